/* Flow-CSP: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "csp/net/output_link.hpp"
#include "csp/net/write_filter.hpp"
#include "csp/net/binding_registry.hpp"
#include "csp/net/error.hpp"
#include "csp/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <boost/noncopyable.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <atomic>
#include <algorithm>
#include <vector>
#include <limits>

namespace csp::net
{

// Types.

/**
 * Internal, non-movable pImpl implementation of Migratable_channel_output class.
 * In and of itself it would have been directly and publicly usable; however Migratable_channel_output adds move
 * semantics, which are essential to the relocation protocol (the endpoint changes owners) and to detecting a stale
 * handle (a moved-from Migratable_channel_output is in NULL state).
 *
 * @see All discussion of the public API is in Migratable_channel_output doc header; that class forwards to this
 *      one.  All discussion of pImpl-related notions is also there.
 *
 * ### Impl design ###
 * The state machine is in #m_state; the resources it guards are #m_link (non-null if and only if
 * `m_state == S_CONNECTED`) and the #m_registry claim (held from the start of a `recreate()` attempt until its
 * failure, or until the binding is torn down by prepare_to_move() or destroy()).
 *
 * #m_mutex serializes everything but state(); and #m_state is modified only with #m_mutex locked.  The exception
 * to "everything" is the Link_factory::connect() call inside recreate(): it may block for a long time, and it is
 * made with #m_mutex unlocked and `m_state == S_RECONNECTING`.  During that time:
 *   - write() sees `S_RECONNECTING` (without locking) and fails immediately with error::Code::S_NOT_CONNECTED.
 *     This is true even if write() is invoked from inside the connect() call on the same thread.
 *   - recreate(), bind(), set_link_factory() fail with error::Code::S_ENDPOINT_STATE_INVALID_FOR_OP;
 *     prepare_to_move() is a no-op.
 *   - destroy() succeeds.  When connect() returns, recreate() sees `S_DESTROYED`, drops the new link, and reports
 *     error::Code::S_ENDPOINT_DESTROYED.
 *
 * Lock order: #m_mutex, then Binding_registry's internal lock.  The registry never calls out, so that's that.
 *
 * @tparam Value
 *         See Migratable_channel_output.
 */
template<typename Value>
class Migratable_channel_output_impl :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// See Migratable_channel_output.
  using Link = Output_link<Value>;

  /// See Migratable_channel_output.
  using Factory = Link_factory<Value>;

  /// See Migratable_channel_output.
  using Filter_ptr = std::shared_ptr<Write_filter<Value>>;

  // Constants.

  /// Index value meaning "at the end" for add_write_filter().
  static constexpr size_t S_FILTER_INDEX_END = std::numeric_limits<size_t>::max();

  // Constructors/destructor.

  /**
   * See Migratable_channel_output counterpart.
   *
   * @param logger_ptr
   *        See Migratable_channel_output counterpart.
   * @param nickname_str
   *        See Migratable_channel_output counterpart.
   * @param endpoint_id
   *        See Migratable_channel_output counterpart.
   * @param link_factory
   *        See Migratable_channel_output counterpart.
   * @param registry
   *        See Migratable_channel_output counterpart.
   */
  explicit Migratable_channel_output_impl(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                          const Endpoint_id& endpoint_id,
                                          Factory* link_factory, Binding_registry* registry);

  /// See Migratable_channel_output counterpart.  Equivalent to destroy().
  ~Migratable_channel_output_impl();

  // Methods.

  /**
   * See Migratable_channel_output counterpart.
   *
   * @param location
   *        See Migratable_channel_output counterpart.
   * @param err_code
   *        See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  bool bind(const Channel_location& location, Error_code* err_code);

  /**
   * See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  bool prepare_to_move();

  /**
   * Implements both Migratable_channel_output::recreate() overloads.
   *
   * @param new_location_or_null
   *        The location to bind to; or null to use location().
   * @param err_code
   *        See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  bool recreate(const Channel_location* new_location_or_null, Error_code* err_code);

  /**
   * See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  bool destroy();

  /**
   * See Migratable_channel_output counterpart.
   *
   * @param value
   *        See Migratable_channel_output counterpart.
   * @param err_code
   *        See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  bool write(const Value& value, Error_code* err_code);

  /**
   * See Migratable_channel_output counterpart.
   *
   * @param link_factory
   *        See Migratable_channel_output counterpart.
   * @param err_code
   *        See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  bool set_link_factory(Factory* link_factory, Error_code* err_code);

  /**
   * Implements both Migratable_channel_output::add_write_filter() overloads.
   *
   * @param filter
   *        See Migratable_channel_output counterpart.
   * @param index
   *        See Migratable_channel_output counterpart; or #S_FILTER_INDEX_END.
   * @param err_code
   *        See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  bool add_write_filter(Filter_ptr filter, size_t index, Error_code* err_code);

  /**
   * See Migratable_channel_output counterpart.
   *
   * @param filter
   *        See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  bool remove_write_filter(const Write_filter<Value>* filter);

  /**
   * See Migratable_channel_output counterpart (the overload taking an index).
   *
   * @param index
   *        See Migratable_channel_output counterpart.
   * @param err_code
   *        See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  bool remove_write_filter_at(size_t index, Error_code* err_code);

  /**
   * See Migratable_channel_output counterpart.
   *
   * @param index
   *        See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  Filter_ptr write_filter(size_t index) const;

  /**
   * See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  size_t write_filter_count() const;

  /**
   * See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  Connection_state state() const;

  /**
   * See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  Endpoint_id endpoint_id() const;

  /**
   * See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  const Channel_id& channel_id() const;

  /**
   * See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  Channel_location location() const;

  /**
   * See Migratable_channel_output counterpart.
   * @return See Migratable_channel_output counterpart.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock_guard = util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Releases #m_link and the #m_registry claim, if we hold either.  #m_mutex must be locked.
   *
   * @param context
   *        For logging: what's going on.
   */
  void release_binding(util::String_view context);

  /**
   * Emits the error appropriate to an operation that cannot proceed in state `state`, for the common cases
   * (S_DESTROYED; S_CONNECTED or S_RECONNECTING).  Logs a WARNING.
   *
   * @param op_name
   *        For logging.
   * @param state
   *        The state.
   * @param err_code
   *        Not null.  Set to the error.
   */
  void emit_state_error(util::String_view op_name, Connection_state state, Error_code* err_code) const;

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See channel_id().
  const Channel_id m_channel_id;

  /// See location().  Protected by #m_mutex.
  Channel_location m_location;

  /// See state().  Modified only with #m_mutex locked; read by state() without it.
  std::atomic<Connection_state> m_state;

  /// Protects the mutable data here (see class doc header Impl section).
  mutable Mutex m_mutex;

  /// Source of #m_link.  Not null.  Protected by #m_mutex.
  Factory* m_link_factory;

  /// Registry to claim bindings in; or null.  Protected by #m_mutex.
  Binding_registry* const m_registry;

  /**
   * `true` if and only if we hold the #m_registry entry of our channel: from a successful claim in recreate()
   * until release_binding() or a failed connect.  Only then may we release it, as the entry is keyed by channel
   * alone and may belong to another endpoint of the same channel.  Protected by #m_mutex.
   */
  bool m_claimed;

  /// The live binding if `m_state == S_CONNECTED`; else null.  Protected by #m_mutex.
  std::unique_ptr<Link> m_link;

  /// The write filters in the order they apply.  None is null.  Protected by #m_mutex.
  std::vector<Filter_ptr> m_filters;
}; // class Migratable_channel_output_impl

// Template implementations.

template<typename Value>
Migratable_channel_output_impl<Value>::Migratable_channel_output_impl
  (flow::log::Logger* logger_ptr, util::String_view nickname_str, const Endpoint_id& endpoint_id,
   Factory* link_factory, Binding_registry* registry) :

  flow::log::Log_context(logger_ptr, Log_component::S_NET),
  m_nickname(nickname_str),
  m_channel_id(endpoint_id.m_channel_id),
  m_location(endpoint_id.m_location),
  m_state(Connection_state::S_DISCONNECTED),
  m_link_factory(link_factory),
  m_registry(registry),
  m_claimed(false)
{
  assert(m_link_factory && "Broke contract: link factory must not be null.");
  assert((!m_channel_id.is_nil()) && "Broke contract: channel ID must not be nil.");

  FLOW_LOG_INFO("Migratable_channel_output [" << *this << "]: Created at last known location [" << m_location << "]; "
                "not connected yet.  Registry: [" << (m_registry ? m_registry->nickname() : util::EMPTY_STRING) << "].");
}

template<typename Value>
Migratable_channel_output_impl<Value>::~Migratable_channel_output_impl()
{
  FLOW_LOG_INFO("Migratable_channel_output [" << *this << "]: Shutting down.");
  destroy();
}

template<typename Value>
bool Migratable_channel_output_impl<Value>::bind(const Channel_location& location, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Migratable_channel_output_impl::bind,
                                     flow::util::bind_ns::cref(location), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  {
    Lock_guard lock(m_mutex);

    const Connection_state state = m_state;
    if ((state == Connection_state::S_CONNECTED) && (m_location == location))
    {
      FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Bind to [" << location << "] requested; "
                     "already connected there; no-op.");
      err_code->clear();
      return false;
    }
    // else
    if (state != Connection_state::S_DISCONNECTED)
    {
      emit_state_error("bind", state, err_code);
      return false;
    }
    // else: Fall through (unlocked) to the real work.
  }

  return recreate(&location, err_code);
} // Migratable_channel_output_impl::bind()

template<typename Value>
bool Migratable_channel_output_impl<Value>::prepare_to_move()
{
  Lock_guard lock(m_mutex);

  if (m_state != Connection_state::S_CONNECTED)
  {
    FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Prepare-to-move requested, but state is "
                   "[" << m_state.load() << "], not CONNECTED; no-op.");
    return false;
  }
  // else

  FLOW_LOG_INFO("Migratable_channel_output [" << *this << "]: Preparing to move away from [" << m_location << "]: "
                "quiescing [" << m_filters.size() << "] write filters; then releasing the binding.  "
                "Writes are rejected from now on.");
  m_state = Connection_state::S_PREPARING;

  for (const auto& filter : m_filters)
  {
    filter->quiesce();
  }
  release_binding("prepare-to-move");

  m_state = Connection_state::S_DISCONNECTED;
  FLOW_LOG_INFO("Migratable_channel_output [" << *this << "]: Disconnected from [" << m_location << "]; "
                "ready to move.");
  return true;
} // Migratable_channel_output_impl::prepare_to_move()

template<typename Value>
bool Migratable_channel_output_impl<Value>::recreate(const Channel_location* new_location_or_null,
                                                     Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Migratable_channel_output_impl::recreate, new_location_or_null, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Endpoint_id target;
  target.m_channel_id = m_channel_id;
  Factory* link_factory;

  {
    Lock_guard lock(m_mutex);

    const Connection_state state = m_state;
    if ((state != Connection_state::S_DISCONNECTED) && (state != Connection_state::S_PREPARING))
    {
      emit_state_error("recreate", state, err_code);
      return false;
    }
    // else

    target.m_location = new_location_or_null ? *new_location_or_null : m_location;
    if (target.m_location.null())
    {
      FLOW_LOG_WARNING("Migratable_channel_output [" << *this << "]: Recreate requested, but no location was "
                       "given, and there is no last known location either.  Call bind() or recreate() with a "
                       "location.");
      *err_code = error::Code::S_INVALID_ARGUMENT;
      return false;
    }
    // else

    if (m_registry)
    {
      /* We hold no claim while disconnected; so an existing entry, even at the same location, is another live
       * binding of this channel. */
      if ((!m_registry->claim(target, err_code)) && (!*err_code))
      {
        *err_code = error::Code::S_CHANNEL_ALREADY_BOUND;
      }
      if (*err_code)
      {
        FLOW_LOG_WARNING("Migratable_channel_output [" << *this << "]: Recreate at [" << target.m_location << "] "
                         "refused by registry [" << *m_registry << "] (details above); "
                         "staying [" << state << "].");
        return false;
      }
      // else
      m_claimed = true;
    }
    // else: We own the claim (if applicable) until we release_binding() or fail below.

    FLOW_LOG_INFO("Migratable_channel_output [" << *this << "]: Reconnecting to [" << target.m_location << "] "
                  "(was at [" << m_location << "]).  Writes are rejected until connected.");
    m_location = target.m_location;
    m_state = Connection_state::S_RECONNECTING;
    link_factory = m_link_factory;
  } // Lock_guard lock(m_mutex);

  // Unlocked: this may take a while (see class doc header).
  auto new_link = link_factory->connect(target, err_code);
  if ((!*err_code) && (!new_link))
  {
    *err_code = error::Code::S_LOCATION_UNREACHABLE;
  }

  Lock_guard lock(m_mutex);

  if (m_state == Connection_state::S_DESTROYED)
  {
    // destroy() won; it also released our registry claim.
    FLOW_LOG_WARNING("Migratable_channel_output [" << *this << "]: Connect to [" << target.m_location << "] "
                     "completed (result [" << *err_code << "]), but we were destroyed meanwhile; "
                     "dropping any new link.");
    new_link.reset();
    *err_code = error::Code::S_ENDPOINT_DESTROYED;
    return false;
  }
  // else
  assert((m_state == Connection_state::S_RECONNECTING) && "Only destroy() may interfere while we're connecting.");

  if (*err_code)
  {
    FLOW_LOG_WARNING("Migratable_channel_output [" << *this << "]: Connect to [" << target.m_location << "] "
                     "failed: [" << *err_code << "] [" << err_code->message() << "].  Disconnected; "
                     "a subsequent recreate() may retry.");
    new_link.reset();
    release_binding("connect failure");
    m_state = Connection_state::S_DISCONNECTED;
    return false;
  }
  // else

  m_link = std::move(new_link);
  m_state = Connection_state::S_CONNECTED;
  FLOW_LOG_INFO("Migratable_channel_output [" << *this << "]: Connected to [" << m_location << "].");
  return true;
} // Migratable_channel_output_impl::recreate()

template<typename Value>
bool Migratable_channel_output_impl<Value>::destroy()
{
  Lock_guard lock(m_mutex);

  const Connection_state state = m_state;
  if (state == Connection_state::S_DESTROYED)
  {
    FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Destroy requested, but already destroyed; no-op.");
    return false;
  }
  // else

  FLOW_LOG_INFO("Migratable_channel_output [" << *this << "]: Destroying (state was [" << state << "]).");
  /* If S_RECONNECTING: recreate() is in connect() and will notice S_DESTROYED when done; but the claim it made is
   * released here, so the channel is not left bound in the registry. */
  release_binding("destroy");
  m_filters.clear();
  m_state = Connection_state::S_DESTROYED;
  return true;
} // Migratable_channel_output_impl::destroy()

template<typename Value>
bool Migratable_channel_output_impl<Value>::write(const Value& value, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Migratable_channel_output_impl::write, flow::util::bind_ns::cref(value), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  // Check without locking first: we might be inside connect() on this very thread (see class doc header).
  if (m_state != Connection_state::S_CONNECTED)
  {
    FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Write rejected: state is [" << m_state.load() << "].");
    *err_code = error::Code::S_NOT_CONNECTED;
    return false;
  }
  // else

  Lock_guard lock(m_mutex);

  if (m_state != Connection_state::S_CONNECTED) // Changed since the check above.
  {
    FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Write rejected: state is [" << m_state.load() << "].");
    *err_code = error::Code::S_NOT_CONNECTED;
    return false;
  }
  // else
  assert(m_link);

  Value filtered = value;
  for (const auto& filter : m_filters)
  {
    filtered = filter->filter(std::move(filtered));
  }

  m_link->send(filtered, err_code);
  if (*err_code == Error_code(error::Code::S_INPUT_FULL))
  {
    FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Send to [" << m_location << "] refused: reading "
                   "end is full.  Still connected; the write may be retried.");
    return false;
  }
  // else
  if (*err_code)
  {
    FLOW_LOG_WARNING("Migratable_channel_output [" << *this << "]: Send to [" << m_location << "] failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].  Disconnecting; "
                     "recreate() may re-establish the binding.");
    release_binding("send failure");
    m_state = Connection_state::S_DISCONNECTED;
    return false;
  }
  // else

  FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Sent value to [" << m_location << "].");
  return true;
} // Migratable_channel_output_impl::write()

template<typename Value>
bool Migratable_channel_output_impl<Value>::set_link_factory(Factory* link_factory, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Migratable_channel_output_impl::set_link_factory, link_factory, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(link_factory && "Broke contract: link factory must not be null.");

  Lock_guard lock(m_mutex);

  const Connection_state state = m_state;
  if (state != Connection_state::S_DISCONNECTED)
  {
    emit_state_error("set-link-factory", state, err_code);
    return false;
  }
  // else

  FLOW_LOG_INFO("Migratable_channel_output [" << *this << "]: Link factory replaced "
                "([" << m_link_factory << "] => [" << link_factory << "]).");
  m_link_factory = link_factory;
  err_code->clear();
  return true;
}

template<typename Value>
bool Migratable_channel_output_impl<Value>::add_write_filter(Filter_ptr filter, size_t index, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Migratable_channel_output_impl::add_write_filter, filter, index, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Lock_guard lock(m_mutex);

  if (m_state == Connection_state::S_DESTROYED)
  {
    emit_state_error("add-write-filter", Connection_state::S_DESTROYED, err_code);
    return false;
  }
  // else

  if (index == S_FILTER_INDEX_END)
  {
    index = m_filters.size();
  }
  if ((!filter) || (index > m_filters.size()))
  {
    FLOW_LOG_WARNING("Migratable_channel_output [" << *this << "]: Add-write-filter: filter [" << filter.get() << "] "
                     "at index [" << index << "] is invalid (have [" << m_filters.size() << "] filters).");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else

  FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Adding write filter [" << filter.get() << "] "
                 "at index [" << index << "].");
  m_filters.insert(m_filters.begin() + index, std::move(filter));
  err_code->clear();
  return true;
}

template<typename Value>
bool Migratable_channel_output_impl<Value>::remove_write_filter(const Write_filter<Value>* filter)
{
  Lock_guard lock(m_mutex);

  const auto it = std::find_if(m_filters.begin(), m_filters.end(),
                               [filter](const Filter_ptr& f) -> bool { return f.get() == filter; });
  if (it == m_filters.end())
  {
    FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Remove-write-filter: "
                   "filter [" << filter << "] not attached; no-op.");
    return false;
  }
  // else

  FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Removing write filter [" << filter << "].");
  m_filters.erase(it);
  return true;
}

template<typename Value>
bool Migratable_channel_output_impl<Value>::remove_write_filter_at(size_t index, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Migratable_channel_output_impl::remove_write_filter_at, index, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Lock_guard lock(m_mutex);

  if (index >= m_filters.size())
  {
    FLOW_LOG_WARNING("Migratable_channel_output [" << *this << "]: Remove-write-filter: index [" << index << "] "
                     "out of range (have [" << m_filters.size() << "] filters).");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else

  FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Removing write filter [" << m_filters[index].get() << "] "
                 "at index [" << index << "].");
  m_filters.erase(m_filters.begin() + index);
  err_code->clear();
  return true;
}

template<typename Value>
typename Migratable_channel_output_impl<Value>::Filter_ptr
  Migratable_channel_output_impl<Value>::write_filter(size_t index) const
{
  Lock_guard lock(m_mutex);
  return (index < m_filters.size()) ? m_filters[index] : Filter_ptr();
}

template<typename Value>
size_t Migratable_channel_output_impl<Value>::write_filter_count() const
{
  Lock_guard lock(m_mutex);
  return m_filters.size();
}

template<typename Value>
Connection_state Migratable_channel_output_impl<Value>::state() const
{
  return m_state;
}

template<typename Value>
Endpoint_id Migratable_channel_output_impl<Value>::endpoint_id() const
{
  Lock_guard lock(m_mutex);
  return Endpoint_id{ m_channel_id, m_location };
}

template<typename Value>
const Channel_id& Migratable_channel_output_impl<Value>::channel_id() const
{
  return m_channel_id;
}

template<typename Value>
Channel_location Migratable_channel_output_impl<Value>::location() const
{
  Lock_guard lock(m_mutex);
  return m_location;
}

template<typename Value>
const std::string& Migratable_channel_output_impl<Value>::nickname() const
{
  return m_nickname;
}

template<typename Value>
void Migratable_channel_output_impl<Value>::release_binding(util::String_view context)
{
  if (m_link)
  {
    FLOW_LOG_TRACE("Migratable_channel_output [" << *this << "]: Closing link to [" << m_link->remote_location() << "] "
                   "(context: [" << context << "]).");
    m_link.reset(); // Blocks until the link's resources are gone (see Output_link dtor).
  }
  if (m_claimed)
  {
    assert(m_registry);
    m_registry->release(m_channel_id);
    m_claimed = false;
  }
}

template<typename Value>
void Migratable_channel_output_impl<Value>::emit_state_error(util::String_view op_name, Connection_state state,
                                                             Error_code* err_code) const
{
  *err_code = (state == Connection_state::S_DESTROYED) ? error::Code::S_ENDPOINT_DESTROYED
                                                       : error::Code::S_ENDPOINT_STATE_INVALID_FOR_OP;
  FLOW_LOG_WARNING("Migratable_channel_output [" << *this << "]: Operation [" << op_name << "] not allowed in "
                   "state [" << state << "]: [" << *err_code << "] [" << err_code->message() << "].");
}

template<typename Value>
std::ostream& operator<<(std::ostream& os, const Migratable_channel_output_impl<Value>& val)
{
  // Must not lock (we're invoked from logging with m_mutex locked); hence only the immutable stuff.
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val)
            << " channel [" << val.channel_id() << ']';
}

} // namespace csp::net
