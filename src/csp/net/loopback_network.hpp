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
#include "csp/net/error.hpp"
#include "csp/store/data_store.hpp"
#include "csp/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <boost/unordered_map.hpp>
#include <boost/functional/hash.hpp>

namespace csp::net
{

// Types.

/**
 * In-process network layer: a Link_factory whose links deliver each value straight into a Data_store registered as
 * the reading end ("input") at a Channel_location.  It is the reference wiring of csp::net to csp::store, and it
 * stands in for a real network layer in tests and demos: a location can be made unreachable (set_reachable()) to
 * simulate a failed connect, and an input can be closed (close_input()) to simulate a broken link.
 *
 * A link obtained from connect() is live until destroyed, and live_link_count() counts them; so one can verify
 * that a binding was released.  A send on a link whose input was closed fails with error::Code::S_LINK_HOSED.
 *
 * ### Thread safety ###
 * All methods, and `send()` on links, are safe to call concurrently.  The pointer returned by input_store() is not
 * protected, however: use it only when no link is concurrently sending to that input.  A send to an input whose
 * store reports Store_state::S_FULL (a full Fifo_buffer) is refused with error::Code::S_INPUT_FULL and leaves the
 * store untouched; a reader draining it makes room again.
 *
 * `*this` must outlive every link it has produced.
 *
 * @tparam Value
 *         Type of value carried by the channels.
 */
template<typename Value>
class Loopback_network :
  public Link_factory<Value>,
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for the reading-end store type.
  using Store = store::Data_store<Value>;

  /// Short-hand for the link type.
  using Link = Output_link<Value>;

  // Constructors/destructor.

  /**
   * Constructs a network with no inputs.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in logging only.
   */
  explicit Loopback_network(flow::log::Logger* logger_ptr, util::String_view nickname_str);

  /// Closes all inputs.  Behavior is undefined if any link is still alive.
  ~Loopback_network() override;

  // Methods.

  /**
   * Registers a reading end at `location`, initially reachable.
   *
   * @param location
   *        The location.  Must not be null().
   * @param input_store
   *        Values sent to `location` are `put()` into this.  Must not be null.
   * @return `true` on success; `false` if an input is already open at `location` (no-op).
   */
  bool open_input(const Channel_location& location, std::unique_ptr<Store> input_store);

  /**
   * Unregisters the reading end at `location`: further connects to it fail, and links to it break.
   *
   * @param location
   *        The location.
   * @return `true` on success; `false` if no input is open at `location` (no-op).
   */
  bool close_input(const Channel_location& location);

  /**
   * Sets whether connect() to `location` succeeds.  Existing links are not affected.
   *
   * @param location
   *        The location.
   * @param reachable
   *        See above.
   * @return `true` on success; `false` if no input is open at `location` (no-op).
   */
  bool set_reachable(const Channel_location& location, bool reachable);

  /**
   * The store of the input at `location`.  See thread safety note in class doc header.
   *
   * @param location
   *        The location.
   * @return See above; null if no input is open at `location`.
   */
  Store* input_store(const Channel_location& location) const;

  /**
   * Number of links produced by connect() and not yet destroyed.
   *
   * @return See above.
   */
  size_t live_link_count() const;

  /**
   * Implements Link_factory API: succeeds if and only if an input is open and reachable at
   * `endpoint_id.m_location`; else emits error::Code::S_LOCATION_UNREACHABLE.
   *
   * @param endpoint_id
   *        See Link_factory.
   * @param err_code
   *        See Link_factory.
   * @return See Link_factory.
   */
  std::unique_ptr<Link> connect(const Endpoint_id& endpoint_id, Error_code* err_code) override;

private:
  // Types.

  /// A reading end.
  struct Input
  {
    /// Where values go.
    std::unique_ptr<Store> m_store;

    /// See set_reachable().
    bool m_reachable;
  };

  /// Links hold weak references to their Input, which close_input() destroys.
  using Input_ptr = std::shared_ptr<Input>;

  /// Short-hand for the input map.
  using Input_map = boost::unordered_map<Channel_location, Input_ptr, boost::hash<Channel_location>>;

  class Loopback_link;

  // Methods.

  /**
   * Implements Loopback_link::send().
   *
   * @param input
   *        The link's input.
   * @param endpoint_id
   *        The link's endpoint (for logging).
   * @param value
   *        See Output_link.
   * @param err_code
   *        See Output_link.
   */
  void deliver(const std::weak_ptr<Input>& input, const Endpoint_id& endpoint_id,
               const Value& value, Error_code* err_code);

  /**
   * Called by Loopback_link dtor.
   *
   * @param endpoint_id
   *        The link's endpoint (for logging).
   */
  void link_closed(const Endpoint_id& endpoint_id);

  // Data.

  /// Nickname for logging.
  const std::string m_nickname;

  /// Protects the rest of the data.
  mutable util::Mutex_non_recursive m_mutex;

  /// The open inputs.
  Input_map m_inputs;

  /// See live_link_count().
  size_t m_live_link_count;
}; // class Loopback_network

/**
 * Output_link produced by Loopback_network.
 *
 * @tparam Value
 *         See Loopback_network.
 */
template<typename Value>
class Loopback_network<Value>::Loopback_link :
  public Output_link<Value>
{
public:
  // Constructors/destructor.

  /**
   * Constructs the link.  Loopback_network counts it already.
   *
   * @param network
   *        The creator.
   * @param endpoint_id
   *        Channel and location.
   * @param input
   *        The input at the location.
   */
  explicit Loopback_link(Loopback_network* network, const Endpoint_id& endpoint_id, const Input_ptr& input);

  /// Un-counts the link.
  ~Loopback_link() override;

  // Methods.

  /**
   * Implements Output_link API.
   *
   * @param value
   *        See Output_link.
   * @param err_code
   *        See Output_link.
   */
  void send(const Value& value, Error_code* err_code) override;

  /**
   * Implements Output_link API.
   * @return See Output_link.
   */
  const Channel_location& remote_location() const override;

private:
  // Data.

  /// The creator.
  Loopback_network* const m_network;

  /// See ctor.
  const Endpoint_id m_endpoint_id;

  /// See ctor.  Expired once the input is closed.
  const std::weak_ptr<Input> m_input;
}; // class Loopback_network::Loopback_link

// Template implementations.

template<typename Value>
Loopback_network<Value>::Loopback_network(flow::log::Logger* logger_ptr, util::String_view nickname_str) :
  flow::log::Log_context(logger_ptr, Log_component::S_NET),
  m_nickname(nickname_str),
  m_live_link_count(0)
{
  FLOW_LOG_INFO("Loopback_network [" << m_nickname << "]: Created with no inputs.");
}

template<typename Value>
Loopback_network<Value>::~Loopback_network()
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  assert((m_live_link_count == 0) && "Broke contract: all links must be gone by now.");
  FLOW_LOG_INFO("Loopback_network [" << m_nickname << "]: Shutting down; closing [" << m_inputs.size() << "] inputs.");
}

template<typename Value>
bool Loopback_network<Value>::open_input(const Channel_location& location, std::unique_ptr<Store> input_store)
{
  assert((!location.null()) && input_store && "Broke contract.");

  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  if (m_inputs.find(location) != m_inputs.end())
  {
    FLOW_LOG_WARNING("Loopback_network [" << m_nickname << "]: Cannot open input at [" << location << "]: "
                     "already open.");
    return false;
  }
  // else

  FLOW_LOG_INFO("Loopback_network [" << m_nickname << "]: Opened input at [" << location << "] with "
                "store [" << *input_store << "].");
  m_inputs.emplace(location, std::make_shared<Input>(Input{ std::move(input_store), true }));
  return true;
}

template<typename Value>
bool Loopback_network<Value>::close_input(const Channel_location& location)
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  const auto it = m_inputs.find(location);
  if (it == m_inputs.end())
  {
    FLOW_LOG_WARNING("Loopback_network [" << m_nickname << "]: Cannot close input at [" << location << "]: "
                     "not open.");
    return false;
  }
  // else

  FLOW_LOG_INFO("Loopback_network [" << m_nickname << "]: Closed input at [" << location << "]; "
                "links to it are hosed.");
  m_inputs.erase(it); // Links' weak_ptr<>s expire (we are the only owner).
  return true;
}

template<typename Value>
bool Loopback_network<Value>::set_reachable(const Channel_location& location, bool reachable)
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  const auto it = m_inputs.find(location);
  if (it == m_inputs.end())
  {
    return false;
  }
  // else

  FLOW_LOG_INFO("Loopback_network [" << m_nickname << "]: Input at [" << location << "] is now "
                "[" << (reachable ? "reachable" : "unreachable") << "].");
  it->second->m_reachable = reachable;
  return true;
}

template<typename Value>
typename Loopback_network<Value>::Store* Loopback_network<Value>::input_store(const Channel_location& location) const
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  const auto it = m_inputs.find(location);
  return (it == m_inputs.end()) ? 0 : it->second->m_store.get();
}

template<typename Value>
size_t Loopback_network<Value>::live_link_count() const
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_live_link_count;
}

template<typename Value>
std::unique_ptr<typename Loopback_network<Value>::Link>
  Loopback_network<Value>::connect(const Endpoint_id& endpoint_id, Error_code* err_code)
{
  assert(err_code);

  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  const auto it = m_inputs.find(endpoint_id.m_location);
  if ((it == m_inputs.end()) || (!it->second->m_reachable))
  {
    FLOW_LOG_WARNING("Loopback_network [" << m_nickname << "]: Connect for [" << endpoint_id << "] failed: "
                     "no reachable input there.");
    *err_code = error::Code::S_LOCATION_UNREACHABLE;
    return {};
  }
  // else

  ++m_live_link_count;
  FLOW_LOG_TRACE("Loopback_network [" << m_nickname << "]: Connected [" << endpoint_id << "]; "
                 "[" << m_live_link_count << "] live links.");
  err_code->clear();
  return std::make_unique<Loopback_link>(this, endpoint_id, it->second);
}

template<typename Value>
void Loopback_network<Value>::deliver(const std::weak_ptr<Input>& input, const Endpoint_id& endpoint_id,
                                      const Value& value, Error_code* err_code)
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  const auto input_ptr = input.lock();
  if (!input_ptr)
  {
    FLOW_LOG_WARNING("Loopback_network [" << m_nickname << "]: Send for [" << endpoint_id << "] failed: "
                     "input was closed.");
    *err_code = error::Code::S_LINK_HOSED;
    return;
  }
  // else

  if (input_ptr->m_store->state() == store::Store_state::S_FULL)
  {
    FLOW_LOG_WARNING("Loopback_network [" << m_nickname << "]: Send for [" << endpoint_id << "] refused: "
                     "input store [" << *input_ptr->m_store << "] is full.");
    *err_code = error::Code::S_INPUT_FULL;
    return;
  }
  // else

  input_ptr->m_store->put(value);
  FLOW_LOG_TRACE("Loopback_network [" << m_nickname << "]: Delivered value for [" << endpoint_id << "]; "
                 "input state now [" << input_ptr->m_store->state() << "].");
  err_code->clear();
}

template<typename Value>
void Loopback_network<Value>::link_closed(const Endpoint_id& endpoint_id)
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  assert(m_live_link_count != 0);
  --m_live_link_count;
  FLOW_LOG_TRACE("Loopback_network [" << m_nickname << "]: Link for [" << endpoint_id << "] closed; "
                 "[" << m_live_link_count << "] live links.");
}

template<typename Value>
Loopback_network<Value>::Loopback_link::Loopback_link(Loopback_network* network, const Endpoint_id& endpoint_id,
                                                      const Input_ptr& input) :
  m_network(network),
  m_endpoint_id(endpoint_id),
  m_input(input)
{
  // Yay.
}

template<typename Value>
Loopback_network<Value>::Loopback_link::~Loopback_link()
{
  m_network->link_closed(m_endpoint_id);
}

template<typename Value>
void Loopback_network<Value>::Loopback_link::send(const Value& value, Error_code* err_code)
{
  m_network->deliver(m_input, m_endpoint_id, value, err_code);
}

template<typename Value>
const Channel_location& Loopback_network<Value>::Loopback_link::remote_location() const
{
  return m_endpoint_id.m_location;
}

} // namespace csp::net
