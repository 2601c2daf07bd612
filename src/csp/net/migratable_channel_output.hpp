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

#include "csp/net/detail/migratable_channel_output_impl.hpp"
#include <boost/move/make_unique.hpp>
#include <experimental/propagate_const>

namespace csp::net
{

// Types.

/**
 * The writing end of a network channel, relocatable: it can be unbound from the channel's current location, moved
 * (with its owner, possibly to another host), and re-bound at the same or a new location, all the while keeping the
 * channel's identity (Channel_id).  Writes go through a live Output_link obtained from a Link_factory (the network
 * layer's interface) and are first passed through the endpoint's chain of Write_filter objects.
 *
 * ### Connection state machine ###
 * See state() and Connection_state.  In short:
 *   - Construction: `S_DISCONNECTED` at a given last known location (which may be null, if never bound).
 *   - bind(L): `S_DISCONNECTED -> S_RECONNECTING -> S_CONNECTED`, at L.  If already `S_CONNECTED` at L, no-op.
 *   - prepare_to_move(): `S_CONNECTED -> S_PREPARING -> S_DISCONNECTED`.  Each write filter is quiesced, the link
 *     is closed, and the binding is released (see Binding_registry).  Once it returns, nothing more can be written
 *     through the old binding.  Cannot be aborted once begun.
 *   - recreate() / recreate(L2): `S_DISCONNECTED -> S_RECONNECTING -> S_CONNECTED`, at the last known location or
 *     L2.  On failure (location unreachable, or the channel is bound live elsewhere according to the registry):
 *     `-> S_DISCONNECTED`, never a stale `S_CONNECTED`; the error is emitted; a subsequent recreate() may retry.
 *   - A send failure in write(): `S_CONNECTED -> S_DISCONNECTED`.  recreate() may re-establish.
 *   - destroy(): any state but `S_DESTROYED` -> `S_DESTROYED`, permanently.
 *
 * write() succeeds only in `S_CONNECTED`.  In any other state, including the relocation window
 * (`S_PREPARING`, `S_DISCONNECTED`, `S_RECONNECTING`), it fails immediately with error::Code::S_NOT_CONNECTED;
 * it never defers the value and never blocks waiting for a binding.
 *
 * ### Identity and binding invariant ###
 * channel_id() never changes.  location() is the location of the current binding, or of the most recent binding
 * attempt when not connected.  If every writer of a channel uses the same Binding_registry, then at any moment at
 * most one writer binding of the channel is live; between prepare_to_move() and the next successful recreate() there
 * is none.
 *
 * ### Moving between owners ###
 * The object is movable but not copyable.  A moved-from object is in NULL state, as-if default-constructed:
 * state() returns Connection_state::S_NULL, and every operation fails (error-emitting ones with
 * error::Code::S_ENDPOINT_NULL).  Hence a handle kept by an owner after giving the endpoint away is detectably
 * stale.  See Relocator for the full protocol, where the in-transit endpoint is held by a Migration_ticket.
 *
 * ### Thread safety ###
 * Relocation operations (bind(), prepare_to_move(), recreate(), destroy(), set_link_factory()) are meant to be
 * issued by the owner, one at a time.  write() may be called concurrently with them; it is serialized against them
 * internally, except that while a binding is being established (Link_factory::connect() is executing) write() does
 * not wait but fails at once.  That is true even if write() is invoked, on the same thread, from within connect().
 * state() is lock-free.  Do not call into the same object from a Write_filter or Output_link method.
 *
 * ### pImpl ###
 * The implementation is in Migratable_channel_output_impl; `*this` holds a `unique_ptr` to it, which makes moves
 * cheap and gives the NULL state for free (null pointer).
 *
 * @tparam Value
 *         Type of value carried by the channel.  Must be copyable.
 */
template<typename Value>
class Migratable_channel_output
{
public:
  // Types.

  /// Type of value carried by the channel.
  using value_type = Value;

  /// Short-hand for the link type.
  using Link = Output_link<Value>;

  /// Short-hand for the link factory type.
  using Factory = Link_factory<Value>;

  /// Short-hand for the write filter handle type.
  using Filter_ptr = std::shared_ptr<Write_filter<Value>>;

  // Constructors/destructor.

  /**
   * Constructs an endpoint of the given channel in `S_DISCONNECTED` state.  To connect call bind() (or recreate(),
   * if `endpoint_id.m_location` is not null()).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param endpoint_id
   *        Channel ID (must not be nil; see generate_channel_id()) and last known location (may be null()).
   * @param link_factory
   *        Source of links.  Must not be null; must exist until the endpoint is destroyed or set_link_factory()
   *        replaces it.
   * @param registry
   *        Registry in which to claim each binding; or null to not do so.  Must exist until `*this` is destroyed.
   */
  explicit Migratable_channel_output(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                     const Endpoint_id& endpoint_id,
                                     Factory* link_factory, Binding_registry* registry = 0);

  /**
   * Default ctor: creates an object in NULL state.  Useful as the target of a move, e.g., in Relocator::arrive().
   */
  Migratable_channel_output();

  /**
   * Move-constructs from `src`; `src` becomes as-if default-cted (NULL state).
   *
   * @param src
   *        Source object.
   */
  Migratable_channel_output(Migratable_channel_output&& src);

  /// Copying is disallowed.
  Migratable_channel_output(const Migratable_channel_output&) = delete;

  /**
   * Destroys the endpoint if not in NULL state: equivalent to destroy() followed by releasing all memory.
   */
  ~Migratable_channel_output();

  // Methods.

  /**
   * Move-assigns from `src`; `*this` acts as if destructed first; `src` becomes as-if default-cted (NULL state).
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Migratable_channel_output& operator=(Migratable_channel_output&& src);

  /// Copying is disallowed.
  Migratable_channel_output& operator=(const Migratable_channel_output&) = delete;

  /**
   * Binds the endpoint to a location: if `S_DISCONNECTED`, equivalent to `recreate(location)`; if `S_CONNECTED`
   * at `location` already, a no-op (returns `false`, no error).
   *
   * @param location
   *        Location of the channel's reading end.  Must not be null() (else error::Code::S_INVALID_ARGUMENT).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error::Code generated:
   *        error::Code::S_ENDPOINT_STATE_INVALID_FOR_OP (connected elsewhere, or mid-connect),
   *        error::Code::S_ENDPOINT_DESTROYED, error::Code::S_ENDPOINT_NULL; and those of recreate().
   * @return `true` if a new binding was established; else `false`.
   */
  bool bind(const Channel_location& location, Error_code* err_code = 0);

  /**
   * Quiesces, unbinds, and releases the current binding, so that the endpoint can move.  See class doc header.
   * On return (if `true`), state() is `S_DISCONNECTED`.
   *
   * @return `true` if it was `S_CONNECTED` and now is not; `false` if it was not `S_CONNECTED` (no-op).
   */
  bool prepare_to_move();

  /**
   * Re-establishes a binding at location() (the last known location), e.g., after a send failure or after an
   * earlier recreate() failed because the location was unreachable.
   *
   * @param err_code
   *        See the other recreate().
   * @return See the other recreate().
   */
  bool recreate(Error_code* err_code = 0);

  /**
   * Establishes a binding at `new_location`, keeping channel_id().  Allowed in `S_DISCONNECTED` state only.
   * Transitions through `S_RECONNECTING` (visible to state() and write() from other threads, or from within
   * Link_factory::connect()) to `S_CONNECTED` on success; back to `S_DISCONNECTED` on failure.  location() is
   * `new_location` in any case, so that recreate() without a location retries there.
   *
   * @param new_location
   *        Location of the channel's reading end.  Must not be null() (else error::Code::S_INVALID_ARGUMENT).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error::Code generated:
   *        error::Code::S_CHANNEL_ALREADY_BOUND (per registry, another binding of the channel is live),
   *        error::Code::S_LOCATION_UNREACHABLE or a code emitted by Link_factory::connect(),
   *        error::Code::S_ENDPOINT_STATE_INVALID_FOR_OP (not `S_DISCONNECTED`),
   *        error::Code::S_ENDPOINT_DESTROYED (also if destroy() was called while connecting),
   *        error::Code::S_ENDPOINT_NULL, error::Code::S_INVALID_ARGUMENT.
   * @return `true` on success; `false` on error.
   */
  bool recreate(const Channel_location& new_location, Error_code* err_code = 0);

  /**
   * Moves the endpoint to `S_DESTROYED` state permanently, closing the link and releasing the binding if any.
   * Write filters are detached.
   *
   * @return `true` if it was not `S_DESTROYED` (or NULL) before; `false` otherwise (no-op).
   */
  bool destroy();

  /**
   * Passes `value` through the write filters and sends the result to the channel's reading end.  Fails immediately
   * unless `S_CONNECTED`.  If the send fails the endpoint becomes `S_DISCONNECTED` (and releases the binding),
   * except when the reading end is merely full (error::Code::S_INPUT_FULL): then it stays connected and the write
   * may be retried once the reader has made room.
   *
   * @param value
   *        The value.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error::Code generated:
   *        error::Code::S_NOT_CONNECTED, error::Code::S_ENDPOINT_NULL,
   *        error::Code::S_INPUT_FULL, error::Code::S_LINK_HOSED or a code emitted by Output_link::send().
   * @return `true` if sent; `false` on error.
   */
  bool write(const Value& value, Error_code* err_code = 0);

  /**
   * Replaces the link factory to be used by subsequent bindings: e.g., that of the destination host.
   * Allowed in `S_DISCONNECTED` state only.
   *
   * @param link_factory
   *        Must not be null; see ctor.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error::Code generated:
   *        error::Code::S_ENDPOINT_STATE_INVALID_FOR_OP, error::Code::S_ENDPOINT_DESTROYED,
   *        error::Code::S_ENDPOINT_NULL.
   * @return `true` on success; `false` on error.
   */
  bool set_link_factory(Factory* link_factory, Error_code* err_code = 0);

  /**
   * Appends a write filter to the end of the chain.
   *
   * @param filter
   *        The filter.  Must not be null (else error::Code::S_INVALID_ARGUMENT).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error::Code generated:
   *        error::Code::S_INVALID_ARGUMENT, error::Code::S_ENDPOINT_DESTROYED, error::Code::S_ENDPOINT_NULL.
   * @return `true` on success; `false` on error.
   */
  bool add_write_filter(Filter_ptr filter, Error_code* err_code = 0);

  /**
   * Inserts a write filter at the given position in the chain: 0 means it applies first.
   *
   * @param filter
   *        See other add_write_filter().
   * @param index
   *        Position; at most write_filter_count() (else error::Code::S_INVALID_ARGUMENT).
   * @param err_code
   *        See other add_write_filter().
   * @return See other add_write_filter().
   */
  bool add_write_filter(Filter_ptr filter, size_t index, Error_code* err_code = 0);

  /**
   * Detaches the given write filter.
   *
   * @param filter
   *        The filter.
   * @return `true` if it was attached; `false` if not, or if in NULL state (no-op).
   */
  bool remove_write_filter(const Write_filter<Value>* filter);

  /**
   * Detaches the write filter at the given position in the chain.
   *
   * @param index
   *        Position; less than write_filter_count() (else error::Code::S_INVALID_ARGUMENT).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error::Code generated:
   *        error::Code::S_INVALID_ARGUMENT, error::Code::S_ENDPOINT_NULL.
   * @return `true` on success; `false` on error.
   */
  bool remove_write_filter(size_t index, Error_code* err_code = 0);

  /**
   * Returns the write filter at the given position in the chain.
   *
   * @param index
   *        Position.
   * @return See above; null if `index` is out of range, or if in NULL state.
   */
  Filter_ptr write_filter(size_t index) const;

  /**
   * Number of attached write filters.
   *
   * @return See above; 0 if in NULL state.
   */
  size_t write_filter_count() const;

  /**
   * Current connection state.  Does not lock.  Connection_state::S_NULL if and only if in NULL state.
   *
   * @return See above.
   */
  Connection_state state() const;

  /**
   * Channel ID and location() together: the form to ship to a destination host.
   *
   * @return See above; all-nil if in NULL state.
   */
  Endpoint_id endpoint_id() const;

  /**
   * The channel's ID, constant for the life of the endpoint.
   *
   * @return See above; nil if in NULL state.
   */
  Channel_id channel_id() const;

  /**
   * Location of the current binding, or of the last binding attempt.  See class doc header.
   *
   * @return See above; null() if in NULL state or never bound.
   */
  Channel_location location() const;

  /**
   * Nickname as passed to ctor.
   *
   * @return See above; empty string if in NULL state.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for `const`-respecting wrapper around Migratable_channel_output_impl for the pImpl idiom.
  using Impl_ptr = std::experimental::propagate_const<boost::movelib::unique_ptr<Migratable_channel_output_impl<Value>>>;

  // Friends.

  /// Friend of Migratable_channel_output.
  template<typename Value2>
  friend std::ostream& operator<<(std::ostream& os, const Migratable_channel_output<Value2>& val);

  // Methods.

  /**
   * Emits error::Code::S_ENDPOINT_NULL: sets `*err_code`, or throws if `err_code` is null.
   *
   * @param err_code
   *        See `flow::Error_code` docs.
   * @return `false`.
   */
  static bool null_op_error(Error_code* err_code);

  // Data.

  /// The true implementation of this class.  See also our class doc header; and operator=(Migratable_channel_output&&).
  Impl_ptr m_impl;
}; // class Migratable_channel_output

// Template implementations (strict pImpl-idiom style (albeit pImpl-lite due to template-ness)).

// The move semantics we get for free with pImpl; they'll just move-to/from the unique_ptr m_impl.

template<typename Value>
Migratable_channel_output<Value>::Migratable_channel_output(Migratable_channel_output&&) = default;
template<typename Value>
Migratable_channel_output<Value>& Migratable_channel_output<Value>::operator=(Migratable_channel_output&&) = default;

// The NULL state ctor comports with how null m_impl is treated all over below.
template<typename Value>
Migratable_channel_output<Value>::Migratable_channel_output() = default;

// The rest is strict forwarding to m_impl, once PEER state is established (non-null m_impl).

template<typename Value>
Migratable_channel_output<Value>::Migratable_channel_output
  (flow::log::Logger* logger_ptr, util::String_view nickname_str, const Endpoint_id& endpoint_id,
   Factory* link_factory, Binding_registry* registry) :

  m_impl(boost::movelib::make_unique<Migratable_channel_output_impl<Value>>
           (logger_ptr, nickname_str, endpoint_id, link_factory, registry))
{
  // Yay.
}

// It's only explicitly defined to formally document it.
template<typename Value>
Migratable_channel_output<Value>::~Migratable_channel_output() = default;

template<typename Value>
bool Migratable_channel_output<Value>::null_op_error(Error_code* err_code) // Static.
{
  if (!err_code)
  {
    throw flow::error::Runtime_error(error::Code::S_ENDPOINT_NULL, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else
  *err_code = error::Code::S_ENDPOINT_NULL;
  return false;
}

template<typename Value>
bool Migratable_channel_output<Value>::bind(const Channel_location& location, Error_code* err_code)
{
  return m_impl ? m_impl->bind(location, err_code) : null_op_error(err_code);
}

template<typename Value>
bool Migratable_channel_output<Value>::prepare_to_move()
{
  return m_impl ? m_impl->prepare_to_move() : false;
}

template<typename Value>
bool Migratable_channel_output<Value>::recreate(Error_code* err_code)
{
  return m_impl ? m_impl->recreate(0, err_code) : null_op_error(err_code);
}

template<typename Value>
bool Migratable_channel_output<Value>::recreate(const Channel_location& new_location, Error_code* err_code)
{
  return m_impl ? m_impl->recreate(&new_location, err_code) : null_op_error(err_code);
}

template<typename Value>
bool Migratable_channel_output<Value>::destroy()
{
  return m_impl ? m_impl->destroy() : false;
}

template<typename Value>
bool Migratable_channel_output<Value>::write(const Value& value, Error_code* err_code)
{
  return m_impl ? m_impl->write(value, err_code) : null_op_error(err_code);
}

template<typename Value>
bool Migratable_channel_output<Value>::set_link_factory(Factory* link_factory, Error_code* err_code)
{
  return m_impl ? m_impl->set_link_factory(link_factory, err_code) : null_op_error(err_code);
}

template<typename Value>
bool Migratable_channel_output<Value>::add_write_filter(Filter_ptr filter, Error_code* err_code)
{
  return m_impl ? m_impl->add_write_filter(std::move(filter), Migratable_channel_output_impl<Value>::S_FILTER_INDEX_END,
                                           err_code)
                : null_op_error(err_code);
}

template<typename Value>
bool Migratable_channel_output<Value>::add_write_filter(Filter_ptr filter, size_t index, Error_code* err_code)
{
  return m_impl ? m_impl->add_write_filter(std::move(filter), index, err_code) : null_op_error(err_code);
}

template<typename Value>
bool Migratable_channel_output<Value>::remove_write_filter(const Write_filter<Value>* filter)
{
  return m_impl ? m_impl->remove_write_filter(filter) : false;
}

template<typename Value>
bool Migratable_channel_output<Value>::remove_write_filter(size_t index, Error_code* err_code)
{
  return m_impl ? m_impl->remove_write_filter_at(index, err_code) : null_op_error(err_code);
}

template<typename Value>
typename Migratable_channel_output<Value>::Filter_ptr Migratable_channel_output<Value>::write_filter(size_t index) const
{
  return m_impl ? m_impl->write_filter(index) : Filter_ptr();
}

template<typename Value>
size_t Migratable_channel_output<Value>::write_filter_count() const
{
  return m_impl ? m_impl->write_filter_count() : 0;
}

template<typename Value>
Connection_state Migratable_channel_output<Value>::state() const
{
  return m_impl ? m_impl->state() : Connection_state::S_NULL;
}

template<typename Value>
Endpoint_id Migratable_channel_output<Value>::endpoint_id() const
{
  return m_impl ? m_impl->endpoint_id() : Endpoint_id();
}

template<typename Value>
Channel_id Migratable_channel_output<Value>::channel_id() const
{
  return m_impl ? m_impl->channel_id() : boost::uuids::nil_uuid();
}

template<typename Value>
Channel_location Migratable_channel_output<Value>::location() const
{
  return m_impl ? m_impl->location() : Channel_location();
}

template<typename Value>
const std::string& Migratable_channel_output<Value>::nickname() const
{
  return m_impl ? m_impl->nickname() : util::EMPTY_STRING;
}

// `friend`ship needed for this "non-method method":

template<typename Value>
std::ostream& operator<<(std::ostream& os, const Migratable_channel_output<Value>& val)
{
  if (val.m_impl)
  {
    return os << *val.m_impl;
  }
  // else
  return os << "null";
}

} // namespace csp::net
