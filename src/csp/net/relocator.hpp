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

#include "csp/net/migratable_channel_output.hpp"

namespace csp::net
{

// Types.

/**
 * A departed Migratable_channel_output in transit between owners: produced by Relocator::depart() at the source,
 * consumed by Relocator::arrive() at the destination.  What has to reach the destination host (in whatever way the
 * owner migrates) is endpoint_id(); within one process the ticket itself can simply be moved along.
 *
 * Move-only, like the endpoint it holds.  A default-constructed or moved-from ticket is empty().
 *
 * @tparam Value
 *         See Migratable_channel_output.
 */
template<typename Value>
class Migration_ticket
{
public:
  // Types.

  /// Short-hand for the endpoint type.
  using Endpoint = Migratable_channel_output<Value>;

  // Constructors/destructor.

  /// Constructs an empty() ticket.
  Migration_ticket();

  /**
   * Move-constructs from `src`, which becomes empty().
   *
   * @param src
   *        Source object.
   */
  Migration_ticket(Migration_ticket&& src);

  /// Copying is disallowed.
  Migration_ticket(const Migration_ticket&) = delete;

  // Methods.

  /**
   * Move-assigns from `src`, which becomes empty().  Any endpoint held by `*this` is destroyed first.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Migration_ticket& operator=(Migration_ticket&& src);

  /// Copying is disallowed.
  Migration_ticket& operator=(const Migration_ticket&) = delete;

  /**
   * Identity and last known location of the endpoint in transit.
   *
   * @return See above; all-nil if empty().
   */
  Endpoint_id endpoint_id() const;

  /**
   * `true` if and only if no endpoint is held.
   *
   * @return See above.
   */
  bool empty() const;

  /**
   * The held endpoint, for inspection.
   *
   * @return See above.  In NULL state if empty().
   */
  const Endpoint& endpoint() const;

private:
  // Friends.

  /// Makes and consumes tickets.
  friend class Relocator<Value>;

  // Constructors.

  /**
   * Constructs a ticket holding the given endpoint.
   *
   * @param endpoint
   *        Endpoint; becomes NULL.
   */
  explicit Migration_ticket(Endpoint&& endpoint);

  // Data.

  /// The endpoint in transit; in NULL state if empty().
  Endpoint m_endpoint;
}; // class Migration_ticket

/**
 * Carries out the relocation protocol of a Migratable_channel_output, the writing end of a network channel, whose
 * owner is moving (to another host, or just to another reading-end location).  It adds no state of its own: it
 * sequences the endpoint's operations and logs the protocol at INFO level, so a given Relocator may be used for any
 * number of relocations, concurrently.
 *
 * ### Protocol ###
 *   -# Source host: `ticket = depart(std::move(endpoint))`.  The endpoint is quiesced and unbound
 *      (Migratable_channel_output::prepare_to_move()); from then until step 3 completes, the channel has no live
 *      writer binding.  The owner's `endpoint` is left in NULL state, so a stale use of it fails visibly.
 *   -# The owner migrates, taking `ticket.endpoint_id()` (its `ostream<<` form, if crossing processes) along.
 *   -# Destination host: `arrive(std::move(ticket), local_link_factory, &endpoint, &err_code)`, or the overload
 *      that also specifies a new location.  The destination's Link_factory is installed, and the binding is
 *      re-established (Migratable_channel_output::recreate()).
 *
 * If step 3 fails, the endpoint is nevertheless delivered to the target in `S_DISCONNECTED` state; the owner decides
 * whether to retry (Migratable_channel_output::recreate()) or give up (Migratable_channel_output::destroy()).
 * Relocator never retries on its own.
 *
 * relocate() does the whole thing in place, for an owner that stays put while the channel's reading end moves.
 *
 * @tparam Value
 *         See Migratable_channel_output.
 */
template<typename Value>
class Relocator :
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for the endpoint type.
  using Endpoint = Migratable_channel_output<Value>;

  /// Short-hand for the ticket type.
  using Ticket = Migration_ticket<Value>;

  /// Short-hand for the link factory type.
  using Factory = Link_factory<Value>;

  // Constructors/destructor.

  /**
   * Constructs the relocator.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in logging only.
   */
  explicit Relocator(flow::log::Logger* logger_ptr, util::String_view nickname_str);

  // Methods.

  /**
   * Step 1 of the protocol (see class doc header): quiesces and unbinds `endpoint` and packs it into a ticket.
   * If `endpoint` is not connected (e.g., it is already `S_DISCONNECTED`) it is packed as-is.
   *
   * @param endpoint
   *        The endpoint.  Becomes NULL.
   * @return Ticket holding the endpoint; empty() if `endpoint` was NULL.
   */
  Ticket depart(Endpoint&& endpoint);

  /**
   * Step 3 of the protocol (see class doc header): unpacks the ticket into `*target`, installs `link_factory`, and
   * re-binds at the endpoint's last known location.
   *
   * @param ticket
   *        Ticket from depart().  Becomes empty().
   * @param link_factory
   *        Link factory of the destination.  Must not be null.
   * @param target
   *        Receives the endpoint whether or not the binding succeeded.  Must not be null.  Whatever it held before
   *        is destroyed.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error::Code generated:
   *        error::Code::S_ENDPOINT_NULL (ticket was empty()); those of Migratable_channel_output::set_link_factory()
   *        and Migratable_channel_output::recreate().
   * @return `true` if connected; else `false`.
   */
  bool arrive(Ticket&& ticket, Factory* link_factory, Endpoint* target, Error_code* err_code = 0);

  /**
   * Same as the other arrive(), but re-binds at `new_location`.
   *
   * @param ticket
   *        See other arrive().
   * @param link_factory
   *        See other arrive().
   * @param new_location
   *        Location of the channel's reading end at the destination.
   * @param target
   *        See other arrive().
   * @param err_code
   *        See other arrive().
   * @return See other arrive().
   */
  bool arrive(Ticket&& ticket, Factory* link_factory, const Channel_location& new_location,
              Endpoint* target, Error_code* err_code = 0);

  /**
   * In-place relocation: Migratable_channel_output::prepare_to_move() (if connected) followed by
   * `Migratable_channel_output::recreate(new_location)`.
   *
   * @param endpoint
   *        The endpoint.  Must not be null.
   * @param new_location
   *        Location of the channel's reading end.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error::Code generated:
   *        error::Code::S_ENDPOINT_NULL; those of Migratable_channel_output::recreate().
   * @return `true` if connected at `new_location`; else `false`.
   */
  bool relocate(Endpoint* endpoint, const Channel_location& new_location, Error_code* err_code = 0);

  /**
   * Nickname as passed to ctor.
   *
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Methods.

  /**
   * Implements both arrive() overloads.
   *
   * @param ticket
   *        See arrive().
   * @param link_factory
   *        See arrive().
   * @param new_location_or_null
   *        See arrive(); null means the last known location.
   * @param target
   *        See arrive().
   * @param err_code
   *        See arrive().
   * @return See arrive().
   */
  bool arrive_impl(Ticket* ticket, Factory* link_factory, const Channel_location* new_location_or_null,
                   Endpoint* target, Error_code* err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;
}; // class Relocator

// Template implementations.

template<typename Value>
Migration_ticket<Value>::Migration_ticket() = default;

template<typename Value>
Migration_ticket<Value>::Migration_ticket(Migration_ticket&&) = default;

template<typename Value>
Migration_ticket<Value>& Migration_ticket<Value>::operator=(Migration_ticket&&) = default;

template<typename Value>
Migration_ticket<Value>::Migration_ticket(Endpoint&& endpoint) :
  m_endpoint(std::move(endpoint))
{
  // Yay.
}

template<typename Value>
Endpoint_id Migration_ticket<Value>::endpoint_id() const
{
  return m_endpoint.endpoint_id();
}

template<typename Value>
bool Migration_ticket<Value>::empty() const
{
  return m_endpoint.state() == Connection_state::S_NULL;
}

template<typename Value>
const typename Migration_ticket<Value>::Endpoint& Migration_ticket<Value>::endpoint() const
{
  return m_endpoint;
}

template<typename Value>
Relocator<Value>::Relocator(flow::log::Logger* logger_ptr, util::String_view nickname_str) :
  flow::log::Log_context(logger_ptr, Log_component::S_NET),
  m_nickname(nickname_str)
{
  // Yay.
}

template<typename Value>
typename Relocator<Value>::Ticket Relocator<Value>::depart(Endpoint&& endpoint)
{
  if (endpoint.prepare_to_move())
  {
    FLOW_LOG_INFO("Relocator [" << m_nickname << "]: Endpoint [" << endpoint << "] departed from "
                  "[" << endpoint.location() << "]; channel has no live writer binding until arrival.");
  }
  else
  {
    const auto state = endpoint.state();
    if (state == Connection_state::S_DISCONNECTED)
    {
      FLOW_LOG_INFO("Relocator [" << m_nickname << "]: Endpoint [" << endpoint << "] departing; it was already "
                    "disconnected; last known location [" << endpoint.location() << "].");
    }
    else
    {
      FLOW_LOG_WARNING("Relocator [" << m_nickname << "]: Endpoint [" << endpoint << "] departing in state "
                       "[" << state << "]; arrival will fail.");
    }
  }

  return Ticket(std::move(endpoint));
} // Relocator::depart()

template<typename Value>
bool Relocator<Value>::arrive(Ticket&& ticket, Factory* link_factory, Endpoint* target, Error_code* err_code)
{
  return arrive_impl(&ticket, link_factory, 0, target, err_code);
}

template<typename Value>
bool Relocator<Value>::arrive(Ticket&& ticket, Factory* link_factory, const Channel_location& new_location,
                              Endpoint* target, Error_code* err_code)
{
  return arrive_impl(&ticket, link_factory, &new_location, target, err_code);
}

template<typename Value>
bool Relocator<Value>::arrive_impl(Ticket* ticket, Factory* link_factory,
                                   const Channel_location* new_location_or_null,
                                   Endpoint* target, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Relocator::arrive_impl,
                                     ticket, link_factory, new_location_or_null, target, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(ticket && target && link_factory && "Broke contract.");

  *target = std::move(ticket->m_endpoint);
  if (target->state() == Connection_state::S_NULL)
  {
    FLOW_LOG_WARNING("Relocator [" << m_nickname << "]: Arrival with an empty ticket; nothing to recreate.");
    *err_code = error::Code::S_ENDPOINT_NULL;
    return false;
  }
  // else

  const auto location = new_location_or_null ? *new_location_or_null : target->location();
  FLOW_LOG_INFO("Relocator [" << m_nickname << "]: Endpoint [" << *target << "] arriving; "
                "recreating at [" << location << "].");

  if (target->set_link_factory(link_factory, err_code)
      && target->recreate(location, err_code))
  {
    FLOW_LOG_INFO("Relocator [" << m_nickname << "]: Endpoint [" << *target << "] arrived; connected to "
                  "[" << location << "].");
    return true;
  }
  // else

  FLOW_LOG_WARNING("Relocator [" << m_nickname << "]: Endpoint [" << *target << "] arrived but could not be "
                   "connected to [" << location << "]: [" << *err_code << "] [" << err_code->message() << "].  "
                   "It is the owner's to retry or destroy.");
  return false;
} // Relocator::arrive_impl()

template<typename Value>
bool Relocator<Value>::relocate(Endpoint* endpoint, const Channel_location& new_location, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Relocator::relocate,
                                     endpoint, flow::util::bind_ns::cref(new_location), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(endpoint && "Broke contract.");

  if (endpoint->state() == Connection_state::S_NULL)
  {
    FLOW_LOG_WARNING("Relocator [" << m_nickname << "]: Relocation of a NULL endpoint requested.");
    *err_code = error::Code::S_ENDPOINT_NULL;
    return false;
  }
  // else

  const auto old_location = endpoint->location();
  endpoint->prepare_to_move();
  if (!endpoint->recreate(new_location, err_code))
  {
    FLOW_LOG_WARNING("Relocator [" << m_nickname << "]: Endpoint [" << *endpoint << "] relocation "
                     "[" << old_location << "] => [" << new_location << "] failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else

  FLOW_LOG_INFO("Relocator [" << m_nickname << "]: Endpoint [" << *endpoint << "] relocated "
                "[" << old_location << "] => [" << new_location << "].");
  return true;
} // Relocator::relocate()

template<typename Value>
const std::string& Relocator<Value>::nickname() const
{
  return m_nickname;
}

} // namespace csp::net
