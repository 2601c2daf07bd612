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

#include "csp/net/endpoint_id.hpp"
#include <memory>

namespace csp::net
{

// Types.

/**
 * One live writer-side physical binding of a network channel: the network layer's conduit from a writing end
 * (Migratable_channel_output) to the channel's reading end at remote_location().  Flow-CSP does not implement the
 * network layer; an implementation is obtained from the network layer's Link_factory (or see Loopback_network).
 *
 * The binding is live from construction until destruction: the destructor must release every resource the binding
 * holds (sockets, buffers, remote virtual channel registration), so that once it returns nothing further can be
 * delivered through it.  Migratable_channel_output relies on this for the move protocol.
 *
 * ### Thread safety ###
 * Migratable_channel_output never invokes a given link concurrently with itself; an implementation needs no
 * internal locking on that account.
 *
 * @tparam Value
 *         Type of value carried by the channel.
 */
template<typename Value>
class Output_link
{
public:
  // Constructors/destructor.

  /// Releases the binding.
  virtual ~Output_link() = default;

  // Methods.

  /**
   * Sends one value to the reading end.  Does not block beyond what the network layer needs to accept the value.
   *
   * @param value
   *        The value.
   * @param err_code
   *        Not null.  Cleared on success.  error::Code::S_INPUT_FULL means the value was not taken, as the reading
   *        end cannot hold more right now; the link stays usable.  Any other truthy value (error::Code::S_LINK_HOSED
   *        or a network layer code) means the link is assumed to be unusable.
   */
  virtual void send(const Value& value, Error_code* err_code) = 0;

  /**
   * The location of the reading end at which the binding terminates.
   *
   * @return See above.
   */
  virtual const Channel_location& remote_location() const = 0;
}; // class Output_link

/**
 * Source of Output_link objects: the network layer's interface for establishing a writer-side physical binding to
 * a given channel location.  A Migratable_channel_output holds a pointer to one; on relocation to another host the
 * destination host's factory is installed (see Relocator::arrive()).
 *
 * ### Thread safety ###
 * connect() may be called concurrently on the same object, for different endpoints.
 *
 * @tparam Value
 *         Type of value carried by the channel.
 */
template<typename Value>
class Link_factory
{
public:
  // Types.

  /// Short-hand for the product.
  using Link = Output_link<Value>;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Link_factory() = default;

  // Methods.

  /**
   * Establishes a binding from the writing end of channel `endpoint_id.m_channel_id` to its reading end at
   * `endpoint_id.m_location`.  May block (e.g., on a network handshake).
   *
   * @param endpoint_id
   *        Channel and location.  Location is not null().
   * @param err_code
   *        Not null.  Cleared on success; on failure set to a truthy value: error::Code::S_LOCATION_UNREACHABLE or
   *        a network layer code.
   * @return The live link on success; null on failure.
   */
  virtual std::unique_ptr<Link> connect(const Endpoint_id& endpoint_id, Error_code* err_code) = 0;
}; // class Link_factory

} // namespace csp::net
