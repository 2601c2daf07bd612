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

#include "csp/common.hpp"
#include <boost/uuid/uuid.hpp>
#include <ostream>

/**
 * Flow-CSP module providing network channel ends whose physical binding can move between locations while the
 * channel keeps its identity.
 *
 * A network channel is identified by a Channel_id, which never changes.  Its reading end lives at a
 * Channel_location (a node address plus a virtual channel number on that node).  Its writing end is a
 * Migratable_channel_output, which at any moment is either bound to that location through a live Output_link
 * (Connection_state::S_CONNECTED) or not bound at all.  The Output_link objects come from a Link_factory: this is
 * the interface to the external network layer, which Flow-CSP does not implement (Loopback_network is an
 * in-process stand-in).
 *
 * Relocation is done by Relocator: the endpoint is quiesced and unbound at the source (prepare_to_move()), its
 * ownership moves (it is move-only; the ticket in between is a Migration_ticket), and it is re-bound at the
 * destination (recreate()).  A Binding_registry, if supplied, guarantees that no two writer bindings of one
 * Channel_id are ever live at once.
 */
namespace csp::net
{

// Types.

// Find doc headers near the bodies of these compound types.

class Channel_location;
struct Endpoint_id;
class Binding_registry;

template<typename Value>
class Output_link;
template<typename Value>
class Link_factory;
template<typename Value>
class Write_filter;
template<typename Value>
class Migratable_channel_output;
template<typename Value>
class Migratable_channel_output_impl;
template<typename Value>
class Migration_ticket;
template<typename Value>
class Relocator;
template<typename Value>
class Loopback_network;

/// Globally unique, location-independent identifier of a channel; stable across relocations.
using Channel_id = boost::uuids::uuid;

/**
 * The connection state of a Migratable_channel_output.  Transitions (see Migratable_channel_output doc header
 * for the full state machine):
 *   - S_CONNECTED -> S_PREPARING -> S_DISCONNECTED: `prepare_to_move()`.
 *   - S_DISCONNECTED -> S_RECONNECTING -> S_CONNECTED (or back to S_DISCONNECTED on failure): `recreate()`.
 *   - any except S_NULL, S_DESTROYED -> S_DESTROYED: `destroy()`.
 */
enum class Connection_state
{
  /// Default-constructed or moved-from: no channel identity; every operation fails.
  S_NULL,
  /// Bound to a location via a live link; writes are accepted.
  S_CONNECTED,
  /// The binding is being torn down; writes are rejected.
  S_PREPARING,
  /// No live binding, but the channel identity remains valid; writes are rejected; `recreate()` may be called.
  S_DISCONNECTED,
  /// A new binding is being established; writes are rejected.
  S_RECONNECTING,
  /// Terminal: destroyed by `destroy()`; all resources released.
  S_DESTROYED
}; // enum class Connection_state

// Free functions.

/**
 * Generates a new, random (version 4) Channel_id.  Thread-safe.
 *
 * @return See above.
 */
Channel_id generate_channel_id();

/**
 * Serializes a Connection_state, e.g., Connection_state::S_CONNECTED => `"CONNECTED"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Connection_state val);

/**
 * Prints string representation of the given `Migratable_channel_output` to the given `ostream`.
 *
 * @relatesalso Migratable_channel_output
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Value>
std::ostream& operator<<(std::ostream& os, const Migratable_channel_output<Value>& val);

/**
 * Prints string representation of the given `Migratable_channel_output_impl` to the given `ostream`.
 *
 * @relatesalso Migratable_channel_output_impl
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Value>
std::ostream& operator<<(std::ostream& os, const Migratable_channel_output_impl<Value>& val);

} // namespace csp::net
