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

#include "csp/net/channel_location.hpp"
#include <boost/uuid/nil_generator.hpp>

namespace csp::net
{

// Types.

/**
 * Identity of a network channel end: the location-independent Channel_id plus the current Channel_location of the
 * channel's reading end.  The former never changes over the life of the channel; the latter changes on relocation.
 *
 * The string form (`ostream<<`, `istream>>`) is `<uuid>@<location>`, e.g.,
 * `0b5c7d4e-1f29-4c2a-9e1a-3c52bfa6f7a1@10.0.0.7:4000#12`.  This is what the migrating process ships to the
 * destination host, so that the channel end can be recreated there.
 */
struct Endpoint_id
{
  // Data.

  /// The channel's identity.  Nil (all zeroes) means no channel.
  Channel_id m_channel_id = boost::uuids::nil_uuid();

  /// Where the channel's reading end currently lives.
  Channel_location m_location;
}; // struct Endpoint_id

// Free functions.

/**
 * Returns `true` if and only if both members are equal.
 *
 * @relatesalso Endpoint_id
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Endpoint_id& val1, const Endpoint_id& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Endpoint_id
 *
 * @param val1
 *        See `==`.
 * @param val2
 *        See `==`.
 * @return See above.
 */
bool operator!=(const Endpoint_id& val1, const Endpoint_id& val2);

/**
 * Prints string representation (see Endpoint_id doc header).
 *
 * @relatesalso Endpoint_id
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Endpoint_id& val);

/**
 * Reads a whitespace-delimited token in the form written by `ostream<<`.  A malformed token sets `is` to failed
 * state and leaves `val` unchanged.
 *
 * @relatesalso Endpoint_id
 *
 * @param is
 *        Stream from which to read.
 * @param val
 *        Object to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Endpoint_id& val);

} // namespace csp::net
