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
#include "csp/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <boost/unordered_map.hpp>
#include <boost/functional/hash.hpp>

namespace csp::net
{

// Types.

/**
 * Thread-safe record of the live writer-side bindings of network channels: for each Channel_id at most one
 * Channel_location.  Migratable_channel_output claim()s an entry just before connecting and release()s it once its
 * link is gone, so that with a registry shared by all endpoints of a given channel no two writer bindings of it are
 * ever live at once.  During a relocation there is a window in which the channel has no entry at all.
 *
 * A registry is optional from the point of view of Migratable_channel_output; without one the invariant is the
 * owner's (or the network layer's) responsibility.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently on the same object.
 */
class Binding_registry :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs an empty registry.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   */
  explicit Binding_registry(flow::log::Logger* logger_ptr, util::String_view nickname);

  // Methods.

  /**
   * Records that the channel `endpoint_id.m_channel_id` now has a live writer binding at `endpoint_id.m_location`.
   * If it already does at that same location, this is a no-op that succeeds.
   *
   * @param endpoint_id
   *        The binding.  `m_location` must not be null().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_CHANNEL_ALREADY_BOUND (a binding at a different location is live; nothing changed).
   * @return `true` if the entry was added; `false` if it was already there, or on error.
   */
  bool claim(const Endpoint_id& endpoint_id, Error_code* err_code = 0);

  /**
   * Forgets the live binding of the given channel, if any.
   *
   * @param channel_id
   *        The channel.
   * @return `true` if there was one; `false` if not (no-op).
   */
  bool release(const Channel_id& channel_id);

  /**
   * Returns whether the given channel has a live binding, and if so where.
   *
   * @param channel_id
   *        The channel.
   * @param location
   *        If not null, and the result is `true`, `*location` is set to the binding's location.
   * @return See above.
   */
  bool live_location(const Channel_id& channel_id, Channel_location* location = 0) const;

  /**
   * Number of channels with a live binding.
   *
   * @return See above.
   */
  size_t live_count() const;

  /**
   * Nickname as passed to ctor.
   *
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for the map type: Channel_id to live location.
  using Binding_map = boost::unordered_map<Channel_id, Channel_location, boost::hash<Channel_id>>;

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Protects #m_bindings.
  mutable util::Mutex_non_recursive m_mutex;

  /// The live bindings.  Protected by #m_mutex.
  Binding_map m_bindings;
}; // class Binding_registry

// Free functions.

/**
 * Prints string representation of the given Binding_registry to the given `ostream`.
 *
 * @relatesalso Binding_registry
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Binding_registry& val);

} // namespace csp::net
