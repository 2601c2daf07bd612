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

#include "csp/net/net_fwd.hpp"

namespace csp::net
{

// Types.

/**
 * An opaque pass-through stage attached to the writing end of a network channel: Migratable_channel_output applies
 * its write filters, in order, to each value passed to `write()`, before it goes to the link.  A filter may
 * transform the value (compression, tagging, accounting) but cannot veto it.
 *
 * Filters travel with the endpoint when it is relocated.  Before the endpoint unbinds from its old location it calls
 * quiesce() on each filter; a filter holding state tied to the old binding (e.g., a batch pending flush) should
 * settle it there.  A filter is shared (`shared_ptr`) so that its owner can keep observing it.
 *
 * ### Thread safety ###
 * filter() and quiesce() are called with the endpoint's internal lock held, hence never concurrently with each
 * other for one endpoint.  If a filter is attached to several endpoints, it must handle concurrency itself.
 *
 * @tparam Value
 *         Type of value carried by the channel.
 */
template<typename Value>
class Write_filter
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Write_filter() = default;

  // Methods.

  /**
   * Filters one value.
   *
   * @param value
   *        The value as written by the user or as output by the preceding filter.
   * @return The value to pass to the next filter or the link.
   */
  virtual Value filter(Value value) = 0;

  /// Called once before the endpoint is unbound for relocation.  Default: no-op.
  virtual void quiesce();
}; // class Write_filter

// Template implementations.

template<typename Value>
void Write_filter<Value>::quiesce()
{
  // Nothing to settle by default.
}

} // namespace csp::net
