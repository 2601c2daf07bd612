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

#include "csp/store/detail/bounded_store.hpp"

namespace csp::store
{

// Types.

/**
 * Data_store with FIFO semantics that always accepts a write, overwriting its oldest unread value if full.
 * When empty, the channel blocks readers.  When full, a writer is *not* blocked: the oldest value left unread is
 * discarded and the new value appended.  So `put()` on a full store is equivalent to a `get()` whose result is
 * thrown away immediately followed by a `put()` on the now-not-full store.
 *
 * Hence, for a store of capacity `n`, once more than `n` values have been written, `get()` returns the value written
 * exactly `n` `put()`s ago (among those not yet read); the discarded values are never seen by a reader, and the
 * survivors are never reordered.
 *
 * state() returns Store_state::S_EMPTY or Store_state::S_NONEMPTYFULL but never Store_state::S_FULL.
 *
 * Typical use: a channel carrying periodic samples (sensor readings, UI positions), where a slow reader should see
 * the most recent `n` and a fast writer must never be held up.
 *
 * ### Thread safety ###
 * See Data_store.
 *
 * @tparam Value
 *         See Data_store.
 */
template<typename Value>
class Overwrite_oldest_buffer :
  public Bounded_store<Value>
{
public:
  // Constructors/destructor.

  /**
   * Constructs an empty store with room for `capacity` values.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param capacity
   *        The number of values the store can hold.
   * @throws flow::error::Runtime_error
   *         Containing store::error::Code::S_INVALID_CAPACITY if `capacity` is zero or negative.  Do not
   *         catch this in order to retry: the code generating it is in error and needs correcting.
   */
  explicit Overwrite_oldest_buffer(flow::log::Logger* logger_ptr, int capacity);

  // Methods.

  /**
   * Implements Data_store API: appends `value`; if the store was full, first discards the oldest value.
   *
   * @param value
   *        See Data_store.
   */
  void put(Value value) override;

  /**
   * Implements Data_store API: Store_state::S_EMPTY if nothing is buffered, else Store_state::S_NONEMPTYFULL.
   *
   * @return See above.
   */
  Store_state state() const override;

  /**
   * Implements Data_store API.  Only the capacity is cloned, not any buffered value.
   *
   * @return See above.
   */
  std::unique_ptr<Data_store<Value>> clone_empty() const override;

  // Base's Log_context accessors are hidden by the dependent base; the FLOW_LOG_*() macros need them.
  using Bounded_store<Value>::get_logger;
  using Bounded_store<Value>::get_log_component;

private:
  // Types.

  /// Short-hand for immediate base.
  using Base = Bounded_store<Value>;
}; // class Overwrite_oldest_buffer

// Template implementations.

template<typename Value>
Overwrite_oldest_buffer<Value>::Overwrite_oldest_buffer(flow::log::Logger* logger_ptr, int capacity) :
  Base(logger_ptr, Buffer_policy::S_OVERWRITE_OLDEST, capacity)
{
  // Yay.
}

template<typename Value>
void Overwrite_oldest_buffer<Value>::put(Value value)
{
  if (this->full())
  {
    FLOW_LOG_TRACE("Overwrite_oldest_buffer [" << *this << "]: Full at [" << this->capacity() << "] values; "
                   "discarding oldest unread value to accept new one.");
    this->m_slots.pop_front();
  }
  this->m_slots.push_back(std::move(value));
}

template<typename Value>
Store_state Overwrite_oldest_buffer<Value>::state() const
{
  return this->m_slots.empty() ? Store_state::S_EMPTY : Store_state::S_NONEMPTYFULL;
}

template<typename Value>
std::unique_ptr<Data_store<Value>> Overwrite_oldest_buffer<Value>::clone_empty() const
{
  return std::make_unique<Overwrite_oldest_buffer>(get_logger(), this->capacity());
}

} // namespace csp::store
