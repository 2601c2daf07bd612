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
 * Data_store with FIFO semantics that always accepts a write but silently drops it if full; what is already
 * buffered is never disturbed.
 *
 * state() returns Store_state::S_EMPTY or Store_state::S_NONEMPTYFULL but never Store_state::S_FULL.
 *
 * @tparam Value
 *         See Data_store.
 */
template<typename Value>
class Overflowing_buffer :
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
   *         Containing store::error::Code::S_INVALID_CAPACITY if `capacity` is zero or negative.
   */
  explicit Overflowing_buffer(flow::log::Logger* logger_ptr, int capacity);

  // Methods.

  /**
   * Implements Data_store API: appends `value` unless full, in which case `value` is discarded.
   *
   * @param value
   *        See Data_store.
   */
  void put(Value value) override;

  /**
   * Implements Data_store API.
   * @return See above.
   */
  Store_state state() const override;

  /**
   * Implements Data_store API.
   * @return See above.
   */
  std::unique_ptr<Data_store<Value>> clone_empty() const override;

  using Bounded_store<Value>::get_logger;
  using Bounded_store<Value>::get_log_component;
}; // class Overflowing_buffer

// Template implementations.

template<typename Value>
Overflowing_buffer<Value>::Overflowing_buffer(flow::log::Logger* logger_ptr, int capacity) :
  Bounded_store<Value>(logger_ptr, Buffer_policy::S_OVERFLOW_DROP, capacity)
{
  // Yay.
}

template<typename Value>
void Overflowing_buffer<Value>::put(Value value)
{
  if (this->full())
  {
    FLOW_LOG_TRACE("Overflowing_buffer [" << *this << "]: Full; dropping value being written.");
    return;
  }
  // else
  this->m_slots.push_back(std::move(value));
}

template<typename Value>
Store_state Overflowing_buffer<Value>::state() const
{
  return this->m_slots.empty() ? Store_state::S_EMPTY : Store_state::S_NONEMPTYFULL;
}

template<typename Value>
std::unique_ptr<Data_store<Value>> Overflowing_buffer<Value>::clone_empty() const
{
  return std::make_unique<Overflowing_buffer>(get_logger(), this->capacity());
}

} // namespace csp::store
