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
 * Data_store with FIFO semantics that always accepts a write, overwriting its *newest* unread value if full.
 * Contrast with Overwrite_oldest_buffer: here the `capacity() - 1` oldest values are preserved and the last slot
 * keeps being replaced by whatever was written most recently.
 *
 * state() returns Store_state::S_EMPTY or Store_state::S_NONEMPTYFULL but never Store_state::S_FULL.
 *
 * @tparam Value
 *         See Data_store.
 */
template<typename Value>
class Overwriting_buffer :
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
  explicit Overwriting_buffer(flow::log::Logger* logger_ptr, int capacity);

  // Methods.

  /**
   * Implements Data_store API: appends `value`; if full, it replaces the newest value instead.
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
}; // class Overwriting_buffer

// Template implementations.

template<typename Value>
Overwriting_buffer<Value>::Overwriting_buffer(flow::log::Logger* logger_ptr, int capacity) :
  Bounded_store<Value>(logger_ptr, Buffer_policy::S_OVERWRITE_NEWEST, capacity)
{
  // Yay.
}

template<typename Value>
void Overwriting_buffer<Value>::put(Value value)
{
  if (this->full())
  {
    FLOW_LOG_TRACE("Overwriting_buffer [" << *this << "]: Full; replacing newest unread value.");
    this->m_slots.back() = std::move(value);
    return;
  }
  // else
  this->m_slots.push_back(std::move(value));
}

template<typename Value>
Store_state Overwriting_buffer<Value>::state() const
{
  return this->m_slots.empty() ? Store_state::S_EMPTY : Store_state::S_NONEMPTYFULL;
}

template<typename Value>
std::unique_ptr<Data_store<Value>> Overwriting_buffer<Value>::clone_empty() const
{
  return std::make_unique<Overwriting_buffer>(get_logger(), this->capacity());
}

} // namespace csp::store
