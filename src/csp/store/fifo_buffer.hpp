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
 * Data_store with plain bounded FIFO semantics: when empty the channel blocks readers, when full it blocks writers.
 * The blocking is the runtime's job; this store merely reports Store_state::S_FULL, and the runtime must then
 * not call `put()` (precondition violation; assertion may trip).
 *
 * state() returns Store_state::S_EMPTY, Store_state::S_FULL, or (in between) Store_state::S_NONEMPTYFULL.
 *
 * @tparam Value
 *         See Data_store.
 */
template<typename Value>
class Fifo_buffer :
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
  explicit Fifo_buffer(flow::log::Logger* logger_ptr, int capacity);

  // Methods.

  /**
   * Implements Data_store API.  Precondition: `state() != S_FULL`.
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
}; // class Fifo_buffer

// Template implementations.

template<typename Value>
Fifo_buffer<Value>::Fifo_buffer(flow::log::Logger* logger_ptr, int capacity) :
  Bounded_store<Value>(logger_ptr, Buffer_policy::S_FIFO, capacity)
{
  // Yay.
}

template<typename Value>
void Fifo_buffer<Value>::put(Value value)
{
  assert((!this->full()) && "put() on a FULL Fifo_buffer; the runtime must check state() first.");
  this->m_slots.push_back(std::move(value));
}

template<typename Value>
Store_state Fifo_buffer<Value>::state() const
{
  if (this->m_slots.empty())
  {
    return Store_state::S_EMPTY;
  }
  // else
  return this->full() ? Store_state::S_FULL : Store_state::S_NONEMPTYFULL;
}

template<typename Value>
std::unique_ptr<Data_store<Value>> Fifo_buffer<Value>::clone_empty() const
{
  return std::make_unique<Fifo_buffer>(get_logger(), this->capacity());
}

} // namespace csp::store
