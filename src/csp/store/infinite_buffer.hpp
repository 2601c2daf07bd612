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

#include "csp/store/data_store.hpp"
#include <boost/circular_buffer.hpp>

namespace csp::store
{

// Types.

/**
 * Data_store with unbounded FIFO semantics: when empty the channel blocks readers; writers are never blocked.
 * The capacity given to the constructor is only the initial size of the ring; whenever a `put()` finds the ring full,
 * the ring's capacity is doubled first.  It never shrinks.
 *
 * state() returns Store_state::S_EMPTY or Store_state::S_NONEMPTYFULL but never Store_state::S_FULL.
 *
 * @tparam Value
 *         See Data_store.
 */
template<typename Value>
class Infinite_buffer :
  public Data_store<Value>
{
public:
  // Constants.

  /// Initial capacity used by the 1-arg constructor.
  static constexpr int S_DEFAULT_INITIAL_CAPACITY = 8;

  // Constructors/destructor.

  /**
   * Constructs an empty store whose ring initially has room for `initial_capacity` values.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param initial_capacity
   *        See above.
   * @throws flow::error::Runtime_error
   *         Containing store::error::Code::S_INVALID_CAPACITY if `initial_capacity` is zero or negative.
   */
  explicit Infinite_buffer(flow::log::Logger* logger_ptr, int initial_capacity = S_DEFAULT_INITIAL_CAPACITY);

  // Methods.

  /**
   * Implements Data_store API: appends `value`, growing if needed.
   *
   * @param value
   *        See Data_store.
   */
  void put(Value value) override;

  /**
   * Implements Data_store API.
   * @return See above.
   */
  Value get() override;

  /**
   * Implements Data_store API.
   * @return See above.
   */
  Store_state state() const override;

  /**
   * Implements Data_store API.  The clone starts at the same *initial* capacity, regardless of growth of `*this`.
   * @return See above.
   */
  std::unique_ptr<Data_store<Value>> clone_empty() const override;

  /**
   * Implements Data_store API.
   * @return See above.
   */
  size_t size() const override;

  using Data_store<Value>::get_logger;
  using Data_store<Value>::get_log_component;

private:
  // Data.

  /// The buffered values, oldest at front.
  boost::circular_buffer<Value> m_slots;
}; // class Infinite_buffer

// Template implementations.

template<typename Value>
Infinite_buffer<Value>::Infinite_buffer(flow::log::Logger* logger_ptr, int initial_capacity) :
  Data_store<Value>(logger_ptr, Buffer_policy::S_INFINITE, initial_capacity),
  m_slots(static_cast<size_t>(initial_capacity))
{
  // Yay.
}

template<typename Value>
void Infinite_buffer<Value>::put(Value value)
{
  if (m_slots.full())
  {
    FLOW_LOG_TRACE("Infinite_buffer [" << *this << "]: Ring full at [" << m_slots.capacity() << "] values; "
                   "doubling.");
    m_slots.set_capacity(m_slots.capacity() * 2);
  }
  m_slots.push_back(std::move(value));
}

template<typename Value>
Value Infinite_buffer<Value>::get()
{
  assert((!m_slots.empty()) && "get() on an EMPTY data-store; the runtime must check state() first.");

  Value value(std::move(m_slots.front()));
  m_slots.pop_front();
  return value;
}

template<typename Value>
Store_state Infinite_buffer<Value>::state() const
{
  return m_slots.empty() ? Store_state::S_EMPTY : Store_state::S_NONEMPTYFULL;
}

template<typename Value>
std::unique_ptr<Data_store<Value>> Infinite_buffer<Value>::clone_empty() const
{
  return std::make_unique<Infinite_buffer>(get_logger(), this->capacity());
}

template<typename Value>
size_t Infinite_buffer<Value>::size() const
{
  return m_slots.size();
}

} // namespace csp::store
