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
 * Internal-use base of the fixed-capacity data-stores: the ring of slots plus the policy-independent half of the
 * Data_store contract (`get()`, `size()`).  A sub-class decides what `put()` does at capacity and what `state()`
 * reports.
 *
 * The ring is a `boost::circular_buffer` allocated once, at construction, to exactly `capacity()` slots; it never
 * reallocates.  Front = oldest value.
 *
 * @tparam Value
 *         See Data_store.
 */
template<typename Value>
class Bounded_store :
  public Data_store<Value>
{
public:
  // Methods.

  /**
   * Implements Data_store API.
   * @return See above.
   */
  Value get() override;

  /**
   * Implements Data_store API.
   * @return See above.
   */
  size_t size() const override;

protected:
  // Constructors.

  /**
   * Constructs with `capacity` empty slots.
   *
   * @param logger_ptr
   *        See Data_store.
   * @param policy
   *        See Data_store.
   * @param capacity
   *        See Data_store.
   */
  explicit Bounded_store(flow::log::Logger* logger_ptr, Buffer_policy policy, int capacity);

  // Methods.

  /**
   * `true` if and only if every slot is occupied.
   * @return See above.
   */
  bool full() const;

  // Data.

  /// The buffered values, oldest at front.  Capacity fixed at `capacity()`.
  boost::circular_buffer<Value> m_slots;
}; // class Bounded_store

// Template implementations.

template<typename Value>
Bounded_store<Value>::Bounded_store(flow::log::Logger* logger_ptr, Buffer_policy policy, int capacity) :
  Data_store<Value>(logger_ptr, policy, capacity),
  // Data_store ctor has thrown by now if capacity is not positive.
  m_slots(static_cast<size_t>(capacity))
{
  // That's it.
}

template<typename Value>
Value Bounded_store<Value>::get()
{
  assert((!m_slots.empty()) && "get() on an EMPTY data-store; the runtime must check state() first.");

  Value value(std::move(m_slots.front()));
  m_slots.pop_front();
  return value;
}

template<typename Value>
size_t Bounded_store<Value>::size() const
{
  return m_slots.size();
}

template<typename Value>
bool Bounded_store<Value>::full() const
{
  return m_slots.full();
}

} // namespace csp::store
