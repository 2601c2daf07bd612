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

#include "csp/store/store_fwd.hpp"
#include "csp/store/store_config.hpp"
#include <flow/log/log.hpp>

namespace csp::store
{

// Types.

/**
 * Interface of a channel data-store: the buffering policy of one buffered channel, as seen by the channel runtime.
 * The runtime holds a `Data_store&` (or `unique_ptr<Data_store>`) and never the concrete type, so that a new policy
 * requires no change to the runtime.
 *
 * ### How the runtime uses it ###
 *   - Reader wants a value: if `state() == S_EMPTY` it blocks the reader until a writer completes a `put()`;
 *     otherwise `get()`.
 *   - Writer wants to write: if `state() == S_FULL` it blocks the writer until a reader completes a `get()`;
 *     otherwise `put()`.
 *   - Channel is reset, or a structurally identical channel is made: clone_empty().
 *
 * `put()`, `get()`, `state()`, and clone_empty() never block.  Values come out of `get()` in the order they went into
 * `put()`, minus whatever the policy discarded; no policy reorders the values it keeps.
 *
 * ### Thread safety ###
 * None, as for standard containers.  The runtime serializes access per channel (CSP discipline: one process may be
 * completing a `get()`, another a `put()`, but never concurrently on the same store; those it serializes
 * too).
 *
 * @tparam Value
 *         Type of buffered value.  Must be movable.
 */
template<typename Value>
class Data_store :
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for template parameter.
  using value_type = Value;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Data_store();

  // Methods.

  /**
   * Accepts a value without blocking.  What happens to it, and possibly to an already-buffered value, when the
   * store is at capacity depends on the policy.  Fifo_buffer is the exception: calling this when `state() == S_FULL`
   * is a precondition violation.
   *
   * @param value
   *        The value to buffer.
   */
  virtual void put(Value value) = 0;

  /**
   * Removes and returns the oldest buffered value.  Calling this when `state() == S_EMPTY` is a precondition
   * violation; behavior is undefined (assertion may trip).
   *
   * @return See above.
   */
  virtual Value get() = 0;

  /**
   * The current state, by which the runtime decides whether a reader or writer may proceed.
   *
   * @return See above.
   */
  virtual Store_state state() const = 0;

  /**
   * Returns a new, empty, independent store of the same policy and capacity.  Buffered values are not copied.
   *
   * @return See above.  Never null.
   */
  virtual std::unique_ptr<Data_store> clone_empty() const = 0;

  /**
   * The number of buffered values.  Informational: the runtime must decide on the basis of state().
   *
   * @return See above.
   */
  virtual size_t size() const = 0;

  /**
   * Capacity given at construction; for Infinite_buffer this is the initial capacity, not a limit.
   *
   * @return See above.  Positive.
   */
  int capacity() const;

  /**
   * The policy implemented by the concrete store.
   *
   * @return See above.
   */
  Buffer_policy policy() const;

  /**
   * Returns the structural configuration of `*this`; `make_data_store<Value>(logger, config())` is equivalent to
   * clone_empty().
   *
   * @return See above.
   */
  Store_config config() const;

protected:
  // Constructors.

  /**
   * Constructs the base: validates `capacity` and records the config.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param policy
   *        The concrete policy.
   * @param capacity
   *        See capacity().
   * @throws flow::error::Runtime_error
   *         Containing store::error::Code::S_INVALID_CAPACITY if `capacity <= 0`.
   */
  explicit Data_store(flow::log::Logger* logger_ptr, Buffer_policy policy, int capacity);

private:
  // Data.

  /// See config().
  const Store_config m_config;
}; // class Data_store

// Template implementations.

template<typename Value>
Data_store<Value>::Data_store(flow::log::Logger* logger_ptr, Buffer_policy policy, int capacity) :
  flow::log::Log_context(logger_ptr, Log_component::S_STORE),
  m_config(validated_store_config(logger_ptr, Store_config{ policy, capacity }))
{
  FLOW_LOG_TRACE("Data_store [" << *this << "]: Created empty.");
}

template<typename Value>
Data_store<Value>::~Data_store() = default;

template<typename Value>
int Data_store<Value>::capacity() const
{
  return m_config.m_capacity;
}

template<typename Value>
Buffer_policy Data_store<Value>::policy() const
{
  return m_config.m_policy;
}

template<typename Value>
Store_config Data_store<Value>::config() const
{
  return m_config;
}

template<typename Value>
std::ostream& operator<<(std::ostream& os, const Data_store<Value>& val)
{
  return os << val.config() << '@' << static_cast<const void*>(&val);
}

} // namespace csp::store
