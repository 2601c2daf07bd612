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

#include "csp/common.hpp"
#include <memory>
#include <ostream>
#include <istream>

/**
 * Flow-CSP module providing channel data-stores: the buffering policies of buffered channels.
 *
 * The channel runtime (external to Flow-CSP) owns one Data_store per buffered channel and refers to it only
 * through the abstract Data_store interface; it never names a concrete policy.  Before releasing a blocked
 * reader it checks `state() != Store_state::S_EMPTY`; before releasing a blocked writer it checks
 * `state() != Store_state::S_FULL`; having done so it calls `get()` or `put()`, which never block.
 *
 * Available policies (all same interface):
 *   - Fifo_buffer: plain bounded FIFO; reports Store_state::S_FULL at capacity, so the runtime blocks writers.
 *   - Overwrite_oldest_buffer: bounded FIFO that, at capacity, discards the oldest unread value to accept a write.
 *   - Overwriting_buffer: bounded FIFO that, at capacity, replaces the newest unread value with the new one.
 *   - Overflowing_buffer: bounded FIFO that, at capacity, silently discards the value being written.
 *   - Infinite_buffer: unbounded FIFO.
 *
 * Use make_data_store() to build one of the above from a Store_config (e.g., parsed from a config file).
 */
namespace csp::store
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Value>
class Data_store;
template<typename Value>
class Fifo_buffer;
template<typename Value>
class Overwrite_oldest_buffer;
template<typename Value>
class Overwriting_buffer;
template<typename Value>
class Overflowing_buffer;
template<typename Value>
class Infinite_buffer;

struct Store_config;

/**
 * The state of a Data_store as reported to the channel runtime by Data_store::state().  The runtime uses this,
 * and only this, to decide whether a pending reader or writer may be released.
 */
enum class Store_state
{
  /// Nothing is buffered: a reader must wait; a writer may proceed.
  S_EMPTY,

  /**
   * The store is at capacity and its policy cannot absorb another `put()`: a writer must wait; a reader may
   * proceed.  Only Fifo_buffer ever reports this.
   */
  S_FULL,

  /**
   * At least one value is buffered, and a `put()` may proceed without waiting (either there is room, or the
   * policy's overflow rule absorbs the write): both a reader and a writer may proceed.  This is what an at-capacity
   * Overwrite_oldest_buffer reports.
   */
  S_NONEMPTYFULL
}; // enum class Store_state

/// The buffering policy implemented by a Data_store; identifies the concrete class.
enum class Buffer_policy
{
  /// Fifo_buffer.
  S_FIFO,
  /// Overwrite_oldest_buffer.
  S_OVERWRITE_OLDEST,
  /// Overwriting_buffer.
  S_OVERWRITE_NEWEST,
  /// Overflowing_buffer.
  S_OVERFLOW_DROP,
  /// Infinite_buffer.
  S_INFINITE,
  /// Sentinel: not a valid policy; result of failed deserialization.
  S_END_SENTINEL
}; // enum class Buffer_policy

// Free functions.

/**
 * Constructs a new, empty Data_store of the policy and capacity in `config`.  This is the factory counterpart of
 * Data_store::clone_empty(): the config captures the structure of a store and none of its contents.
 *
 * @tparam Value
 *         Type of buffered value.  Must be copyable or movable.
 * @param logger_ptr
 *        Logger to use for logging subsequently (by the new store too).
 * @param config
 *        Policy and capacity.
 * @return The new store.  Never null.
 * @throws flow::error::Runtime_error
 *         Containing store::error::Code::S_INVALID_CAPACITY (non-positive capacity) or
 *         store::error::Code::S_UNKNOWN_POLICY (`config.m_policy` is `S_END_SENTINEL`).  Either is a defect in the
 *         configuration; do not catch this in order to retry.
 */
template<typename Value>
std::unique_ptr<Data_store<Value>> make_data_store(flow::log::Logger* logger_ptr, const Store_config& config);

/**
 * Prints string representation of the given Data_store to the given `ostream`.
 *
 * @relatesalso Data_store
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Value>
std::ostream& operator<<(std::ostream& os, const Data_store<Value>& val);

/**
 * Serializes a Store_state, e.g., Store_state::S_NONEMPTYFULL => `"NONEMPTYFULL"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Store_state val);

/**
 * Serializes a Buffer_policy, e.g., Buffer_policy::S_OVERWRITE_OLDEST => `"OVERWRITE_OLDEST"`.  The output string
 * is compatible with the reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Buffer_policy val);

/**
 * Deserializes a Buffer_policy from a standard input stream.  Recognized: the integer value of the `enum`; or the
 * case-insensitive symbol sans `S_` prefix (e.g., `"overwrite_oldest"`).  If none is recognized,
 * Buffer_policy::S_END_SENTINEL is the result.  This enables parsing from a config file or command line, and
 * conversion from `string` via `boost::lexical_cast`.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Buffer_policy& val);

/**
 * Serializes a Store_config as `POLICY:capacity`, e.g., `"OVERWRITE_OLDEST:16"`.
 *
 * @relatesalso Store_config
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Store_config& val);

/**
 * Deserializes a Store_config from the format written by the reverse `ostream<<`.  A malformed input sets
 * `is` to failed state.  No validation of the capacity is done here; make_data_store() does that.
 *
 * @relatesalso Store_config
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Store_config& val);

/**
 * Returns `true` if and only if the two configs are identical.
 *
 * @relatesalso Store_config
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Store_config& val1, const Store_config& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Store_config
 *
 * @param val1
 *        See `==`.
 * @param val2
 *        See `==`.
 * @return See above.
 */
bool operator!=(const Store_config& val1, const Store_config& val2);

} // namespace csp::store
