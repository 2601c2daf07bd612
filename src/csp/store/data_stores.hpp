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

#include "csp/store/fifo_buffer.hpp"
#include "csp/store/overwrite_oldest_buffer.hpp"
#include "csp/store/overwriting_buffer.hpp"
#include "csp/store/overflowing_buffer.hpp"
#include "csp/store/infinite_buffer.hpp"
#include "csp/store/error.hpp"
#include <flow/error/error.hpp>

namespace csp::store
{

// Template implementations.

template<typename Value>
std::unique_ptr<Data_store<Value>> make_data_store(flow::log::Logger* logger_ptr, const Store_config& config)
{
  using flow::error::Runtime_error;
  using std::make_unique;

  switch (config.m_policy)
  {
  case Buffer_policy::S_FIFO:
    return make_unique<Fifo_buffer<Value>>(logger_ptr, config.m_capacity);
  case Buffer_policy::S_OVERWRITE_OLDEST:
    return make_unique<Overwrite_oldest_buffer<Value>>(logger_ptr, config.m_capacity);
  case Buffer_policy::S_OVERWRITE_NEWEST:
    return make_unique<Overwriting_buffer<Value>>(logger_ptr, config.m_capacity);
  case Buffer_policy::S_OVERFLOW_DROP:
    return make_unique<Overflowing_buffer<Value>>(logger_ptr, config.m_capacity);
  case Buffer_policy::S_INFINITE:
    return make_unique<Infinite_buffer<Value>>(logger_ptr, config.m_capacity);
  case Buffer_policy::S_END_SENTINEL:
    break;
  }

  // Let the validator log and pick the code; it will throw.
  validated_store_config(logger_ptr, config);
  throw Runtime_error(error::Code::S_UNKNOWN_POLICY, FLOW_UTIL_WHERE_AM_I_STR()); // Not reached.
} // make_data_store()

} // namespace csp::store
