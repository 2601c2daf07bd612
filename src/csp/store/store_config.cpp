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
#include "csp/store/store_config.hpp"
#include "csp/store/error.hpp"
#include <flow/error/error.hpp>

namespace csp::store
{

// Implementations.

Store_config validated_store_config(flow::log::Logger* logger_ptr, const Store_config& config)
{
  using flow::error::Runtime_error;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_STORE);

  if ((config.m_policy < Buffer_policy::S_FIFO) || (config.m_policy >= Buffer_policy::S_END_SENTINEL))
  {
    FLOW_LOG_WARNING("Data_store creation: Config [" << config << "] names no known buffering policy.  "
                     "This is a bug in the configuration or the code that built it.");
    throw Runtime_error(error::Code::S_UNKNOWN_POLICY, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (config.m_capacity <= 0)
  {
    FLOW_LOG_WARNING("Data_store creation: Config [" << config << "] specifies zero or negative capacity.  "
                     "Application code generating this is in error and needs correcting; do not retry.");
    throw Runtime_error(error::Code::S_INVALID_CAPACITY, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  return config;
} // validated_store_config()

std::ostream& operator<<(std::ostream& os, Store_state val)
{
  switch (val)
  {
  case Store_state::S_EMPTY:
    return os << "EMPTY";
  case Store_state::S_FULL:
    return os << "FULL";
  case Store_state::S_NONEMPTYFULL:
    return os << "NONEMPTYFULL";
  }
  assert(false);
  return os;
}

std::ostream& operator<<(std::ostream& os, Buffer_policy val)
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (val)
  {
  case Buffer_policy::S_FIFO:
    return os << "FIFO";
  case Buffer_policy::S_OVERWRITE_OLDEST:
    return os << "OVERWRITE_OLDEST";
  case Buffer_policy::S_OVERWRITE_NEWEST:
    return os << "OVERWRITE_NEWEST";
  case Buffer_policy::S_OVERFLOW_DROP:
    return os << "OVERFLOW_DROP";
  case Buffer_policy::S_INFINITE:
    return os << "INFINITE";
  case Buffer_policy::S_END_SENTINEL:
    return os << "END_SENTINEL";
  }
  return os << "UNKNOWN_POLICY_" << static_cast<int>(val);
}

std::istream& operator>>(std::istream& is, Buffer_policy& val)
{
  // Range [FIFO, END_SENTINEL); no match => END_SENTINEL; allow for number; case-insensitive.
  val = flow::util::istream_to_enum(&is, Buffer_policy::S_END_SENTINEL, Buffer_policy::S_END_SENTINEL, true, false,
                                    Buffer_policy::S_FIFO);
  return is;
}

std::ostream& operator<<(std::ostream& os, const Store_config& val)
{
  return os << val.m_policy << ':' << val.m_capacity;
}

std::istream& operator>>(std::istream& is, Store_config& val)
{
  /* istream_to_enum() stops at the first non-alphanumeric-or-underscore character, which is our ':' separator.
   * Then the integer follows. */
  Buffer_policy policy;
  char sep = 0;
  int capacity = 0;

  is >> policy;
  if (is.get(sep) && (sep == ':') && (is >> capacity) && (policy != Buffer_policy::S_END_SENTINEL))
  {
    val = Store_config{ policy, capacity };
  }
  else
  {
    is.setstate(std::ios_base::failbit);
  }
  return is;
}

bool operator==(const Store_config& val1, const Store_config& val2)
{
  return (val1.m_policy == val2.m_policy) && (val1.m_capacity == val2.m_capacity);
}

bool operator!=(const Store_config& val1, const Store_config& val2)
{
  return !(val1 == val2);
}

} // namespace csp::store
