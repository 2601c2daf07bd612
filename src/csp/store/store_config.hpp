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
#include <flow/log/log.hpp>

namespace csp::store
{

// Types.

/**
 * The structural configuration of a Data_store: which policy and what capacity.  It never carries buffered data,
 * so building a store from it (make_data_store()) always yields an empty one.  It is a simple aggregate and
 * can be read from config/command line in `POLICY:capacity` form via `operator>>` or `boost::lexical_cast`.
 */
struct Store_config
{
  // Data.

  /// The buffering policy.
  Buffer_policy m_policy;

  /// The capacity (a limit for bounded policies; initial capacity for Buffer_policy::S_INFINITE).  Must be positive.
  int m_capacity;
}; // struct Store_config

// Free functions.

/**
 * Returns `config` itself if it describes a store that can be constructed; otherwise logs a WARNING and throws.
 * Used by every Data_store constructor.
 *
 * @param logger_ptr
 *        Logger to use for logging.
 * @param config
 *        Config to check.
 * @return `config`.
 * @throws flow::error::Runtime_error
 *         Containing store::error::Code::S_INVALID_CAPACITY or store::error::Code::S_UNKNOWN_POLICY.
 */
Store_config validated_store_config(flow::log::Logger* logger_ptr, const Store_config& config);

} // namespace csp::store
