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

#pragma once

#include <flow/log/log.hpp>

namespace csp::test
{

/**
 * Process-wide settings of the unit tests, read once from the environment.
 *   - `CSP_TEST_LOG_SEV`: the minimum severity logged by Test_logger, as accepted by `istream>>flow::log::Sev`
 *     (e.g., `TRACE`, `data`, or the integer value).  Default: `WARNING`.
 */
struct Test_config
{
  // Methods.

  /**
   * Returns the one Test_config, initializing it on first call.
   *
   * @return See above.
   */
  static const Test_config& get_singleton();

  // Data.

  /// Default minimum severity for Test_logger.
  flow::log::Sev m_sev;

private:
  // Constructors.

  /// Reads the environment.
  Test_config();
}; // struct Test_config

} // namespace csp::test
