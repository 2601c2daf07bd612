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

#include "csp/test/test_common_util.hpp"
#include <gtest/gtest.h>

namespace csp::test
{

std::string get_test_suite_name()
{
  const auto test_info = ::testing::UnitTest::GetInstance()->current_test_info();
  return test_info ? test_info->test_suite_name() : std::string();
}

} // namespace csp::test
