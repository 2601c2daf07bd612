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

#include <flow/log/log.hpp>
#include <boost/unordered_map.hpp>
#include <string>

namespace csp
{

// Types.

#ifndef CSP_DOXYGEN_ONLY // Doxygen gets the documented placeholder in csp/common.hpp instead.

// See csp/common.hpp for doc header.
enum class Log_component
{
  /* Macro magic: generate S_<NAME> = <value>, members from the one list of components; then the name map in
   * common.cpp is generated from the same list.  This is the Flow convention. */
#  define FLOW_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) \
     S_##ARG_name_root = (ARG_enum_val),
#  include "csp/detail/macros/log_component_enum_declare.macros.hpp"
#  undef FLOW_LOG_CFG_COMPONENT_DEFINE
  /// Sentinel: not a valid component.
  S_END_SENTINEL
}; // enum class Log_component

// Constants.

// See csp/common.hpp for doc header.
extern const boost::unordered_multimap<Log_component, std::string> S_CSP_LOG_COMPONENT_NAME_MAP;

#endif // CSP_DOXYGEN_ONLY

} // namespace csp
