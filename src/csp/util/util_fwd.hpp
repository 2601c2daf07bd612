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
#include <flow/util/util.hpp>

/**
 * Flow-CSP module containing miscellaneous general-use facilities that are used by ~all Flow-CSP
 * modules and/or do not fit into any other Flow-CSP module.  As of this writing it is aliases and a constant or two.
 */
namespace csp::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Short-hand for the non-recursive mutex type used throughout; Flow's alias of `boost::mutex`.
using Mutex_non_recursive = flow::util::Mutex_non_recursive;

/// Short-hand for Flow's scoped lock (`boost::lock_guard`) on a mutex of type `Mutex`.
template<typename Mutex>
using Lock_guard = flow::util::Lock_guard<Mutex>;

// Constants.

/// A (default-cted) string.  May be useful for functions returning `const std::string&`.
extern const std::string EMPTY_STRING;

} // namespace csp::util
