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

#include <flow/util/util.hpp>

#include "csp/detail/common.hpp"

/* We build in C++17 mode ourselves, and most of the API is header-inlined templates (csp::store, csp::net);
 * so the linking user's `#include`ing .cpp file(s) need C++17 too.  Enforce it. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any csp/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-CSP project: a library in modern C++17 providing the building blocks of a
 * CSP-style (communicating sequential processes) channel runtime.  It is deliberately not a scheduler: the
 * process runtime that blocks and releases readers and writers lives outside; Flow-CSP supplies the pieces whose
 * correctness that runtime depends on.
 *
 * Flow-CSP modules overview
 * -------------------------
 *   - *csp::store*: Channel data-stores, i.e., the pluggable buffering policies of a buffered channel.
 *     csp::store::Data_store is the one interface the channel runtime holds; csp::store::Overwrite_oldest_buffer,
 *     csp::store::Fifo_buffer, csp::store::Overwriting_buffer, csp::store::Overflowing_buffer, and
 *     csp::store::Infinite_buffer are its implementations.  The runtime consults `state()` to decide whether a
 *     pending reader or writer may proceed, and only then issues `put()` or `get()`.
 *   - *csp::net*: Network channel ends that may change location.  A csp::net::Migratable_channel_output is the
 *     writing end of a channel whose reading end lives at a csp::net::Channel_location on some node; it can be torn
 *     down and re-established elsewhere (see csp::net::Relocator) without losing its csp::net::Channel_id.
 *     The transport that actually ships values between nodes is external and is reached through the
 *     csp::net::Link_factory interface.
 *   - *csp::util*: Miscellaneous aliases shared by the above.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Flow-CSP requires Flow and Boost.  `flow::log` is the logging system, and `flow::Error_code` (boost.system) and
 * the related Flow conventions are used for error reporting.  Coding style, documentation style, and logging style
 * are inherited from Flow as well.
 *
 * ### Error reporting ###
 * Same as Flow: a fallible API takes a trailing `Error_code* err_code = 0`.  If non-null, `*err_code` is set to
 * success or to a truthy code.  If null, a truthy code is instead thrown inside a `flow::error::Runtime_error`.
 * Violations of documented preconditions (e.g., `get()` on an empty store) are bugs in the caller and are
 * not reported at all; an assertion may trip.
 *
 * ### Logging ###
 * The user supplies a `flow::log::Logger*` to the various constructors (null means log nowhere).  Configure
 * component names via csp::S_CSP_LOG_COMPONENT_NAME_MAP.
 */
namespace csp
{

// Types.  They're outside of `namespace ::csp::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef CSP_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing the log components used by Flow-CSP internal logging.
 * The members are generated from `log_component_enum_declare.macros.hpp`; see that file.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; see `log_component_enum_declare.macros.hpp` for actual members.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in csp::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_CSP_LOG_COMPONENT_NAME_MAP;

#endif // CSP_DOXYGEN_ONLY

} // namespace csp
