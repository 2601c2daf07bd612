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

#include "csp/common.hpp"
#include "csp/test/test_config.hpp"
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>
#include <iostream>
#include <sstream>

namespace csp::test
{

/**
 * Console logger for the unit tests, knowing the Flow-CSP and Flow component names, filtered at the Test_config
 * severity unless told otherwise.  Optionally it captures into memory instead of the console, so that a test can
 * check what a component reported (e.g., that a refused binding was logged as a WARNING); see captured().
 */
class Test_logger :
  public flow::log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity
   *        Lowest severity that will pass through logging filter, for all components.
   * @param capture
   *        If `true` messages go to captured() and not to the console.
   */
  explicit Test_logger(const flow::log::Sev& min_severity = Test_config::get_singleton().m_sev, bool capture = false) :
    m_config(min_severity),
    m_capturing(capture),
    m_logger(&m_config, capture ? static_cast<std::ostream&>(m_capture) : std::cout,
             capture ? static_cast<std::ostream&>(m_capture) : std::cerr)
  {
    register_components(); // The Logger holds the m_config pointer already; that is fine.
  }

  /**
   * Overrides the severity filter of one Flow-CSP component, e.g., to quiet the chatty S_STORE in a test that is
   * about S_NET.
   *
   * @param component
   *        The component.
   * @param min_severity
   *        Lowest severity that will pass for it.
   * @return `false` if the component is unknown to the config (not a valid Log_component).
   */
  bool set_component_verbosity(Log_component component, flow::log::Sev min_severity)
  {
    return m_config.configure_component_verbosity(min_severity, component);
  }

  /**
   * Everything logged so far, if constructed with `capture == true`; else empty.  Do not call while another
   * thread may be logging.
   *
   * @return See above.
   */
  std::string captured() const
  {
    return m_capturing ? m_capture.str() : std::string();
  }

  /**
   * Returns the logging configuration.
   *
   * @return See above.
   */
  flow::log::Config& get_config()
  {
    return *m_logger.m_config;
  }

  /// Forwards to console Logger.
  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Forwards to console Logger.
  bool logs_asynchronously() const override
  {
    return m_logger.logs_asynchronously();
  }

  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Names our components ("csp-" prefix) and Flow's ("flow-") in #m_config, in disjoint index ranges.
  void register_components()
  {
    using flow::log::Config;

    m_config.init_component_to_union_idx_mapping<Log_component>
      (S_CSP_COMPONENT_IDX_BASE, Config::standard_component_payload_enum_sparse_length<Log_component>());
    m_config.init_component_names<Log_component>(S_CSP_LOG_COMPONENT_NAME_MAP, false, "csp-");
    m_config.init_component_to_union_idx_mapping<flow::Flow_log_component>
      (S_FLOW_COMPONENT_IDX_BASE, Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
    m_config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  }

  /// First union index of Log_component values.
  static constexpr size_t S_CSP_COMPONENT_IDX_BASE = 100;

  /// First union index of Flow's components; above every Log_component index.
  static constexpr size_t S_FLOW_COMPONENT_IDX_BASE = 200;

  /// Logging configuration.
  flow::log::Config m_config;

  /// See captured().
  const bool m_capturing;

  /// Sink of #m_logger if #m_capturing.
  std::ostringstream m_capture;

  /// The real logger.
  flow::log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace csp::test
