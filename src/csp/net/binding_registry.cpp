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
#include "csp/net/binding_registry.hpp"
#include "csp/net/error.hpp"
#include <flow/error/error.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace csp::net
{

// Implementations.

Binding_registry::Binding_registry(flow::log::Logger* logger_ptr, util::String_view nickname) :
  flow::log::Log_context(logger_ptr, Log_component::S_NET),
  m_nickname(nickname)
{
  FLOW_LOG_INFO("Binding_registry [" << *this << "]: Created empty.");
}

bool Binding_registry::claim(const Endpoint_id& endpoint_id, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Binding_registry::claim, flow::util::bind_ns::cref(endpoint_id), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert((!endpoint_id.m_location.null()) && "Broke contract: cannot bind to null location.");

  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  const auto result = m_bindings.try_emplace(endpoint_id.m_channel_id, endpoint_id.m_location);
  if (result.second)
  {
    err_code->clear();
    FLOW_LOG_TRACE("Binding_registry [" << *this << "]: Channel [" << endpoint_id << "] claimed; "
                   "[" << m_bindings.size() << "] live bindings now.");
    return true;
  }
  // else

  const auto& live_loc = result.first->second;
  if (live_loc == endpoint_id.m_location)
  {
    err_code->clear();
    FLOW_LOG_TRACE("Binding_registry [" << *this << "]: Channel [" << endpoint_id << "] claimed again at the same "
                   "location; no-op.");
    return false;
  }
  // else

  FLOW_LOG_WARNING("Binding_registry [" << *this << "]: Channel [" << endpoint_id << "] cannot be claimed: "
                   "it is already bound live at [" << live_loc << "].  Release that binding first.");
  *err_code = error::Code::S_CHANNEL_ALREADY_BOUND;
  return false;
} // Binding_registry::claim()

bool Binding_registry::release(const Channel_id& channel_id)
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  const auto it = m_bindings.find(channel_id);
  if (it == m_bindings.end())
  {
    FLOW_LOG_TRACE("Binding_registry [" << *this << "]: Channel [" << channel_id << "] release requested, but it "
                   "has no live binding; no-op.");
    return false;
  }
  // else

  FLOW_LOG_TRACE("Binding_registry [" << *this << "]: Channel [" << channel_id << "] released from "
                 "[" << it->second << "]; [" << (m_bindings.size() - 1) << "] live bindings now.");
  m_bindings.erase(it);
  return true;
}

bool Binding_registry::live_location(const Channel_id& channel_id, Channel_location* location) const
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  const auto it = m_bindings.find(channel_id);
  if (it == m_bindings.end())
  {
    return false;
  }
  // else
  if (location)
  {
    *location = it->second;
  }
  return true;
}

size_t Binding_registry::live_count() const
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_bindings.size();
}

const std::string& Binding_registry::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Binding_registry& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace csp::net
