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
#include "csp/net/endpoint_id.hpp"
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <sstream>
#include <stdexcept>

namespace csp::net
{

// Implementations.

Channel_id generate_channel_id()
{
  // random_generator is not thread-safe; one per thread is.
  thread_local boost::uuids::random_generator gen;
  return gen();
}

bool operator==(const Endpoint_id& val1, const Endpoint_id& val2)
{
  return (val1.m_channel_id == val2.m_channel_id) && (val1.m_location == val2.m_location);
}

bool operator!=(const Endpoint_id& val1, const Endpoint_id& val2)
{
  return !(val1 == val2);
}

std::ostream& operator<<(std::ostream& os, const Endpoint_id& val)
{
  return os << boost::uuids::to_string(val.m_channel_id) << '@' << val.m_location;
}

std::istream& operator>>(std::istream& is, Endpoint_id& val)
{
  using boost::uuids::string_generator;
  using std::string;
  using std::istringstream;

  string token;
  if (!(is >> token))
  {
    return is;
  }
  // else

  const auto sep_pos = token.find('@');
  if (sep_pos == string::npos)
  {
    is.setstate(std::ios_base::failbit);
    return is;
  }
  // else

  Endpoint_id result;
  try
  {
    result.m_channel_id = string_generator()(token.substr(0, sep_pos));
  }
  catch (const std::runtime_error&) // string_generator's way of reporting a malformed UUID.
  {
    is.setstate(std::ios_base::failbit);
    return is;
  }

  istringstream loc_is(token.substr(sep_pos + 1));
  if (!(loc_is >> result.m_location))
  {
    is.setstate(std::ios_base::failbit);
    return is;
  }
  // else

  val = std::move(result);
  return is;
} // istream>>Endpoint_id

std::ostream& operator<<(std::ostream& os, Connection_state val)
{
  switch (val)
  {
  case Connection_state::S_NULL:
    return os << "NULL";
  case Connection_state::S_CONNECTED:
    return os << "CONNECTED";
  case Connection_state::S_PREPARING:
    return os << "PREPARING";
  case Connection_state::S_DISCONNECTED:
    return os << "DISCONNECTED";
  case Connection_state::S_RECONNECTING:
    return os << "RECONNECTING";
  case Connection_state::S_DESTROYED:
    return os << "DESTROYED";
  }
  assert(false);
  return os;
}

} // namespace csp::net
