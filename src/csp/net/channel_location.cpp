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
#include "csp/net/channel_location.hpp"
#include <boost/functional/hash/hash.hpp>
#include <boost/lexical_cast.hpp>

namespace csp::net
{

// Implementations.

Channel_location::Channel_location() :
  m_vcn(0)
{
  // That's it.
}

Channel_location::Channel_location(util::String_view node, vcn_t vcn) :
  m_node(node),
  m_vcn(node.empty() ? 0 : vcn)
{
  // That's it.
}

const std::string& Channel_location::node() const
{
  return m_node;
}

Channel_location::vcn_t Channel_location::vcn() const
{
  return m_vcn;
}

bool Channel_location::null() const
{
  return m_node.empty();
}

bool operator==(const Channel_location& val1, const Channel_location& val2)
{
  return (val1.vcn() == val2.vcn()) && (val1.node() == val2.node());
}

bool operator!=(const Channel_location& val1, const Channel_location& val2)
{
  return !(val1 == val2);
}

bool operator<(const Channel_location& val1, const Channel_location& val2)
{
  if (val1.node() != val2.node())
  {
    return val1.node() < val2.node();
  }
  // else
  return val1.vcn() < val2.vcn();
}

size_t hash_value(const Channel_location& val)
{
  size_t seed = boost::hash_value(val.node());
  boost::hash_combine(seed, val.vcn());
  return seed;
}

std::ostream& operator<<(std::ostream& os, const Channel_location& val)
{
  if (val.null())
  {
    return os << "null";
  }
  // else
  return os << val.node() << '#' << val.vcn();
}

std::istream& operator>>(std::istream& is, Channel_location& val)
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using std::string;

  string token;
  if (!(is >> token))
  {
    return is;
  }
  // else

  const auto sep_pos = token.rfind('#');
  if ((sep_pos == string::npos) || (sep_pos == 0) || (sep_pos == token.size() - 1))
  {
    is.setstate(std::ios_base::failbit);
    return is;
  }
  // else

  try
  {
    const auto vcn = lexical_cast<Channel_location::vcn_t>(token.substr(sep_pos + 1));
    val = Channel_location(util::String_view(token.data(), sep_pos), vcn);
  }
  catch (const bad_lexical_cast&)
  {
    is.setstate(std::ios_base::failbit);
  }
  return is;
} // istream>>Channel_location

} // namespace csp::net
