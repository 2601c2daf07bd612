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

#include "csp/net/net_fwd.hpp"
#include "csp/util/util_fwd.hpp"
#include <string>
#include <ostream>
#include <istream>

namespace csp::net
{

// Types.

/**
 * The physical location of the reading end of a network channel: an opaque node address, as understood by the
 * network layer (Link_factory), plus a virtual channel number (VCN) distinguishing channels read on that node.
 * A default-constructed Channel_location is null(): it denotes no location.
 *
 * Value semantics: copy, assignment, equality, total ordering, and hashing all work as one would expect.
 *
 * String form (`ostream<<`, `istream>>`): `node#vcn`, e.g., `10.0.0.7:4000#12`.  The node address may not contain
 * `#` or whitespace.
 */
class Channel_location
{
public:
  // Types.

  /// Type of the virtual channel number.
  using vcn_t = uint32_t;

  // Constructors/destructor.

  /// Constructs null() location.
  Channel_location();

  /**
   * Constructs a location.
   *
   * @param node
   *        Node address; non-empty (else the result is null()).
   * @param vcn
   *        Virtual channel number on that node.
   */
  explicit Channel_location(util::String_view node, vcn_t vcn);

  // Methods.

  /**
   * Node address.
   * @return See above.  Empty if and only if null().
   */
  const std::string& node() const;

  /**
   * Virtual channel number.
   * @return See above.
   */
  vcn_t vcn() const;

  /**
   * `true` if and only if this denotes no location.
   * @return See above.
   */
  bool null() const;

private:
  // Data.

  /// See node().
  std::string m_node;

  /// See vcn().
  vcn_t m_vcn;
}; // class Channel_location

// Free functions.

/**
 * Returns `true` if and only if the two locations are identical.
 *
 * @relatesalso Channel_location
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Channel_location& val1, const Channel_location& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Channel_location
 *
 * @param val1
 *        See `==`.
 * @param val2
 *        See `==`.
 * @return See above.
 */
bool operator!=(const Channel_location& val1, const Channel_location& val2);

/**
 * Total ordering: by node, then by VCN.
 *
 * @relatesalso Channel_location
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator<(const Channel_location& val1, const Channel_location& val2);

/**
 * Hasher of Channel_location for boost.unordered et al.
 *
 * @relatesalso Channel_location
 *
 * @param val
 *        Object to hash.
 * @return See above.
 */
size_t hash_value(const Channel_location& val);

/**
 * Prints `node#vcn`, or `null` for null() location.
 *
 * @relatesalso Channel_location
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Channel_location& val);

/**
 * Reads a whitespace-delimited token in the form written by `ostream<<` (other than `null`).  A malformed token
 * sets `is` to failed state and leaves `val` unchanged.
 *
 * @relatesalso Channel_location
 *
 * @param is
 *        Stream from which to read.
 * @param val
 *        Object to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Channel_location& val);

} // namespace csp::net
