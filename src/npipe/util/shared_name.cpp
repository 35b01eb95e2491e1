/* npipe
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
#include "npipe/util/shared_name.hpp"
#include <boost/functional/hash/hash.hpp>
#include <cctype>

namespace npipe::util
{

// Initializers.

const char Shared_name::S_SEPARATOR = '_';

const size_t Shared_name::S_MAX_LENGTH = 75;

const Shared_name Shared_name::S_EMPTY;

// Implementations.

Shared_name::Shared_name() = default;
Shared_name::Shared_name(const Shared_name&) = default;
Shared_name::Shared_name(Shared_name&&) = default;

Shared_name Shared_name::ct(const char* src) // Static.
{
  Shared_name result;
  result.m_raw_name.assign(src);
  return result;
}

Shared_name Shared_name::ct(std::string&& src_moved) // Static.
{
  Shared_name result;
  result.m_raw_name.assign(std::move(src_moved));
  return result;
}

Shared_name& Shared_name::operator=(const Shared_name&) = default;
Shared_name& Shared_name::operator=(Shared_name&&) = default;

Shared_name& Shared_name::operator+=(const char* raw_name_to_append)
{
  m_raw_name += raw_name_to_append;
  return *this;
}

Shared_name& Shared_name::operator+=(const Shared_name& to_append)
{
  m_raw_name += to_append.str();
  return *this;
}

Shared_name& Shared_name::operator/=(const char* raw_name_to_append)
{
  m_raw_name += S_SEPARATOR;
  return operator+=(raw_name_to_append);
}

Shared_name& Shared_name::operator/=(const Shared_name& to_append)
{
  m_raw_name += S_SEPARATOR;
  return operator+=(to_append);
}

Shared_name operator+(const Shared_name& src1, const char* raw_src2)
{
  return Shared_name(src1) += raw_src2;
}

Shared_name operator+(const Shared_name& src1, const Shared_name& src2)
{
  return Shared_name(src1) += src2;
}

Shared_name operator/(const Shared_name& src1, const char* raw_src2)
{
  return Shared_name(src1) /= raw_src2;
}

Shared_name operator/(const Shared_name& src1, const Shared_name& src2)
{
  return Shared_name(src1) /= src2;
}

const std::string& Shared_name::str() const
{
  return m_raw_name;
}

const char* Shared_name::native_str() const
{
  return m_raw_name.c_str();
}

size_t Shared_name::size() const
{
  return m_raw_name.size();
}

bool Shared_name::empty() const
{
  return m_raw_name.empty();
}

void Shared_name::clear()
{
  m_raw_name.clear();
}

bool Shared_name::sanitized() const
{
  using std::isalnum;

  // Keep in sync with sanitize()!

  if (size() > S_MAX_LENGTH)
  {
    return false;
  }
  // else

  bool prev_is_sep = false;
  for (const auto ch : m_raw_name)
  {
    const bool is_sep = ch == S_SEPARATOR;
    // Note: isalnum() explicitly checks for [A-Za-z0-9] in the C locale; no internationalized stuff.
    if ((!is_sep) && (!isalnum(static_cast<unsigned char>(ch))))
    {
      return false;
    }
    // else
    if (is_sep && prev_is_sep)
    {
      return false;
    }
    // else
    prev_is_sep = is_sep;
  }

  return true;
} // Shared_name::sanitized()

bool Shared_name::sanitize()
{
  using std::isalnum;
  using std::string;

  constexpr char SEPARATOR_ALT = '/';
  static_assert(SEPARATOR_ALT != '_', "The real separator and the alt must be different characters.");

  // Keep in sync with sanitized()!

  /* Build the result separately and only commit it on success; so on failure *this is untouched.
   * A name is short, so the extra allocation is of no consequence. */
  string result;
  result.reserve(m_raw_name.size());

  for (const auto ch : m_raw_name)
  {
    const bool is_sep = (ch == S_SEPARATOR) || (ch == SEPARATOR_ALT);
    if (is_sep)
    {
      if (result.empty() || (result.back() != S_SEPARATOR))
      {
        result += S_SEPARATOR;
      }
      // else { Collapse the run of separators. }
    }
    else if (isalnum(static_cast<unsigned char>(ch)))
    {
      result += ch;
    }
    else
    {
      return false;
    }

    if (result.size() > S_MAX_LENGTH)
    {
      return false;
    }
  } // for (ch : m_raw_name)

  m_raw_name = std::move(result);
  assert(sanitized());
  return true;
} // Shared_name::sanitize()

std::ostream& operator<<(std::ostream& os, const Shared_name& val)
{
  // Output char count for convenience: these can be at a premium.
  if (val.str().empty())
  {
    return os << "null";
  }
  // else
  return os << val.str().size() << '|' << val.str();
}

bool operator==(const Shared_name& val1, const Shared_name& val2)
{
  return val1.str() == val2.str();
}

bool operator!=(const Shared_name& val1, const Shared_name& val2)
{
  return !(operator==(val1, val2));
}

bool operator<(const Shared_name& val1, const Shared_name& val2)
{
  return val1.str() < val2.str();
}

size_t hash_value(const Shared_name& val)
{
  using boost::hash;
  using std::string;

  return hash<string>()(val.str());
}

} // namespace npipe::util
