// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hex.hpp"

#include <glog/logging.h>

#include <cstdint>
#include <utility>

namespace fhetrade
{

namespace
{

bool
ParseHexDigit (const char digit, uint_fast8_t& target)
{
  if (digit >= '0' && digit <= '9')
    {
      target = (digit - '0');
      return true;
    }

  if (digit >= 'a' && digit <= 'f')
    {
      target = 0xA + (digit - 'a');
      return true;
    }
  if (digit >= 'A' && digit <= 'F')
    {
      target = 0xA + (digit - 'A');
      return true;
    }

  LOG (ERROR) << "Invalid hex digit: '" << digit << "'";
  return false;
}

} // anonymous namespace

std::string
BytesToHex (const std::string& bytes)
{
  static constexpr char DIGITS[] = "0123456789abcdef";

  std::string result(bytes.size () * 2, 'x');
  for (size_t i = 0; i < bytes.size (); ++i)
    {
      const uint8_t val = bytes[i];
      result[2 * i] = DIGITS[val >> 4];
      result[2 * i + 1] = DIGITS[val % 0x10];
    }
  return result;
}

bool
HexToBytes (const std::string& hex, std::string& bytes)
{
  if (hex.size () % 2 != 0)
    {
      LOG (ERROR) << "Hex string has odd length: " << hex;
      return false;
    }

  std::string res(hex.size () / 2, '\0');
  for (size_t i = 0; i < res.size (); ++i)
    {
      uint_fast8_t hi, lo;
      if (!ParseHexDigit (hex[2 * i], hi)
            || !ParseHexDigit (hex[2 * i + 1], lo))
        return false;
      res[i] = static_cast<char> ((hi << 4) | lo);
    }

  bytes = std::move (res);
  return true;
}

} // namespace fhetrade
