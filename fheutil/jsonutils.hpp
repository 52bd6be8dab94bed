// Copyright (C) 2020-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHEUTIL_JSONUTILS_HPP
#define FHEUTIL_JSONUTILS_HPP

#include "uint256.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>

namespace fhetrade
{

/**
 * Returns true if the given JSON value is a true integer, i.e. really
 * was parsed from an integer literal.  This is in contrast to a value that
 * has isInt() return true, but was actually parsed from a floating-point
 * literal and just happens to be integral.
 *
 * This function can be used in conjunction with isInt / isUInt on JSON values
 * if we want to enforce that they are passed as integer literals.
 */
bool IsIntegerValue (const Json::Value& val);

/**
 * Parses a uint256 given in JSON as hex string.  Returns false if the
 * value is not a string or not a valid 64-digit hex number.
 */
bool Uint256FromJson (const Json::Value& val, uint256& res);

/**
 * Parses a binary string given in JSON as hex string.
 */
bool BytesFromJson (const Json::Value& val, std::string& res);

/**
 * Converts a plaintext value to JSON.  If it fits into 64 bits, it is
 * returned as integer.  Otherwise, we return the hex string.
 */
Json::Value PlaintextToJson (const uint256& val);

} // namespace fhetrade

#endif // FHEUTIL_JSONUTILS_HPP
