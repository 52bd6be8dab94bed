// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHEUTIL_HEX_HPP
#define FHEUTIL_HEX_HPP

#include <string>

namespace fhetrade
{

/**
 * Encodes a binary string as lower-case hex.
 */
std::string BytesToHex (const std::string& bytes);

/**
 * Decodes a hex string (upper- or lower-case digits, no prefix) into
 * raw bytes.  Returns false if the string has odd length or contains
 * invalid characters.
 */
bool HexToBytes (const std::string& hex, std::string& bytes);

} // namespace fhetrade

#endif // FHEUTIL_HEX_HPP
