#pragma once

#include "common/types.h"
#include <string>
#include <vector>

namespace periwinkle {
namespace common {

/**
 * @brief Base58 encoding with the Bitcoin/Solana alphabet
 *
 * Leading zero bytes are rendered as leading '1' characters, so the
 * encoding of an all-zero address is a run of '1's.
 */
std::string base58_encode(const std::vector<uint8_t> &data);

/// Decode a base58 string; fails on characters outside the alphabet
Result<std::vector<uint8_t>> base58_decode(const std::string &encoded);

/**
 * @brief Decode a base58 address into a 32-byte key
 * @return Error if the string is not base58 or does not hold 32 bytes
 */
Result<PublicKey> pubkey_from_base58(const std::string &encoded);

/**
 * @brief Decode a well-known address literal
 *
 * Intended for compile-time constants such as program ids. Throws
 * std::invalid_argument if the literal is malformed.
 */
PublicKey pubkey_literal(const char *encoded);

} // namespace common
} // namespace periwinkle
