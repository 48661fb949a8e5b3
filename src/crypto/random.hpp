#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace tally::crypto {

// Pairing secret: decimal digits shown to the operator.
constexpr size_t PAIR_CODE_LENGTH = 10;
// Bearer token issued to a paired peer.
constexpr size_t TOKEN_LENGTH = 32;

/**
 * Initialize libsodium. Must succeed before any other function here is used.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * Generate random bytes from the system CSPRNG.
 */
[[nodiscard]] std::vector<uint8_t> random_bytes(size_t count);

/**
 * Generate a numeric pairing code of PAIR_CODE_LENGTH digits.
 */
[[nodiscard]] std::string generate_pairing_code();

/**
 * Generate an alphanumeric ([A-Za-z0-9]) token, uniformly distributed.
 */
[[nodiscard]] std::string generate_token(size_t length = TOKEN_LENGTH);

/**
 * Generate a random version 4 UUID.
 */
[[nodiscard]] Uuid generate_uuid();

/**
 * Compare two secrets without leaking the position of the first mismatch.
 * Strings of different length compare unequal.
 */
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b);

} // namespace tally::crypto
