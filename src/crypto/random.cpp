#include "crypto/random.hpp"

#include <sodium.h>

namespace tally::crypto {

namespace {

constexpr std::string_view ALPHANUMERIC =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

} // namespace

Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    randombytes_buf(bytes.data(), count);
    return bytes;
}

std::string generate_pairing_code() {
    std::string code;
    code.reserve(PAIR_CODE_LENGTH);
    for (size_t i = 0; i < PAIR_CODE_LENGTH; ++i) {
        code.push_back(static_cast<char>('0' + randombytes_uniform(10)));
    }
    return code;
}

std::string generate_token(size_t length) {
    std::string token;
    token.reserve(length);
    const auto alphabet_size = static_cast<uint32_t>(ALPHANUMERIC.size());
    for (size_t i = 0; i < length; ++i) {
        token.push_back(ALPHANUMERIC[randombytes_uniform(alphabet_size)]);
    }
    return token;
}

Uuid generate_uuid() {
    Uuid::Bytes bytes{};
    randombytes_buf(bytes.data(), bytes.size());
    return Uuid::from_random_bytes(bytes);
}

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace tally::crypto
