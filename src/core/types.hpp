#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <type_traits>

namespace tally {

/**
 * UUID - Universally Unique Identifier.
 *
 * Used as the stable identity of a device installation.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Build a version 4 UUID from 16 random bytes supplied by the caller.
     */
    [[nodiscard]] static Uuid from_random_bytes(Bytes bytes) noexcept {
        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;
        return Uuid(bytes);
    }

    /**
     * Parse the hyphenated form, with or without surrounding braces.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Lowercase hyphenated form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Instant - an exact point in time as parsed from RFC 3339 text.
 *
 * Keeps the full fractional precision of the source string so that two
 * distinct well-formed timestamps never compare equal.
 */
struct Instant {
    int64_t seconds = 0;  // since Unix epoch, UTC
    int32_t nanos = 0;    // 0..999'999'999

    auto operator<=>(const Instant&) const = default;
    bool operator==(const Instant&) const = default;
};

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)".
 * 't', 'z' and a single space separator are accepted as RFC 3339 allows.
 */
[[nodiscard]] std::optional<Instant> parse_rfc3339(std::string_view text);

/**
 * Timestamp - Represents a point in time.
 *
 * Stored as milliseconds since Unix epoch. Formatting always produces the
 * fixed-width form "YYYY-MM-DDTHH:MM:SS.mmmZ" so that lexical and
 * chronological ordering agree for timestamps written by this program.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}
    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    /**
     * Parse an RFC 3339 string, truncating to millisecond precision.
     */
    [[nodiscard]] static std::optional<Timestamp> from_iso_string(std::string_view text);

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(millis_ - d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * The value reported as "last change" for a dataset with an empty change log.
 */
inline constexpr std::string_view EPOCH_SENTINEL = "1970-01-01T00:00:00Z";

} // namespace tally
