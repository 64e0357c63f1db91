#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace manuscripts {

/**
 * Uuid - 128-bit random identifier (RFC 4122 version 4).
 *
 * Used for session ids and for the advertised instance id.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Draws from libsodium's CSPRNG; crypto::init() must have run.
     */
    [[nodiscard]] static Uuid generate();

    /**
     * Accepts hyphenated or plain hex, either case.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view text);

    /**
     * xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase.
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - Wall-clock milliseconds since the Unix epoch.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept = default;
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    /**
     * ISO 8601 in UTC with milliseconds, e.g. 2024-05-01T09:30:00.250Z.
     */
    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_ = 0;
};

} // namespace manuscripts

namespace std {
template<>
struct hash<manuscripts::Uuid> {
    size_t operator()(const manuscripts::Uuid& uuid) const noexcept {
        size_t h = 0;
        for (auto b : uuid.bytes()) {
            h = h * 131 + b;
        }
        return h;
    }
};
} // namespace std
