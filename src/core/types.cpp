#include "core/types.hpp"

#include <sodium.h>

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace manuscripts {

Uuid Uuid::generate() {
    Bytes bytes;
    randombytes_buf(bytes.data(), bytes.size());

    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view text) {
    std::string hex;
    hex.reserve(32);
    for (char c : text) {
        if (c != '-') hex += c;
    }
    if (hex.size() != 32) return std::nullopt;

    Bytes bytes;
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        const char* first = hex.data() + i * 2;
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
        if (ec != std::errc{} || ptr != first + 2) {
            return std::nullopt;
        }
        bytes[i] = static_cast<uint8_t>(value);
    }
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += kHex[bytes_[i] >> 4];
        out += kHex[bytes_[i] & 0x0F];
    }
    return out;
}

std::string Timestamp::to_iso_string() const {
    const std::time_t secs = static_cast<std::time_t>(millis_ / 1000);
    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
    return oss.str();
}

} // namespace manuscripts
