#include "application/TtlCodec.hpp"
#include <stdexcept>

namespace tiercache::application {

std::uint32_t TtlCodec::truncatedMillis(TimePoint instant) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        instant.time_since_epoch()).count();
    return static_cast<std::uint32_t>(static_cast<std::uint64_t>(millis));
}

std::string TtlCodec::encode(TimePoint instant) {
    const std::uint32_t value = truncatedMillis(instant);

    std::string out(kTimestampSize, '\0');
    out[0] = static_cast<char>((value >> 24) & 0xFF);
    out[1] = static_cast<char>((value >> 16) & 0xFF);
    out[2] = static_cast<char>((value >> 8) & 0xFF);
    out[3] = static_cast<char>(value & 0xFF);
    return out;
}

TtlCodec::TimePoint TtlCodec::decode(const std::string& bytes, TimePoint now) {
    if (bytes.size() != kTimestampSize) {
        throw std::invalid_argument(
            "ttl codec: expected " + std::to_string(kTimestampSize) +
            " bytes, got " + std::to_string(bytes.size()));
    }
    return decode(bytes.data(), now);
}

TtlCodec::TimePoint TtlCodec::decode(const char* bytes, TimePoint now) {
    const auto* b = reinterpret_cast<const unsigned char*>(bytes);
    const std::uint32_t stored =
        (static_cast<std::uint32_t>(b[0]) << 24) |
        (static_cast<std::uint32_t>(b[1]) << 16) |
        (static_cast<std::uint32_t>(b[2]) << 8) |
        static_cast<std::uint32_t>(b[3]);

    // Возраст по модулю 2^32: корректен и при переходе через границу
    const std::uint32_t age = truncatedMillis(now) - stored;
    return now - std::chrono::milliseconds(age);
}

} // namespace tiercache::application
