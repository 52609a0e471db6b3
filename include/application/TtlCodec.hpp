#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tiercache::application {

/**
 * @brief Кодек 4-байтовой метки времени записи
 *
 * Формат: миллисекунды Unix-времени, усечённые до 32 бит, big-endian.
 *
 * decode() восстанавливает последний момент не позже now с теми же
 * младшими 32 битами. Возраст до 2^32 мс (~49.7 суток) восстанавливается
 * точно, более старые записи "заворачиваются" и могут выглядеть свежими.
 */
class TtlCodec {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    static constexpr std::size_t kTimestampSize = 4;

    static std::string encode(TimePoint instant);

    /**
     * @param bytes Ровно kTimestampSize байт
     * @param now Момент, относительно которого восстанавливается метка
     * @throws std::invalid_argument при неверной длине
     */
    static TimePoint decode(const std::string& bytes, TimePoint now);

    static TimePoint decode(const char* bytes, TimePoint now);

private:
    static std::uint32_t truncatedMillis(TimePoint instant);
};

} // namespace tiercache::application
