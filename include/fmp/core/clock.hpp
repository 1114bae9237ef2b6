#pragma once

#include <chrono>
#include <cstdint>

namespace fmp {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Source of wall-clock time
 *
 * Session TTLs and the expiry sweep read time through this interface so a
 * test can move time forward without sleeping.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    Timestamp now() const override { return std::chrono::system_clock::now(); }
};

inline std::int64_t to_unix_millis(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline Timestamp from_unix_millis(std::int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

} // namespace fmp
