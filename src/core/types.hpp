#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <compare>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace tagsync {

/**
 * Timestamp - a point in time as milliseconds since the Unix epoch.
 *
 * This is the unit of every `createdAt` / `updatedAt` field and of the
 * last-write-wins comparison in the merge engine.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using SystemClock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<SystemClock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(SystemClock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * Format as ISO 8601 (UTC, millisecond precision).
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = SystemClock::to_time_t(to_time_point());
        std::tm tm_utc{};
        gmtime_r(&time_t, &tm_utc);
        std::ostringstream oss;
        oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
        auto ms = millis_ % 1000;
        oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
        return oss.str();
    }

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
 * Clock - source of mutation timestamps.
 *
 * The entity store takes a Clock so tests can drive time explicitly.
 */
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override { return Timestamp::now(); }

    [[nodiscard]] static const SystemClock& instance() {
        static const SystemClock clock;
        return clock;
    }
};

} // namespace tagsync
