#pragma once

#include "core/types.hpp"
#include <chrono>

namespace tagsync::testing {

/**
 * Clock that only moves when told to.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(int64_t start_millis = 1'700'000'000'000) : now_(start_millis) {}

    [[nodiscard]] Timestamp now() const override { return now_; }

    void set(Timestamp t) { now_ = t; }
    void advance(std::chrono::milliseconds d) { now_ = now_ + d; }

private:
    Timestamp now_;
};

} // namespace tagsync::testing
