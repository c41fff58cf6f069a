#pragma once

#include "util/timestamp.hpp"

namespace tally::util {

// Source of UTC "now": UpdatedAt stamps on the device, watermarks on the server.
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override { return currentTimestamp(); }
};

// A write stamp that is both "now" and strictly after the record's previous
// stamp, so UpdatedAt never moves backwards under clock skew.
inline Timestamp advanceStamp(const Timestamp previous, const Timestamp now) {
    return now > previous ? now : previous + std::chrono::microseconds{1};
}

}
