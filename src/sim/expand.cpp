#include "rtlsim/sim/expand.hpp"

#include <limits>
#include <string>

namespace rtlsim::sim {

const char* to_string(ClockPhase p) {
    switch (p) {
    case ClockPhase::Low: return "Low";
    case ClockPhase::RisingEdge: return "RisingEdge";
    case ClockPhase::HighLookahead: return "HighLookahead";
    }
    return "?";
}

void checkClockPeriod(uint64_t period) {
    if (period < kMinClockPeriod) {
        throw RangeError("clock period " + std::to_string(period) +
                         " is shorter than the minimum of " +
                         std::to_string(kMinClockPeriod));
    }
}

void checkTimeSpan(uint64_t cycles, uint64_t period) {
    // The last event is at (cycles-1)*P + P/2 + 1, which is <= cycles*P.
    if (cycles > 0 && period > std::numeric_limits<uint64_t>::max() / cycles) {
        throw RangeError("clock period " + std::to_string(period) + " over " +
                         std::to_string(cycles) +
                         " cycles overflows the 64-bit time axis");
    }
}

} // namespace rtlsim::sim
