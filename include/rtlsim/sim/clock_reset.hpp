#pragma once
// ClockReset: the clock and reset levels of the current simulation tick.
// Passed explicitly as the first argument of every evaluation; never stored
// in component state.

#include "rtlsim/value/representable.hpp"

namespace rtlsim::sim {

struct ClockReset {
    bool mClock = false;
    bool mReset = false;

    bool operator==(const ClockReset& o) const {
        return mClock == o.mClock && mReset == o.mReset;
    }
    bool operator!=(const ClockReset& o) const { return !(*this == o); }
};

inline ClockReset clockReset(bool clock, bool reset) {
    return ClockReset{clock, reset};
}

} // namespace rtlsim::sim

namespace rtlsim::value {
template <>
struct Representable<sim::ClockReset> {
    static constexpr uint32_t kWidth = 2;
    static void append(const sim::ClockReset& v, BitString& out) {
        Representable<bool>::append(v.mClock, out);
        Representable<bool>::append(v.mReset, out);
    }
    static sim::ClockReset read(const BitString& in, size_t& pos) {
        sim::ClockReset cr;
        cr.mClock = Representable<bool>::read(in, pos);
        cr.mReset = Representable<bool>::read(in, pos);
        return cr;
    }
    static sim::ClockReset reset() { return sim::ClockReset{false, true}; }
};
} // namespace rtlsim::value
