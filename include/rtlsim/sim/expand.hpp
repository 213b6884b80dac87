#pragma once
// Clock/reset event expander.
//
// Every logical cycle c (reset-held or normal) becomes three samples:
//
//   phase          time            clock  value
//   Low            c*P             0      cycle c
//   RisingEdge     c*P + P/2       1      cycle c      <- authoritative
//   HighLookahead  c*P + P/2 + 1   1      cycle c+1 (if any, else cycle c)
//
// The R reset cycles come first (reset=1, input = reset value of I), then
// one cycle per logical input with reset=0. Total: 3 * (R + n) events.

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "rtlsim/error.hpp"
#include "rtlsim/sim/clock_reset.hpp"
#include "rtlsim/value/representable.hpp"

namespace rtlsim::sim {

enum class ClockPhase : uint8_t { Low, RisingEdge, HighLookahead };

const char* to_string(ClockPhase p);

inline constexpr uint64_t kEventsPerCycle = 3;
inline constexpr uint64_t kMinClockPeriod = 3;

// RangeError if period is too short for strictly increasing timestamps.
void checkClockPeriod(uint64_t period);
// RangeError if the last timestamp of `cycles` cycles overflows uint64_t.
void checkTimeSpan(uint64_t cycles, uint64_t period);

inline uint64_t phaseTime(uint64_t cycle, ClockPhase phase, uint64_t period) {
    const uint64_t base = cycle * period;
    switch (phase) {
    case ClockPhase::Low: return base;
    case ClockPhase::RisingEdge: return base + period / 2;
    case ClockPhase::HighLookahead: return base + period / 2 + 1;
    }
    return base;
}

template <typename I>
struct Event {
    uint64_t mTime = 0;
    uint64_t mCycle = 0;
    ClockPhase mPhase = ClockPhase::Low;
    ClockReset mCr;
    I mInput;
    std::optional<I> mLookahead; // next cycle's input, when one exists

    bool operator==(const Event& o) const {
        return mTime == o.mTime && mCycle == o.mCycle && mPhase == o.mPhase &&
               mCr == o.mCr &&
               value::toBitString(mInput) == value::toBitString(o.mInput) &&
               lookaheadBits() == o.lookaheadBits();
    }
    bool operator!=(const Event& o) const { return !(*this == o); }

  private:
    std::optional<value::BitString> lookaheadBits() const {
        if (!mLookahead) return std::nullopt;
        return value::toBitString(*mLookahead);
    }
};

// Pull-based, restartable event source.
template <typename I>
class Expander {
    static_assert(value::isRepresentable<I>, "input must be Representable");

  public:
    using Input = I;

    Expander(std::vector<I> inputs, uint32_t resetCycles, uint64_t period)
        : mInputs(std::move(inputs))
        , mResetCycles(resetCycles)
        , mPeriod(period)
        , mResetInput(value::resetValue<I>()) {
        checkClockPeriod(period);
        checkTimeSpan(cycles(), period);
    }

    uint64_t cycles() const { return mResetCycles + mInputs.size(); }
    uint64_t size() const { return kEventsPerCycle * cycles(); }
    uint32_t resetCycles() const { return mResetCycles; }
    uint64_t period() const { return mPeriod; }

    std::optional<Event<I>> next() {
        if (mCycle >= cycles()) return std::nullopt;
        Event<I> ev = makeEvent(mCycle, mPhase);
        advance();
        return ev;
    }

    void restart() {
        mCycle = 0;
        mPhase = ClockPhase::Low;
    }

  private:
    bool cycleReset(uint64_t c) const { return c < mResetCycles; }
    // By value: std::vector<bool> has no element references.
    I cycleInput(uint64_t c) const {
        return cycleReset(c) ? mResetInput : mInputs[c - mResetCycles];
    }

    Event<I> makeEvent(uint64_t c, ClockPhase phase) const {
        const bool hasNext = c + 1 < cycles();
        // The lookahead phase already carries the next cycle's value.
        const uint64_t valueCycle =
          (phase == ClockPhase::HighLookahead && hasNext) ? c + 1 : c;
        Event<I> ev{phaseTime(c, phase, mPeriod),
                    c,
                    phase,
                    clockReset(phase != ClockPhase::Low,
                               cycleReset(valueCycle)),
                    cycleInput(valueCycle),
                    std::nullopt};
        if (hasNext) ev.mLookahead = cycleInput(c + 1);
        return ev;
    }

    void advance() {
        switch (mPhase) {
        case ClockPhase::Low: mPhase = ClockPhase::RisingEdge; break;
        case ClockPhase::RisingEdge: mPhase = ClockPhase::HighLookahead; break;
        case ClockPhase::HighLookahead:
            mPhase = ClockPhase::Low;
            ++mCycle;
            break;
        }
    }

    std::vector<I> mInputs;
    uint32_t mResetCycles = 0;
    uint64_t mPeriod = 0;
    I mResetInput;

    uint64_t mCycle = 0;
    ClockPhase mPhase = ClockPhase::Low;
};

// Eager form: all 3 * (resetCycles + inputs.size()) events.
template <typename I>
std::vector<Event<I>> expand(const std::vector<I>& inputs,
                             uint32_t resetCycles, uint64_t period) {
    Expander<I> ex(inputs, resetCycles, period);
    std::vector<Event<I>> events;
    events.reserve(ex.size());
    while (auto ev = ex.next())
        events.push_back(std::move(*ev));
    return events;
}

} // namespace rtlsim::sim
