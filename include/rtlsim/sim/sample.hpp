#pragma once
// Synchronous sampler: one authoritative value per logical cycle, taken at
// the RisingEdge phase (raw index 3*i + 1 of a complete trace). Low and
// HighLookahead duplicates are dropped.

#include <cstdint>
#include <vector>

#include "rtlsim/sim/run.hpp"

namespace rtlsim::sim {

template <typename I, typename O>
struct CycleSample {
    uint64_t mCycle = 0;
    uint64_t mTime = 0;
    ClockReset mCr;
    I mInput;
    O mOutput;
};

template <typename I, typename O>
std::vector<CycleSample<I, O>> synchronousSample(const Trace<I, O>& trace) {
    std::vector<CycleSample<I, O>> out;
    out.reserve(trace.size() / kEventsPerCycle);
    for (const auto& e : trace) {
        if (e.mEvent.mPhase != ClockPhase::RisingEdge) continue;
        out.push_back(CycleSample<I, O>{e.mEvent.mCycle, e.mEvent.mTime,
                                        e.mEvent.mCr, e.mEvent.mInput,
                                        e.mOutput});
    }
    return out;
}

template <typename I, typename O>
std::vector<O> sample(const Trace<I, O>& trace) {
    std::vector<O> out;
    out.reserve(trace.size() / kEventsPerCycle);
    for (const auto& e : trace)
        if (e.mEvent.mPhase == ClockPhase::RisingEdge)
            out.push_back(e.mOutput);
    return out;
}

} // namespace rtlsim::sim
