#pragma once
// Test-harness runner: applies a component's evaluator to each event.
//
// The runner owns the committed state Q and the pending next state D. On a
// rising clock edge the pending D is committed into Q before evaluating;
// every event then evaluates (cr, input, Q), records the output and keeps the
// returned D as pending.

#include <optional>
#include <utility>
#include <vector>

#include "rtlsim/sim/expand.hpp"
#include "rtlsim/sim/synchronous.hpp"

namespace rtlsim::sim {

template <typename I, typename O>
struct TraceEntry {
    Event<I> mEvent;
    O mOutput;
};

template <typename I, typename O>
using Trace = std::vector<TraceEntry<I, O>>;

template <typename C>
using TraceOf = Trace<typename C::Input, typename C::Output>;

// Applies the edge semantics one event at a time.
template <typename C>
class EventRunner {
  public:
    using Input = typename C::Input;
    using Output = typename C::Output;
    using State = typename C::State;
    using NextState = typename C::NextState;

    explicit EventRunner(const C& component)
        : mEval(component)
        , mState(mEval.init()) {}

    Output apply(const Event<Input>& ev) {
        if (ev.mCr.mClock && !mLastClock && mPending) {
            mState = State(*mPending);
        }
        mLastClock = ev.mCr.mClock;
        auto [out, d] = mEval.step(ev.mCr, ev.mInput, mState);
        mPending = std::move(d);
        return out;
    }

    const State& state() const { return mState; }

  private:
    Evaluator<C> mEval;
    State mState;
    std::optional<NextState> mPending;
    bool mLastClock = false;
};

// Pull-based run over an Expander; stop early by not calling next().
template <typename C>
class Runner {
  public:
    using Input = typename C::Input;
    using Entry = TraceEntry<Input, typename C::Output>;

    Runner(const C& component, Expander<Input> events)
        : mCore(component)
        , mEvents(std::move(events)) {}

    std::optional<Entry> next() {
        auto ev = mEvents.next();
        if (!ev) return std::nullopt;
        auto out = mCore.apply(*ev);
        return Entry{std::move(*ev), std::move(out)};
    }

    const typename C::State& state() const { return mCore.state(); }

  private:
    EventRunner<C> mCore;
    Expander<Input> mEvents;
};

template <typename C>
TraceOf<C> run(const C& component,
               const std::vector<Event<typename C::Input>>& events) {
    EventRunner<C> r(component);
    TraceOf<C> trace;
    trace.reserve(events.size());
    for (const auto& ev : events)
        trace.push_back({ev, r.apply(ev)});
    return trace;
}

template <typename C>
TraceOf<C> run(const C& component, Expander<typename C::Input> events) {
    Runner<C> r(component, std::move(events));
    TraceOf<C> trace;
    while (auto e = r.next())
        trace.push_back(std::move(*e));
    return trace;
}

} // namespace rtlsim::sim
