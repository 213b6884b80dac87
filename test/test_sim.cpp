#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "rtlsim/lib/accumulator.hpp"
#include "rtlsim/sim/expand.hpp"
#include "rtlsim/sim/kernel.hpp"
#include "rtlsim/sim/run.hpp"
#include "rtlsim/sim/sample.hpp"

using namespace rtlsim;
using namespace rtlsim::sim;
using value::BitVector;
using value::bits;

using AccIn = lib::AccumulatorIn<8>;

static std::vector<AccIn> accInputs(std::initializer_list<uint64_t> vals) {
    std::vector<AccIn> v;
    for (uint64_t x : vals)
        v.emplace_back(true, bits<8>(x));
    return v;
}

// Free-function kernel: 4-bit up counter with enable.
static std::pair<BitVector<4>, BitVector<4>>
counterKernel(ClockReset cr, bool enable, BitVector<4> q) {
    if (cr.mReset) return {BitVector<4>::reset(), BitVector<4>::reset()};
    return {q, enable ? q + bits<4>(1) : q};
}

TEST(ClockReset, Representable) {
    static_assert(value::widthOf<ClockReset> == 2, "");
    EXPECT_EQ(value::bitStringToString(value::toBitString(clockReset(true, false))),
              "01");
    EXPECT_EQ(value::resetValue<ClockReset>(), clockReset(false, true));
}

TEST(Expand, EventCountLaw) {
    for (uint32_t r : {0u, 1u, 3u}) {
        for (size_t n : {size_t{0}, size_t{1}, size_t{4}}) {
            std::vector<bool> inputs(n, true);
            auto events = expand(inputs, r, 10);
            EXPECT_EQ(events.size(), 3 * (r + n)) << "R=" << r << " n=" << n;
        }
    }
    EXPECT_TRUE(expand(std::vector<bool>{}, 0, 10).empty());
}

TEST(Expand, PhasesTimesAndLookahead) {
    auto in = accInputs({7, 9});
    auto ev = expand(in, 1, 10);
    ASSERT_EQ(ev.size(), 9u);

    const uint64_t times[] = {0, 5, 6, 10, 15, 16, 20, 25, 26};
    const ClockPhase phases[] = {ClockPhase::Low, ClockPhase::RisingEdge,
                                 ClockPhase::HighLookahead};
    for (size_t i = 0; i < ev.size(); ++i) {
        EXPECT_EQ(ev[i].mTime, times[i]) << "event " << i;
        EXPECT_EQ(ev[i].mCycle, i / 3);
        EXPECT_EQ(ev[i].mPhase, phases[i % 3]);
        EXPECT_EQ(ev[i].mCr.mClock, i % 3 != 0);
    }

    // Reset cycle: reset held with the reset input value.
    EXPECT_TRUE(ev[0].mCr.mReset);
    EXPECT_TRUE(ev[1].mCr.mReset);
    EXPECT_FALSE(ev[0].mInput.first);
    EXPECT_EQ(ev[0].mInput.second.value(), 0u);

    // Lookahead of the reset cycle already carries cycle 1.
    EXPECT_FALSE(ev[2].mCr.mReset);
    EXPECT_EQ(ev[2].mInput.second.value(), 7u);
    ASSERT_TRUE(ev[2].mLookahead.has_value());
    EXPECT_EQ(ev[2].mLookahead->second.value(), 7u);

    EXPECT_EQ(ev[4].mInput.second.value(), 7u);
    EXPECT_EQ(ev[5].mInput.second.value(), 9u);

    // Last cycle has no next: lookahead phase repeats its own value.
    EXPECT_EQ(ev[8].mInput.second.value(), 9u);
    EXPECT_FALSE(ev[8].mLookahead.has_value());
}

TEST(Expand, TimestampsStrictlyIncreasing) {
    for (uint64_t p : {3u, 4u, 7u, 100u}) {
        auto ev = expand(std::vector<bool>(5, false), 2, p);
        for (size_t i = 1; i < ev.size(); ++i)
            EXPECT_LT(ev[i - 1].mTime, ev[i].mTime) << "period " << p;
    }
    EXPECT_THROW(expand(std::vector<bool>{true}, 1, 2), RangeError);
    EXPECT_THROW(Expander<bool>({true}, 1, 0), RangeError);
}

TEST(Expand, TimeAxisOverflowRejected) {
    const std::vector<bool> in(5, true);
    EXPECT_THROW(expand(in, 0, uint64_t{1} << 62), RangeError);
    EXPECT_THROW(Expander<bool>(in, 3, uint64_t{1} << 61), RangeError);

    // Largest period that still fits: timestamps keep increasing to the end.
    const uint64_t p = std::numeric_limits<uint64_t>::max() / 5;
    auto ev = expand(in, 0, p);
    ASSERT_EQ(ev.size(), 15u);
    for (size_t i = 1; i < ev.size(); ++i)
        EXPECT_LT(ev[i - 1].mTime, ev[i].mTime) << "event " << i;
    EXPECT_EQ(ev.back().mTime, 4 * p + p / 2 + 1);

    // No cycles, no time axis to overflow.
    EXPECT_TRUE(expand(std::vector<bool>{}, 0, p * 2).empty());
}

TEST(Expand, Idempotent) {
    auto in = accInputs({1, 2, 3});
    EXPECT_EQ(expand(in, 2, 10), expand(in, 2, 10));

    Expander<AccIn> ex(in, 2, 10);
    std::vector<Event<AccIn>> first, second;
    while (auto e = ex.next())
        first.push_back(*e);
    ex.restart();
    while (auto e = ex.next())
        second.push_back(*e);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, expand(in, 2, 10));
    EXPECT_EQ(ex.size(), 15u);
}

TEST(Evaluator, ResetDeterminism) {
    lib::Accumulator<8> acc;
    Evaluator<lib::Accumulator<8>> eval(acc);
    EXPECT_EQ(eval.init(), eval.init());
    for (uint64_t q : {0u, 5u, 255u}) {
        for (uint64_t d : {0u, 1u, 200u}) {
            auto [out, next] =
              eval.step(clockReset(true, true), {true, bits<8>(d)}, bits<8>(q));
            EXPECT_EQ(out.value(), 0u);
            EXPECT_EQ(next.value(), 0u);
        }
    }
    auto [out, next] =
      eval.step(clockReset(false, false), {true, bits<8>(200)}, bits<8>(100));
    EXPECT_EQ(out.value(), 100u);
    EXPECT_EQ(next.value(), 44u); // wraps modulo 256
}

TEST(Run, AccumulatorEndToEnd) {
    lib::Accumulator<8> acc;
    auto trace = run(acc, expand(accInputs({1, 2, 3}), 1, 100));
    ASSERT_EQ(trace.size(), 12u);

    auto out = sample(trace);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].value(), 0u);
    EXPECT_EQ(out[1].value(), 1u);
    EXPECT_EQ(out[2].value(), 3u);
    EXPECT_EQ(out[3].value(), 6u);
}

TEST(Run, SamplerLaw) {
    lib::Accumulator<8> acc;
    for (uint32_t r : {0u, 1u, 2u}) {
        auto in = accInputs({4, 4, 1, 9, 250});
        auto trace = run(acc, expand(in, r, 10));
        auto out = sample(trace);
        ASSERT_EQ(out.size(), r + in.size());
        for (size_t i = 0; i < out.size(); ++i)
            EXPECT_EQ(out[i], trace[3 * i + 1].mOutput);

        auto cyc = synchronousSample(trace);
        ASSERT_EQ(cyc.size(), out.size());
        for (size_t i = 0; i < cyc.size(); ++i) {
            EXPECT_EQ(cyc[i].mCycle, i);
            EXPECT_EQ(cyc[i].mCr.mReset, i < r);
            EXPECT_EQ(cyc[i].mOutput, out[i]);
        }
    }
}

TEST(Run, NoResetCapturesOnFirstEdge) {
    lib::Accumulator<8> acc;
    auto out = sample(run(acc, expand(accInputs({1, 2, 3}), 0, 10)));
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].value(), 1u);
    EXPECT_EQ(out[1].value(), 3u);
    EXPECT_EQ(out[2].value(), 6u);
}

TEST(Run, EnableHolds) {
    lib::Accumulator<8> acc;
    std::vector<AccIn> in = {{true, bits<8>(5)},
                             {false, bits<8>(100)},
                             {true, bits<8>(1)}};
    auto out = sample(run(acc, expand(in, 1, 10)));
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[1].value(), 5u);
    EXPECT_EQ(out[2].value(), 5u);
    EXPECT_EQ(out[3].value(), 6u);
}

TEST(Run, LazyRunnerMatchesEager) {
    lib::Accumulator<8> acc;
    auto in = accInputs({3, 1, 4, 1, 5});
    auto eager = run(acc, expand(in, 1, 10));

    Runner<lib::Accumulator<8>> lazy(acc, Expander<AccIn>(in, 1, 10));
    size_t i = 0;
    while (auto e = lazy.next()) {
        ASSERT_LT(i, eager.size());
        EXPECT_EQ(e->mEvent, eager[i].mEvent);
        EXPECT_EQ(e->mOutput, eager[i].mOutput);
        ++i;
    }
    EXPECT_EQ(i, eager.size());
    EXPECT_EQ(lazy.state().value(), 14u);

    // Stopping early leaves the rest unevaluated.
    Runner<lib::Accumulator<8>> partial(acc, Expander<AccIn>(in, 1, 10));
    for (int k = 0; k < 5; ++k)
        ASSERT_TRUE(partial.next().has_value());
    EXPECT_EQ(partial.state().value(), 3u);
}

TEST(Kernel, ShapeDetection) {
    auto good = [](ClockReset, const bool& in, const BitVector<2>& q) {
        return std::make_pair(in, q);
    };
    auto twoArgs = [](ClockReset, bool in) { return std::make_pair(in, in); };
    auto notPair = [](ClockReset, bool in, bool) { return in; };
    auto noClock = [](bool, bool in, bool q) { return std::make_pair(in, q); };
    auto badState = [](ClockReset, bool in, int q) {
        return std::make_pair(in, q);
    };
    auto generic = [](ClockReset, auto in, bool q) {
        return std::make_pair(in, q);
    };
    int counter = 0;
    auto mutating = [counter](ClockReset, bool in, bool q) mutable {
        ++counter;
        return std::make_pair(in, q);
    };

    EXPECT_TRUE(isKernelShaped<decltype(good)>);
    EXPECT_TRUE(isKernelShaped<decltype(&counterKernel)>);
    EXPECT_FALSE(isKernelShaped<decltype(twoArgs)>);
    EXPECT_FALSE(isKernelShaped<decltype(notPair)>);
    EXPECT_FALSE(isKernelShaped<decltype(noClock)>);
    EXPECT_FALSE(isKernelShaped<decltype(badState)>);
    EXPECT_FALSE(isKernelShaped<decltype(generic)>);
    EXPECT_FALSE(isKernelShaped<decltype(mutating)>);

    EXPECT_EQ(KernelShape<decltype(twoArgs)>::describe(),
              "expected 3 parameters (ClockReset, input, state), got 2");
    EXPECT_EQ(KernelShape<decltype(noClock)>::describe(),
              "first parameter must be ClockReset");
    EXPECT_EQ(KernelShape<decltype(notPair)>::describe(),
              "result must be std::pair<output, next state>");
}

TEST(Kernel, CounterComponent) {
    auto counter = makeKernelComponent(&counterKernel);
    static_assert(std::is_same_v<decltype(counter)::Output, BitVector<4>>, "");
    auto out = sample(run(counter, expand(std::vector<bool>(17, true), 1, 10)));
    ASSERT_EQ(out.size(), 18u);
    EXPECT_EQ(out[0].value(), 0u);
    EXPECT_EQ(out[1].value(), 1u);
    EXPECT_EQ(out[15].value(), 15u);
    EXPECT_EQ(out[16].value(), 0u); // wraps
    EXPECT_EQ(out[17].value(), 1u);

    KernelComponent<decltype(&counterKernel)> preset(&counterKernel,
                                                     bits<4>(9));
    EXPECT_EQ(preset.init().value(), 9u);
    auto noReset = sample(run(preset, expand(std::vector<bool>{false}, 0, 10)));
    ASSERT_EQ(noReset.size(), 1u);
    EXPECT_EQ(noReset[0].value(), 9u);
}
