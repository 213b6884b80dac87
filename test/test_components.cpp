#include <type_traits>
#include <vector>

#include <gtest/gtest.h>

#include "rtlsim/lib/accumulator.hpp"
#include "rtlsim/lib/dff.hpp"
#include "rtlsim/lib/shift_out.hpp"
#include "rtlsim/lib/shift_register.hpp"
#include "rtlsim/sim/run.hpp"
#include "rtlsim/sim/sample.hpp"

using namespace rtlsim;
using namespace rtlsim::sim;
using value::BitVector;
using value::bits;

template <typename C>
static std::vector<typename C::Output>
sampled(const C& comp, const std::vector<typename C::Input>& in,
        uint32_t resetCycles = 1) {
    return sample(run(comp, expand(in, resetCycles, 10)));
}

TEST(Dff, DelaysByOneEdge) {
    lib::Dff<bool> d;
    auto out = sampled(d, {true, false, true, true});
    EXPECT_EQ(out, (std::vector<bool>{false, true, false, true, true}));
}

TEST(Dff, InitValueAndReset) {
    lib::Dff<BitVector<8>> d(bits<8>(0x5A));
    EXPECT_EQ(d.init(), bits<8>(0x5A));
    EXPECT_EQ(d.init(), d.init());

    // Reset output is the type's reset value; the register reloads init.
    auto [out, next] =
      d.evaluate(clockReset(true, true), bits<8>(7), bits<8>(3));
    EXPECT_EQ(out.value(), 0u);
    EXPECT_EQ(next, bits<8>(0x5A));

    auto noReset = sampled(d, {bits<8>(1)}, 0);
    ASSERT_EQ(noReset.size(), 1u);
    EXPECT_EQ(noReset[0].value(), 1u);
}

TEST(ShiftRegister, SerialToParallel) {
    lib::ShiftRegister<4> sr;
    std::vector<lib::ShiftRegisterIn> in = {
      {true, true}, {true, false}, {true, true}, {true, true}, {true, false}};
    auto out = sampled(sr, in);
    ASSERT_EQ(out.size(), 6u);
    const uint64_t expect[] = {0x0, 0x1, 0x2, 0x5, 0xB, 0x6};
    for (size_t i = 0; i < out.size(); ++i)
        EXPECT_EQ(out[i].value(), expect[i]) << "cycle " << i;
}

TEST(ShiftRegister, HoldsWithoutEnable) {
    lib::ShiftRegister<8> sr;
    std::vector<lib::ShiftRegisterIn> in = {
      {true, true}, {false, true}, {false, false}, {true, true}};
    auto out = sampled(sr, in);
    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(out[1].value(), 0x1u);
    EXPECT_EQ(out[2].value(), 0x1u);
    EXPECT_EQ(out[3].value(), 0x1u);
    EXPECT_EQ(out[4].value(), 0x3u);
}

TEST(ShiftRegister, StateTypes) {
    using SR = lib::ShiftRegister<16>;
    static_assert(value::widthOf<SR::State> == 16, "");
    static_assert(value::widthOf<SR::NextState> == 16, "");
    static_assert(!std::is_same_v<SR::State, SR::NextState>, "");
    SR sr;
    EXPECT_EQ(sr.init(), sr.init());
    EXPECT_EQ(sr.init().mRegister.value(), 0u);

    lib::ShiftRegisterQ<16> q(bits<16>(0x8001));
    auto bs = value::toBitString(q);
    EXPECT_EQ(value::bitStringToString(bs), "1000000000000001");
    EXPECT_EQ(value::fromBitString<lib::ShiftRegisterQ<16>>(bs), q);

    // Reset forces both output and next state to zero.
    auto [out, next] = sr.evaluate(clockReset(true, true), {true, true}, q);
    EXPECT_EQ(out.value(), 0u);
    EXPECT_EQ(next.mRegister.value(), 0u);
}

TEST(ShiftOut, ParallelToSerialMsbFirst) {
    lib::ShiftOut<8> so;
    std::vector<lib::ShiftOutIn<8>> in;
    in.emplace_back(false, true, bits<8>(0xAB)); // load
    for (int i = 0; i < 8; ++i)
        in.emplace_back(true, false, bits<8>(0));
    in.emplace_back(false, false, bits<8>(0)); // hold
    auto out = sampled(so, in);
    EXPECT_EQ(out, (std::vector<bool>{false, true, false, true, false, true,
                                      false, true, true, false, false}));
}

TEST(ShiftOut, LoadWinsOverEnable) {
    lib::ShiftOut<4> so;
    std::vector<lib::ShiftOutIn<4>> in;
    in.emplace_back(false, true, bits<4>(0x3)); // 0011
    in.emplace_back(true, false, bits<4>(0));   // 0110
    in.emplace_back(true, true, bits<4>(0x9));  // load 1001, no shift
    in.emplace_back(false, false, bits<4>(0));
    auto out = sampled(so, in);
    EXPECT_EQ(out, (std::vector<bool>{false, false, false, true, true}));

    auto [serial, next] =
      so.evaluate(clockReset(true, false),
                  lib::ShiftOutIn<4>{true, true, bits<4>(0xC)}, bits<4>(0x1));
    EXPECT_FALSE(serial);
    EXPECT_EQ(next.value(), 0xCu);
}

TEST(ShiftOut, ResetClearsOutput) {
    lib::ShiftOut<4> so;
    auto [serial, next] =
      so.evaluate(clockReset(true, true),
                  lib::ShiftOutIn<4>{false, true, bits<4>(0xF)}, bits<4>(0x8));
    EXPECT_FALSE(serial);
    EXPECT_EQ(next.value(), 0u);
}

TEST(Accumulator, WrapsAtWidth) {
    lib::Accumulator<4> acc;
    std::vector<lib::AccumulatorIn<4>> in = {
      {true, bits<4>(9)}, {true, bits<4>(9)}, {false, bits<4>(15)}};
    auto out = sampled(acc, in);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[1].value(), 9u);
    EXPECT_EQ(out[2].value(), 2u);
    EXPECT_EQ(out[3].value(), 2u);
}
