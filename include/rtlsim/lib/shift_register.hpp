#pragma once
// Shift-in register (serial to parallel).
//
// On each rising edge with enable set the register shifts left by one and
// serial_in fills the LSB; otherwise it holds. The output is the current
// parallel value. Storage is a Dff child, driven with this unit's ClockReset.
//
//     before:  [N-1] ... [1] [0]
//     after:   [N-2] ... [0] [serial_in]

#include <utility>

#include "rtlsim/lib/dff.hpp"
#include "rtlsim/value/bit_vector.hpp"

namespace rtlsim::lib {

template <uint32_t N>
struct ShiftRegisterD {
    value::BitVector<N> mRegister;
};

template <uint32_t N>
struct ShiftRegisterQ {
    value::BitVector<N> mRegister;

    ShiftRegisterQ() = default;
    explicit ShiftRegisterQ(value::BitVector<N> reg)
        : mRegister(reg) {}
    explicit ShiftRegisterQ(const ShiftRegisterD<N>& d)
        : mRegister(d.mRegister) {}

    bool operator==(const ShiftRegisterQ& o) const {
        return mRegister == o.mRegister;
    }
    bool operator!=(const ShiftRegisterQ& o) const { return !(*this == o); }
};

using ShiftRegisterIn = std::pair<bool, bool>; // (enable, serial_in)

template <uint32_t N>
class ShiftRegister final
    : public sim::Synchronous<ShiftRegisterIn, value::BitVector<N>,
                              ShiftRegisterQ<N>, ShiftRegisterD<N>> {
  public:
    using Base = sim::Synchronous<ShiftRegisterIn, value::BitVector<N>,
                                  ShiftRegisterQ<N>, ShiftRegisterD<N>>;
    using typename Base::Input;
    using typename Base::Result;
    using typename Base::State;

    State init() const override { return State(mRegister.init()); }

    Result evaluate(sim::ClockReset cr, const Input& input,
                    const State& q) const override {
        const auto& [enable, serialIn] = input;
        const value::BitVector<N> current = q.mRegister;
        value::BitVector<N> next = current;
        if (enable) {
            next = (current << 1) |
                   value::BitVector<N>::fromMagnitude(uint64_t{serialIn});
        }
        auto [out, reg] = mRegister.evaluate(cr, next, current);
        return {out, ShiftRegisterD<N>{reg}};
    }

  private:
    Dff<value::BitVector<N>> mRegister;
};

} // namespace rtlsim::lib

namespace rtlsim::value {

template <uint32_t N>
struct Representable<lib::ShiftRegisterQ<N>> {
    static constexpr uint32_t kWidth = N;
    static void append(const lib::ShiftRegisterQ<N>& v, BitString& out) {
        Representable<BitVector<N>>::append(v.mRegister, out);
    }
    static lib::ShiftRegisterQ<N> read(const BitString& in, size_t& pos) {
        return lib::ShiftRegisterQ<N>(
          Representable<BitVector<N>>::read(in, pos));
    }
    static lib::ShiftRegisterQ<N> reset() { return {}; }
};

template <uint32_t N>
struct Representable<lib::ShiftRegisterD<N>> {
    static constexpr uint32_t kWidth = N;
    static void append(const lib::ShiftRegisterD<N>& v, BitString& out) {
        Representable<BitVector<N>>::append(v.mRegister, out);
    }
    static lib::ShiftRegisterD<N> read(const BitString& in, size_t& pos) {
        return {Representable<BitVector<N>>::read(in, pos)};
    }
    static lib::ShiftRegisterD<N> reset() { return {}; }
};

} // namespace rtlsim::value
