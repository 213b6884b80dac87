#pragma once
// Shift-out register (parallel to serial).
//
// load captures data_in; otherwise enable shifts left by one with a 0 filling
// the LSB; otherwise the register holds. load wins over enable. The serial
// output is the MSB of the current register, so after a load the word is
// presented MSB first over the next N enabled cycles.

#include <tuple>

#include "rtlsim/lib/dff.hpp"
#include "rtlsim/value/bit_vector.hpp"

namespace rtlsim::lib {

template <uint32_t N>
using ShiftOutIn = std::tuple<bool, bool, value::BitVector<N>>; // (enable, load, data_in)

template <uint32_t N>
class ShiftOut final
    : public sim::Synchronous<ShiftOutIn<N>, bool, value::BitVector<N>> {
  public:
    using Base = sim::Synchronous<ShiftOutIn<N>, bool, value::BitVector<N>>;
    using typename Base::Input;
    using typename Base::Result;
    using typename Base::State;

    Result evaluate(sim::ClockReset cr, const Input& input,
                    const State& q) const override {
        const auto& [enable, load, data] = input;
        State next = q;
        if (load) {
            next = data;
        } else if (enable) {
            next = q << 1;
        }
        auto [reg, d] = mRegister.evaluate(cr, next, q);
        return {reg.msb(), d};
    }

  private:
    Dff<value::BitVector<N>> mRegister;
};

} // namespace rtlsim::lib
