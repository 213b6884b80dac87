#pragma once
// Accumulator: state += data on each cycle with enable set, wrapping modulo
// 2^W. The output is the current state; reset forces the state to 0 and the
// output to 0.

#include <utility>

#include "rtlsim/sim/synchronous.hpp"
#include "rtlsim/value/bit_vector.hpp"

namespace rtlsim::lib {

template <uint32_t W>
using AccumulatorIn = std::pair<bool, value::BitVector<W>>; // (enable, data)

template <uint32_t W>
class Accumulator final
    : public sim::Synchronous<AccumulatorIn<W>, value::BitVector<W>,
                              value::BitVector<W>> {
  public:
    using Base = sim::Synchronous<AccumulatorIn<W>, value::BitVector<W>,
                                  value::BitVector<W>>;
    using typename Base::Input;
    using typename Base::Result;
    using typename Base::State;

    Result evaluate(sim::ClockReset cr, const Input& input,
                    const State& q) const override {
        if (cr.mReset) return {State::reset(), State::reset()};
        const auto& [enable, data] = input;
        return {q, enable ? q + data : q};
    }
};

} // namespace rtlsim::lib
