#pragma once
// D flip-flop: the output is the stored value, the next state is the input.
// Under reset the output is T's reset value and the next state is the
// flip-flop's initial value.

#include <utility>

#include "rtlsim/sim/synchronous.hpp"

namespace rtlsim::lib {

template <typename T>
class Dff final : public sim::Synchronous<T, T, T> {
  public:
    using Base = sim::Synchronous<T, T, T>;
    using typename Base::Result;

    Dff()
        : mInit(value::resetValue<T>()) {}
    explicit Dff(T init)
        : mInit(std::move(init)) {}

    T init() const override { return mInit; }

    Result evaluate(sim::ClockReset cr, const T& input,
                    const T& q) const override {
        if (cr.mReset) return {value::resetValue<T>(), mInit};
        return {q, input};
    }

  private:
    T mInit;
};

} // namespace rtlsim::lib
