#pragma once
// State/port interface of a synchronous unit and its evaluator.
//
// A unit declares Input, Output, State (current, "Q") and NextState ("D"),
// all Representable, and implements exactly one evaluation function
//   evaluate(clockReset, input, state) -> (output, nextState).
// Output and next state depend only on the arguments; a unit with children
// forwards its own ClockReset to them so all share one timing reference.

#include <type_traits>
#include <utility>

#include "rtlsim/sim/clock_reset.hpp"
#include "rtlsim/value/representable.hpp"

namespace rtlsim::sim {

template <typename I, typename O, typename Q, typename D = Q>
class Synchronous {
    static_assert(value::isRepresentable<I>, "Input must be Representable");
    static_assert(value::isRepresentable<O>, "Output must be Representable");
    static_assert(value::isRepresentable<Q>, "State must be Representable");
    static_assert(value::isRepresentable<D>,
                  "NextState must be Representable");
    static_assert(std::is_constructible_v<Q, const D&>,
                  "NextState must commit into State");

  public:
    using Input = I;
    using Output = O;
    using State = Q;
    using NextState = D;
    using Result = std::pair<O, D>;

    virtual ~Synchronous() = default;

    // Canonical reset state; independent of any previous run.
    virtual Q init() const { return value::resetValue<Q>(); }

    virtual Result evaluate(ClockReset cr, const I& input,
                            const Q& state) const = 0;
};

template <typename C>
inline constexpr bool isSynchronous = std::is_base_of_v<
  Synchronous<typename C::Input, typename C::Output, typename C::State,
              typename C::NextState>,
  C>;

// init/step view over a component. step is total: it never throws for
// arguments admitted by the type system.
template <typename C>
class Evaluator {
  public:
    using Input = typename C::Input;
    using Output = typename C::Output;
    using State = typename C::State;
    using NextState = typename C::NextState;
    using Result = typename C::Result;

    explicit Evaluator(const C& component)
        : mComponent(component) {}

    State init() const { return mComponent.init(); }
    Result step(ClockReset cr, const Input& input, const State& state) const {
        return mComponent.evaluate(cr, input, state);
    }

  private:
    const C& mComponent;
};

} // namespace rtlsim::sim
