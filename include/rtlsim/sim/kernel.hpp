#pragma once
// Components authored as a free kernel function or lambda:
//   (ClockReset, I, Q) -> std::pair<O, D>
// KernelShape inspects a callable's signature without instantiating anything
// that depends on it being well formed, so a registry can reject a bad kernel
// with ShapeError before any simulation runs.

#include <cstddef>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "rtlsim/error.hpp"
#include "rtlsim/sim/synchronous.hpp"

namespace rtlsim::sim {

namespace detail {

template <typename R, typename... A>
struct SignatureTraits {
    static constexpr bool kKnown = true;
    using Result = R;
    using Args = std::tuple<A...>;
};

// Only const call operators qualify; a kernel may not mutate itself.
template <typename M>
struct MemberCallTraits {
    static constexpr bool kKnown = false;
};
template <typename C, typename R, typename... A>
struct MemberCallTraits<R (C::*)(A...) const> : SignatureTraits<R, A...> {};

template <typename F, typename = void>
struct CallableTraits {
    static constexpr bool kKnown = false;
};
template <typename R, typename... A>
struct CallableTraits<R (*)(A...), void> : SignatureTraits<R, A...> {};
template <typename F>
struct CallableTraits<F, std::void_t<decltype(&F::operator())>>
    : MemberCallTraits<decltype(&F::operator())> {};

template <typename Args, size_t I, bool = (I < std::tuple_size_v<Args>)>
struct ArgAt {
    using type = void;
};
template <typename Args, size_t I>
struct ArgAt<Args, I, true> {
    using type = std::decay_t<std::tuple_element_t<I, Args>>;
};

template <typename R>
struct PairParts {
    static constexpr bool kIsPair = false;
    using First = void;
    using Second = void;
};
template <typename A, typename B>
struct PairParts<std::pair<A, B>> {
    static constexpr bool kIsPair = true;
    using First = A;
    using Second = B;
};

template <typename Q, typename D,
          bool = value::isRepresentable<Q> && value::isRepresentable<D>>
struct CommitOk : std::false_type {};
template <typename Q, typename D>
struct CommitOk<Q, D, true>
    : std::bool_constant<std::is_constructible_v<Q, const D&>> {};

} // namespace detail

template <typename F, typename Traits = detail::CallableTraits<std::decay_t<F>>,
          bool Known = Traits::kKnown>
struct KernelShape {
    static constexpr bool kValid = false;
    static std::string describe() {
        return "kernel is not a callable with a single call signature";
    }
};

template <typename F, typename Traits>
struct KernelShape<F, Traits, true> {
    using Args = typename Traits::Args;
    using Ret = std::decay_t<typename Traits::Result>;
    using Input = typename detail::ArgAt<Args, 1>::type;
    using State = typename detail::ArgAt<Args, 2>::type;
    using Output = typename detail::PairParts<Ret>::First;
    using NextState = typename detail::PairParts<Ret>::Second;

    static constexpr size_t kArity = std::tuple_size_v<Args>;
    static constexpr bool kArityOk = kArity == 3;
    static constexpr bool kClockOk =
      std::is_same_v<typename detail::ArgAt<Args, 0>::type, ClockReset>;
    static constexpr bool kInputOk = value::isRepresentable<Input>;
    static constexpr bool kStateOk = value::isRepresentable<State>;
    static constexpr bool kPairOk = detail::PairParts<Ret>::kIsPair;
    static constexpr bool kOutputOk = value::isRepresentable<Output>;
    static constexpr bool kNextOk = value::isRepresentable<NextState>;

    static constexpr bool kCommitOk =
      detail::CommitOk<State, NextState>::value;
    static constexpr bool kValid = kArityOk && kClockOk && kInputOk &&
                                   kStateOk && kPairOk && kOutputOk &&
                                   kNextOk && kCommitOk;

    static std::string describe() {
        if (!kArityOk) {
            return "expected 3 parameters (ClockReset, input, state), got " +
                   std::to_string(kArity);
        }
        if (!kClockOk) return "first parameter must be ClockReset";
        if (!kInputOk) return "input parameter type is not Representable";
        if (!kStateOk) return "state parameter type is not Representable";
        if (!kPairOk) return "result must be std::pair<output, next state>";
        if (!kOutputOk) return "output type is not Representable";
        if (!kNextOk) return "next-state type is not Representable";
        if (!kCommitOk) return "next state cannot commit into state";
        return "ok";
    }
};

template <typename F>
inline constexpr bool isKernelShaped = KernelShape<F>::kValid;

// Synchronous adapter over a well-shaped kernel. The reset state defaults to
// the state type's canonical reset value.
template <typename F>
class KernelComponent final
    : public Synchronous<typename KernelShape<F>::Input,
                         typename KernelShape<F>::Output,
                         typename KernelShape<F>::State,
                         typename KernelShape<F>::NextState> {
    static_assert(KernelShape<F>::kValid,
                  "kernel must have shape (ClockReset, I, Q) -> pair<O, D>");

  public:
    using Base = Synchronous<typename KernelShape<F>::Input,
                             typename KernelShape<F>::Output,
                             typename KernelShape<F>::State,
                             typename KernelShape<F>::NextState>;
    using typename Base::Input;
    using typename Base::Result;
    using typename Base::State;

    explicit KernelComponent(F kernel)
        : mKernel(std::move(kernel))
        , mInit(value::resetValue<State>()) {}
    KernelComponent(F kernel, State init)
        : mKernel(std::move(kernel))
        , mInit(std::move(init)) {}

    State init() const override { return mInit; }
    Result evaluate(ClockReset cr, const Input& input,
                    const State& state) const override {
        return mKernel(cr, input, state);
    }

  private:
    F mKernel;
    State mInit;
};

template <typename F>
KernelComponent<std::decay_t<F>> makeKernelComponent(F&& kernel) {
    return KernelComponent<std::decay_t<F>>(std::forward<F>(kernel));
}

} // namespace rtlsim::sim
