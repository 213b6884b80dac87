#pragma once
// BitVector<W>: the statically sized form of Bits. Width-changing
// combinators take the output width as an explicit template argument that is
// verified at compile time; there is no implicit widening or truncation.

#include <cstdint>
#include <type_traits>

#include "rtlsim/value/bits.hpp"

namespace rtlsim::value {

template <uint32_t W>
class BitVector {
    static_assert(W >= 1 && W <= Bits::kMaxWidth,
                  "BitVector width must be in [1, 64]");

  public:
    static constexpr uint32_t kWidth = W;

    BitVector() = default;

    static BitVector fromMagnitude(uint64_t v) {
        return BitVector(Bits::fromMagnitude(W, v).value());
    }
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>,
                               int> = 0>
    static BitVector fromMagnitude(T v) {
        return BitVector(Bits::fromMagnitude(W, v).value());
    }
    // WidthMismatchError unless b.width() == W.
    static BitVector fromBits(const Bits& b) {
        if (b.width() != W) {
            throw WidthMismatchError("cannot view " +
                                     std::to_string(b.width()) +
                                     "-bit value as BitVector<" +
                                     std::to_string(W) + ">");
        }
        return BitVector(b.value());
    }
    static BitVector reset() { return BitVector(); }

    uint64_t value() const { return mValue; }
    Bits toBits() const { return Bits::fromMagnitude(W, mValue); }
    BitString bits() const { return toBits().bits(); }
    bool any() const { return mValue != 0; }
    bool msb() const { return ((mValue >> (W - 1)) & 1u) != 0; }

    template <uint32_t I>
    bool bit() const {
        static_assert(I < W, "bit index out of range");
        return ((mValue >> I) & 1u) != 0;
    }

    BitVector operator&(const BitVector& o) const {
        return BitVector(mValue & o.mValue);
    }
    BitVector operator|(const BitVector& o) const {
        return BitVector(mValue | o.mValue);
    }
    BitVector operator^(const BitVector& o) const {
        return BitVector(mValue ^ o.mValue);
    }
    BitVector operator+(const BitVector& o) const {
        return BitVector((mValue + o.mValue) & kMask);
    }
    BitVector operator-(const BitVector& o) const {
        return BitVector((mValue - o.mValue) & kMask);
    }
    BitVector operator~() const { return BitVector(~mValue & kMask); }

    BitVector operator<<(uint32_t amount) const {
        return amount >= W ? BitVector() : BitVector((mValue << amount) & kMask);
    }
    BitVector operator>>(uint32_t amount) const {
        return amount >= W ? BitVector() : BitVector(mValue >> amount);
    }

    bool operator==(const BitVector& o) const { return mValue == o.mValue; }
    bool operator!=(const BitVector& o) const { return mValue != o.mValue; }

  private:
    static constexpr uint64_t kMask = Bits::maskFor(W);

    explicit BitVector(uint64_t v)
        : mValue(v) {}

    uint64_t mValue = 0;

    template <uint32_t Out, uint32_t A, uint32_t B>
    friend BitVector<Out> concat(const BitVector<A>&, const BitVector<B>&);
};

// {hi, lo}: hi lands in the upper bits.
template <uint32_t Out, uint32_t A, uint32_t B>
BitVector<Out> concat(const BitVector<A>& hi, const BitVector<B>& lo) {
    static_assert(Out == A + B, "declared concat width must equal A + B");
    return BitVector<Out>((hi.mValue << B) | lo.mValue);
}

template <uint32_t Out, uint32_t W>
BitVector<Out> zeroExtend(const BitVector<W>& v) {
    static_assert(Out >= W, "zeroExtend cannot narrow");
    return BitVector<Out>::fromMagnitude(v.value());
}

template <uint32_t Out, uint32_t W>
BitVector<Out> truncate(const BitVector<W>& v) {
    static_assert(Out <= W, "truncate cannot widen");
    return BitVector<Out>::fromMagnitude(v.value() & Bits::maskFor(Out));
}

template <uint32_t Msb, uint32_t Lsb, uint32_t W>
BitVector<Msb - Lsb + 1> slice(const BitVector<W>& v) {
    static_assert(Msb >= Lsb && Msb < W, "slice out of range");
    constexpr uint32_t kOut = Msb - Lsb + 1;
    return BitVector<kOut>::fromMagnitude((v.value() >> Lsb) &
                                          Bits::maskFor(kOut));
}

template <uint32_t W>
BitVector<W> bits(uint64_t v) {
    return BitVector<W>::fromMagnitude(v);
}

} // namespace rtlsim::value
