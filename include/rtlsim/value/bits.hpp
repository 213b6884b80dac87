#pragma once
// Bit symbols, bit strings, and the runtime-checked fixed-width value Bits.
// Bit strings are LSB-first: element 0 is bit 0. Printing puts the MSB first.

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "rtlsim/error.hpp"

namespace rtlsim::value {

enum class BitSymbol : uint8_t { Zero, One, Unknown };

using BitString = std::vector<BitSymbol>;

char toChar(BitSymbol b);
// MSB-first text, e.g. "10x1".
std::string bitStringToString(const BitString& bs);
// Inverse of bitStringToString; accepts 0, 1, x/X and '_' separators.
BitString bitStringFromString(std::string_view text);
bool isFullyKnown(const BitString& bs);

// A width-checked unsigned magnitude, 0 <= width <= 64.
class Bits {
  public:
    static constexpr uint32_t kMaxWidth = 64;

    Bits() = default;

    static Bits zero(uint32_t width);
    static Bits fromMagnitude(uint32_t width, uint64_t value);
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>,
                               int> = 0>
    static Bits fromMagnitude(uint32_t width, T value) {
        if (value < 0) {
            throw RangeError("negative magnitude " + std::to_string(value) +
                             " for width " + std::to_string(width));
        }
        return fromMagnitude(width, static_cast<uint64_t>(value));
    }
    // Every symbol must be 0 or 1.
    static Bits fromBitString(const BitString& bs);

    uint32_t width() const { return mWidth; }
    uint64_t value() const { return mValue; }
    bool bit(uint32_t idx) const;
    bool any() const { return mValue != 0; }

    BitString bits() const;
    std::string toString() const;

    // Equal-width operations; WidthMismatchError otherwise.
    Bits operator&(const Bits& o) const;
    Bits operator|(const Bits& o) const;
    Bits operator^(const Bits& o) const;
    Bits operator+(const Bits& o) const; // wraps modulo 2^width
    Bits operator-(const Bits& o) const; // wraps modulo 2^width
    Bits operator~() const;
    bool operator==(const Bits& o) const;
    bool operator!=(const Bits& o) const { return !(*this == o); }

    // Shifting by an amount >= width yields zero of the same width.
    Bits shl(uint32_t amount) const;
    Bits shr(uint32_t amount) const;

    // Explicit width-changing combinators.
    static Bits concat(const Bits& hi, const Bits& lo, uint32_t declaredWidth);
    Bits slice(uint32_t msb, uint32_t lsb) const;
    Bits zeroExtend(uint32_t newWidth) const;
    Bits truncate(uint32_t newWidth) const;

    static constexpr uint64_t maskFor(uint32_t width) {
        return width >= 64 ? ~uint64_t{0} : ((uint64_t{1} << width) - 1);
    }

  private:
    Bits(uint32_t width, uint64_t value)
        : mWidth(width)
        , mValue(value) {}

    void requireSameWidth(const Bits& o, const char* op) const;

    uint32_t mWidth = 0;
    uint64_t mValue = 0;
};

} // namespace rtlsim::value
