#include "rtlsim/value/bits.hpp"

#include <algorithm>
#include <sstream>

namespace rtlsim::value {

char toChar(BitSymbol b) {
    switch (b) {
    case BitSymbol::Zero: return '0';
    case BitSymbol::One: return '1';
    case BitSymbol::Unknown: return 'x';
    }
    return 'x';
}

std::string bitStringToString(const BitString& bs) {
    std::string s;
    s.reserve(bs.size());
    for (auto it = bs.rbegin(); it != bs.rend(); ++it)
        s.push_back(toChar(*it));
    return s;
}

BitString bitStringFromString(std::string_view text) {
    BitString bs;
    bs.reserve(text.size());
    for (auto it = text.rbegin(); it != text.rend(); ++it) {
        switch (*it) {
        case '0': bs.push_back(BitSymbol::Zero); break;
        case '1': bs.push_back(BitSymbol::One); break;
        case 'x':
        case 'X': bs.push_back(BitSymbol::Unknown); break;
        case '_': break;
        default:
            throw RangeError("invalid bit character '" + std::string(1, *it) +
                             "' in \"" + std::string(text) + "\"");
        }
    }
    return bs;
}

bool isFullyKnown(const BitString& bs) {
    return std::none_of(bs.begin(), bs.end(), [](BitSymbol b) {
        return b == BitSymbol::Unknown;
    });
}

static void checkWidth(uint32_t width) {
    if (width > Bits::kMaxWidth) {
        throw RangeError("width " + std::to_string(width) +
                         " exceeds maximum of " +
                         std::to_string(Bits::kMaxWidth));
    }
}

Bits Bits::zero(uint32_t width) {
    checkWidth(width);
    return Bits(width, 0);
}

Bits Bits::fromMagnitude(uint32_t width, uint64_t value) {
    checkWidth(width);
    if ((value & ~maskFor(width)) != 0) {
        throw RangeError("magnitude " + std::to_string(value) +
                         " does not fit in " + std::to_string(width) +
                         " bits");
    }
    return Bits(width, value);
}

Bits Bits::fromBitString(const BitString& bs) {
    checkWidth(static_cast<uint32_t>(bs.size()));
    uint64_t v = 0;
    for (size_t i = 0; i < bs.size(); ++i) {
        switch (bs[i]) {
        case BitSymbol::Zero: break;
        case BitSymbol::One: v |= uint64_t{1} << i; break;
        case BitSymbol::Unknown:
            throw RangeError("bit " + std::to_string(i) + " of \"" +
                             bitStringToString(bs) + "\" is unknown");
        }
    }
    return Bits(static_cast<uint32_t>(bs.size()), v);
}

bool Bits::bit(uint32_t idx) const {
    if (idx >= mWidth) {
        throw RangeError("bit index " + std::to_string(idx) +
                         " out of range for width " + std::to_string(mWidth));
    }
    return ((mValue >> idx) & 1u) != 0;
}

BitString Bits::bits() const {
    BitString bs(mWidth, BitSymbol::Zero);
    for (uint32_t i = 0; i < mWidth; ++i)
        if ((mValue >> i) & 1u) bs[i] = BitSymbol::One;
    return bs;
}

std::string Bits::toString() const {
    std::ostringstream oss;
    oss << mWidth << "'b" << bitStringToString(bits());
    return oss.str();
}

void Bits::requireSameWidth(const Bits& o, const char* op) const {
    if (mWidth != o.mWidth) {
        throw WidthMismatchError(std::string("operator ") + op +
                                 " on widths " + std::to_string(mWidth) +
                                 " and " + std::to_string(o.mWidth));
    }
}

Bits Bits::operator&(const Bits& o) const {
    requireSameWidth(o, "&");
    return Bits(mWidth, mValue & o.mValue);
}
Bits Bits::operator|(const Bits& o) const {
    requireSameWidth(o, "|");
    return Bits(mWidth, mValue | o.mValue);
}
Bits Bits::operator^(const Bits& o) const {
    requireSameWidth(o, "^");
    return Bits(mWidth, mValue ^ o.mValue);
}
Bits Bits::operator+(const Bits& o) const {
    requireSameWidth(o, "+");
    return Bits(mWidth, (mValue + o.mValue) & maskFor(mWidth));
}
Bits Bits::operator-(const Bits& o) const {
    requireSameWidth(o, "-");
    return Bits(mWidth, (mValue - o.mValue) & maskFor(mWidth));
}
Bits Bits::operator~() const { return Bits(mWidth, ~mValue & maskFor(mWidth)); }

bool Bits::operator==(const Bits& o) const {
    requireSameWidth(o, "==");
    return mValue == o.mValue;
}

Bits Bits::shl(uint32_t amount) const {
    if (amount >= mWidth) return Bits(mWidth, 0);
    return Bits(mWidth, (mValue << amount) & maskFor(mWidth));
}
Bits Bits::shr(uint32_t amount) const {
    if (amount >= mWidth) return Bits(mWidth, 0);
    return Bits(mWidth, mValue >> amount);
}

Bits Bits::concat(const Bits& hi, const Bits& lo, uint32_t declaredWidth) {
    const uint32_t actual = hi.mWidth + lo.mWidth;
    if (declaredWidth != actual) {
        throw WidthMismatchError(
          "concat of widths " + std::to_string(hi.mWidth) + " and " +
          std::to_string(lo.mWidth) + " declared as " +
          std::to_string(declaredWidth) + ", actual " + std::to_string(actual));
    }
    checkWidth(actual);
    uint64_t v = lo.mWidth >= 64 ? lo.mValue : (hi.mValue << lo.mWidth);
    if (lo.mWidth < 64) v |= lo.mValue;
    return Bits(actual, v);
}

Bits Bits::slice(uint32_t msb, uint32_t lsb) const {
    if (msb < lsb || msb >= mWidth) {
        throw RangeError("slice [" + std::to_string(msb) + ":" +
                         std::to_string(lsb) + "] out of range for width " +
                         std::to_string(mWidth));
    }
    const uint32_t w = msb - lsb + 1;
    return Bits(w, (mValue >> lsb) & maskFor(w));
}

Bits Bits::zeroExtend(uint32_t newWidth) const {
    checkWidth(newWidth);
    if (newWidth < mWidth) {
        throw RangeError("zeroExtend from " + std::to_string(mWidth) +
                         " to narrower width " + std::to_string(newWidth));
    }
    return Bits(newWidth, mValue);
}

Bits Bits::truncate(uint32_t newWidth) const {
    if (newWidth > mWidth) {
        throw RangeError("truncate from " + std::to_string(mWidth) +
                         " to wider width " + std::to_string(newWidth));
    }
    return Bits(newWidth, mValue & maskFor(newWidth));
}

} // namespace rtlsim::value
