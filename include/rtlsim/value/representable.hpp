#pragma once
// Representable contract: which value types may cross into circuit ports and
// state. A specialization of Representable<T> provides
//   static constexpr uint32_t kWidth;
//   static void append(const T&, BitString& out);      // LSB-first
//   static T read(const BitString& in, size_t& pos);   // consumes kWidth
//   static T reset();                                  // canonical instance
// and optionally fields() listing top-level field widths. Products place
// their first component in the lowest bits. Tagged unions (std::variant) lay
// out the payload first, padded with unknown bits, then the discriminant.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "rtlsim/value/bit_vector.hpp"
#include "rtlsim/value/bits.hpp"

namespace rtlsim::value {

template <typename T, typename Enable = void>
struct Representable;

template <typename T, typename = void>
struct IsRepresentable : std::false_type {};
template <typename T>
struct IsRepresentable<T, std::void_t<decltype(Representable<T>::kWidth)>>
    : std::true_type {};

template <typename T>
inline constexpr bool isRepresentable = IsRepresentable<T>::value;

template <typename T>
inline constexpr uint32_t widthOf = Representable<T>::kWidth;

constexpr uint32_t ceilLog2(size_t n) {
    uint32_t w = 0;
    while ((size_t{1} << w) < n)
        ++w;
    return w;
}

namespace detail {
inline bool readBit(const BitString& in, size_t& pos) {
    if (pos >= in.size()) {
        throw WidthMismatchError("bit string too short: need bit " +
                                 std::to_string(pos) + " of " +
                                 std::to_string(in.size()));
    }
    switch (in[pos++]) {
    case BitSymbol::Zero: return false;
    case BitSymbol::One: return true;
    case BitSymbol::Unknown: break;
    }
    throw RangeError("cannot decode unknown bit at position " +
                     std::to_string(pos - 1));
}

inline uint64_t readMagnitude(const BitString& in, size_t& pos,
                              uint32_t width) {
    uint64_t v = 0;
    for (uint32_t i = 0; i < width; ++i)
        if (readBit(in, pos)) v |= uint64_t{1} << i;
    return v;
}

inline void appendMagnitude(uint64_t v, uint32_t width, BitString& out) {
    for (uint32_t i = 0; i < width; ++i)
        out.push_back(((v >> i) & 1u) ? BitSymbol::One : BitSymbol::Zero);
}

template <typename T, typename = void>
struct HasFields : std::false_type {};
template <typename T>
struct HasFields<T, std::void_t<decltype(Representable<T>::fields())>>
    : std::true_type {};
} // namespace detail

template <>
struct Representable<bool> {
    static constexpr uint32_t kWidth = 1;
    static void append(bool v, BitString& out) {
        out.push_back(v ? BitSymbol::One : BitSymbol::Zero);
    }
    static bool read(const BitString& in, size_t& pos) {
        return detail::readBit(in, pos);
    }
    static bool reset() { return false; }
};

template <uint32_t W>
struct Representable<BitVector<W>> {
    static constexpr uint32_t kWidth = W;
    static void append(const BitVector<W>& v, BitString& out) {
        detail::appendMagnitude(v.value(), W, out);
    }
    static BitVector<W> read(const BitString& in, size_t& pos) {
        return BitVector<W>::fromMagnitude(detail::readMagnitude(in, pos, W));
    }
    static BitVector<W> reset() { return BitVector<W>::reset(); }
};

template <typename A, typename B>
struct Representable<std::pair<A, B>,
                     std::enable_if_t<isRepresentable<A> && isRepresentable<B>>> {
    static constexpr uint32_t kWidth = widthOf<A> + widthOf<B>;
    static void append(const std::pair<A, B>& v, BitString& out) {
        Representable<A>::append(v.first, out);
        Representable<B>::append(v.second, out);
    }
    static std::pair<A, B> read(const BitString& in, size_t& pos) {
        A a = Representable<A>::read(in, pos);
        B b = Representable<B>::read(in, pos);
        return {std::move(a), std::move(b)};
    }
    static std::pair<A, B> reset() {
        return {Representable<A>::reset(), Representable<B>::reset()};
    }
    static std::vector<uint32_t> fields() { return {widthOf<A>, widthOf<B>}; }
};

template <typename... Ts>
struct Representable<std::tuple<Ts...>,
                     std::enable_if_t<(isRepresentable<Ts> && ...)>> {
    static constexpr uint32_t kWidth = (0u + ... + widthOf<Ts>);
    static void append(const std::tuple<Ts...>& v, BitString& out) {
        std::apply(
          [&](const auto&... parts) {
              (Representable<std::decay_t<decltype(parts)>>::append(parts, out),
               ...);
          },
          v);
    }
    static std::tuple<Ts...> read(const BitString& in, size_t& pos) {
        // Braced initialization evaluates left to right.
        return std::tuple<Ts...>{Representable<Ts>::read(in, pos)...};
    }
    static std::tuple<Ts...> reset() {
        return std::tuple<Ts...>{Representable<Ts>::reset()...};
    }
    static std::vector<uint32_t> fields() { return {widthOf<Ts>...}; }
};

template <typename T, size_t N>
struct Representable<std::array<T, N>, std::enable_if_t<isRepresentable<T>>> {
    static constexpr uint32_t kWidth = static_cast<uint32_t>(N) * widthOf<T>;
    static void append(const std::array<T, N>& v, BitString& out) {
        for (const auto& e : v)
            Representable<T>::append(e, out);
    }
    static std::array<T, N> read(const BitString& in, size_t& pos) {
        std::array<T, N> r;
        for (auto& e : r)
            e = Representable<T>::read(in, pos);
        return r;
    }
    static std::array<T, N> reset() {
        std::array<T, N> r;
        r.fill(Representable<T>::reset());
        return r;
    }
    static std::vector<uint32_t> fields() {
        return std::vector<uint32_t>(N, widthOf<T>);
    }
};

template <typename... Ts>
struct Representable<std::variant<Ts...>,
                     std::enable_if_t<(isRepresentable<Ts> && ...)>> {
    using T = std::variant<Ts...>;
    static constexpr uint32_t kDiscriminantWidth = ceilLog2(sizeof...(Ts));
    static constexpr uint32_t kPayloadWidth = std::max({0u, widthOf<Ts>...});
    static constexpr uint32_t kWidth = kDiscriminantWidth + kPayloadWidth;

    static void append(const T& v, BitString& out) {
        const size_t start = out.size();
        std::visit(
          [&](const auto& alt) {
              Representable<std::decay_t<decltype(alt)>>::append(alt, out);
          },
          v);
        out.resize(start + kPayloadWidth, BitSymbol::Unknown);
        detail::appendMagnitude(v.index(), kDiscriminantWidth, out);
    }
    static T read(const BitString& in, size_t& pos) {
        const size_t payload = pos;
        size_t discPos = pos + kPayloadWidth;
        const uint64_t idx =
          detail::readMagnitude(in, discPos, kDiscriminantWidth);
        if (idx >= sizeof...(Ts)) {
            throw RangeError("variant discriminant " + std::to_string(idx) +
                             " out of range for " +
                             std::to_string(sizeof...(Ts)) + " alternatives");
        }
        pos = discPos;
        return readAt(static_cast<size_t>(idx), in, payload,
                      std::index_sequence_for<Ts...>{});
    }
    static T reset() {
        using First = std::variant_alternative_t<0, T>;
        return T(std::in_place_index<0>, Representable<First>::reset());
    }

  private:
    template <size_t I>
    static T readAlt(const BitString& in, size_t pos) {
        using Alt = std::variant_alternative_t<I, T>;
        return T(std::in_place_index<I>, Representable<Alt>::read(in, pos));
    }
    template <size_t... Is>
    static T readAt(size_t idx, const BitString& in, size_t pos,
                    std::index_sequence<Is...>) {
        using Reader = T (*)(const BitString&, size_t);
        static constexpr Reader kReaders[] = {&readAlt<Is>...};
        return kReaders[idx](in, pos);
    }
};

// Encode v as exactly widthOf<T> symbols.
template <typename T>
BitString toBitString(const T& v) {
    static_assert(isRepresentable<T>, "type is not Representable");
    BitString out;
    out.reserve(widthOf<T>);
    Representable<T>::append(v, out);
    return out;
}

// WidthMismatchError unless bs has exactly widthOf<T> symbols; RangeError on
// unknown bits that the decoding has to read.
template <typename T>
T fromBitString(const BitString& bs) {
    static_assert(isRepresentable<T>, "type is not Representable");
    if (bs.size() != widthOf<T>) {
        throw WidthMismatchError("expected " + std::to_string(widthOf<T>) +
                                 " bits, got " + std::to_string(bs.size()));
    }
    size_t pos = 0;
    return Representable<T>::read(bs, pos);
}

template <typename T>
T resetValue() {
    static_assert(isRepresentable<T>, "type is not Representable");
    return Representable<T>::reset();
}

// Top-level field widths; a non-product type is a single field.
template <typename T>
std::vector<uint32_t> fieldWidths() {
    if constexpr (detail::HasFields<T>::value) {
        return Representable<T>::fields();
    } else {
        return {widthOf<T>};
    }
}

} // namespace rtlsim::value
