#pragma once

#include "error.hpp"

#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <type_traits>
#include <vector>

namespace bitmask {

/// Identifier type. Signed so that negative ids can be rejected instead of
/// wrapping to a huge shift amount.
using ident_t = int;

/// Encodes sets of small integer identifiers as a single unsigned word.
///
/// Bit i of the word (0-indexed from the LSB) is set iff identifier i is a
/// member of the set, so valid identifiers are [0, width - 1].
///
/// The checked operations (encode / has_bit / toggle_bit) throw
/// InvalidIdentifier for an out-of-range id before any shift is performed.
/// The *_unchecked variants leave range discipline to the caller and only
/// assert in debug builds; shifting by an out-of-range amount is undefined.
///
/// All operations are pure: masks are plain values, never mutated in place.
template <typename Word>
class BitMask {
    static_assert(std::is_integral<Word>::value &&
                      std::is_unsigned<Word>::value &&
                      !std::is_same<Word, bool>::value,
                  "Word must be an unsigned integer type");
    static_assert(std::numeric_limits<Word>::digits <= 64,
                  "Word must be at most 64 bits wide");

  public:
    using word_type = Word;

    // ----- compile-time constants -----
    static constexpr unsigned width = std::numeric_limits<Word>::digits;
    static constexpr ident_t max_id = static_cast<ident_t>(width) - 1;
    static constexpr Word empty = 0;
    static constexpr Word full = std::numeric_limits<Word>::max();

    /// True if id names a bit of the word.
    static constexpr bool is_valid_id(ident_t id) noexcept {
        return id >= 0 && id <= max_id;
    }

    // ----- encode -----

    /// Mask with a bit set for every id in [first, last).
    /// Duplicates are idempotent; an empty range yields 0.
    /// Each id is range-checked in its own type, so a wide value is
    /// rejected rather than truncated to ident_t.
    template <typename InputIt>
    static Word encode(InputIt first, InputIt last) {
        Word mask = empty;
        for (; first != last; ++first)
            mask |= bit(checked_value(*first));
        return mask;
    }

    static Word encode(const std::vector<ident_t> &ids) {
        return encode(ids.begin(), ids.end());
    }

    static Word encode(std::initializer_list<ident_t> ids) {
        return encode(ids.begin(), ids.end());
    }

    /// Unchecked encode, usable in constant expressions.
    /// Values are converted to ident_t as-is; keep them in [0, max_id].
    template <typename InputIt>
    static constexpr Word encode_unchecked(InputIt first,
                                           InputIt last) noexcept {
        Word mask = empty;
        for (; first != last; ++first)
            mask |= bit_unchecked(static_cast<ident_t>(*first));
        return mask;
    }

    static Word encode_unchecked(const std::vector<ident_t> &ids) noexcept {
        return encode_unchecked(ids.begin(), ids.end());
    }

    static constexpr Word
    encode_unchecked(std::initializer_list<ident_t> ids) noexcept {
        return encode_unchecked(ids.begin(), ids.end());
    }

    // ----- decode -----

    /// Ascending list of the bit positions set in mask.
    /// Every bit up to the top of the word is reported, the MSB included.
    static std::vector<ident_t> decode(Word mask) {
        std::vector<ident_t> ids;
        ids.reserve(count(mask));
        uint64_t m = mask;
        while (m != 0) {
            ids.push_back(static_cast<ident_t>(__builtin_ctzll(m)));
            m &= m - 1; // clear lowest set bit
        }
        return ids;
    }

    /// Number of ids in mask.
    static constexpr unsigned count(Word mask) noexcept {
        return static_cast<unsigned>(
            __builtin_popcountll(static_cast<uint64_t>(mask)));
    }

    // ----- point operations -----

    static constexpr bool has_bit(Word mask, ident_t id) {
        return (mask & bit(checked(id))) != 0;
    }

    static constexpr bool has_bit_unchecked(Word mask, ident_t id) noexcept {
        return (mask & bit_unchecked(id)) != 0;
    }

    /// mask with bit id flipped; all other bits unchanged.
    static constexpr Word toggle_bit(Word mask, ident_t id) {
        return static_cast<Word>(mask ^ bit(checked(id)));
    }

    static constexpr Word toggle_bit_unchecked(Word mask, ident_t id) noexcept {
        return static_cast<Word>(mask ^ bit_unchecked(id));
    }

  private:
    static constexpr ident_t checked(ident_t id) {
        if (!is_valid_id(id))
            throw InvalidIdentifier(id, width);
        return id;
    }

    template <typename T> static constexpr ident_t checked_value(T v) {
        static_assert(std::is_integral<T>::value &&
                          !std::is_same<T, bool>::value,
                      "identifiers must be integers");
        if constexpr (std::is_signed<T>::value) {
            if (static_cast<long long>(v) < 0 ||
                static_cast<long long>(v) > max_id)
                throw InvalidIdentifier(v, width);
        } else {
            if (static_cast<unsigned long long>(v) >
                static_cast<unsigned long long>(max_id))
                throw InvalidIdentifier(v, width);
        }
        return static_cast<ident_t>(v);
    }

    static constexpr Word bit(ident_t id) noexcept {
        return static_cast<Word>(Word(1) << static_cast<unsigned>(id));
    }

    static constexpr Word bit_unchecked(ident_t id) noexcept {
        assert(is_valid_id(id));
        return bit(id);
    }
};

using BitMask8 = BitMask<uint8_t>;
using BitMask16 = BitMask<uint16_t>;
using BitMask32 = BitMask<uint32_t>;
using BitMask64 = BitMask<uint64_t>;

// ----- default width: 32 bits -----

/// Mask word used by the free functions below. Valid ids are [0, 31].
using mask_t = uint32_t;
using DefaultMask = BitMask<mask_t>;

inline mask_t encode(const std::vector<ident_t> &ids) {
    return DefaultMask::encode(ids);
}

inline mask_t encode(std::initializer_list<ident_t> ids) {
    return DefaultMask::encode(ids);
}

inline std::vector<ident_t> decode(mask_t mask) {
    return DefaultMask::decode(mask);
}

inline bool has_bit(mask_t mask, ident_t id) {
    return DefaultMask::has_bit(mask, id);
}

inline mask_t toggle_bit(mask_t mask, ident_t id) {
    return DefaultMask::toggle_bit(mask, id);
}

} // namespace bitmask
