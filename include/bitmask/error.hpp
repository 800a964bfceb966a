#pragma once

#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace bitmask {

/// Thrown by the checked BitMask operations when an identifier does not
/// name a bit of the mask word, i.e. id < 0 or id >= width.
///
/// The identifier may come from any integral type; what() always shows the
/// value as the caller passed it.
class InvalidIdentifier : public std::out_of_range {
  public:
    template <typename T>
    InvalidIdentifier(T id, unsigned width)
        : std::out_of_range(make_message(std::to_string(id), width)),
          id_(saturate(id)), width_(width) {
        static_assert(std::is_integral<T>::value,
                      "identifier must be an integral value");
    }

    /// The rejected identifier. Unsigned values above LLONG_MAX saturate.
    long long id() const noexcept { return id_; }

    /// Bit width of the mask the identifier was checked against.
    unsigned width() const noexcept { return width_; }

  private:
    static std::string make_message(const std::string &id, unsigned width) {
        return "bitmask: identifier " + id + " out of range [0, " +
               std::to_string(width - 1) + "]";
    }

    template <typename T> static long long saturate(T id) noexcept {
        if constexpr (std::is_unsigned<T>::value) {
            constexpr auto limit = static_cast<unsigned long long>(
                std::numeric_limits<long long>::max());
            if (static_cast<unsigned long long>(id) > limit)
                return std::numeric_limits<long long>::max();
        }
        return static_cast<long long>(id);
    }

    long long id_;
    unsigned width_;
};

} // namespace bitmask
