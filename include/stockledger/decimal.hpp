#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace stockledger {

/**
 * Signed fixed-point decimal with four fractional digits.
 *
 * Quantities and money never pass through binary floating point: the value
 * 3.5 is held as the integer 35000. Multiplication and division round half
 * away from zero using 128-bit intermediates. Every operation that would leave
 * the int64 range throws ValidationError("decimal overflow").
 */
class Decimal {
public:
    static constexpr int kScale = 4;
    static constexpr int64_t kFactor = 10000;

    constexpr Decimal() = default;

    /// Build from the raw scaled representation (35000 == 3.5).
    static constexpr Decimal from_scaled(int64_t scaled) { return Decimal(scaled); }

    /// Build from a whole number of units. Throws ValidationError on overflow.
    static Decimal from_units(int64_t units);

    /**
     * Parse a plain decimal string such as "12", "-0.25" or "3.5000".
     * Throws ValidationError on malformed input or more than four fractional digits.
     */
    static Decimal parse(const std::string& text);

    /// Nearest representable value, rounding half away from zero.
    static Decimal from_double(double value);

    static constexpr Decimal zero() { return Decimal(0); }

    constexpr int64_t scaled() const { return scaled_; }
    double to_double() const { return static_cast<double>(scaled_) / kFactor; }

    /// Shortest exact rendering: "3.5", "20", "-0.0125".
    std::string to_string() const;

    constexpr bool is_zero() const { return scaled_ == 0; }
    constexpr bool is_negative() const { return scaled_ < 0; }
    constexpr bool is_positive() const { return scaled_ > 0; }

    Decimal abs() const;

    /// Round to whole units, half away from zero.
    Decimal round_units() const;

    Decimal operator-() const;
    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;

    /// Throws ValidationError when dividing by zero.
    Decimal operator/(const Decimal& other) const;

    Decimal& operator+=(const Decimal& other) { return *this = *this + other; }
    Decimal& operator-=(const Decimal& other) { return *this = *this - other; }

    constexpr bool operator==(const Decimal& other) const { return scaled_ == other.scaled_; }
    constexpr bool operator!=(const Decimal& other) const { return scaled_ != other.scaled_; }
    constexpr bool operator<(const Decimal& other) const { return scaled_ < other.scaled_; }
    constexpr bool operator<=(const Decimal& other) const { return scaled_ <= other.scaled_; }
    constexpr bool operator>(const Decimal& other) const { return scaled_ > other.scaled_; }
    constexpr bool operator>=(const Decimal& other) const { return scaled_ >= other.scaled_; }

private:
    explicit constexpr Decimal(int64_t scaled) : scaled_(scaled) {}

    int64_t scaled_ = 0;
};

inline Decimal min(const Decimal& a, const Decimal& b) { return b < a ? b : a; }
inline Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

} // namespace stockledger
