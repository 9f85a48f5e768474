#include "stockledger/decimal.hpp"
#include "stockledger/errors.hpp"
#include <cctype>
#include <cmath>
#include <limits>

namespace stockledger {

namespace {

using wide = __int128;

// Divide rounding half away from zero.
int64_t div_round(wide numerator, wide denominator) {
    bool negative = (numerator < 0) != (denominator < 0);
    wide n = numerator < 0 ? -numerator : numerator;
    wide d = denominator < 0 ? -denominator : denominator;
    wide q = n / d;
    wide r = n % d;
    if (r * 2 >= d) ++q;
    if (q > std::numeric_limits<int64_t>::max()) {
        throw ValidationError("decimal overflow");
    }
    return static_cast<int64_t>(negative ? -q : q);
}

int64_t checked_add(int64_t a, int64_t b) {
    int64_t out;
    if (__builtin_add_overflow(a, b, &out)) throw ValidationError("decimal overflow");
    return out;
}

int64_t checked_sub(int64_t a, int64_t b) {
    int64_t out;
    if (__builtin_sub_overflow(a, b, &out)) throw ValidationError("decimal overflow");
    return out;
}

int64_t checked_mul(int64_t a, int64_t b) {
    int64_t out;
    if (__builtin_mul_overflow(a, b, &out)) throw ValidationError("decimal overflow");
    return out;
}

} // anonymous namespace

Decimal Decimal::parse(const std::string& text) {
    if (text.empty()) throw ValidationError("empty decimal");

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    wide whole = 0;
    int64_t fraction = 0;
    int fraction_digits = 0;
    bool seen_digit = false;
    bool seen_point = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_point) throw ValidationError("malformed decimal: " + text);
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ValidationError("malformed decimal: " + text);
        }
        seen_digit = true;
        int digit = c - '0';
        if (seen_point) {
            if (++fraction_digits > kScale) {
                throw ValidationError("too many fractional digits: " + text);
            }
            fraction = fraction * 10 + digit;
        } else {
            whole = whole * 10 + digit;
            if (whole > std::numeric_limits<int64_t>::max() / kFactor) {
                throw ValidationError("decimal overflow: " + text);
            }
        }
    }
    if (!seen_digit) throw ValidationError("malformed decimal: " + text);

    for (int i = fraction_digits; i < kScale; ++i) fraction *= 10;
    wide scaled = whole * kFactor + fraction;
    if (scaled > std::numeric_limits<int64_t>::max()) {
        throw ValidationError("decimal overflow: " + text);
    }
    return Decimal(static_cast<int64_t>(negative ? -scaled : scaled));
}

Decimal Decimal::from_units(int64_t units) {
    return Decimal(checked_mul(units, kFactor));
}

Decimal Decimal::from_double(double value) {
    if (!std::isfinite(value)) throw ValidationError("decimal from non-finite value");
    double scaled = std::round(value * kFactor);
    if (std::fabs(scaled) >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        throw ValidationError("decimal overflow");
    }
    return Decimal(static_cast<int64_t>(scaled));
}

std::string Decimal::to_string() const {
    // Widen before negating so INT64_MIN does not overflow.
    wide magnitude = scaled_ < 0 ? -static_cast<wide>(scaled_) : static_cast<wide>(scaled_);
    auto whole = static_cast<uint64_t>(magnitude / kFactor);
    auto fraction = static_cast<int64_t>(magnitude % kFactor);

    std::string out = scaled_ < 0 ? "-" : "";
    out += std::to_string(whole);
    if (fraction != 0) {
        std::string digits = std::to_string(fraction);
        digits.insert(0, kScale - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out += "." + digits;
    }
    return out;
}

Decimal Decimal::round_units() const {
    return Decimal(checked_mul(div_round(scaled_, kFactor), kFactor));
}

Decimal Decimal::abs() const {
    return scaled_ < 0 ? -*this : *this;
}

Decimal Decimal::operator-() const {
    return Decimal(checked_sub(0, scaled_));
}

Decimal Decimal::operator+(const Decimal& other) const {
    return Decimal(checked_add(scaled_, other.scaled_));
}

Decimal Decimal::operator-(const Decimal& other) const {
    return Decimal(checked_sub(scaled_, other.scaled_));
}

Decimal Decimal::operator*(const Decimal& other) const {
    return Decimal(div_round(static_cast<wide>(scaled_) * other.scaled_, kFactor));
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.scaled_ == 0) throw ValidationError("division by zero");
    return Decimal(div_round(static_cast<wide>(scaled_) * kFactor, other.scaled_));
}

} // namespace stockledger
