#include "decimal.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

using Integer = Decimal::Integer;
using Rational = Decimal::Rational;

Integer pow10_integer(unsigned exponent) {
    return boost::multiprecision::pow(Integer(10), exponent);
}

// Quotient of non-negative a / positive b, ties to even
Integer divide_half_even(const Integer& a, const Integer& b) {
    Integer quotient = a / b;
    Integer twice_remainder = (a % b) * 2;
    if (twice_remainder > b || (twice_remainder == b && quotient % 2 != 0)) {
        quotient += 1;
    }
    return quotient;
}

// Quotient of non-negative a / positive b, ties away from zero
Integer divide_half_up(const Integer& a, const Integer& b) {
    Integer quotient = a / b;
    if ((a % b) * 2 >= b) {
        quotient += 1;
    }
    return quotient;
}

// scaled / 10^scale rendered with exactly `scale` fractional digits
std::string format_scaled(const Integer& scaled, int scale, bool negative) {
    std::string digits = scaled.str();
    if (scale > 0) {
        if (digits.size() <= static_cast<std::size_t>(scale)) {
            digits.insert(0, static_cast<std::size_t>(scale) + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - static_cast<std::size_t>(scale), 1, '.');
    }
    if (negative && scaled != 0) {
        digits.insert(0, 1, '-');
    }
    return digits;
}

}  // namespace

Decimal::Decimal(long long value) : value_(value) {}

Decimal::Decimal(const Integer& value) : value_(value) {}

Decimal::Decimal(const Rational& value) : value_(value) {}

Decimal Decimal::parse(const std::string& text) {
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    Integer mantissa = 0;
    int scale = 0;
    int digit_count = 0;
    bool seen_point = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            mantissa = mantissa * 10 + (c - '0');
            ++digit_count;
            if (seen_point) {
                ++scale;
            }
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }
    if (digit_count == 0) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }

    int exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool negative_exponent = false;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            negative_exponent = text[pos] == '-';
            ++pos;
        }
        int exponent_digits = 0;
        for (; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos) {
            exponent = exponent * 10 + (text[pos] - '0');
            if (++exponent_digits > 4) {
                throw std::invalid_argument("Decimal exponent out of range: '" + text + "'");
            }
        }
        if (exponent_digits == 0) {
            throw std::invalid_argument("Invalid decimal exponent: '" + text + "'");
        }
        if (negative_exponent) {
            exponent = -exponent;
        }
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }

    Decimal result(negative ? Integer(-mantissa) : mantissa);
    return result * pow10(exponent - scale);
}

Decimal Decimal::pow10(int exponent) {
    if (exponent >= 0) {
        return Decimal(pow10_integer(static_cast<unsigned>(exponent)));
    }
    return Decimal(Rational(1) / Rational(pow10_integer(static_cast<unsigned>(-exponent))));
}

std::string Decimal::to_string() const {
    Integer num = boost::multiprecision::numerator(value_);
    Integer den = boost::multiprecision::denominator(value_);
    bool negative = num < 0;
    if (negative) {
        num = -num;
    }

    // A terminating expansion needs max(twos, fives) fractional digits
    Integer rest = den;
    int twos = 0;
    int fives = 0;
    while (rest % 2 == 0) {
        rest /= 2;
        ++twos;
    }
    while (rest % 5 == 0) {
        rest /= 5;
        ++fives;
    }

    if (rest == 1) {
        int scale = std::max(twos, fives);
        Integer scaled = num * pow10_integer(static_cast<unsigned>(scale)) / den;
        return format_scaled(scaled, scale, negative);
    }

    Integer scaled = divide_half_even(num * pow10_integer(kMaxFractionDigits), den);
    int scale = kMaxFractionDigits;
    while (scale > 0 && scaled % 10 == 0) {
        scaled /= 10;
        --scale;
    }
    return format_scaled(scaled, scale, negative);
}

std::string Decimal::to_fixed(int places) const {
    if (places < 0) {
        throw std::invalid_argument("Decimal places cannot be negative");
    }
    Integer num = boost::multiprecision::numerator(value_);
    Integer den = boost::multiprecision::denominator(value_);
    bool negative = num < 0;
    if (negative) {
        num = -num;
    }
    Integer scaled = divide_half_up(num * pow10_integer(static_cast<unsigned>(places)), den);
    return format_scaled(scaled, places, negative);
}

bool Decimal::is_zero() const {
    return value_ == 0;
}

bool Decimal::is_integer() const {
    return boost::multiprecision::denominator(value_) == 1;
}

bool Decimal::is_terminating() const {
    Integer rest = boost::multiprecision::denominator(value_);
    while (rest % 2 == 0) {
        rest /= 2;
    }
    while (rest % 5 == 0) {
        rest /= 5;
    }
    return rest == 1;
}

int Decimal::sign() const {
    if (value_ > 0) {
        return 1;
    }
    if (value_ < 0) {
        return -1;
    }
    return 0;
}

Decimal Decimal::abs() const {
    return value_ < 0 ? -*this : *this;
}

Decimal Decimal::floor() const {
    Integer num = boost::multiprecision::numerator(value_);
    Integer den = boost::multiprecision::denominator(value_);
    // Integer division truncates toward zero
    Integer quotient = num / den;
    if (num < 0 && num % den != 0) {
        quotient -= 1;
    }
    return Decimal(quotient);
}

Decimal Decimal::ceil() const {
    return -(-*this).floor();
}

Decimal Decimal::operator-() const {
    return Decimal(Rational(-value_));
}

Decimal& Decimal::operator+=(const Decimal& other) {
    value_ += other.value_;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    value_ -= other.value_;
    return *this;
}

Decimal& Decimal::operator*=(const Decimal& other) {
    value_ *= other.value_;
    return *this;
}

Decimal& Decimal::operator/=(const Decimal& other) {
    if (other.value_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    value_ /= other.value_;
    return *this;
}
