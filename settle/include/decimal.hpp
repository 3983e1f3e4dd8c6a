#pragma once

#include <string>
#include <ostream>
#include <boost/multiprecision/cpp_int.hpp>

// Exact decimal value backed by an arbitrary-precision rational.
// Quotients are kept exact; rounding only happens when a caller asks for it.
class Decimal {
public:
    using Integer = boost::multiprecision::cpp_int;
    using Rational = boost::multiprecision::cpp_rational;

    // Fractional digits printed for values with a non-terminating expansion
    static constexpr int kMaxFractionDigits = 10;

    Decimal() = default;
    Decimal(long long value);
    explicit Decimal(const Integer& value);
    explicit Decimal(const Rational& value);

    // Parses "-12", "12.340", ".5", "1e-2". Throws std::invalid_argument.
    static Decimal parse(const std::string& text);

    // 10^exponent, exponent may be negative
    static Decimal pow10(int exponent);

    // Shortest exact form ("13.2", "-0.05", "1000"). Non-terminating values
    // are rounded half-even to kMaxFractionDigits.
    std::string to_string() const;

    // Fixed number of fractional digits, ties away from zero
    std::string to_fixed(int places) const;

    bool is_zero() const;
    bool is_integer() const;
    bool is_terminating() const;
    int sign() const;

    Decimal abs() const;
    Decimal floor() const;
    Decimal ceil() const;

    const Rational& rational() const { return value_; }

    Decimal operator-() const;
    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);
    Decimal& operator*=(const Decimal& other);
    // Throws std::domain_error on a zero divisor
    Decimal& operator/=(const Decimal& other);

    friend Decimal operator+(Decimal lhs, const Decimal& rhs) { return lhs += rhs; }
    friend Decimal operator-(Decimal lhs, const Decimal& rhs) { return lhs -= rhs; }
    friend Decimal operator*(Decimal lhs, const Decimal& rhs) { return lhs *= rhs; }
    friend Decimal operator/(Decimal lhs, const Decimal& rhs) { return lhs /= rhs; }

    friend bool operator==(const Decimal& lhs, const Decimal& rhs) { return lhs.value_ == rhs.value_; }
    friend bool operator!=(const Decimal& lhs, const Decimal& rhs) { return lhs.value_ != rhs.value_; }
    friend bool operator<(const Decimal& lhs, const Decimal& rhs) { return lhs.value_ < rhs.value_; }
    friend bool operator<=(const Decimal& lhs, const Decimal& rhs) { return lhs.value_ <= rhs.value_; }
    friend bool operator>(const Decimal& lhs, const Decimal& rhs) { return lhs.value_ > rhs.value_; }
    friend bool operator>=(const Decimal& lhs, const Decimal& rhs) { return lhs.value_ >= rhs.value_; }

    friend std::ostream& operator<<(std::ostream& os, const Decimal& value) {
        return os << value.to_string();
    }

private:
    Rational value_;
};
