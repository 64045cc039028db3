#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <nlohmann/json.hpp>

namespace fifo {

/**
 * Exact signed fixed-point decimal with 8 fractional digits.
 *
 * Quantities, prices and fees are carried in raw units of 1e-8 so that
 * sums are exact and results are reproducible across runs. Only
 * multiplication and division round, always half-to-even at the 8th
 * fractional digit.
 */
class Decimal {
public:
    static constexpr int SCALE_DIGITS = 8;
    static constexpr int64_t SCALE = 100000000LL;

    constexpr Decimal() = default;

    static constexpr Decimal from_raw(int64_t raw) { return Decimal(raw); }
    static Decimal from_int(int64_t units);

    // Throws std::invalid_argument on malformed text or more than
    // 8 significant fractional digits.
    static Decimal parse(const std::string& text);

    constexpr int64_t raw() const { return raw_; }

    std::string to_string() const;
    double to_double() const { return static_cast<double>(raw_) / SCALE; }

    bool is_zero() const { return raw_ == 0; }
    bool is_negative() const { return raw_ < 0; }
    bool is_positive() const { return raw_ > 0; }
    Decimal abs() const;

    Decimal operator+(const Decimal& o) const;
    Decimal operator-(const Decimal& o) const;
    Decimal operator-() const;
    Decimal& operator+=(const Decimal& o);
    Decimal& operator-=(const Decimal& o);

    // Rounded half-to-even
    Decimal operator*(const Decimal& o) const;

    // a * b / c computed with a 128-bit intermediate, rounded half-to-even.
    static Decimal mul_div(const Decimal& a, const Decimal& b, const Decimal& c);

    bool operator==(const Decimal& o) const { return raw_ == o.raw_; }
    bool operator!=(const Decimal& o) const { return raw_ != o.raw_; }
    bool operator<(const Decimal& o) const { return raw_ < o.raw_; }
    bool operator<=(const Decimal& o) const { return raw_ <= o.raw_; }
    bool operator>(const Decimal& o) const { return raw_ > o.raw_; }
    bool operator>=(const Decimal& o) const { return raw_ >= o.raw_; }

private:
    constexpr explicit Decimal(int64_t raw) : raw_(raw) {}

    int64_t raw_{0};
};

inline Decimal min(const Decimal& a, const Decimal& b) {
    return a < b ? a : b;
}

std::ostream& operator<<(std::ostream& os, const Decimal& d);

void to_json(nlohmann::json& j, const Decimal& d);
void from_json(const nlohmann::json& j, Decimal& d);

} // namespace fifo
