#include "common/decimal.hpp"
#include <stdexcept>
#include <limits>
#include <cctype>

namespace fifo {

namespace {

using int128 = __int128;

int64_t narrow(int128 v) {
    if (v > std::numeric_limits<int64_t>::max() || v < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("Decimal overflow");
    }
    return static_cast<int64_t>(v);
}

// Divide with round-half-to-even
int128 div_half_even(int128 num, int128 den) {
    if (den == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    if (den < 0) {
        num = -num;
        den = -den;
    }

    int128 q = num / den;
    int128 r = num % den;
    if (r == 0) return q;

    int128 twice = (r < 0 ? -r : r) * 2;
    bool negative = num < 0;

    if (twice > den || (twice == den && (q % 2 != 0))) {
        q += negative ? -1 : 1;
    }
    return q;
}

} // namespace

Decimal Decimal::from_int(int64_t units) {
    return Decimal(narrow(static_cast<int128>(units) * SCALE));
}

Decimal Decimal::parse(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        pos++;
    }

    int128 int_part = 0;
    int128 frac_part = 0;
    int frac_digits = 0;
    bool seen_digit = false;
    bool seen_dot = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_dot) {
                throw std::invalid_argument("Malformed decimal: " + text);
            }
            seen_dot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Malformed decimal: " + text);
        }
        seen_digit = true;
        int digit = c - '0';

        if (!seen_dot) {
            int_part = int_part * 10 + digit;
            if (int_part > std::numeric_limits<int64_t>::max() / SCALE) {
                throw std::overflow_error("Decimal overflow: " + text);
            }
        } else if (frac_digits < SCALE_DIGITS) {
            frac_part = frac_part * 10 + digit;
            frac_digits++;
        } else if (digit != 0) {
            throw std::invalid_argument("Decimal exceeds 8 fractional digits: " + text);
        }
    }

    if (!seen_digit) {
        throw std::invalid_argument("Malformed decimal: " + text);
    }

    for (int i = frac_digits; i < SCALE_DIGITS; ++i) {
        frac_part *= 10;
    }

    int128 raw = int_part * SCALE + frac_part;
    return Decimal(narrow(negative ? -raw : raw));
}

std::string Decimal::to_string() const {
    int128 v = raw_;
    bool negative = v < 0;
    if (negative) v = -v;

    auto int_part = static_cast<uint64_t>(v / SCALE);
    auto frac_part = static_cast<uint64_t>(v % SCALE);

    std::string out = negative ? "-" : "";
    out += std::to_string(int_part);

    if (frac_part != 0) {
        std::string frac = std::to_string(frac_part);
        frac.insert(0, SCALE_DIGITS - frac.size(), '0');
        while (!frac.empty() && frac.back() == '0') {
            frac.pop_back();
        }
        out += "." + frac;
    }
    return out;
}

Decimal Decimal::abs() const {
    return raw_ < 0 ? -*this : *this;
}

Decimal Decimal::operator+(const Decimal& o) const {
    return Decimal(narrow(static_cast<int128>(raw_) + o.raw_));
}

Decimal Decimal::operator-(const Decimal& o) const {
    return Decimal(narrow(static_cast<int128>(raw_) - o.raw_));
}

Decimal Decimal::operator-() const {
    return Decimal(narrow(-static_cast<int128>(raw_)));
}

Decimal& Decimal::operator+=(const Decimal& o) {
    *this = *this + o;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& o) {
    *this = *this - o;
    return *this;
}

Decimal Decimal::operator*(const Decimal& o) const {
    int128 product = static_cast<int128>(raw_) * o.raw_;
    return Decimal(narrow(div_half_even(product, SCALE)));
}

Decimal Decimal::mul_div(const Decimal& a, const Decimal& b, const Decimal& c) {
    if (c.raw_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    // (a/S * b/S) / (c/S) * S = a*b / c in raw units
    int128 num = static_cast<int128>(a.raw_) * b.raw_;
    return Decimal(narrow(div_half_even(num, c.raw_)));
}

std::ostream& operator<<(std::ostream& os, const Decimal& d) {
    return os << d.to_string();
}

void to_json(nlohmann::json& j, const Decimal& d) {
    j = d.to_string();
}

void from_json(const nlohmann::json& j, Decimal& d) {
    if (j.is_string()) {
        d = Decimal::parse(j.get<std::string>());
    } else if (j.is_number_integer()) {
        d = Decimal::from_int(j.get<int64_t>());
    } else {
        throw std::invalid_argument("Decimal must be a string or integer in JSON");
    }
}

} // namespace fifo
