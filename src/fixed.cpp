#include "depotpack/fixed.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace depotpack {
namespace {

constexpr std::int64_t kMaxRaw = std::numeric_limits<std::int64_t>::max() / 4;
// Operands of products and quotients stay below 1e6 units so that every
// intermediate fits into 64 bits.
constexpr std::int64_t kMaxMulRaw = 1000000LL * Fixed::kScale;

// Rounds num / den half away from zero. den must be > 0.
std::int64_t div_round(std::int64_t num, std::int64_t den) {
    const bool neg = num < 0;
    const std::uint64_t n = neg ? static_cast<std::uint64_t>(-(num + 1)) + 1u : static_cast<std::uint64_t>(num);
    const std::uint64_t d = static_cast<std::uint64_t>(den);
    std::uint64_t q = n / d;
    const std::uint64_t r = n % d;
    if (r >= d - r) {
        ++q;
    }
    const std::int64_t out = static_cast<std::int64_t>(q);
    return neg ? -out : out;
}

// Computes round(a * b / d) without overflowing for coordinates far beyond
// any depot plot: a * b = a * (b / d) * d + a * (b % d).
std::int64_t mul_div_round(std::int64_t a, std::int64_t b, std::int64_t d) {
    if (std::llabs(a) > kMaxMulRaw || std::llabs(b) > kMaxMulRaw) {
        throw std::overflow_error("Fixed: multiplication out of range");
    }
    const std::int64_t bq = b / d;
    const std::int64_t br = b % d;
    return a * bq + div_round(a * br, d);
}

}  // namespace

Fixed Fixed::from_double(double v) {
    if (!std::isfinite(v) || std::abs(v) > static_cast<double>(kMaxRaw / kScale)) {
        throw std::invalid_argument("Fixed::from_double: value must be finite and in range");
    }
    return from_raw(static_cast<std::int64_t>(std::llround(v * static_cast<double>(kScale))));
}

Fixed Fixed::parse(std::string_view text) {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) {
        --e;
    }
    const std::string s(text.substr(b, e - b));
    if (s.empty()) {
        throw std::invalid_argument("Fixed::parse: empty value");
    }

    size_t i = 0;
    bool neg = false;
    if (s[i] == '+' || s[i] == '-') {
        neg = (s[i] == '-');
        ++i;
    }

    std::int64_t int_part = 0;
    std::int64_t frac_part = 0;
    int frac_digits = 0;
    bool any_digit = false;
    bool in_frac = false;

    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '.' && !in_frac) {
            in_frac = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Fixed::parse: invalid number: " + s);
        }
        any_digit = true;
        const int d = c - '0';
        if (!in_frac) {
            if (int_part > (kMaxRaw / kScale - d) / 10) {
                throw std::overflow_error("Fixed::parse: value out of range: " + s);
            }
            int_part = int_part * 10 + d;
        } else if (frac_digits < kDecimals) {
            frac_part = frac_part * 10 + d;
            ++frac_digits;
        } else if (d != 0) {
            throw std::invalid_argument("Fixed::parse: more than 6 decimals: " + s);
        }
    }
    if (!any_digit) {
        throw std::invalid_argument("Fixed::parse: invalid number: " + s);
    }
    for (; frac_digits < kDecimals; ++frac_digits) {
        frac_part *= 10;
    }

    const std::int64_t raw = int_part * kScale + frac_part;
    return from_raw(neg ? -raw : raw);
}

std::string Fixed::to_string() const {
    const bool neg = raw_ < 0;
    const std::uint64_t mag = neg ? static_cast<std::uint64_t>(-(raw_ + 1)) + 1u : static_cast<std::uint64_t>(raw_);
    const std::uint64_t ip = mag / static_cast<std::uint64_t>(kScale);
    std::uint64_t fp = mag % static_cast<std::uint64_t>(kScale);

    std::string out = neg ? "-" : "";
    out += std::to_string(ip);
    if (fp != 0) {
        std::string frac = std::to_string(fp);
        frac.insert(0, static_cast<size_t>(kDecimals) - frac.size(), '0');
        while (!frac.empty() && frac.back() == '0') {
            frac.pop_back();
        }
        out += '.';
        out += frac;
    }
    return out;
}

Fixed operator*(Fixed l, Fixed r) {
    return Fixed::from_raw(mul_div_round(l.raw_, r.raw_, Fixed::kScale));
}

Fixed operator/(Fixed l, Fixed r) {
    if (r.raw_ == 0) {
        throw std::domain_error("Fixed: division by zero");
    }
    std::int64_t num = l.raw_;
    std::int64_t den = r.raw_;
    if (den < 0) {
        num = -num;
        den = -den;
    }
    if (std::llabs(num) > kMaxMulRaw || den > kMaxMulRaw) {
        throw std::overflow_error("Fixed: division out of range");
    }
    // num * kScale / den, split to stay in range.
    const std::int64_t q = num / den;
    const std::int64_t rem = num % den;
    return Fixed::from_raw(q * Fixed::kScale + div_round(rem * Fixed::kScale, den));
}

Fixed operator/(Fixed l, int k) {
    if (k == 0) {
        throw std::domain_error("Fixed: division by zero");
    }
    std::int64_t num = l.raw_;
    std::int64_t den = k;
    if (den < 0) {
        num = -num;
        den = -den;
    }
    return Fixed::from_raw(div_round(num, den));
}

double ratio(Fixed num, Fixed den) {
    if (den.raw() == 0) {
        throw std::domain_error("ratio: denominator is zero");
    }
    return static_cast<double>(num.raw()) / static_cast<double>(den.raw());
}

std::ostream& operator<<(std::ostream& os, Fixed v) {
    return os << v.to_string();
}

}  // namespace depotpack
