#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace depotpack {

// Exact decimal scalar stored as an integer count of micro-units (1e-6).
//
// Sums, differences, comparisons and integer scaling are exact. Products and
// quotients of two values are rounded half away from zero to the nearest
// micro-unit, which keeps every derived coordinate reproducible across runs.
class Fixed {
public:
    static constexpr std::int64_t kScale = 1000000;
    static constexpr int kDecimals = 6;

    constexpr Fixed() = default;
    constexpr Fixed(int v) : raw_(static_cast<std::int64_t>(v) * kScale) {}
    Fixed(double) = delete;

    static constexpr Fixed from_raw(std::int64_t raw) {
        Fixed f;
        f.raw_ = raw;
        return f;
    }
    static Fixed from_double(double v);

    // Parses decimal text such as "12.5", "-0.25" or "3". More than kDecimals
    // significant fractional digits are rejected.
    static Fixed parse(std::string_view text);

    constexpr std::int64_t raw() const { return raw_; }
    double to_double() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }

    // Shortest decimal representation ("2.55", "10", "-0.5").
    std::string to_string() const;

    constexpr Fixed operator-() const { return from_raw(-raw_); }

    Fixed& operator+=(Fixed o) {
        raw_ += o.raw_;
        return *this;
    }
    Fixed& operator-=(Fixed o) {
        raw_ -= o.raw_;
        return *this;
    }

    friend constexpr Fixed operator+(Fixed l, Fixed r) { return from_raw(l.raw_ + r.raw_); }
    friend constexpr Fixed operator-(Fixed l, Fixed r) { return from_raw(l.raw_ - r.raw_); }
    friend constexpr Fixed operator*(Fixed l, int k) { return from_raw(l.raw_ * k); }
    friend constexpr Fixed operator*(int k, Fixed r) { return from_raw(r.raw_ * k); }
    friend Fixed operator*(Fixed l, Fixed r);
    friend Fixed operator/(Fixed l, Fixed r);
    friend Fixed operator/(Fixed l, int k);

    friend constexpr bool operator==(Fixed l, Fixed r) { return l.raw_ == r.raw_; }
    friend constexpr bool operator!=(Fixed l, Fixed r) { return l.raw_ != r.raw_; }
    friend constexpr bool operator<(Fixed l, Fixed r) { return l.raw_ < r.raw_; }
    friend constexpr bool operator<=(Fixed l, Fixed r) { return l.raw_ <= r.raw_; }
    friend constexpr bool operator>(Fixed l, Fixed r) { return l.raw_ > r.raw_; }
    friend constexpr bool operator>=(Fixed l, Fixed r) { return l.raw_ >= r.raw_; }

private:
    std::int64_t raw_ = 0;
};

// Ratio of two values as double (reporting only, e.g. utilization rates).
double ratio(Fixed num, Fixed den);

std::ostream& operator<<(std::ostream& os, Fixed v);

}  // namespace depotpack
