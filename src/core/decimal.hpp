#pragma once

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace tradeflow {

/**
 * Fixed-point decimal with 8 fractional digits.
 *
 * All capital, price, quantity and fee math goes through this type so that
 * repeated add/subtract is exact. Multiplication and division round half away
 * from zero at the 8th digit.
 */
class Decimal {
public:
    static constexpr int64_t SCALE = 100000000;
    static constexpr int DIGITS = 8;
    // Largest whole number whose scaled value fits the raw representation.
    static constexpr int64_t MAX_WHOLE = std::numeric_limits<int64_t>::max() / SCALE;

    constexpr Decimal() = default;

    static constexpr Decimal from_raw(int64_t raw) {
        Decimal d;
        d.raw_ = raw;
        return d;
    }

    // Throws std::out_of_range past +/-MAX_WHOLE.
    static constexpr Decimal from_int(int64_t v) {
        return (v > MAX_WHOLE || v < -MAX_WHOLE) ? throw std::out_of_range("decimal out of range")
                                                 : from_raw(v * SCALE);
    }

    // Nearest representable value; used for config and test literals.
    // Throws std::out_of_range when the value does not fit.
    static Decimal from_double(double v);

    // Accepts "123", "-0.5", "1.23456789"; more than 8 fractional digits are rounded half-up.
    // Values outside the representable range yield nullopt.
    static std::optional<Decimal> parse(const std::string& s);

    int64_t raw() const { return raw_; }
    double to_double() const { return static_cast<double>(raw_) / static_cast<double>(SCALE); }
    std::string to_string() const;

    bool is_zero() const { return raw_ == 0; }
    bool is_positive() const { return raw_ > 0; }
    bool is_negative() const { return raw_ < 0; }
    Decimal abs() const { return raw_ < 0 ? -*this : *this; }

    // Round half away from zero to a multiple of step.
    Decimal round_to(Decimal step) const;
    // Round toward zero to a multiple of step.
    Decimal floor_to(Decimal step) const;

    // Arithmetic throws std::overflow_error instead of wrapping.
    Decimal operator-() const { return from_raw(checked_sub(0, raw_)); }
    Decimal operator+(Decimal o) const { return from_raw(checked_add(raw_, o.raw_)); }
    Decimal operator-(Decimal o) const { return from_raw(checked_sub(raw_, o.raw_)); }
    Decimal operator*(Decimal o) const;
    Decimal operator/(Decimal o) const;
    Decimal& operator+=(Decimal o) { raw_ = checked_add(raw_, o.raw_); return *this; }
    Decimal& operator-=(Decimal o) { raw_ = checked_sub(raw_, o.raw_); return *this; }

    bool operator==(Decimal o) const { return raw_ == o.raw_; }
    bool operator!=(Decimal o) const { return raw_ != o.raw_; }
    bool operator<(Decimal o) const { return raw_ < o.raw_; }
    bool operator<=(Decimal o) const { return raw_ <= o.raw_; }
    bool operator>(Decimal o) const { return raw_ > o.raw_; }
    bool operator>=(Decimal o) const { return raw_ >= o.raw_; }

private:
    static int64_t checked_add(int64_t a, int64_t b) {
        int64_t r;
        if (__builtin_add_overflow(a, b, &r)) throw std::overflow_error("decimal overflow");
        return r;
    }
    static int64_t checked_sub(int64_t a, int64_t b) {
        int64_t r;
        if (__builtin_sub_overflow(a, b, &r)) throw std::overflow_error("decimal overflow");
        return r;
    }

    int64_t raw_{0};
};

inline Decimal min(Decimal a, Decimal b) { return a < b ? a : b; }
inline Decimal max(Decimal a, Decimal b) { return a < b ? b : a; }

// Percentages are stored as e.g. 5 for 5%.
inline Decimal percent_of(Decimal value, Decimal pct) {
    return value * pct / Decimal::from_int(100);
}

// Persisted as strings so replayed records compare byte-for-byte.
void to_json(nlohmann::json& j, const Decimal& d);
void from_json(const nlohmann::json& j, Decimal& d);

} // namespace tradeflow
