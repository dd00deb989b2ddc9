#include "decimal.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tradeflow {

namespace {

using i128 = __int128;

// Divide with rounding half away from zero.
int64_t div_round(i128 num, i128 den) {
    if (den == 0) throw std::domain_error("decimal division by zero");
    i128 q = num / den;
    i128 r = num % den;
    if (r != 0) {
        i128 abs_r = r < 0 ? -r : r;
        i128 abs_d = den < 0 ? -den : den;
        if (abs_r * 2 >= abs_d) {
            bool negative = (num < 0) != (den < 0);
            q += negative ? -1 : 1;
        }
    }
    if (q > std::numeric_limits<int64_t>::max() || q < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("decimal overflow");
    }
    return static_cast<int64_t>(q);
}

} // namespace

Decimal Decimal::from_double(double v) {
    if (!std::isfinite(v)) throw std::invalid_argument("decimal from non-finite double");
    double scaled = v * static_cast<double>(SCALE);
    // 2^63 is exact in a double; anything at or past it would wrap in llround.
    const double limit = std::ldexp(1.0, 63);
    if (scaled >= limit || scaled <= -limit) throw std::out_of_range("decimal out of range");
    return from_raw(static_cast<int64_t>(std::llround(scaled)));
}

std::optional<Decimal> Decimal::parse(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i == s.size()) return std::nullopt;
    bool negative = false;
    if (s[i] == '-' || s[i] == '+') {
        negative = s[i] == '-';
        ++i;
    }
    i128 int_part = 0;
    i128 frac_part = 0;
    int frac_digits = 0;
    bool any_digit = false;
    bool round_up = false;
    for (; i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); ++i) {
        int_part = int_part * 10 + (s[i] - '0');
        if (int_part > std::numeric_limits<int64_t>::max() / SCALE) return std::nullopt;
        any_digit = true;
    }
    if (i < s.size() && s[i] == '.') {
        ++i;
        for (; i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); ++i) {
            any_digit = true;
            if (frac_digits < DIGITS) {
                frac_part = frac_part * 10 + (s[i] - '0');
                ++frac_digits;
            } else if (frac_digits == DIGITS) {
                round_up = (s[i] - '0') >= 5;
                ++frac_digits;
            }
        }
    }
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (!any_digit || i != s.size()) return std::nullopt;
    for (int d = std::min(frac_digits, DIGITS); d < DIGITS; ++d) frac_part *= 10;
    i128 raw = int_part * SCALE + frac_part + (round_up ? 1 : 0);
    if (raw > std::numeric_limits<int64_t>::max()) return std::nullopt;
    return from_raw(static_cast<int64_t>(negative ? -raw : raw));
}

std::string Decimal::to_string() const {
    int64_t v = raw_;
    bool negative = v < 0;
    uint64_t mag = negative ? static_cast<uint64_t>(-(v + 1)) + 1 : static_cast<uint64_t>(v);
    uint64_t ip = mag / SCALE;
    uint64_t fp = mag % SCALE;
    std::string out = negative ? "-" : "";
    out += std::to_string(ip);
    if (fp != 0) {
        std::string frac = std::to_string(fp);
        frac.insert(0, DIGITS - frac.size(), '0');
        while (!frac.empty() && frac.back() == '0') frac.pop_back();
        out += "." + frac;
    }
    return out;
}

Decimal Decimal::operator*(Decimal o) const {
    return from_raw(div_round(static_cast<i128>(raw_) * o.raw_, SCALE));
}

Decimal Decimal::operator/(Decimal o) const {
    return from_raw(div_round(static_cast<i128>(raw_) * SCALE, o.raw_));
}

Decimal Decimal::round_to(Decimal step) const {
    if (step.raw_ <= 0) return *this;
    return from_raw(div_round(raw_, step.raw_) * step.raw_);
}

Decimal Decimal::floor_to(Decimal step) const {
    if (step.raw_ <= 0) return *this;
    return from_raw((raw_ / step.raw_) * step.raw_);
}

void to_json(nlohmann::json& j, const Decimal& d) {
    j = d.to_string();
}

void from_json(const nlohmann::json& j, Decimal& d) {
    if (j.is_string()) {
        auto parsed = Decimal::parse(j.get<std::string>());
        if (!parsed) throw std::invalid_argument("invalid decimal: " + j.get<std::string>());
        d = *parsed;
    } else if (j.is_number_unsigned()) {
        auto v = j.get<uint64_t>();
        if (v > static_cast<uint64_t>(Decimal::MAX_WHOLE)) throw std::out_of_range("decimal out of range");
        d = Decimal::from_int(static_cast<int64_t>(v));
    } else if (j.is_number_integer()) {
        d = Decimal::from_int(j.get<int64_t>());
    } else if (j.is_number()) {
        d = Decimal::from_double(j.get<double>());
    } else {
        throw std::invalid_argument("decimal must be a string or number");
    }
}

} // namespace tradeflow
