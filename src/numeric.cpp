#include "symalg/numeric.hpp"
#include "symalg/errors.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace symalg {

namespace {
constexpr long long kMax = std::numeric_limits<long long>::max();
constexpr long long kMin = std::numeric_limits<long long>::min();

bool addOverflows(long long a, long long b) {
    return (b > 0 && a > kMax - b) || (b < 0 && a < kMin - b);
}

bool subOverflows(long long a, long long b) {
    return (b < 0 && a > kMax + b) || (b > 0 && a < kMin + b);
}

bool mulOverflows(long long a, long long b) {
    if (a > 0) {
        return b > 0 ? a > kMax / b : b < kMin / a;
    }
    if (b > 0) {
        return a < kMin / b;
    }
    return a != 0 && b < kMax / a;
}

// Вещественный результат свёртки; NaN не сворачивается
std::optional<Numeric> realResult(double result) {
    if (std::isnan(result)) {
        return std::nullopt;
    }
    return Numeric(result);
}

// Причина, по которой степень не вычисляется, или nullptr
const char* powerFailure(double base, double exponent) {
    if (base == 0.0 && exponent < 0.0) {
        return "Ноль нельзя возводить в отрицательную степень";
    }
    if (base < 0.0 && std::isfinite(exponent) && std::trunc(exponent) != exponent) {
        return "Отрицательное основание в дробной степени";
    }
    if (std::isfinite(base) && std::isfinite(exponent) && !std::isfinite(std::pow(base, exponent))) {
        return "Переполнение при возведении в степень";
    }
    return nullptr;
}

// Целая степень возведением в квадрат; nullopt при переполнении
std::optional<long long> integerPower(long long base, long long exponent) {
    long long result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            if (mulOverflows(result, base)) {
                return std::nullopt;
            }
            result *= base;
        }
        exponent >>= 1;
        if (exponent > 0) {
            if (mulOverflows(base, base)) {
                return std::nullopt;
            }
            base *= base;
        }
    }
    return result;
}
}

double Numeric::asDouble() const {
    if (isInteger()) {
        return static_cast<double>(std::get<long long>(value));
    }
    return std::get<double>(value);
}

bool Numeric::isZero() const {
    return asDouble() == 0.0;
}

bool Numeric::isOne() const {
    return isInteger() ? asInteger() == 1 : std::get<double>(value) == 1.0;
}

std::string Numeric::toString() const {
    if (isInteger()) {
        return std::to_string(asInteger());
    }

    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), std::get<double>(value));
    std::string text(buffer, ec == std::errc() ? end : buffer);
    // Вещественное значение не должно выглядеть как целое
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::optional<Numeric> Numeric::parse(const std::string& text) {
    const char* begin = text.data();
    const char* end = begin + text.size();

    // from_chars не принимает ведущий '+'
    if (begin != end && *begin == '+') {
        ++begin;
        if (begin != end && *begin == '-') {
            return std::nullopt;
        }
    }
    if (begin == end) {
        return std::nullopt;
    }

    long long integer = 0;
    auto [intEnd, intError] = std::from_chars(begin, end, integer);
    if (intError == std::errc() && intEnd == end) {
        return Numeric(integer);
    }

    double real = 0.0;
    auto [realEnd, realError] = std::from_chars(begin, end, real);
    if (realEnd != end) {
        return std::nullopt;
    }
    if (realError == std::errc()) {
        return Numeric(real);
    }
    if (realError == std::errc::result_out_of_range) {
        // 1e999 -> inf, 1e-999 -> 0.0
        return Numeric(std::strtod(std::string(begin, end).c_str(), nullptr));
    }
    return std::nullopt;
}

std::optional<Numeric> foldAdd(const Numeric& lhs, const Numeric& rhs) {
    if (lhs.isInteger() && rhs.isInteger() && !addOverflows(lhs.asInteger(), rhs.asInteger())) {
        return Numeric(lhs.asInteger() + rhs.asInteger());
    }
    return realResult(lhs.asDouble() + rhs.asDouble());
}

std::optional<Numeric> foldSub(const Numeric& lhs, const Numeric& rhs) {
    if (lhs.isInteger() && rhs.isInteger() && !subOverflows(lhs.asInteger(), rhs.asInteger())) {
        return Numeric(lhs.asInteger() - rhs.asInteger());
    }
    return realResult(lhs.asDouble() - rhs.asDouble());
}

std::optional<Numeric> foldMul(const Numeric& lhs, const Numeric& rhs) {
    if (lhs.isInteger() && rhs.isInteger() && !mulOverflows(lhs.asInteger(), rhs.asInteger())) {
        return Numeric(lhs.asInteger() * rhs.asInteger());
    }
    return realResult(lhs.asDouble() * rhs.asDouble());
}

// Деление всегда вещественное
std::optional<Numeric> foldDiv(const Numeric& lhs, const Numeric& rhs) {
    if (rhs.isZero()) {
        return std::nullopt;
    }
    return realResult(lhs.asDouble() / rhs.asDouble());
}

std::optional<Numeric> foldPow(const Numeric& base, const Numeric& exponent) {
    if (base.isInteger() && exponent.isInteger() && exponent.asInteger() >= 0) {
        if (auto exact = integerPower(base.asInteger(), exponent.asInteger())) {
            return Numeric(*exact);
        }
    }
    if (powerFailure(base.asDouble(), exponent.asDouble()) != nullptr) {
        return std::nullopt;
    }
    return realResult(std::pow(base.asDouble(), exponent.asDouble()));
}

double checkedDivide(double lhs, double rhs) {
    if (rhs == 0.0) {
        throw ArithmeticError("Деление на ноль");
    }
    return lhs / rhs;
}

double checkedPower(double base, double exponent) {
    if (const char* failure = powerFailure(base, exponent)) {
        throw ArithmeticError(failure);
    }
    return std::pow(base, exponent);
}

} // namespace symalg
