#pragma once

#include <concepts>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace symalg {

// Числовое значение листа дерева.
// Хранит либо целое, либо вещественное число; тип выбирается при создании
// (парсер создаёт целое, если токен целиком разбирается как целое).
class Numeric {
public:
    Numeric() : value(0LL) {}

    // Любой целый тип хранится как long long; беззнаковые значения,
    // не помещающиеся в long long, становятся вещественными
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Numeric(T integer) : value(fromInteger(integer)) {}

    template <std::floating_point T>
    Numeric(T real) : value(static_cast<double>(real)) {}

    bool isInteger() const { return std::holds_alternative<long long>(value); }
    long long asInteger() const { return std::get<long long>(value); }
    double asDouble() const;

    // Проверки по значению: 0 и 0.0 оба считаются нулём
    bool isZero() const;
    bool isOne() const;

    // Текстовое представление: целые как есть, вещественные в кратчайшей
    // точной форме с ".0" для целых значений (2.0, 0.5, 1e+16)
    std::string toString() const;

    // Разбор токена: сначала как целое, затем как вещественное.
    // Возвращает nullopt, если токен не является числом целиком.
    static std::optional<Numeric> parse(const std::string& text);

    // Равенство с учётом представления: 2 != 2.0
    bool operator==(const Numeric& other) const { return value == other.value; }
    bool operator!=(const Numeric& other) const { return !(*this == other); }

private:
    using Storage = std::variant<long long, double>;
    Storage value;

    template <std::integral T>
    static Storage fromInteger(T integer) {
        if constexpr (std::is_unsigned_v<T>) {
            if (integer > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
                return static_cast<double>(integer);
            }
        }
        return static_cast<long long>(integer);
    }
};

// Свёртка констант. Результат nullopt означает, что арифметика отказалась
// (деление на ноль, 0 в отрицательной степени, комплексный результат,
// переполнение, результат NaN, например inf - inf).
std::optional<Numeric> foldAdd(const Numeric& lhs, const Numeric& rhs);
std::optional<Numeric> foldSub(const Numeric& lhs, const Numeric& rhs);
std::optional<Numeric> foldMul(const Numeric& lhs, const Numeric& rhs);
std::optional<Numeric> foldDiv(const Numeric& lhs, const Numeric& rhs);
std::optional<Numeric> foldPow(const Numeric& base, const Numeric& exponent);

// Арифметика вычисления (eval) в double.
// Выбрасывают ArithmeticError там, где свёртка вернула бы nullopt.
double checkedDivide(double lhs, double rhs);
double checkedPower(double base, double exponent);

} // namespace symalg
