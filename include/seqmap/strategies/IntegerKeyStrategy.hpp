#pragma once

#include <seqmap/Errors.hpp>
#include <seqmap/IKeyStrategy.hpp>
#include <charconv>
#include <string>
#include <system_error>
#include <type_traits>

/**
 * @brief Целочисленные ключи в памяти, десятичные строки на проводе
 * @tparam K Целочисленный тип ключа
 *
 * Типичный случай: формат допускает только строковые ключи (JSON-объект),
 * а приложению нужны числа. Ключ разбирается один раз при чтении и
 * дальше хранится как число.
 *
 * Пример:
 *   "42"  -> 42
 *   "-7"  -> -7
 *   "4x2" -> KeyDecodeError
 *   "300" -> KeyDecodeError для uint8_t (выход за диапазон)
 *
 * Round trip выполняется для любого значения K.
 */
template<typename K>
class IntegerKeyStrategy : public IKeyStrategy<K, std::string> {
    static_assert(std::is_integral<K>::value && !std::is_same<K, bool>::value,
                  "IntegerKeyStrategy requires an integral key type");

public:
    std::string encodeKey(const K& original) override {
        return std::to_string(original);
    }

    K decodeKey(std::string wire) override {
        K value{};
        const char* first = wire.data();
        const char* last = wire.data() + wire.size();

        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::result_out_of_range) {
            throw KeyDecodeError("integer key out of range: '" + wire + "'");
        }
        if (ec != std::errc() || ptr != last || wire.empty()) {
            throw KeyDecodeError("not an integer key: '" + wire + "'");
        }
        return value;
    }
};
