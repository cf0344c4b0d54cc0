#pragma once

#include <seqmap/IKeyStrategy.hpp>
#include <algorithm>
#include <cctype>
#include <string>

/**
 * @brief Приводит строковые ключи к нижнему регистру при чтении
 *
 * decodeKey() нормализует ключ ("Content-Type" -> "content-type"),
 * encodeKey() пишет ключ как есть.
 *
 * Внимание: round trip не гарантирован — wire-ключ с заглавными буквами
 * после чтения и повторной записи вернётся в нижнем регистре.
 * Для ключей, уже приведённых к нижнему регистру, композиция тождественна.
 */
class LowercaseKeyStrategy : public IKeyStrategy<std::string, std::string> {
public:
    std::string encodeKey(const std::string& original) override {
        return original;
    }

    std::string decodeKey(std::string wire) override {
        std::transform(wire.begin(), wire.end(), wire.begin(),
            [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
        return wire;
    }
};
