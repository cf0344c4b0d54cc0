#pragma once

#include <seqmap/IKeyStrategy.hpp>
#include <utility>

/**
 * @brief Стратегия без преобразования ключей
 * @tparam K Тип ключа (он же тип ключа на проводе)
 *
 * Используется по умолчанию — преобразование ключей opt-in.
 * Никогда не бросает исключений.
 */
template<typename K>
class IdentityKeyStrategy : public IKeyStrategy<K, K> {
public:
    K encodeKey(const K& original) override {
        return original;
    }

    K decodeKey(K wire) override {
        return std::move(wire);
    }
};
