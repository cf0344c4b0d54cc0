#pragma once

#include <seqmap/Errors.hpp>
#include <seqmap/IKeyStrategy.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Пропускает ключи без изменений, отбраковывая их по предикату
 * @tparam K Тип ключа
 *
 * Проверка выполняется в обе стороны: невалидный ключ не попадёт
 * ни в мапу при чтении (KeyDecodeError), ни на провод при записи
 * (KeyEncodeError).
 *
 * Использование:
 * @code
 *   ValidatingKeyStrategy<std::string> nonEmpty(
 *       [](const std::string& key) { return !key.empty(); },
 *       "key must not be empty");
 * @endcode
 */
template<typename K>
class ValidatingKeyStrategy : public IKeyStrategy<K, K> {
public:
    using Predicate = std::function<bool(const K&)>;

    /**
     * @param predicate Возвращает true для допустимых ключей
     * @param description Текст, попадающий в сообщение об ошибке
     */
    explicit ValidatingKeyStrategy(Predicate predicate,
                                   std::string description = "key rejected by predicate")
        : predicate_(std::move(predicate))
        , description_(std::move(description))
    {
        if (!predicate_) {
            throw std::invalid_argument("Key predicate cannot be empty");
        }
    }

    K encodeKey(const K& original) override {
        if (!predicate_(original)) {
            throw KeyEncodeError(description_);
        }
        return original;
    }

    K decodeKey(K wire) override {
        if (!predicate_(wire)) {
            throw KeyDecodeError(description_);
        }
        return wire;
    }

private:
    Predicate predicate_;
    std::string description_;
};
