#pragma once

#include <cstddef>
#include <exception>
#include <optional>

/**
 * @brief Направление вызова адаптера
 */
enum class Direction {
    Serialize,
    Deserialize
};

inline const char* toString(Direction direction) {
    return direction == Direction::Serialize ? "SERIALIZE" : "DESERIALIZE";
}

/**
 * @brief Интерфейс слушателя событий сериализации
 * @tparam K Тип ключа в памяти
 *
 * На каждый вызов serialize/deserialize приходит ровно один onBegin
 * и ровно одно из onComplete / onFailure.
 * Слушатель только наблюдает — повлиять на ход вызова он не может.
 */
template<typename K>
class ISerializationListener {
public:
    virtual ~ISerializationListener() = default;

    /**
     * @param sizeHint Количество записей, если оно известно заранее
     */
    virtual void onBegin(Direction direction, std::optional<size_t> sizeHint) {
        (void)direction; (void)sizeHint;
    }
    virtual void onKeyEncoded(const K& key) { (void)key; }
    virtual void onKeyDecoded(const K& key) { (void)key; }
    virtual void onComplete(Direction direction, size_t entries) {
        (void)direction; (void)entries;
    }
    virtual void onFailure(Direction direction, const std::exception& error) {
        (void)direction; (void)error;
    }
};
