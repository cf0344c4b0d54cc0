#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Базовая ошибка на границе сериализации
 *
 * Все ошибки кодирования/декодирования наследуются от неё,
 * поэтому вызывающий код может ловить их одним catch.
 * Операции с OrderedMap в памяти никогда не бросают эти ошибки.
 */
class MapSerializationError : public std::runtime_error {
public:
    explicit MapSerializationError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * @brief Ключ не может быть представлен в wire-формате
 *
 * Бросается стратегией в encodeKey(). Прерывает сериализацию.
 */
class KeyEncodeError : public MapSerializationError {
public:
    explicit KeyEncodeError(const std::string& message)
        : MapSerializationError("Key encode error: " + message)
    {}
};

/**
 * @brief Wire-ключ не может быть преобразован обратно в ключ
 *
 * Бросается стратегией в decodeKey(). Прерывает десериализацию,
 * частично собранная мапа отбрасывается.
 */
class KeyDecodeError : public MapSerializationError {
public:
    explicit KeyDecodeError(const std::string& message)
        : MapSerializationError("Key decode error: " + message)
    {}
};

/**
 * @brief Поток токенов повреждён (нет значения для ключа, неверный заголовок и т.п.)
 *
 * Бросается читателями/писателями wire-формата.
 */
class WireFormatError : public MapSerializationError {
public:
    explicit WireFormatError(const std::string& message)
        : MapSerializationError("Wire format error: " + message)
    {}
};
