#pragma once

/**
 * @brief Интерфейс стратегии преобразования ключей
 * @tparam K Тип ключа в памяти (то, что лежит в OrderedMap)
 * @tparam W Тип ключа в wire-формате
 *
 * Применяется ровно один раз на ключ и только на границе сериализации —
 * операции с мапой в памяти стратегию не вызывают.
 * Позволяет нормализовать, валидировать, переименовывать ключи до того,
 * как они попадут в хранилище, без второго прохода по данным.
 *
 * Ошибки сообщаются исключениями:
 * - encodeKey() -> KeyEncodeError
 * - decodeKey() -> KeyDecodeError
 *
 * Стратегия должна быть чистой функцией ключа. Если реализация хранит
 * состояние между ключами (например, счётчик), это состояние обязано
 * сбрасываться в reset() — адаптер вызывает его в начале каждого вызова.
 *
 * Для корректного round trip требуется decodeKey(encodeKey(k)) == k.
 *
 * Реализации:
 * - IdentityKeyStrategy — без преобразования (по умолчанию)
 * - IntegerKeyStrategy — целые в памяти, десятичные строки на проводе
 * - LowercaseKeyStrategy — нормализация регистра при чтении
 * - ValidatingKeyStrategy — отбраковка ключей по предикату
 */
template<typename K, typename W>
class IKeyStrategy {
public:
    virtual ~IKeyStrategy() = default;

    /**
     * @brief Преобразовать ключ для записи в wire-формат
     * @param original Ключ из мапы
     * @return Ключ в представлении wire-формата
     * @throws KeyEncodeError если ключ не представим
     */
    virtual W encodeKey(const K& original) = 0;

    /**
     * @brief Преобразовать прочитанный wire-ключ в ключ мапы
     * @param wire Ключ, прочитанный из wire-формата
     * @return Ключ для вставки в мапу
     * @throws KeyDecodeError если ключ не может быть преобразован
     */
    virtual K decodeKey(W wire) = 0;

    /**
     * @brief Сбросить состояние перед новым вызовом serialize/deserialize
     */
    virtual void reset() {}
};
