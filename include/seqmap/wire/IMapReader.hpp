#pragma once

#include <cstddef>
#include <optional>

/**
 * @brief Интерфейс чтения map-образного потока токенов
 * @tparam W Тип ключа на проводе
 * @tparam V Тип значения
 *
 * Читатель отдаёт пары по одной, в порядке их появления во входных данных.
 * Повреждённый поток (нет значения для ключа, мусор после конца мапы и т.п.)
 * сообщается через WireFormatError — адаптер пробрасывает его как есть.
 */
template<typename W, typename V>
class IMapReader {
public:
    virtual ~IMapReader() = default;

    /**
     * @brief Начать чтение мапы
     * @return Количество записей, если формат его знает заранее
     * @throws WireFormatError при неверном начале мапы
     */
    virtual std::optional<size_t> beginMap() = 0;

    /**
     * @brief Прочитать следующую пару
     * @param[out] key Ключ
     * @param[out] value Значение
     * @return false, если мапа закончилась
     * @throws WireFormatError при повреждённых данных
     */
    virtual bool nextEntry(W& key, V& value) = 0;
};
