#pragma once

#include <cstddef>

/**
 * @brief Интерфейс записи map-образного потока токенов
 * @tparam W Тип ключа на проводе
 * @tparam V Тип значения
 *
 * Адаптер вызывает методы строго в порядке:
 *   beginMap(n) -> writeEntry() x n -> endMap()
 * Записи передаются в порядке хранения в мапе — писатель обязан
 * сохранить его.
 *
 * Реализации:
 * - PairSequenceWriter — вектор пар в памяти
 * - BinaryMapWriter — бинарный формат с префиксами длины
 * - TextMapWriter — JSON-объект (rapidjson)
 */
template<typename W, typename V>
class IMapWriter {
public:
    virtual ~IMapWriter() = default;

    /**
     * @brief Начало мапы
     * @param count Количество записей, которое будет передано
     */
    virtual void beginMap(size_t count) = 0;

    /**
     * @brief Записать одну пару
     * @throws WireFormatError если пара не может быть записана
     */
    virtual void writeEntry(const W& key, const V& value) = 0;

    virtual void endMap() = 0;
};
