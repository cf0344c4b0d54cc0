#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

/**
 * @brief Ассоциативный контейнер поверх std::vector с сохранением порядка
 * @tparam K Тип ключа (нужен только operator== для поиска/удаления)
 * @tparam V Тип значения
 *
 * Архитектура:
 * - Данные хранятся в std::vector<std::pair<K, V>> в порядке вставки
 * - Никакая операция не переупорядочивает элементы
 * - Дубликаты ключей допустимы: insert() просто дописывает в конец
 * - Поиск — линейный проход с начала, побеждает ПЕРВОЕ совпадение
 *
 * Зачем: при десериализации не платим за хэширование и раскладку по
 * бакетам, а порядок ключей на входе сохраняется. Поиск O(n) — это
 * сознательный компромисс, скрытого индекса нет.
 *
 * Пример использования:
 * @code
 *   OrderedMap<std::string, int> map;
 *   map.insert("b", 2);
 *   map.insert("a", 1);
 *   map.insert("b", 3);            // дубликат — допустим
 *
 *   map.get("b");                  // 2 (первое совпадение)
 *   auto pairs = std::move(map).intoPairs();  // [(b,2), (a,1), (b,3)]
 * @endcode
 */
template<typename K, typename V>
class OrderedMap {
public:
    using key_type = K;
    using mapped_type = V;
    using value_type = std::pair<K, V>;
    using Storage = std::vector<value_type>;
    using iterator = typename Storage::iterator;
    using const_iterator = typename Storage::const_iterator;
    using size_type = typename Storage::size_type;

    OrderedMap() = default;

    /**
     * @brief Обернуть готовую последовательность пар
     * @param pairs Пары в нужном порядке (без сортировки и дедупликации)
     *
     * O(1), если вектор передан через std::move.
     */
    explicit OrderedMap(Storage pairs)
        : entries_(std::move(pairs))
    {}

    OrderedMap(std::initializer_list<value_type> init)
        : entries_(init)
    {}

    template<typename InputIt>
    OrderedMap(InputIt first, InputIt last)
        : entries_(first, last)
    {}

    static OrderedMap fromPairs(Storage pairs) {
        return OrderedMap(std::move(pairs));
    }

    /**
     * @brief Пустая мапа с заранее выделенной памятью
     */
    static OrderedMap withCapacity(size_type capacity) {
        OrderedMap map;
        map.entries_.reserve(capacity);
        return map;
    }

    // ==================== Вставка ====================

    /**
     * @brief Добавить запись в конец
     *
     * Существующий ключ не проверяется — дубликаты сохраняются.
     */
    void insert(K key, V value) {
        entries_.emplace_back(std::move(key), std::move(value));
    }

    /**
     * @brief Заменить значение первого совпадения или добавить в конец
     * @return true, если значение было заменено, false — если добавлено
     *
     * При замене позиция записи не меняется.
     */
    bool insertOrReplace(K key, V value) {
        auto it = findEntry(key);
        if (it != entries_.end()) {
            it->second = std::move(value);
            return true;
        }
        entries_.emplace_back(std::move(key), std::move(value));
        return false;
    }

    /**
     * @brief Дописать элемент в группу последнего ключа
     * @tparam T Тип элемента (V должен быть контейнером с push_back)
     *
     * Если ключ последней записи равен key — item добавляется в её значение,
     * иначе создаётся новая запись со значением из одного элемента.
     * Группируются только подряд идущие одинаковые ключи:
     *   (a,1) (a,2) (b,3) (a,4) -> [(a,[1,2]), (b,[3]), (a,[4])]
     */
    template<typename T>
    void pushToSameLast(K key, T&& item) {
        if (!entries_.empty() && entries_.back().first == key) {
            entries_.back().second.push_back(std::forward<T>(item));
            return;
        }

        V group;
        group.push_back(std::forward<T>(item));
        entries_.emplace_back(std::move(key), std::move(group));
    }

    // ==================== Поиск ====================

    /**
     * @brief Получить копию значения первого совпадения
     * @return Значение или std::nullopt, если ключа нет
     */
    std::optional<V> get(const K& key) const {
        auto it = findEntry(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Указатель на значение первого совпадения (без копирования)
     * @return nullptr, если ключа нет
     */
    const V* find(const K& key) const {
        auto it = findEntry(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    V* find(const K& key) {
        auto it = findEntry(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    bool contains(const K& key) const {
        return findEntry(key) != entries_.end();
    }

    // ==================== Удаление ====================

    /**
     * @brief Удалить первое совпадение
     * @return Удалённое значение или std::nullopt
     *
     * Порядок оставшихся записей сохраняется (vector::erase, O(n)).
     */
    std::optional<V> remove(const K& key) {
        auto it = findEntry(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        V value = std::move(it->second);
        entries_.erase(it);
        return value;
    }

    void clear() {
        entries_.clear();
    }

    // ==================== Доступ к последовательности ====================

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    const_iterator cbegin() const { return entries_.cbegin(); }
    const_iterator cend() const { return entries_.cend(); }

    const Storage& pairs() const { return entries_; }

    /**
     * @brief Забрать последовательность пар, уничтожив мапу
     *
     * Порядок не меняется. Через это делается любая внешняя
     * конвертация в другой тип мапы за один проход.
     */
    Storage intoPairs() && {
        return std::move(entries_);
    }

    size_type size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_type capacity() const { return entries_.capacity(); }
    void reserve(size_type capacity) { entries_.reserve(capacity); }

    friend bool operator==(const OrderedMap& lhs, const OrderedMap& rhs) {
        return lhs.entries_ == rhs.entries_;
    }

    friend bool operator!=(const OrderedMap& lhs, const OrderedMap& rhs) {
        return !(lhs == rhs);
    }

private:
    iterator findEntry(const K& key) {
        return std::find_if(entries_.begin(), entries_.end(),
            [&key](const value_type& entry) {
                return entry.first == key;
            });
    }

    const_iterator findEntry(const K& key) const {
        return std::find_if(entries_.begin(), entries_.end(),
            [&key](const value_type& entry) {
                return entry.first == key;
            });
    }

    Storage entries_;
};
