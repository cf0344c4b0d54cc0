#pragma once

#include <seqmap/OrderedMap.hpp>
#include <map>
#include <unordered_map>
#include <utility>

/**
 * @brief Конвертация OrderedMap в стандартные мапы и обратно
 *
 * Всё делается одним линейным проходом по парам — контейнер сам
 * про другие типы хранилищ ничего не знает.
 *
 * При переносе в мапу с уникальными ключами дубликаты схлопываются,
 * остаётся ПОСЛЕДНЕЕ значение (как при повторной вставке каждой пары).
 * При переносе из std::unordered_map порядок определяется порядком
 * обхода хэш-таблицы.
 */

template<typename K, typename V>
std::unordered_map<K, V> toUnorderedMap(OrderedMap<K, V> map) {
    std::unordered_map<K, V> result;
    result.reserve(map.size());
    for (auto& [key, value] : std::move(map).intoPairs()) {
        result.insert_or_assign(std::move(key), std::move(value));
    }
    return result;
}

template<typename K, typename V>
std::map<K, V> toMap(OrderedMap<K, V> map) {
    std::map<K, V> result;
    for (auto& [key, value] : std::move(map).intoPairs()) {
        result.insert_or_assign(std::move(key), std::move(value));
    }
    return result;
}

template<typename K, typename V, typename Hash, typename KeyEqual, typename Alloc>
OrderedMap<K, V> fromUnorderedMap(std::unordered_map<K, V, Hash, KeyEqual, Alloc> hash) {
    auto map = OrderedMap<K, V>::withCapacity(hash.size());
    for (auto& [key, value] : hash) {
        map.insert(key, std::move(value));
    }
    return map;
}

template<typename K, typename V, typename Compare, typename Alloc>
OrderedMap<K, V> fromMap(std::map<K, V, Compare, Alloc> tree) {
    auto map = OrderedMap<K, V>::withCapacity(tree.size());
    for (auto& [key, value] : tree) {
        map.insert(key, std::move(value));
    }
    return map;
}
