#pragma once

#include <seqmap/IKeyStrategy.hpp>
#include <seqmap/OrderedMap.hpp>
#include <seqmap/listeners/ISerializationListener.hpp>
#include <seqmap/serialization/OrderedMapBuilder.hpp>
#include <seqmap/strategies/IdentityKeyStrategy.hpp>
#include <seqmap/wire/IMapReader.hpp>
#include <seqmap/wire/IMapWriter.hpp>
#include <algorithm>
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @brief Адаптер между OrderedMap и map-образным wire-протоколом
 * @tparam K Тип ключа в памяти
 * @tparam V Тип значения
 * @tparam W Тип ключа на проводе
 *
 * Serialize:   записи в порядке хранения -> encodeKey -> writer
 * Deserialize: reader -> decodeKey -> insert в конец -> OrderedMap
 *
 * Стратегия передаётся в каждый вызов и заимствуется только на его время.
 * В начале каждого вызова вызывается strategy.reset().
 *
 * Ошибки стратегии (KeyEncodeError/KeyDecodeError) и формата
 * (WireFormatError) пробрасываются без изменений. При ошибке чтения
 * мапа не возвращается; при ошибке записи содержимое writer'а
 * не определено (ранние записи могли уже уйти).
 *
 * Пример использования:
 * @code
 *   IntegerKeyStrategy<int> strategy;
 *   MapSerializer<int, std::string, std::string> serializer;
 *   serializer.addListener(std::make_shared<LoggingListener<int>>());
 *
 *   std::istringstream in(R"({"2": "b", "1": "a"})");
 *   TextMapReader<std::string, std::string> reader(in);
 *   auto map = serializer.deserialize(reader, strategy);  // [(2,b), (1,a)]
 * @endcode
 */
template<typename K, typename V, typename W = K>
class MapSerializer {
public:
    using Listener = ISerializationListener<K>;

    /**
     * @brief Записать мапу в writer
     * @throws KeyEncodeError, WireFormatError
     */
    void serialize(const OrderedMap<K, V>& map,
                   IMapWriter<W, V>& writer,
                   IKeyStrategy<K, W>& strategy) {
        notifyBegin(Direction::Serialize, map.size());
        try {
            strategy.reset();
            writer.beginMap(map.size());
            for (const auto& [key, value] : map) {
                W wireKey = strategy.encodeKey(key);
                notifyKeyEncoded(key);
                writer.writeEntry(wireKey, value);
            }
            writer.endMap();
        } catch (const std::exception& e) {
            notifyFailure(Direction::Serialize, e);
            throw;
        }
        notifyComplete(Direction::Serialize, map.size());
    }

    /**
     * @brief Прочитать мапу из reader
     * @return Мапа с записями в порядке провода
     * @throws KeyDecodeError, WireFormatError
     */
    OrderedMap<K, V> deserialize(IMapReader<W, V>& reader,
                                 IKeyStrategy<K, W>& strategy) {
        std::optional<size_t> sizeHint;
        try {
            strategy.reset();
            sizeHint = reader.beginMap();
        } catch (const std::exception& e) {
            notifyBegin(Direction::Deserialize, std::nullopt);
            notifyFailure(Direction::Deserialize, e);
            throw;
        }
        notifyBegin(Direction::Deserialize, sizeHint);

        OrderedMapBuilder<K, V, W> builder(strategy);
        builder.begin(sizeHint);
        try {
            W wireKey{};
            V value{};
            while (reader.nextEntry(wireKey, value)) {
                const K& key = builder.acceptEntry(std::move(wireKey), std::move(value));
                notifyKeyDecoded(key);
            }
        } catch (const std::exception& e) {
            builder.fail();
            notifyFailure(Direction::Deserialize, e);
            throw;
        }

        size_t entries = builder.size();
        OrderedMap<K, V> map = builder.finish();
        notifyComplete(Direction::Deserialize, entries);
        return map;
    }

    // ==================== Управление слушателями ====================

    void addListener(std::shared_ptr<Listener> listener) {
        if (!listener) {
            throw std::invalid_argument("Listener cannot be null");
        }
        listeners_.push_back(std::move(listener));
    }

    void removeListener(const std::shared_ptr<Listener>& listener) {
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end());
    }

    size_t listenerCount() const { return listeners_.size(); }

private:
    void notifyBegin(Direction direction, std::optional<size_t> sizeHint) {
        for (auto& listener : listeners_) {
            listener->onBegin(direction, sizeHint);
        }
    }

    void notifyKeyEncoded(const K& key) {
        for (auto& listener : listeners_) {
            listener->onKeyEncoded(key);
        }
    }

    void notifyKeyDecoded(const K& key) {
        for (auto& listener : listeners_) {
            listener->onKeyDecoded(key);
        }
    }

    void notifyComplete(Direction direction, size_t entries) {
        for (auto& listener : listeners_) {
            listener->onComplete(direction, entries);
        }
    }

    void notifyFailure(Direction direction, const std::exception& error) {
        for (auto& listener : listeners_) {
            listener->onFailure(direction, error);
        }
    }

    std::vector<std::shared_ptr<Listener>> listeners_;
};

// ==================== Хелперы для стратегии по умолчанию ====================

/**
 * @brief Записать мапу без преобразования ключей
 */
template<typename K, typename V>
void serializeMap(const OrderedMap<K, V>& map, IMapWriter<K, V>& writer) {
    IdentityKeyStrategy<K> identity;
    MapSerializer<K, V> serializer;
    serializer.serialize(map, writer, identity);
}

/**
 * @brief Прочитать мапу без преобразования ключей
 */
template<typename K, typename V>
OrderedMap<K, V> deserializeMap(IMapReader<K, V>& reader) {
    IdentityKeyStrategy<K> identity;
    MapSerializer<K, V> serializer;
    return serializer.deserialize(reader, identity);
}
