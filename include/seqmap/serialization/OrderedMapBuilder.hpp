#pragma once

#include <seqmap/IKeyStrategy.hpp>
#include <seqmap/OrderedMap.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Сборщик OrderedMap из потока токенов (visitor/builder)
 * @tparam K Тип ключа в памяти
 * @tparam V Тип значения
 * @tparam W Тип ключа на проводе
 *
 * Получает пары по одной в порядке провода, пропускает каждый ключ
 * через стратегию и дописывает запись в конец мапы.
 *
 * Состояния:
 *   Idle --begin()--> Reading --finish()--> Done
 *                        |
 *                        +--fail() / ошибка стратегии--> Failed
 *
 * В Failed частично собранная мапа уничтожается — наружу она не попадает.
 * Вызов операции в неподходящем состоянии — std::logic_error.
 */
template<typename K, typename V, typename W = K>
class OrderedMapBuilder {
public:
    enum class State {
        Idle,
        Reading,
        Done,
        Failed
    };

    /**
     * @param strategy Стратегия ключей (заимствуется, должна пережить сборщик)
     */
    explicit OrderedMapBuilder(IKeyStrategy<K, W>& strategy)
        : strategy_(strategy)
    {}

    /**
     * @brief Начать сборку
     * @param sizeHint Ожидаемое количество записей (для reserve)
     */
    void begin(std::optional<size_t> sizeHint = std::nullopt) {
        requireState(State::Idle, "begin");
        if (sizeHint) {
            map_.reserve(*sizeHint);
        }
        state_ = State::Reading;
    }

    /**
     * @brief Принять очередную пару
     * @return Ссылка на декодированный ключ (валидна до следующего вызова)
     *
     * Исключение стратегии переводит сборщик в Failed и пробрасывается дальше.
     */
    const K& acceptEntry(W wireKey, V value) {
        requireState(State::Reading, "acceptEntry");
        try {
            K key = strategy_.decodeKey(std::move(wireKey));
            map_.insert(std::move(key), std::move(value));
        } catch (...) {
            fail();
            throw;
        }
        return (map_.end() - 1)->first;
    }

    /**
     * @brief Завершить сборку и забрать мапу
     */
    OrderedMap<K, V> finish() {
        requireState(State::Reading, "finish");
        state_ = State::Done;
        return std::move(map_);
    }

    /**
     * @brief Прервать сборку, отбросив всё накопленное
     */
    void fail() {
        map_ = OrderedMap<K, V>();
        state_ = State::Failed;
    }

    State state() const { return state_; }

    size_t size() const { return map_.size(); }

private:
    void requireState(State expected, const char* operation) const {
        if (state_ != expected) {
            throw std::logic_error(std::string("OrderedMapBuilder::") + operation +
                                   " called in wrong state");
        }
    }

    IKeyStrategy<K, W>& strategy_;
    OrderedMap<K, V> map_;
    State state_ = State::Idle;
};
