#pragma once

#include <seqmap/listeners/ISerializationListener.hpp>
#include <atomic>
#include <cstdint>

/**
 * @brief Слушатель для сбора статистики сериализации
 * @tparam K Тип ключа
 *
 * Собирает:
 * - serializations/deserializations — количество начатых вызовов
 * - keysEncoded/keysDecoded — сколько ключей прошло через стратегию
 * - completions/failures — чем закончились вызовы
 *
 * Использование:
 *   auto stats = std::make_shared<StatsListener<std::string>>();
 *   serializer.addListener(stats);
 *   // ... работа ...
 *   std::cout << "Failure rate: " << stats->failureRate() << std::endl;
 *
 * Примечание: счётчики atomic, чтобы один слушатель можно было
 * разделить между сериализаторами в разных потоках.
 */
template<typename K>
class StatsListener : public ISerializationListener<K> {
public:
    void onBegin(Direction direction, std::optional<size_t> sizeHint) override {
        (void)sizeHint;
        if (direction == Direction::Serialize) {
            ++serializations_;
        } else {
            ++deserializations_;
        }
    }

    void onKeyEncoded(const K& key) override {
        (void)key;
        ++keysEncoded_;
    }

    void onKeyDecoded(const K& key) override {
        (void)key;
        ++keysDecoded_;
    }

    void onComplete(Direction direction, size_t entries) override {
        (void)direction; (void)entries;
        ++completions_;
    }

    void onFailure(Direction direction, const std::exception& error) override {
        (void)direction; (void)error;
        ++failures_;
    }

    // ==================== Геттеры ====================

    uint64_t serializations() const { return serializations_; }
    uint64_t deserializations() const { return deserializations_; }
    uint64_t keysEncoded() const { return keysEncoded_; }
    uint64_t keysDecoded() const { return keysDecoded_; }
    uint64_t completions() const { return completions_; }
    uint64_t failures() const { return failures_; }

    /**
     * @brief Доля неудачных вызовов (0.0 - 1.0)
     * @return 0.0, если вызовов не было
     */
    double failureRate() const {
        uint64_t total = completions_ + failures_;
        if (total == 0) return 0.0;
        return static_cast<double>(failures_) / static_cast<double>(total);
    }

    /**
     * @brief Сбросить все счётчики
     */
    void reset() {
        serializations_ = 0;
        deserializations_ = 0;
        keysEncoded_ = 0;
        keysDecoded_ = 0;
        completions_ = 0;
        failures_ = 0;
    }

private:
    std::atomic<uint64_t> serializations_{0};
    std::atomic<uint64_t> deserializations_{0};
    std::atomic<uint64_t> keysEncoded_{0};
    std::atomic<uint64_t> keysDecoded_{0};
    std::atomic<uint64_t> completions_{0};
    std::atomic<uint64_t> failures_{0};
};
