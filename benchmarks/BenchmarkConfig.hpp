#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Конфигурация для бенчмарков
 *
 * Позволяет настраивать размер мапы, количество повторов
 * и длину ключей.
 */
struct BenchmarkConfig {
    // ========== ОСНОВНЫЕ ПАРАМЕТРЫ ==========

    /// Количество записей в одной мапе
    size_t map_size = 10'000;

    /// Сколько раз повторить десериализацию
    size_t repetitions = 100;

    /// Длина строкового ключа (ключи вида "key_000123")
    size_t key_length = 16;

    /// Seed для генератора случайных чисел (воспроизводимость)
    uint32_t random_seed = 42;

    // ========== ПРЕДУСТАНОВЛЕННЫЕ КОНФИГУРАЦИИ ==========

    /// Лёгкая конфигурация (быстрый тест)
    void setLight() {
        map_size = 1'000;
        repetitions = 20;
    }

    /// Стандартная конфигурация
    void setStandard() {
        map_size = 10'000;
        repetitions = 100;
    }

    /// Много маленьких мап — типичный JSON-объект с десятком полей
    void setSmallObjects() {
        map_size = 16;
        repetitions = 100'000;
    }

    size_t totalEntries() const {
        return map_size * repetitions;
    }
};
