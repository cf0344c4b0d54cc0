#pragma once

#include <seqmap/listeners/ISerializationListener.hpp>
#include <iostream>
#include <string>

/**
 * @brief Слушатель для логирования событий сериализации в поток
 * @tparam K Тип ключа (должен поддерживать вывод в ostream)
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener<std::string>>("config");
 *   serializer.addListener(logger);
 *
 * Ядро само ничего не логирует — без слушателя вывода нет.
 */
template<typename K>
class LoggingListener : public ISerializationListener<K> {
public:
    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя источника)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingListener(const std::string& prefix = "SeqMap",
                             std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onBegin(Direction direction, std::optional<size_t> sizeHint) override {
        os_ << "[" << prefix_ << "] BEGIN " << toString(direction);
        if (sizeHint) {
            os_ << ": " << *sizeHint << " entries";
        }
        os_ << "\n";
    }

    void onKeyEncoded(const K& key) override {
        os_ << "[" << prefix_ << "] ENCODE: " << key << "\n";
    }

    void onKeyDecoded(const K& key) override {
        os_ << "[" << prefix_ << "] DECODE: " << key << "\n";
    }

    void onComplete(Direction direction, size_t entries) override {
        os_ << "[" << prefix_ << "] DONE " << toString(direction)
            << ": " << entries << " entries\n";
    }

    void onFailure(Direction direction, const std::exception& error) override {
        os_ << "[" << prefix_ << "] FAILED " << toString(direction)
            << ": " << error.what() << "\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
};
