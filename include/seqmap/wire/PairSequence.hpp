#pragma once

#include <seqmap/wire/IMapReader.hpp>
#include <seqmap/wire/IMapWriter.hpp>
#include <utility>
#include <vector>

/**
 * @brief Поток токенов поверх std::vector<std::pair<W, V>>
 *
 * Самый простой "провод": пары лежат в памяти в нужном порядке.
 * Удобен для тестов и как точка обмена с другими продюсерами пар.
 */
template<typename W, typename V>
class PairSequenceWriter : public IMapWriter<W, V> {
public:
    /**
     * @param out Куда писать пары (ownership не передаётся)
     */
    explicit PairSequenceWriter(std::vector<std::pair<W, V>>& out)
        : out_(out)
    {}

    void beginMap(size_t count) override {
        out_.clear();
        out_.reserve(count);
    }

    void writeEntry(const W& key, const V& value) override {
        out_.emplace_back(key, value);
    }

    void endMap() override {}

private:
    std::vector<std::pair<W, V>>& out_;
};

/**
 * @brief Однопроходный читатель: пары перемещаются из вектора по мере чтения
 */
template<typename W, typename V>
class PairSequenceReader : public IMapReader<W, V> {
public:
    explicit PairSequenceReader(std::vector<std::pair<W, V>> tokens)
        : tokens_(std::move(tokens))
    {}

    std::optional<size_t> beginMap() override {
        return tokens_.size() - position_;
    }

    bool nextEntry(W& key, V& value) override {
        if (position_ >= tokens_.size()) {
            return false;
        }
        key = std::move(tokens_[position_].first);
        value = std::move(tokens_[position_].second);
        ++position_;
        return true;
    }

private:
    std::vector<std::pair<W, V>> tokens_;
    size_t position_ = 0;
};
