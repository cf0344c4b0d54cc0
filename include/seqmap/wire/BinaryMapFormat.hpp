#pragma once

#include <seqmap/Errors.hpp>
#include <seqmap/wire/BinaryCodec.hpp>
#include <seqmap/wire/IMapReader.hpp>
#include <seqmap/wire/IMapWriter.hpp>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Константы бинарного формата мапы
 *
 * Формат:
 * [4 байта: magic "SMAP"]
 * [4 байта: версия формата]
 * [4 байта: количество записей]
 * [записи...]
 *
 * Формат записи:
 * [4 байта: размер ключа]
 * [N байт: данные ключа]
 * [4 байта: размер значения]
 * [M байт: данные значения]
 *
 * Записи идут строго в порядке хранения в мапе.
 * Пустая мапа — только заголовок (12 байт).
 */
struct BinaryMapFormat {
    static constexpr uint32_t MAGIC = 0x50414D53;  // "SMAP" в little-endian
    static constexpr uint32_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 12;
};

/**
 * @brief Писатель бинарного формата
 * @tparam W Тип ключа на проводе
 * @tparam V Тип значения
 */
template<typename W, typename V>
class BinaryMapWriter : public IMapWriter<W, V> {
public:
    /**
     * @param out Буфер для результата (ownership не передаётся)
     */
    explicit BinaryMapWriter(std::vector<uint8_t>& out)
        : out_(out)
    {}

    void beginMap(size_t count) override {
        if (count > UINT32_MAX) {
            throw WireFormatError("too many entries for binary format: " +
                                  std::to_string(count));
        }
        out_.clear();
        BinaryCodec::appendUint32(out_, BinaryMapFormat::MAGIC);
        BinaryCodec::appendUint32(out_, BinaryMapFormat::VERSION);
        BinaryCodec::appendUint32(out_, static_cast<uint32_t>(count));
    }

    void writeEntry(const W& key, const V& value) override {
        BinaryCodec::appendScalar(out_, key);
        BinaryCodec::appendScalar(out_, value);
    }

    void endMap() override {}

private:
    std::vector<uint8_t>& out_;
};

/**
 * @brief Читатель бинарного формата
 * @tparam W Тип ключа на проводе
 * @tparam V Тип значения
 *
 * Проверяет magic, версию, лимит количества записей и отсутствие
 * мусора после последней записи.
 */
template<typename W, typename V>
class BinaryMapReader : public IMapReader<W, V> {
public:
    /// Лимит записей по умолчанию — защита от огромного count в заголовке
    static constexpr size_t DEFAULT_MAX_ENTRIES = 16'000'000;

    /**
     * @param data Входные данные (должны жить дольше читателя)
     * @param maxEntries Максимально допустимое количество записей
     */
    explicit BinaryMapReader(const std::vector<uint8_t>& data,
                             size_t maxEntries = DEFAULT_MAX_ENTRIES)
        : data_(data)
        , maxEntries_(maxEntries)
    {}

    std::optional<size_t> beginMap() override {
        if (data_.size() < BinaryMapFormat::HEADER_SIZE) {
            throw WireFormatError("input too small for map header");
        }

        offset_ = 0;

        uint32_t magic = BinaryCodec::readUint32(data_, offset_);
        if (magic != BinaryMapFormat::MAGIC) {
            throw WireFormatError("wrong magic number");
        }

        uint32_t version = BinaryCodec::readUint32(data_, offset_);
        if (version != BinaryMapFormat::VERSION) {
            throw WireFormatError("unsupported format version: " +
                                  std::to_string(version));
        }

        count_ = BinaryCodec::readUint32(data_, offset_);
        if (count_ > maxEntries_) {
            throw WireFormatError("entry count " + std::to_string(count_) +
                                  " exceeds limit " + std::to_string(maxEntries_));
        }
        read_ = 0;

        // Каждая запись занимает минимум 8 байт (два префикса длины),
        // поэтому подсказку о размере ограничиваем тем, что реально может быть в данных
        size_t possible = (data_.size() - offset_) / 8;
        return std::min(count_, possible);
    }

    bool nextEntry(W& key, V& value) override {
        if (read_ == count_) {
            if (offset_ != data_.size()) {
                throw WireFormatError(std::to_string(data_.size() - offset_) +
                                      " trailing bytes after last entry");
            }
            return false;
        }

        if (!BinaryCodec::readScalar(data_, offset_, key)) {
            throw WireFormatError("key missing at entry " + std::to_string(read_));
        }
        if (!BinaryCodec::readScalar(data_, offset_, value)) {
            throw WireFormatError("value missing for key at entry " +
                                  std::to_string(read_));
        }

        ++read_;
        return true;
    }

private:
    const std::vector<uint8_t>& data_;
    size_t maxEntries_;
    size_t offset_ = 0;
    size_t count_ = 0;
    size_t read_ = 0;
};
