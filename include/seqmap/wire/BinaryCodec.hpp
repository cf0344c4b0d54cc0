#pragma once

#include <seqmap/Errors.hpp>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

/**
 * @brief Кодирование скаляров для бинарного формата
 *
 * Все целые заголовки — uint32 little-endian.
 * Поддерживаемые типы скаляров:
 * - Арифметические типы (int, double, etc.) — через memcpy
 * - bool — один байт, при чтении допускаются только 0 и 1
 * - std::string — сырые байты
 *
 * Для других типов нужен свой формат (или специализация encode/decode).
 */
struct BinaryCodec {
    // ==================== Запись ====================

    static void appendUint32(std::vector<uint8_t>& data, uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            data.push_back(static_cast<uint8_t>(value >> shift));
        }
    }

    /**
     * @brief Записать скаляр с префиксом длины
     */
    template<typename T>
    static void appendScalar(std::vector<uint8_t>& data, const T& value) {
        static_assert(std::is_arithmetic<T>::value,
                      "BinaryCodec supports arithmetic types and std::string");
        appendUint32(data, static_cast<uint32_t>(sizeof(T)));
        size_t offset = data.size();
        data.resize(offset + sizeof(T));
        std::memcpy(data.data() + offset, &value, sizeof(T));
    }

    static void appendScalar(std::vector<uint8_t>& data, const std::string& value) {
        if (value.size() > UINT32_MAX) {
            throw WireFormatError("string of " + std::to_string(value.size()) +
                                  " bytes does not fit a 32-bit length prefix");
        }
        appendUint32(data, static_cast<uint32_t>(value.size()));
        data.insert(data.end(), value.begin(), value.end());
    }

    /// bool — ровно один байт 0 или 1
    static void appendScalar(std::vector<uint8_t>& data, bool value) {
        appendUint32(data, 1);
        data.push_back(value ? 1 : 0);
    }

    // ==================== Чтение ====================

    static uint32_t readUint32(const std::vector<uint8_t>& data, size_t& offset) {
        if (offset > data.size() || data.size() - offset < 4) {
            throw WireFormatError("unexpected end of data");
        }

        uint32_t value = 0;
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | data[offset + i];
        }
        offset += 4;
        return value;
    }

    /**
     * @brief Прочитать скаляр с префиксом длины
     * @return false, если данные закончились до префикса
     * @throws WireFormatError если префикс есть, а данных не хватает
     *         или размер не совпадает с типом
     */
    template<typename T>
    static bool readScalar(const std::vector<uint8_t>& data, size_t& offset, T& value) {
        static_assert(std::is_arithmetic<T>::value,
                      "BinaryCodec supports arithmetic types and std::string");
        size_t size = 0;
        if (!readPrefix(data, offset, size)) {
            return false;
        }
        if (size != sizeof(T)) {
            throw WireFormatError("scalar size mismatch: expected " +
                                  std::to_string(sizeof(T)) + " bytes, got " +
                                  std::to_string(size));
        }
        std::memcpy(&value, data.data() + offset, sizeof(T));
        offset += size;
        return true;
    }

    static bool readScalar(const std::vector<uint8_t>& data, size_t& offset, std::string& value) {
        size_t size = 0;
        if (!readPrefix(data, offset, size)) {
            return false;
        }
        value.assign(reinterpret_cast<const char*>(data.data() + offset), size);
        offset += size;
        return true;
    }

    /**
     * @brief Прочитать bool
     * @throws WireFormatError если байт не 0 и не 1
     */
    static bool readScalar(const std::vector<uint8_t>& data, size_t& offset, bool& value) {
        size_t size = 0;
        if (!readPrefix(data, offset, size)) {
            return false;
        }
        if (size != 1) {
            throw WireFormatError("scalar size mismatch: expected 1 byte for bool, got " +
                                  std::to_string(size));
        }
        uint8_t byte = data[offset];
        if (byte > 1) {
            throw WireFormatError("invalid bool byte " + std::to_string(byte));
        }
        value = byte == 1;
        offset += size;
        return true;
    }

private:
    static bool readPrefix(const std::vector<uint8_t>& data, size_t& offset, size_t& size) {
        if (offset + 4 > data.size()) {
            return false;
        }
        size = readUint32(data, offset);
        if (size > data.size() - offset) {
            throw WireFormatError("scalar of " + std::to_string(size) +
                                  " bytes exceeds remaining data");
        }
        return true;
    }
};
