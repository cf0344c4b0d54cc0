#pragma once

#include <seqmap/Errors.hpp>
#include <seqmap/wire/IMapReader.hpp>
#include <seqmap/wire/IMapWriter.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/reader.h>
#include <rapidjson/writer.h>
#include <cmath>
#include <cstdint>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @brief Настройки текстового писателя
 */
struct TextFormatOptions {
    /// Каждая запись на отдельной строке с отступом
    bool pretty = false;

    /// Ширина отступа в режиме pretty, не меньше 0
    int indent = 2;
};

/**
 * @brief Кодирование скаляров для текстового формата
 *
 * - std::string — JSON-строка, экранирование делает rapidjson
 * - bool — true / false
 * - целые — JSON-число (char-типы пишутся числом), при чтении
 *   проверяется диапазон типа
 * - вещественные — кратчайшая запись, которая читается в то же значение;
 *   NaN и бесконечности в JSON не представимы
 */
struct TextCodec {
    // ==================== Запись ====================

    template<typename Json>
    static bool writeKey(Json& json, const std::string& key) {
        return json.Key(key.data(), toSize(key));
    }

    template<typename Json>
    static bool writeValue(Json& json, const std::string& value) {
        return json.String(value.data(), toSize(value));
    }

    template<typename Json>
    static bool writeValue(Json& json, bool value) {
        return json.Bool(value);
    }

    template<typename Json, typename T>
    static typename std::enable_if<std::is_integral<T>::value &&
                                   !std::is_same<T, bool>::value, bool>::type
    writeValue(Json& json, T value) {
        if constexpr (std::is_signed<T>::value) {
            return json.Int64(static_cast<int64_t>(value));
        } else {
            return json.Uint64(static_cast<uint64_t>(value));
        }
    }

    template<typename Json, typename T>
    static typename std::enable_if<std::is_floating_point<T>::value, bool>::type
    writeValue(Json& json, T value) {
        if (!std::isfinite(value)) {
            throw WireFormatError("non-finite number cannot be written as JSON");
        }
        return json.Double(static_cast<double>(value));
    }

    // ==================== Чтение ====================

    /**
     * @brief Привести значение, пришедшее от парсера, к типу T
     * @tparam S bool, int64_t, uint64_t, double или std::string
     * @throws WireFormatError если тип не тот или значение вне диапазона T
     */
    template<typename S, typename T>
    static void readValue(const S& source, T& value) {
        if constexpr (std::is_same<T, std::string>::value) {
            if constexpr (std::is_same<S, std::string>::value) {
                value = source;
            } else {
                throw WireFormatError("expected string value");
            }
        } else if constexpr (std::is_same<T, bool>::value) {
            if constexpr (std::is_same<S, bool>::value) {
                value = source;
            } else {
                throw WireFormatError("expected boolean value");
            }
        } else if constexpr (std::is_integral<T>::value) {
            if constexpr (std::is_integral<S>::value && !std::is_same<S, bool>::value) {
                if (!fitsInteger<T>(source)) {
                    throw WireFormatError("integer value " + std::to_string(source) +
                                          " out of range");
                }
                value = static_cast<T>(source);
            } else {
                throw WireFormatError("expected integer value");
            }
        } else {
            static_assert(std::is_floating_point<T>::value,
                          "TextCodec supports arithmetic types and std::string");
            if constexpr (std::is_arithmetic<S>::value && !std::is_same<S, bool>::value) {
                double number = static_cast<double>(source);
                if (std::fabs(number) > static_cast<double>(std::numeric_limits<T>::max())) {
                    throw WireFormatError("number out of range");
                }
                value = static_cast<T>(number);
            } else {
                throw WireFormatError("expected number value");
            }
        }
    }

private:
    static rapidjson::SizeType toSize(const std::string& s) {
        if (s.size() > std::numeric_limits<rapidjson::SizeType>::max()) {
            throw WireFormatError("string of " + std::to_string(s.size()) +
                                  " bytes is too long for JSON output");
        }
        return static_cast<rapidjson::SizeType>(s.size());
    }

    template<typename T, typename S>
    static bool fitsInteger(S source) {
        if constexpr (std::is_signed<S>::value) {
            if constexpr (std::is_signed<T>::value) {
                return source >= std::numeric_limits<T>::min() &&
                       source <= std::numeric_limits<T>::max();
            } else {
                return source >= 0 &&
                       static_cast<uint64_t>(source) <=
                           static_cast<uint64_t>(std::numeric_limits<T>::max());
            }
        } else {
            return source <= static_cast<uint64_t>(std::numeric_limits<T>::max());
        }
    }
};

/**
 * @brief Писатель текстового формата поверх rapidjson::Writer
 * @tparam W Тип ключа на проводе (ключи JSON-объекта — строки)
 * @tparam V Тип значения
 *
 * Результат — JSON-объект с ключами в порядке хранения:
 * {"k1":v1,"k2":v2}, пустая мапа — {}.
 * В режиме pretty каждая запись на своей строке: "k": v.
 * Для нестроковых ключей нужна стратегия, например IntegerKeyStrategy.
 */
template<typename W, typename V>
class TextMapWriter : public IMapWriter<W, V> {
    static_assert(std::is_same<W, std::string>::value,
                  "JSON object keys are strings, use a key strategy for other key types");

public:
    /**
     * @throws std::invalid_argument если options.indent < 0
     */
    explicit TextMapWriter(std::ostream& os, TextFormatOptions options = {})
        : os_(os)
        , stream_(os)
        , options_(options)
        , compact_(stream_)
        , pretty_(stream_)
    {
        if (options_.indent < 0) {
            throw std::invalid_argument("Indent must be non-negative");
        }
        pretty_.SetIndent(' ', static_cast<unsigned>(options_.indent));
    }

    void beginMap(size_t count) override {
        (void)count;
        compact_.Reset(stream_);
        pretty_.Reset(stream_);
        emit([](auto& json) { return json.StartObject(); });
    }

    void writeEntry(const W& key, const V& value) override {
        emit([&key](auto& json) { return TextCodec::writeKey(json, key); });
        emit([&value](auto& json) { return TextCodec::writeValue(json, value); });
    }

    void endMap() override {
        emit([](auto& json) { return json.EndObject(); });
        stream_.Flush();
        if (!os_) {
            throw WireFormatError("output stream failure");
        }
    }

private:
    template<typename Action>
    void emit(Action&& action) {
        bool ok = options_.pretty ? action(pretty_) : action(compact_);
        if (!ok) {
            throw WireFormatError("JSON writer rejected value");
        }
    }

    std::ostream& os_;
    rapidjson::OStreamWrapper stream_;
    TextFormatOptions options_;
    rapidjson::Writer<rapidjson::OStreamWrapper> compact_;
    rapidjson::PrettyWriter<rapidjson::OStreamWrapper> pretty_;
};

/**
 * @brief SAX-обработчик rapidjson, собирающий пары верхнего уровня
 * @tparam V Тип значения
 *
 * Пары сохраняются в порядке появления во входе, дубликаты не схлопываются.
 * Корень должен быть объектом, значения — скалярами.
 */
template<typename V>
class TextMapHandler : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, TextMapHandler<V>> {
public:
    bool Null() {
        expectValue();
        throw WireFormatError("null value for key '" + key_ + "'");
    }

    bool Bool(bool b) { return store(b); }
    bool Int(int i) { return store(static_cast<int64_t>(i)); }
    bool Uint(unsigned u) { return store(static_cast<uint64_t>(u)); }
    bool Int64(int64_t i) { return store(i); }
    bool Uint64(uint64_t u) { return store(u); }
    bool Double(double d) { return store(d); }

    bool String(const char* str, rapidjson::SizeType length, bool) {
        return store(std::string(str, length));
    }

    bool Key(const char* str, rapidjson::SizeType length, bool) {
        key_.assign(str, length);
        state_ = State::Value;
        return true;
    }

    bool StartObject() {
        if (state_ == State::Start) {
            state_ = State::Key;
            return true;
        }
        return nested();
    }

    bool EndObject(rapidjson::SizeType) {
        state_ = State::Done;
        return true;
    }

    bool StartArray() { return nested(); }
    bool EndArray(rapidjson::SizeType) { return nested(); }

    std::vector<std::pair<std::string, V>> release() {
        return std::move(entries_);
    }

private:
    enum class State { Start, Key, Value, Done };

    void expectValue() const {
        if (state_ != State::Value) {
            throw WireFormatError("expected '{' at start of map");
        }
    }

    bool nested() {
        expectValue();
        throw WireFormatError("nested value for key '" + key_ + "' is not supported");
    }

    template<typename S>
    bool store(const S& source) {
        expectValue();
        V value{};
        TextCodec::readValue(source, value);
        entries_.emplace_back(std::move(key_), std::move(value));
        key_.clear();
        state_ = State::Key;
        return true;
    }

    State state_ = State::Start;
    std::string key_;
    std::vector<std::pair<std::string, V>> entries_;
};

/**
 * @brief Читатель текстового формата поверх SAX-парсера rapidjson
 * @tparam W Тип ключа на проводе (ключи JSON-объекта — строки)
 * @tparam V Тип значения
 *
 * beginMap() разбирает весь вход и проверяет синтаксис, поэтому количество
 * записей известно заранее. Вложенные объекты и массивы как значения
 * не поддерживаются. После закрывающей '}' допускаются только пробелы.
 */
template<typename W, typename V>
class TextMapReader : public IMapReader<W, V> {
    static_assert(std::is_same<W, std::string>::value,
                  "JSON object keys are strings, use a key strategy for other key types");

public:
    explicit TextMapReader(std::istream& is)
        : is_(is)
    {}

    std::optional<size_t> beginMap() override {
        rapidjson::IStreamWrapper stream(is_);
        rapidjson::Reader reader;
        TextMapHandler<V> handler;

        rapidjson::ParseResult result = reader.Parse<PARSE_FLAGS>(stream, handler);
        if (result.IsError()) {
            throw WireFormatError(std::string(rapidjson::GetParseError_En(result.Code())) +
                                  " (offset " + std::to_string(result.Offset()) + ")");
        }

        entries_ = handler.release();
        position_ = 0;
        return entries_.size();
    }

    bool nextEntry(W& key, V& value) override {
        if (position_ >= entries_.size()) {
            return false;
        }
        key = std::move(entries_[position_].first);
        value = std::move(entries_[position_].second);
        ++position_;
        return true;
    }

private:
    static constexpr unsigned PARSE_FLAGS = rapidjson::kParseFullPrecisionFlag;

    std::istream& is_;
    std::vector<std::pair<std::string, V>> entries_;
    size_t position_ = 0;
};
