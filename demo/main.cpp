#include <seqmap/SeqMap.hpp>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

/**
 * @brief Демонстрация библиотеки на примере заголовков и кодов ответа
 *
 * Сценарии:
 * 1. Порядок ключей сохраняется при чтении и записи
 * 2. Нормализация ключей стратегией на границе чтения
 * 3. Целочисленные ключи поверх JSON-объекта
 * 4. Ошибка в середине входа — мапа не возвращается
 */

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

/**
 * @brief Демо 1: порядок ключей
 *
 * std::unordered_map перемешал бы поля, OrderedMap пишет их как прочитал.
 */
void demoOrderPreserved() {
    printSeparator("Demo 1: Order Preserved");

    std::istringstream in(R"({"zeta": 26, "alpha": 1, "mid": 13})");
    TextMapReader<std::string, int> reader(in);
    auto map = deserializeMap(reader);

    std::ostringstream out;
    TextMapWriter<std::string, int> writer(out, TextFormatOptions{true, 2});
    serializeMap(map, writer);

    std::cout << out.str() << "\n";
}

/**
 * @brief Демо 2: нормализация ключей
 *
 * Ключи приводятся к нижнему регистру до попадания в мапу,
 * поэтому поиск не зависит от того, как их написал отправитель.
 */
void demoKeyNormalization() {
    printSeparator("Demo 2: Key Normalization");

    LowercaseKeyStrategy strategy;
    MapSerializer<std::string, std::string> serializer;
    serializer.addListener(std::make_shared<LoggingListener<std::string>>("headers"));

    std::istringstream in(R"({"Content-Type": "text/plain", "X-Request-Id": "42"})");
    TextMapReader<std::string, std::string> reader(in);
    auto headers = serializer.deserialize(reader, strategy);

    if (const std::string* type = headers.find("content-type")) {
        std::cout << "content-type = " << *type << "\n";
    }
}

/**
 * @brief Демо 3: целые ключи поверх строкового формата
 */
void demoIntegerKeys() {
    printSeparator("Demo 3: Integer Keys");

    IntegerKeyStrategy<int> strategy;
    MapSerializer<int, std::string, std::string> serializer;
    auto stats = std::make_shared<StatsListener<int>>();
    serializer.addListener(stats);

    std::istringstream in(R"({"404": "Not Found", "200": "OK", "500": "Server Error"})");
    TextMapReader<std::string, std::string> reader(in);
    auto statuses = serializer.deserialize(reader, strategy);

    for (const auto& [code, text] : statuses) {
        std::cout << "  " << code << " -> " << text << "\n";
    }

    std::vector<uint8_t> binary;
    BinaryMapWriter<std::string, std::string> writer(binary);
    serializer.serialize(statuses, writer, strategy);

    std::cout << "\nBinary size: " << binary.size() << " bytes\n";
    std::cout << "Keys decoded: " << stats->keysDecoded()
              << ", keys encoded: " << stats->keysEncoded() << "\n";

    auto lookup = toUnorderedMap(std::move(statuses));
    std::cout << "Lookup 200 via unordered_map: " << lookup.at(200) << "\n";
}

/**
 * @brief Демо 4: ошибка посреди входа
 */
void demoFailureAtomicity() {
    printSeparator("Demo 4: Failure Atomicity");

    IntegerKeyStrategy<int> strategy;
    MapSerializer<int, std::string, std::string> serializer;
    serializer.addListener(std::make_shared<LoggingListener<int>>("statuses"));

    std::istringstream in(R"({"200": "OK", "two hundred": "OK?"})");
    TextMapReader<std::string, std::string> reader(in);

    try {
        auto statuses = serializer.deserialize(reader, strategy);
        std::cout << "Unexpected success: " << statuses.size() << " entries\n";
    } catch (const MapSerializationError& e) {
        std::cout << "Rejected input, no map produced: " << e.what() << "\n";
    }
}

int main() {
    demoOrderPreserved();
    demoKeyNormalization();
    demoIntegerKeys();
    demoFailureAtomicity();

    std::cout << "\nDone.\n";
    return 0;
}
