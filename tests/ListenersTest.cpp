#include <gtest/gtest.h>
#include <seqmap/Errors.hpp>
#include <seqmap/listeners/LoggingListener.hpp>
#include <seqmap/listeners/StatsListener.hpp>
#include <seqmap/serialization/MapSerializer.hpp>
#include <seqmap/strategies/IntegerKeyStrategy.hpp>
#include <seqmap/wire/PairSequence.hpp>
#include <sstream>

/**
 * @brief Тесты для слушателей
 *
 * Проверяем:
 * - StatsListener корректно считает события
 * - LoggingListener выводит сообщения
 * - На каждый вызов ровно один begin и один complete/failure
 * - Добавление и удаление слушателей
 */

using IntSerializer = MapSerializer<int, std::string, std::string>;
using WireTokens = std::vector<std::pair<std::string, std::string>>;

// ==================== StatsListener ====================

TEST(StatsListenerTest, InitiallyZero) {
    StatsListener<int> stats;

    EXPECT_EQ(stats.serializations(), 0u);
    EXPECT_EQ(stats.deserializations(), 0u);
    EXPECT_EQ(stats.keysEncoded(), 0u);
    EXPECT_EQ(stats.keysDecoded(), 0u);
    EXPECT_EQ(stats.completions(), 0u);
    EXPECT_EQ(stats.failures(), 0u);
    EXPECT_DOUBLE_EQ(stats.failureRate(), 0.0);
}

TEST(StatsListenerTest, CountsSuccessfulCalls) {
    IntegerKeyStrategy<int> strategy;
    IntSerializer serializer;
    auto stats = std::make_shared<StatsListener<int>>();
    serializer.addListener(stats);

    PairSequenceReader<std::string, std::string> reader(WireTokens{{"1", "a"}, {"2", "b"}});
    auto map = serializer.deserialize(reader, strategy);

    WireTokens out;
    PairSequenceWriter<std::string, std::string> writer(out);
    serializer.serialize(map, writer, strategy);

    EXPECT_EQ(stats->deserializations(), 1u);
    EXPECT_EQ(stats->serializations(), 1u);
    EXPECT_EQ(stats->keysDecoded(), 2u);
    EXPECT_EQ(stats->keysEncoded(), 2u);
    EXPECT_EQ(stats->completions(), 2u);
    EXPECT_EQ(stats->failures(), 0u);
}

TEST(StatsListenerTest, CountsFailures) {
    IntegerKeyStrategy<int> strategy;
    IntSerializer serializer;
    auto stats = std::make_shared<StatsListener<int>>();
    serializer.addListener(stats);

    PairSequenceReader<std::string, std::string> good(WireTokens{{"1", "a"}});
    serializer.deserialize(good, strategy);

    PairSequenceReader<std::string, std::string> bad(WireTokens{{"1", "a"}, {"x", "b"}});
    EXPECT_THROW(serializer.deserialize(bad, strategy), KeyDecodeError);

    EXPECT_EQ(stats->deserializations(), 2u);
    EXPECT_EQ(stats->keysDecoded(), 2u);
    EXPECT_EQ(stats->completions(), 1u);
    EXPECT_EQ(stats->failures(), 1u);
    EXPECT_DOUBLE_EQ(stats->failureRate(), 0.5);
}

TEST(StatsListenerTest, Reset) {
    StatsListener<int> stats;
    stats.onBegin(Direction::Serialize, 1);
    stats.onKeyEncoded(1);
    stats.onComplete(Direction::Serialize, 1);

    stats.reset();

    EXPECT_EQ(stats.serializations(), 0u);
    EXPECT_EQ(stats.keysEncoded(), 0u);
    EXPECT_EQ(stats.completions(), 0u);
}

// ==================== LoggingListener ====================

TEST(LoggingListenerTest, LogsDeserialization) {
    std::ostringstream oss;
    IntegerKeyStrategy<int> strategy;
    IntSerializer serializer;
    serializer.addListener(std::make_shared<LoggingListener<int>>("test", oss));

    PairSequenceReader<std::string, std::string> reader(WireTokens{{"7", "seven"}});
    serializer.deserialize(reader, strategy);

    std::string output = oss.str();
    EXPECT_NE(output.find("[test] BEGIN DESERIALIZE: 1 entries"), std::string::npos);
    EXPECT_NE(output.find("[test] DECODE: 7"), std::string::npos);
    EXPECT_NE(output.find("[test] DONE DESERIALIZE: 1 entries"), std::string::npos);
}

TEST(LoggingListenerTest, LogsFailure) {
    std::ostringstream oss;
    IntegerKeyStrategy<int> strategy;
    IntSerializer serializer;
    serializer.addListener(std::make_shared<LoggingListener<int>>("test", oss));

    PairSequenceReader<std::string, std::string> reader(WireTokens{{"oops", "x"}});
    EXPECT_THROW(serializer.deserialize(reader, strategy), KeyDecodeError);

    std::string output = oss.str();
    EXPECT_NE(output.find("[test] FAILED DESERIALIZE"), std::string::npos);
    EXPECT_NE(output.find("oops"), std::string::npos);
    EXPECT_EQ(output.find("DONE"), std::string::npos);
}

TEST(LoggingListenerTest, LogsSerialization) {
    std::ostringstream oss;
    IntegerKeyStrategy<int> strategy;
    IntSerializer serializer;
    serializer.addListener(std::make_shared<LoggingListener<int>>("out", oss));

    OrderedMap<int, std::string> map = {{3, "c"}, {1, "a"}};
    WireTokens tokens;
    PairSequenceWriter<std::string, std::string> writer(tokens);
    serializer.serialize(map, writer, strategy);

    std::string output = oss.str();
    auto first = output.find("[out] ENCODE: 3");
    auto second = output.find("[out] ENCODE: 1");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
}

// ==================== Управление слушателями ====================

TEST(ListenersTest, MultipleListenersWorkTogether) {
    std::ostringstream oss;
    IntegerKeyStrategy<int> strategy;
    IntSerializer serializer;
    auto stats = std::make_shared<StatsListener<int>>();
    serializer.addListener(stats);
    serializer.addListener(std::make_shared<LoggingListener<int>>("multi", oss));

    PairSequenceReader<std::string, std::string> reader(WireTokens{{"1", "a"}});
    serializer.deserialize(reader, strategy);

    EXPECT_EQ(serializer.listenerCount(), 2u);
    EXPECT_EQ(stats->keysDecoded(), 1u);
    EXPECT_FALSE(oss.str().empty());
}

TEST(ListenersTest, RemoveListener) {
    IntegerKeyStrategy<int> strategy;
    IntSerializer serializer;
    auto stats = std::make_shared<StatsListener<int>>();
    serializer.addListener(stats);
    serializer.removeListener(stats);

    PairSequenceReader<std::string, std::string> reader(WireTokens{{"1", "a"}});
    serializer.deserialize(reader, strategy);

    EXPECT_EQ(serializer.listenerCount(), 0u);
    EXPECT_EQ(stats->deserializations(), 0u);
}

TEST(ListenersTest, NullListenerThrows) {
    IntSerializer serializer;

    EXPECT_THROW(serializer.addListener(nullptr), std::invalid_argument);
}
