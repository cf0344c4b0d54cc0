#include <gtest/gtest.h>
#include <seqmap/Errors.hpp>
#include <seqmap/strategies/IdentityKeyStrategy.hpp>
#include <seqmap/strategies/IntegerKeyStrategy.hpp>
#include <seqmap/strategies/LowercaseKeyStrategy.hpp>
#include <seqmap/strategies/ValidatingKeyStrategy.hpp>
#include <cstdint>
#include <limits>
#include <string>

/**
 * @brief Тесты стратегий ключей
 *
 * Проверяем:
 * - Identity ничего не меняет
 * - decodeKey(encodeKey(k)) == k для корректных стратегий
 * - Ошибки кодирования/декодирования
 * - Нормализацию, которая сознательно ломает round trip
 */

// ==================== IdentityKeyStrategy ====================

TEST(IdentityKeyStrategyTest, PassesKeysThrough) {
    IdentityKeyStrategy<std::string> strategy;

    EXPECT_EQ(strategy.encodeKey("Key"), "Key");
    EXPECT_EQ(strategy.decodeKey("Key"), "Key");
}

TEST(IdentityKeyStrategyTest, UsableThroughInterface) {
    IdentityKeyStrategy<int> identity;
    IKeyStrategy<int, int>& strategy = identity;

    EXPECT_EQ(strategy.decodeKey(strategy.encodeKey(-5)), -5);
}

// ==================== IntegerKeyStrategy ====================

TEST(IntegerKeyStrategyTest, EncodesDecimal) {
    IntegerKeyStrategy<int64_t> strategy;

    EXPECT_EQ(strategy.encodeKey(42), "42");
    EXPECT_EQ(strategy.encodeKey(-7), "-7");
}

TEST(IntegerKeyStrategyTest, DecodesDecimal) {
    IntegerKeyStrategy<int64_t> strategy;

    EXPECT_EQ(strategy.decodeKey("42"), 42);
    EXPECT_EQ(strategy.decodeKey("-7"), -7);
}

TEST(IntegerKeyStrategyTest, CompositionIsIdentity) {
    IntegerKeyStrategy<int64_t> strategy;

    for (int64_t key : {int64_t{0}, int64_t{1}, int64_t{-1},
                        std::numeric_limits<int64_t>::max(),
                        std::numeric_limits<int64_t>::min()}) {
        EXPECT_EQ(strategy.decodeKey(strategy.encodeKey(key)), key);
    }
}

TEST(IntegerKeyStrategyTest, RejectsGarbage) {
    IntegerKeyStrategy<int> strategy;

    EXPECT_THROW(strategy.decodeKey("4x2"), KeyDecodeError);
    EXPECT_THROW(strategy.decodeKey("abc"), KeyDecodeError);
    EXPECT_THROW(strategy.decodeKey(""), KeyDecodeError);
    EXPECT_THROW(strategy.decodeKey(" 1"), KeyDecodeError);
}

TEST(IntegerKeyStrategyTest, RejectsOutOfRange) {
    IntegerKeyStrategy<uint8_t> strategy;

    EXPECT_EQ(strategy.decodeKey("255"), 255);
    EXPECT_THROW(strategy.decodeKey("300"), KeyDecodeError);
    EXPECT_THROW(strategy.decodeKey("-1"), KeyDecodeError);
}

TEST(IntegerKeyStrategyTest, DecodeErrorIsSerializationError) {
    IntegerKeyStrategy<int> strategy;

    try {
        strategy.decodeKey("nope");
        FAIL() << "Expected KeyDecodeError";
    } catch (const MapSerializationError& e) {
        EXPECT_NE(std::string(e.what()).find("nope"), std::string::npos);
    }
}

// ==================== LowercaseKeyStrategy ====================

TEST(LowercaseKeyStrategyTest, NormalizesOnDecode) {
    LowercaseKeyStrategy strategy;

    EXPECT_EQ(strategy.decodeKey("Content-Type"), "content-type");
    EXPECT_EQ(strategy.encodeKey("Content-Type"), "Content-Type");
}

TEST(LowercaseKeyStrategyTest, RoundTripOnlyForLowercaseKeys) {
    LowercaseKeyStrategy strategy;

    EXPECT_EQ(strategy.decodeKey(strategy.encodeKey("host")), "host");
    EXPECT_NE(strategy.decodeKey(strategy.encodeKey("Host")), "Host");
}

// ==================== ValidatingKeyStrategy ====================

TEST(ValidatingKeyStrategyTest, AcceptsValidKeys) {
    ValidatingKeyStrategy<std::string> strategy(
        [](const std::string& key) { return !key.empty(); });

    EXPECT_EQ(strategy.encodeKey("a"), "a");
    EXPECT_EQ(strategy.decodeKey("b"), "b");
}

TEST(ValidatingKeyStrategyTest, RejectsInvalidKeysBothWays) {
    ValidatingKeyStrategy<std::string> strategy(
        [](const std::string& key) { return !key.empty(); },
        "key must not be empty");

    EXPECT_THROW(strategy.encodeKey(""), KeyEncodeError);
    EXPECT_THROW(strategy.decodeKey(""), KeyDecodeError);
}

TEST(ValidatingKeyStrategyTest, ConstructorThrowsOnEmptyPredicate) {
    EXPECT_THROW(
        ValidatingKeyStrategy<int>(nullptr),
        std::invalid_argument
    );
}
