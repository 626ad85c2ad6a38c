#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

#include "uuid/uuid_codec.hpp"
#include "uuid/uuid_generator.hpp"
#include "testing_utils.hpp"

namespace {
// 2024-04-11 03:43:23.223 UTC
constexpr uint64_t KNOWN_MILLISECONDS = 1'712'807'003'223ULL;
constexpr uint64_t KNOWN_INSTANT_NS = KNOWN_MILLISECONDS * 1'000'000;
} // namespace

namespace uuuidv7::tests {

class UuidGeneratorTest : public ::testing::Test {
protected:
    UuidGenerator generator;
};

// Проверка общего формата и структуры UUID
TEST_F(UuidGeneratorTest, UuidTestFormatting)
{
    for (size_t i = 0; i < 10000; i++) {
        const auto uuid = generator.generate();

        EXPECT_TRUE(UuidCodec::isValidUuid(uuid));
        EXPECT_EQ(36U, uuid.length());

        // Проверка дефисов
        EXPECT_EQ('-', uuid[8]);
        EXPECT_EQ('-', uuid[13]);
        EXPECT_EQ('-', uuid[18]);
        EXPECT_EQ('-', uuid[23]);

        // Проверка версии UUID
        EXPECT_EQ('7', uuid[14]);

        // Проверка варианта UUID
        const auto variant = uuid[19];
        EXPECT_TRUE(variant == '8' || variant == '9' || variant == 'a' || variant == 'b');

        // Проверка, что все символы в нижнем регистре
        for (const auto symbol : uuid) {
            EXPECT_TRUE(!std::isalpha(static_cast<unsigned char>(symbol))
                        || std::islower(static_cast<unsigned char>(symbol)));
        }
    }
}

// Версия и вариант в бинарном представлении
TEST_F(UuidGeneratorTest, UuidTestFieldConstants)
{
    for (size_t i = 0; i < 10000; i++) {
        const auto raw = generator.generateRaw();
        EXPECT_EQ(0x7, raw[6] >> 4);
        EXPECT_EQ(0x2, raw[8] >> 6);
        EXPECT_TRUE(hasV7Layout(raw));
    }
}

// Проверка уникальности UUID
TEST_F(UuidGeneratorTest, UuidTestUniqueness)
{
    constexpr size_t UUID_COUNT = 100000;
    std::unordered_set<std::string> uuids;

    for (size_t i = 0; i < UUID_COUNT; i++) {
        EXPECT_TRUE(uuids.insert(generator.generate()).second);
    }

    EXPECT_EQ(UUID_COUNT, uuids.size());
}

// Проверка многопоточной генерации UUID
TEST_F(UuidGeneratorTest, UuidTestConcurrentGeneration)
{
    constexpr size_t THREAD_COUNT = 20; // Количество потоков
    constexpr size_t UUID_PER_THREAD = 10000; // Количество генерируемых UUID в каждом потоке

    std::unordered_set<std::string> uuids;
    std::mutex uuidsMutex;

    auto generateTask = [this, &uuids, &uuidsMutex]() {
        std::vector<std::string> localUuids;
        localUuids.reserve(UUID_PER_THREAD);
        for (size_t i = 0; i < UUID_PER_THREAD; i++) {
            localUuids.push_back(generator.generate());
        }

        std::lock_guard<std::mutex> lock(uuidsMutex);
        for (const auto &uuid : localUuids) {
            EXPECT_TRUE(uuids.insert(uuid).second);
        }
    };

    std::vector<std::future<void>> futures;
    for (size_t i = 0; i < THREAD_COUNT; i++) {
        futures.push_back(std::async(std::launch::async, generateTask));
    }
    for (auto &future : futures) {
        future.get();
    }

    EXPECT_EQ(THREAD_COUNT * UUID_PER_THREAD, uuids.size());
}

// Метка времени в UUID соответствует системным часам
TEST_F(UuidGeneratorTest, UuidTestTimestampMatchesClock)
{
    SystemClockSource clock;
    const auto before = clock.nowNanoseconds() / NANOSECONDS_PER_MILLISECOND;
    const auto raw = generator.generateRaw();
    const auto after = clock.nowNanoseconds() / NANOSECONDS_PER_MILLISECOND;

    const auto timestamp = UuidGenerator::extractTimestamp(raw);
    EXPECT_GE(timestamp, before);
    EXPECT_LE(timestamp, after);
}

// При системных часах старшие 60 бит не убывают
TEST_F(UuidGeneratorTest, UuidTestTimeFieldsNonDecreasing)
{
    std::vector<RawUuid> uuids;
    for (size_t i = 0; i < 10000; i++) {
        uuids.push_back(generator.generateRaw());
    }

    for (size_t i = 1; i < uuids.size(); i++) {
        const auto prev = std::make_pair(extractTimestamp(uuids[i - 1]),
                                         extractFraction(uuids[i - 1]));
        const auto curr = std::make_pair(extractTimestamp(uuids[i]), extractFraction(uuids[i]));
        EXPECT_LE(prev, curr);
    }
}

// Известное значение при фиксированных часах и ГСЧ
TEST(UuidGeneratorDeterministicTest, KnownValue)
{
    UuidGenerator generator(std::make_shared<FakeClockSource>(KNOWN_INSTANT_NS + 500'000),
                            std::make_shared<PatternRandomSource>(std::vector<uint8_t>{ 0 }));

    EXPECT_EQ("018ecb40-c457-7800-8000-000000000000", generator.generate());
}

// Используются младшие 62 бита из 8 случайных байтов
TEST(UuidGeneratorDeterministicTest, RandomTakesLow62Bits)
{
    UuidGenerator generator(std::make_shared<FakeClockSource>(KNOWN_INSTANT_NS),
                            std::make_shared<PatternRandomSource>(std::vector<uint8_t>{
                                0xC1, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF }));

    const auto raw = generator.generateRaw();
    EXPECT_EQ(0x0123456789ABCDEFULL, extractRandom(raw));
    EXPECT_EQ("018ecb40-c457-7000-8123-456789abcdef", UuidCodec::encode(raw));
}

// UUID упорядочены так же, как созданы, при неубывающих часах
TEST(UuidGeneratorDeterministicTest, OrderingMatchesGenerationOrder)
{
    constexpr size_t UUID_COUNT = 20000;
    // Шаг 250 нс больше ширины одного интервала доли (~244 нс)
    UuidGenerator generator(std::make_shared<FakeClockSource>(KNOWN_INSTANT_NS + 123, 250),
                            std::make_shared<SystemRandomSource>());

    std::vector<RawUuid> raws;
    std::vector<std::string> texts;
    for (size_t i = 0; i < UUID_COUNT; i++) {
        raws.push_back(generator.generateRaw());
        texts.push_back(UuidCodec::encode(raws.back()));
    }

    auto sortedRaws = raws;
    std::sort(sortedRaws.begin(), sortedRaws.end());
    EXPECT_EQ(raws, sortedRaws);

    auto sortedTexts = texts;
    std::sort(sortedTexts.begin(), sortedTexts.end());
    EXPECT_EQ(texts, sortedTexts);
}

// Ошибка источника случайных данных не перехватывается генератором
TEST(UuidGeneratorDeterministicTest, RandomSourceFailurePropagates)
{
    UuidGenerator generator(std::make_shared<FakeClockSource>(KNOWN_INSTANT_NS),
                            std::make_shared<FailingRandomSource>());

    EXPECT_THROW(generator.generateRaw(), std::system_error);
    EXPECT_THROW(generator.generate(), std::system_error);
}

TEST(UuidGeneratorDeterministicTest, MissingSourcesRejected)
{
    EXPECT_THROW(UuidGenerator(nullptr, std::make_shared<SystemRandomSource>()),
                 std::invalid_argument);
    EXPECT_THROW(UuidGenerator(std::make_shared<SystemClockSource>(), nullptr),
                 std::invalid_argument);
}

TEST(UuidGeneratorExtractTest, ExtractTimestampFromText)
{
    const auto timestamp = UuidGenerator::extractTimestamp("018ecb40-c457-73e6-a400-000398daddd9");
    ASSERT_TRUE(timestamp.has_value());
    EXPECT_EQ(KNOWN_MILLISECONDS, *timestamp);

    const auto upper = UuidGenerator::extractTimestamp("018ECB40-C457-73E6-A400-000398DADDD9");
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(KNOWN_MILLISECONDS, *upper);
}

TEST(UuidGeneratorExtractTest, ExtractTimestampFromRaw)
{
    const auto raw = UuidCodec::decode("018ecb40-c457-73e6-a400-000398daddd9");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(KNOWN_MILLISECONDS, UuidGenerator::extractTimestamp(*raw));
}

TEST(UuidGeneratorExtractTest, ExtractTimestampRejectsMalformedText)
{
    EXPECT_FALSE(UuidGenerator::extractTimestamp("018ecb40-c457-73e6-a400").has_value());
    EXPECT_FALSE(UuidGenerator::extractTimestamp("018ecb40c45773e6a400000398daddd9").has_value());
    EXPECT_FALSE(
        UuidGenerator::extractTimestamp("018ecb40-c457-73e6-a400-000398daddz9").has_value());
}

// Сгенерированный UUID возвращает метку времени часов
TEST(UuidGeneratorExtractTest, ExtractTimestampAfterGenerate)
{
    for (uint64_t offset : { 0ULL, 1ULL, 999'999ULL, 123'456'789ULL }) {
        UuidGenerator generator(std::make_shared<FakeClockSource>(KNOWN_INSTANT_NS + offset),
                                std::make_shared<SystemRandomSource>());
        const auto text = generator.generate();
        const auto timestamp = UuidGenerator::extractTimestamp(text);
        ASSERT_TRUE(timestamp.has_value());
        EXPECT_EQ(KNOWN_MILLISECONDS + offset / 1'000'000, *timestamp);
    }
}
} // namespace uuuidv7::tests
