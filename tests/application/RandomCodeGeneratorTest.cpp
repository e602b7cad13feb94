/**
 * @file RandomCodeGeneratorTest.cpp
 * @brief Unit-тесты для RandomCodeGenerator
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/RandomCodeGenerator.hpp"
#include "adapters/secondary/InMemoryLinkRepository.hpp"
#include "domain/exceptions/ExhaustionError.hpp"
#include "domain/exceptions/StoreUnavailableError.hpp"
#include "domain/exceptions/DeadlineExceededError.hpp"
#include "../mocks/MockLinkRepository.hpp"

#include <set>
#include <thread>
#include <chrono>

using namespace shortener;
using namespace shortener::application;
using namespace shortener::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class RandomCodeGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryLinkRepository>();
    }

    std::shared_ptr<settings::ShortenerSettings> makeSettings(
        const std::string& alphabet, std::size_t length, std::size_t maxAttempts)
    {
        return std::make_shared<settings::ShortenerSettings>(alphabet, length, maxAttempts);
    }

    void occupy(const std::string& code) {
        repository_->insert(domain::Link("owner-0", "https://taken.example", code),
                            domain::Deadline::unbounded());
    }

    /// Один вызов с собственным лимитом попыток
    static std::string generate(RandomCodeGenerator& generator, std::size_t attempts,
                                const domain::Deadline& deadline = domain::Deadline::unbounded())
    {
        domain::AttemptBudget budget(attempts);
        return generator.generate(deadline, budget);
    }

    std::shared_ptr<adapters::secondary::InMemoryLinkRepository> repository_;
};

// ============================================
// ФОРМАТ КОДА
// ============================================

TEST_F(RandomCodeGeneratorTest, Generate_DefaultSettings_SixSymbolsFromAlphabet) {
    auto settings = makeSettings(settings::ShortenerSettings::DEFAULT_ALPHABET, 6, 256);
    RandomCodeGenerator generator(settings, repository_);

    const std::string alphabet = settings::ShortenerSettings::DEFAULT_ALPHABET;
    EXPECT_EQ(alphabet.size(), 62u);

    for (int i = 0; i < 100; ++i) {
        auto code = generate(generator, 256);
        ASSERT_EQ(code.size(), 6u);
        for (char c : code) {
            EXPECT_NE(alphabet.find(c), std::string::npos) << "Unexpected symbol in " << code;
        }
    }
}

TEST_F(RandomCodeGeneratorTest, Generate_ProducesDifferentCodes) {
    RandomCodeGenerator generator(makeSettings(settings::ShortenerSettings::DEFAULT_ALPHABET, 6, 256),
                                  repository_);

    std::set<std::string> codes;
    for (int i = 0; i < 200; ++i) {
        codes.insert(generate(generator, 256));
    }

    // 200 выборок из 56.8 млрд: совпадения практически исключены
    EXPECT_EQ(codes.size(), 200u);
}

// ============================================
// КОЛЛИЗИИ И ИСЧЕРПАНИЕ
// ============================================

TEST_F(RandomCodeGeneratorTest, Generate_SkipsOccupiedCode) {
    // Пространство из двух кодов, "a" занят
    RandomCodeGenerator generator(makeSettings("ab", 1, 256), repository_);
    occupy("a");

    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(generate(generator, 256), "b");
    }
}

TEST_F(RandomCodeGeneratorTest, Generate_FullCodeSpace_ThrowsExhaustion) {
    RandomCodeGenerator generator(makeSettings("ab", 1, 16), repository_);
    occupy("a");
    occupy("b");

    try {
        generate(generator, 16);
        FAIL() << "Expected ExhaustionError";
    } catch (const domain::ExhaustionError& e) {
        EXPECT_EQ(e.attempts(), 16u);
    }
}

TEST_F(RandomCodeGeneratorTest, Generate_FullCodeSpace_ChecksStoreExactlyMaxAttempts) {
    auto mockRepo = std::make_shared<MockLinkRepository>();
    RandomCodeGenerator generator(makeSettings("x", 3, 5), mockRepo);

    domain::Link taken("owner-0", "https://taken.example", "xxx");
    EXPECT_CALL(*mockRepo, findByCode("xxx", _))
        .Times(5)
        .WillRepeatedly(Return(taken));

    EXPECT_THROW(generate(generator, 5), domain::ExhaustionError);
}

// ============================================
// ОШИБКИ ХРАНИЛИЩА И ДЕДЛАЙН
// ============================================

TEST_F(RandomCodeGeneratorTest, Generate_StoreUnavailable_Propagates) {
    auto mockRepo = std::make_shared<MockLinkRepository>();
    RandomCodeGenerator generator(makeSettings("ab", 4, 10), mockRepo);

    EXPECT_CALL(*mockRepo, findByCode(_, _))
        .WillOnce(Throw(domain::StoreUnavailableError("connection refused")));

    EXPECT_THROW(generate(generator, 10), domain::StoreUnavailableError);
}

TEST_F(RandomCodeGeneratorTest, Generate_ExpiredDeadline_DoesNotTouchStore) {
    auto mockRepo = std::make_shared<MockLinkRepository>();
    RandomCodeGenerator generator(makeSettings("ab", 4, 10), mockRepo);

    EXPECT_CALL(*mockRepo, findByCode(_, _)).Times(0);

    auto deadline = domain::Deadline::after(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_THROW(generate(generator, 10, deadline), domain::DeadlineExceededError);
}

TEST_F(RandomCodeGeneratorTest, Generate_ContinuesSharedBudget) {
    RandomCodeGenerator generator(makeSettings("ab", 1, 16), repository_);
    occupy("a");
    occupy("b");

    domain::AttemptBudget budget(5);
    ASSERT_TRUE(budget.tryConsume());
    ASSERT_TRUE(budget.tryConsume());

    // Две попытки уже потрачены вызывающим: осталось три
    EXPECT_THROW(generator.generate(domain::Deadline::unbounded(), budget), domain::ExhaustionError);
    EXPECT_EQ(budget.used(), 5u);
}
