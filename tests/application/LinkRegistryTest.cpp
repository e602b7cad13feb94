/**
 * @file LinkRegistryTest.cpp
 * @brief Unit-тесты для LinkRegistry
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/LinkRegistry.hpp"
#include "application/RandomCodeGenerator.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/InMemoryLinkRepository.hpp"
#include "settings/MetricsSettings.hpp"
#include "domain/exceptions/ConflictError.hpp"
#include "domain/exceptions/ExhaustionError.hpp"
#include "domain/exceptions/StoreUnavailableError.hpp"
#include "domain/exceptions/DeadlineExceededError.hpp"
#include "../mocks/MockCodeGenerator.hpp"
#include "../mocks/MockLinkRepository.hpp"

#include <set>
#include <mutex>
#include <thread>
#include <vector>

using namespace shortener;
using namespace shortener::application;
using namespace shortener::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class LinkRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::ShortenerSettings>(
            settings::ShortenerSettings::DEFAULT_ALPHABET, 6, 256);
        repository_ = std::make_shared<adapters::secondary::InMemoryLinkRepository>();
        metrics_ = std::make_shared<MetricsService>(std::make_shared<settings::MetricsSettings>());
        generator_ = std::make_shared<RandomCodeGenerator>(settings_, repository_);
        registry_ = std::make_shared<LinkRegistry>(settings_, generator_, repository_, metrics_);
    }

    std::shared_ptr<settings::ShortenerSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryLinkRepository> repository_;
    std::shared_ptr<MetricsService> metrics_;
    std::shared_ptr<RandomCodeGenerator> generator_;
    std::shared_ptr<LinkRegistry> registry_;
};

// ============================================
// CREATE
// ============================================

TEST_F(LinkRegistryTest, Create_FirstLink_GetsIdOneAndZeroClicks) {
    auto link = registry_->create("1", "https://example.com", domain::Deadline::unbounded());

    EXPECT_EQ(link.id, 1);
    EXPECT_EQ(link.ownerId, "1");
    EXPECT_EQ(link.originalUrl, "https://example.com");
    EXPECT_EQ(link.code.size(), 6u);
    EXPECT_EQ(link.clickCount, 0);
    EXPECT_EQ(repository_->size(), 1u);
    EXPECT_EQ(metrics_->value("links_created_total"), 1);
}

TEST_F(LinkRegistryTest, Create_PersistsLinkUnderItsCode) {
    auto link = registry_->create("1", "https://example.com/a?b=c", domain::Deadline::unbounded());

    auto stored = repository_->findByCode(link.code, domain::Deadline::unbounded());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->id, link.id);
    EXPECT_EQ(stored->originalUrl, "https://example.com/a?b=c");
}

TEST_F(LinkRegistryTest, Create_SameUrlTwice_GetsDistinctCodes) {
    auto first = registry_->create("1", "https://example.com", domain::Deadline::unbounded());
    auto second = registry_->create("1", "https://example.com", domain::Deadline::unbounded());

    EXPECT_NE(first.code, second.code);
    EXPECT_NE(first.id, second.id);
}

TEST_F(LinkRegistryTest, Create_ConflictOnInsert_RetriesWithNextCode) {
    // Генератор сначала отдаёт уже занятый код (гонка между проверкой и вставкой)
    repository_->insert(domain::Link("owner-0", "https://taken.example", "TAKEN1"),
                        domain::Deadline::unbounded());

    auto mockGenerator = std::make_shared<MockCodeGenerator>();
    EXPECT_CALL(*mockGenerator, generate(_, _))
        .WillOnce(Return("TAKEN1"))
        .WillOnce(Return("FRESH2"));

    LinkRegistry registry(settings_, mockGenerator, repository_, metrics_);
    auto link = registry.create("1", "https://example.com", domain::Deadline::unbounded());

    EXPECT_EQ(link.code, "FRESH2");
    EXPECT_EQ(link.id, 2);
    EXPECT_EQ(repository_->size(), 2u);
    EXPECT_EQ(metrics_->value("code_collisions_total"), 1);

    // Занятый код по-прежнему принадлежит первой ссылке
    auto taken = repository_->findByCode("TAKEN1", domain::Deadline::unbounded());
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->originalUrl, "https://taken.example");
}

TEST_F(LinkRegistryTest, Create_ConflictEveryTime_ThrowsExhaustionWithinBound) {
    auto bounded = std::make_shared<settings::ShortenerSettings>("ab", 1, 4);
    repository_->insert(domain::Link("owner-0", "https://taken.example", "a"),
                        domain::Deadline::unbounded());

    auto mockGenerator = std::make_shared<MockCodeGenerator>();
    EXPECT_CALL(*mockGenerator, generate(_, _))
        .Times(4)
        .WillRepeatedly(Return("a"));

    LinkRegistry registry(bounded, mockGenerator, repository_, metrics_);

    EXPECT_THROW(registry.create("1", "https://example.com", domain::Deadline::unbounded()),
                 domain::ExhaustionError);
    EXPECT_EQ(repository_->size(), 1u);
    EXPECT_EQ(metrics_->value("code_collisions_total"), 4);
}

TEST_F(LinkRegistryTest, Create_GeneratorAndInsertShareOneAttemptBudget) {
    // 3 занятых кандидата + 1 свободный, но вставка проиграла гонку:
    // лимит 4 уже израсходован, генератор повторно не запускается
    auto bounded = std::make_shared<settings::ShortenerSettings>("ab", 4, 4);
    auto mockRepo = std::make_shared<MockLinkRepository>();
    auto generator = std::make_shared<RandomCodeGenerator>(bounded, mockRepo);
    LinkRegistry registry(bounded, generator, mockRepo, metrics_);

    domain::Link taken("owner-0", "https://taken.example", "aaaa");
    EXPECT_CALL(*mockRepo, findByCode(_, _))
        .Times(4)
        .WillOnce(Return(taken))
        .WillOnce(Return(taken))
        .WillOnce(Return(taken))
        .WillOnce(Return(std::nullopt));
    EXPECT_CALL(*mockRepo, insert(_, _))
        .WillOnce(Throw(domain::ConflictError("bbbb")));

    try {
        registry.create("1", "https://example.com", domain::Deadline::unbounded());
        FAIL() << "Expected ExhaustionError";
    } catch (const domain::ExhaustionError& e) {
        EXPECT_EQ(e.attempts(), 4u);
    }
    EXPECT_EQ(metrics_->value("code_collisions_total"), 1);
}

TEST_F(LinkRegistryTest, Create_TinyCodeSpaceFullyOccupied_ThrowsExhaustion) {
    auto tiny = std::make_shared<settings::ShortenerSettings>("ab", 2, 64);
    for (const auto* code : {"aa", "ab", "ba", "bb"}) {
        repository_->insert(domain::Link("owner-0", "https://taken.example", code),
                            domain::Deadline::unbounded());
    }

    auto generator = std::make_shared<RandomCodeGenerator>(tiny, repository_);
    LinkRegistry registry(tiny, generator, repository_, metrics_);

    EXPECT_THROW(registry.create("1", "https://example.com", domain::Deadline::unbounded()),
                 domain::ExhaustionError);
    EXPECT_EQ(repository_->size(), 4u);
}

TEST_F(LinkRegistryTest, Create_TinyCodeSpaceWithOneFreeCode_TakesIt) {
    auto tiny = std::make_shared<settings::ShortenerSettings>("ab", 2, 256);
    for (const auto* code : {"aa", "ab", "ba"}) {
        repository_->insert(domain::Link("owner-0", "https://taken.example", code),
                            domain::Deadline::unbounded());
    }

    auto generator = std::make_shared<RandomCodeGenerator>(tiny, repository_);
    LinkRegistry registry(tiny, generator, repository_, metrics_);

    auto link = registry.create("1", "https://example.com", domain::Deadline::unbounded());
    EXPECT_EQ(link.code, "bb");
}

TEST_F(LinkRegistryTest, Create_StoreUnavailableOnInsert_FailsWithoutRetry) {
    auto mockRepo = std::make_shared<MockLinkRepository>();
    auto mockGenerator = std::make_shared<MockCodeGenerator>();

    EXPECT_CALL(*mockGenerator, generate(_, _)).WillOnce(Return("abc123"));
    EXPECT_CALL(*mockRepo, insert(_, _))
        .WillOnce(Throw(domain::StoreUnavailableError("connection reset")));

    LinkRegistry registry(settings_, mockGenerator, mockRepo, metrics_);

    EXPECT_THROW(registry.create("1", "https://example.com", domain::Deadline::unbounded()),
                 domain::StoreUnavailableError);
    EXPECT_EQ(metrics_->value("links_created_total"), 0);
}

TEST_F(LinkRegistryTest, Create_ExpiredDeadline_NothingPersisted) {
    auto mockGenerator = std::make_shared<MockCodeGenerator>();
    EXPECT_CALL(*mockGenerator, generate(_, _)).Times(0);

    LinkRegistry registry(settings_, mockGenerator, repository_, metrics_);

    auto deadline = domain::Deadline::after(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_THROW(registry.create("1", "https://example.com", deadline), domain::DeadlineExceededError);
    EXPECT_EQ(repository_->size(), 0u);
}

// ============================================
// CONCURRENCY
// ============================================

TEST_F(LinkRegistryTest, Create_Concurrent_AllCodesUnique) {
    const int NUM_THREADS = 8;
    const int LINKS_PER_THREAD = 50;

    std::mutex resultMutex;
    std::vector<domain::Link> created;
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, t, &resultMutex, &created]() {
            for (int i = 0; i < LINKS_PER_THREAD; ++i) {
                auto link = registry_->create(
                    "owner-" + std::to_string(t),
                    "https://example.com/" + std::to_string(t) + "/" + std::to_string(i),
                    domain::Deadline::unbounded());
                std::lock_guard<std::mutex> lock(resultMutex);
                created.push_back(link);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    std::set<std::string> codes;
    std::set<std::int64_t> ids;
    for (const auto& link : created) {
        codes.insert(link.code);
        ids.insert(link.id);
    }

    const size_t expected = NUM_THREADS * LINKS_PER_THREAD;
    EXPECT_EQ(created.size(), expected);
    EXPECT_EQ(codes.size(), expected);
    EXPECT_EQ(ids.size(), expected);
    EXPECT_EQ(repository_->size(), expected);
}

TEST_F(LinkRegistryTest, Create_ConcurrentInTinyCodeSpace_NeverDuplicates) {
    // 16 кодов, 16 потоков по одной ссылке: гонки неизбежны,
    // каждую разрешает уникальный индекс хранилища
    auto tiny = std::make_shared<settings::ShortenerSettings>("abcd", 2, 1000);
    auto generator = std::make_shared<RandomCodeGenerator>(tiny, repository_);
    LinkRegistry registry(tiny, generator, repository_, metrics_);

    std::mutex resultMutex;
    std::set<std::string> codes;
    std::vector<std::thread> threads;

    for (int t = 0; t < 16; ++t) {
        threads.emplace_back([&registry, &resultMutex, &codes, t]() {
            auto link = registry.create("owner", "https://example.com/" + std::to_string(t),
                                        domain::Deadline::unbounded());
            std::lock_guard<std::mutex> lock(resultMutex);
            codes.insert(link.code);
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(codes.size(), 16u);
    EXPECT_EQ(repository_->size(), 16u);
}

// ============================================
// LIST
// ============================================

TEST_F(LinkRegistryTest, ListByOwner_ReturnsOnlyOwnLinks) {
    auto a1 = registry_->create("alice", "https://a.example/1", domain::Deadline::unbounded());
    registry_->create("bob", "https://b.example/1", domain::Deadline::unbounded());
    auto a2 = registry_->create("alice", "https://a.example/2", domain::Deadline::unbounded());

    auto links = registry_->listByOwner("alice", domain::Deadline::unbounded());

    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[0].code, a1.code);
    EXPECT_EQ(links[1].code, a2.code);
}

TEST_F(LinkRegistryTest, ListByOwner_UnknownOwner_Empty) {
    registry_->create("alice", "https://a.example/1", domain::Deadline::unbounded());

    EXPECT_TRUE(registry_->listByOwner("nobody", domain::Deadline::unbounded()).empty());
}
