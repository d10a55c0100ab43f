#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "services/media_service.h"
#include "services/cache_key_deriver.h"
#include "exceptions/media_exceptions.h"
#include "utils/logger.h"
#include "utils/metrics.h"
#include "mocks/fake_clock.h"
#include "mocks/fake_image_transformer.h"
#include "mocks/fake_source_storage.h"
#include "mocks/mock_source_storage.h"
#include "test_helpers/test_constants.h"
#include "test_helpers/test_builders.h"
#include "test_helpers/test_file_manager.h"
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace lumen;
using namespace lumen::testing;
using namespace lumen::test_constants;
using namespace lumen::test_builders;
using namespace lumen::test_helpers;
using ::testing::_;
using ::testing::Return;
using ::testing::ReturnRef;

using OptStr = std::optional<std::string>;

class MediaServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Initialize logger and metrics for tests
        Logger::initialize("lumen-test", "error", Logger::Format::TEXT, "test");
        Metrics::initialize("LumenTest", "lumen-test", "test", false);

        cache_dir_ = std::make_unique<TempDirectory>("media_cache_");
        clock_ = std::make_shared<FakeClock>();
        stats_ = std::make_shared<StatsTracker>();
        store_ = std::make_shared<CacheStore>(cache_dir_->str(), stats_, clock_);
        sweeper_ = std::make_shared<EvictionSweeper>(store_, clock_, ONE_HOUR);
        storage_ = std::make_shared<FakeSourceStorage>();
        transformer_ = std::make_shared<CountingImageTransformer>();

        storage_->put(PRODUCT_IMAGE_PATH, TestDataBuilder::createBinaryData(MEDIUM_DATA_SIZE), FINGERPRINT_V1);
        service_ = makeService(SizePolicyBuilder::defaultBounded(), std::chrono::seconds(30));
    }

    void TearDown() override {
        // Let any abandoned worker finish
        transformer_->release();
    }

    std::shared_ptr<MediaService> makeService(SizePolicy policy, std::chrono::milliseconds timeout) {
        return std::make_shared<MediaService>(
            storage_, transformer_, store_, sweeper_, std::move(policy), SEVEN_DAYS, timeout);
    }

    static std::string body(const Thumbnail& thumbnail) {
        return std::string(thumbnail.bytes.begin(), thumbnail.bytes.end());
    }

    std::unique_ptr<TempDirectory> cache_dir_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<StatsTracker> stats_;
    std::shared_ptr<CacheStore> store_;
    std::shared_ptr<EvictionSweeper> sweeper_;
    std::shared_ptr<FakeSourceStorage> storage_;
    std::shared_ptr<CountingImageTransformer> transformer_;
    std::shared_ptr<MediaService> service_;
};

// ============================================================================
// Cache Miss / Hit Tests
// ============================================================================

TEST_F(MediaServiceTest, GetThumbnail_FirstRequest_MissThenHit) {
    // Act
    Thumbnail first = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
    Thumbnail second = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));

    // Assert
    EXPECT_FALSE(first.served_from_cache) << "First request is computed";
    EXPECT_TRUE(second.served_from_cache) << "Second request is served from the cache";
    EXPECT_EQ(first.bytes, second.bytes);
    EXPECT_EQ(MIME_JPEG, second.content_type);
    EXPECT_EQ(1, transformer_->calls());

    CacheStats stats = service_->getCacheStats();
    EXPECT_EQ(1u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
    EXPECT_EQ(1u, stats.entries);
    EXPECT_EQ(first.bytes.size(), stats.total_bytes);
}

TEST_F(MediaServiceTest, GetThumbnail_NoDimensions_UsesDefaultSize) {
    Thumbnail thumbnail = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr(), OptStr());

    EXPECT_EQ("thumb:800x800:" + std::to_string(MEDIUM_DATA_SIZE), body(thumbnail));
}

TEST_F(MediaServiceTest, GetThumbnail_TypedOverload_SameCacheEntry) {
    service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));

    Thumbnail typed = service_->getThumbnail(PRODUCT_IMAGE_PATH, std::optional<int>(400),
                                             std::optional<int>(400));

    EXPECT_TRUE(typed.served_from_cache);
}

TEST_F(MediaServiceTest, GetThumbnail_EquivalentPathSpelling_SharesEntry) {
    service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));

    Thumbnail thumbnail = service_->getThumbnail("/" + PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));

    EXPECT_TRUE(thumbnail.served_from_cache);
}

TEST_F(MediaServiceTest, GetThumbnail_DifferentSizes_SeparateEntries) {
    Thumbnail small = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("100"), OptStr("100"));
    Thumbnail large = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));

    EXPECT_NE(small.bytes, large.bytes);
    EXPECT_EQ(2u, service_->getCacheStats().entries);
}

TEST_F(MediaServiceTest, GetThumbnail_SourceReplaced_RecomputesUnderNewKey) {
    // Arrange
    service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
    storage_->put(PRODUCT_IMAGE_PATH, TestDataBuilder::createBinaryData(SMALL_DATA_SIZE), FINGERPRINT_V2);

    // Act
    Thumbnail thumbnail = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));

    // Assert
    EXPECT_FALSE(thumbnail.served_from_cache) << "A new fingerprint never hits the old entry";
    EXPECT_EQ("thumb:400x400:" + std::to_string(SMALL_DATA_SIZE), body(thumbnail));
    EXPECT_EQ(2, transformer_->calls());
    EXPECT_EQ(2u, service_->getCacheStats().entries) << "The old entry lingers until it expires";
}

TEST_F(MediaServiceTest, GetThumbnail_AfterTtl_Recomputes) {
    service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
    clock_->advance(SEVEN_DAYS);

    Thumbnail thumbnail = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));

    EXPECT_FALSE(thumbnail.served_from_cache);
    EXPECT_EQ(2, transformer_->calls());
    EXPECT_EQ(1u, service_->getCacheStats().entries) << "The refreshed entry replaces the expired one";
}

TEST_F(MediaServiceTest, GetThumbnail_IndependentServices_IdenticalBytes) {
    // Arrange
    TempDirectory other_dir("media_cache_other_");
    auto other_store = std::make_shared<CacheStore>(other_dir.str(), std::make_shared<StatsTracker>(), clock_);
    auto other = std::make_shared<MediaService>(
        storage_, transformer_, other_store, sweeper_, SizePolicyBuilder::defaultBounded(),
        SEVEN_DAYS, std::chrono::seconds(30));

    // Act
    Thumbnail first = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("200"), OptStr("200"));
    Thumbnail second = other->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("200"), OptStr("200"));

    // Assert
    EXPECT_EQ(first.bytes, second.bytes) << "Same source and size must give the same bytes";
}

// ============================================================================
// Request Validation Tests
// ============================================================================

TEST_F(MediaServiceTest, GetThumbnail_WidthOnly_InvalidRequestWithoutStorageAccess) {
    EXPECT_THROW(service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr()),
                 exceptions::InvalidRequestException);

    EXPECT_EQ(0, storage_->fingerprintCalls()) << "Validation happens before any I/O";
    EXPECT_EQ(0u, service_->getCacheStats().misses);
}

TEST_F(MediaServiceTest, GetThumbnail_StrictPolicyUnlistedSize_ThrowsSizePolicyViolation) {
    auto strict = makeService(SizePolicyBuilder::defaultStrict(), std::chrono::seconds(30));

    EXPECT_THROW(strict->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("300"), OptStr("300")),
                 exceptions::SizePolicyViolationException);
    EXPECT_EQ(0, transformer_->calls());
}

TEST_F(MediaServiceTest, GetThumbnail_TraversalPath_ThrowsInvalidRequest) {
    EXPECT_THROW(service_->getThumbnail("uploads/../../etc/passwd", OptStr(), OptStr()),
                 exceptions::InvalidRequestException);
}

// ============================================================================
// Failure Tests
// ============================================================================

TEST_F(MediaServiceTest, GetThumbnail_MissingSource_ThrowsNotFound) {
    EXPECT_THROW(service_->getThumbnail(MISSING_IMAGE_PATH, OptStr("400"), OptStr("400")),
                 exceptions::NotFoundException);
    EXPECT_EQ(0, transformer_->calls());
}

TEST_F(MediaServiceTest, GetThumbnail_StorageDown_ThrowsStorageUnavailable) {
    storage_->setUnavailable(true);

    EXPECT_THROW(service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400")),
                 exceptions::StorageUnavailableException);
}

TEST_F(MediaServiceTest, GetThumbnail_TransformFails_NothingCachedAndRetryAllowed) {
    // Arrange
    transformer_->setFailure(true);

    // Act & Assert
    EXPECT_THROW(service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400")),
                 exceptions::TransformException);
    EXPECT_EQ(0u, service_->getCacheStats().entries);

    transformer_->setFailure(false);
    Thumbnail thumbnail = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
    EXPECT_FALSE(thumbnail.served_from_cache);
    EXPECT_EQ(2, transformer_->calls()) << "Failures are not cached";
}

TEST_F(MediaServiceTest, GetThumbnail_CacheWriteFails_StillReturnsBytes) {
    // Arrange: block the shard directory the entry would be written to
    std::string key = CacheKeyDeriver::deriveKey(PRODUCT_IMAGE_PATH, 400, 400, FINGERPRINT_V1);
    ASSERT_TRUE(TestFileManager::writeFile(cache_dir_->path() / key.substr(0, 2), TEST_CONTENT));

    // Act
    Thumbnail thumbnail = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));

    // Assert
    EXPECT_EQ("thumb:400x400:" + std::to_string(MEDIUM_DATA_SIZE), body(thumbnail))
        << "Cache write failure must not fail the request";
    EXPECT_FALSE(thumbnail.served_from_cache);
    EXPECT_EQ(0u, service_->getCacheStats().entries);
}

TEST_F(MediaServiceTest, GetThumbnail_TransformTimesOut_ThrowsTransformException) {
    // Arrange
    auto impatient = makeService(SizePolicyBuilder::defaultBounded(), std::chrono::milliseconds(50));
    transformer_->hold();

    // Act & Assert
    EXPECT_THROW(impatient->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400")),
                 exceptions::TransformException);
    EXPECT_EQ(0u, impatient->getCoalescer().inFlight()) << "Timed-out key must be free for retries";

    transformer_->release();
}

TEST_F(MediaServiceTest, GetThumbnail_TimeoutWithFollowers_AllReceiveTransformException) {
    // Arrange
    auto impatient = makeService(SizePolicyBuilder::defaultBounded(), std::chrono::milliseconds(200));
    transformer_->hold();
    std::atomic<int> failures{0};

    // Act
    std::vector<std::thread> threads;
    for (int i = 0; i < CONCURRENT_THREADS_SMALL; ++i) {
        threads.emplace_back([&] {
            try {
                impatient->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
            } catch (const exceptions::TransformException&) {
                failures++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    transformer_->release();

    // Assert
    EXPECT_EQ(CONCURRENT_THREADS_SMALL, failures.load());
    EXPECT_EQ(0u, service_->getCacheStats().entries) << "Abandoned results are discarded";
}

// ============================================================================
// Single-Flight Tests
// ============================================================================

TEST_F(MediaServiceTest, GetThumbnail_ConcurrentMisses_TransformRunsOnce) {
    // Arrange
    transformer_->hold();
    std::vector<Thumbnail> results(CONCURRENT_CALLERS);
    std::vector<std::thread> threads;

    // Act
    for (int i = 0; i < CONCURRENT_CALLERS; ++i) {
        threads.emplace_back([&, i] {
            results[i] = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
        });
    }

    const auto& coalescer = service_->getCoalescer();
    while (coalescer.leaderCount() + coalescer.coalescedCount() <
           static_cast<uint64_t>(CONCURRENT_CALLERS)) {
        std::this_thread::yield();
    }
    transformer_->release();
    for (auto& thread : threads) {
        thread.join();
    }

    // Assert
    EXPECT_EQ(1, transformer_->calls()) << "Exactly one transform for concurrent identical requests";
    EXPECT_EQ(1, storage_->resolveCalls()) << "Exactly one source retrieval";
    for (const auto& result : results) {
        EXPECT_EQ(results[0].bytes, result.bytes);
    }
    EXPECT_EQ(1u, service_->getCacheStats().entries);
    EXPECT_EQ(static_cast<uint64_t>(CONCURRENT_CALLERS), service_->getCacheStats().misses);
}

TEST_F(MediaServiceTest, GetThumbnail_StaggeredConcurrentMisses_TransformRunsOncePerKey) {
    // Callers start at slightly different times and nothing holds the
    // transformer, so late callers can miss the cache just before the first
    // result is stored and reach the coalescer after its record is gone.
    constexpr int ROUNDS = 40;
    int worst = 0;

    for (int round = 0; round < ROUNDS; ++round) {
        // Arrange: a new fingerprint gives a new cache key every round
        storage_->put(PRODUCT_IMAGE_PATH, TestDataBuilder::createBinaryData(SMALL_DATA_SIZE),
                      "fp-round-" + std::to_string(round));
        int calls_before = transformer_->calls();
        std::atomic<bool> go{false};
        std::atomic<int> served{0};

        // Act
        std::vector<std::thread> threads;
        for (int i = 0; i < CONCURRENT_CALLERS; ++i) {
            threads.emplace_back([&, i] {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                std::this_thread::sleep_for(std::chrono::microseconds((i * 37) % 300));
                Thumbnail thumbnail = service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
                if (!thumbnail.bytes.empty()) {
                    served++;
                }
            });
        }
        go.store(true);
        for (auto& thread : threads) {
            thread.join();
        }

        ASSERT_EQ(CONCURRENT_CALLERS, served.load());
        worst = std::max(worst, transformer_->calls() - calls_before);
    }

    // Assert
    EXPECT_EQ(1, worst) << "Concurrent identical requests must share a single transform";
}

// ============================================================================
// Abandoned Worker Tests
// ============================================================================

TEST_F(MediaServiceTest, GetThumbnail_RetryWhileTimedOutWorkerRuns_RejectedWithoutNewWorker) {
    // Arrange
    auto impatient = makeService(SizePolicyBuilder::defaultBounded(), std::chrono::milliseconds(50));
    transformer_->hold();
    EXPECT_THROW(impatient->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400")),
                 exceptions::TransformException);
    ASSERT_EQ(1u, impatient->abandonedWorkers());

    // Act & Assert
    for (int i = 0; i < CONCURRENT_THREADS_SMALL; ++i) {
        EXPECT_THROW(impatient->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400")),
                     exceptions::TransformException);
    }
    EXPECT_EQ(1, transformer_->calls()) << "A stalled key must not spawn more workers";
    EXPECT_EQ(1u, impatient->runningWorkers());

    transformer_->release();
    ASSERT_TRUE(impatient->waitForWorkers(ONE_SECOND));
    EXPECT_EQ(0u, impatient->abandonedWorkers());

    Thumbnail thumbnail = impatient->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
    EXPECT_FALSE(thumbnail.bytes.empty()) << "Key is usable again once the worker returned";
    EXPECT_EQ(2, transformer_->calls());
}

TEST_F(MediaServiceTest, GetThumbnail_TooManyStalledWorkers_RejectsOtherKeys) {
    // Arrange
    auto impatient = makeService(SizePolicyBuilder::defaultBounded(), std::chrono::milliseconds(20));
    transformer_->hold();
    for (size_t i = 0; i < MediaService::MAX_ABANDONED_WORKERS; ++i) {
        int side = THUMB_100 + static_cast<int>(i);
        EXPECT_THROW(impatient->getThumbnail(PRODUCT_IMAGE_PATH, side, side),
                     exceptions::TransformException);
    }
    ASSERT_EQ(MediaService::MAX_ABANDONED_WORKERS, impatient->abandonedWorkers());
    int calls_before = transformer_->calls();

    // Act & Assert
    EXPECT_THROW(impatient->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("1200"), OptStr("1200")),
                 exceptions::TransformException);
    EXPECT_EQ(calls_before, transformer_->calls()) << "No worker is started past the limit";

    transformer_->release();
    EXPECT_TRUE(impatient->waitForWorkers(ONE_SECOND));
    EXPECT_EQ(0u, impatient->runningWorkers());
}

TEST_F(MediaServiceTest, WaitForWorkers_NothingRunning_ReturnsImmediately) {
    EXPECT_TRUE(service_->waitForWorkers(ONE_MILLISECOND));
    EXPECT_EQ(0u, service_->runningWorkers());
}

// ============================================================================
// Collaborator Interaction Tests
// ============================================================================

TEST_F(MediaServiceTest, GetThumbnail_CacheHit_DoesNotResolveSource) {
    // Arrange
    auto mock_storage = std::make_shared<MockSourceStorage>();
    auto service = std::make_shared<MediaService>(
        mock_storage, transformer_, store_, sweeper_, SizePolicyBuilder::defaultBounded(),
        SEVEN_DAYS, std::chrono::seconds(30));

    SourceAsset asset{TestDataBuilder::createData(SMALL_DATA_SIZE), FINGERPRINT_V1};
    EXPECT_CALL(*mock_storage, fingerprint(PRODUCT_IMAGE_PATH))
        .Times(2)
        .WillRepeatedly(Return(FINGERPRINT_V1));
    EXPECT_CALL(*mock_storage, resolve(PRODUCT_IMAGE_PATH))
        .Times(1)
        .WillOnce(Return(asset));

    // Act
    service->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
    Thumbnail second = service->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));

    // Assert
    EXPECT_TRUE(second.served_from_cache);
}

TEST_F(MediaServiceTest, ResolveSource_NormalizesPath) {
    SourceAsset asset = service_->resolveSource("//" + PRODUCT_IMAGE_PATH);

    EXPECT_EQ(FINGERPRINT_V1, asset.fingerprint);
    EXPECT_EQ(MEDIUM_DATA_SIZE, asset.bytes.size());
}

// ============================================================================
// Maintenance Operation Tests
// ============================================================================

TEST_F(MediaServiceTest, ClearExpired_NothingExpired_ReturnsZeroAndKeepsStats) {
    service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("400"), OptStr("400"));
    CacheStats before = service_->getCacheStats();

    size_t cleared = service_->clearExpired();

    EXPECT_EQ(0u, cleared);
    CacheStats after = service_->getCacheStats();
    EXPECT_EQ(before.entries, after.entries);
    EXPECT_EQ(before.total_bytes, after.total_bytes);
}

TEST_F(MediaServiceTest, ClearExpired_AfterTtl_RemovesEntries) {
    service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("100"), OptStr("100"));
    service_->getThumbnail(PRODUCT_IMAGE_PATH, OptStr("200"), OptStr("200"));
    clock_->advance(SEVEN_DAYS + ONE_SECOND);

    EXPECT_EQ(2u, service_->clearExpired());
    EXPECT_EQ(0u, service_->getCacheStats().entries);
    EXPECT_EQ(0u, service_->getCacheStats().total_bytes);
}

TEST_F(MediaServiceTest, ListAllowedSizes_DescribesPolicy) {
    auto listing = service_->listAllowedSizes();

    EXPECT_EQ("bounded", listing["mode"]);
    EXPECT_EQ(DEFAULT_SIZE, listing["default"]["width"]);
}
