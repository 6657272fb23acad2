// tests/test_tiered_cache_coordinator.cpp
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>

#include <unistd.h>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/cache/InMemoryStore.hpp"
#include "../src/core/KeyBuilder.hpp"
#include "../src/core/TieredCacheCoordinator.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;

namespace fs = std::filesystem;

namespace {
    TableRecord makeRecord(const std::string& item, const std::string& value) {
        TableRecord record;
        record.header = {{"Produto", "Quantidade (L.)"}};
        record.body = {TableGroup{{item, value}, {}}};
        record.footer = {{"Total", value}};
        return record;
    }

    StoreLookup hit(const std::string& value) {
        return StoreLookup{StoreStatus::HIT, value};
    }

    StoreLookup miss() {
        return StoreLookup{StoreStatus::MISS, ""};
    }

    StoreLookup unavailable() {
        return StoreLookup{StoreStatus::UNAVAILABLE, ""};
    }
}

class TieredCacheCoordinatorTest : public ::testing::Test {
protected:
    AppConfig config_;
    fs::path dir_;
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<CacheStatistics> statistics_ = std::make_shared<CacheStatistics>();
    std::shared_ptr<StaticFallbackStore> static_store_;

    const std::map<std::string, std::string> params_ = {{"year", "2023"}};
    const std::string key_ = KeyBuilder::buildKey("producao", {{"year", "2023"}});

    void SetUp() override {
        static std::atomic<int> counter{0};
        dir_ = fs::temp_directory_path() /
               ("vitify_tiers_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::create_directories(dir_);
        config_.short_cache_ttl = 300;
        config_.fallback_cache_ttl = 2592000;
        static_store_ = std::make_shared<StaticFallbackStore>(dir_.string(), 10, std::chrono::minutes(5), logger_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void writeStaticFile(const std::string& name, const std::string& content) {
        std::ofstream out(dir_ / name, std::ios::binary);
        out << content;
    }

    std::unique_ptr<TieredCacheCoordinator> makeCoordinator(std::shared_ptr<IVolatileStore> store) {
        return std::make_unique<TieredCacheCoordinator>(store, static_store_, statistics_, config_, logger_, statsd_);
    }

    static TieredCacheCoordinator::FetchFunction failingFetch(int* calls = nullptr) {
        return [calls]() {
            if (calls) ++*calls;
            return FetchResult::failure(FetchErrorKind::NETWORK, "connection refused");
        };
    }

    static TieredCacheCoordinator::FetchFunction succeedingFetch(const TableRecord& record, int* calls = nullptr) {
        return [record, calls]() {
            if (calls) ++*calls;
            return FetchResult::success(record);
        };
    }
};

TEST_F(TieredCacheCoordinatorTest, ConstructorRejectsNullDependencies) {
    auto store = std::make_shared<InMemoryStore>();
    EXPECT_THROW(TieredCacheCoordinator(nullptr, static_store_, statistics_, config_, logger_, statsd_), std::invalid_argument);
    EXPECT_THROW(TieredCacheCoordinator(store, nullptr, statistics_, config_, logger_, statsd_), std::invalid_argument);
    EXPECT_THROW(TieredCacheCoordinator(store, static_store_, statistics_, config_, nullptr, statsd_), std::invalid_argument);
}

TEST_F(TieredCacheCoordinatorTest, ShortTermHitSkipsFetch) {
    auto store = std::make_shared<StrictMock<MockVolatileStore>>();
    TableRecord cached = makeRecord("VINHO DE MESA", "100");
    EXPECT_CALL(*store, get("short:" + key_))
        .WillOnce(Return(hit(TieredCacheCoordinator::encodePayload(cached, std::chrono::system_clock::now()))));

    int fetch_calls = 0;
    auto coordinator = makeCoordinator(store);
    Resolution resolution = coordinator->resolve("producao", params_, failingFetch(&fetch_calls));

    ASSERT_TRUE(resolution.ok());
    EXPECT_EQ(resolution.entry->provenance, Provenance::SHORT_TERM);
    EXPECT_EQ(*resolution.entry->payload, cached);
    EXPECT_EQ(fetch_calls, 0);
    ASSERT_EQ(resolution.attempts.size(), 1);
    EXPECT_EQ(statistics_->short_term_hits.load(), 1);
}

TEST_F(TieredCacheCoordinatorTest, FetchSuccessWarmsBothTiers) {
    auto store = std::make_shared<NiceMock<MockVolatileStore>>();
    TableRecord fresh = makeRecord("SUCO DE UVA", "42");
    EXPECT_CALL(*store, get("short:" + key_)).WillOnce(Return(miss()));
    EXPECT_CALL(*store, get("fallback:" + key_)).Times(0);
    EXPECT_CALL(*store, set("short:" + key_, _, 300)).WillOnce(Return(true));
    EXPECT_CALL(*store, set("fallback:" + key_, _, 2592000)).WillOnce(Return(true));

    auto coordinator = makeCoordinator(store);
    Resolution resolution = coordinator->resolve("producao", params_, succeedingFetch(fresh));

    ASSERT_TRUE(resolution.ok());
    EXPECT_EQ(resolution.entry->provenance, Provenance::FRESH);
    EXPECT_EQ(*resolution.entry->payload, fresh);
    EXPECT_EQ(statistics_->fetch_successes.load(), 1);
    EXPECT_EQ(statistics_->store_write_failures.load(), 0);
}

TEST_F(TieredCacheCoordinatorTest, FailedWarmWriteStillServesFreshData) {
    auto store = std::make_shared<NiceMock<MockVolatileStore>>();
    ON_CALL(*store, get(_)).WillByDefault(Return(unavailable()));
    ON_CALL(*store, set(_, _, _)).WillByDefault(Return(false));

    auto coordinator = makeCoordinator(store);
    Resolution resolution = coordinator->resolve("producao", params_, succeedingFetch(makeRecord("A", "1")));

    ASSERT_TRUE(resolution.ok());
    EXPECT_EQ(resolution.entry->provenance, Provenance::FRESH);
    EXPECT_EQ(statistics_->store_write_failures.load(), 2);
}

TEST_F(TieredCacheCoordinatorTest, LongTermHitAfterFetchFailure) {
    auto store = std::make_shared<NiceMock<MockVolatileStore>>();
    TableRecord stale = makeRecord("DERIVADOS", "7");
    auto stored_at = std::chrono::system_clock::from_time_t(1700000000);
    EXPECT_CALL(*store, get("short:" + key_)).WillOnce(Return(miss()));
    EXPECT_CALL(*store, get("fallback:" + key_))
        .WillOnce(Return(hit(TieredCacheCoordinator::encodePayload(stale, stored_at))));
    EXPECT_CALL(*store, set(_, _, _)).Times(0);

    auto coordinator = makeCoordinator(store);
    Resolution resolution = coordinator->resolve("producao", params_, failingFetch());

    ASSERT_TRUE(resolution.ok());
    EXPECT_EQ(resolution.entry->provenance, Provenance::LONG_TERM);
    EXPECT_EQ(resolution.entry->stored_at, stored_at);
    ASSERT_EQ(resolution.attempts.size(), 3);
    EXPECT_EQ(resolution.attempts[1].outcome, AttemptOutcome::FAILED);
    EXPECT_THAT(resolution.attempts[1].detail, HasSubstr("connection refused"));
    EXPECT_EQ(statistics_->fetch_failures.load(), 1);
}

TEST_F(TieredCacheCoordinatorTest, CorruptPayloadCountsAsMiss) {
    auto store = std::make_shared<NiceMock<MockVolatileStore>>();
    EXPECT_CALL(*store, get("short:" + key_)).WillOnce(Return(hit("{not json")));
    EXPECT_CALL(*store, get("fallback:" + key_)).WillOnce(Return(hit("{\"data\": 5}")));
    writeStaticFile("Producao.csv", "Produto;Quantidade\nVINHO DE MESA;1\n");

    auto coordinator = makeCoordinator(store);
    Resolution resolution = coordinator->resolve("producao", params_, failingFetch());

    ASSERT_TRUE(resolution.ok());
    EXPECT_EQ(resolution.entry->provenance, Provenance::STATIC_FALLBACK);
    EXPECT_EQ(statistics_->corrupt_payloads.load(), 2);
    EXPECT_EQ(resolution.attempts[0].detail, "corrupt payload");
}

TEST_F(TieredCacheCoordinatorTest, ExhaustionReportsEveryTier) {
    auto store = std::make_shared<NiceMock<MockVolatileStore>>();
    ON_CALL(*store, get(_)).WillByDefault(Return(miss()));
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::DATA_UNAVAILABLE, 1)).Times(1);

    auto coordinator = makeCoordinator(store);
    Resolution resolution = coordinator->resolve("producao", params_, failingFetch());

    EXPECT_FALSE(resolution.ok());
    ASSERT_EQ(resolution.attempts.size(), 4);
    EXPECT_EQ(resolution.attempts[0].step, ResolutionStep::SHORT_TERM);
    EXPECT_EQ(resolution.attempts[1].step, ResolutionStep::LIVE_FETCH);
    EXPECT_EQ(resolution.attempts[2].step, ResolutionStep::LONG_TERM);
    EXPECT_EQ(resolution.attempts[3].step, ResolutionStep::STATIC_FALLBACK);
    EXPECT_EQ(statistics_->unavailable_outcomes.load(), 1);

    json attempts = resolution.attemptsJson();
    ASSERT_TRUE(attempts.is_array());
    EXPECT_EQ(attempts[1]["tier"], "live_fetch");
    EXPECT_EQ(attempts[1]["outcome"], "failed");
    EXPECT_EQ(attempts[3]["tier"], "csv_fallback");
}

TEST_F(TieredCacheCoordinatorTest, FreshFetchThenShortTermHit) {
    auto store = std::make_shared<InMemoryStore>();
    auto coordinator = makeCoordinator(store);
    TableRecord r = makeRecord("VINHO DE MESA", "169.762.429");

    int fetch_calls = 0;
    Resolution first = coordinator->resolve("producao", params_, succeedingFetch(r, &fetch_calls));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(ProvenanceUtils::toCachedFlag(first.entry->provenance), json(false));
    EXPECT_EQ(*first.entry->payload, r);

    Resolution second = coordinator->resolve("producao", params_, succeedingFetch(r, &fetch_calls));
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(ProvenanceUtils::toCachedFlag(second.entry->provenance), json("short_term"));
    EXPECT_EQ(*second.entry->payload, r);
    EXPECT_EQ(fetch_calls, 1);
}

TEST_F(TieredCacheCoordinatorTest, FailedFetchServesLongTermTier) {
    auto store = std::make_shared<InMemoryStore>();
    TableRecord r2 = makeRecord("SUCO DE UVA", "2");
    ASSERT_TRUE(store->set("fallback:" + key_, TieredCacheCoordinator::encodePayload(r2, std::chrono::system_clock::now()), 600));

    auto coordinator = makeCoordinator(store);
    Resolution resolution = coordinator->resolve("producao", params_, failingFetch());

    ASSERT_TRUE(resolution.ok());
    EXPECT_EQ(ProvenanceUtils::toCachedFlag(resolution.entry->provenance), json("fallback"));
    EXPECT_EQ(*resolution.entry->payload, r2);
}

TEST_F(TieredCacheCoordinatorTest, UnavailableStoreServesStaticSnapshot) {
    auto store = std::make_shared<NiceMock<MockVolatileStore>>();
    ON_CALL(*store, get(_)).WillByDefault(Return(unavailable()));
    ON_CALL(*store, name()).WillByDefault(Return("redis"));
    writeStaticFile("Producao.csv", "Produto;Quantidade (L.)\nVINHO DE MESA;3\nTotal;3\n");

    auto coordinator = makeCoordinator(store);
    Resolution resolution = coordinator->resolve("producao", params_, failingFetch());

    ASSERT_TRUE(resolution.ok());
    EXPECT_EQ(ProvenanceUtils::toCachedFlag(resolution.entry->provenance), json("csv_fallback"));
    EXPECT_EQ(resolution.entry->payload->body[0].item_data, (TableRow{"VINHO DE MESA", "3"}));
    EXPECT_EQ(resolution.attempts[0].outcome, AttemptOutcome::UNAVAILABLE);
    EXPECT_EQ(resolution.attempts[2].outcome, AttemptOutcome::UNAVAILABLE);
    EXPECT_EQ(statistics_->store_unavailable.load(), 2);
    EXPECT_EQ(statistics_->static_hits.load(), 1);
}

TEST_F(TieredCacheCoordinatorTest, StaticTierUsesSubOptionFile) {
    auto store = std::make_shared<NiceMock<MockVolatileStore>>();
    ON_CALL(*store, get(_)).WillByDefault(Return(miss()));
    writeStaticFile("ProcessaViniferas.csv", "Cultivar;kg\nTINTAS;1\n");
    writeStaticFile("ProcessaMesa.csv", "Cultivar;kg\nNIAGARA;9\n");

    auto coordinator = makeCoordinator(store);
    Resolution resolution = coordinator->resolve("processamento", {{"sub_option", "mesa"}}, failingFetch());

    ASSERT_TRUE(resolution.ok());
    EXPECT_EQ(resolution.entry->payload->body[0].item_data[0], "NIAGARA");
}

TEST_F(TieredCacheCoordinatorTest, PayloadEncodingShape) {
    TableRecord record = makeRecord("A", "1");
    auto stored_at = std::chrono::system_clock::from_time_t(1700000000);
    json encoded = json::parse(TieredCacheCoordinator::encodePayload(record, stored_at));
    EXPECT_EQ(encoded["cached"], true);
    EXPECT_EQ(encoded["timestamp"], "2023-11-14T22:13:20Z");
    EXPECT_EQ(encoded["data"]["body"][0]["item_data"][0], "A");

    auto decoded = TieredCacheCoordinator::decodePayload(encoded.dump());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->first, record);
    EXPECT_EQ(decoded->second, stored_at);

    EXPECT_FALSE(TieredCacheCoordinator::decodePayload("[]").has_value());
    EXPECT_FALSE(TieredCacheCoordinator::decodePayload("{\"data\": {\"body\": 3}}").has_value());
}
