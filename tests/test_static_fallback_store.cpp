// tests/test_static_fallback_store.cpp
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <unistd.h>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/cache/StaticFallbackStore.hpp"

using ::testing::_;
using ::testing::NiceMock;

namespace fs = std::filesystem;

class StaticFallbackStoreTest : public ::testing::Test {
protected:
    fs::path dir_;
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();

    void SetUp() override {
        static std::atomic<int> counter{0};
        dir_ = fs::temp_directory_path() /
               ("vitify_static_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::ofstream out(dir_ / name, std::ios::binary);
        out << content;
    }

    std::unique_ptr<StaticFallbackStore> makeStore(size_t capacity = 10,
                                                   std::chrono::milliseconds ttl = std::chrono::minutes(5)) {
        return std::make_unique<StaticFallbackStore>(dir_.string(), capacity, ttl, logger_);
    }
};

TEST_F(StaticFallbackStoreTest, LoadsDefaultFile) {
    writeFile("Producao.csv", "Produto;2023\nVINHO DE MESA;100\nTotal;100\n");
    auto store = makeStore();

    auto record = store->lookup("producao", std::nullopt);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->header[0], (TableRow{"Produto", "2023"}));
    EXPECT_EQ(record->body.size(), 1);
    EXPECT_EQ(record->footer.size(), 1);
}

TEST_F(StaticFallbackStoreTest, SubOptionSelectsItsFile) {
    writeFile("ProcessaViniferas.csv", "Cultivar;kg\nTINTAS;10\n");
    writeFile("ProcessaAmericanas.csv", "Cultivar;kg\nBORDO;20\n");
    auto store = makeStore();

    auto americanas = store->lookup("processamento", std::string("americanas"));
    ASSERT_NE(americanas, nullptr);
    EXPECT_EQ(americanas->body[0].item_data[0], "BORDO");

    auto fallback_default = store->lookup("processamento", std::string("unknown"));
    ASSERT_NE(fallback_default, nullptr);
    EXPECT_EQ(fallback_default->body[0].item_data[0], "TINTAS");
}

TEST_F(StaticFallbackStoreTest, SecondLookupServedFromCache) {
    writeFile("Comercio.csv", "Produto;L\nVINHO;1\n");
    auto store = makeStore();

    auto first = store->lookup("comercializacao", std::nullopt);
    ASSERT_NE(first, nullptr);
    fs::remove(dir_ / "Comercio.csv");
    auto second = store->lookup("comercializacao", std::nullopt);

    EXPECT_EQ(first.get(), second.get());
    BoundedResultCacheStats stats = store->cacheStats();
    EXPECT_EQ(stats.hits, 1);
    EXPECT_EQ(stats.size, 1);
}

TEST_F(StaticFallbackStoreTest, ClearCacheForcesReload) {
    writeFile("ExpVinho.csv", "Pais;US$\nAlemanha;1\n");
    auto store = makeStore();
    ASSERT_NE(store->lookup("exportacao", std::nullopt), nullptr);

    store->clearCache();
    fs::remove(dir_ / "ExpVinho.csv");

    EXPECT_EQ(store->lookup("exportacao", std::nullopt), nullptr);
}

TEST_F(StaticFallbackStoreTest, MissingOrMalformedFilesAreAbsent) {
    writeFile("ImpVinhos.csv", "Pais;kg\n");  // header only
    EXPECT_CALL(*logger_, warn(_)).Times(::testing::AtLeast(2));
    auto store = makeStore();

    EXPECT_EQ(store->lookup("importacao", std::nullopt), nullptr);
    EXPECT_EQ(store->lookup("producao", std::nullopt), nullptr);
}

TEST_F(StaticFallbackStoreTest, UnknownEndpointIsAbsent) {
    auto store = makeStore();
    EXPECT_EQ(store->lookup("vendas", std::nullopt), nullptr);
}

TEST_F(StaticFallbackStoreTest, MissingDirectoryWarnsAndMisses) {
    EXPECT_CALL(*logger_, warn(_)).Times(::testing::AnyNumber());
    EXPECT_CALL(*logger_, warn(::testing::HasSubstr("does not exist"))).Times(1);
    StaticFallbackStore store((dir_ / "absent").string(), 10, std::chrono::minutes(5), logger_);

    EXPECT_FALSE(store.directoryAvailable());
    EXPECT_EQ(store.lookup("producao", std::nullopt), nullptr);
    EXPECT_EQ(store.validateInventory()["overall_status"], "invalid");
}

TEST_F(StaticFallbackStoreTest, InventoryPartial) {
    writeFile("Producao.csv", "Produto;2023\nVINHO;1\n");
    writeFile("Comercio.csv", "broken");
    auto store = makeStore();

    json report = store->validateInventory();
    EXPECT_EQ(report["overall_status"], "partial");
    EXPECT_EQ(report["total_endpoints"], 5);
    EXPECT_EQ(report["total_files"], 15);
    EXPECT_EQ(report["existing_files"], 2);
    EXPECT_EQ(report["usable_files"], 1);
    EXPECT_EQ(report["missing_files"], 13);
    EXPECT_TRUE(report["endpoints"]["producao"]["valid"].get<bool>());
    EXPECT_FALSE(report["endpoints"]["comercializacao"]["valid"].get<bool>());
    EXPECT_FALSE(report["endpoints"]["comercializacao"]["files"]["Comercio.csv"]["parseable"].get<bool>());
}

TEST_F(StaticFallbackStoreTest, InventoryValidWhenEveryFileParses) {
    const char* files[] = {
        "Producao.csv", "ProcessaViniferas.csv", "ProcessaAmericanas.csv", "ProcessaMesa.csv",
        "ProcessaSemclass.csv", "Comercio.csv", "ImpVinhos.csv", "ImpEspumantes.csv", "ImpFrescas.csv",
        "ImpPassas.csv", "ImpSuco.csv", "ExpVinho.csv", "ExpUva.csv", "ExpEspumantes.csv", "ExpSuco.csv"
    };
    for (const char* file : files) {
        writeFile(file, "col;valor\nlinha;1\n");
    }
    auto store = makeStore();

    json report = store->validateInventory();
    EXPECT_EQ(report["overall_status"], "valid");
    EXPECT_EQ(report["valid_endpoints"], 5);
    EXPECT_TRUE(report["missing_files_list"].empty());
}
