// File: tests/storage/transaction_store_test.cpp
#include "storage/transaction_store.hpp"
#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <memory>

namespace trendsketch {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

TransactionRecord MakeRecord(const std::string& date, const std::string& entity,
                             double quantity = 1.0) {
    TransactionRecord record;
    record.order_date = date;
    record.entity = entity;
    record.category = "Office";
    record.quantity = quantity;
    record.unit_price = 2.5;
    record.profit = 0.75;
    return record;
}

std::string GetTempDbPath() {
    static int counter = 0;
    return "/tmp/test_transactions_" + std::to_string(std::time(nullptr)) +
           "_" + std::to_string(counter++) + ".db";
}

// Run SQL against a database file outside the store
bool ExecuteRaw(const std::string& path, const std::string& sql) {
    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return false;
    }
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
    sqlite3_close(db);
    return rc == SQLITE_OK;
}

void RemoveDb(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

class TransactionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = GetTempDbPath();
        TransactionStore::Config config;
        config.db_path = db_path_;
        store_ = std::make_unique<TransactionStore>(config);
    }

    void TearDown() override {
        store_.reset();
        RemoveDb(db_path_);
    }

    std::string db_path_;
    std::unique_ptr<TransactionStore> store_;
};

// ============================================================================
// Constructor Tests
// ============================================================================

TEST_F(TransactionStoreTest, NewDatabaseIsEmpty) {
    EXPECT_EQ(0u, store_->Count());
    EXPECT_TRUE(store_->LoadAll().empty());
    EXPECT_EQ(db_path_, store_->GetPath());
}

TEST(TransactionStoreOpenTest, InvalidPathThrows) {
    TransactionStore::Config config;
    config.db_path = "/nonexistent_dir_for_trendsketch/sub/transactions.db";
    EXPECT_THROW(TransactionStore store(config), std::runtime_error);
}

TEST(TransactionStoreOpenTest, MissingFileNotCreatedWhenCreationDisabled) {
    TransactionStore::Config config;
    config.db_path = GetTempDbPath();
    config.create_if_missing = false;

    EXPECT_THROW(TransactionStore store(config), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(config.db_path));
}

TEST(TransactionStoreOpenTest, ExistingFileOpensWhenCreationDisabled) {
    std::string db_path = GetTempDbPath();
    {
        TransactionStore::Config config;
        config.db_path = db_path;
        TransactionStore store(config);
        store.Insert(MakeRecord("2024-01-01", "Pen"));
    }

    TransactionStore::Config config;
    config.db_path = db_path;
    config.create_if_missing = false;
    {
        TransactionStore store(config);
        EXPECT_EQ(1u, store.LoadAll().size());
    }

    RemoveDb(db_path);
}

TEST(TransactionStoreOpenTest, InMemoryDatabase) {
    TransactionStore::Config config;
    config.db_path = ":memory:";
    TransactionStore store(config);

    EXPECT_TRUE(store.Insert(MakeRecord("2024-01-01", "Pen")));
    EXPECT_EQ(1u, store.Count());
}

// ============================================================================
// Insert and Load Tests
// ============================================================================

TEST_F(TransactionStoreTest, InsertAndLoad) {
    TransactionRecord record = MakeRecord("2024-05-17", "Desk Lamp", 3.0);
    ASSERT_TRUE(store_->Insert(record));

    auto records = store_->LoadAll();
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("2024-05-17", records[0].order_date);
    EXPECT_EQ("Desk Lamp", records[0].entity);
    EXPECT_EQ("Office", records[0].category);
    EXPECT_DOUBLE_EQ(3.0, records[0].quantity);
    EXPECT_DOUBLE_EQ(2.5, records[0].unit_price);
    EXPECT_DOUBLE_EQ(0.75, records[0].profit);
}

TEST_F(TransactionStoreTest, LoadPreservesInsertionOrder) {
    store_->Insert(MakeRecord("2024-03-01", "C"));
    store_->Insert(MakeRecord("2024-01-01", "A"));
    store_->Insert(MakeRecord("2024-02-01", "B"));

    auto records = store_->LoadAll();
    ASSERT_EQ(3u, records.size());
    EXPECT_EQ("C", records[0].entity);
    EXPECT_EQ("A", records[1].entity);
    EXPECT_EQ("B", records[2].entity);
}

TEST_F(TransactionStoreTest, InsertBatch) {
    std::vector<TransactionRecord> records;
    for (int i = 0; i < 100; ++i) {
        records.push_back(MakeRecord("2024-01-01", "E" + std::to_string(i), i));
    }

    EXPECT_EQ(100u, store_->InsertBatch(records));
    EXPECT_EQ(100u, store_->Count());
    EXPECT_EQ(100u, store_->GetTotalWrites());

    auto loaded = store_->LoadAll();
    ASSERT_EQ(100u, loaded.size());
    EXPECT_EQ("E42", loaded[42].entity);
    EXPECT_DOUBLE_EQ(42.0, loaded[42].quantity);
}

TEST_F(TransactionStoreTest, InsertEmptyBatch) {
    EXPECT_EQ(0u, store_->InsertBatch({}));
    EXPECT_EQ(0u, store_->Count());
}

TEST_F(TransactionStoreTest, EmptyCategoryRoundTrips) {
    TransactionRecord record = MakeRecord("2024-01-01", "Pen");
    record.category = "";
    store_->Insert(record);

    EXPECT_EQ("", store_->LoadAll()[0].category);
}

TEST_F(TransactionStoreTest, Clear) {
    store_->InsertBatch({MakeRecord("2024-01-01", "A"), MakeRecord("2024-01-02", "B")});
    ASSERT_EQ(2u, store_->Count());

    store_->Clear();

    EXPECT_EQ(0u, store_->Count());
}

TEST_F(TransactionStoreTest, ReplaceAllSwapsContents) {
    store_->InsertBatch({MakeRecord("2024-01-01", "Old A"), MakeRecord("2024-01-02", "Old B")});

    EXPECT_EQ(1u, store_->ReplaceAll({MakeRecord("2024-02-01", "New")}));

    auto records = store_->LoadAll();
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("New", records[0].entity);
}

TEST_F(TransactionStoreTest, ReplaceAllWithNothingEmptiesStore) {
    store_->Insert(MakeRecord("2024-01-01", "A"));

    EXPECT_EQ(0u, store_->ReplaceAll({}));
    EXPECT_EQ(0u, store_->Count());
}

TEST_F(TransactionStoreTest, FailedReplaceKeepsExistingRows) {
    store_->InsertBatch({MakeRecord("2024-01-01", "Keep A"), MakeRecord("2024-01-02", "Keep B")});
    ASSERT_TRUE(ExecuteRaw(db_path_,
        "CREATE TRIGGER reject_bad BEFORE INSERT ON transactions "
        "WHEN NEW.entity = 'Bad' BEGIN SELECT RAISE(ABORT, 'rejected'); END;"));

    std::vector<TransactionRecord> replacement{
        MakeRecord("2024-03-01", "Fine"),
        MakeRecord("2024-03-02", "Bad"),
    };
    EXPECT_THROW(store_->ReplaceAll(replacement), std::runtime_error);

    auto records = store_->LoadAll();
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ("Keep A", records[0].entity);
    EXPECT_EQ("Keep B", records[1].entity);
}

TEST_F(TransactionStoreTest, ReadCounter) {
    store_->InsertBatch({MakeRecord("2024-01-01", "A"), MakeRecord("2024-01-02", "B")});
    store_->LoadAll();
    EXPECT_EQ(2u, store_->GetTotalReads());
}

TEST(TransactionStoreReadTest, ScanErrorIsReported) {
    std::string db_path = GetTempDbPath();

    // The second row fails while stepping (abs of the smallest integer overflows)
    ASSERT_TRUE(ExecuteRaw(db_path,
        "CREATE TABLE raw_orders (id INTEGER PRIMARY KEY, order_date TEXT, entity TEXT, "
        "category TEXT, quantity, unit_price REAL, profit REAL);"
        "INSERT INTO raw_orders VALUES (1, '2024-01-01', 'Pen', 'Office', 1, 2.0, 0.5);"
        "INSERT INTO raw_orders VALUES (2, '2024-01-02', 'Ink', 'Office', "
        "-9223372036854775807 - 1, 2.0, 0.5);"
        "CREATE VIEW transactions AS SELECT id, order_date, entity, category, "
        "abs(quantity) AS quantity, unit_price, profit FROM raw_orders;"));

    {
        TransactionStore::Config config;
        config.db_path = db_path;
        config.create_if_missing = false;
        TransactionStore store(config);

        EXPECT_THROW(store.LoadAll(), std::runtime_error);
    }

    RemoveDb(db_path);
}

// ============================================================================
// Persistence Tests
// ============================================================================

TEST(TransactionStorePersistenceTest, DataSurvivesReopen) {
    std::string db_path = GetTempDbPath();

    {
        TransactionStore::Config config;
        config.db_path = db_path;
        TransactionStore store(config);
        store.Insert(MakeRecord("2024-06-01", "Chair", 2.0));
    }

    {
        TransactionStore::Config config;
        config.db_path = db_path;
        TransactionStore store(config);
        auto records = store.LoadAll();
        ASSERT_EQ(1u, records.size());
        EXPECT_EQ("Chair", records[0].entity);
    }

    RemoveDb(db_path);
}

} // namespace
} // namespace trendsketch
