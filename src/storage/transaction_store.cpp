// File: src/storage/transaction_store.cpp
#include "storage/transaction_store.hpp"
#include <stdexcept>

namespace trendsketch {

namespace {

const char* kInsertSql =
    "INSERT INTO transactions (order_date, entity, category, quantity, unit_price, profit) "
    "VALUES (?, ?, ?, ?, ?, ?);";

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

TransactionStore::TransactionStore(const Config& config)
    : config_(config) {

    int flags = SQLITE_OPEN_READWRITE;
    if (config_.create_if_missing) {
        flags |= SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(config_.db_path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

TransactionStore::~TransactionStore() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void TransactionStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    if (config_.create_if_missing) {
        CreateTables();
    }
}

void TransactionStore::CreateTables() {
    std::string create_table = R"(
        CREATE TABLE IF NOT EXISTS transactions (
            id INTEGER PRIMARY KEY,
            order_date TEXT NOT NULL,
            entity TEXT NOT NULL,
            category TEXT,
            quantity REAL NOT NULL DEFAULT 0,
            unit_price REAL NOT NULL DEFAULT 0,
            profit REAL NOT NULL DEFAULT 0
        );
    )";

    if (!ExecuteSQL(create_table)) {
        throw std::runtime_error("Failed to create transactions table: " +
                                 std::string(sqlite3_errmsg(db_)));
    }

    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_entity ON transactions(entity);");
}

bool TransactionStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (error_msg) {
        sqlite3_free(error_msg);
    }
    return rc == SQLITE_OK;
}

// ============================================================================
// Writes
// ============================================================================

void TransactionStore::BindRecord(sqlite3_stmt* stmt, const TransactionRecord& record) {
    sqlite3_bind_text(stmt, 1, record.order_date.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.entity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.category.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 4, record.quantity);
    sqlite3_bind_double(stmt, 5, record.unit_price);
    sqlite3_bind_double(stmt, 6, record.profit);
}

bool TransactionStore::Insert(const TransactionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    BindRecord(stmt, record);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return false;
    }

    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool TransactionStore::InsertAllLocked(const std::vector<TransactionRecord>& records) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    for (const auto& record : records) {
        BindRecord(stmt, record);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return false;
        }

        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }

    sqlite3_finalize(stmt);
    return true;
}

size_t TransactionStore::InsertBatch(const std::vector<TransactionRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (records.empty()) {
        return 0;
    }

    BeginTransaction();
    if (!InsertAllLocked(records)) {
        RollbackTransaction();
        return 0;
    }
    CommitTransaction();

    total_writes_.fetch_add(records.size(), std::memory_order_relaxed);
    return records.size();
}

size_t TransactionStore::ReplaceAll(const std::vector<TransactionRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("BEGIN IMMEDIATE TRANSACTION;")) {
        throw std::runtime_error("Failed to begin replacement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }

    if (!ExecuteSQL("DELETE FROM transactions;") || !InsertAllLocked(records)) {
        std::string error = sqlite3_errmsg(db_);
        RollbackTransaction();
        throw std::runtime_error("Failed to replace transactions: " + error);
    }

    if (!ExecuteSQL("COMMIT;")) {
        std::string error = sqlite3_errmsg(db_);
        RollbackTransaction();
        throw std::runtime_error("Failed to commit replacement: " + error);
    }

    total_writes_.fetch_add(records.size(), std::memory_order_relaxed);
    return records.size();
}

void TransactionStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ExecuteSQL("DELETE FROM transactions;")) {
        throw std::runtime_error("Failed to clear transactions: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
}

// ============================================================================
// Reads
// ============================================================================

std::string TransactionStore::ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

std::vector<TransactionRecord> TransactionStore::LoadAll() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT order_date, entity, category, quantity, unit_price, profit "
        "FROM transactions ORDER BY id;";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to query transactions: " +
                                 std::string(sqlite3_errmsg(db_)));
    }

    std::vector<TransactionRecord> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        TransactionRecord record;
        record.order_date = ColumnText(stmt, 0);
        record.entity = ColumnText(stmt, 1);
        record.category = ColumnText(stmt, 2);
        record.quantity = sqlite3_column_double(stmt, 3);
        record.unit_price = sqlite3_column_double(stmt, 4);
        record.profit = sqlite3_column_double(stmt, 5);
        records.push_back(std::move(record));
    }

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        throw std::runtime_error("Failed to read transactions: " + error);
    }

    sqlite3_finalize(stmt);
    total_reads_.fetch_add(records.size(), std::memory_order_relaxed);
    return records;
}

size_t TransactionStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT COUNT(*) FROM transactions;";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

void TransactionStore::BeginTransaction() {
    ExecuteSQL("BEGIN TRANSACTION;");
}

void TransactionStore::CommitTransaction() {
    ExecuteSQL("COMMIT;");
}

void TransactionStore::RollbackTransaction() {
    ExecuteSQL("ROLLBACK;");
}

} // namespace trendsketch
