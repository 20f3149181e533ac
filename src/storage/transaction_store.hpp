// File: src/storage/transaction_store.hpp
#pragma once

#include "core/types.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace trendsketch {

/// Transaction record source backed by SQLite
///
/// Stores raw order lines in a single `transactions` table and hands them
/// back in insertion order for series preparation. The engine only reads
/// from it at corpus load time.
class TransactionStore {
public:
    /// Configuration for TransactionStore
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory db)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// Milliseconds to wait on a locked database
        int busy_timeout_ms{5000};

        /// Create the file and schema when missing; otherwise a missing file fails to open
        bool create_if_missing{true};
    };

    /// Open the database, creating it unless create_if_missing is false
    /// @throws std::runtime_error if database cannot be opened or initialized
    explicit TransactionStore(const Config& config);

    /// Destructor - closes database connection
    ~TransactionStore();

    // Prevent copying (SQLite connection is not copyable)
    TransactionStore(const TransactionStore&) = delete;
    TransactionStore& operator=(const TransactionStore&) = delete;

    /// Insert one record
    /// @return true if stored
    bool Insert(const TransactionRecord& record);

    /// Insert records in a single transaction; nothing is stored on failure
    /// @return Number of records stored
    size_t InsertBatch(const std::vector<TransactionRecord>& records);

    /// Replace every stored record in one transaction; the old rows survive on failure
    /// @throws std::runtime_error if the replacement cannot be committed
    size_t ReplaceAll(const std::vector<TransactionRecord>& records);

    /// All records in insertion order
    /// @throws std::runtime_error if the query fails or stops before the last row
    std::vector<TransactionRecord> LoadAll() const;

    /// Number of stored records
    size_t Count() const;

    /// Remove all records
    void Clear();

    const std::string& GetPath() const { return config_.db_path; }

    uint64_t GetTotalReads() const { return total_reads_.load(std::memory_order_relaxed); }
    uint64_t GetTotalWrites() const { return total_writes_.load(std::memory_order_relaxed); }

private:
    Config config_;
    sqlite3* db_{nullptr};

    mutable std::mutex mutex_;

    mutable std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};

    void InitializeDatabase();
    void CreateTables();
    bool ExecuteSQL(const std::string& sql);

    /// Insert with a prepared statement inside an open transaction
    /// @return false on the first failed step
    bool InsertAllLocked(const std::vector<TransactionRecord>& records);

    /// Bind a record to the prepared INSERT statement
    static void BindRecord(sqlite3_stmt* stmt, const TransactionRecord& record);

    /// Read a column as std::string ("" for NULL)
    static std::string ColumnText(sqlite3_stmt* stmt, int column);

    void BeginTransaction();
    void CommitTransaction();
    void RollbackTransaction();
};

} // namespace trendsketch
