#pragma once

/**
 * @file ledger.hpp
 * @brief Transaction ledger for ingestion batches
 *
 * Every ingestion is recorded as a Transaction in
 * <history-dir>/transactions.json. A transaction can be previewed and rolled
 * back later, removing the tasks it added from the manifest. Entries are
 * never deleted; rollback only flips `reverted`.
 *
 * @example
 * ```cpp
 * vtm::FileManifestStore manifest("vtm.json");
 * vtm::FileHistoryStore history(".vtm-history");
 * vtm::Ledger ledger(manifest, history);
 *
 * auto preview = ledger.preview("2025-10-30-001", {true});
 * if (preview.isOk() && preview.value().blocking_dependents.empty()) {
 *     ledger.rollback("2025-10-30-001");
 * }
 * ```
 */

#include "vtm/manifest_store.hpp"
#include "vtm/result.hpp"
#include "vtm/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Transaction
// ============================================================================

struct Transaction {
    std::string id;                       // "YYYY-MM-DD-NNN"
    std::string action = "ingest";
    std::vector<std::string> sources;
    std::string timestamp;                // RFC3339 UTC
    std::string description;
    std::vector<std::string> tasks_added;
    bool reverted = false;
    std::optional<std::string> reverted_at;
};

nlohmann::json transaction_to_json(const Transaction& tx);

struct TransactionParseResult {
    bool ok = false;
    std::string error;
    Transaction transaction;
};

TransactionParseResult parse_transaction(const nlohmann::json& j);

// ============================================================================
// History Storage
// ============================================================================

class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    /// All transactions in recorded order; a missing history is empty
    virtual Result<std::vector<Transaction>> load() = 0;

    virtual Result<void> save(const std::vector<Transaction>& transactions) = 0;

    virtual std::string location() const = 0;
};

/**
 * @brief History persisted as <dir>/transactions.json
 */
class FileHistoryStore : public HistoryStore {
public:
    explicit FileHistoryStore(std::string dir);

    Result<std::vector<Transaction>> load() override;
    Result<void> save(const std::vector<Transaction>& transactions) override;
    std::string location() const override { return path_; }

private:
    std::string dir_;
    std::string path_;
};

class MemoryHistoryStore : public HistoryStore {
public:
    MemoryHistoryStore() = default;
    explicit MemoryHistoryStore(std::string content) : content_(std::move(content)) {}

    Result<std::vector<Transaction>> load() override;
    Result<void> save(const std::vector<Transaction>& transactions) override;
    std::string location() const override { return "<memory history>"; }

    const std::optional<std::string>& content() const { return content_; }

private:
    std::optional<std::string> content_;
};

// Parse a history document; CORRUPT_HISTORY on any schema violation
Result<std::vector<Transaction>> parse_history(const std::string& content,
                                               const std::string& location);

std::string serialize_history(const std::vector<Transaction>& transactions);

// ============================================================================
// Ledger
// ============================================================================

struct HistoryStats {
    int total_entries = 0;
    int reverted_entries = 0;
    int tasks_added = 0;
    std::optional<std::string> oldest;
    std::optional<std::string> newest;
};

struct BlockingDependent {
    std::string task_id;     // task outside the removal set
    std::string depends_on;  // task inside it
};

struct RollbackOptions {
    bool cascade = false;  // also remove every transitive dependent
    bool force = false;    // skip the dependents check; may leave dangling dependencies
};

struct RollbackPreview {
    Transaction transaction;
    std::vector<std::string> tasks_to_remove;   // recorded order, then cascaded
    std::vector<BlockingDependent> blocking_dependents;
    std::vector<std::string> cascaded;          // dependents pulled in by cascade
};

struct RollbackOutcome {
    Transaction transaction;                    // after being marked reverted
    std::vector<std::string> removed;
    std::vector<std::string> cascaded;
};

class Ledger {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    Ledger(ManifestStore& manifest, HistoryStore& history,
           Clock clock = [] { return std::chrono::system_clock::now(); });

    /// Append a transaction for tasks added by one ingestion batch
    Result<Transaction> record(const std::vector<std::string>& sources,
                               const std::vector<std::string>& task_ids,
                               const std::string& description = "");

    /// Newest first; limit 0 means all
    Result<std::vector<Transaction>> history(size_t limit = 0);

    Result<Transaction> find(const std::string& id);

    Result<HistoryStats> history_stats();

    /// What rollback would do; writes nothing
    Result<RollbackPreview> preview(const std::string& id, const RollbackOptions& options = {});

    /// Remove the transaction's tasks (manifest first), then mark it reverted
    Result<RollbackOutcome> rollback(const std::string& id, const RollbackOptions& options = {});

private:
    Result<RollbackPreview> plan(const Manifest& manifest, const Transaction& tx,
                                 const RollbackOptions& options) const;

    ManifestStore& manifest_;
    HistoryStore& history_;
    Clock clock_;
};

} // namespace vtm
