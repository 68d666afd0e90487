#include "vtm/ledger.hpp"
#include "vtm/platform.hpp"

#include <spdlog/spdlog.h>

namespace vtm {

namespace {

const char* kHistoryFile = "transactions.json";

bool read_string_array(const nlohmann::json& j, const std::string& key,
                       std::vector<std::string>& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_array()) return false;
    for (const auto& item : j[key]) {
        if (!item.is_string()) return false;
        out.push_back(item.get<std::string>());
    }
    return true;
}

} // namespace

// ============================================================================
// Transaction (de)serialization
// ============================================================================

nlohmann::json transaction_to_json(const Transaction& tx) {
    nlohmann::json j;
    j["id"] = tx.id;
    j["action"] = tx.action;
    j["sources"] = tx.sources;
    j["timestamp"] = tx.timestamp;
    j["description"] = tx.description;
    j["tasks_added"] = tx.tasks_added;
    j["reverted"] = tx.reverted;
    if (tx.reverted_at) {
        j["reverted_at"] = *tx.reverted_at;
    } else {
        j["reverted_at"] = nullptr;
    }
    return j;
}

TransactionParseResult parse_transaction(const nlohmann::json& j) {
    TransactionParseResult result;

    if (!j.is_object()) {
        result.error = "transaction is not an object";
        return result;
    }
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        result.error = "transaction without id";
        return result;
    }

    Transaction& tx = result.transaction;
    tx.id = j["id"].get<std::string>();

    if (j.contains("action") && j["action"].is_string()) {
        tx.action = j["action"].get<std::string>();
    }
    if (j.contains("timestamp") && j["timestamp"].is_string()) {
        tx.timestamp = j["timestamp"].get<std::string>();
    } else {
        result.error = "transaction " + tx.id + " has no timestamp";
        return result;
    }
    if (j.contains("description") && j["description"].is_string()) {
        tx.description = j["description"].get<std::string>();
    }

    // single "source" string from older histories
    if (j.contains("source") && j["source"].is_string()) {
        tx.sources.push_back(j["source"].get<std::string>());
    }
    if (!read_string_array(j, "sources", tx.sources) ||
        !read_string_array(j, "tasks_added", tx.tasks_added)) {
        result.error = "transaction " + tx.id + " has a malformed list";
        return result;
    }

    if (j.contains("reverted") && j["reverted"].is_boolean()) {
        tx.reverted = j["reverted"].get<bool>();
    }
    if (j.contains("reverted_at") && j["reverted_at"].is_string()) {
        tx.reverted_at = j["reverted_at"].get<std::string>();
    }

    result.ok = true;
    return result;
}

Result<std::vector<Transaction>> parse_history(const std::string& content,
                                               const std::string& location) {
    std::vector<Transaction> out;

    try {
        auto j = nlohmann::json::parse(content);

        const nlohmann::json* list = nullptr;
        if (j.is_array()) {
            list = &j;
        } else if (j.is_object() && j.contains("transactions") && j["transactions"].is_array()) {
            list = &j["transactions"];
        } else {
            return Result<std::vector<Transaction>>::err(
                Error(ErrorCode::CORRUPT_HISTORY, "expected a \"transactions\" array")
                    .withContext(location));
        }

        for (const auto& item : *list) {
            auto parsed = parse_transaction(item);
            if (!parsed.ok) {
                return Result<std::vector<Transaction>>::err(
                    Error(ErrorCode::CORRUPT_HISTORY, parsed.error).withContext(location));
            }
            out.push_back(std::move(parsed.transaction));
        }
    } catch (const nlohmann::json::parse_error& e) {
        return Result<std::vector<Transaction>>::err(
            Error(ErrorCode::CORRUPT_HISTORY, std::string("JSON parse error: ") + e.what())
                .withContext(location));
    }

    return Result<std::vector<Transaction>>::ok(std::move(out));
}

std::string serialize_history(const std::vector<Transaction>& transactions) {
    nlohmann::json j;
    j["transactions"] = nlohmann::json::array();
    for (const auto& tx : transactions) {
        j["transactions"].push_back(transaction_to_json(tx));
    }
    return j.dump(2) + "\n";
}

// ============================================================================
// FileHistoryStore
// ============================================================================

FileHistoryStore::FileHistoryStore(std::string dir)
    : dir_(std::move(dir)), path_(join_path(dir_, kHistoryFile)) {}

Result<std::vector<Transaction>> FileHistoryStore::load() {
    if (!path_exists(path_)) {
        return Result<std::vector<Transaction>>::ok({});
    }

    auto content = read_file(path_);
    if (!content) {
        return Result<std::vector<Transaction>>::err(
            Error(ErrorCode::IO_ERROR, "cannot read " + path_));
    }
    return parse_history(*content, path_);
}

Result<void> FileHistoryStore::save(const std::vector<Transaction>& transactions) {
    if (!is_directory(dir_)) {
        auto created = atomic_create_directory(dir_);
        if (!created.ok) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                           "cannot create " + dir_ + ": " + created.error));
        }
    }

    auto written = atomic_write_file(path_, serialize_history(transactions));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "cannot write " + path_ + ": " + written.error));
    }

    spdlog::debug("saved history {} ({} transactions)", path_, transactions.size());
    return Result<void>::ok();
}

// ============================================================================
// MemoryHistoryStore
// ============================================================================

Result<std::vector<Transaction>> MemoryHistoryStore::load() {
    if (!content_) {
        return Result<std::vector<Transaction>>::ok({});
    }
    return parse_history(*content_, location());
}

Result<void> MemoryHistoryStore::save(const std::vector<Transaction>& transactions) {
    content_ = serialize_history(transactions);
    return Result<void>::ok();
}

} // namespace vtm
