#pragma once

#include "vtm/ledger.hpp"
#include "vtm/manifest_store.hpp"
#include "vtm/result.hpp"
#include "vtm/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Batch Ingest
// ============================================================================
//
// Turns a batch of task drafts into manifest tasks. A draft is a task object
// whose id may be absent and whose dependencies may be batch indices:
//
//   [ {"title": "Schema", ...},
//     {"title": "API", "dependencies": [0, "TASK-004"]} ]
//
// With assign_ids the batch gets TASK-NNN ids continuing from the highest
// number already in the manifest, and index 0 above resolves to that id.

struct IngestOptions {
    std::vector<std::string> sources;  // recorded sources; default: distinct adr_source values
    bool assign_ids = true;            // false: drafts must carry their own unique ids
    bool dry_run = false;              // prepare and validate only
    std::string description;
};

struct IngestResult {
    std::vector<Task> tasks;                  // as added (or as they would be)
    std::optional<Transaction> transaction;   // absent on dry run
};

/// Accept a JSON array of drafts or an object with a "tasks" array
Result<nlohmann::json> parse_drafts(const std::string& content);

/// Highest N over ids of the form TASK-N, 0 if none
int highest_task_number(const std::vector<Task>& tasks);

std::string format_task_id(int number);

/// Build tasks from drafts against the current manifest without writing
Result<std::vector<Task>> prepare_batch(const Manifest& manifest, const nlohmann::json& drafts,
                                        bool assign_ids);

/// Prepare, validate the combined graph, save the manifest, record a transaction
Result<IngestResult> ingest(ManifestStore& store, Ledger& ledger, const nlohmann::json& drafts,
                            const IngestOptions& options = {});

} // namespace vtm
