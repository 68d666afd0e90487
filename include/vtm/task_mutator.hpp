#pragma once

#include "vtm/manifest_store.hpp"
#include "vtm/result.hpp"
#include "vtm/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Task State Machine
// ============================================================================
//
//   pending --start--> in-progress --complete--> completed
//   pending --block--> blocked
//   in-progress | blocked --reset--> pending
//   completed --reset(reopen)--> pending
//
// Each operation is one load -> mutate -> save cycle against the store.
// Any failure returns before save(), leaving the persisted manifest as it was.

struct StartOptions {
    bool force = false;  // start even if dependencies are not completed
};

struct CompletionEvidence {
    bool tests_pass = false;
    bool all_ac_verified = false;
    std::vector<size_t> verified_criteria;  // 1-based criterion numbers
    std::vector<std::string> commits;
    std::vector<std::string> files_created;
};

struct CompleteOptions {
    bool force = false;  // skip the in-progress and evidence checks
};

struct ResetOptions {
    bool reopen = false;  // administrative override for completed tasks
};

struct MutationOutcome {
    Task task;                       // task after the transition
    ManifestStats stats;             // stats after the transition
    std::vector<Task> newly_ready;   // only filled by complete
};

Result<MutationOutcome> start_task(ManifestStore& store, const std::string& id,
                                   const StartOptions& options = {});

Result<MutationOutcome> complete_task(ManifestStore& store, const std::string& id,
                                      const CompletionEvidence& evidence,
                                      const CompleteOptions& options = {});

Result<MutationOutcome> block_task(ManifestStore& store, const std::string& id,
                                   const std::string& reason = "");

Result<MutationOutcome> reset_task(ManifestStore& store, const std::string& id,
                                   const ResetOptions& options = {});

/// Parse an acceptance-criteria selection: "all" or "1,2,4"
Result<void> parse_ac_selection(const std::string& selection, CompletionEvidence& evidence);

} // namespace vtm
