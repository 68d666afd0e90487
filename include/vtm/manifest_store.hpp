#pragma once

/**
 * @file manifest_store.hpp
 * @brief Ownership of the persisted task manifest
 *
 * Every engine operation takes a ManifestStore explicitly. A store loads the
 * whole document, and save() recomputes derived fields (stats, blocks)
 * before writing, so callers cannot make them drift.
 */

#include "vtm/manifest.hpp"
#include "vtm/result.hpp"
#include "vtm/types.hpp"

#include <optional>
#include <string>

namespace vtm {

class ManifestStore {
public:
    virtual ~ManifestStore() = default;

    /// Load and schema-check the manifest
    virtual Result<Manifest> load() = 0;

    /// Persist the manifest; either the whole document is written or nothing
    virtual Result<void> save(const Manifest& manifest) = 0;

    /// Human-readable location for messages
    virtual std::string location() const = 0;
};

/**
 * @brief Manifest persisted as a single JSON file
 *
 * Writes go to a temp file beside the target which is fsynced and renamed
 * over it.
 */
class FileManifestStore : public ManifestStore {
public:
    explicit FileManifestStore(std::string path) : path_(std::move(path)) {}

    Result<Manifest> load() override;
    Result<void> save(const Manifest& manifest) override;
    std::string location() const override { return path_; }

    bool exists() const;

private:
    std::string path_;
};

/**
 * @brief In-memory store holding the serialized document
 *
 * Goes through the same encode/parse path as the file store so tests observe
 * exactly the bytes a file would contain.
 */
class MemoryManifestStore : public ManifestStore {
public:
    MemoryManifestStore() = default;
    explicit MemoryManifestStore(std::string content) : content_(std::move(content)) {}

    Result<Manifest> load() override;
    Result<void> save(const Manifest& manifest) override;
    std::string location() const override { return "<memory>"; }

    const std::optional<std::string>& content() const { return content_; }
    int save_count() const { return save_count_; }

private:
    std::optional<std::string> content_;
    int save_count_ = 0;
};

// Parse raw manifest text into a Result, mapping schema failures to
// CORRUPT_MANIFEST
Result<Manifest> load_manifest_from_string(const std::string& content,
                                           const std::string& location);

} // namespace vtm
