#include "vtm/manifest_store.hpp"
#include "vtm/platform.hpp"

#include <spdlog/spdlog.h>

namespace vtm {

Result<Manifest> load_manifest_from_string(const std::string& content,
                                           const std::string& location) {
    auto parsed = parse_manifest(content);
    if (!parsed.ok) {
        return Result<Manifest>::err(
            Error(ErrorCode::CORRUPT_MANIFEST, parsed.error).withContext(location));
    }
    for (const auto& warning : parsed.warnings) {
        spdlog::warn("{}: {}", location, warning);
    }
    return Result<Manifest>::ok(std::move(parsed.manifest));
}

// ============================================================================
// FileManifestStore
// ============================================================================

bool FileManifestStore::exists() const {
    return path_exists(path_);
}

Result<Manifest> FileManifestStore::load() {
    if (!path_exists(path_)) {
        return Result<Manifest>::err(Error(
            ErrorCode::MANIFEST_NOT_FOUND,
            "manifest not found at " + path_ + ". Run 'vtm init' to create one."));
    }

    auto content = read_file(path_);
    if (!content) {
        return Result<Manifest>::err(Error(ErrorCode::IO_ERROR, "cannot read " + path_));
    }

    spdlog::debug("loaded manifest {} ({} bytes)", path_, content->size());
    return load_manifest_from_string(*content, path_);
}

Result<void> FileManifestStore::save(const Manifest& manifest) {
    auto encoded = encode_manifest(manifest);
    if (encoded.isErr()) {
        return Result<void>::err(encoded.error());
    }

    std::string dir = get_parent_directory(path_);
    if (!dir.empty() && !is_directory(dir)) {
        auto created = atomic_create_directory(dir);
        if (!created.ok) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                           "cannot create " + dir + ": " + created.error));
        }
    }

    auto written = atomic_write_file(path_, encoded.value());
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "cannot write " + path_ + ": " + written.error));
    }

    spdlog::debug("saved manifest {} ({} tasks)", path_, manifest.tasks.size());
    return Result<void>::ok();
}

// ============================================================================
// MemoryManifestStore
// ============================================================================

Result<Manifest> MemoryManifestStore::load() {
    if (!content_) {
        return Result<Manifest>::err(Error(ErrorCode::MANIFEST_NOT_FOUND,
                                           "manifest not found in memory store"));
    }
    return load_manifest_from_string(*content_, location());
}

Result<void> MemoryManifestStore::save(const Manifest& manifest) {
    auto encoded = encode_manifest(manifest);
    if (encoded.isErr()) {
        return Result<void>::err(encoded.error());
    }
    content_ = std::move(encoded.value());
    ++save_count_;
    return Result<void>::ok();
}

} // namespace vtm
