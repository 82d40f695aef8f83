#include "CheckpointStore.hpp"
#include "core/Errors.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace isoholdem::build {

namespace fs = std::filesystem;

void write_json_atomic(const std::string& path, const nlohmann::json& data) {
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream f(tmp_path);
        if (!f.is_open()) {
            throw std::runtime_error("Cannot write " + tmp_path);
        }
        f << data.dump();
        if (!f) {
            throw std::runtime_error("Write failed for " + tmp_path);
        }
    }
    fs::rename(tmp_path, path);
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw DatasetMissingError("Missing dataset file: " + path);
    }
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw ParseError("Malformed dataset file " + path + ": " + e.what());
    }
}

// ============================================================================
// Manifest
// ============================================================================

nlohmann::json Manifest::to_json() const {
    return {
        {"kind", kind},
        {"batch_size", batch_size},
        {"batches", batches},
        {"units", units},
        {"complete", complete},
        {"extra", extra}
    };
}

Manifest Manifest::from_json(const nlohmann::json& j) {
    Manifest m;
    try {
        m.kind = j.at("kind").get<std::string>();
        m.batch_size = j.at("batch_size").get<std::size_t>();
        m.batches = j.value("batches", std::size_t{0});
        m.units = j.value("units", std::size_t{0});
        m.complete = j.value("complete", false);
        m.extra = j.value("extra", nlohmann::json::object());
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("Malformed manifest: ") + e.what());
    }
    return m;
}

// ============================================================================
// CheckpointStore
// ============================================================================

CheckpointStore::CheckpointStore(std::string dir)
    : dir_(std::move(dir)) {}

std::string CheckpointStore::batch_path(std::size_t index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "batch_%06zu.json", index);
    return (fs::path(dir_) / name).string();
}

std::string CheckpointStore::manifest_path() const {
    return (fs::path(dir_) / "manifest.json").string();
}

bool CheckpointStore::has_batch(std::size_t index) const {
    return fs::exists(batch_path(index));
}

void CheckpointStore::write_batch(std::size_t index, const nlohmann::json& data) const {
    write_json_atomic(batch_path(index), data);
}

nlohmann::json CheckpointStore::read_batch(std::size_t index) const {
    return read_json_file(batch_path(index));
}

bool CheckpointStore::has_manifest() const {
    return fs::exists(manifest_path());
}

Manifest CheckpointStore::read_manifest() const {
    return Manifest::from_json(read_json_file(manifest_path()));
}

void CheckpointStore::write_manifest(const Manifest& manifest) const {
    write_json_atomic(manifest_path(), manifest.to_json());
}

bool CheckpointStore::is_complete() const {
    return has_manifest() && read_manifest().complete;
}

Manifest CheckpointStore::prepare(const std::string& kind, std::size_t batch_size) const {
    fs::create_directories(dir_);

    if (has_manifest()) {
        Manifest existing = read_manifest();
        if (existing.kind != kind) {
            throw std::runtime_error("Checkpoint directory " + dir_ + " holds '" +
                                     existing.kind + "', expected '" + kind + "'");
        }
        if (existing.batch_size != batch_size) {
            throw std::runtime_error("Checkpoint directory " + dir_ + " was built with batch size " +
                                     std::to_string(existing.batch_size) + ", requested " +
                                     std::to_string(batch_size));
        }
        return existing;
    }

    Manifest m;
    m.kind = kind;
    m.batch_size = batch_size;
    write_manifest(m);
    return m;
}

void CheckpointStore::for_each_batch(
    const std::function<void(std::size_t, const nlohmann::json&)>& visit) const {
    if (!has_manifest()) {
        throw DatasetMissingError("No dataset at " + dir_);
    }
    Manifest m = read_manifest();
    if (!m.complete) {
        throw DatasetMissingError("Dataset at " + dir_ + " is incomplete");
    }
    for (std::size_t i = 0; i < m.batches; ++i) {
        visit(i, read_batch(i));
    }
}

} // namespace isoholdem::build
