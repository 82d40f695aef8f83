#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace isoholdem::build {

// Writes JSON to a temp file and renames it into place, so readers never
// see a truncated file. Throws std::runtime_error on I/O failure.
void write_json_atomic(const std::string& path, const nlohmann::json& data);

// Throws DatasetMissingError if the file is absent, ParseError if malformed
nlohmann::json read_json_file(const std::string& path);

// Describes a sharded dataset directory
struct Manifest {
    std::string kind;              // What the shards hold, e.g. "river_equity"
    std::size_t batch_size = 0;    // Units per shard (last may be short)
    std::size_t batches = 0;       // Shards in a complete dataset
    std::size_t units = 0;         // Total units over all shards
    bool complete = false;
    nlohmann::json extra = nlohmann::json::object();  // Kind-specific metadata

    nlohmann::json to_json() const;
    static Manifest from_json(const nlohmann::json& j);
};

// Directory of batch_NNNNNN.json shards plus manifest.json.
// A shard file either exists completely or not at all.
class CheckpointStore {
public:
    explicit CheckpointStore(std::string dir);

    const std::string& dir() const { return dir_; }

    std::string batch_path(std::size_t index) const;
    std::string manifest_path() const;

    bool has_batch(std::size_t index) const;
    void write_batch(std::size_t index, const nlohmann::json& data) const;
    nlohmann::json read_batch(std::size_t index) const;

    bool has_manifest() const;
    Manifest read_manifest() const;
    void write_manifest(const Manifest& manifest) const;

    // Manifest present and marked complete
    bool is_complete() const;

    // Creates the directory and records an in-progress manifest. Resuming
    // a dataset of a different kind or batch size throws std::runtime_error.
    Manifest prepare(const std::string& kind, std::size_t batch_size) const;

    // Visits every shard of a complete dataset in index order.
    // Throws DatasetMissingError if the dataset is incomplete.
    void for_each_batch(
        const std::function<void(std::size_t, const nlohmann::json&)>& visit) const;

private:
    std::string dir_;
};

} // namespace isoholdem::build
