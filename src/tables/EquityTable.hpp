#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "build/BatchRunner.hpp"
#include "cards/Card.hpp"
#include "cards/HandCode.hpp"
#include "StrengthTable.hpp"

namespace isoholdem::tables {

// Dataset kind recorded in the equity manifest
constexpr const char* RIVER_EQUITY_KIND = "river_equity";

// Canonical street-aware 7-card hand -> river equity against a uniformly
// random opponent holding. Immutable once loaded.
class EquityTable {
public:
    EquityTable() = default;

    // Reads every shard of a complete dataset directory.
    // Throws DatasetMissingError if absent or incomplete, ParseError if malformed.
    static EquityTable load(const std::string& dir);

    // Key must be a canonical street-aware 7-card hand; equity in [0, 1]
    void insert(cards::HandCode canonical_seven, float equity);

    // Canonicalizes (street-aware) and retrieves; DatasetLookupMiss if absent
    double lookup(const cards::Hand& seven) const;

    // 7 cards: lookup. 5 or 6 cards: mean lookup over every completion
    // of the board. Throws std::invalid_argument for other sizes.
    double equity(const cards::Hand& hand) const;

    std::size_t size() const { return equities_.size(); }

private:
    std::unordered_map<cards::HandCode, float> equities_;
};

// Computes river equities for every canonical river hand (or an explicit
// list) in parallel, checkpointing each batch to a dataset directory
class EquityTableBuilder {
public:
    explicit EquityTableBuilder(std::shared_ptr<const StrengthTable> strengths,
                                build::BatchConfig config = {});

    // Set callback to receive per-batch progress
    void set_callback(build::ProgressCallback callback);

    // All 123,156,254 canonical street-aware 7-card hands
    build::BuildSummary build(const std::string& dir) const;

    // Only the given hands (canonicalized first)
    build::BuildSummary build(const std::vector<cards::Hand>& hands,
                              const std::string& dir) const;

    const build::BatchConfig& config() const { return config_; }

private:
    build::BuildSummary run(const build::UnitSource& source, const std::string& dir) const;

    std::shared_ptr<const StrengthTable> strengths_;
    build::BatchConfig config_;
    std::optional<build::ProgressCallback> callback_;
};

} // namespace isoholdem::tables
