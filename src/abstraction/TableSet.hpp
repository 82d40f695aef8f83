#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "AbstractionBuilder.hpp"
#include "AbstractionTable.hpp"
#include "build/BatchRunner.hpp"
#include "cards/Street.hpp"
#include "core/Config.hpp"
#include "tables/EquityTable.hpp"
#include "tables/StrengthTable.hpp"

namespace isoholdem::abstraction {

// Read-only handles to every table the facade serves from.
// Loaded once, then shared by any number of concurrent readers.
struct TableSet {
    std::shared_ptr<const tables::StrengthTable> strengths;
    std::shared_ptr<const tables::EquityTable> equities;
    std::shared_ptr<const AbstractionTable> flop;
    std::shared_ptr<const AbstractionTable> turn;
};

// Which tables a set of queries reads from
struct TableNeeds {
    bool strengths = false;
    bool equities = false;
    bool flop = false;
    bool turn = false;

    static TableNeeds all() { return {true, true, true, true}; }
};

// Tables that answering abstract_id and strength for these hands requires.
// River ids need the equity table; flop and turn hands only load it when
// with_equity is set. Throws std::invalid_argument for a hand that is not
// 2, 5, 6 or 7 cards.
TableNeeds tables_needed(const std::vector<cards::Hand>& hands, bool with_equity);

build::BatchConfig equity_batch_config(const Config& config);
AbstractionBuildConfig abstraction_build_config(const Config& config, cards::Street street);

// Strength dataset is required: DatasetMissingError if absent
std::shared_ptr<const tables::StrengthTable> load_strengths(const Config& config);

// Loads the river equity dataset, building (or resuming) it first when
// config.build_missing is set. DatasetMissingError if it stays incomplete.
std::shared_ptr<const tables::EquityTable> load_equities(
    const Config& config,
    std::shared_ptr<const tables::StrengthTable> strengths,
    const std::optional<build::ProgressCallback>& callback = std::nullopt);

// Same for a street's abstraction table (flop or turn)
std::shared_ptr<const AbstractionTable> load_abstraction(
    const Config& config,
    cards::Street street,
    std::shared_ptr<const tables::StrengthTable> strengths,
    const std::optional<build::ProgressCallback>& callback = std::nullopt);

// The requested tables, in dependency order
TableSet load_tables(const Config& config,
                     const TableNeeds& needs,
                     const std::optional<build::ProgressCallback>& callback = std::nullopt);

} // namespace isoholdem::abstraction
