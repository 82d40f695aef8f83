#include "EquityTable.hpp"
#include "Rollout.hpp"
#include "build/CheckpointStore.hpp"
#include "cards/Canonical.hpp"
#include "cards/Enumeration.hpp"
#include "core/Errors.hpp"
#include <stdexcept>
#include <utility>

namespace isoholdem::tables {

using cards::Hand;
using cards::HandCode;
using cards::StreetMode;

// ============================================================================
// EquityTable
// ============================================================================

EquityTable EquityTable::load(const std::string& dir) {
    build::CheckpointStore store(dir);
    if (!store.has_manifest()) {
        throw DatasetMissingError("No river equity dataset at " + dir);
    }
    build::Manifest manifest = store.read_manifest();
    if (manifest.kind != RIVER_EQUITY_KIND) {
        throw ParseError("Dataset at " + dir + " holds '" + manifest.kind +
                         "', not river equities");
    }

    EquityTable table;
    table.equities_.reserve(manifest.units);
    store.for_each_batch([&table](std::size_t, const nlohmann::json& batch) {
        if (!batch.is_object()) {
            throw ParseError("Equity shard is not a JSON object");
        }
        for (auto it = batch.begin(); it != batch.end(); ++it) {
            if (!it.value().is_number()) {
                throw ParseError("Equity for " + it.key() + " is not a number");
            }
            HandCode code = 0;
            try {
                code = cards::code_from_string(it.key());
            } catch (const std::logic_error& e) {
                throw ParseError("Bad equity key " + it.key() + ": " + e.what());
            }
            if (cards::code_length(code) != 7) {
                throw ParseError("Equity key " + it.key() + " is not a 7-card hand");
            }
            if (!cards::is_canonical(cards::unpack_hand(code), StreetMode::StreetAware)) {
                throw ParseError("Equity key " + it.key() + " is not canonical");
            }
            try {
                table.insert(code, it.value().get<float>());
            } catch (const std::invalid_argument& e) {
                throw ParseError("Bad equity entry " + it.key() + ": " + e.what());
            }
        }
    });
    return table;
}

void EquityTable::insert(HandCode canonical_seven, float equity) {
    if (!(equity >= 0.0f && equity <= 1.0f)) {
        throw std::invalid_argument("Equity out of range for " +
                                    cards::code_to_string(canonical_seven));
    }
    equities_[canonical_seven] = equity;
}

double EquityTable::lookup(const Hand& seven) const {
    if (seven.size() != 7) {
        throw std::invalid_argument("River equity lookup needs 7 cards, got " +
                                    std::to_string(seven.size()));
    }
    Hand canonical = cards::canonicalize(seven, StreetMode::StreetAware);
    auto it = equities_.find(cards::pack_hand(canonical));
    if (it == equities_.end()) {
        throw DatasetLookupMiss("No river equity for " + cards::hand_to_string(canonical));
    }
    return it->second;
}

double EquityTable::equity(const Hand& hand) const {
    switch (hand.size()) {
        case 7:
            return lookup(hand);
        case 5:
        case 6:
            break;
        default:
            throw std::invalid_argument("Equity needs 5, 6 or 7 cards, got " +
                                        std::to_string(hand.size()));
    }
    if (cards::has_duplicates(hand)) {
        throw std::invalid_argument("Hand has repeated cards: " + cards::hand_to_string(hand));
    }

    const std::vector<int> rest = remaining_deck(cards::card_mask(hand));
    Hand full = hand;
    double sum = 0.0;
    int n = 0;

    if (hand.size() == 6) {
        full.push_back(cards::Card());
        for (int river : rest) {
            full[6] = cards::Card::from_index(river);
            sum += lookup(full);
            ++n;
        }
    } else {
        full.resize(7);
        for (size_t a = 0; a < rest.size(); ++a) {
            full[5] = cards::Card::from_index(rest[a]);
            for (size_t b = a + 1; b < rest.size(); ++b) {
                full[6] = cards::Card::from_index(rest[b]);
                sum += lookup(full);
                ++n;
            }
        }
    }
    return sum / n;
}

// ============================================================================
// EquityTableBuilder
// ============================================================================

EquityTableBuilder::EquityTableBuilder(std::shared_ptr<const StrengthTable> strengths,
                                       build::BatchConfig config)
    : strengths_(std::move(strengths))
    , config_(std::move(config)) {
    if (!strengths_ || strengths_->empty()) {
        throw std::invalid_argument("Equity builder needs a loaded strength table");
    }
}

void EquityTableBuilder::set_callback(build::ProgressCallback callback) {
    callback_ = std::move(callback);
}

build::BuildSummary EquityTableBuilder::build(const std::string& dir) const {
    return run([](const std::function<void(HandCode)>& emit) {
        cards::for_each_canonical(7, StreetMode::StreetAware, [&emit](const Hand& h) {
            emit(cards::pack_hand(h));
        });
    }, dir);
}

build::BuildSummary EquityTableBuilder::build(const std::vector<Hand>& hands,
                                              const std::string& dir) const {
    std::vector<HandCode> codes;
    codes.reserve(hands.size());
    for (const Hand& h : hands) {
        if (h.size() != 7) {
            throw std::invalid_argument("River equity units are 7-card hands: " +
                                        cards::hand_to_string(h));
        }
        codes.push_back(cards::pack_hand(cards::canonicalize(h, StreetMode::StreetAware)));
    }
    return run([&codes](const std::function<void(HandCode)>& emit) {
        for (HandCode c : codes) emit(c);
    }, dir);
}

build::BuildSummary EquityTableBuilder::run(const build::UnitSource& source,
                                            const std::string& dir) const {
    build::CheckpointStore store(dir);
    const StrengthTable& strengths = *strengths_;

    return build::run_checkpointed<float>(
        RIVER_EQUITY_KIND, source, store, config_,
        [&strengths](HandCode code) {
            return static_cast<float>(river_equity(cards::unpack_hand(code), strengths));
        },
        [](float equity) { return nlohmann::json(equity); },
        callback_);
}

} // namespace isoholdem::tables
