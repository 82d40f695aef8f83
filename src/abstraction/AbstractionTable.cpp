#include "AbstractionTable.hpp"
#include "build/CheckpointStore.hpp"
#include "cards/Canonical.hpp"
#include "core/Errors.hpp"
#include <stdexcept>

namespace isoholdem::abstraction {

using cards::Hand;
using cards::Street;

std::string abstraction_kind(Street street) {
    return cards::street_to_string(street) + "_abstraction";
}

AbstractionTable::AbstractionTable(Street street, int num_buckets)
    : street_(street)
    , num_buckets_(num_buckets) {
    if (street != Street::Flop && street != Street::Turn) {
        throw std::invalid_argument("Abstraction tables exist for flop and turn only, not " +
                                    cards::street_to_string(street));
    }
    if (num_buckets <= 0) {
        throw std::invalid_argument("Bucket count must be positive");
    }
}

AbstractionTable AbstractionTable::load(const std::string& dir, Street street) {
    build::CheckpointStore store(dir);
    if (!store.has_manifest()) {
        throw DatasetMissingError("No " + cards::street_to_string(street) +
                                  " abstraction dataset at " + dir);
    }
    build::Manifest manifest = store.read_manifest();
    if (manifest.kind != abstraction_kind(street)) {
        throw ParseError("Dataset at " + dir + " holds '" + manifest.kind +
                         "', expected '" + abstraction_kind(street) + "'");
    }
    if (!manifest.extra.contains("num_buckets") ||
        !manifest.extra["num_buckets"].is_number_integer()) {
        throw ParseError("Abstraction manifest at " + dir + " has no bucket count");
    }

    AbstractionTable table(street, manifest.extra["num_buckets"].get<int>());
    table.buckets_.reserve(manifest.units);
    store.for_each_batch([&table](std::size_t, const nlohmann::json& batch) {
        if (!batch.is_object()) {
            throw ParseError("Abstraction shard is not a JSON object");
        }
        for (auto it = batch.begin(); it != batch.end(); ++it) {
            if (!it.value().is_number_integer()) {
                throw ParseError("Bucket for " + it.key() + " is not an integer");
            }
            try {
                table.insert(cards::parse_hand(it.key()), it.value().get<int>());
            } catch (const std::invalid_argument& e) {
                throw ParseError("Bad abstraction entry " + it.key() + ": " + e.what());
            }
        }
    });
    return table;
}

cards::HandCode AbstractionTable::key(const Hand& hand) const {
    if (static_cast<int>(hand.size()) != cards::cards_for_street(street_)) {
        throw std::invalid_argument(cards::street_to_string(street_) + " hands have " +
                                    std::to_string(cards::cards_for_street(street_)) +
                                    " cards, got " + std::to_string(hand.size()));
    }
    return cards::pack_hand(cards::canonicalize(hand, cards::StreetMode::StreetAware));
}

void AbstractionTable::insert(const Hand& hand, int bucket) {
    if (bucket < 0 || bucket >= num_buckets_) {
        throw std::invalid_argument("Bucket " + std::to_string(bucket) + " outside [0, " +
                                    std::to_string(num_buckets_) + ")");
    }
    buckets_[key(hand)] = bucket;
}

int AbstractionTable::lookup(const Hand& hand) const {
    cards::HandCode code = key(hand);
    auto it = buckets_.find(code);
    if (it == buckets_.end()) {
        throw DatasetLookupMiss("No " + cards::street_to_string(street_) + " bucket for " +
                                cards::code_to_string(code));
    }
    return it->second;
}

} // namespace isoholdem::abstraction
