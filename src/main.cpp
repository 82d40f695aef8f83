// IsoHoldem: canonical hand representation and card abstraction for
// Texas Hold'em
//
// Maps every hand to its suit-isomorphism class, serves strength and equity
// lookups from precomputed tables, and buckets flop and turn hands by
// clustering their equity distributions.
//
// Usage:
//   ./isoholdem <command> [options]
//
// Commands:
//   build-strengths                  Generate the 5-card strength dataset
//   build-equity                     Build or resume the river equity dataset
//   build-abstraction --street S     Build or resume the flop/turn abstraction
//   enumerate <n> [--street-aware]   Count canonical n-card hands (--list prints them)
//   canonical <cards>                Print the canonical form of a hand
//   query <cards>... [--equity]      Abstraction id, strength and category per hand
//
// Options:
//   --config <path>      JSON config file
//   --products <dir>     Dataset directory (default: products)
//   --threads <n>        Worker threads (default: hardware concurrency)
//   --max-batches <n>    Stop a build after n new batches
//   --seed <n>           Clustering seed (default: 123)
//   --equity             Also report equity of flop and turn hands
//   --verbose            Print per-batch progress

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "abstraction/AbstractionBuilder.hpp"
#include "abstraction/CardAbstraction.hpp"
#include "abstraction/TableSet.hpp"
#include "cards/Canonical.hpp"
#include "cards/Enumeration.hpp"
#include "cards/Street.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "eval/HandEvaluator.hpp"
#include "tables/EquityTable.hpp"
#include "tables/StrengthTable.hpp"

using namespace isoholdem;

// Process exit codes
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_PARSE = 2;
constexpr int EXIT_DATASET_MISSING = 3;
constexpr int EXIT_LOOKUP_MISS = 4;
constexpr int EXIT_INVARIANT = 5;
constexpr int EXIT_RUNTIME = 6;

// Command line arguments
struct Args {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> config_path;
    std::optional<std::string> products_dir;
    std::optional<int> threads;
    std::optional<int> max_batches;
    std::optional<uint32_t> seed;
    std::string street = "flop";
    bool street_aware = false;
    bool list = false;
    bool equity = false;
    bool verbose = false;
};

void print_usage() {
    std::cout << "IsoHoldem: canonical hands and card abstraction for Hold'em\n\n"
              << "Usage: isoholdem <command> [options]\n\n"
              << "Commands:\n"
              << "  build-strengths                  Generate the 5-card strength dataset\n"
              << "  build-equity                     Build or resume the river equity dataset\n"
              << "  build-abstraction --street S     Build or resume the flop|turn abstraction\n"
              << "  enumerate <n> [--street-aware]   Count canonical n-card hands (--list prints them)\n"
              << "  canonical <cards> [--street-aware]  Print the canonical form of a hand\n"
              << "  query <cards>... [--equity]      Abstraction id, strength and category per hand\n\n"
              << "Options:\n"
              << "  --config <path>      JSON config file\n"
              << "  --products <dir>     Dataset directory (default: products)\n"
              << "  --threads <n>        Worker threads (default: hardware concurrency)\n"
              << "  --max-batches <n>    Stop a build after n new batches\n"
              << "  --seed <n>           Clustering seed (default: 123)\n"
              << "  --equity             Also report equity of flop and turn hands\n"
              << "  --verbose            Print per-batch progress\n"
              << "  --help               Show this help\n";
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--products" && i + 1 < argc) {
            args.products_dir = argv[++i];
        } else if (arg == "--threads" && i + 1 < argc) {
            args.threads = std::stoi(argv[++i]);
        } else if (arg == "--max-batches" && i + 1 < argc) {
            args.max_batches = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            args.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--street" && i + 1 < argc) {
            args.street = argv[++i];
        } else if (arg == "--street-aware") {
            args.street_aware = true;
        } else if (arg == "--list") {
            args.list = true;
        } else if (arg == "--equity") {
            args.equity = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

Config make_config(const Args& args) {
    Config config = args.config_path ? Config::load(*args.config_path) : Config();
    if (args.products_dir) config.set_products_dir(*args.products_dir);
    if (args.threads) config.num_threads = *args.threads;
    if (args.max_batches) config.max_batches = *args.max_batches;
    if (args.seed) config.seed = *args.seed;
    if (args.verbose) config.verbose = true;
    config.validate();
    return config;
}

// ============================================================================
// Commands
// ============================================================================

int run_build_strengths(const Config& config) {
    auto start = std::chrono::high_resolution_clock::now();
    tables::StrengthTable table = tables::StrengthTable::build_from_evaluator();
    table.save(config.strength_path);
    auto end = std::chrono::high_resolution_clock::now();

    std::cout << "Canonical 5-card hands: " << table.size() << std::endl;
    std::cout << "Written to: " << config.strength_path << std::endl;
    std::cout << "Time: "
              << std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count()
              << " ms\n";
    return 0;
}

int run_build_equity(const Config& config) {
    auto strengths = abstraction::load_strengths(config);
    std::cout << "Strength table: " << strengths->size() << " hands\n";

    tables::EquityTableBuilder builder(strengths, abstraction::equity_batch_config(config));
    build::BuildSummary summary = builder.build(config.equity_dir);

    std::cout << "River equity build: " << summary.to_json().dump() << std::endl;
    if (!summary.complete) {
        std::cout << "Incomplete; rerun to resume from batch " << summary.computed
                  + summary.skipped << std::endl;
    }
    return 0;
}

int run_build_abstraction(const Config& config, const std::string& street_name) {
    cards::Street street = cards::street_from_string(street_name);
    auto strengths = abstraction::load_strengths(config);

    abstraction::AbstractionBuilder builder(
        strengths, abstraction::abstraction_build_config(config, street));

    const std::string& dist_dir = (street == cards::Street::Flop)
        ? config.flop_distribution_dir : config.turn_distribution_dir;
    const std::string& abs_dir = (street == cards::Street::Flop)
        ? config.flop_abstraction_dir : config.turn_abstraction_dir;

    build::BuildSummary summary = builder.build_distributions(street, dist_dir);
    std::cout << "Equity distributions (" << street_name << "): "
              << summary.to_json().dump() << std::endl;
    if (!summary.complete) {
        std::cout << "Incomplete; rerun to resume\n";
        return 0;
    }

    abstraction::AbstractionTable table = builder.cluster(street, dist_dir, abs_dir);
    std::cout << "Abstraction: " << table.size() << " hands in "
              << table.num_buckets() << " buckets, written to " << abs_dir << std::endl;
    return 0;
}

int run_enumerate(const Args& args) {
    if (args.positional.empty()) {
        throw std::invalid_argument("enumerate needs a hand length");
    }
    const int length = std::stoi(args.positional[0]);
    const cards::StreetMode mode = args.street_aware
        ? cards::StreetMode::StreetAware : cards::StreetMode::StreetAgnostic;

    std::size_t count = 0;
    cards::for_each_canonical(length, mode, [&](const cards::Hand& h) {
        ++count;
        if (args.list) std::cout << cards::hand_to_string(h) << "\n";
    });
    std::cout << "Canonical " << length << "-card hands ("
              << (args.street_aware ? "street-aware" : "street-agnostic") << "): "
              << count << std::endl;
    return 0;
}

int run_canonical(const Args& args) {
    if (args.positional.empty()) {
        throw std::invalid_argument("canonical needs a hand");
    }
    const cards::StreetMode mode = args.street_aware
        ? cards::StreetMode::StreetAware : cards::StreetMode::StreetAgnostic;
    for (const std::string& text : args.positional) {
        try {
            cards::Hand hand = cards::parse_hand(text);
            std::cout << text << " -> "
                      << cards::hand_to_string(cards::canonicalize(hand, mode)) << std::endl;
        } catch (const ParseError& e) {
            std::cerr << "Skipping '" << text << "': " << e.what() << std::endl;
        }
    }
    return 0;
}

int run_query(const Args& args, const Config& config) {
    std::vector<cards::Hand> hands;
    for (const std::string& text : args.positional) {
        try {
            hands.push_back(cards::parse_hand(text));
        } catch (const ParseError& e) {
            std::cerr << "Skipping '" << text << "': " << e.what() << std::endl;
        }
    }

    abstraction::TableSet tables = abstraction::load_tables(
        config, abstraction::tables_needed(hands, args.equity));
    abstraction::CardAbstraction facade(tables, config.river_buckets);

    for (const cards::Hand& hand : hands) {
        std::cout << std::left << std::setw(16) << cards::hand_to_string(hand)
                  << " street=" << cards::street_to_string(cards::street_for_length(hand.size()))
                  << " id=" << facade.abstract_id(hand);
        if (hand.size() >= 5) {
            std::cout << " strength=" << facade.hand_strength(hand) << " ("
                      << eval::hand_rank_to_string(eval::HandEvaluator::evaluate(hand).rank())
                      << ")";
        }
        if (tables.equities && hand.size() >= 5) {
            std::cout << " equity=" << std::fixed << std::setprecision(4) << facade.equity(hand);
        }
        std::cout << std::endl;
    }
    return 0;
}

int dispatch(const Args& args) {
    if (args.command.empty()) {
        print_usage();
        return EXIT_USAGE;
    }

    std::cout << "======================================\n";
    std::cout << "  IsoHoldem v1.0\n";
    std::cout << "  Hold'em Hand Isomorphism & Abstraction\n";
    std::cout << "======================================\n\n";

    if (args.command == "enumerate") return run_enumerate(args);
    if (args.command == "canonical") return run_canonical(args);

    Config config = make_config(args);
    if (args.command == "build-strengths") return run_build_strengths(config);
    if (args.command == "build-equity") return run_build_equity(config);
    if (args.command == "build-abstraction") return run_build_abstraction(config, args.street);
    if (args.command == "query") return run_query(args, config);

    std::cerr << "Unknown command: " << args.command << std::endl;
    return EXIT_USAGE;
}

int main(int argc, char* argv[]) {
    try {
        return dispatch(parse_args(argc, argv));
    } catch (const ParseError& e) {
        std::cerr << "Parse error: " << e.what() << std::endl;
        return EXIT_PARSE;
    } catch (const DatasetMissingError& e) {
        std::cerr << "Dataset missing: " << e.what() << std::endl;
        return EXIT_DATASET_MISSING;
    } catch (const DatasetLookupMiss& e) {
        std::cerr << "Dataset lookup miss: " << e.what() << std::endl;
        return EXIT_LOOKUP_MISS;
    } catch (const CanonicalizationInvariantViolation& e) {
        std::cerr << "Canonicalization invariant violated: " << e.what() << std::endl;
        return EXIT_INVARIANT;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_RUNTIME;
    }
}
