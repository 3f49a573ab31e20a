// SPDX-License-Identifier: MIT
/**
 * @file cli_options.hpp
 * @brief Command line options shared by the volbatch tools
 */

#pragma once

#include "src/batch/vol_batch.hpp"
#include <charconv>
#include <chrono>
#include <expected>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace volbatch::cli {

struct Options {
    std::optional<std::string> ticker;  // Positional, single-ticker tool only
    Date start_date = Date::today();
    bool use_dividends = false;
    bool save = true;
    std::string snapshot_dir = "snapshots";
    std::string ticker_map = "tickerMap.json";
    VolBatchParams params;
};

inline void print_usage(const char* prog, bool single) {
    std::cerr << "Usage: " << prog << (single ? " TICKER" : "") << " [options]\n"
              << "  --start-date YYYY-MM-DD   observation date (default: today)\n"
              << "  --divs                    use ticker map dividend yields\n"
              << "  --no-save                 do not write <TICKER>.json files\n"
              << "  --snapshots DIR           surface snapshot directory (default: snapshots)\n"
              << "  --ticker-map FILE         ticker map (default: tickerMap.json)\n"
              << "  --output-dir DIR          output directory (default: .)\n"
              << "  --timeout SECONDS         per-ticker timeout (default: 120)\n"
              << "  --concurrency N           tickers processed at once (default: 1)\n"
              << "  --pause SECONDS           pause between ticker launches (default: 0)\n"
              << "  --tenors N                skew report horizon in months (default: 24)\n"
              << "  --rate R                  interest rate with --divs (default: 0.05)\n"
              << "  --discount TYPE           discount method without --divs (default: smooth)\n";
}

template<typename T>
std::optional<T> parse_number(std::string_view s) {
    T value{};
    auto r = std::from_chars(s.data(), s.data() + s.size(), value);
    if (r.ec != std::errc{} || r.ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

/// Parse argv; returns an error message on invalid input
inline std::expected<Options, std::string> parse_options(int argc, char** argv, bool single) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--divs") {
            opts.use_dividends = true;
            continue;
        }
        if (arg == "--no-save") {
            opts.save = false;
            continue;
        }
        if (!arg.starts_with("--")) {
            if (single && !opts.ticker) {
                opts.ticker = std::string(arg);
                continue;
            }
            return std::unexpected("Unexpected argument: " + std::string(arg));
        }

        if (i + 1 >= argc) {
            return std::unexpected("Missing value for " + std::string(arg));
        }
        std::string_view value = argv[++i];

        if (arg == "--start-date") {
            auto date = Date::parse(value);
            if (!date) {
                return std::unexpected(date.error());
            }
            opts.start_date = *date;
        } else if (arg == "--snapshots") {
            opts.snapshot_dir = std::string(value);
        } else if (arg == "--ticker-map") {
            opts.ticker_map = std::string(value);
        } else if (arg == "--output-dir") {
            opts.params.output_dir = std::string(value);
        } else if (arg == "--discount") {
            opts.params.discount_type = std::string(value);
        } else if (arg == "--timeout" || arg == "--pause") {
            auto seconds = parse_number<double>(value);
            if (!seconds) {
                return std::unexpected("Invalid number for " + std::string(arg) + ": " + std::string(value));
            }
            auto ms = milliseconds_from_seconds(*seconds);
            if (!ms) {
                return std::unexpected("Invalid duration for " + std::string(arg) + ": " +
                                       ms.error().detail);
            }
            if (arg == "--timeout") {
                opts.params.batch.per_job_timeout = *ms;
            } else {
                opts.params.batch.launch_interval = *ms;
            }
        } else if (arg == "--concurrency") {
            auto n = parse_number<size_t>(value);
            if (!n) {
                return std::unexpected("Invalid concurrency: " + std::string(value));
            }
            opts.params.batch.max_concurrency = *n;
        } else if (arg == "--tenors") {
            auto n = parse_number<int>(value);
            if (!n) {
                return std::unexpected("Invalid tenor count: " + std::string(value));
            }
            opts.params.reshape.bucket_count = *n;
        } else if (arg == "--rate") {
            auto rate = parse_number<double>(value);
            if (!rate) {
                return std::unexpected("Invalid rate: " + std::string(value));
            }
            opts.params.interest_rate = *rate;
        } else {
            return std::unexpected("Unknown option: " + std::string(arg));
        }
    }

    if (single && !opts.ticker) {
        return std::unexpected(std::string("Missing TICKER"));
    }
    return opts;
}

/// Progress lines for one batch
inline void report_outcome(const ProcessResult& result) {
    for (const auto& entry : result.outcome.entries) {
        if (entry.result) {
            std::cout << "Successfully processed " << entry.ticker << "\n";
        } else if (entry.result.error().code == JobFailureCode::Timeout) {
            std::cerr << entry.ticker << " timed out or failed, skipping ("
                      << entry.result.error().reason << ")\n";
        } else {
            std::cerr << "Error processing " << entry.ticker << ": "
                      << entry.result.error().reason << "\n";
        }
    }
    for (const auto& saved : result.saved) {
        if (saved.path) {
            std::cout << "Saved " << saved.path->string() << "\n";
        } else {
            std::cerr << "Could not save " << saved.ticker << ": " << saved.path.error() << "\n";
        }
    }
}

}  // namespace volbatch::cli
