// SPDX-License-Identifier: MIT
/**
 * @file volbatch_single.cc
 * @brief Skew report for one ticker from a surface snapshot
 *
 * Example:
 *   volbatch_single SPY --start-date 2024-06-21 --snapshots ./snapshots --output-dir ./out
 */

#include "examples/cli_options.hpp"
#include "src/batch/file_sources.hpp"
#include <iostream>

using namespace volbatch;

int main(int argc, char** argv) {
    auto opts = cli::parse_options(argc, argv, /*single=*/true);
    if (!opts) {
        std::cerr << opts.error() << "\n";
        cli::print_usage(argv[0], true);
        return 2;
    }

    // The map only supplies names and yields; a missing map is not fatal here
    TickerMap tickers;
    if (auto map = load_ticker_map(opts->ticker_map)) {
        tickers = std::move(*map);
    } else {
        std::cerr << "Warning: " << map.error() << "\n";
    }

    VolBatch vb(opts->params, std::move(tickers),
                std::make_shared<JsonSnapshotSurfaceSource>(opts->snapshot_dir),
                std::make_shared<ConfiguredDiscountSource>());

    std::cout << "Processing ticker " << *opts->ticker << "\n";
    auto result = vb.process_single_ticker(*opts->ticker, opts->start_date,
                                           opts->use_dividends, opts->save);
    if (!result) {
        std::cerr << result.error() << "\n";
        return 2;
    }

    cli::report_outcome(*result);
    if (!result->outcome.all_succeeded() || result->save_failures() > 0) {
        return 1;
    }
    return 0;
}
