// SPDX-License-Identifier: MIT
/**
 * @file volbatch_batch.cc
 * @brief Skew reports for every ticker of a ticker map
 *
 * Example:
 *   volbatch_batch --ticker-map tickerMap.json --snapshots ./snapshots \
 *                  --timeout 120 --concurrency 4 --output-dir ./out
 *
 * Prints one progress line per ticker and a JSON summary on stdout.
 * Exit status is 0 when every ticker succeeded, 1 on partial failure and
 * 2 on invalid invocation.
 */

#include "examples/cli_options.hpp"
#include "src/batch/batch_summary.hpp"
#include "src/batch/file_sources.hpp"
#include <iostream>

using namespace volbatch;

int main(int argc, char** argv) {
    auto opts = cli::parse_options(argc, argv, /*single=*/false);
    if (!opts) {
        std::cerr << opts.error() << "\n";
        cli::print_usage(argv[0], false);
        return 2;
    }

    auto tickers = load_ticker_map(opts->ticker_map);
    if (!tickers) {
        std::cerr << tickers.error() << "\n";
        return 2;
    }

    for (const auto& entry : tickers->entries) {
        std::cout << "Processing ticker " << entry.key << "\n";
    }

    VolBatch vb(opts->params, std::move(*tickers),
                std::make_shared<JsonSnapshotSurfaceSource>(opts->snapshot_dir),
                std::make_shared<ConfiguredDiscountSource>());

    auto result = vb.process_batch(opts->start_date, opts->use_dividends, opts->save);
    if (!result) {
        std::cerr << result.error() << "\n";
        return 2;
    }

    cli::report_outcome(*result);
    std::cout << dump_json(batch_summary_json(result->outcome), 2) << "\n";

    if (!result->outcome.all_succeeded() || result->save_failures() > 0) {
        return 1;
    }
    return 0;
}
