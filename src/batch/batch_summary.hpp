// SPDX-License-Identifier: MIT
#pragma once

#include "src/batch/batch_runner.hpp"
#include "src/report/json_output.hpp"

namespace volbatch {

/// Per-ticker status listing of a batch
///
/// {"tickers": [{"ticker", "status": "ok"|"Timeout"|..., "reason", "elapsed_ms"}],
///  "succeeded", "failed", "elapsed_ms"}
Json batch_summary_json(const BatchOutcome& outcome);

}  // namespace volbatch
