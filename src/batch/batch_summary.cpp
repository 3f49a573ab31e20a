// SPDX-License-Identifier: MIT
#include "src/batch/batch_summary.hpp"

namespace volbatch {

Json batch_summary_json(const BatchOutcome& outcome) {
    Json tickers = Json::array();
    for (const auto& entry : outcome.entries) {
        Json item = Json::object();
        item["ticker"] = entry.ticker;
        if (entry.result) {
            item["status"] = "ok";
            item["reason"] = nullptr;
            item["elapsed_ms"] = nullptr;
        } else {
            const auto& failure = entry.result.error();
            item["status"] = std::string(to_string(failure.code));
            item["reason"] = failure.reason;
            item["elapsed_ms"] = failure.elapsed.count();
        }
        tickers.push_back(std::move(item));
    }

    Json doc = Json::object();
    doc["tickers"] = std::move(tickers);
    doc["succeeded"] = outcome.succeeded();
    doc["failed"] = outcome.failed_count();
    doc["elapsed_ms"] = outcome.elapsed.count();
    return doc;
}

}  // namespace volbatch
