// SPDX-License-Identifier: MIT
/**
 * @file json_output.hpp
 * @brief JSON encoding of ticker results and file persistence
 *
 * Encoding is the serialization boundary: every number is passed through
 * sanitize() here, so non-finite values are written as null and wrapper
 * types as plain doubles. Object keys keep insertion order.
 */

#pragma once

#include "src/report/skew_report.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace volbatch {

using Json = nlohmann::ordered_json;

/// Sanitized number or null
Json json_number(std::optional<double> value);
Json json_number(double value);

/// `skew_dict`: {"1M": {"80": vol|null, ...}, ..., "ticker", "start_date"}
Json skew_dict_to_json(const SkewGrid& grid, const std::string& ticker, const Date& start_date);

/// `skew_data`: {"skew_dict": {"1": {...}, ...}, "ticker", "start_date"}
Json skew_data_to_json(const SkewData& data);

/// `data_dict`: run parameters and raw surface points
Json data_dict_to_json(const SurfaceSummary& summary);

/// Full envelope with keys `data_dict`, `skew_dict`, `skew_data`
Json to_json(const TickerResult& result);

/// Serialize a document (invalid UTF-8 replaced, never throws on content)
std::string dump_json(const Json& doc, int indent = -1);

/// Write a document to `path`, returning the number of bytes written
std::expected<size_t, std::string> write_json_file(const Json& doc,
                                                   const std::filesystem::path& path,
                                                   int indent = -1);

/// Read and parse a JSON document
std::expected<Json, std::string> read_json_file(const std::filesystem::path& path);

}  // namespace volbatch
