// SPDX-License-Identifier: MIT
#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <expected>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace volbatch {

/// Failure categories reported by external data collaborators
enum class UpstreamErrorCode {
    Network,
    NotFound,
    Malformed,
    Unsupported,
    Cancelled
};

/// Collaborator failure with the collaborator's own reason text
struct UpstreamError {
    UpstreamErrorCode code{UpstreamErrorCode::Network};
    std::string reason;
};

/// Error codes for degenerate or invalid surface shapes
enum class TransformErrorCode {
    EmptySurface,
    NonPositiveStrike,
    InvalidStrikeGrid,
    InvalidBucketCount,
    Exception
};

/// Detailed transform error
struct TransformError {
    TransformErrorCode code;
    std::string reason;
    double value = 0.0;  ///< Offending value (strike, count), 0 if not applicable
};

/// Per-ticker failure tag recorded in a batch outcome
enum class JobFailureCode {
    Timeout,
    UpstreamError,
    TransformError
};

/// Failure of one ticker job, carried as data in the batch outcome
struct JobFailure {
    JobFailureCode code;
    std::string ticker;
    std::string reason;
    std::chrono::milliseconds elapsed{0};
};

/// Invalid batch invocation parameters (fatal for the whole call)
enum class ConfigErrorCode {
    NonPositiveTimeout,
    EmptyTickerList,
    InvalidConcurrency,
    InvalidStrikeGrid,
    InvalidBucketCount,
    MissingAtmStrike,
    MissingCollaborator,
    InvalidDuration
};

struct ConfigError {
    ConfigErrorCode code;
    std::string detail;
};

inline std::string_view to_string(UpstreamErrorCode code) {
    switch (code) {
        case UpstreamErrorCode::Network: return "Network";
        case UpstreamErrorCode::NotFound: return "NotFound";
        case UpstreamErrorCode::Malformed: return "Malformed";
        case UpstreamErrorCode::Unsupported: return "Unsupported";
        case UpstreamErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline std::string_view to_string(TransformErrorCode code) {
    switch (code) {
        case TransformErrorCode::EmptySurface: return "EmptySurface";
        case TransformErrorCode::NonPositiveStrike: return "NonPositiveStrike";
        case TransformErrorCode::InvalidStrikeGrid: return "InvalidStrikeGrid";
        case TransformErrorCode::InvalidBucketCount: return "InvalidBucketCount";
        case TransformErrorCode::Exception: return "Exception";
    }
    return "Unknown";
}

inline std::string_view to_string(JobFailureCode code) {
    switch (code) {
        case JobFailureCode::Timeout: return "Timeout";
        case JobFailureCode::UpstreamError: return "UpstreamError";
        case JobFailureCode::TransformError: return "TransformError";
    }
    return "Unknown";
}

inline std::string_view to_string(ConfigErrorCode code) {
    switch (code) {
        case ConfigErrorCode::NonPositiveTimeout: return "NonPositiveTimeout";
        case ConfigErrorCode::EmptyTickerList: return "EmptyTickerList";
        case ConfigErrorCode::InvalidConcurrency: return "InvalidConcurrency";
        case ConfigErrorCode::InvalidStrikeGrid: return "InvalidStrikeGrid";
        case ConfigErrorCode::InvalidBucketCount: return "InvalidBucketCount";
        case ConfigErrorCode::MissingAtmStrike: return "MissingAtmStrike";
        case ConfigErrorCode::MissingCollaborator: return "MissingCollaborator";
        case ConfigErrorCode::InvalidDuration: return "InvalidDuration";
    }
    return "Unknown";
}

/// Output stream operator for UpstreamError
inline std::ostream& operator<<(std::ostream& os, const UpstreamError& err) {
    os << "UpstreamError{code=" << to_string(err.code)
       << ", reason=" << err.reason << "}";
    return os;
}

/// Output stream operator for TransformError
inline std::ostream& operator<<(std::ostream& os, const TransformError& err) {
    os << "TransformError{code=" << to_string(err.code)
       << ", reason=" << err.reason
       << ", value=" << err.value << "}";
    return os;
}

/// Output stream operator for JobFailure
inline std::ostream& operator<<(std::ostream& os, const JobFailure& err) {
    os << "JobFailure{code=" << to_string(err.code)
       << ", ticker=" << err.ticker
       << ", reason=" << err.reason
       << ", elapsed_ms=" << err.elapsed.count() << "}";
    return os;
}

/// Output stream operator for ConfigError
inline std::ostream& operator<<(std::ostream& os, const ConfigError& err) {
    os << "ConfigError{code=" << to_string(err.code)
       << ", detail=" << err.detail << "}";
    return os;
}

/// Render any streamable error for diagnostics
template<typename E>
std::string describe(const E& err) {
    std::ostringstream ss;
    ss << err;
    return ss.str();
}

/// Classify a collaborator failure as a job failure
inline JobFailure to_job_failure(const UpstreamError& err, std::string ticker,
                                 std::chrono::milliseconds elapsed) {
    return JobFailure{
        .code = JobFailureCode::UpstreamError,
        .ticker = std::move(ticker),
        .reason = std::string(to_string(err.code)) + ": " + err.reason,
        .elapsed = elapsed};
}

/// Classify a reshaping failure as a job failure
inline JobFailure to_job_failure(const TransformError& err, std::string ticker,
                                 std::chrono::milliseconds elapsed) {
    return JobFailure{
        .code = JobFailureCode::TransformError,
        .ticker = std::move(ticker),
        .reason = std::string(to_string(err.code)) + ": " + err.reason,
        .elapsed = elapsed};
}

/// Run a collaborator call, classifying an escaping exception as UpstreamError
template<typename Fn>
auto catch_upstream(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return std::unexpected(UpstreamError{UpstreamErrorCode::Network,
                                             std::string("collaborator threw: ") + e.what()});
    }
}

/// Run a reshape or report step, classifying an escaping exception as TransformError
template<typename Fn>
auto catch_transform(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return std::unexpected(TransformError{TransformErrorCode::Exception,
                                              std::string("transform threw: ") + e.what()});
    }
}

}  // namespace volbatch
