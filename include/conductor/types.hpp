#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <random>
#include <string>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace conductor {

// ============================================================================
// Dynamic Values
// ============================================================================

/// Dynamic structured value used for agent outputs, tool parameters and metadata.
using Value = nlohmann::json;

/// Name of the terminal sentinel stage.
inline constexpr const char* kEndStage = "end";

/// Stage name of the record that closes a stage stream.
inline constexpr const char* kStreamEndMarker = "__end__";

/**
 * @brief Recursively copies a dynamic value.
 *
 * Objects and arrays are rebuilt element by element so the result shares no
 * storage with the source.
 */
[[nodiscard]] inline Value deep_copy(const Value& value) {
    if (value.is_object()) {
        Value copy = Value::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            copy[it.key()] = deep_copy(it.value());
        }
        return copy;
    }
    if (value.is_array()) {
        Value copy = Value::array();
        for (const auto& element : value) {
            copy.push_back(deep_copy(element));
        }
        return copy;
    }
    return value;
}

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Configuration errors
 * - 200-299: LLM provider errors
 * - 300-399: Engine logic errors
 * - 400-499: Runtime/request errors
 * - 500-599: Tool errors
 * - 600-699: Persistence errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    DuplicateAgent = 101,
    UnknownReference = 102,
    InvalidCapability = 103,
    DependencyCycle = 104,
    MissingCapability = 105,
    ResumeStageNotConfigured = 106,

    // LLM errors (200-299)
    LlmProviderFailed = 200,
    LlmResponseParseFailed = 201,
    PromptNotFound = 202,

    // Engine errors (300-399)
    OutputValidationFailed = 300,
    HookFailed = 301,
    UnknownStage = 302,
    InvalidEnvelopeState = 303,
    NoPendingInterrupt = 304,
    StateDecodeFailed = 305,

    // Runtime errors (400-499)
    RequestCancelled = 401,
    RequestTimeout = 402,

    // Tool errors (500-599)
    ToolNotFound = 500,
    ToolExecutionFailed = 501,
    InvalidToolArguments = 502,
    ToolAccessDenied = 503,

    // Persistence errors (600-699)
    PersistenceFailed = 600,
    StateNotFound = 601,

    // Unknown
    Unknown = 999
};

/// Symbolic name of an error code, used as `error_type` in envelope errors.
inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::DuplicateAgent: return "DuplicateAgent";
        case ErrorCode::UnknownReference: return "UnknownReference";
        case ErrorCode::InvalidCapability: return "InvalidCapability";
        case ErrorCode::DependencyCycle: return "DependencyCycle";
        case ErrorCode::MissingCapability: return "MissingCapability";
        case ErrorCode::ResumeStageNotConfigured: return "ResumeStageNotConfigured";
        case ErrorCode::LlmProviderFailed: return "LlmProviderFailed";
        case ErrorCode::LlmResponseParseFailed: return "LlmResponseParseFailed";
        case ErrorCode::PromptNotFound: return "PromptNotFound";
        case ErrorCode::OutputValidationFailed: return "OutputValidationFailed";
        case ErrorCode::HookFailed: return "HookFailed";
        case ErrorCode::UnknownStage: return "UnknownStage";
        case ErrorCode::InvalidEnvelopeState: return "InvalidEnvelopeState";
        case ErrorCode::NoPendingInterrupt: return "NoPendingInterrupt";
        case ErrorCode::StateDecodeFailed: return "StateDecodeFailed";
        case ErrorCode::RequestCancelled: return "RequestCancelled";
        case ErrorCode::RequestTimeout: return "RequestTimeout";
        case ErrorCode::ToolNotFound: return "ToolNotFound";
        case ErrorCode::ToolExecutionFailed: return "ToolExecutionFailed";
        case ErrorCode::InvalidToolArguments: return "InvalidToolArguments";
        case ErrorCode::ToolAccessDenied: return "ToolAccessDenied";
        case ErrorCode::PersistenceFailed: return "PersistenceFailed";
        case ErrorCode::StateNotFound: return "StateNotFound";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type used with tl::expected for composable error handling without
 * exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (stage names, paths, values)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }

    /// True for cancellation and deadline expiry, as opposed to business failures.
    bool is_abort() const {
        return code == ErrorCode::RequestCancelled || code == ErrorCode::RequestTimeout;
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message && context == other.context;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Timestamps
// ============================================================================

/// Wall-clock timestamp; engine-created values are truncated to milliseconds.
using Timestamp = std::chrono::system_clock::time_point;

[[nodiscard]] inline Timestamp now_utc() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

namespace detail {

// Civil date <-> day count conversions (proleptic Gregorian, 1970-01-01 = 0).
inline int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

inline bool read_digits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (text[i] < '0' || text[i] > '9') return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

} // namespace detail

/**
 * @brief Formats a timestamp as RFC 3339 UTC with millisecond precision.
 *
 * Output shape: `YYYY-MM-DDTHH:MM:SS.mmmZ`.
 */
[[nodiscard]] inline std::string format_timestamp(Timestamp ts) {
    using namespace std::chrono;
    const auto ms_total = duration_cast<milliseconds>(ts.time_since_epoch()).count();
    int64_t days = ms_total / 86400000;
    int64_t ms_of_day = ms_total % 86400000;
    if (ms_of_day < 0) {
        ms_of_day += 86400000;
        --days;
    }

    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    detail::civil_from_days(days, year, month, day);

    const auto hour = static_cast<int>(ms_of_day / 3600000);
    const auto minute = static_cast<int>((ms_of_day / 60000) % 60);
    const auto second = static_cast<int>((ms_of_day / 1000) % 60);
    const auto millis = static_cast<int>(ms_of_day % 1000);

    std::array<char, 32> buf{};
    std::snprintf(buf.data(), buf.size(), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(year), month, day, hour, minute, second, millis);
    return std::string(buf.data());
}

/**
 * @brief Parses an RFC 3339 timestamp.
 *
 * Accepts optional fractional seconds (truncated to milliseconds) and either
 * a `Z` suffix or a numeric `+HH:MM` / `-HH:MM` offset.
 *
 * @return The parsed timestamp, or nullopt if the text is malformed
 */
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!detail::read_digits(text, 0, 4, year) || text.size() < 19 ||
        text[4] != '-' || !detail::read_digits(text, 5, 2, month) ||
        text[7] != '-' || !detail::read_digits(text, 8, 2, day) ||
        (text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
        !detail::read_digits(text, 11, 2, hour) || text[13] != ':' ||
        !detail::read_digits(text, 14, 2, minute) || text[16] != ':' ||
        !detail::read_digits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int i = digits; i < 3; ++i) millis *= 10;
    }

    int offset_minutes = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        int off_h = 0, off_m = 0;
        if (!detail::read_digits(text, pos + 1, 2, off_h) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !detail::read_digits(text, pos + 4, 2, off_m)) {
            return std::nullopt;
        }
        offset_minutes = sign * (off_h * 60 + off_m);
        pos += 6;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const int64_t days = detail::days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t total_ms =
        ((days * 86400 + hour * 3600 + minute * 60 + second) - offset_minutes * 60) * 1000 + millis;
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(total_ms)));
}

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief Generates `<prefix><16 lowercase hex chars>`.
 */
[[nodiscard]] inline std::string generate_id(const std::string& prefix) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::array<char, 17> buf{};
    std::snprintf(buf.data(), buf.size(), "%016llx", static_cast<unsigned long long>(rng()));
    return prefix + std::string(buf.data());
}

} // namespace conductor
