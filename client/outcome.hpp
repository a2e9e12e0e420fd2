#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>

enum class FailureKind { Timeout, ConnectionFailed, HttpStatus };

struct SuccessOutcome {
    std::chrono::microseconds duration{0};
};

struct FailureOutcome {
    FailureKind kind = FailureKind::ConnectionFailed;
    int status_code = 0;    // only meaningful for HttpStatus
    std::optional<std::chrono::microseconds> duration;
};

// Classified result of one completed attempt.
using Outcome = std::variant<SuccessOutcome, FailureOutcome>;

// What the transport layer saw, before classification.
enum class TransportStatus { Completed, TimedOut, ConnectionError };

struct RawResult {
    TransportStatus transport = TransportStatus::Completed;
    int status_code = 0;    // valid when transport == Completed
    std::chrono::microseconds elapsed{0};
};

/**
 * @brief Maps a raw result to its Outcome. 2xx is success, every other
 * status is an HttpStatus failure that still carries its duration.
 */
Outcome classify_outcome(const RawResult& raw);

// "timeout", "connection_failed" or "<code>_<snake_case_reason>".
std::string error_label(const FailureOutcome& failure);

// Standard reason phrase for an HTTP status, nullptr if it has none.
const char* reason_phrase(int status_code);

std::string to_snake_case(const std::string& text);

inline bool is_success(const Outcome& outcome)
{
    return std::holds_alternative<SuccessOutcome>(outcome);
}
