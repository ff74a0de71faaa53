#pragma once

#include <optional>
#include <string>
#include <utility>

/*
  Outcome of one call to an external capability (registry, audit tool).

  Transports never throw for transient failures; they hand back a
  LookupError and the resolver turns it into placeholder metadata.
*/

enum class LookupErrorCode {
    NotFound,
    Timeout,
    Transport,
    HttpStatus,
    InvalidUrl,
    Malformed,
    ProcessFailed
};

struct LookupError {
    LookupErrorCode code = LookupErrorCode::Transport;
    std::string message;
};

template<typename T>
struct LookupResult {
    std::optional<T> value;
    std::optional<LookupError> error;

    static LookupResult Ok(T v) {
        return {std::move(v), std::nullopt};
    }

    static LookupResult Err(LookupErrorCode code, std::string message) {
        return {std::nullopt, LookupError{code, std::move(message)}};
    }

    explicit operator bool() const {
        return value.has_value();
    }
};

const char* lookup_error_name(LookupErrorCode code);
