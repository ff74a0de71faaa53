#include "lookup_result.hpp"

const char* lookup_error_name(LookupErrorCode code) {
    switch (code) {
        case LookupErrorCode::NotFound: return "not found";
        case LookupErrorCode::Timeout: return "timeout";
        case LookupErrorCode::Transport: return "transport error";
        case LookupErrorCode::HttpStatus: return "http status";
        case LookupErrorCode::InvalidUrl: return "invalid url";
        case LookupErrorCode::Malformed: return "malformed response";
        case LookupErrorCode::ProcessFailed: return "process failed";
    }
    return "unknown";
}
