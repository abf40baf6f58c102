#include "duplex_error.h"

DuplexError::DuplexError(DuplexErrorKind kind, const std::string& stage,
                         const std::string& message, const std::string& document)
    : std::runtime_error(message), kind_(kind), stage_(stage), document_(document) {
}

std::string DuplexError::describe() const {
    std::string text = "[" + stage_ + "] ";
    if (!document_.empty()) {
        text += document_ + ": ";
    }
    text += what();
    return text;
}

const char* error_kind_name(DuplexErrorKind kind) {
    switch (kind) {
    case DuplexErrorKind::INSUFFICIENT_PAGES:
        return "InsufficientPages";
    case DuplexErrorKind::INVALID_CONFIGURATION:
        return "InvalidConfiguration";
    case DuplexErrorKind::EMPTY_INPUT:
        return "EmptyInput";
    case DuplexErrorKind::RENDER_FAILURE:
        return "RenderFailure";
    case DuplexErrorKind::IO_FAILURE:
        return "IOFailure";
    case DuplexErrorKind::INVALID_STATE:
        return "InvalidState";
    }
    return "Unknown";
}

int exit_code_for(DuplexErrorKind kind) {
    switch (kind) {
    case DuplexErrorKind::INSUFFICIENT_PAGES:
        return EC_INSUFFICIENT_PAGES;
    case DuplexErrorKind::INVALID_CONFIGURATION:
        return EC_INVALID_CONFIGURATION;
    case DuplexErrorKind::EMPTY_INPUT:
        return EC_EMPTY_INPUT;
    case DuplexErrorKind::IO_FAILURE:
        return EC_WRITE_ERROR;
    case DuplexErrorKind::INVALID_STATE:
        return EC_INVALID_STATE;
    case DuplexErrorKind::RENDER_FAILURE:
        break;
    }
    return EC_UNKNOWN_ERROR;
}
