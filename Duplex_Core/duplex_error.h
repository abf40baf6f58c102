#ifndef DUPLEX_ERROR_H
#define DUPLEX_ERROR_H

#include <stdexcept>
#include <string>

// Exit codes
constexpr int EC_SUCCESS = 0;
constexpr int EC_INVALID_ARGS = 1;
constexpr int EC_FILE_NOT_FOUND = 2;
constexpr int EC_INSUFFICIENT_PAGES = 3;
constexpr int EC_INVALID_CONFIGURATION = 4;
constexpr int EC_EMPTY_INPUT = 5;
constexpr int EC_WRITE_ERROR = 6;
constexpr int EC_INVALID_STATE = 7;
constexpr int EC_PRINT_ERROR = 8;
constexpr int EC_UNKNOWN_ERROR = 10;

enum class DuplexErrorKind {
    INSUFFICIENT_PAGES,
    INVALID_CONFIGURATION,
    EMPTY_INPUT,
    RENDER_FAILURE,
    IO_FAILURE,
    INVALID_STATE
};

// Error raised by the page pipeline. Carries the stage that failed and,
// where one applies, the document being processed.
class DuplexError : public std::runtime_error {
public:
    DuplexError(DuplexErrorKind kind, const std::string& stage,
                const std::string& message, const std::string& document = "");

    DuplexErrorKind getKind() const { return kind_; }
    const std::string& getStage() const { return stage_; }
    const std::string& getDocument() const { return document_; }

    // "[trim] report.pdf: message"
    std::string describe() const;

private:
    DuplexErrorKind kind_;
    std::string stage_;
    std::string document_;
};

const char* error_kind_name(DuplexErrorKind kind);

int exit_code_for(DuplexErrorKind kind);

#endif // DUPLEX_ERROR_H
