#pragma once

#include <stdexcept>
#include <string>

namespace covec {

/**
 * Structured error reporting for the feature pipeline.
 * Every failure is a CovecException carrying a code, the throwing context
 * and an optional suggestion. Nothing is retried: a failed run is rerun.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Input data errors
    SCHEMA_ERROR = 100,

    // Configuration errors
    INVALID_CONFIGURATION = 150,

    // Mathematical errors
    NUMERICAL_ERROR = 200,
    EMPTY_VOCABULARY = 201,

    // I/O errors
    FILE_NOT_FOUND = 300,

    // Parallel execution errors
    JOB_FAILED = 400,

    // Internal errors
    INTERNAL_ERROR = 500
};

inline const char* error_code_name(ErrorCode code) noexcept;

class CovecException : public std::runtime_error {
public:
    explicit CovecException(ErrorCode code, const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "covec error [" + std::string(error_code_name(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public CovecException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : CovecException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Missing columns, negative or non-integer values, misaligned rows
class SchemaError : public CovecException {
public:
    explicit SchemaError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : CovecException(ErrorCode::SCHEMA_ERROR, message, context, suggestion) {}
};

// Invalid pipeline setup, e.g. composite-key fields that cannot hold their values
class ConfigurationError : public CovecException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : CovecException(ErrorCode::INVALID_CONFIGURATION, message, context, suggestion) {}
};

class NumericalError : public CovecException {
public:
    explicit NumericalError(const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "")
        : CovecException(ErrorCode::NUMERICAL_ERROR, message, context, suggestion) {}
};

// The min-df cutoff removed every token; there is nothing to factorize
class VocabularyError : public CovecException {
public:
    explicit VocabularyError(const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : CovecException(ErrorCode::EMPTY_VOCABULARY, message, context, suggestion) {}
};

class IOError : public CovecException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : CovecException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

class JobError : public CovecException {
public:
    explicit JobError(const std::string& message,
                      const std::string& context = "",
                      const std::string& suggestion = "")
        : CovecException(ErrorCode::JOB_FAILED, message, context, suggestion) {}
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:               return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT:      return "INVALID_ARGUMENT";
        case ErrorCode::SCHEMA_ERROR:          return "SCHEMA_ERROR";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::NUMERICAL_ERROR:       return "NUMERICAL_ERROR";
        case ErrorCode::EMPTY_VOCABULARY:      return "EMPTY_VOCABULARY";
        case ErrorCode::FILE_NOT_FOUND:        return "FILE_NOT_FOUND";
        case ErrorCode::JOB_FAILED:            return "JOB_FAILED";
        case ErrorCode::INTERNAL_ERROR:        return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

// Macros for common error checking
#define COVEC_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw covec::InvalidArgumentError(message, __func__); } while (0)

#define COVEC_CHECK_SCHEMA(condition, message) \
    do { if (!(condition)) throw covec::SchemaError(message, __func__); } while (0)

#define COVEC_CHECK_CONFIG(condition, message) \
    do { if (!(condition)) throw covec::ConfigurationError(message, __func__); } while (0)

} // namespace covec
