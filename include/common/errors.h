#pragma once

#include <stdexcept>
#include <string>

namespace ocrlayer {

// ==================== Exit codes ====================

namespace ExitCode {
    constexpr int SUCCESS = 0;
    constexpr int FAILURE = 1;      // aborted run, interrupt, engine/document/save errors
    constexpr int USAGE_ERROR = 2;  // bad command line
}

// ==================== Exception taxonomy ====================

/**
 * @brief Base class of every error raised by ocrlayer
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The OCR engine's external tool is missing or unusable
class EngineNotFoundError : public Error {
public:
    explicit EngineNotFoundError(const std::string& engineName)
        : Error("OCR engine (" + engineName + ") not found"), engineName_(engineName) {}

    const std::string& engineName() const { return engineName_; }

private:
    std::string engineName_;
};

/// The back-end cannot enumerate its languages
class UnknownLanguageListError : public Error {
public:
    UnknownLanguageListError() : Error("unable to determine list of available languages") {}
};

class InvalidLanguageIdError : public Error {
public:
    explicit InvalidLanguageIdError(const std::string& language)
        : Error("invalid language identifier: " + language), language_(language) {}

    const std::string& language() const { return language_; }

private:
    std::string language_;
};

class MissingLanguagePackError : public Error {
public:
    explicit MissingLanguagePackError(const std::string& language)
        : Error("language pack for the selected language (" + language + ") is not available"),
          language_(language) {}

    const std::string& language() const { return language_; }

private:
    std::string language_;
};

/// The page has no image suitable for OCR
class NoImageError : public Error {
public:
    using Error::Error;
};

/// Raw engine output could not be parsed
class EngineOutputError : public Error {
public:
    using Error::Error;
};

/// Unknown engine name or property
class EngineConfigError : public Error {
public:
    using Error::Error;
};

/// Document could not be opened or a page could not be rendered
class DocumentError : public Error {
public:
    DocumentError(int code, const std::string& message) : Error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

class PersistenceError : public Error {
public:
    using Error::Error;
};

/// The user interrupted the run (SIGINT/SIGTERM)
class InterruptedError : public Error {
public:
    InterruptedError() : Error("interrupted by user") {}
};

/**
 * @brief A page failed under the abort policy and the run was halted
 *
 * pageNumber is 1-based. The failure that caused the abort is kept as cause().
 */
class PipelineAbortedError : public Error {
public:
    PipelineAbortedError(int pageNumber, const std::string& cause)
        : Error("processing aborted at page " + std::to_string(pageNumber) + ": " + cause),
          pageNumber_(pageNumber), cause_(cause) {}

    int pageNumber() const { return pageNumber_; }
    const std::string& cause() const { return cause_; }

private:
    int pageNumber_;
    std::string cause_;
};

} // namespace ocrlayer
