#pragma once

#include <string>
#include <stdexcept>
#include <cerrno>

namespace ghostdb {

// Conditions that stop a run. Per-line anomalies are never reported this way.
enum class ErrorKind {
    None,
    InputOpen,
    OutputCreate,
    Read,
    Write,
    ConfigOpen,
    ConfigParse,
    InvalidArgument
};

// Error kind to process exit status mapping (sysexits.h values)
class ErrorHandler {
public:
    static int exitCode(ErrorKind kind);

    static std::string kindToString(ErrorKind kind);

    // strerror() text for an errno value, "Unknown error N" otherwise
    static std::string describeErrno(int err);

    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_USAGE = 64;
    static constexpr int EXIT_DATAERR = 65;
    static constexpr int EXIT_NOINPUT = 66;
    static constexpr int EXIT_SOFTWARE = 70;
    static constexpr int EXIT_CANTCREAT = 73;
    static constexpr int EXIT_IOERR = 74;
    static constexpr int EXIT_CONFIG = 78;
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Fatal error raised by file and configuration handling
class GhostDBException : public std::runtime_error {
public:
    GhostDBException(ErrorKind kind, const std::string& message,
                     const std::string& path = "");

    ErrorKind kind() const { return m_kind; }
    const std::string& path() const { return m_path; }
    const std::string& context() const { return m_context; }
    int exitCode() const { return ErrorHandler::exitCode(m_kind); }

private:
    ErrorKind m_kind;
    std::string m_path;
    std::string m_context;
};

}  // namespace ghostdb
