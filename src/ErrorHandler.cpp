#include "ErrorHandler.hpp"
#include <cstring>

namespace ghostdb {

thread_local std::string ErrorContext::s_currentContext;

namespace {

std::string withContext(const std::string& message) {
    auto context = ErrorContext::current();
    if (context.empty()) {
        return message;
    }
    return message + " (" + context + ")";
}

}  // namespace

int ErrorHandler::exitCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return EXIT_OK;

        case ErrorKind::InvalidArgument:
            return EXIT_USAGE;

        case ErrorKind::InputOpen:
            return EXIT_NOINPUT;

        case ErrorKind::OutputCreate:
            return EXIT_CANTCREAT;

        case ErrorKind::Read:
        case ErrorKind::Write:
            return EXIT_IOERR;

        case ErrorKind::ConfigOpen:
        case ErrorKind::ConfigParse:
            return EXIT_CONFIG;
    }
    return EXIT_SOFTWARE;
}

std::string ErrorHandler::kindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::InputOpen: return "input-open";
        case ErrorKind::OutputCreate: return "output-create";
        case ErrorKind::Read: return "read";
        case ErrorKind::Write: return "write";
        case ErrorKind::ConfigOpen: return "config-open";
        case ErrorKind::ConfigParse: return "config-parse";
        case ErrorKind::InvalidArgument: return "invalid-argument";
    }
    return "unknown";
}

std::string ErrorHandler::describeErrno(int err) {
    if (err == 0) {
        return "Success";
    }
    const char* text = std::strerror(err);
    if (text && *text) {
        return std::string(text);
    }
    return "Unknown error " + std::to_string(err);
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

GhostDBException::GhostDBException(ErrorKind kind, const std::string& message,
                                   const std::string& path)
    : std::runtime_error(withContext(message))
    , m_kind(kind)
    , m_path(path)
    , m_context(ErrorContext::current()) {
}

}  // namespace ghostdb
