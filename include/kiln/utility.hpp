#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace kiln {

enum class ErrorKind : uint8_t {
    Parse,
    Cycle,
    UnknownTarget,
    DuplicateTarget,
    UndefinedVariable,
    CyclicVariable,
    ExternalProcess,
    Timeout,
    Io,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T> using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_BUILD_FAILED = 1,
    EXIT_GRAPH_ERROR = 2,
    EXIT_USAGE = 64,
};

// Graph and definition errors abort before anything runs; everything else is
// a failure of the run itself.
inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ExternalProcess:
    case ErrorKind::Timeout:
    case ErrorKind::Io:
        return EXIT_BUILD_FAILED;
    default:
        return EXIT_GRAPH_ERROR;
    }
}

const char *error_kind_name(ErrorKind kind);

} // namespace kiln
