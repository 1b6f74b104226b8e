#include "kiln/utility.hpp"

namespace kiln {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Parse:
        return "ParseError";
    case ErrorKind::Cycle:
        return "CycleError";
    case ErrorKind::UnknownTarget:
        return "UnknownTargetError";
    case ErrorKind::DuplicateTarget:
        return "DuplicateTargetError";
    case ErrorKind::UndefinedVariable:
        return "UndefinedVariableError";
    case ErrorKind::CyclicVariable:
        return "CyclicVariableError";
    case ErrorKind::ExternalProcess:
        return "ExternalProcessError";
    case ErrorKind::Timeout:
        return "TimeoutError";
    case ErrorKind::Io:
        return "IoError";
    }
    return "Error";
}

} // namespace kiln
