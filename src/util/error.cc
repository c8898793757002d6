#include "util/error.hpp"

std::string
patchy::repr(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "Success";
        case ErrorKind::MalformedHunk:
            return "Malformed hunk";
        case ErrorKind::NotFound:
            return "Hunk text not found";
        case ErrorKind::IO:
            return "I/O error";
        case ErrorKind::AmbiguousFormat:
            return "Ambiguous hunk format";
        default:
            return "Unknown error";
    }
}
