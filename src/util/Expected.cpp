#include "util/Expected.hpp"

namespace oops {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid arguments";
        case ErrorCode::NotARepository: return "not a repository";
        case ErrorCode::AlreadyInitialized: return "already initialized";
        case ErrorCode::IoError: return "i/o error";
        case ErrorCode::ObjectNotFound: return "object not found";
        case ErrorCode::InvalidCommit: return "invalid commit";
        case ErrorCode::FileNotTracked: return "file not tracked";
        case ErrorCode::NoCommits: return "no commits";
        case ErrorCode::UnexpectedError: return "unexpected error";
    }
    return "unknown";
}

}
