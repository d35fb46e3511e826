#include "errors/Error.hpp"

namespace lsm {

std::string_view to_string(const ErrorCode code) {
    switch (code) {
    case ErrorCode::AuthCanceled: return "authentication canceled";
    case ErrorCode::AuthFailed: return "authentication failed";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::TraversalAttempt: return "path traversal attempt";
    case ErrorCode::DecryptionFailure: return "decryption failure";
    case ErrorCode::KeyUnavailable: return "master key unavailable";
    case ErrorCode::StoreFailure: return "credential store failure";
    case ErrorCode::IOFailure: return "I/O failure";
    case ErrorCode::InvalidArgument: return "invalid argument";
    case ErrorCode::InvalidConfig: return "invalid configuration";
    }
    return "unknown error";
}

}
