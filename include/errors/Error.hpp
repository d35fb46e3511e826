#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lsm {

enum class ErrorCode : std::uint8_t {
    AuthCanceled,       // user declined the biometric/fallback prompt
    AuthFailed,         // platform-level authentication error
    NotFound,           // no such secret in the credential store
    TraversalAttempt,   // key resolves outside the cache root
    DecryptionFailure,  // tampered cache file or stale master key
    KeyUnavailable,     // master key could not be obtained
    StoreFailure,       // credential store backend error
    IOFailure,          // filesystem error
    InvalidArgument,
    InvalidConfig
};

std::string_view to_string(ErrorCode code);

struct Error : public std::runtime_error {
    ErrorCode code;

    Error(ErrorCode c, const std::string& msg) : std::runtime_error(msg), code(c) {}
};

template <ErrorCode C>
struct CodedError : public Error {
    static constexpr ErrorCode kCode = C;
    explicit CodedError(const std::string& msg) : Error(C, msg) {}
};

using AuthCanceledError      = CodedError<ErrorCode::AuthCanceled>;
using AuthFailedError        = CodedError<ErrorCode::AuthFailed>;
using NotFoundError          = CodedError<ErrorCode::NotFound>;
using TraversalAttemptError  = CodedError<ErrorCode::TraversalAttempt>;
using DecryptionFailureError = CodedError<ErrorCode::DecryptionFailure>;
using KeyUnavailableError    = CodedError<ErrorCode::KeyUnavailable>;
using StoreFailureError      = CodedError<ErrorCode::StoreFailure>;
using IOFailureError         = CodedError<ErrorCode::IOFailure>;
using InvalidArgumentError   = CodedError<ErrorCode::InvalidArgument>;
using InvalidConfigError     = CodedError<ErrorCode::InvalidConfig>;

}
