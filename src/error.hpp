#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <variant>

#include <mw/error.hpp>

// The secret for an account is missing or could not be read.
struct CredentialError
{
    std::string msg;
};

// The request never produced a response (DNS, timeout, TLS...).
struct TransportError
{
    std::string msg;
};

// The backend answered with a non-success status.
struct ProtocolError
{
    int status;
    std::string msg;
};

// The response does not look like what the backend documents.
struct DecodeError
{
    std::string msg;
};

// Required input was missing, so no request was sent.
struct PreconditionError
{
    std::string msg;
};

// A local store, like the schedule file, could not be read or
// written.
struct StorageError
{
    std::string msg;
};

using Error = std::variant<CredentialError, TransportError, ProtocolError,
                           DecodeError, PreconditionError, StorageError>;

template<typename T>
using E = std::expected<T, Error>;

inline Error credentialError(std::string_view msg)
{
    return CredentialError{std::string(msg)};
}

inline Error transportError(std::string_view msg)
{
    return TransportError{std::string(msg)};
}

inline Error protocolError(int status, std::string_view msg)
{
    return ProtocolError{status, std::string(msg)};
}

inline Error decodeError(std::string_view msg)
{
    return DecodeError{std::string(msg)};
}

inline Error preconditionError(std::string_view msg)
{
    return PreconditionError{std::string(msg)};
}

inline Error storageError(std::string_view msg)
{
    return StorageError{std::string(msg)};
}

std::string errorMsg(const Error& e);

// Prefix the message of an error with some context, keeping its kind.
Error withContext(Error e, std::string_view context);

// Convert an error from the HTTP layer. Anything the HTTP session
// itself reports is a transport failure.
Error fromHTTPError(const mw::Error& e);

// Whether trying again later might succeed. Nothing retries
// automatically; this is for callers that want to tell the user.
bool isRetryable(const Error& e);
