#pragma once
#include <stdexcept>
#include <string>

namespace mcpeasy
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

/// Missing or malformed tool arguments.
struct ValidationError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

struct TimeoutError : public TransportError
{
    using TransportError::TransportError;
};

/// Missing credentials or configuration; fatal before serving starts.
struct ConfigError : public Error
{
    using Error::Error;
};

struct AuthError : public Error
{
    using Error::Error;
};

/// Upstream API answered but reported a failure.
struct ServiceError : public Error
{
    using Error::Error;
};

} // namespace mcpeasy
