#pragma once
#include <stdexcept>
#include <string>

namespace mcplink
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Spawn failure, broken pipe, unexpected exit. Fatal to the connection.
struct TransportError : public Error
{
    using Error::Error;
};

/// The connection was torn down while the call was outstanding (or before it started).
struct ConnectionClosedError : public TransportError
{
    using TransportError::TransportError;
};

/// A well-formed response carrying a JSON-RPC error object.
/// Only the issuing call fails; the connection stays usable.
class RpcError : public Error
{
  public:
    RpcError(int code, const std::string& message)
        : Error("RPC error " + std::to_string(code) + ": " + message), code_(code),
          message_(message)
    {
    }

    int code() const
    {
        return code_;
    }
    const std::string& rpc_message() const
    {
        return message_;
    }

  private:
    int code_;
    std::string message_;
};

/// The caller's cancellation token fired before a response arrived.
struct CancelledError : public Error
{
    using Error::Error;
};

/// The per-call deadline expired before a response arrived.
struct CallTimeoutError : public CancelledError
{
    using CancelledError::CancelledError;
};

struct NotInitializedError : public Error
{
    using Error::Error;
};

} // namespace mcplink
