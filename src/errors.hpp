#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  Configuration,
  Connection,
  Protocol,
  PathConflict,
  Transfer,
  Integrity
};

inline const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Configuration: return "configuration error";
    case ErrorKind::Connection: return "connection error";
    case ErrorKind::Protocol: return "protocol error";
    case ErrorKind::PathConflict: return "path conflict";
    case ErrorKind::Transfer: return "transfer error";
    case ErrorKind::Integrity: return "integrity error";
  }
  return "error";
}

// Every failure that ends a session is one of these; main() maps them to exit code 1.
class SessionError : public std::runtime_error {
public:
  SessionError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class ConfigurationError : public SessionError {
public:
  explicit ConfigurationError(const std::string& message)
    : SessionError(ErrorKind::Configuration, message) {}
};

class ConnectionError : public SessionError {
public:
  explicit ConnectionError(const std::string& message)
    : SessionError(ErrorKind::Connection, message) {}
};

class ProtocolError : public SessionError {
public:
  explicit ProtocolError(const std::string& message)
    : SessionError(ErrorKind::Protocol, message) {}
};

class PathConflictError : public SessionError {
public:
  explicit PathConflictError(const std::string& message)
    : SessionError(ErrorKind::PathConflict, message) {}
};

class TransferError : public SessionError {
public:
  explicit TransferError(const std::string& message)
    : SessionError(ErrorKind::Transfer, message) {}
};

class IntegrityError : public SessionError {
public:
  explicit IntegrityError(const std::string& message)
    : SessionError(ErrorKind::Integrity, message) {}
};
