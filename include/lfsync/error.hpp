#pragma once
#include <stdexcept>
#include <string>

namespace lfsync {

// Base of every error the library raises on purpose.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed pointer file or manifest document.
class ParseError : public Error {
public:
  using Error::Error;
};

// Missing credentials or invalid settings; fatal at startup.
class ConfigError : public Error {
public:
  using Error::Error;
};

// Blob store failure. status() is the HTTP status, or 0 for a transport error.
class StoreError : public Error {
public:
  StoreError(const std::string &what, int status) : Error(what), status_{status} {}

  [[nodiscard]] auto status() const noexcept -> int { return status_; }
  [[nodiscard]] auto not_found() const noexcept -> bool { return status_ == 404; }
  // Network errors and 5xx responses are worth another attempt.
  [[nodiscard]] auto transient() const noexcept -> bool { return status_ == 0 || status_ >= 500; }

private:
  int status_;
};

// A version-control command exited non-zero.
class VcsError : public Error {
public:
  VcsError(const std::string &command, int exit_code, const std::string &detail)
      : Error(command + " failed (exit " + std::to_string(exit_code) + "): " + detail),
        exit_code_{exit_code} {}

  [[nodiscard]] auto exit_code() const noexcept -> int { return exit_code_; }

private:
  int exit_code_;
};

} // namespace lfsync
