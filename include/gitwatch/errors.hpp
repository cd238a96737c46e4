#pragma once
#include <stdexcept>
#include <string>

namespace gitwatch {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Bad ignore pattern, invalid root or config value. Raised before the run loop starts.
struct ConfigError : Error {
  using Error::Error;
};

// A single path could not be read or watched. Recoverable.
struct IoError : Error {
  using Error::Error;
};

// The status query failed. Degrades to "no status".
struct RepositoryError : Error {
  using Error::Error;
};

struct NoRepositoryError : RepositoryError {
  explicit NoRepositoryError(const std::string &where)
      : RepositoryError("no git repository found at or above " + where) {}
};

// The watched root vanished or the event channel closed. Terminates the run loop.
struct FatalWatchError : Error {
  using Error::Error;
};

} // namespace gitwatch
