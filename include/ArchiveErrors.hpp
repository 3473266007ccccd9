#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace archiver {

/**
 * Base class for every error the archiver reports to its callers.
 * Media download and snapshot failures are not errors: they surface as
 * empty optionals.
 */
class ArchiveError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class InputErrorKind {
  UnrecognizedLocation,
  UnrecognizedInput,
  InstanceRequired,
  InvalidArgument
};

// User-correctable input problem, message is shown verbatim.
class InputError : public ArchiveError {
public:
  InputError(InputErrorKind kind, const std::string &message)
      : ArchiveError(message), m_kind(kind) {}

  InputErrorKind kind() const { return m_kind; }

private:
  InputErrorKind m_kind;
};

class RemoteError : public ArchiveError {
public:
  explicit RemoteError(const std::string &message) : ArchiveError(message) {}
  RemoteError(int status, const std::string &message)
      : ArchiveError(message), m_status(status) {}

  std::optional<int> status() const { return m_status; }

  // A 500 or a Misskey INTERNAL_ERROR payload: the instance is struggling.
  bool isOverload() const {
    return m_status == 500 ||
           std::string(what()).find("INTERNAL_ERROR") != std::string::npos;
  }

private:
  std::optional<int> m_status;
};

// Connection failure or timeout below the HTTP status level.
class TransportError : public ArchiveError {
public:
  using ArchiveError::ArchiveError;
};

class StorageError : public ArchiveError {
public:
  using ArchiveError::ArchiveError;
};

// Browser protocol failure. Never leaves HeadlessChromeRenderer::capture(),
// which reports it as a failed snapshot.
class RenderError : public ArchiveError {
public:
  using ArchiveError::ArchiveError;
};

} // namespace archiver
