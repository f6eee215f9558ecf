#pragma once
#include <stdexcept>
#include <string>

struct GuardragError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Unreadable file, empty extracted text, malformed metadata.
struct IngestionError : GuardragError {
  using GuardragError::GuardragError;
};

struct EmbeddingError : GuardragError {
  using GuardragError::GuardragError;
};

// Vector index failures, including dimension mismatches.
struct IndexError : GuardragError {
  using GuardragError::GuardragError;
};

struct ChatError : GuardragError {
  using GuardragError::GuardragError;
};

struct HttpError : GuardragError {
  HttpError(const std::string& what, long status) : GuardragError(what), status(status) {}
  long status; // 0 when the request never produced a response
};
