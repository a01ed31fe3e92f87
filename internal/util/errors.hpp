#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/api/result.hpp"

namespace chronicle::util {

/*
  Central error types.

  The CLI maps these to exit codes; the daemon logs them.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& msg) : std::invalid_argument(msg) {
  }
};

/*
  Raised by AppendEvents when the stream moved past the caller's expected
  version. Nothing was written.
*/
class ConcurrencyConflict : public std::runtime_error {
 public:
  ConcurrencyConflict(uint64_t expected, uint64_t actual)
      : std::runtime_error("concurrency conflict: expected version " + std::to_string(expected) + " but stream is at " +
                           std::to_string(actual)),
        expected_(expected),
        actual_(actual) {
  }

  uint64_t expected() const {
    return expected_;
  }
  uint64_t actual() const {
    return actual_;
  }

 private:
  uint64_t expected_;
  uint64_t actual_;
};

class StorageError : public std::runtime_error {
 public:
  StorageError(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode code() const {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

/*
  An event could not be applied after all retries. The projection position
  still points at the event before it.
*/
class ProjectionApplyError : public std::runtime_error {
 public:
  ProjectionApplyError(std::string event_id, uint64_t global_sequence, uint32_t attempts, const std::string& cause)
      : std::runtime_error("failed to apply event " + event_id + " (sequence " + std::to_string(global_sequence) +
                           ") after " + std::to_string(attempts) + " attempts: " + cause),
        event_id_(std::move(event_id)),
        global_sequence_(global_sequence),
        attempts_(attempts) {
  }

  const std::string& event_id() const {
    return event_id_;
  }
  uint64_t global_sequence() const {
    return global_sequence_;
  }
  uint32_t attempts() const {
    return attempts_;
  }

 private:
  std::string event_id_;
  uint64_t    global_sequence_;
  uint32_t    attempts_;
};

class RebuildError : public std::runtime_error {
 public:
  explicit RebuildError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chronicle::util
