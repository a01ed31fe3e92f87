#pragma once

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/projection/projector.hpp"

namespace chronicle::testing {

/*
  Projector that remembers what it applied. Failures can be scripted per
  global sequence: fail_times[seq] = n fails the next n attempts, a negative
  n fails forever.
*/
class RecordingProjector final : public projection::Projector {
 public:
  explicit RecordingProjector(std::string name = "recording") : name_(std::move(name)) {
  }

  std::string Name() const override {
    return name_;
  }

  void Apply(const db::model::EventRecord& event) override {
    std::scoped_lock lock(mutex_);
    ++attempts_[event.global_sequence];

    auto it = fail_times_.find(event.global_sequence);
    if (it != fail_times_.end() && it->second != 0) {
      if (it->second > 0) --it->second;
      throw std::runtime_error("scripted failure at sequence " + std::to_string(event.global_sequence));
    }

    // idempotent on global sequence
    if (!applied_.empty() && event.global_sequence <= applied_.back()) return;
    applied_.push_back(event.global_sequence);
  }

  void Reset() override {
    std::scoped_lock lock(mutex_);
    applied_.clear();
    ++resets_;
  }

  db::model::ProjectionPositionRecord CurrentPosition() const override {
    std::scoped_lock                    lock(mutex_);
    db::model::ProjectionPositionRecord p;
    p.projection_name = name_;
    if (!applied_.empty()) p.last_global_sequence = applied_.back();
    p.events_processed = applied_.size();
    return p;
  }

  void FailAt(uint64_t sequence, int times) {
    std::scoped_lock lock(mutex_);
    fail_times_[sequence] = times;
  }

  std::vector<uint64_t> Applied() const {
    std::scoped_lock lock(mutex_);
    return applied_;
  }

  int Attempts(uint64_t sequence) const {
    std::scoped_lock lock(mutex_);
    auto             it = attempts_.find(sequence);
    return it == attempts_.end() ? 0 : it->second;
  }

  int Resets() const {
    std::scoped_lock lock(mutex_);
    return resets_;
  }

 private:
  std::string                 name_;
  mutable std::mutex          mutex_;
  std::vector<uint64_t>       applied_;
  std::map<uint64_t, int>     fail_times_;
  std::map<uint64_t, int>     attempts_;
  int                         resets_ = 0;
};

} // namespace chronicle::testing
