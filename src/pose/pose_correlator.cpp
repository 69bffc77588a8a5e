#include "pose_correlator.hpp"

namespace pose {

bool PoseCorrelator::is_newer(const PoseSample &candidate,
                              const PoseSample &current) {
  if (candidate.id && current.id) {
    return *candidate.id > *current.id;
  }
  return candidate.timestamp > current.timestamp;
}

bool PoseCorrelator::observe(const PoseSample &sample) {
  std::lock_guard<std::mutex> lock(mutex_);

  // An id at or below one already accepted is stale even when the current
  // sample carries no id.
  if (sample.id && highest_id_ && *sample.id <= *highest_id_) {
    ++rejected_;
    return false;
  }
  if (current_ && !is_newer(sample, *current_)) {
    ++rejected_;
    return false;
  }

  current_ = sample;
  if (sample.id) {
    highest_id_ = sample.id;
  }
  ++accepted_;
  return true;
}

std::optional<PoseSample> PoseCorrelator::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

uint64_t PoseCorrelator::accepted_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accepted_;
}

uint64_t PoseCorrelator::rejected_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rejected_;
}

} // namespace pose
