#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

#include "pose/pose_sample.hpp"

namespace pose {

/**
 * @brief Single cell holding the freshest known pose.
 *
 * Not a queue: a newer sample replaces the current one and intermediate
 * samples are dropped. A sample is accepted only when it is strictly newer
 * than the current one:
 *   - both carry an id: compare ids
 *   - otherwise: compare timestamps
 * Ties are rejected. An id never goes backwards: a sample whose id is not
 * above the largest id accepted so far is rejected, even if a sample without
 * an id was accepted in between.
 *
 * Thread Safety:
 *   The whole sample is swapped under a mutex, so the pose-receiving path and
 *   the frame-encoding path never observe a half-written transform.
 */
class PoseCorrelator {
public:
  PoseCorrelator() = default;

  PoseCorrelator(const PoseCorrelator &) = delete;
  PoseCorrelator &operator=(const PoseCorrelator &) = delete;

  /**
   * @brief Offer a sample.
   * @return true if it became the current pose, false if stale/out-of-order
   */
  bool observe(const PoseSample &sample);

  /**
   * @brief Copy of the current pose, nullopt before the first accepted sample.
   */
  std::optional<PoseSample> current() const;

  uint64_t accepted_count() const;
  uint64_t rejected_count() const;

private:
  static bool is_newer(const PoseSample &candidate, const PoseSample &current);

  std::optional<PoseSample> current_;
  std::optional<uint64_t> highest_id_; // largest id ever accepted
  uint64_t accepted_ = 0;
  uint64_t rejected_ = 0;

  mutable std::mutex mutex_;
};

} // namespace pose
