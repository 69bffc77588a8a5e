#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

#include "pose/pose_correlator.hpp"

using pose::PoseCorrelator;
using pose::PoseSample;

namespace {

PoseSample sample(std::optional<uint64_t> id, double ts) {
  PoseSample s;
  s.id = id;
  s.timestamp = ts;
  return s;
}

} // namespace

TEST(PoseCorrelatorTest, EmptyUntilFirstSample) {
  PoseCorrelator c;
  EXPECT_FALSE(c.current().has_value());
  EXPECT_TRUE(c.observe(sample(1, 1.0)));
  ASSERT_TRUE(c.current().has_value());
  EXPECT_EQ(*c.current()->id, 1u);
}

TEST(PoseCorrelatorTest, OlderIdDoesNotReplaceNewer) {
  PoseCorrelator c;
  EXPECT_TRUE(c.observe(sample(5, 100.0)));
  EXPECT_FALSE(c.observe(sample(3, 90.0)));

  const auto cur = c.current();
  ASSERT_TRUE(cur.has_value());
  EXPECT_EQ(*cur->id, 5u);
  EXPECT_DOUBLE_EQ(cur->timestamp, 100.0);
  EXPECT_EQ(c.accepted_count(), 1u);
  EXPECT_EQ(c.rejected_count(), 1u);
}

TEST(PoseCorrelatorTest, IdWinsOverTimestampWhenBothPresent) {
  PoseCorrelator c;
  EXPECT_TRUE(c.observe(sample(5, 100.0)));
  // Newer id with an older timestamp is still newer.
  EXPECT_TRUE(c.observe(sample(6, 50.0)));
  EXPECT_EQ(*c.current()->id, 6u);
}

TEST(PoseCorrelatorTest, TiesAreRejected) {
  PoseCorrelator c;
  EXPECT_TRUE(c.observe(sample(7, 1.0)));
  EXPECT_FALSE(c.observe(sample(7, 2.0)));

  PoseCorrelator by_time;
  EXPECT_TRUE(by_time.observe(sample(std::nullopt, 3.0)));
  EXPECT_FALSE(by_time.observe(sample(std::nullopt, 3.0)));
}

TEST(PoseCorrelatorTest, FallsBackToTimestampWithoutIds) {
  PoseCorrelator c;
  EXPECT_TRUE(c.observe(sample(std::nullopt, 10.0)));
  EXPECT_FALSE(c.observe(sample(std::nullopt, 9.0)));
  EXPECT_TRUE(c.observe(sample(std::nullopt, 11.0)));
  // One side lacks an id: timestamps decide.
  EXPECT_FALSE(c.observe(sample(100, 10.5)));
  EXPECT_TRUE(c.observe(sample(100, 12.0)));
  EXPECT_DOUBLE_EQ(c.current()->timestamp, 12.0);
}

TEST(PoseCorrelatorTest, CurrentPoseNeverRegressesInId) {
  PoseCorrelator c;
  const uint64_t ids[] = {3, 1, 4, 1, 5, 9, 2, 6, 5, 3, 5, 8, 9, 7};
  uint64_t high = 0;
  for (uint64_t id : ids) {
    c.observe(sample(id, static_cast<double>(id)));
    high = std::max(high, id);
    EXPECT_EQ(*c.current()->id, high);
  }
}

TEST(PoseCorrelatorTest, IdStaysMonotonicAcrossSamplesWithoutId) {
  PoseCorrelator c;
  EXPECT_TRUE(c.observe(sample(5, 100.0)));
  EXPECT_TRUE(c.observe(sample(std::nullopt, 101.0)));

  // Newer timestamp, but the id is below one already accepted.
  EXPECT_FALSE(c.observe(sample(3, 102.0)));
  EXPECT_FALSE(c.observe(sample(5, 103.0)));
  EXPECT_FALSE(c.current()->id.has_value());
  EXPECT_DOUBLE_EQ(c.current()->timestamp, 101.0);

  EXPECT_TRUE(c.observe(sample(6, 104.0)));
  EXPECT_EQ(*c.current()->id, 6u);
  EXPECT_EQ(c.rejected_count(), 2u);
}

TEST(PoseCorrelatorTest, ReadersNeverSeeTornTransforms) {
  PoseCorrelator c;
  std::atomic<bool> done{false};

  std::thread writer([&] {
    for (uint64_t id = 1; id <= 20000; ++id) {
      PoseSample s;
      s.id = id;
      s.timestamp = static_cast<double>(id);
      s.transform.fill(static_cast<double>(id));
      c.observe(s);
    }
    done.store(true);
  });

  std::atomic<int> torn{0};
  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      while (!done.load()) {
        const auto cur = c.current();
        if (!cur) {
          continue;
        }
        for (double v : cur->transform) {
          if (v != static_cast<double>(*cur->id)) {
            ++torn;
          }
        }
      }
    });
  }

  writer.join();
  for (auto &t : readers) {
    t.join();
  }
  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(*c.current()->id, 20000u);
}
