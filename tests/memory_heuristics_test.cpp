#include "sysprobe/analyzers/memory_heuristics.hpp"
#include "sysprobe/core/errors.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace sysprobe;
using sysprobe::analyzers::MemoryHeuristics;
using sysprobe::analyzers::SnapshotDiffer;
using sysprobe::monitors::MemoryView;
using sysprobe::test::MakeRegion;

namespace {

core::MemorySnapshot
MakeSnapshot(uint64_t id, int pid, std::vector<monitors::MemoryRegion> heap,
             std::chrono::system_clock::time_point taken_at)
{
  core::MemorySnapshot snapshot;
  snapshot.id = id;
  snapshot.process_id = pid;
  snapshot.taken_at = taken_at;
  for (auto &region : heap) {
    region.view = MemoryView::HEAP;
  }
  snapshot.regions_by_view[MemoryView::HEAP] = std::move(heap);
  snapshot.summary = core::SnapshotStore::Summarize(snapshot.regions_by_view);
  snapshot.fingerprint = core::SnapshotStore::Fingerprint(snapshot.regions_by_view);
  return snapshot;
}

const auto kT0 = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
const auto kT1 = kT0 + std::chrono::seconds(5);

constexpr uint64_t kMiB = 1024 * 1024;

} // namespace

TEST(Fragmentation, NoFreeSpaceIsZero)
{
  EXPECT_EQ(MemoryHeuristics::Fragmentation({}), 0.0);
  EXPECT_EQ(MemoryHeuristics::Fragmentation({MakeRegion(0x1000, 0x1000)}), 0.0);
}

TEST(Fragmentation, SingleFreeBlockIsZero)
{
  EXPECT_EQ(MemoryHeuristics::Fragmentation({MakeRegion(0x1000, 300, false)}), 0.0);
}

TEST(Fragmentation, SplitFreeSpaceIsMoreFragmented)
{
  double split = MemoryHeuristics::Fragmentation(
      {MakeRegion(0x1000, 100, false), MakeRegion(0x2000, 100, false), MakeRegion(0x3000, 100, false)});
  double whole = MemoryHeuristics::Fragmentation({MakeRegion(0x1000, 300, false)});

  EXPECT_GT(split, whole);
  EXPECT_NEAR(split, 1.0 - 100.0 / 300.0, 1e-12);
}

TEST(Fragmentation, UsedRegionsAreIgnored)
{
  double value = MemoryHeuristics::Fragmentation(
      {MakeRegion(0x1000, 800, false), MakeRegion(0x2000, 4096), MakeRegion(0x3000, 200, false)});
  EXPECT_NEAR(value, 0.2, 1e-12);
}

TEST(Fragmentation, PerViewAndOverall)
{
  auto snapshot = MakeSnapshot(1, 10, {MakeRegion(0x1000, 100, false), MakeRegion(0x2000, 100, false)}, kT0);
  snapshot.regions_by_view[MemoryView::STACK] = {MakeRegion(0x90000, 200, false)};

  EXPECT_NEAR(MemoryHeuristics::Fragmentation(snapshot, MemoryView::HEAP), 0.5, 1e-12);
  EXPECT_EQ(MemoryHeuristics::Fragmentation(snapshot, MemoryView::STACK), 0.0);
  EXPECT_EQ(MemoryHeuristics::Fragmentation(snapshot, MemoryView::CODE), 0.0);
  // Pooled free regions: 100 + 100 + 200, largest 200
  EXPECT_NEAR(MemoryHeuristics::OverallFragmentation(snapshot), 0.5, 1e-12);
}

TEST(AssessLeak, GrowthWithoutReleaseIsPotentialLeak)
{
  auto a = MakeSnapshot(1, 10, {MakeRegion(0x100000, kMiB)}, kT0);
  auto b = MakeSnapshot(2, 10, {MakeRegion(0x100000, kMiB), MakeRegion(0x400000, 2 * kMiB)}, kT1);
  auto diff = SnapshotDiffer().Diff(a, b);

  auto assessment = MemoryHeuristics::AssessLeak(a, b, diff);
  EXPECT_TRUE(assessment.potential_leak);
  EXPECT_FALSE(assessment.churn);
  EXPECT_EQ(assessment.net_size_change, static_cast<int64_t>(2 * kMiB));
  EXPECT_EQ(assessment.added_count, 1u);
  EXPECT_EQ(assessment.removed_count, 0u);
  EXPECT_EQ(assessment.threshold, kMiB);
  EXPECT_FALSE(assessment.reason.empty());
}

TEST(AssessLeak, ChurnIsNotALeak)
{
  auto a = MakeSnapshot(1, 10, {MakeRegion(0x100000, kMiB), MakeRegion(0x300000, kMiB)}, kT0);
  auto b = MakeSnapshot(2, 10, {MakeRegion(0x500000, 3 * kMiB), MakeRegion(0x900000, kMiB)}, kT1);
  auto diff = SnapshotDiffer().Diff(a, b);

  auto assessment = MemoryHeuristics::AssessLeak(a, b, diff);
  EXPECT_EQ(assessment.net_size_change, static_cast<int64_t>(2 * kMiB));
  EXPECT_EQ(assessment.added_count, 2u);
  EXPECT_EQ(assessment.removed_count, 2u);
  EXPECT_TRUE(assessment.churn);
  EXPECT_FALSE(assessment.potential_leak);
}

TEST(AssessLeak, SmallGrowthIsBelowThreshold)
{
  auto a = MakeSnapshot(1, 10, {MakeRegion(0x100000, 4096)}, kT0);
  auto b = MakeSnapshot(2, 10, {MakeRegion(0x100000, 4096), MakeRegion(0x200000, 4096)}, kT1);
  auto diff = SnapshotDiffer().Diff(a, b);

  auto assessment = MemoryHeuristics::AssessLeak(a, b, diff);
  EXPECT_FALSE(assessment.potential_leak);
  EXPECT_FALSE(assessment.churn);

  EXPECT_TRUE(MemoryHeuristics::AssessLeak(a, b, diff, 1024).potential_leak);
}

TEST(AssessLeak, RejectsDifferentProcesses)
{
  auto a = MakeSnapshot(1, 10, {}, kT0);
  auto b = MakeSnapshot(2, 11, {}, kT1);
  auto diff = SnapshotDiffer().Diff(a, b);
  EXPECT_THROW(MemoryHeuristics::AssessLeak(a, b, diff), core::InvalidArgumentError);
}

TEST(AssessLeak, RejectsSameInstant)
{
  auto a = MakeSnapshot(1, 10, {}, kT0);
  auto b = MakeSnapshot(2, 10, {}, kT0);
  auto diff = SnapshotDiffer().Diff(a, b);
  EXPECT_THROW(MemoryHeuristics::AssessLeak(a, b, diff), core::InvalidArgumentError);
}
