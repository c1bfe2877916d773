#include "sysprobe/core/snapshot_store.hpp"
#include "sysprobe/core/errors.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace sysprobe;
using sysprobe::core::SnapshotRequest;
using sysprobe::core::SnapshotStore;
using sysprobe::monitors::MemoryView;
using sysprobe::test::FakeMemoryInspector;
using sysprobe::test::MakeRegion;

namespace {

constexpr int kPid = 100;

std::shared_ptr<FakeMemoryInspector>
StandardInspector()
{
  auto inspector = std::make_shared<FakeMemoryInspector>();
  inspector->SetRegions(kPid, MemoryView::HEAP,
                        {MakeRegion(0x1000, 0x1000), MakeRegion(0x2000, 0x3000, false)});
  inspector->SetRegions(kPid, MemoryView::STACK, {MakeRegion(0x7ff000, 0x1000)});
  inspector->SetRegions(kPid, MemoryView::CODE, {MakeRegion(0x400000, 0x2000, true, "r-xp")});
  return inspector;
}

SnapshotRequest
ForPid(int pid, const std::string &label = "")
{
  SnapshotRequest request;
  request.process_id = pid;
  request.label = label;
  return request;
}

} // namespace

TEST(SnapshotStore, TakesAndSummarisesSnapshot)
{
  SnapshotStore store(StandardInspector());

  auto snapshot = store.TakeSnapshot(ForPid(kPid, "before"));
  EXPECT_EQ(snapshot->id, 1u);
  EXPECT_EQ(snapshot->process_id, kPid);
  EXPECT_EQ(snapshot->label, "before");
  EXPECT_EQ(snapshot->RegionCount(), 4u);

  EXPECT_EQ(snapshot->summary.used_size, 0x1000u + 0x1000u + 0x2000u);
  EXPECT_EQ(snapshot->summary.free_size, 0x3000u);
  EXPECT_EQ(snapshot->summary.total_size, snapshot->summary.used_size + snapshot->summary.free_size);
  EXPECT_EQ(snapshot->summary.used_region_count, 3u);
  EXPECT_NEAR(snapshot->summary.used_percentage, 100.0 * 0x4000 / 0x7000, 1e-9);
  EXPECT_EQ(snapshot->fingerprint.size(), 64u);

  EXPECT_EQ(snapshot->Regions(MemoryView::HEAP).size(), 2u);
  EXPECT_TRUE(snapshot->Regions(MemoryView::DATA).empty());
  EXPECT_EQ(snapshot->Regions(MemoryView::CODE)[0].view, MemoryView::CODE);
}

TEST(SnapshotStore, IdsAreMonotonicAndLookupsWork)
{
  SnapshotStore store(StandardInspector());

  auto a = store.TakeSnapshot(ForPid(kPid));
  auto b = store.TakeSnapshot(ForPid(kPid));
  EXPECT_LT(a->id, b->id);
  EXPECT_EQ(a->label, "snapshot");

  EXPECT_EQ(store.GetSnapshot(b->id)->id, b->id);
  EXPECT_THROW(store.GetSnapshot(42), core::NotFoundError);
  EXPECT_EQ(store.ListSnapshots().size(), 2u);
  EXPECT_EQ(store.SnapshotsForProcess(kPid).size(), 2u);
  EXPECT_TRUE(store.SnapshotsForProcess(kPid + 1).empty());

  // Same layout, same fingerprint
  EXPECT_EQ(a->fingerprint, b->fingerprint);
}

TEST(SnapshotStore, RegionIdsAreUniqueWithinSnapshot)
{
  SnapshotStore store(StandardInspector());
  auto snapshot = store.TakeSnapshot(ForPid(kPid));

  std::set<uint64_t> ids;
  for (const auto &[view, regions] : snapshot->regions_by_view) {
    for (const auto &region : regions) {
      EXPECT_TRUE(ids.insert(region.id).second);
    }
  }
  EXPECT_EQ(ids.size(), snapshot->RegionCount());
}

TEST(SnapshotStore, RequiresProcessOrSession)
{
  SnapshotStore store(StandardInspector());

  EXPECT_THROW(store.TakeSnapshot(SnapshotRequest{}), core::InvalidArgumentError);
  EXPECT_THROW(store.TakeSnapshot(ForPid(0)), core::InvalidArgumentError);
  EXPECT_THROW(store.TakeSnapshot(ForPid(-3)), core::InvalidArgumentError);
  EXPECT_TRUE(store.ListSnapshots().empty());
}

TEST(SnapshotStore, ResolvesProcessFromSession)
{
  auto resolver = [](uint64_t session_id) -> int {
    if (session_id == 7)
      return kPid;
    throw core::NotFoundError("Session not found: " + std::to_string(session_id));
  };
  SnapshotStore store(StandardInspector(), resolver);

  SnapshotRequest request;
  request.session_id = 7;
  request.process_id = 1; // ignored when a session is given
  auto snapshot = store.TakeSnapshot(request);
  EXPECT_EQ(snapshot->process_id, kPid);
  ASSERT_TRUE(snapshot->session_id.has_value());
  EXPECT_EQ(*snapshot->session_id, 7u);

  request.session_id = 8;
  EXPECT_THROW(store.TakeSnapshot(request), core::NotFoundError);
}

TEST(SnapshotStore, UnknownSessionWithoutResolver)
{
  SnapshotStore store(StandardInspector());
  SnapshotRequest request;
  request.session_id = 1;
  EXPECT_THROW(store.TakeSnapshot(request), core::NotFoundError);
}

TEST(SnapshotStore, EnumerationFailureStoresNothing)
{
  auto inspector = StandardInspector();
  inspector->FailView(kPid, MemoryView::STACK, "permission denied");
  SnapshotStore store(inspector);

  EXPECT_THROW(store.TakeSnapshot(ForPid(kPid)), core::CaptureUnavailableError);
  EXPECT_TRUE(store.ListSnapshots().empty());

  inspector->ClearFailures();
  EXPECT_EQ(store.TakeSnapshot(ForPid(kPid))->id, 1u);
}

TEST(SnapshotStore, OverlappingUsedRegionsAreRejected)
{
  auto inspector = std::make_shared<FakeMemoryInspector>();
  inspector->SetRegions(kPid, MemoryView::HEAP, {MakeRegion(0x1000, 0x2000), MakeRegion(0x2800, 0x1000)});
  SnapshotStore store(inspector);

  EXPECT_THROW(store.TakeSnapshot(ForPid(kPid)), core::IntegrityViolationError);
  EXPECT_TRUE(store.ListSnapshots().empty());
}

TEST(SnapshotStore, FreeRegionsMustNotOverlapAnything)
{
  // Adjacent regions are fine
  std::vector<monitors::MemoryRegion> regions = {MakeRegion(0x1000, 0x2000), MakeRegion(0x3000, 0x1000, false),
                                                 MakeRegion(0x4000, 0x1000)};
  EXPECT_NO_THROW(SnapshotStore::ValidateDisjoint(MemoryView::HEAP, regions));

  EXPECT_THROW(SnapshotStore::ValidateDisjoint(MemoryView::HEAP,
                                               {MakeRegion(0x1000, 0x2000), MakeRegion(0x1800, 0x1000, false)}),
               core::IntegrityViolationError);
  EXPECT_THROW(SnapshotStore::ValidateDisjoint(MemoryView::HEAP,
                                               {MakeRegion(0x1000, 0x2000), MakeRegion(0x1000, 0x800, false)}),
               core::IntegrityViolationError);
  EXPECT_THROW(SnapshotStore::ValidateDisjoint(MemoryView::HEAP,
                                               {MakeRegion(0x1000, 0x800, false), MakeRegion(0x1000, 0x800, false)}),
               core::IntegrityViolationError);
}

TEST(SnapshotStore, FreeGapSharingUsedBaseIsRejected)
{
  auto inspector = std::make_shared<FakeMemoryInspector>();
  inspector->SetRegions(kPid, MemoryView::HEAP, {MakeRegion(0x1000, 0x2000), MakeRegion(0x1000, 0x800, false)});
  SnapshotStore store(inspector);

  EXPECT_THROW(store.TakeSnapshot(ForPid(kPid)), core::IntegrityViolationError);
  EXPECT_TRUE(store.ListSnapshots().empty());
}

TEST(SnapshotStore, RetentionDropsOldest)
{
  SnapshotStore::Config config;
  config.max_snapshots = 2;
  SnapshotStore store(StandardInspector(), nullptr, config);

  store.TakeSnapshot(ForPid(kPid));
  store.TakeSnapshot(ForPid(kPid));
  auto third = store.TakeSnapshot(ForPid(kPid));

  auto all = store.ListSnapshots();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all.front()->id, 2u);
  EXPECT_EQ(all.back()->id, third->id);
  EXPECT_THROW(store.GetSnapshot(1), core::NotFoundError);
}

TEST(SnapshotStore, EmptyProcessHasZeroSummary)
{
  SnapshotStore store(std::make_shared<FakeMemoryInspector>());
  auto snapshot = store.TakeSnapshot(ForPid(kPid));
  EXPECT_EQ(snapshot->summary.total_size, 0u);
  EXPECT_EQ(snapshot->summary.used_percentage, 0.0);
}
