#include "sysprobe/monitors/proc_maps_inspector.hpp"
#include "sysprobe/core/errors.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace sysprobe;
using sysprobe::monitors::AllocationKind;
using sysprobe::monitors::MapsEntry;
using sysprobe::monitors::MemoryView;
using sysprobe::monitors::ProcMapsInspector;

namespace fs = std::filesystem;

namespace {

const char *kMaps = "00400000-00452000 r-xp 00000000 08:02 173521     /usr/bin/cat\n"
                    "00651000-00652000 rw-p 00051000 08:02 173521     /usr/bin/cat\n"
                    "00e03000-00e24000 rw-p 00000000 00:00 0          [heap]\n"
                    "7f1c00000000-7f1c00021000 rw-p 00000000 00:00 0\n"
                    "7f1c00021000-7f1c04000000 ---p 00000000 00:00 0\n"
                    "7fff5a2d5000-7fff5a2f6000 rw-p 00000000 00:00 0  [stack]\n"
                    "ffffffffff600000-ffffffffff601000 --xp 00000000 00:00 0  [vsyscall]\n";

std::vector<MapsEntry>
ParseAll(const std::string &text)
{
  std::vector<MapsEntry> entries;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    auto entry = ProcMapsInspector::ParseMapsLine(line);
    if (entry) {
      entries.push_back(*entry);
    }
  }
  return entries;
}

MapsEntry
Entry(uint64_t start, uint64_t end, const std::string &perms = "rw-p", const std::string &path = "")
{
  MapsEntry entry;
  entry.start_address = start;
  entry.end_address = end;
  entry.permissions = perms;
  entry.pathname = path;
  return entry;
}

} // namespace

TEST(ProcMapsInspector, ParsesMapsLine)
{
  auto entry = ProcMapsInspector::ParseMapsLine("00400000-00452000 r-xp 00001000 08:02 173521  /usr/bin/dbus daemon");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->start_address, 0x400000u);
  EXPECT_EQ(entry->end_address, 0x452000u);
  EXPECT_EQ(entry->permissions, "r-xp");
  EXPECT_EQ(entry->offset, 0x1000u);
  EXPECT_EQ(entry->device, "08:02");
  EXPECT_EQ(entry->inode, 173521u);
  EXPECT_EQ(entry->pathname, "/usr/bin/dbus daemon");

  auto anonymous = ProcMapsInspector::ParseMapsLine("7f1c00000000-7f1c00021000 rw-p 00000000 00:00 0");
  ASSERT_TRUE(anonymous.has_value());
  EXPECT_TRUE(anonymous->pathname.empty());
}

TEST(ProcMapsInspector, RejectsMalformedLines)
{
  EXPECT_FALSE(ProcMapsInspector::ParseMapsLine("").has_value());
  EXPECT_FALSE(ProcMapsInspector::ParseMapsLine("00400000 r-xp 00000000 08:02 1").has_value());
  EXPECT_FALSE(ProcMapsInspector::ParseMapsLine("zz-00452000 r-xp 00000000 08:02 1").has_value());
  EXPECT_FALSE(ProcMapsInspector::ParseMapsLine("00452000-00400000 r-xp 00000000 08:02 1").has_value());
  EXPECT_FALSE(ProcMapsInspector::ParseMapsLine("00400000-00452000 rx 00000000 08:02 1").has_value());
}

TEST(ProcMapsInspector, ClassifiesViews)
{
  EXPECT_EQ(ProcMapsInspector::ClassifyView(Entry(0, 1, "rw-p", "[heap]")), MemoryView::HEAP);
  EXPECT_EQ(ProcMapsInspector::ClassifyView(Entry(0, 1, "rw-p", "[stack]")), MemoryView::STACK);
  EXPECT_EQ(ProcMapsInspector::ClassifyView(Entry(0, 1, "rw-p", "[stack:4243]")), MemoryView::STACK);
  EXPECT_EQ(ProcMapsInspector::ClassifyView(Entry(0, 1, "r-xp", "/usr/lib/libc.so.6")), MemoryView::CODE);
  EXPECT_EQ(ProcMapsInspector::ClassifyView(Entry(0, 1, "r--p", "/usr/lib/libc.so.6")), MemoryView::DATA);
  EXPECT_EQ(ProcMapsInspector::ClassifyView(Entry(0, 1)), MemoryView::DATA);
}

TEST(ProcMapsInspector, BuildViewSortsAndFillsGaps)
{
  ProcMapsInspector inspector;
  std::vector<MapsEntry> entries = {Entry(0x5000, 0x6000), Entry(0x1000, 0x2000), Entry(0x2000, 0x3000),
                                    Entry(0x9000, 0xa000, "r-xp")};

  auto regions = inspector.BuildView(entries, MemoryView::DATA);
  // 0x1000, 0x2000, gap 0x3000..0x5000, 0x5000
  ASSERT_EQ(regions.size(), 4u);
  EXPECT_EQ(regions[0].base_address, 0x1000u);
  EXPECT_EQ(regions[1].base_address, 0x2000u);
  EXPECT_FALSE(regions[2].used);
  EXPECT_EQ(regions[2].base_address, 0x3000u);
  EXPECT_EQ(regions[2].size, 0x2000u);
  EXPECT_EQ(regions[2].allocation_kind, AllocationKind::UNMAPPED);
  EXPECT_TRUE(regions[3].used);

  for (std::size_t i = 0; i < regions.size(); ++i) {
    EXPECT_EQ(regions[i].id, i + 1);
    EXPECT_EQ(regions[i].view, MemoryView::DATA);
  }
}

TEST(ProcMapsInspector, LargeGapsAreNotFreeSpace)
{
  ProcMapsInspector::Config config;
  config.max_free_gap_bytes = 0x1000;
  ProcMapsInspector inspector(config);

  auto regions = inspector.BuildView({Entry(0x1000, 0x2000), Entry(0x3000, 0x4000), Entry(0x10000, 0x11000)},
                                     MemoryView::DATA);
  ASSERT_EQ(regions.size(), 4u);
  EXPECT_FALSE(regions[1].used);
  EXPECT_TRUE(regions[2].used);
  EXPECT_TRUE(regions[3].used);
}

TEST(ProcMapsInspector, AllocationKinds)
{
  ProcMapsInspector inspector;
  auto entries = ParseAll(kMaps);
  ASSERT_EQ(entries.size(), 7u);

  auto heap = inspector.BuildView(entries, MemoryView::HEAP);
  ASSERT_EQ(heap.size(), 1u);
  EXPECT_EQ(heap[0].allocation_kind, AllocationKind::HEAP);
  EXPECT_EQ(heap[0].size, 0x21000u);

  auto code = inspector.BuildView(entries, MemoryView::CODE);
  ASSERT_EQ(code.size(), 2u);
  EXPECT_EQ(code[0].allocation_kind, AllocationKind::FILE_BACKED);
  EXPECT_EQ(code[0].label, "/usr/bin/cat");
  EXPECT_EQ(code[1].allocation_kind, AllocationKind::SPECIAL);

  auto data = inspector.BuildView(entries, MemoryView::DATA);
  auto anonymous = std::find_if(data.begin(), data.end(), [](const monitors::MemoryRegion &r) {
    return r.base_address == 0x7f1c00000000u;
  });
  ASSERT_NE(anonymous, data.end());
  EXPECT_EQ(anonymous->allocation_kind, AllocationKind::ANONYMOUS);
  EXPECT_EQ(anonymous->protection, "rw-p");
}

TEST(ProcMapsInspector, ReadsFromProcRoot)
{
  auto root = fs::temp_directory_path() / "sysprobe_proc_maps_test";
  fs::create_directories(root / "321");
  {
    std::ofstream out(root / "321" / "maps");
    out << kMaps;
    out << "not a maps line\n";
  }

  ProcMapsInspector::Config config;
  config.proc_root = root;
  ProcMapsInspector inspector(config);

  EXPECT_EQ(inspector.Regions(321, MemoryView::STACK).size(), 1u);
  EXPECT_EQ(inspector.Regions(321, MemoryView::HEAP).size(), 1u);
  EXPECT_THROW(inspector.Regions(322, MemoryView::HEAP), core::CaptureUnavailableError);
  EXPECT_THROW(inspector.Regions(0, MemoryView::HEAP), core::CaptureUnavailableError);

  fs::remove_all(root);
}
