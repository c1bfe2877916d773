#include "sysprobe/monitors/strace_capture_source.hpp"
#include "sysprobe/core/errors.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace sysprobe;
using sysprobe::monitors::CaptureResult;
using sysprobe::monitors::StraceCaptureSource;

namespace fs = std::filesystem;

namespace {

// Shell script standing in for strace; it is invoked as "<script> -p PID"
class StraceCaptureSourceTest : public ::testing::Test
{
protected:
  void
  SetUp() override
  {
    dir = fs::temp_directory_path() /
          ("sysprobe_strace_" + std::to_string(getpid()) + "_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
  }

  void
  TearDown() override
  {
    fs::remove_all(dir);
  }

  StraceCaptureSource::Config
  Tracer(const std::string &body)
  {
    auto script = dir / "strace.sh";
    {
      std::ofstream out(script);
      out << "#!/bin/sh\n"
          << "echo launched >> " << (dir / "launches").string() << "\n"
          << body;
    }
    fs::permissions(script, fs::perms::owner_all);

    StraceCaptureSource::Config config;
    config.strace_binary = script.string();
    config.strace_args.clear();
    config.attach_timeout_ms = 2000;
    return config;
  }

  std::string
  WaitFor(const std::string &flag)
  {
    return "while [ ! -f " + (dir / flag).string() + " ]; do sleep 0.05; done\n";
  }

  void
  Touch(const std::string &flag)
  {
    std::ofstream out(dir / flag);
  }

  std::size_t
  Launches()
  {
    std::ifstream in(dir / "launches");
    std::size_t count = 0;
    std::string line;
    while (std::getline(in, line))
      count++;
    return count;
  }

  fs::path dir;
};

} // namespace

TEST_F(StraceCaptureSourceTest, SessionsOnOneProcessShareOneTracer)
{
  StraceCaptureSource source(Tracer("echo \"strace: Process $2 attached\"\n" + WaitFor("go") +
                                    "echo \"1700000000.000001 getpid() = $2 <0.000005>\"\n" + WaitFor("more") +
                                    "echo \"1700000000.000002 close(3) = 0 <0.000001>\"\n"
                                    "exec sleep 30\n"));

  auto first = source.Attach(getpid());
  auto second = source.Attach(getpid());
  EXPECT_EQ(Launches(), 1u);

  Touch("go");
  auto a = first->Next();
  auto b = second->Next();
  ASSERT_EQ(a.kind, CaptureResult::Kind::EVENT);
  ASSERT_EQ(b.kind, CaptureResult::Kind::EVENT);
  EXPECT_EQ(a.event->name, "getpid");
  EXPECT_EQ(b.event->name, "getpid");

  // Ending one channel leaves the other reading
  first->Interrupt();
  EXPECT_EQ(first->Next().kind, CaptureResult::Kind::END_OF_STREAM);
  first.reset();

  Touch("more");
  auto c = second->Next();
  ASSERT_EQ(c.kind, CaptureResult::Kind::EVENT);
  EXPECT_EQ(c.event->name, "close");

  // With every channel gone the next attach launches a fresh tracer
  second.reset();
  auto third = source.Attach(getpid());
  EXPECT_EQ(Launches(), 2u);
}

TEST_F(StraceCaptureSourceTest, AttachDiagnosticFailsSynchronously)
{
  StraceCaptureSource source(
      Tracer("echo \"strace: attach: ptrace(PTRACE_SEIZE, $2): Operation not permitted\"\nexit 1\n"));

  EXPECT_THROW(source.Attach(getpid()), core::CaptureUnavailableError);
}

TEST_F(StraceCaptureSourceTest, TracerExitingBeforeAttachFails)
{
  StraceCaptureSource source(Tracer("exit 1\n"));
  EXPECT_THROW(source.Attach(getpid()), core::CaptureUnavailableError);
}

TEST_F(StraceCaptureSourceTest, MissingBinaryFails)
{
  StraceCaptureSource::Config config;
  config.strace_binary = (dir / "no-such-strace").string();
  StraceCaptureSource source(config);

  EXPECT_THROW(source.Attach(getpid()), core::CaptureUnavailableError);
  EXPECT_THROW(source.Attach(0), core::CaptureUnavailableError);
}

TEST_F(StraceCaptureSourceTest, ProcessExitEndsEveryChannel)
{
  StraceCaptureSource source(Tracer("echo \"strace: Process $2 attached\"\n" + WaitFor("go") +
                                    "echo \"1700000000.000001 getpid() = $2 <0.000005>\"\n"
                                    "echo \"+++ exited with 0 +++\"\n"
                                    "exec sleep 30\n"));

  auto first = source.Attach(getpid());
  auto second = source.Attach(getpid());
  Touch("go");

  for (auto *channel : {first.get(), second.get()}) {
    auto event = channel->Next();
    ASSERT_EQ(event.kind, CaptureResult::Kind::EVENT);
    EXPECT_EQ(event.event->name, "getpid");
    EXPECT_EQ(channel->Next().kind, CaptureResult::Kind::END_OF_STREAM);
    EXPECT_EQ(channel->Next().kind, CaptureResult::Kind::END_OF_STREAM);
  }
}
