#include "sysprobe/parsers/strace_parser.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace sysprobe;
using sysprobe::monitors::SyscallArg;
using sysprobe::parsers::StraceParser;

namespace fs = std::filesystem;

namespace {

constexpr int kPid = 1234;

template <typename T>
const T &
As(const SyscallArg &arg)
{
  EXPECT_TRUE(std::holds_alternative<T>(arg));
  return std::get<T>(arg);
}

} // namespace

TEST(StraceParser, ParsesCompleteLine)
{
  StraceParser parser;
  auto event = parser.ParseLine(R"(1700000000.123456 openat(AT_FDCWD, "/etc/passwd", O_RDONLY) = 3 <0.000021>)", kPid);

  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->name, "openat");
  EXPECT_EQ(event->result, 3);
  EXPECT_FALSE(event->error.has_value());
  EXPECT_EQ(event->duration_ns, 21000u);
  EXPECT_EQ(event->pid, kPid);
  EXPECT_EQ(event->tid, kPid);

  auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(event->timestamp.time_since_epoch());
  EXPECT_EQ(since_epoch.count(), 1700000000123456LL);

  ASSERT_EQ(event->parameters.size(), 3u);
  EXPECT_EQ(As<std::string>(event->parameters[0]), "AT_FDCWD");
  EXPECT_EQ(As<std::string>(event->parameters[1]), "/etc/passwd");
  EXPECT_EQ(As<std::string>(event->parameters[2]), "O_RDONLY");
  EXPECT_FALSE(event->raw_line.empty());
}

TEST(StraceParser, ThreadPrefixSetsTid)
{
  StraceParser parser;
  auto event = parser.ParseLine(R"([pid  4243] 1700000000.123500 read(3, "root:x:0:0"..., 4096) = 1024 <0.000010>)", kPid);

  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->tid, 4243);
  EXPECT_EQ(event->pid, kPid);
  ASSERT_EQ(event->parameters.size(), 3u);
  EXPECT_EQ(As<long>(event->parameters[0]), 3);
  EXPECT_EQ(As<std::string>(event->parameters[1]), "root:x:0:0");
  EXPECT_EQ(As<long>(event->parameters[2]), 4096);
  EXPECT_EQ(event->result, 1024);
}

TEST(StraceParser, FailedCallCarriesErrno)
{
  StraceParser parser;
  auto event = parser.ParseLine(
      R"(12:34:56.789012 access("/etc/ld.so.preload", R_OK) = -1 ENOENT (No such file or directory) <0.000008>)", kPid);

  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->name, "access");
  EXPECT_EQ(event->result, -1);
  ASSERT_TRUE(event->error.has_value());
  EXPECT_EQ(*event->error, "ENOENT");
  EXPECT_EQ(event->duration_ns, 8000u);
}

TEST(StraceParser, NestedStructArgumentStaysWhole)
{
  StraceParser parser;
  auto event = parser.ParseLine(
      R"(1700000000.000001 fstat(3, {st_mode=S_IFREG|0644, st_size=2772, ...}) = 0 <0.000003>)", kPid);

  ASSERT_TRUE(event.has_value());
  ASSERT_EQ(event->parameters.size(), 2u);
  EXPECT_EQ(As<std::string>(event->parameters[1]), "{st_mode=S_IFREG|0644, st_size=2772, ...}");
}

TEST(StraceParser, ResumedCallIsEmitted)
{
  StraceParser parser;
  EXPECT_FALSE(parser.ParseLine("[pid 1235] 1700000000.000001 read(3,  <unfinished ...>", kPid).has_value());

  auto event = parser.ParseLine(R"([pid 1235] 1700000000.000900 <... read resumed>"", 4096) = 0 <0.000005>)", kPid);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->name, "read");
  EXPECT_EQ(event->tid, 1235);
  EXPECT_EQ(event->result, 0);
  ASSERT_EQ(event->parameters.size(), 2u);
  EXPECT_EQ(As<std::string>(event->parameters[0]), "");
}

TEST(StraceParser, NoReturnCall)
{
  StraceParser parser;
  auto event = parser.ParseLine("1700000000.000001 exit_group(0) = ?", kPid);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->name, "exit_group");
  EXPECT_EQ(event->result, 0);
  EXPECT_EQ(event->duration_ns, 0u);
}

TEST(StraceParser, NonSyscallLinesProduceNothing)
{
  StraceParser parser;
  EXPECT_FALSE(parser.ParseLine("", kPid).has_value());
  EXPECT_FALSE(parser.ParseLine("--- SIGCHLD {si_signo=SIGCHLD, si_code=CLD_EXITED} ---", kPid).has_value());
  EXPECT_FALSE(parser.ParseLine("1700000000.000001 +++ exited with 0 +++", kPid).has_value());
  EXPECT_FALSE(parser.ParseLine("strace: Process 1234 attached", kPid).has_value());
  EXPECT_FALSE(parser.ParseLine("garbage that is not strace output", kPid).has_value());
  EXPECT_FALSE(parser.ParseLine("1700000000.000001 read(3, \"abc\", 3)", kPid).has_value());
}

TEST(StraceParser, ArgumentTyping)
{
  EXPECT_EQ(As<long>(StraceParser::ParseArgument("42")), 42);
  EXPECT_EQ(As<long>(StraceParser::ParseArgument("-1")), -1);
  EXPECT_EQ(As<long>(StraceParser::ParseArgument("0x10")), 16);
  EXPECT_EQ(As<std::string>(StraceParser::ParseArgument(R"("a\nb")")), "a\nb");
  EXPECT_EQ(As<std::string>(StraceParser::ParseArgument("O_RDONLY|O_CLOEXEC")), "O_RDONLY|O_CLOEXEC");
  EXPECT_EQ(As<std::string>(StraceParser::ParseArgument("NULL")), "NULL");

  EXPECT_TRUE(StraceParser::ParseArguments("").empty());
  EXPECT_EQ(StraceParser::ParseArguments(R"("a,b", [1, 2], 3)").size(), 3u);
}

TEST(StraceParser, Durations)
{
  EXPECT_EQ(StraceParser::ParseDuration("0.000123").value_or(0), 123000u);
  EXPECT_EQ(StraceParser::ParseDuration("2.5").value_or(0), 2500000000u);
  EXPECT_EQ(StraceParser::ParseDuration("1").value_or(0), 1000000000u);
  EXPECT_FALSE(StraceParser::ParseDuration("").has_value());
  EXPECT_FALSE(StraceParser::ParseDuration("abc").has_value());
  EXPECT_FALSE(StraceParser::ParseDuration("0.12x").has_value());
}

TEST(StraceParser, DiagnosticsAndExitNotices)
{
  EXPECT_TRUE(StraceParser::IsTracerDiagnostic("strace: attach: ptrace(PTRACE_SEIZE, 1): Operation not permitted"));
  EXPECT_FALSE(StraceParser::IsTracerDiagnostic("1700000000.000001 close(3) = 0"));

  EXPECT_TRUE(StraceParser::IsAttachNotice("strace: Process 1234 attached"));
  EXPECT_TRUE(StraceParser::IsAttachNotice("strace: Process 1234 attached with 3 threads"));
  EXPECT_TRUE(StraceParser::IsAttachNotice("strace: Process 1240 detached"));
  EXPECT_FALSE(StraceParser::IsAttachNotice("strace: attach: ptrace(PTRACE_SEIZE, 1): Operation not permitted"));

  EXPECT_TRUE(StraceParser::IsProcessExit("+++ exited with 0 +++", kPid));
  EXPECT_TRUE(StraceParser::IsProcessExit("1700000000.000001 +++ killed by SIGKILL +++", kPid));
  EXPECT_TRUE(StraceParser::IsProcessExit("[pid  1234] +++ exited with 1 +++", kPid));
  // Another thread exiting does not end the trace
  EXPECT_FALSE(StraceParser::IsProcessExit("[pid  1235] +++ exited with 0 +++", kPid));
  EXPECT_FALSE(StraceParser::IsProcessExit("1700000000.000001 close(3) = 0", kPid));
}

TEST(StraceParser, ParsesLogFileInOrder)
{
  auto path = fs::temp_directory_path() / "sysprobe_strace_parser_test.log";
  {
    std::ofstream out(path);
    out << "1700000000.000001 openat(AT_FDCWD, \"/tmp/x\", O_RDONLY) = 3 <0.000010>\n";
    out << "--- SIGCHLD {si_signo=SIGCHLD} ---\n";
    out << "1700000000.000002 read(3, \"\", 10) = 0 <0.000002>\n";
    out << "1700000000.000003 close(3) = 0 <0.000001>\n";
  }

  StraceParser parser;
  auto events = parser.Parse(path, kPid);
  fs::remove(path);

  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].name, "openat");
  EXPECT_EQ(events[0].id, 1u);
  EXPECT_EQ(events[2].name, "close");
  EXPECT_EQ(events[2].id, 3u);

  EXPECT_TRUE(parser.Parse("/nonexistent/sysprobe.log", kPid).empty());
}
