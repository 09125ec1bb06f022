#include <csignal>
#include <cstdlib>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cli/cli.hpp"
#include "config.hpp"
#include "notice.hpp"
#include "scratch_dir.hpp"

extern char** environ;

namespace {

std::string expected_output() {
  std::string out;
  for (const auto& line : notice_lines()) {
    out.append(line);
    out.push_back('\n');
  }
  return out;
}

std::set<std::string> snapshot_environment() {
  std::set<std::string> env;
  for (char** e = environ; *e != nullptr; ++e) env.insert(*e);
  return env;
}

}  // namespace

class RunCliTest : public ScratchDirTest {
 protected:
  void SetUp() override {
    ScratchDirTest::SetUp();
    gConfig = std::make_unique<Config>();
    gConfig->set_defaults();
  }

  void TearDown() override {
    gConfig.reset();
    ScratchDirTest::TearDown();
  }

  int run(std::vector<std::string> args, std::string& out) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    ::testing::internal::CaptureStdout();
    int code = run_cli(static_cast<int>(args.size()), argv.data());
    out = ::testing::internal::GetCapturedStdout();
    return code;
  }
};

TEST_F(RunCliTest, PrintsNoticeThenOpensEnvFile) {
  gConfig->opener = write_recording_opener();

  std::string out;
  EXPECT_EQ(run({"envfix"}, out), 0);
  EXPECT_EQ(out, expected_output());
  EXPECT_EQ(read_file(dir / "args.txt"), ".env\n");
}

TEST_F(RunCliTest, IgnoresArguments) {
  gConfig->opener = write_recording_opener();

  std::string plain;
  ASSERT_EQ(run({"envfix"}, plain), 0);
  auto plainArgs = read_file(dir / "args.txt");
  std::filesystem::remove(dir / "args.txt");

  std::string withArgs;
  EXPECT_EQ(run({"envfix", "--help", "-x", "other.env", "--config=foo", "--",
                 "trailing"},
                withArgs),
            0);
  EXPECT_EQ(withArgs, plain);
  EXPECT_EQ(read_file(dir / "args.txt"), plainArgs);
}

TEST_F(RunCliTest, ExitCodeFollowsOpener) {
  gConfig->opener = write_recording_opener(4);

  std::string out;
  EXPECT_EQ(run({"envfix"}, out), 4);
  EXPECT_EQ(out, expected_output());
}

TEST_F(RunCliTest, MissingOpenerStillPrintsNotice) {
  gConfig->opener = (dir / "no-such-editor").string();

  std::string out;
  EXPECT_EQ(run({"envfix"}, out), 127);
  EXPECT_EQ(out, expected_output());
}

TEST_F(RunCliTest, LeavesEnvironmentAndEnvFileAlone) {
  const std::string contents = "DATABASE_URL=sqlite:/nope\n";
  {
    std::ofstream ofs(dir / ".env");
    ofs << contents;
  }
  gConfig->opener = write_recording_opener();
  auto envBefore = snapshot_environment();

  std::string out;
  EXPECT_EQ(run({"envfix"}, out), 0);
  EXPECT_EQ(snapshot_environment(), envBefore);
  EXPECT_EQ(read_file(dir / ".env"), contents);
}

TEST_F(RunCliTest, ReportsLaunchFailureAndReturnsOne) {
  gConfig->opener.clear();

  std::string out;
  ::testing::internal::CaptureStderr();
  EXPECT_EQ(run({"envfix"}, out), 1);
  auto err = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(out, expected_output());
  EXPECT_EQ(err, "open_in_default_editor(): no opener configured\n");
}

TEST_F(RunCliTest, IgnoredSigchldDoesNotFailTheRun) {
  signal(SIGCHLD, SIG_IGN);
  gConfig->opener = write_recording_opener();

  std::string out;
  int code = run({"envfix"}, out);
  signal(SIGCHLD, SIG_DFL);

  EXPECT_EQ(code, 0);
  EXPECT_EQ(out, expected_output());
  EXPECT_EQ(read_file(dir / "args.txt"), ".env\n");
}
