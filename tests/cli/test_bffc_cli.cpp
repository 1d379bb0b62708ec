// test_bffc_cli.cpp - CLI integration tests for bffc

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliResult
{
  int exit_code = 0;
  std::string out;
  std::string err;
};

/// Runs bffc in `dir` with `args` (already quoted) and captures both streams.
CliResult run_bffc(const fs::path & dir, const std::string & args)
{
  CliResult result;
#ifdef BFF_BFFC_PATH
  const fs::path out_file = dir / "stdout.txt";
  const fs::path err_file = dir / "stderr.txt";
  const std::string cmd = "cd " + shell_quote(dir.string()) + " && " +
                          shell_quote(BFF_BFFC_PATH) + " " + args + " > " +
                          shell_quote(out_file.string()) + " 2> " +
                          shell_quote(err_file.string());

  const int rc = std::system(cmd.c_str());

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    result.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    result.exit_code = WEXITSTATUS(rc);
  } else {
    result.exit_code = 128;
  }
#else
  result.exit_code = rc;
#endif

  result.out = read_all(out_file);
  result.err = read_all(err_file);
#else
  (void)dir;
  (void)args;
#endif
  return result;
}

}  // namespace

TEST(BffcCliTest, CheckReportsOk)
{
#ifndef BFF_BFFC_PATH
  GTEST_SKIP() << "BFF_BFFC_PATH is not configured (bffc target missing?)";
#endif
  const fs::path dir = make_temp_dir("bffc_check_ok");
  write_all(dir / "fbuild.bff", ".A = 'x'\n.B = .A + 'y'\n");

  const auto r = run_bffc(dir, "check " + shell_quote((dir / "fbuild.bff").string()));

  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_NE(r.out.find(": OK"), std::string::npos);
}

TEST(BffcCliTest, CheckFailsOnUndefinedVariable)
{
#ifndef BFF_BFFC_PATH
  GTEST_SKIP() << "BFF_BFFC_PATH is not configured (bffc target missing?)";
#endif
  const fs::path dir = make_temp_dir("bffc_check_error");
  write_all(dir / "fbuild.bff", ".B = .Missing\n");

  const auto r = run_bffc(dir, "check fbuild.bff");

  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("Referencing variable \"Missing\""), std::string::npos) << r.err;
}

TEST(BffcCliTest, CheckFollowsIncludes)
{
#ifndef BFF_BFFC_PATH
  GTEST_SKIP() << "BFF_BFFC_PATH is not configured (bffc target missing?)";
#endif
  const fs::path dir = make_temp_dir("bffc_check_include");
  write_all(dir / "common.bff", ".Shared = 'yes'\n");
  write_all(dir / "fbuild.bff", "#include \"common.bff\"\n.Use = .Shared\n");

  EXPECT_EQ(run_bffc(dir, "check fbuild.bff").exit_code, 0);

  fs::remove(dir / "common.bff");
  EXPECT_EQ(run_bffc(dir, "check fbuild.bff").exit_code, 1);
}

TEST(BffcCliTest, DefinesBecomeEnvironmentVariables)
{
#ifndef BFF_BFFC_PATH
  GTEST_SKIP() << "BFF_BFFC_PATH is not configured (bffc target missing?)";
#endif
  const fs::path dir = make_temp_dir("bffc_defines");
  write_all(dir / "fbuild.bff", "#import BFF_TEST_SDK\n.Sdk = .BFF_TEST_SDK\n");

  EXPECT_EQ(run_bffc(dir, "check fbuild.bff").exit_code, 1);
  EXPECT_EQ(run_bffc(dir, "check fbuild.bff -D BFF_TEST_SDK=/opt/sdk").exit_code, 0);
}

TEST(BffcCliTest, DumpPrintsEvaluatedData)
{
#ifndef BFF_BFFC_PATH
  GTEST_SKIP() << "BFF_BFFC_PATH is not configured (bffc target missing?)";
#endif
  const fs::path dir = make_temp_dir("bffc_dump");
  write_all(dir / "fbuild.bff", ".Name = 'value'\nAlias('All') { .Targets = {} }\n");

  const auto r = run_bffc(dir, "dump fbuild.bff");
  ASSERT_EQ(r.exit_code, 0) << r.err;

  const json j = json::parse(r.out);
  EXPECT_TRUE(j["error"].is_null());
  ASSERT_EQ(j["targetDefinitions"].size(), 1u);
  EXPECT_EQ(j["targetDefinitions"][0]["name"], "All");

  bool saw_name = false;
  for (const auto & def : j["variableDefinitions"]) {
    if (def["name"] == "Name") {
      saw_name = true;
    }
  }
  EXPECT_TRUE(saw_name);
}

TEST(BffcCliTest, DumpUsesProjectConfiguration)
{
#ifndef BFF_BFFC_PATH
  GTEST_SKIP() << "BFF_BFFC_PATH is not configured (bffc target missing?)";
#endif
  const fs::path dir = make_temp_dir("bffc_project");
  fs::create_directories(dir / "build");
  write_all(dir / "build" / "fbuild.bff", "#if __WINDOWS__\n.OnWindows = true\n#endif\n");
  write_all(dir / "bff.yaml", "root_file: build/fbuild.bff\nplatform: windows\n");

  const auto r = run_bffc(dir, "dump --project");
  ASSERT_EQ(r.exit_code, 0) << r.err;

  const json j = json::parse(r.out);
  ASSERT_EQ(j["variableDefinitions"].size(), 1u);
  EXPECT_EQ(j["variableDefinitions"][0]["name"], "OnWindows");
}

TEST(BffcCliTest, ParsePrintsSyntaxTree)
{
#ifndef BFF_BFFC_PATH
  GTEST_SKIP() << "BFF_BFFC_PATH is not configured (bffc target missing?)";
#endif
  const fs::path dir = make_temp_dir("bffc_parse");
  write_all(dir / "fbuild.bff", ".A = 1\n");

  const auto r = run_bffc(dir, "parse fbuild.bff");
  ASSERT_EQ(r.exit_code, 0) << r.err;

  const json j = json::parse(r.out);
  EXPECT_EQ(j["type"], "Program");
}

TEST(BffcCliTest, ParseFailsOnSyntaxError)
{
#ifndef BFF_BFFC_PATH
  GTEST_SKIP() << "BFF_BFFC_PATH is not configured (bffc target missing?)";
#endif
  const fs::path dir = make_temp_dir("bffc_parse_error");
  write_all(dir / "fbuild.bff", ".A =\n");

  EXPECT_EQ(run_bffc(dir, "parse fbuild.bff").exit_code, 1);
}

TEST(BffcCliTest, RejectsUnknownPlatform)
{
#ifndef BFF_BFFC_PATH
  GTEST_SKIP() << "BFF_BFFC_PATH is not configured (bffc target missing?)";
#endif
  const fs::path dir = make_temp_dir("bffc_platform");
  write_all(dir / "fbuild.bff", ".A = 1\n");

  const auto r = run_bffc(dir, "check fbuild.bff --platform amiga");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("invalid platform"), std::string::npos);
}
