#include <catch2/catch_test_macros.hpp>

#define STRINGIFY_HELPER(x) #x
#define STRINGIFY(x) STRINGIFY_HELPER(x)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

static const std::string segram_cli = STRINGIFY(SEGRAM_CLI);
static const std::string data_dir = STRINGIFY(SEGRAM_DATA_DIR);

// Portable exit code extraction: WEXITSTATUS on POSIX, raw value on Windows
static int
exit_code(int status) {
#ifdef _WIN32
  return status;
#else
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
#endif
}

static std::string
slurp(const fs::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

static int
run_cli(const std::string& args) {
  std::string cmd = segram_cli + " " + args + " >/dev/null 2>/dev/null";
  return exit_code(std::system(cmd.c_str()));
}

static int
run_cli_output(const std::string& args, std::string& out, std::string& err) {
  auto out_file = fs::temp_directory_path() / "segram_cli_stdout.txt";
  auto err_file = fs::temp_directory_path() / "segram_cli_stderr.txt";
  std::string cmd = segram_cli + " " + args + " >" + out_file.string() +
                    " 2>" + err_file.string();
  int rc = exit_code(std::system(cmd.c_str()));
  out = slurp(out_file);
  err = slurp(err_file);
  fs::remove(out_file);
  fs::remove(err_file);
  return rc;
}

static std::string
data(const std::string& name) {
  return data_dir + "/" + name;
}

TEST_CASE("--help exits 0 and produces output", "[cli]") {
  std::string out, err;
  int rc = run_cli_output("--help", out, err);
  CHECK(rc == 0);
  CHECK(err.find("Usage") != std::string::npos);
}

TEST_CASE("--version exits 0 and contains the name", "[cli]") {
  std::string out, err;
  int rc = run_cli_output("--version", out, err);
  CHECK(rc == 0);
  CHECK(err.find("segram") != std::string::npos);
}

TEST_CASE("no arguments exits 1 (usage error)", "[cli]") {
  CHECK(run_cli("") == 1);
}

TEST_CASE("unknown option exits 1", "[cli]") {
  CHECK(run_cli("--frobnicate") == 1);
}

TEST_CASE("missing grammar file exits 2", "[cli]") {
  CHECK(run_cli("nonexistent.xml " + data("select.xml")) == 2);
}

TEST_CASE("malformed grammar exits 3", "[cli]") {
  std::string out, err;
  int rc = run_cli_output(data("broken.xml") + " " + data("select.xml"), out,
                          err);
  CHECK(rc == 3);
  CHECK(err.find("grammar_loader") != std::string::npos);
}

TEST_CASE("complete match of the root rule", "[cli]") {
  std::string out, err;
  int rc = run_cli_output(
      data("statements.xml") + " " + data("select.xml"), out, err);
  CHECK(rc == 0);
  CHECK(out.find("matched: 9 segment(s)") != std::string::npos);
  CHECK(out.find("complete: yes") != std::string::npos);
  CHECK(out.find("text: SELECT a b\nFROM users") != std::string::npos);
}

TEST_CASE("partial match leaves the trailing comment", "[cli]") {
  std::string out, err;
  int rc = run_cli_output(
      data("statements.xml") + " " + data("partial.xml"), out, err);
  CHECK(rc == 0);
  CHECK(out.find("matched: 5 segment(s)") != std::string::npos);
  CHECK(out.find("unmatched: 2 segment(s)") != std::string::npos);
  CHECK(out.find("complete: no") != std::string::npos);
}

TEST_CASE("no match exits 4", "[cli]") {
  std::string out, err;
  int rc = run_cli_output(
      data("statements.xml") + " " + data("unmatched.xml"), out, err);
  CHECK(rc == 4);
  CHECK(out.find("matched: 0 segment(s)") != std::string::npos);
}

TEST_CASE("-r selects a rule", "[cli]") {
  std::string out, err;
  int rc = run_cli_output("-r table " + data("statements.xml") + " " +
                              data("unmatched.xml"),
                          out, err);
  CHECK(rc == 4);

  rc = run_cli_output("-r column_list " + data("statements.xml") + " " +
                          data("select.xml"),
                      out, err);
  CHECK(rc == 4);
}

TEST_CASE("unknown rule exits 1", "[cli]") {
  CHECK(run_cli("-r nope " + data("statements.xml") + " " +
                data("select.xml")) == 1);
}

TEST_CASE("--no-prune gives the same answer", "[cli]") {
  std::string pruned, unpruned, err;
  run_cli_output(data("statements.xml") + " " + data("select.xml"), pruned,
                 err);
  int rc = run_cli_output("--no-prune " + data("statements.xml") + " " +
                              data("select.xml"),
                          unpruned, err);
  CHECK(rc == 0);
  CHECK(pruned == unpruned);
}

TEST_CASE("left-recursive rule reports a match error", "[cli]") {
  std::string out, err;
  int rc = run_cli_output("-r loop --max-depth 50 " + data("statements.xml") +
                              " " + data("select.xml"),
                          out, err);
  CHECK(rc == 4);
  CHECK(err.find("maximum match depth") != std::string::npos);
}

TEST_CASE("-vvv traces pruning decisions", "[cli]") {
  std::string out, err;
  int rc = run_cli_output("-vvv " + data("statements.xml") + " " +
                              data("select.xml"),
                          out, err);
  CHECK(rc == 0);
  CHECK(err.find("PRN") != std::string::npos);
}
