#include "loghive/cli.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << '\n';
    std::exit(1);
  }
}

struct CliResult {
  int code = 0;
  std::string out;
  std::string log;
};

CliResult run(const std::vector<std::string> &args) {
  std::vector<const char *> argv;
  argv.push_back("loghive");
  for (const auto &a : args) argv.push_back(a.c_str());

  std::ostringstream out;
  std::ostringstream log;
  CliResult r;
  r.code = loghive::run_cli(static_cast<int>(argv.size()), argv.data(), out, log);
  r.out = out.str();
  r.log = log.str();
  return r;
}

std::string read_file(const fs::path &p) {
  std::ifstream in(p);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

const char *kLines =
    "1.1.1.1,2024-02-25 12:34:56,/home,200,UA1\n"
    "1.1.1.2,2024-02-25 12:35:10,/home,500,UA2\n"
    "1.1.1.2,2024-02-25 12:36:10,/login,404,UA2\n"
    "1.1.1.2,2024-02-25 12:37:10,/login,404,UA2\n"
    "1.1.1.2,2024-02-25 12:38:10,/login,404,UA2\n"
    "1.1.1.2,2024-02-25 12:39:10,/login,404,UA2\n"
    "1.1.1.3,2024-02-25 12:39:50,/login,404\n";

} // namespace

int main() {
  const fs::path dir = fs::temp_directory_path() / "loghive_test_cli";
  fs::remove_all(dir);
  fs::create_directories(dir);
  const std::string input = (dir / "access.csv").string();
  {
    std::ofstream out(input);
    out << kLines;
  }

  {
    CliResult r = run({"--help"});
    check(r.code == 0 && r.out.find("Usage:") != std::string::npos, "--help");
    r = run({"--version"});
    check(r.code == 0 && r.out.find("loghive v") == 0, "--version");
    r = run({});
    check(r.code == 1, "no command");
  }

  {
    CliResult r = run({"report", "--file", input});
    check(r.code == 1 && r.log.find("Unknown command: report") != std::string::npos, "unknown command");

    r = run({"analyze", "--file", input, "--bogus"});
    check(r.code == 1 && r.log.find("Unknown argument: --bogus") != std::string::npos, "unknown argument");

    r = run({"analyze", "--file", input, "--fail-statuses", "404,abc"});
    check(r.code == 1 && r.log.find("Invalid --fail-statuses") != std::string::npos, "bad status list");

    r = run({"analyze", "--file", input, "--fail-statuses", "404,700"});
    check(r.code == 1, "status list out of range");

    r = run({"analyze", "--file", input, "--top", "0"});
    check(r.code == 1 && r.log.find("Invalid --top") != std::string::npos, "bad --top");

    r = run({"analyze", "--file", input, "--min-failures", "-1"});
    check(r.code == 1, "bad --min-failures");

    r = run({"analyze", "--file", input, "--jobs", "x"});
    check(r.code == 1, "bad --jobs");

    r = run({"analyze", "--file", input, "--format", "xml"});
    check(r.code == 1 && r.log.find("Invalid --format") != std::string::npos, "bad --format");

    r = run({"analyze"});
    check(r.code == 1 && r.log.find("Missing --file") != std::string::npos, "missing --file");

    r = run({"analyze", "--file", (dir / "absent.csv").string()});
    check(r.code == 1 && r.log.find("Failed to open file") != std::string::npos, "unreadable input");
  }

  {
    CliResult r = run({"analyze", "--file", input, "--format", "json"});
    check(r.code == 0, "json run: " + r.log);
    check(r.out.find("\"total_requests\": 6,") != std::string::npos, "json total");
    check(r.out.find("{\"ip\": \"1.1.1.2\", \"count\": 5}") != std::string::npos, "json failed ip");
    check(r.out.find("{\"line\": 7, \"error\": \"FieldCount\"}") != std::string::npos, "json skipped");
    check(r.log.find("Warning: FieldCount at line 7.") != std::string::npos, "skipped line logged");
  }

  {
    CliResult r = run({"analyze", "--file", input, "--top", "1", "--fail-statuses", " 500 ", "--min-failures", "0"});
    check(r.code == 0, "text run");
    check(r.out.find("Total requests: 6") != std::string::npos, "text total");
    check(r.out.find("  /login: 4\n\nTop user agents") != std::string::npos, "--top 1");
    check(r.out.find("Failed IPs:\n  1.1.1.2: 1\n") != std::string::npos, "--fail-statuses / --min-failures");
  }

  {
    const fs::path parts = dir / "warehouse";
    const fs::path report = dir / "report.json";
    CliResult r = run({"analyze", "--file", input, "--format", "json", "--out", report.string(),
                       "--partition-dir", parts.string(), "--jobs", "4"});
    check(r.code == 0, "out + partition run: " + r.log);
    check(r.out.empty(), "--out leaves stdout empty");
    check(read_file(report).find("\"total_requests\": 6,") != std::string::npos, "--out contents");
    check(read_file(parts / "status=200" / "000000_0") == "1.1.1.1,2024-02-25 12:34:56,/home,200,UA1\n",
          "--partition-dir contents");
    check(fs::exists(parts / "status=404" / "000000_0") && fs::exists(parts / "status=500" / "000000_0"),
          "--partition-dir partitions");
  }

  {
    // bad --out fails before any partition is written
    const fs::path parts = dir / "untouched";
    CliResult r = run({"analyze", "--file", input, "--out", (dir / "no" / "such" / "report.txt").string(),
                       "--partition-dir", parts.string()});
    check(r.code == 1 && r.log.find("Failed to open output file") != std::string::npos, "bad --out");
    check(!fs::exists(parts), "no partitions written when --out fails");
  }

  fs::remove_all(dir);

  std::cout << "cli tests passed\n";
  return 0;
}
