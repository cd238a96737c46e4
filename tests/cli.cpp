#include "cli/registry.hpp"

#include "repo_fixture.hpp"

#include <json/json.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// Runs a registered command with stdout captured.
static int run(const std::string &cmd, std::vector<std::string> args, std::string &out) {
  args.insert(args.begin(), cmd);
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  const auto fn = gitwatch::cli::find_command(cmd);
  std::ostringstream captured;
  auto *old = std::cout.rdbuf(captured.rdbuf());
  const int rc = fn(static_cast<int>(argv.size()), argv.data());
  std::cout.rdbuf(old);
  out = captured.str();
  return rc;
}

int main() {
  fixture::TempDir tmp("cli");
  try {
    gitwatch::cli::register_all_commands();
    if (!gitwatch::cli::find_command("watch") || !gitwatch::cli::find_command("status")) {
      std::cerr << "commands not registered\n";
      return 1;
    }
    if (gitwatch::cli::find_command("commit")) { std::cerr << "unexpected command\n"; return 1; }

    fixture::FakeRepo fake(tmp.path / "repo");
    fixture::write_file(fake.root() / "staged.txt", "s\n");
    fake.write_index({fixture::IndexFile{.path = "staged.txt", .id = fake.blob("s\n")}});
    fixture::write_file(fake.root() / "loose.txt", "l\n");

    std::string out;
    if (run("status", {fake.root().string(), "-f", "events"}, out) != gitwatch::cli::kExitOk ||
        out != "? loose.txt\nA staged.txt\n") {
      std::cerr << "status events output:\n" << out;
      return 1;
    }

    if (run("status", {fake.root().string()}, out) != gitwatch::cli::kExitOk) {
      std::cerr << "status json failed\n";
      return 1;
    }
    Json::Value v;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    if (!reader->parse(out.data(), out.data() + out.size(), &v, &errs) ||
        v["branch"].asString() != "main" || v["staged_files"].asUInt64() != 1 ||
        v["untracked_files"].asUInt64() != 1) {
      std::cerr << "status json output: " << out;
      return 1;
    }

    // Exit codes: no repository, bad usage
    fixture::fs::create_directories(tmp.path / "plain");
    if (run("status", {(tmp.path / "plain").string()}, out) != gitwatch::cli::kExitFailure) {
      std::cerr << "no repository should fail\n";
      return 1;
    }
    if (run("status", {"--format", "xml"}, out) != gitwatch::cli::kExitUsage) {
      std::cerr << "bad format should be a usage error\n";
      return 1;
    }
    if (run("watch", {(tmp.path / "missing").string()}, out) != gitwatch::cli::kExitUsage) {
      std::cerr << "missing watch root should be a usage error\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "cli OK\n";
  return 0;
}
