#include "gitwatch/errors.hpp"
#include "gitwatch/event_source.hpp"

#include "repo_fixture.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <vector>

using gitwatch::RawEvent;
using gitwatch::RawKind;
namespace fs = std::filesystem;
using ms = std::chrono::milliseconds;

// Collects events until one satisfies `pred` or two seconds pass.
static bool wait_for(gitwatch::EventQueue &q, std::vector<RawEvent> &seen,
                     const std::function<bool(const RawEvent &)> &pred) {
  const auto until = std::chrono::steady_clock::now() + ms(2000);
  while (std::chrono::steady_clock::now() < until) {
    if (auto ev = q.pop_for(ms(50))) {
      seen.push_back(*ev);
      if (pred(*ev))
        return true;
    }
  }
  return false;
}

int main() {
  fixture::TempDir tmp("events");
  try {
    const auto root = tmp.path / "watched";
    fs::create_directories(root / "existing");

    // Not a directory
    {
      gitwatch::InotifyEventSource bad(tmp.path / "missing", true);
      bool threw = false;
      try {
        bad.start();
      } catch (const gitwatch::ConfigError &) {
        threw = true;
      }
      if (!threw) { std::cerr << "missing root accepted\n"; return 1; }
      bad.stop();
    }

    gitwatch::InotifyEventSource src(root, true);
    src.start();
    auto &q = src.events();
    std::vector<RawEvent> seen;
    if (src.watch_count() != 2) { std::cerr << "watch count " << src.watch_count() << "\n"; return 1; }

    fixture::write_file(root / "a.txt", "one\n");
    if (!wait_for(q, seen, [&](const RawEvent &e) {
          return e.kind == RawKind::Created && e.path == root / "a.txt";
        })) {
      std::cerr << "no create event\n";
      return 1;
    }

    fixture::write_file(root / "a.txt", "two\n");
    if (!wait_for(q, seen, [&](const RawEvent &e) {
          return e.kind == RawKind::Modified && e.path == root / "a.txt";
        })) {
      std::cerr << "no modify event\n";
      return 1;
    }

    fs::rename(root / "a.txt", root / "b.txt");
    std::uint32_t from_cookie = 0;
    if (!wait_for(q, seen, [&](const RawEvent &e) {
          if (e.kind == RawKind::RenamedFrom && e.path == root / "a.txt")
            from_cookie = e.cookie;
          return e.kind == RawKind::RenamedTo && e.path == root / "b.txt";
        })) {
      std::cerr << "no rename pair\n";
      return 1;
    }
    if (from_cookie == 0 || seen.back().cookie != from_cookie) { std::cerr << "rename cookie\n"; return 1; }

    // Pre-existing and newly created directories are watched
    fixture::write_file(root / "existing" / "x.txt", "x\n");
    if (!wait_for(q, seen, [&](const RawEvent &e) { return e.path == root / "existing" / "x.txt"; })) {
      std::cerr << "no event below an existing directory\n";
      return 1;
    }
    fs::create_directories(root / "fresh");
    if (!wait_for(q, seen, [&](const RawEvent &e) {
          return e.kind == RawKind::Created && e.is_dir && e.path == root / "fresh";
        })) {
      std::cerr << "no directory create\n";
      return 1;
    }
    fixture::write_file(root / "fresh" / "y.txt", "y\n");
    if (!wait_for(q, seen, [&](const RawEvent &e) { return e.path == root / "fresh" / "y.txt"; })) {
      std::cerr << "new directory not watched\n";
      return 1;
    }

    fs::remove(root / "b.txt");
    if (!wait_for(q, seen, [&](const RawEvent &e) {
          return e.kind == RawKind::Removed && e.path == root / "b.txt";
        })) {
      std::cerr << "no remove event\n";
      return 1;
    }

    // Removing the root ends the stream
    fs::remove_all(root);
    if (!wait_for(q, seen, [](const RawEvent &e) { return e.kind == RawKind::Terminated; })) {
      std::cerr << "no terminal event\n";
      return 1;
    }
    if (!q.closed()) { std::cerr << "queue open after termination\n"; return 1; }
    src.stop();
    src.stop();

    // Non-recursive: only the root directory
    const auto flat = tmp.path / "flat";
    fs::create_directories(flat / "sub");
    gitwatch::InotifyEventSource shallow(flat, false);
    shallow.start();
    if (shallow.watch_count() != 1) { std::cerr << "non-recursive watch count\n"; return 1; }
    shallow.stop();
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "event_source OK\n";
  return 0;
}
