#include "gitwatch/errors.hpp"
#include "gitwatch/status_cache.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using gitwatch::FileStatus;
using gitwatch::RepoStatus;
using gitwatch::StatusCache;
using ms = std::chrono::milliseconds;

int main() {
  try {
    StatusCache::Clock::time_point now = StatusCache::Clock::time_point{} + std::chrono::hours(1);
    auto clock = [&now] { return now; };

    // Hit inside the TTL, refresh after it
    {
      int calls = 0;
      StatusCache cache(
          ms(500),
          [&] {
            ++calls;
            RepoStatus s;
            s.branch = "main";
            s.ahead = static_cast<std::uint64_t>(calls);
            return s;
          },
          clock);

      if (cache.peek()) { std::cerr << "peek before first fetch\n"; return 1; }
      auto a = cache.get();
      if (!a || a->branch != "main" || a->ahead != 1) { std::cerr << "first get\n"; return 1; }
      now += ms(499);
      auto b = cache.get();
      if (!b || b->ahead != 1 || calls != 1) { std::cerr << "expected a cache hit\n"; return 1; }
      now += ms(1);
      auto c = cache.get();
      if (!c || c->ahead != 2 || calls != 2) { std::cerr << "expected a refresh at TTL\n"; return 1; }

      cache.invalidate();
      auto d = cache.get();
      if (!d || d->ahead != 3 || cache.fetch_count() != 3) { std::cerr << "invalidate\n"; return 1; }
      if (!cache.peek() || cache.peek()->ahead != 3) { std::cerr << "peek\n"; return 1; }
    }

    // No repository: absent, remembered for the TTL, re-checked afterwards
    {
      bool repo_exists = false;
      StatusCache cache(
          ms(500),
          [&]() -> RepoStatus {
            if (!repo_exists)
              throw gitwatch::NoRepositoryError("/nowhere");
            RepoStatus s;
            s.branch = "main";
            s.file_statuses["a.txt"] = FileStatus::Modified;
            return s;
          },
          clock);

      if (cache.get()) { std::cerr << "absent expected\n"; return 1; }
      repo_exists = true;
      if (cache.get()) { std::cerr << "absence must be cached for the TTL\n"; return 1; }
      if (cache.fetch_count() != 1) { std::cerr << "absent refetched early\n"; return 1; }
      now += ms(600);
      auto s = cache.get();
      if (!s || s->lookup("a.txt") != FileStatus::Modified) { std::cerr << "late repo\n"; return 1; }
    }

    // Other failures also degrade to absent
    {
      StatusCache cache(
          ms(500), []() -> RepoStatus { throw gitwatch::RepositoryError("corrupt index"); }, clock);
      if (cache.get()) { std::cerr << "repository error must read as absent\n"; return 1; }
    }

    // Concurrent callers share one fetch
    {
      std::atomic<int> calls{0};
      StatusCache cache(std::chrono::seconds(30), [&] {
        ++calls;
        std::this_thread::sleep_for(ms(50));
        RepoStatus s;
        s.branch = "main";
        return s;
      });

      std::atomic<int> seen{0};
      std::vector<std::thread> threads;
      for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
          if (auto s = cache.get(); s && s->branch == "main")
            ++seen;
        });
      }
      for (auto &t : threads)
        t.join();
      if (calls.load() != 1) { std::cerr << "expected a single fetch, got " << calls << "\n"; return 1; }
      if (seen.load() != 8) { std::cerr << "every caller must see the snapshot\n"; return 1; }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "status_cache OK\n";
  return 0;
}
