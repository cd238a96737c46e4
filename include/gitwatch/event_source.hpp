#pragma once
#include "gitwatch/event.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace gitwatch {

// Unbounded, thread-safe channel from the reader thread to the orchestrator.
// Producers never block, so a slow consumer cannot overflow the kernel queue.
class EventQueue {
public:
  void push(RawEvent ev);

  // Waits up to `timeout` for one event. std::nullopt on timeout or when closed and empty.
  std::optional<RawEvent> pop_for(std::chrono::milliseconds timeout);

  // Everything queued right now, without waiting.
  std::vector<RawEvent> drain();

  // No further pushes are accepted; waiting consumers wake up.
  void close();
  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<RawEvent> q_;
  bool closed_{false};
};

// Produces RawEvents for a watched root. `stop()` is the stop handle; once the source
// has terminated on its own it is a no-op.
class EventSource {
public:
  virtual ~EventSource() = default;

  virtual void start() = 0;
  virtual void stop() = 0;

  EventQueue &events() { return queue_; }

protected:
  EventQueue queue_;
};

// Linux inotify backend. One watch per directory; directories created (or moved in)
// while running are picked up when they fall within `max_depth`.
class InotifyEventSource final : public EventSource {
public:
  // max_depth: directory levels below root to watch; std::nullopt for unlimited.
  InotifyEventSource(std::filesystem::path root, bool recursive,
                     std::optional<std::uint32_t> max_depth = std::nullopt);
  ~InotifyEventSource() override;

  InotifyEventSource(const InotifyEventSource &) = delete;
  InotifyEventSource &operator=(const InotifyEventSource &) = delete;

  // Throws ConfigError if root is not a watchable directory.
  void start() override;
  void stop() override;

  [[nodiscard]] std::size_t watch_count() const { return watch_count_.load(); }

private:
  struct WatchedDir {
    std::filesystem::path path;
    std::uint32_t depth;
  };

  void run();
  void dispatch(std::uint32_t mask, int wd, std::uint32_t cookie, const char *name);
  void terminate(const std::string &why);
  [[nodiscard]] bool descend_into(std::uint32_t depth) const;
  bool add_watch(const std::filesystem::path &dir, std::uint32_t depth);
  void add_tree(const std::filesystem::path &dir, std::uint32_t depth);
  void remove_tree(const std::filesystem::path &dir);
  void close_fds();

  std::filesystem::path root_;
  bool recursive_;
  std::optional<std::uint32_t> max_depth_;

  int fd_{-1};
  int wake_[2]{-1, -1};
  int root_wd_{-1};
  std::unordered_map<int, WatchedDir> dirs_; // reader thread only once started
  std::atomic<std::size_t> watch_count_{0};

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> finished_{false};
};

} // namespace gitwatch
