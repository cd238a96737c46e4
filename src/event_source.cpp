#include "gitwatch/event_source.hpp"

#include "gitwatch/errors.hpp"
#include "gitwatch/fs.hpp"
#include "gitwatch/log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace stdfs = std::filesystem;

namespace gitwatch {

// ——— EventQueue ———

void EventQueue::push(RawEvent ev) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_)
      return;
    q_.push_back(std::move(ev));
  }
  cv_.notify_one();
}

std::optional<RawEvent> EventQueue::pop_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, timeout, [this] { return !q_.empty() || closed_; });
  if (q_.empty())
    return std::nullopt;
  RawEvent ev = std::move(q_.front());
  q_.pop_front();
  return ev;
}

std::vector<RawEvent> EventQueue::drain() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<RawEvent> out(std::make_move_iterator(q_.begin()),
                            std::make_move_iterator(q_.end()));
  q_.clear();
  return out;
}

void EventQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool EventQueue::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

std::size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return q_.size();
}

// ——— InotifyEventSource ———

namespace {
constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB |
                                     IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF |
                                     IN_MOVE_SELF | IN_EXCL_UNLINK | IN_ONLYDIR;
} // namespace

InotifyEventSource::InotifyEventSource(stdfs::path root, bool recursive,
                                       std::optional<std::uint32_t> max_depth)
    : root_(std::move(root)), recursive_(recursive), max_depth_(max_depth) {}

InotifyEventSource::~InotifyEventSource() { stop(); }

bool InotifyEventSource::descend_into(std::uint32_t depth) const {
  return recursive_ && (!max_depth_ || depth <= *max_depth_);
}

void InotifyEventSource::start() {
  if (running_.load() || finished_.load())
    return;
  if (!fs::is_directory(root_))
    throw ConfigError("watch root is not a directory: " + root_.string());

  fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (fd_ < 0)
    throw ConfigError(std::string("inotify_init1: ") + std::strerror(errno));
  if (pipe2(wake_, O_NONBLOCK | O_CLOEXEC) != 0) {
    const int err = errno;
    close_fds();
    throw ConfigError(std::string("pipe2: ") + std::strerror(err));
  }

  if (!add_watch(root_, 0)) {
    const int err = errno;
    close_fds();
    throw ConfigError("cannot watch " + root_.string() + ": " + std::strerror(err));
  }
  root_wd_ = dirs_.begin()->first;
  if (recursive_) {
    std::error_code ec;
    for (stdfs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
      if (it->is_directory(ec) && !it->is_symlink(ec) && descend_into(1))
        add_tree(it->path(), 1);
    }
  }
  log::debug("watching ", root_.string(), " (", watch_count_.load(), " directories)");

  running_ = true;
  thread_ = std::thread([this] { run(); });
}

void InotifyEventSource::stop() {
  if (running_.exchange(false)) {
    const char b = 'x';
    // The reader may already have exited on its own; a failed wake-up is harmless then.
    if (write(wake_[1], &b, 1) < 0 && errno != EAGAIN)
      log::debug("wake pipe: ", std::strerror(errno));
  }
  if (thread_.joinable())
    thread_.join();
  close_fds();
}

void InotifyEventSource::close_fds() {
  if (fd_ >= 0)
    ::close(fd_);
  for (int &w : wake_) {
    if (w >= 0)
      ::close(w);
    w = -1;
  }
  fd_ = -1;
}

bool InotifyEventSource::add_watch(const stdfs::path &dir, std::uint32_t depth) {
  const int wd = inotify_add_watch(fd_, dir.c_str(), kWatchMask);
  if (wd < 0)
    return false;
  // The same directory reached twice (e.g. via a rename) keeps one wd.
  if (dirs_.insert_or_assign(wd, WatchedDir{dir, depth}).second)
    ++watch_count_;
  return true;
}

void InotifyEventSource::add_tree(const stdfs::path &dir, std::uint32_t depth) {
  if (!add_watch(dir, depth)) {
    queue_.push(RawEvent::error("cannot watch directory: " + std::string(std::strerror(errno)),
                                dir));
    return;
  }
  if (!descend_into(depth + 1))
    return;
  std::error_code ec;
  for (stdfs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_directory(ec) && !it->is_symlink(ec))
      add_tree(it->path(), depth + 1);
  }
  if (ec)
    queue_.push(RawEvent::error("cannot list directory: " + ec.message(), dir));
}

void InotifyEventSource::remove_tree(const stdfs::path &dir) {
  for (auto it = dirs_.begin(); it != dirs_.end();) {
    if (it->first != root_wd_ && fs::is_within(it->second.path, dir)) {
      inotify_rm_watch(fd_, it->first);
      it = dirs_.erase(it);
      --watch_count_;
    } else {
      ++it;
    }
  }
}

void InotifyEventSource::terminate(const std::string &why) {
  log::warn(why);
  queue_.push(RawEvent::terminated(why));
  queue_.close();
  finished_ = true;
}

void InotifyEventSource::run() {
  alignas(struct inotify_event) char buffer[16 * 1024];

  while (!finished_.load()) {
    pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_[0], POLLIN, 0}};
    const int ret = poll(fds, 2, -1);
    if (ret < 0) {
      if (errno == EINTR)
        continue;
      terminate(std::string("poll: ") + std::strerror(errno));
      break;
    }
    if (fds[1].revents != 0)
      break; // stop() requested
    if ((fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
      terminate("inotify descriptor closed");
      break;
    }

    const ssize_t len = read(fd_, buffer, sizeof(buffer));
    if (len < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      terminate(std::string("read: ") + std::strerror(errno));
      break;
    }

    const struct inotify_event *event = nullptr;
    for (char *ptr = buffer; ptr < buffer + len && !finished_.load();
         ptr += sizeof(struct inotify_event) + event->len) {
      event = reinterpret_cast<const struct inotify_event *>(ptr);
      dispatch(event->mask, event->wd, event->cookie, event->len ? event->name : nullptr);
    }
  }
}

void InotifyEventSource::dispatch(std::uint32_t mask, int wd, std::uint32_t cookie,
                                  const char *name) {
  if (mask & IN_Q_OVERFLOW) {
    queue_.push(RawEvent::error("kernel event queue overflowed; changes were missed", root_));
    return;
  }

  const auto it = dirs_.find(wd);
  if (it == dirs_.end())
    return;

  if (wd == root_wd_ && (mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_UNMOUNT | IN_IGNORED))) {
    terminate("watched root is no longer accessible: " + root_.string());
    return;
  }
  if (mask & IN_IGNORED) {
    dirs_.erase(it);
    --watch_count_;
    return;
  }
  if (!name)
    return; // self events on subdirectories; the parent reports them

  const bool is_dir = (mask & IN_ISDIR) != 0;
  const std::uint32_t depth = it->second.depth;
  stdfs::path full = it->second.path / name;

  if (mask & IN_CREATE) {
    if (is_dir && descend_into(depth + 1))
      add_tree(full, depth + 1);
    queue_.push(RawEvent::created(std::move(full), is_dir));
  } else if (mask & IN_DELETE) {
    queue_.push(RawEvent::removed(std::move(full), is_dir));
  } else if (mask & IN_MOVED_FROM) {
    if (is_dir)
      remove_tree(full);
    queue_.push(RawEvent::renamed_from(std::move(full), cookie, is_dir));
  } else if (mask & IN_MOVED_TO) {
    if (is_dir && descend_into(depth + 1))
      add_tree(full, depth + 1);
    queue_.push(RawEvent::renamed_to(std::move(full), cookie, is_dir));
  } else if ((mask & (IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB)) && !is_dir) {
    queue_.push(RawEvent::modified(std::move(full)));
  }
}

} // namespace gitwatch
