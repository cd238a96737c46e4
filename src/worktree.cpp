#include "gitwatch/worktree.hpp"

#include "gitwatch/consts.hpp"
#include "gitwatch/errors.hpp"
#include "gitwatch/index.hpp"
#include "gitwatch/log.hpp"
#include "gitwatch/path_matcher.hpp"
#include "gitwatch/repo.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace stdfs = std::filesystem;

namespace gitwatch::worktree {

static void tree_to_map_impl(const Repository &repo, const std::string &tree_hex,
                             const std::string &prefix, PathBlobMap &out) {
  for (auto &e : repo.read_tree(tree_hex)) {
    if (e.mode == consts::kModeTree)
      tree_to_map_impl(repo, to_hex(e.id), prefix + e.name + "/", out);
    else
      out[prefix + e.name] = BlobRef{.mode = e.mode, .id = e.id};
  }
}

PathBlobMap tree_to_map(const Repository &repo, const std::string &tree_hex) {
  PathBlobMap m;
  tree_to_map_impl(repo, tree_hex, "", m);
  return m;
}

static oid symlink_oid(const stdfs::path &p) {
  std::vector<char> buf(4096);
  const auto n = ::readlink(p.c_str(), buf.data(), buf.size());
  if (n < 0)
    throw IoError("readlink failed: " + p.string());
  return blob_oid(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(buf.data()),
                                                static_cast<std::size_t>(n)));
}

WorkState compare_with_index(const stdfs::path &workdir, const IndexEntry &entry) {
  const auto type = entry.mode & consts::kModeTypeMask;
  if (entry.skip_worktree || type == consts::kModeGitlink)
    return WorkState::Unchanged;

  const auto p = workdir / entry.path;
  struct stat st {};
  if (::lstat(p.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR)
      return WorkState::Deleted;
    log::debug("lstat ", p.string(), " failed; reporting modified");
    return WorkState::Modified;
  }

  const bool is_link = S_ISLNK(st.st_mode);
  if (S_ISDIR(st.st_mode))
    return WorkState::Deleted; // a directory where a file was tracked
  if (is_link != (type == consts::kModeSymlink))
    return WorkState::Modified;
  if (!is_link) {
    const bool exec = (st.st_mode & S_IXUSR) != 0;
    if (exec != (entry.mode == consts::kModeExec))
      return WorkState::Modified;
  }

  if (static_cast<std::uint32_t>(st.st_size) == entry.size &&
      static_cast<std::uint32_t>(st.st_mtim.tv_sec) == entry.mtime_s &&
      static_cast<std::uint32_t>(st.st_mtim.tv_nsec) == entry.mtime_ns)
    return WorkState::Unchanged;

  // intent-to-add entries carry the empty blob id; any content differs
  if (entry.intent_to_add)
    return WorkState::Modified;

  try {
    const oid id = is_link ? symlink_oid(p) : blob_oid_of_file(p);
    return id == entry.id ? WorkState::Unchanged : WorkState::Modified;
  } catch (const IoError &e) {
    // changed or vanished while hashing; the next event refreshes it
    log::debug(e.what());
    return WorkState::Modified;
  }
}

namespace {

std::string join(const std::string &dir, const std::string &name) {
  return dir.empty() ? name : dir + "/" + name;
}

struct Scanner {
  const stdfs::path &workdir;
  const std::set<std::string> &tracked;
  std::set<std::string> tracked_dirs;
  const PathMatcher &ignore;
  std::vector<std::string> out;

  bool has_visible_file(const std::string &rel) const {
    std::error_code ec;
    for (const auto &e : stdfs::directory_iterator(workdir / rel, ec)) {
      const auto name = e.path().filename().string();
      if (name == consts::kGitDir)
        continue;
      const auto child = join(rel, name);
      const bool dir = e.is_directory(ec) && !e.is_symlink(ec);
      if (ignore.is_ignored_relative(child, dir))
        continue;
      if (!dir || has_visible_file(child))
        return true;
    }
    return false;
  }

  void visit(const std::string &rel) {
    std::error_code ec;
    stdfs::directory_iterator it(workdir / rel, ec);
    if (ec) {
      log::debug("cannot list ", (workdir / rel).string(), ": ", ec.message());
      return;
    }
    std::vector<stdfs::directory_entry> entries(begin(it), end(it));
    for (const auto &e : entries) {
      const auto name = e.path().filename().string();
      if (name == consts::kGitDir)
        continue;
      const auto child = join(rel, name);
      const bool dir = e.is_directory(ec) && !e.is_symlink(ec);
      if (tracked.contains(child))
        continue;
      if (ignore.is_ignored_relative(child, dir))
        continue;
      if (!dir) {
        out.push_back(child);
      } else if (tracked_dirs.contains(child)) {
        visit(child);
      } else if (has_visible_file(child)) {
        out.push_back(child + "/");
      }
    }
  }
};

} // namespace

std::vector<std::string> collect_untracked(const stdfs::path &workdir,
                                           const std::set<std::string> &tracked,
                                           const PathMatcher &ignore) {
  Scanner s{.workdir = workdir, .tracked = tracked, .tracked_dirs = {}, .ignore = ignore, .out = {}};
  for (const auto &p : tracked) {
    for (auto slash = p.find('/'); slash != std::string::npos; slash = p.find('/', slash + 1))
      s.tracked_dirs.insert(p.substr(0, slash));
  }
  s.visit("");
  std::ranges::sort(s.out);
  return std::move(s.out);
}

} // namespace gitwatch::worktree
