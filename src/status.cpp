#include "gitwatch/status.hpp"

#include "gitwatch/consts.hpp"
#include "gitwatch/errors.hpp"
#include "gitwatch/fs.hpp"
#include "gitwatch/index.hpp"
#include "gitwatch/log.hpp"
#include "gitwatch/path_matcher.hpp"
#include "gitwatch/refs.hpp"
#include "gitwatch/repo.hpp"
#include "gitwatch/util.hpp"
#include "gitwatch/worktree.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <vector>

namespace gitwatch {

std::string_view short_code(FileStatus s) {
  switch (s) {
  case FileStatus::Modified:
    return "M";
  case FileStatus::Added:
  case FileStatus::Staged:
    return "A";
  case FileStatus::Deleted:
    return "D";
  case FileStatus::Renamed:
    return "R";
  case FileStatus::Untracked:
    return "?";
  case FileStatus::Conflicted:
    return "U";
  }
  return "?";
}

std::optional<FileStatus> RepoStatus::lookup(std::string_view rel) const {
  if (auto it = file_statuses.find(std::string(rel)); it != file_statuses.end())
    return it->second;
  // untracked directories are collapsed to "dir/"
  for (auto slash = rel.find('/'); slash != std::string_view::npos;
       slash = rel.find('/', slash + 1)) {
    auto it = file_statuses.find(std::string(rel.substr(0, slash + 1)));
    if (it != file_statuses.end() && it->second == FileStatus::Untracked)
      return it->second;
  }
  return std::nullopt;
}

namespace {

// Commit HEAD resolves to; std::nullopt on an unborn branch.
std::optional<std::string> head_commit(const Repository &repo) {
  return resolve_ref(repo, consts::kHeadFile);
}

PathMatcher untracked_rules(const Repository &repo) {
  std::vector<std::string> lines;
  if (auto exclude = fs::read_text(repo.common_dir() / consts::kInfoExclude))
    lines = strutil::split_lines(*exclude);
  auto m = PathMatcher::compile_lines(repo.workdir(), lines);
  const auto ignore_file = repo.workdir() / consts::kIgnoreFile;
  if (auto text = fs::read_text(ignore_file))
    m.add_rules(*text, ignore_file.string());
  return m;
}

} // namespace

RepoStatus compute_status(const Repository &repo) {
  RepoStatus st;
  st.workdir = repo.workdir();

  const auto branch = current_branch(repo);
  st.branch = branch ? *branch : std::string(consts::kDetached);

  const auto head = head_commit(repo);
  worktree::PathBlobMap head_map;
  if (head)
    head_map = worktree::tree_to_map(repo, repo.read_commit(*head).tree_hex);

  if (branch && head) {
    const auto upstream = read_ref(repo, std::string(consts::kUpstreamPrefix) + *branch);
    if (upstream && looks_hex40(*upstream)) {
      const auto [ahead, behind] = repo.ahead_behind(*head, *upstream);
      st.ahead = ahead;
      st.behind = behind;
    }
  }

  Index idx{repo.index_file()};
  idx.load();

  std::set<std::string> tracked;
  std::set<std::string> conflicted;
  for (const auto &e : idx.entries()) {
    tracked.insert(e.path);
    if (e.stage != 0)
      conflicted.insert(e.path);
  }
  const auto stage0 = idx.by_path();

  // Blobs removed from HEAD, by id, for exact-match rename detection.
  std::map<oid, std::vector<std::string>> removed;
  for (const auto &[path, blob] : head_map) {
    if (!tracked.contains(path))
      removed[blob.id].push_back(path);
  }

  for (const auto &path : conflicted) {
    st.file_statuses[path] = FileStatus::Conflicted;
    st.has_conflicts = true;
  }

  for (const auto &[path, entry] : stage0) {
    if (conflicted.contains(path))
      continue;
    if (entry->intent_to_add) {
      st.file_statuses[path] = FileStatus::Added;
      continue;
    }
    const auto h = head_map.find(path);
    if (h == head_map.end()) {
      auto r = removed.find(entry->id);
      if (r != removed.end() && !r->second.empty()) {
        r->second.pop_back(); // the old path is reported through the rename
        st.file_statuses[path] = FileStatus::Renamed;
      } else {
        st.file_statuses[path] = FileStatus::Staged;
      }
      continue;
    }
    if (h->second.id != entry->id || h->second.mode != entry->mode) {
      st.file_statuses[path] = FileStatus::Staged;
      continue;
    }
    switch (worktree::compare_with_index(repo.workdir(), *entry)) {
    case worktree::WorkState::Deleted:
      st.file_statuses[path] = FileStatus::Deleted;
      break;
    case worktree::WorkState::Modified:
      st.file_statuses[path] = FileStatus::Modified;
      break;
    case worktree::WorkState::Unchanged:
      break;
    }
  }

  // Deleted from the index but still in HEAD.
  for (const auto &[id, paths] : removed) {
    for (const auto &path : paths)
      st.file_statuses[path] = FileStatus::Staged;
  }

  const auto ignore = untracked_rules(repo);
  for (auto &path : worktree::collect_untracked(repo.workdir(), tracked, ignore))
    st.file_statuses.emplace(std::move(path), FileStatus::Untracked);

  return st;
}

RepoStatus compute_status_at(const std::filesystem::path &start) {
  auto repo = Repository::discover(start);
  if (!repo)
    throw NoRepositoryError(start.string());
  try {
    return compute_status(*repo);
  } catch (const RepositoryError &) {
    throw;
  } catch (const std::exception &e) {
    throw RepositoryError(repo->workdir().string() + ": " + e.what());
  }
}

} // namespace gitwatch
