#include "gitwatch/repo.hpp"

#include "gitwatch/consts.hpp"
#include "gitwatch/errors.hpp"
#include "gitwatch/fs.hpp"
#include "gitwatch/util.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace gfs = gitwatch::fs;

namespace gitwatch {

namespace {

// "gitdir: <path>" in a .git file; relative paths are relative to the file's directory.
std::optional<stdfs::path> read_gitfile(const stdfs::path &file) {
  const auto text = gfs::read_text(file);
  if (!text || !text->starts_with(consts::kGitFilePrefix))
    return std::nullopt;
  auto target = strutil::trim(std::string_view(*text).substr(consts::kGitFilePrefix.size()));
  strutil::rstrip_newlines(target);
  if (target.empty())
    return std::nullopt;
  stdfs::path p(target);
  if (p.is_relative())
    p = file.parent_path() / p;
  return p.lexically_normal();
}

// Committer line: "committer Name <email> <epoch> <tz>"
std::int64_t parse_commit_time(std::string_view line) {
  const auto gt = line.rfind('>');
  if (gt == std::string_view::npos)
    return 0;
  std::int64_t v = 0;
  std::size_t i = gt + 1;
  while (i < line.size() && line[i] == consts::kSpace)
    ++i;
  for (; i < line.size() && line[i] >= '0' && line[i] <= '9'; ++i)
    v = v * 10 + (line[i] - '0');
  return v;
}

} // namespace

Repository::Repository(stdfs::path workdir, stdfs::path git_dir)
    : workdir_(std::move(workdir)), git_dir_(std::move(git_dir)), common_dir_(git_dir_) {
  if (auto common = gfs::read_text(git_dir_ / "commondir")) {
    auto rel = strutil::trim(*common);
    strutil::rstrip_newlines(rel);
    stdfs::path p(rel);
    common_dir_ = (p.is_relative() ? git_dir_ / p : p).lexically_normal();
  }
  store_ = std::make_unique<ObjectStore>(objects_dir());
}

auto Repository::discover(const stdfs::path &start) -> std::optional<Repository> {
  std::error_code ec;
  auto p = stdfs::weakly_canonical(stdfs::absolute(start), ec);
  if (ec)
    p = stdfs::absolute(start).lexically_normal();
  if (!gfs::is_directory(p))
    p = p.parent_path();

  for (;;) {
    const auto candidate = p / consts::kGitDir;
    if (gfs::is_directory(candidate) && gfs::exists(candidate / consts::kHeadFile))
      return Repository(p, candidate);
    if (stdfs::is_regular_file(candidate, ec)) {
      if (auto target = read_gitfile(candidate); target && gfs::is_directory(*target))
        return Repository(p, *target);
    }
    if (p == p.root_path() || !p.has_parent_path())
      break;
    p = p.parent_path();
  }
  return std::nullopt;
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      break;
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Trees (binary)

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const auto [type, data] = store_->read(hex_oid);
  if (type != consts::kTypeTree) {
    throw RepositoryError("object " + std::string(hex_oid) + " is not a tree");
  }

  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw RepositoryError("tree parse: expected space");
    }
    const std::string mode_str(p, q_space);
    const std::uint32_t mode = ascii_octal_to_mode(mode_str);

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw RepositoryError("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw RepositoryError("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const auto obj = store_->read(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw RepositoryError("object " + std::string(commit_hex) + " is not a commit");
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  // headers only; the message after the blank line is not needed
  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string_view line = std::string_view(text).substr(
        pos, nl == std::string::npos ? std::string_view::npos : nl - pos);
    if (line.empty())
      break;

    if (line.starts_with(consts::kTreePrefix)) {
      info.tree_hex = std::string(line.substr(consts::kTreePrefix.size(), consts::kOidHexLen));
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.emplace_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.starts_with("committer ")) {
      info.commit_time = parse_commit_time(line);
    }

    if (nl == std::string::npos)
      break;
    pos = nl + 1;
  }

  if (!looks_hex40(info.tree_hex))
    throw RepositoryError("commit " + std::string(commit_hex) + " has no tree");
  return info;
}

auto Repository::ahead_behind(std::string_view local_hex, std::string_view upstream_hex) const
    -> std::pair<std::uint64_t, std::uint64_t> {
  if (local_hex == upstream_hex)
    return {0, 0};

  // Walk both histories newest-first, marking which side reaches each commit. Once
  // every queued commit is reachable from both sides nothing older can change the
  // counts.
  constexpr std::uint8_t kLocal = 1;
  constexpr std::uint8_t kUpstream = 2;
  constexpr std::uint8_t kBoth = kLocal | kUpstream;

  std::map<std::string, std::uint8_t> flags;
  std::map<std::string, CommitInfo> commits;
  std::set<std::pair<std::int64_t, std::string>> queue; // ordered by commit time
  std::set<std::string> done;
  std::size_t live = 0; // queued commits not yet reachable from both sides

  const auto commit = [&](const std::string &hex) -> const CommitInfo & {
    auto it = commits.find(hex);
    if (it == commits.end())
      it = commits.emplace(hex, read_commit(hex)).first;
    return it->second;
  };

  const auto mark = [&](const std::string &hex, std::uint8_t f) {
    auto &cur = flags[hex];
    const std::uint8_t before = cur;
    if ((before | f) == before || done.contains(hex))
      return;
    cur = before | f;
    const auto key = std::make_pair(commit(hex).commit_time, hex);
    if (queue.insert(key).second) {
      if (cur != kBoth)
        ++live;
    } else if (cur == kBoth) {
      --live; // was queued with one side only
    }
  };

  mark(std::string(local_hex), kLocal);
  mark(std::string(upstream_hex), kUpstream);

  std::uint64_t ahead = 0;
  std::uint64_t behind = 0;
  while (live > 0 && !queue.empty()) {
    const auto node = *std::prev(queue.end());
    queue.erase(std::prev(queue.end()));
    const std::string &hex = node.second;
    const std::uint8_t f = flags[hex];
    if (f != kBoth)
      --live;
    done.insert(hex);
    if (f == kLocal)
      ++ahead;
    else if (f == kUpstream)
      ++behind;
    for (const auto &parent : commit(hex).parents)
      mark(parent, f);
  }
  return {ahead, behind};
}

} // namespace gitwatch
