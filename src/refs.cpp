#include "gitwatch/refs.hpp"

#include "gitwatch/consts.hpp"
#include "gitwatch/errors.hpp"
#include "gitwatch/fs.hpp"
#include "gitwatch/repo.hpp"
#include "gitwatch/util.hpp"

#include <string>
#include <string_view>

namespace gitwatch {

namespace {

// HEAD and per-worktree refs live in git_dir; branches in the shared directory.
std::filesystem::path ref_path(const Repository &repo, std::string_view refname) {
  if (refname == consts::kHeadFile || !refname.starts_with("refs/"))
    return repo.git_dir() / refname;
  return repo.common_dir() / refname;
}

std::optional<std::string> read_packed_ref(const Repository &repo, std::string_view refname) {
  const auto text = fs::read_text(repo.common_dir() / consts::kPackedRefs);
  if (!text)
    return std::nullopt;
  // "<hex> <refname>" lines; '#' header and "^<hex>" peeled lines are skipped
  for (const auto &line : strutil::split_lines(*text)) {
    if (line.empty() || line[0] == '#' || line[0] == '^')
      continue;
    const auto sp = line.find(consts::kSpace);
    if (sp != consts::kOidHexLen)
      continue;
    if (std::string_view(line).substr(sp + 1) == refname)
      return line.substr(0, sp);
  }
  return std::nullopt;
}

} // namespace

std::optional<std::string> read_head(const Repository &repo) {
  auto s = fs::read_text(repo.head_file());
  if (!s)
    return std::nullopt;
  strutil::rstrip_newlines(*s);
  return s;
}

std::optional<std::string> read_ref(const Repository &repo, std::string_view refname) {
  if (auto s = fs::read_text(ref_path(repo, refname))) {
    strutil::rstrip_newlines(*s);
    return s;
  }
  return read_packed_ref(repo, refname);
}

std::optional<std::string> resolve_ref(const Repository &repo, std::string_view name) {
  std::string cur(name);
  // git gives up after five levels of symbolic indirection
  for (int depth = 0; depth < 5; ++depth) {
    const auto val = (cur == consts::kHeadFile) ? read_head(repo) : read_ref(repo, cur);
    if (!val)
      return std::nullopt;
    if (val->starts_with(consts::kRefPrefix)) {
      cur = strutil::trim(std::string_view(*val).substr(consts::kRefPrefix.size()));
      continue;
    }
    if (!looks_hex40(*val))
      throw RepositoryError("ref " + cur + " holds a malformed id: " + *val);
    return val;
  }
  throw RepositoryError("symbolic ref loop at " + std::string(name));
}

std::optional<std::string> current_branch(const Repository &repo) {
  const auto head = read_head(repo);
  if (!head)
    throw RepositoryError("missing HEAD in " + repo.git_dir().string());
  if (!head->starts_with(consts::kRefPrefix))
    return std::nullopt;
  const auto target = strutil::trim(std::string_view(*head).substr(consts::kRefPrefix.size()));
  if (target.starts_with(consts::kHeadsPrefix))
    return target.substr(consts::kHeadsPrefix.size());
  return target;
}

} // namespace gitwatch
