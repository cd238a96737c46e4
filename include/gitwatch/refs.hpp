#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace gitwatch {

class Repository; // fwd

// HEAD file with trailing newlines stripped (e.g. "ref: refs/heads/main" or a 40-hex id).
// Returns std::nullopt if HEAD does not exist.
std::optional<std::string> read_head(const Repository& repo);

// 40-hex id stored under `refname` ("refs/heads/main"): the loose ref file first, then
// the packed-refs table. Returns std::nullopt when neither has it.
std::optional<std::string> read_ref(const Repository& repo, std::string_view refname);

// Follow symbolic refs starting at `name` ("HEAD" or a full ref name) to a commit id.
// std::nullopt for an unborn branch.
std::optional<std::string> resolve_ref(const Repository& repo, std::string_view name);

// Short branch name HEAD points to ("main"), std::nullopt when HEAD is detached.
std::optional<std::string> current_branch(const Repository& repo);

} // namespace gitwatch
