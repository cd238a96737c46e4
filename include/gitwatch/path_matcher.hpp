#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gitwatch {

/**
 * Gitignore-style path predicate, compiled once and queried on the hot event path.
 *
 * Rule order is: default excludes, then the root ignore file, then extra patterns.
 * The last matching rule decides; `!pattern` re-includes. A path inside an excluded
 * directory stays excluded.
 *
 * Queries do no I/O. Whether a path is a directory is a caller hint, used only by
 * rules written with a trailing slash.
 */
class PathMatcher {
public:
  PathMatcher() = default;

  // Throws ConfigError on a malformed pattern or an unreadable ignore file.
  static PathMatcher compile(const std::filesystem::path &root, bool use_default_excludes,
                             bool ignore_file, const std::vector<std::string> &extra_patterns);

  // Matcher from explicit rule lines (e.g. .git/info/exclude).
  static PathMatcher compile_lines(const std::filesystem::path &root,
                                   const std::vector<std::string> &lines);

  // `path` is absolute (under root) or root-relative. Paths outside root are never ignored.
  [[nodiscard]] bool is_ignored(const std::filesystem::path &path, bool is_dir = false) const;

  // Same predicate on an already root-relative, '/'-separated path.
  [[nodiscard]] bool is_ignored_relative(std::string_view rel, bool is_dir = false) const;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] std::size_t rule_count() const { return rules_.size(); }

  // Append rules parsed from gitignore-format text. `source` names the origin in errors.
  void add_rules(std::string_view text, std::string_view source);
  void add_rule(std::string_view line, std::string_view source, std::size_t line_no = 0);

private:
  struct Rule {
    std::string glob;   // body without '!', leading '/' or trailing '/'
    bool negated{};
    bool dir_only{};
    bool anchored{};    // matched against the full relative path, not the basename
  };

  [[nodiscard]] bool evaluate(std::string_view rel, bool is_dir) const;
  [[nodiscard]] static bool rule_matches(const Rule &r, std::string_view rel, bool is_dir);

  std::filesystem::path root_;
  std::vector<Rule> rules_;
};

// Glob match with gitignore semantics: '*', '?' and '[...]' stay within one path
// component; '**/' spans zero or more directories; a trailing '/**' matches everything
// below. Backslash escapes the next character.
bool glob_match(std::string_view pattern, std::string_view text);

} // namespace gitwatch
