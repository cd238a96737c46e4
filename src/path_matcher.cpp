#include "gitwatch/path_matcher.hpp"

#include "gitwatch/consts.hpp"
#include "gitwatch/errors.hpp"
#include "gitwatch/fs.hpp"
#include "gitwatch/util.hpp"

#include <optional>
#include <string>

namespace gitwatch {

namespace {

// Parses a bracket expression starting at pat[0] == '['. Returns the length of the
// expression including both brackets, or std::nullopt if it is unterminated.
std::optional<std::size_t> class_length(std::string_view pat) {
  std::size_t j = 1;
  if (j < pat.size() && (pat[j] == '!' || pat[j] == '^'))
    ++j;
  if (j < pat.size() && pat[j] == ']')
    ++j;
  while (j < pat.size() && pat[j] != ']') {
    if (pat[j] == '\\')
      ++j;
    ++j;
  }
  if (j >= pat.size())
    return std::nullopt;
  return j + 1;
}

bool class_matches(std::string_view cls, char c) {
  // cls is the full "[...]" expression
  std::size_t j = 1;
  bool negate = false;
  if (cls[j] == '!' || cls[j] == '^') {
    negate = true;
    ++j;
  }
  bool hit = false;
  bool first = true;
  while (j < cls.size() - 1) {
    char lo = cls[j];
    if (lo == ']' && !first)
      break;
    if (lo == '\\' && j + 1 < cls.size() - 1)
      lo = cls[++j];
    first = false;
    if (j + 2 < cls.size() - 1 && cls[j + 1] == '-') {
      const char hi = cls[j + 2];
      if (lo <= c && c <= hi)
        hit = true;
      j += 3;
      continue;
    }
    if (lo == c)
      hit = true;
    ++j;
  }
  return hit != negate;
}

std::string validate_glob(std::string_view glob) {
  for (std::size_t i = 0; i < glob.size(); ++i) {
    if (glob[i] == '\\') {
      if (i + 1 == glob.size())
        return "trailing backslash";
      ++i;
    } else if (glob[i] == '[') {
      const auto len = class_length(glob.substr(i));
      if (!len)
        return "unterminated character class";
      i += *len - 1;
    }
  }
  return {};
}

} // namespace

bool glob_match(std::string_view pat, std::string_view str) {
  while (!pat.empty()) {
    const char c = pat.front();
    if (c == '*') {
      if (pat.size() >= 2 && pat[1] == '*') {
        auto rest = pat.substr(2);
        if (rest.empty())
          return true;
        if (rest.front() == '/') {
          rest.remove_prefix(1);
          if (glob_match(rest, str))
            return true;
          for (std::size_t k = 0; k < str.size(); ++k) {
            if (str[k] == '/' && glob_match(rest, str.substr(k + 1)))
              return true;
          }
          return false;
        }
      }
      while (!pat.empty() && pat.front() == '*')
        pat.remove_prefix(1);
      if (pat.empty())
        return str.find('/') == std::string_view::npos;
      for (std::size_t k = 0; k <= str.size(); ++k) {
        if (glob_match(pat, str.substr(k)))
          return true;
        if (k < str.size() && str[k] == '/')
          break;
      }
      return false;
    }

    if (str.empty())
      return false;

    if (c == '?') {
      if (str.front() == '/')
        return false;
    } else if (c == '[') {
      const auto len = class_length(pat);
      if (len) {
        if (str.front() == '/' || !class_matches(pat.substr(0, *len), str.front()))
          return false;
        pat.remove_prefix(*len);
        str.remove_prefix(1);
        continue;
      }
      if (str.front() != '[')
        return false;
    } else if (c == '\\' && pat.size() > 1) {
      pat.remove_prefix(1);
      if (pat.front() != str.front())
        return false;
    } else if (c != str.front()) {
      return false;
    }
    pat.remove_prefix(1);
    str.remove_prefix(1);
  }
  return str.empty();
}

PathMatcher PathMatcher::compile(const std::filesystem::path &root, bool use_default_excludes,
                                 bool ignore_file,
                                 const std::vector<std::string> &extra_patterns) {
  PathMatcher m;
  m.root_ = root.lexically_normal();

  if (use_default_excludes) {
    for (const auto &p : consts::kDefaultExcludes)
      m.add_rule(p, "default excludes");
  }

  if (ignore_file) {
    const auto path = m.root_ / consts::kIgnoreFile;
    std::optional<std::string> text;
    try {
      text = fs::read_text(path);
    } catch (const IoError &e) {
      throw ConfigError(std::string("cannot read ignore file: ") + e.what());
    }
    if (text)
      m.add_rules(*text, path.string());
  }

  for (const auto &p : extra_patterns)
    m.add_rule(p, "--ignore");

  return m;
}

PathMatcher PathMatcher::compile_lines(const std::filesystem::path &root,
                                       const std::vector<std::string> &lines) {
  PathMatcher m;
  m.root_ = root.lexically_normal();
  std::size_t n = 0;
  for (const auto &l : lines)
    m.add_rule(l, "rules", ++n);
  return m;
}

void PathMatcher::add_rules(std::string_view text, std::string_view source) {
  std::size_t n = 0;
  for (const auto &line : strutil::split_lines(text))
    add_rule(line, source, ++n);
}

void PathMatcher::add_rule(std::string_view line, std::string_view source, std::size_t line_no) {
  const auto fail = [&](const std::string &why) {
    std::string where(source);
    if (line_no)
      where += ":" + std::to_string(line_no);
    throw ConfigError("bad ignore pattern '" + std::string(line) + "' (" + where + "): " + why);
  };

  std::string s(line);
  strutil::rstrip_newlines(s);
  if (s.empty() || s.front() == '#')
    return;
  // Trailing spaces are dropped unless escaped.
  while (!s.empty() && s.back() == ' ' && !(s.size() >= 2 && s[s.size() - 2] == '\\'))
    s.pop_back();
  if (s.empty())
    return;

  Rule r;
  std::string_view body{s};
  if (body.front() == '!') {
    r.negated = true;
    body.remove_prefix(1);
    if (body.empty())
      fail("negation without a pattern");
  }
  if (body.size() > 1 && body.back() == '/' && body[body.size() - 2] != '\\') {
    r.dir_only = true;
    body.remove_suffix(1);
  }
  if (body.find('/') != std::string_view::npos) {
    r.anchored = true;
    if (body.front() == '/')
      body.remove_prefix(1);
  }
  if (body.empty() || body == "/")
    fail("empty pattern");
  if (const auto why = validate_glob(body); !why.empty())
    fail(why);

  r.glob = std::string(body);
  rules_.push_back(std::move(r));
}

bool PathMatcher::rule_matches(const Rule &r, std::string_view rel, bool is_dir) {
  if (r.dir_only && !is_dir)
    return false;
  if (r.anchored)
    return glob_match(r.glob, rel);
  const auto slash = rel.rfind('/');
  const auto base = slash == std::string_view::npos ? rel : rel.substr(slash + 1);
  return glob_match(r.glob, base);
}

bool PathMatcher::evaluate(std::string_view rel, bool is_dir) const {
  bool ignored = false;
  for (const auto &r : rules_) {
    if (rule_matches(r, rel, is_dir))
      ignored = !r.negated;
  }
  return ignored;
}

bool PathMatcher::is_ignored_relative(std::string_view rel, bool is_dir) const {
  while (!rel.empty() && rel.back() == '/') {
    rel.remove_suffix(1);
    is_dir = true;
  }
  if (rel.empty() || rel == "." || rules_.empty())
    return false;

  // An excluded parent directory cannot be re-included by a later rule on a child.
  for (std::size_t pos = rel.find('/'); pos != std::string_view::npos;
       pos = rel.find('/', pos + 1)) {
    if (evaluate(rel.substr(0, pos), true))
      return true;
  }
  return evaluate(rel, is_dir);
}

bool PathMatcher::is_ignored(const std::filesystem::path &path, bool is_dir) const {
  if (path.is_absolute()) {
    if (!fs::is_within(path, root_))
      return false;
    return is_ignored_relative(path.lexically_normal().lexically_relative(root_).generic_string(),
                               is_dir);
  }
  return is_ignored_relative(path.lexically_normal().generic_string(), is_dir);
}

} // namespace gitwatch
