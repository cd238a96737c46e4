#include "gitwatch/errors.hpp"
#include "gitwatch/path_matcher.hpp"

#include "repo_fixture.hpp"

#include <iostream>
#include <string>
#include <vector>

using gitwatch::PathMatcher;

static bool throws_config(const std::vector<std::string> &lines) {
  try {
    (void)PathMatcher::compile_lines("/r", lines);
  } catch (const gitwatch::ConfigError &) {
    return true;
  }
  return false;
}

int main() {
  // Globs
  if (!gitwatch::glob_match("*.log", "debug.log")) { std::cerr << "glob *.log\n"; return 1; }
  if (gitwatch::glob_match("*.log", "dir/debug.log")) { std::cerr << "* crossed '/'\n"; return 1; }
  if (!gitwatch::glob_match("a/**/b", "a/b")) { std::cerr << "** zero dirs\n"; return 1; }
  if (!gitwatch::glob_match("a/**/b", "a/x/y/b")) { std::cerr << "** many dirs\n"; return 1; }
  if (!gitwatch::glob_match("a/**", "a/x/y")) { std::cerr << "trailing **\n"; return 1; }
  if (!gitwatch::glob_match("file[0-9].txt", "file7.txt")) { std::cerr << "class range\n"; return 1; }
  if (gitwatch::glob_match("file[!0-9].txt", "file7.txt")) { std::cerr << "negated class\n"; return 1; }
  if (!gitwatch::glob_match("\\*star", "*star")) { std::cerr << "escaped *\n"; return 1; }
  if (!gitwatch::glob_match("?.c", "a.c") || gitwatch::glob_match("?.c", "/.c")) {
    std::cerr << "? semantics\n";
    return 1;
  }

  fixture::TempDir tmp("matcher");
  const auto root = tmp.path;

  // Default excludes
  {
    auto m = PathMatcher::compile(root, true, false, {});
    if (!m.is_ignored(root / ".git" / "index")) { std::cerr << ".git not excluded\n"; return 1; }
    if (!m.is_ignored(root / "node_modules" / "x" / "y.js")) { std::cerr << "node_modules\n"; return 1; }
    if (!m.is_ignored(root / "target", true)) { std::cerr << "target/ dir\n"; return 1; }
    if (m.is_ignored(root / "target", false)) { std::cerr << "target/ must be dir-only\n"; return 1; }
    if (!m.is_ignored(root / "src" / ".main.c.swp")) { std::cerr << "*.swp\n"; return 1; }
    if (!m.is_ignored(root / "notes.txt~")) { std::cerr << "*~\n"; return 1; }
    if (m.is_ignored(root / "src" / "main.c")) { std::cerr << "main.c ignored\n"; return 1; }
    if (m.is_ignored("/elsewhere/.git")) { std::cerr << "outside root must not be ignored\n"; return 1; }

    auto none = PathMatcher::compile(root, false, false, {});
    if (none.is_ignored(root / ".git" / "index")) { std::cerr << "defaults disabled\n"; return 1; }
  }

  // Extra pattern applies with no ignore file and no default match
  {
    auto m = PathMatcher::compile(root, true, false, {"*.log"});
    if (!m.is_ignored(root / "debug.log")) { std::cerr << "extra pattern *.log\n"; return 1; }
    if (!m.is_ignored("logs/debug.log")) { std::cerr << "extra pattern at depth\n"; return 1; }
  }

  // Ignore file: precedence, negation, anchoring, directory rules
  fixture::write_file(root / ".gitignore", "# comment\n"
                                           "\n"
                                           "*.o\n"
                                           "!keep.o\n"
                                           "/only_top.txt\n"
                                           "docs/*.html\n"
                                           "cache/\n"
                                           "\\#hash\n"
                                           "trailing.txt   \n");
  {
    auto m = PathMatcher::compile(root, true, true, {});
    if (!m.is_ignored("a/b/c.o")) { std::cerr << "*.o anywhere\n"; return 1; }
    if (m.is_ignored("keep.o")) { std::cerr << "!keep.o re-include\n"; return 1; }
    if (!m.is_ignored("only_top.txt")) { std::cerr << "anchored top\n"; return 1; }
    if (m.is_ignored("sub/only_top.txt")) { std::cerr << "anchored must not float\n"; return 1; }
    if (!m.is_ignored("docs/index.html")) { std::cerr << "docs/*.html\n"; return 1; }
    if (m.is_ignored("docs/api/index.html")) { std::cerr << "docs/*.html is one level\n"; return 1; }
    if (!m.is_ignored("cache/blob", false)) { std::cerr << "file inside cache/\n"; return 1; }
    if (!m.is_ignored("#hash")) { std::cerr << "escaped #\n"; return 1; }
    if (!m.is_ignored("trailing.txt")) { std::cerr << "trailing spaces trimmed\n"; return 1; }

    // A later extra pattern overrides the file.
    auto m2 = PathMatcher::compile(root, true, true, {"!keep_me.o"});
    if (m2.is_ignored("keep_me.o")) { std::cerr << "extra pattern precedence\n"; return 1; }

    // Disabled ignore file
    auto m3 = PathMatcher::compile(root, true, false, {});
    if (m3.is_ignored("a/b/c.o")) { std::cerr << "ignore file disabled\n"; return 1; }
  }

  // Children of an excluded directory cannot be re-included.
  {
    auto m = PathMatcher::compile_lines(root, {"out/", "!out/important.txt"});
    if (!m.is_ignored("out/important.txt")) { std::cerr << "re-include under excluded dir\n"; return 1; }
  }

  // Malformed patterns fail at compile time
  if (!throws_config({"[abc"})) { std::cerr << "unterminated class accepted\n"; return 1; }
  if (!throws_config({"foo\\"})) { std::cerr << "trailing backslash accepted\n"; return 1; }
  if (!throws_config({"!"})) { std::cerr << "empty negation accepted\n"; return 1; }
  try {
    (void)PathMatcher::compile(root, true, false, {"ok", "bad["});
    std::cerr << "bad extra pattern accepted\n";
    return 1;
  } catch (const gitwatch::ConfigError &e) {
    if (std::string(e.what()).find("bad[") == std::string::npos) {
      std::cerr << "error does not name the pattern: " << e.what() << "\n";
      return 1;
    }
  }

  std::cout << "path_matcher OK\n";
  return 0;
}
