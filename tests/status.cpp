#include "gitwatch/errors.hpp"
#include "gitwatch/records.hpp"
#include "gitwatch/repo.hpp"
#include "gitwatch/status.hpp"

#include "repo_fixture.hpp"

#include <iostream>
#include <map>
#include <string>

using fixture::FakeRepo;
using fixture::IndexFile;
using gitwatch::FileStatus;

namespace fs = std::filesystem;

// Commits `files` on main, checks them out and writes a matching index.
static std::string commit_clean(const FakeRepo &fake, const std::map<std::string, std::string> &files,
                                std::int64_t when = 1000) {
  const auto tree = fake.tree_of(files);
  const auto c = fake.commit(tree, {}, when);
  fake.set_ref("refs/heads/main", c);
  std::vector<IndexFile> entries;
  for (const auto &[path, content] : files) {
    fixture::write_file(fake.root() / path, content);
    entries.push_back(IndexFile{.path = path, .id = fake.blob(content)});
  }
  fake.write_index(entries);
  return c;
}

static void dump(const gitwatch::RepoStatus &st) {
  std::cerr << "  branch=" << st.branch << " ahead=" << st.ahead << " behind=" << st.behind << "\n";
  for (const auto &[p, s] : st.file_statuses)
    std::cerr << "  " << gitwatch::short_code(s) << " " << p << "\n";
}

static bool expect(const char *name, const gitwatch::RepoStatus &st,
                   const std::map<std::string, FileStatus> &want) {
  if (st.file_statuses == want)
    return true;
  std::cerr << name << ": unexpected statuses\n";
  dump(st);
  return false;
}

int main() {
  fixture::TempDir tmp("status");
  try {
    // Two modified, one staged, one untracked on main with no upstream
    {
      FakeRepo fake(tmp.path / "basic");
      commit_clean(fake, {{"a.txt", "a\n"}, {"b.txt", "b\n"}, {"c.txt", "c\n"}});
      fixture::write_file(fake.root() / "new.txt", "new\n");
      fake.write_index({IndexFile{.path = "a.txt", .id = fake.blob("a\n")},
                        IndexFile{.path = "b.txt", .id = fake.blob("b\n")},
                        IndexFile{.path = "c.txt", .id = fake.blob("c\n")},
                        IndexFile{.path = "new.txt", .id = fake.blob("new\n")}});
      fixture::write_file(fake.root() / "a.txt", "a changed\n");
      fixture::write_file(fake.root() / "b.txt", "b changed too\n");
      fixture::write_file(fake.root() / "u.txt", "untracked\n");

      const auto st = gitwatch::compute_status_at(fake.root());
      if (st.branch != "main" || st.ahead != 0 || st.behind != 0 || st.has_conflicts) {
        std::cerr << "basic header\n";
        dump(st);
        return 1;
      }
      if (!expect("basic", st,
                  {{"a.txt", FileStatus::Modified},
                   {"b.txt", FileStatus::Modified},
                   {"new.txt", FileStatus::Staged},
                   {"u.txt", FileStatus::Untracked}}))
        return 1;

      const auto sum = gitwatch::summarize(st);
      const gitwatch::SummaryRecord want{.branch = "main", .modified_files = 2, .staged_files = 1,
                                         .untracked_files = 1};
      if (!(sum == want)) { std::cerr << "summary counts\n"; return 1; }
    }

    // Clean tree: empty status
    {
      FakeRepo fake(tmp.path / "clean");
      commit_clean(fake, {{"x", "x\n"}, {"dir/y", "y\n"}});
      const auto st = gitwatch::compute_status_at(fake.root() / "dir");
      if (!expect("clean", st, {})) return 1;
    }

    // Worktree deletion, staged deletion, exact rename, untracked directory, ignored file
    {
      FakeRepo fake(tmp.path / "mixed");
      commit_clean(fake, {{"keep.txt", "k\n"}, {"gone.txt", "g\n"}, {"staged_rm.txt", "s\n"},
                          {"old_name.txt", "moved content\n"}});
      fs::remove(fake.root() / "gone.txt");
      fs::remove(fake.root() / "staged_rm.txt");
      fs::rename(fake.root() / "old_name.txt", fake.root() / "new_name.txt");
      fake.write_index({IndexFile{.path = "keep.txt", .id = fake.blob("k\n")},
                        IndexFile{.path = "gone.txt", .id = fake.blob("g\n")},
                        IndexFile{.path = "new_name.txt", .id = fake.blob("moved content\n")}});
      fixture::write_file(fake.root() / "scratch" / "deep" / "notes.md", "n\n");
      fixture::write_file(fake.root() / "empty_ignored" / "x.log", "l\n");
      fixture::write_file(fake.root() / "debug.log", "l\n");
      fixture::write_file(fake.git_dir() / "info" / "exclude", "*.log\n");

      const auto st = gitwatch::compute_status_at(fake.root());
      if (!expect("mixed", st,
                  {{"gone.txt", FileStatus::Deleted},
                   {"staged_rm.txt", FileStatus::Staged},
                   {"new_name.txt", FileStatus::Renamed},
                   {"scratch/", FileStatus::Untracked}}))
        return 1;
      if (st.lookup("scratch/deep/notes.md") != FileStatus::Untracked) {
        std::cerr << "lookup through untracked directory\n";
        return 1;
      }
      if (st.lookup("keep.txt")) { std::cerr << "clean file has a status\n"; return 1; }
    }

    // Merge conflict and intent-to-add
    {
      FakeRepo fake(tmp.path / "conflict");
      commit_clean(fake, {{"shared.txt", "base\n"}});
      fixture::write_file(fake.root() / "shared.txt", "<<<<<<< ours\n");
      fixture::write_file(fake.root() / "later.txt", "later\n");
      fake.write_index({IndexFile{.path = "shared.txt", .id = fake.blob("base\n"), .stage = 1},
                        IndexFile{.path = "shared.txt", .id = fake.blob("ours\n"), .stage = 2},
                        IndexFile{.path = "shared.txt", .id = fake.blob("theirs\n"), .stage = 3},
                        IndexFile{.path = "later.txt", .id = fake.blob(""), .intent_to_add = true}});
      const auto st = gitwatch::compute_status_at(fake.root());
      if (!st.has_conflicts) { std::cerr << "has_conflicts not set\n"; return 1; }
      if (!expect("conflict", st,
                  {{"shared.txt", FileStatus::Conflicted}, {"later.txt", FileStatus::Added}}))
        return 1;
      if (!gitwatch::summarize(st).has_conflicts) { std::cerr << "summary conflict flag\n"; return 1; }
    }

    // Ahead/behind against origin, then detached HEAD
    {
      FakeRepo fake(tmp.path / "divergence");
      const auto c1 = commit_clean(fake, {{"f", "1\n"}}, 1000);
      const auto tree = fake.tree_of({{"f", "1\n"}});
      const auto c2 = fake.commit(tree, {c1}, 2000);
      const auto c3 = fake.commit(tree, {c2}, 3000);
      fake.set_ref("refs/heads/main", c3);
      fake.set_ref("refs/remotes/origin/main", c1);

      auto st = gitwatch::compute_status_at(fake.root());
      if (st.ahead != 2 || st.behind != 0) { std::cerr << "ahead only\n"; dump(st); return 1; }

      const auto u1 = fake.commit(tree, {c1}, 2500);
      fake.set_ref("refs/remotes/origin/main", u1);
      st = gitwatch::compute_status_at(fake.root());
      if (st.ahead != 2 || st.behind != 1) { std::cerr << "diverged\n"; dump(st); return 1; }

      fake.set_ref("refs/remotes/origin/main", c3);
      st = gitwatch::compute_status_at(fake.root());
      if (st.ahead != 0 || st.behind != 0) { std::cerr << "in sync\n"; dump(st); return 1; }

      fake.set_head(c2);
      st = gitwatch::compute_status_at(fake.root());
      if (st.branch != "detached" || st.ahead != 0 || st.behind != 0) {
        std::cerr << "detached\n";
        dump(st);
        return 1;
      }
      if (gitwatch::summarize(st).branch != "detached") { std::cerr << "detached summary\n"; return 1; }
    }

    // Unborn branch: everything in the index is staged
    {
      FakeRepo fake(tmp.path / "unborn");
      fixture::write_file(fake.root() / "first.txt", "1\n");
      fake.write_index({IndexFile{.path = "first.txt", .id = fake.blob("1\n")}});
      const auto st = gitwatch::compute_status_at(fake.root());
      if (st.branch != "main" || !expect("unborn", st, {{"first.txt", FileStatus::Staged}}))
        return 1;
    }

    // No repository
    {
      const auto plain = tmp.path / "plain";
      fs::create_directories(plain);
      bool threw = false;
      try {
        (void)gitwatch::compute_status_at(plain);
      } catch (const gitwatch::NoRepositoryError &) {
        threw = true;
      }
      if (!threw) { std::cerr << "expected NoRepositoryError\n"; return 1; }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "status OK\n";
  return 0;
}
