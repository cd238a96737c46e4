#include "gitwatch/errors.hpp"
#include "gitwatch/index.hpp"

#include "repo_fixture.hpp"

#include <iostream>
#include <string>

using fixture::FakeRepo;
using fixture::IndexFile;

int main() {
  fixture::TempDir tmp("index");
  try {
    FakeRepo fake(tmp.path);
    const auto a = fake.blob("a\n");
    const auto b = fake.blob("b\n");
    fixture::write_file(tmp.path / "docs" / "guide.md", "guide\n");

    // Missing index: empty, no error
    gitwatch::Index idx(fake.git_dir() / "index");
    idx.load();
    if (!idx.entries().empty() || idx.version() != 0) { std::cerr << "missing index\n"; return 1; }

    // Version 2, stat data from disk
    fake.write_index({IndexFile{.path = "docs/guide.md", .id = a},
                      IndexFile{.path = "README", .id = b, .mode = 0100755}});
    idx.load();
    if (idx.version() != 2 || idx.entries().size() != 2) { std::cerr << "v2 entry count\n"; return 1; }
    const auto &first = idx.entries()[0];
    if (first.path != "README" || first.mode != 0100755 || first.id != b) {
      std::cerr << "v2 first entry: " << first.path << "\n";
      return 1;
    }
    const auto &second = idx.entries()[1];
    if (second.path != "docs/guide.md" || second.size != 6 || second.mtime_s == 0) {
      std::cerr << "v2 stat data\n";
      return 1;
    }

    // Conflict stages stay out of by_path()
    fake.write_index({IndexFile{.path = "clash.txt", .id = a, .stage = 1},
                      IndexFile{.path = "clash.txt", .id = a, .stage = 2},
                      IndexFile{.path = "clash.txt", .id = b, .stage = 3},
                      IndexFile{.path = "ok.txt", .id = b}});
    idx.load();
    if (idx.entries().size() != 4 || idx.entries()[2].stage != 3) { std::cerr << "stages\n"; return 1; }
    const auto by_path = idx.by_path();
    if (by_path.size() != 1 || !by_path.contains("ok.txt")) { std::cerr << "by_path\n"; return 1; }

    // Extended flags (version 3)
    fake.write_index({IndexFile{.path = "new.txt", .id = a, .intent_to_add = true},
                      IndexFile{.path = "old.txt", .id = b}});
    idx.load();
    if (idx.version() != 3 || !idx.entries()[0].intent_to_add || idx.entries()[1].intent_to_add ||
        idx.entries()[1].path != "old.txt") {
      std::cerr << "intent-to-add\n";
      return 1;
    }

    // Version 4 prefix-compressed paths
    fake.write_index({IndexFile{.path = "src/app/main.c", .id = a},
                      IndexFile{.path = "src/app/util.c", .id = b},
                      IndexFile{.path = "src/lib.c", .id = a},
                      IndexFile{.path = "zz", .id = b}},
                     4);
    idx.load();
    if (idx.version() != 4 || idx.entries().size() != 4) { std::cerr << "v4 count\n"; return 1; }
    const char *want[] = {"src/app/main.c", "src/app/util.c", "src/lib.c", "zz"};
    for (std::size_t i = 0; i < 4; ++i) {
      if (idx.entries()[i].path != want[i]) {
        std::cerr << "v4 path " << i << ": " << idx.entries()[i].path << "\n";
        return 1;
      }
    }

    // Corrupt index
    fixture::write_file(fake.git_dir() / "index", "NOPE and some more bytes to be long enough");
    bool threw = false;
    try {
      idx.load();
    } catch (const gitwatch::RepositoryError &) {
      threw = true;
    }
    if (!threw) { std::cerr << "bad signature accepted\n"; return 1; }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "git_index OK\n";
  return 0;
}
