#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace gitwatch::consts {

// Repository layout
inline constexpr std::string_view kGitDir       = ".git";
inline constexpr std::string_view kObjectsDir   = "objects";
inline constexpr std::string_view kPackDir      = "pack";
inline constexpr std::string_view kHeadFile     = "HEAD";
inline constexpr std::string_view kIndexFile    = "index";
inline constexpr std::string_view kPackedRefs   = "packed-refs";
inline constexpr std::string_view kInfoExclude  = "info/exclude";
inline constexpr std::string_view kGitFilePrefix = "gitdir:";
inline constexpr std::string_view kIgnoreFile   = ".gitignore";

// Ref names
inline constexpr std::string_view kRefPrefix     = "ref: ";
inline constexpr std::string_view kHeadsPrefix   = "refs/heads/";
inline constexpr std::string_view kUpstreamPrefix = "refs/remotes/origin/";
inline constexpr std::string_view kDetached      = "detached";

// Git object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";
inline constexpr std::string_view kTypeTag    = "tag";

// File modes (octal)
inline constexpr std::uint32_t kModeFile    = 0100644;
inline constexpr std::uint32_t kModeExec    = 0100755;
inline constexpr std::uint32_t kModeSymlink = 0120000;
inline constexpr std::uint32_t kModeGitlink = 0160000;
inline constexpr std::uint32_t kModeTree    = 0040000;
inline constexpr std::uint32_t kModeTypeMask = 0170000;

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;
inline constexpr std::size_t kOidHexLen = 40;

// ——— Index file ———
inline constexpr std::uint32_t kIndexSignature = 0x44495243; // "DIRC"
inline constexpr std::uint16_t kIndexFlagExtended = 0x4000;
inline constexpr std::uint16_t kIndexStageMask    = 0x3000;
inline constexpr std::uint16_t kIndexStageShift   = 12;
inline constexpr std::uint16_t kIndexNameMask     = 0x0FFF;
inline constexpr std::uint16_t kIndexExtSkipWorktree = 0x4000;
inline constexpr std::uint16_t kIndexExtIntentToAdd  = 0x2000;

// ——— Pack files ———
inline constexpr std::uint32_t kPackSignature = 0x5041434B; // "PACK"
inline constexpr std::uint32_t kIdxSignature  = 0xFF744F63; // "\377tOc"

// ——— Commit header prefixes ———
inline constexpr std::string_view kTreePrefix   = "tree ";
inline constexpr std::string_view kParentPrefix = "parent ";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// ——— Watch defaults ———
inline constexpr std::chrono::milliseconds kDefaultDebounce{100};
inline constexpr std::chrono::milliseconds kDefaultTtl{500};
inline constexpr std::chrono::milliseconds kDefaultTick{100};

// Always excluded unless default excludes are disabled.
inline constexpr std::array<std::string_view, 9> kDefaultExcludes = {
    ".git", "target/", "build/", "node_modules/", "*.swp", "*.swo", "*~", "*.tmp", ".DS_Store",
};

} // namespace gitwatch::consts
