/*
 * GChat Path Resolver
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Resolves a path expression (literal file, glob pattern or directory) against
 *   the project root. Every path accepted here is checked both lexically (no
 *   absolute paths, no leading "..", no escape after normalization) and
 *   physically (the symlink-resolved location must stay under the canonical
 *   root) before anything is read. Results are sorted by root-relative path.
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gchat {

enum class PathError {
    None,
    NotFound,     // nothing exists / nothing matched
    OutsideRoot,  // absolute, parent traversal or symlink escape
    BadPattern,   // empty expression or invalid glob
    NotADirectory,
    Unreadable
};

// Strict: any offending path fails the whole expression (user placeholders).
// DropOffending: offending paths are skipped and the rest proceeds (model requests).
enum class Containment { Strict, DropOffending };

struct PathResolution {
    std::vector<std::filesystem::path> paths; // absolute, under root
    PathError error = PathError::None;
    std::string message;
    std::vector<std::string> dropped;          // DropOffending only
    bool ok() const { return error == PathError::None; }
};

struct TreeListing {
    std::string text;
    PathError error = PathError::None;
    std::string message;
    bool ok() const { return error == PathError::None; }
};

// Detect glob meta characters.
bool has_glob_chars(const std::string& s);

// Translate a single-segment glob (*, ?, [...]) into an ECMAScript regex.
std::string glob_to_regex(const std::string& pat);

PathResolution resolve(const std::string& expr, const std::filesystem::path& root,
                       Containment policy = Containment::Strict);

// Nested listing of a directory below root, used by @d placeholders.
TreeListing render_tree(const std::string& expr, const std::filesystem::path& root);

// Root-relative generic form used in labels and @f lines ("." for the root itself).
std::string relative_display(const std::filesystem::path& p, const std::filesystem::path& root);

std::optional<std::string> read_text_file(const std::filesystem::path& p, std::size_t max_bytes,
                                          std::string* why = nullptr);

const char* path_error_name(PathError e);

} // namespace gchat
