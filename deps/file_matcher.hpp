#pragma once

// ============================================================
// file_matcher.hpp -- Recursive file selection by glob patterns
//
// Patterns are matched case-insensitively against the root-relative
// path with forward slashes:
//   *     any run of characters within one path segment
//   ?     one character within a segment
//   **    any run of characters, across segments
//   **/   zero or more leading directories
// A file is selected when some include pattern matches its path and
// no exclude pattern matches its path or one of its parent folders.
// ============================================================

#include <string>
#include <vector>

// Glob match of one pattern against one relative path
bool glob_match(const std::string& pattern, const std::string& rel_path);

class FileMatcher {
public:
    FileMatcher() = default;

    void add_include(const std::string& pattern) { includes_.push_back(pattern); }
    void add_exclude(const std::string& pattern) { excludes_.push_back(pattern); }

    void add_includes(const std::vector<std::string>& patterns);
    void add_excludes(const std::vector<std::string>& patterns);

    // Whether a root-relative forward-slash path is selected
    bool matches(const std::string& rel_path) const;

    // Absolute, normalized paths of every selected regular file under
    // root, sorted. A missing root yields an empty list.
    std::vector<std::string> match(const std::string& root) const;

private:
    bool excluded(const std::string& rel_path) const;

    std::vector<std::string> includes_;
    std::vector<std::string> excludes_;
};
