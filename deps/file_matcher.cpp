// ============================================================
// file_matcher.cpp -- Recursive file selection by glob patterns
// ============================================================

#include "file_matcher.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

char lower(char c) {
    return (c >= 'A' && c <= 'Z') ? (char)(c + 32) : c;
}

bool match_here(const char* p, const char* s) {
    while (*p) {
        if (p[0] == '*' && p[1] == '*') {
            const char* rest = p + 2;
            // "**/" may also stand for no directory at all
            if (*rest == '/' && match_here(rest + 1, s)) return true;
            for (const char* t = s; ; ++t) {
                if (match_here(rest, t)) return true;
                if (!*t) break;
            }
            return false;
        }
        if (*p == '*') {
            for (const char* t = s; ; ++t) {
                if (match_here(p + 1, t)) return true;
                if (!*t || *t == '/') break;
            }
            return false;
        }
        if (!*s) return false;
        if (*p == '?') {
            if (*s == '/') return false;
        } else if (lower(*p) != lower(*s)) {
            return false;
        }
        ++p;
        ++s;
    }
    return *s == '\0';
}

} // namespace

bool glob_match(const std::string& pattern, const std::string& rel_path) {
    return match_here(pattern.c_str(), rel_path.c_str());
}

void FileMatcher::add_includes(const std::vector<std::string>& patterns) {
    includes_.insert(includes_.end(), patterns.begin(), patterns.end());
}

void FileMatcher::add_excludes(const std::vector<std::string>& patterns) {
    excludes_.insert(excludes_.end(), patterns.begin(), patterns.end());
}

bool FileMatcher::excluded(const std::string& rel_path) const {
    for (const auto& pattern : excludes_) {
        if (glob_match(pattern, rel_path)) return true;
        // Parent folders: "a", "a/b" for "a/b/c.txt"
        for (size_t slash = rel_path.find('/'); slash != std::string::npos;
             slash = rel_path.find('/', slash + 1)) {
            if (glob_match(pattern, rel_path.substr(0, slash))) return true;
        }
    }
    return false;
}

bool FileMatcher::matches(const std::string& rel_path) const {
    bool included = std::any_of(includes_.begin(), includes_.end(),
                                [&](const std::string& p) { return glob_match(p, rel_path); });
    return included && !excluded(rel_path);
}

std::vector<std::string> FileMatcher::match(const std::string& root) const {
    std::vector<std::string> results;
    if (!file_io::is_directory(root)) {
        LOG_DEBUG("file_matcher: root does not exist: " + root);
        return results;
    }

    fs::path root_path(file_io::normalize_path(root));
    std::error_code ec;
    fs::recursive_directory_iterator it(root_path,
        fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    if (ec) {
        LOG_WARN("file_matcher: cannot scan " + root + ": " + ec.message());
        return results;
    }

    for (; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARN("file_matcher: scan error under " + root + ": " + ec.message());
            ec.clear();
            continue;
        }
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;

        fs::path rel = it->path().lexically_relative(root_path);
        if (rel.empty()) continue;
        if (matches(rel.generic_string())) {
            results.push_back(it->path().lexically_normal().string());
        }
    }

    std::sort(results.begin(), results.end());
    LOG_DEBUG("file_matcher: " + std::to_string(results.size()) + " files matched under " + root);
    return results;
}
