#pragma once

// ============================================================
// reference_source.hpp -- Capability interface for dependency sources
//
// A source indexes a set of project files once, then answers
// "which files does this file reference" for files it handles.
// index_files() must complete before the first query; queries may
// then run concurrently from many threads.
// ============================================================

#include <set>
#include <string>
#include <vector>

using PathSet = std::set<std::string>;

class ReferenceSource {
public:
    virtual ~ReferenceSource() = default;

    // Index the given files. Returns the number of files that failed.
    virtual size_t index_files(const std::vector<std::string>& paths) = 0;

    // Files directly referenced by `path` (absolute, de-duplicated).
    virtual PathSet direct_references_of(const std::string& path) const = 0;

    // Whether this source can answer for `path`
    virtual bool handles(const std::string& path) const = 0;
};
