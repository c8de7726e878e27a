#pragma once

// ============================================================
// identifier.hpp -- Global identifier reference value type
// ============================================================

#include "../common/platform.hpp"
#include <functional>
#include <optional>
#include <string>

// One "fileID: <local>, guid: <global>" reference, or an asset's own id.
// Two records name the same asset iff their global ids are equal; the
// local id is carried for fidelity only.
struct IdentifierRecord {
    i64 local_id{0};
    std::optional<std::string> global_id;

    bool has_global_id() const {
        return global_id.has_value() && !global_id->empty();
    }

    bool same_asset(const IdentifierRecord& other) const {
        return has_global_id() && other.has_global_id() &&
               *global_id == *other.global_id;
    }

    bool operator==(const IdentifierRecord& other) const {
        return local_id == other.local_id && global_id == other.global_id;
    }
    bool operator!=(const IdentifierRecord& other) const { return !(*this == other); }
};

struct IdentifierRecordHash {
    size_t operator()(const IdentifierRecord& r) const {
        size_t h = std::hash<i64>{}(r.local_id);
        if (r.global_id) {
            h ^= std::hash<std::string>{}(*r.global_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        }
        return h;
    }
};
