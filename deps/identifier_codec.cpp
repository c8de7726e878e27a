// ============================================================
// identifier_codec.cpp -- Identifier pattern scans
// ============================================================

#include "identifier_codec.hpp"
#include "../common/file_io.hpp"
#include "../common/platform.hpp"
#include <charconv>
#include <regex>
#include <string>

namespace {

// Exactly UNIPACK_GUID_HEX_LEN lowercase alphanumerics, not the prefix of a longer token
std::string guid_group() {
    return "([a-z0-9]{" + std::to_string(UNIPACK_GUID_HEX_LEN) + "})(?![a-z0-9])";
}

const std::regex& reference_pattern() {
    static const std::regex re("fileID: (-?[0-9]+), guid: " + guid_group(),
                               std::regex::ECMAScript | std::regex::optimize);
    return re;
}

const std::regex& guid_pattern() {
    static const std::regex re("guid: " + guid_group(),
                               std::regex::ECMAScript | std::regex::optimize);
    return re;
}

void scan_line(std::string_view line, std::vector<IdentifierRecord>& out) {
    using It = std::string_view::const_iterator;
    std::regex_iterator<It> it(line.begin(), line.end(), reference_pattern());
    std::regex_iterator<It> end;
    for (; it != end; ++it) {
        const auto& m = *it;
        std::string digits = m[1].str();

        IdentifierRecord rec;
        auto res = std::from_chars(digits.data(), digits.data() + digits.size(), rec.local_id);
        if (res.ec != std::errc()) continue;  // out of int64 range
        rec.global_id = m[2].str();
        out.push_back(std::move(rec));
    }
}

bool match_guid(std::string_view line, IdentifierRecord& out) {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(line.begin(), line.end(), m, guid_pattern())) return false;
    out.global_id = m[1].str();
    return true;
}

// Calls fn for each '\n'-separated line of text (trailing '\r' stripped)
template<typename Fn>
void for_each_text_line(std::string_view text, Fn fn) {
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        size_t stop = (nl == std::string_view::npos) ? text.size() : nl;
        std::string_view line = text.substr(pos, stop - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!fn(line)) return;
        if (nl == std::string_view::npos) return;
        pos = nl + 1;
    }
}

} // namespace

std::vector<IdentifierRecord> identifier_codec::extract_references(const std::string& path) {
    std::vector<IdentifierRecord> out;
    file_io::for_each_line(path, [&](std::string_view line) {
        scan_line(line, out);
        return true;
    });
    return out;
}

std::vector<IdentifierRecord> identifier_codec::extract_references_from_text(std::string_view text) {
    std::vector<IdentifierRecord> out;
    for_each_text_line(text, [&](std::string_view line) {
        scan_line(line, out);
        return true;
    });
    return out;
}

IdentifierRecord identifier_codec::extract_own_identifier(const std::string& path) {
    IdentifierRecord rec;
    file_io::for_each_line(path, [&](std::string_view line) {
        return !match_guid(line, rec);
    });
    return rec;
}

IdentifierRecord identifier_codec::extract_own_identifier_from_text(std::string_view text) {
    IdentifierRecord rec;
    for_each_text_line(text, [&](std::string_view line) {
        return !match_guid(line, rec);
    });
    return rec;
}
