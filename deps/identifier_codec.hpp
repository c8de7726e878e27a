#pragma once

// ============================================================
// identifier_codec.hpp -- Extract identifiers from asset text
//
// Line-oriented pattern scans; no document parse.
//   references : "fileID: <signed int>, guid: <32 [a-z0-9]>"
//   own id     : first "guid: <32 [a-z0-9]>" line of a .meta file
//
// A path that does not exist yields an empty result, never an error.
// ============================================================

#include "identifier.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace identifier_codec {

// Every reference on every line, in file order, duplicates included.
// Reads one line at a time.
std::vector<IdentifierRecord> extract_references(const std::string& path);

std::vector<IdentifierRecord> extract_references_from_text(std::string_view text);

// First "guid:" match; stops reading as soon as it is found.
// Empty record (no global id) if there is none or the file is missing.
IdentifierRecord extract_own_identifier(const std::string& path);

IdentifierRecord extract_own_identifier_from_text(std::string_view text);

} // namespace identifier_codec
