#pragma once

#include "termpost/doc/document.hpp"

#include <filesystem>
#include <string>

namespace termpost::doc
{

// Trees are exchanged as nested JSON objects:
//   {"kind": "paragraph", "children": [{"kind": "text", "text": "..."}]}
// with optional "refuri", "name" and "argument" members.
DocumentNode parseDocument(const std::string &json, const std::string &origin = "<memory>");
DocumentNode loadDocument(const std::filesystem::path &path);

} // namespace termpost::doc
