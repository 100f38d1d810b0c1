#pragma once

#include "termpost/log.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termpost::paths
{

// File name of path with its extension replaced.
std::string changeExtension(const std::filesystem::path &path, std::string_view extension);

std::filesystem::path resolvePath(const std::filesystem::path &path);

// Name of the last directory in path, from the text of the path alone.
std::string bottomDirectory(std::string_view path);

// Locates the document behind an HTML link of a site generated under a
// "_website" directory. Throws std::runtime_error when nothing matches.
std::filesystem::path documentPathFromLink(std::string_view htmlLink, const std::filesystem::path &htmlFile,
                                           const std::vector<std::string> &extensions = {".json"},
                                           log::Logger *logger = nullptr);

// scheme://host[/path...] with an empty path completed to "/". Returns nullopt
// when the scheme or host is missing.
std::optional<std::string> normalizeUrl(std::string_view url);

// Writes content to a temporary sibling and renames it over path.
void writeFileAtomically(const std::filesystem::path &path, std::string_view content);

std::string readTextFile(const std::filesystem::path &path);

} // namespace termpost::paths
