#include "termpost/paths.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace termpost::paths
{

std::string changeExtension(const std::filesystem::path &path, std::string_view extension)
{
    std::filesystem::path result = path.filename();
    result.replace_extension(std::string(extension));
    return result.string();
}

std::filesystem::path resolvePath(const std::filesystem::path &path)
{
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec)
        return std::filesystem::absolute(path).lexically_normal();
    return resolved;
}

std::string bottomDirectory(std::string_view path)
{
    std::size_t slash = path.rfind('/');
    if (slash == std::string_view::npos)
        return {};
    std::string_view directory = path.substr(0, slash);
    std::size_t previous = directory.rfind('/');
    if (previous == std::string_view::npos)
        return std::string(directory);
    return std::string(directory.substr(previous + 1));
}

std::filesystem::path documentPathFromLink(std::string_view htmlLink, const std::filesystem::path &htmlFile,
                                           const std::vector<std::string> &extensions, log::Logger *logger)
{
    std::filesystem::path link;
    for (const auto &part : std::filesystem::path(std::string(htmlLink)))
    {
        const std::string text = part.string();
        if (text.empty() || text == "." || text == ".." || text == "/")
            continue;
        link /= part;
    }

    std::filesystem::path absoluteHtml = resolvePath(htmlFile);
    std::filesystem::path root;
    bool found = false;
    for (const auto &part : absoluteHtml)
    {
        if (part == "_website")
        {
            found = true;
            break;
        }
        root /= part;
    }
    if (!found)
        throw std::runtime_error("Missing '_website' directory in '" + absoluteHtml.string() +
                                 "', cannot find document from HTML link");

    std::filesystem::path base = root / link;
    std::vector<std::filesystem::path> candidates{base};
    for (const auto &extension : extensions)
    {
        std::filesystem::path candidate = base;
        candidate.replace_extension(extension);
        candidates.push_back(candidate);
    }

    for (const auto &candidate : candidates)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec))
        {
            log::debug(logger, "Found document: '" + candidate.string() + "'");
            return resolvePath(candidate);
        }
        log::debug(logger, "Tentative document not found: '" + candidate.string() + "'");
    }
    throw std::runtime_error("Could not find document '" + link.filename().string() + "' in '" + root.string() + "'");
}

std::optional<std::string> normalizeUrl(std::string_view url)
{
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos || schemeEnd == 0)
        return std::nullopt;
    std::string_view scheme = url.substr(0, schemeEnd);
    if (!std::all_of(scheme.begin(), scheme.end(), [](char ch)
                     { return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.'; }))
        return std::nullopt;

    std::string_view rest = url.substr(schemeEnd + 3);
    std::size_t hostEnd = rest.find_first_of("/?#");
    std::string_view host = rest.substr(0, hostEnd);
    if (host.empty() || host.find_first_of(" \t") != std::string_view::npos)
        return std::nullopt;

    std::string result(url);
    if (hostEnd == std::string_view::npos || rest[hostEnd] != '/')
    {
        // Query and fragment are dropped along with an empty path.
        result = std::string(scheme) + "://" + std::string(host) + "/";
    }
    return result;
}

void writeFileAtomically(const std::filesystem::path &path, std::string_view content)
{
    std::filesystem::path temporary = path;
    temporary += ".tmp-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    {
        std::ofstream out(temporary, std::ios::binary | std::ios::trunc);
        if (!out)
            throw std::runtime_error("Failed to create file: '" + temporary.string() + "'");
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out)
        {
            std::error_code ec;
            std::filesystem::remove(temporary, ec);
            throw std::runtime_error("Failed to write file: '" + temporary.string() + "'");
        }
    }

    std::error_code ec;
    std::filesystem::rename(temporary, path, ec);
    if (ec)
    {
        std::error_code removeEc;
        std::filesystem::remove(temporary, removeEc);
        throw std::runtime_error("Failed to replace '" + path.string() + "': " + ec.message());
    }
}

std::string readTextFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("Failed to read text file: '" + path.string() + "'");
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace termpost::paths
