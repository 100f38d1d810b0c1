#pragma once

#include "termpost/doc/document.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace termpost::motd
{

using Clock = std::chrono::system_clock;

// Metadata of the post selected for the message of the day.
struct PostRecord
{
    std::string date;
    // Empty when the record only names the published page.
    std::filesystem::path source;
    std::optional<std::string> htmlLink;
};

struct PostInfo
{
    std::string title;
    std::string date;
};

// Parses a strict DD/MM/YYYY date as UTC midnight. Throws DateParseError.
Clock::time_point parsePostDate(std::string_view date);

// Reads {"date": ..., "source": ..., "html_link": ...}. A relative source is
// resolved against the directory of the record file. The source may be left
// out when html_link is present. Throws DocumentError.
PostRecord loadPostRecord(const std::filesystem::path &path);
PostRecord parsePostRecord(const std::string &json, const std::filesystem::path &baseDirectory = {});

// Title of the post and the value of its "date" docinfo field.
PostInfo postInfoFromDocument(const doc::DocumentNode &tree, const std::string &origin = "<memory>");

} // namespace termpost::motd
