#pragma once

#include "termpost/log.hpp"
#include "termpost/motd/motd_assembler.hpp"
#include "termpost/motd/post_record.hpp"
#include "termpost/options.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace termpost::motd
{

struct MotdSettings
{
    int lifespanHours = 72;
    int wrapWidth = 0;
    int indent = 2;
    bool briefing = false;
    std::optional<std::filesystem::path> headerFile;
    std::optional<std::filesystem::path> footerFile;
    std::optional<std::filesystem::path> fallbackFile;
    std::optional<std::string> footerLink;
    std::optional<std::filesystem::path> websiteHtml;
};

inline constexpr const char *kOptionLifespan = "lifespanHours";
inline constexpr const char *kOptionWrapWidth = "wrapWidth";
inline constexpr const char *kOptionIndent = "indent";
inline constexpr const char *kOptionBriefing = "briefing";
inline constexpr const char *kOptionHeader = "headerFile";
inline constexpr const char *kOptionFooter = "footerFile";
inline constexpr const char *kOptionFallback = "fallbackFile";
inline constexpr const char *kOptionLink = "footerLink";
inline constexpr const char *kOptionWebsiteHtml = "websiteHtml";

void registerMotdOptions(config::OptionRegistry &registry);

// Validates the footer link. Throws ConfigurationError.
MotdSettings settingsFromRegistry(const config::OptionRegistry &registry);

// Reads header and footer text for the layout. Unreadable files raise
// ConfigurationError.
MotdLayout layoutFromSettings(const MotdSettings &settings);

// Document to render for the record. With a website page configured, the
// record's html_link is looked up beside the "_website" tree and wins over its
// source. Throws ConfigurationError when no document can be named.
std::filesystem::path postSourcePath(const PostRecord &record, const MotdSettings &settings,
                                     log::Logger *logger = nullptr);

} // namespace termpost::motd
