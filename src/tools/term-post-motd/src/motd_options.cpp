#include "motd_options.hpp"

#include "termpost/errors.hpp"
#include "termpost/paths.hpp"

#include <stdexcept>

namespace termpost::motd
{
namespace
{

std::optional<std::string> readPart(const std::optional<std::filesystem::path> &file, const char *what)
{
    if (!file)
        return std::nullopt;
    try
    {
        return paths::readTextFile(*file);
    }
    catch (const std::runtime_error &err)
    {
        throw ConfigurationError(std::string("Cannot use ") + what + ": " + err.what());
    }
}

} // namespace

void registerMotdOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionLifespan, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(72)), "Lifespan",
                             "Hours a post stays in the MOTD, 0 keeps it forever.", 0});
    registry.registerOption({kOptionWrapWidth, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(0)), "Wrap Width",
                             "Re-flow the MOTD to this many columns, 0 disables wrapping.", 0});
    registry.registerOption({kOptionIndent, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(2)), "Indent",
                             "Spaces added before every non-blank line.", 0});
    registry.registerOption({kOptionBriefing, config::OptionKind::Boolean, config::OptionValue(false), "Briefing",
                             "Only show the first paragraph of the post."});
    registry.registerOption({kOptionHeader, config::OptionKind::String, config::OptionValue(), "Header File",
                             "Text placed above the post."});
    registry.registerOption({kOptionFooter, config::OptionKind::String, config::OptionValue(), "Footer File",
                             "Text placed below the post."});
    registry.registerOption({kOptionFallback, config::OptionKind::String, config::OptionValue(), "Fallback File",
                             "MOTD used verbatim once the post is too old."});
    registry.registerOption({kOptionLink, config::OptionKind::String, config::OptionValue(), "Footer Link",
                             "URL shown after the post."});
    registry.registerOption({kOptionWebsiteHtml, config::OptionKind::String, config::OptionValue(),
                             "Website Page", "Any page of the generated site, used to find posts by their link."});
}

MotdSettings settingsFromRegistry(const config::OptionRegistry &registry)
{
    MotdSettings settings;
    settings.lifespanHours = static_cast<int>(registry.getInteger(kOptionLifespan));
    settings.wrapWidth = static_cast<int>(registry.getInteger(kOptionWrapWidth));
    settings.indent = static_cast<int>(registry.getInteger(kOptionIndent));
    settings.briefing = registry.getBool(kOptionBriefing);
    if (auto header = registry.getOptionalString(kOptionHeader))
        settings.headerFile = *header;
    if (auto footer = registry.getOptionalString(kOptionFooter))
        settings.footerFile = *footer;
    if (auto fallback = registry.getOptionalString(kOptionFallback))
        settings.fallbackFile = *fallback;
    if (auto page = registry.getOptionalString(kOptionWebsiteHtml))
        settings.websiteHtml = *page;
    if (auto link = registry.getOptionalString(kOptionLink))
    {
        settings.footerLink = paths::normalizeUrl(*link);
        if (!settings.footerLink)
            throw ConfigurationError("Invalid footer link '" + *link + "'");
    }
    return settings;
}

MotdLayout layoutFromSettings(const MotdSettings &settings)
{
    MotdLayout layout;
    layout.header = readPart(settings.headerFile, "header");
    layout.footer = readPart(settings.footerFile, "footer");
    layout.footerLink = settings.footerLink;
    layout.wrapWidth = settings.wrapWidth;
    layout.indent = settings.indent;
    return layout;
}

std::filesystem::path postSourcePath(const PostRecord &record, const MotdSettings &settings, log::Logger *logger)
{
    if (settings.websiteHtml && record.htmlLink)
    {
        try
        {
            return paths::documentPathFromLink(*record.htmlLink, *settings.websiteHtml, {".json"}, logger);
        }
        catch (const std::runtime_error &err)
        {
            if (record.source.empty())
                throw ConfigurationError(err.what());
            log::warning(logger, std::string(err.what()) + ", using the record source");
        }
    }
    if (record.source.empty())
        throw ConfigurationError("Post record has no source, use --website-html FILE to find it from its link");
    return record.source;
}

} // namespace termpost::motd
