#include "motd_options.hpp"

#include "termpost/app_info.hpp"
#include "termpost/doc/document_loader.hpp"
#include "termpost/errors.hpp"
#include "termpost/log.hpp"
#include "termpost/motd/motd_assembler.hpp"
#include "termpost/motd/post_record.hpp"
#include "termpost/paths.hpp"
#include "termpost/render/tree_renderer.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifndef TERM_POST_VERSION
#define TERM_POST_VERSION "0.0.0"
#endif

using namespace termpost;

namespace
{

constexpr const char *kToolId = "term-post-motd";

const appinfo::ToolInfo &toolInfo()
{
    return appinfo::requireTool(kToolId);
}

void printUsage()
{
    const auto &info = toolInfo();
    std::cout << info.executable << " - " << info.shortDescription << "\n\n"
              << "Usage: " << info.executable << " " << info.usage << "\n\n"
              << "  --lifespan HOURS       Use the fallback once the post is older (0 never expires)\n"
              << "  --wrap N               Re-flow the MOTD to N columns (0 disables)\n"
              << "  --indent N             Indent non-blank lines by N spaces\n"
              << "  --header FILE          Text placed above the post\n"
              << "  --footer FILE          Text placed below the post\n"
              << "  --link URL             Link shown after the post (defaults to the post's link)\n"
              << "  --fallback FILE        MOTD used verbatim for stale posts\n"
              << "  --website-html FILE    Page of the generated site; find the post source from its link\n"
              << "  --briefing             Only show the first paragraph of the post\n"
              << "  --load-options FILE    Load options from FILE\n"
              << "  --no-default-options   Do not load saved defaults\n"
              << "  --save-defaults        Save the effective options as defaults\n"
              << "  -v, --verbose          Report progress\n"
              << "  --debug                Report everything\n"
              << "  --version              Print the version and exit" << std::endl;
}

std::string renderPost(const motd::PostRecord &record, const motd::MotdSettings &settings, log::Logger &logger)
{
    const std::filesystem::path source = motd::postSourcePath(record, settings, &logger);
    doc::DocumentNode tree = doc::loadDocument(source);
    try
    {
        motd::PostInfo info = motd::postInfoFromDocument(tree, source.string());
        logger.info("Post '" + info.title + "' published on " + info.date);
        if (info.date != record.date)
            logger.warning("Post record date " + record.date + " differs from the document date " + info.date);
    }
    catch (const DocumentError &err)
    {
        logger.warning(err.what());
    }

    render::TreeRenderer renderer(&logger);
    return renderer.render(tree, settings.briefing).escapeBody;
}

} // namespace

int main(int argc, char **argv)
{
    log::Logger logger(kToolId, &std::cerr);
    config::OptionRegistry registry(kToolId);
    motd::registerMotdOptions(registry);

    bool loadDefaults = true;
    bool saveDefaults = false;
    std::vector<std::filesystem::path> optionFiles;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::filesystem::path> positional;

    const std::vector<std::pair<std::string, const char *>> valueFlags{
        {"--lifespan", motd::kOptionLifespan}, {"--wrap", motd::kOptionWrapWidth},
        {"--indent", motd::kOptionIndent},     {"--header", motd::kOptionHeader},
        {"--footer", motd::kOptionFooter},     {"--link", motd::kOptionLink},
        {"--fallback", motd::kOptionFallback}, {"--website-html", motd::kOptionWebsiteHtml},
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto flag = std::find_if(valueFlags.begin(), valueFlags.end(),
                                 [&](const auto &entry) { return entry.first == arg; });
        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--version")
        {
            std::cout << kToolId << " " << TERM_POST_VERSION << std::endl;
            return 0;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            logger.setThreshold(log::Level::Info);
        }
        else if (arg == "--debug")
        {
            logger.setThreshold(log::Level::Debug);
        }
        else if (arg == "--briefing")
        {
            overrides.emplace_back(motd::kOptionBriefing, "true");
        }
        else if (arg == "--no-default-options")
        {
            loadDefaults = false;
        }
        else if (arg == "--save-defaults")
        {
            saveDefaults = true;
        }
        else if (flag != valueFlags.end() || arg == "--load-options")
        {
            if (i + 1 >= argc)
            {
                std::cerr << kToolId << ": " << arg << " requires a value" << std::endl;
                return EXIT_FAILURE;
            }
            std::string value = argv[++i];
            if (flag != valueFlags.end())
                overrides.emplace_back(flag->second, value);
            else
                optionFiles.emplace_back(value);
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            std::cerr << kToolId << ": unknown option '" << arg << "'" << std::endl;
            return EXIT_FAILURE;
        }
        else
        {
            positional.emplace_back(arg);
        }
    }

    if (positional.size() != 2)
    {
        std::cerr << kToolId << ": expected a post record and an output path, see --help" << std::endl;
        return EXIT_FAILURE;
    }
    const std::filesystem::path &recordPath = positional[0];
    const std::filesystem::path &output = positional[1];

    try
    {
        if (loadDefaults && registry.loadDefaults())
            logger.debug("Loaded defaults from '" + registry.defaultOptionsPath().string() + "'");
        for (const auto &file : optionFiles)
        {
            if (!registry.loadFromFile(file))
                throw ConfigurationError("Failed to load options from '" + file.string() + "'");
        }
        for (const auto &[key, value] : overrides)
            registry.setFromString(key, value);

        motd::MotdSettings settings = motd::settingsFromRegistry(registry);
        if (saveDefaults && !registry.saveDefaults())
            logger.warning("Failed to save defaults to '" + registry.defaultOptionsPath().string() + "'");
        if (!settings.fallbackFile)
            throw ConfigurationError("A fallback MOTD is required, use --fallback FILE");

        motd::PostRecord record = motd::loadPostRecord(recordPath);
        if (!settings.footerLink && record.htmlLink)
        {
            settings.footerLink = paths::normalizeUrl(*record.htmlLink);
            if (!settings.footerLink)
                logger.warning("Ignoring invalid post link '" + *record.htmlLink + "'");
        }

        motd::MotdRequest request;
        request.postDate = motd::parsePostDate(record.date);
        request.now = motd::Clock::now();
        request.lifespanHours = settings.lifespanHours;
        request.layout = motd::layoutFromSettings(settings);
        try
        {
            request.fallbackBody = paths::readTextFile(*settings.fallbackFile);
        }
        catch (const std::runtime_error &err)
        {
            throw ConfigurationError(std::string("Cannot use fallback: ") + err.what());
        }

        if (motd::evaluateFreshness(request.postDate, request.now, request.lifespanHours) == motd::Freshness::Fresh)
            request.renderedBody = renderPost(record, settings, logger);

        motd::MotdResult result = motd::assembleMotd(request, &logger);
        paths::writeFileAtomically(output, result.text);
        logger.info("Wrote " + std::string(motd::freshnessName(result.freshness)) + " MOTD to '" + output.string() +
                    "'");
    }
    catch (const std::exception &err)
    {
        logger.error(err.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
