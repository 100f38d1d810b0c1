#include "ansi_options.hpp"

#include "termpost/app_info.hpp"
#include "termpost/doc/document_loader.hpp"
#include "termpost/errors.hpp"
#include "termpost/log.hpp"
#include "termpost/paths.hpp"
#include "termpost/render/tree_renderer.hpp"
#include "termpost/text/ansi_wrap.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifndef TERM_POST_VERSION
#define TERM_POST_VERSION "0.0.0"
#endif

using namespace termpost;

namespace
{

constexpr const char *kToolId = "term-post-ansi";

const appinfo::ToolInfo &toolInfo()
{
    return appinfo::requireTool(kToolId);
}

void printUsage()
{
    const auto &info = toolInfo();
    std::cout << info.executable << " - " << info.shortDescription << "\n\n"
              << "Usage: " << info.executable << " " << info.usage << "\n\n"
              << "  --briefing             Stop after the first paragraph following the title\n"
              << "  --wrap N               Re-flow the output to N columns (0 disables)\n"
              << "  --format FORMAT        Write 'ansi' escape codes (default) or 'markdown'\n"
              << "  --force                Replace OUTPUT if it already exists\n"
              << "  --load-options FILE    Load options from FILE\n"
              << "  --no-default-options   Do not load saved defaults\n"
              << "  --save-defaults        Save the effective options as defaults\n"
              << "  -v, --verbose          Report progress\n"
              << "  --debug                Report everything\n"
              << "  --version              Print the version and exit" << std::endl;
}

std::string renderDocument(const std::filesystem::path &input, const ansi::AnsiSettings &settings,
                           log::Logger &logger)
{
    doc::DocumentNode tree = doc::loadDocument(input);
    logger.info("Loaded document '" + input.string() + "'");

    render::TreeRenderer renderer(&logger);
    render::RenderedText rendered = renderer.render(tree, settings.briefing);
    const std::string &body = render::select(rendered, settings.format);
    if (settings.wrapWidth == 0)
        return body;

    std::string wrapped;
    for (const auto &line : text::wrapAnsi(std::string_view(body), settings.wrapWidth))
    {
        if (!wrapped.empty())
            wrapped.push_back('\n');
        wrapped += line;
    }
    return wrapped;
}

} // namespace

int main(int argc, char **argv)
{
    log::Logger logger(kToolId, &std::cerr);
    config::OptionRegistry registry(kToolId);
    ansi::registerAnsiOptions(registry);

    bool loadDefaults = true;
    bool saveDefaults = false;
    bool force = false;
    std::vector<std::filesystem::path> optionFiles;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::filesystem::path> positional;

    auto requireValue = [&](int &index, const std::string &flag) -> std::optional<std::string> {
        if (index + 1 >= argc)
        {
            std::cerr << kToolId << ": " << flag << " requires a value" << std::endl;
            return std::nullopt;
        }
        return std::string(argv[++index]);
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
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
        else if (arg == "--force")
        {
            force = true;
        }
        else if (arg == "--briefing")
        {
            overrides.emplace_back(ansi::kOptionBriefing, "true");
        }
        else if (arg == "--no-default-options")
        {
            loadDefaults = false;
        }
        else if (arg == "--save-defaults")
        {
            saveDefaults = true;
        }
        else if (arg == "--wrap" || arg == "--format" || arg == "--load-options")
        {
            auto value = requireValue(i, arg);
            if (!value)
                return EXIT_FAILURE;
            if (arg == "--wrap")
                overrides.emplace_back(ansi::kOptionWrapWidth, *value);
            else if (arg == "--format")
                overrides.emplace_back(ansi::kOptionFormat, *value);
            else
                optionFiles.emplace_back(*value);
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
        std::cerr << kToolId << ": expected a document and an output path, see --help" << std::endl;
        return EXIT_FAILURE;
    }
    const std::filesystem::path &input = positional[0];

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

        ansi::AnsiSettings settings = ansi::settingsFromRegistry(registry);
        if (saveDefaults && !registry.saveDefaults())
            logger.warning("Failed to save defaults to '" + registry.defaultOptionsPath().string() + "'");

        const std::filesystem::path output = ansi::outputPathFor(input, positional[1], settings.format);
        std::error_code ec;
        if (!force && std::filesystem::exists(output, ec))
            throw ConfigurationError("Output file '" + output.string() + "' already exists, use --force to replace it");

        std::string content = renderDocument(input, settings, logger);
        paths::writeFileAtomically(output, content);
        logger.info("Wrote '" + output.string() + "'");
    }
    catch (const std::exception &err)
    {
        logger.error(err.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
