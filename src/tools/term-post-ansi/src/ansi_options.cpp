#include "ansi_options.hpp"

#include "termpost/errors.hpp"
#include "termpost/paths.hpp"

#include <system_error>

namespace termpost::ansi
{

void registerAnsiOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionBriefing, config::OptionKind::Boolean, config::OptionValue(false), "Briefing",
                             "Stop after the first paragraph that follows the title."});
    registry.registerOption({kOptionWrapWidth, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(0)), "Wrap Width",
                             "Re-flow the output to this many columns, 0 disables wrapping.", 0});
    registry.registerOption({kOptionFormat, config::OptionKind::String, config::OptionValue(std::string("ansi")),
                             "Output Format", "Either 'ansi' for escape codes or 'markdown'."});
}

render::OutputFormat parseOutputFormat(const std::string &name)
{
    if (name == "ansi" || name == "escape")
        return render::OutputFormat::Escape;
    if (name == "markdown" || name == "md")
        return render::OutputFormat::Markdown;
    throw ConfigurationError("Unknown output format '" + name + "', expected 'ansi' or 'markdown'");
}

AnsiSettings settingsFromRegistry(const config::OptionRegistry &registry)
{
    AnsiSettings settings;
    settings.briefing = registry.getBool(kOptionBriefing);
    settings.wrapWidth = static_cast<int>(registry.getInteger(kOptionWrapWidth));
    settings.format = parseOutputFormat(registry.getString(kOptionFormat));
    return settings;
}

std::filesystem::path outputPathFor(const std::filesystem::path &input, const std::filesystem::path &output,
                                    render::OutputFormat format)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(output, ec))
        return output;
    const char *extension = format == render::OutputFormat::Markdown ? ".md" : ".ansi";
    return output / paths::changeExtension(input, extension);
}

} // namespace termpost::ansi
