#include "sn/edit/decoration_dump.hpp"
#include "sn/edit/markdown_editor.hpp"
#include "sn/markdown/engine_options.hpp"
#include "sn/options.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace
{

struct CommandLine
{
    bool help = false;
    std::optional<std::string> dumpFile;
    std::optional<std::size_t> cursor;
    std::optional<std::string> optionsFile;
    std::vector<std::string> files;
};

void printHelp()
{
    std::cout << sn::edit::appName() << " - " << sn::edit::appShortDescription() << "\n\n";
    std::cout << "Usage:\n  " << sn::edit::appUsage() << "\n\n";
    std::cout << "  --dump FILE           print line blocks and decorations of FILE as JSON\n";
    std::cout << "  --cursor OFFSET       treat OFFSET as the cursor position for --dump\n";
    std::cout << "  --load-options FILE   read editor options from a JSON file\n";
    std::cout << "  -h, --help            show this help" << std::endl;
}

bool isHelpFlag(std::string_view arg)
{
    return arg == "--help" || arg == "-h";
}

void reportError(const std::string &message)
{
    std::cerr << sn::edit::appName() << ": " << message << std::endl;
}

bool parseCommandLine(int argc, char **argv, CommandLine &cmd)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg{argv[i]};
        auto requireValue = [&](std::string_view flag) -> const char * {
            if (i + 1 >= argc)
            {
                reportError(std::string(flag) + " requires a value");
                return nullptr;
            }
            return argv[++i];
        };

        if (isHelpFlag(arg))
        {
            cmd.help = true;
        }
        else if (arg == "--dump")
        {
            const char *value = requireValue(arg);
            if (!value)
                return false;
            cmd.dumpFile = value;
        }
        else if (arg == "--load-options")
        {
            const char *value = requireValue(arg);
            if (!value)
                return false;
            cmd.optionsFile = value;
        }
        else if (arg == "--cursor")
        {
            const char *value = requireValue(arg);
            if (!value)
                return false;
            try
            {
                std::size_t idx = 0;
                unsigned long long parsed = std::stoull(value, &idx);
                if (idx != std::string_view(value).size())
                    throw std::invalid_argument(value);
                cmd.cursor = static_cast<std::size_t>(parsed);
            }
            catch (const std::exception &)
            {
                reportError(std::string("invalid cursor offset: ") + value);
                return false;
            }
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            reportError("unknown option " + std::string(arg));
            return false;
        }
        else
        {
            cmd.files.emplace_back(arg);
        }
    }
    return true;
}

bool readFile(const std::string &path, std::string &text)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    text = buffer.str();
    return static_cast<bool>(in) || in.eof();
}

} // namespace

int main(int argc, char **argv)
{
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd))
        return 2;
    if (cmd.help)
    {
        printHelp();
        return 0;
    }

    sn::config::OptionRegistry registry{std::string(sn::edit::kAppId)};
    sn::markdown::registerEngineOptions(registry);
    registry.loadDefaults();
    if (cmd.optionsFile)
    {
        std::string error;
        if (!registry.loadFromFile(*cmd.optionsFile, &error))
        {
            reportError(error);
            return 1;
        }
    }
    sn::markdown::EngineSettings settings = sn::markdown::engineSettingsFrom(registry);

    if (cmd.dumpFile)
    {
        std::string text;
        if (!readFile(*cmd.dumpFile, text))
        {
            reportError("cannot read " + *cmd.dumpFile);
            return 1;
        }
        std::cout << sn::edit::dumpDocument(text, cmd.cursor, settings).dump(2) << std::endl;
        return 0;
    }

    sn::edit::NotesEditorApp app(cmd.files, settings);
    app.run();
    app.shutDown();
    return 0;
}
