#include <clocale>
#include <locale>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <QGuiApplication>

#include <csm/config.hpp>
#include <csm/json_util.hpp>
#include <csm/version.hpp>

#include <csm/job/job.hpp>
#include <csm/pdf/generate.hpp>
#include <csm/util/log.hpp>

using JobOverrides = std::unordered_map<std::string, std::string>;

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_ParseError{ false };

    bool m_Deterministic{ false };

    std::optional<std::string> m_JobFile{ std::nullopt };
    std::optional<std::string> m_JobJson{ std::nullopt };
    JobOverrides m_JobOverrides{};
};

enum ExitCode : int
{
    Success = 0,
    Failure = 1,
    PartialFailure = 2,
};

constexpr const char c_HelpStr[]{
    R"(
Command Line Interface for Card Sheet Maker

    --help              Display this information.
    --version           Display the version and build time.
    --deterministic     Produce byte-identical output between runs
                        and don't write a default config.ini.
    --job <file>        Load the job from this file.
    --job <json>        Load the job from this json blob.
    --job               Take all following commands and override
                        job settings with them.

Job Overrides are formatted as follows:
    --<name> <value>    Will override the property <name> with the
                        value <value> as if parsed as json, where
                        <name> can be a nested name and refers to
                        the names seen in job files.
                        For example:
                            --file_name output_file
                            --card_layout.width 3
                            --paper_size A4

Exit codes:
    0                   All sheets were written.
    1                   No cards were found or the job is invalid.
    2                   Some sheets could not be written.
)"
};

class OverridesProvider : public JsonProvider
{
  public:
    OverridesProvider(const JobOverrides& overrides)
        : m_Overrides{ overrides }
    {
    }

    virtual std::vector<std::string> GetJsonPaths() const override
    {
        std::vector<std::string> paths;
        paths.reserve(m_Overrides.size());
        for (const auto& [path, value] : m_Overrides)
        {
            paths.push_back(path);
        }
        return paths;
    }

    virtual nlohmann::json GetJsonValue(std::string_view path_view) const override
    {
        const std::string path{ path_view };
        if (m_Overrides.contains(path))
        {
            const auto& value{ m_Overrides.at(path) };
            try
            {
                // Try parsing the override as a literal ...
                return nlohmann::json::parse(value);
            }
            catch (const nlohmann::json::parse_error&)
            {
                // ... and keep it as a string if that's not possible.
                return value;
            }
        }

        return nlohmann::json{};
    }

  private:
    const JobOverrides& m_Overrides;
};

CommandLineOptions ParseCommandLine(int argc, char** raw_argv)
{
    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    size_t i{ 1 };
    bool parse_overrides{ false };
    for (; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--help")
        {
            fmt::print("{}", c_HelpStr);
            cli.m_HelpDisplayed = true;
            return cli;
        }
        else if (arg == "--version")
        {
            fmt::print("Card Sheet Maker {} (built {})\n", CardSheetMakerVersion(), CardSheetMakerBuildTime());
            cli.m_HelpDisplayed = true;
            return cli;
        }
        else if (arg == "--deterministic")
        {
            cli.m_Deterministic = true;
        }
        else if (arg == "--job")
        {
            if (i + 1 >= argv.size() ||
                std::string_view{ argv[i + 1] }.starts_with("--"))
            {
                // Parse overrides from now on out
                ++i;
                parse_overrides = true;
                break;
            }
            else
            {
                ++i;
                std::string param{ argv[i] };
                if (fs::exists(param))
                {
                    cli.m_JobFile = std::move(param);
                }
                else
                {
                    cli.m_JobJson = std::move(param);
                }
            }
        }
        else
        {
            LogError("Unknown command line option {}", arg);
            cli.m_ParseError = true;
            return cli;
        }
    }

    if (!parse_overrides)
    {
        return cli;
    }

    for (; i < argv.size(); i += 2)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--deterministic")
        {
            // Flags are allowed between overrides, they take no value
            cli.m_Deterministic = true;
            i--;
            continue;
        }

        if (!arg.starts_with("--") || i + 1 >= argv.size())
        {
            LogError("Error while parsing job overrides. Expected --<name> <value> but got {}", arg);
            cli.m_ParseError = true;
            return cli;
        }

        const std::string_view param{ argv[i + 1] };
        cli.m_JobOverrides[std::string{ arg.substr(2) }] = param;
    }

    return cli;
}

int main(int argc, char** argv)
{
#ifdef WIN32
    {
        static constexpr char c_LocaleName[]{ ".utf-8" };
        std::setlocale(LC_ALL, c_LocaleName);
        std::locale::global(std::locale(c_LocaleName));
    }
#endif

    Log::RegisterThreadName("MainThread");

    // Svg cutting guides are painted, but the cli never opens a window
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
    {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app{ argc, argv };

    CommandLineOptions cli{};
    {
        // Whether we log to a file depends on the config, so until it is loaded only log to console
        Log startup_log{ LogFlags::Console, Log::c_MainLogName };

        cli = ParseCommandLine(argc, argv);
        if (cli.m_HelpDisplayed)
        {
            return ExitCode::Success;
        }
        if (cli.m_ParseError)
        {
            return ExitCode::Failure;
        }

        g_Cfg = LoadConfig(c_DefaultConfigFile, !cli.m_Deterministic);
    }

    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::FatalQuit |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailColumn |
        LogFlags::DetailThread |
        LogFlags::DetailStacktrace
    };
    if (g_Cfg.m_LogToFile && !cli.m_Deterministic)
    {
        log_flags = log_flags | LogFlags::File;
    }
    Log main_log{ log_flags, Log::c_MainLogName };

    if (cli.m_Deterministic)
    {
        g_Cfg.m_DeterministicOutput = true;
    }

    OverridesProvider overrides_provider{
        cli.m_JobOverrides
    };

    Job job{};
    if (cli.m_JobFile.has_value())
    {
        if (!job.Load(cli.m_JobFile.value(), &overrides_provider))
        {
            return ExitCode::Failure;
        }
    }
    else if (cli.m_JobJson.has_value())
    {
        if (!job.LoadFromJson(cli.m_JobJson.value(), &overrides_provider))
        {
            LogError("Failed loading job from json-blob...");
            return ExitCode::Failure;
        }
    }
    else if (!cli.m_JobOverrides.empty())
    {
        LogInfo("Starting from a default job with overrides...");
        const auto default_json{ job.DumpToJson() };
        if (!job.LoadFromJson(default_json, &overrides_provider))
        {
            return ExitCode::Failure;
        }
    }
    else
    {
        LogInfo("Starting from a default job...");
    }

    GenerationResult result{};
    try
    {
        result = GenerateSheets(job, g_Cfg);
    }
    catch (const std::exception& e)
    {
        LogError("Can not generate sheets: {}", e.what());
        return ExitCode::Failure;
    }

    switch (result.m_Status)
    {
    case GenerationStatus::NoCards:
        return ExitCode::Failure;
    case GenerationStatus::PartialFailure:
        LogWarning("Wrote {} of {} sheets for {} cards", result.m_Sheets.size(), result.m_NumSheets, result.m_NumCards);
        return ExitCode::PartialFailure;
    case GenerationStatus::Success:
        LogInfo("Wrote {} sheets for {} cards", result.m_Sheets.size(), result.m_NumCards);
        break;
    }

    if (!result.m_FallbackImages.empty())
    {
        LogWarning("{} images were replaced by placeholders", result.m_FallbackImages.size());
    }

    return ExitCode::Success;
}
