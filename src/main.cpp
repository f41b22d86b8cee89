#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

// Core models
#include "core/LogEntry.hpp"
#include "core/ParsingStats.hpp"

// Input
#include "input/ByteSource.hpp"
#include "input/ParseWorker.hpp"
#include "input/StreamParser.hpp"

// Reporting
#include "report/ConsoleReporter.hpp"
#include "report/EntryFilter.hpp"
#include "report/JsonReporter.hpp"

// Utils
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace
{
    constexpr const char *kDefaultConfigFile = "config/logseg.conf";
    constexpr std::uint64_t kDefaultMaxFileSize = 30ULL * 1024 * 1024;
    constexpr std::int64_t kDefaultDisplayLimit = 150;

    constexpr int kExitOk = 0;
    constexpr int kExitUsage = 1;
    constexpr int kExitParseFailed = 2;

    // -------------------------
    // CLI
    // -------------------------
    struct CliOptions
    {
        std::string inputFile;
        std::optional<std::string> configFile;
        std::string severity = "ALL";
        std::string search;
        std::optional<std::int64_t> limit;
        bool json = false;
        bool pretty = false;
        bool strict = false;
        bool verbose = false;
        bool help = false;
        std::string badArgument;
    };

    CliOptions parseArgs(int argc, char *argv[])
    {
        CliOptions opts;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            const bool hasValue = i + 1 < argc;

            if ((arg == "--config" || arg == "-c") && hasValue)
            {
                opts.configFile = argv[++i];
            }
            else if ((arg == "--severity" || arg == "-s") && hasValue)
            {
                opts.severity = argv[++i];
            }
            else if ((arg == "--search" || arg == "-q") && hasValue)
            {
                opts.search = argv[++i];
            }
            else if ((arg == "--limit" || arg == "-n") && hasValue)
            {
                const std::string value = argv[++i];
                if (!value.empty() && value.size() < 10 &&
                    std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
                    opts.limit = std::stoll(value);
                else
                    opts.badArgument = arg + " " + value;
            }
            else if (arg == "--json")
            {
                opts.json = true;
            }
            else if (arg == "--pretty")
            {
                opts.pretty = true;
            }
            else if (arg == "--strict")
            {
                opts.strict = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                opts.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                opts.help = true;
            }
            else if (!arg.empty() && arg[0] != '-' && opts.inputFile.empty())
            {
                opts.inputFile = arg;
            }
            else
            {
                opts.badArgument = arg;
            }
        }

        return opts;
    }

    void printUsage(const char *progName)
    {
        std::cout
            << "Usage: " << progName << " [OPTIONS] input.log\n\n"
            << "Splits a log file into logical entries (multi-line stack traces and\n"
            << "JSON blocks stay together) and prints them.\n\n"
            << "OPTIONS:\n"
            << "  -c, --config FILE        Config file (default: " << kDefaultConfigFile << " if present)\n"
            << "  -s, --severity LEVEL     ALL, ERROR, WARN, INFO, DEBUG or TRACE\n"
            << "  -q, --search TEXT        Case-insensitive text filter\n"
            << "  -n, --limit N            Show at most N entries (0 = all)\n"
            << "      --json               Print entries and stats as JSON\n"
            << "      --pretty             Indent JSON output\n"
            << "      --strict             Abort on malformed UTF-8 instead of replacing it\n"
            << "  -v, --verbose            Debug logging\n"
            << "  -h, --help               Show this help\n\n";
    }

    void applyLoggingConfig(const LogSeg::Utils::ConfigLoader &config, bool verbose)
    {
        auto &logger = LogSeg::Utils::getLogger();

        if (const auto levelName = config.getString("log_level"))
        {
            if (const auto level = LogSeg::Utils::parseLogLevel(*levelName))
                logger.setLevel(*level);
            else
                logger.warn("Ignoring invalid log_level: " + *levelName);
        }
        if (verbose)
            logger.setLevel(LogSeg::Utils::LogLevel::DEBUG);

        const std::string logFile = config.getStringOr("log_file", "");
        if (!logFile.empty() && !logger.setFile(logFile))
            logger.warn("Cannot open log file " + logFile + "; logging to stderr only");
    }

    bool colorsWanted(const LogSeg::Utils::ConfigLoader &config, bool autoDetected)
    {
        const std::string mode = config.getStringOr("color", "auto");
        if (LogSeg::Utils::iequals(mode, "auto"))
            return autoDetected;
        if (const auto b = config.getBool("color"))
            return *b;

        LogSeg::Utils::getLogger().warn("Ignoring invalid color setting: " + mode);
        return autoDetected;
    }
} // namespace

int main(int argc, char *argv[])
{
    using namespace LogSeg;

    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (!opts.badArgument.empty())
    {
        std::cerr << "Error: unexpected argument: " << opts.badArgument << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (opts.inputFile.empty())
    {
        std::cerr << "Error: input file required.\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    auto &logger = Utils::getLogger();

    // Configuration
    Utils::ConfigLoader config;
    if (opts.configFile)
    {
        if (!config.loadFromFile(*opts.configFile))
        {
            std::cerr << "Error: cannot read config file: " << *opts.configFile << "\n";
            return kExitUsage;
        }
    }
    else
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(kDefaultConfigFile, ec) &&
            !config.loadFromFile(kDefaultConfigFile))
        {
            logger.warn(std::string("Cannot read ") + kDefaultConfigFile + "; using defaults");
        }
    }

    applyLoggingConfig(config, opts.verbose);
    if (config.malformedLines() > 0)
        logger.warn("Skipped " + std::to_string(config.malformedLines()) + " malformed config line(s)");

    const auto severity = Report::parseSeverityFilter(opts.severity);
    if (!severity)
    {
        std::cerr << "Error: unknown severity: " << opts.severity << "\n";
        return kExitUsage;
    }

    Input::ParserOptions parserOptions = Input::ParserOptions::fromConfig(config);
    if (opts.strict)
        parserOptions.decodeErrors = Input::DecodeErrorMode::STRICT;

    // Input
    auto source = std::make_unique<Input::FileByteSource>();
    if (!source->open(opts.inputFile))
    {
        logger.error("Cannot open input file: " + opts.inputFile);
        return kExitParseFailed;
    }

    // File-size ceiling is caller policy, checked before any parsing.
    const std::uint64_t maxSize = config.getByteSizeOr("max_file_size_bytes", kDefaultMaxFileSize);
    if (maxSize > 0 && source->totalSize() > maxSize)
    {
        std::cerr << "Error: file too large: " << source->totalSize()
                  << " bytes (maximum " << maxSize << " bytes)\n";
        return kExitUsage;
    }

    Input::ParseWorker worker(parserOptions);
    if (!worker.start(std::move(source)))
    {
        logger.error("Parse worker is busy");
        return kExitParseFailed;
    }

    std::optional<Input::ParseResult> result;
    while (true)
    {
        Input::ParseEvent ev = worker.waitEvent();
        if (ev.kind == Input::ParseEvent::Kind::PROGRESS)
        {
            logger.info("Parsing " + opts.inputFile + ": " +
                        std::to_string(static_cast<int>(ev.progress.fraction * 100.0)) + "% (" +
                        std::to_string(ev.progress.lines) + " lines)");
            continue;
        }

        if (ev.kind == Input::ParseEvent::Kind::ERROR)
        {
            std::cerr << "Error: " << ev.error << "\n";
            return kExitParseFailed;
        }

        result = std::move(ev.result);
        break;
    }
    worker.join();

    // Filtering
    Report::EntryFilter filter;
    filter.setSeverity(*severity);
    filter.setSearch(opts.search);

    if (opts.json)
    {
        if (opts.limit)
            filter.setLimit(static_cast<std::size_t>(*opts.limit));

        Report::JsonReporter json(opts.pretty ? Report::JsonReporter::PrettyPrint::PRETTY
                                              : Report::JsonReporter::PrettyPrint::COMPACT);
        json.write(std::cout, result->entries, filter.apply(result->entries), result->stats);
        if (!opts.pretty)
            std::cout << "\n";
        return kExitOk;
    }

    const std::int64_t limit = opts.limit.value_or(config.getIntOr("display_limit", kDefaultDisplayLimit));
    filter.setLimit(limit > 0 ? static_cast<std::size_t>(limit) : 0);

    Report::ConsoleReporter console;
    console.setEnableColors(colorsWanted(config, console.colorsEnabled()));
    console.printEntries(result->entries, filter.apply(result->entries), filter.countMatches(result->entries));
    console.printSummary(result->stats, Report::countSeverities(result->entries));

    return kExitOk;
}
