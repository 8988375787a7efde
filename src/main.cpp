#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

// Core models
#include "core/DetectionReport.hpp"

// Input
#include "input/FileReader.hpp"
#include "input/MetricParser.hpp"

// Utils
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

// Detection
#include "detection/DetectionRegistry.hpp"
#include "detection/DetectorConfig.hpp"

// Baselines
#include "analysis/BaselineGenerator.hpp"
#include "persistence/BaselineStore.hpp"

// Reporting
#include "report/ConsoleReporter.hpp"
#include "report/JsonReporter.hpp"

using namespace Sentinel;

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitError = 1;
    constexpr int kExitBadConfig = 2;

    // -------------------------
    // CLI
    // -------------------------
    struct CliOptions
    {
        std::string inputFile;
        std::string configFile;
        std::string baselineFile;
        std::string saveBaselineFile;
        std::string generateBaselineFile;
        std::string outputDir = ".";
        std::string logFile;
        std::size_t points = 1000;
        double anomalyRate = 0.05;
        std::uint32_t seed = 42;
        core::Severity jsonMinSeverity = core::Severity::Sev3;
        bool json = false;
        bool verbose = false;
        bool help = false;
    };

    void printUsage(const char *progName)
    {
        std::cout
            << "Usage: " << progName << " [OPTIONS] metrics.log\n\n"
            << "Replays a recorded metric stream through the anomaly detector.\n"
            << "Each line: 'YYYY-MM-DD HH:MM:SS name=value ...' or '<unix-seconds> name=value ...'\n\n"
            << "OPTIONS:\n"
            << "  -c, --config FILE          key = value configuration file\n"
            << "  -b, --baseline FILE        Seed windows from a baseline snapshot\n"
            << "  --save-baseline FILE       Write a snapshot after the replay\n"
            << "  --generate-baseline FILE   Write a synthetic baseline and exit\n"
            << "  --points N                 Points per metric for generation (default: 1000)\n"
            << "  --anomaly-rate R           Injected anomaly fraction (default: 0.05)\n"
            << "  --seed S                   Generator seed (default: 42)\n"
            << "  -o, --output DIR           Output directory for --json (default: .)\n"
            << "  --json                     Write sentinel_report.json\n"
            << "  --min-severity SEV-N       Leave less severe anomalies out of the JSON report\n"
            << "  --log-file FILE            Also write log messages to FILE\n"
            << "  -v, --verbose              Debug logging and detailed console output\n"
            << "  -h, --help                 Show this help\n\n"
            << "Exit codes: 0 success, 1 usage or I/O error, 2 invalid configuration\n";
    }

    /// Parsed options, or std::nullopt with `error` set.
    std::optional<CliOptions> parseArgs(int argc, char *argv[], std::string &error)
    {
        CliOptions opts;

        auto needValue = [&](int &i, const std::string &flag) -> std::optional<std::string>
        {
            if (i + 1 >= argc)
            {
                error = "Missing value for " + flag;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                opts.help = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                opts.verbose = true;
            }
            else if (arg == "--json")
            {
                opts.json = true;
            }
            else if (arg == "--config" || arg == "-c" ||
                     arg == "--baseline" || arg == "-b" ||
                     arg == "--save-baseline" || arg == "--generate-baseline" ||
                     arg == "--output" || arg == "-o" ||
                     arg == "--log-file")
            {
                const auto v = needValue(i, arg);
                if (!v)
                    return std::nullopt;

                if (arg == "--config" || arg == "-c")
                    opts.configFile = *v;
                else if (arg == "--baseline" || arg == "-b")
                    opts.baselineFile = *v;
                else if (arg == "--save-baseline")
                    opts.saveBaselineFile = *v;
                else if (arg == "--generate-baseline")
                    opts.generateBaselineFile = *v;
                else if (arg == "--output" || arg == "-o")
                    opts.outputDir = *v;
                else
                    opts.logFile = *v;
            }
            else if (arg == "--points")
            {
                const auto v = needValue(i, arg);
                const auto n = v ? Utils::parseInteger(*v) : std::nullopt;
                if (!n || *n <= 0)
                {
                    error = "--points expects a positive integer";
                    return std::nullopt;
                }
                opts.points = static_cast<std::size_t>(*n);
            }
            else if (arg == "--anomaly-rate")
            {
                const auto v = needValue(i, arg);
                const auto r = v ? Utils::parseNumber(*v) : std::nullopt;
                if (!r || *r < 0.0 || *r > 1.0)
                {
                    error = "--anomaly-rate expects a number in [0, 1]";
                    return std::nullopt;
                }
                opts.anomalyRate = *r;
            }
            else if (arg == "--min-severity")
            {
                const auto v = needValue(i, arg);
                const auto sev = v ? core::parseSeverity(*v) : std::nullopt;
                if (!sev)
                {
                    error = "--min-severity expects SEV-1, SEV-2 or SEV-3";
                    return std::nullopt;
                }
                opts.jsonMinSeverity = *sev;
            }
            else if (arg == "--seed")
            {
                const auto v = needValue(i, arg);
                const auto s = v ? Utils::parseInteger(*v) : std::nullopt;
                if (!s || *s < 0 || *s > 0xFFFFFFFFLL)
                {
                    error = "--seed expects a non-negative integer";
                    return std::nullopt;
                }
                opts.seed = static_cast<std::uint32_t>(*s);
            }
            else if (!arg.empty() && arg[0] != '-')
            {
                if (!opts.inputFile.empty())
                {
                    error = "Only one input file is supported";
                    return std::nullopt;
                }
                opts.inputFile = arg;
            }
            else
            {
                error = "Unknown option: " + arg;
                return std::nullopt;
            }
        }

        return opts;
    }

    /// Apply log_level from the config file; -v wins.
    void configureLogging(const Utils::ConfigLoader &config, const CliOptions &opts)
    {
        auto &logger = Utils::getLogger();

        if (const auto name = config.getString("log_level"))
        {
            if (const auto level = Utils::parseLogLevel(*name))
                logger.setLevel(*level);
            else
                logger.warn("Unknown log_level '" + *name + "', keeping " +
                            Utils::Logger::toString(logger.level()));
        }

        if (opts.verbose)
            logger.setLevel(Utils::LogLevel::DEBUG);

        if (!opts.logFile.empty() && !logger.setFile(opts.logFile))
            logger.warn("Cannot open log file " + opts.logFile + ", logging to console only");
    }

    int generateBaseline(const CliOptions &opts, const Detection::DetectorConfig &config)
    {
        Analysis::BaselineGenerator generator(opts.points, opts.anomalyRate, opts.seed);
        const auto snapshot = generator.generate(config.ewmaAlpha);

        Persistence::BaselineStore store(opts.generateBaselineFile);
        return store.save(snapshot, config) ? kExitOk : kExitError;
    }

    bool writeJsonReport(const core::DetectionReport &report, const CliOptions &opts)
    {
        auto &logger = Utils::getLogger();
        const std::string &outputDir = opts.outputDir;

        std::error_code ec;
        std::filesystem::create_directories(outputDir, ec);
        if (ec)
        {
            logger.error("Cannot create output directory " + outputDir + ": " + ec.message());
            return false;
        }

        const auto path = std::filesystem::path(outputDir) / "sentinel_report.json";
        std::ofstream out(path);
        if (!out.is_open())
        {
            logger.error("Cannot open " + path.string() + " for writing");
            return false;
        }

        Report::JsonReporter json(Report::JsonReporter::PrettyPrint::PRETTY);
        json.setMinSeverity(opts.jsonMinSeverity);
        json.generateReport(report);
        json.writeJson(out);
        out.flush();
        if (!out)
        {
            logger.error("Failed writing " + path.string());
            return false;
        }

        logger.info("JSON report written to " + path.string());
        return true;
    }
} // anonymous namespace

int main(int argc, char *argv[])
{
    std::string argError;
    const auto parsed = parseArgs(argc, argv, argError);
    if (!parsed)
    {
        std::cerr << "Error: " << argError << "\n\n";
        printUsage(argv[0]);
        return kExitError;
    }

    const CliOptions &opts = *parsed;
    if (opts.help)
    {
        printUsage(argv[0]);
        return kExitOk;
    }

    auto &logger = Utils::getLogger();

    // Configuration
    Utils::ConfigLoader configFile;
    if (!opts.configFile.empty() && !configFile.loadFromFile(opts.configFile))
    {
        logger.error("Cannot read config file: " + opts.configFile);
        return kExitError;
    }
    configureLogging(configFile, opts);

    Detection::DetectorConfig detectorConfig;
    try
    {
        detectorConfig = Detection::DetectorConfig::fromConfig(configFile);
        if (const auto problem = detectorConfig.validate())
            throw std::invalid_argument(*problem);
    }
    catch (const std::invalid_argument &e)
    {
        logger.error(std::string("Invalid configuration: ") + e.what());
        return kExitBadConfig;
    }

    if (!opts.generateBaselineFile.empty())
        return generateBaseline(opts, detectorConfig);

    if (opts.inputFile.empty())
    {
        std::cerr << "Error: input file required.\n\n";
        printUsage(argv[0]);
        return kExitError;
    }

    logger.info("Starting LLM Sentinel");
    logger.info("Input: " + opts.inputFile);

    Detection::DetectionRegistry registry(detectorConfig);

    if (!opts.baselineFile.empty())
    {
        const auto snapshot = Persistence::BaselineStore(opts.baselineFile).load();
        if (!snapshot)
        {
            logger.error("Cannot use baseline " + opts.baselineFile);
            return kExitError;
        }
        Persistence::BaselineStore::apply(*snapshot, registry);
    }

    Input::FileReader reader(opts.inputFile);
    if (!reader.isOpen())
    {
        logger.error("Cannot open input file: " + opts.inputFile);
        return kExitError;
    }

    Input::MetricParser parser;
    Report::ConsoleReporter console(opts.verbose ? Report::ConsoleReporter::Verbosity::VERBOSE
                                                 : Report::ConsoleReporter::Verbosity::NORMAL);

    core::DetectionReport report;
    report.setProcessedFile(opts.inputFile);

    while (const auto line = reader.nextLine())
    {
        const auto pr = parser.parseLineDetailed(*line);
        if (pr.skipped)
            continue;

        if (!pr.batch)
        {
            report.recordMalformedLine();
            logger.warn("Line " + std::to_string(reader.lineNumber()) + ": " + pr.error);
            continue;
        }

        const auto result = registry.observeBatch(pr.batch->metrics, pr.batch->timestamp);
        report.recordBatch(pr.batch->timestamp);

        for (const auto &anomaly : result.anomalies)
        {
            report.addAnomaly(anomaly);
            console.reportAnomaly(anomaly);
        }

        if (result.pattern)
        {
            report.addPattern(*result.pattern);
            console.reportPattern(*result.pattern);
        }
    }

    report.setSummary(registry.summary());
    console.generateReport(report);

    int exitCode = kExitOk;

    if (opts.json && !writeJsonReport(report, opts))
        exitCode = kExitError;

    if (!opts.saveBaselineFile.empty())
    {
        Persistence::BaselineStore store(opts.saveBaselineFile);
        if (!store.save(registry.snapshot(), registry.config()))
            exitCode = kExitError;
    }

    logger.info("Done: " + std::to_string(report.batchesProcessed()) + " batches, " +
                std::to_string(report.anomalies().size()) + " anomalies, " +
                std::to_string(report.patterns().size()) + " patterns");
    return exitCode;
}
