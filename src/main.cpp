#include "core/app_config.hpp"
#include "core/benchmark_runner.hpp"
#include "core/decoder/media_decoder.hpp"
#include "core/detection_profile.hpp"
#include "core/evidence_extractor.hpp"
#include "core/file_organizer.hpp"
#include "core/file_utils.hpp"
#include "core/mount_manager.hpp"
#include "core/scan_coordinator.hpp"
#include "core/scan_errors.hpp"
#include "core/scoring_engine.hpp"
#include "core/thread_pool_manager.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

static void printUsage(const char *program)
{
    std::cout << "TikTok media organizer" << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program << " scan <directory> [--apply]       Classify and organize media (copies unless --apply)" << std::endl;
    std::cout << "  " << program << " test <tiktok_dir> <other_dir>    Measure accuracy on labeled samples" << std::endl;
    std::cout << "  " << program << " analyze <file>                   Print the evidence report for one file as JSON" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>      Configuration file (default: config.json)" << std::endl;
    std::cout << "  --log-level <LEVEL>  TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

static void printSummary(const ScanSummary &summary)
{
    std::cout << std::endl;
    std::cout << "Scan results" << std::endl;
    std::cout << "  Files found:        " << summary.total_files << std::endl;
    std::cout << "  Skipped (cached):   " << summary.skipped_cached << std::endl;
    std::cout << "  Confirmed:          " << summary.confirmed << std::endl;
    std::cout << "  Likely:             " << summary.likely << std::endl;
    std::cout << "  Possible:           " << summary.possible << std::endl;
    std::cout << "  Unlikely:           " << summary.unlikely << std::endl;
    if (summary.failed_files > 0)
        std::cout << "  Unreadable:         " << summary.failed_files << std::endl;
    if (summary.organize_failures > 0)
        std::cout << "  Not organized:      " << summary.organize_failures << std::endl;
    std::cout << "  Organized into:     " << summary.organization_root << std::endl;

    if (summary.apply_mode)
    {
        std::cout << "  Moved files:        " << summary.moved_files.size() << std::endl;
        for (const auto &moved : summary.moved_files)
            std::cout << "    " << moved << std::endl;
    }
    else
    {
        std::cout << "  Preview mode: files were copied, originals untouched. Re-run with --apply to move them." << std::endl;
    }

    if (summary.used_fallback_location)
        std::cout << "  NOTE: " << summary.fallback_notice << std::endl;
    if (!summary.cache_persisted)
        std::cout << "  NOTE: result cache could not be saved to " << summary.cache_path << std::endl;
}

static nlohmann::json buildReport(const EvidenceBundle &bundle, MediaKind kind, const ScoreResult &score,
                                  const ScoreResult &generic)
{
    nlohmann::json report;
    report["file"] = bundle.file_path;
    report["size"] = bundle.file_size;
    report["size_human"] = FileUtils::humanReadableSize(bundle.file_size);
    report["dimensions"] = bundle.dimensions ? nlohmann::json(bundle.dimensions->toString()) : nlohmann::json();
    report["aspect_ratio"] = bundle.aspect_ratio ? nlohmann::json(*bundle.aspect_ratio) : nlohmann::json();
    report["format"] = bundle.format ? nlohmann::json(*bundle.format) : nlohmann::json();
    report["found_strings"] = bundle.found_strings;
    if (bundle.content_hash)
        report["content_hash"] = *bundle.content_hash;

    report["media_kind"] = MediaKinds::getName(kind);
    report["confidence"] = score.confidence;
    report["verdict"] = Verdicts::getName(score.verdict);
    report["is_match"] = score.is_match;
    report["evidence"] = score.evidence;
    report["indicators"] = score.indicators;
    report["generic_confidence"] = generic.confidence;
    report["generic_verdict"] = Verdicts::getName(generic.verdict);
    return report;
}

int main(int argc, char *argv[])
{
    std::string config_path = "config.json";
    std::string log_level_override;
    std::vector<std::string> positional;
    bool apply = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--apply")
        {
            apply = true;
        }
        else if (arg == "--config" || arg == "--log-level")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return 1;
            }
            if (arg == "--config")
                config_path = argv[++i];
            else
                log_level_override = argv[++i];
        }
        else if (arg.rfind("--", 0) == 0)
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.empty())
    {
        printUsage(argv[0]);
        return 1;
    }

    auto &config = AppConfig::getInstance();
    config.loadFromFile(config_path);
    Logger::init(log_level_override.empty() ? config.getLogLevel() : log_level_override);

    const std::string command = positional[0];
    const size_t expected_args = command == "test" ? 3 : 2;
    if ((command != "scan" && command != "test" && command != "analyze") || positional.size() != expected_args)
    {
        std::cerr << "Error: invalid arguments for '" << command << "'" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    MountManager::getInstance().setConstrainedPatterns(config.getConstrainedPathPatterns());
    ThreadPoolManager::initialize(config.getMaxAnalysisThreads());

    const DetectionProfile profile = DetectionProfile::defaults();
    LibraryMediaDecoder decoder;
    EvidenceExtractor extractor(profile, decoder, config.getExtractorOptions());
    ScoringEngine engine(profile);
    FileOrganizer organizer(config.getOrganizerOptions());
    ScanCoordinator coordinator(extractor, engine, organizer, config.getScanOptions());

    int exit_code = 0;
    try
    {
        if (command == "scan")
        {
            ScanSummary summary = coordinator.scan(positional[1], apply);
            printSummary(summary);
        }
        else if (command == "test")
        {
            BenchmarkRunner runner(coordinator);
            BenchmarkReport report = runner.run(positional[1], positional[2]);
            BenchmarkRunner::logReport(report);
            std::cout << "Sensitivity: " << report.sensitivity << "%  Specificity: " << report.specificity
                      << "%  Rating: " << report.rating << std::endl;
        }
        else
        {
            const std::string &file = positional[1];
            EvidenceBundle bundle = extractor.extract(file);
            MediaKind kind = coordinator.mediaKindFor(file);
            ScoreResult score = engine.score(bundle, kind);
            ScoreResult generic = engine.score(bundle, MediaKind::GENERIC);
            nlohmann::json report = buildReport(bundle, kind, score, generic);
            std::cout << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        }
    }
    catch (const std::invalid_argument &e)
    {
        Logger::error(e.what());
        exit_code = 1;
    }
    catch (const IoError &e)
    {
        Logger::error(e.what());
        exit_code = 1;
    }

    ThreadPoolManager::shutdown();
    return exit_code;
}
