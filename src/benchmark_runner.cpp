#include "core/benchmark_runner.hpp"
#include "logging/logger.hpp"
#include <iomanip>
#include <sstream>

static std::string percent(double value)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "%";
    return ss.str();
}

BenchmarkRunner::BenchmarkRunner(ScanCoordinator &coordinator)
    : coordinator_(coordinator)
{
}

SetStatistics BenchmarkRunner::tally(const std::vector<FileVerdict> &results)
{
    SetStatistics stats;
    for (const auto &result : results)
    {
        if (!result.analyzed)
        {
            stats.failed++;
            continue;
        }
        stats.total++;
        switch (result.score.verdict)
        {
        case Verdict::CONFIRMED:
            stats.confirmed++;
            break;
        case Verdict::LIKELY:
            stats.likely++;
            break;
        case Verdict::POSSIBLE:
            stats.possible++;
            break;
        case Verdict::UNLIKELY:
            stats.unlikely++;
            break;
        }
    }
    return stats;
}

std::string BenchmarkRunner::rate(double sensitivity, double specificity)
{
    if (sensitivity > 80.0 && specificity > 80.0)
        return "EXCELLENT";
    if (sensitivity > 60.0 && specificity > 60.0)
        return "GOOD";
    return "NEEDS_IMPROVEMENT";
}

BenchmarkReport BenchmarkRunner::evaluate(const std::vector<FileVerdict> &positives,
                                          const std::vector<FileVerdict> &negatives)
{
    BenchmarkReport report;
    report.positives = tally(positives);
    report.negatives = tally(negatives);

    if (report.positives.total > 0)
        report.sensitivity = 100.0 * static_cast<double>(report.positives.confirmed + report.positives.likely) /
                             static_cast<double>(report.positives.total);
    if (report.negatives.total > 0)
        report.specificity = 100.0 * static_cast<double>(report.negatives.unlikely) /
                             static_cast<double>(report.negatives.total);

    for (const auto &result : negatives)
    {
        if (result.analyzed && result.score.verdict >= Verdict::LIKELY)
            report.false_positives.push_back(result);
    }
    for (const auto &result : positives)
    {
        if (result.analyzed && result.score.verdict == Verdict::UNLIKELY)
            report.missed_positives.push_back(result);
    }

    report.rating = rate(report.sensitivity, report.specificity);
    return report;
}

BenchmarkReport BenchmarkRunner::run(const std::string &positive_dir, const std::string &negative_dir)
{
    Logger::info("Benchmarking against positives in " + positive_dir + " and negatives in " + negative_dir);
    std::vector<FileVerdict> positives = coordinator_.analyzeDirectory(positive_dir);
    std::vector<FileVerdict> negatives = coordinator_.analyzeDirectory(negative_dir);
    return evaluate(positives, negatives);
}

void BenchmarkRunner::logReport(const BenchmarkReport &report)
{
    auto describe = [](const std::string &label, const SetStatistics &stats)
    {
        Logger::info(label + ": " + std::to_string(stats.total) + " files, " +
                     std::to_string(stats.confirmed) + " confirmed, " +
                     std::to_string(stats.likely) + " likely, " +
                     std::to_string(stats.possible) + " possible, " +
                     std::to_string(stats.unlikely) + " unlikely" +
                     (stats.failed > 0 ? ", " + std::to_string(stats.failed) + " unreadable" : ""));
    };

    describe("Known TikTok set", report.positives);
    describe("Known non-TikTok set", report.negatives);
    Logger::info("Sensitivity: " + percent(report.sensitivity) + ", specificity: " + percent(report.specificity));

    for (const auto &fp : report.false_positives)
    {
        Logger::warn("False positive (" + std::to_string(fp.score.confidence) + "): " + fp.path);
    }
    for (const auto &missed : report.missed_positives)
    {
        Logger::info("Missed (" + std::to_string(missed.score.confidence) + "): " + missed.path);
    }

    Logger::info("Overall rating: " + report.rating);
}
