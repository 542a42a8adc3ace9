#pragma once

#include <string>
#include <vector>
#include "core/scan_coordinator.hpp"

struct SetStatistics
{
    size_t total = 0; // analyzed files only
    size_t confirmed = 0;
    size_t likely = 0;
    size_t possible = 0;
    size_t unlikely = 0;
    size_t failed = 0;
};

struct BenchmarkReport
{
    SetStatistics positives;
    SetStatistics negatives;
    double sensitivity = 0.0; // percent of positives rated CONFIRMED or LIKELY
    double specificity = 0.0; // percent of negatives rated UNLIKELY
    std::string rating;
    std::vector<FileVerdict> false_positives; // negatives scoring LIKELY or above
    std::vector<FileVerdict> missed_positives; // positives rated UNLIKELY
};

/**
 * @brief Measures detection accuracy on two labeled sample directories
 */
class BenchmarkRunner
{
public:
    explicit BenchmarkRunner(ScanCoordinator &coordinator);

    /**
     * @brief Classify both directories and compare against their labels
     * @param positive_dir Directory of known TikTok media
     * @param negative_dir Directory of known non-TikTok media
     * @throws std::invalid_argument if either directory is inaccessible
     */
    BenchmarkReport run(const std::string &positive_dir, const std::string &negative_dir);

    static BenchmarkReport evaluate(const std::vector<FileVerdict> &positives,
                                    const std::vector<FileVerdict> &negatives);

    static SetStatistics tally(const std::vector<FileVerdict> &results);

    /**
     * @brief EXCELLENT when both rates exceed 80, GOOD when both exceed 60
     */
    static std::string rate(double sensitivity, double specificity);

    static void logReport(const BenchmarkReport &report);

private:
    ScanCoordinator &coordinator_;
};
