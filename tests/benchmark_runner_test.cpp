#include "test_base.hpp"
#include "core/benchmark_runner.hpp"
#include "core/thread_pool_manager.hpp"
#include <stdexcept>

class BenchmarkRunnerTest : public TestBase
{
protected:
    static FileVerdict verdict(const std::string &name, Verdict v, int confidence)
    {
        FileVerdict result;
        result.path = "/samples/" + name;
        result.analyzed = true;
        result.score.confidence = confidence;
        result.score.verdict = v;
        result.score.is_match = Verdicts::isMatch(v);
        return result;
    }

    static FileVerdict unreadable(const std::string &name)
    {
        FileVerdict result;
        result.path = "/samples/" + name;
        result.error_message = "cannot open file";
        return result;
    }
};

TEST_F(BenchmarkRunnerTest, EvaluateComputesRates)
{
    std::vector<FileVerdict> positives = {
        verdict("p1.png", Verdict::CONFIRMED, 95),
        verdict("p2.png", Verdict::CONFIRMED, 80),
        verdict("p3.mp4", Verdict::LIKELY, 45),
        verdict("p4.jpg", Verdict::UNLIKELY, 5),
        unreadable("p5.jpg")};
    std::vector<FileVerdict> negatives = {
        verdict("n1.jpg", Verdict::UNLIKELY, 0),
        verdict("n2.jpg", Verdict::UNLIKELY, 0),
        verdict("n3.jpg", Verdict::UNLIKELY, 10),
        verdict("n4.jpg", Verdict::UNLIKELY, 15),
        verdict("n5.png", Verdict::LIKELY, 40)};

    BenchmarkReport report = BenchmarkRunner::evaluate(positives, negatives);

    EXPECT_EQ(report.positives.total, 4u);
    EXPECT_EQ(report.positives.failed, 1u);
    EXPECT_DOUBLE_EQ(report.sensitivity, 75.0);
    EXPECT_DOUBLE_EQ(report.specificity, 80.0);
    EXPECT_EQ(report.rating, "GOOD");
    ASSERT_EQ(report.false_positives.size(), 1u);
    EXPECT_EQ(report.false_positives[0].path, "/samples/n5.png");
    ASSERT_EQ(report.missed_positives.size(), 1u);
    EXPECT_EQ(report.missed_positives[0].path, "/samples/p4.jpg");
}

TEST_F(BenchmarkRunnerTest, PossibleNegativeIsNotFalsePositive)
{
    std::vector<FileVerdict> negatives = {verdict("n1.jpg", Verdict::POSSIBLE, 25)};

    BenchmarkReport report = BenchmarkRunner::evaluate({}, negatives);

    EXPECT_TRUE(report.false_positives.empty());
    EXPECT_DOUBLE_EQ(report.specificity, 0.0);
}

TEST_F(BenchmarkRunnerTest, RatingBoundariesAreExclusive)
{
    EXPECT_EQ(BenchmarkRunner::rate(90.0, 85.0), "EXCELLENT");
    EXPECT_EQ(BenchmarkRunner::rate(80.0, 95.0), "GOOD");
    EXPECT_EQ(BenchmarkRunner::rate(61.0, 60.5), "GOOD");
    EXPECT_EQ(BenchmarkRunner::rate(60.0, 99.0), "NEEDS_IMPROVEMENT");
}

TEST_F(BenchmarkRunnerTest, EmptySetsRateZero)
{
    BenchmarkReport report = BenchmarkRunner::evaluate({}, {});

    EXPECT_DOUBLE_EQ(report.sensitivity, 0.0);
    EXPECT_DOUBLE_EQ(report.specificity, 0.0);
    EXPECT_EQ(report.rating, "NEEDS_IMPROVEMENT");
}

TEST_F(BenchmarkRunnerTest, RunClassifiesSampleDirectories)
{
    writeFile(path("positive/a.png"), tiktokPhotoBytes());
    writeFile(path("positive/b.png"), tiktokPhotoBytes());
    writeText(path("negative/c.jpg"), "holiday snapshot");
    writeText(path("negative/d.jpg"), "another picture");

    const DetectionProfile profile = DetectionProfile::defaults();
    LibraryMediaDecoder decoder;
    EvidenceExtractor extractor(profile, decoder);
    ScoringEngine engine(profile);
    FileOrganizer organizer;
    ScanCoordinator coordinator(extractor, engine, organizer);
    BenchmarkRunner runner(coordinator);

    BenchmarkReport report = runner.run(path("positive"), path("negative"));
    ThreadPoolManager::shutdown();

    EXPECT_EQ(report.positives.total, 2u);
    EXPECT_EQ(report.negatives.total, 2u);
    EXPECT_DOUBLE_EQ(report.sensitivity, 100.0);
    EXPECT_DOUBLE_EQ(report.specificity, 100.0);
    EXPECT_EQ(report.rating, "EXCELLENT");
    EXPECT_FALSE(fs::exists(path("positive/tiktok_detection")));

    EXPECT_THROW(runner.run(path("positive"), path("missing")), std::invalid_argument);
}
