#include "BaseTestFixture.h"
#include "DedupRunner.hpp"
#include <nlohmann/json.hpp>

class DedupRunnerTest : public BaseTestFixture {
protected:
    DedupConfig config;

    void SetUp() override {
        BaseTestFixture::SetUp();
        config.inputDir = inputDir.string();
        config.outputDir = outputDir.string();
        config.quiet = true;
    }

    // img1: blue square, img2: img1 re-saved at 90% quality, img3: red square
    void writeScenario() {
        ASSERT_TRUE(writeImage(inputDir / "img1.png", squareImage(BLUE, 0)));
        ASSERT_TRUE(resave(inputDir / "img1.png", inputDir / "img2.jpg", 90));
        ASSERT_TRUE(writeImage(inputDir / "img3.png", squareImage(RED, 3)));
    }

    static std::string name(const std::string& id) {
        return fs::path(id).filename().string();
    }
};

TEST_F(DedupRunnerTest, RecompressedCopyIsDuplicateOfOriginal) {
    writeScenario();
    DedupResult result = DedupRunner(config).run();

    ASSERT_EQ(result.verdicts.size(), 3u);
    EXPECT_EQ(name(result.verdicts[0].id), "img1.png");
    EXPECT_EQ(result.verdicts[0].kind, VerdictKind::Unique);
    EXPECT_EQ(name(result.verdicts[1].id), "img2.jpg");
    EXPECT_EQ(result.verdicts[1].kind, VerdictKind::Duplicate);
    EXPECT_EQ(name(result.verdicts[1].representative), "img1.png");
    EXPECT_EQ(name(result.verdicts[2].id), "img3.png");
    EXPECT_EQ(result.verdicts[2].kind, VerdictKind::Unique);

    EXPECT_EQ(result.accepted.size(), 2u);
    EXPECT_EQ(result.summary.unique, 2u);
    EXPECT_EQ(result.summary.duplicates, 1u);
    EXPECT_EQ(result.summary.skipped, 0u);
}

TEST_F(DedupRunnerTest, OutputContainsOnlyUniqueImages) {
    writeScenario();
    DedupResult result = DedupRunner(config).run();

    EXPECT_EQ(result.uniqueDir.string(), (outputDir / UNIQUE_DIR_NAME).string());
    EXPECT_TRUE(fs::exists(result.uniqueDir / "img1.png"));
    EXPECT_TRUE(fs::exists(result.uniqueDir / "img3.png"));
    EXPECT_FALSE(fs::exists(result.uniqueDir / "img2.jpg"));
    EXPECT_EQ(fs::file_size(result.uniqueDir / "img1.png"), fs::file_size(inputDir / "img1.png"));
}

TEST_F(DedupRunnerTest, CorruptFileIsSkippedAndDoesNotAffectOthers) {
    writeBytes(inputDir / "img0_broken.png", "garbage bytes, not an image");
    writeScenario();
    DedupResult result = DedupRunner(config).run();

    ASSERT_EQ(result.verdicts.size(), 4u);
    EXPECT_EQ(name(result.verdicts[0].id), "img0_broken.png");
    EXPECT_EQ(result.verdicts[0].kind, VerdictKind::Skipped);
    EXPECT_EQ(result.verdicts[0].skipReason, SkipReason::DecodeFailure);
    EXPECT_EQ(result.verdicts[1].kind, VerdictKind::Unique);
    EXPECT_EQ(result.verdicts[2].kind, VerdictKind::Duplicate);
    EXPECT_EQ(result.verdicts[3].kind, VerdictKind::Unique);

    for (const auto& entry : result.accepted) {
        EXPECT_NE(name(entry.representative), "img0_broken.png");
    }
    EXPECT_EQ(result.summary.skipped, 1u);
    EXPECT_FALSE(fs::exists(result.uniqueDir / "img0_broken.png"));
}

TEST_F(DedupRunnerTest, OversizeImageIsSkipped) {
    cv::Mat noise(300, 300, CV_8UC3);
    cv::randu(noise, cv::Scalar::all(0), cv::Scalar::all(255));
    ASSERT_TRUE(writeImage(inputDir / "img0_noise.png", noise));
    writeScenario();

    config.maxImageSize = 50 * 1024;
    ASSERT_GT(fs::file_size(inputDir / "img0_noise.png"), config.maxImageSize);
    DedupResult result = DedupRunner(config).run();

    ASSERT_EQ(result.verdicts.size(), 4u);
    EXPECT_EQ(result.verdicts[0].kind, VerdictKind::Skipped);
    EXPECT_EQ(result.verdicts[0].skipReason, SkipReason::Oversize);
    EXPECT_EQ(result.verdicts[1].kind, VerdictKind::Unique);
    EXPECT_EQ(result.verdicts[2].kind, VerdictKind::Duplicate);
    EXPECT_EQ(result.verdicts[3].kind, VerdictKind::Unique);
}

TEST_F(DedupRunnerTest, NestedStructureIsPreserved) {
    ASSERT_TRUE(writeImage(inputDir / "album" / "2019" / "a.png", squareImage(BLUE, 1)));
    ASSERT_TRUE(writeImage(inputDir / "b.bmp", squareImage(RED, 2)));
    DedupResult result = DedupRunner(config).run();

    EXPECT_TRUE(fs::exists(result.uniqueDir / "album" / "2019" / "a.png"));
    EXPECT_TRUE(fs::exists(result.uniqueDir / "b.bmp"));
}

TEST_F(DedupRunnerTest, ParallelFingerprintingKeepsVerdicts) {
    writeScenario();
    ASSERT_TRUE(writeImage(inputDir / "img4.png", squareImage(RED, 3)));
    ASSERT_TRUE(writeImage(inputDir / "img5.png", squareImage(BLUE, 2)));

    DedupResult sequential = DedupRunner(config).run();
    config.workers = 4;
    DedupResult parallel = DedupRunner(config).run();
    EXPECT_EQ(parallel.verdicts, sequential.verdicts);

    config.itemTimeoutMs = 60000;
    DedupResult bounded = DedupRunner(config).run();
    EXPECT_EQ(bounded.verdicts, sequential.verdicts);
}

TEST_F(DedupRunnerTest, WritesJsonReport) {
    writeScenario();
    config.reportPath = (tempDir / "reports" / "run.json").string();
    DedupRunner(config).run();

    std::ifstream f(config.reportPath);
    ASSERT_TRUE(f.good());
    nlohmann::json report = nlohmann::json::parse(f);

    EXPECT_EQ(report["summary"]["unique"], 2);
    EXPECT_EQ(report["summary"]["duplicates"], 1);
    EXPECT_EQ(report["summary"]["accepted_set_size"], 2);
    EXPECT_EQ(report["config"]["distance_threshold"], 5);
    ASSERT_EQ(report["items"].size(), 3u);
    EXPECT_EQ(report["items"][1]["verdict"], "duplicate");
    EXPECT_EQ(name(report["items"][1]["representative"].get<std::string>()), "img1.png");
    ASSERT_EQ(report["accepted"].size(), 2u);
    EXPECT_EQ(report["accepted"][0]["fingerprint"].get<std::string>().size(), 16u);
}

TEST_F(DedupRunnerTest, BatchAboveArchiveLimitAbortsWithoutOutput) {
    writeScenario();
    config.maxArchiveSize = 10;
    EXPECT_THROW(DedupRunner(config).run(), DedupException);
    EXPECT_FALSE(fs::exists(outputDir / UNIQUE_DIR_NAME));
}

TEST_F(DedupRunnerTest, AllImagesUndecodableAbortsWithoutOutput) {
    writeBytes(inputDir / "a.png", "nope");
    writeBytes(inputDir / "b.jpg", "still nope");
    EXPECT_THROW(DedupRunner(config).run(), DedupException);
    EXPECT_FALSE(fs::exists(outputDir / UNIQUE_DIR_NAME));
}

TEST_F(DedupRunnerTest, SingleCorruptFileFinishesWithNoUniques) {
    writeBytes(inputDir / "only.png", "nope");
    DedupResult result = DedupRunner(config).run();

    ASSERT_EQ(result.verdicts.size(), 1u);
    EXPECT_EQ(result.verdicts[0].kind, VerdictKind::Skipped);
    EXPECT_EQ(result.verdicts[0].skipReason, SkipReason::DecodeFailure);
    EXPECT_EQ(result.summary.unique, 0u);
    EXPECT_EQ(result.summary.skipped, 1u);
    EXPECT_TRUE(fs::is_directory(result.uniqueDir));
    EXPECT_TRUE(fs::is_empty(result.uniqueDir));
}

TEST_F(DedupRunnerTest, ReportFailureLeavesNoOutput) {
    writeScenario();
    // An existing directory cannot be opened as the report file
    config.reportPath = tempDir.string();
    EXPECT_THROW(DedupRunner(config).run(), DedupException);
    EXPECT_FALSE(fs::exists(outputDir / UNIQUE_DIR_NAME));
}

TEST_F(DedupRunnerTest, ReportFailureKeepsPreviousResult) {
    writeScenario();
    DedupRunner(config).run();
    ASSERT_TRUE(fs::exists(outputDir / UNIQUE_DIR_NAME / "img1.png"));

    ASSERT_TRUE(writeImage(inputDir / "img4.png", squareImage(BLUE, 2)));
    config.reportPath = tempDir.string();
    EXPECT_THROW(DedupRunner(config).run(), DedupException);
    EXPECT_TRUE(fs::exists(outputDir / UNIQUE_DIR_NAME / "img1.png"));
    EXPECT_FALSE(fs::exists(outputDir / UNIQUE_DIR_NAME / "img4.png"));
}

TEST_F(DedupRunnerTest, RerunReplacesPreviousResult) {
    writeBytes(outputDir / UNIQUE_DIR_NAME / "stale.png", "left over");
    writeScenario();
    DedupResult result = DedupRunner(config).run();

    EXPECT_FALSE(fs::exists(result.uniqueDir / "stale.png"));
    EXPECT_TRUE(fs::exists(result.uniqueDir / "img1.png"));
    EXPECT_TRUE(fs::exists(result.uniqueDir / "img3.png"));

    // No scratch directories are left beside the result
    std::vector<std::string> entries;
    for (const auto& entry : fs::directory_iterator(outputDir)) entries.push_back(entry.path().filename().string());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], UNIQUE_DIR_NAME);
}

TEST_F(DedupRunnerTest, RejectsBadDirectories) {
    config.inputDir = (tempDir / "missing").string();
    EXPECT_THROW(DedupRunner(config).run(), DedupException);

    config.inputDir = inputDir.string();
    config.outputDir = (inputDir / "out").string();
    EXPECT_THROW(DedupRunner(config).run(), DedupException);
}

TEST_F(DedupRunnerTest, EmptyInputProducesEmptyOutput) {
    DedupResult result = DedupRunner(config).run();
    EXPECT_TRUE(result.verdicts.empty());
    EXPECT_TRUE(fs::is_directory(result.uniqueDir));
    EXPECT_TRUE(fs::is_empty(result.uniqueDir));
}
