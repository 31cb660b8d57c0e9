#include <gtest/gtest.h>

#include <fstream>
#include <map>
#include <string>

#include "ks_comparator.h"
#include "test_helpers.h"

namespace {

NormalizedKeyGroup groupOf(std::initializer_list<std::string> keys) {
    NormalizedKeyGroup group;
    for (const auto& key : keys) {
        group[key].insert(key);
    }
    return group;
}

}

class SystemComparatorTest : public ::testing::Test {
protected:
    SystemComparatorTest() : errorHandler_(fastErrorHandling(), logFile_) {}

    ComparisonResult compare(const std::map<std::string, std::string>& files, ProcessingConfig processing = {}) {
        SystemComparator comparator(normalizer_, errorHandler_, processing, logFile_);
        return comparator.compareAll(files);
    }

    TempDir dir_;
    std::ofstream logFile_;
    KeyNormalizer normalizer_;
    ErrorHandler errorHandler_;
};

TEST(ComparisonTest, AuthorityAgainstOneDependent) {
    std::map<std::string, NormalizedKeyGroup> systems;
    systems["A"] = groupOf({ "K1", "K2", "K3" });
    systems["B"] = groupOf({ "K1", "K2", "K4" });

    const auto result = computeComparison(systems);

    ASSERT_TRUE(result.hasAuthority);
    EXPECT_EQ(result.keysOnlyInA, (KeySet{ "K3" }));
    EXPECT_EQ(result.keysMissingInA, (KeySet{ "K4" }));
    EXPECT_EQ(result.keysInAllSystems, (KeySet{ "K1", "K2" }));
    EXPECT_EQ(result.allKeys, (KeySet{ "K1", "K2", "K3", "K4" }));
    EXPECT_EQ(result.systemGaps.at("B"), (KeySet{ "K3" }));
    EXPECT_DOUBLE_EQ(result.statistics.matchPercentage, 50.0);

    const auto summary = buildComparisonSummary(result);
    ASSERT_GE(summary.size(), 6u);
    EXPECT_EQ(summary[5].first, "Overall Match Rate");
    EXPECT_EQ(summary[5].second, "50.0%");
}

TEST(ComparisonTest, InvariantsHoldAcrossSystems) {
    std::map<std::string, NormalizedKeyGroup> systems;
    systems["A"] = groupOf({ "K1", "K2", "K3", "K5" });
    systems["B"] = groupOf({ "K1", "K4", "K5" });
    systems["C"] = groupOf({ "K1", "K5", "K6" });

    const auto result = computeComparison(systems);

    for (const auto& key : result.keysInAllSystems) {
        EXPECT_TRUE(result.allKeys.count(key));
    }
    for (const auto& key : result.keysOnlyInA) {
        EXPECT_FALSE(result.keysMissingInA.count(key));
    }
    EXPECT_GE(result.statistics.matchPercentage, 0.0);
    EXPECT_LE(result.statistics.matchPercentage, 100.0);
    EXPECT_EQ(result.keysInAllSystems, (KeySet{ "K1", "K5" }));
    EXPECT_EQ(result.keysOnlyInA, (KeySet{ "K2", "K3" }));
    EXPECT_EQ(result.keysMissingInA, (KeySet{ "K4", "K6" }));
}

TEST(ComparisonTest, MissingAuthorityLeavesComparisonEmpty) {
    std::map<std::string, NormalizedKeyGroup> systems;
    systems["B"] = groupOf({ "K1" });

    const auto result = computeComparison(systems);

    EXPECT_FALSE(result.hasAuthority);
    EXPECT_TRUE(result.allKeys.empty());
    EXPECT_TRUE(result.keysMissingInA.empty());
    EXPECT_EQ(result.statistics.systemCounts.at("B"), 1u);
}

TEST(ComparisonTest, SystemsOutsideAToEAreIgnored) {
    std::map<std::string, NormalizedKeyGroup> systems;
    systems["A"] = groupOf({ "K1" });
    systems["F"] = groupOf({ "K2" });

    const auto result = computeComparison(systems);

    ASSERT_TRUE(result.hasAuthority);
    EXPECT_TRUE(result.keysMissingInA.empty());
    EXPECT_EQ(result.keysInAllSystems, (KeySet{ "K1" }));
    EXPECT_EQ(result.allKeys, (KeySet{ "K1" }));
    EXPECT_EQ(result.systemGaps.count("F"), 0u);
    EXPECT_EQ(result.systemKeys.count("F"), 0u);
    EXPECT_DOUBLE_EQ(result.statistics.matchPercentage, 100.0);
}

TEST_F(SystemComparatorTest, EquivalentSpellingsFormOneDuplicateGroup) {
    const auto a = dir_.writeKeyFile("A.csv", { "KEY-001", "key-001", "KEY-002" });
    const auto b = dir_.writeKeyFile("B.csv", { "key 1", "KEY-002" });

    const auto result = compare({ { "A", a.string() }, { "B", b.string() } });

    ASSERT_EQ(result.duplicates.count("A"), 1u);
    const auto& groups = result.duplicates.at("A");
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups.at("KEY-000001").size(), 2u);
    EXPECT_EQ(result.statistics.duplicateGroups.at("A"), 1u);
    EXPECT_EQ(result.statistics.systemCounts.at("A"), 2u);
    EXPECT_EQ(result.keysInAllSystems, (KeySet{ "KEY-000001", "KEY-000002" }));
    EXPECT_EQ(result.statistics.totalKeysProcessed, 5u);
}

TEST_F(SystemComparatorTest, ResultDoesNotDependOnBatchSizeOrParallelism) {
    std::vector<std::string> aKeys;
    std::vector<std::string> bKeys;
    std::vector<std::string> cKeys;
    for (int i = 0; i < 200; ++i) {
        aKeys.push_back("cust-" + std::to_string(i));
        if (i % 3 != 0) bKeys.push_back("CUST " + std::to_string(i));
        if (i % 5 != 0) cKeys.push_back("cust_" + std::to_string(i + 50));
    }
    const std::map<std::string, std::string> files = {
        { "A", dir_.writeKeyFile("A.csv", aKeys).string() },
        { "B", dir_.writeKeyFile("B.csv", bKeys).string() },
        { "C", dir_.writeKeyFile("C.csv", cKeys).string() }
    };

    ProcessingConfig sequential;
    sequential.parallel = false;
    sequential.batchSize = 1000;

    ProcessingConfig parallelSmallBatches;
    parallelSmallBatches.parallel = true;
    parallelSmallBatches.maxWorkers = 3;
    parallelSmallBatches.batchSize = 7;

    const auto first = compare(files, sequential);
    const auto second = compare(files, parallelSmallBatches);

    EXPECT_EQ(first.systemKeys, second.systemKeys);
    EXPECT_EQ(first.allKeys, second.allKeys);
    EXPECT_EQ(first.keysInAllSystems, second.keysInAllSystems);
    EXPECT_EQ(first.keysOnlyInA, second.keysOnlyInA);
    EXPECT_EQ(first.keysMissingInA, second.keysMissingInA);
    EXPECT_EQ(first.systemGaps, second.systemGaps);
    EXPECT_DOUBLE_EQ(first.statistics.matchPercentage, second.statistics.matchPercentage);
}

TEST_F(SystemComparatorTest, MissingDependentFileParticipatesAsEmptySystem) {
    const auto a = dir_.writeKeyFile("A.csv", { "K1", "K2" });

    const auto result = compare({ { "A", a.string() }, { "B", (dir_.path() / "B.csv").string() } });

    ASSERT_TRUE(result.hasAuthority);
    EXPECT_EQ(result.systemKeys.count("B"), 1u);
    EXPECT_TRUE(result.keysInAllSystems.empty());
    EXPECT_EQ(result.systemGaps.at("B"), (KeySet{ "K1", "K2" }));
    ASSERT_EQ(result.processingErrors.size(), 1u);
    EXPECT_EQ(result.processingErrors[0].type, "missing_file");
    EXPECT_EQ(errorHandler_.errorCount(), 1u);
}

TEST_F(SystemComparatorTest, MissingAuthorityFileReportsNoAuthority) {
    const auto b = dir_.writeKeyFile("B.csv", { "K1" });

    const auto result = compare({ { "B", b.string() } });

    EXPECT_FALSE(result.hasAuthority);
}

TEST_F(SystemComparatorTest, SkippedAuthorityFileReportsNoAuthority) {
    const auto b = dir_.writeKeyFile("B.csv", { "K1" });

    const auto result = compare({ { "A", (dir_.path() / "A.csv").string() }, { "B", b.string() } });

    EXPECT_FALSE(result.hasAuthority);
    EXPECT_EQ(result.systemKeys.count("A"), 0u);
}

TEST_F(SystemComparatorTest, MissingDependentWithoutPartialProcessingFails) {
    ErrorHandlingConfig config = fastErrorHandling();
    config.enablePartialProcessing = false;
    ErrorHandler strictHandler(config, logFile_);
    SystemComparator comparator(normalizer_, strictHandler, ProcessingConfig{}, logFile_);

    const auto a = dir_.writeKeyFile("A.csv", { "K1" });

    EXPECT_THROW(comparator.compareAll({ { "A", a.string() }, { "B", (dir_.path() / "B.csv").string() } }),
                 SystemUnavailableError);
}

TEST_F(SystemComparatorTest, FailPolicyAbortsComparison) {
    ErrorHandlingConfig config = fastErrorHandling();
    config.onMissingFile = MissingFilePolicy::Fail;
    ErrorHandler strictHandler(config, logFile_);
    SystemComparator comparator(normalizer_, strictHandler, ProcessingConfig{}, logFile_);

    const auto a = dir_.writeKeyFile("A.csv", { "K1" });

    EXPECT_THROW(comparator.compareAll({ { "A", a.string() }, { "B", (dir_.path() / "B.csv").string() } }),
                 SystemUnavailableError);
}

TEST_F(SystemComparatorTest, UnknownSystemFileIsNotLoaded) {
    const auto a = dir_.writeKeyFile("A.csv", { "K1" });
    const auto b = dir_.writeKeyFile("B.csv", { "K1" });
    const auto f = dir_.writeKeyFile("F.csv", { "K2" });

    const auto result = compare({ { "A", a.string() }, { "B", b.string() }, { "F", f.string() } });

    EXPECT_EQ(result.systemKeys.count("F"), 0u);
    EXPECT_TRUE(result.keysMissingInA.empty());
    EXPECT_EQ(result.statistics.totalKeysProcessed, 2u);
    EXPECT_DOUBLE_EQ(result.statistics.matchPercentage, 100.0);
}

TEST_F(SystemComparatorTest, KeyWithNothingLeftAfterNormalizationIsCorrupt) {
    const auto a = dir_.writeKeyFile("A.csv", { "K1" });
    const auto b = dir_.writeKeyFile("B.csv", { "K1", "###" });

    const auto result = compare({ { "A", a.string() }, { "B", b.string() } });

    EXPECT_EQ(result.systemKeys.at("B").count(""), 0u);
    EXPECT_TRUE(result.keysMissingInA.empty());
    EXPECT_EQ(result.allKeys, (KeySet{ "K1" }));
    ASSERT_EQ(result.processingErrors.size(), 1u);
    EXPECT_EQ(result.processingErrors[0].type, "corrupt_data");
    EXPECT_EQ(result.processingErrors[0].system, "B");
    EXPECT_EQ(result.processingErrors[0].row, 3);
}

TEST_F(SystemComparatorTest, ErrorCeilingStopsComparison) {
    ErrorHandlingConfig config = fastErrorHandling();
    config.maxErrorsBeforeFail = 2;
    ErrorHandler limitedHandler(config, logFile_);
    SystemComparator comparator(normalizer_, limitedHandler, ProcessingConfig{}, logFile_);

    const auto a = dir_.writeFile("A.csv", "key,status\nK1\nK2\nK3,active\n");

    EXPECT_THROW(comparator.compareAll({ { "A", a.string() } }), DataValidationError);
}
