#include <gtest/gtest.h>
#include <memory>
#include "common/errors.hpp"
#include "source/path_classifier.hpp"
#include "test_helpers.hpp"

using namespace rowfeed;
using namespace rowfeed::test;

using Grouped = std::map<std::string, std::vector<std::string>>;

class PathClassifierTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryFileSystem> fs_ = std::make_shared<MemoryFileSystem>();
    PathClassifier classifier_{fs_};
};

TEST_F(PathClassifierTest, SingleFile) {
    fs_->addFile("mem://data/data.jsonl", "{}\n");

    auto result = classifier_.classify("mem://data/data.jsonl");
    EXPECT_EQ(result.singleFile, std::optional<std::string>("mem://data/data.jsonl"));
    EXPECT_TRUE(result.sequence.empty());
    EXPECT_TRUE(result.grouped.empty());
    EXPECT_EQ(result.filetype, "json");
    EXPECT_EQ(std::get<std::string>(result.dataFiles()), "mem://data/data.jsonl");
}

TEST_F(PathClassifierTest, FlatDirectoryIsSortedSequence) {
    fs_->addFile("mem://data/b.csv", "x\n");
    fs_->addFile("mem://data/a.csv", "x\n");
    fs_->addFile("mem://data/.hidden", "x\n");

    auto result = classifier_.classify("mem://data");
    EXPECT_FALSE(result.singleFile.has_value());
    EXPECT_EQ(result.sequence, (std::vector<std::string>{"mem://data/a.csv", "mem://data/b.csv"}));
    EXPECT_TRUE(result.grouped.empty());
    EXPECT_EQ(result.filetype, "csv");
}

TEST_F(PathClassifierTest, SubdirectoriesAreGrouped) {
    fs_->addFile("mem://data/train/1.jsonl", "{}\n");
    fs_->addFile("mem://data/train/0.jsonl", "{}\n");
    fs_->addFile("mem://data/test/0.jsonl", "{}\n");
    fs_->addFile("mem://data/test/deeper/ignored.jsonl", "{}\n");

    auto result = classifier_.classify("mem://data");
    EXPECT_TRUE(result.sequence.empty());
    Grouped expected{{"mem://data/test", {"mem://data/test/0.jsonl"}},
                     {"mem://data/train", {"mem://data/train/0.jsonl", "mem://data/train/1.jsonl"}}};
    EXPECT_EQ(result.grouped, expected);
    EXPECT_EQ(result.filetype, "json");
    EXPECT_TRUE(std::holds_alternative<Grouped>(result.dataFiles()));
}

TEST_F(PathClassifierTest, MixedDirectoryKeepsFilesOutOfGroups) {
    fs_->addFile("mem://data/top.txt", "x\n");
    fs_->addFile("mem://data/sub/inner.txt", "x\n");

    auto result = classifier_.classify("mem://data");
    EXPECT_EQ(result.sequence, (std::vector<std::string>{"mem://data/top.txt"}));
    EXPECT_EQ(result.grouped, (Grouped{{"mem://data/sub", {"mem://data/sub/inner.txt"}}}));
    EXPECT_EQ(result.filetype, "txt");
    // a non-empty sequence takes precedence
    EXPECT_TRUE(std::holds_alternative<std::vector<std::string>>(result.dataFiles()));
}

TEST_F(PathClassifierTest, DirectoryWithoutFilesIsUnresolvable) {
    fs_->addFile("mem://data/sub/nested/deep.csv", "x\n");
    try {
        classifier_.classify("mem://data");
        FAIL() << "Expected UnresolvableFiletype";
    } catch (const UnresolvableFiletype& e) {
        EXPECT_EQ(e.getPath(), "mem://data");
    }
}

TEST_F(PathClassifierTest, MissingPathIsUnavailable) {
    EXPECT_THROW(classifier_.classify("mem://nowhere"), SourceUnavailable);
}

TEST_F(PathClassifierTest, FileWithoutExtensionHasEmptyFiletype) {
    fs_->addFile("mem://data/README", "x\n");
    EXPECT_EQ(classifier_.classify("mem://data/README").filetype, "");
}

TEST_F(PathClassifierTest, LocalDirectory) {
    TempDir dir("path_classifier_test");
    dir.writeFile("train/part-0.csv", "a\n1\n");
    dir.writeFile("validation/part-0.csv", "a\n2\n");

    PathClassifier local(std::make_shared<LocalFileSystem>());
    auto result = local.classify(dir.str());
    ASSERT_EQ(result.grouped.size(), 2u);
    EXPECT_EQ(result.grouped.begin()->first, (dir.path() / "train").string());
    EXPECT_EQ(result.filetype, "csv");
}

TEST(SelectSplitFilesTest, GroupedMatchesFullKeyOrLastComponent) {
    DataFiles files = Grouped{{"mem://data/train", {"t0", "t1"}}, {"mem://data/test", {"e0"}}};

    EXPECT_EQ(selectSplitFiles(files, "train"), (std::vector<std::string>{"t0", "t1"}));
    EXPECT_EQ(selectSplitFiles(files, "mem://data/test"), (std::vector<std::string>{"e0"}));
    EXPECT_THROW(selectSplitFiles(files, "validation"), SourceUnavailable);
}

TEST(SelectSplitFilesTest, UngroupedFilesOnlyFormTrain) {
    DataFiles single = std::string("a.csv");
    DataFiles sequence = std::vector<std::string>{"a.csv", "b.csv"};

    EXPECT_EQ(selectSplitFiles(single, "train"), (std::vector<std::string>{"a.csv"}));
    EXPECT_EQ(selectSplitFiles(sequence, "train"), (std::vector<std::string>{"a.csv", "b.csv"}));
    EXPECT_THROW(selectSplitFiles(sequence, "test"), SourceUnavailable);
}
