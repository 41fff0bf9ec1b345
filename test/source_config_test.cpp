#include <gtest/gtest.h>
#include <cstdlib>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "config/source_config.hpp"
#include "source/filesystem_source.hpp"
#include "source/hub_source.hpp"
#include "source/snapshot_source.hpp"
#include "test_helpers.hpp"

using namespace rowfeed;
using namespace rowfeed::test;

TEST(SourceConfigTest, ParsesFilesystemConfig) {
    auto config = SourceConfig::from_json(Value::parse(R"({
        "kind": "filesystem",
        "data_files": "mem://data",
        "filetype": "csv",
        "split": "test",
        "streaming": true,
        "num_examples": 20,
        "batch_size": 8,
        "storage_options": {"region": "eu"}
    })"));

    EXPECT_EQ(config.getKind(), SourceKind::FILESYSTEM);
    const auto& files = std::get<FilesystemDescriptor>(config.descriptor);
    EXPECT_EQ(files.dataFiles, "mem://data");
    EXPECT_EQ(files.filetype, std::optional<std::string>("csv"));
    EXPECT_EQ(files.split, "test");
    EXPECT_TRUE(config.options.streaming);
    EXPECT_EQ(config.options.rowLimit, std::optional<RowCount>(20));
    EXPECT_EQ(config.batchSize, 8);
    EXPECT_EQ(config.options.storageOptions.at("region"), "eu");
}

TEST(SourceConfigTest, AppliesDefaults) {
    auto config = SourceConfig::from_json(Value::parse(R"({"kind": "hub", "repo_id": "org/data"})"));

    const auto& hub = std::get<HubDescriptor>(config.descriptor);
    EXPECT_EQ(hub.repoId, "org/data");
    EXPECT_FALSE(hub.config.has_value());
    EXPECT_EQ(hub.split, "train");
    EXPECT_FALSE(config.options.streaming);
    EXPECT_FALSE(config.options.rowLimit.has_value());
    EXPECT_EQ(config.batchSize, 50);
    EXPECT_FALSE(config.hubMirror.has_value());
}

TEST(SourceConfigTest, ParsesSnapshotConfig) {
    auto config = SourceConfig::from_json(Value::parse(R"({
        "kind": "snapshot", "dataset_path": "/tmp/ds", "config": "default",
        "is_distiset": true, "keep_in_memory": false
    })"));

    const auto& snapshot = std::get<SnapshotDescriptor>(config.descriptor);
    EXPECT_EQ(snapshot.datasetPath, "/tmp/ds");
    EXPECT_EQ(snapshot.config, std::optional<std::string>("default"));
    EXPECT_FALSE(snapshot.split.has_value());
    EXPECT_TRUE(snapshot.isDistiset);
    EXPECT_EQ(snapshot.keepInMemory, std::optional<bool>(false));
}

TEST(SourceConfigTest, RejectsInvalidValuesNamingTheKey) {
    auto keyOf = [](const std::string& text) -> std::string {
        try {
            SourceConfig::from_json(Value::parse(text));
        } catch (const InvalidConfiguration& e) {
            return e.getKey();
        }
        return "<accepted>";
    };

    EXPECT_EQ(keyOf(R"({"repo_id": "x"})"), "kind");
    EXPECT_EQ(keyOf(R"({"kind": "ftp"})"), "kind");
    EXPECT_EQ(keyOf(R"({"kind": "hub"})"), "repo_id");
    EXPECT_EQ(keyOf(R"({"kind": "hub", "repo_id": ""})"), "repo_id");
    EXPECT_EQ(keyOf(R"({"kind": "filesystem", "data_files": 3})"), "data_files");
    EXPECT_EQ(keyOf(R"({"kind": "snapshot"})"), "dataset_path");
    EXPECT_EQ(keyOf(R"({"kind": "hub", "repo_id": "x", "batch_size": 0})"), "batch_size");
    EXPECT_EQ(keyOf(R"({"kind": "hub", "repo_id": "x", "batch_size": 2.5})"), "batch_size");
    EXPECT_EQ(keyOf(R"({"kind": "hub", "repo_id": "x", "num_examples": -1})"), "num_examples");
    EXPECT_EQ(keyOf(R"({"kind": "hub", "repo_id": "x", "streaming": "yes"})"), "streaming");
    EXPECT_EQ(keyOf(R"({"kind": "hub", "repo_id": "x", "storage_options": []})"), "storage_options");
    EXPECT_EQ(keyOf(R"([1, 2])"), "<root>");
    EXPECT_EQ(keyOf(R"({"kind": "hub", "repo_id": "x", "num_examples": 0})"), "<accepted>");
}

TEST(SourceConfigTest, ToJsonRoundTrips) {
    SourceConfig config;
    SnapshotDescriptor snapshot;
    snapshot.datasetPath = "/data/snap";
    snapshot.split = "train";
    snapshot.keepInMemory = true;
    config.descriptor = snapshot;
    config.options.rowLimit = 12;
    config.batchSize = 4;

    auto json = config.to_json();
    EXPECT_EQ(json.at("kind"), "snapshot");
    EXPECT_EQ(json.at("num_examples"), 12);

    auto parsed = SourceConfig::from_json(json);
    const auto& parsedSnapshot = std::get<SnapshotDescriptor>(parsed.descriptor);
    EXPECT_EQ(parsedSnapshot.datasetPath, "/data/snap");
    EXPECT_EQ(parsedSnapshot.split, std::optional<std::string>("train"));
    EXPECT_EQ(parsedSnapshot.keepInMemory, std::optional<bool>(true));
    EXPECT_EQ(parsed.options.rowLimit, std::optional<RowCount>(12));
    EXPECT_EQ(parsed.batchSize, 4);
}

TEST(SourceConfigTest, ParseSourceConfigReportsErrors) {
    auto ok = parseSourceConfig(R"({"kind": "filesystem", "data_files": "/tmp/x.csv"})");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->getKind(), SourceKind::FILESYSTEM);

    auto malformed = parseSourceConfig("{\"kind\": ");
    ASSERT_FALSE(malformed.has_value());
    EXPECT_NE(malformed.error().find("malformed JSON"), std::string::npos);

    auto invalid = parseSourceConfig(R"({"kind": "hub"})");
    ASSERT_FALSE(invalid.has_value());
    EXPECT_NE(invalid.error().find("repo_id"), std::string::npos);
}

TEST(SourceConfigTest, FromFile) {
    TempDir dir("source_config_test");
    auto path = dir.writeFile("config.json", R"({"kind": "filesystem", "data_files": "/tmp/x.csv"})");
    EXPECT_EQ(SourceConfig::fromFile(path.string()).getKind(), SourceKind::FILESYSTEM);

    auto broken = dir.writeFile("broken.json", "{");
    EXPECT_THROW(SourceConfig::fromFile(broken.string()), InvalidConfiguration);
    EXPECT_THROW(SourceConfig::fromFile((dir.path() / "missing.json").string()), SourceUnavailable);
}

TEST(SourceConfigTest, SourceKindNames) {
    EXPECT_EQ(sourceKindToString(SourceKind::HUB), "hub");
    EXPECT_EQ(sourceKindFromString("disk"), SourceKind::SNAPSHOT);
    EXPECT_FALSE(sourceKindFromString("ftp").has_value());
}

TEST(MakeSourceAdapterTest, BuildsAdapterForEachKind) {
    ScopedMemoryScheme scheme("mem");
    scheme.fs().addFile("mem://data/data.jsonl", data_helpers::sequenceJsonLines(3));

    auto files = makeSourceAdapter(
        SourceConfig::from_json(Value::parse(R"({"kind": "filesystem", "data_files": "mem://data/data.jsonl"})")));
    ASSERT_NE(dynamic_cast<FilesystemSource*>(files.get()), nullptr);
    EXPECT_FALSE(files->isOpen());
    files->open();
    EXPECT_EQ(files->rowCount(), 3);

    auto snapshot = makeSourceAdapter(
        SourceConfig::from_json(Value::parse(R"({"kind": "snapshot", "dataset_path": "/nonexistent"})")));
    EXPECT_NE(dynamic_cast<SnapshotSource*>(snapshot.get()), nullptr);
}

TEST(MakeSourceAdapterTest, HubUsesProvidedServices) {
    DatasetInfo info;
    info.features = {"id", "text"};
    info.splits = {{"train", 2}};
    auto infoService = std::make_shared<FakeInfoService>(DatasetInfos{{defaultConfigName, info}});
    auto repository = std::make_shared<FakeRepository>();
    repository->addSplit("train", data_helpers::sequenceBatch(2));

    auto config = SourceConfig::from_json(Value::parse(R"({"kind": "hub", "repo_id": "org/data"})"));
    auto adapter = makeSourceAdapter(config, SourceServices{infoService, repository});
    ASSERT_NE(dynamic_cast<HubSource*>(adapter.get()), nullptr);
    adapter->open();
    EXPECT_EQ(adapter->rowCount(), 2);
}

TEST(MakeSourceAdapterTest, HubMirrorFromConfig) {
    TempDir dir("make_source_adapter_test");
    dir.writeFile("org/data/dataset_infos.json",
                  R"({"default": {"features": ["id", "text"], "splits": {"train": 2}}})");
    dir.writeFile("org/data/default/train/0.jsonl", data_helpers::sequenceJsonLines(2));

    auto config = SourceConfig::from_json(Value::parse(R"({"kind": "hub", "repo_id": "org/data"})"));
    config.hubMirror = dir.str();
    auto adapter = makeSourceAdapter(config);
    adapter->open();
    EXPECT_EQ(adapter->readColumnar(0, 5), data_helpers::sequenceBatch(2));
}

TEST(MakeSourceAdapterTest, HubWithoutServicesIsInvalidConfiguration) {
    ::unsetenv("ROWFEED_HUB_MIRROR");
    auto config = SourceConfig::from_json(Value::parse(R"({"kind": "hub", "repo_id": "org/data"})"));
    try {
        makeSourceAdapter(config);
        FAIL() << "Expected InvalidConfiguration";
    } catch (const InvalidConfiguration& e) {
        EXPECT_EQ(e.getKey(), "hub_mirror");
    }
}

TEST(LoggingTest, SetLogLevel) {
    EXPECT_TRUE(setLogLevel("debug"));
    EXPECT_EQ(getLogger().level(), spdlog::level::debug);
    EXPECT_FALSE(setLogLevel("loud"));
    EXPECT_TRUE(setLogLevel("info"));
    EXPECT_EQ(getLogger().level(), spdlog::level::info);
}
