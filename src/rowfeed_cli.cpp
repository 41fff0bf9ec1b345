#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "common/batch.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/stacktrace.hpp"
#include "config/source_config.hpp"
#include "source/batch_producer.hpp"
#include "source/path_classifier.hpp"
#include "storage/filesystem.hpp"
#include "storage/snapshot.hpp"

using namespace rowfeed;

namespace {

void printUsage(std::ostream& os) {
    os << "usage:\n"
       << "  rowfeed produce <config.json> [--offset N] [--batch-size N] [--log-level L]\n"
       << "  rowfeed classify <path>\n"
       << "  rowfeed save <config.json> <out_dir>\n";
}

std::optional<RowCount> parseCount(const std::string& text) {
    RowCount value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::unique_ptr<SourceAdapter> openSource(const std::string& configPath, SourceConfig& config) {
    config = SourceConfig::fromFile(configPath);
    auto adapter = makeSourceAdapter(config);
    adapter->open();
    return adapter;
}

int runProduce(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage(std::cerr);
        return 2;
    }
    std::string configPath;
    RowCount offset = 0;
    std::optional<RowCount> batchSize;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--offset" || arg == "--batch-size" || arg == "--log-level") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return 2;
            }
            const auto& value = args[++i];
            if (arg == "--log-level") {
                if (!setLogLevel(value)) {
                    std::cerr << "Error: unknown log level '" << value << "'" << std::endl;
                    return 2;
                }
                continue;
            }
            auto count = parseCount(value);
            if (!count) {
                std::cerr << "Error: " << arg << " expects an integer, got '" << value << "'" << std::endl;
                return 2;
            }
            if (arg == "--offset")
                offset = *count;
            else
                batchSize = *count;
        } else if (configPath.empty()) {
            configPath = arg;
        } else {
            std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
            return 2;
        }
    }
    if (configPath.empty()) {
        printUsage(std::cerr);
        return 2;
    }

    SourceConfig config;
    auto adapter = openSource(configPath, config);
    BatchProducer producer(*adapter);
    auto stream = producer.produce(offset, batchSize.value_or(config.batchSize));
    while (auto batch = stream.next()) {
        Value line;
        line["rows"] = std::move(batch->rows);
        line["is_last"] = batch->isLast;
        std::cout << toJsonText(line) << '\n';
    }
    std::cout.flush();
    Logger::info("Produced {} rows from {}", stream.delivered(), adapter->describe());
    return 0;
}

int runClassify(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printUsage(std::cerr);
        return 2;
    }
    const auto& path = args[0];
    PathClassifier classifier(FileSystemRegistry::instance().resolve(path));
    auto classification = classifier.classify(path);

    Value out;
    out["single_file"] = classification.singleFile ? Value(*classification.singleFile) : Value(nullptr);
    out["sequence"] = classification.sequence;
    out["grouped"] = Value::object();
    for (const auto& [group, files] : classification.grouped) {
        out["grouped"][group] = files;
    }
    out["filetype"] = classification.filetype;
    std::cout << toJsonText(out, 2) << std::endl;
    return 0;
}

int runSave(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        printUsage(std::cerr);
        return 2;
    }
    SourceConfig config;
    auto adapter = openSource(args[0], config);

    ColumnarBatch data(adapter->columns());
    BatchProducer producer(*adapter);
    auto stream = producer.produce(0, config.batchSize);
    while (auto batch = stream.next()) {
        data.append(toColumnar(batch->rows, adapter->columns()));
    }
    Logger::debug("Collected rows:\n{}", data.toPrettyString());

    SnapshotWriter writer(args[1]);
    writer.saveDataset(data);
    Logger::info("Saved {} rows from {} to {}", data.getRowCount(), adapter->describe(), args[1]);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    rowfeed::initializeSignalHandlers();
    if (argc < 2) {
        printUsage(std::cerr);
        return 2;
    }
    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "produce") {
            return runProduce(args);
        } else if (command == "classify") {
            return runClassify(args);
        } else if (command == "save") {
            return runSave(args);
        } else if (command == "-h" || command == "--help" || command == "help") {
            printUsage(std::cout);
            return 0;
        }
        std::cerr << "Error: unknown command '" << command << "'" << std::endl;
        printUsage(std::cerr);
        return 2;
    } catch (const SourceException& e) {
        Logger::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::critical("Unexpected error: {}", e.what());
        return 1;
    }
}
