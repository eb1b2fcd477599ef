#include <support/batch.hpp>
#include <support/errors.hpp>
#include <support/file_utils.hpp>
#include <pipeline/encoding.hpp>
#include <pipeline/pipeline.hpp>
#include <trantor/utils/Logger.h>
#include <algorithm>

namespace inkwell {

Json::Value BatchSummary::toJson() const {
    Json::Value root;
    root["processed"] = static_cast<Json::UInt64>(processed);
    root["failed"] = static_cast<Json::UInt64>(failed);
    root["files"] = Json::Value(Json::arrayValue);
    for (const auto& entry : entries) {
        Json::Value jEntry;
        jEntry["source"] = entry.source;
        jEntry["destination"] = entry.destination;
        jEntry["ok"] = entry.ok;
        if (!entry.ok) jEntry["error"] = entry.error;
        root["files"].append(jEntry);
    }
    return root;
}

BatchDriver::BatchDriver(BatchConfig config) : config_(std::move(config)) {}

bool BatchDriver::matchesExtension(const std::filesystem::path& path) const {
    const auto ext = pipeline::normalizedExtension(path);
    return std::find(config_.extensions.begin(), config_.extensions.end(), ext) != config_.extensions.end();
}

std::vector<std::filesystem::path> BatchDriver::collectInputs() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.input, ec)) {
        throw MissingSourceError(config_.input.string());
    }

    const auto outputDir = std::filesystem::weakly_canonical(config_.output, ec);

    std::vector<std::filesystem::path> inputs;
    for (auto it = std::filesystem::recursive_directory_iterator(config_.input);
         it != std::filesystem::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        if (entry.is_directory()) {
            // results written inside the input tree must not be picked up again
            if (!outputDir.empty() && std::filesystem::weakly_canonical(entry.path(), ec) == outputDir) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file() && matchesExtension(entry.path())) {
            inputs.push_back(entry.path());
        }
    }
    std::sort(inputs.begin(), inputs.end());
    return inputs;
}

std::filesystem::path BatchDriver::destinationFor(const std::filesystem::path& source) const {
    auto destination = config_.output / source.lexically_relative(config_.input);
    if (!config_.outputFormat.empty()) {
        destination.replace_extension("." + config_.outputFormat);
    }
    return destination;
}

BatchSummary BatchDriver::run() const {
    config_.params.validate();

    BatchSummary summary;
    const auto inputs = collectInputs();
    LOG_INFO << "Processing " << inputs.size() << " file(s) from " << config_.input.string()
             << " into " << config_.output.string() << " (" << config_.params.describe() << ")";

    for (const auto& source : inputs) {
        BatchEntry entry;
        entry.source = source.string();
        const auto destination = destinationFor(source);
        entry.destination = destination.string();
        try {
            pipeline::processImage(source, destination, config_.params);
            entry.ok = true;
            ++summary.processed;
        } catch (const std::exception& e) {
            if (!config_.continueOnError) throw;
            LOG_ERROR << "Skipping " << entry.source << ": " << e.what();
            entry.error = e.what();
            ++summary.failed;
        }
        summary.entries.push_back(std::move(entry));
    }

    LOG_INFO << "Done: " << summary.processed << " processed, " << summary.failed << " failed";
    return summary;
}

void writeReport(const BatchSummary& summary, const std::filesystem::path& path) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    files::ensureDirectory(path.parent_path());
    files::writeFileAtomically(path, Json::writeString(builder, summary.toJson()));
    LOG_INFO << "Wrote report " << path.string();
}

}
