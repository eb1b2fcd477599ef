#ifndef INKWELL_BATCH_HPP
#define INKWELL_BATCH_HPP

#include <support/config.hpp>
#include <json/json.h>
#include <filesystem>
#include <string>
#include <vector>

namespace inkwell {

struct BatchEntry {
    std::string source;
    std::string destination;
    bool ok = false;
    std::string error;
};

struct BatchSummary {
    size_t processed = 0;
    size_t failed = 0;
    std::vector<BatchEntry> entries;

    Json::Value toJson() const;
};

class BatchDriver {
public:
    explicit BatchDriver(BatchConfig config);

    // Matching files under the input directory, sorted, excluding the output directory.
    std::vector<std::filesystem::path> collectInputs() const;

    std::filesystem::path destinationFor(const std::filesystem::path& source) const;

    /**
     * @brief Runs the pipeline once per input file, sequentially.
     * @throws the first pipeline error when continueOnError is off.
     */
    BatchSummary run() const;

    const BatchConfig& config() const { return config_; }

private:
    bool matchesExtension(const std::filesystem::path& path) const;

    BatchConfig config_;
};

void writeReport(const BatchSummary& summary, const std::filesystem::path& path);

}

#endif // INKWELL_BATCH_HPP
