#ifndef INKWELL_CONFIG_HPP
#define INKWELL_CONFIG_HPP

#include <pipeline/params.hpp>
#include <support/cli_parser.hpp>
#include <trantor/utils/Logger.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace inkwell {
    struct BatchConfig {
        std::filesystem::path input = "./res";
        std::filesystem::path output = "./res/output";
        std::vector<std::string> extensions{"png", "jpg", "jpeg", "webp"};
        // replaces the destination extension when set, e.g. "png"
        std::string outputFormat;
        bool continueOnError = true;
        std::string logLevel = "info";
        std::filesystem::path report;
        pipeline::EnhancementParams params;
    };

    /**
     * @brief Parses a YAML configuration document on top of the defaults.
     * @throws InvalidParameterError on malformed YAML or a value of the wrong type.
     */
    BatchConfig parseConfig(const std::string& yamlText);

    BatchConfig loadConfig(const std::filesystem::path& path);

    // Looks for inkwell.yaml in the working directory, then in its parent.
    std::optional<std::filesystem::path> findConfigFile();

    /**
     * @brief Maps "trace", "debug", "info", "warn" or "error" to a trantor log level.
     * @throws InvalidParameterError for any other name.
     */
    trantor::Logger::LogLevel parseLogLevel(const std::string& name);

    // "1920x1080" -> FitWithin{1920, 1080}
    pipeline::FitWithin parseBox(const std::string& text);

    // Options understood by the inkwell command line.
    const std::vector<CliOption>& cliOptions();

    /**
     * @brief Applies command line values on top of a loaded configuration.
     * @throws InvalidParameterError for malformed numbers, conflicting options, or
     * dithering options without a binarization to apply them to.
     */
    void applyCliOverrides(const CliParser& cli, BatchConfig& config);
}

#endif // INKWELL_CONFIG_HPP
