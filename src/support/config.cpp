#include <support/config.hpp>
#include <support/errors.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace inkwell {

template <typename T>
static T readValue(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw InvalidParameterError("Invalid value for '" + key + "': " + e.what());
    }
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string stripDot(std::string ext) {
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    return lower(ext);
}

static void readPipeline(const YAML::Node& node, pipeline::EnhancementParams& params) {
    if (node["brightness"]) params.brightness = readValue<double>(node["brightness"], "pipeline.brightness");
    if (node["contrast"]) params.contrast = readValue<double>(node["contrast"], "pipeline.contrast");
    if (node["sharpness"]) params.sharpness = readValue<double>(node["sharpness"], "pipeline.sharpness");

    if (node["fit"] && node["scale"]) {
        throw InvalidParameterError("pipeline.fit and pipeline.scale are mutually exclusive");
    }
    if (const auto fit = node["fit"]) {
        if (fit.IsScalar()) {
            params.resize = parseBox(readValue<std::string>(fit, "pipeline.fit"));
        } else {
            auto box = readValue<std::vector<int>>(fit, "pipeline.fit");
            if (box.size() != 2) {
                throw InvalidParameterError("pipeline.fit expects [width, height]");
            }
            params.resize = pipeline::FitWithin{box[0], box[1]};
        }
    }
    if (const auto scale = node["scale"]) {
        params.resize = pipeline::ScaleBy{readValue<double>(scale, "pipeline.scale")};
    }

    if (const auto binarize = node["binarize"]) {
        if (binarize.IsScalar() && !readValue<bool>(binarize, "pipeline.binarize")) {
            params.binarize.reset();
        } else {
            pipeline::Binarization b;
            if (binarize.IsMap()) {
                if (binarize["threshold"]) b.threshold = readValue<int>(binarize["threshold"], "pipeline.binarize.threshold");
                if (binarize["dither"]) b.dither = readValue<bool>(binarize["dither"], "pipeline.binarize.dither");
            }
            params.binarize = b;
        }
    }
}

BatchConfig parseConfig(const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const YAML::Exception& e) {
        throw InvalidParameterError(std::string("Malformed configuration: ") + e.what());
    }

    BatchConfig config;
    if (root.IsNull()) return config;
    if (!root.IsMap()) {
        throw InvalidParameterError("Configuration root must be a mapping");
    }

    if (root["input"]) config.input = readValue<std::string>(root["input"], "input");
    if (root["output"]) config.output = readValue<std::string>(root["output"], "output");
    if (root["extensions"]) {
        config.extensions.clear();
        for (const auto& ext : readValue<std::vector<std::string>>(root["extensions"], "extensions")) {
            config.extensions.push_back(stripDot(ext));
        }
    }
    if (root["output_format"]) config.outputFormat = stripDot(readValue<std::string>(root["output_format"], "output_format"));
    if (root["continue_on_error"]) config.continueOnError = readValue<bool>(root["continue_on_error"], "continue_on_error");
    if (root["log_level"]) config.logLevel = lower(readValue<std::string>(root["log_level"], "log_level"));
    if (root["report"]) config.report = readValue<std::string>(root["report"], "report");
    if (const auto pipelineNode = root["pipeline"]) {
        if (!pipelineNode.IsMap()) {
            throw InvalidParameterError("'pipeline' must be a mapping");
        }
        readPipeline(pipelineNode, config.params);
    }
    return config;
}

BatchConfig loadConfig(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw InvalidParameterError("Cannot open configuration file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return parseConfig(buffer.str());
}

std::optional<std::filesystem::path> findConfigFile() {
    for (const char* candidate : {"inkwell.yaml", "../inkwell.yaml"}) {
        if (std::filesystem::exists(candidate)) {
            return std::filesystem::path(candidate);
        }
    }
    return std::nullopt;
}

trantor::Logger::LogLevel parseLogLevel(const std::string& name) {
    const auto level = lower(name);
    if (level == "trace") return trantor::Logger::kTrace;
    if (level == "debug") return trantor::Logger::kDebug;
    if (level == "info") return trantor::Logger::kInfo;
    if (level == "warn") return trantor::Logger::kWarn;
    if (level == "error") return trantor::Logger::kError;
    throw InvalidParameterError("Unknown log level: " + name);
}

pipeline::FitWithin parseBox(const std::string& text) {
    const auto sep = lower(text).find('x');
    if (sep == std::string::npos) {
        throw InvalidParameterError("Expected WIDTHxHEIGHT, got '" + text + "'");
    }
    try {
        size_t used = 0;
        const int width = std::stoi(text.substr(0, sep), &used);
        if (used != sep) throw std::invalid_argument(text);
        const std::string rest = text.substr(sep + 1);
        const int height = std::stoi(rest, &used);
        if (used != rest.size()) throw std::invalid_argument(text);
        return pipeline::FitWithin{width, height};
    } catch (const std::logic_error&) {
        throw InvalidParameterError("Expected WIDTHxHEIGHT, got '" + text + "'");
    }
}

const std::vector<CliOption>& cliOptions() {
    static const std::vector<CliOption> options = {
        {"help", false},      {"config", true},        {"input", true},
        {"output", true},     {"in", true},            {"out", true},
        {"format", true},     {"report", true},        {"stop-on-error", false},
        {"log-level", true},  {"brightness", true},    {"contrast", true},
        {"sharpness", true},  {"fit", true},           {"scale", true},
        {"threshold", true},  {"dither", false},       {"no-dither", false},
    };
    return options;
}

static double parseNumber(const CliParser& cli, const std::string& key) {
    const auto text = cli.get(key);
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return value;
    } catch (const std::logic_error&) {
        throw InvalidParameterError("--" + key + " expects a number, got '" + text + "'");
    }
}

void applyCliOverrides(const CliParser& cli, BatchConfig& config) {
    using namespace pipeline;

    if (cli.has("input")) config.input = cli.get("input");
    if (cli.has("output")) config.output = cli.get("output");
    if (cli.has("format")) config.outputFormat = stripDot(cli.get("format"));
    if (cli.has("report")) config.report = cli.get("report");
    if (cli.has("stop-on-error")) config.continueOnError = false;
    if (cli.has("log-level")) config.logLevel = cli.get("log-level");

    auto& params = config.params;
    if (cli.has("brightness")) params.brightness = parseNumber(cli, "brightness");
    if (cli.has("contrast")) params.contrast = parseNumber(cli, "contrast");
    if (cli.has("sharpness")) params.sharpness = parseNumber(cli, "sharpness");
    if (cli.has("fit") && cli.has("scale")) {
        throw InvalidParameterError("--fit and --scale are mutually exclusive");
    }
    if (cli.has("fit")) params.resize = parseBox(cli.get("fit"));
    if (cli.has("scale")) params.resize = ScaleBy{parseNumber(cli, "scale")};

    if (cli.has("threshold")) {
        Binarization binarize = params.binarize.value_or(Binarization{});
        const double threshold = parseNumber(cli, "threshold");
        if (threshold < 0 || threshold > 255 || threshold != std::floor(threshold)) {
            throw InvalidParameterError("--threshold expects an integer in 0..255");
        }
        binarize.threshold = static_cast<int>(threshold);
        params.binarize = binarize;
    }
    if (cli.has("dither") && cli.has("no-dither")) {
        throw InvalidParameterError("--dither and --no-dither are mutually exclusive");
    }
    if (cli.has("dither") || cli.has("no-dither")) {
        if (!params.binarize) {
            throw InvalidParameterError("--dither/--no-dither need --threshold or a binarize section");
        }
        params.binarize->dither = cli.has("dither");
    }
}

}
