#include <pipeline/pipeline.hpp>
#include <support/batch.hpp>
#include <support/cli_parser.hpp>
#include <support/config.hpp>
#include <support/errors.hpp>
#include <trantor/utils/Logger.h>
#include <iostream>

static const char* kUsage =
    "Usage: inkwell [--config FILE] [--input DIR --output DIR | --in FILE --out FILE]\n"
    "               [--brightness F] [--contrast F] [--sharpness F]\n"
    "               [--fit WxH | --scale F] [--threshold N] [--dither | --no-dither]\n"
    "               [--format EXT] [--report FILE] [--stop-on-error] [--log-level LEVEL]\n";

int main(int argc, char** argv) {
    inkwell::CliParser cli(inkwell::cliOptions());
    try {
        cli.parse(argc, argv);
    } catch (const inkwell::Error& e) {
        std::cerr << e.what() << "\n" << kUsage;
        return 1;
    }
    if (cli.has("help")) {
        std::cout << kUsage;
        return 0;
    }

    inkwell::BatchConfig config;
    try {
        if (cli.has("config")) {
            config = inkwell::loadConfig(cli.get("config"));
        } else if (auto found = inkwell::findConfigFile()) {
            config = inkwell::loadConfig(*found);
        }
        inkwell::applyCliOverrides(cli, config);
        trantor::Logger::setLogLevel(inkwell::parseLogLevel(config.logLevel));
        config.params.validate();
    } catch (const inkwell::Error& e) {
        LOG_ERROR << e.what();
        std::cerr << kUsage;
        return 1;
    }

    if (cli.has("in") || cli.has("out")) {
        if (!cli.has("in") || !cli.has("out")) {
            std::cerr << kUsage;
            return 1;
        }
        try {
            inkwell::pipeline::processImage(cli.get("in"), cli.get("out"), config.params);
        } catch (const std::exception& e) {
            LOG_ERROR << e.what();
            return 2;
        }
        return 0;
    }

    try {
        inkwell::BatchDriver driver(config);
        const auto summary = driver.run();
        if (!config.report.empty()) {
            inkwell::writeReport(summary, config.report);
        }
        return summary.failed == 0 ? 0 : 2;
    } catch (const inkwell::MissingSourceError& e) {
        LOG_ERROR << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR << "Batch aborted: " << e.what();
        return 2;
    }
}
