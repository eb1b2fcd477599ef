#include <support/cli_parser.hpp>
#include <support/errors.hpp>
#include <algorithm>

namespace inkwell {

CliParser::CliParser(std::vector<CliOption> options) : options_(std::move(options)) {}

const CliOption* CliParser::find(const std::string& name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [&name](const CliOption& option) { return option.name == name; });
    return it == options_.end() ? nullptr : &*it;
}

void CliParser::parse(int argc, char** argv) {
    values_.clear();
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            throw InvalidParameterError("Unexpected argument '" + arg + "'");
        }

        std::string name = arg.substr(2);
        std::string value;
        bool inlineValue = false;
        if (const auto eq = name.find('='); eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.erase(eq);
            inlineValue = true;
        }

        const CliOption* option = find(name);
        if (option == nullptr) {
            throw InvalidParameterError("Unknown option --" + name);
        }
        if (!option->takesValue) {
            if (inlineValue) {
                throw InvalidParameterError("Option --" + name + " does not take a value");
            }
            values_[name] = "true";
            continue;
        }
        if (!inlineValue) {
            if (i + 1 >= argc || argv[i + 1] == nullptr) {
                throw InvalidParameterError("Option --" + name + " expects a value");
            }
            value = argv[++i];
        }
        values_[name] = value;
    }
}

bool CliParser::has(const std::string& name) const {
    return values_.count(name) != 0;
}

std::string CliParser::get(const std::string& name, const std::string& def) const {
    auto it = values_.find(name);
    return it == values_.end() ? def : it->second;
}

}
