#ifndef INKWELL_CLI_PARSER_HPP
#define INKWELL_CLI_PARSER_HPP

#include <map>
#include <string>
#include <vector>

namespace inkwell {
    struct CliOption {
        std::string name;
        bool takesValue;
    };

    /**
     * @brief Command line parser bound to a fixed option table.
     *
     * Accepts "--name value", "--name=value" and bare "--flag". An option that takes a
     * value consumes the next argument as is, so negative numbers parse. Unknown names,
     * a missing value, a value given to a flag and positional arguments throw
     * InvalidParameterError. A repeated option keeps its last value.
     */
    class CliParser {
    public:
        explicit CliParser(std::vector<CliOption> options);

        void parse(int argc, char** argv);

        bool has(const std::string& name) const;
        std::string get(const std::string& name, const std::string& def = "") const;

    private:
        const CliOption* find(const std::string& name) const;

        std::vector<CliOption> options_;
        std::map<std::string, std::string> values_;
    };
}

#endif // INKWELL_CLI_PARSER_HPP
