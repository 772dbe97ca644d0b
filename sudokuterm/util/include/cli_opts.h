#ifndef SUDOKUTERM_CLI_OPTS_H
#define SUDOKUTERM_CLI_OPTS_H

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * Simple command line option parser based on std::find. Options start with "--". Options listed as value options
 * consume the following argument; everything else that does not start with "--" is a positional value.
 */
class CliOptionsParser
{
    std::vector<std::string> args;
    std::vector<std::string> valueOptions;

    [[nodiscard]] auto takesValue(const std::string& option) const -> bool
    {
        return std::find(valueOptions.begin(), valueOptions.end(), option) != valueOptions.end();
    }

  public:
    explicit CliOptionsParser(int argc, char** argv, std::vector<std::string> valueOptions = {})
      : valueOptions(std::move(valueOptions))
    {
        for (int i = 1; i < argc; ++i) {
            this->args.emplace_back(argv[i]);
        }
    }

    explicit CliOptionsParser(std::vector<std::string> args, std::vector<std::string> valueOptions = {})
      : args(std::move(args))
      , valueOptions(std::move(valueOptions))
    {}

    /**
     * Returns the string value following the given option. If the option is not present an empty string is returned.
     * If the same option is specified multiple times, the first value is returned.
     *
     * @param option Name of the option
     * @return Option value or empty string
     */
    [[nodiscard]] auto getOption(const std::string_view& option) const -> const std::string&
    {
        auto optIter = std::find(this->args.begin(), this->args.end(), option);
        if (optIter != this->args.end() && ++optIter != this->args.end()) {
            return *optIter;
        }

        // Return reference to empty string. We cannot return a reference to an empty literal as this would result in
        // a reference to a temporary object, i.e. the std::string created.
        static const std::string noOptValue;
        return noOptValue;
    }

    /**
     * Returns all arguments that are neither options nor values of value options, in command line order.
     */
    [[nodiscard]] auto getPositionalOptions() const -> std::vector<std::string>
    {
        std::vector<std::string> positional;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i].rfind("--", 0) == 0) {
                if (takesValue(args[i])) {
                    ++i;
                }
                continue;
            }
            positional.push_back(args[i]);
        }
        return positional;
    }

    /**
     * Checks whether the given option is present. This does not ensure, that the options actually has a value and
     * should only be used to check for flag-like options.
     * @param option Name of the option
     * @return True if the option is present, false otherwise
     */
    [[nodiscard]] auto hasOption(const std::string_view& option) const -> bool
    {
        return std::find(this->args.begin(), this->args.end(), option) != this->args.end();
    }

    /**
     * Returns every option that is neither a value option nor one of the given flags.
     */
    [[nodiscard]] auto getUnknownOptions(const std::vector<std::string>& flags) const -> std::vector<std::string>
    {
        std::vector<std::string> unknown;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i].rfind("--", 0) != 0) {
                continue;
            }
            if (takesValue(args[i])) {
                ++i;
            } else if (std::find(flags.begin(), flags.end(), args[i]) == flags.end()) {
                unknown.push_back(args[i]);
            }
        }
        return unknown;
    }
};

#endif // SUDOKUTERM_CLI_OPTS_H
