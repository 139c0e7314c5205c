#pragma once

#include "config/server_config.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace syn {

/**
 * @brief Value of one option as given on the command line
 */
struct ArgValue {
    std::string value;
    bool is_set = false;

    /**
     * @throws std::runtime_error unless the whole value is an integer
     */
    int as_int() const;

    /**
     * @brief Split on @p delim, keeping empty items
     *
     * "a,,b," gives {"a", "", "b", ""} so blank words still reach validation.
     */
    std::vector<std::string> as_list(char delim = ',') const;
};

/**
 * @brief Options and positional arguments of one command invocation
 */
struct Args {
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    bool has(const std::string& name) const;
    ArgValue get(const std::string& name) const;

    /**
     * @throws std::runtime_error if the option was not given
     */
    const std::string& require(const std::string& name) const;
};

struct OptionDef {
    std::string name;
    char short_name = 0;
    std::string description;
    bool required = false;
    bool is_flag = false;      // Presence only, takes no value
    bool repeatable = false;   // Repeated values are joined with ','
};

struct Command {
    std::string name;
    std::string description;
    std::vector<OptionDef> options;
    std::function<int(const Args&)> handler;
    bool takes_positional = false;
};

/**
 * @brief Sub-command dispatcher for the `syn` tool
 *
 * Global options are accepted by every command, after the command name.
 */
class CLI {
public:
    CLI(std::string program_name, std::string version);

    void add_global_option(OptionDef option);
    void register_command(Command command);

    /**
     * @brief Parse argv, run the selected command and return its exit code
     *
     * Parse errors and exceptions escaping the handler are printed and
     * turned into exit code 1.
     */
    int run(int argc, char** argv) const;

    /**
     * @brief Parse the tokens that follow the command name
     * @throws std::runtime_error on an unknown command or option, a missing
     *         value, a missing required option or an unexpected positional
     */
    Args parse(const std::string& command_name, const std::vector<std::string>& tokens) const;

    void print_help() const;
    void print_command_help(const Command& command) const;

private:
    std::string program_name_;
    std::string version_;
    std::vector<OptionDef> global_options_;
    std::map<std::string, Command> commands_;

    const OptionDef* find_option(const Command& command, const std::string& key) const;
};

/**
 * @brief Build the effective configuration of one invocation
 *
 * Sources are layered defaults < --config file < SYN_* environment <
 * command line (--host, --port, --workers, --quiet, --server).
 *
 * @throws std::runtime_error if a source is malformed or the result is invalid
 */
ServerConfig resolve_config(const Args& args);

} // namespace syn
