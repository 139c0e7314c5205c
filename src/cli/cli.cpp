#include "cli/cli.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace syn {

// ============================================================================
// Argument values
// ============================================================================

int ArgValue::as_int() const {
    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(value, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Expected an integer, got: " + value);
    }
    if (pos != value.size()) {
        throw std::runtime_error("Expected an integer, got: " + value);
    }
    return result;
}

std::vector<std::string> ArgValue::as_list(char delim) const {
    std::vector<std::string> items;
    if (!is_set) return items;

    size_t start = 0;
    while (true) {
        size_t end = value.find(delim, start);
        items.push_back(value.substr(start, end - start));
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return items;
}

bool Args::has(const std::string& name) const {
    auto it = named.find(name);
    return it != named.end() && it->second.is_set;
}

ArgValue Args::get(const std::string& name) const {
    auto it = named.find(name);
    return it != named.end() ? it->second : ArgValue{};
}

const std::string& Args::require(const std::string& name) const {
    auto it = named.find(name);
    if (it == named.end() || !it->second.is_set) {
        throw std::runtime_error("Missing required argument: --" + name);
    }
    return it->second.value;
}

// ============================================================================
// Parsing
// ============================================================================

CLI::CLI(std::string program_name, std::string version)
    : program_name_(std::move(program_name)), version_(std::move(version)) {}

void CLI::add_global_option(OptionDef option) {
    global_options_.push_back(std::move(option));
}

void CLI::register_command(Command command) {
    std::string name = command.name;
    commands_[name] = std::move(command);
}

const OptionDef* CLI::find_option(const Command& command, const std::string& key) const {
    auto matches = [&key](const OptionDef& option) {
        if (key == "--" + option.name) return true;
        return option.short_name != 0 && key.size() == 2 &&
               key[0] == '-' && key[1] == option.short_name;
    };

    for (const auto& option : command.options) {
        if (matches(option)) return &option;
    }
    for (const auto& option : global_options_) {
        if (matches(option)) return &option;
    }
    return nullptr;
}

Args CLI::parse(const std::string& command_name, const std::vector<std::string>& tokens) const {
    auto it = commands_.find(command_name);
    if (it == commands_.end()) {
        throw std::runtime_error("Unknown command: " + command_name);
    }
    const Command& command = it->second;

    Args args;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];

        if (token.size() < 2 || token[0] != '-') {
            if (!command.takes_positional) {
                throw std::runtime_error("Unexpected argument: " + token);
            }
            args.positional.push_back(token);
            continue;
        }

        // --name=value
        std::string key = token;
        std::string value;
        bool inline_value = false;
        auto eq_pos = token.find('=');
        if (token.rfind("--", 0) == 0 && eq_pos != std::string::npos) {
            key = token.substr(0, eq_pos);
            value = token.substr(eq_pos + 1);
            inline_value = true;
        }

        const OptionDef* option = find_option(command, key);
        if (!option) {
            throw std::runtime_error("Unknown argument: " + token);
        }

        if (option->is_flag) {
            if (inline_value) {
                throw std::runtime_error("Option --" + option->name + " takes no value");
            }
            value = "true";
        } else if (!inline_value) {
            if (i + 1 >= tokens.size()) {
                throw std::runtime_error("Option " + key + " requires a value");
            }
            value = tokens[++i];
        }

        ArgValue& slot = args.named[option->name];
        if (slot.is_set && option->repeatable) {
            slot.value += "," + value;
        } else {
            slot.value = value;
        }
        slot.is_set = true;
    }

    auto check_required = [&args](const std::vector<OptionDef>& options) {
        for (const auto& option : options) {
            if (option.required && !args.has(option.name)) {
                throw std::runtime_error("Missing required argument: --" + option.name);
            }
        }
    };
    check_required(command.options);
    check_required(global_options_);

    return args;
}

// ============================================================================
// Running
// ============================================================================

int CLI::run(int argc, char** argv) const {
    if (argc < 2) {
        print_help();
        return 1;
    }

    std::string command_name = argv[1];
    if (command_name == "--help" || command_name == "-h") {
        print_help();
        return 0;
    }
    if (command_name == "--version") {
        std::cout << program_name_ << " version " << version_ << "\n";
        return 0;
    }

    auto it = commands_.find(command_name);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << command_name << "\n";
        std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
        return 1;
    }
    const Command& command = it->second;

    std::vector<std::string> tokens(argv + 2, argv + argc);
    if (std::find(tokens.begin(), tokens.end(), "--help") != tokens.end()) {
        print_command_help(command);
        return 0;
    }

    Args args;
    try {
        args = parse(command_name, tokens);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_command_help(command);
        return 1;
    }

    try {
        return command.handler(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

namespace {

void print_options(const std::vector<OptionDef>& options) {
    for (const auto& option : options) {
        std::string flags = "--" + option.name;
        if (option.short_name != 0) {
            flags += ", -" + std::string(1, option.short_name);
        }
        if (!option.is_flag) {
            flags += " <value>";
        }
        std::cout << "  " << std::left << std::setw(24) << flags << option.description;
        if (option.repeatable) std::cout << " (repeatable)";
        if (option.required) std::cout << " [required]";
        std::cout << "\n";
    }
}

} // anonymous namespace

void CLI::print_help() const {
    std::cout << program_name_ << " - Synonym dictionary server and client\n\n";
    std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
    std::cout << "Commands:\n";
    for (const auto& [name, command] : commands_) {
        std::cout << "  " << std::left << std::setw(10) << name << command.description << "\n";
    }
    if (!global_options_.empty()) {
        std::cout << "\nGlobal options:\n";
        print_options(global_options_);
    }
    std::cout << "\nRun '" << program_name_ << " <command> --help' for command options.\n";
}

void CLI::print_command_help(const Command& command) const {
    std::cout << "\nUsage: " << program_name_ << " " << command.name;
    for (const auto& option : command.options) {
        if (option.required) std::cout << " --" << option.name << " <value>";
    }
    std::cout << " [options]";
    if (command.takes_positional) std::cout << " [words...]";
    std::cout << "\n\n" << command.description << "\n";

    if (!command.options.empty()) {
        std::cout << "\nOptions:\n";
        print_options(command.options);
    }
    if (!global_options_.empty()) {
        std::cout << "\nGlobal options:\n";
        print_options(global_options_);
    }
    std::cout << "\n";
}

// ============================================================================
// Configuration
// ============================================================================

ServerConfig resolve_config(const Args& args) {
    ServerConfig config;
    if (args.has("config")) {
        config = ServerConfig::from_json_file(args.require("config"));
    }
    config = ServerConfig::from_environment(config);

    if (args.has("host")) config.host = args.require("host");
    if (args.has("port")) config.port = args.get("port").as_int();
    if (args.has("workers")) config.worker_threads = args.get("workers").as_int();
    if (args.has("quiet")) config.verbose = false;
    if (args.has("server")) config.client_base_url = args.require("server");

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }
    return config;
}

} // namespace syn
