#pragma once

#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nx {

// ============================================================================
// Arguments
// ============================================================================

/**
 * @brief One parsed option value
 */
struct ArgValue {
    std::string name;
    std::string value;
    bool is_set = false;

    explicit operator bool() const { return is_set; }
    const std::string& str() const { return value; }

    /// @throws std::runtime_error when set but not an integer
    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;
        size_t consumed = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(value, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != value.size()) {
            throw std::runtime_error("--" + name + " expects an integer, got '" + value + "'");
        }
        return parsed;
    }

    /// Unset options stay unset.
    std::optional<int> as_optional_int() const {
        if (!is_set) return std::nullopt;
        return as_int();
    }
};

/**
 * @brief Options of one command invocation
 */
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name) const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{name, "", false};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    std::string require(const std::string& name) const {
        auto it = named.find(name);
        if (it == named.end() || !it->second.is_set) {
            throw std::runtime_error("Missing required argument: --" + name);
        }
        return it->second.value;
    }
};

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;                   ///< Presence means true, no value
};

// ============================================================================
// Commands
// ============================================================================

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        for (const auto& arg : args) {
            if (arg.required) std::cout << " --" << arg.name << " <value>";
        }
        std::cout << " [options]\n\n" << description << "\n\nOptions:\n";
        for (const auto& arg : args) {
            std::cout << "  --" << arg.name;
            if (!arg.short_name.empty()) std::cout << ", -" << arg.short_name;
            if (!arg.is_flag) std::cout << " <value>";
            std::cout << "\n      " << arg.description;
            if (!arg.default_value.empty()) std::cout << " (default: " << arg.default_value << ")";
            if (arg.required) std::cout << " [required]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

/**
 * @brief Sub-command dispatcher: `nx <command> [--option value ...]`
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        commands_[cmd.name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string cmd_name = argv[1];
        if (cmd_name == "--help" || cmd_name == "-h") {
            print_help();
            return 0;
        }
        if (cmd_name == "--version" || cmd_name == "-v") {
            std::cout << program_name_ << " version " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }
        const Command& cmd = it->second;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd.print_help(program_name_);
                return 0;
            }
        }

        Args args;
        try {
            args = parse_args(argc - 2, argv + 2, cmd);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd.print_help(program_name_);
            return 1;
        }

        try {
            return cmd.handler(args);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - topic discovery service\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\nCommands:\n";
        for (const auto& entry : commands_) {
            std::string padded = entry.first;
            if (padded.size() < 12) padded.resize(12, ' ');
            std::cout << "  " << padded << entry.second.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command options.\n";
    }

    /// Exposed for tests.
    static Args parse_args(int argc, char** argv, const Command& cmd) {
        Args result;

        std::map<std::string, const ArgDef*> by_name;
        std::map<std::string, const ArgDef*> by_short;
        for (const auto& arg : cmd.args) {
            by_name["--" + arg.name] = &arg;
            if (!arg.short_name.empty()) by_short["-" + arg.short_name] = &arg;
        }

        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];

            const ArgDef* def = nullptr;
            if (arg.rfind("--", 0) == 0) {
                // --name=value
                auto eq_pos = arg.find('=');
                if (eq_pos != std::string::npos) {
                    auto it = by_name.find(arg.substr(0, eq_pos));
                    if (it != by_name.end()) {
                        result.named[it->second->name] = ArgValue{it->second->name, arg.substr(eq_pos + 1), true};
                        continue;
                    }
                }
                auto it = by_name.find(arg);
                if (it != by_name.end()) def = it->second;
            } else if (arg.size() == 2 && arg[0] == '-') {
                auto it = by_short.find(arg);
                if (it != by_short.end()) def = it->second;
            } else {
                result.positional.push_back(arg);
                continue;
            }

            if (!def) {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            if (def->is_flag) {
                result.named[def->name] = ArgValue{def->name, "true", true};
            } else {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Argument " + arg + " requires a value");
                }
                result.named[def->name] = ArgValue{def->name, argv[++i], true};
            }
        }

        for (const auto& arg : cmd.args) {
            if (result.named.count(arg.name)) continue;
            if (arg.required) {
                throw std::runtime_error("Missing required argument: --" + arg.name);
            }
            if (!arg.default_value.empty()) {
                result.named[arg.name] = ArgValue{arg.name, arg.default_value, true};
            }
        }
        return result;
    }

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace nx
