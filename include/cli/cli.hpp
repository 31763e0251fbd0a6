#pragma once

#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace cee {

// Option value as typed on the command line
struct ArgValue {
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }
    operator std::string() const { return value; }

    /**
     * @throws std::runtime_error if the value is not a number
     */
    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;
        try {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used == value.size()) return parsed;
        } catch (const std::logic_error&) {
        }
        throw std::runtime_error("Expected an integer, got '" + value + "'");
    }

    double as_double(double default_val = 0.0) const {
        if (!is_set) return default_val;
        try {
            size_t used = 0;
            double parsed = std::stod(value, &used);
            if (used == value.size()) return parsed;
        } catch (const std::logic_error&) {
        }
        throw std::runtime_error("Expected a number, got '" + value + "'");
    }

    bool as_bool(bool default_val = false) const {
        if (!is_set) return default_val;
        if (value == "true" || value == "1" || value == "yes") return true;
        if (value == "false" || value == "0" || value == "no") return false;
        throw std::runtime_error("Expected true or false, got '" + value + "'");
    }
};

// Parsed options for one subcommand
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name, const std::string& default_val = "") const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{default_val, !default_val.empty()};
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
    bool is_flag = false;  // Presence means true
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        for (const auto& arg : args) {
            if (arg.required) {
                std::cout << " --" << arg.name << " <value>";
            }
        }
        std::cout << " [options]\n\n" << description << "\n\nOptions:\n";
        for (const auto& arg : args) {
            std::cout << "  --" << arg.name;
            if (!arg.short_name.empty()) std::cout << ", -" << arg.short_name;
            if (!arg.is_flag) std::cout << " <value>";
            std::cout << "\n      " << arg.description;
            if (!arg.default_value.empty()) {
                std::cout << " (default: " << arg.default_value << ")";
            }
            if (arg.required) std::cout << " [required]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

/**
 * @brief Subcommand dispatcher
 *
 * Options shared by every subcommand are appended to each registered command.
 * Handler exceptions are reported on stderr and turned into exit code 1.
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version, const std::string& summary)
        : program_name_(program_name), version_(version), summary_(summary) {}

    void add_common_arg(ArgDef def) {
        common_args_.push_back(std::move(def));
    }

    void register_command(Command cmd) {
        for (const auto& def : common_args_) {
            cmd.args.push_back(def);
        }
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
        std::cout << program_name_ << " - " << summary_ << "\n\n";
        std::cout << "Usage: " << program_name_ << " <command> --graph <snapshot.json> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << name;
            for (size_t i = name.length(); i < 16; ++i) std::cout << " ";
            std::cout << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
        std::cout << "\nVersion: " << version_ << "\n";
    }

private:
    Args parse_args(int argc, char** argv, const Command& cmd) const {
        Args result;

        std::map<std::string, const ArgDef*> by_name;
        std::map<std::string, const ArgDef*> by_short;
        for (const auto& arg : cmd.args) {
            by_name["--" + arg.name] = &arg;
            if (!arg.short_name.empty()) {
                by_short["-" + arg.short_name] = &arg;
            }
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
                        result.named[it->second->name] = ArgValue{arg.substr(eq_pos + 1), true};
                        continue;
                    }
                }
                auto it = by_name.find(arg);
                if (it != by_name.end()) def = it->second;
            } else if (arg.rfind("-", 0) == 0 && arg.length() == 2) {
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
                result.named[def->name] = ArgValue{"true", true};
            } else {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Argument " + arg + " requires a value");
                }
                result.named[def->name] = ArgValue{argv[++i], true};
            }
        }

        for (const auto& arg : cmd.args) {
            if (result.named.find(arg.name) != result.named.end()) continue;
            if (arg.required) {
                throw std::runtime_error("Missing required argument: --" + arg.name);
            }
            if (!arg.default_value.empty()) {
                result.named[arg.name] = ArgValue{arg.default_value, true};
            }
        }

        return result;
    }

    std::string program_name_;
    std::string version_;
    std::string summary_;
    std::vector<ArgDef> common_args_;
    std::map<std::string, Command> commands_;
};

} // namespace cee
