#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <utility>
#include <stdexcept>
#include <string>
#include <vector>

namespace cg {

// Argument value holder
struct ArgValue {
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }

    // Invalid numbers are rejected rather than silently replaced
    size_t as_size(size_t default_val = 0) const {
        if (!is_set) return default_val;
        size_t consumed = 0;
        unsigned long long parsed = 0;
        try {
            if (!value.empty() && value[0] == '-') throw std::invalid_argument(value);
            parsed = std::stoull(value, &consumed);
        } catch (const std::exception&) {
            throw std::runtime_error("Expected a non-negative integer, got '" + value + "'");
        }
        if (consumed != value.size()) {
            throw std::runtime_error("Expected a non-negative integer, got '" + value + "'");
        }
        return static_cast<size_t>(parsed);
    }

    bool as_flag() const { return is_set && value != "false"; }
};

// Parsed arguments container
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name) const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{};
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

    // Named option first, then the positional slot, then the fallback
    std::string option_or_positional(const std::string& name, size_t index,
                                     const std::string& fallback) const {
        if (has(name)) return named.at(name).value;
        if (index < positional.size()) return positional[index];
        return fallback;
    }
};

// Argument definition
struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;  // Presence means true, no value consumed
};

// Command definition
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;
    std::string positional_usage;  // e.g. "[root] [outdir]"
    size_t max_positional = 0;

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        if (!positional_usage.empty()) {
            std::cout << " " << positional_usage;
        }
        for (const auto& arg : args) {
            if (arg.required) {
                std::cout << " --" << arg.name << " <value>";
            }
        }
        std::cout << " [options]\n\n";
        std::cout << description << "\n\n";
        std::cout << "Options:\n";
        for (const auto& arg : args) {
            std::cout << "  --" << arg.name;
            if (!arg.short_name.empty()) {
                std::cout << ", -" << arg.short_name;
            }
            if (!arg.is_flag) {
                std::cout << " <value>";
            }
            std::cout << "\n      " << arg.description;
            if (!arg.default_value.empty()) {
                std::cout << " (default: " << arg.default_value << ")";
            }
            if (arg.required) {
                std::cout << " [required]";
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

// Subcommand dispatcher for the conceptgraph executable
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
        std::cout << program_name_ << " - build a concept co-occurrence graph from a document corpus\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << name;
            for (size_t i = name.length(); i < 16; ++i) std::cout << " ";
            std::cout << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
        std::cout << "\nVersion: " << version_ << "\n";
    }

    // Exposed for tests
    static Args parse_args(int argc, char** argv, const Command& cmd) {
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
                if (result.positional.size() >= cmd.max_positional) {
                    throw std::runtime_error("Unexpected argument: " + arg);
                }
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
            if (result.named.find(arg.name) == result.named.end()) {
                if (arg.required) {
                    throw std::runtime_error("Missing required argument: --" + arg.name);
                }
            }
        }

        return result;
    }

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace cg
