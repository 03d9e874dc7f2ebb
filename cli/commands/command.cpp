//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/cli/commands/command.hpp"
#include "dsv/utils/string_utils.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace dsv::cli {

    namespace {

        const ArgDef* find_long(const std::vector<ArgDef>& defs, const std::string_view name) {
            for (const auto& def : defs) {
                if (def.name == name) {
                    return &def;
                }
            }
            for (const auto& def : common_arguments()) {
                if (def.name == name) {
                    return &def;
                }
            }
            return nullptr;
        }

        const ArgDef* find_short(const std::vector<ArgDef>& defs, const char c) {
            for (const auto& def : defs) {
                if (def.short_name == c) {
                    return &def;
                }
            }
            for (const auto& def : common_arguments()) {
                if (def.short_name == c) {
                    return &def;
                }
            }
            return nullptr;
        }

        void print_option(const ArgDef& arg) {
            std::ostringstream flag;
            if (arg.short_name) {
                flag << "-" << arg.short_name << ", ";
            } else {
                flag << "    ";
            }
            flag << "--" << arg.name;
            if (arg.takes_value) {
                flag << " <" << arg.value_name << ">";
            }

            std::cout << "  " << std::left << std::setw(28) << flag.str() << arg.description;
            if (!arg.default_value.empty()) {
                std::cout << " (default: " << arg.default_value << ")";
            }
            if (arg.repeatable) {
                std::cout << " [repeatable]";
            }
            if (arg.required) {
                std::cout << " [required]";
            }
            std::cout << "\n";
        }

        Result<ParsedArgs, Error> option_error(const std::string& message, const std::string& option) {
            return Result<ParsedArgs, Error>::failure(Error::invalid_argument(message, option));
        }

    }  // namespace

    const std::vector<ArgDef>& common_arguments() {
        static const std::vector<ArgDef> common = {
            {"help", 'h', "Show this help message", false, false, "", ""},
            {"verbose", 'v', "Explain each step and list skipped problems", false, false, "", ""},
            {"quiet", 'q', "Print only the names of unused dependencies", false, false, "", ""},
            {"debug", 0, "Print debug information", false, false, "", ""},
            {"json", 0, "Print the report as JSON", false, false, "", ""},
        };
        return common;
    }

    // ============================================================================
    // ParsedArgs
    // ============================================================================

    void ParsedArgs::add_value(const ArgDef& def, const std::string& value) {
        auto& values = values_[def.name];
        if (!def.repeatable) {
            values.clear();
        }
        values.push_back(value);
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_.insert(name);
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || flags_.contains(name);
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        if (const auto it = values_.find(name); it != values_.end() && !it->second.empty()) {
            return it->second.back();
        }
        return std::nullopt;
    }

    std::vector<std::string> ParsedArgs::get_all(const std::string& name) const {
        std::vector<std::string> out;
        const auto it = values_.find(name);
        if (it == values_.end()) {
            return out;
        }
        for (const auto& value : it->second) {
            for (const auto part : string_utils::split(value, ',')) {
                if (const auto trimmed = string_utils::trim(part); !trimmed.empty()) {
                    out.emplace_back(trimmed);
                }
            }
        }
        return out;
    }

    Result<std::optional<std::size_t>, Error> ParsedArgs::get_count(const std::string& name) const {
        using CountResult = Result<std::optional<std::size_t>, Error>;

        const auto value = get(name);
        if (!value) {
            return CountResult::success(std::nullopt);
        }

        std::size_t count = 0;
        const char* first = value->data();
        const char* last = first + value->size();
        const auto [ptr, ec] = std::from_chars(first, last, count);
        if (ec != std::errc{} || ptr != last) {
            return CountResult::failure(
                Error::invalid_argument("--" + name + " expects a non-negative integer", *value)
            );
        }
        return CountResult::success(count);
    }

    // ============================================================================
    // Argument parser
    // ============================================================================

    Result<ParsedArgs, Error> parse_arguments(const std::vector<std::string>& args, const std::vector<ArgDef>& defs) {
        ParsedArgs parsed;
        for (const auto& def : defs) {
            if (!def.default_value.empty()) {
                parsed.add_value(def, def.default_value);
            }
        }

        bool options_ended = false;

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg.empty()) {
                continue;
            }
            if (options_ended || arg[0] != '-' || arg.size() == 1) {
                parsed.add_positional(arg);
                continue;
            }
            if (arg == "--") {
                options_ended = true;
                continue;
            }

            if (arg[1] == '-') {
                std::string name = arg.substr(2);
                std::optional<std::string> inline_value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const ArgDef* def = find_long(defs, name);
                if (!def) {
                    return option_error("Unknown option", "--" + name);
                }
                if (!def->takes_value) {
                    if (inline_value) {
                        return option_error("Option takes no value", "--" + name);
                    }
                    parsed.set_flag(def->name);
                    continue;
                }

                std::string value = inline_value.value_or("");
                if (!inline_value && i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return option_error("Option requires a value", "--" + name);
                }
                parsed.add_value(*def, value);
                continue;
            }

            // Bundled short options; a value-taking one consumes the rest.
            for (std::size_t j = 1; j < arg.size(); ++j) {
                const char c = arg[j];
                const ArgDef* def = find_short(defs, c);
                if (!def) {
                    return option_error("Unknown option", std::string("-") + c);
                }
                if (!def->takes_value) {
                    parsed.set_flag(def->name);
                    continue;
                }

                std::string value;
                if (j + 1 < arg.size()) {
                    value = arg.substr(j + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return option_error("Option requires a value", std::string("-") + c);
                }
                parsed.add_value(*def, value);
                break;
            }
        }

        return Result<ParsedArgs, Error>::success(std::move(parsed));
    }

    // ============================================================================
    // Command
    // ============================================================================

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: depsieve " << name();
        for (const auto& arg : arguments()) {
            if (arg.required) {
                ss << " --" << arg.name << " <" << arg.value_name << ">";
            }
        }
        ss << " [OPTIONS]";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }
        return "";
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n" << usage() << "\n";

        if (const auto args = arguments(); !args.empty()) {
            std::cout << "\nOptions:\n";
            for (const auto& arg : args) {
                print_option(arg);
            }
        }

        std::cout << "\nCommon options:\n";
        for (const auto& arg : common_arguments()) {
            print_option(arg);
        }
    }

    void Command::configure_output(const ParsedArgs& args) {
        if (args.get_flag("debug")) {
            verbosity_ = Verbosity::Debug;
        } else if (args.get_flag("verbose")) {
            verbosity_ = Verbosity::Verbose;
        } else if (args.get_flag("quiet")) {
            verbosity_ = Verbosity::Quiet;
        }
        if (args.get_flag("json")) {
            output_format_ = OutputFormat::JSON;
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
            std::cerr << msg << "\n";
        }
    }

    void Command::print_debug(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Debug) {
            std::cerr << "[DEBUG] " << msg << "\n";
        }
    }

    // ============================================================================
    // CommandRegistry
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry instance;
        return instance;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        for (const auto& cmd : commands_) {
            if (cmd->name() == name) {
                return cmd.get();
            }
        }
        return nullptr;
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        return result;
    }

    std::string take_command_name(std::vector<std::string>& args, const std::string_view fallback) {
        if (args.empty() || args.front().empty() || args.front().front() == '-') {
            return std::string(fallback);
        }
        if (!CommandRegistry::instance().find(args.front())) {
            return std::string(fallback);
        }
        std::string name = std::move(args.front());
        args.erase(args.begin());
        return name;
    }

}  // namespace dsv::cli
