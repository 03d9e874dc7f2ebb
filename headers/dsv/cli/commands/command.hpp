//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_COMMAND_HPP
#define DEPSIEVE_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Command registry and argument handling for the depsieve CLI.
 *
 * Every command declares its options as ArgDef entries. The options shared
 * by all commands (help, verbosity, JSON output) live in common_arguments()
 * and are merged in by parse_arguments().
 */

#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::cli {

    struct ArgDef {
        std::string name;           // --name
        char short_name = 0;        // -n
        std::string description;
        bool required = false;
        bool takes_value = true;    // false for flags
        std::string default_value;
        std::string value_name = "VALUE";
        bool repeatable = false;    // every occurrence is kept
    };

    /**
     * Options accepted by every command: --help, --verbose, --quiet,
     * --debug and --json.
     */
    [[nodiscard]] const std::vector<ArgDef>& common_arguments();

    class ParsedArgs {
    public:
        void add_value(const ArgDef& def, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] bool get_flag(const std::string& name) const;

        /// Last value given for @p name
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;

        /**
         * Every value given for a repeatable option, with comma lists split
         * and blanks dropped.
         */
        [[nodiscard]] std::vector<std::string> get_all(const std::string& name) const;

        /**
         * Value of @p name as a non-negative count.
         *
         * @return InvalidArgument when the value is not a whole number.
         */
        [[nodiscard]] Result<std::optional<std::size_t>, Error> get_count(const std::string& name) const;

        [[nodiscard]] const std::vector<std::string>& positional() const noexcept { return positional_; }

    private:
        std::map<std::string, std::vector<std::string>> values_;
        std::set<std::string> flags_;
        std::vector<std::string> positional_;
    };

    /**
     * Parses the arguments that follow the command name against
     * @p defs and common_arguments().
     *
     * @return InvalidArgument naming the offending option.
     */
    [[nodiscard]] Result<ParsedArgs, Error> parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );

    enum class Verbosity {
        Quiet,      // errors only
        Normal,
        Verbose,
        Debug
    };

    enum class OutputFormat {
        Text,
        JSON
    };

    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Usage line followed by examples.
         */
        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Checks option combinations that the parser cannot.
         *
         * @return An empty string when @p args are acceptable, otherwise
         *         the message to print.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        /**
         * @return Process exit code.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        void print_help() const;

    protected:
        /**
         * Applies --quiet, --verbose, --debug and --json.
         */
        void configure_output(const ParsedArgs& args);

        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;
        void print_debug(std::string_view msg) const;

        [[nodiscard]] bool is_quiet() const noexcept { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const noexcept { return verbosity_ >= Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const noexcept { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;

        /// Commands in registration order
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    /**
     * Removes the command name from the front of @p args and returns it.
     * When the first argument is empty, an option, or not a registered
     * command, @p args is left alone and @p fallback is returned.
     */
    [[nodiscard]] std::string take_command_name(std::vector<std::string>& args, std::string_view fallback);

}  // namespace dsv::cli

#endif //DEPSIEVE_COMMAND_HPP
