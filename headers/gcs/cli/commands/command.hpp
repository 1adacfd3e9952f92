//
// Created by gregorian-rayne on 2/19/26.
//

#ifndef GCS_COMMAND_HPP
#define GCS_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Base class and argument parsing for gcs subcommands.
 *
 * Subcommands register themselves with CommandRegistry from their own
 * translation unit; main() only dispatches by name.
 */

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gcs::cli
{
    /**
     * Command-line argument definition.
     */
    struct ArgDef {
        std::string name;           // Long name (--name)
        char short_name = 0;        // Short name (-n)
        std::string description;
        bool required = false;
        bool takes_value = true;    // false for flags
        std::string default_value;
        std::string value_name = "VALUE";
    };

    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;

        /**
         * nullopt when absent or not a whole decimal number.
         */
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;
        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

        /**
         * How many times a flag was given ("-vv" counts 2).
         */
        [[nodiscard]] int flag_count(const std::string& name) const;

    private:
        std::unordered_map<std::string, std::string> args_;
        std::unordered_map<std::string, int> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,      // Only errors
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
        [[nodiscard]] virtual std::string usage() const;
        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * @return Process exit code.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * @return Error message if invalid, empty if valid.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        void set_verbosity(Verbosity v) { verbosity_ = v; }
        void set_output_format(OutputFormat f) { output_format_ = f; }

        /**
         * Applies -v / -q / --json from @p args.
         */
        void apply_common_flags(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;
        void print_debug(std::string_view msg) const;

        [[nodiscard]] Verbosity verbosity() const { return verbosity_; }
        [[nodiscard]] OutputFormat output_format() const { return output_format_; }
        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments that follow the subcommand name. --help, --verbose,
     * --quiet and --json (and -h, -v, -q) are accepted for every command.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );
}  // namespace gcs::cli

#endif //GCS_COMMAND_HPP
