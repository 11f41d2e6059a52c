#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tenantdb::cli {

enum class Command {
    STARTUP,
    MIGRATE,
    MIGRATE_TENANT,
    PATCH,
    STATUS,
    PROVISION,
    HELP
};

[[nodiscard]] std::string_view command_name(Command command);
[[nodiscard]] std::optional<Command> parse_command(std::string_view name);

inline constexpr const char* kDefaultConfigFile = "config/tenantdb.toml";

/**
 * @brief Parsed invocation of the tenantdb binary
 *
 * Only the fields relevant to the chosen command are populated. Values given
 * on the command line override the matching config file keys.
 */
struct CommandLine {
    Command command = Command::HELP;
    std::string config_file = kDefaultConfigFile;

    std::string tenant;            // migrate-tenant positional, patch/provision --tenant
    std::string patch_id;          // patch --patch (single patch, requires --tenant)

    std::string owner_email;
    std::string owner_password;
    std::string company_name;

    std::optional<size_t> workers;        // overrides migrations.max_parallel_tenants
    std::optional<std::string> log_level; // overrides logging.level
};

struct ParseResult {
    bool success = false;
    std::string error_message;
    CommandLine command_line;

    static ParseResult ok(CommandLine cl) {
        ParseResult result;
        result.success = true;
        result.command_line = std::move(cl);
        return result;
    }

    static ParseResult error(std::string message) {
        ParseResult result;
        result.success = false;
        result.error_message = std::move(message);
        return result;
    }
};

/**
 * @brief Parse argv (argv[0] is the program name and is skipped)
 *
 * Accepts `--name value` and `--name=value`; `--` ends option parsing.
 * An unknown option, a missing value or a missing required option is an error.
 */
[[nodiscard]] ParseResult parse_command_line(int argc, const char* const* argv);

[[nodiscard]] std::string usage();

} // namespace tenantdb::cli
