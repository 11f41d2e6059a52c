#include "cli/command_line.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>
#include <vector>

namespace tenantdb::cli {

namespace {

enum class OptionId {
    CONFIG,
    TENANT,
    PATCH,
    OWNER_EMAIL,
    OWNER_PASSWORD,
    COMPANY,
    WORKERS,
    LOG_LEVEL,
    HELP
};

struct OptionSpec {
    OptionId id;
    const char* long_name;
    char short_name;
    bool takes_value;
};

constexpr std::array<OptionSpec, 9> kOptions = {{
    {OptionId::CONFIG,         "config",         'c',  true},
    {OptionId::TENANT,         "tenant",         't',  true},
    {OptionId::PATCH,          "patch",          'p',  true},
    {OptionId::OWNER_EMAIL,    "owner-email",    '\0', true},
    {OptionId::OWNER_PASSWORD, "owner-password", '\0', true},
    {OptionId::COMPANY,        "company",        '\0', true},
    {OptionId::WORKERS,        "workers",        'j',  true},
    {OptionId::LOG_LEVEL,      "log-level",      '\0', true},
    {OptionId::HELP,           "help",           'h',  false},
}};

const OptionSpec* find_long(std::string_view name) {
    for (const auto& spec : kOptions) {
        if (name == spec.long_name) return &spec;
    }
    return nullptr;
}

const OptionSpec* find_short(char c) {
    if (c == '\0') return nullptr;
    for (const auto& spec : kOptions) {
        if (spec.short_name == c) return &spec;
    }
    return nullptr;
}

// Returns an error message, or empty on success
std::string apply_option(CommandLine& cl, OptionId id, const std::string& value) {
    switch (id) {
        case OptionId::CONFIG:         cl.config_file = value; break;
        case OptionId::TENANT:         cl.tenant = value; break;
        case OptionId::PATCH:          cl.patch_id = value; break;
        case OptionId::OWNER_EMAIL:    cl.owner_email = value; break;
        case OptionId::OWNER_PASSWORD: cl.owner_password = value; break;
        case OptionId::COMPANY:        cl.company_name = value; break;
        case OptionId::WORKERS: {
            const auto n = utils::try_parse_int<size_t>(value);
            if (!n || *n == 0) {
                return std::format("--workers expects a positive integer, got '{}'", value);
            }
            cl.workers = *n;
            break;
        }
        case OptionId::LOG_LEVEL:
            if (!utils::log::parse_level(value)) {
                return std::format("--log-level expects debug, info, warn or error, got '{}'", value);
            }
            cl.log_level = value;
            break;
        case OptionId::HELP:
            cl.command = Command::HELP;
            break;
    }
    return {};
}

std::string check_required(const CommandLine& cl, const std::vector<std::string>& positionals) {
    const auto name = command_name(cl.command);
    switch (cl.command) {
        case Command::MIGRATE_TENANT:
            if (positionals.size() != 1) {
                return "migrate-tenant expects exactly one <slug|id> argument";
            }
            return {};
        case Command::PATCH:
            if (!cl.patch_id.empty() && cl.tenant.empty()) {
                return "patch --patch requires --tenant";
            }
            if (cl.patch_id.empty() && !cl.tenant.empty()) {
                return "patch --tenant requires --patch";
            }
            break;
        case Command::PROVISION:
            if (cl.tenant.empty()) return "provision requires --tenant";
            if (cl.owner_email.empty()) return "provision requires --owner-email";
            if (cl.owner_password.empty()) return "provision requires --owner-password";
            if (cl.company_name.empty()) return "provision requires --company";
            break;
        default:
            break;
    }
    if (!positionals.empty()) {
        return std::format("{} takes no positional arguments, got '{}'", name, positionals.front());
    }
    return {};
}

} // anonymous namespace

std::string_view command_name(Command command) {
    switch (command) {
        case Command::STARTUP:        return "startup";
        case Command::MIGRATE:        return "migrate";
        case Command::MIGRATE_TENANT: return "migrate-tenant";
        case Command::PATCH:          return "patch";
        case Command::STATUS:         return "status";
        case Command::PROVISION:      return "provision";
        case Command::HELP:           return "help";
    }
    return "unknown";
}

std::optional<Command> parse_command(std::string_view name) {
    if (name == "startup") return Command::STARTUP;
    if (name == "migrate") return Command::MIGRATE;
    if (name == "migrate-tenant") return Command::MIGRATE_TENANT;
    if (name == "patch") return Command::PATCH;
    if (name == "status") return Command::STATUS;
    if (name == "provision") return Command::PROVISION;
    if (name == "help") return Command::HELP;
    return std::nullopt;
}

ParseResult parse_command_line(int argc, const char* const* argv) {
    CommandLine cl;
    std::vector<std::string> positionals;
    bool have_command = false;
    bool help_requested = false;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view tok = argv[i] ? argv[i] : "";

        if (options_done || tok.size() < 2 || tok[0] != '-') {
            if (!have_command) {
                const auto command = parse_command(tok);
                if (!command) {
                    return ParseResult::error(std::format("Unknown command '{}'", tok));
                }
                cl.command = *command;
                have_command = true;
            } else {
                positionals.emplace_back(tok);
            }
            continue;
        }

        if (tok == "--") {
            options_done = true;
            continue;
        }

        const OptionSpec* spec = nullptr;
        std::string display;
        std::optional<std::string> inline_value;

        if (tok.starts_with("--")) {
            std::string_view name = tok.substr(2);
            if (const auto eq = name.find('='); eq != std::string_view::npos) {
                inline_value = std::string(name.substr(eq + 1));
                name = name.substr(0, eq);
            }
            spec = find_long(name);
            display = std::format("--{}", name);
        } else {
            if (tok.size() != 2) {
                return ParseResult::error(std::format("Malformed option '{}'", tok));
            }
            spec = find_short(tok[1]);
            display = std::string(tok);
        }

        if (!spec) {
            return ParseResult::error(std::format("Unknown option '{}'", display));
        }

        if (!spec->takes_value) {
            if (inline_value) {
                return ParseResult::error(std::format("Option '{}' takes no value", display));
            }
            help_requested = true;
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else {
            if (i + 1 >= argc || argv[i + 1] == nullptr) {
                return ParseResult::error(std::format("Option '{}' requires a value", display));
            }
            value = argv[++i];
        }

        if (auto err = apply_option(cl, spec->id, value); !err.empty()) {
            return ParseResult::error(std::move(err));
        }
    }

    if (help_requested || !have_command) {
        cl.command = Command::HELP;
        return ParseResult::ok(std::move(cl));
    }
    if (cl.command == Command::HELP) {
        return ParseResult::ok(std::move(cl));
    }

    if (auto err = check_required(cl, positionals); !err.empty()) {
        return ParseResult::error(std::move(err));
    }
    if (cl.command == Command::MIGRATE_TENANT) {
        cl.tenant = positionals.front();
    }
    return ParseResult::ok(std::move(cl));
}

std::string usage() {
    return
        "Usage: tenantdb <command> [options]\n"
        "\n"
        "Commands:\n"
        "  startup                      shared migrations, tenant migrations, then patches\n"
        "  migrate                      apply pending migrations to every eligible tenant\n"
        "  migrate-tenant <slug|id>     apply pending migrations to one tenant\n"
        "  patch                        apply the patch catalog to every eligible tenant\n"
        "  status                       report applied and pending migrations per tenant\n"
        "  provision                    bootstrap a tenant schema and its owner account\n"
        "\n"
        "Options:\n"
        "  -c, --config FILE            config file (default config/tenantdb.toml)\n"
        "  -j, --workers N              tenants processed concurrently\n"
        "      --log-level LEVEL        debug | info | warn | error\n"
        "  -t, --tenant SLUG|ID         patch / provision target tenant\n"
        "  -p, --patch ID               patch: apply a single patch (with --tenant)\n"
        "      --owner-email EMAIL      provision: owner login\n"
        "      --owner-password PASS    provision: owner password (hashed before storage)\n"
        "      --company NAME           provision: company name for tenant settings\n"
        "  -h, --help                   show this help\n";
}

} // namespace tenantdb::cli
