#include "cli/Commands.hpp"
#include "core/Locksmith.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"
#include "notify/Notifier.hpp"
#include "util/duration.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <sodium.h>

using namespace lsm::types;
using json = nlohmann::json;

namespace lsm::cli {

namespace {

constexpr auto kDefaultExpiry = "30d";
constexpr auto kRowFormat = "{:<30} {:<20} {:<20} {:<12}\n";

struct ParsedArgs {
    std::vector<std::string> positional;
    std::optional<std::string> expires;
    bool json = false;
};

// Flags may appear anywhere after the command; "--" ends flag parsing.
ParsedArgs parseArgs(const std::vector<std::string>& args, const bool allowExpires, const bool allowJson) {
    ParsedArgs parsed;
    bool flagsDone = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (flagsDone || a.size() < 2 || a[0] != '-') {
            parsed.positional.push_back(a);
            continue;
        }

        if (a == "--") {
            flagsDone = true;
        } else if (allowExpires && (a == "--expires" || a == "-expires")) {
            if (i + 1 >= args.size()) throw InvalidArgumentError("flag needs an argument: " + a);
            parsed.expires = args[++i];
        } else if (allowExpires && (a.starts_with("--expires=") || a.starts_with("-expires="))) {
            parsed.expires = a.substr(a.find('=') + 1);
        } else if (allowJson && (a == "--json" || a == "-json")) {
            parsed.json = true;
        } else {
            throw InvalidArgumentError("flag provided but not defined: " + a);
        }
    }

    return parsed;
}

std::string truncate(const std::string& s, const size_t maxLen) {
    if (s.size() <= maxLen) return s;
    return s.substr(0, maxLen - 3) + "...";
}

std::string statusDisplay(const SecretMetadata& meta, const std::chrono::seconds threshold, const bool show) {
    if (!show) return "";
    switch (meta.status(threshold)) {
    case ExpirationStatus::Expired: return "❌ Expired";
    case ExpirationStatus::Expiring: return "⚠️  Expiring";
    case ExpirationStatus::Valid: break;
    }
    return "✓  Valid";
}

std::unique_ptr<core::Locksmith> openOrThrow(Context& ctx) {
    if (!ctx.openLocksmith) throw KeyUnavailableError("no credential store configured");
    auto ls = ctx.openLocksmith();
    if (!ls) throw KeyUnavailableError("failed to open credential store");
    return ls;
}

int handleAdd(core::Locksmith& ls, const std::vector<std::string>& args, Context& ctx) {
    const auto parsed = parseArgs(args, true, false);
    if (parsed.positional.size() < 2)
        throw InvalidArgumentError("usage: locksmith add <key> <secret> [--expires <duration>]");

    const auto& key = parsed.positional[0];
    std::string value = parsed.positional[1];

    std::chrono::seconds ttl;
    try {
        ttl = util::parseDuration(parsed.expires.value_or(kDefaultExpiry));
    } catch (const InvalidArgumentError& e) {
        sodium_memzero(value.data(), value.size());
        throw InvalidArgumentError(std::string("invalid expiration duration: ") + e.what());
    }

    const auto expiresAt = std::chrono::time_point_cast<std::chrono::seconds>(Clock::now() + ttl);
    try {
        ls.set(key, value, expiresAt);
    } catch (const Error&) {
        sodium_memzero(value.data(), value.size());
        throw;
    }
    sodium_memzero(value.data(), value.size());

    ctx.out << fmt::format("Successfully saved secret '{}' (expires at {})\n", key,
                           util::formatTime(expiresAt, "%d %b %y %H:%M %Z"));
    return 0;
}

int handleGet(core::Locksmith& ls, const std::vector<std::string>& args, Context& ctx) {
    const auto parsed = parseArgs(args, false, true);
    if (parsed.positional.empty()) throw InvalidArgumentError("usage: locksmith get <key> [--json]");

    const auto& key = parsed.positional[0];
    const auto threshold = ctx.config.notifications.expiringThreshold();

    auto secret = ls.getWithMetadata(key);
    const auto now = Clock::now();

    if (parsed.json) {
        json j = {
            {"key", key},
            {"value", secret.valueString()},
            {"created_at", util::timestampToString(secret.created_at)},
            {"expires_at", util::timestampToString(secret.expires_at)},
            {"expires_in", util::formatClock(secret.timeUntilExpiration(now))},
            {"is_expired", secret.isExpired(now)},
            {"is_expiring", secret.status(threshold, now) == ExpirationStatus::Expiring}
        };
        auto text = j.dump(2, ' ', false, json::error_handler_t::replace);
        ctx.out << text << '\n';
        sodium_memzero(text.data(), text.size());
        j.clear();
        return 0;
    }

    if (ctx.config.notifications.show_on_get)
        notify::Notifier(ctx.config.notifications, ctx.err).notifyExpiration(key, secret.metadata(), now);

    auto value = secret.valueString();
    ctx.out << value << '\n';
    sodium_memzero(value.data(), value.size());
    return 0;
}

int handleList(core::Locksmith& ls, Context& ctx) {
    const auto items = ls.listWithMetadata();
    if (items.empty()) {
        ctx.out << "No secrets stored.\n";
        return 0;
    }

    const auto threshold = ctx.config.notifications.expiringThreshold();

    ctx.out << fmt::format(kRowFormat, "KEY", "CREATED", "EXPIRES", "STATUS");
    ctx.out << std::string(84, '-') << '\n';

    for (const auto& [key, meta] : items) {
        if (meta.empty()) {
            ctx.out << fmt::format(kRowFormat, truncate(key, 30), "N/A", "N/A", "Unknown");
            continue;
        }

        ctx.out << fmt::format("{:<30} {:<20} {:<20} {}\n", truncate(key, 30),
                               util::dateToString(meta.created_at), util::dateToString(meta.expires_at),
                               statusDisplay(meta, threshold, ctx.config.notifications.show_on_list));
    }

    return 0;
}

int handleDelete(core::Locksmith& ls, const std::vector<std::string>& args, Context& ctx) {
    if (args.empty()) throw InvalidArgumentError("usage: locksmith delete <key>");

    const auto& key = args[0];
    ls.remove(key);
    ctx.out << fmt::format("Successfully deleted secret '{}'\n", key);
    return 0;
}

}

void printUsage(std::ostream& os) {
    os << "Usage: locksmith <command> [arguments]\n"
       << "\nCommands:\n"
       << "  add <key> <secret> [--expires <duration>]  Store a secret (default expires in 30d)\n"
       << "  get <key> [--json]                         Retrieve a secret (requires authentication)\n"
       << "  list                                       List all stored keys and metadata\n"
       << "  delete <key>                               Remove a secret\n"
       << "  help                                       Show this message\n"
       << "\nDurations: <N>d (days), <N>w (weeks), <N>mo (30 days), <N>y (365 days), or h/m/s/ms\n"
       << "           components with optional fractions such as 1h30m or 1.5h\n"
       << "\nFlags:\n"
       << "  -v, --version                              Print the version\n";
}

int run(const std::vector<std::string>& args, Context& ctx) {
    if (args.empty()) {
        printUsage(ctx.out);
        return 1;
    }

    const auto& command = args.front();

    if (command == "--version" || command == "-v") {
        ctx.out << "locksmith v" << LOCKSMITH_VERSION << '\n';
        return 0;
    }

    if (command == "help" || command == "-h" || command == "--help") {
        printUsage(ctx.out);
        return 0;
    }

    if (command != "add" && command != "get" && command != "list" && command != "delete") {
        ctx.err << "Unknown command: " << command << '\n';
        printUsage(ctx.out);
        return 1;
    }

    const std::vector rest(args.begin() + 1, args.end());

    try {
        const auto ls = openOrThrow(ctx);

        if (command == "add") return handleAdd(*ls, rest, ctx);
        if (command == "get") return handleGet(*ls, rest, ctx);
        if (command == "list") return handleList(*ls, ctx);
        return handleDelete(*ls, rest, ctx);
    } catch (const Error& e) {
        log::Registry::cli()->debug("[cli] '{}' failed ({}): {}", command, to_string(e.code), e.what());
        ctx.err << "Error: " << e.what() << '\n';
        return 1;
    }
}

int runSummon(const std::vector<std::string>& args, Context& ctx) {
    if (args.empty()) {
        ctx.err << "Error: No secret identifier provided\n";
        return 1;
    }

    const auto& id = args.front();

    try {
        const auto ls = openOrThrow(ctx);
        auto value = ls->get(id);
        ctx.out << value << std::flush;
        sodium_memzero(value.data(), value.size());
        return 0;
    } catch (const Error& e) {
        log::Registry::cli()->debug("[summon] '{}' failed ({}): {}", id, to_string(e.code), e.what());
        ctx.err << fmt::format("Error retrieving secret '{}': {}\n", id, e.what());
        return 1;
    }
}

}
