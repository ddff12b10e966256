#include "rewind/core/config.hpp"
#include "rewind/core/logging.hpp"
#include "rewind/state_keeper.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <sys/wait.h>

namespace {

using rewindkit::Config;
using rewindkit::Error;
using rewindkit::Json;
using rewindkit::StateKeeper;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;
constexpr int kExitNotFound = 3;

int report(const Error& error) {
    std::cerr << "Error: " << error.full_message() << "\n";
    return error.is_not_found() ? kExitNotFound : kExitFailed;
}

int usage(const char* line) {
    std::cerr << "Usage: rewind-cli " << line << "\n";
    return kExitUsage;
}

// JSON argument, or nullopt with a message on stderr
std::optional<Json> parse_json_arg(const char* text) {
    Json value = Json::parse(text, nullptr, false);
    if (value.is_discarded()) {
        std::cerr << "Error: not valid JSON: " << text << "\n";
        return std::nullopt;
    }
    return value;
}

std::string format_time(rewindkit::core::TimePoint tp) {
    std::time_t t = rewindkit::core::Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string truncate(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

// state show | set <json> | put <key> <json> | clear
int cmd_state(StateKeeper& keeper, int argc, char* argv[]) {
    if (argc < 1) {
        return usage("state show|set <json>|put <key> <json>|clear");
    }
    std::string sub = argv[0];

    if (sub == "show") {
        auto state = keeper.current_state();
        if (!state) {
            std::cerr << "No current state\n";
            return kExitNotFound;
        }
        std::cout << state->dump(2) << "\n";
        if (auto saved = keeper.state_store().last_saved()) {
            std::cerr << "Saved " << format_time(*saved) << "\n";
        }
        return kExitOk;
    }

    if (sub == "set") {
        if (argc < 2) return usage("state set <json>");
        auto value = parse_json_arg(argv[1]);
        if (!value) return kExitUsage;

        auto result = keeper.replace_state(*value);
        if (result.is_err()) return report(result.error());
        std::cout << "State replaced\n";
        return kExitOk;
    }

    if (sub == "put") {
        if (argc < 3) return usage("state put <key> <json>");
        std::string key = argv[1];
        auto value = parse_json_arg(argv[2]);
        if (!value) return kExitUsage;

        auto result = keeper.modify_state([&](Json& doc) {
            if (!doc.is_object()) {
                doc = Json::object();
            }
            doc[key] = *value;
        });
        if (result.is_err()) return report(result.error());
        std::cout << result.value().dump(2) << "\n";
        return kExitOk;
    }

    if (sub == "clear") {
        auto result = keeper.clear_state();
        if (result.is_err()) return report(result.error());
        std::cout << "State cleared\n";
        return kExitOk;
    }

    std::cerr << "Unknown state command: " << sub << "\n";
    return kExitUsage;
}

// snapshot create <description> | list | show <id> | delete <id> | rollback <id>
int cmd_snapshot(StateKeeper& keeper, int argc, char* argv[]) {
    if (argc < 1) {
        return usage("snapshot create <description>|list|show <id>|delete <id>|rollback <id>");
    }
    std::string sub = argv[0];
    auto& snapshots = keeper.snapshots();

    if (sub == "create") {
        std::string description = argc > 1 ? argv[1] : "Manual snapshot";
        auto result = snapshots.create_snapshot(description);
        if (result.is_err()) return report(result.error());
        if (!result.value()) {
            std::cerr << "No current state to snapshot\n";
            return kExitNotFound;
        }
        std::cout << *result.value() << "\n";
        return kExitOk;
    }

    if (sub == "list") {
        auto infos = snapshots.list_snapshots();
        if (infos.empty()) {
            std::cout << "No snapshots.\n";
            return kExitOk;
        }

        std::cout << std::left
                  << std::setw(26) << "ID"
                  << std::setw(22) << "CREATED"
                  << "DESCRIPTION\n";
        std::cout << std::string(80, '-') << "\n";
        for (const auto& info : infos) {
            std::cout << std::left
                      << std::setw(26) << info.id
                      << std::setw(22) << format_time(info.timestamp)
                      << truncate(info.description, 40) << "\n";
        }
        std::cout << "\n" << infos.size() << " of " << snapshots.max_snapshots() << " snapshot(s)\n";
        return kExitOk;
    }

    if (argc < 2) {
        return usage(("snapshot " + sub + " <id>").c_str());
    }
    std::string id = argv[1];

    if (sub == "show") {
        auto snapshot = snapshots.get_snapshot(id);
        if (!snapshot) {
            std::cerr << "Error: Snapshot not found: " << id << "\n";
            return kExitNotFound;
        }
        std::cout << snapshot->to_json().dump(2) << "\n";
        return kExitOk;
    }

    if (sub == "delete") {
        if (!snapshots.get_snapshot(id)) {
            std::cerr << "Error: Snapshot not found: " << id << "\n";
            return kExitNotFound;
        }
        if (!snapshots.delete_snapshot(id)) {
            std::cerr << "Error: could not delete snapshot " << id << "\n";
            return kExitFailed;
        }
        std::cout << "Deleted snapshot " << id << "\n";
        return kExitOk;
    }

    if (sub == "rollback") {
        auto result = snapshots.rollback(id);
        if (result.is_err()) return report(result.error());
        std::cout << "Rolled back to " << id << "\n";
        return kExitOk;
    }

    std::cerr << "Unknown snapshot command: " << sub << "\n";
    return kExitUsage;
}

int print_document(const rewindkit::documents::Document& doc) {
    std::cout << doc.to_json().dump(2) << "\n";
    return kExitOk;
}

// doc create [title] [payload] | list | show | append | update | pin | unpin | delete | export | stats
int cmd_doc(StateKeeper& keeper, int argc, char* argv[]) {
    if (argc < 1) {
        return usage("doc create|list|show|append|update|pin|unpin|delete|export|stats");
    }
    std::string sub = argv[0];
    auto& docs = keeper.documents();

    if (sub == "create") {
        std::optional<std::string> title;
        Json payload = Json::object();
        if (argc > 1) title = argv[1];
        if (argc > 2) {
            auto parsed = parse_json_arg(argv[2]);
            if (!parsed) return kExitUsage;
            payload = std::move(*parsed);
        }

        auto result = docs.create(std::move(payload), title);
        if (result.is_err()) return report(result.error());
        std::cout << result.value() << "\n";
        return kExitOk;
    }

    if (sub == "list") {
        auto all = docs.list();
        if (all.empty()) {
            std::cout << "No documents.\n";
            return kExitOk;
        }

        auto current = docs.current_id();
        std::cout << std::left
                  << std::setw(3) << ""
                  << std::setw(14) << "ID"
                  << std::setw(34) << "TITLE"
                  << std::setw(9) << "ENTRIES"
                  << "UPDATED\n";
        std::cout << std::string(80, '-') << "\n";
        for (const auto& doc : all) {
            std::string marks;
            marks += doc.pinned ? '*' : ' ';
            marks += (current && *current == doc.id) ? '>' : ' ';
            std::cout << std::left
                      << std::setw(3) << marks
                      << std::setw(14) << doc.id
                      << std::setw(34) << truncate(doc.title, 33)
                      << std::setw(9) << doc.entries.size()
                      << format_time(doc.updated_at) << "\n";
        }
        std::cout << "\n" << all.size() << " document(s)\n";
        return kExitOk;
    }

    if (sub == "stats") {
        std::cout << docs.stats().to_json().dump(2) << "\n";
        return kExitOk;
    }

    if (argc < 2) {
        return usage(("doc " + sub + " <id>").c_str());
    }
    std::string id = argv[1];

    if (sub == "show") {
        auto doc = docs.get(id);
        if (!doc) {
            std::cerr << "Error: Document not found: " << id << "\n";
            return kExitNotFound;
        }
        return print_document(*doc);
    }

    if (sub == "export") {
        auto text = docs.export_as_text(id);
        if (text.is_err()) return report(text.error());
        std::cout << text.value();
        return kExitOk;
    }

    rewindkit::Result<void, Error> result;
    if (sub == "append" || sub == "update") {
        if (argc < 3) return usage(("doc " + sub + " <id> <json>").c_str());
        auto value = parse_json_arg(argv[2]);
        if (!value) return kExitUsage;
        result = sub == "append" ? docs.append(id, std::move(*value))
                                 : docs.update(id, std::move(*value));
    } else if (sub == "pin" || sub == "unpin") {
        result = docs.set_pinned(id, sub == "pin");
    } else if (sub == "delete") {
        result = docs.remove(id);
    } else {
        std::cerr << "Unknown doc command: " << sub << "\n";
        return kExitUsage;
    }

    if (result.is_err()) return report(result.error());
    std::cout << "OK\n";
    return kExitOk;
}

// guard <deadline-ms> <shell-command>
int cmd_guard(StateKeeper& keeper, int argc, char* argv[]) {
    if (argc < 2) {
        return usage("guard <deadline-ms> <shell-command>");
    }

    long deadline_ms = std::strtol(argv[0], nullptr, 10);
    if (deadline_ms <= 0) {
        std::cerr << "Error: deadline must be a positive number of milliseconds\n";
        return kExitUsage;
    }
    std::string command = argv[1];

    auto& snapshots = keeper.snapshots();
    auto guard = snapshots.prepare_auto_rollback(command, rewindkit::core::Duration{deadline_ms});
    if (!guard.is_active()) {
        std::cerr << "Warning: no current state, running without a rollback guard\n";
    }

    int status = std::system(command.c_str());
    int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;

    bool guarded = guard.state() != rewindkit::rollback::GuardState::Inactive;

    if (exit_code == 0) {
        if (guarded && !guard.disarm()) {
            std::cerr << "Deadline passed: state rolled back to " << *guard.snapshot_id() << "\n";
            return kExitFailed;
        }
        std::cout << "Command succeeded" << (guarded ? ", rollback disarmed" : "") << "\n";
        return kExitOk;
    }

    // Failed before the deadline: roll back now rather than waiting it out
    if (guard.disarm()) {
        auto result = snapshots.rollback(*guard.snapshot_id());
        if (result.is_err()) return report(result.error());
        std::cerr << "Command failed (exit " << exit_code << "): state rolled back to "
                  << *guard.snapshot_id() << "\n";
    } else if (guard.state() == rewindkit::rollback::GuardState::Fired) {
        std::cerr << "Deadline passed: state rolled back to " << *guard.snapshot_id() << "\n";
    } else {
        std::cerr << "Command failed (exit " << exit_code << ")\n";
    }
    return kExitFailed;
}

int show_usage() {
    std::cerr << "Usage: rewind-cli [--config <path>] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  state show | set <json> | put <key> <json> | clear\n"
              << "  snapshot create <description> | list | show <id> | delete <id> | rollback <id>\n"
              << "  doc create [title] [json] | list | show <id> | append <id> <json>\n"
              << "      | update <id> <json> | pin <id> | unpin <id> | delete <id>\n"
              << "      | export <id> | stats\n"
              << "  guard <deadline-ms> <shell-command>\n";
    return kExitUsage;
}

}  // namespace

int main(int argc, char* argv[]) {
    int arg = 1;
    std::optional<std::string> config_path;
    if (argc > 2 && std::string(argv[1]) == "--config") {
        config_path = argv[2];
        arg = 3;
    }
    if (argc <= arg) {
        return show_usage();
    }

    Config config;
    if (config_path) {
        auto loaded = Config::load(*config_path);
        if (loaded.is_err()) return report(loaded.error());
        config = std::move(loaded).value();
    } else {
        config = Config::load_or_default(Config::default_path());
    }
    config.apply_environment();
    config.expand_paths();

    auto logging = rewindkit::core::init_logging(config.observability);
    if (logging.is_err()) {
        std::cerr << "Warning: " << logging.error().full_message() << "\n";
    }

    std::string cmd = argv[arg];
    int sub_argc = argc - arg - 1;
    char** sub_argv = argv + arg + 1;

    if (cmd != "state" && cmd != "snapshot" && cmd != "doc" && cmd != "guard") {
        std::cerr << "Unknown command: " << cmd << "\n";
        return show_usage();
    }

    StateKeeper keeper(config);
    auto opened = keeper.open();
    if (opened.is_err()) return report(opened.error());

    int code = kExitUsage;
    if (cmd == "state")    code = cmd_state(keeper, sub_argc, sub_argv);
    if (cmd == "snapshot") code = cmd_snapshot(keeper, sub_argc, sub_argv);
    if (cmd == "doc")      code = cmd_doc(keeper, sub_argc, sub_argv);
    if (cmd == "guard")    code = cmd_guard(keeper, sub_argc, sub_argv);

    keeper.close();
    spdlog::shutdown();
    return code;
}
