/**
 * hookstack - hook orchestration engine
 *
 * One process per host event: reads the event JSON from stdin and writes
 * exactly one decision JSON to stdout. Logs go to stderr.
 */
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/paths.hpp"
#include "core/util.hpp"
#include "engine/dispatcher.hpp"
#include "engine/engine_config.hpp"
#include "hooks/agent_registry.hpp"
#include "hooks/event.hpp"
#include <filesystem>
#include <iostream>
#include <iterator>
#include <string>
#include <nlohmann/json.hpp>

#ifndef HOOKSTACK_VERSION
#define HOOKSTACK_VERSION "0.0.0"
#endif

using json = nlohmann::json;
using namespace hookstack;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;      // EX_USAGE
constexpr int kExitSoftware = 70;   // EX_SOFTWARE

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--status [--session ID]] [--version]\n"
              << "  Reads one hook event as JSON from stdin and prints the decision.\n";
}

// A decision for input we cannot interpret. The host should not be blocked
// by events this engine does not handle.
void print_passthrough(const std::string& warning) {
    json out = {{"admit", true}, {"message", "Warning: " + warning}, {"stage", "complete"}};
    std::cout << out.dump() << std::endl;
}

// A write we cannot interpret is refused rather than waved through.
void print_blocked(const std::string& reason) {
    json out = {{"admit", false}, {"message", "Write blocked: " + reason}, {"stage", "blocked"}};
    std::cout << out.dump() << std::endl;
}

engine::Dispatcher make_dispatcher(const std::filesystem::path& project) {
    return engine::Dispatcher(engine::load_engine_config(project),
                              hooks::AgentRegistry::load(engine::agents_path(project)),
                              project);
}

int run_status(const std::filesystem::path& project, const std::string& session_id) {
    try {
        auto dispatcher = make_dispatcher(project);
        std::cout << dispatcher.status(session_id, core::Clock::now()).dump(2) << std::endl;
        return kExitOk;
    } catch (const std::exception& e) {
        spdlog::error("Status failed: {}", e.what());
        return kExitSoftware;
    }
}

int run_event(const std::filesystem::path& project) {
    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    json j;
    try {
        j = json::parse(input);
    } catch (const json::exception& e) {
        spdlog::warn("Malformed hook event: {}", e.what());
        print_passthrough("hookstack could not parse the hook event");
        return kExitOk;
    }

    hooks::HookEvent event;
    try {
        event = hooks::parse_hook_event(j, core::Clock::now());
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring hook event: {}", e.what());
        if (hooks::is_write_gating_payload(j)) {
            print_blocked(std::string("hookstack could not interpret the event: ") + e.what());
        } else {
            print_passthrough(std::string("hookstack ignored the event: ") + e.what());
        }
        return kExitOk;
    }

    engine::Decision decision;
    try {
        auto dispatcher = make_dispatcher(project);
        decision = dispatcher.dispatch(event);
    } catch (const std::exception& e) {
        spdlog::error("Cannot start dispatcher: {}", e.what());
        decision.internal_fault = true;
        decision.admit = !event.is_write_gating();
        decision.stage = decision.admit ? engine::Stage::COMPLETE : engine::Stage::BLOCKED;
        decision.message = std::string(decision.admit ? "Warning: hookstack internal error: "
                                                      : "Write blocked: internal error in hookstack: ") + e.what();
    }

    std::cout << decision.to_json().dump() << std::endl;
    return decision.internal_fault ? kExitSoftware : kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    bool status = false;
    std::string session_id = "default";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version") {
            std::cout << "hookstack " << HOOKSTACK_VERSION << std::endl;
            return kExitOk;
        } else if (arg == "--status") {
            status = true;
        } else if (arg == "--session" && i + 1 < argc) {
            session_id = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return kExitOk;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return kExitUsage;
        }
    }

    const auto project = core::paths::project_dir();
    const auto exported = core::config::load_dotenv(project);

    core::init_logger(core::config::get_env("HOOKSTACK_LOG_FILE"));
    core::set_log_level(core::parse_log_level(core::config::get_env("HOOKSTACK_LOG_LEVEL"),
                                              spdlog::level::warn));
    spdlog::debug("Loaded {} variable(s) from {}/.env", exported, project.string());

    return status ? run_status(project, session_id) : run_event(project);
}
