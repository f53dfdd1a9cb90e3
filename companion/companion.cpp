#include <filesystem>
#include <iostream>
#include <string>

#include "clock.hpp"
#include "config.hpp"
#include "console.hpp"
#include "linux_platform.hpp"
#include "main_context.hpp"
#include "peer_link.hpp"
#include "peer_session.hpp"
#include "rest_timer.hpp"
#include "shared_defaults.hpp"
#include "shared_state_bridge.hpp"
#include "sync_service.hpp"
#include "transport.hpp"
#include "workout_progress.hpp"

static constexpr const char* kThemeKey = "selectedTheme";

// -------------------- console --------------------

static void print_help() {
    std::cout << "commands:\n"
              << "  show               print the workout\n"
              << "  next               show what to record next\n"
              << "  record             record the next set or group round\n"
              << "  complete <set-id>  record one specific set\n"
              << "  yes | no           answer a pending rest prompt\n"
              << "  start <seconds>    start a rest countdown\n"
              << "  add <seconds>      extend the running countdown\n"
              << "  skip               end the countdown early\n"
              << "  dismiss            silence the alarm\n"
              << "  bg | fg            move to background / foreground\n"
              << "  timer              countdown status\n"
              << "  sync               ask the handheld for the workout\n"
              << "  quit\n";
}

static void print_next(const NextItem& item) {
    switch (item.kind) {
        case NextItem::Kind::None:
            std::cout << "workout complete\n";
            break;
        case NextItem::Kind::Set:
            std::cout << item.exercise->name << " set " << item.set_number << "/" << item.total_sets
                      << "  " << item.set->id.value << "\n";
            break;
        case NextItem::Kind::GroupRound:
            std::cout << "group " << item.group->order_index << " round " << item.round << "/"
                      << item.group->set_count << "\n";
            for (const auto& member : item.group->exercises) std::cout << "  " << member.name << "\n";
            break;
    }
}

/*
 * CompanionApp
 * The companion records sets against the handheld's plan and runs the rest
 * timer that follows them. Every timer transition is mirrored to the shared
 * state bridge by the engine itself.
 */
class CompanionApp {
public:
    CompanionApp(MainContext& context, WorkoutSyncService& sync, RestTimerEngine& timer,
                 SharedDefaults& defaults)
        : context_(context), sync_(sync), timer_(timer), defaults_(defaults) {}

    void wire() {
        sync_.on_theme([this](const std::string& theme) {
            std::string current;
            if (defaults_.get(kThemeKey, current) && current == theme) return;
            if (!defaults_.set(kThemeKey, theme)) {
                std::cerr << "[sync] cannot persist theme " << theme << "\n";
                return;
            }
            std::cout << "[sync] theme " << theme << "\n";
        });
        sync_.on_status([](bool reachable, bool installed) {
            std::cout << "[session] handheld " << (reachable ? "reachable" : "unreachable")
                      << (installed ? "" : " (not installed)") << "\n";
        });
        sync_.subscribe([this](const WorkoutSnapshot&) {
            if (!announced_ && sync_.last_sync()) {
                announced_ = true;
                std::cout << "[sync] workout received\n";
            }
        });
        timer_.on_change([](const TimerSnapshot& t) {
            std::cout << "[timer] " << timer_state_name(t.state) << " total=" << t.total_duration
                      << "s\n";
        });
    }

    void command(const std::string& cmd, const std::string& arg) {
        if (cmd == "show") {
            if (!sync_.snapshot()) {
                std::cout << (sync_.reachable() ? "syncing..." : "waiting for handheld...") << "\n";
                return;
            }
            print_snapshot(std::cout, *sync_.snapshot());
        } else if (cmd == "next") {
            if (sync_.snapshot()) print_next(next_incomplete(*sync_.snapshot()));
        } else if (cmd == "record") {
            record_next();
        } else if (cmd == "complete") {
            Uuid id;
            if (!Uuid::parse(arg, id)) {
                std::cerr << "complete needs <set-id>\n";
                return;
            }
            sync_.record_set(id);
        } else if (cmd == "yes") {
            if (pending_rest_ > 0) timer_.start(pending_rest_);
            pending_rest_ = 0;
        } else if (cmd == "no") {
            pending_rest_ = 0;
        } else if (cmd == "start" || cmd == "add") {
            int seconds = 0;
            try {
                seconds = std::stoi(arg);
            } catch (const std::exception&) {
                std::cerr << cmd << " needs <seconds>\n";
                return;
            }
            const bool ok = cmd == "start" ? timer_.start(seconds) : timer_.add_time(seconds);
            if (!ok) std::cout << "not allowed while " << timer_state_name(timer_.state()) << "\n";
        } else if (cmd == "skip") {
            timer_.skip();
        } else if (cmd == "dismiss") {
            timer_.dismiss();
        } else if (cmd == "bg") {
            timer_.enter_background();
        } else if (cmd == "fg") {
            timer_.enter_foreground();
        } else if (cmd == "timer") {
            std::cout << timer_state_name(timer_.state()) << " " << timer_.formatted_remaining()
                      << " progress=" << timer_.progress() << "\n";
        } else if (cmd == "sync") {
            std::cout << "[transport] request-sync: " << send_outcome_name(sync_.request_sync())
                      << "\n";
        } else if (cmd == "quit") {
            context_.stop();
        } else {
            print_help();
        }
    }

private:
    /*
     * record_next
     * Records the next set, or every open set of the active group round, then
     * decides on rest. A group's last round never rests.
     */
    void record_next() {
        if (!sync_.snapshot()) return;
        const NextItem item = next_incomplete(*sync_.snapshot());

        std::optional<int> rest;
        bool rest_allowed = true;
        if (item.kind == NextItem::Kind::Set) {
            rest = item.set->rest_seconds;
            sync_.record_set(item.set->id);
        } else if (item.kind == NextItem::Kind::GroupRound) {
            rest = item.group->round_rest_seconds;
            rest_allowed = item.round < item.group->set_count;
            for (const Uuid& id : round_set_ids(*item.group, item.round)) sync_.record_set(id);
        } else {
            std::cout << "workout complete\n";
            return;
        }
        if (!rest_allowed) return;

        const bool finished = next_incomplete(*sync_.snapshot()).kind == NextItem::Kind::None;
        const RestDecision decision = rest_after_completion(*sync_.snapshot(), rest, finished);
        if (decision.seconds <= 0) return;
        if (decision.auto_start) {
            timer_.start(decision.seconds);
        } else {
            pending_rest_ = decision.seconds;
            std::cout << "start rest " << decision.seconds << "s? (yes/no)\n";
        }
    }

    MainContext& context_;
    WorkoutSyncService& sync_;
    RestTimerEngine& timer_;
    SharedDefaults& defaults_;
    int pending_rest_ = 0;
    bool announced_ = false;
};

// -------------------- main() --------------------

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: ./wsync_companion <config>\n";
        return 1;
    }

    Config cfg;
    std::string error;
    if (!load_config(argv[1], cfg, error)) {
        std::cerr << "config: " << error << "\n";
        return 1;
    }
    if (!cfg.role.empty() && cfg.role != "companion") {
        std::cerr << "config: role is " << cfg.role << ", expected companion\n";
        return 1;
    }
    if (cfg.listen.empty() || cfg.peer.empty()) {
        std::cerr << "config: listen and peer are required\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.data_dir, ec);
    if (ec) {
        std::cerr << "cannot create " << cfg.data_dir << ": " << ec.message() << "\n";
        return 1;
    }
    std::filesystem::create_directories(cfg.shared_dir, ec);
    if (ec) {
        std::cerr << "cannot create " << cfg.shared_dir << ": " << ec.message() << "\n";
        return 1;
    }

    MainContext context;
    SystemClock clock;
    GrpcPeerLink link(cfg.peer, cfg.send_deadline);
    DurableOutbox outbox(cfg.data_dir + "/companion.outbox");
    if (!outbox.load()) {
        std::cerr << "[transport] continuing with an empty outbox\n";
    }
    TransportSelector transport(link, outbox, cfg.verbose);

    PeerSession session(wsync::ROLE_COMPANION, link, context, cfg.ping_interval);
    WorkoutSyncService sync(DeviceRole::Companion, transport, clock);
    sync.attach(session);

    SharedDefaults defaults(cfg.shared_dir);
    SharedStateBridge bridge(defaults, clock);

    ThreadedGrant grant(cfg.grant_limit);
    ThreadedAlertScheduler alerts([](const std::string& name, const std::string& body) {
        std::cout << "[alert] " << name << ": " << body << std::endl;
    });
    TerminalHaptics haptics;
    TimerOptions options;
    options.tick_interval = cfg.tick_interval;
    options.haptic_interval = cfg.haptic_interval;
    RestTimerEngine timer(context, clock, grant, alerts, haptics, &bridge, options);

    CompanionApp app(context, sync, timer, defaults);
    app.wire();

    // A stale record from an earlier run would otherwise read as a live timer.
    if (!bridge.save(SharedStateBridge::default_state())) {
        std::cerr << "[bridge] cannot write to " << cfg.shared_dir << "\n";
    }

    if (!session.activate(cfg.listen)) return 1;
    std::cout << "Companion running at " << cfg.listen << ", handheld at " << cfg.peer << std::endl;

    Console console(context, [&](const std::string& cmd, const std::string& arg) {
        app.command(cmd, arg);
    });
    console.start();

    context.run();
    timer.stop();
    session.deactivate();
    return 0;
}
