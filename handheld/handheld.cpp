#include <filesystem>
#include <iostream>
#include <string>

#include "clock.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "console.hpp"
#include "linux_platform.hpp"
#include "main_context.hpp"
#include "peer_link.hpp"
#include "peer_session.hpp"
#include "rest_timer.hpp"
#include "sync_service.hpp"
#include "transport.hpp"
#include "workout_progress.hpp"

// -------------------- console --------------------

static void print_help() {
    std::cout << "commands:\n"
              << "  show                 print the workout\n"
              << "  complete <set-id>    mark a set completed and publish\n"
              << "  uncomplete <set-id>  mark a set not completed and tell the companion\n"
              << "  publish              send the current workout\n"
              << "  theme <code>         change the companion's theme\n"
              << "  rest <seconds>       start a rest countdown\n"
              << "  stop                 stop the rest countdown or alarm\n"
              << "  status               peer and timer status\n"
              << "  quit\n";
}

/*
 * HandheldApp
 * The handheld owns the workout plan. It publishes the plan whenever it
 * changes or the companion asks, and applies the companion's completions.
 */
class HandheldApp {
public:
    HandheldApp(MainContext& context, WorkoutSyncService& sync, RestTimerEngine& timer)
        : context_(context), sync_(sync), timer_(timer) {}

    void wire() {
        sync_.on_set_completed([this](const Uuid& id) {
            std::cout << "[sync] companion completed set " << id.value << "\n";
            republish();
        });
        sync_.on_sync_requested([this] {
            std::cout << "[sync] companion requested sync\n";
            republish();
        });
        sync_.on_status([](bool reachable, bool installed) {
            std::cout << "[session] companion " << (reachable ? "reachable" : "unreachable")
                      << (installed ? "" : " (not installed)") << "\n";
        });
        timer_.on_change([](const TimerSnapshot& t) {
            std::cout << "[timer] " << timer_state_name(t.state) << " total=" << t.total_duration
                      << "s\n";
        });
    }

    void command(const std::string& cmd, const std::string& arg) {
        if (cmd == "show") {
            if (sync_.snapshot()) print_snapshot(std::cout, *sync_.snapshot());
        } else if (cmd == "complete" || cmd == "uncomplete") {
            Uuid id;
            if (!Uuid::parse(arg, id)) {
                std::cerr << cmd << " needs <set-id>\n";
                return;
            }
            const bool done = cmd == "complete";
            const bool found = done ? sync_.mark_set_completed(id) : sync_.mark_set_uncompleted(id);
            if (!found) {
                std::cout << "no set " << id.value << "\n";
                return;
            }
            if (!done) report("set-uncomplete", sync_.send_set_uncomplete(id));
            republish();
        } else if (cmd == "publish") {
            republish();
        } else if (cmd == "theme") {
            if (arg.empty()) {
                std::cerr << "theme needs <code>\n";
                return;
            }
            report("selected-theme", sync_.send_theme(arg));
        } else if (cmd == "rest") {
            int seconds = 0;
            try {
                seconds = std::stoi(arg);
            } catch (const std::exception&) {
                std::cerr << "rest needs <seconds>\n";
                return;
            }
            if (!timer_.start(seconds)) std::cout << "timer busy or bad duration\n";
        } else if (cmd == "stop") {
            timer_.stop();
        } else if (cmd == "status") {
            std::cout << "reachable=" << sync_.reachable() << " installed=" << sync_.peer_installed()
                      << " timer=" << timer_state_name(timer_.state()) << " "
                      << timer_.formatted_remaining() << "\n";
        } else if (cmd == "quit") {
            context_.stop();
        } else {
            print_help();
        }
    }

    void republish() {
        if (!sync_.snapshot()) return;
        report("workout-data", sync_.publish(*sync_.snapshot()));
    }

private:
    static void report(const char* what, SendOutcome outcome) {
        std::cout << "[transport] " << what << ": " << send_outcome_name(outcome) << "\n";
    }

    MainContext& context_;
    WorkoutSyncService& sync_;
    RestTimerEngine& timer_;
};

// -------------------- main() --------------------

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "Usage: ./wsync_handheld <config> <workout.textproto>\n";
        return 1;
    }

    Config cfg;
    std::string error;
    if (!load_config(argv[1], cfg, error)) {
        std::cerr << "config: " << error << "\n";
        return 1;
    }
    if (!cfg.role.empty() && cfg.role != "handheld") {
        std::cerr << "config: role is " << cfg.role << ", expected handheld\n";
        return 1;
    }
    if (cfg.listen.empty() || cfg.peer.empty()) {
        std::cerr << "config: listen and peer are required\n";
        return 1;
    }

    WorkoutSnapshot workout;
    if (!load_workout_textproto(argv[2], workout, error)) {
        std::cerr << "workout: " << error << "\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.data_dir, ec);
    if (ec) {
        std::cerr << "cannot create " << cfg.data_dir << ": " << ec.message() << "\n";
        return 1;
    }

    MainContext context;
    SystemClock clock;
    GrpcPeerLink link(cfg.peer, cfg.send_deadline);
    DurableOutbox outbox(cfg.data_dir + "/handheld.outbox");
    if (!outbox.load()) {
        std::cerr << "[transport] continuing with an empty outbox\n";
    }
    TransportSelector transport(link, outbox, cfg.verbose);

    PeerSession session(wsync::ROLE_HANDHELD, link, context, cfg.ping_interval);
    WorkoutSyncService sync(DeviceRole::Handheld, transport, clock);
    sync.set_selected_theme(cfg.theme);
    sync.attach(session);

    ThreadedGrant grant(cfg.grant_limit);
    ThreadedAlertScheduler alerts([](const std::string& name, const std::string& body) {
        std::cout << "[alert] " << name << ": " << body << std::endl;
    });
    TerminalHaptics haptics;
    TimerOptions options;
    options.tick_interval = cfg.tick_interval;
    options.haptic_interval = cfg.haptic_interval;
    RestTimerEngine timer(context, clock, grant, alerts, haptics, nullptr, options);

    HandheldApp app(context, sync, timer);
    app.wire();

    if (!session.activate(cfg.listen)) return 1;
    std::cout << "Handheld running at " << cfg.listen << ", companion at " << cfg.peer << std::endl;

    context.post([&] {
        sync.adopt(workout);
        app.republish();
    });

    Console console(context, [&](const std::string& cmd, const std::string& arg) {
        app.command(cmd, arg);
    });
    console.start();

    context.run();
    timer.stop();
    session.deactivate();
    return 0;
}
