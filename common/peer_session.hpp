#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "wsync.grpc.pb.h"

#include "main_context.hpp"
#include "peer_link.hpp"

// Recognized envelope keys.
enum class MessageKind { SelectedTheme, WorkoutData, SetCompletion, SetUncomplete, RequestSync };

const char* message_kind_name(MessageKind kind);

// kinds_in lists the kinds present in |message| in dispatch order.
std::vector<MessageKind> kinds_in(const wsync::Envelope& message);

/*
 * PeerSession
 * Owns the paired-device connection lifecycle:
 *  - activation: starts the local PeerService and the reachability monitor;
 *  - reachability: the monitor pings the peer every interval and reports
 *    changes on the owning context;
 *  - install state: whether the peer app has ever answered as installed;
 *  - routing: inbound envelopes arrive on gRPC threads, hop onto the owning
 *    context and are handed to the handler registered for each present kind.
 */
class PeerSession {
public:
    using Handler = std::function<void(const wsync::Envelope&)>;
    using StatusHandler = std::function<void(bool)>;

    PeerSession(wsync::PeerRole role, PeerLink& link, MainContext& context,
                std::chrono::milliseconds ping_interval);
    ~PeerSession();

    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    // Binds |listen_address| and starts monitoring. Returns false when the
    // server cannot be started.
    bool activate(const std::string& listen_address);
    void deactivate();

    void on(MessageKind kind, Handler handler);
    void on_activated(std::function<void()> handler) { activated_handler_ = std::move(handler); }
    void on_reachability_changed(StatusHandler handler) { reachability_handler_ = std::move(handler); }
    void on_install_changed(StatusHandler handler) { install_handler_ = std::move(handler); }

    // Owning-context view of the peer.
    bool reachable() const { return reachable_; }
    bool peer_installed() const { return installed_; }
    wsync::PeerRole role() const { return role_; }

    // Any thread. Marshals |message| onto the owning context.
    void handle_inbound(const wsync::Envelope& message);

    // Owning context only.
    void dispatch(const wsync::Envelope& message);
    void update_status(const PeerStatus& status);

private:
    void monitor_loop();

    wsync::PeerRole role_;
    PeerLink& link_;
    MainContext& context_;
    std::chrono::milliseconds ping_interval_;

    std::map<MessageKind, Handler> handlers_;
    std::function<void()> activated_handler_;
    StatusHandler reachability_handler_;
    StatusHandler install_handler_;
    bool reachable_ = false;
    bool installed_ = false;

    std::unique_ptr<wsync::PeerService::Service> service_;
    std::unique_ptr<grpc::Server> server_;
    std::thread monitor_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_ = false;
};
