#include "peer_session.hpp"

#include <iostream>

using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

namespace {

// PeerServiceImpl is the inbound half of the session. Deliver acknowledges at
// once and leaves the work to the owning context.
class PeerServiceImpl final : public wsync::PeerService::Service {
public:
    explicit PeerServiceImpl(PeerSession* session) : session_(session) {}

    Status Deliver(ServerContext*, const wsync::Envelope* req, wsync::DeliverReply*) override {
        session_->handle_inbound(*req);
        return Status::OK;
    }

    // Answering at all means this app is installed and running.
    Status Ping(ServerContext*, const wsync::PingRequest*, wsync::PingReply* reply) override {
        reply->set_role(session_->role());
        reply->set_app_installed(true);
        return Status::OK;
    }

private:
    PeerSession* session_;
};

}  // namespace

const char* message_kind_name(MessageKind kind) {
    switch (kind) {
        case MessageKind::SelectedTheme: return "selected-theme";
        case MessageKind::WorkoutData: return "workout-data";
        case MessageKind::SetCompletion: return "set-completion";
        case MessageKind::SetUncomplete: return "set-uncomplete";
        case MessageKind::RequestSync: return "request-sync";
    }
    return "unknown";
}

// Theme first so a snapshot observer already sees the theme it came with.
std::vector<MessageKind> kinds_in(const wsync::Envelope& message) {
    std::vector<MessageKind> kinds;
    if (message.has_selected_theme()) kinds.push_back(MessageKind::SelectedTheme);
    if (message.has_workout_data()) kinds.push_back(MessageKind::WorkoutData);
    if (message.has_set_completion()) kinds.push_back(MessageKind::SetCompletion);
    if (message.has_set_uncomplete()) kinds.push_back(MessageKind::SetUncomplete);
    if (message.has_request_sync()) kinds.push_back(MessageKind::RequestSync);
    return kinds;
}

PeerSession::PeerSession(wsync::PeerRole role, PeerLink& link, MainContext& context,
                         std::chrono::milliseconds ping_interval)
    : role_(role), link_(link), context_(context), ping_interval_(ping_interval) {}

PeerSession::~PeerSession() {
    deactivate();
}

bool PeerSession::activate(const std::string& listen_address) {
    if (server_) return true;

    service_ = std::make_unique<PeerServiceImpl>(this);
    ServerBuilder builder;
    builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
    if (!server_) {
        std::cerr << "[session] cannot listen on " << listen_address << "\n";
        service_.reset();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = false;
    }
    monitor_ = std::thread([this] { monitor_loop(); });

    context_.post([this] {
        if (activated_handler_) activated_handler_();
    });
    return true;
}

void PeerSession::deactivate() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable()) monitor_.join();

    if (server_) {
        server_->Shutdown();
        server_.reset();
    }
    service_.reset();
}

void PeerSession::on(MessageKind kind, Handler handler) {
    handlers_[kind] = std::move(handler);
}

void PeerSession::handle_inbound(const wsync::Envelope& message) {
    context_.post([this, message] { dispatch(message); });
}

void PeerSession::dispatch(const wsync::Envelope& message) {
    for (MessageKind kind : kinds_in(message)) {
        auto it = handlers_.find(kind);
        if (it == handlers_.end()) continue;
        it->second(message);
    }
}

// Install state is sticky: an unreachable peer keeps its last known value.
void PeerSession::update_status(const PeerStatus& status) {
    if (status.app_installed && !installed_) {
        installed_ = true;
        if (install_handler_) install_handler_(true);
    }
    if (status.reachable != reachable_) {
        reachable_ = status.reachable;
        std::cout << "[session] peer " << (reachable_ ? "reachable" : "unreachable") << "\n";
        if (reachability_handler_) reachability_handler_(reachable_);
    }
}

void PeerSession::monitor_loop() {
    std::unique_lock<std::mutex> lock(monitor_mutex_);
    while (!monitor_stop_) {
        lock.unlock();
        PeerStatus status = link_.probe(role_);
        context_.post([this, status] { update_status(status); });
        lock.lock();
        monitor_cv_.wait_for(lock, ping_interval_, [this] { return monitor_stop_; });
    }
}
