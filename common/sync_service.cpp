#include "sync_service.hpp"

#include <iostream>

#include "codec.hpp"

WorkoutSyncService::WorkoutSyncService(DeviceRole role, TransportSelector& transport, const Clock& clock)
    : role_(role), transport_(transport), clock_(clock) {}

void WorkoutSyncService::attach(PeerSession& session) {
    session.on(MessageKind::SelectedTheme, [this](const wsync::Envelope& m) {
        handle_theme(m.selected_theme());
    });
    session.on(MessageKind::WorkoutData, [this](const wsync::Envelope& m) {
        handle_workout_data(m.workout_data());
    });
    session.on(MessageKind::SetCompletion, [this](const wsync::Envelope& m) {
        handle_set_completion(m.set_completion());
    });
    session.on(MessageKind::SetUncomplete, [this](const wsync::Envelope& m) {
        handle_set_uncomplete(m.set_uncomplete());
    });
    session.on(MessageKind::RequestSync, [this](const wsync::Envelope&) {
        handle_request_sync();
    });

    // The companion asks for a fresh snapshot as soon as it can talk to the
    // handheld; the request is queued if the handheld is asleep.
    session.on_activated([this] {
        if (role_ == DeviceRole::Companion) request_sync();
    });
    session.on_reachability_changed([this](bool reachable) {
        reachable_ = reachable;
        if (reachable) {
            transport_.flush_pending();
            if (role_ == DeviceRole::Companion) request_sync();
        }
        status_changed();
    });
    session.on_install_changed([this](bool installed) {
        peer_installed_ = installed;
        status_changed();
    });
}

// -------------------- outbound --------------------

SendOutcome WorkoutSyncService::publish(const WorkoutSnapshot& snapshot) {
    std::string bytes;
    if (!encode_snapshot(snapshot, bytes)) {
        std::cerr << "[sync] cannot encode workout snapshot\n";
        return SendOutcome::Failed;
    }
    wsync::Envelope message;
    message.set_workout_data(bytes);
    if (role_ == DeviceRole::Handheld && !selected_theme_.empty()) {
        message.set_selected_theme(selected_theme_);
    }
    return transport_.send(message, Delivery::ContextWhenUnreachable);
}

SendOutcome WorkoutSyncService::request_sync() {
    wsync::Envelope message;
    message.set_request_sync(true);
    return transport_.send(message, Delivery::QueueWhenUnreachable);
}

SendOutcome WorkoutSyncService::send_set_completion(const Uuid& set_id, TimePoint completed_at) {
    std::string bytes;
    if (!encode_set_completion(set_id, completed_at, bytes)) {
        std::cerr << "[sync] cannot encode set completion\n";
        return SendOutcome::Failed;
    }
    wsync::Envelope message;
    message.set_set_completion(bytes);
    return transport_.send(message, Delivery::QueueWhenUnreachable);
}

SendOutcome WorkoutSyncService::send_set_uncomplete(const Uuid& set_id) {
    wsync::Envelope message;
    message.set_set_uncomplete(set_id.value);
    return transport_.send(message, Delivery::ImmediateOnly);
}

SendOutcome WorkoutSyncService::send_theme(const std::string& theme) {
    selected_theme_ = theme;
    wsync::Envelope message;
    message.set_selected_theme(theme);
    return transport_.send(message, Delivery::ImmediateOnly);
}

// The completion goes out even when the set is not known locally yet: the
// handheld owns the plan and will recognize it.
bool WorkoutSyncService::record_set(const Uuid& set_id) {
    bool known = mark_set_completed(set_id);
    TimePoint at = stamp_now(clock_);
    if (known) {
        const SetRecord* set = find_set(*snapshot_, set_id);
        if (set && set->completed_at) at = *set->completed_at;
    }
    send_set_completion(set_id, at);
    return known;
}

// -------------------- inbound --------------------

void WorkoutSyncService::on_receive(const wsync::Envelope& message) {
    for (MessageKind kind : kinds_in(message)) {
        switch (kind) {
            case MessageKind::SelectedTheme: handle_theme(message.selected_theme()); break;
            case MessageKind::WorkoutData: handle_workout_data(message.workout_data()); break;
            case MessageKind::SetCompletion: handle_set_completion(message.set_completion()); break;
            case MessageKind::SetUncomplete: handle_set_uncomplete(message.set_uncomplete()); break;
            case MessageKind::RequestSync: handle_request_sync(); break;
        }
    }
}

void WorkoutSyncService::handle_workout_data(const std::string& bytes) {
    WorkoutSnapshot incoming;
    std::string error;
    if (!decode_snapshot(bytes, incoming, &error)) {
        std::cerr << "[sync] dropping workout-data: " << error << "\n";
        return;
    }
    if (snapshot_) {
        snapshot_ = merge_snapshots(*snapshot_, incoming);
    } else {
        snapshot_ = std::move(incoming);
    }
    last_sync_ = clock_.now();
    notify();
}

/*
 * handle_set_completion
 * Applies the completion with the sender's stamp through the resolver, so a
 * completion that arrives after a newer local change loses. The domain
 * callback fires unless the completion was stale against a known set.
 */
void WorkoutSyncService::handle_set_completion(const std::string& bytes) {
    Uuid set_id;
    TimePoint completed_at;
    if (!decode_set_completion(bytes, set_id, completed_at)) {
        std::cerr << "[sync] dropping malformed set-completion\n";
        return;
    }

    bool known = false;
    bool applied = false;
    if (snapshot_) {
        known = find_set(*snapshot_, set_id) != nullptr;
        applied = apply_completion(*snapshot_, set_id, CompletionState{true, completed_at});
    }
    if (applied) notify();
    if ((!known || applied) && set_completed_cb_) set_completed_cb_(set_id);
}

void WorkoutSyncService::handle_set_uncomplete(const std::string& id_text) {
    Uuid set_id;
    if (!Uuid::parse(id_text, set_id)) {
        std::cerr << "[sync] dropping set-uncomplete with bad id '" << id_text << "'\n";
        return;
    }
    mark_set_uncompleted(set_id);
}

void WorkoutSyncService::handle_request_sync() {
    if (sync_requested_cb_) sync_requested_cb_();
}

void WorkoutSyncService::handle_theme(const std::string& theme) {
    if (theme_cb_) theme_cb_(theme);
}

// -------------------- local state --------------------

void WorkoutSyncService::adopt(const WorkoutSnapshot& snapshot) {
    snapshot_ = snapshot;
    notify();
}

bool WorkoutSyncService::mark_set_completed(const Uuid& set_id) {
    return set_completion(set_id, true);
}

bool WorkoutSyncService::mark_set_uncompleted(const Uuid& set_id) {
    return set_completion(set_id, false);
}

// No match is not an error: the set may belong to content that has not
// synchronized yet.
bool WorkoutSyncService::set_completion(const Uuid& set_id, bool completed) {
    if (!snapshot_) return false;
    SetRecord* set = find_set(*snapshot_, set_id);
    if (!set) return false;
    set->completed = completed;
    set->completed_at = stamp_now(clock_);
    notify();
    return true;
}

void WorkoutSyncService::notify() {
    for (auto& observer : observers_) observer(*snapshot_);
}

void WorkoutSyncService::status_changed() {
    if (status_cb_) status_cb_(reachable_, peer_installed_);
}
