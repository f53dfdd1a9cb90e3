#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "clock.hpp"
#include "conflict_resolver.hpp"
#include "peer_session.hpp"
#include "snapshot.hpp"
#include "transport.hpp"

enum class DeviceRole { Handheld, Companion };

/*
 * WorkoutSyncService
 * Holds this device's copy of the workout and keeps it converging with the
 * peer's copy. Full snapshots are merged through merge_snapshots (structure
 * from the sender, completion by timestamp); single-set messages are applied
 * in place. Runs entirely on the owning context.
 */
class WorkoutSyncService {
public:
    using SnapshotObserver = std::function<void(const WorkoutSnapshot&)>;

    WorkoutSyncService(DeviceRole role, TransportSelector& transport, const Clock& clock);

    // Registers the service's handlers and status hooks on |session|.
    void attach(PeerSession& session);

    // -------- outbound --------
    SendOutcome publish(const WorkoutSnapshot& snapshot);
    SendOutcome request_sync();
    SendOutcome send_set_completion(const Uuid& set_id, TimePoint completed_at);
    SendOutcome send_set_uncomplete(const Uuid& set_id);
    // Theme change on its own, outside a snapshot publish. Best effort.
    SendOutcome send_theme(const std::string& theme);

    // Companion: local completion for immediate feedback, then notify the peer.
    bool record_set(const Uuid& set_id);

    // -------- inbound --------
    void on_receive(const wsync::Envelope& message);

    // -------- local state --------
    // adopt replaces the held snapshot with one built by the domain
    // collaborator (handheld) and notifies observers.
    void adopt(const WorkoutSnapshot& snapshot);
    bool mark_set_completed(const Uuid& set_id);
    bool mark_set_uncompleted(const Uuid& set_id);

    const std::optional<WorkoutSnapshot>& snapshot() const { return snapshot_; }
    std::optional<TimePoint> last_sync() const { return last_sync_; }
    bool reachable() const { return reachable_; }
    bool peer_installed() const { return peer_installed_; }
    DeviceRole role() const { return role_; }

    // Theme code attached to every published snapshot (handheld).
    void set_selected_theme(const std::string& theme) { selected_theme_ = theme; }

    void subscribe(SnapshotObserver observer) { observers_.push_back(std::move(observer)); }
    void on_set_completed(std::function<void(const Uuid&)> cb) { set_completed_cb_ = std::move(cb); }
    void on_sync_requested(std::function<void()> cb) { sync_requested_cb_ = std::move(cb); }
    void on_theme(std::function<void(const std::string&)> cb) { theme_cb_ = std::move(cb); }
    void on_status(std::function<void(bool, bool)> cb) { status_cb_ = std::move(cb); }

private:
    void handle_workout_data(const std::string& bytes);
    void handle_set_completion(const std::string& bytes);
    void handle_set_uncomplete(const std::string& id_text);
    void handle_request_sync();
    void handle_theme(const std::string& theme);

    bool set_completion(const Uuid& set_id, bool completed);
    void notify();
    void status_changed();

    DeviceRole role_;
    TransportSelector& transport_;
    const Clock& clock_;

    std::optional<WorkoutSnapshot> snapshot_;
    std::optional<TimePoint> last_sync_;
    std::string selected_theme_;
    bool reachable_ = false;
    bool peer_installed_ = false;

    std::vector<SnapshotObserver> observers_;
    std::function<void(const Uuid&)> set_completed_cb_;
    std::function<void()> sync_requested_cb_;
    std::function<void(const std::string&)> theme_cb_;
    std::function<void(bool, bool)> status_cb_;
};
