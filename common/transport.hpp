#pragma once
#include <functional>
#include <string>

#include "peer_link.hpp"
#include "wsync.pb.h"

// What to do with a message when the peer is not reachable.
enum class Delivery {
    QueueWhenUnreachable,    // append to the durable queue
    ContextWhenUnreachable,  // replace the durable latest-value slot
    ImmediateOnly,           // best effort, dropped when unreachable
};

enum class SendOutcome { Delivered, Queued, StoredAsContext, Failed, Dropped };

const char* send_outcome_name(SendOutcome outcome);

/*
 * DurableOutbox
 * Store-and-forward state kept in one file: a FIFO of pending envelopes plus
 * a single context slot. Every change is written through (temp file + rename)
 * before the call returns, so pending messages survive a restart.
 * Used only from the owning context.
 */
class DurableOutbox {
public:
    explicit DurableOutbox(std::string path);

    // Reads the file if it exists. A missing file is an empty outbox; an
    // unreadable one is renamed to "<path>.corrupt" and the outbox starts
    // empty. Returns false, still empty, when that file cannot be moved aside.
    bool load();

    // On a failed write these leave the outbox as it was and return false.
    bool enqueue(const wsync::Envelope& message);
    bool replace_context(const wsync::Envelope& message);
    bool clear_context();

    int pending() const { return record_.pending_size(); }
    bool has_context() const { return record_.has_context(); }

    /*
     * flush
     * Hands the context slot, then each queued envelope in order, to
     * |deliver|. Stops at the first failure; everything delivered so far is
     * removed. Returns the number of envelopes delivered.
     */
    int flush(const std::function<bool(const wsync::Envelope&)>& deliver);

private:
    bool persist();

    std::string path_;
    wsync::OutboxRecord record_;
};

// TransportSelector picks, per send, the immediate channel or the durable
// one according to the peer's current reachability and the message's policy.
class TransportSelector {
public:
    TransportSelector(PeerLink& link, DurableOutbox& outbox, bool verbose = false);

    SendOutcome send(const wsync::Envelope& message, Delivery delivery);

    // Called when the peer becomes reachable.
    int flush_pending();

    bool reachable() const { return link_.reachable(); }

private:
    PeerLink& link_;
    DurableOutbox& outbox_;
    bool verbose_;
};
