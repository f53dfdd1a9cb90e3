#include "transport.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>

const char* send_outcome_name(SendOutcome outcome) {
    switch (outcome) {
        case SendOutcome::Delivered: return "delivered";
        case SendOutcome::Queued: return "queued";
        case SendOutcome::StoredAsContext: return "stored-as-context";
        case SendOutcome::Failed: return "failed";
        case SendOutcome::Dropped: return "dropped";
    }
    return "failed";
}

// -------------------- DurableOutbox --------------------

DurableOutbox::DurableOutbox(std::string path) : path_(std::move(path)) {}

bool DurableOutbox::load() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        record_.Clear();
        return true;
    }
    wsync::OutboxRecord loaded;
    if (!loaded.ParseFromIstream(&in)) {
        in.close();
        const std::string aside = path_ + ".corrupt";
        if (std::rename(path_.c_str(), aside.c_str()) != 0) {
            std::cerr << "[transport] outbox " << path_ << " is unreadable and cannot be moved aside\n";
            record_.Clear();
            return false;
        }
        std::cerr << "[transport] outbox " << path_ << " is unreadable, moved to " << aside
                  << ", starting empty\n";
        record_.Clear();
        return true;
    }
    record_.Swap(&loaded);
    return true;
}

// A change that cannot be written is rolled back, so memory and file agree.
bool DurableOutbox::enqueue(const wsync::Envelope& message) {
    *record_.add_pending() = message;
    if (persist()) return true;
    record_.mutable_pending()->RemoveLast();
    return false;
}

bool DurableOutbox::replace_context(const wsync::Envelope& message) {
    wsync::OutboxRecord before = record_;
    *record_.mutable_context() = message;
    if (persist()) return true;
    record_.Swap(&before);
    return false;
}

bool DurableOutbox::clear_context() {
    if (!record_.has_context()) return true;
    wsync::OutboxRecord before = record_;
    record_.clear_context();
    if (persist()) return true;
    record_.Swap(&before);
    return false;
}

int DurableOutbox::flush(const std::function<bool(const wsync::Envelope&)>& deliver) {
    int delivered = 0;
    bool changed = false;

    if (record_.has_context()) {
        if (!deliver(record_.context())) return 0;
        record_.clear_context();
        changed = true;
        delivered++;
    }

    int sent = 0;
    while (sent < record_.pending_size() && deliver(record_.pending(sent))) {
        sent++;
    }
    if (sent > 0) {
        record_.mutable_pending()->DeleteSubrange(0, sent);
        changed = true;
        delivered += sent;
    }

    if (changed) persist();
    return delivered;
}

bool DurableOutbox::persist() {
    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out || !record_.SerializeToOstream(&out)) {
            std::cerr << "[transport] cannot write outbox " << tmp << "\n";
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::cerr << "[transport] cannot replace outbox " << path_ << "\n";
        return false;
    }
    return true;
}

// -------------------- TransportSelector --------------------

TransportSelector::TransportSelector(PeerLink& link, DurableOutbox& outbox, bool verbose)
    : link_(link), outbox_(outbox), verbose_(verbose) {}

/*
 * send
 * Reachable peer: one immediate attempt. A failed immediate send is logged
 * and reported as Failed; it is never moved to the queue, since the sender
 * chose the immediate path for freshness. A delivered latest-value message
 * supersedes the stored context, which is discarded.
 * Unreachable peer: the message's Delivery policy decides.
 */
SendOutcome TransportSelector::send(const wsync::Envelope& message, Delivery delivery) {
    if (link_.reachable()) {
        if (link_.deliver(message)) {
            if (verbose_) std::cout << "[transport] delivered immediately\n";
            // The stored context is older than what just went out.
            if (delivery == Delivery::ContextWhenUnreachable && !outbox_.clear_context()) {
                std::cerr << "[transport] stale context could not be cleared\n";
            }
            return SendOutcome::Delivered;
        }
        std::cerr << "[transport] immediate send failed, not queued\n";
        return SendOutcome::Failed;
    }

    switch (delivery) {
        case Delivery::QueueWhenUnreachable:
            if (!outbox_.enqueue(message)) return SendOutcome::Failed;
            if (verbose_) std::cout << "[transport] peer unreachable, queued ("
                                    << outbox_.pending() << " pending)\n";
            return SendOutcome::Queued;
        case Delivery::ContextWhenUnreachable:
            if (!outbox_.replace_context(message)) return SendOutcome::Failed;
            if (verbose_) std::cout << "[transport] peer unreachable, context updated\n";
            return SendOutcome::StoredAsContext;
        case Delivery::ImmediateOnly:
            break;
    }
    std::cerr << "[transport] peer unreachable, message dropped\n";
    return SendOutcome::Dropped;
}

int TransportSelector::flush_pending() {
    int n = outbox_.flush([this](const wsync::Envelope& m) { return link_.deliver(m); });
    if (n > 0) std::cout << "[transport] flushed " << n << " stored message(s)\n";
    return n;
}
