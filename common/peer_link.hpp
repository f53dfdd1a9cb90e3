#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "wsync.grpc.pb.h"

struct PeerStatus {
    bool reachable = false;
    bool app_installed = false;
};

// PeerLink is the immediate, low-latency channel to the paired device.
// reachable() reports the result of the latest probe().
class PeerLink {
public:
    virtual ~PeerLink() = default;
    virtual bool reachable() const = 0;
    virtual bool deliver(const wsync::Envelope& message) = 0;
    virtual PeerStatus probe(wsync::PeerRole self) = 0;
};

// GrpcPeerLink issues unary RPCs against the peer's PeerService. Every call
// carries a short deadline so a send never blocks the caller indefinitely.
class GrpcPeerLink final : public PeerLink {
public:
    GrpcPeerLink(const std::string& address, std::chrono::milliseconds deadline);

    bool reachable() const override { return reachable_.load(); }
    bool deliver(const wsync::Envelope& message) override;
    PeerStatus probe(wsync::PeerRole self) override;

private:
    std::string address_;
    std::chrono::milliseconds deadline_;
    std::unique_ptr<wsync::PeerService::Stub> stub_;
    std::atomic<bool> reachable_{false};
};
