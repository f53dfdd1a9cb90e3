#include "peer_link.hpp"

#include <iostream>

GrpcPeerLink::GrpcPeerLink(const std::string& address, std::chrono::milliseconds deadline)
    : address_(address), deadline_(deadline) {
    auto ch = grpc::CreateChannel(address_, grpc::InsecureChannelCredentials());
    stub_ = wsync::PeerService::NewStub(ch);
}

bool GrpcPeerLink::deliver(const wsync::Envelope& message) {
    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
    wsync::DeliverReply rep;
    auto s = stub_->Deliver(&ctx, message, &rep);
    if (!s.ok()) {
        std::cerr << "[transport] deliver to " << address_ << " failed: "
                  << s.error_message() << "\n";
        return false;
    }
    return true;
}

// probe pings the peer and records the outcome as the current reachability.
PeerStatus GrpcPeerLink::probe(wsync::PeerRole self) {
    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
    wsync::PingRequest req;
    req.set_role(self);
    wsync::PingReply rep;
    auto s = stub_->Ping(&ctx, req, &rep);

    PeerStatus status;
    status.reachable = s.ok();
    status.app_installed = s.ok() && rep.app_installed();
    reachable_.store(status.reachable);
    return status;
}
