/**
 * @file LiveMember.cpp
 *
 * This module contains the implementation of the Huddle::LiveMember class.
 *
 * © 2020 by Richard Walters
 */

#include <Huddle/LiveMember.hpp>

namespace Huddle {

    LiveMember::~LiveMember() noexcept = default;

    LiveMember::LiveMember(
        const std::string& id,
        std::unique_ptr< ITransport > transport
    )
        : id_(id)
        , isCoordinator_(false)
        , transport_(std::move(transport))
    {
        if (transport_ != nullptr) {
            address_ = transport_->GetPeerAddress();
            port_ = transport_->GetPeerPort();
        }
    }

    LiveMember::LiveMember(
        const std::string& id,
        const std::string& address,
        uint16_t port
    )
        : id_(id)
        , address_(address)
        , port_(port)
        , isCoordinator_(false)
    {
    }

    const std::string& LiveMember::GetId() const {
        return id_;
    }

    const std::string& LiveMember::GetAddress() const {
        return address_;
    }

    uint16_t LiveMember::GetPort() const {
        return port_;
    }

    bool LiveMember::IsCoordinator() const {
        return isCoordinator_;
    }

    void LiveMember::SetCoordinator(bool isCoordinator) {
        isCoordinator_ = isCoordinator;
    }

    bool LiveMember::HasTransport() const {
        std::lock_guard< decltype(transportMutex_) > lock(transportMutex_);
        return (
            (transport_ != nullptr)
            && !closed_
        );
    }

    MemberSnapshot LiveMember::Detach() const {
        return MemberSnapshot(id_, address_, port_, isCoordinator_);
    }

    bool LiveMember::Ping() {
        return Send(Message(Message::Type::Heartbeat, "server", ""));
    }

    bool LiveMember::Send(const Message& message) {
        std::lock_guard< decltype(transportMutex_) > lock(transportMutex_);
        if (
            (transport_ == nullptr)
            || closed_
        ) {
            return false;
        }
        return transport_->Send(message);
    }

    void LiveMember::Close(bool graceful) {
        ITransport* transport = nullptr;
        {
            std::lock_guard< decltype(transportMutex_) > lock(transportMutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            transport = transport_.get();
        }
        if (transport != nullptr) {
            transport->Close(graceful);
        }
    }

}
