/**
 * @file ConnectionHandler.cpp
 *
 * This module contains the implementation of the Huddle::ConnectionHandler
 * class.
 *
 * © 2020 by Richard Walters
 */

#include "ConnectionHandler.hpp"

#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Huddle {

    ConnectionHandler::~ConnectionHandler() noexcept = default;

    ConnectionHandler::ConnectionHandler(
        std::weak_ptr< Server::Impl > server,
        std::unique_ptr< ITransport > transport
    )
        : server_(server)
        , transport_(std::move(transport))
    {
    }

    bool ConnectionHandler::Start() {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        if (transport_ == nullptr) {
            return false;
        }
        std::weak_ptr< ConnectionHandler > weakSelf(shared_from_this());
        return transport_->Open(
            [weakSelf](Message&& message){
                const auto self = weakSelf.lock();
                if (self == nullptr) {
                    return;
                }
                self->OnMessage(std::move(message));
            },
            [weakSelf](bool graceful){
                const auto self = weakSelf.lock();
                if (self == nullptr) {
                    return;
                }
                self->OnBroken(graceful);
            }
        );
    }

    void ConnectionHandler::Stop() {
        Finish(false);
    }

    bool ConnectionHandler::IsDone() const {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        if (state_ == State::Closed) {
            return true;
        }
        return (
            (member_ != nullptr)
            && !member_->HasTransport()
        );
    }

    void ConnectionHandler::OnMessage(Message&& message) {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        switch (state_) {
            case State::AwaitingJoin: {
                Join(message);
            } break;

            case State::Registered: {
                const auto server = server_.lock();
                if (server == nullptr) {
                    Finish(false);
                    return;
                }
                Dispatch(server, message);
            } break;

            default: break;
        }
    }

    void ConnectionHandler::OnBroken(bool graceful) {
        const auto server = server_.lock();
        if (server != nullptr) {
            std::lock_guard< decltype(mutex_) > lock(mutex_);
            if (state_ != State::Closed) {
                server->diagnosticsSender.SendDiagnosticInformationFormatted(
                    (
                        graceful
                        ? 2
                        : SystemAbstractions::DiagnosticsSender::Levels::WARNING
                    ),
                    "Connection with %s %s",
                    (id_.empty() ? "(unregistered peer)" : id_.c_str()),
                    (graceful ? "closed" : "broken")
                );
            }
        }
        Finish(false);
    }

    void ConnectionHandler::Join(const Message& message) {
        const auto server = server_.lock();
        if (message.type != Message::Type::Join) {
            if (server != nullptr) {
                server->diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Expected JOIN but received %s",
                    MessageTypeToString(message.type).c_str()
                );
            }
            (void)transport_->Send(Message(Message::Type::Error, "server", "Expected JOIN."));
            transport_->Close(true);
            state_ = State::Closed;
            return;
        }
        if (message.senderId.empty()) {
            (void)transport_->Send(Message(Message::Type::Error, "server", "ID must not be empty."));
            transport_->Close(true);
            state_ = State::Closed;
            return;
        }
        if (server == nullptr) {
            transport_->Close(false);
            state_ = State::Closed;
            return;
        }
        id_ = message.senderId;
        member_ = std::make_shared< LiveMember >(id_, std::move(transport_));
        const auto member = member_;
        Server::Impl* const serverRaw = server.get();
        const auto accepted = server->Add(
            id_,
            member,
            [serverRaw, member]{
                (void)member->Send(serverRaw->MakeCoordinatorNotice(member));
            }
        );
        if (!accepted) {
            (void)member_->Send(Message(Message::Type::Error, "server", "ID already in use."));
            member_->Close(true);
            state_ = State::Closed;
            return;
        }
        state_ = State::Registered;
        server->Announce(id_ + " joined the chat.", id_);
    }

    void ConnectionHandler::Dispatch(
        const std::shared_ptr< Server::Impl >& server,
        const Message& message
    ) {
        switch (message.type) {
            case Message::Type::Leave: {
                server->diagnosticsSender.SendDiagnosticInformationFormatted(
                    2,
                    "Member requested leave: %s",
                    id_.c_str()
                );
                if (!member_->Send(Message(Message::Type::Leave, "server", "Leaving the group"))) {
                    server->diagnosticsSender.SendDiagnosticInformationFormatted(
                        SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                        "Could not acknowledge leave of %s",
                        id_.c_str()
                    );
                }
                Finish(true);
            } break;

            case Message::Type::RequestMemberList: {
                std::lock_guard< decltype(server->mutex) > lock(server->mutex);
                if (id_ != server->coordinatorId) {
                    server->diagnosticsSender.SendDiagnosticInformationFormatted(
                        1,
                        "Ignoring member list request from non-coordinator %s",
                        id_.c_str()
                    );
                    return;
                }
                Message memberList(
                    Message::Type::MemberList,
                    server->coordinatorId,
                    Payload::FromMembers(server->GetSnapshots())
                );
                memberList.recipientId = id_;
                memberList.coordinatorId = server->coordinatorId;
                (void)member_->Send(memberList);
            } break;

            case Message::Type::RequestMemberListApproval: {
                const auto coordinator = server->coordinatorRegistry->Get();
                if (coordinator == nullptr) {
                    server->diagnosticsSender.SendDiagnosticInformationFormatted(
                        1,
                        "No coordinator to approve member list request from %s",
                        id_.c_str()
                    );
                    return;
                }
                Message prompt(
                    Message::Type::RequestMemberListApproval,
                    id_,
                    "Requesting member list approval."
                );
                prompt.recipientId = coordinator->GetId();
                (void)coordinator->Send(prompt);
            } break;

            case Message::Type::MemberListApproved: {
                std::lock_guard< decltype(server->mutex) > lock(server->mutex);
                if (id_ != server->coordinatorId) {
                    return;
                }
                Message memberList(
                    Message::Type::MemberList,
                    server->coordinatorId,
                    Payload::FromMembers(server->GetSnapshots())
                );
                memberList.recipientId = message.recipientId;
                memberList.coordinatorId = server->coordinatorId;
                (void)server->SendTo(message.recipientId, memberList);
            } break;

            case Message::Type::MemberListDenied: {
                std::lock_guard< decltype(server->mutex) > lock(server->mutex);
                if (id_ != server->coordinatorId) {
                    return;
                }
                Message denial(
                    Message::Type::Error,
                    "server",
                    (
                        message.GetText().empty()
                        ? std::string("Member list request denied.")
                        : message.GetText()
                    )
                );
                denial.recipientId = message.recipientId;
                (void)server->SendTo(message.recipientId, denial);
            } break;

            case Message::Type::Heartbeat: {
                const auto& text = message.GetText();
                if (text == "pong") {
                    server->MarkHeartbeatResponse(id_, true);
                    std::lock_guard< decltype(server->mutex) > lock(server->mutex);
                    if (
                        server->configuration.notifyCoordinatorOfActivity
                        && !server->coordinatorId.empty()
                        && (server->coordinatorId != id_)
                    ) {
                        (void)server->SendTo(
                            server->coordinatorId,
                            Message(
                                Message::Type::Broadcast,
                                "server",
                                id_ + " is still active."
                            )
                        );
                    }
                } else if (text == "manual ping") {
                    std::lock_guard< decltype(server->mutex) > lock(server->mutex);
                    if (id_ != server->coordinatorId) {
                        server->diagnosticsSender.SendDiagnosticInformationFormatted(
                            1,
                            "Ignoring manual ping from non-coordinator %s",
                            id_.c_str()
                        );
                        return;
                    }
                    server->diagnosticsSender.SendDiagnosticInformationFormatted(
                        3,
                        "Manual liveness check requested by %s",
                        id_.c_str()
                    );
                    server->SendToAll(
                        Message(Message::Type::Heartbeat, id_, ""),
                        id_
                    );
                    if (server->mobilized) {
                        server->ResetHeartbeatTimer();
                    }
                }
            } break;

            case Message::Type::Broadcast: {
                server->diagnosticsSender.SendDiagnosticInformationFormatted(
                    1,
                    "[Broadcast] from %s: %s",
                    id_.c_str(),
                    message.GetText().c_str()
                );
                server->SendToAll(message);
            } break;

            case Message::Type::Private: {
                server->diagnosticsSender.SendDiagnosticInformationFormatted(
                    1,
                    "[Private] from %s to %s: %s",
                    id_.c_str(),
                    message.recipientId.c_str(),
                    message.GetText().c_str()
                );
                if (!server->SendTo(message.recipientId, message)) {
                    server->diagnosticsSender.SendDiagnosticInformationFormatted(
                        1,
                        "Dropped private message for unknown member %s",
                        message.recipientId.c_str()
                    );
                }
            } break;

            case Message::Type::Unknown: {
                server->diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Malformed message from %s; disconnecting",
                    id_.c_str()
                );
                Finish(false);
            } break;

            default: {
                server->diagnosticsSender.SendDiagnosticInformationFormatted(
                    1,
                    "Ignoring %s message from %s",
                    MessageTypeToString(message.type).c_str(),
                    id_.c_str()
                );
            } break;
        }
    }

    void ConnectionHandler::Finish(bool graceful) {
        std::shared_ptr< LiveMember > member;
        ITransport* transport = nullptr;
        std::shared_ptr< Server::Impl > server;
        {
            std::lock_guard< decltype(mutex_) > lock(mutex_);
            if (state_ == State::Closed) {
                return;
            }
            if (state_ == State::Registered) {
                member = member_;
                server = server_.lock();
            } else {
                transport = transport_.get();
            }
            state_ = State::Closed;
        }

        // The transport's callbacks take this handler's lock, so the
        // connection is closed only after the lock is released.  Once
        // closed, the handler never gives up its transport, so the
        // pointer stays valid.
        if (member != nullptr) {
            if (server == nullptr) {
                member->Close(graceful);
            } else {
                (void)server->Disconnect(member, graceful);
            }
        } else if (transport != nullptr) {
            transport->Close(graceful);
        }
    }

}
