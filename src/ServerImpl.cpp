/**
 * @file ServerImpl.cpp
 *
 * This module contains the implementation of the Huddle::Server::Impl
 * structure.
 *
 * © 2020 by Richard Walters
 */

#include "ConnectionHandler.hpp"
#include "ServerImpl.hpp"

#include <Huddle/Message.hpp>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Huddle {

    Server::Impl::Impl(std::shared_ptr< CoordinatorRegistry > coordinatorRegistry)
        : diagnosticsSender("Huddle::Server")
        , coordinatorRegistry(coordinatorRegistry)
        , election(coordinatorRegistry)
    {
    }

    bool Server::Impl::Add(
        const std::string& id,
        std::shared_ptr< LiveMember > member,
        std::function< void() > onAccepted
    ) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        if (members.find(id) != members.end()) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Duplicate ID attempted: %s",
                id.c_str()
            );
            return false;
        }
        const auto wasEmpty = members.empty();
        members[id] = member;
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Member joined: %s (%s:%u)",
            id.c_str(),
            member->GetAddress().c_str(),
            (unsigned int)member->GetPort()
        );
        if (wasEmpty) {
            member->SetCoordinator(true);
            coordinatorId = id;
            coordinatorRegistry->Set(member);
            diagnosticsSender.SendDiagnosticInformationFormatted(
                3,
                "New coordinator elected: %s",
                id.c_str()
            );
        } else if (id == coordinatorId) {
            member->SetCoordinator(true);
            coordinatorRegistry->Set(member);
        }
        if (onAccepted != nullptr) {
            onAccepted();
        }
        PushNameList();
        return true;
    }

    bool Server::Impl::Remove(
        const std::string& id,
        const std::shared_ptr< LiveMember >& expectedInstance
    ) {
        std::unique_lock< decltype(mutex) > lock(mutex);
        const auto membersEntry = members.find(id);
        if (membersEntry == members.end()) {
            return false;
        }
        if (
            (expectedInstance != nullptr)
            && (membersEntry->second != expectedInstance)
        ) {
            return false;
        }
        membersEntry->second->SetCoordinator(false);
        (void)members.erase(membersEntry);
        (void)heartbeatResponses.erase(id);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Removing member: %s",
            id.c_str()
        );
        if (id == coordinatorId) {
            ElectNewCoordinator();
        }
        const auto becameEmpty = members.empty();
        if (becameEmpty) {
            coordinatorId.clear();
            coordinatorRegistry->Reset();
        }
        PushNameList();
        const auto lastMemberLeftDelegateSample = lastMemberLeftDelegate;
        lock.unlock();
        if (
            becameEmpty
            && (lastMemberLeftDelegateSample != nullptr)
        ) {
            lastMemberLeftDelegateSample();
        }
        return true;
    }

    bool Server::Impl::Disconnect(
        const std::shared_ptr< LiveMember >& member,
        bool graceful
    ) {
        const auto& id = member->GetId();
        const auto removed = Remove(id, member);
        if (removed) {
            Announce(id + " left the chat.");
        }
        member->Close(graceful);
        return removed;
    }

    void Server::Impl::ElectNewCoordinator() {
        const auto winner = election.Run(members);
        if (winner == nullptr) {
            coordinatorId.clear();
            diagnosticsSender.SendDiagnosticInformationString(
                3,
                "No coordinator available."
            );
            return;
        }
        coordinatorId = winner->GetId();
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "New coordinator elected: %s",
            coordinatorId.c_str()
        );
        for (const auto& member: members) {
            (void)member.second->Send(MakeCoordinatorNotice(member.second));
        }
    }

    Message Server::Impl::MakeCoordinatorNotice(
        const std::shared_ptr< LiveMember >& member
    ) const {
        const auto isCoordinator = (member->GetId() == coordinatorId);
        Message notice(
            Message::Type::Join,
            "server",
            (
                isCoordinator
                ? "You are the coordinator."
                : "Current coordinator is: " + coordinatorId
            )
        );
        notice.isCoordinator = isCoordinator;
        notice.coordinatorId = coordinatorId;
        return notice;
    }

    void Server::Impl::PushNameList() {
        const auto coordinator = coordinatorRegistry->Get();
        if (coordinator == nullptr) {
            return;
        }
        std::vector< std::string > names;
        names.reserve(members.size());
        for (const auto& member: members) {
            names.push_back(member.first);
        }
        Message nameList(
            Message::Type::MemberNameList,
            "server",
            Payload::FromNames(names)
        );
        nameList.recipientId = coordinator->GetId();
        (void)coordinator->Send(nameList);
    }

    std::vector< MemberSnapshot > Server::Impl::GetSnapshots() const {
        std::vector< MemberSnapshot > snapshots;
        snapshots.reserve(members.size());
        for (const auto& member: members) {
            snapshots.push_back(member.second->Detach());
        }
        return snapshots;
    }

    void Server::Impl::SendToAll(
        const Message& message,
        const std::string& exceptId
    ) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        for (const auto& member: members) {
            if (member.first == exceptId) {
                continue;
            }
            if (!member.second->Send(message)) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Unable to send %s message to %s",
                    MessageTypeToString(message.type).c_str(),
                    member.first.c_str()
                );
            }
        }
    }

    bool Server::Impl::SendTo(
        const std::string& id,
        const Message& message
    ) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        const auto membersEntry = members.find(id);
        if (membersEntry == members.end()) {
            return false;
        }
        return membersEntry->second->Send(message);
    }

    void Server::Impl::Announce(
        const std::string& text,
        const std::string& exceptId
    ) {
        SendToAll(
            Message(Message::Type::Broadcast, "server", text),
            exceptId
        );
    }

    void Server::Impl::MarkHeartbeatResponse(
        const std::string& id,
        bool responded
    ) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        if (members.find(id) == members.end()) {
            return;
        }
        heartbeatResponses[id] = responded;
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Heartbeat response from %s: %s",
            id.c_str(),
            (responded ? "responded" : "not responded")
        );
    }

    void Server::Impl::ResetHeartbeatTimer() {
        if (scheduler == nullptr) {
            return;
        }
        if (heartbeatTimerToken != 0) {
            scheduler->Cancel(heartbeatTimerToken);
            heartbeatTimerToken = 0;
        }
        const auto dueTime = (
            scheduler->GetClock()->GetCurrentTime()
            + configuration.heartbeatInterval
        );
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const auto thisGeneration = generation;
        const auto thisSerial = ++heartbeatTimerSerial;
        heartbeatTimerToken = scheduler->Schedule(
            [weakImpl, thisGeneration, thisSerial]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                if (
                    !impl->mobilized
                    || (impl->generation != thisGeneration)
                    || (impl->heartbeatTimerSerial != thisSerial)
                ) {
                    return;
                }
                impl->heartbeatTimerToken = 0;
                impl->CheckHeartbeats();
                impl->ResetHeartbeatTimer();
            },
            dueTime
        );
    }

    void Server::Impl::CheckHeartbeats() {
        if (scheduler == nullptr) {
            return;
        }
        const auto round = ++heartbeatRound;
        if (heartbeatSweepToken != 0) {
            scheduler->Cancel(heartbeatSweepToken);
            heartbeatSweepToken = 0;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Running heartbeat round %zu (%zu members)",
            round,
            members.size()
        );
        heartbeatResponses.clear();
        for (const auto& member: members) {
            heartbeatResponses[member.first] = false;
            if (!member.second->Ping()) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Unable to probe %s",
                    member.first.c_str()
                );
            }
        }
        const auto dueTime = (
            scheduler->GetClock()->GetCurrentTime()
            + configuration.heartbeatGraceWindow
        );
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const auto thisGeneration = generation;
        heartbeatSweepToken = scheduler->Schedule(
            [weakImpl, thisGeneration, round]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                {
                    std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                    if (
                        !impl->mobilized
                        || (impl->generation != thisGeneration)
                        || (impl->heartbeatRound != round)
                    ) {
                        return;
                    }
                    impl->heartbeatSweepToken = 0;
                }
                impl->SweepHeartbeats(round);
            },
            dueTime
        );
    }

    void Server::Impl::SweepHeartbeats(size_t round) {
        std::vector< std::shared_ptr< LiveMember > > unresponsive;
        {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (heartbeatRound != round) {
                return;
            }
            for (const auto& response: heartbeatResponses) {
                if (response.second) {
                    continue;
                }
                const auto membersEntry = members.find(response.first);
                if (membersEntry != members.end()) {
                    unresponsive.push_back(membersEntry->second);
                }
            }
        }
        for (const auto& member: unresponsive) {
            if (Disconnect(member, false)) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    2,
                    "Removed inactive member: %s",
                    member->GetId().c_str()
                );
            }
        }
    }

    void Server::Impl::CancelHeartbeatCallbacks() {
        if (scheduler == nullptr) {
            return;
        }
        if (heartbeatTimerToken != 0) {
            scheduler->Cancel(heartbeatTimerToken);
            heartbeatTimerToken = 0;
        }
        if (heartbeatSweepToken != 0) {
            scheduler->Cancel(heartbeatSweepToken);
            heartbeatSweepToken = 0;
        }
    }

    void Server::Impl::OnNewConnection(std::unique_ptr< ITransport > transport) {
        ReapHandlers();
        std::shared_ptr< ConnectionHandler > handler;
        {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (mobilized) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    1,
                    "New connection from %s:%u",
                    transport->GetPeerAddress().c_str(),
                    (unsigned int)transport->GetPeerPort()
                );
                handler = std::make_shared< ConnectionHandler >(
                    shared_from_this(),
                    std::move(transport)
                );
                (void)handlers.insert(handler);
            }
        }
        if (handler == nullptr) {
            transport->Close(false);
            return;
        }
        if (!handler->Start()) {
            diagnosticsSender.SendDiagnosticInformationString(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Unable to open new connection"
            );
            handler->Stop();
        }
    }

    void Server::Impl::ReapHandlers() {
        std::set< std::shared_ptr< ConnectionHandler > > handlersSample;
        {
            std::lock_guard< decltype(mutex) > lock(mutex);
            handlersSample = handlers;
        }
        std::vector< std::shared_ptr< ConnectionHandler > > doneHandlers;
        for (const auto& handler: handlersSample) {
            if (handler->IsDone()) {
                doneHandlers.push_back(handler);
            }
        }
        if (doneHandlers.empty()) {
            return;
        }
        std::lock_guard< decltype(mutex) > lock(mutex);
        for (const auto& handler: doneHandlers) {
            (void)handlers.erase(handler);
        }
    }

}
