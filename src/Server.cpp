/**
 * @file Server.cpp
 *
 * This module contains the implementation of the Huddle::Server class.
 *
 * © 2020 by Richard Walters
 */

#include "ConnectionHandler.hpp"
#include "ServerImpl.hpp"

#include <Huddle/Server.hpp>
#include <set>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace {

    /**
     * Publish a warning about a configuration field whose value was
     * rejected.
     *
     * @param[in] diagnosticsSender
     *     If not null, this is used to publish the warning.
     *
     * @param[in] field
     *     This is the name of the rejected field.
     */
    void WarnRejectedField(
        SystemAbstractions::DiagnosticsSender* diagnosticsSender,
        const char* field
    ) {
        if (diagnosticsSender == nullptr) {
            return;
        }
        diagnosticsSender->SendDiagnosticInformationFormatted(
            SystemAbstractions::DiagnosticsSender::Levels::WARNING,
            "Ignoring out-of-range value for %s; using the default",
            field
        );
    }

    /**
     * Read a positive number of seconds from the given JSON value, which
     * may be either an integer or a floating-point number.
     *
     * @param[in] json
     *     This is the object holding the value to read.
     *
     * @param[in] field
     *     This is the name of the value to read.
     *
     * @param[in,out] seconds
     *     This is where to store the number of seconds, if the value
     *     is a positive number.
     *
     * @param[in] diagnosticsSender
     *     If not null, this is used to warn about a rejected value.
     */
    void ReadSeconds(
        const Json::Value& json,
        const char* field,
        double& seconds,
        SystemAbstractions::DiagnosticsSender* diagnosticsSender
    ) {
        const auto& value = json[field];
        double valueIn;
        switch (value.GetType()) {
            case Json::Value::Type::Integer: {
                valueIn = (double)(int)value;
            } break;

            case Json::Value::Type::FloatingPoint: {
                valueIn = value;
            } break;

            default: return;
        }
        if (valueIn > 0.0) {
            seconds = valueIn;
        } else {
            WarnRejectedField(diagnosticsSender, field);
        }
    }

}

namespace Huddle {

    auto Server::Configuration::FromJson(
        const Json::Value& json,
        SystemAbstractions::DiagnosticsSender* diagnosticsSender
    ) -> Configuration {
        Configuration configuration;
        if (json["port"].GetType() == Json::Value::Type::Integer) {
            const auto port = (int)json["port"];
            if (
                (port >= 0)
                && (port <= 65535)
            ) {
                configuration.port = (uint16_t)port;
            } else {
                WarnRejectedField(diagnosticsSender, "port");
            }
        }
        ReadSeconds(json, "heartbeatInterval", configuration.heartbeatInterval, diagnosticsSender);
        ReadSeconds(json, "heartbeatGraceWindow", configuration.heartbeatGraceWindow, diagnosticsSender);
        if (json["electionRule"].GetType() == Json::Value::Type::String) {
            const std::string rule = json["electionRule"];
            if (rule == "highestPort") {
                configuration.electionRule = ElectionRule::HighestPort;
            } else if (rule == "lowestId") {
                configuration.electionRule = ElectionRule::LowestId;
            }
        }
        if (json["notifyCoordinatorOfActivity"].GetType() == Json::Value::Type::Boolean) {
            configuration.notifyCoordinatorOfActivity = json["notifyCoordinatorOfActivity"];
        }
        return configuration;
    }

    Server::~Server() noexcept {
        if (impl_ != nullptr) {
            Demobilize();
        }
    }
    Server::Server(Server&&) noexcept = default;
    Server& Server::operator=(Server&&) noexcept = default;

    Server::Server()
        : impl_(new Impl(std::make_shared< CoordinatorRegistry >()))
    {
    }

    Server::Server(std::shared_ptr< CoordinatorRegistry > coordinatorRegistry)
        : impl_(new Impl(coordinatorRegistry))
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Server::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void Server::SetLastMemberLeftDelegate(LastMemberLeftDelegate lastMemberLeftDelegate) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->lastMemberLeftDelegate = lastMemberLeftDelegate;
    }

    bool Server::Mobilize(
        std::shared_ptr< IServerTransport > serverTransport,
        std::shared_ptr< Timekeeping::Scheduler > scheduler,
        const Configuration& configuration
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->mobilized) {
            impl_->diagnosticsSender.SendDiagnosticInformationString(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Already mobilized"
            );
            return false;
        }
        std::weak_ptr< Impl > weakImpl(impl_);
        const auto bound = serverTransport->BindNetwork(
            configuration.port,
            [weakImpl](std::unique_ptr< ITransport > transport){
                const auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    transport->Close(false);
                    return;
                }
                impl->OnNewConnection(std::move(transport));
            }
        );
        if (!bound) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "Unable to accept connections on port %u",
                (unsigned int)configuration.port
            );
            return false;
        }
        ++impl_->generation;
        impl_->mobilized = true;
        impl_->configuration = configuration;
        const Configuration defaults;
        if (!(configuration.heartbeatInterval > 0.0)) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Heartbeat interval must be positive; using %g seconds",
                defaults.heartbeatInterval
            );
            impl_->configuration.heartbeatInterval = defaults.heartbeatInterval;
        }
        if (!(configuration.heartbeatGraceWindow > 0.0)) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Heartbeat grace window must be positive; using %g seconds",
                defaults.heartbeatGraceWindow
            );
            impl_->configuration.heartbeatGraceWindow = defaults.heartbeatGraceWindow;
        }
        impl_->election.SetRule(configuration.electionRule);
        impl_->serverTransport = serverTransport;
        impl_->scheduler = scheduler;
        impl_->heartbeatResponses.clear();
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Server running on port %u",
            (unsigned int)serverTransport->GetBoundPort()
        );
        impl_->ResetHeartbeatTimer();
        return true;
    }

    void Server::Demobilize() {
        std::shared_ptr< IServerTransport > serverTransport;
        std::set< std::shared_ptr< ConnectionHandler > > handlers;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            if (!impl_->mobilized) {
                return;
            }
            impl_->mobilized = false;
            impl_->CancelHeartbeatCallbacks();
            impl_->scheduler = nullptr;
            serverTransport = std::move(impl_->serverTransport);
            handlers.swap(impl_->handlers);
        }
        serverTransport->ReleaseNetwork();
        for (const auto& handler: handlers) {
            handler->Stop();
        }
        std::vector< std::shared_ptr< LiveMember > > remaining;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            for (const auto& member: impl_->members) {
                remaining.push_back(member.second);
            }
        }
        for (const auto& member: remaining) {
            (void)impl_->Disconnect(member, false);
        }
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->heartbeatResponses.clear();
        impl_->diagnosticsSender.SendDiagnosticInformationString(
            3,
            "Server stopped"
        );
    }

    uint16_t Server::GetBoundPort() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->serverTransport == nullptr) {
            return 0;
        }
        return impl_->serverTransport->GetBoundPort();
    }

    bool Server::Add(
        const std::string& id,
        std::shared_ptr< LiveMember > member
    ) {
        return impl_->Add(id, member);
    }

    bool Server::Remove(const std::string& id) {
        return impl_->Remove(id);
    }

    void Server::StartHeartbeatRound() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return;
        }
        impl_->ResetHeartbeatTimer();
    }

    void Server::CheckHeartbeats() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return;
        }
        impl_->CheckHeartbeats();
    }

    void Server::MarkHeartbeatResponse(
        const std::string& id,
        bool responded
    ) {
        impl_->MarkHeartbeatResponse(id, responded);
    }

    std::shared_ptr< LiveMember > Server::GetMember(const std::string& id) const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto membersEntry = impl_->members.find(id);
        if (membersEntry == impl_->members.end()) {
            return nullptr;
        }
        return membersEntry->second;
    }

    std::vector< std::string > Server::GetMemberIds() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        std::vector< std::string > ids;
        ids.reserve(impl_->members.size());
        for (const auto& member: impl_->members) {
            ids.push_back(member.first);
        }
        return ids;
    }

    std::string Server::GetCoordinatorId() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->coordinatorId;
    }

    std::shared_ptr< CoordinatorRegistry > Server::GetCoordinatorRegistry() const {
        return impl_->coordinatorRegistry;
    }

    Json::Value Server::GetStatus() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        auto members = Json::Array({});
        for (const auto& snapshot: impl_->GetSnapshots()) {
            members.Add((Json::Value)snapshot);
        }
        return Json::Object({
            {"coordinator", impl_->coordinatorId},
            {"members", std::move(members)},
            {"heartbeatRound", (int)impl_->heartbeatRound},
        });
    }

    std::map< std::string, bool > Server::GetHeartbeatResponses() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->heartbeatResponses;
    }

    size_t Server::GetHeartbeatRound() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->heartbeatRound;
    }

}
