#pragma once

/**
 * @file ServerImpl.hpp
 *
 * This module contains the implementation of the Huddle::Server class.
 *
 * © 2020 by Richard Walters
 */

#include <functional>
#include <Huddle/CoordinatorRegistry.hpp>
#include <Huddle/Election.hpp>
#include <Huddle/IServerTransport.hpp>
#include <Huddle/LiveMember.hpp>
#include <Huddle/Message.hpp>
#include <Huddle/Server.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <Timekeeping/Scheduler.hpp>
#include <vector>

namespace Huddle {

    class ConnectionHandler;

    /**
     * This contains the private properties of a Server class instance
     * that don't live any longer than the Server class instance itself.
     */
    struct Server::Impl
        : std::enable_shared_from_this< Impl >
    {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is used to synchronize access to the properties below.
         */
        std::recursive_mutex mutex;

        bool mobilized = false;

        size_t generation = 0;

        /**
         * This holds the settings which control the server.
         */
        Configuration configuration;

        /**
         * This is the object used to accept peer connections.
         */
        std::shared_ptr< IServerTransport > serverTransport;

        /**
         * This is the object used to track time for the server
         * and call back functions at specific times.
         */
        std::shared_ptr< Timekeeping::Scheduler > scheduler;

        /**
         * This is the membership registry.
         */
        Members members;

        /**
         * For each member probed in the current heartbeat round, this
         * indicates whether or not it has responded.
         */
        std::map< std::string, bool > heartbeatResponses;

        /**
         * This records which member is the coordinator.
         */
        std::shared_ptr< CoordinatorRegistry > coordinatorRegistry;

        /**
         * This selects a new coordinator when the old one is removed.
         */
        Election election;

        /**
         * This is the identifier of the coordinator, or empty if there
         * is none.
         */
        std::string coordinatorId;

        LastMemberLeftDelegate lastMemberLeftDelegate;

        /**
         * This is the scheduler token for the callback that happens
         * when the next heartbeat round should start.
         */
        int heartbeatTimerToken = 0;

        /**
         * This is the scheduler token for the callback that happens
         * when the grace window of the current heartbeat round ends.
         */
        int heartbeatSweepToken = 0;

        /**
         * This is incremented each time the heartbeat timer is reset, so
         * that a timer callback already under way when it was cancelled
         * can tell it is stale.
         */
        size_t heartbeatTimerSerial = 0;

        /**
         * This is the number of the current heartbeat round.
         */
        size_t heartbeatRound = 0;

        /**
         * These are the handlers of the connections accepted so far.
         * Handlers are dropped once their connection is closed.
         */
        std::set< std::shared_ptr< ConnectionHandler > > handlers;

        // Methods

        /**
         * This is the constructor of the structure.
         *
         * @param[in] coordinatorRegistry
         *     This is the registry in which to record the coordinator.
         */
        explicit Impl(std::shared_ptr< CoordinatorRegistry > coordinatorRegistry);

        /**
         * Register the given member under the given identifier.
         *
         * @param[in] id
         *     This is the identifier under which to register the member.
         *
         * @param[in] member
         *     This is the member to register.
         *
         * @param[in] onAccepted
         *     If not null, this is called, with the server locked, once
         *     the member is registered and before anything else is sent
         *     to the member.
         *
         * @return
         *     An indication of whether or not the member was registered
         *     is returned.
         */
        bool Add(
            const std::string& id,
            std::shared_ptr< LiveMember > member,
            std::function< void() > onAccepted = nullptr
        );

        /**
         * Remove the member registered under the given identifier.  The
         * last-member-left delegate is called, with the server unlocked,
         * if the membership becomes empty.  The caller must not hold the
         * server lock.
         *
         * @param[in] id
         *     This is the identifier of the member to remove.
         *
         * @param[in] expectedInstance
         *     If not null, the member is only removed if it is this
         *     instance.
         *
         * @return
         *     An indication of whether or not a member was removed
         *     is returned.
         */
        bool Remove(
            const std::string& id,
            const std::shared_ptr< LiveMember >& expectedInstance = nullptr
        );

        /**
         * Remove the given member if it is still registered, tell the
         * remaining members it left, and close its transport.  The caller
         * must not hold the server lock.
         *
         * @param[in] member
         *     This is the member to disconnect.
         *
         * @param[in] graceful
         *     This indicates whether or not to let queued messages go out
         *     before the member's connection closes.
         *
         * @return
         *     An indication of whether or not the member was still
         *     registered is returned.
         */
        bool Disconnect(
            const std::shared_ptr< LiveMember >& member,
            bool graceful
        );

        /**
         * Run an election over the current membership, record the winner,
         * and tell every member who the coordinator is now.
         */
        void ElectNewCoordinator();

        /**
         * Build the message which tells the given member who the
         * coordinator is.
         *
         * @param[in] member
         *     This is the member to which the message is addressed.
         *
         * @return
         *     The message is returned.
         */
        Message MakeCoordinatorNotice(const std::shared_ptr< LiveMember >& member) const;

        /**
         * Send the coordinator the sorted identifiers of all members.
         */
        void PushNameList();

        /**
         * Return metadata-only copies of all members.
         *
         * @return
         *     Metadata-only copies of all members are returned, in
         *     identifier order.
         */
        std::vector< MemberSnapshot > GetSnapshots() const;

        /**
         * Send the given message to every member.
         *
         * @param[in] message
         *     This is the message to send.
         *
         * @param[in] exceptId
         *     If not empty, this is the identifier of a member to skip.
         */
        void SendToAll(
            const Message& message,
            const std::string& exceptId = ""
        );

        /**
         * Send the given message to one member.
         *
         * @param[in] id
         *     This is the identifier of the member to which to send
         *     the message.
         *
         * @param[in] message
         *     This is the message to send.
         *
         * @return
         *     An indication of whether or not the member is registered
         *     and the message was handed to its transport is returned.
         */
        bool SendTo(
            const std::string& id,
            const Message& message
        );

        /**
         * Send each member a message from the server with the given text.
         *
         * @param[in] text
         *     This is the text of the notice.
         *
         * @param[in] exceptId
         *     If not empty, this is the identifier of a member to skip.
         */
        void Announce(
            const std::string& text,
            const std::string& exceptId = ""
        );

        /**
         * Record whether or not the given member has answered the liveness
         * probe of the current heartbeat round.  Nothing is recorded for
         * an identifier which is not registered.
         *
         * @param[in] id
         *     This is the identifier of the member.
         *
         * @param[in] responded
         *     This indicates whether or not the member has responded.
         */
        void MarkHeartbeatResponse(
            const std::string& id,
            bool responded
        );

        /**
         * Cancel any heartbeat timer and install a new one which starts
         * a heartbeat round once per heartbeat interval.
         */
        void ResetHeartbeatTimer();

        /**
         * Start a heartbeat round.
         */
        void CheckHeartbeats();

        /**
         * Remove every member which has not answered the liveness probe
         * of the given heartbeat round.  Nothing happens if a later round
         * has started since.
         *
         * @param[in] round
         *     This is the number of the heartbeat round whose grace window
         *     has ended.
         */
        void SweepHeartbeats(size_t round);

        /**
         * Cancel the heartbeat timer and any pending sweep.
         */
        void CancelHeartbeatCallbacks();

        /**
         * Take over a newly accepted peer connection.
         *
         * @param[in] transport
         *     This is the transport of the new connection.
         */
        void OnNewConnection(std::unique_ptr< ITransport > transport);

        /**
         * Drop the handlers whose connections are closed.
         */
        void ReapHandlers();
    };

}
