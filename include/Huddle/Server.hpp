#ifndef HUDDLE_SERVER_HPP
#define HUDDLE_SERVER_HPP

/**
 * @file Server.hpp
 *
 * This module declares the Huddle::Server implementation.
 *
 * © 2020 by Richard Walters
 */

#include "CoordinatorRegistry.hpp"
#include "Election.hpp"
#include "IServerTransport.hpp"
#include "LiveMember.hpp"

#include <functional>
#include <Json/Value.hpp>
#include <map>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <Timekeeping/Scheduler.hpp>
#include <vector>

namespace Huddle {

    /**
     * This is the rendezvous point of a group of peers.  It keeps track of
     * who is present, which member is the coordinator, and which members
     * still answer liveness probes, and it routes text between members.
     */
    class Server {
        // Types
    public:
        /**
         * This holds the settings which control the server.
         */
        struct Configuration {
            /**
             * This is the port on which to accept connections from peers,
             * or zero to let the operating system pick one.
             */
            uint16_t port = 5000;

            /**
             * This is the time, in seconds, between the starts of two
             * heartbeat rounds.
             */
            double heartbeatInterval = 300.0;

            /**
             * This is the time, in seconds, a member has to answer a
             * liveness probe before it is removed.
             */
            double heartbeatGraceWindow = 60.0;

            /**
             * This is the rule used to pick a new coordinator.
             */
            ElectionRule electionRule = ElectionRule::LowestId;

            /**
             * This indicates whether or not the coordinator is told each
             * time another member answers a liveness probe.
             */
            bool notifyCoordinatorOfActivity = true;

            /**
             * Build a configuration from its JSON form.  Fields missing
             * from the JSON keep their default values, as do fields whose
             * values are out of range (a port outside 0-65535, or an
             * interval which is not positive).
             *
             * @param[in] json
             *     This is the JSON form of the configuration.
             *
             * @param[in] diagnosticsSender
             *     If not null, this is used to publish a warning for
             *     each field whose value was rejected.
             *
             * @return
             *     The configuration is returned.
             */
            static Configuration FromJson(
                const Json::Value& json,
                SystemAbstractions::DiagnosticsSender* diagnosticsSender = nullptr
            );
        };

        /**
         * This is the type of function called whenever the membership
         * of the group becomes empty.
         */
        using LastMemberLeftDelegate = std::function< void() >;

        // Lifecycle Methods
    public:
        ~Server() noexcept;
        Server(const Server&) = delete;
        Server(Server&&) noexcept;
        Server& operator=(const Server&) = delete;
        Server& operator=(Server&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.  The server uses a
         * coordinator registry of its own.
         */
        Server();

        /**
         * This constructor lets the caller share the coordinator registry
         * used by the server.
         *
         * @param[in] coordinatorRegistry
         *     This is the registry in which the server records the
         *     current coordinator.
         */
        explicit Server(std::shared_ptr< CoordinatorRegistry > coordinatorRegistry);

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the class.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        /**
         * Set the function to call each time the membership of the group
         * becomes empty.  It is called once per such transition, without
         * any lock of the server held.
         *
         * @param[in] lastMemberLeftDelegate
         *     This is the function to call each time the membership of
         *     the group becomes empty.
         */
        void SetLastMemberLeftDelegate(LastMemberLeftDelegate lastMemberLeftDelegate);

        /**
         * Start accepting peer connections and start the heartbeat timer.
         *
         * @param[in] serverTransport
         *     This is the object used to accept peer connections.
         *
         * @param[in] scheduler
         *     This is the object used to track time and run the
         *     heartbeat timer.
         *
         * @param[in] configuration
         *     This holds the settings which control the server.
         *
         * @return
         *     An indication of whether or not the server was able to
         *     start accepting connections is returned.
         */
        bool Mobilize(
            std::shared_ptr< IServerTransport > serverTransport,
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const Configuration& configuration = Configuration()
        );

        /**
         * Stop accepting peer connections, stop the heartbeat timer, and
         * close every connection.  The membership is emptied.
         */
        void Demobilize();

        /**
         * Return the port on which the server accepts peer connections.
         *
         * @return
         *     The port on which the server accepts peer connections is
         *     returned, or zero if the server is not mobilized.
         */
        uint16_t GetBoundPort() const;

        /**
         * Register the given member under the given identifier.  If the
         * membership was empty, the member becomes the coordinator.  The
         * coordinator is sent a fresh list of member names.
         *
         * @param[in] id
         *     This is the identifier under which to register the member.
         *
         * @param[in] member
         *     This is the member to register.
         *
         * @return
         *     An indication of whether or not the member was registered
         *     is returned.  This is false if the identifier is in use.
         */
        bool Add(
            const std::string& id,
            std::shared_ptr< LiveMember > member
        );

        /**
         * Remove the member registered under the given identifier.  If it
         * was the coordinator, a new one is elected and announced.  The
         * coordinator is sent a fresh list of member names.
         *
         * @param[in] id
         *     This is the identifier of the member to remove.
         *
         * @return
         *     An indication of whether or not a member was removed
         *     is returned.
         */
        bool Remove(const std::string& id);

        /**
         * (Re)start the repeating heartbeat timer.  Any timer already
         * running is cancelled first.  This has no effect unless the
         * server is mobilized.
         */
        void StartHeartbeatRound();

        /**
         * Start a heartbeat round right now: every member is marked as not
         * having responded and sent a liveness probe, and a sweep is
         * scheduled to remove every member still not having responded
         * once the grace window has passed.  Starting a round cancels the
         * sweep of the round before it.  This has no effect unless the
         * server is mobilized.
         */
        void CheckHeartbeats();

        /**
         * Record whether or not the given member has answered the liveness
         * probe of the current heartbeat round.
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
         * Return the member registered under the given identifier.
         *
         * @param[in] id
         *     This is the identifier of the member to return.
         *
         * @return
         *     The member is returned, or nullptr if no member is
         *     registered under the given identifier.
         */
        std::shared_ptr< LiveMember > GetMember(const std::string& id) const;

        /**
         * Return the identifiers of all registered members.
         *
         * @return
         *     The identifiers of all registered members are returned,
         *     sorted ascending.
         */
        std::vector< std::string > GetMemberIds() const;

        /**
         * Return the identifier of the coordinator.
         *
         * @return
         *     The identifier of the coordinator is returned, or an empty
         *     string if there is none.
         */
        std::string GetCoordinatorId() const;

        std::shared_ptr< CoordinatorRegistry > GetCoordinatorRegistry() const;

        /**
         * Return a description of the current state of the group.
         *
         * @return
         *     An object is returned holding the coordinator identifier,
         *     a snapshot of each member, and the heartbeat round number.
         */
        Json::Value GetStatus() const;

        /**
         * Return the heartbeat response table.
         *
         * @return
         *     For each member probed in the current heartbeat round, an
         *     indication of whether or not it has responded is returned.
         */
        std::map< std::string, bool > GetHeartbeatResponses() const;

        /**
         * Return the number of heartbeat rounds started since the server
         * was constructed.
         *
         * @return
         *     The number of heartbeat rounds started since the server
         *     was constructed is returned.
         */
        size_t GetHeartbeatRound() const;

        // Package-Private properties (public but opaque)
    public:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::shared_ptr< Impl > impl_;
    };

}

#endif /* HUDDLE_SERVER_HPP */
