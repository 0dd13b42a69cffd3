#ifndef HUDDLE_CLIENT_HPP
#define HUDDLE_CLIENT_HPP

/**
 * @file Client.hpp
 *
 * This module declares the Huddle::Client class.
 *
 * © 2020 by Richard Walters
 */

#include "ITransport.hpp"
#include "MemberSnapshot.hpp"
#include "Message.hpp"

#include <functional>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <vector>

namespace Huddle {

    /**
     * This is one peer of a group.  It connects to the membership server,
     * sends messages on behalf of the peer, and publishes what arrives from
     * the server as events.  It never reconnects by itself; to rejoin after
     * being disconnected, call Connect again.
     */
    class Client {
        // Types
    public:
        /**
         * This is the base class for events that the client can publish.
         */
        struct Event {
            /**
             * These are the types of events that the client can publish.
             */
            const enum class Type {
                /**
                 * A message arrived from the server.
                 */
                MessageReceived,

                /**
                 * A list of all members arrived from the server.
                 */
                MembershipChanged,

                /**
                 * The connection with the server was lost.
                 */
                Disconnected,
            } type;

            /**
             * This is the constructor of the event.
             *
             * @param[in] type
             *     This is used to identify the subclass of the concrete event.
             */
            explicit Event(Type type) : type(type) {}
        };

        /**
         * This holds information published whenever a message arrives
         * from the server.
         */
        struct MessageReceivedEvent
            : public Event
        {
            MessageReceivedEvent() : Event(Type::MessageReceived) {}

            /**
             * This is the message that arrived.
             */
            Message message;
        };

        /**
         * This holds information published whenever a list of all members
         * arrives from the server.
         */
        struct MembershipChangedEvent
            : public Event
        {
            MembershipChangedEvent() : Event(Type::MembershipChanged) {}

            /**
             * These are the members of the group.
             */
            std::vector< MemberSnapshot > members;
        };

        /**
         * This is published when the connection with the server is lost.
         */
        struct DisconnectedEvent
            : public Event
        {
            DisconnectedEvent() : Event(Type::Disconnected) {}
        };

        /**
         * This is the type of function used to deliver events published
         * by the client.  Events are delivered one at a time, in order,
         * from a thread of the client's own.
         *
         * @param[in] event
         *     This is the event published by the client.
         */
        using EventDelegate = std::function< void(const Event& event) >;

        /**
         * This is the type of function returned by SubscribeToEvents, to
         * end the subscription.
         */
        using EventsUnsubscribeDelegate = std::function< void() >;

        /**
         * This is the type of function used to open a connection with
         * the membership server.
         *
         * @param[in] address
         *     This is the host name or address of the server.
         *
         * @param[in] port
         *     This is the port of the server.
         *
         * @return
         *     The transport of the new connection is returned, or nullptr
         *     if no connection could be made.
         */
        using TransportFactory = std::function<
            std::unique_ptr< ITransport >(
                const std::string& address,
                uint16_t port
            )
        >;

        /**
         * This is the outcome of an attempt to connect.
         */
        struct ConnectResult {
            /**
             * This indicates whether or not the client joined the group.
             */
            bool success = false;

            /**
             * If the attempt failed, this describes why.  If the server
             * refused the join, this is the text of its refusal.
             */
            std::string error;
        };

        // Lifecycle Methods
    public:
        ~Client() noexcept;
        Client(const Client&) = delete;
        Client(Client&&) noexcept;
        Client& operator=(const Client&) = delete;
        Client& operator=(Client&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.  The client connects to
         * the server over the network.
         */
        Client();

        /**
         * This constructor lets the caller decide how connections to the
         * server are made.
         *
         * @param[in] transportFactory
         *     This is the function used to open a connection with the
         *     membership server.
         */
        explicit Client(TransportFactory transportFactory);

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
         * This method forms a new subscription to events published
         * by the client.
         *
         * @param[in] eventDelegate
         *     This is the function to call to deliver events
         *     to the subscriber.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        EventsUnsubscribeDelegate SubscribeToEvents(EventDelegate eventDelegate);

        /**
         * Set how long Connect waits for the server to reply to the join.
         *
         * @param[in] seconds
         *     This is how long, in seconds, Connect waits for the server
         *     to reply to the join.
         */
        void SetConnectTimeout(double seconds);

        /**
         * Open a connection with the server, ask to join the group under
         * the given identifier, and wait for the server's reply.  The
         * server's JOIN reply is queued for publishing as a message event
         * before this method returns.
         *
         * @param[in] id
         *     This is the identifier under which to join the group.
         *
         * @param[in] address
         *     This is the host name or address of the server.
         *
         * @param[in] port
         *     This is the port of the server.
         *
         * @return
         *     The outcome of the attempt is returned.
         */
        ConnectResult Connect(
            const std::string& id,
            const std::string& address,
            uint16_t port
        );

        /**
         * Send text to every member, or to one member.
         *
         * @param[in] text
         *     This is the text to send.
         *
         * @param[in] recipientId
         *     This is the identifier of the member to which to send the
         *     text privately.  If it is empty or "Broadcast", the text is
         *     sent to every member.
         *
         * @return
         *     An indication of whether or not the message was sent
         *     is returned.
         */
        bool Send(
            const std::string& text,
            const std::string& recipientId = "Broadcast"
        );

        /**
         * Send the given message to the server as is.
         *
         * @param[in] message
         *     This is the message to send.
         *
         * @return
         *     An indication of whether or not the message was sent
         *     is returned.
         */
        bool SendRaw(const Message& message);

        /**
         * Tell the server the client is leaving, and close the connection.
         * This does nothing if the client is not connected.
         */
        void Leave();

        /**
         * Answer a liveness probe from the server.
         *
         * @return
         *     An indication of whether or not the answer was sent
         *     is returned.
         */
        bool RespondToHeartbeat();

        /**
         * Ask the server to probe every other member now.  The server only
         * honors this from the coordinator.
         *
         * @return
         *     An indication of whether or not the request was sent
         *     is returned.
         */
        bool RequestActiveCheck();

        /**
         * Ask for the list of all members.  The coordinator asks the
         * server directly; any other member asks the coordinator for
         * approval.
         *
         * @return
         *     An indication of whether or not the request was sent
         *     is returned.
         */
        bool RequestMemberList();

        /**
         * As the coordinator, let the given member see the member list.
         *
         * @param[in] requesterId
         *     This is the identifier of the member which asked.
         *
         * @return
         *     An indication of whether or not the approval was sent
         *     is returned.
         */
        bool ApproveMemberListRequest(const std::string& requesterId);

        /**
         * As the coordinator, refuse to let the given member see the
         * member list.
         *
         * @param[in] requesterId
         *     This is the identifier of the member which asked.
         *
         * @param[in] reason
         *     This is the text the member is sent as the refusal.
         *
         * @return
         *     An indication of whether or not the refusal was sent
         *     is returned.
         */
        bool DenyMemberListRequest(
            const std::string& requesterId,
            const std::string& reason
        );

        bool IsConnected() const;
        bool IsCoordinator() const;
        std::string GetCoordinatorId() const;
        std::string GetId() const;

        // Private properties
    private:
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

#endif /* HUDDLE_CLIENT_HPP */
