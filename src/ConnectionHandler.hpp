#pragma once

/**
 * @file ConnectionHandler.hpp
 *
 * This module declares the Huddle::ConnectionHandler class.
 *
 * © 2020 by Richard Walters
 */

#include "ServerImpl.hpp"

#include <Huddle/ITransport.hpp>
#include <Huddle/LiveMember.hpp>
#include <Huddle/Message.hpp>
#include <memory>
#include <mutex>
#include <string>

namespace Huddle {

    /**
     * This runs the server side of the protocol for one accepted
     * peer connection, from the peer's JOIN until the connection ends.
     */
    class ConnectionHandler
        : public std::enable_shared_from_this< ConnectionHandler >
    {
        // Types
    public:
        /**
         * These are the stages through which a connection passes.
         */
        enum class State {
            /**
             * The peer has not yet sent its JOIN.
             */
            AwaitingJoin,

            /**
             * The peer is registered with the server.
             */
            Registered,

            /**
             * The connection has ended and cleanup is done.
             */
            Closed,
        };

        // Lifecycle Methods
    public:
        ~ConnectionHandler() noexcept;
        ConnectionHandler(const ConnectionHandler&) = delete;
        ConnectionHandler(ConnectionHandler&&) = delete;
        ConnectionHandler& operator=(const ConnectionHandler&) = delete;
        ConnectionHandler& operator=(ConnectionHandler&&) = delete;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         *
         * @param[in] server
         *     This is the server with which to register the peer.
         *
         * @param[in] transport
         *     This is the transport of the accepted connection.
         */
        ConnectionHandler(
            std::weak_ptr< Server::Impl > server,
            std::unique_ptr< ITransport > transport
        );

        /**
         * Start receiving messages from the peer.
         *
         * @return
         *     An indication of whether or not the transport could be
         *     opened is returned.
         */
        bool Start();

        /**
         * End the connection, with the same cleanup as if the peer had
         * disconnected.  This does nothing if the connection already
         * ended.
         */
        void Stop();

        /**
         * Return an indication of whether or not the connection has ended.
         *
         * @return
         *     An indication of whether or not the connection has ended
         *     is returned.
         */
        bool IsDone() const;

        // Private Methods
    private:
        void OnMessage(Message&& message);
        void OnBroken(bool graceful);

        /**
         * Handle the first message from the peer, which has to be
         * a JOIN.
         *
         * @param[in] message
         *     This is the first message from the peer.
         */
        void Join(const Message& message);

        /**
         * Handle a message from a registered peer.
         *
         * @param[in] server
         *     This is the server with which the peer is registered.
         *
         * @param[in] message
         *     This is the message from the peer.
         */
        void Dispatch(
            const std::shared_ptr< Server::Impl >& server,
            const Message& message
        );

        /**
         * Remove the peer, tell the others it left, and close the
         * connection.  Only the first call has any effect.
         *
         * @param[in] graceful
         *     This indicates whether or not to let queued messages go out
         *     before the connection closes.
         */
        void Finish(bool graceful);

        // Private properties
    private:
        std::weak_ptr< Server::Impl > server_;

        /**
         * This is used to synchronize access to the properties below.
         */
        mutable std::recursive_mutex mutex_;

        State state_ = State::AwaitingJoin;

        /**
         * This is the identifier the peer joined with.
         */
        std::string id_;

        /**
         * This holds the transport until the peer is registered, after
         * which the member owns it.
         */
        std::unique_ptr< ITransport > transport_;

        /**
         * This is the member registered for the peer.
         */
        std::shared_ptr< LiveMember > member_;
    };

}
