#ifndef HUDDLE_I_TRANSPORT_HPP
#define HUDDLE_I_TRANSPORT_HPP

/**
 * @file ITransport.hpp
 *
 * This module declares the Huddle::ITransport interface.
 *
 * © 2020 by Richard Walters
 */

#include "Message.hpp"

#include <functional>
#include <stdint.h>
#include <string>

namespace Huddle {

    /**
     * This represents one end of a persistent duplex connection over
     * which messages travel in the order they are sent.  To integrate
     * Huddle components with a network, implement this interface in
     * terms of the actual connection.
     */
    class ITransport {
        // Types
    public:
        /**
         * This is the type of function used to deliver messages received
         * from the other end of the connection.
         *
         * @param[in] message
         *     This is the message received.  It has the type Unknown if
         *     the record received could not be decoded.
         */
        using MessageReceivedDelegate = std::function< void(Message&& message) >;

        /**
         * This is the type of function called when the connection is
         * closed by the other end or fails.
         *
         * @param[in] graceful
         *     This indicates whether or not the other end closed the
         *     connection gracefully.
         */
        using BrokenDelegate = std::function< void(bool graceful) >;

        // Methods
    public:
        virtual ~ITransport() noexcept {}

        /**
         * Return the network address of the other end of the connection.
         *
         * @return
         *     The network address of the other end of the connection
         *     is returned.
         */
        virtual std::string GetPeerAddress() const = 0;

        /**
         * Return the network port of the other end of the connection.
         *
         * @return
         *     The network port of the other end of the connection
         *     is returned.
         */
        virtual uint16_t GetPeerPort() const = 0;

        /**
         * Begin delivering messages received from the other end of the
         * connection.  Delegates are called from the transport's own
         * thread.
         *
         * @param[in] messageReceivedDelegate
         *     This is the function to call for each message received.
         *
         * @param[in] brokenDelegate
         *     This is the function to call once, when the connection
         *     closes or fails.
         *
         * @return
         *     An indication of whether or not the transport was able to
         *     begin delivering messages is returned.
         */
        virtual bool Open(
            MessageReceivedDelegate messageReceivedDelegate,
            BrokenDelegate brokenDelegate
        ) = 0;

        /**
         * Queue the given message to be sent to the other end of the
         * connection.  This does not wait for any reply.
         *
         * @param[in] message
         *     This is the message to send.
         *
         * @return
         *     An indication of whether or not the message was accepted
         *     for sending is returned.
         */
        virtual bool Send(const Message& message) = 0;

        /**
         * Close the connection.  The broken delegate is not called for a
         * close requested through this method.
         *
         * @param[in] graceful
         *     This indicates whether or not to let queued messages go out
         *     before the connection closes.
         */
        virtual void Close(bool graceful) = 0;
    };

}

#endif /* HUDDLE_I_TRANSPORT_HPP */
