#ifndef HUDDLE_I_SERVER_TRANSPORT_HPP
#define HUDDLE_I_SERVER_TRANSPORT_HPP

/**
 * @file IServerTransport.hpp
 *
 * This module declares the Huddle::IServerTransport interface.
 *
 * © 2020 by Richard Walters
 */

#include "ITransport.hpp"

#include <functional>
#include <memory>
#include <stdint.h>

namespace Huddle {

    /**
     * This represents the listening side of the network used by the
     * membership server to accept connections from peers.
     */
    class IServerTransport {
        // Types
    public:
        /**
         * This is the type of function used to hand over each newly
         * accepted connection.
         *
         * @param[in] transport
         *     This is the transport of the new connection.  It has not
         *     been opened yet.
         */
        using NewConnectionDelegate = std::function<
            void(std::unique_ptr< ITransport > transport)
        >;

        // Methods
    public:
        virtual ~IServerTransport() noexcept {}

        /**
         * Start accepting connections on the given port.
         *
         * @param[in] port
         *     This is the port on which to accept connections, or zero
         *     to let the operating system pick one.
         *
         * @param[in] newConnectionDelegate
         *     This is the function to call for each accepted connection.
         *
         * @return
         *     An indication of whether or not the transport is now
         *     accepting connections is returned.
         */
        virtual bool BindNetwork(
            uint16_t port,
            NewConnectionDelegate newConnectionDelegate
        ) = 0;

        /**
         * Return the port on which connections are being accepted.
         *
         * @return
         *     The port on which connections are being accepted is
         *     returned, or zero if the transport is not bound.
         */
        virtual uint16_t GetBoundPort() const = 0;

        /**
         * Stop accepting connections.
         */
        virtual void ReleaseNetwork() = 0;
    };

}

#endif /* HUDDLE_I_SERVER_TRANSPORT_HPP */
