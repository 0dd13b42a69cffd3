#ifndef HUDDLE_NETWORK_SERVER_TRANSPORT_HPP
#define HUDDLE_NETWORK_SERVER_TRANSPORT_HPP

/**
 * @file NetworkServerTransport.hpp
 *
 * This module declares the Huddle::NetworkServerTransport class.
 *
 * © 2020 by Richard Walters
 */

#include "IServerTransport.hpp"

#include <memory>
#include <stdint.h>

namespace Huddle {

    /**
     * This accepts TCP connections from members, handing each to the server
     * as a NetworkTransport.
     */
    class NetworkServerTransport
        : public IServerTransport
    {
        // Lifecycle Methods
    public:
        ~NetworkServerTransport() noexcept;
        NetworkServerTransport(const NetworkServerTransport&) = delete;
        NetworkServerTransport(NetworkServerTransport&&) = delete;
        NetworkServerTransport& operator=(const NetworkServerTransport&) = delete;
        NetworkServerTransport& operator=(NetworkServerTransport&&) = delete;

        // Public Methods
    public:
        NetworkServerTransport();

        // IServerTransport
    public:
        virtual bool BindNetwork(
            uint16_t port,
            NewConnectionDelegate newConnectionDelegate
        ) override;
        virtual uint16_t GetBoundPort() const override;
        virtual void ReleaseNetwork() override;

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
        std::unique_ptr< Impl > impl_;
    };

}

#endif /* HUDDLE_NETWORK_SERVER_TRANSPORT_HPP */
