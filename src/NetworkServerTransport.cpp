/**
 * @file NetworkServerTransport.cpp
 *
 * This module contains the implementation of the
 * Huddle::NetworkServerTransport class.
 *
 * © 2020 by Richard Walters
 */

#include <Huddle/NetworkServerTransport.hpp>
#include <Huddle/NetworkTransport.hpp>
#include <SystemAbstractions/NetworkEndpoint.hpp>

namespace Huddle {

    /**
     * This contains the private properties of a NetworkServerTransport
     * instance.
     */
    struct NetworkServerTransport::Impl {
        /**
         * This listens for new connections.
         */
        SystemAbstractions::NetworkEndpoint endpoint;
    };

    NetworkServerTransport::~NetworkServerTransport() noexcept {
        ReleaseNetwork();
    }

    NetworkServerTransport::NetworkServerTransport()
        : impl_(new Impl())
    {
    }

    bool NetworkServerTransport::BindNetwork(
        uint16_t port,
        NewConnectionDelegate newConnectionDelegate
    ) {
        return impl_->endpoint.Open(
            [newConnectionDelegate](
                std::shared_ptr< SystemAbstractions::NetworkConnection > connection
            ){
                newConnectionDelegate(
                    std::unique_ptr< ITransport >(new NetworkTransport(connection))
                );
            },
            [](
                uint32_t address,
                uint16_t port,
                const std::vector< uint8_t >& body
            ){
            },
            SystemAbstractions::NetworkEndpoint::Mode::Connection,
            0,
            0,
            port
        );
    }

    uint16_t NetworkServerTransport::GetBoundPort() const {
        return impl_->endpoint.GetBoundPort();
    }

    void NetworkServerTransport::ReleaseNetwork() {
        impl_->endpoint.Close();
    }

}
