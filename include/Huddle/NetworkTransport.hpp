#ifndef HUDDLE_NETWORK_TRANSPORT_HPP
#define HUDDLE_NETWORK_TRANSPORT_HPP

/**
 * @file NetworkTransport.hpp
 *
 * This module declares the Huddle::NetworkTransport class.
 *
 * © 2020 by Richard Walters
 */

#include "ITransport.hpp"

#include <memory>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/NetworkConnection.hpp>

namespace Huddle {

    /**
     * This is the transport of a TCP connection.  Each message travels as
     * one record: a variable-length byte count followed by the message's
     * serialized form.
     */
    class NetworkTransport
        : public ITransport
    {
        // Lifecycle Methods
    public:
        ~NetworkTransport() noexcept;
        NetworkTransport(const NetworkTransport&) = delete;
        NetworkTransport(NetworkTransport&&) = delete;
        NetworkTransport& operator=(const NetworkTransport&) = delete;
        NetworkTransport& operator=(NetworkTransport&&) = delete;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         *
         * @param[in] connection
         *     This is the connection over which to carry messages.
         */
        explicit NetworkTransport(
            std::shared_ptr< SystemAbstractions::NetworkConnection > connection
        );

        /**
         * Open a TCP connection with the given host.
         *
         * @param[in] host
         *     This is the host name or dotted address of the host.
         *
         * @param[in] port
         *     This is the port of the host.
         *
         * @return
         *     The transport of the new connection is returned, or nullptr
         *     if the connection could not be made.
         */
        static std::unique_ptr< NetworkTransport > Connect(
            const std::string& host,
            uint16_t port
        );

        // ITransport
    public:
        virtual std::string GetPeerAddress() const override;
        virtual uint16_t GetPeerPort() const override;
        virtual bool Open(
            MessageReceivedDelegate messageReceivedDelegate,
            BrokenDelegate brokenDelegate
        ) override;
        virtual bool Send(const Message& message) override;
        virtual void Close(bool graceful) override;

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

#endif /* HUDDLE_NETWORK_TRANSPORT_HPP */
