/**
 * @file NetworkTransport.cpp
 *
 * This module contains the implementation of the Huddle::NetworkTransport
 * class.
 *
 * © 2020 by Richard Walters
 */

#include <Huddle/NetworkTransport.hpp>
#include <mutex>
#include <Serialization/SerializedString.hpp>
#include <StringExtensions/StringExtensions.hpp>
#include <SystemAbstractions/StringFile.hpp>
#include <vector>

namespace {

    /**
     * This is the most bytes of a single record that will be held
     * while waiting for the rest of it.
     */
    constexpr size_t MAX_BUFFERED_RECORD_SIZE = 1048576;

    /**
     * This is the address returned when a host name cannot be resolved.
     */
    constexpr uint32_t UNRESOLVED_ADDRESS = 0;

}

namespace Huddle {

    /**
     * This contains the private properties of a NetworkTransport instance.
     */
    struct NetworkTransport::Impl {
        // Properties

        /**
         * This is the connection over which messages are carried.
         */
        std::shared_ptr< SystemAbstractions::NetworkConnection > connection;

        /**
         * This is used to synchronize access to the properties below.
         */
        std::mutex mutex;

        /**
         * This holds bytes received which do not yet make up a whole
         * record.
         */
        std::string receiveBuffer;

        MessageReceivedDelegate messageReceivedDelegate;
        BrokenDelegate brokenDelegate;

        /**
         * This indicates whether or not Close has been called.
         */
        bool closed = false;

        // Methods

        /**
         * Take in bytes received from the connection, and deliver every
         * message they complete.
         *
         * @param[in] data
         *     These are the bytes received.
         */
        void ReceiveData(const std::vector< uint8_t >& data) {
            std::vector< Message > messages;
            MessageReceivedDelegate messageReceivedDelegateSample;
            BrokenDelegate brokenDelegateSample;
            bool overflow = false;
            {
                std::lock_guard< decltype(mutex) > lock(mutex);
                if (closed) {
                    return;
                }
                receiveBuffer.append(data.begin(), data.end());
                for (;;) {
                    SystemAbstractions::StringFile buffer(receiveBuffer);
                    Serialization::SerializedString record;
                    if (!record.Deserialize(&buffer)) {
                        break;
                    }
                    const std::string serialization = record;
                    messages.emplace_back(serialization);
                    receiveBuffer.erase(0, (size_t)buffer.GetPosition());
                }
                if (receiveBuffer.size() > MAX_BUFFERED_RECORD_SIZE) {
                    overflow = true;
                    closed = true;
                    receiveBuffer.clear();
                }
                messageReceivedDelegateSample = messageReceivedDelegate;
                brokenDelegateSample = brokenDelegate;
            }
            for (auto& message: messages) {
                messageReceivedDelegateSample(std::move(message));
            }
            if (overflow) {
                connection->Close(false);
                brokenDelegateSample(false);
            }
        }

        /**
         * Handle the connection closing or failing.
         *
         * @param[in] graceful
         *     This indicates whether or not the other end closed the
         *     connection gracefully.
         */
        void ConnectionBroken(bool graceful) {
            BrokenDelegate brokenDelegateSample;
            {
                std::lock_guard< decltype(mutex) > lock(mutex);
                if (closed) {
                    return;
                }
                closed = true;
                brokenDelegateSample = brokenDelegate;
            }
            brokenDelegateSample(graceful);
        }
    };

    NetworkTransport::~NetworkTransport() noexcept {
        Close(false);
    }

    NetworkTransport::NetworkTransport(
        std::shared_ptr< SystemAbstractions::NetworkConnection > connection
    )
        : impl_(new Impl())
    {
        impl_->connection = connection;
    }

    std::unique_ptr< NetworkTransport > NetworkTransport::Connect(
        const std::string& host,
        uint16_t port
    ) {
        const auto address = SystemAbstractions::NetworkConnection::GetAddressOfHost(host);
        if (address == UNRESOLVED_ADDRESS) {
            return nullptr;
        }
        const auto connection = std::make_shared< SystemAbstractions::NetworkConnection >();
        if (!connection->Connect(address, port)) {
            return nullptr;
        }
        return std::unique_ptr< NetworkTransport >(new NetworkTransport(connection));
    }

    std::string NetworkTransport::GetPeerAddress() const {
        const auto address = impl_->connection->GetPeerAddress();
        return StringExtensions::sprintf(
            "%u.%u.%u.%u",
            (unsigned int)((address >> 24) & 0xFF),
            (unsigned int)((address >> 16) & 0xFF),
            (unsigned int)((address >> 8) & 0xFF),
            (unsigned int)(address & 0xFF)
        );
    }

    uint16_t NetworkTransport::GetPeerPort() const {
        return impl_->connection->GetPeerPort();
    }

    bool NetworkTransport::Open(
        MessageReceivedDelegate messageReceivedDelegate,
        BrokenDelegate brokenDelegate
    ) {
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            if (impl_->closed) {
                return false;
            }
            impl_->messageReceivedDelegate = messageReceivedDelegate;
            impl_->brokenDelegate = brokenDelegate;
        }
        std::weak_ptr< Impl > weakImpl(impl_);
        return impl_->connection->Process(
            [weakImpl](const std::vector< uint8_t >& data){
                const auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                impl->ReceiveData(data);
            },
            [weakImpl](bool graceful){
                const auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                impl->ConnectionBroken(graceful);
            }
        );
    }

    bool NetworkTransport::Send(const Message& message) {
        const auto serialization = message.Serialize();
        if (serialization.empty()) {
            return false;
        }
        SystemAbstractions::StringFile buffer;
        Serialization::SerializedString record(serialization);
        if (!record.Serialize(&buffer)) {
            return false;
        }
        const std::string recordBytes = buffer;
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (
            impl_->closed
            || !impl_->connection->IsConnected()
        ) {
            return false;
        }
        impl_->connection->SendMessage(
            std::vector< uint8_t >(recordBytes.begin(), recordBytes.end())
        );
        return true;
    }

    void NetworkTransport::Close(bool graceful) {
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            if (impl_->closed) {
                return;
            }
            impl_->closed = true;
        }
        impl_->connection->Close(graceful);
    }

}
