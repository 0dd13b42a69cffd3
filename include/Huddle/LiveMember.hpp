#ifndef HUDDLE_LIVE_MEMBER_HPP
#define HUDDLE_LIVE_MEMBER_HPP

/**
 * @file LiveMember.hpp
 *
 * This module declares the Huddle::LiveMember class.
 *
 * © 2020 by Richard Walters
 */

#include "ITransport.hpp"
#include "MemberSnapshot.hpp"
#include "Message.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <stdint.h>
#include <string>

namespace Huddle {

    /**
     * This is the server-side record of a connected member.  It owns the
     * transport of the member's connection exclusively, so it can never be
     * copied or sent anywhere.  Use Detach to get a form that can.
     */
    class LiveMember {
        // Lifecycle Methods
    public:
        ~LiveMember() noexcept;
        LiveMember(const LiveMember&) = delete;
        LiveMember(LiveMember&&) = delete;
        LiveMember& operator=(const LiveMember&) = delete;
        LiveMember& operator=(LiveMember&&) = delete;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         *
         * @param[in] id
         *     This is the identifier of the member.
         *
         * @param[in] transport
         *     This is the transport of the member's connection.  The
         *     address and port of the member are taken from it.  It may
         *     be null, in which case the member has no address, and
         *     nothing can be sent to it.
         */
        LiveMember(
            const std::string& id,
            std::unique_ptr< ITransport > transport
        );

        /**
         * This constructor is used when the address and port of the
         * member are known independently of any transport.
         *
         * @param[in] id
         *     This is the identifier of the member.
         *
         * @param[in] address
         *     This is the network address of the member.
         *
         * @param[in] port
         *     This is the network port of the member.
         */
        LiveMember(
            const std::string& id,
            const std::string& address,
            uint16_t port
        );

        const std::string& GetId() const;
        const std::string& GetAddress() const;
        uint16_t GetPort() const;

        /**
         * Return an indication of whether or not the member is currently
         * flagged as the group coordinator.
         *
         * @return
         *     An indication of whether or not the member is currently
         *     flagged as the group coordinator is returned.
         */
        bool IsCoordinator() const;

        /**
         * Set or clear the member's coordinator flag.
         *
         * @param[in] isCoordinator
         *     This indicates whether or not the member is the coordinator.
         */
        void SetCoordinator(bool isCoordinator);

        /**
         * Return an indication of whether or not the member has a
         * transport which has not been closed.
         *
         * @return
         *     An indication of whether or not the member has a
         *     transport which has not been closed is returned.
         */
        bool HasTransport() const;

        /**
         * Return a metadata-only copy of the member.
         *
         * @return
         *     A metadata-only copy of the member is returned.
         */
        MemberSnapshot Detach() const;

        /**
         * Send a liveness probe to the member.  This never waits for
         * the member's answer.
         *
         * @return
         *     An indication of whether or not the probe was handed to the
         *     transport is returned.  This is false if the member owns no
         *     transport or the transport refused the probe.
         */
        bool Ping();

        /**
         * Send the given message to the member.
         *
         * @param[in] message
         *     This is the message to send.
         *
         * @return
         *     An indication of whether or not the message was handed to the
         *     transport is returned.
         */
        bool Send(const Message& message);

        /**
         * Close the member's transport.  Later sends to the member fail.
         * The transport itself is kept until the member is destroyed,
         * since this may be called from the transport's own thread.
         *
         * @param[in] graceful
         *     This indicates whether or not to let queued messages go out
         *     before the connection closes.
         */
        void Close(bool graceful);

        // Private properties
    private:
        /**
         * This is the identifier of the member.
         */
        const std::string id_;

        std::string address_;

        uint16_t port_ = 0;

        std::atomic< bool > isCoordinator_;

        /**
         * This is used to synchronize access to the transport.
         */
        mutable std::mutex transportMutex_;

        /**
         * This is the transport of the member's connection.
         */
        std::unique_ptr< ITransport > transport_;

        /**
         * This indicates whether or not the transport has been closed.
         */
        bool closed_ = false;
    };

    /**
     * This is the type of the membership registry: live members keyed
     * and ordered by identifier.
     */
    using Members = std::map< std::string, std::shared_ptr< LiveMember > >;

}

#endif /* HUDDLE_LIVE_MEMBER_HPP */
