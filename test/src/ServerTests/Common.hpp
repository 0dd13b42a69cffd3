#pragma once

/**
 * @file Common.hpp
 *
 * This module declares the base fixture used to test the Huddle::Server
 * class.  The fixture is subclassed to test various aspects of the class,
 * including:
 * - Membership: joining, leaving, and coordinator election
 * - Routing: broadcast, private, and member list messages
 * - Heartbeats: liveness probes and removal of unresponsive members
 * - Lifecycle: mobilizing and demobilizing the server
 *
 * © 2020 by Richard Walters
 */

#include "../MockTransport.hpp"

#include <functional>
#include <gtest/gtest.h>
#include <Huddle/Message.hpp>
#include <Huddle/Server.hpp>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <Timekeeping/Clock.hpp>
#include <Timekeeping/Scheduler.hpp>
#include <vector>

namespace ServerTests {

    /**
     * This is a fake time-keeper which is used to test the server.
     */
    struct MockTimeKeeper
        : public Timekeeping::Clock
    {
        // Properties

        double currentTime = 0.0;
        std::vector< std::function< void() > > destructionDelegates;

        // Lifecycle

        ~MockTimeKeeper();
        MockTimeKeeper(const MockTimeKeeper&) = delete;
        MockTimeKeeper(MockTimeKeeper&&) = delete;
        MockTimeKeeper& operator=(const MockTimeKeeper&) = delete;
        MockTimeKeeper& operator=(MockTimeKeeper&&) = delete;

        // Methods

        MockTimeKeeper() = default;

        void RegisterDestructionDelegate(std::function< void() > destructionDelegate);

        // Timekeeping::Clock

        virtual double GetCurrentTime() override;
    };

    /**
     * This is the base class for the concrete ServerTests test fixtures,
     * providing common setup and teardown for each test.
     */
    struct Common
        : public ::testing::Test
    {
        // Properties

        std::vector< std::string > diagnosticMessages;
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate diagnosticsUnsubscribeDelegate;
        size_t lastMemberLeftCount = 0;
        std::shared_ptr< MockTimeKeeper > mockTimeKeeper = std::make_shared< MockTimeKeeper >();
        std::shared_ptr< HuddleTests::MockServerTransport > mockServerTransport = std::make_shared< HuddleTests::MockServerTransport >();
        std::mutex mutex;
        std::shared_ptr< Timekeeping::Scheduler > scheduler = std::make_shared< Timekeeping::Scheduler >();
        Huddle::Server server;
        Huddle::Server::Configuration serverConfiguration;

        // Methods

        bool MobilizeServer();

        /**
         * Open a connection to the server from the given port and ask to
         * join the group under the given identifier.
         *
         * @return
         *     The state of the new connection is returned.
         */
        std::shared_ptr< HuddleTests::MockConnection > Join(
            const std::string& id,
            uint16_t peerPort
        );

        /**
         * Deliver to the server a message of the given type from the peer
         * on the given connection.
         */
        void Deliver(
            const std::shared_ptr< HuddleTests::MockConnection >& connection,
            Huddle::Message::Type type,
            const std::string& senderId,
            const std::string& text = "",
            const std::string& recipientId = ""
        );

        void AdvanceTime(double seconds);
        void AdvanceTimeToHeartbeatRound();
        void AdvanceTimeThroughGraceWindow();
        size_t CountDiagnosticMessages(const std::string& message);
        void SetServerDelegates();

        // ::testing::Test

        virtual void SetUp() override;
        virtual void TearDown() override;
    };

}
