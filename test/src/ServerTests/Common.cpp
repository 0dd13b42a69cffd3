/**
 * @file Common.cpp
 *
 * This module provides the implementation of the base fixture used to test
 * the Huddle::Server class.
 *
 * © 2020 by Richard Walters
 */

#include "Common.hpp"

#include <functional>
#include <gtest/gtest.h>
#include <Huddle/Server.hpp>
#include <stddef.h>
#include <StringExtensions/StringExtensions.hpp>
#include <vector>

namespace ServerTests {

    MockTimeKeeper::~MockTimeKeeper() {
        for (const auto& destructionDelegate: destructionDelegates) {
            destructionDelegate();
        }
    }

    void MockTimeKeeper::RegisterDestructionDelegate(std::function< void() > destructionDelegate) {
        destructionDelegates.push_back(destructionDelegate);
    }

    double MockTimeKeeper::GetCurrentTime() {
        return currentTime;
    }

    bool Common::MobilizeServer() {
        return server.Mobilize(
            mockServerTransport,
            scheduler,
            serverConfiguration
        );
    }

    std::shared_ptr< HuddleTests::MockConnection > Common::Join(
        const std::string& id,
        uint16_t peerPort
    ) {
        const auto connection = mockServerTransport->Accept("10.0.0.1", peerPort);
        Deliver(connection, Huddle::Message::Type::Join, id);
        return connection;
    }

    void Common::Deliver(
        const std::shared_ptr< HuddleTests::MockConnection >& connection,
        Huddle::Message::Type type,
        const std::string& senderId,
        const std::string& text,
        const std::string& recipientId
    ) {
        Huddle::Message message(type, senderId, text);
        message.recipientId = recipientId;
        connection->Receive(message);
    }

    void Common::AdvanceTime(double seconds) {
        mockTimeKeeper->currentTime += seconds;
        scheduler->WakeUp();
    }

    void Common::AdvanceTimeToHeartbeatRound() {
        AdvanceTime(serverConfiguration.heartbeatInterval);
    }

    void Common::AdvanceTimeThroughGraceWindow() {
        AdvanceTime(serverConfiguration.heartbeatGraceWindow + 0.001);
    }

    size_t Common::CountDiagnosticMessages(const std::string& message) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        size_t count = 0;
        for (const auto& diagnosticMessage: diagnosticMessages) {
            if (diagnosticMessage == message) {
                ++count;
            }
        }
        return count;
    }

    void Common::SetServerDelegates() {
        scheduler->SetClock(mockTimeKeeper);
        diagnosticsUnsubscribeDelegate = server.SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                std::lock_guard< decltype(mutex) > lock(mutex);
                diagnosticMessages.push_back(
                    StringExtensions::sprintf(
                        "%s[%zu]: %s",
                        senderName.c_str(),
                        level,
                        message.c_str()
                    )
                );
            },
            0
        );
        server.SetLastMemberLeftDelegate(
            [this]{
                std::lock_guard< decltype(mutex) > lock(mutex);
                ++lastMemberLeftCount;
            }
        );
    }

    void Common::SetUp() {
        SetServerDelegates();
        serverConfiguration.port = 5000;
        serverConfiguration.heartbeatInterval = 10.0;
        serverConfiguration.heartbeatGraceWindow = 2.0;
    }

    void Common::TearDown() {
        server.Demobilize();
        diagnosticsUnsubscribeDelegate();
    }

}
