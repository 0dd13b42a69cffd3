/**
 * @file Lifecycle.cpp
 *
 * This module contains the unit tests of the Huddle::Server class that have
 * to do with mobilizing and demobilizing the server, and with its
 * configuration.
 *
 * © 2020 by Richard Walters
 */

#include "Common.hpp"

#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <Huddle/Election.hpp>
#include <Huddle/Message.hpp>
#include <Huddle/Server.hpp>
#include <Json/Value.hpp>
#include <memory>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <thread>
#include <vector>

namespace ServerTests {

    /**
     * This is the test fixture for these tests, providing common
     * setup and teardown for each test.
     */
    struct LifecycleTests
        : public Common
    {
    };

    TEST_F(LifecycleTests, Mobilize_Binds_Configured_Port) {
        // Arrange
        serverConfiguration.port = 5123;

        // Act
        const auto mobilized = MobilizeServer();

        // Assert
        EXPECT_TRUE(mobilized);
        EXPECT_TRUE(mockServerTransport->bound);
        EXPECT_EQ(5123, server.GetBoundPort());
        EXPECT_EQ(1, CountDiagnosticMessages("Huddle::Server[3]: Server running on port 5123"));
    }

    TEST_F(LifecycleTests, Mobilize_Twice_Fails_Second_Time) {
        // Arrange
        ASSERT_TRUE(MobilizeServer());

        // Act
        const auto mobilizedAgain = MobilizeServer();

        // Assert
        EXPECT_FALSE(mobilizedAgain);
        EXPECT_EQ(1, CountDiagnosticMessages("Huddle::Server[5]: Already mobilized"));
    }

    TEST_F(LifecycleTests, Mobilize_Fails_When_Port_Unavailable) {
        // Arrange
        mockServerTransport->bindResult = false;

        // Act
        const auto mobilized = MobilizeServer();

        // Assert
        EXPECT_FALSE(mobilized);
        EXPECT_EQ(0, server.GetBoundPort());
        EXPECT_EQ(1, CountDiagnosticMessages("Huddle::Server[10]: Unable to accept connections on port 5000"));
    }

    TEST_F(LifecycleTests, Demobilize_Closes_Connections_And_Releases_Network) {
        // Arrange
        ASSERT_TRUE(MobilizeServer());
        const auto bob = Join("bob", 6001);
        const auto amy = Join("amy", 6002);

        // Act
        server.Demobilize();

        // Assert
        EXPECT_TRUE(mockServerTransport->released);
        EXPECT_TRUE(bob->IsClosed());
        EXPECT_TRUE(amy->IsClosed());
        EXPECT_TRUE(server.GetMemberIds().empty());
        EXPECT_EQ(1, lastMemberLeftCount);
        EXPECT_EQ(0, server.GetBoundPort());
    }

    TEST_F(LifecycleTests, Demobilize_Closes_Member_Connection_Without_Handler_Lock_Held) {
        // Arrange
        ASSERT_TRUE(MobilizeServer());
        const auto bob = Join("bob", 6001);
        std::thread deliverer;
        bool deliveredWhileClosing = false;
        HuddleTests::MockConnection* const bobRaw = bob.get();
        bob->onClose = [bobRaw, &deliverer, &deliveredWhileClosing]{
            const auto delivered = std::make_shared< std::promise< void > >();
            auto deliveredFuture = delivered->get_future();
            deliverer = std::thread(
                [bobRaw, delivered]{
                    bobRaw->Receive(
                        Huddle::Message(Huddle::Message::Type::Broadcast, "bob", "still here")
                    );
                    delivered->set_value();
                }
            );
            deliveredWhileClosing = (
                deliveredFuture.wait_for(std::chrono::milliseconds(100))
                == std::future_status::ready
            );
        };

        // Act
        server.Demobilize();
        if (deliverer.joinable()) {
            deliverer.join();
        }

        // Assert
        EXPECT_TRUE(deliveredWhileClosing);
        EXPECT_TRUE(bob->IsClosed());
        EXPECT_TRUE(server.GetMemberIds().empty());
        bob->onClose = nullptr;
    }

    TEST_F(LifecycleTests, Demobilize_Twice_Does_Not_Crash) {
        // Arrange
        ASSERT_TRUE(MobilizeServer());

        // Act
        server.Demobilize();
        server.Demobilize();

        // Assert
        EXPECT_EQ(1, CountDiagnosticMessages("Huddle::Server[3]: Server stopped"));
    }

    TEST_F(LifecycleTests, No_Heartbeat_Rounds_After_Demobilize) {
        // Arrange
        ASSERT_TRUE(MobilizeServer());
        server.Demobilize();

        // Act
        AdvanceTimeToHeartbeatRound();

        // Assert
        EXPECT_FALSE(mockServerTransport->bound);
        EXPECT_EQ(0, server.GetHeartbeatRound());
    }

    TEST_F(LifecycleTests, Scheduler_Released_On_Demobilize) {
        // Arrange
        bool timeKeeperDestroyed = false;
        const auto onTimeKeeperDestroyed = [&timeKeeperDestroyed]{
            timeKeeperDestroyed = true;
        };
        mockTimeKeeper->RegisterDestructionDelegate(onTimeKeeperDestroyed);
        ASSERT_TRUE(MobilizeServer());
        scheduler = nullptr;
        mockTimeKeeper = nullptr;

        // Act
        server.Demobilize();

        // Assert
        EXPECT_TRUE(timeKeeperDestroyed);
    }

    TEST_F(LifecycleTests, Can_Mobilize_Again_After_Demobilize) {
        // Arrange
        ASSERT_TRUE(MobilizeServer());
        server.Demobilize();

        // Act
        const auto mobilized = MobilizeServer();
        const auto bob = Join("bob", 6001);

        // Assert
        EXPECT_TRUE(mobilized);
        EXPECT_EQ("bob", server.GetCoordinatorId());
    }

    TEST_F(LifecycleTests, Connection_Refused_After_Demobilize) {
        // Arrange
        ASSERT_TRUE(MobilizeServer());
        const auto delegate = mockServerTransport->newConnectionDelegate;
        server.Demobilize();
        const auto connection = std::make_shared< HuddleTests::MockConnection >();

        // Act
        delegate(
            std::unique_ptr< Huddle::ITransport >(new HuddleTests::MockTransport(connection))
        );

        // Assert
        EXPECT_TRUE(connection->IsClosed());
        EXPECT_FALSE(connection->opened);
    }

    TEST_F(LifecycleTests, Configuration_From_Json) {
        // Arrange
        const auto json = Json::Value::FromEncoding(
            "{"
            "\"port\": 6000,"
            "\"heartbeatInterval\": 30,"
            "\"heartbeatGraceWindow\": 2.5,"
            "\"electionRule\": \"highestPort\","
            "\"notifyCoordinatorOfActivity\": false"
            "}"
        );

        // Act
        const auto configuration = Huddle::Server::Configuration::FromJson(json);

        // Assert
        EXPECT_EQ(6000, configuration.port);
        EXPECT_EQ(30.0, configuration.heartbeatInterval);
        EXPECT_EQ(2.5, configuration.heartbeatGraceWindow);
        EXPECT_EQ(Huddle::ElectionRule::HighestPort, configuration.electionRule);
        EXPECT_FALSE(configuration.notifyCoordinatorOfActivity);
    }

    TEST_F(LifecycleTests, Configuration_Defaults_For_Missing_Fields) {
        // Arrange
        const auto json = Json::Value::FromEncoding("{\"port\": 7000}");

        // Act
        const auto configuration = Huddle::Server::Configuration::FromJson(json);

        // Assert
        EXPECT_EQ(7000, configuration.port);
        EXPECT_EQ(300.0, configuration.heartbeatInterval);
        EXPECT_EQ(60.0, configuration.heartbeatGraceWindow);
        EXPECT_EQ(Huddle::ElectionRule::LowestId, configuration.electionRule);
        EXPECT_TRUE(configuration.notifyCoordinatorOfActivity);
    }

    TEST_F(LifecycleTests, Configuration_From_Json_Rejects_Out_Of_Range_Port) {
        // Arrange
        SystemAbstractions::DiagnosticsSender diagnosticsSender("Configuration");
        std::vector< std::string > warnings;
        const auto unsubscribe = diagnosticsSender.SubscribeToDiagnostics(
            [&warnings](
                std::string senderName,
                size_t level,
                std::string message
            ){
                warnings.push_back(message);
            },
            SystemAbstractions::DiagnosticsSender::Levels::WARNING
        );
        const auto tooHigh = Json::Value::FromEncoding("{\"port\": 70000}");
        const auto negative = Json::Value::FromEncoding("{\"port\": -1}");

        // Act
        const auto tooHighConfiguration = Huddle::Server::Configuration::FromJson(tooHigh, &diagnosticsSender);
        const auto negativeConfiguration = Huddle::Server::Configuration::FromJson(negative, &diagnosticsSender);

        // Assert
        EXPECT_EQ(5000, tooHighConfiguration.port);
        EXPECT_EQ(5000, negativeConfiguration.port);
        EXPECT_EQ(
            std::vector< std::string >({
                "Ignoring out-of-range value for port; using the default",
                "Ignoring out-of-range value for port; using the default",
            }),
            warnings
        );
        unsubscribe();
    }

    TEST_F(LifecycleTests, Configuration_From_Json_Rejects_Non_Positive_Intervals) {
        // Arrange
        SystemAbstractions::DiagnosticsSender diagnosticsSender("Configuration");
        std::vector< std::string > warnings;
        const auto unsubscribe = diagnosticsSender.SubscribeToDiagnostics(
            [&warnings](
                std::string senderName,
                size_t level,
                std::string message
            ){
                warnings.push_back(message);
            },
            SystemAbstractions::DiagnosticsSender::Levels::WARNING
        );
        const auto json = Json::Value::FromEncoding(
            "{"
            "\"heartbeatInterval\": 0,"
            "\"heartbeatGraceWindow\": -2.5"
            "}"
        );

        // Act
        const auto configuration = Huddle::Server::Configuration::FromJson(json, &diagnosticsSender);

        // Assert
        EXPECT_EQ(300.0, configuration.heartbeatInterval);
        EXPECT_EQ(60.0, configuration.heartbeatGraceWindow);
        EXPECT_EQ(
            std::vector< std::string >({
                "Ignoring out-of-range value for heartbeatInterval; using the default",
                "Ignoring out-of-range value for heartbeatGraceWindow; using the default",
            }),
            warnings
        );
        unsubscribe();
    }

    TEST_F(LifecycleTests, Mobilize_Replaces_Non_Positive_Heartbeat_Interval) {
        // Arrange
        serverConfiguration.heartbeatInterval = 0.0;
        serverConfiguration.heartbeatGraceWindow = -1.0;

        // Act
        ASSERT_TRUE(MobilizeServer());
        const auto bob = Join("bob", 6001);
        AdvanceTime(1.0);

        // Assert
        EXPECT_EQ(1, CountDiagnosticMessages("Huddle::Server[5]: Heartbeat interval must be positive; using 300 seconds"));
        EXPECT_EQ(1, CountDiagnosticMessages("Huddle::Server[5]: Heartbeat grace window must be positive; using 60 seconds"));
        EXPECT_FALSE(bob->AwaitSentOfType(Huddle::Message::Type::Heartbeat, 1));
        EXPECT_EQ(0, server.GetHeartbeatRound());
        AdvanceTime(300.0);
        ASSERT_TRUE(bob->AwaitSentOfType(Huddle::Message::Type::Heartbeat, 1));
        EXPECT_EQ(1, server.GetHeartbeatRound());
    }

}
