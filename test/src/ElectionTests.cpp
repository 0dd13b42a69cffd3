/**
 * @file ElectionTests.cpp
 *
 * This module contains the unit tests of the Huddle::Election and
 * Huddle::CoordinatorRegistry classes.
 *
 * © 2020 by Richard Walters
 */

#include <gtest/gtest.h>
#include <Huddle/CoordinatorRegistry.hpp>
#include <Huddle/Election.hpp>
#include <Huddle/LiveMember.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

    /**
     * Add to the given members one without a transport.
     */
    std::shared_ptr< Huddle::LiveMember > AddMember(
        Huddle::Members& members,
        const std::string& id,
        uint16_t port
    ) {
        const auto member = std::make_shared< Huddle::LiveMember >(id, "10.0.0.1", port);
        members[id] = member;
        return member;
    }

    size_t CountCoordinators(const Huddle::Members& members) {
        size_t count = 0;
        for (const auto& member: members) {
            if (member.second->IsCoordinator()) {
                ++count;
            }
        }
        return count;
    }

}

TEST(ElectionTests, Lowest_Identifier_Wins) {
    // Arrange
    const auto registry = std::make_shared< Huddle::CoordinatorRegistry >();
    Huddle::Election election(registry);
    Huddle::Members members;
    (void)AddMember(members, "cid", 6003);
    const auto amy = AddMember(members, "amy", 6002);
    (void)AddMember(members, "bob", 6001);

    // Act
    const auto winner = election.Run(members);

    // Assert
    EXPECT_EQ(amy, winner);
    EXPECT_TRUE(amy->IsCoordinator());
    EXPECT_EQ(1, CountCoordinators(members));
    EXPECT_EQ("amy", registry->GetId());
    EXPECT_EQ(amy, registry->Get());
}

TEST(ElectionTests, Previous_Coordinator_Flag_Cleared) {
    // Arrange
    const auto registry = std::make_shared< Huddle::CoordinatorRegistry >();
    Huddle::Election election(registry);
    Huddle::Members members;
    const auto bob = AddMember(members, "bob", 6001);
    bob->SetCoordinator(true);
    (void)AddMember(members, "amy", 6002);

    // Act
    (void)election.Run(members);

    // Assert
    EXPECT_FALSE(bob->IsCoordinator());
    EXPECT_EQ(1, CountCoordinators(members));
}

TEST(ElectionTests, Rerun_On_Unchanged_Membership_Is_Idempotent) {
    // Arrange
    const auto registry = std::make_shared< Huddle::CoordinatorRegistry >();
    Huddle::Election election(registry);
    Huddle::Members members;
    const auto cid = AddMember(members, "cid", 6003);
    const auto amy = AddMember(members, "amy", 6002);
    const auto bob = AddMember(members, "bob", 6001);
    const auto firstWinner = election.Run(members);

    // Act
    const auto secondWinner = election.Run(members);

    // Assert
    EXPECT_EQ(firstWinner, secondWinner);
    EXPECT_EQ(amy, secondWinner);
    EXPECT_TRUE(amy->IsCoordinator());
    EXPECT_FALSE(bob->IsCoordinator());
    EXPECT_FALSE(cid->IsCoordinator());
    EXPECT_EQ(1, CountCoordinators(members));
    EXPECT_EQ("amy", registry->GetId());
    EXPECT_EQ(amy, registry->Get());
}

TEST(ElectionTests, Concurrent_Runs_Leave_One_Coordinator) {
    // Arrange
    const auto registry = std::make_shared< Huddle::CoordinatorRegistry >();
    Huddle::Election election(registry);
    Huddle::Members members;
    (void)AddMember(members, "cid", 6003);
    const auto amy = AddMember(members, "amy", 6002);
    (void)AddMember(members, "bob", 6001);
    std::vector< std::thread > threads;

    // Act
    for (size_t i = 0; i < 8; ++i) {
        threads.emplace_back(
            [&election, &members]{
                for (size_t j = 0; j < 100; ++j) {
                    (void)election.Run(members);
                }
            }
        );
    }
    for (auto& thread: threads) {
        thread.join();
    }

    // Assert
    EXPECT_EQ(1, CountCoordinators(members));
    EXPECT_TRUE(amy->IsCoordinator());
    EXPECT_EQ(amy, registry->Get());
}

TEST(ElectionTests, Empty_Membership_Yields_No_Coordinator) {
    // Arrange
    const auto registry = std::make_shared< Huddle::CoordinatorRegistry >();
    Huddle::Election election(registry);
    Huddle::Members members;
    const auto bob = AddMember(members, "bob", 6001);
    (void)election.Run(members);
    members.clear();

    // Act
    const auto winner = election.Run(members);

    // Assert
    EXPECT_TRUE(winner == nullptr);
    EXPECT_TRUE(registry->Get() == nullptr);
    EXPECT_EQ("", registry->GetId());
}

TEST(ElectionTests, Highest_Port_Wins_Under_Port_Rule) {
    // Arrange
    const auto registry = std::make_shared< Huddle::CoordinatorRegistry >();
    Huddle::Election election(registry, Huddle::ElectionRule::HighestPort);
    Huddle::Members members;
    (void)AddMember(members, "amy", 6001);
    const auto cid = AddMember(members, "cid", 6009);
    (void)AddMember(members, "bob", 6005);

    // Act
    const auto winner = election.Run(members);

    // Assert
    EXPECT_EQ(cid, winner);
    EXPECT_EQ("cid", registry->GetId());
    EXPECT_EQ(1, CountCoordinators(members));
}

TEST(ElectionTests, Port_Tie_Goes_To_Lowest_Identifier) {
    // Arrange
    Huddle::Members members;
    (void)AddMember(members, "cid", 6009);
    const auto bob = AddMember(members, "bob", 6009);
    (void)AddMember(members, "amy", 6001);

    // Act
    const auto winner = Huddle::Election::Select(members, Huddle::ElectionRule::HighestPort);

    // Assert
    EXPECT_EQ(bob, winner);
}

TEST(ElectionTests, Rule_Can_Be_Changed) {
    // Arrange
    const auto registry = std::make_shared< Huddle::CoordinatorRegistry >();
    Huddle::Election election(registry);

    // Act
    election.SetRule(Huddle::ElectionRule::HighestPort);

    // Assert
    EXPECT_EQ(Huddle::ElectionRule::HighestPort, election.GetRule());
}

TEST(CoordinatorRegistryTests, Initially_Empty) {
    // Arrange
    Huddle::CoordinatorRegistry registry;

    // Act
    const auto coordinator = registry.Get();

    // Assert
    EXPECT_TRUE(coordinator == nullptr);
    EXPECT_EQ("", registry.GetId());
}

TEST(CoordinatorRegistryTests, Set_Then_Reset) {
    // Arrange
    Huddle::CoordinatorRegistry registry;
    const auto member = std::make_shared< Huddle::LiveMember >("bob", "10.0.0.1", 6001);
    registry.Set(member);
    ASSERT_EQ(member, registry.Get());
    ASSERT_EQ("bob", registry.GetId());

    // Act
    registry.Reset();

    // Assert
    EXPECT_TRUE(registry.Get() == nullptr);
    EXPECT_EQ("", registry.GetId());
}

TEST(CoordinatorRegistryTests, Does_Not_Keep_Coordinator_Alive) {
    // Arrange
    Huddle::CoordinatorRegistry registry;
    auto member = std::make_shared< Huddle::LiveMember >("bob", "10.0.0.1", 6001);
    registry.Set(member);

    // Act
    member = nullptr;

    // Assert
    EXPECT_TRUE(registry.Get() == nullptr);
}
