/**
 * @file MessageTests.cpp
 *
 * This module contains the unit tests of the
 * Huddle::Message structure and the Huddle::Payload class.
 *
 * © 2020 by Richard Walters
 */

#include <gtest/gtest.h>
#include <Huddle/MemberSnapshot.hpp>
#include <Huddle/Message.hpp>
#include <Json/Value.hpp>
#include <string>
#include <vector>

TEST(MessageTests, Join_Reply) {
    // Arrange
    Huddle::Message messageIn(
        Huddle::Message::Type::Join,
        "server",
        "You are the coordinator."
    );
    messageIn.coordinatorId = "bob";
    messageIn.isCoordinator = true;
    const auto serializedMessage = messageIn.Serialize();

    // Act
    Huddle::Message message(serializedMessage);

    // Assert
    EXPECT_EQ(Huddle::Message::Type::Join, message.type);
    EXPECT_EQ("server", message.senderId);
    EXPECT_EQ("", message.recipientId);
    EXPECT_EQ("bob", message.coordinatorId);
    EXPECT_TRUE(message.isCoordinator);
    EXPECT_EQ(Huddle::Payload::Kind::Text, message.GetPayload().GetKind());
    EXPECT_EQ("You are the coordinator.", message.GetText());
}

TEST(MessageTests, Private_Message) {
    // Arrange
    Huddle::Message messageIn(Huddle::Message::Type::Private, "amy", "psst");
    messageIn.recipientId = "cid";
    const auto serializedMessage = messageIn.Serialize();

    // Act
    Huddle::Message message(serializedMessage);

    // Assert
    EXPECT_EQ(Huddle::Message::Type::Private, message.type);
    EXPECT_EQ("amy", message.senderId);
    EXPECT_EQ("cid", message.recipientId);
    EXPECT_FALSE(message.isCoordinator);
    EXPECT_EQ("psst", message.GetText());
}

TEST(MessageTests, Member_List) {
    // Arrange
    const std::vector< Huddle::MemberSnapshot > members{
        {"amy", "10.0.0.2", 6002, false},
        {"bob", "10.0.0.1", 6001, true},
    };
    Huddle::Message messageIn(
        Huddle::Message::Type::MemberList,
        "bob",
        Huddle::Payload::FromMembers(members)
    );
    messageIn.recipientId = "amy";
    const auto serializedMessage = messageIn.Serialize();

    // Act
    Huddle::Message message(serializedMessage);

    // Assert
    EXPECT_EQ(Huddle::Message::Type::MemberList, message.type);
    EXPECT_EQ(Huddle::Payload::Kind::Members, message.GetPayload().GetKind());
    EXPECT_EQ(members, message.GetMembers());
    EXPECT_EQ("", message.GetText());
    EXPECT_TRUE(message.GetNames().empty());
}

TEST(MessageTests, Member_Name_List) {
    // Arrange
    Huddle::Message messageIn(
        Huddle::Message::Type::MemberNameList,
        "server",
        Huddle::Payload::FromNames({"amy", "bob", "cid"})
    );
    const auto serializedMessage = messageIn.Serialize();

    // Act
    Huddle::Message message(serializedMessage);

    // Assert
    EXPECT_EQ(Huddle::Message::Type::MemberNameList, message.type);
    EXPECT_EQ(
        std::vector< std::string >({"amy", "bob", "cid"}),
        message.GetNames()
    );
}

TEST(MessageTests, Empty_Serialization_Is_Unknown) {
    // Arrange

    // Act
    Huddle::Message message("");

    // Assert
    EXPECT_EQ(Huddle::Message::Type::Unknown, message.type);
}

TEST(MessageTests, Truncated_Serialization_Is_Unknown) {
    // Arrange
    const auto serializedMessage = Huddle::Message(
        Huddle::Message::Type::Broadcast,
        "amy",
        "hello, world"
    ).Serialize();

    // Act
    Huddle::Message message(serializedMessage.substr(0, serializedMessage.length() - 1));

    // Assert
    EXPECT_EQ(Huddle::Message::Type::Unknown, message.type);
    EXPECT_EQ("", message.senderId);
    EXPECT_EQ("", message.GetText());
}

TEST(MessageTests, Newer_Serialization_Version_Is_Unknown) {
    // Arrange
    auto serializedMessage = Huddle::Message(
        Huddle::Message::Type::Broadcast,
        "amy",
        "hello"
    ).Serialize();
    ASSERT_EQ(0x01, serializedMessage[0]);
    serializedMessage[0] = 0x02;

    // Act
    Huddle::Message message(serializedMessage);

    // Assert
    EXPECT_EQ(Huddle::Message::Type::Unknown, message.type);
}

TEST(MessageTests, Out_Of_Range_Type_Is_Unknown) {
    // Arrange
    const std::vector< char > serializedMessageBytes({
        0x01, // version (1)
        0x20, // type (not a valid type)
        0x00, // sender ID
        0x00, // recipient ID
        0x00, // coordinator ID
        0x00, // coordinator flag
        0x00, // payload kind (text)
        0x00, // text
    });
    const std::string serializedMessage(
        serializedMessageBytes.begin(),
        serializedMessageBytes.end()
    );

    // Act
    Huddle::Message message(serializedMessage);

    // Assert
    EXPECT_EQ(Huddle::Message::Type::Unknown, message.type);
}

TEST(MessageTests, Payload_Kind_Mismatch_On_Wire_Is_Unknown) {
    // Arrange
    const std::vector< char > serializedMessageBytes({
        0x01, // version (1)
        0x03, // type (Broadcast)
        0x00, // sender ID
        0x00, // recipient ID
        0x00, // coordinator ID
        0x00, // coordinator flag
        0x02, // payload kind (names)
        0x00, // number of names
    });
    const std::string serializedMessage(
        serializedMessageBytes.begin(),
        serializedMessageBytes.end()
    );

    // Act
    Huddle::Message message(serializedMessage);

    // Assert
    EXPECT_EQ(Huddle::Message::Type::Unknown, message.type);
}

TEST(MessageTests, Constructing_With_Wrong_Payload_Kind_Throws) {
    // Arrange
    const auto names = Huddle::Payload::FromNames({"amy"});
    const auto text = Huddle::Payload::FromText("hello");

    // Act & Assert
    EXPECT_THROW(
        Huddle::Message(Huddle::Message::Type::Broadcast, "amy", names),
        Huddle::InvalidPayloadKind
    );
    EXPECT_THROW(
        Huddle::Message(Huddle::Message::Type::MemberList, "bob", text),
        Huddle::InvalidPayloadKind
    );
    EXPECT_THROW(
        Huddle::Message(Huddle::Message::Type::MemberNameList, "server", "amy"),
        Huddle::InvalidPayloadKind
    );
}

TEST(MessageTests, Set_Name_List_Only_On_Name_List_Message) {
    // Arrange
    Huddle::Message nameList(
        Huddle::Message::Type::MemberNameList,
        "server",
        Huddle::Payload::FromNames({})
    );
    Huddle::Message broadcast(Huddle::Message::Type::Broadcast, "amy", "hi");

    // Act
    nameList.SetNameList({"amy", "bob"});

    // Assert
    EXPECT_EQ(std::vector< std::string >({"amy", "bob"}), nameList.GetNames());
    EXPECT_THROW(broadcast.SetNameList({"amy"}), Huddle::InvalidPayloadKind);
    EXPECT_EQ("hi", broadcast.GetText());
}

TEST(MessageTests, Payload_From_Json_Text) {
    // Arrange
    const Json::Value json("hello");

    // Act
    const auto payload = Huddle::Payload::FromJson(json);

    // Assert
    EXPECT_EQ(Huddle::Payload::Kind::Text, payload.GetKind());
    EXPECT_EQ("hello", payload.GetText());
}

TEST(MessageTests, Payload_From_Json_Member_Snapshots) {
    // Arrange
    auto json = Json::Array({});
    json.Add((Json::Value)Huddle::MemberSnapshot("amy", "10.0.0.2", 6002, true));

    // Act
    const auto payload = Huddle::Payload::FromJson(json);

    // Assert
    EXPECT_EQ(Huddle::Payload::Kind::Members, payload.GetKind());
    ASSERT_EQ(1, payload.GetMembers().size());
    EXPECT_EQ(
        Huddle::MemberSnapshot("amy", "10.0.0.2", 6002, true),
        payload.GetMembers()[0]
    );
}

TEST(MessageTests, Payload_From_Json_List_Of_Non_Snapshots_Throws) {
    // Arrange
    auto json = Json::Array({});
    json.Add("amy");
    json.Add(42);

    // Act & Assert
    EXPECT_THROW(Huddle::Payload::FromJson(json), Huddle::InvalidPayloadKind);
}

TEST(MessageTests, Payload_From_Json_Number_Throws) {
    // Arrange
    const Json::Value json(42);

    // Act & Assert
    EXPECT_THROW(Huddle::Payload::FromJson(json), Huddle::InvalidPayloadKind);
}

TEST(MessageTests, Message_Type_Names) {
    EXPECT_EQ("Join", Huddle::MessageTypeToString(Huddle::Message::Type::Join));
    EXPECT_EQ("MemberNameList", Huddle::MessageTypeToString(Huddle::Message::Type::MemberNameList));
    EXPECT_EQ("Error", Huddle::MessageTypeToString(Huddle::Message::Type::Error));
}
