/**
 * @file Message.cpp
 *
 * This module contains the implementation of the Huddle::Message structure
 * and the Huddle::Payload class.
 *
 * © 2020 by Richard Walters
 */

#include <Huddle/Message.hpp>
#include <Json/Value.hpp>
#include <Serialization/SerializedBoolean.hpp>
#include <Serialization/SerializedInteger.hpp>
#include <Serialization/SerializedString.hpp>
#include <SystemAbstractions/StringFile.hpp>

namespace {

    constexpr int CURRENT_SERIALIZATION_VERSION = 1;

    const std::string EMPTY_TEXT;
    const std::vector< Huddle::MemberSnapshot > EMPTY_MEMBERS;
    const std::vector< std::string > EMPTY_NAMES;

    const char* PayloadKindToString(Huddle::Payload::Kind kind) {
        switch (kind) {
            case Huddle::Payload::Kind::Text: return "text";
            case Huddle::Payload::Kind::Members: return "member list";
            case Huddle::Payload::Kind::Names: return "name list";
            default: return "???";
        }
    }

}

namespace Huddle {

    InvalidPayloadKind::InvalidPayloadKind(const std::string& what)
        : std::invalid_argument(what)
    {
    }

    Payload Payload::FromText(const std::string& text) {
        Payload payload;
        payload.kind_ = Kind::Text;
        payload.text_ = text;
        return payload;
    }

    Payload Payload::FromMembers(const std::vector< MemberSnapshot >& members) {
        Payload payload;
        payload.kind_ = Kind::Members;
        payload.members_ = members;
        return payload;
    }

    Payload Payload::FromNames(const std::vector< std::string >& names) {
        Payload payload;
        payload.kind_ = Kind::Names;
        payload.names_ = names;
        return payload;
    }

    Payload Payload::FromJson(const Json::Value& json) {
        switch (json.GetType()) {
            case Json::Value::Type::String: {
                return FromText(json);
            } break;

            case Json::Value::Type::Array: {
                std::vector< MemberSnapshot > members;
                const auto numElements = json.GetSize();
                members.reserve(numElements);
                for (size_t i = 0; i < numElements; ++i) {
                    const auto& element = json[i];
                    if (!MemberSnapshot::IsSnapshot(element)) {
                        throw InvalidPayloadKind(
                            "invalid payload kind: list element is not a member snapshot"
                        );
                    }
                    members.emplace_back(element);
                }
                return FromMembers(members);
            } break;

            default: {
                throw InvalidPayloadKind(
                    "invalid payload kind: expected text or a list of member snapshots"
                );
            }
        }
    }

    auto Payload::GetKind() const -> Kind {
        return kind_;
    }

    const std::string& Payload::GetText() const {
        return (kind_ == Kind::Text) ? text_ : EMPTY_TEXT;
    }

    const std::vector< MemberSnapshot >& Payload::GetMembers() const {
        return (kind_ == Kind::Members) ? members_ : EMPTY_MEMBERS;
    }

    const std::vector< std::string >& Payload::GetNames() const {
        return (kind_ == Kind::Names) ? names_ : EMPTY_NAMES;
    }

    Message::Message(const std::string& serialization) {
        if (serialization.empty()) {
            return;
        }
        SystemAbstractions::StringFile buffer(serialization);
        Serialization::SerializedInteger intField;
        if (!intField.Deserialize(&buffer)) {
            return;
        }
        if ((int)intField > CURRENT_SERIALIZATION_VERSION) {
            return;
        }
        if (!intField.Deserialize(&buffer)) {
            return;
        }
        const auto serializedType = (int)intField;
        if (
            (serializedType <= (int)Type::Unknown)
            || (serializedType > (int)Type::Error)
        ) {
            return;
        }
        const auto typeIn = (Type)serializedType;
        Serialization::SerializedString stringField;
        if (!stringField.Deserialize(&buffer)) {
            return;
        }
        const std::string senderIdIn = stringField;
        if (!stringField.Deserialize(&buffer)) {
            return;
        }
        const std::string recipientIdIn = stringField;
        if (!stringField.Deserialize(&buffer)) {
            return;
        }
        const std::string coordinatorIdIn = stringField;
        Serialization::SerializedBoolean boolField;
        if (!boolField.Deserialize(&buffer)) {
            return;
        }
        const bool isCoordinatorIn = boolField;
        if (!intField.Deserialize(&buffer)) {
            return;
        }
        const auto kind = (Payload::Kind)(int)intField;
        if (kind != GetPayloadKind(typeIn)) {
            return;
        }
        Payload payloadIn;
        switch (kind) {
            case Payload::Kind::Text: {
                if (!stringField.Deserialize(&buffer)) {
                    return;
                }
                payloadIn = Payload::FromText(stringField);
            } break;

            case Payload::Kind::Members: {
                if (!intField.Deserialize(&buffer)) {
                    return;
                }
                const auto numMembers = (int)intField;
                if (numMembers < 0) {
                    return;
                }
                std::vector< MemberSnapshot > members;
                for (int i = 0; i < numMembers; ++i) {
                    MemberSnapshot member;
                    if (!member.Deserialize(&buffer)) {
                        return;
                    }
                    members.push_back(std::move(member));
                }
                payloadIn = Payload::FromMembers(members);
            } break;

            case Payload::Kind::Names: {
                if (!intField.Deserialize(&buffer)) {
                    return;
                }
                const auto numNames = (int)intField;
                if (numNames < 0) {
                    return;
                }
                std::vector< std::string > names;
                for (int i = 0; i < numNames; ++i) {
                    if (!stringField.Deserialize(&buffer)) {
                        return;
                    }
                    names.push_back(stringField);
                }
                payloadIn = Payload::FromNames(names);
            } break;

            default: return;
        }
        type = typeIn;
        senderId = senderIdIn;
        recipientId = recipientIdIn;
        coordinatorId = coordinatorIdIn;
        isCoordinator = isCoordinatorIn;
        payload_ = std::move(payloadIn);
    }

    Message::Message(
        Type type,
        const std::string& senderId,
        const Payload& payload
    )
        : type(type)
        , senderId(senderId)
        , payload_(payload)
    {
        const auto expectedKind = GetPayloadKind(type);
        if (payload.GetKind() != expectedKind) {
            throw InvalidPayloadKind(
                std::string("invalid payload kind: ")
                + MessageTypeToString(type)
                + " carries a "
                + PayloadKindToString(expectedKind)
                + ", not a "
                + PayloadKindToString(payload.GetKind())
            );
        }
    }

    Message::Message(
        Type type,
        const std::string& senderId,
        const std::string& text
    )
        : Message(type, senderId, Payload::FromText(text))
    {
    }

    Payload::Kind Message::GetPayloadKind(Type type) {
        switch (type) {
            case Type::MemberList: return Payload::Kind::Members;
            case Type::MemberNameList: return Payload::Kind::Names;
            default: return Payload::Kind::Text;
        }
    }

    const Payload& Message::GetPayload() const {
        return payload_;
    }

    const std::string& Message::GetText() const {
        return payload_.GetText();
    }

    const std::vector< MemberSnapshot >& Message::GetMembers() const {
        return payload_.GetMembers();
    }

    const std::vector< std::string >& Message::GetNames() const {
        return payload_.GetNames();
    }

    void Message::SetNameList(const std::vector< std::string >& names) {
        if (type != Type::MemberNameList) {
            throw InvalidPayloadKind(
                std::string("invalid payload kind: ")
                + MessageTypeToString(type)
                + " does not carry a name list"
            );
        }
        payload_ = Payload::FromNames(names);
    }

    std::string Message::Serialize() const {
        SystemAbstractions::StringFile buffer;
        Serialization::SerializedInteger intField(CURRENT_SERIALIZATION_VERSION);
        if (!intField.Serialize(&buffer)) {
            return "";
        }
        intField = (int)type;
        if (!intField.Serialize(&buffer)) {
            return "";
        }
        Serialization::SerializedString stringField(senderId);
        if (!stringField.Serialize(&buffer)) {
            return "";
        }
        stringField = recipientId;
        if (!stringField.Serialize(&buffer)) {
            return "";
        }
        stringField = coordinatorId;
        if (!stringField.Serialize(&buffer)) {
            return "";
        }
        Serialization::SerializedBoolean boolField(isCoordinator);
        if (!boolField.Serialize(&buffer)) {
            return "";
        }
        intField = (int)payload_.GetKind();
        if (!intField.Serialize(&buffer)) {
            return "";
        }
        switch (payload_.GetKind()) {
            case Payload::Kind::Text: {
                stringField = payload_.GetText();
                if (!stringField.Serialize(&buffer)) {
                    return "";
                }
            } break;

            case Payload::Kind::Members: {
                const auto& members = payload_.GetMembers();
                intField = (int)members.size();
                if (!intField.Serialize(&buffer)) {
                    return "";
                }
                for (const auto& member: members) {
                    if (!member.Serialize(&buffer)) {
                        return "";
                    }
                }
            } break;

            case Payload::Kind::Names: {
                const auto& names = payload_.GetNames();
                intField = (int)names.size();
                if (!intField.Serialize(&buffer)) {
                    return "";
                }
                for (const auto& name: names) {
                    stringField = name;
                    if (!stringField.Serialize(&buffer)) {
                        return "";
                    }
                }
            } break;

            default: return "";
        }
        return buffer;
    }

    void PrintTo(
        const Message::Type& type,
        std::ostream* os
    ) {
        *os << MessageTypeToString(type);
    }

    std::string MessageTypeToString(Message::Type type) {
        switch (type) {
            case Message::Type::Unknown: return "Unknown";
            case Message::Type::Join: return "Join";
            case Message::Type::Leave: return "Leave";
            case Message::Type::Broadcast: return "Broadcast";
            case Message::Type::Private: return "Private";
            case Message::Type::Heartbeat: return "Heartbeat";
            case Message::Type::MemberList: return "MemberList";
            case Message::Type::RequestMemberList: return "RequestMemberList";
            case Message::Type::RequestMemberListApproval: return "RequestMemberListApproval";
            case Message::Type::MemberListApproved: return "MemberListApproved";
            case Message::Type::MemberListDenied: return "MemberListDenied";
            case Message::Type::MemberNameList: return "MemberNameList";
            case Message::Type::Error: return "Error";
            default: return "???";
        }
    }

}
