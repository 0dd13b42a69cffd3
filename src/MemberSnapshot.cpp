/**
 * @file MemberSnapshot.cpp
 *
 * This module contains the implementation of the Huddle::MemberSnapshot
 * structure.
 *
 * © 2020 by Richard Walters
 */

#include <Huddle/MemberSnapshot.hpp>
#include <Serialization/SerializedBoolean.hpp>
#include <Serialization/SerializedString.hpp>
#include <Serialization/SerializedUnsignedInteger.hpp>

namespace {

    /**
     * Tell whether or not the given JSON value is an integer that fits
     * in a port number.
     *
     * @param[in] json
     *     This is the value to check.
     *
     * @return
     *     An indication of whether or not the value is a port number
     *     is returned.
     */
    bool IsPort(const Json::Value& json) {
        if (json.GetType() != Json::Value::Type::Integer) {
            return false;
        }
        const auto value = (int)json;
        return (
            (value >= 0)
            && (value <= 65535)
        );
    }

}

namespace Huddle {

    MemberSnapshot::MemberSnapshot(
        const std::string& id,
        const std::string& address,
        uint16_t port,
        bool isCoordinator
    )
        : id(id)
        , address(address)
        , port(port)
        , isCoordinator(isCoordinator)
    {
    }

    MemberSnapshot::MemberSnapshot(const Json::Value& json) {
        if (json["id"].GetType() == Json::Value::Type::String) {
            id = (std::string)json["id"];
        }
        if (json["address"].GetType() == Json::Value::Type::String) {
            address = (std::string)json["address"];
        }
        if (IsPort(json["port"])) {
            port = (uint16_t)(int)json["port"];
        }
        if (json["coordinator"].GetType() == Json::Value::Type::Boolean) {
            isCoordinator = json["coordinator"];
        }
    }

    bool MemberSnapshot::IsSnapshot(const Json::Value& json) {
        return (
            (json.GetType() == Json::Value::Type::Object)
            && (json["id"].GetType() == Json::Value::Type::String)
            && (json["address"].GetType() == Json::Value::Type::String)
            && IsPort(json["port"])
            && (json["coordinator"].GetType() == Json::Value::Type::Boolean)
        );
    }

    MemberSnapshot::operator Json::Value() const {
        return Json::Object({
            {"id", id},
            {"address", address},
            {"port", (int)port},
            {"coordinator", isCoordinator},
        });
    }

    bool MemberSnapshot::Serialize(SystemAbstractions::IFile* file) const {
        Serialization::SerializedString stringField(id);
        if (!stringField.Serialize(file)) {
            return false;
        }
        stringField = address;
        if (!stringField.Serialize(file)) {
            return false;
        }
        Serialization::SerializedUnsignedInteger portField(port);
        if (!portField.Serialize(file)) {
            return false;
        }
        Serialization::SerializedBoolean boolField(isCoordinator);
        return boolField.Serialize(file);
    }

    bool MemberSnapshot::Deserialize(SystemAbstractions::IFile* file) {
        Serialization::SerializedString stringField;
        if (!stringField.Deserialize(file)) {
            return false;
        }
        const std::string idIn = stringField;
        if (!stringField.Deserialize(file)) {
            return false;
        }
        const std::string addressIn = stringField;
        Serialization::SerializedUnsignedInteger portField;
        if (!portField.Deserialize(file)) {
            return false;
        }
        if ((uintmax_t)portField > 65535) {
            return false;
        }
        Serialization::SerializedBoolean boolField;
        if (!boolField.Deserialize(file)) {
            return false;
        }
        id = idIn;
        address = addressIn;
        port = (uint16_t)(uintmax_t)portField;
        isCoordinator = boolField;
        return true;
    }

    bool MemberSnapshot::operator==(const MemberSnapshot& other) const {
        return (
            (id == other.id)
            && (address == other.address)
            && (port == other.port)
            && (isCoordinator == other.isCoordinator)
        );
    }

    bool MemberSnapshot::operator!=(const MemberSnapshot& other) const {
        return !(*this == other);
    }

    void PrintTo(
        const MemberSnapshot& snapshot,
        std::ostream* os
    ) {
        *os << snapshot.id << '@' << snapshot.address << ':' << snapshot.port;
        if (snapshot.isCoordinator) {
            *os << " (coordinator)";
        }
    }

}
