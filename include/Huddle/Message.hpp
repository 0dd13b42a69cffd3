#ifndef HUDDLE_MESSAGE_HPP
#define HUDDLE_MESSAGE_HPP

/**
 * @file Message.hpp
 *
 * This module declares the Huddle::Message structure and the
 * Huddle::Payload class it carries.
 *
 * © 2020 by Richard Walters
 */

#include "MemberSnapshot.hpp"

#include <Json/Value.hpp>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Huddle {

    /**
     * This is thrown when a message or payload is constructed from
     * content whose kind does not match what the construction
     * declares.
     */
    class InvalidPayloadKind
        : public std::invalid_argument
    {
    public:
        /**
         * This is the constructor of the class.
         *
         * @param[in] what
         *     This describes the mismatch.
         */
        explicit InvalidPayloadKind(const std::string& what);
    };

    /**
     * This holds exactly one of the kinds of content a message
     * may carry: free text, an ordered list of member snapshots,
     * or an ordered list of names.
     */
    class Payload {
        // Types
    public:
        /**
         * These are the kinds of content a payload may hold.
         */
        enum class Kind {
            /**
             * The payload is free text (possibly empty).
             */
            Text,

            /**
             * The payload is an ordered list of member snapshots.
             */
            Members,

            /**
             * The payload is an ordered list of member names.
             */
            Names,
        };

        // Public Methods
    public:
        /**
         * This constructs an empty text payload.
         */
        Payload() = default;

        /**
         * Build a text payload.
         *
         * @param[in] text
         *     This is the text to carry.
         *
         * @return
         *     The payload is returned.
         */
        static Payload FromText(const std::string& text);

        /**
         * Build a member list payload.
         *
         * @param[in] members
         *     These are the member snapshots to carry.
         *
         * @return
         *     The payload is returned.
         */
        static Payload FromMembers(const std::vector< MemberSnapshot >& members);

        /**
         * Build a name list payload.
         *
         * @param[in] names
         *     These are the names to carry.
         *
         * @return
         *     The payload is returned.
         */
        static Payload FromNames(const std::vector< std::string >& names);

        /**
         * Build a payload from a generic JSON value.  A string becomes a
         * text payload.  An array becomes a member list payload, but only
         * if it is empty or every element has the shape of a member
         * snapshot.
         *
         * @param[in] json
         *     This is the value from which to build the payload.
         *
         * @return
         *     The payload is returned.
         *
         * @throw InvalidPayloadKind
         *     This is thrown if the value is neither a string nor a list
         *     of member snapshots.
         */
        static Payload FromJson(const Json::Value& json);

        /**
         * Return the kind of content held by the payload.
         *
         * @return
         *     The kind of content held by the payload is returned.
         */
        Kind GetKind() const;

        /**
         * Return the text held by the payload.
         *
         * @return
         *     The text held by the payload is returned.  This is empty
         *     unless the payload is of kind Text.
         */
        const std::string& GetText() const;

        /**
         * Return the member snapshots held by the payload.
         *
         * @return
         *     The member snapshots held by the payload are returned.
         *     This is empty unless the payload is of kind Members.
         */
        const std::vector< MemberSnapshot >& GetMembers() const;

        /**
         * Return the names held by the payload.
         *
         * @return
         *     The names held by the payload are returned.  This is empty
         *     unless the payload is of kind Names.
         */
        const std::vector< std::string >& GetNames() const;

        // Private properties
    private:
        Kind kind_ = Kind::Text;
        std::string text_;
        std::vector< MemberSnapshot > members_;
        std::vector< std::string > names_;
    };

    /**
     * This is a record exchanged between a peer client and the server.
     */
    struct Message {
        // Types

        /**
         * These are the types of messages for which the message object
         * might be used.
         */
        enum class Type {
            /**
             * This is the default type of message, used for uninitialized
             * messages and for records that failed to deserialize.
             */
            Unknown,

            /**
             * From a peer, this asks to join the group.  From the server,
             * this acknowledges a join or announces the coordinator.
             */
            Join,

            /**
             * From a peer, this announces it is leaving the group.  From the
             * server, this acknowledges the leave.
             */
            Leave,

            /**
             * This carries text to every member of the group.
             */
            Broadcast,

            /**
             * This carries text to the one member named as recipient.
             */
            Private,

            /**
             * This is a liveness probe, or the answer to one ("pong"), or a
             * coordinator's request for an immediate check ("manual ping").
             */
            Heartbeat,

            /**
             * This carries member snapshots of the whole group.
             */
            MemberList,

            /**
             * This is the coordinator asking for the member list.
             */
            RequestMemberList,

            /**
             * This is a member asking the coordinator for permission to see
             * the member list.
             */
            RequestMemberListApproval,

            /**
             * This is the coordinator granting a member list request.
             */
            MemberListApproved,

            /**
             * This is the coordinator refusing a member list request.
             */
            MemberListDenied,

            /**
             * This carries the sorted names of the whole group to the
             * coordinator.
             */
            MemberNameList,

            /**
             * This reports a refusal or failure to a peer.
             */
            Error,
        };

        // Properties

        /**
         * This indicates for what purpose the message is being sent.
         */
        Type type = Type::Unknown;

        /**
         * This is the identifier of the member (or "server") sending the
         * message.
         */
        std::string senderId;

        /**
         * This is the identifier of the member to whom the message is
         * addressed, or empty if the message is not addressed.
         */
        std::string recipientId;

        /**
         * This is the identifier of the coordinator, or empty if not given.
         */
        std::string coordinatorId;

        /**
         * This indicates whether or not the recipient is the coordinator.
         * It is only meaningful for Join messages sent by the server.
         */
        bool isCoordinator = false;

        // Methods

        /**
         * This is the constructor of the class.
         *
         * @param[in] serialization
         *     If not empty, this is the serialized form of the message, used
         *     to initialize the type and properties of the message.  If it
         *     cannot be deserialized, the type is left as Unknown.
         */
        Message(const std::string& serialization = "");

        /**
         * This constructs a message of the given type with the given
         * payload.
         *
         * @param[in] type
         *     This is the type of message to construct.
         *
         * @param[in] senderId
         *     This is the identifier of the sender.
         *
         * @param[in] payload
         *     This is the content of the message.
         *
         * @throw InvalidPayloadKind
         *     This is thrown if the kind of the payload is not the one
         *     carried by messages of the given type.
         */
        Message(
            Type type,
            const std::string& senderId,
            const Payload& payload
        );

        /**
         * This constructs a text-carrying message of the given type.
         *
         * @param[in] type
         *     This is the type of message to construct.
         *
         * @param[in] senderId
         *     This is the identifier of the sender.
         *
         * @param[in] text
         *     This is the text content of the message.
         *
         * @throw InvalidPayloadKind
         *     This is thrown if messages of the given type do not
         *     carry text.
         */
        Message(
            Type type,
            const std::string& senderId,
            const std::string& text
        );

        /**
         * Return the kind of payload carried by messages of the given type.
         *
         * @param[in] type
         *     This is the type of message.
         *
         * @return
         *     The kind of payload carried by messages of the given type
         *     is returned.
         */
        static Payload::Kind GetPayloadKind(Type type);

        /**
         * Return the content of the message.
         *
         * @return
         *     The content of the message is returned.
         */
        const Payload& GetPayload() const;

        /**
         * Return the text content of the message.
         *
         * @return
         *     The text content of the message is returned.
         */
        const std::string& GetText() const;

        /**
         * Return the member snapshots carried by the message.
         *
         * @return
         *     The member snapshots carried by the message are returned.
         */
        const std::vector< MemberSnapshot >& GetMembers() const;

        /**
         * Return the names carried by the message.
         *
         * @return
         *     The names carried by the message are returned.
         */
        const std::vector< std::string >& GetNames() const;

        /**
         * Replace the names carried by the message.
         *
         * @param[in] names
         *     These are the names to carry.
         *
         * @throw InvalidPayloadKind
         *     This is thrown if the message is not a MemberNameList message.
         */
        void SetNameList(const std::vector< std::string >& names);

        /**
         * This method returns a string which can be used to construct a new
         * message with the exact same contents as this message.
         *
         * @return
         *     A string which can be used to construct a new message with the
         *     exact same contents as this message is returned.
         */
        std::string Serialize() const;

        // Private properties
    private:
        /**
         * This is the content of the message.
         */
        Payload payload_;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Message::Type type.
     *
     * @param[in] type
     *     This is the message type value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     message type value.
     */
    void PrintTo(
        const Message::Type& type,
        std::ostream* os
    );

    /**
     * Return a human-readable string representation of the given message
     * type.
     *
     * @param[in] type
     *     This is the message type to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given message
     *     type is returned.
     */
    std::string MessageTypeToString(Message::Type type);

}

#endif /* HUDDLE_MESSAGE_HPP */
