#ifndef HUDDLE_MEMBER_SNAPSHOT_HPP
#define HUDDLE_MEMBER_SNAPSHOT_HPP

/**
 * @file MemberSnapshot.hpp
 *
 * This module declares the Huddle::MemberSnapshot structure.
 *
 * © 2020 by Richard Walters
 */

#include <Json/Value.hpp>
#include <ostream>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/IFile.hpp>

namespace Huddle {

    /**
     * This is the metadata-only form of a group member.  It carries
     * no transport and is the only form of a member that is ever
     * sent to another process.
     */
    struct MemberSnapshot {
        // Properties

        /**
         * This is the identifier of the member, unique amongst all
         * members currently registered with the server.
         */
        std::string id;

        /**
         * This is the network address from which the member connected.
         */
        std::string address;

        /**
         * This is the network port from which the member connected.
         */
        uint16_t port = 0;

        /**
         * This indicates whether or not the member was the group
         * coordinator when the snapshot was taken.
         */
        bool isCoordinator = false;

        // Methods

        /**
         * This is the default constructor.
         */
        MemberSnapshot() = default;

        /**
         * This constructor initializes every property of the snapshot.
         *
         * @param[in] id
         *     This is the identifier of the member.
         *
         * @param[in] address
         *     This is the network address from which the member connected.
         *
         * @param[in] port
         *     This is the network port from which the member connected.
         *
         * @param[in] isCoordinator
         *     This indicates whether or not the member is the coordinator.
         */
        MemberSnapshot(
            const std::string& id,
            const std::string& address,
            uint16_t port,
            bool isCoordinator
        );

        /**
         * This constructs the snapshot from its JSON form.
         *
         * @param[in] json
         *     This is the JSON form of the snapshot.  Missing or
         *     mistyped fields are left at their default values.
         */
        explicit MemberSnapshot(const Json::Value& json);

        /**
         * Return an indication of whether or not the given JSON value
         * has the shape of a member snapshot: an object with a string
         * "id", a string "address", an integer "port", and a boolean
         * "coordinator".
         *
         * @param[in] json
         *     This is the value to check.
         *
         * @return
         *     An indication of whether or not the given JSON value
         *     has the shape of a member snapshot is returned.
         */
        static bool IsSnapshot(const Json::Value& json);

        /**
         * This is the typecast to JSON operator for the class.
         */
        operator Json::Value() const;

        /**
         * Write the snapshot to the given file.
         *
         * @param[in] file
         *     This is the file to which to write the snapshot.
         *
         * @return
         *     An indication of whether or not the snapshot was written
         *     successfully is returned.
         */
        bool Serialize(SystemAbstractions::IFile* file) const;

        /**
         * Read the snapshot from the given file.
         *
         * @param[in] file
         *     This is the file from which to read the snapshot.
         *
         * @return
         *     An indication of whether or not the snapshot was read
         *     successfully is returned.
         */
        bool Deserialize(SystemAbstractions::IFile* file);

        /**
         * This is the equality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other snapshot to which to compare this one.
         *
         * @return
         *     An indication of whether or not the two snapshots are
         *     equal is returned.
         */
        bool operator==(const MemberSnapshot& other) const;

        /**
         * This is the inequality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other snapshot to which to compare this one.
         *
         * @return
         *     An indication of whether or not the two snapshots are
         *     not equal is returned.
         */
        bool operator!=(const MemberSnapshot& other) const;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the MemberSnapshot class.
     *
     * @param[in] snapshot
     *     This is the member snapshot value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     member snapshot value.
     */
    void PrintTo(
        const MemberSnapshot& snapshot,
        std::ostream* os
    );

}

#endif /* HUDDLE_MEMBER_SNAPSHOT_HPP */
