#ifndef HUDDLE_COORDINATOR_REGISTRY_HPP
#define HUDDLE_COORDINATOR_REGISTRY_HPP

/**
 * @file CoordinatorRegistry.hpp
 *
 * This module declares the Huddle::CoordinatorRegistry class.
 *
 * © 2020 by Richard Walters
 */

#include "LiveMember.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace Huddle {

    /**
     * This is the single shared slot recording which member is the group
     * coordinator right now.  It only refers to the member; the membership
     * registry of the server keeps the member alive.
     */
    class CoordinatorRegistry {
        // Public Methods
    public:
        /**
         * Record the given member as the coordinator.
         *
         * @param[in] member
         *     This is the member to record as the coordinator.
         */
        void Set(const std::shared_ptr< LiveMember >& member);

        /**
         * Return the member recorded as the coordinator.
         *
         * @return
         *     The member recorded as the coordinator is returned, or
         *     nullptr if there is none (or it no longer exists).
         */
        std::shared_ptr< LiveMember > Get() const;

        /**
         * Return the identifier of the member recorded as the coordinator.
         *
         * @return
         *     The identifier of the member recorded as the coordinator is
         *     returned, or an empty string if there is none.
         */
        std::string GetId() const;

        /**
         * Forget the recorded coordinator.
         */
        void Reset();

        // Private properties
    private:
        mutable std::mutex mutex_;
        std::weak_ptr< LiveMember > coordinator_;
    };

}

#endif /* HUDDLE_COORDINATOR_REGISTRY_HPP */
