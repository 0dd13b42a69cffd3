#ifndef HUDDLE_ELECTION_HPP
#define HUDDLE_ELECTION_HPP

/**
 * @file Election.hpp
 *
 * This module declares the Huddle::Election class.
 *
 * © 2020 by Richard Walters
 */

#include "CoordinatorRegistry.hpp"
#include "LiveMember.hpp"

#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace Huddle {

    /**
     * These are the rules by which a coordinator may be selected.
     */
    enum class ElectionRule {
        /**
         * The member with the lexicographically smallest identifier wins.
         */
        LowestId,

        /**
         * The member connected from the highest port wins.  Ties go to
         * the member with the smallest identifier.
         */
        HighestPort,
    };

    /**
     * This selects a coordinator from a set of members, flags it, and
     * records it in a coordinator registry.  Runs never interleave.
     */
    class Election {
        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         *
         * @param[in] coordinatorRegistry
         *     This is the registry in which to record each winner.
         *
         * @param[in] rule
         *     This is the rule by which to select the winner.
         */
        explicit Election(
            std::shared_ptr< CoordinatorRegistry > coordinatorRegistry,
            ElectionRule rule = ElectionRule::LowestId
        );

        /**
         * Pick the winner of an election over the given members, without
         * changing anything.
         *
         * @param[in] members
         *     These are the candidates.
         *
         * @param[in] rule
         *     This is the rule by which to select the winner.
         *
         * @return
         *     The winner is returned, or nullptr if there are no members.
         */
        static std::shared_ptr< LiveMember > Select(
            const Members& members,
            ElectionRule rule
        );

        /**
         * Clear the coordinator flag of every member, then select a winner,
         * flag it, and record it in the registry.  If there are no
         * members, the registry is cleared instead.
         *
         * @param[in] members
         *     These are the candidates.
         *
         * @return
         *     The winner is returned, or nullptr if there are no members.
         */
        std::shared_ptr< LiveMember > Run(const Members& members);

        void SetRule(ElectionRule rule);
        ElectionRule GetRule() const;

        // Private properties
    private:
        /**
         * This is used to keep election runs from interleaving.
         */
        mutable std::mutex mutex_;

        std::shared_ptr< CoordinatorRegistry > coordinatorRegistry_;
        ElectionRule rule_;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the ElectionRule type.
     *
     * @param[in] rule
     *     This is the election rule value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     election rule value.
     */
    void PrintTo(
        const ElectionRule& rule,
        std::ostream* os
    );

}

#endif /* HUDDLE_ELECTION_HPP */
