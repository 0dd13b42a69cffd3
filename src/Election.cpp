/**
 * @file Election.cpp
 *
 * This module contains the implementation of the Huddle::Election class.
 *
 * © 2020 by Richard Walters
 */

#include <Huddle/Election.hpp>

namespace Huddle {

    Election::Election(
        std::shared_ptr< CoordinatorRegistry > coordinatorRegistry,
        ElectionRule rule
    )
        : coordinatorRegistry_(coordinatorRegistry)
        , rule_(rule)
    {
    }

    std::shared_ptr< LiveMember > Election::Select(
        const Members& members,
        ElectionRule rule
    ) {
        if (members.empty()) {
            return nullptr;
        }
        switch (rule) {
            case ElectionRule::HighestPort: {
                // Members are visited in id order, so the first of any
                // tied ports is kept.
                std::shared_ptr< LiveMember > winner;
                for (const auto& member: members) {
                    if (
                        (winner == nullptr)
                        || (member.second->GetPort() > winner->GetPort())
                    ) {
                        winner = member.second;
                    }
                }
                return winner;
            } break;

            case ElectionRule::LowestId:
            default: {
                return members.begin()->second;
            } break;
        }
    }

    std::shared_ptr< LiveMember > Election::Run(const Members& members) {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        for (const auto& member: members) {
            member.second->SetCoordinator(false);
        }
        const auto winner = Select(members, rule_);
        if (winner == nullptr) {
            coordinatorRegistry_->Reset();
        } else {
            winner->SetCoordinator(true);
            coordinatorRegistry_->Set(winner);
        }
        return winner;
    }

    void Election::SetRule(ElectionRule rule) {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        rule_ = rule;
    }

    ElectionRule Election::GetRule() const {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        return rule_;
    }

    void PrintTo(
        const ElectionRule& rule,
        std::ostream* os
    ) {
        switch (rule) {
            case ElectionRule::LowestId: {
                *os << "LowestId";
            } break;

            case ElectionRule::HighestPort: {
                *os << "HighestPort";
            } break;

            default: {
                *os << "???";
            } break;
        }
    }

}
