/**
 * @file CoordinatorRegistry.cpp
 *
 * This module contains the implementation of the
 * Huddle::CoordinatorRegistry class.
 *
 * © 2020 by Richard Walters
 */

#include <Huddle/CoordinatorRegistry.hpp>

namespace Huddle {

    void CoordinatorRegistry::Set(const std::shared_ptr< LiveMember >& member) {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        coordinator_ = member;
    }

    std::shared_ptr< LiveMember > CoordinatorRegistry::Get() const {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        return coordinator_.lock();
    }

    std::string CoordinatorRegistry::GetId() const {
        const auto coordinator = Get();
        if (coordinator == nullptr) {
            return "";
        }
        return coordinator->GetId();
    }

    void CoordinatorRegistry::Reset() {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        coordinator_.reset();
    }

}
