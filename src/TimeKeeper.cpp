/**
 * @file TimeKeeper.cpp
 *
 * This module contains the implementation of the Huddle::TimeKeeper class.
 *
 * © 2020 by Richard Walters
 */

#include <Huddle/TimeKeeper.hpp>

namespace Huddle {

    double TimeKeeper::GetCurrentTime() {
        return time_.GetTime();
    }

}
