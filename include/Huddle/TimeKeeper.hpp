#ifndef HUDDLE_TIME_KEEPER_HPP
#define HUDDLE_TIME_KEEPER_HPP

/**
 * @file TimeKeeper.hpp
 *
 * This module declares the Huddle::TimeKeeper class.
 *
 * © 2020 by Richard Walters
 */

#include <SystemAbstractions/Time.hpp>
#include <Timekeeping/Clock.hpp>

namespace Huddle {

    /**
     * This is the clock used to drive the membership server's timers
     * outside of tests.  It reports the time of the operating system's
     * high-resolution clock.
     */
    class TimeKeeper
        : public Timekeeping::Clock
    {
        // Timekeeping::Clock
    public:
        /**
         * This method returns the current time, in seconds.
         *
         * @return
         *     The current time is returned, in seconds.
         */
        virtual double GetCurrentTime() override;

        // Private properties
    private:
        SystemAbstractions::Time time_;
    };

}

#endif /* HUDDLE_TIME_KEEPER_HPP */
