#ifndef SESSIONCORE_CLOCK_H
#define SESSIONCORE_CLOCK_H

#include <QDateTime>

/**
 * @brief Source of "now" for every duration, heartbeat and schedule computation
 *
 * Components take a Clock* so tests can pin time; timers still run on real time.
 */
class Clock
{
public:
    virtual ~Clock() = default;

    // Current instant in UTC
    virtual QDateTime now() const = 0;

    // Process-wide wall clock
    static Clock* system();
};

#endif // SESSIONCORE_CLOCK_H
