#ifndef SESSIONCORE_TESTS_MANUALCLOCK_H
#define SESSIONCORE_TESTS_MANUALCLOCK_H

#include <QDateTime>

#include "sessioncore/clock.h"

// Clock that only moves when a test moves it
class ManualClock : public Clock
{
public:
    explicit ManualClock(const QDateTime& start = QDateTime(QDate(2024, 3, 4), QTime(9, 0), Qt::UTC))
        : m_now(start)
    {
    }

    QDateTime now() const override { return m_now; }

    void set(const QDateTime& now) { m_now = now; }
    void advanceSeconds(qint64 seconds) { m_now = m_now.addSecs(seconds); }
    void advanceMinutes(qint64 minutes) { m_now = m_now.addSecs(minutes * 60); }

private:
    QDateTime m_now;
};

#endif // SESSIONCORE_TESTS_MANUALCLOCK_H
