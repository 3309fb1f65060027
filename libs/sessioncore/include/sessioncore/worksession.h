#ifndef SESSIONCORE_WORKSESSION_H
#define SESSIONCORE_WORKSESSION_H

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>

/**
 * @brief One pause inside a work session
 *
 * endTime stays invalid while the break is open; durationMinutes is -1 until it closes.
 */
struct BreakPeriod
{
    QDateTime startTime;
    QDateTime endTime;
    int durationMinutes = -1;

    bool isOpen() const { return !endTime.isValid(); }

    // Elapsed milliseconds, measured to now for an open break
    qint64 elapsedMsecs(const QDateTime& now) const;
};

/**
 * @brief The work log document shared by every client of a user
 *
 * The store copy is authoritative; local copies are overwritten by every snapshot.
 */
class WorkSession
{
public:
    enum class Status {
        Active,
        Break,
        Completed
    };

    enum class Source {
        Browser,
        Desktop
    };

    QString id;
    QString userId;
    QString userDisplayName;
    QDateTime checkInTime;
    QDateTime checkOutTime;
    Status status = Status::Active;
    Source source = Source::Browser;
    QList<BreakPeriod> breaks;
    QDateTime lastHeartbeat;
    int durationMinutes = 0;
    int breakDurationMinutes = 0;
    QString report;
    QStringList attachments;
    bool flagged = false;
    QString flagReason;

    // Server write time; only used to detect changes
    QDateTime updateTime;

    bool isValid() const { return !id.isEmpty() && !userId.isEmpty(); }
    bool isOpen() const { return status != Status::Completed; }
    bool isDesktop() const { return source == Source::Desktop; }

    // Only the last break may be open, and only while status is Break
    bool breaksWellFormed() const;
    bool hasOpenBreak() const;
    QDateTime openBreakStart() const;

    qint64 closedBreakMsecs() const;
    qint64 totalBreakMsecs(const QDateTime& now) const;

    // Appends an open break and moves to Break; false if not Active
    bool beginBreak(const QDateTime& now);

    // Closes the open break and moves to Active; false if none is open
    bool endBreak(const QDateTime& now);

    // Terminal transition: closes any open break and fills the duration fields
    void complete(const QDateTime& now, const QString& report, const QStringList& attachments);
    void completeFlagged(const QDateTime& now, const QString& report, const QString& reason);

    QJsonObject toJson() const;

    static QString statusToString(Status status);
    static Status statusFromString(const QString& value, bool* ok = nullptr);
    static QString sourceToString(Source source);
    static Source sourceFromString(const QString& value);

    // Field paths written by each operation
    static QStringList breakFieldMask();
    static QStringList completionFieldMask();
    static QStringList flaggedCompletionFieldMask();
    static QStringList heartbeatFieldMask();
};

Q_DECLARE_METATYPE(WorkSession)

namespace SessionMath {

// Milliseconds rounded to the nearest whole minute
int roundMinutes(qint64 msecs);

// max(0, round(total) - round(breaks))
int netDurationMinutes(const QDateTime& checkIn, const QDateTime& checkOut, qint64 breakMsecs);

} // namespace SessionMath

#endif // SESSIONCORE_WORKSESSION_H
