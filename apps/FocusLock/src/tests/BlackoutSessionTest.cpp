#include <QtTest/QtTest>
#include <QJsonObject>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/AtomicFile.h"
#include "core/BlackoutSession.h"
#include "TestFakes.h"

class BlackoutSessionTest : public QObject
{
    Q_OBJECT

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        m_notifier = new RecordingNotifier();
        m_session = createSession();
    }

    void cleanup() {
        delete m_session;
        delete m_notifier;
        m_tempDir.reset();
    }

    void testStartPersistsState() {
        QSignalSpy spy(m_session, &BlackoutSession::sessionStarted);

        QCOMPARE(m_session->start(10, false, now()), BlackoutSession::Started);
        QVERIFY(m_session->isActive(now()));
        QVERIFY(!m_session->isLocked());
        QCOMPARE(m_session->remainingSeconds(now()), qint64(600));
        QCOMPARE(spy.count(), 1);

        QJsonObject state;
        QCOMPARE(AtomicFile::readJsonObject(statePath(), state), AtomicFile::Ok);
        QCOMPARE(state.value("duration_minutes").toInt(), 10);
        QCOMPARE(state.value("locked").toBool(), false);
        QCOMPARE(QDateTime::fromString(state.value("end_time").toString(), Qt::ISODate), now().addSecs(600));
    }

    void testWatchdogLockHoldsEpochEnd() {
        QCOMPARE(m_session->start(5, true, now()), BlackoutSession::Started);

        QByteArray content;
        QCOMPARE(AtomicFile::readAll(lockPath(), content), AtomicFile::Ok);
        QCOMPARE(content.trimmed().toLongLong(), now().addSecs(300).toSecsSinceEpoch());
    }

    void testInvalidDurationRejected() {
        QCOMPARE(m_session->start(0, false, now()), BlackoutSession::InvalidDuration);
        QCOMPARE(m_session->start(-5, false, now()), BlackoutSession::InvalidDuration);
        QVERIFY(!m_session->isActive(now()));
        QVERIFY(!AtomicFile::exists(statePath()));
    }

    void testUnlockedSessionRestarts() {
        QCOMPARE(m_session->start(10, false, now()), BlackoutSession::Started);
        QCOMPARE(m_session->start(30, true, now().addSecs(60)), BlackoutSession::Restarted);
        QVERIFY(m_session->isLocked());
        QCOMPARE(m_session->endTime(), now().addSecs(60 + 1800));
    }

    void testLockedSessionRejectsStartAndStop() {
        QCOMPARE(m_session->start(10, true, now()), BlackoutSession::Started);

        QCOMPARE(m_session->start(60, false, now().addSecs(60)), BlackoutSession::RejectedLocked);
        QCOMPARE(m_session->stop(), BlackoutSession::Locked);
        QCOMPARE(m_session->endTime(), now().addSecs(600));
        QVERIFY(AtomicFile::exists(statePath()));
    }

    void testStopClearsFiles() {
        QSignalSpy spy(m_session, &BlackoutSession::sessionStopped);

        QCOMPARE(m_session->stop(), BlackoutSession::NotActive);
        QCOMPARE(m_session->start(10, false, now()), BlackoutSession::Started);
        QCOMPARE(m_session->stop(), BlackoutSession::Stopped);

        QVERIFY(!m_session->isActive(now()));
        QVERIFY(!AtomicFile::exists(statePath()));
        QVERIFY(!AtomicFile::exists(lockPath()));
        QCOMPARE(spy.count(), 1);
    }

    void testRestoreResumesLockedSession() {
        QCOMPARE(m_session->start(10, true, now()), BlackoutSession::Started);
        delete m_session;

        // Process killed one minute in, then relaunched
        m_session = createSession();
        QSignalSpy spy(m_session, &BlackoutSession::sessionStarted);
        QVERIFY(m_session->restore(now().addSecs(60)));

        QVERIFY(m_session->isActive(now().addSecs(60)));
        QVERIFY(m_session->isLocked());
        QVERIFY(m_session->remainingSeconds(now().addSecs(60)) >= 9 * 60);
        QCOMPARE(m_session->stop(), BlackoutSession::Locked);
        QCOMPARE(spy.count(), 1);
    }

    void testRestoreDiscardsExpiredState() {
        QCOMPARE(m_session->start(10, false, now()), BlackoutSession::Started);
        delete m_session;

        m_session = createSession();
        QVERIFY(!m_session->restore(now().addSecs(601)));
        QVERIFY(!m_session->isActive(now().addSecs(601)));
        QVERIFY(!AtomicFile::exists(statePath()));
        QVERIFY(!AtomicFile::exists(lockPath()));
    }

    void testRestoreDiscardsCorruptState() {
        QCOMPARE(AtomicFile::writeAll(statePath(), "{ not json"), AtomicFile::Ok);
        QVERIFY(!m_session->restore(now()));
        QVERIFY(!AtomicFile::exists(statePath()));
    }

    void testRestoreWithoutStateIsNoop() {
        QVERIFY(!m_session->restore(now()));
        QVERIFY(!m_session->isActive(now()));
    }

    void testTickCompletesExpiredSession() {
        QSignalSpy stopped(m_session, &BlackoutSession::sessionStopped);
        QSignalSpy completed(m_session, &BlackoutSession::sessionCompleted);
        QCOMPARE(m_session->start(1, true, now()), BlackoutSession::Started);

        m_session->tick(now().addSecs(59));
        QVERIFY(m_session->isActive(now().addSecs(59)));
        QCOMPARE(completed.count(), 0);

        m_session->tick(now().addSecs(60));
        QVERIFY(!m_session->isActive(now().addSecs(60)));
        QVERIFY(!m_session->isLocked());
        QCOMPARE(completed.count(), 1);
        QCOMPARE(stopped.count(), 1);
        QCOMPARE(m_notifier->count(), 1);
        QVERIFY(!AtomicFile::exists(statePath()));
        QVERIFY(!AtomicFile::exists(lockPath()));
    }

    void testFocusBlockQueuesWorkThenBreak() {
        const QList<BlackoutSession::QueuedTask> tasks = m_session->queueFocusBlock(25, 5, true, 10, now());
        QCOMPARE(tasks.size(), 2);
        QCOMPARE(tasks.at(0).trigger, now().addSecs(10 * 60));
        QVERIFY(tasks.at(0).locked);
        QCOMPARE(tasks.at(1).trigger, now().addSecs(35 * 60));
        QVERIFY(!tasks.at(1).locked);
        QCOMPARE(m_session->pendingTasks().size(), 2);
    }

    void testFocusBlockWithoutBreak() {
        QCOMPARE(m_session->queueFocusBlock(25, 0, false, 0, now()).size(), 1);
        QVERIFY(m_session->queueFocusBlock(0, 5, false, 0, now()).isEmpty());
        QVERIFY(m_session->queueFocusBlock(25, -1, false, 0, now()).isEmpty());
    }

    void testDueTaskStartsBlackout() {
        QSignalSpy triggered(m_session, &BlackoutSession::taskTriggered);
        m_session->queueFocusBlock(25, 5, false, 0, now());

        m_session->tick(now());
        QVERIFY(m_session->isActive(now()));
        QCOMPARE(m_session->durationMinutes(), 25);
        QCOMPARE(m_session->pendingTasks().size(), 1);
        QCOMPARE(triggered.count(), 1);

        // The break takes over as the work block ends
        m_session->tick(now().addSecs(25 * 60));
        QVERIFY(m_session->isActive(now().addSecs(25 * 60)));
        QCOMPARE(m_session->durationMinutes(), 5);
        QVERIFY(m_session->pendingTasks().isEmpty());
    }

    void testDueTaskWaitsForLockedSession() {
        QCOMPARE(m_session->start(30, true, now()), BlackoutSession::Started);
        m_session->queueFocusBlock(10, 0, false, 5, now());

        m_session->tick(now().addSecs(5 * 60));
        QCOMPARE(m_session->pendingTasks().size(), 1);
        QCOMPARE(m_session->durationMinutes(), 30);

        m_session->tick(now().addSecs(30 * 60));
        QVERIFY(m_session->pendingTasks().isEmpty());
        QCOMPARE(m_session->durationMinutes(), 10);
    }

    void testQueueAtRollsToTomorrow() {
        const BlackoutSession::QueuedTask later = m_session->queueAt(QTime(21, 0), 30, false, now());
        QCOMPARE(later.trigger, QDateTime(now().date(), QTime(21, 0)));
        QCOMPARE(later.label, QString("21:00"));

        const BlackoutSession::QueuedTask early = m_session->queueAt(QTime(6, 30), 30, false, now());
        QCOMPARE(early.trigger, QDateTime(now().date().addDays(1), QTime(6, 30)));

        QVERIFY(m_session->queueAt(QTime(), 30, false, now()).id.isEmpty());
        QVERIFY(m_session->queueAt(QTime(7, 0), 0, false, now()).id.isEmpty());
    }

    void testCancelTask() {
        const QList<BlackoutSession::QueuedTask> tasks = m_session->queueFocusBlock(25, 5, true, 10, now());

        QVERIFY(!m_session->cancelTask(tasks.at(0).id));
        QVERIFY(m_session->cancelTask(tasks.at(1).id));
        QVERIFY(!m_session->cancelTask("missing"));
        QCOMPARE(m_session->pendingTasks().size(), 1);
    }

    void testLaunchBlackoutNotifies() {
        QVERIFY(m_session->launchBlackout(15, false, "Evening wind-down", now()));
        QVERIFY(m_session->isBlackoutActive(now()));
        QCOMPARE(m_notifier->count(), 1);

        QVERIFY(m_session->launchBlackout(20, true, "Restart", now()));
        QVERIFY(!m_session->launchBlackout(20, false, "Rejected", now()));
        QCOMPARE(m_notifier->count(), 2);
    }

private:
    BlackoutSession* createSession() {
        return new BlackoutSession(statePath(), lockPath(), m_notifier, 3600 * 1000);
    }

    QString statePath() const { return m_tempDir->filePath("blackout_state.json"); }
    QString lockPath() const { return m_tempDir->filePath("blackout.lock"); }

    static QDateTime now() { return QDateTime(QDate(2026, 3, 10), QTime(14, 0)); }

    QScopedPointer<QTemporaryDir> m_tempDir;
    RecordingNotifier* m_notifier = nullptr;
    BlackoutSession* m_session = nullptr;
};

QTEST_MAIN(BlackoutSessionTest)
#include "BlackoutSessionTest.moc"
