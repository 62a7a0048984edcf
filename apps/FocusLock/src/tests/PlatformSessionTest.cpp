#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/AtomicFile.h"
#include "core/HostsManager.h"
#include "core/PlatformSession.h"
#include "core/ProcessManager.h"
#include "core/UsageTracker.h"
#include "TestFakes.h"

class PlatformSessionTest : public QObject
{
    Q_OBJECT

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        QCOMPARE(AtomicFile::writeAll(m_tempDir->filePath("hosts"), "127.0.0.1 localhost\n"), AtomicFile::Ok);

        m_platform = Platform();
        m_platform.id = "instagram";
        m_platform.displayName = "Instagram";
        m_platform.dailyLimitSeconds = 600;
        m_platform.domains = QStringList() << "instagram.com" << "www.instagram.com";
        m_platform.processNames = QStringList() << "Instagram.exe";
        m_platform.markerTag = "INSTAGRAM";

        m_runner = new FakeCommandRunner();
        m_notifier = new RecordingNotifier();
        m_hosts = new HostsManager(m_tempDir->filePath("hosts"), m_tempDir->filePath("hosts.backup"),
                                   "127.0.0.1", m_runner);
        m_processes = new ProcessManager(m_runner);
        m_tracker = new UsageTracker(m_tempDir->path(), 4);

        // Ticks are driven by hand through accountUsage()
        m_session = new PlatformSession(m_platform, m_tracker, m_hosts, m_processes, m_notifier,
                                        QList<int>() << 5 << 1, 3600 * 1000);

        QCOMPARE(m_hosts->apply(m_platform.markerId(), m_platform.domains), HostsManager::Applied);
    }

    void cleanup() {
        delete m_session;
        delete m_tracker;
        delete m_processes;
        delete m_notifier;
        delete m_hosts;
        delete m_runner;
        m_tempDir.reset();
    }

    void testStartLiftsBlock() {
        QSignalSpy spy(m_session, &PlatformSession::stateChanged);

        QVERIFY(m_session->start(now()));
        QCOMPARE(m_session->state(), PlatformSession::Running);
        QVERIFY(!m_hosts->hasRegion(m_platform.markerId()));
        QCOMPARE(m_tracker->sessionCount(m_platform, now()), 1);
        QCOMPARE(spy.count(), 1);
    }

    void testUsageChargedWhileRunningOnly() {
        m_session->accountUsage(30.0, now());
        QCOMPARE(m_tracker->usedSeconds(m_platform, now()), 0.0);

        QVERIFY(m_session->start(now()));
        m_session->accountUsage(30.0, now());
        QCOMPARE(m_tracker->usedSeconds(m_platform, now()), 30.0);
    }

    void testPauseReblocksAndResumeKeepsSession() {
        QVERIFY(m_session->start(now()));
        QVERIFY(m_session->pause(now()));
        QCOMPARE(m_session->state(), PlatformSession::Paused);
        QVERIFY(m_hosts->isApplied(m_platform.markerId(), m_platform.domains));

        QVERIFY(m_session->start(now()));
        QCOMPARE(m_session->state(), PlatformSession::Running);
        QCOMPARE(m_tracker->sessionCount(m_platform, now()), 1);
    }

    void testStopReblocks() {
        QVERIFY(m_session->start(now()));
        QVERIFY(m_session->stop(now()));
        QCOMPARE(m_session->state(), PlatformSession::Idle);
        QVERIFY(m_hosts->isApplied(m_platform.markerId(), m_platform.domains));
        QVERIFY(!m_session->stop(now()));
    }

    void testStopWithoutRunningAppsSkipsKill() {
        QVERIFY(m_session->start(now()));
        QVERIFY(m_session->stop(now()));

        QVERIFY(m_runner->killedProcesses().isEmpty());
        QCOMPARE(m_runner->callCount("taskkill"), 0);
        QCOMPARE(m_runner->callCount("pkill"), 0);
    }

    void testLoopTicksAcrossRestarts() {
        PlatformSession session(m_platform, m_tracker, m_hosts, m_processes, m_notifier,
                                QList<int>() << 5 << 1, 5);
        QSignalSpy usage(&session, &PlatformSession::usageUpdated);

        for (int i = 0; i < 10; ++i) {
            QVERIFY(session.start(now()));
            QCOMPARE(session.state(), PlatformSession::Running);
            QVERIFY(session.stop(now()));
        }

        QVERIFY(session.start(now()));
        QTRY_VERIFY(usage.count() > 0);
        QVERIFY(session.pause(now()));
        QCOMPARE(session.state(), PlatformSession::Paused);
        QVERIFY(m_hosts->isApplied(m_platform.markerId(), m_platform.domains));
    }

    void testWarningsFireOnce() {
        QSignalSpy spy(m_session, &PlatformSession::warningIssued);
        QVERIFY(m_session->start(now()));

        m_session->accountUsage(290.0, now());
        QCOMPARE(spy.count(), 0);
        m_session->accountUsage(10.0, now());
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(1).toInt(), 5);
        m_session->accountUsage(5.0, now());
        QCOMPARE(spy.count(), 1);
        m_session->accountUsage(240.0, now());
        QCOMPARE(spy.count(), 2);
        QCOMPARE(spy.at(1).at(1).toInt(), 1);
        QCOMPARE(m_notifier->count(), 2);
    }

    void testExhaustionBlocksAndKills() {
        QSignalSpy exhausted(m_session, &PlatformSession::allowanceExhausted);
        m_runner->setProcessRunning("Instagram.exe");

        QVERIFY(m_session->start(now()));
        const UsageSnapshot usage = m_session->accountUsage(600.0, now());

        QVERIFY(usage.blocked);
        QCOMPARE(m_session->state(), PlatformSession::Exhausted);
        QCOMPARE(exhausted.count(), 1);
        QVERIFY(m_hosts->isApplied(m_platform.markerId(), m_platform.domains));
        QCOMPARE(m_runner->killedProcesses(), QStringList() << "Instagram.exe");

        // No more charging once exhausted
        m_session->accountUsage(60.0, now());
        QCOMPARE(m_tracker->usedSeconds(m_platform, now()), 600.0);
    }

    void testStartRefusedWhenSpent() {
        m_tracker->addUsage(m_platform, 600.0, now());

        QVERIFY(!m_session->start(now()));
        QCOMPARE(m_session->state(), PlatformSession::Exhausted);
        QVERIFY(m_hosts->isApplied(m_platform.markerId(), m_platform.domains));
        QCOMPARE(m_notifier->count(), 1);
        QCOMPARE(m_tracker->sessionCount(m_platform, now()), 0);
    }

    void testNewDayAllowsStartAgain() {
        m_tracker->addUsage(m_platform, 600.0, now());
        QVERIFY(!m_session->start(now()));

        const QDateTime tomorrow(QDate(2026, 3, 11), QTime(9, 0));
        QVERIFY(m_session->start(tomorrow));
        QCOMPARE(m_session->state(), PlatformSession::Running);
    }

private:
    static QDateTime now() {
        return QDateTime(QDate(2026, 3, 10), QTime(12, 0));
    }

    QScopedPointer<QTemporaryDir> m_tempDir;
    Platform m_platform;
    FakeCommandRunner* m_runner;
    HostsManager* m_hosts;
    ProcessManager* m_processes;
    UsageTracker* m_tracker;
    RecordingNotifier* m_notifier;
    PlatformSession* m_session;
};

QTEST_MAIN(PlatformSessionTest)
#include "PlatformSessionTest.moc"
