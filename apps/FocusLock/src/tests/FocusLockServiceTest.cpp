#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>

#include "core/AtomicFile.h"
#include "core/BlackoutSession.h"
#include "core/FirewallManager.h"
#include "core/HostsManager.h"
#include "core/IntegrityMonitor.h"
#include "core/PermanentBlockStore.h"
#include "core/PlatformSession.h"
#include "core/TimedBlock.h"
#include "managers/ConfigManager.h"
#include "service/FocusLockService.h"
#include "TestFakes.h"

namespace {

const QByteArray kOriginal = "127.0.0.1 localhost\n";

} // namespace

class FocusLockServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        qputenv("FOCUSLOCK_CONFIG_DIR", m_tempDir->filePath("config").toUtf8());

        QCOMPARE(AtomicFile::writeAll(hostsPath(), kOriginal), AtomicFile::Ok);
        const QByteArray ini = "[General]\n"
                               "DataDir=" + dataDir().toUtf8() + "\n"
                               "HostsFilePath=" + hostsPath().toUtf8() + "\n"
                               "AllowlistDomains=github.com\n";
        QCOMPARE(AtomicFile::writeAll(m_tempDir->filePath("config/focuslock.conf"), ini), AtomicFile::Ok);

        m_runner = new FakeCommandRunner();
        m_resolver = new FakeResolver();
        m_resolver->setAddresses("github.com", QStringList() << "140.82.112.3");
        m_notifier = new RecordingNotifier();
        m_service = new FocusLockService(m_runner, m_resolver, m_notifier);
    }

    void cleanup() {
        delete m_service;
        delete m_notifier;
        delete m_resolver;
        delete m_runner;
        qunsetenv("FOCUSLOCK_CONFIG_DIR");
        m_tempDir.reset();
    }

    void testBootAppliesEveryBlock() {
        QVERIFY(m_service->initialize());

        HostsManager* hosts = m_service->hostsManager();
        QVERIFY(hosts->isApplied(FocusLockService::permanentMarkerId(), m_service->permanentBlock().domains));
        QVERIFY(hosts->hasRegion("FOCUSLOCK-INSTAGRAM"));
        QVERIFY(hosts->hasRegion("FOCUSLOCK-YOUTUBE"));
        QVERIFY(m_service->firewallManager()->isDnsLocked());
        QVERIFY(!m_service->firewallManager()->isAllowlistActive());
        QCOMPARE(m_service->enforcedBlocks().size(), 3);
    }

    void testBootRefusedWithoutDnsLock() {
        m_runner->setProgramFails("netsh", true);
        QVERIFY(!m_service->initialize());
        QVERIFY(!m_service->start());
    }

    void testBootResumesBlackout() {
        QJsonObject state;
        state["end_time"] = QDateTime::currentDateTimeUtc().addSecs(600).toString(Qt::ISODate);
        state["duration_minutes"] = 10;
        state["locked"] = true;
        QCOMPARE(AtomicFile::writeJsonObject(dataDir() + "/blackout_state.json", state), AtomicFile::Ok);

        QVERIFY(m_service->initialize());
        QVERIFY(m_service->blackoutSession()->isActive());
        QVERIFY(m_service->blackoutSession()->isLocked());
        QVERIFY(m_service->blackoutSession()->remainingSeconds() > 9 * 60);
        QVERIFY(!m_service->startBlackout(5, false));
    }

    void testBootReenablesOrphanedAllowlist() {
        QCOMPARE(AtomicFile::writeFlag(dataDir() + "/allowlist_active.flag"), AtomicFile::Ok);

        QVERIFY(m_service->initialize());
        QVERIFY(m_service->firewallManager()->isAllowlistActive());
        QCOMPARE(m_service->firewallManager()->allowlistDomains(), QStringList() << "github.com");
    }

    void testSessionLiftsOnlyItsPlatform() {
        QVERIFY(m_service->initialize());

        QVERIFY(m_service->startPlatformSession("youtube"));
        QVERIFY(!m_service->hostsManager()->hasRegion("FOCUSLOCK-YOUTUBE"));
        QVERIFY(m_service->hostsManager()->hasRegion("FOCUSLOCK-INSTAGRAM"));
        QCOMPARE(m_service->enforcedBlocks().size(), 2);

        QVERIFY(!m_service->startPlatformSession("tiktok"));
        QVERIFY(m_service->stopPlatformSession("youtube"));
        QVERIFY(m_service->hostsManager()->hasRegion("FOCUSLOCK-YOUTUBE"));
    }

    void testIntegrityLiftsRunningSessionRegion() {
        QVERIFY(m_service->initialize());
        QVERIFY(m_service->startPlatformSession("youtube"));
        QCOMPARE(m_service->liftedMarkers(), QStringList() << "FOCUSLOCK-YOUTUBE");

        // Re-added by a tick that raced the session start
        QCOMPARE(m_service->hostsManager()->apply("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"),
                 HostsManager::Applied);

        const IntegrityMonitor::Report report = m_service->integrityMonitor()->checkOnce();
        QCOMPARE(report.regionsLifted, 1);
        QVERIFY(!m_service->hostsManager()->hasRegion("FOCUSLOCK-YOUTUBE"));
        QVERIFY(m_service->hostsManager()->hasRegion("FOCUSLOCK-INSTAGRAM"));
    }

    void testTimedBlockClosesOpenSession() {
        QVERIFY(m_service->initialize());
        QVERIFY(m_service->startPlatformSession("youtube"));
        QVERIFY(!m_service->hostsManager()->hasRegion("FOCUSLOCK-YOUTUBE"));

        QVERIFY(m_service->startTimedBlock(QStringList() << "youtube", 30, true));
        QCOMPARE(m_service->platformSession("youtube")->state(), PlatformSession::Idle);
        QVERIFY(m_service->hostsManager()->hasRegion("FOCUSLOCK-YOUTUBE"));
        QVERIFY(m_service->liftedMarkers().isEmpty());

        QVERIFY(!m_service->startPlatformSession("youtube"));
        QVERIFY(!m_service->stopTimedBlock());
        QVERIFY(m_service->startPlatformSession("instagram"));
    }

    void testBootRestoresTimedBlock() {
        QJsonObject state;
        state["end_time"] = QDateTime::currentDateTimeUtc().addSecs(900).toString(Qt::ISODate);
        state["platform_ids"] = QJsonArray::fromStringList(QStringList() << "instagram");
        state["duration_minutes"] = 15;
        state["locked"] = false;
        QCOMPARE(AtomicFile::writeJsonObject(dataDir() + "/web_block_state.json", state), AtomicFile::Ok);

        QVERIFY(m_service->initialize());
        QVERIFY(m_service->timedBlock()->blocksPlatform("instagram"));
        QVERIFY(!m_service->startPlatformSession("instagram"));

        QVERIFY(m_service->stopTimedBlock());
        QVERIFY(m_service->startPlatformSession("instagram"));
    }

    void testStopIsFailSafe() {
        QVERIFY(m_service->initialize());
        QVERIFY(m_service->start());
        QVERIFY(m_service->isRunning());

        QVERIFY(m_service->startPlatformSession("instagram"));
        QVERIFY(m_service->enableAllowlist());

        QVERIFY(m_service->stop());
        QVERIFY(!m_service->isRunning());
        QCOMPARE(m_service->platformSession("instagram")->state(), PlatformSession::Idle);
        QVERIFY(m_service->hostsManager()->hasRegion("FOCUSLOCK-INSTAGRAM"));
        QVERIFY(!m_service->firewallManager()->isAllowlistActive());
        QVERIFY(m_service->firewallManager()->isDnsLocked());
    }

    void testDestroyJoinsRunningLoops() {
        QVERIFY(m_service->initialize());
        QVERIFY(m_service->startPlatformSession("youtube"));
        QVERIFY(m_service->enableAllowlist());
        QVERIFY(m_service->firewallManager()->isRefreshRunning());

        delete m_service;
        m_service = nullptr;

        // The open session was closed on the way out, the allow-list is left
        // for the next boot to recover
        QByteArray hosts;
        QCOMPARE(AtomicFile::readAll(hostsPath(), hosts), AtomicFile::Ok);
        QVERIFY(hosts.contains("FOCUSLOCK-YOUTUBE-START"));
        QVERIFY(AtomicFile::exists(dataDir() + "/allowlist_active.flag"));
    }

    void testUserBlockAppliedImmediately() {
        QVERIFY(m_service->initialize());

        QVERIFY(m_service->permanentBlocks()->addBlock("News", QStringList() << "news.ycombinator.com"));
        QVERIFY(m_service->permanentBlock().domains.contains("news.ycombinator.com"));
        QVERIFY(m_service->hostsManager()->isApplied(FocusLockService::permanentMarkerId(),
                                                     m_service->permanentBlock().domains));
    }

private:
    QString dataDir() const { return m_tempDir->filePath("data"); }
    QString hostsPath() const { return m_tempDir->filePath("hosts"); }

    QScopedPointer<QTemporaryDir> m_tempDir;
    FakeCommandRunner* m_runner = nullptr;
    FakeResolver* m_resolver = nullptr;
    RecordingNotifier* m_notifier = nullptr;
    FocusLockService* m_service = nullptr;
};

QTEST_MAIN(FocusLockServiceTest)
#include "FocusLockServiceTest.moc"
