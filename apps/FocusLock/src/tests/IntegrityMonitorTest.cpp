#include <QtTest/QtTest>
#include <QDir>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/AtomicFile.h"
#include "core/BlockPolicy.h"
#include "core/FirewallManager.h"
#include "core/HostsManager.h"
#include "core/IntegrityMonitor.h"
#include "TestFakes.h"

namespace {

class FixedPolicy : public BlockPolicy
{
public:
    QList<HostsBlock> enforcedBlocks() const override { return m_blocks; }
    QStringList liftedMarkers() const override { return m_lifted; }

    QList<HostsBlock> m_blocks;
    QStringList m_lifted;
};

const QByteArray kOriginal = "127.0.0.1 localhost\n";

} // namespace

class IntegrityMonitorTest : public QObject
{
    Q_OBJECT

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        m_hostsPath = m_tempDir->filePath("hosts");
        QCOMPARE(AtomicFile::writeAll(m_hostsPath, kOriginal), AtomicFile::Ok);

        m_runner = new FakeCommandRunner();
        m_resolver = new FakeResolver();
        m_hosts = new HostsManager(m_hostsPath, m_tempDir->filePath("hosts.backup"), "127.0.0.1", m_runner);
        m_firewall = new FirewallManager("FocusLock", m_tempDir->filePath("allowlist_active.flag"), m_runner, m_resolver);

        m_policy.m_blocks.clear();
        m_policy.m_lifted.clear();
        m_policy.m_blocks.append(HostsBlock{"FOCUSLOCK-PERMANENT", "permanent", QStringList() << "example.com"});
        m_policy.m_blocks.append(HostsBlock{"FOCUSLOCK-YOUTUBE", "YouTube", QStringList() << "youtube.com"});

        m_monitor = new IntegrityMonitor(m_hosts, m_firewall, &m_policy, 3600 * 1000);
    }

    void cleanup() {
        delete m_monitor;
        delete m_firewall;
        delete m_hosts;
        delete m_resolver;
        delete m_runner;
        m_tempDir.reset();
    }

    void testFirstPassAppliesEverything() {
        QSignalSpy drift(m_monitor, &IntegrityMonitor::driftRepaired);
        QSignalSpy dns(m_monitor, &IntegrityMonitor::dnsLockRepaired);

        const IntegrityMonitor::Report report = m_monitor->checkOnce();
        QCOMPARE(report.regionsChecked, 2);
        QCOMPARE(report.regionsRepaired, 2);
        QCOMPARE(report.failures, 0);
        QVERIFY(report.dnsLockRepaired);
        QCOMPARE(drift.count(), 2);
        QCOMPARE(dns.count(), 1);

        QVERIFY(m_hosts->isApplied("FOCUSLOCK-PERMANENT", QStringList() << "example.com"));
        QVERIFY(m_firewall->isDnsLocked());
    }

    void testSteadyStateWritesNothing() {
        m_monitor->checkOnce();
        const int netshCalls = m_runner->callCount("netsh advfirewall firewall add");
        QFileInfo before(m_hostsPath);
        const QDateTime modified = before.lastModified();

        const IntegrityMonitor::Report report = m_monitor->checkOnce();
        QCOMPARE(report.regionsRepaired, 0);
        QCOMPARE(report.failures, 0);
        QVERIFY(!report.dnsLockRepaired);
        QCOMPARE(m_runner->callCount("netsh advfirewall firewall add"), netshCalls);
        QCOMPARE(QFileInfo(m_hostsPath).lastModified(), modified);
    }

    void testExternalEditReverted() {
        m_monitor->checkOnce();

        // Hosts file reset to stock by hand
        QCOMPARE(AtomicFile::writeAll(m_hostsPath, kOriginal), AtomicFile::Ok);

        QSignalSpy drift(m_monitor, &IntegrityMonitor::driftRepaired);
        const IntegrityMonitor::Report report = m_monitor->checkOnce();
        QCOMPARE(report.regionsRepaired, 2);
        QCOMPARE(drift.count(), 2);
        QVERIFY(m_hosts->isApplied("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"));
    }

    void testDeletedDnsRuleReinstalled() {
        m_monitor->checkOnce();
        m_runner->removeRule("FocusLock-DNS-Lock");

        const IntegrityMonitor::Report report = m_monitor->checkOnce();
        QVERIFY(report.dnsLockRepaired);
        QCOMPARE(report.regionsRepaired, 0);
        QVERIFY(m_firewall->isDnsLocked());
    }

    void testPolicyChangesFollowedLive() {
        m_monitor->checkOnce();

        // A running session lifts the YouTube block: the monitor no longer asserts it
        m_policy.m_blocks.removeLast();
        QVERIFY(HostsManager::isSuccess(m_hosts->remove("FOCUSLOCK-YOUTUBE")));

        const IntegrityMonitor::Report report = m_monitor->checkOnce();
        QCOMPARE(report.regionsChecked, 1);
        QCOMPARE(report.regionsRepaired, 0);
        QVERIFY(!m_hosts->hasRegion("FOCUSLOCK-YOUTUBE"));
    }

    void testLiftedRegionRemovedWithinOneTick() {
        m_monitor->checkOnce();

        // A session started while the tick was applying: the region came back
        m_policy.m_blocks.removeLast();
        m_policy.m_lifted << "FOCUSLOCK-YOUTUBE";
        QVERIFY(m_hosts->hasRegion("FOCUSLOCK-YOUTUBE"));

        const IntegrityMonitor::Report report = m_monitor->checkOnce();
        QCOMPARE(report.regionsLifted, 1);
        QCOMPARE(report.failures, 0);
        QVERIFY(!m_hosts->hasRegion("FOCUSLOCK-YOUTUBE"));
        QVERIFY(m_hosts->hasRegion("FOCUSLOCK-PERMANENT"));

        const IntegrityMonitor::Report steady = m_monitor->checkOnce();
        QCOMPARE(steady.regionsLifted, 0);
        QCOMPARE(steady.regionsRepaired, 0);
    }

    void testFailuresCounted() {
        m_monitor->checkOnce();
        m_runner->removeRule("FocusLock-DNS-Lock");
        m_runner->setProgramFails("netsh", true);

        // Unreadable hosts path
        QVERIFY(QFile::remove(m_hostsPath));
        QVERIFY(QDir().mkpath(m_hostsPath));

        const IntegrityMonitor::Report report = m_monitor->checkOnce();
        QCOMPARE(report.failures, 3);
        QCOMPARE(report.regionsRepaired, 0);
        QVERIFY(!report.dnsLockRepaired);
    }

    void testStartStop() {
        QVERIFY(m_monitor->start());
        QVERIFY(m_monitor->isRunning());
        m_monitor->stop();
        QVERIFY(!m_monitor->isRunning());
    }

private:
    QScopedPointer<QTemporaryDir> m_tempDir;
    QString m_hostsPath;
    FakeCommandRunner* m_runner = nullptr;
    FakeResolver* m_resolver = nullptr;
    HostsManager* m_hosts = nullptr;
    FirewallManager* m_firewall = nullptr;
    FixedPolicy m_policy;
    IntegrityMonitor* m_monitor = nullptr;
};

QTEST_MAIN(IntegrityMonitorTest)
#include "IntegrityMonitorTest.moc"
