#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/AtomicFile.h"
#include "core/HostsManager.h"
#include "TestFakes.h"

class HostsManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        m_hostsPath = m_tempDir->filePath("hosts");
        m_backupPath = m_tempDir->filePath("hosts.backup");
        m_runner = new FakeCommandRunner();
        m_manager = new HostsManager(m_hostsPath, m_backupPath, "127.0.0.1", m_runner);

        QCOMPARE(AtomicFile::writeAll(m_hostsPath, kOriginal), AtomicFile::Ok);
    }

    void cleanup() {
        delete m_manager;
        delete m_runner;
        m_tempDir.reset();
    }

    void testApplyWritesRegionAndFlushes() {
        QSignalSpy spy(m_manager, &HostsManager::regionChanged);

        const QStringList domains = QStringList() << "youtube.com" << "www.youtube.com";
        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", domains, "FocusLock - YouTube block"), HostsManager::Applied);

        QByteArray content;
        QCOMPARE(AtomicFile::readAll(m_hostsPath, content), AtomicFile::Ok);
        QVERIFY(content.startsWith(kOriginal));
        QVERIFY(content.contains("# FocusLock - YouTube block\n127.0.0.1 youtube.com\n127.0.0.1 www.youtube.com\n"));

        QVERIFY(m_manager->isApplied("FOCUSLOCK-YOUTUBE", domains));
        QCOMPARE(m_manager->blockedDomains("FOCUSLOCK-YOUTUBE"), domains);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(m_runner->callCount(flushProgram()), 1);
    }

    void testApplyIsIdempotent() {
        const QStringList domains = QStringList() << "instagram.com";
        QCOMPARE(m_manager->apply("FOCUSLOCK-INSTAGRAM", domains), HostsManager::Applied);

        QByteArray first;
        QCOMPARE(AtomicFile::readAll(m_hostsPath, first), AtomicFile::Ok);
        const QDateTime modified = QFileInfo(m_hostsPath).lastModified();

        QCOMPARE(m_manager->apply("FOCUSLOCK-INSTAGRAM", domains), HostsManager::Unchanged);

        QByteArray second;
        QCOMPARE(AtomicFile::readAll(m_hostsPath, second), AtomicFile::Ok);
        QCOMPARE(second, first);
        QCOMPARE(QFileInfo(m_hostsPath).lastModified(), modified);
        QCOMPARE(m_runner->callCount(flushProgram()), 1);
    }

    void testRemoveRestoresOriginalBytes() {
        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"), HostsManager::Applied);
        QCOMPARE(m_manager->remove("FOCUSLOCK-YOUTUBE"), HostsManager::Applied);

        QByteArray content;
        QCOMPARE(AtomicFile::readAll(m_hostsPath, content), AtomicFile::Ok);
        QCOMPARE(content, kOriginal);

        QCOMPARE(m_manager->remove("FOCUSLOCK-YOUTUBE"), HostsManager::Unchanged);
    }

    void testRegionsDoNotInterfere() {
        QCOMPARE(m_manager->apply("FOCUSLOCK-PERMANENT", QStringList() << "pornhub.com"), HostsManager::Applied);
        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"), HostsManager::Applied);
        QCOMPARE(m_manager->remove("FOCUSLOCK-YOUTUBE"), HostsManager::Applied);

        QVERIFY(m_manager->isApplied("FOCUSLOCK-PERMANENT", QStringList() << "pornhub.com"));
        QVERIFY(!m_manager->hasRegion("FOCUSLOCK-YOUTUBE"));
    }

    void testEmptyDomainSetRemovesRegion() {
        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"), HostsManager::Applied);
        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", QStringList() << "not a domain"), HostsManager::Applied);
        QVERIFY(!m_manager->hasRegion("FOCUSLOCK-YOUTUBE"));
    }

    void testExternalEditIsReverted() {
        const QStringList domains = QStringList() << "youtube.com" << "m.youtube.com";
        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", domains), HostsManager::Applied);

        // Someone deletes a line from inside the region
        QByteArray content;
        QCOMPARE(AtomicFile::readAll(m_hostsPath, content), AtomicFile::Ok);
        content.replace("127.0.0.1 m.youtube.com\n", "");
        QCOMPARE(AtomicFile::writeAll(m_hostsPath, content), AtomicFile::Ok);
        QVERIFY(!m_manager->isApplied("FOCUSLOCK-YOUTUBE", domains));

        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", domains), HostsManager::Applied);
        QVERIFY(m_manager->isApplied("FOCUSLOCK-YOUTUBE", domains));
    }

    void testBackupTakenOnceBeforeFirstWrite() {
        QVERIFY(!AtomicFile::exists(m_backupPath));
        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"), HostsManager::Applied);

        QByteArray backup;
        QCOMPARE(AtomicFile::readAll(m_backupPath, backup), AtomicFile::Ok);
        QCOMPARE(backup, kOriginal);

        QCOMPARE(m_manager->apply("FOCUSLOCK-INSTAGRAM", QStringList() << "instagram.com"), HostsManager::Applied);
        QCOMPARE(AtomicFile::readAll(m_backupPath, backup), AtomicFile::Ok);
        QCOMPARE(backup, kOriginal);

        QVERIFY(m_manager->restoreBackup());
        QByteArray content;
        QCOMPARE(AtomicFile::readAll(m_hostsPath, content), AtomicFile::Ok);
        QCOMPARE(content, kOriginal);
    }

    void testCorruptedFileRebuiltFromBackup() {
        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"), HostsManager::Applied);

        QByteArray garbage("127.0.0.1 localhost\n");
        garbage.append('\0');
        garbage.append("\xFF\xFE junk\n");
        QCOMPARE(AtomicFile::writeAll(m_hostsPath, garbage), AtomicFile::Ok);
        QVERIFY(HostsManager::looksCorrupted(garbage));

        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"), HostsManager::Applied);

        QByteArray content;
        QCOMPARE(AtomicFile::readAll(m_hostsPath, content), AtomicFile::Ok);
        QVERIFY(!HostsManager::looksCorrupted(content));
        QVERIFY(content.startsWith(kOriginal));
        QVERIFY(m_manager->isApplied("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"));
    }

    void testMissingFileTreatedAsEmpty() {
        QVERIFY(QFile::remove(m_hostsPath));
        QCOMPARE(m_manager->apply("FOCUSLOCK-PERMANENT", QStringList() << "example.com"), HostsManager::Applied);
        QVERIFY(m_manager->isApplied("FOCUSLOCK-PERMANENT", QStringList() << "example.com"));
    }

    void testDuplicateRegionsCollapsedOnWrite() {
        QByteArray doubled = kOriginal;
        doubled.append("# >>> FOCUSLOCK-YOUTUBE-START <<<\n127.0.0.1 youtube.com\n# >>> FOCUSLOCK-YOUTUBE-END <<<\n");
        doubled.append("# >>> FOCUSLOCK-YOUTUBE-START <<<\n127.0.0.1 youtube.com\n# >>> FOCUSLOCK-YOUTUBE-END <<<\n");
        QCOMPARE(AtomicFile::writeAll(m_hostsPath, doubled), AtomicFile::Ok);

        QVERIFY(!m_manager->isApplied("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"));
        QCOMPARE(m_manager->apply("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"), HostsManager::Applied);
        QVERIFY(m_manager->isApplied("FOCUSLOCK-YOUTUBE", QStringList() << "youtube.com"));
    }

private:
    static QString flushProgram() {
#ifdef Q_OS_WIN
        return "ipconfig";
#else
        return "resolvectl";
#endif
    }

    const QByteArray kOriginal = QByteArray("# hosts\n127.0.0.1 localhost\n::1 localhost\n");

    QScopedPointer<QTemporaryDir> m_tempDir;
    QString m_hostsPath;
    QString m_backupPath;
    FakeCommandRunner* m_runner;
    HostsManager* m_manager;
};

QTEST_MAIN(HostsManagerTest)
#include "HostsManagerTest.moc"
