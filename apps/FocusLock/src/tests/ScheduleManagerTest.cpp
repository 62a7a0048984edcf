#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/AtomicFile.h"
#include "core/ScheduleManager.h"
#include "TestFakes.h"

class ScheduleManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        m_launcher = new RecordingLauncher();
        m_manager = new ScheduleManager(schedulesPath(), m_launcher, 60000);
    }

    void cleanup() {
        delete m_manager;
        delete m_launcher;
        m_tempDir.reset();
    }

    void testAddAssignsIdAndPersists() {
        Schedule schedule = workday("Deep work", QTime(9, 0), QTime(11, 0));
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);
        QCOMPARE(schedule.id.size(), 8);

        ScheduleManager reloaded(schedulesPath(), m_launcher, 60000);
        QVERIFY(reloaded.load());
        QCOMPARE(reloaded.schedules().size(), 1);
        QCOMPARE(reloaded.schedules().at(0).name, QString("Deep work"));
        QCOMPARE(reloaded.schedules().at(0).start, QTime(9, 0));
        QCOMPARE(reloaded.schedules().at(0).days, schedule.days);
    }

    void testInvalidSchedulesRejected() {
        Schedule inverted = workday("Backwards", QTime(11, 0), QTime(9, 0));
        QCOMPARE(m_manager->addSchedule(inverted), ScheduleManager::InvalidTimeRange);

        Schedule empty = workday("Zero length", QTime(9, 0), QTime(9, 0));
        QCOMPARE(m_manager->addSchedule(empty), ScheduleManager::InvalidTimeRange);

        Schedule noDays = workday("No days", QTime(9, 0), QTime(10, 0));
        noDays.days.clear();
        QCOMPARE(m_manager->addSchedule(noDays), ScheduleManager::InvalidDays);

        Schedule badDay = workday("Day 7", QTime(9, 0), QTime(10, 0));
        badDay.days = QList<int>() << 7;
        QCOMPARE(m_manager->addSchedule(badDay), ScheduleManager::InvalidDays);

        QVERIFY(m_manager->schedules().isEmpty());
        QVERIFY(!AtomicFile::exists(schedulesPath()));
    }

    void testUpdateRemoveToggle() {
        Schedule schedule = workday("Morning", QTime(9, 0), QTime(10, 0));
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);

        schedule.end = QTime(10, 30);
        QCOMPARE(m_manager->updateSchedule(schedule), ScheduleManager::NoError);
        QCOMPARE(m_manager->schedules().at(0).end, QTime(10, 30));

        QCOMPARE(m_manager->toggleSchedule(schedule.id), ScheduleManager::NoError);
        QVERIFY(!m_manager->schedules().at(0).enabled);
        QCOMPARE(m_manager->setEnabled(schedule.id, true), ScheduleManager::NoError);
        QVERIFY(m_manager->schedules().at(0).enabled);

        QCOMPARE(m_manager->removeSchedule(schedule.id), ScheduleManager::NoError);
        QCOMPARE(m_manager->removeSchedule(schedule.id), ScheduleManager::NotFound);

        Schedule ghost = workday("Ghost", QTime(9, 0), QTime(10, 0));
        ghost.id = "deadbeef";
        QCOMPARE(m_manager->updateSchedule(ghost), ScheduleManager::NotFound);
    }

    void testTriggersOncePerDay() {
        QSignalSpy spy(m_manager, &ScheduleManager::scheduleTriggered);
        Schedule schedule = workday("Focus", QTime(9, 0), QTime(10, 0));
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);

        QVERIFY(m_manager->evaluate(on(8, 59)).isEmpty());
        QCOMPARE(m_manager->evaluate(on(9, 15)), schedule.id);
        QCOMPARE(m_launcher->m_launches.size(), 1);
        QCOMPARE(m_launcher->m_launches.at(0).minutes, 45);
        QVERIFY(!m_launcher->m_launches.at(0).locked);
        QCOMPARE(m_launcher->m_launches.at(0).reason, QString("Schedule: Focus"));
        QCOMPARE(spy.count(), 1);

        // User cancels the blackout; the window does not fire again today
        QVERIFY(m_manager->evaluate(on(9, 20)).isEmpty());
        QCOMPARE(m_launcher->m_launches.size(), 1);
        QVERIFY(m_manager->isTriggeredToday(schedule.id));
    }

    void testRearmsNextDay() {
        Schedule schedule;
        schedule.name = "Every day";
        schedule.days = QList<int>() << 0 << 1 << 2 << 3 << 4 << 5 << 6;
        schedule.start = QTime(9, 0);
        schedule.end = QTime(10, 0);
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);

        QCOMPARE(m_manager->evaluate(on(9, 0)), schedule.id);
        QCOMPARE(m_manager->evaluate(on(9, 30).addDays(1)), schedule.id);
        QCOMPARE(m_launcher->m_launches.size(), 2);
        QCOMPARE(m_launcher->m_launches.at(0).minutes, 60);
    }

    void testRemainingMinutesRoundUp() {
        Schedule schedule = workday("Short", QTime(9, 0), QTime(10, 0));
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);

        const QDateTime lateInWindow(day(), QTime(9, 59, 30));
        QCOMPARE(m_manager->evaluate(lateInWindow), schedule.id);
        QCOMPARE(m_launcher->m_launches.at(0).minutes, 1);
    }

    void testEndIsExclusive() {
        Schedule schedule = workday("Focus", QTime(9, 0), QTime(10, 0));
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);
        QVERIFY(m_manager->evaluate(on(10, 0)).isEmpty());
        QVERIFY(m_launcher->m_launches.isEmpty());
    }

    void testWrongWeekdayIgnored() {
        Schedule schedule = workday("Focus", QTime(9, 0), QTime(10, 0));
        schedule.days = QList<int>() << (day().dayOfWeek() % 7);  // tomorrow's index
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);
        QVERIFY(m_manager->evaluate(on(9, 30)).isEmpty());
    }

    void testDisabledScheduleIgnored() {
        Schedule schedule = workday("Focus", QTime(9, 0), QTime(10, 0));
        schedule.enabled = false;
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);
        QVERIFY(m_manager->evaluate(on(9, 30)).isEmpty());
    }

    void testActiveBlackoutDefers() {
        Schedule schedule = workday("Focus", QTime(9, 0), QTime(10, 0));
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);

        m_launcher->m_active = true;
        QVERIFY(m_manager->evaluate(on(9, 10)).isEmpty());
        QVERIFY(!m_manager->isTriggeredToday(schedule.id));

        m_launcher->m_active = false;
        QCOMPARE(m_manager->evaluate(on(9, 40)), schedule.id);
        QCOMPARE(m_launcher->m_launches.at(0).minutes, 20);
    }

    void testFailedLaunchRetried() {
        Schedule schedule = workday("Focus", QTime(9, 0), QTime(10, 0));
        QCOMPARE(m_manager->addSchedule(schedule), ScheduleManager::NoError);

        m_launcher->m_failLaunch = true;
        QVERIFY(m_manager->evaluate(on(9, 10)).isEmpty());
        QVERIFY(!m_manager->isTriggeredToday(schedule.id));

        m_launcher->m_failLaunch = false;
        QCOMPARE(m_manager->evaluate(on(9, 11)), schedule.id);
    }

    void testOnlyOneWindowFiresPerTick() {
        Schedule first = workday("First", QTime(9, 0), QTime(10, 0));
        Schedule second = workday("Second", QTime(9, 0), QTime(11, 0));
        QCOMPARE(m_manager->addSchedule(first), ScheduleManager::NoError);
        QCOMPARE(m_manager->addSchedule(second), ScheduleManager::NoError);

        QCOMPARE(m_manager->evaluate(on(9, 30)), first.id);
        QCOMPARE(m_launcher->m_launches.size(), 1);
    }

    void testLoadSkipsInvalidEntries() {
        const QByteArray json("{\"schedules\": ["
                              "{\"id\": \"aaaa1111\", \"name\": \"ok\", \"days\": [0,1], \"start\": \"09:00\", \"end\": \"10:00\", \"enabled\": true},"
                              "{\"id\": \"bbbb2222\", \"name\": \"inverted\", \"days\": [0], \"start\": \"11:00\", \"end\": \"10:00\"},"
                              "{\"id\": \"aaaa1111\", \"name\": \"duplicate\", \"days\": [2], \"start\": \"09:00\", \"end\": \"10:00\"}"
                              "]}");
        QCOMPARE(AtomicFile::writeAll(schedulesPath(), json), AtomicFile::Ok);

        QVERIFY(m_manager->load());
        QCOMPARE(m_manager->schedules().size(), 1);
        QCOMPARE(m_manager->schedules().at(0).name, QString("ok"));
    }

    void testLoadAssignsMissingIds() {
        const QByteArray json("{\"schedules\": ["
                              "{\"name\": \"Work\", \"days\": [1], \"start\": \"09:00\", \"end\": \"17:00\", \"enabled\": true},"
                              "{\"name\": \"Evening\", \"days\": [1], \"start\": \"20:00\", \"end\": \"21:00\"}"
                              "]}");
        QCOMPARE(AtomicFile::writeAll(schedulesPath(), json), AtomicFile::Ok);

        QVERIFY(m_manager->load());
        const QList<Schedule> loaded = m_manager->schedules();
        QCOMPARE(loaded.size(), 2);
        QCOMPARE(loaded.at(0).id.size(), 8);
        QVERIFY(loaded.at(0).id != loaded.at(1).id);

        // 2026-03-10 is a Tuesday (day 1)
        QCOMPARE(m_manager->evaluate(on(10, 0)), loaded.at(0).id);
        QCOMPARE(m_launcher->m_launches.size(), 1);
        QCOMPARE(m_launcher->m_launches.at(0).minutes, 7 * 60);

        // The assigned ids survive a reload
        ScheduleManager reloaded(schedulesPath(), m_launcher, 60000);
        QVERIFY(reloaded.load());
        QCOMPARE(reloaded.schedules().at(0).id, loaded.at(0).id);
        QCOMPARE(reloaded.schedules().at(1).id, loaded.at(1).id);
    }

private:
    QString schedulesPath() const {
        return m_tempDir->filePath("schedules.json");
    }

    static QDate day() {
        return QDate(2026, 3, 10);
    }

    static QDateTime on(int hour, int minute) {
        return QDateTime(day(), QTime(hour, minute));
    }

    static Schedule workday(const QString& name, const QTime& start, const QTime& end) {
        Schedule schedule;
        schedule.name = name;
        schedule.days = QList<int>() << (day().dayOfWeek() - 1);
        schedule.start = start;
        schedule.end = end;
        return schedule;
    }

    QScopedPointer<QTemporaryDir> m_tempDir;
    RecordingLauncher* m_launcher;
    ScheduleManager* m_manager;
};

QTEST_MAIN(ScheduleManagerTest)
#include "ScheduleManagerTest.moc"
