#include "PrefsTest.hpp"

#include "../Prefs.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace livecopy;

static bool WriteFile(const QString &path, const QByteArray &data)
{
	QFile file(path);
	if (!file.open(QIODevice::WriteOnly))
		return false;
	cbool ok = file.write(data) == data.size();
	file.close();
	return ok;
}

void PrefsTest::defaults()
{
	const Prefs prefs = Prefs::Defaults();
	QCOMPARE(prefs.system_partition_label(), QString("system"));
	QVERIFY(!prefs.show_hard_disks());
	QCOMPARE(prefs.busy_poll_ms(), i8(1000));
	QCOMPARE(prefs.busy_wait_budget_ms(), i8(300000));
	QCOMPARE(prefs.export_image_name(), QString("data.squashfs"));
	QCOMPARE(prefs::UmountMaxAttempts, 10);
	QCOMPARE(prefs::PersistencePartitionLabel, QString("live-rw"));
}

void PrefsTest::loadFile()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	const QString path = dir.path() + "/livecopy.conf";
	QVERIFY(WriteFile(path,
		"# livecopy settings\n"
		"system_partition_label = LIVE\n"
		"show_hard_disks = yes\n"
		"\n"
		"busy_poll_ms=250 # quicker\n"
		"busy_wait_budget_ms = 0\n"
		"export_image_name = home.squashfs\n"
		"colour = blue\n"));
	
	Prefs prefs;
	QVERIFY(prefs.Load(path));
	QCOMPARE(prefs.system_partition_label(), QString("LIVE"));
	QVERIFY(prefs.show_hard_disks());
	QCOMPARE(prefs.busy_poll_ms(), i8(250));
	QCOMPARE(prefs.busy_wait_budget_ms(), i8(0));
	QCOMPARE(prefs.export_image_name(), QString("home.squashfs"));
}

void PrefsTest::missingFile()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	
	Prefs prefs;
	QVERIFY(prefs.Load(dir.path() + "/absent.conf"));
	QCOMPARE(prefs.system_partition_label(), QString("system"));
	QCOMPARE(prefs.busy_poll_ms(), i8(1000));
}

void PrefsTest::badLines()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	const QString path = dir.path() + "/livecopy.conf";
	QVERIFY(WriteFile(path,
		"busy_poll_ms = -5\n"
		"show_hard_disks\n"
		"system_partition_label = LIVE\n"));
	
	Prefs prefs;
	QVERIFY(!prefs.Load(path));
	QCOMPARE(prefs.busy_poll_ms(), i8(1000));
	QVERIFY(!prefs.show_hard_disks());
	QCOMPARE(prefs.system_partition_label(), QString("LIVE"));
	
	QVERIFY(!prefs.ParseLine("export_image_name = ../escape.squashfs"));
	QVERIFY(!prefs.ParseLine("show_hard_disks = maybe"));
	QVERIFY(!prefs.ParseLine("system_partition_label ="));
	QCOMPARE(prefs.export_image_name(), QString("data.squashfs"));
}

void PrefsTest::configPath()
{
	QVERIFY(prefs::GetPrefsFilePath().endsWith("/livecopy/livecopy.conf"));
}

QTEST_GUILESS_MAIN(PrefsTest)
