#include "ExportTest.hpp"

#include "../exporter.hh"
#include "../Partition.hpp"
#include "../io/io.hh"

#include <QFile>

using namespace livecopy;
using livecopy::tests::MakePartition;

void ExportTest::init()
{
	service_ = new livecopy::tests::FakeDeviceService();
	runner_ = new livecopy::tests::FakeProcessRunner();
	builder_ = new livecopy::tests::FakeImageBuilder();
	prefs_ = Prefs::Defaults();
	source_ = new QTemporaryDir();
	target_ = new QTemporaryDir();
	QVERIFY(source_->isValid());
	QVERIFY(target_->isValid());
	service_->mount_dirs.insert("sdb2", source_->path());
}

void ExportTest::cleanup()
{
	delete target_;
	delete source_;
	delete builder_;
	delete runner_;
	delete service_;
	target_ = source_ = nullptr;
	builder_ = nullptr;
	runner_ = nullptr;
	service_ = nullptr;
}

Services ExportTest::services()
{
	Services s;
	s.device_service = service_;
	s.runner = runner_;
	s.prefs = &prefs_;
	return s;
}

void ExportTest::checkTarget()
{
	const exporter::TargetInfo info = exporter::CheckTarget(target_->path());
	QVERIFY(info.exists);
	QVERIFY(info.writable);
	QVERIFY(info.usable());
	QVERIFY(info.free_space >= 0);
	
	const exporter::TargetInfo missing = exporter::CheckTarget(target_->path() + "/nope");
	QVERIFY(!missing.exists);
	QVERIFY(!missing.writable);
	QCOMPARE(missing.free_space, i8(-1));
	
	QVERIFY(!exporter::CheckTarget(QString()).exists);
}

void ExportTest::missingTarget()
{
	Partition p(MakePartition("sdb2", 2, 8 * io::GiB, "live-rw"), services());
	Error err;
	QString image;
	
	QVERIFY(!exporter::ExportPartition(p, target_->path() + "/nope", *builder_,
		prefs_, &image, &err));
	QCOMPARE(err.kind, ErrorKind::Target);
	QCOMPARE(builder_->calls, 0);
	QCOMPARE(service_->mount_calls, 0);
	QVERIFY(image.isEmpty());
}

void ExportTest::readOnlyTarget()
{
	if (geteuid() == 0)
		QSKIP("root can write into read-only directories");
	
	QVERIFY(QFile::setPermissions(target_->path(),
		QFileDevice::ReadOwner | QFileDevice::ExeOwner));
	Partition p(MakePartition("sdb2", 2, 8 * io::GiB, "live-rw"), services());
	Error err;
	
	cbool ok = exporter::ExportPartition(p, target_->path(), *builder_,
		prefs_, nullptr, &err);
	QFile::setPermissions(target_->path(), QFileDevice::ReadOwner
		| QFileDevice::WriteOwner | QFileDevice::ExeOwner);
	
	QVERIFY(!ok);
	QCOMPARE(err.kind, ErrorKind::Target);
	QCOMPARE(builder_->calls, 0);
}

void ExportTest::exportBuildsImage()
{
	prefs_.export_image_name("backup.squashfs");
	Partition p(MakePartition("sdb2", 2, 8 * io::GiB, "live-rw"), services());
	Error err;
	QString image;
	
	QVERIFY(exporter::ExportPartition(p, target_->path(), *builder_, prefs_,
		&image, &err));
	QVERIFY(err.ok());
	QCOMPARE(image, target_->path() + "/backup.squashfs");
	QCOMPARE(builder_->calls, 1);
	QCOMPARE(builder_->source, source_->path());
	QCOMPARE(builder_->target, image);
	/// the partition wasn't mounted before, it isn't afterwards
	QCOMPARE(service_->mount_calls, 1);
	QCOMPARE(service_->unmount_calls, 1);
	QVERIFY(!p.IsMounted());
}

void ExportTest::exportOfMountedPartition()
{
	service_->mounts.insert("sdb2", { source_->path() });
	Partition p(MakePartition("sdb2", 2, 8 * io::GiB, "live-rw"), services());
	QString image;
	
	QVERIFY(exporter::ExportPartition(p, target_->path() + '/', *builder_, prefs_,
		&image, nullptr));
	QCOMPARE(image, target_->path() + "/data.squashfs");
	QCOMPARE(service_->mount_calls, 0);
	QCOMPARE(service_->unmount_calls, 0);
	QVERIFY(p.IsMounted());
}

void ExportTest::builderFailure()
{
	builder_->succeed = false;
	Partition p(MakePartition("sdb2", 2, 8 * io::GiB, "live-rw"), services());
	Error err;
	
	QVERIFY(!exporter::ExportPartition(p, target_->path(), *builder_, prefs_,
		nullptr, &err));
	QCOMPARE(err.kind, ErrorKind::ImageBuild);
	QCOMPARE(service_->unmount_calls, 1);
	QVERIFY(!p.IsMounted());
}

void ExportTest::squashfsCommandLine()
{
	runner_->Respond("mksquashfs /media/sdb2 /tmp/out/data.squashfs -noappend", 0);
	io::SquashfsBuilder builder(runner_);
	Error err;
	
	QVERIFY(builder.Build("/media/sdb2", "/tmp/out/data.squashfs", &err));
	QVERIFY(err.ok());
	QCOMPARE(runner_->calls, QStringList({"mksquashfs /media/sdb2 /tmp/out/data.squashfs -noappend"}));
}

void ExportTest::squashfsFailure()
{
	io::SquashfsBuilder builder(runner_);
	Error err;
	
	QVERIFY(!builder.Build("/media/sdb2", "/tmp/out/data.squashfs", &err));
	QCOMPARE(err.kind, ErrorKind::ImageBuild);
	QVERIFY(err.message.contains("exit code 1"));
}

QTEST_GUILESS_MAIN(ExportTest)
