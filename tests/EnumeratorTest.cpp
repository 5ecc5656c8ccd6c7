#include "EnumeratorTest.hpp"

#include "../DeviceList.hpp"
#include "../enumerator.hh"
#include "../Partition.hpp"
#include "../StorageDevice.hpp"
#include "../io/io.hh"

#include <QTemporaryDir>

using namespace livecopy;
using livecopy::tests::MakePartition;
using livecopy::tests::MakeUsbDisk;

static io::DiskInfo MakeHardDisk()
{
	io::DiskInfo info;
	info.name = QLatin1String("sda");
	info.dev_path = QLatin1String("/dev/sda");
	info.id_model = QLatin1String("Samsung SSD 860");
	info.id_revision = QLatin1String("RVT04B6Q");
	info.bus = QLatin1String("ata");
	info.size = 500 * io::GiB;
	info.removable = false;
	info.partitions.append(MakePartition("sda1", 1, 500 * io::GiB, "root"));
	return info;
}

void EnumeratorTest::init()
{
	service_ = new livecopy::tests::FakeDeviceService();
	runner_ = new livecopy::tests::FakeProcessRunner();
	prefs_ = Prefs::Defaults();
	notified_ = 0;
	last_snapshot_.clear();
	
	io::DiskInfo usb = MakeUsbDisk("sdb", 16 * io::GiB);
	usb.partitions.append(MakePartition("sdb1", 1, 2 * io::GiB, "system", "vfat", "0x0c"));
	usb.partitions.append(MakePartition("sdb2", 2, 8000000000, "live-rw"));
	service_->AddDisk(usb);
	service_->AddDisk(MakeHardDisk());
}

void EnumeratorTest::cleanup()
{
	delete runner_;
	delete service_;
	runner_ = nullptr;
	service_ = nullptr;
}

Services EnumeratorTest::services()
{
	Services s;
	s.device_service = service_;
	s.runner = runner_;
	s.prefs = &prefs_;
	return s;
}

void EnumeratorTest::fixedDiskFiltered()
{
	DeviceList list;
	enumerator::Strategy strategy;
	strategy.include_fixed_disks = false;
	strategy.on_changed = [this](const DeviceSnapshot &s) {
		notified_++;
		last_snapshot_ = s;
	};
	
	QCOMPARE(enumerator::AddDevice("/dev/sda", list, services(), strategy),
		AddResult::Filtered);
	QCOMPARE(list.count(), 0);
	QCOMPARE(notified_, 0);
}

void EnumeratorTest::fixedDiskIncluded()
{
	DeviceList list;
	enumerator::Strategy strategy;
	strategy.include_fixed_disks = true;
	strategy.on_changed = [this](const DeviceSnapshot &s) {
		notified_++;
		last_snapshot_ = s;
	};
	
	QCOMPARE(enumerator::AddDevice("/dev/sda", list, services(), strategy),
		AddResult::Added);
	QCOMPARE(list.count(), 1);
	QCOMPARE(notified_, 1);
	QCOMPARE(last_snapshot_[0].kind, DeviceKind::HardDisk);
}

void EnumeratorTest::sameDeviceAddedOnce()
{
	DeviceList list;
	enumerator::Strategy strategy;
	strategy.on_changed = [this](const DeviceSnapshot &s) {
		notified_++;
		last_snapshot_ = s;
	};
	
	QCOMPARE(enumerator::AddDevice("/dev/sdb", list, services(), strategy),
		AddResult::Added);
	QCOMPARE(enumerator::AddDevice("/dev/sdb", list, services(), strategy),
		AddResult::AlreadyPresent);
	QCOMPARE(list.count(), 1);
	QCOMPARE(notified_, 1);
	QCOMPARE(int(last_snapshot_.size()), 1);
	QCOMPARE(int(last_snapshot_[0].partitions.size()), 2);
}

void EnumeratorTest::pathForms()
{
	DeviceList list;
	enumerator::Strategy strategy;
	
	QCOMPARE(enumerator::AddDevice("/org/freedesktop/UDisks2/block_devices/sdb",
		list, services(), strategy), AddResult::Added);
	QCOMPARE(enumerator::AddDevice("sdb", list, services(), strategy),
		AddResult::AlreadyPresent);
	
	auto g = list.guard();
	StorageDevice *device = list.FindByDevPath_NTS("/dev/sdb");
	QVERIFY(device != nullptr);
	QCOMPARE(device->dev_path(), QString("/dev/sdb"));
	QCOMPARE(int(device->partitions().size()), 2);
	QCOMPARE(device->partitions()[1]->name(), QString("sdb2"));
}

void EnumeratorTest::queryFailure()
{
	DeviceList list;
	enumerator::Strategy strategy;
	strategy.on_changed = [this](const DeviceSnapshot&) { notified_++; };
	Error err;
	
	QCOMPARE(enumerator::AddDevice("/dev/sdz", list, services(), strategy, &err),
		AddResult::Failed);
	QCOMPARE(err.kind, ErrorKind::DeviceQuery);
	QCOMPARE(list.count(), 0);
	QCOMPARE(notified_, 0);
}

void EnumeratorTest::prewarmUsableSpace()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	service_->mount_dirs.insert("sdb1", dir.path());
	service_->mount_dirs.insert("sdb2", dir.path());
	runner_->Respond("du -sb /home/user", 0, "1000000\t/home/user\n");
	runner_->Respond("du -sb /etc/cups", 0, "50000\t/etc/cups\n");
	
	DeviceList list;
	enumerator::Strategy strategy = enumerator::InstallStrategy(
		[this](const DeviceSnapshot &s) {
			notified_++;
			last_snapshot_ = s;
		});
	
	QCOMPARE(enumerator::AddDevice("/dev/sdb", list, services(), strategy),
		AddResult::Added);
	QCOMPARE(notified_, 1);
	const PartitionSummary &persistency = last_snapshot_[0].partitions[1];
	QCOMPARE(persistency.usable_space, i8(7998950000));
	QVERIFY(last_snapshot_[0].partitions[0].usable_space >= 0);
	/// every temporary mount was undone
	QCOMPARE(service_->mount_calls, 2);
	QCOMPARE(service_->unmount_calls, 2);
}

void EnumeratorTest::prewarmUsedSpace()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	service_->mount_dirs.insert("sdb1", dir.path());
	service_->mount_dirs.insert("sdb2", dir.path());
	runner_->Respond("du -sb /home/user", 0, "1000000\t/home/user\n");
	runner_->Respond("du -sb /etc/cups", 0, "50000\t/etc/cups\n");
	
	DeviceList list;
	QCOMPARE(enumerator::AddDevice("/dev/sdb", list, services(),
		enumerator::TransferStrategy(prefs_)), AddResult::Added);
	
	auto g = list.guard();
	Partition *p = list.FindByDevPath_NTS("sdb")->FindPartition("sdb2");
	QVERIFY(p != nullptr);
	QCOMPARE(p->cached_usable_space(), i8(7998950000));
	QCOMPARE(p->GetUsedSpace(), i8(1050000));
	QCOMPARE(runner_->count("du"), 2);
}

void EnumeratorTest::namedStrategies()
{
	prefs_.show_hard_disks(true);
	
	const enumerator::Strategy install = enumerator::InstallStrategy();
	QVERIFY(!install.include_fixed_disks);
	QCOMPARE(install.prewarm, Prewarm::UsableSpace);
	
	const enumerator::Strategy transfer = enumerator::TransferStrategy(prefs_);
	QVERIFY(transfer.include_fixed_disks);
	QCOMPARE(transfer.prewarm, Prewarm::UsedSpace);
	
	const enumerator::Strategy upgrade = enumerator::UpgradeStrategy(prefs_);
	QVERIFY(upgrade.include_fixed_disks);
	QCOMPARE(upgrade.prewarm, Prewarm::None);
	
	DeviceList list;
	QCOMPARE(enumerator::AddDevice("/dev/sdb", list, services(), upgrade),
		AddResult::Added);
	QCOMPARE(service_->mount_paths_calls, 0);
	QCOMPARE(int(runner_->calls.size()), 0);
}

void EnumeratorTest::removeDevice()
{
	DeviceList list;
	enumerator::Strategy strategy;
	strategy.on_changed = [this](const DeviceSnapshot &s) {
		notified_++;
		last_snapshot_ = s;
	};
	
	QCOMPARE(enumerator::AddDevice("/dev/sdb", list, services(), strategy),
		AddResult::Added);
	QVERIFY(!enumerator::RemoveDevice("/dev/sdc", list, strategy));
	QCOMPARE(notified_, 1);
	
	QVERIFY(enumerator::RemoveDevice("/dev/sdb", list, strategy));
	QCOMPARE(notified_, 2);
	QVERIFY(last_snapshot_.isEmpty());
	QCOMPARE(list.count(), 0);
}

void EnumeratorTest::addAll()
{
	DeviceList list;
	enumerator::Strategy strategy;
	strategy.include_fixed_disks = true;
	strategy.on_changed = [this](const DeviceSnapshot &s) {
		notified_++;
		last_snapshot_ = s;
	};
	
	QCOMPARE(enumerator::AddAll(list, services(), strategy), 2);
	QCOMPARE(list.count(), 2);
	QCOMPARE(notified_, 2);
	QCOMPARE(last_snapshot_[0].dev_path, QString("/dev/sdb"));
	QCOMPARE(last_snapshot_[1].dev_path, QString("/dev/sda"));
	
	strategy.include_fixed_disks = false;
	DeviceList removable_only;
	QCOMPARE(enumerator::AddAll(removable_only, services(), strategy), 1);
	
	service_->fail_query = true;
	DeviceList failing;
	Error err;
	QCOMPARE(enumerator::AddAll(failing, services(), strategy, &err), -1);
	QCOMPARE(err.kind, ErrorKind::DeviceQuery);
}

QTEST_GUILESS_MAIN(EnumeratorTest)
