#include "DeviceManager.hpp"

#include "AutoDelete.hh"
#include "io/DeviceService.hpp"
#include "io/ImageBuilder.hpp"
#include "io/ProcessRunner.hpp"
#include "io/udev.hh"
#include "exporter.hh"

namespace livecopy {

namespace devicemanager {

void* AddAllTh(void *p)
{
	pthread_detach(pthread_self());
	WorkerArgs *args = (WorkerArgs*)p;
	AutoDelete ad(args);
	DeviceManager *manager = args->manager;
	
	Error err;
	cint added = enumerator::AddAll(manager->devices(), manager->services(),
		manager->strategy(), &err);
	if (added == -1)
		lvc_warn("%s", qPrintable(err.toString()));
	else
		lvc_info("%d device(s) found", added);
	
	manager->WorkerFinished();
	return nullptr;
}

void* AddDeviceTh(void *p)
{
	pthread_detach(pthread_self());
	WorkerArgs *args = (WorkerArgs*)p;
	AutoDelete ad(args);
	DeviceManager *manager = args->manager;
	
	const AddResult r = enumerator::AddDevice(args->path, manager->devices(),
		manager->services(), manager->strategy());
#ifdef LIVECOPY_DEBUG_PARTITION
	lvc_info("%s: %s", qPrintable(args->path), enumerator::AddResultToString(r));
#else
	Q_UNUSED(r);
#endif
	
	manager->WorkerFinished();
	return nullptr;
}

void* ExportTh(void *p)
{
	pthread_detach(pthread_self());
	WorkerArgs *args = (WorkerArgs*)p;
	AutoDelete ad(args);
	DeviceManager *manager = args->manager;
	
	Error err;
	QString image_path;
	io::PartitionInfo info;
	if (manager->FindPartitionInfo(args->path, info)) {
		Partition partition(info, manager->services());
		exporter::ExportPartition(partition, args->target_dir,
			*manager->image_builder(), manager->prefs(), &image_path, &err);
	} else {
		Error::Set(&err, ErrorKind::DeviceQuery, args->path,
			QLatin1String("export"), QLatin1String("No such partition"));
	}
	
	QMetaObject::invokeMethod(manager, "ExportFinished",
		Q_ARG(QString, args->path),
		Q_ARG(QString, image_path),
		Q_ARG(livecopy::Error, err));
	
	manager->WorkerFinished();
	return nullptr;
}

void* MonitorTh(void *p)
{
	pthread_detach(pthread_self());
	WorkerArgs *args = (WorkerArgs*)p;
	AutoDelete ad(args);
	DeviceManager *manager = args->manager;
	
	bool enumerating = false;
	cbool ok = io::udev::MonitorDevices(manager, &manager->cancel(),
	[manager, &enumerating]() {
		enumerating = true;
		manager->Enumerate();
	});
	
	if (!ok)
		lvc_warn("Device monitor failed");
	
	/// No hot-plug events, the list still gets populated once
	if (!enumerating)
		manager->Enumerate();
	
	manager->WorkerFinished();
	return nullptr;
}

void* MountTh(void *p)
{
	pthread_detach(pthread_self());
	WorkerArgs *args = (WorkerArgs*)p;
	AutoDelete ad(args);
	DeviceManager *manager = args->manager;
	
	Error err;
	QString mount_path;
	io::PartitionInfo info;
	if (manager->FindPartitionInfo(args->path, info)) {
		Partition partition(info, manager->services());
		partition.Mount(mount_path, &err);
	} else {
		Error::Set(&err, ErrorKind::DeviceQuery, args->path,
			QLatin1String("mount"), QLatin1String("No such partition"));
	}
	
	QMetaObject::invokeMethod(manager, "MountFinished",
		Q_ARG(QString, args->path),
		Q_ARG(QString, mount_path),
		Q_ARG(livecopy::Error, err));
	
	manager->WorkerFinished();
	return nullptr;
}

void* UmountTh(void *p)
{
	pthread_detach(pthread_self());
	WorkerArgs *args = (WorkerArgs*)p;
	AutoDelete ad(args);
	DeviceManager *manager = args->manager;
	
	Error err;
	bool ok = false;
	io::PartitionInfo info;
	if (manager->FindPartitionInfo(args->path, info)) {
		Partition partition(info, manager->services());
		ok = partition.Umount(&err);
	} else {
		Error::Set(&err, ErrorKind::DeviceQuery, args->path,
			QLatin1String("unmount"), QLatin1String("No such partition"));
	}
	
	QMetaObject::invokeMethod(manager, "UmountFinished",
		Q_ARG(QString, args->path),
		Q_ARG(bool, ok),
		Q_ARG(livecopy::Error, err));
	
	manager->WorkerFinished();
	return nullptr;
}

void* UsableSpaceTh(void *p)
{
	pthread_detach(pthread_self());
	WorkerArgs *args = (WorkerArgs*)p;
	AutoDelete ad(args);
	DeviceManager *manager = args->manager;
	
	i8 n = -1;
	io::PartitionInfo info;
	if (manager->FindPartitionInfo(args->path, info)) {
		Partition partition(info, manager->services());
		n = partition.GetUsableSpace();
	}
	
	QMetaObject::invokeMethod(manager, "UsableSpaceReady",
		Q_ARG(QString, args->path),
		Q_ARG(qint64, n));
	
	manager->WorkerFinished();
	return nullptr;
}

} // devicemanager::

DeviceManager::DeviceManager(const Prefs &prefs, io::DeviceService *device_service,
	io::ProcessRunner *runner, io::ImageBuilder *builder, QObject *parent):
QObject(parent),
prefs_(prefs),
device_service_(device_service),
runner_(runner),
builder_(builder)
{
	qRegisterMetaType<livecopy::Device>();
	qRegisterMetaType<livecopy::DeviceAction>();
	qRegisterMetaType<livecopy::Error>();
	qRegisterMetaType<livecopy::DeviceSnapshot>("livecopy::DeviceSnapshot");
	
	services_.device_service = device_service_;
	services_.runner = runner_;
	services_.prefs = &prefs_;
	services_.cancel = &cancel_;
	
	strategy(enumerator::TransferStrategy(prefs_));
}

DeviceManager::~DeviceManager()
{
	Stop();
	delete builder_;
	delete runner_;
	delete device_service_;
}

void DeviceManager::DeviceEvent(livecopy::Device device,
	livecopy::DeviceAction action, QString dev_path)
{
	if (device != Device::Disk) {
#ifdef LIVECOPY_DEBUG_PARTITION
		lvc_info("Partition event ignored: %s", qPrintable(dev_path));
#endif
		return;
	}
	
	switch (action) {
	case DeviceAction::Added: {
		WorkerArgs *args = new WorkerArgs();
		args->path = dev_path;
		StartWorker(devicemanager::AddDeviceTh, args);
		break;
	}
	case DeviceAction::Removed: {
		enumerator::RemoveDevice(dev_path, devices_, strategy_);
		break;
	}
	case DeviceAction::None: break;
	}
}

bool DeviceManager::FindPartitionInfo(const QString &name, io::PartitionInfo &info)
{
	MutexGuard g = devices_.guard();
	for (StorageDevice *device: devices_.devices_NTS()) {
		Partition *p = device->FindPartition(name);
		if (p) {
			info = p->info();
			return true;
		}
	}
	
	return false;
}

bool DeviceManager::RequestExport(const QString &partition, const QString &target_dir)
{
	WorkerArgs *args = new WorkerArgs();
	args->path = partition;
	args->target_dir = target_dir;
	return StartWorker(devicemanager::ExportTh, args);
}

bool DeviceManager::RequestMount(const QString &partition)
{
	WorkerArgs *args = new WorkerArgs();
	args->path = partition;
	return StartWorker(devicemanager::MountTh, args);
}

bool DeviceManager::RequestUmount(const QString &partition)
{
	WorkerArgs *args = new WorkerArgs();
	args->path = partition;
	return StartWorker(devicemanager::UmountTh, args);
}

bool DeviceManager::RequestUsableSpace(const QString &partition)
{
	WorkerArgs *args = new WorkerArgs();
	args->path = partition;
	return StartWorker(devicemanager::UsableSpaceTh, args);
}

bool DeviceManager::Enumerate()
{
	return StartWorker(devicemanager::AddAllTh, new WorkerArgs());
}

bool DeviceManager::Start(cbool monitor)
{
	/// The monitor enumerates once it's receiving, so that a disk plugged
	/// in between the two still shows up.
	if (monitor)
		return StartWorker(devicemanager::MonitorTh, new WorkerArgs());
	
	return Enumerate();
}

bool DeviceManager::StartWorker(void* (*func)(void*), WorkerArgs *args)
{
	args->manager = this;
	if (cancel_.cancelled()) {
		delete args;
		return false;
	}
	
	{
		auto g = workers_.guard();
		active_workers_++;
	}
	
	pthread_t th;
	cint status = pthread_create(&th, NULL, func, args);
	if (status != 0) {
		lvc_warn("pthread_create: %s", strerror(status));
		delete args;
		WorkerFinished();
		return false;
	}
	
	return true;
}

void DeviceManager::Stop()
{
	cancel_.Cancel();
	
	auto g = workers_.guard();
	while (active_workers_ > 0)
		workers_.CondWait();
}

void DeviceManager::strategy(const enumerator::Strategy &s)
{
	strategy_ = s;
	strategy_.on_changed = [this](const DeviceSnapshot &snapshot) {
		QMetaObject::invokeMethod(this, "DevicesChanged",
			Q_ARG(livecopy::DeviceSnapshot, snapshot));
	};
}

void DeviceManager::WorkerFinished()
{
	auto g = workers_.guard();
	active_workers_--;
	workers_.Broadcast();
}

}
