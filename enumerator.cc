#include "enumerator.hh"

#include "DeviceList.hpp"
#include "Error.hpp"
#include "Partition.hpp"
#include "Prefs.hpp"
#include "StorageDevice.hpp"
#include "io/DeviceService.hpp"
#include "io/io.hh"

namespace livecopy::enumerator {

Strategy InstallStrategy(OnChanged on_changed)
{
	Strategy s;
	s.include_fixed_disks = false;
	s.prewarm = Prewarm::UsableSpace;
	s.on_changed = on_changed;
	return s;
}

Strategy TransferStrategy(const Prefs &prefs, OnChanged on_changed)
{
	Strategy s;
	s.include_fixed_disks = prefs.show_hard_disks();
	s.prewarm = Prewarm::UsedSpace;
	s.on_changed = on_changed;
	return s;
}

Strategy UpgradeStrategy(const Prefs &prefs, OnChanged on_changed)
{
	Strategy s;
	s.include_fixed_disks = prefs.show_hard_disks();
	s.prewarm = Prewarm::None;
	s.on_changed = on_changed;
	return s;
}

const char* AddResultToString(const AddResult r)
{
	switch (r) {
	case AddResult::Added: return "Added";
	case AddResult::AlreadyPresent: return "AlreadyPresent";
	case AddResult::Filtered: return "Filtered";
	case AddResult::Failed: return "Failed";
	}
	
	return "?";
}

StorageDevice* BuildDevice(const io::DiskInfo &info, const Services &services)
{
	StorageDevice *device = new StorageDevice(info);
	for (const io::PartitionInfo &pi: info.partitions)
		device->AddPartition(new Partition(pi, services));
	
	return device;
}

void PrewarmDevice(StorageDevice *device, const Prewarm prewarm)
{
	switch (prewarm) {
	case Prewarm::None: return;
	case Prewarm::UsableSpace: {
		for (Partition *p: device->partitions())
			p->GetUsableSpace();
		return;
	}
	case Prewarm::UsedSpace: {
		for (Partition *p: device->partitions())
			p->GetUsedSpace();
		return;
	}
	}
}

AddResult AddDevice(const QString &path, DeviceList &list,
	const Services &services, const Strategy &strategy, Error *err)
{
	const QString name = io::DeviceNameFromPath(path);
	io::DiskInfo info;
	Error e;
	if (!services.device_service->QueryDevice(name, info, &e)) {
		lvc_warn("%s", qPrintable(e.toString()));
		if (err)
			*err = e;
		return AddResult::Failed;
	}
	
	if (!strategy.include_fixed_disks
		&& StorageDevice::KindOf(info) == DeviceKind::HardDisk)
	{
		return AddResult::Filtered;
	}
	
	StorageDevice *device = BuildDevice(info, services);
	/// Probing may mount partitions, do it before taking the list lock
	PrewarmDevice(device, strategy.prewarm);
	
	DeviceSnapshot snapshot;
	{
		MutexGuard g = list.guard();
		if (list.Contains_NTS(*device)) {
			delete device;
			return AddResult::AlreadyPresent;
		}
		list.Append_NTS(device);
		snapshot = list.Snapshot_NTS();
	}
	
	lvc_info("Added %s", qPrintable(info.dev_path));
	if (strategy.on_changed)
		strategy.on_changed(snapshot);
	
	return AddResult::Added;
}

int AddAll(DeviceList &list, const Services &services,
	const Strategy &strategy, Error *err)
{
	QVector<QString> names;
	LVC_CHECK_ARG(services.device_service->ListDevices(names, err), -1);
	
	int added = 0;
	for (const QString &name: names) {
		const AddResult r = AddDevice(name, list, services, strategy);
		if (r == AddResult::Added)
			added++;
	}
	
	return added;
}

bool RemoveDevice(const QString &path, DeviceList &list, const Strategy &strategy)
{
	DeviceSnapshot snapshot;
	{
		MutexGuard g = list.guard();
		if (!list.Remove_NTS(path))
			return false;
		snapshot = list.Snapshot_NTS();
	}
	
	lvc_info("Removed %s", qPrintable(path));
	if (strategy.on_changed)
		strategy.on_changed(snapshot);
	
	return true;
}

}
