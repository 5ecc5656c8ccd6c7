#include "DeviceList.hpp"

#include "StorageDevice.hpp"
#include "io/io.hh"

namespace livecopy {

DeviceList::DeviceList() {}

DeviceList::~DeviceList()
{
	MutexGuard g = guard();
	for (StorageDevice *next: devices_)
		delete next;
	devices_.clear();
}

void DeviceList::Append_NTS(StorageDevice *device)
{
	devices_.append(device);
}

bool DeviceList::Contains_NTS(const StorageDevice &device) const
{
	for (StorageDevice *next: devices_) {
		if (*next == device)
			return true;
	}
	
	return false;
}

int DeviceList::count()
{
	MutexGuard g = guard();
	return devices_.size();
}

StorageDevice* DeviceList::FindByDevPath_NTS(const QString &dev_path) const
{
	const QString name = io::DeviceNameFromPath(dev_path);
	for (StorageDevice *next: devices_) {
		if (next->device_name() == name)
			return next;
	}
	
	return nullptr;
}

bool DeviceList::Remove_NTS(const QString &dev_path)
{
	const QString name = io::DeviceNameFromPath(dev_path);
	for (int i = 0; i < devices_.size(); i++) {
		StorageDevice *next = devices_[i];
		if (next->device_name() == name) {
			devices_.remove(i);
			delete next;
			return true;
		}
	}
	
	return false;
}

DeviceSnapshot DeviceList::Snapshot()
{
	MutexGuard g = guard();
	return Snapshot_NTS();
}

DeviceSnapshot DeviceList::Snapshot_NTS() const
{
	DeviceSnapshot vec;
	for (StorageDevice *next: devices_)
		vec.append(next->Summary());
	
	return vec;
}

}
