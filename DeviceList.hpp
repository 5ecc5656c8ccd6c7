#pragma once

#include "decl.hxx"
#include "MutexGuard.hpp"

#include <QVector>
#include <pthread.h>

namespace livecopy {

/// Owns the devices. Methods ending with _NTS expect the caller
/// to hold the lock.
class DeviceList {
public:
	DeviceList();
	virtual ~DeviceList();
	
	pthread_mutex_t mutex = PTHREAD_MUTEX_INITIALIZER;
	
	MutexGuard guard() { return MutexGuard(&mutex, LockType::Normal); }
	
	/// Takes ownership of the device.
	void Append_NTS(StorageDevice *device);
	bool Contains_NTS(const StorageDevice &device) const;
	StorageDevice* FindByDevPath_NTS(const QString &dev_path) const;
	/// Deletes the device, returns false if there's none with this path.
	bool Remove_NTS(const QString &dev_path);
	DeviceSnapshot Snapshot_NTS() const;
	
	int count();
	DeviceSnapshot Snapshot();
	
	const QVector<StorageDevice*>& devices_NTS() const { return devices_; }
	
private:
	NO_ASSIGN_COPY_MOVE(DeviceList);
	
	QVector<StorageDevice*> devices_;
};

}
