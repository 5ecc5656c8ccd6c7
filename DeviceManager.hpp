#pragma once

#include "decl.hxx"
#include "err.hpp"
#include "CondMutex.hpp"
#include "DeviceList.hpp"
#include "enumerator.hh"
#include "Error.hpp"
#include "Partition.hpp"
#include "Prefs.hpp"
#include "StorageDevice.hpp"
#include "io/decl.hxx"

#include <QObject>

namespace livecopy {

namespace devicemanager {
void* AddAllTh(void *args);
void* AddDeviceTh(void *args);
void* ExportTh(void *args);
void* MonitorTh(void *args);
void* MountTh(void *args);
void* UmountTh(void *args);
void* UsableSpaceTh(void *args);
}

struct WorkerArgs {
	DeviceManager *manager = nullptr;
	/// Device or partition path, e.g. "/dev/sdb" or "sdb1"
	QString path;
	QString target_dir;
};

/// Owns the services, the device list and the cancel token. All
/// blocking work runs on detached threads, results come back as
/// queued signals on the thread that owns this object.
class DeviceManager: public QObject {
	Q_OBJECT
public:
	/// Takes ownership of the service, the runner and the builder.
	DeviceManager(const Prefs &prefs, io::DeviceService *device_service,
		io::ProcessRunner *runner, io::ImageBuilder *builder,
		QObject *parent = nullptr);
	virtual ~DeviceManager();
	
	CondMutex& cancel() { return cancel_; }
	DeviceList& devices() { return devices_; }
	io::ImageBuilder* image_builder() const { return builder_; }
	const Prefs& prefs() const { return prefs_; }
	const Services& services() const { return services_; }
	const enumerator::Strategy& strategy() const { return strategy_; }
	/// Call before Start(), on_changed is replaced.
	void strategy(const enumerator::Strategy &s);
	
	/// Populates the list and starts watching for hot-plug events.
	bool Start(cbool monitor = true);
	/// Lists all disks on a worker thread.
	bool Enumerate();
	/// Cancels busy-waits, ends the monitor loop and waits for workers.
	void Stop();
	
	bool RequestExport(const QString &partition, const QString &target_dir);
	bool RequestMount(const QString &partition);
	bool RequestUmount(const QString &partition);
	bool RequestUsableSpace(const QString &partition);
	
	/// Copies the identity of a partition out of the list.
	bool FindPartitionInfo(const QString &name, io::PartitionInfo &info);
	
	void WorkerFinished();
	
public Q_SLOTS:
	void DeviceEvent(livecopy::Device device, livecopy::DeviceAction action,
		QString dev_path);
	
Q_SIGNALS:
	void DevicesChanged(livecopy::DeviceSnapshot snapshot);
	void MountFinished(QString device, QString mount_path, livecopy::Error error);
	void UmountFinished(QString device, bool ok, livecopy::Error error);
	void UsableSpaceReady(QString device, qint64 bytes);
	void ExportFinished(QString device, QString image_path, livecopy::Error error);
	
private:
	NO_ASSIGN_COPY_MOVE(DeviceManager);
	
	bool StartWorker(void* (*func)(void*), WorkerArgs *args);
	
	Prefs prefs_;
	io::DeviceService *device_service_ = nullptr;
	io::ProcessRunner *runner_ = nullptr;
	io::ImageBuilder *builder_ = nullptr;
	CondMutex cancel_;
	/// guards active_workers_
	CondMutex workers_;
	int active_workers_ = 0;
	Services services_;
	DeviceList devices_;
	enumerator::Strategy strategy_;
};

}
