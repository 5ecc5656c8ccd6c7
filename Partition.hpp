#pragma once

#include "decl.hxx"
#include "err.hpp"
#include "CondMutex.hpp"
#include "Error.hpp"
#include "Once.hpp"
#include "io/decl.hxx"

#include <QStringList>

namespace livecopy {

/// Collaborators shared by every partition and device, owned elsewhere.
struct Services {
	io::DeviceService *device_service = nullptr;
	io::ProcessRunner *runner = nullptr;
	const Prefs *prefs = nullptr;
	/// Optional, wakes up and ends busy-waits.
	CondMutex *cancel = nullptr;
};

/// Mounts a partition for the lifetime of this object unless it
/// was mounted already, in which case nothing is undone.
class ScopedMount {
public:
	ScopedMount(Partition *partition);
	~ScopedMount();
	
	bool Mount(Error *err);
	void Release();
	
	const QString& mount_path() const { return mount_path_; }
	bool temporary() const { return temporary_; }
	
private:
	NO_ASSIGN_COPY_MOVE(ScopedMount);
	
	Partition *partition_ = nullptr;
	QString mount_path_;
	bool temporary_ = false;
};

class Partition {
public:
	Partition(const io::PartitionInfo &info, const Services &services);
	virtual ~Partition();
	
	const QString& name() const { return info_.name; }
	QString dev_path() const { return QLatin1String("/dev/") + info_.name; }
	i4 number() const { return info_.number; }
	i8 offset() const { return info_.offset; }
	i8 size() const { return info_.size; }
	const QString& type() const { return info_.type; }
	const QString& label() const { return info_.label; }
	const QString& fs() const { return info_.fs; }
	const QString& system_partition_label() const { return system_label_; }
	const io::PartitionInfo& info() const { return info_; }
	
	bool GetMountPaths(QStringList &ret, Error *err = nullptr);
	bool IsMounted(Error *err = nullptr);
	bool Mount(QString &mount_path, Error *err = nullptr);
	bool Umount(Error *err = nullptr);
	
	bool IsExtended() const;
	bool HasExtendedFilesystem() const;
	bool IsPersistencyPartition() const;
	bool IsSystemPartition(Error *err = nullptr);
	
	/// -1 if unknown, the result is cached either way.
	i8 GetUsableSpace();
	i8 GetUsedSpace();
	/// Never probes, -1 if not computed yet or a probe is running.
	i8 cached_usable_space() const;
	
	QString ToString() const;
	
private:
	NO_ASSIGN_COPY_MOVE(Partition);
	
	bool WaitUntilReleased();
	i8 MeasureDirSize(const QString &dir_path, Error *err);
	i8 MeasureUsableSpace(const QString &mount_path, Error *err);
	
	const io::PartitionInfo info_;
	const QString system_label_;
	Services services_;
	
	Mutex mutex_;
	Once<bool> is_system_;
	Once<i8> usable_space_;
};

}
