#pragma once

#include "types.hxx"

#include <QString>
#include <QVector>
#include <QMetaType> /// Q_DECLARE_METATYPE()

namespace livecopy {
class CondMutex;
class DeviceList;
class DeviceManager;
class Mutex;
class MutexGuard;
class Partition;
class Prefs;
class ScopedMount;
class StorageDevice;
struct DeviceSummary;
struct Error;
struct PartitionSummary;
struct Services;

using DeviceSnapshot = QVector<DeviceSummary>;

enum class DeviceKind: i1 {
	UsbFlashDrive,
	HardDisk,
	SdCard,
};

enum class Device: i1 {
	None,
	Disk,
	Partition
};

enum class DeviceAction: i1 {
	None,
	Added,
	Removed
};

enum class Prewarm: i1 {
	None,
	UsableSpace,
	UsedSpace,
};

enum class AddResult: i1 {
	Added,
	AlreadyPresent,
	Filtered,
	Failed,
};

enum class UmountState: i1 {
	Mounted,
	Unmounting,
	Unmounted,
	GaveUp,
};

} // livecopy::

Q_DECLARE_METATYPE(livecopy::Device);
Q_DECLARE_METATYPE(livecopy::DeviceAction);
