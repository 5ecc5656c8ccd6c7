#pragma once

#include "decl.hxx"
#include "../decl.hxx"

#include <functional>
#include <libudev.h>
#include <QObject>

namespace livecopy::io::udev {

DeviceAction DeviceActionFromStr(const char *s);
Device DeviceFromStr(const char *s);

bool ListDisks(QVector<QString> &names);
/// Returns false if there's no such block device.
bool ReadDisk(const QString &name, DiskInfo &info);
void ReadDiskInfo(struct udev_device *device, DiskInfo &info);
void ReadPartitionInfo(struct udev_device *device, PartitionInfo &info);

/// Blocks until cancelled. The receiver gets
/// DeviceEvent(livecopy::Device, livecopy::DeviceAction, QString) invoked, queued.
/// on_receiving runs once the monitor socket is live, events after it aren't lost.
bool MonitorDevices(QObject *receiver, CondMutex *cancel,
	const std::function<void ()> &on_receiving);

}
