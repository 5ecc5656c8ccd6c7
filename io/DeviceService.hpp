#pragma once

#include "decl.hxx"

#include <QStringList>

namespace livecopy::io {

/// The OS block-device service. Every call is a round trip to the OS,
/// nothing is cached here.
class DeviceService {
public:
	virtual ~DeviceService();
	
	/// Whole disks only, e.g. "sdb", "mmcblk0".
	virtual bool ListDevices(QVector<QString> &names, Error *err) = 0;
	virtual bool QueryDevice(const QString &name, DiskInfo &info, Error *err) = 0;
	virtual bool GetMountPaths(const QString &device, QStringList &ret, Error *err) = 0;
	/// fs_type "auto" or empty lets the service detect the filesystem.
	virtual bool Mount(const QString &device, const QString &fs_type,
		const QStringList &options, QString &mount_path, Error *err) = 0;
	virtual bool Unmount(const QString &device, const QStringList &options,
		Error *err) = 0;
};

}
