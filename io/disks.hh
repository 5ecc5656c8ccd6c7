#pragma once

#include <QtCore/QCoreApplication>
#include <QtDBus/QtDBus>

#include "DeviceService.hpp"
#include "../Error.hpp"

namespace livecopy::io {

/// Device identity and partition tables come from udev,
/// mounting goes through UDisks2 on the system bus.
class UDisksService: public DeviceService {
public:
	UDisksService();
	virtual ~UDisksService();
	
	bool ListDevices(QVector<QString> &names, Error *err) override;
	bool QueryDevice(const QString &name, DiskInfo &info, Error *err) override;
	bool GetMountPaths(const QString &device, QStringList &ret, Error *err) override;
	bool Mount(const QString &device, const QString &fs_type,
		const QStringList &options, QString &mount_path, Error *err) override;
	bool Unmount(const QString &device, const QStringList &options,
		Error *err) override;
	
private:
	NO_ASSIGN_COPY_MOVE(UDisksService);
	
	bool CheckBus(const QString &device, const QString &op, Error *err);
};

namespace disks {
QString ObjectPath(const QString &device);
bool ReadMountPoints(const QDBusMessage &reply, QStringList &ret);
}

}
