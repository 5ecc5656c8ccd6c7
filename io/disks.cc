#include "disks.hh"

#include "io.hh"
#include "udev.hh"

namespace livecopy::io {

static const char *ServiceName = "org.freedesktop.UDisks2";
static const char *FilesystemIface = "org.freedesktop.UDisks2.Filesystem";
static const char *PropertiesIface = "org.freedesktop.DBus.Properties";
/// Returned by Properties.Get when the block has no Filesystem interface,
/// e.g. an extended partition. Such a block is simply not mounted.
static const QString InvalidArgsError = QLatin1String("org.freedesktop.DBus.Error.InvalidArgs");

namespace disks {

QString ObjectPath(const QString &device)
{
	return QLatin1String("/org/freedesktop/UDisks2/block_devices/")
		+ DeviceNameFromPath(device);
}

bool ReadMountPoints(const QDBusMessage &reply, QStringList &ret)
{
	const QList<QVariant> list = reply.arguments();
	LVC_CHECK(!list.isEmpty());
	
	/// Get() returns a variant holding "aay"
	QVariant v = list.first().value<QDBusVariant>().variant();
	LVC_CHECK(v.canConvert<QDBusArgument>());
	const QDBusArgument arg = v.value<QDBusArgument>();
	
	arg.beginArray();
	while (!arg.atEnd())
	{
		QByteArray ba;
		arg >> ba;
		while (ba.endsWith('\0'))
			ba.chop(1);
		if (!ba.isEmpty())
			ret.append(QString::fromLocal8Bit(ba));
	}
	arg.endArray();
	
	return true;
}

} // disks::

UDisksService::UDisksService() {}
UDisksService::~UDisksService() {}

bool UDisksService::CheckBus(const QString &device, const QString &op, Error *err)
{
	if (QDBusConnection::systemBus().isConnected())
		return true;
	
	fprintf(stderr, "Cannot connect to the D-Bus system bus.\n"
	"To start it, run:\n\teval `dbus-launch --auto-syntax`\n");
	Error::Set(err, ErrorKind::DeviceQuery, device, op,
		QLatin1String("DBus: Failed to connect to system bus"));
	return false;
}

bool UDisksService::ListDevices(QVector<QString> &names, Error *err)
{
	if (!udev::ListDisks(names)) {
		Error::Set(err, ErrorKind::DeviceQuery, QString(), QLatin1String("list"),
			QLatin1String("udev enumeration failed"));
		return false;
	}
	
	return true;
}

bool UDisksService::QueryDevice(const QString &name, DiskInfo &info, Error *err)
{
	if (!udev::ReadDisk(DeviceNameFromPath(name), info)) {
		Error::Set(err, ErrorKind::DeviceQuery, name, QLatin1String("query"),
			QLatin1String("No such disk"));
		return false;
	}
	
	return true;
}

bool UDisksService::GetMountPaths(const QString &device, QStringList &ret, Error *err)
{
	const QString op = QLatin1String("mount-paths");
	if (!CheckBus(device, op, err))
		return false;
	
	QDBusInterface iface(ServiceName, disks::ObjectPath(device), PropertiesIface,
		QDBusConnection::systemBus());
	
	if (!iface.isValid()) {
		Error::Set(err, ErrorKind::DeviceQuery, device, op,
			QLatin1String("Invalid interface"));
		return false;
	}
	
	QDBusMessage reply = iface.call(QDBus::Block, "Get",
		QString(FilesystemIface), QString("MountPoints"));
	
	if (reply.type() == QDBusMessage::ErrorMessage) {
		if (reply.errorName() == InvalidArgsError)
			return true;
		Error::Set(err, ErrorKind::DeviceQuery, device, op, reply.errorMessage());
		return false;
	}
	
	if (!disks::ReadMountPoints(reply, ret)) {
		Error::Set(err, ErrorKind::DeviceQuery, device, op,
			QLatin1String("Unexpected reply signature"));
		return false;
	}
	
	return true;
}

bool UDisksService::Mount(const QString &device, const QString &fs_type,
	const QStringList &options, QString &mount_path, Error *err)
{
	const QString op = QLatin1String("mount");
	if (!CheckBus(device, op, err))
		return false;
	
	QDBusInterface iface(ServiceName, disks::ObjectPath(device), FilesystemIface,
		QDBusConnection::systemBus());
	
	if (!iface.isValid()) {
		Error::Set(err, ErrorKind::DeviceQuery, device, op,
			QLatin1String("Invalid interface"));
		return false;
	}
	
	QMap<QString, QVariant> args;
	if (!fs_type.isEmpty() && fs_type != QLatin1String("auto"))
		args["fstype"] = fs_type;
	if (!options.isEmpty())
		args["options"] = options.join(',');
	
	QDBusReply<QString> reply = iface.call(QDBus::Block, "Mount", args);
	
	if (!reply.isValid()) {
		Error::Set(err, ErrorKind::DeviceQuery, device, op, reply.error().message());
		return false;
	}
	
	mount_path = reply.value();
	return true;
}

bool UDisksService::Unmount(const QString &device, const QStringList &options,
	Error *err)
{
	const QString op = QLatin1String("unmount");
	if (!CheckBus(device, op, err))
		return false;
	
	QDBusInterface iface(ServiceName, disks::ObjectPath(device), FilesystemIface,
		QDBusConnection::systemBus());
	
	if (!iface.isValid()) {
		Error::Set(err, ErrorKind::DeviceQuery, device, op,
			QLatin1String("Invalid interface"));
		return false;
	}
	
	QMap<QString, QVariant> args;
	for (const QString &s: options)
		args[s] = true;
	
/// Unmount() has an empty reply signature, QDBusReply<QString> fails on it
	QDBusMessage reply = iface.call(QDBus::Block, "Unmount", args);
	
	if (reply.type() == QDBusMessage::ErrorMessage) {
		lvc_warn("Call failed: %s", qPrintable(reply.errorMessage()));
		Error::Set(err, ErrorKind::DeviceQuery, device, op, reply.errorMessage());
		return false;
	}
	
	return true;
}

}
