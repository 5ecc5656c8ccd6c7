#include "udev.hh"

#include "../AutoDelete.hh"
#include "../CondMutex.hpp"

#include <algorithm>
#include <sys/select.h>

namespace livecopy::io::udev {

static const char *const BlockSubsystem = "block";

static const QString loop_str = QLatin1String("loop");
static const QString ram_str = QLatin1String("ram");
static const QString zram_str = QLatin1String("zram");
static const QString mmcblk_str = QLatin1String("mmcblk");

static QString PropertyStr(struct udev_device *device, const char *key)
{
	const char *s = udev_device_get_property_value(device, key);
	return s ? QString::fromLocal8Bit(s) : QString();
}

static i8 PropertyI8(struct udev_device *device, const char *key, ci8 fallback)
{
	const char *s = udev_device_get_property_value(device, key);
	if (!s)
		return fallback;
	bool ok;
	ci8 n = QByteArray(s).toLongLong(&ok);
	return ok ? n : fallback;
}

static bool SkipDisk(const QString &sys_name)
{
	return sys_name.startsWith(loop_str) || sys_name.startsWith(ram_str)
		|| sys_name.startsWith(zram_str);
}

DeviceAction DeviceActionFromStr(const char *s)
{
	if (!s)
		return DeviceAction::None;
	if (strcmp(s, "add") == 0)
		return DeviceAction::Added;
	if (strcmp(s, "remove") == 0)
		return DeviceAction::Removed;
	
	return DeviceAction::None;
}

Device DeviceFromStr(const char *s)
{
	if (!s)
		return Device::None;
	if (strcmp(s, "partition") == 0)
		return Device::Partition;
	if (strcmp(s, "disk") == 0)
		return Device::Disk;
	
	return Device::None;
}

bool ListDisks(QVector<QString> &names)
{
	struct udev *udev = udev_new();
	LVC_CHECK(udev != nullptr);
	UdevAutoUnref auto_unref(udev);
	
	struct udev_enumerate *enumerate = udev_enumerate_new(udev);
	LVC_CHECK(enumerate != nullptr);
	UdevEnumerateAutoUnref auto_unref_enumerate(enumerate);
	udev_enumerate_add_match_subsystem(enumerate, BlockSubsystem);
	udev_enumerate_add_match_property(enumerate, "DEVTYPE", "disk");
	udev_enumerate_scan_devices(enumerate);
	
	struct udev_list_entry *devices = udev_enumerate_get_list_entry(enumerate);
	struct udev_list_entry *next_entry;
	udev_list_entry_foreach(next_entry, devices)
	{
		const char *path = udev_list_entry_get_name(next_entry);
		struct udev_device *device = udev_device_new_from_syspath(udev, path);
		if (!device)
			continue;
		UdevDeviceAutoUnref udau(device);
		const QString sys_name = QString::fromLocal8Bit(udev_device_get_sysname(device));
		if (SkipDisk(sys_name))
			continue;
		names.append(sys_name);
	}
	
	return true;
}

bool ReadDisk(const QString &name, DiskInfo &info)
{
	struct udev *udev = udev_new();
	LVC_CHECK(udev != nullptr);
	UdevAutoUnref auto_unref(udev);
	
	auto name_ba = name.toLocal8Bit();
	struct udev_device *disk = udev_device_new_from_subsystem_sysname(udev,
		BlockSubsystem, name_ba.data());
	if (!disk)
		return false;
	UdevDeviceAutoUnref auto_unref_disk(disk);
	
	const char *dev_type = udev_device_get_devtype(disk);
	if (DeviceFromStr(dev_type) != Device::Disk) {
		lvc_warn("%s is not a disk", name_ba.data());
		return false;
	}
	
	ReadDiskInfo(disk, info);
	
	struct udev_enumerate *enumerate = udev_enumerate_new(udev);
	LVC_CHECK(enumerate != nullptr);
	UdevEnumerateAutoUnref auto_unref_enumerate(enumerate);
	udev_enumerate_add_match_parent(enumerate, disk);
	udev_enumerate_add_match_subsystem(enumerate, BlockSubsystem);
	udev_enumerate_add_match_property(enumerate, "DEVTYPE", "partition");
	udev_enumerate_scan_devices(enumerate);
	
	struct udev_list_entry *devices = udev_enumerate_get_list_entry(enumerate);
	struct udev_list_entry *next_entry;
	udev_list_entry_foreach(next_entry, devices)
	{
		const char *path = udev_list_entry_get_name(next_entry);
		struct udev_device *device = udev_device_new_from_syspath(udev, path);
		if (!device)
			continue;
		UdevDeviceAutoUnref udau(device);
		PartitionInfo pi;
		ReadPartitionInfo(device, pi);
		info.partitions.append(pi);
	}
	
	std::sort(info.partitions.begin(), info.partitions.end(),
		[](const PartitionInfo &a, const PartitionInfo &b) {
			return a.number < b.number;
	});
	
	return true;
}

void ReadDiskInfo(struct udev_device *device, DiskInfo &info)
{
	info.name = QString::fromLocal8Bit(udev_device_get_sysname(device));
	info.dev_path = QString::fromLocal8Bit(udev_device_get_devnode(device));
	info.id_model = PropertyStr(device, "ID_MODEL").replace('_', ' ');
	info.id_vendor = PropertyStr(device, "ID_VENDOR").replace('_', ' ');
	info.id_revision = PropertyStr(device, "ID_REVISION");
	info.bus = PropertyStr(device, "ID_BUS");
	
	const char *sz = udev_device_get_sysattr_value(device, "size");
	if (sz) {
		bool ok;
		ci8 sectors = QByteArray(sz).toLongLong(&ok);
		if (ok)
			info.size = sectors * io::SectorSize;
	}
	
	const char *removable = udev_device_get_sysattr_value(device, "removable");
	info.removable = (removable && strcmp(removable, "1") == 0)
		|| info.bus == QLatin1String("usb");
	
	info.sd_card = info.name.startsWith(mmcblk_str)
		|| PropertyStr(device, "ID_DRIVE_FLASH_SD") == QLatin1String("1");
	if (info.sd_card) {
		/// mmc cards have no ID_MODEL, the card name is in sysfs
		struct udev_device *parent = udev_device_get_parent(device);
		const char *card_name = parent ? udev_device_get_sysattr_value(parent, "name") : nullptr;
		if (card_name)
			info.id_model = QString::fromLocal8Bit(card_name).trimmed();
		if (info.id_revision.isEmpty() && parent) {
			const char *rev = udev_device_get_sysattr_value(parent, "fwrev");
			if (rev)
				info.id_revision = QString::fromLocal8Bit(rev).trimmed();
		}
	}
}

void ReadPartitionInfo(struct udev_device *device, PartitionInfo &info)
{
	info.name = QString::fromLocal8Bit(udev_device_get_sysname(device));
	info.number = i4(PropertyI8(device, "ID_PART_ENTRY_NUMBER", -1));
	ci8 offset = PropertyI8(device, "ID_PART_ENTRY_OFFSET", -1);
	info.offset = (offset == -1) ? -1 : offset * io::SectorSize;
	ci8 size = PropertyI8(device, "ID_PART_ENTRY_SIZE", -1);
	info.size = (size == -1) ? -1 : size * io::SectorSize;
	info.type = PropertyStr(device, "ID_PART_ENTRY_TYPE");
	info.label = PropertyStr(device, "ID_FS_LABEL");
	info.fs = PropertyStr(device, "ID_FS_TYPE");
	
	if (info.number == -1) {
		const char *n = udev_device_get_sysattr_value(device, "partition");
		if (n)
			info.number = QByteArray(n).toInt();
	}
}

bool MonitorDevices(QObject *receiver, CondMutex *cancel,
	const std::function<void ()> &on_receiving)
{
	struct udev *udev = udev_new();
	LVC_CHECK(udev != nullptr);
	UdevAutoUnref auto_unref_udev(udev);

	struct udev_monitor *monitor = udev_monitor_new_from_netlink(udev, "udev");
	LVC_CHECK(monitor != nullptr);
	UdevMonitorAutoUnref auto_unref_monitor(monitor);
	
	udev_monitor_filter_add_match_subsystem_devtype(monitor, BlockSubsystem, "disk");
	udev_monitor_filter_add_match_subsystem_devtype(monitor, BlockSubsystem, "partition");
	if (udev_monitor_enable_receiving(monitor) < 0) {
		lvc_trace();
		return false;
	}
	int fd = udev_monitor_get_fd(monitor);
	
	if (on_receiving)
		on_receiving();
	
	while (!cancel->cancelled())
	{
		fd_set fds;
		FD_ZERO(&fds);
		FD_SET(fd, &fds);
		struct timeval tv;
		tv.tv_sec = 0;
		tv.tv_usec = 500 * 1000; /// 500 ms, then look at the cancel flag
		
		int ret = select(fd + 1, &fds, NULL, NULL, &tv);
		if (ret == -1 && errno != EINTR) {
			lvc_errno();
			return false;
		}
		
		if (ret <= 0 || !FD_ISSET(fd, &fds))
			continue;
		
		struct udev_device *device = udev_monitor_receive_device(monitor);
		if (!device) {
			lvc_trace();
			continue;
		}
		
		UdevDeviceAutoUnref udau(device);
		const DeviceAction device_action = DeviceActionFromStr(udev_device_get_action(device));
		const Device device_enum = DeviceFromStr(udev_device_get_devtype(device));
		if (device_enum == Device::None || device_action == DeviceAction::None)
			continue;
		
		const char *devnode = udev_device_get_devnode(device);
		if (!devnode)
			continue;
		const QString dev_path = QString::fromLocal8Bit(devnode);
		QMetaObject::invokeMethod(receiver, "DeviceEvent", Qt::QueuedConnection,
			Q_ARG(livecopy::Device, device_enum),
			Q_ARG(livecopy::DeviceAction, device_action),
			Q_ARG(QString, dev_path));
	}
	
	lvc_info("Device monitor quit");
	return true;
}

}
