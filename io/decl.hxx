#pragma once

#include <QVector>
#include <QString>

#include "../decl.hxx"
#include "../err.hpp"

namespace livecopy::io {
class DeviceService;
class ImageBuilder;
class ProcessRunner;

const i8 KiB = 1024;
const i8 MiB = KiB * 1024;
const i8 GiB = MiB * 1024;
const i8 TiB = GiB * 1024;

/// udev reports partition offsets and sizes in 512 byte sectors
const i8 SectorSize = 512;

// udevadm info --query=property /dev/sdb1
struct PartitionInfo {
	/// DEVNAME="/dev/sdb1" without "/dev/"
	QString name;
	/// ID_PART_ENTRY_NUMBER="1"
	i4 number = -1;
	/// ID_PART_ENTRY_OFFSET, in bytes
	i8 offset = -1;
	/// ID_PART_ENTRY_SIZE, in bytes
	i8 size = -1;
	/// ID_PART_ENTRY_TYPE="0x83"
	QString type;
	/// ID_FS_LABEL="live-rw"
	QString label;
	/// ID_FS_TYPE="ext4"
	QString fs;
};

struct DiskInfo {
	/// "sdb"
	QString name;
	/// "/dev/sdb"
	QString dev_path;
	QString id_model;
	QString id_vendor;
	QString id_revision;
	/// ID_BUS="usb"
	QString bus;
	i8 size = -1;
	bool removable = false;
	bool sd_card = false;
	QVector<PartitionInfo> partitions;
};

struct ExecResult {
	int exit_code = -1;
	QString out;
	QString err;
	
	bool started() const { return exit_code != -1; }
};

}
