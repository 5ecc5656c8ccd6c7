#include "StorageDevice.hpp"

#include "Partition.hpp"
#include "io/io.hh"

namespace livecopy {

const char* DeviceKindToString(const DeviceKind kind)
{
	switch (kind) {
	case DeviceKind::UsbFlashDrive: return "USB flash drive";
	case DeviceKind::HardDisk: return "Hard disk";
	case DeviceKind::SdCard: return "SD card";
	}
	
	return "?";
}

static QString NameOf(const DeviceKind kind, const io::DiskInfo &info)
{
	switch (kind) {
	case DeviceKind::SdCard: return info.id_model;
	case DeviceKind::UsbFlashDrive:
	case DeviceKind::HardDisk: return QString();
	}
	
	return QString();
}

StorageDevice::StorageDevice(const io::DiskInfo &info):
info_(info),
kind_(KindOf(info)),
name_(NameOf(kind_, info))
{}

StorageDevice::~StorageDevice()
{
	for (Partition *p: partitions_)
		delete p;
}

DeviceKind StorageDevice::KindOf(const io::DiskInfo &info)
{
	if (info.sd_card)
		return DeviceKind::SdCard;
	if (!info.removable)
		return DeviceKind::HardDisk;
	
	return DeviceKind::UsbFlashDrive;
}

Partition* StorageDevice::FindPartition(const QString &name) const
{
	const QString short_name = io::DeviceNameFromPath(name);
	for (Partition *p: partitions_) {
		if (p->name() == short_name)
			return p;
	}
	
	return nullptr;
}

bool StorageDevice::HasSystemPartition()
{
	for (Partition *p: partitions_) {
		if (p->IsSystemPartition())
			return true;
	}
	
	return false;
}

QString StorageDevice::ToString() const
{
	const QString size_str = io::SizeToString(info_.size);
	switch (kind_) {
	case DeviceKind::SdCard: {
		return name_ + QLatin1String(", ") + info_.dev_path
			+ QLatin1String(", ") + size_str;
	}
	case DeviceKind::UsbFlashDrive:
	case DeviceKind::HardDisk: {
		QString s = info_.id_vendor;
		if (!info_.id_model.isEmpty()) {
			if (!s.isEmpty())
				s += QLatin1Char(' ');
			s += info_.id_model;
		}
		if (!info_.id_revision.isEmpty()) {
			s += QLatin1Char(' ');
			s += info_.id_revision;
		}
		return s + QLatin1String(", ") + info_.dev_path
			+ QLatin1String(", ") + size_str;
	}
	}
	
	return info_.dev_path;
}

DeviceSummary StorageDevice::Summary() const
{
	DeviceSummary ds;
	ds.kind = kind_;
	ds.name = name_;
	ds.dev_path = info_.dev_path;
	ds.vendor = info_.id_vendor;
	ds.model = info_.id_model;
	ds.revision = info_.id_revision;
	ds.size = info_.size;
	ds.text = ToString();
	
	for (Partition *p: partitions_) {
		PartitionSummary ps;
		ps.name = p->name();
		ps.number = p->number();
		ps.size = p->size();
		ps.label = p->label();
		ps.fs = p->fs();
		ps.persistency = p->IsPersistencyPartition();
		ps.extended = p->IsExtended();
		ps.usable_space = p->cached_usable_space();
		ps.text = p->ToString();
		ds.partitions.append(ps);
	}
	
	return ds;
}

bool StorageDevice::operator==(const StorageDevice &rhs) const
{
	if (kind_ != rhs.kind_)
		return false;
	
	switch (kind_) {
	case DeviceKind::SdCard: {
		if (name_ != rhs.name_)
			return false;
		break;
	}
	case DeviceKind::UsbFlashDrive:
	case DeviceKind::HardDisk: break;
	}
	
	return info_.dev_path == rhs.info_.dev_path && info_.size == rhs.info_.size
		&& info_.id_revision == rhs.info_.id_revision;
}

size_t qHash(const StorageDevice &key, size_t seed)
{
	switch (key.kind()) {
	case DeviceKind::SdCard:
		return qHashMulti(seed, int(key.kind()), key.name(), key.dev_path(),
			key.size(), key.revision());
	case DeviceKind::UsbFlashDrive:
	case DeviceKind::HardDisk:
		return qHashMulti(seed, int(key.kind()), key.dev_path(), key.size(),
			key.revision());
	}
	
	return seed;
}

}
