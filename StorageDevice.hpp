#pragma once

#include "decl.hxx"
#include "err.hpp"
#include "io/decl.hxx"

#include <QHash>
#include <QMetaType> /// Q_DECLARE_METATYPE()

namespace livecopy {

struct PartitionSummary {
	QString name;
	i4 number = -1;
	i8 size = -1;
	QString label;
	QString fs;
	bool persistency = false;
	bool extended = false;
	/// -1 unless measured already
	i8 usable_space = -1;
	QString text;
};

struct DeviceSummary {
	DeviceKind kind = DeviceKind::UsbFlashDrive;
	QString name;
	QString dev_path;
	QString vendor;
	QString model;
	QString revision;
	i8 size = -1;
	QString text;
	QVector<PartitionSummary> partitions;
};

const char* DeviceKindToString(const DeviceKind kind);

class StorageDevice {
public:
	StorageDevice(const io::DiskInfo &info);
	virtual ~StorageDevice();
	
	static DeviceKind KindOf(const io::DiskInfo &info);
	
	DeviceKind kind() const { return kind_; }
	bool is_sd_card() const { return kind_ == DeviceKind::SdCard; }
	bool is_fixed() const { return kind_ == DeviceKind::HardDisk; }
	/// Human readable card name, only set for SD cards.
	const QString& name() const { return name_; }
	const QString& dev_path() const { return info_.dev_path; }
	QString device_name() const { return info_.name; }
	const QString& vendor() const { return info_.id_vendor; }
	const QString& model() const { return info_.id_model; }
	const QString& revision() const { return info_.id_revision; }
	i8 size() const { return info_.size; }
	
	const QVector<Partition*>& partitions() const { return partitions_; }
	/// Takes ownership.
	void AddPartition(Partition *p) { partitions_.append(p); }
	Partition* FindPartition(const QString &name) const;
	bool HasSystemPartition();
	
	QString ToString() const;
	DeviceSummary Summary() const;
	
	bool operator==(const StorageDevice &rhs) const;
	bool operator!=(const StorageDevice &rhs) const { return !(*this == rhs); }
	
private:
	NO_ASSIGN_COPY_MOVE(StorageDevice);
	
	const io::DiskInfo info_;
	const DeviceKind kind_;
	const QString name_;
	QVector<Partition*> partitions_;
};

size_t qHash(const StorageDevice &key, size_t seed = 0);

}
Q_DECLARE_METATYPE(livecopy::DeviceSummary);
