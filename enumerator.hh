#pragma once

#include "decl.hxx"
#include "io/decl.hxx"

#include <functional>

namespace livecopy::enumerator {

using OnChanged = std::function<void (const DeviceSnapshot &snapshot)>;

struct Strategy {
	bool include_fixed_disks = false;
	Prewarm prewarm = Prewarm::None;
	/// Called without the list lock held.
	OnChanged on_changed = nullptr;
};

/// Removable media only, measures free space up front.
Strategy InstallStrategy(OnChanged on_changed = nullptr);
Strategy TransferStrategy(const Prefs &prefs, OnChanged on_changed = nullptr);
Strategy UpgradeStrategy(const Prefs &prefs, OnChanged on_changed = nullptr);

/// "/dev/sdb", "/org/freedesktop/UDisks2/block_devices/sdb" or "sdb"
AddResult AddDevice(const QString &path, DeviceList &list,
	const Services &services, const Strategy &strategy, Error *err = nullptr);

/// Returns the number of devices added, -1 if listing failed.
int AddAll(DeviceList &list, const Services &services,
	const Strategy &strategy, Error *err = nullptr);

StorageDevice* BuildDevice(const io::DiskInfo &info, const Services &services);

void PrewarmDevice(StorageDevice *device, const Prewarm prewarm);

bool RemoveDevice(const QString &path, DeviceList &list, const Strategy &strategy);

const char* AddResultToString(const AddResult r);

}
