#include "Partition.hpp"

#include "Prefs.hpp"
#include "io/DeviceService.hpp"
#include "io/io.hh"
#include "io/ProcessRunner.hpp"

#include <QElapsedTimer>

namespace livecopy {

static const QString LiveDirName = QLatin1String("live");
static const QString SquashfsExt = QLatin1String(".squashfs");
static const QString UserHomeDir = QLatin1String("/home/user");
static const QString CupsConfigDir = QLatin1String("/etc/cups");

ScopedMount::ScopedMount(Partition *partition): partition_(partition) {}

ScopedMount::~ScopedMount()
{
	Release();
}

bool ScopedMount::Mount(Error *err)
{
	QStringList paths;
	LVC_CHECK(partition_->GetMountPaths(paths, err));
	
	if (!paths.isEmpty()) {
		mount_path_ = paths.first();
#ifdef LIVECOPY_DEBUG_PARTITION
		lvc_info("%s already mounted at %s", qPrintable(partition_->name()),
			qPrintable(mount_path_));
#endif
		return true;
	}
	
	LVC_CHECK(partition_->Mount(mount_path_, err));
	temporary_ = true;
	
	return true;
}

void ScopedMount::Release()
{
	if (!temporary_)
		return;
	
	temporary_ = false;
	Error err;
	if (!partition_->Umount(&err))
		lvc_warn("%s", qPrintable(err.toString()));
}

Partition::Partition(const io::PartitionInfo &info, const Services &services):
info_(info),
system_label_(services.prefs ? services.prefs->system_partition_label()
	: prefs::DefaultSystemPartitionLabel),
services_(services)
{}

Partition::~Partition() {}

bool Partition::GetMountPaths(QStringList &ret, Error *err)
{
	ret.clear();
	Error e;
	if (!services_.device_service->GetMountPaths(dev_path(), ret, &e)) {
		lvc_warn("%s", qPrintable(e.toString()));
		if (err)
			*err = e;
		return false;
	}
	
	return true;
}

bool Partition::IsMounted(Error *err)
{
	QStringList paths;
	if (!GetMountPaths(paths, err))
		return false;
	
	return !paths.isEmpty();
}

bool Partition::Mount(QString &mount_path, Error *err)
{
	QStringList paths;
	LVC_CHECK(GetMountPaths(paths, err));
	
	if (!paths.isEmpty()) {
		mount_path = paths.first();
#ifdef LIVECOPY_DEBUG_PARTITION
		lvc_info("%s already mounted at %s", qPrintable(info_.name), qPrintable(mount_path));
#endif
		return true;
	}
	
	Error e;
	if (!services_.device_service->Mount(dev_path(), QLatin1String("auto"),
		QStringList(), mount_path, &e))
	{
		lvc_warn("%s", qPrintable(e.toString()));
		if (err)
			*err = e;
		return false;
	}
	
	return true;
}

bool Partition::Umount(Error *err)
{
	const QString dev = dev_path();
	auto dev_ba = dev.toLocal8Bit();
	UmountState state = UmountState::Mounted;
	
	Error query_err;
	if (!IsMounted(&query_err) && query_err.ok()) {
		lvc_info("%s was NOT mounted", dev_ba.data());
		state = UmountState::Unmounted;
	}
	
	int attempt = 0;
	while (state == UmountState::Mounted || state == UmountState::Unmounting)
	{
		if (attempt == prefs::UmountMaxAttempts) {
			state = UmountState::GaveUp;
			break;
		}
		attempt++;
		state = UmountState::Unmounting;
		
		/// Someone else may have unmounted it while we were waiting
		query_err.Clear();
		cbool mounted = IsMounted(&query_err);
		if (!query_err.ok()) {
			lvc_warn("Attempt %d: %s", attempt, qPrintable(query_err.toString()));
			continue;
		}
		
		if (!mounted) {
			lvc_info("%s was NOT mounted", dev_ba.data());
			state = UmountState::Unmounted;
			break;
		}
		
		lvc_info("%s is mounted, calling umount...", dev_ba.data());
		Error e;
		if (services_.device_service->Unmount(dev, QStringList(), &e)) {
			state = UmountState::Unmounted;
			break;
		}
		
		lvc_warn("Attempt %d: %s", attempt, qPrintable(e.toString()));
		if (!WaitUntilReleased()) {
			lvc_warn("%s: cancelled", dev_ba.data());
			state = UmountState::GaveUp;
		}
	}
	
	if (state == UmountState::Unmounted)
		return true;
	
	lvc_severe("Could not umount %s", dev_ba.data());
	Error::Set(err, ErrorKind::UnmountExhausted, dev, QLatin1String("unmount"),
		QLatin1String("Could not umount"));
	
	return false;
}

bool Partition::WaitUntilReleased()
{
	const QString dev = dev_path();
	const QStringList args = { QLatin1String("-m"), dev };
	ci8 poll_ms = services_.prefs ? services_.prefs->busy_poll_ms() : prefs::DefaultBusyPollMs;
	ci8 budget_ms = services_.prefs ? services_.prefs->busy_wait_budget_ms()
		: prefs::DefaultBusyWaitBudgetMs;
	CondMutex *cancel = services_.cancel;
	QElapsedTimer timer;
	timer.start();
	
	while (true)
	{
		if (cancel && cancel->cancelled())
			return false;
		
		/// fuser exits with 0 while the device is held open
		io::ExecResult result = services_.runner->Execute(true, true,
			QLatin1String("fuser"), args);
		if (result.exit_code != 0)
			return true;
		
		lvc_info("%s is still being used by the following processes:\n%s",
			qPrintable(dev), qPrintable(result.out));
		
		if (budget_ms > 0 && timer.elapsed() >= budget_ms) {
			lvc_warn("%s: gave up waiting after %ld ms", qPrintable(dev),
				long(timer.elapsed()));
			return true;
		}
		
		if (cancel) {
			if (!cancel->SleepMs(poll_ms))
				return false;
		} else {
			usleep(poll_ms * 1000);
		}
	}
}

bool Partition::IsExtended() const
{
	return info_.type == QLatin1String("0x05") || info_.type == QLatin1String("0x0f");
}

bool Partition::HasExtendedFilesystem() const
{
	return info_.fs == QLatin1String("ext2") || info_.fs == QLatin1String("ext3")
		|| info_.fs == QLatin1String("ext4");
}

bool Partition::IsPersistencyPartition() const
{
	return info_.label == prefs::PersistencePartitionLabel;
}

bool Partition::IsSystemPartition(Error *err)
{
	auto g = mutex_.guard();
	if (is_system_.has_value())
		return is_system_.value();
	
	if (info_.label != system_label_) {
#ifdef LIVECOPY_DEBUG_PARTITION
		lvc_info("%s: does not match system partition label", qPrintable(info_.name));
#endif
		is_system_.Set(false);
		return false;
	}
	
	bool found = false;
	{
		ScopedMount mount(this);
		if (!mount.Mount(err))
			return false;
		
		const QString live_dir = mount.mount_path() + '/' + LiveDirName;
		if (io::DirExists(live_dir)) {
			QVector<QString> names;
			io::ListFileNames(live_dir, names, [](const QString &name) {
				return name.endsWith(SquashfsExt);
			});
			found = !names.isEmpty();
		}
	}
	
	is_system_.Set(found);
	return found;
}

i8 Partition::GetUsableSpace()
{
	auto g = mutex_.guard();
	if (usable_space_.has_value())
		return usable_space_.value();
	
	Error err;
	i8 n = -1;
	{
		ScopedMount mount(this);
		if (mount.Mount(&err))
			n = MeasureUsableSpace(mount.mount_path(), &err);
	}
	
	if (!err.ok())
		lvc_warn("%s", qPrintable(err.toString()));
#ifdef LIVECOPY_DEBUG_PARTITION
	lvc_info("%s: usable space: %ld", qPrintable(info_.name), long(n));
#endif
	
	usable_space_.Set(n);
	return n;
}

i8 Partition::GetUsedSpace()
{
	ci8 usable = GetUsableSpace();
	if (usable == -1 || info_.size == -1)
		return -1;
	
	return info_.size - usable;
}

i8 Partition::cached_usable_space() const
{
	MutexGuard g(&mutex_.mutex, LockType::TryLock);
	if (!g.locked() || !usable_space_.has_value())
		return -1;
	
	return usable_space_.value();
}

i8 Partition::MeasureUsableSpace(const QString &mount_path, Error *err)
{
	if (IsPersistencyPartition()) {
		/// An upgrade keeps only these two dirs of the running system
		ci8 user_size = MeasureDirSize(UserHomeDir, err);
		if (user_size == -1)
			return -1;
		ci8 cups_size = MeasureDirSize(CupsConfigDir, err);
		if (cups_size == -1)
			return -1;
		
		return info_.size - user_size - cups_size;
	}
	
	int status = 0;
	ci8 free_space = io::GetFreeSpace(mount_path, &status);
	if (free_space == -1) {
		Error::Set(err, ErrorKind::Measurement, info_.name, QLatin1String("statvfs"),
			QString::fromLocal8Bit(strerror(status)));
	}
	
	return free_space;
}

i8 Partition::MeasureDirSize(const QString &dir_path, Error *err)
{
	const QString op = QLatin1String("du ") + dir_path;
	io::ExecResult result = services_.runner->Execute(true, true,
		QLatin1String("du"), { QLatin1String("-sb"), dir_path });
	
	if (result.exit_code != 0) {
		Error::Set(err, ErrorKind::Measurement, info_.name, op,
			QLatin1String("exit code ") + QString::number(result.exit_code)
			+ QLatin1String(": ") + result.err.trimmed());
		return -1;
	}
	
	/// "1000000\t/home/user"
	const QString out = result.out.trimmed();
	int end = 0;
	while (end < out.size() && out[end].isDigit())
		end++;
	
	bool ok = false;
	ci8 n = (end > 0) ? out.left(end).toLongLong(&ok) : -1;
	if (!ok) {
		Error::Set(err, ErrorKind::Measurement, info_.name, op,
			QLatin1String("Unparsable output: \"") + out + '\"');
		return -1;
	}
	
	return n;
}

QString Partition::ToString() const
{
	QString s = info_.name + QLatin1String(" (") + io::SizeToString(info_.size);
	if (!info_.fs.isEmpty())
		s += QLatin1String(", ") + info_.fs;
	if (!info_.label.isEmpty())
		s += QLatin1String(", ") + info_.label;
	
	return s + ')';
}

}
