#include "exporter.hh"

#include "Error.hpp"
#include "Partition.hpp"
#include "Prefs.hpp"
#include "io/ImageBuilder.hpp"
#include "io/io.hh"

namespace livecopy::exporter {

TargetInfo CheckTarget(const QString &dir_path)
{
	TargetInfo info;
	if (dir_path.isEmpty() || !io::DirExists(dir_path))
		return info;
	
	info.exists = true;
	info.writable = io::CanWriteToDir(dir_path);
	info.free_space = io::GetFreeSpace(dir_path);
	
	return info;
}

bool ExportPartition(Partition &partition, const QString &target_dir,
	io::ImageBuilder &builder, const Prefs &prefs, QString *image_path,
	Error *err)
{
	const QString op = QLatin1String("export");
	const TargetInfo target = CheckTarget(target_dir);
	if (!target.exists) {
		lvc_warn("Target directory doesn't exist: %s", qPrintable(target_dir));
		Error::Set(err, ErrorKind::Target, partition.name(), op,
			QLatin1String("No such directory: ") + target_dir);
		return false;
	}
	
	if (!target.writable) {
		lvc_warn("Target directory not writable: %s", qPrintable(target_dir));
		Error::Set(err, ErrorKind::Target, partition.name(), op,
			QLatin1String("Directory not writable: ") + target_dir);
		return false;
	}
	
	QString dir = target_dir;
	if (!dir.endsWith('/'))
		dir.append('/');
	const QString dest = dir + prefs.export_image_name();
	
	ScopedMount mount(&partition);
	LVC_CHECK(mount.Mount(err));
	
	lvc_info("Exporting %s to %s", qPrintable(partition.dev_path()), qPrintable(dest));
	LVC_CHECK(builder.Build(mount.mount_path(), dest, err));
	
	if (image_path)
		*image_path = dest;
	
	return true;
}

}
