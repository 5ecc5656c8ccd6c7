#pragma once

#include "decl.hxx"
#include "io/decl.hxx"

namespace livecopy::exporter {

struct TargetInfo {
	bool exists = false;
	bool writable = false;
	/// -1 if the directory doesn't exist
	i8 free_space = -1;
	
	bool usable() const { return exists && writable; }
};

TargetInfo CheckTarget(const QString &dir_path);

/// Builds "<target_dir>/<export_image_name>" out of the partition's
/// contents, mounting the partition for the duration if needed.
bool ExportPartition(Partition &partition, const QString &target_dir,
	io::ImageBuilder &builder, const Prefs &prefs, QString *image_path,
	Error *err);

}
