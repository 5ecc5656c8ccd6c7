#include "ImageBuilder.hpp"

#include "ProcessRunner.hpp"
#include "../Error.hpp"

namespace livecopy::io {

static const QString MksquashfsCmd = QLatin1String("mksquashfs");

ImageBuilder::~ImageBuilder() {}

SquashfsBuilder::SquashfsBuilder(ProcessRunner *runner): runner_(runner) {}
SquashfsBuilder::~SquashfsBuilder() {}

bool SquashfsBuilder::Build(const QString &source_mount_path,
	const QString &target_image_path, Error *err)
{
	QStringList args;
	args << source_mount_path << target_image_path << QLatin1String("-noappend");
	lvc_info("%s %s", qPrintable(MksquashfsCmd), qPrintable(args.join(' ')));
	
	const ExecResult result = runner_->Execute(false, true, MksquashfsCmd, args);
	if (result.exit_code != 0) {
		QString msg = result.started()
			? QLatin1String("exit code ") + QString::number(result.exit_code)
			: result.err;
		if (result.started() && !result.err.isEmpty())
			msg += QLatin1String(": ") + result.err.trimmed();
		lvc_warn("mksquashfs failed: %s", qPrintable(msg));
		Error::Set(err, ErrorKind::ImageBuild, source_mount_path,
			QLatin1String("mksquashfs"), msg);
		return false;
	}
	
	return true;
}

}
