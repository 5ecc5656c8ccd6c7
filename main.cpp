#include "DeviceManager.hpp"
#include "Prefs.hpp"
#include "io/disks.hh"
#include "io/ImageBuilder.hpp"
#include "io/io.hh"
#include "io/ProcessRunner.hpp"

#include <QCoreApplication>

static void PrintSnapshot(const livecopy::DeviceSnapshot &snapshot)
{
	lvc_info("%d device(s):", int(snapshot.size()));
	for (const livecopy::DeviceSummary &ds: snapshot)
	{
		printf("  [%s] %s\n", livecopy::DeviceKindToString(ds.kind), qPrintable(ds.text));
		for (const livecopy::PartitionSummary &ps: ds.partitions)
		{
			QString usable;
			if (ps.usable_space != -1)
				usable = QLatin1String(", usable: ") + livecopy::io::SizeToString(ps.usable_space);
			printf("    %s%s\n", qPrintable(ps.text), qPrintable(usable));
		}
	}
}

int main(int argc, char *argv[])
{
	QCoreApplication qapp(argc, argv);
	
	livecopy::Prefs prefs;
	if (!prefs.Load())
		lvc_warn("Some lines of %s were ignored", qPrintable(livecopy::prefs::GetPrefsFilePath()));
	
	auto *runner = new livecopy::io::QtProcessRunner();
	livecopy::DeviceManager manager(prefs, new livecopy::io::UDisksService(),
		runner, new livecopy::io::SquashfsBuilder(runner));
	
	QObject::connect(&manager, &livecopy::DeviceManager::DevicesChanged, PrintSnapshot);
	QObject::connect(&qapp, &QCoreApplication::aboutToQuit, [&manager]() {
		manager.Stop();
	});
	
	if (!manager.Start())
		return 1;
	
	cint app_status = qapp.exec();
	if (app_status != 0) {
		lvc_status(app_status);
	}
	
	return app_status;
}
