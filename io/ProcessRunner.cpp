#include "ProcessRunner.hpp"

#include <QProcess>
#include <QProcessEnvironment>

#include <csignal>

namespace livecopy::io {

ProcessRunner::~ProcessRunner() {}

QtProcessRunner::QtProcessRunner() {}
QtProcessRunner::~QtProcessRunner() {}

ExecResult QtProcessRunner::Execute(cbool capture_out, cbool capture_err,
	const QString &program, const QStringList &args)
{
	ExecResult result;
	QProcess process;
	{ /// output of du, fuser etc. gets parsed, keep it in the C locale
		auto env = QProcessEnvironment::systemEnvironment();
		env.insert(QLatin1String("LC_ALL"), QLatin1String("C"));
		process.setProcessEnvironment(env);
	}
	
	if (!capture_out)
		process.setStandardOutputFile(QProcess::nullDevice());
	if (!capture_err)
		process.setStandardErrorFile(QProcess::nullDevice());
	
	process.start(program, args);
	
	if (!process.waitForStarted(-1)) {
		result.err = process.errorString();
		lvc_warn("Failed to start %s: %s", qPrintable(program), qPrintable(result.err));
		return result;
	}
	
	if (!process.waitForFinished(-1)) {
		result.err = process.errorString();
		lvc_warn("%s didn't finish: %s", qPrintable(program), qPrintable(result.err));
		return result;
	}
	
	if (capture_out)
		result.out = QString::fromLocal8Bit(process.readAllStandardOutput());
	if (capture_err)
		result.err = QString::fromLocal8Bit(process.readAllStandardError());
	
	if (process.exitStatus() == QProcess::CrashExit) {
		lvc_warn("%s crashed", qPrintable(program));
		result.exit_code = 128 + SIGABRT;
	} else {
		result.exit_code = process.exitCode();
	}
	
	return result;
}

}
