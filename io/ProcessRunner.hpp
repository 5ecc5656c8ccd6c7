#pragma once

#include "decl.hxx"

#include <QStringList>

namespace livecopy::io {

class ProcessRunner {
public:
	virtual ~ProcessRunner();
	
	/// Synchronous. A program that could not be started yields
	/// exit_code == -1 and the reason in ExecResult::err.
	virtual ExecResult Execute(cbool capture_out, cbool capture_err,
		const QString &program, const QStringList &args) = 0;
	
	ExecResult Execute(const QString &program, const QStringList &args) {
		return Execute(true, true, program, args);
	}
};

class QtProcessRunner: public ProcessRunner {
public:
	QtProcessRunner();
	virtual ~QtProcessRunner();
	
	using ProcessRunner::Execute;
	ExecResult Execute(cbool capture_out, cbool capture_err,
		const QString &program, const QStringList &args) override;
};

}
