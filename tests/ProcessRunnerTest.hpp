#pragma once

#include <QTest>

class ProcessRunnerTest: public QObject
{
	Q_OBJECT
	
private Q_SLOTS:
	void capturesOutputAndExitCode();
	void runsInCLocale();
	void discardsUncapturedOutput();
	void missingProgram();
};
