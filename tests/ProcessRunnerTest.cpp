#include "ProcessRunnerTest.hpp"

#include "../io/ProcessRunner.hpp"

using namespace livecopy;

void ProcessRunnerTest::capturesOutputAndExitCode()
{
	io::QtProcessRunner runner;
	const io::ExecResult result = runner.Execute("sh",
		{ "-c", "echo out; echo err >&2; exit 3" });
	
	QVERIFY(result.started());
	QCOMPARE(result.exit_code, 3);
	QCOMPARE(result.out, QString("out\n"));
	QCOMPARE(result.err, QString("err\n"));
}

void ProcessRunnerTest::runsInCLocale()
{
	io::QtProcessRunner runner;
	const io::ExecResult result = runner.Execute("sh", { "-c", "echo $LC_ALL" });
	
	QCOMPARE(result.exit_code, 0);
	QCOMPARE(result.out.trimmed(), QString("C"));
}

void ProcessRunnerTest::discardsUncapturedOutput()
{
	io::QtProcessRunner runner;
	const io::ExecResult result = runner.Execute(false, true, "sh",
		{ "-c", "echo out; echo err >&2" });
	
	QCOMPARE(result.exit_code, 0);
	QVERIFY(result.out.isEmpty());
	QCOMPARE(result.err, QString("err\n"));
}

void ProcessRunnerTest::missingProgram()
{
	io::QtProcessRunner runner;
	const io::ExecResult result = runner.Execute("/nonexistent/livecopy-helper", {});
	
	QVERIFY(!result.started());
	QCOMPARE(result.exit_code, -1);
	QVERIFY(!result.err.isEmpty());
}

QTEST_GUILESS_MAIN(ProcessRunnerTest)
