#pragma once

#include "Fakes.hpp"
#include "../Prefs.hpp"

#include <QTemporaryDir>
#include <QTest>

class ExportTest: public QObject
{
	Q_OBJECT
	
private Q_SLOTS:
	void init();
	void cleanup();
	
	void checkTarget();
	void missingTarget();
	void readOnlyTarget();
	void exportBuildsImage();
	void exportOfMountedPartition();
	void builderFailure();
	void squashfsCommandLine();
	void squashfsFailure();
	
private:
	livecopy::Services services();
	
	livecopy::tests::FakeDeviceService *service_ = nullptr;
	livecopy::tests::FakeProcessRunner *runner_ = nullptr;
	livecopy::tests::FakeImageBuilder *builder_ = nullptr;
	livecopy::Prefs prefs_;
	QTemporaryDir *source_ = nullptr;
	QTemporaryDir *target_ = nullptr;
};
