#pragma once

#include <QTest>

class PrefsTest: public QObject
{
	Q_OBJECT
	
private Q_SLOTS:
	void defaults();
	void loadFile();
	void missingFile();
	void badLines();
	void configPath();
};
