#include "prefs.hh"

#include <QStandardPaths>

namespace livecopy::prefs {

QString GetPrefsFilePath()
{
	return prefs::QueryAppConfigPath() + '/' + prefs::PrefsFileName;
}

QString QueryAppConfigPath()
{
	static QString dir_path = QString();
	
	if (!dir_path.isEmpty())
		return dir_path;
	
	QString config_path = QStandardPaths::writableLocation(QStandardPaths::ConfigLocation);
	
	if (!config_path.endsWith('/'))
		config_path.append('/');
	
	/// read-only: the dir is not created if missing
	dir_path = config_path + prefs::AppConfigName;
	return dir_path;
}
}
