#pragma once

#include <QString>
#include "types.hxx"

namespace livecopy::prefs {
const QString AppConfigName = QLatin1String("livecopy");
const QString PrefsFileName = QLatin1String("livecopy.conf");

const QString DefaultSystemPartitionLabel = QLatin1String("system");
const QString PersistencePartitionLabel = QLatin1String("live-rw");
const QString DefaultExportImageName = QLatin1String("data.squashfs");

cint UmountMaxAttempts = 10;
ci8 DefaultBusyPollMs = 1000;
ci8 DefaultBusyWaitBudgetMs = 5 * 60 * 1000;

QString GetPrefsFilePath();
QString QueryAppConfigPath();
}
