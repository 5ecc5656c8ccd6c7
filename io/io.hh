#pragma once

#include "decl.hxx"
#include "../decl.hxx"
#include "../err.hpp"

#include <functional>

#include <QByteArray>
#include <QString>
#include <QVector>

namespace livecopy::io {

using FilterFunc = std::function<bool (const QString &name)>;

bool CanWriteToDir(const QString &dir_path);

/// "/dev/sdb", "/org/freedesktop/UDisks2/block_devices/sdb", "sdb" -> "sdb"
QString DeviceNameFromPath(const QString &path);

bool DirExists(const QString &full_path);

bool FileExists(const QString &full_path);

QString FloatToString(const float number, const int precision);

/// Space available to unprivileged users, -1 on error.
i8 GetFreeSpace(const QString &path, int *ret_error = nullptr);

bool ListFileNames(const QString &full_dir_path, QVector<QString> &vec,
	FilterFunc ff = nullptr);

bool ReadFile(const QString &full_path, QByteArray &buffer, ci8 read_max = -1);

QString SizeToString(const i8 sz);

}
