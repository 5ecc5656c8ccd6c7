#include "io.hh"

#include <dirent.h>
#include <fcntl.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace livecopy::io {

bool CanWriteToDir(const QString &dir_path)
{
	auto ba = dir_path.toLocal8Bit();
	return access(ba.data(), W_OK) == 0;
}

QString DeviceNameFromPath(const QString &path)
{
	int index = path.lastIndexOf('/');
	if (index == -1)
		return path;
	
	return path.mid(index + 1);
}

bool DirExists(const QString &full_path)
{
	auto ba = full_path.toLocal8Bit();
	struct stat st;
	if (stat(ba.data(), &st) != 0)
		return false;
	
	return S_ISDIR(st.st_mode);
}

bool FileExists(const QString &full_path)
{
	auto ba = full_path.toLocal8Bit();
	struct stat st;
	return stat(ba.data(), &st) == 0;
}

QString FloatToString(const float number, const int precision)
{
	QString float_str = QString::number(number, 'f', precision);
	static const auto zeroes = QLatin1String(".0");
	if (float_str.endsWith(zeroes))
		return float_str.mid(0, float_str.size() - zeroes.size());
	
	return float_str;
}

i8 GetFreeSpace(const QString &path, int *ret_error)
{
	auto ba = path.toLocal8Bit();
	struct statvfs stv;
	if (statvfs(ba.data(), &stv) != 0) {
		if (ret_error)
			*ret_error = errno;
		return -1;
	}
	
	return i8(stv.f_bavail) * i8(stv.f_frsize);
}

bool ListFileNames(const QString &full_dir_path, QVector<QString> &vec,
	FilterFunc ff)
{
	struct dirent *entry;
	auto dir_path_ba = full_dir_path.toLocal8Bit();
	DIR *dp = opendir(dir_path_ba.data());
	
	if (dp == NULL)
		return false;
	
	while ((entry = readdir(dp)))
	{
		const char *n = entry->d_name;
		if (strcmp(n, ".") == 0 || strcmp(n, "..") == 0)
			continue;
		
		QString name = QString::fromLocal8Bit(n);
		if (ff && !ff(name))
			continue;
		
		vec.append(name);
	}
	
	closedir(dp);
	
	return true;
}

bool ReadFile(const QString &full_path, QByteArray &buffer, ci8 read_max)
{
	auto path = full_path.toLocal8Bit();
	const int fd = ::open(path.data(), O_RDONLY);
	
	if (fd == -1) {
		lvc_warn("open(): %s: \"%s\"", strerror(errno), path.data());
		return false;
	}
	
	const isize chunk_size = (read_max == -1 || read_max > 4096) ? 4096 : read_max;
	QByteArray chunk(chunk_size, Qt::Uninitialized);
	buffer.clear();
	
	while (true)
	{
		const isize read_chunk = ::read(fd, chunk.data(), chunk_size);
		if (read_chunk == -1)
		{
			if (errno == EAGAIN || errno == EINTR)
				continue;
			lvc_warn("ReadFile: %s", strerror(errno));
			::close(fd);
			return false;
		} else if (read_chunk == 0) {
			/// Zero indicates the end of file, happens with sysfs files.
			break;
		}
		
		buffer.append(chunk.constData(), read_chunk);
		
		if (read_max != -1 && buffer.size() >= read_max)
			break;
	}
	
	::close(fd);
	
	return true;
}

QString SizeToString(const i8 sz)
{
	float rounded;
	QString type;
	if (sz >= io::TiB) {
		rounded = float(sz) / io::TiB;
		type = QLatin1String(" TiB");
	}
	else if (sz >= io::GiB) {
		rounded = float(sz) / io::GiB;
		type = QLatin1String(" GiB");
	} else if (sz >= io::MiB) {
		rounded = float(sz) / io::MiB;
		type = QLatin1String(" MiB");
	} else if (sz >= io::KiB) {
		rounded = float(sz) / io::KiB;
		type = QLatin1String(" KiB");
	} else {
		rounded = sz;
		type = QLatin1String(" bytes");
	}
	
	return io::FloatToString(rounded, 1) + type;
}

}
