#include "Error.hpp"

namespace livecopy {

const char* ErrorKindToString(const ErrorKind kind)
{
	switch (kind) {
	case ErrorKind::None: return "None";
	case ErrorKind::DeviceQuery: return "DeviceQuery";
	case ErrorKind::Measurement: return "Measurement";
	case ErrorKind::UnmountExhausted: return "UnmountExhausted";
	case ErrorKind::Target: return "Target";
	case ErrorKind::ImageBuild: return "ImageBuild";
	}
	
	return "?";
}

void Error::Set(Error *err, const ErrorKind kind, const QString &device,
	const QString &op, const QString &message)
{
	if (err == nullptr)
		return;
	err->kind = kind;
	err->device = device;
	err->op = op;
	err->message = message;
}

QString Error::toString() const
{
	if (ok())
		return QString();
	
	QString s = QLatin1String(ErrorKindToString(kind));
	if (!device.isEmpty())
		s += QLatin1String(" on ") + device;
	if (!op.isEmpty())
		s += QLatin1String(" (") + op + ')';
	if (!message.isEmpty())
		s += QLatin1String(": ") + message;
	
	return s;
}

}
