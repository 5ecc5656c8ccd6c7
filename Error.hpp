#pragma once

#include "decl.hxx"

#include <QString>

namespace livecopy {

enum class ErrorKind: i1 {
	None = 0,
	DeviceQuery,
	Measurement,
	UnmountExhausted,
	Target,
	ImageBuild,
};

struct Error {
	ErrorKind kind = ErrorKind::None;
	QString device;
	QString op;
	QString message;
	
	bool ok() const { return kind == ErrorKind::None; }
	void Clear() { *this = Error(); }
	QString toString() const;
	
	static void Set(Error *err, const ErrorKind kind, const QString &device,
		const QString &op, const QString &message);
};

const char* ErrorKindToString(const ErrorKind kind);

}
Q_DECLARE_METATYPE(livecopy::Error);
