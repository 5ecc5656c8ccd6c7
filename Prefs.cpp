#include "Prefs.hpp"

#include "io/io.hh"

namespace livecopy {

static bool ParseBool(const QString &s, bool &ret)
{
	const QString v = s.toLower();
	if (v == QLatin1String("true") || v == QLatin1String("yes") || v == QLatin1String("1")) {
		ret = true;
		return true;
	}
	if (v == QLatin1String("false") || v == QLatin1String("no") || v == QLatin1String("0")) {
		ret = false;
		return true;
	}
	return false;
}

Prefs::Prefs() {}
Prefs::~Prefs() {}

bool Prefs::Load(const QString &full_path)
{
	if (!io::FileExists(full_path))
		return true;
	
	QByteArray ba;
	if (!io::ReadFile(full_path, ba)) {
		lvc_printq2("Can't read prefs file: ", full_path);
		return false;
	}
	
	const QString data = QString::fromUtf8(ba);
	const auto lines = data.split('\n');
	bool ok = true;
	for (const QString &next: lines)
	{
		if (!ParseLine(next))
			ok = false;
	}
	
	return ok;
}

bool Prefs::ParseLine(const QString &line)
{
	QString s = line;
	cint hash = s.indexOf('#');
	if (hash != -1)
		s.truncate(hash);
	s = s.trimmed();
	if (s.isEmpty())
		return true;
	
	cint eq = s.indexOf('=');
	if (eq == -1) {
		lvc_printq2("Prefs: no '=' in line: ", line);
		return false;
	}
	
	const QString key = s.left(eq).trimmed();
	const QString value = s.mid(eq + 1).trimmed();
	
	if (key == QLatin1String("system_partition_label")) {
		LVC_CHECK(!value.isEmpty());
		system_partition_label_ = value;
	} else if (key == QLatin1String("show_hard_disks")) {
		bool b;
		LVC_CHECK(ParseBool(value, b));
		show_hard_disks(b);
	} else if (key == QLatin1String("busy_poll_ms")) {
		bool ok;
		ci8 n = value.toLongLong(&ok);
		LVC_CHECK(ok && n > 0);
		busy_poll_ms_ = n;
	} else if (key == QLatin1String("busy_wait_budget_ms")) {
		bool ok;
		ci8 n = value.toLongLong(&ok);
		LVC_CHECK(ok && n >= 0);
		busy_wait_budget_ms_ = n;
	} else if (key == QLatin1String("export_image_name")) {
		LVC_CHECK(!value.isEmpty() && !value.contains('/'));
		export_image_name_ = value;
	} else {
		lvc_printq2("Prefs: ignoring unknown key ", key);
	}
	
	return true;
}

}
