#pragma once

#include "decl.hxx"
#include "prefs.hh"

namespace livecopy {

class Prefs {
	static const u8 ShowHardDisks = 1u << 0;
public:
	Prefs();
	virtual ~Prefs();
	
	static Prefs Defaults() { return Prefs(); }
	
	/// Missing file is not an error, defaults stay in place.
	bool Load(const QString &full_path);
	bool Load() { return Load(prefs::GetPrefsFilePath()); }
	bool ParseLine(const QString &line);
	
	inline void toggle_bool(const bool b, cu8 flag) {
		if (b)
			bool_ |= flag;
		else
			bool_ &= ~flag;
	}
	
	bool show_hard_disks() const { return bool_ & ShowHardDisks; }
	void show_hard_disks(bool b) { toggle_bool(b, ShowHardDisks); }
	
	const QString& system_partition_label() const { return system_partition_label_; }
	void system_partition_label(const QString &s) { system_partition_label_ = s; }
	
	i8 busy_poll_ms() const { return busy_poll_ms_; }
	void busy_poll_ms(ci8 n) { busy_poll_ms_ = n; }
	
	i8 busy_wait_budget_ms() const { return busy_wait_budget_ms_; }
	void busy_wait_budget_ms(ci8 n) { busy_wait_budget_ms_ = n; }
	
	const QString& export_image_name() const { return export_image_name_; }
	void export_image_name(const QString &s) { export_image_name_ = s; }
	
private:
	u8 bool_ = 0;
	QString system_partition_label_ = prefs::DefaultSystemPartitionLabel;
	QString export_image_name_ = prefs::DefaultExportImageName;
	i8 busy_poll_ms_ = prefs::DefaultBusyPollMs;
	/// 0 means unbounded
	i8 busy_wait_budget_ms_ = prefs::DefaultBusyWaitBudgetMs;
};

}
