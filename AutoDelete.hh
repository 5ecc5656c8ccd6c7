#pragma once

#include <libudev.h>

namespace livecopy {

/// Drops one libudev reference when going out of scope.
template <class T, T* (*Unref)(T*)> class UdevRef {
public:
	UdevRef(T *p): p_(p) {}
	~UdevRef() {
		if (p_)
			Unref(p_);
	}
	
	UdevRef(const UdevRef&) = delete;
	void operator=(const UdevRef&) = delete;
	
private:
	T *p_ = nullptr;
};

using UdevAutoUnref = UdevRef<struct udev, udev_unref>;
using UdevDeviceAutoUnref = UdevRef<struct udev_device, udev_device_unref>;
using UdevEnumerateAutoUnref = UdevRef<struct udev_enumerate, udev_enumerate_unref>;
using UdevMonitorAutoUnref = UdevRef<struct udev_monitor, udev_monitor_unref>;

/// Deletes the thread args once the worker returns.
template <class A_Type> class AutoDelete {
public:
	AutoDelete(A_Type x) : x_(x) {}
	virtual ~AutoDelete() { delete x_; }
	
private:
	A_Type x_ = nullptr;
};

}
