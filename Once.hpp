#pragma once

namespace livecopy {

/// A cell that can be assigned exactly once. "Not yet computed" is
/// has_value() == false, never a magic value of T.
template <class T> class Once {
public:
	bool has_value() const { return set_; }
	const T& value() const { return value_; }
	
	bool Set(const T &v)
	{
		if (set_)
			return false;
		value_ = v;
		set_ = true;
		return true;
	}
	
private:
	T value_ = {};
	bool set_ = false;
};

}
