#pragma once

#include "err.hpp"
#include <pthread.h>

namespace livecopy {

enum class LockType: i1 {
	Normal,
	TryLock
};

class MutexGuard {
public:
	MutexGuard(pthread_mutex_t *mutex, const LockType lock_type = LockType::Normal);
	MutexGuard(MutexGuard &&rhs): mutex_(rhs.mutex_) { rhs.mutex_ = nullptr; }
	virtual ~MutexGuard();
	
	bool locked() const { return mutex_ != nullptr; }
	
private:
	MutexGuard(const MutexGuard&) = delete;
	void operator=(const MutexGuard&) = delete;
	
	pthread_mutex_t *mutex_ = nullptr;
};

}
