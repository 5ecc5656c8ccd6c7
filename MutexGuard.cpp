#include "MutexGuard.hpp"

namespace livecopy {

MutexGuard::MutexGuard(pthread_mutex_t *mutex, const LockType lock_type):
mutex_(mutex)
{
	switch(lock_type) {
	case LockType::Normal:
	{
		const int status = pthread_mutex_lock(mutex_);
		if (status != 0) {
			lvc_status(status);
			mutex_ = nullptr;
		}
		break;
	}
	case LockType::TryLock: {
		const int status = pthread_mutex_trylock(mutex_);
		if (status != 0)
			mutex_ = nullptr;
		break;
	}
	default: {
		lvc_trace();
	}
	}
}

MutexGuard::~MutexGuard()
{
	if (mutex_ != nullptr)
	{
		const int status = pthread_mutex_unlock(mutex_);
		if (status != 0)
			lvc_status(status);
	}
}

}
