#pragma once

#include "decl.hxx"
#include "err.hpp"
#include "MutexGuard.hpp"

namespace livecopy {

/// Also serves as the cancellation token shared by workers:
/// Cancel() wakes every SleepMs() caller at once.
class CondMutex {
public:
	CondMutex();
	~CondMutex();
	
	mutable pthread_mutex_t mutex = PTHREAD_MUTEX_INITIALIZER;
	mutable pthread_cond_t cond;
	struct Data {
		bool exit = false;
	} data;
	
	inline void Broadcast() {
		pthread_cond_broadcast(&cond);
	}
	
	inline int CondWait() {
		return pthread_cond_wait(&cond, &mutex);
	}
	
	MutexGuard guard() const { return MutexGuard(&mutex); }
	
	void Cancel();
	bool cancelled() const;
	
	/// Returns false if cancelled before or while sleeping.
	bool SleepMs(const i8 ms);
};

class Mutex {
public:
	mutable pthread_mutex_t mutex = PTHREAD_MUTEX_INITIALIZER;
	
	MutexGuard guard() const { return MutexGuard(&mutex); }
};

} // livecopy::
