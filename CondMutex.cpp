#include "CondMutex.hpp"

#include <time.h>

namespace livecopy {

CondMutex::CondMutex()
{
	pthread_condattr_t attr;
	pthread_condattr_init(&attr);
	/// timed waits must not jump with wall clock changes
	pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
	cint status = pthread_cond_init(&cond, &attr);
	if (status != 0)
		lvc_status(status);
	pthread_condattr_destroy(&attr);
}

CondMutex::~CondMutex()
{
	pthread_cond_destroy(&cond);
}

void CondMutex::Cancel()
{
	auto g = guard();
	data.exit = true;
	Broadcast();
}

bool CondMutex::cancelled() const
{
	auto g = guard();
	return data.exit;
}

bool CondMutex::SleepMs(const i8 ms)
{
	struct timespec deadline;
	if (clock_gettime(CLOCK_MONOTONIC, &deadline) != 0) {
		lvc_errno();
		return false;
	}
	
	deadline.tv_sec += ms / 1000;
	deadline.tv_nsec += (ms % 1000) * 1000000L;
	if (deadline.tv_nsec >= 1000000000L) {
		deadline.tv_sec++;
		deadline.tv_nsec -= 1000000000L;
	}
	
	auto g = guard();
	while (!data.exit)
	{
		cint status = pthread_cond_timedwait(&cond, &mutex, &deadline);
		if (status == ETIMEDOUT)
			break;
		if (status != 0 && status != EINTR) {
			lvc_status(status);
			break;
		}
	}
	
	return !data.exit;
}

}
