#ifndef _INTERRUPT_H
#define _INTERRUPT_H

#include "config.h"
#include <atomic>

namespace rtv
{

// cancellation flag of the retrieval which runs on the current thread
namespace interrupt
{

/**
 * Binds a flag to the current thread for the lifetime of the object.
 * Blocking I/O helpers poll it while waiting.
 */
class RTV_API tScope
{
	const std::atomic_bool *m_prev;
public:
	explicit tScope(const std::atomic_bool& flag);
	~tScope();
	tScope(const tScope&) = delete;
	tScope& operator=(const tScope&) = delete;
};

//! true if a flag is bound to this thread and was raised
bool RTV_API IsRequested();

//! throws tInterruptedException if IsRequested()
void RTV_API Check();

//! upper limit for a single blocking wait between two checks, in milliseconds
static const int POLL_SLICE_MS = 100;

}

}

#endif
