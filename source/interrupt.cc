#include "interrupt.h"
#include "rterror.h"

namespace rtv
{
namespace interrupt
{

static thread_local const std::atomic_bool *g_flag = nullptr;

tScope::tScope(const std::atomic_bool& flag) : m_prev(g_flag)
{
	g_flag = &flag;
}

tScope::~tScope()
{
	g_flag = m_prev;
}

bool IsRequested()
{
	return g_flag && g_flag->load();
}

void Check()
{
	if(IsRequested())
		throw tInterruptedException();
}

}
}
