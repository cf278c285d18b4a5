
#ifndef __DEBUG_H__
#define __DEBUG_H__

#include "rtcfg.h"
#include "rtlogger.h"
#include "meta.h"

#ifdef DEBUG
#include <assert.h>
#endif

namespace rtv
{

#ifdef DEBUG
#define ASSERT(x) assert(x)
#else
#define ASSERT(x)
#endif

#ifndef DEBUG
#define ldbg(x)
#define dbgline
#define LOG(x)
#define LOGSTARTFUNC
#define LOGSTARTFUNCs
#define LOGSTARTFUNCx(...)
#define LOGSTART(x)
#define LOGSTARTx(x, ...)
#define LOGSTARTs(x)
#define DBGQLOG(x)
#define LOGRET(x) return x;

#else

#define __RTFUNC__ __func__

#define LOGVA(n, pfx, ...) if(rtv::cfg::debug & n) \
		{ auto&f=__logobj.GetFmter(); f << pfx; tSS::Chain(f, ", ", __VA_ARGS__); \
			__logobj.Write(__FILE__, __LINE__); }

#define LOGAPP(n, pfx, x) if(rtv::cfg::debug&n){ __logobj.GetFmter() << pfx << x; __logobj.Write(__FILE__, __LINE__); }

#define LOG(what) LOGAPP(log::LOG_DEBUG, "- ", what)

#define LOGSTART(x) t_logger __logobj(x, this);
#define LOGSTARTs(x) t_logger __logobj(x, nullptr);
#define LOGSTARTx(nam, ...) LOGSTART(nam); LOGVA(log::LOG_DEBUG, "PARMS: ", __VA_ARGS__);
#define LOGRET(x) { __logobj.GetFmter() << " --> " << x; __logobj.Write(__FILE__, __LINE__); return x; }

#define LOGSTARTFUNC LOGSTART(__RTFUNC__)
#define LOGSTARTFUNCs LOGSTARTs(__RTFUNC__)
#define LOGSTARTFUNCx(...) LOGSTARTx(__RTFUNC__, __VA_ARGS__)

#define ldbg(x) LOG(x)

#define dbgline ldbg("mark")
#define DBGQLOG(x) {log::err(tSS()<< x);}

#endif

}

#endif // __DEBUG_H__
