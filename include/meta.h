#ifndef _META_H
#define _META_H

#include "config.h"

#if defined(_POSIX_C_SOURCE) && (_POSIX_C_SOURCE < 200112L)
#undef _POSIX_C_SOURCE
#endif
#ifndef _POSIX_C_SOURCE
#define _POSIX_C_SOURCE 200112L
#endif

#include <string>
#include <map>
#include <unordered_map>
#include <set>
#include <vector>
#include <deque>
#include <limits>
#include <cstdio>
#include <ctime>
#include <cstring>
#include <functional>
#include <atomic>
#include <stdexcept>

#include <fcntl.h>
#include <pthread.h>
#include <strings.h>
#include <cstdlib>
#include <errno.h>

#include "astrop.h"

namespace rtv
{

class rtbuf;

typedef std::string mstring;
typedef const std::string cmstring;

typedef std::vector<mstring> tStrVec;
typedef std::deque<mstring> tStrDeq;
typedef mstring::size_type tStrPos;
const static tStrPos stmiss(cmstring::npos);
typedef const char * LPCSTR;
//! raw payload of a retrieval
typedef std::vector<uint8_t> tBytes;

#define SZPATHSEP "/"
#define CPATHSEP '/'

extern RTV_API cmstring sEmptyString;
extern std::string sDefPortHTTP, sDefPortHTTPS;
extern cmstring PROT_PFX_HTTPS, PROT_PFX_HTTP;

#ifndef _countof
#define _countof(x) sizeof(x)/sizeof(x[0])
#endif

#define WITHLEN(x) x, (_countof(x)-1)

#define MIN_VAL(x) (std::numeric_limits< x >::min())
#define MAX_VAL(x) (std::numeric_limits< x >::max())

#define StrHas(haystack, needle) (haystack.find(needle) != stmiss)

struct RTV_API tHostPortProto
{
protected:
	mstring sPort;
public:
	mstring sHost;
	bool bSSL=false;
	inline cmstring& GetDefaultPortForProto() const {
		return bSSL ? sDefPortHTTPS : sDefPortHTTP;
	}
	inline cmstring& GetPort() const { return !sPort.empty() ? sPort : GetDefaultPortForProto(); }
	bool operator==(const tHostPortProto& other) const
	{
		return other.sPort == sPort && other.sHost == sHost && other.bSSL == bSSL;
	}
	tHostPortProto(cmstring &h, cmstring &port, bool bSsl) : sPort(port), sHost(h), bSSL(bSsl)
	{
	}
	tHostPortProto() =default;
};

class RTV_API tHttpUrl : public tHostPortProto
{
public:
	using tHostPortProto::tHostPortProto; // ctor

	mstring sPath;
	//! accepts http:// and https:// URLs only, the path keeps query strings
	bool SetHttpUrl(string_view uri);
	mstring ToURI() const;

	inline cmstring & GetProtoPrefix() const
	{
		return bSSL ? PROT_PFX_HTTPS : PROT_PFX_HTTP;
	}
	//! value for the Host header, port only when not default
	mstring GetHostHeader() const;
	inline void clear()
	{
		sHost.clear();
		sPort.clear();
		sPath.clear();
		bSSL = false;
	}
};


// STFU helpers, (void) casts are not effective for certain functions
static inline void ignore_value (int i) { (void) i; }

static inline time_t GetTime()
{
	return ::time(0);
}

//! wall clock time in milliseconds since the epoch
RTV_API int64_t GetTimeMs();

struct RTV_API tErrnoFmter: public mstring
{
	tErrnoFmter(LPCSTR prefix = nullptr);
	tErrnoFmter(LPCSTR prefix, int ec);
};

void set_nb(int fd);

// dirty little RAII helper
struct tDtorEx {
	std::function<void(void)> _action;
	inline tDtorEx(decltype(_action) action) : _action(action) {}
	inline ~tDtorEx() { _action(); }
};

// mostly unique_ptr semantics for a non-pointer type with preserved invalid value, using a custom disposer function which is defined as static template parameter
template<typename T, void TDisposeFunction(T), T inval_default>
struct resource_owner
{
	T m_p;
	resource_owner() : m_p(inval_default) {}
	explicit resource_owner(T xp) : m_p(xp) {}
	~resource_owner() { reset(); };
	T release() { auto ret=m_p; m_p = inval_default; return ret;}
	T get() const { return m_p; }
	T operator*() const { return m_p; }
	resource_owner(const resource_owner&) = delete;
	resource_owner& operator=(const resource_owner&) = delete;
	resource_owner(resource_owner && other) : m_p(other.release())
	{
	}
	resource_owner& operator=(resource_owner && other)
	{
		if (&other != this)
			reset(other.release());
		return *this;
	}
	resource_owner& reset(T xnew = inval_default)
	{
		if (xnew == m_p)
			return *this;
		if (m_p != inval_default)
			TDisposeFunction(m_p);
		m_p = xnew;
		return *this;
	}
	bool valid() const { return inval_default != m_p;}
};

void justforceclose(int);
using unique_fd = resource_owner<int, justforceclose, -1>;

class tStartupException : public std::runtime_error
{
public:
	tStartupException(const std::string& s) : std::runtime_error(s)
	{
	}
};

}

#endif // _META_H
