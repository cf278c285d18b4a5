
#ifndef _RTCFG_H
#define _RTCFG_H

#include "config.h"
#include "meta.h"

namespace rtv
{

namespace cfg
{

/**
 * Configuration builder class which collects all parameters and eventually compiles the config.
 */
class RTV_API tConfigBuilder
{
	struct tImpl;
	tImpl *m_pImpl;

public:

	tConfigBuilder(bool ignoreAllErrors, bool ignoreFileReadErrors);
	~tConfigBuilder();

	tConfigBuilder& AddOption(const mstring &line);
	tConfigBuilder& AddConfigDirectory(cmstring& sDirName);
	//! Applies the collected input in order, then checks the combination of values
	void Build();
};

static const int RESERVED_DEFVAL = -4223;

static const int REDIRMAX_DEFAULT = 5;

extern RTV_API mstring logdir, confdir, agentname, cafile, capath, testsites;

extern RTV_API int debug, offlinemode, verboselog, dirperms, poolsize, queuesize, stalelimit,
contimeout, readtimeout, redirmax, attemptlimit, retryinterval, netcheckinterval, nsafriendly;

//! value for the User-Agent header
extern RTV_API mstring agentheader;

void RTV_API dump_config(bool includingDelicateValues=false);

//! Comma or space separated list from NetworkTestSites
tStrVec RTV_API GetTestSites();

mstring * GetStringPtr(string_view key);
int * GetIntPtr(string_view key);

//! Restores all option values to the built-in defaults
void RTV_API ResetDefaults();

} // namespace cfg

}

#endif
