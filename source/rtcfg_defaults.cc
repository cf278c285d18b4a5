// some variable instances with default values
// shared among different applications

#include "config.h"
#include "meta.h"
#include "rtcfg.h"

using namespace std;

namespace rtv
{
namespace cfg
{

string RTV_API logdir, confdir, agentname, cafile, capath("/etc/ssl/certs"), testsites,
agentheader;

int RTV_API debug(0), offlinemode(0), verboselog(1), dirperms(00755),
poolsize(8), queuesize(1024), stalelimit(30000),
contimeout(8000), readtimeout(5000), redirmax(REDIRMAX_DEFAULT),
attemptlimit(8), retryinterval(120), netcheckinterval(10000),
nsafriendly(0);

void ResetDefaults()
{
	logdir.clear();
	confdir.clear();
	agentname.clear();
	cafile.clear();
	capath = "/etc/ssl/certs";
	testsites.clear();
	agentheader.clear();
	debug = offlinemode = nsafriendly = 0;
	verboselog = 1;
	dirperms = 00755;
	poolsize = 8;
	queuesize = 1024;
	stalelimit = 30000;
	contimeout = 8000;
	readtimeout = 5000;
	redirmax = REDIRMAX_DEFAULT;
	attemptlimit = 8;
	retryinterval = 120;
	netcheckinterval = 10000;
}

} // namespace cfg
}
