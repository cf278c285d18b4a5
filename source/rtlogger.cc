#include "meta.h"

#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <sys/stat.h>

#include "debug.h"
#include "rtlogger.h"
#include "rtcfg.h"
#include "lockable.h"

#include <iostream>
#include <fstream>
#include <atomic>

using namespace std;

namespace rtv
{
namespace log
{

static ofstream fErr, fStat;
static rtmutex mx;

#ifndef DEBUG
static bool logIsEnabled = false;
#else
static bool logIsEnabled = true;
#endif

static std::atomic<uint64_t> totalIn(0);

uint64_t GetTotalBytesIn()
{
	return totalIn.load();
}

bool open()
{
	lockguard g(mx);

	if(cfg::logdir.empty())
		return true;

	logIsEnabled = true;

	string apath(cfg::logdir+"/rtvfetch.log"), epath(cfg::logdir+"/rtvfetch.err");

	if(0 != mkdir(cfg::logdir.c_str(), cfg::dirperms) && errno != EEXIST)
		return false;

	if(fErr.is_open())
		fErr.close();
	if(fStat.is_open())
		fStat.close();

	fErr.open(epath.c_str(), ios::out | ios::app);
	fStat.open(apath.c_str(), ios::out | ios::app);

	return fStat.is_open() && fErr.is_open();
}

void transfer(uint64_t bytesIn, cmstring& sHost, cmstring& sName, bool bAsError)
{
	totalIn.fetch_add(bytesIn);

	if(!logIsEnabled)
		return;

	lockguard g(mx);

	if(!fStat.is_open())
		return;
	fStat << GetTime() << '|' << char(bAsError ? ERRORRQ : INDATA) << '|' << bytesIn;
	if (cfg::verboselog)
		fStat << '|' << sHost << '|' << sName;
	fStat << '\n'; // not endl, it might flush

	if(cfg::debug & LOG_FLUSH) fStat.flush();
}

void misc(const string & sLine, const char cLogType)
{
	if(!logIsEnabled)
		return;

	lockguard g(mx);
	if(!fStat.is_open())
		return;

	fStat << time(0) << '|' << cLogType << '|' << sLine << '\n';

	if(cfg::debug & LOG_FLUSH)
		fStat.flush();
}

void err(const char *msg)
{
	if(!logIsEnabled)
		return;

	lockguard g(mx);

	if(!fErr.is_open())
	{
#ifdef DEBUG
		cerr << msg <<endl;
#endif
		return;
	}

	char buf[32];
	const time_t tm=time(nullptr);
	ctime_r(&tm, buf);
	buf[24]=0;
	fErr << buf << '|' << msg << '\n';

	if(cfg::debug & log::LOG_DEBUG)
		cerr << buf << '|' << msg <<endl;

	if(cfg::debug & (log::LOG_DEBUG|log::LOG_FLUSH))
		fErr.flush();
}

void flush()
{
	if(!logIsEnabled)
		return;

	lockguard g(mx);
	if(fErr.is_open()) fErr.flush();
	if(fStat.is_open()) fStat.flush();
}

void close(bool bReopen)
{
	{
		lockguard g(mx);
		if(!logIsEnabled)
			return;
		if(cfg::debug & LOG_MORE) cerr << (bReopen ? "Reopening logs...\n" : "Closing logs...\n");
		fErr.close();
		fStat.close();
		logIsEnabled = false;
	}
	if(bReopen)
		log::open();
}

}

#ifdef DEBUG

static struct : public base_with_mutex, public std::map<pthread_t, int>
{} indentPerThread;

t_logger::t_logger(const char *szFuncName,  const void * ptr)
{
	if(!cfg::debug) return;
	m_id = pthread_self();
	m_szName = szFuncName;
	callobj = uintptr_t(ptr);
	{
		lockguard __lockguard(indentPerThread);
		m_nLevel = indentPerThread[m_id]++;
	}
	// writing to the level of parent since it's being "created there"
	GetFmter() << ">> " << szFuncName << " [T:"<< (unsigned long) m_id <<" P:0x"<< tSS::hex<< (unsigned long) callobj << tSS::dec <<"]";
	Write();
	m_nLevel++;
}

t_logger::~t_logger()
{
	if(!cfg::debug) return;
	m_nLevel--;
	GetFmter() << "<< " << m_szName << " [T:"<< (unsigned long) m_id <<" P:0x"<< tSS::hex<< (unsigned long) callobj << tSS::dec <<"]";
	Write();
	lockguard __lockguard(indentPerThread);
	indentPerThread[m_id]--;
	if(0 == indentPerThread[m_id])
		indentPerThread.erase(m_id);
}

tSS & t_logger::GetFmter()
{
	m_strm.clear();
	for(unsigned i=0;i<m_nLevel;i++)
		m_strm << "\t";
	m_strm<< " - ";
	return m_strm;
}

void t_logger::Write(const char *pFile, unsigned int nLine)
{
	if(pFile)
	{
		const char *p=strrchr(pFile, CPATHSEP);
		pFile=p?(p+1):pFile;
		m_strm << " [T:" << (unsigned long) m_id << " S:" << pFile << ":" << tSS::dec << nLine
				<<" P:0x"<< tSS::hex<< (unsigned long) callobj << tSS::dec <<"]";
	}
	log::err(m_strm.c_str());
}

#endif

}
