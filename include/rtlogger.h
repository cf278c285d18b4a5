#ifndef _RTLOGGER_H
#define _RTLOGGER_H

#include "config.h"
#include "meta.h"
#include "rtbuf.h"

namespace rtv
{

#ifdef DEBUG

struct t_logger
{
	t_logger(const char *szFuncName, const void * ptr); // starts the logger, shifts stack depth
	~t_logger();
	tSS & GetFmter();
	void Write(const char *pFile = nullptr, unsigned int nLine = 0);
private:
	tSS m_strm;
	pthread_t m_id;
	unsigned int m_nLevel;
	const char * m_szName;
	uintptr_t callobj;
	// don't copy
	t_logger(const t_logger&);
	t_logger operator=(const t_logger&);
};
#endif

// extra notes when the user asks for debug output, also in non-debug builds
#define USRDBG(msg) { if(rtv::cfg::debug & rtv::log::LOG_DEBUG) {rtv::log::err( rtv::tSS()<<msg); } }

namespace log
{

enum ELogFlags
	: uint8_t
	{
		LOG_FLUSH = 1, LOG_MORE = 2, LOG_DEBUG = 4
};

//! type markers of the transfer log
enum ELineType
	: char
	{
		INDATA = 'I', ERRORRQ = 'E', MISC = 'M', FAILNOTE = 'F'
};

// access internal counters
uint64_t GetTotalBytesIn();

bool RTV_API open();
void RTV_API close(bool bReopen);
void RTV_API transfer(uint64_t bytesIn, cmstring& sHost, cmstring& sName, bool bAsError);
void RTV_API err(const char *msg);
void RTV_API misc(const mstring & sLine, const char cLogType = MISC);
inline void err(cmstring &msg)
{
	err(msg.c_str());
}
inline void err(const tSS& msg)
{
	err(msg.c_str());
}
void RTV_API flush();

}

}

#endif
