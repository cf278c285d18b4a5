#include "debug.h"

#include "rtcfg.h"
#include "meta.h"
#include "rtbuf.h"

#include <iostream>
#include <fstream>
#include <deque>
#include <algorithm>

#ifdef HAVE_GLOB
#include <glob.h>
#endif

using namespace std;

namespace rtv
{

namespace cfg {

struct MapNameToString
{
	string_view name; mstring *ptr;
	uint8_t hidden;	// delicate, not printed by default
};

struct MapNameToInt
{
	string_view name; int *ptr;
	const char *warn; uint8_t base;
	uint8_t hidden;	// just a hint
};

MapNameToString n2sTbl[] = {
		{   "LogDir",                  &logdir, 0}
		,{  "UserAgent",               &agentname, 0}
		,{  "CAfile",                  &cafile, 0}
		,{  "CApath",                  &capath, 0}
		,{  "NetworkTestSites",        &testsites, 0}
};

MapNameToInt n2iTbl[] = {
		{   "Debug",                             &debug,            nullptr,    10, false}
		,{  "OfflineMode",                       &offlinemode,      nullptr,    10, false}
		,{  "VerboseLog",                        &verboselog,       nullptr,    10, false}
		,{  "DirPerms",                          &dirperms,         nullptr,    8, false}
		,{  "RetrievalPoolSize",                 &poolsize,         nullptr,    10, false}
		,{  "RetrievalQueueSize",                &queuesize,        nullptr,    10, false}
		,{  "StaleRequestLimit",                 &stalelimit,       nullptr,    10, false}
		,{  "ConnectTimeout",                    &contimeout,       nullptr,    10, false}
		,{  "ReadTimeout",                       &readtimeout,      nullptr,    10, false}
		,{  "RedirMax",                          &redirmax,         nullptr,    10, false}
		,{  "HostAttemptLimit",                  &attemptlimit,     nullptr,    10, false}
		,{  "HostRetryInterval",                 &retryinterval,    nullptr,    10, false}
		,{  "NetworkCheckInterval",              &netcheckinterval, nullptr,    10, false}
		,{  "NoSSLchecks",                       &nsafriendly,      nullptr,    10, false}
};

#define BARF(msg) throw tStartupException(tSS() << msg)

string * GetStringPtr(string_view key) {
	for(auto &ent : n2sTbl)
		if(scaseequals(key, ent.name))
			return ent.ptr;
	return nullptr;
}

static int * GetIntPtr(string_view key, int &base) {
	for(auto &ent : n2iTbl)
	{
		if (scaseequals(key, ent.name))
		{
			if(ent.warn)
				cerr << "Warning, " << to_string(key) << ": " << ent.warn << endl;
			base = ent.base;
			return ent.ptr;
		}
	}
	return nullptr;
}

int * GetIntPtr(string_view key)
{
	for(auto &ent : n2iTbl)
	{
		if (scaseequals(key, ent.name))
			return ent.ptr;
	}
	return nullptr;
}

tStrVec GetTestSites()
{
	tStrVec ret;
	for(tSplitWalk split(testsites, ", \t"); split.Next();)
		ret.emplace_back(split.str());
	return ret;
}

static tStrDeq ExpandFilePattern(cmstring& pattern)
{
	tStrDeq srcs;
#ifdef HAVE_GLOB
	auto p=glob_t();
	if(0==glob(pattern.c_str(), GLOB_DOOFFS, nullptr, &p))
	{
		for(char **s=p.gl_pathv; s<p.gl_pathv+p.gl_pathc;s++)
			srcs.emplace_back(*s);
		globfree(&p);
	}
	else
		cerr << "Warning: failed to find files for " << pattern <<endl;
#else
	srcs.emplace_back(pattern);
#endif
	return srcs;
}

void dump_config(bool includeDelicate)
{
	ostream &cmine(cout);

	for (auto& n2s : n2sTbl)
	{
		if (!n2s.ptr || (n2s.hidden && !includeDelicate))
			continue;
		cmine << to_string(n2s.name) << " = " << *n2s.ptr << endl;
	}

	for (const auto& n2i : n2iTbl)
		if (n2i.ptr && !n2i.hidden)
			cmine << to_string(n2i.name) << " = " << *n2i.ptr << endl;

#ifndef DEBUG
	if (cfg::debug >= log::LOG_DEBUG)
		cerr << "\n\nAdditional debugging information not compiled in.\n\n";
#endif
}

// information with limited livespan, consumed by Build()
struct tConfigBuilder::tImpl
{
	bool m_bIgnoreErrors, m_bAssertReadableFiles;
	// user parameters, with flag == true for directory
	std::deque<std::pair<std::string,bool>> m_input;

void ParseOptionLine(string_view sLine, string_view &key, string_view &val)
{
	auto posCol = sLine.find(':');
	auto posEq = sLine.find('=');
	if (posEq==stmiss && posCol==stmiss)
	{
		key = val = string_view();
		if(m_bIgnoreErrors)
			return;
		BARF("Not a valid configuration directive: " << sLine);
	}
	string::size_type pos;
	if (posEq!=stmiss && posCol!=stmiss)
		pos=min(posEq,posCol);
	else if (posEq!=stmiss)
		pos=posEq;
	else
		pos=posCol;

	key=sLine.substr(0, pos);
	trimBoth(key);
	val=sLine.substr(pos+1);
	trimBoth(val);

	if(endsWithSzAr(val, "\\"))
		cerr << "Warning: multilines are not supported, consider using \\n." <<endl;
}

void SetOption(string_view sLine)
{
	string_view key, value;

	ParseOptionLine(sLine, key, value);
	if(key.empty())
	{
		if(m_bIgnoreErrors)
			return;
		BARF("Missing option name in: " << sLine);
	}

	string * psTarget;
	int * pnTarget;
	int nNumBase(10);

	if ( nullptr != (psTarget = GetStringPtr(key)))
	{
		*psTarget = to_string(value);
	}
	else if ( nullptr != (pnTarget = GetIntPtr(key, nNumBase)))
	{
		// temp. copy is ok here since a number string is most likely SSOed
		auto temp(to_string(value));
		const char *pStart=temp.c_str();
		if(! *pStart)
			BARF("Missing value for " << key << " option!");
		errno = 0;
		char *pEnd(nullptr);
		long nVal = strtol(pStart, &pEnd, nNumBase);
		if (errno)
			BARF("Invalid number for " << key << ":" << tErrnoFmter());

		if (RESERVED_DEFVAL == nVal)
			BARF("Bad value for " << key << " (protected value, use another one)");

		if (*pEnd)
			BARF("Bad value for " << key << " option or found trailing garbage: " << pEnd);

		if (nVal > MAX_VAL(int) || nVal < MIN_VAL(int))
			BARF("Value out of range for " << key << ": " << temp);

		*pnTarget=nVal;
	}
	else
	{
		if(!m_bIgnoreErrors)
			BARF("Warning, unknown configuration directive: " << key);
	}
}

void ReadOneConfFile(const string & szFilename)
{
	ifstream reader(szFilename);
	if(!reader.is_open())
	{
		if(!m_bAssertReadableFiles)
			return;
		BARF("Cannot read " << szFilename);
	}

	string sLine;
	unsigned nLine = 0;
	while(getline(reader, sLine))
	{
		nLine++;
		tStrPos pos=sLine.find('#');
		if(stmiss != pos)
			sLine.erase(pos);
		trimBoth(sLine);
		if(sLine.empty())
			continue;
		try
		{
			SetOption(sLine);
		}
		catch(const tStartupException& ex)
		{
			BARF(ex.what() << " (at " << szFilename << ":" << nLine << ")");
		}
	}
}

void ReadConfigDirectory(cmstring& sPath)
{
	char buf[PATH_MAX];
	if(!realpath(sPath.c_str(), buf))
	{
		if(!m_bAssertReadableFiles)
			return;
		BARF("Failed to open config directory " << sPath);
	}

	confdir=buf; // pickup the last config directory

	for(const auto& src: ExpandFilePattern(confdir+SZPATHSEP "*.conf"))
		ReadOneConfFile(src);
}

void Build()
{
	for(const auto& inputThing: m_input)
	{
		if(inputThing.second)
			ReadConfigDirectory(inputThing.first);
		else
			SetOption(inputThing.first);
	}

	if(poolsize < 1)
		BARF("RetrievalPoolSize must be at least 1");
	if(queuesize < 1)
		BARF("RetrievalQueueSize must be at least 1");
	if(contimeout <= 0 || readtimeout <= 0)
		BARF("unspecified timeout");
	if(attemptlimit < 1)
		BARF("HostAttemptLimit must be at least 1");
	if(retryinterval < 0)
		BARF("HostRetryInterval must not be negative");
	if(netcheckinterval < 0)
		BARF("NetworkCheckInterval must not be negative");

	if(redirmax == RESERVED_DEFVAL || redirmax < 0)
		redirmax = REDIRMAX_DEFAULT;

	if(!logdir.empty())
	{
		while(logdir.length() > 1 && endsWithSzAr(logdir, SZPATHSEP))
			logdir.resize(logdir.length() - 1);
	}

	agentheader = agentname.empty()
			? mstring("rtvfetch/" RTVERSION)
			: agentname;
}

}; // tConfigBuilder::tImpl

tConfigBuilder::tConfigBuilder(bool ignoreAllErrors, bool ignoreFileReadErrors)
{
	m_pImpl = new tImpl();
	m_pImpl->m_bIgnoreErrors = ignoreAllErrors;
	m_pImpl->m_bAssertReadableFiles = !ignoreFileReadErrors;
}

tConfigBuilder::~tConfigBuilder()
{
	delete m_pImpl;
}

tConfigBuilder& tConfigBuilder::AddOption(const mstring &line)
{
	m_pImpl->m_input.emplace_back(make_pair(line, false));
	return *this;
}

tConfigBuilder& tConfigBuilder::AddConfigDirectory(cmstring &sDirName)
{
	m_pImpl->m_input.emplace_back(make_pair(sDirName, true));
	return *this;
}

void tConfigBuilder::Build()
{
	m_pImpl->Build();
}

} // namespace cfg
}
