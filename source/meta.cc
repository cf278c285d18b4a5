#include "debug.h"

#include "meta.h"
#include <unistd.h>
#include <cstring>
#include <cstdio>
#include <sys/time.h>

using namespace std;

namespace rtv
{
cmstring sEmptyString;
std::string RTV_API sDefPortHTTP = "80", sDefPortHTTPS = "443";

cmstring PROT_PFX_HTTPS(WITHLEN("https://")), PROT_PFX_HTTP(WITHLEN("http://"));

void set_nb(int fd) {
	int flags = fcntl(fd, F_GETFL);
	flags |= O_NONBLOCK;
	ignore_value(fcntl(fd, F_SETFL, flags));
}

void justforceclose(int fd)
{
	while(0 != ::close(fd))
	{
		if(errno != EINTR)
			break;
	}
}

int64_t GetTimeMs()
{
	timeval tv;
	gettimeofday(&tv, nullptr);
	return int64_t(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

bool tHttpUrl::SetHttpUrl(string_view url)
{
	clear();
	trimBoth(url);

	if(url.empty())
		return false;

	tStrPos hStart(0), hEndSuc(0), p;

	if(url.length() > 7 && 0==strncasecmp(url.data(), "http://", 7))
		hStart=7;
	else if(url.length() > 8 && 0==strncasecmp(url.data(), "https://", 8))
	{
#ifndef HAVE_SSL
		return false;
#else
		hStart=8;
		bSSL=true;
#endif
	}
	else
		return false; // other protocol or weird stuff

	hEndSuc=url.find_first_of("/?#", hStart);
	if(stmiss==hEndSuc)
	{
		hEndSuc=url.length();
		sPath="/";
	}
	else
	{
		sPath=to_string(url.substr(hEndSuc));
		if(sPath[0] != '/')
			sPath.insert(0, "/");
		auto fragPos = sPath.find('#');
		if(fragPos != stmiss)
			sPath.erase(fragPos);
	}

	sHost=to_string(url.substr(hStart, hEndSuc-hStart));
	// credentials are not supported, strip them off
	p=sHost.rfind('@');
	if(p!=stmiss)
		sHost.erase(0, p+1);

	if(sHost.empty())
		return false;

	bool bBracket = sHost[0]=='[';
	p=sHost.rfind(':');
	if(p!=stmiss && (!bBracket || sHost.find(']') < p))
	{
		if(p==sHost.size()-1)
			return false; // this is crap, http://asdf:/
		for(auto r=p+1; r<sHost.size(); r++)
			if(!isdigit((unsigned char) sHost[r]))
				return false;
		sPort=sHost.substr(p+1);
		sHost.erase(p);
	}
	if(bBracket)
	{
		if(sHost.size() < 3 || sHost.back() != ']')
			return false; // unmatched square brackets
		sHost=sHost.substr(1, sHost.size()-2);
	}
	return !sHost.empty();
}

mstring tHttpUrl::GetHostHeader() const
{
	mstring s = StrHas(sHost, ":") ? "[" + sHost + "]" : sHost;
	if (!sPort.empty() && sPort != GetDefaultPortForProto())
	{
		s += ':';
		s += sPort;
	}
	return s;
}

mstring tHttpUrl::ToURI() const
{
	return GetProtoPrefix() + GetHostHeader() + sPath;
}

}
