
//#define LOCAL_DEBUG
#include "debug.h"

#include "header.h"
#include "config.h"
#include "rtbuf.h"

#include <cstdio>
#include <string.h>
#include <unistd.h>

using namespace std;

namespace rtv
{

struct eHeadPos2label
{
	header::eHeadPos pos;
	const char *str;
	size_t len;
};

eHeadPos2label mapId2Headname[] =
{
		{ header::CONTENT_LENGTH, WITHLEN("Content-Length")},
		{ header::CONNECTION, WITHLEN("Connection")},
		{ header::CONTENT_TYPE, WITHLEN("Content-Type")},
		{ header::TRANSFER_ENCODING, WITHLEN("Transfer-Encoding")},
		{ header::LOCATION, WITHLEN("Location")},
		{ header::CACHE_CONTROL, WITHLEN("Cache-Control")},
		{ header::EXPIRES, WITHLEN("Expires")},
		{ header::DATE, WITHLEN("Date")},
		{ header::HOST, WITHLEN("Host")},
		{ header::USER_AGENT, WITHLEN("User-Agent")}
};

header::header(const header &s)
:type(s.type),
 frontLine(s.frontLine)
{
	for (unsigned i = 0; i < HEADPOS_MAX; i++)
		h[i] = s.h[i] ? strdup(s.h[i]) : nullptr;
}

header& header::operator=(const header& s)
{
	if(&s == this)
		return *this;
	type=s.type;
	frontLine=s.frontLine;
	for (unsigned i = 0; i < HEADPOS_MAX; ++i)
	{
		if (h[i])
			free(h[i]);
		h[i] = s.h[i] ? strdup(s.h[i]) : nullptr;
	}
	return *this;
}

header::~header()
{
	for(auto& p:h)
		free(p);
}

void header::clear()
{
	for(unsigned i=0; i<HEADPOS_MAX; i++)
		del((eHeadPos) i);
	frontLine.clear();
	type=INVALID;
}

void header::del(eHeadPos i)
{
	free(h[i]);
	h[i]=0;
}

int header::Load(LPCSTR const in, unsigned maxlen, const std::function<void(cmstring&, cmstring&)> &unkFunc)
{
	if(maxlen<9)
		return 0;

	if(!in)
		return -1;
	if(!strncmp(in,  "HTTP/1.", 7))
		type=ANSWER;
	else if(!strncmp(in, "GET ", 4))
		type=GET;
	else if (!strncmp(in, "HEAD ", 5))
		type=HEAD;
	else
		return -1;

	auto posNext=in;
	auto lastLineIdx = HEADPOS_MAX;

	while (true)
	{
		auto szBegin=posNext;
		unsigned pos=szBegin-in;
		auto end=(LPCSTR) memchr(szBegin, '\r', maxlen-pos);
		if (!end)
			return 0;
		if (end+1>=in+maxlen)
			return 0; // one newline must fit there, always

		if (szBegin==end)
		{
			if (end[1]=='\n') // DONE HERE!
				return end+2-in;

			return -1; // looks like crap
		}
		posNext=end+2;

		while (end > szBegin && isspace((unsigned char)*(end-1)))
			end--;

		if (frontLine.empty())
		{
			frontLine.assign(in, end-in);
			trimBack(frontLine);
			continue;
		}

		if(*szBegin == ' ' || *szBegin == '\t') // oh, a multiline?
		{
			auto nlen=end-szBegin;
			if(nlen<2) // empty but prefixed line, there might be continuation
				continue;

			if(lastLineIdx == HEADPOS_NOTFORUS)
				continue;
			else if(lastLineIdx == HEADPOS_MAX || !h[lastLineIdx])
				return -4;
			auto xl=strlen(h[lastLineIdx]);
			auto pNew = (char*) realloc(h[lastLineIdx], xl+nlen + 1);
			if(!pNew)
				return -3;
			h[lastLineIdx] = pNew;
			memcpy(h[lastLineIdx]+xl, szBegin, nlen);
			h[lastLineIdx][xl]=' ';
			h[lastLineIdx][xl+nlen]='\0';
			continue;
		}

		// end is behind the last relevant char now
		const char *sep=(const char*) memchr(szBegin, ':', end-szBegin);
		if (!sep)
			return -1;

		auto key = szBegin;
		size_t keyLen=sep-szBegin;

		sep++;
		while (sep<end && isspace((unsigned char)*sep))
			sep++;

		lastLineIdx = HEADPOS_NOTFORUS;

		for(const auto& xh : mapId2Headname)
		{
			if (xh.len != keyLen || strncasecmp(xh.str, key, keyLen))
				continue;
			unsigned l=end-sep;
			lastLineIdx = xh.pos;
			auto pNew = (char*) realloc(h[xh.pos], l+1);
			if(!pNew)
				return -3;
			h[xh.pos] = pNew;
			memcpy(h[xh.pos], sep, l);
			h[xh.pos][l]='\0';
			break;
		}
		if(unkFunc && lastLineIdx == HEADPOS_NOTFORUS)
			unkFunc(string(key, keyLen), string(sep, end-sep));
	}
	return -2;
}

void header::set(eHeadPos i, const char *val)
{
	if (h[i])
	{
		free(h[i]);
		h[i]=nullptr;
	}
	if(val)
		h[i] = strdup(val);
}

void header::set(eHeadPos i, const char *val, size_t len)
{
	if(!val)
	{
		free(h[i]);
		h[i]=nullptr;
		return;
	}
	auto pNew = (char*) realloc(h[i], len+1);
	if(!pNew)
		throw std::bad_alloc();
	h[i] = pNew;
	memcpy(h[i], val, len);
	h[i][len]='\0';
}

void header::set(eHeadPos key, cmstring &value)
{
	set(key, value.data(), value.size());
}

off_t header::getContentLength() const
{
	if(!h[CONTENT_LENGTH])
		return -1;
	char *pEnd(nullptr);
	errno = 0;
	auto n = strtoll(h[CONTENT_LENGTH], &pEnd, 10);
	if(errno || !pEnd || pEnd == h[CONTENT_LENGTH] || *pEnd || n < 0)
		return -1;
	return off_t(n);
}

long header::getMaxAge() const
{
	if(!h[CACHE_CONTROL])
		return -1;
	for(tSplitWalk split(h[CACHE_CONTROL], ", \t"); split.Next();)
	{
		auto tok = split.view();
		if(tok.length() <= 8 || !scaseequals(tok.substr(0, 8), "max-age="))
			continue;
		auto val = to_string(tok.substr(8));
		char *pEnd(nullptr);
		errno = 0;
		auto n = strtol(val.c_str(), &pEnd, 10);
		if(errno || *pEnd || n < 0)
			return -1;
		return n;
	}
	return -1;
}

bool header::isChunked() const
{
	if(!h[TRANSFER_ENCODING])
		return false;
	for(tSplitWalk split(h[TRANSFER_ENCODING], ", \t"); split.Next();)
		if(scaseequals(split.view(), "chunked"))
			return true;
	return false;
}

tSS header::ToString() const
{
	tSS s;
	s<<frontLine << "\r\n";
	for(const auto& pos2key : mapId2Headname)
		if (h[pos2key.pos])
			s << pos2key.str << ": " << h[pos2key.pos] << "\r\n";
	s << "\r\n";
	return s;
}

static const char* fmts[] =
{
		"%a, %d %b %Y %H:%M:%S GMT",
		"%A, %d-%b-%y %H:%M:%S GMT",
		"%a %b %d %H:%M:%S %Y"
};

bool header::ParseDate(const char *s, struct tm *tm)
{
	if(!s || !tm)
		return false;
	for(const auto& fmt : fmts)
	{
		memset(tm, 0, sizeof(*tm));
		if(::strptime(s, fmt, tm))
			return true;
	}

	return false;
}

time_t header::ParseDateUtc(const char *s)
{
	struct tm t;
	if(!ParseDate(s, &t))
		return -1;
	return timegm(&t);
}

}
