#include "debug.h"

#include "httpretriever.h"
#include "tcpconnect.h"
#include "rterror.h"
#include "rtzip.h"
#include "rtcfg.h"
#include "interrupt.h"

using namespace std;

namespace rtv
{

// unknown lengths grow the buffer by this much
#define PAGE_SIZE (1<<15)
#define HEADER_MAX (1<<16)
#define CHUNK_LINE_MAX 4096
#define RESERVE_PAGES_MAX 32

tHttpRetriever::tHttpRetriever(cmstring& sName, tHttpUrl url, std::shared_ptr<IPostProcessor> postProcessor) :
		tRetriever(sName, move(postProcessor)),
		m_url(move(url)),
		m_bExtractZip(false)
{
}

tHttpRetriever::~tHttpRetriever()
{
}

mstring tHttpRetriever::GetResponseMessage() const
{
	lockguard g(const_cast<tHttpRetriever*>(this));
	return m_head.getCodeMessage();
}

time_t tHttpRetriever::GetExpiration(const header& h, time_t now)
{
	auto maxAge = h.getMaxAge();
	if(maxAge >= 0)
		return now + maxAge;

	if(!h.h[header::EXPIRES])
		return 0;
	auto expires = header::ParseDateUtc(h.h[header::EXPIRES]);
	if(expires < 0)
		return 0;
	// use the server's clock for the distance if it told us
	auto date = header::ParseDateUtc(h.h[header::DATE]);
	if(date >= 0)
		return now + (expires - date);
	return expires;
}

void tHttpRetriever::Connect(const tHttpUrl& target)
{
	m_con.reset();
	m_inbuf.clear();
	m_con = tcpconnect::Connect(target, GetConnectTimeout());
}

void tHttpRetriever::SendRequest(const tHttpUrl& target)
{
	header req;
	req.type = header::GET;
	req.frontLine = "GET " + (target.sPath.empty() ? mstring("/") : target.sPath) + " HTTP/1.1";
	req.set(header::HOST, target.GetHostHeader());
	req.set(header::USER_AGENT, cfg::agentheader.empty() ? mstring("rtvfetch/" RTVERSION) : cfg::agentheader);
	req.set(header::CONNECTION, "close");
	auto raw = req.ToString();
	LOG("Request: " << raw);
	m_con->Send(raw.rptr(), raw.size(), GetReadTimeout());
}

size_t tHttpRetriever::Fill()
{
	if(m_inbuf.freecapa() == 0)
	{
		m_inbuf.move();
		if(m_inbuf.freecapa() == 0 && !m_inbuf.setsize(m_inbuf.totalcapa() + PAGE_SIZE))
			throw std::bad_alloc();
	}
	auto n = m_con->Recv(m_inbuf.wptr(), m_inbuf.freecapa(), GetReadTimeout());
	m_inbuf.got(n);
	return n;
}

void tHttpRetriever::ReadResponseHeader()
{
	if(m_inbuf.totalcapa() < PAGE_SIZE)
		m_inbuf.setsize(PAGE_SIZE);
	while(true)
	{
		int n = 0;
		{
			setLockGuard;
			m_head.clear();
			n = m_head.Load(m_inbuf.rptr(), m_inbuf.size());
		}
		if(n < 0 || (n > 0 && m_head.type != header::ANSWER))
			throw tRetrievalException("502 Bad response header");
		if(n > 0)
		{
			m_inbuf.drop(n);
			// informational responses are followed by the real one
			if(m_head.getStatus() >= 100 && m_head.getStatus() < 200)
				continue;
			return;
		}
		if(m_inbuf.size() >= HEADER_MAX)
			throw tRetrievalException("502 Response header too large");
		if(!Fill())
			throw tRetrievalException("502 Connection closed before the response header");
	}
}

static bool resolve_location(const tHttpUrl& base, cmstring& loc, tHttpUrl& out)
{
	if(StrHas(loc, "://"))
		return out.SetHttpUrl(loc);
	out = base;
	if(startsWithSz(loc, "//"))
		return out.SetHttpUrl(base.GetProtoPrefix() + loc.substr(2));
	if(startsWithSz(loc, "/"))
	{
		out.sPath = loc;
		return true;
	}
	auto path = base.sPath.substr(0, base.sPath.find('?'));
	auto slash = path.rfind('/');
	out.sPath = (slash == stmiss ? mstring("/") : path.substr(0, slash + 1)) + loc;
	return true;
}

void tHttpRetriever::OpenConnection()
{
	LOGSTARTFUNCx(m_url.ToURI());

	tHttpUrl target(m_url);
	for(int redirs = 0; ; ++redirs)
	{
		Connect(target);
		interrupt::Check();
		SendRequest(target);
		ReadResponseHeader();

		auto st = m_head.getStatus();
		tProtocolInfo info;
		info.kind = tProtocolInfo::HTTP;
		info.code = st;
		SetProtocolInfo(info);

		if(!REDIRECTCODE(st) || !m_head.h[header::LOCATION])
			return;

		if(redirs >= cfg::redirmax)
			throw tRetrievalException("500 Too many redirects");

		tHttpUrl next;
		if(!resolve_location(target, m_head.h[header::LOCATION], next))
			throw tRetrievalException(mstring("502 Bad redirection target: ") + m_head.h[header::LOCATION]);
		LOG("Redirected to " << next.ToURI());
		target = next;
	}
}

tBytes tHttpRetriever::DoRead()
{
	LOGSTARTFUNCx(GetName());

	SetExpirationTime(GetExpiration(m_head, GetTime()));
	SetContentType(m_head.h[header::CONTENT_TYPE] ? m_head.h[header::CONTENT_TYPE] : "");

	tBytes ret;
	auto st = m_head.getStatus();
	if(BODYFREECODE(st))
		SetContentLength(0);
	else if(m_head.isChunked())
		ret = ReadChunked();
	else
	{
		auto len = m_head.getContentLength();
		SetContentLength(len < 0 ? 0 : len);
		ret = len >= 0 ? ReadSized(len) : ReadUntilClose();
	}

	m_con.reset();
	m_inbuf.clear();

	if(m_bExtractZip && scaseequals(GetContentType(), "application/zip"))
		return ExtractZip(ret);
	return ret;
}

tBytes tHttpRetriever::ReadSized(off_t len)
{
	if(len < 0)
		throw tRetrievalException("502 Bad content length");
	tBytes ret;
	// announced length is not trusted, the buffer grows with the data
	ret.reserve(std::min(len, off_t(PAGE_SIZE * RESERVE_PAGES_MAX)));
	while(off_t(ret.size()) < len)
	{
		interrupt::Check();
		if(m_inbuf.empty() && !Fill())
			throw tRetrievalException("502 Premature end of data");
		auto n = std::min(size_t(len) - ret.size(), m_inbuf.size());
		ret.insert(ret.end(), (const uint8_t*) m_inbuf.rptr(), (const uint8_t*) m_inbuf.rptr() + n);
		m_inbuf.drop(n);
		AddContentLengthRead(n);
	}
	return ret;
}

tBytes tHttpRetriever::ReadUntilClose()
{
	tBytes ret;
	size_t have = 0;
	while(true)
	{
		interrupt::Check();
		if(m_inbuf.empty() && !Fill())
			break;
		if(ret.size() - have < m_inbuf.size())
			ret.resize(ret.size() + std::max<size_t>(PAGE_SIZE, m_inbuf.size()));
		memcpy(ret.data() + have, m_inbuf.rptr(), m_inbuf.size());
		have += m_inbuf.size();
		AddContentLengthRead(m_inbuf.size());
		m_inbuf.clear();
	}
	ret.resize(have);
	return ret;
}

mstring tHttpRetriever::ReadLine()
{
	while(true)
	{
		auto p = (LPCSTR) memchr(m_inbuf.rptr(), '\n', m_inbuf.size());
		if(p)
		{
			mstring line(m_inbuf.rptr(), p - m_inbuf.rptr());
			m_inbuf.drop(p + 1 - m_inbuf.rptr());
			trimBack(line, "\r");
			return line;
		}
		if(m_inbuf.size() > CHUNK_LINE_MAX)
			throw tRetrievalException("502 Bad chunk header");
		interrupt::Check();
		if(!Fill())
			throw tRetrievalException("502 Premature end of data");
	}
}

tBytes tHttpRetriever::ReadChunked()
{
	tBytes ret;
	while(true)
	{
		auto line = ReadLine();
		// chunk extensions are not interesting
		auto ext = line.find(';');
		if(ext != stmiss)
			line.erase(ext);
		trimBoth(line);
		char *pEnd(nullptr);
		errno = 0;
		auto len = strtoull(line.c_str(), &pEnd, 16);
		if(line.empty() || errno || *pEnd || len > (unsigned long long) MAX_VAL(off_t))
			throw tRetrievalException("502 Bad chunk header");
		if(len == 0)
		{
			// skip the trailer
			while(!ReadLine().empty())
				;
			return ret;
		}
		auto chunk = ReadSized(off_t(len));
		ret.insert(ret.end(), chunk.begin(), chunk.end());
		if(!ReadLine().empty())
			throw tRetrievalException("502 Bad chunk terminator");
	}
}

tBytes tHttpRetriever::ExtractZip(const tBytes& payload)
{
	tZipReader reader(payload.data(), payload.size());
	reader.Open();
	if(reader.GetEntries().empty())
	{
		log::err(tSS() << "No zip entry for " << GetName());
		return tBytes();
	}
	return reader.Extract(reader.GetEntries().front());
}

}
