#include "debug.h"

#include "dnsres.h"
#include "meta.h"

#include <event2/event.h>
#include <event2/dns.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>

using namespace std;

namespace rtv
{

static const string dns_error_status_prefix("503 DNS error - ");

// descriptor of a running DNS lookup, passed around with libevent callbacks
struct CAddrInfo::tResolveCall
{
	bool done = false;
	int rc = 0;
	evutil_addrinfo *results = nullptr;

	static void cb_dns(int rc, struct evutil_addrinfo *results, void *arg)
	{
		auto me = (tResolveCall*) arg;
		me->done = true;
		me->rc = rc;
		me->results = results;
	}
};

static void free_base(event_base *p) { if(p) event_base_free(p); }
static void free_dnsbase(evdns_base *p) { if(p) evdns_base_free(p, 1); }

using unique_eb = resource_owner<event_base*, free_base, nullptr>;
using unique_dnsb = resource_owner<evdns_base*, free_dnsbase, nullptr>;

CAddrInfoPtr CAddrInfo::Resolve(cmstring& sHostname, cmstring& sPort, int timeoutMs)
{
	LOGSTARTs("CAddrInfo::Resolve");
	LOG(sHostname << ":" << sPort);

	auto ret = make_shared<CAddrInfo>();
	tResolveCall call;

	{
		unique_eb base(event_base_new());
		if(!base.valid())
		{
			ret->m_sError = dns_error_status_prefix + "cannot create event base";
			return ret;
		}
		unique_dnsb dnsbase(evdns_base_new(*base, EVDNS_BASE_INITIALIZE_NAMESERVERS));
		if(!dnsbase.valid())
		{
			// no usable resolv.conf, still good for numeric addresses and /etc/hosts
			dnsbase.reset(evdns_base_new(*base, 0));
			if(dnsbase.valid())
				ignore_value(evdns_base_load_hosts(*dnsbase, nullptr));
		}
		if(!dnsbase.valid())
		{
			ret->m_sError = dns_error_status_prefix + "cannot create resolver";
			return ret;
		}

		evutil_addrinfo hints;
		memset(&hints, 0, sizeof(hints));
		hints.ai_family = AF_UNSPEC;
		hints.ai_socktype = SOCK_STREAM;
		hints.ai_protocol = IPPROTO_TCP;

		auto req = evdns_getaddrinfo(*dnsbase, sHostname.c_str(), sPort.c_str(),
				&hints, tResolveCall::cb_dns, &call);
		if(req && !call.done)
		{
			timeval tv { timeoutMs / 1000, (timeoutMs % 1000) * 1000 };
			event_base_loopexit(*base, &tv);
			event_base_dispatch(*base);
			if(!call.done)
			{
				evdns_getaddrinfo_cancel(req);
				event_base_loop(*base, EVLOOP_NONBLOCK);
			}
		}
		// dnsbase is released before base, pending requests are failed there
	}

	switch (call.rc)
	{
	case 0:
		break;
	case EVUTIL_EAI_CANCEL:
		ret->m_sError = dns_error_status_prefix + "timeout";
		return ret;
	case EVUTIL_EAI_AGAIN:
	case EVUTIL_EAI_MEMORY:
	case EVUTIL_EAI_SYSTEM:
		ret->m_sError = "504 Temporary DNS resolution error";
		return ret;
	default:
		ret->m_sError = dns_error_status_prefix + evutil_gai_strerror(call.rc);
		return ret;
	}
	if(!call.done)
	{
		ret->m_sError = dns_error_status_prefix + "timeout";
		return ret;
	}
	ret->m_rawInfo = call.results;
	// find any suitable-looking entry and keep a pointer to it faster lookup
	for (auto pCur = ret->m_rawInfo; pCur && !ret->m_tcpAddrInfo; pCur = pCur->ai_next)
	{
		if (pCur->ai_socktype == SOCK_STREAM && pCur->ai_protocol == IPPROTO_TCP)
			ret->m_tcpAddrInfo = pCur;
	}
	if (!ret->m_tcpAddrInfo)
		ret->m_sError = dns_error_status_prefix + evutil_gai_strerror(EVUTIL_EAI_NONAME);
#ifdef DEBUG
	for (auto p = ret->m_rawInfo; p; p = p->ai_next)
		LOG(formatIpPort(p));
#endif
	return ret;
}

CAddrInfo::~CAddrInfo()
{
	if (m_rawInfo) evutil_freeaddrinfo(m_rawInfo);
	m_tcpAddrInfo = m_rawInfo = nullptr;
}

mstring formatIpPort(const evutil_addrinfo *p)
{
	if(!p)
		return "<none>";
	char buf[INET6_ADDRSTRLEN + 1], pbuf[10];
	if(0 != getnameinfo(p->ai_addr, p->ai_addrlen, buf, sizeof(buf), pbuf, sizeof(pbuf),
			NI_NUMERICHOST | NI_NUMERICSERV))
		return "<bad address>";
	return (p->ai_family == PF_INET6 ? mstring("[") + buf + "]" : mstring(buf)) + ":" + pbuf;
}

}
