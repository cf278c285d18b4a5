#ifndef _DNSRES_H_
#define _DNSRES_H_

#include "meta.h"

#include <memory>
#include <event2/util.h>

namespace rtv
{

class RTV_API CAddrInfo
{
	// not to be copied ever
	CAddrInfo(const CAddrInfo&) = delete;
	CAddrInfo operator=(const CAddrInfo&) = delete;

	std::string m_sError;

	// raw returned data from getaddrinfo
	evutil_addrinfo * m_rawInfo = nullptr;
	// shortcut for iterators, first in the list with TCP target
	evutil_addrinfo * m_tcpAddrInfo = nullptr;

	struct tResolveCall;

public:

	CAddrInfo() = default;
	~CAddrInfo();

	/**
	 * Blocking resolution with libevent's evdns, bounded by timeoutMs.
	 * Will result either in the node containing a TCP address (on success) or an error
	 * status line like "503 DNS error - ...".
	 */
	static std::shared_ptr<CAddrInfo> Resolve(cmstring& sHostname, cmstring& sPort, int timeoutMs);

	/**
	 * Return a pre-located pointer which points on the first TCP compatible address or nullptr
	 * if no such found.
	 */
	const evutil_addrinfo *getTcpAddrInfo() const { return m_tcpAddrInfo; }

	bool HasError() const { return !m_tcpAddrInfo; }
	const std::string& GetError() const { return m_sError; }
};

typedef std::shared_ptr<CAddrInfo> CAddrInfoPtr;

//! numeric address and port of a resolved entry, for logging
mstring RTV_API formatIpPort(const evutil_addrinfo *p);

}

#endif
