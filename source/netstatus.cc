#include "debug.h"

#include "netstatus.h"
#include "rtcfg.h"
#include "rterror.h"
#include "tcpconnect.h"

#include <stdexcept>

using namespace std;

namespace rtv
{

static const int64_t NETWORK_STATUS_REPORT_INTERVAL_MS = 120000;
static const int PROBE_TIMEOUT_MS = 2000;
static LPCSTR DEFAULT_NETWORK_TEST_SITES[] =
{
		"cloudflare.com", "archive.org", "w3c.org", "wikipedia.org", "github.com"
};

tBasicNetworkStatus::tBasicNetworkStatus() :
		m_bOffline(cfg::offlinemode != 0),
		m_nAttemptLimit(1),
		m_nTryAgainMs(0)
{
	SetAttemptLimit(cfg::attemptlimit);
	SetTryAgainInterval(int64_t(cfg::retryinterval) * 1000);

	auto now = GetTimeMs();
	m_lastUnavailableLogTime = now;
	m_lastAvailableLogTime = now + 1;
	m_lastNetworkCheckTime = now;

	m_testSites = cfg::GetTestSites();
	if(m_testSites.empty())
		m_testSites.assign(DEFAULT_NETWORK_TEST_SITES, DEFAULT_NETWORK_TEST_SITES + _countof(DEFAULT_NETWORK_TEST_SITES));
}

void tBasicNetworkStatus::SetAttemptLimit(int limit)
{
	if(limit < 1)
	{
		log::err("Invalid host attempt limit, must be at least 1");
		throw std::invalid_argument("Invalid host attempt limit");
	}
	m_nAttemptLimit.store(limit);
}

void tBasicNetworkStatus::SetTryAgainInterval(int64_t intervalMs)
{
	if(intervalMs < 0)
	{
		log::err("Invalid host try-again interval, must not be negative");
		throw std::invalid_argument("Invalid try-again interval");
	}
	m_nTryAgainMs.store(intervalMs);
}

tStrVec tBasicNetworkStatus::GetNetworkTestSites() const
{
	lockguard g(const_cast<tBasicNetworkStatus*>(this));
	return m_testSites;
}

void tBasicNetworkStatus::SetNetworkTestSites(const tStrVec& sites)
{
	setLockGuard;
	m_testSites = sites;
}

void tBasicNetworkStatus::LogUnavailableHost(cmstring& host)
{
	if(m_bOffline || host.empty())
		return;

	auto now = GetTimeMs();
	setLockGuard;
	m_lastUnavailableLogTime = now;
	auto it = m_hosts.find(host);
	if(it == m_hosts.end())
	{
		m_hosts[host].lastLogTime = now;
		return;
	}
	it->second.lastLogTime = now;
	if(it->second.logCount < m_nAttemptLimit.load())
		it->second.logCount++;
}

void tBasicNetworkStatus::LogAvailableHost(cmstring& host)
{
	if(m_bOffline || host.empty())
		return;

	setLockGuard;
	m_hosts.erase(host);
	m_lastAvailableLogTime = GetTimeMs();
}

bool tBasicNetworkStatus::IsHostUnavailable(cmstring& host)
{
	if(m_bOffline)
		return true;

	setLockGuard;
	auto it = m_hosts.find(host);
	if(it == m_hosts.end())
		return false;

	if(GetTimeMs() - it->second.lastLogTime >= m_nTryAgainMs.load())
	{
		it->second.logCount = 0; // info removed from table in LogAvailableHost
		return false;
	}

	return it->second.logCount >= m_nAttemptLimit.load();
}

bool tBasicNetworkStatus::IsNetworkUnavailable(int64_t checkInterval)
{
	if(m_bOffline)
		return true;

	lockguard probeGuard(m_probeMx);
	tStrVec sites;
	{
		setLockGuard;
		// If there's been success since failure, network assumed to be reachable.
		if(m_lastAvailableLogTime > m_lastUnavailableLogTime)
			return m_lastNetworkUnavailableResult = false;

		auto now = GetTimeMs();

		// If there's been success recently, network assumed to be reachable.
		if(!m_lastNetworkUnavailableResult && now - m_lastAvailableLogTime < checkInterval)
			return m_lastNetworkUnavailableResult;

		// If query comes too soon after an earlier one that addressed the network, return the earlier result.
		if(now - m_lastNetworkCheckTime < checkInterval)
			return m_lastNetworkUnavailableResult;

		m_lastNetworkCheckTime = now;
		sites = m_testSites;
	}

	bool reachable = false;
	for(const auto& site : sites)
	{
		if(IsHostReachable(site))
		{
			reachable = true;
			break;
		}
	}

	setLockGuard;
	m_lastNetworkUnavailableResult = !reachable;
	auto now = GetTimeMs();
	if(!reachable && now - m_lastNetworkStatusReportTime > NETWORK_STATUS_REPORT_INTERVAL_MS)
	{
		m_lastNetworkStatusReportTime = now;
		log::misc("Network is unreachable, none of the test sites responded");
	}
	return m_lastNetworkUnavailableResult;
}

bool tBasicNetworkStatus::IsHostReachable(cmstring& hostName)
{
	LOGSTARTFUNCx(hostName);
	for(auto port : {"443", "80"})
	{
		try
		{
			tcpconnect::Connect(tHostPortProto(hostName, port, false), PROBE_TIMEOUT_MS);
			return true;
		}
		catch(const tTransportException& ex)
		{
			if(ex.GetKind() == tTransportException::UNKNOWN_HOST)
			{
				USRDBG("Unreachable test host " << hostName << ": " << ex.what());
				return false;
			}
			USRDBG("Exception testing host " << hostName << ": " << ex.what());
		}
		catch(const tRetrievalException& ex)
		{
			USRDBG("Exception testing host " << hostName << ": " << ex.what());
		}
	}
	return false;
}

}
