#ifndef _NETSTATUS_H
#define _NETSTATUS_H

#include "config.h"
#include "meta.h"
#include "lockable.h"

#include <unordered_map>

namespace rtv
{

/**
 * Health bookkeeping of remote hosts, consulted by the scheduler before dispatch and updated
 * by the retrievers when a host responds or fails.
 */
class RTV_API INetworkStatus
{
public:
	virtual ~INetworkStatus() {}
	virtual void LogAvailableHost(cmstring& host) =0;
	virtual void LogUnavailableHost(cmstring& host) =0;
	virtual bool IsHostUnavailable(cmstring& host) =0;
	virtual bool IsNetworkUnavailable(int64_t checkIntervalMs) =0;
};

class RTV_API tBasicNetworkStatus : public INetworkStatus, public base_with_mutex
{
public:
	//! initial values come from the configuration
	tBasicNetworkStatus();

	void LogAvailableHost(cmstring& host) override;
	void LogUnavailableHost(cmstring& host) override;
	bool IsHostUnavailable(cmstring& host) override;
	bool IsNetworkUnavailable(int64_t checkIntervalMs) override;

	bool IsOfflineMode() const { return m_bOffline.load(); }
	void SetOfflineMode(bool offline) { m_bOffline.store(offline); }

	int GetAttemptLimit() const { return m_nAttemptLimit.load(); }
	//! @throw std::invalid_argument if limit < 1
	void SetAttemptLimit(int limit);
	int64_t GetTryAgainInterval() const { return m_nTryAgainMs.load(); }
	//! interval in milliseconds, @throw std::invalid_argument if negative
	void SetTryAgainInterval(int64_t intervalMs);

	tStrVec GetNetworkTestSites() const;
	void SetNetworkTestSites(const tStrVec& sites);

protected:
	//! name resolution and TCP connect to https or http port, within two seconds
	virtual bool IsHostReachable(cmstring& host);

	struct tHostInfo
	{
		int logCount = 1;
		int64_t lastLogTime = 0;
	};
	std::unordered_map<mstring, tHostInfo> m_hosts;

	std::atomic_bool m_bOffline;
	std::atomic<int> m_nAttemptLimit;
	std::atomic<int64_t> m_nTryAgainMs;

	int64_t m_lastUnavailableLogTime, m_lastAvailableLogTime, m_lastNetworkCheckTime,
	m_lastNetworkStatusReportTime = 0;
	bool m_lastNetworkUnavailableResult = false;
	tStrVec m_testSites;
	// serializes the expensive network probe
	rtmutex m_probeMx;
};

}

#endif
