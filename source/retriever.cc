#include "debug.h"

#include "retriever.h"
#include "httpretriever.h"
#include "arcretriever.h"
#include "netstatus.h"
#include "postproc.h"
#include "interrupt.h"
#include "rterror.h"
#include "rtcfg.h"

using namespace std;

namespace rtv
{

tRetriever::tRetriever(cmstring& sName, std::shared_ptr<IPostProcessor> postProcessor) :
		m_sName(sName),
		m_postProcessor(move(postProcessor)),
		m_state(NotStarted),
		m_nContentLength(0),
		m_nContentLengthRead(0),
		m_nExpiration(0),
		m_nSubmitEpoch(0),
		m_nConnectTimeout(cfg::contimeout),
		m_nReadTimeout(cfg::readtimeout)
{
}

tRetriever::~tRetriever()
{
}

LPCSTR tRetriever::GetStateName(eState st)
{
	switch(st)
	{
	case NotStarted: return "NotStarted";
	case Connecting: return "Connecting";
	case Reading: return "Reading";
	case Interrupted: return "Interrupted";
	case Error: return "Error";
	case Successful: return "Successful";
	}
	return "Unknown";
}

void tRetriever::SetState(eState st)
{
	auto cur = m_state.load();
	while(!IsTerminal(cur))
	{
		if(m_state.compare_exchange_weak(cur, st))
			return;
	}
}

bool tRetriever::CheckInterrupted()
{
	if(!interrupt::IsRequested())
		return false;
	SetState(Interrupted);
	USRDBG("Retrieval interrupted for " << m_sName);
	return true;
}

int tRetriever::GetStaleRequestLimit() const
{
	return m_nStaleLimit < 0 ? cfg::stalelimit : m_nStaleLimit;
}

mstring tRetriever::GetContentType() const
{
	lockguard g(const_cast<tRetriever*>(this));
	return m_sContentType;
}

void tRetriever::SetContentType(cmstring& s)
{
	setLockGuard;
	m_sContentType = s;
}

tRetriever::tProtocolInfo tRetriever::GetProtocolInfo() const
{
	lockguard g(const_cast<tRetriever*>(this));
	return m_protoInfo;
}

void tRetriever::SetProtocolInfo(tProtocolInfo info)
{
	setLockGuard;
	m_protoInfo = info;
}

tBytes tRetriever::GetBuffer() const
{
	lockguard g(const_cast<tRetriever*>(this));
	return m_buffer;
}

tBytes tRetriever::TakeBuffer()
{
	setLockGuard;
	return move(m_buffer);
}

std::shared_ptr<INetworkStatus> tRetriever::GetNetworkStatus() const
{
	lockguard g(const_cast<tRetriever*>(this));
	return m_netStatus;
}

void tRetriever::SetNetworkStatus(std::shared_ptr<INetworkStatus> p)
{
	setLockGuard;
	m_netStatus = move(p);
}

void tRetriever::Execute()
{
	LOGSTARTFUNCx(m_sName);

	std::exception_ptr failure;
	try
	{
		if(!CheckInterrupted())
		{
			SetState(Connecting);
			if(m_nConnectTimeout <= 0 || m_nReadTimeout <= 0)
				throw tRetrievalException("500 unspecified timeout");
			OpenConnection();

			if(!CheckInterrupted())
			{
				SetState(Reading);
				auto buf = DoRead();
				if(buf.empty())
					SetContentLength(0);
				{
					setLockGuard;
					m_buffer = move(buf);
				}
				SetState(Successful);
				auto ns = GetNetworkStatus();
				auto host = GetHost();
				if(ns && !host.empty())
					ns->LogAvailableHost(host);
				log::transfer(GetContentLengthRead(), host, m_sName, false);
			}
		}
	}
	catch(const tInterruptedException&)
	{
		SetState(Interrupted);
		USRDBG("Retrieval interrupted for " << m_sName);
	}
	catch(const tRetrievalException& ex)
	{
		SetState(Error);
		LOG("retrieval failed: " << ex.what());
		auto ns = GetNetworkStatus();
		auto host = GetHost();
		if(ns && !host.empty())
			ns->LogUnavailableHost(host);
		log::transfer(GetContentLengthRead(), host, m_sName, true);
		failure = std::current_exception();
	}
	catch(const std::exception& ex)
	{
		SetState(Error);
		log::err(tSS() << "Error attempting to retrieve " << m_sName << ": " << ex.what());
		failure = std::current_exception();
	}

	RunEndOfLife();

	if(failure)
		std::rethrow_exception(failure);
}

void tRetriever::MarkFailed()
{
	SetState(Error);
	RunEndOfLife();
}

void tRetriever::RunEndOfLife()
{
	if(!m_postProcessor)
		return;
	try
	{
		auto result = m_postProcessor->Run(*this);
		setLockGuard;
		m_buffer = move(result);
	}
	catch(const std::exception& ex)
	{
		// the only transition out of a terminal state
		m_state.store(Error);
		log::err(tSS() << "Error post-processing " << m_sName << ": " << ex.what());
		std::throw_with_nested(tPostProcessException("Error post-processing " + m_sName));
	}
}

tRetrieverPtr CreateRetriever(cmstring& url, std::shared_ptr<IPostProcessor> postProcessor)
{
	auto colon = url.find(':');
	if(colon == stmiss)
		return tRetrieverPtr();
	auto scheme = string_view(url).substr(0, colon);
	if(scaseequals(scheme, "http") || scaseequals(scheme, "https"))
	{
		tHttpUrl parsed;
		if(!parsed.SetHttpUrl(url))
			return tRetrieverPtr();
		return make_shared<tHttpRetriever>(url, move(parsed), move(postProcessor));
	}
	if(scaseequals(scheme, "jar"))
	{
		mstring archive, entry;
		if(!tArchiveRetriever::ParseUrl(url, archive, entry))
			return tRetrieverPtr();
		return make_shared<tArchiveRetriever>(url, archive, entry, move(postProcessor));
	}
	return tRetrieverPtr();
}

}
