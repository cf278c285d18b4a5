#include "debug.h"

#include "failclass.h"
#include "rterror.h"

using namespace std;

namespace rtv
{

LPCSTR GetFailureClassName(eFailureClass c)
{
	switch(c)
	{
	case eFailureClass::NONE: return "none";
	case eFailureClass::CANCELLED: return "cancelled";
	case eFailureClass::INTERRUPTED: return "interrupted";
	case eFailureClass::TRANSPORT: return "transport";
	case eFailureClass::SECURITY: return "security";
	case eFailureClass::POSTPROC: return "post-processing";
	case eFailureClass::UNEXPECTED: return "unexpected";
	}
	return "unknown";
}

tFailureClassifier::tFailureClassifier(std::shared_ptr<ISecurityListener> listener)
: m_listener(move(listener))
{
}

std::shared_ptr<ISecurityListener> tFailureClassifier::GetSecurityListener() const
{
	lockguard g(const_cast<tFailureClassifier*>(this));
	return m_listener;
}

void tFailureClassifier::SetSecurityListener(std::shared_ptr<ISecurityListener> listener)
{
	setLockGuard;
	m_listener = move(listener);
}

eFailureClass tFailureClassifier::Classify(std::exception_ptr ex, bool bCancelled, bool bInterrupted) noexcept
{
	if(bCancelled)
		return eFailureClass::CANCELLED;
	if(!ex)
		return bInterrupted ? eFailureClass::INTERRUPTED : eFailureClass::NONE;
	try
	{
		std::rethrow_exception(ex);
	}
	catch(const tCancelledException&)
	{
		return eFailureClass::CANCELLED;
	}
	catch(const tInterruptedException&)
	{
		return eFailureClass::INTERRUPTED;
	}
	catch(const tTlsException&)
	{
		return eFailureClass::SECURITY;
	}
	catch(const tTransportException&)
	{
		return eFailureClass::TRANSPORT;
	}
	catch(const tPostProcessException&)
	{
		return eFailureClass::POSTPROC;
	}
	catch(...)
	{
		return eFailureClass::UNEXPECTED;
	}
}

static mstring describe(std::exception_ptr ex)
{
	if(!ex)
		return mstring();
	try
	{
		std::rethrow_exception(ex);
	}
	catch(const std::exception& e)
	{
		return FormatNested(e);
	}
	catch(...)
	{
		return "non-standard exception";
	}
}

// whatever the listener throws ends here
static void NotifyListener(ISecurityListener& listener, const std::exception& cause, cmstring& name) noexcept
{
	try
	{
		listener.OnException(cause, name);
	}
	catch(const std::exception& e)
	{
		log::err(tSS() << "Security listener failed for " << name << ": " << e.what());
	}
	catch(...)
	{
		log::err(tSS() << "Security listener failed for " << name << ": non-standard exception");
	}
}

eFailureClass tFailureClassifier::Dispatch(cmstring& name, std::exception_ptr ex, bool bCancelled, bool bInterrupted) noexcept
{
	auto fc = Classify(ex, bCancelled, bInterrupted);
	try
	{
		switch(fc)
		{
		case eFailureClass::NONE:
			break;
		case eFailureClass::CANCELLED:
			log::misc("Retrieval cancelled: " + name, log::FAILNOTE);
			break;
		case eFailureClass::INTERRUPTED:
			log::misc("Retrieval interrupted: " + name, log::FAILNOTE);
			break;
		case eFailureClass::TRANSPORT:
			log::misc("Retrieval failed: " + name + " " + describe(ex), log::FAILNOTE);
			break;
		case eFailureClass::SECURITY:
		{
			auto listener = GetSecurityListener();
			if(!listener)
			{
				log::misc("Retrieval failed: " + name + " " + describe(ex), log::FAILNOTE);
				break;
			}
			try
			{
				std::rethrow_exception(ex);
			}
			catch(const std::exception& cause)
			{
				NotifyListener(*listener, cause, name);
			}
			break;
		}
		case eFailureClass::POSTPROC:
		case eFailureClass::UNEXPECTED:
			log::err(tSS() << "Exception during retrieval of " << name << " ("
					<< GetFailureClassName(fc) << "): " << describe(ex));
			break;
		}
	}
	catch(const std::exception& e)
	{
		log::err(tSS() << "Error reporting the outcome of " << name << ": " << e.what());
	}
	catch(...)
	{
		log::err(tSS() << "Error reporting the outcome of " << name << ": non-standard exception");
	}
	return fc;
}

}
