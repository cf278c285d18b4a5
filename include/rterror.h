#ifndef _RTERROR_H
#define _RTERROR_H

#include "config.h"
#include "meta.h"
#include <stdexcept>

namespace rtv
{

/**
 * Base of the retrieval failures. The message is a status line like "503 Connection timeout",
 * with an HTTP-like code in front.
 */
class RTV_API tRetrievalException : public std::runtime_error
{
public:
	explicit tRetrievalException(cmstring& statusLine) : std::runtime_error(statusLine) {}
	//! leading numeric code of the status line, 500 if there is none
	int GetCode() const;
};

class RTV_API tTransportException : public tRetrievalException
{
public:
	enum eKind
	{
		TIMEOUT,
		CONNECT,
		UNKNOWN_HOST,
		HOST_UNAVAILABLE
	};
	tTransportException(eKind kind, cmstring& statusLine) : tRetrievalException(statusLine), m_kind(kind) {}
	eKind GetKind() const { return m_kind; }
	static LPCSTR KindName(eKind);

private:
	eKind m_kind;
};

//! TLS handshake or certificate verification failure
class RTV_API tTlsException : public tRetrievalException
{
public:
	using tRetrievalException::tRetrievalException;
};

//! Cooperative interruption was noticed in a blocking step
class RTV_API tInterruptedException : public std::runtime_error
{
public:
	tInterruptedException() : std::runtime_error("Interrupted") {}
};

//! The post-processing hook failed, the cause is nested
class RTV_API tPostProcessException : public std::runtime_error
{
public:
	explicit tPostProcessException(cmstring& msg) : std::runtime_error(msg) {}
};

//! Result of a cancelled task was requested
class RTV_API tCancelledException : public std::runtime_error
{
public:
	explicit tCancelledException(cmstring& name) : std::runtime_error("Cancelled: " + name) {}
};

//! Message of an exception and all exceptions nested in it, separated by ": "
mstring RTV_API FormatNested(const std::exception& ex);

}

#endif
