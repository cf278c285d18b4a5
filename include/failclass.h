#ifndef _FAILCLASS_H
#define _FAILCLASS_H

#include "config.h"
#include "meta.h"
#include "lockable.h"

#include <exception>
#include <memory>

namespace rtv
{

enum class eFailureClass : char
{
	NONE,
	CANCELLED,
	INTERRUPTED,
	//! timeout, connection failure, unknown or known-bad host
	TRANSPORT,
	//! TLS handshake or certificate problem
	SECURITY,
	//! the post-processing hook failed
	POSTPROC,
	UNEXPECTED
};

RTV_API LPCSTR GetFailureClassName(eFailureClass);

//! Receiver of TLS failures, to let the application prompt the user or adjust trust settings
class RTV_API ISecurityListener
{
public:
	virtual ~ISecurityListener() {}
	virtual void OnException(const std::exception& cause, cmstring& resourceName) =0;
};

/**
 * Sorts the outcome of a finished task into one of the failure classes and reports it:
 * expected conditions go to the transfer log as notes, unexpected ones to the error log,
 * security problems to the listener if there is one.
 */
class RTV_API tFailureClassifier : public base_with_mutex
{
public:
	explicit tFailureClassifier(std::shared_ptr<ISecurityListener> listener = std::shared_ptr<ISecurityListener>());

	/**
	 * Pure classification.
	 * @param ex Exception raised by the execution, may be empty
	 * @param bCancelled The task was cancelled
	 * @param bInterrupted The retrieval ended in the Interrupted state
	 */
	static eFailureClass Classify(std::exception_ptr ex, bool bCancelled, bool bInterrupted) noexcept;

	//! Classifies and reports, never throws
	eFailureClass Dispatch(cmstring& resourceName, std::exception_ptr ex, bool bCancelled, bool bInterrupted) noexcept;

	std::shared_ptr<ISecurityListener> GetSecurityListener() const;
	void SetSecurityListener(std::shared_ptr<ISecurityListener> listener);

private:
	std::shared_ptr<ISecurityListener> m_listener;
};

}

#endif
