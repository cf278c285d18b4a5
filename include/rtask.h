#ifndef _RTASK_H
#define _RTASK_H

#include "config.h"
#include "meta.h"
#include "lockable.h"
#include "retriever.h"
#include "failclass.h"

#include <functional>
#include <exception>

namespace rtv
{

class tRetrievalTask;
typedef std::shared_ptr<tRetrievalTask> tTaskPtr;

/**
 * Scheduling wrapper of one retriever, also the handle returned to the submitter.
 *
 * The identity is the retriever name. The ordering key is priority plus submission epoch,
 * it only changes through Refresh while the task is outside of the ready queue.
 */
class RTV_API tRetrievalTask : public base_with_condition, public std::enable_shared_from_this<tRetrievalTask>
{
public:
	enum eStatus : char
	{
		PENDING,
		RUNNING,
		DONE,
		CANCELLED
	};

	typedef std::function<void(const tTaskPtr&)> tCancelHook;

	tRetrievalTask(tRetrieverPtr retriever, double priority, uint64_t seqNr);

	cmstring& GetName() const { return m_sName; }
	size_t GetHash() const { return m_nHash; }
	const tRetrieverPtr& GetRetriever() const { return m_retriever; }
	uint64_t GetSequence() const { return m_nSeq; }

	// only stable while the caller prevents concurrent Refresh calls
	double GetPriority() const { return m_priority; }
	double GetKey() const { return m_key; }
	int64_t GetSubmitTime() const { return m_nSubmitTime; }

	/**
	 * Raises the priority to the max of current and requested value and moves the
	 * submission epoch to now. Must not be called while the task is in an ordered container.
	 */
	void Refresh(double priority);

	eStatus GetStatus();
	//! finished or cancelled
	bool IsDone();
	bool IsCancelled();

	/**
	 * Cancels the task unless it is finished already.
	 * @param mayInterrupt Also raise the interruption flag of a running retrieval
	 * @return false if the task was finished or cancelled before
	 */
	bool Cancel(bool mayInterrupt);

	/**
	 * Blocks until the task is finished or cancelled.
	 * @return the retriever after a successful or interrupted execution
	 * @throw tCancelledException if cancelled, or the failure of the execution
	 */
	tRetrieverPtr Get();

	//! @return true if done before the timeout expired
	bool Wait(long msec);

	eFailureClass GetFailureClass();

	// used by the scheduler
	void SetCancelHook(tCancelHook hook);
	//! PENDING -> RUNNING, false if the task was cancelled
	bool BeginExecution();
	void Finish(std::exception_ptr failure, eFailureClass fc);
	const std::atomic_bool& GetInterruptFlag() const { return m_bInterrupt; }

	bool operator==(const tRetrievalTask& other) const { return m_sName == other.m_sName; }
	bool operator!=(const tRetrievalTask& other) const { return m_sName != other.m_sName; }

private:
	tRetrievalTask(const tRetrievalTask&) = delete;
	tRetrievalTask& operator=(const tRetrievalTask&) = delete;

	tRetrieverPtr m_retriever;
	const mstring m_sName;
	const size_t m_nHash;
	const uint64_t m_nSeq;
	double m_priority, m_key = 0;
	int64_t m_nSubmitTime = 0;

	// guarded by the mutex
	eStatus m_status = PENDING;
	std::exception_ptr m_failure;
	eFailureClass m_failClass = eFailureClass::NONE;
	tCancelHook m_cancelHook;

	std::atomic_bool m_bInterrupt;
};

//! Strict weak ordering for the ready queue, first element is dequeued first
struct RTV_API tTaskOrder
{
	bool operator()(const tTaskPtr& a, const tTaskPtr& b) const
	{
		if(a->GetKey() != b->GetKey())
			return a->GetKey() > b->GetKey();
		return a->GetSequence() < b->GetSequence();
	}
};

}

#endif
