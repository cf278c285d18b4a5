#include "debug.h"

#include "rtask.h"
#include "rterror.h"

#include <algorithm>

using namespace std;

namespace rtv
{

tRetrievalTask::tRetrievalTask(tRetrieverPtr retriever, double priority, uint64_t seqNr) :
		m_retriever(move(retriever)),
		m_sName(m_retriever ? m_retriever->GetName() : sEmptyString),
		m_nHash(std::hash<mstring>()(m_sName)),
		m_nSeq(seqNr),
		m_priority(priority),
		m_bInterrupt(false)
{
	if(!m_retriever)
		throw std::invalid_argument("retriever must not be null");
	m_key = m_priority + m_retriever->GetSubmitEpoch();
}

void tRetrievalTask::Refresh(double priority)
{
	m_priority = max(m_priority, priority);
	auto epoch = tRetriever::MakeEpoch();
	m_retriever->SetSubmitEpoch(epoch);
	m_nSubmitTime = GetTimeMs();
	m_key = m_priority + epoch;
}

tRetrievalTask::eStatus tRetrievalTask::GetStatus()
{
	setLockGuard;
	return m_status;
}

bool tRetrievalTask::IsDone()
{
	setLockGuard;
	return m_status == DONE || m_status == CANCELLED;
}

bool tRetrievalTask::IsCancelled()
{
	setLockGuard;
	return m_status == CANCELLED;
}

eFailureClass tRetrievalTask::GetFailureClass()
{
	setLockGuard;
	return m_failClass;
}

void tRetrievalTask::SetCancelHook(tCancelHook hook)
{
	setLockGuard;
	m_cancelHook = move(hook);
}

bool tRetrievalTask::Cancel(bool mayInterrupt)
{
	tCancelHook hook;
	{
		setLockGuard;
		if(m_status == DONE || m_status == CANCELLED)
			return false;
		if(mayInterrupt && m_status == RUNNING)
			m_bInterrupt.store(true);
		m_status = CANCELLED;
		hook = m_cancelHook;
		notifyAll();
	}
	// called unlocked, the hook may finish the task
	if(hook)
		hook(shared_from_this());
	return true;
}

bool tRetrievalTask::BeginExecution()
{
	setLockGuard;
	if(m_status != PENDING)
		return false;
	m_status = RUNNING;
	return true;
}

void tRetrievalTask::Finish(std::exception_ptr failure, eFailureClass fc)
{
	setLockGuard;
	m_failure = failure;
	m_failClass = fc;
	if(m_status != CANCELLED)
		m_status = DONE;
	m_cancelHook = tCancelHook();
	notifyAll();
}

tRetrieverPtr tRetrievalTask::Get()
{
	lockuniq g(this);
	while(m_status != DONE && m_status != CANCELLED)
		wait(g);
	if(m_status == CANCELLED)
		throw tCancelledException(m_sName);
	if(m_failure)
		std::rethrow_exception(m_failure);
	return m_retriever;
}

bool tRetrievalTask::Wait(long msec)
{
	lockuniq g(this);
	auto deadline = GetTimeMs() + msec;
	while(m_status != DONE && m_status != CANCELLED)
	{
		auto left = deadline - GetTimeMs();
		if(left <= 0)
			return false;
		wait_for(g, left / 1000, left % 1000);
	}
	return true;
}

}
