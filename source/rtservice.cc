#include "debug.h"

#include "rtservice.h"
#include "netstatus.h"
#include "interrupt.h"
#include "rterror.h"
#include "rtcfg.h"

#include <algorithm>

#ifdef HAVE_PTHREAD_SETNAME_NP
#include <pthread.h>
#endif

using namespace std;

#define IDLE_THREAD_NAME "rtv-idle"

namespace rtv
{

static void SetThreadName(cmstring& name)
{
#ifdef HAVE_PTHREAD_SETNAME_NP
	// kernel limit is 15 chars, the tail of a URL is more telling
	auto s = name.length() > 15 ? name.substr(name.length() - 15) : name;
	pthread_setname_np(pthread_self(), s.c_str());
#else
	(void) name;
#endif
}

tRetrievalService::tRetrievalService(std::shared_ptr<INetworkStatus> netStatus,
		std::shared_ptr<ISecurityListener> listener) :
		m_netStatus(move(netStatus)),
		m_classifier(move(listener)),
		m_nPoolSize(cfg::poolsize),
		m_nQueueSize(cfg::queuesize),
		m_nActive(0)
{
	if(m_nPoolSize < 1)
		throw std::invalid_argument("Retrieval pool size must be at least one");
	if(cfg::queuesize < 1)
		throw std::invalid_argument("Retrieval queue size must be at least one");
	lockguard g(this);
	SpawnWorkers();
}

tRetrievalService::~tRetrievalService()
{
	bool graceful;
	{
		lockguard g(this);
		graceful = m_bShutdown;
	}
	if(!graceful)
		Shutdown(true);

	decltype(m_threads) threads;
	{
		lockuniq g(this);
		while(m_nThreads > 0)
			wait(g);
		threads.swap(m_threads);
	}
	for(auto& t : threads)
		t.join();
}

// call with the lock held; workers on the finished list have released it already
void tRetrievalService::ReapWorkers()
{
	for(const auto& id : m_finished)
	{
		auto it = find_if(m_threads.begin(), m_threads.end(),
				[&id](const std::thread& t) { return t.get_id() == id; });
		if(it == m_threads.end())
			continue;
		it->join();
		m_threads.erase(it);
	}
	m_finished.clear();
}

// call with the lock held
void tRetrievalService::SpawnWorkers()
{
	ReapWorkers();
	while(!m_bShutdown && m_nThreads < m_nPoolSize)
	{
		m_threads.emplace_back([this]() { WorkerLoop(); });
		m_nThreads++;
	}
	notifyAll();
}

void tRetrievalService::WorkerLoop()
{
	SetThreadName(IDLE_THREAD_NAME);
	lockuniq g(this);
	while(true)
	{
		while(m_queue.empty() && !m_bShutdown && m_nThreads <= m_nPoolSize)
			wait(g);

		// pool was shrunk, or shut down and drained
		if(m_nThreads > m_nPoolSize || m_queue.empty())
			break;

		auto task = *m_queue.begin();
		m_queue.erase(m_queue.begin());

		g.unLock();
		RunTask(task);
		g.reLock();
	}
	m_nThreads--;
	m_finished.emplace_back(std::this_thread::get_id());
	notifyAll();
}

void tRetrievalService::RunTask(const tTaskPtr& task)
{
	LOGSTARTFUNCx(task->GetName());
	auto& rtr = task->GetRetriever();

	auto limit = rtr->GetStaleRequestLimit();
	if(limit > 0 && GetTimeMs() - task->GetSubmitTime() > limit)
	{
		log::misc("Cancelling stale request: " + task->GetName(), log::FAILNOTE);
		task->Cancel(false);
	}

	if(!task->BeginExecution())
	{
		// cancelled after leaving the queue
		Complete(task, std::exception_ptr());
		return;
	}

	std::exception_ptr failure;
	m_nActive.fetch_add(1);
	SetThreadName(task->GetName());
	try
	{
		auto host = rtr->GetHost();
		if(m_netStatus && !host.empty() && m_netStatus->IsHostUnavailable(host))
		{
			LOG("known unavailable host, failing fast");
			failure = std::make_exception_ptr(tTransportException(tTransportException::HOST_UNAVAILABLE,
					"503 Host unavailable: " + host));
			rtr->MarkFailed();
		}
		else
		{
			interrupt::tScope isc(task->GetInterruptFlag());
			rtr->Execute();
		}
	}
	catch(...)
	{
		// kept for the handle and the classifier
		failure = std::current_exception();
	}
	SetThreadName(IDLE_THREAD_NAME);
	m_nActive.fetch_sub(1);

	Complete(task, failure);
}

void tRetrievalService::Complete(const tTaskPtr& task, std::exception_ptr failure)
{
	// must happen before the handle is released, a resubmission is a fresh admission then
	m_admission.Remove(task);
	auto fc = m_classifier.Dispatch(task->GetName(), failure, task->IsCancelled(),
			task->GetRetriever()->GetState() == tRetriever::Interrupted);
	task->Finish(failure, fc);
}

void tRetrievalService::OnCancelled(const tTaskPtr& task)
{
	{
		lockguard g(this);
		if(!m_queue.erase(task))
			return; // owned by a worker
	}
	Complete(task, std::exception_ptr());
}

// call with the admission table locked
bool tRetrievalService::Boost(const tTaskPtr& task, double priority)
{
	lockguard g(this);
	auto it = m_queue.find(task);
	if(it == m_queue.end())
		return false;
	m_queue.erase(it);
	task->Refresh(priority);
	m_queue.insert(task);
	return true;
}

tTaskPtr tRetrievalService::Submit(tRetrieverPtr retriever, double priority)
{
	if(!retriever)
		throw std::invalid_argument("retriever must not be null");
	if(retriever->GetName().empty())
		throw std::invalid_argument("retriever name must not be empty");

	LOGSTARTFUNCx(retriever->GetName(), priority);

	if(m_netStatus && !retriever->GetNetworkStatus())
		retriever->SetNetworkStatus(m_netStatus);

	uint64_t seq;
	{
		lockguard g(this);
		seq = m_nSeq++;
	}
	auto fresh = make_shared<tRetrievalTask>(retriever, priority, seq);
	bool bQueueFull = false;

	auto reuse = [&](const tTaskPtr& existing)
	{
		// a cancelled task may linger until its cleanup, do not hand it out again
		if(existing->IsDone())
			return false;
		if(Boost(existing, priority))
			LOG("raised priority of the queued task");
		return true;
	};
	auto enqueue = [&](const tTaskPtr& t)
	{
		lockguard g(this);
		if(m_bShutdown)
			return false;
		if(m_queue.size() >= m_nQueueSize)
		{
			bQueueFull = true;
			return false;
		}
		t->Refresh(priority);
		t->SetCancelHook([this](const tTaskPtr& p) { OnCancelled(p); });
		m_queue.insert(t);
		m_obj_cond.notify_one();
		return true;
	};

	auto ret = m_admission.Admit(fresh, reuse, enqueue);
	if(!ret)
	{
		log::misc(mstring(bQueueFull ? "Retrieval queue full, rejected: " : "Resource rejected: ")
				+ retriever->GetName(), log::FAILNOTE);
	}
	return ret;
}

bool tRetrievalService::IsAvailable()
{
	lockguard g(this);
	return !m_bShutdown;
}

size_t tRetrievalService::GetQueueLength()
{
	lockguard g(this);
	return m_queue.size();
}

double tRetrievalService::GetProgress()
{
	off_t nTotal = 0, nRead = 0;
	for(const auto& task : m_admission.Snapshot())
	{
		try
		{
			auto& rtr = task->GetRetriever();
			auto len = rtr->GetContentLength();
			if(len <= 0)
				continue;
			nTotal += len;
			nRead += rtr->GetContentLengthRead();
		}
		catch(const std::exception& ex)
		{
			log::misc("Exception retrieving content sizes of " + task->GetName() + ": " + ex.what(),
					log::FAILNOTE);
		}
	}
	if(nTotal <= 0)
		return 0;
	return min(100.0, 100.0 * double(nRead) / double(nTotal));
}

void tRetrievalService::Shutdown(bool immediately)
{
	LOGSTARTFUNCx(immediately);
	decltype(m_queue) dropped;
	{
		lockguard g(this);
		m_bShutdown = true;
		if(immediately)
			dropped.swap(m_queue);
		notifyAll();
	}
	if(immediately)
	{
		auto running = m_admission.Snapshot();
		for(const auto& task : dropped)
		{
			task->Cancel(false);
			Complete(task, std::exception_ptr());
		}
		for(const auto& task : running)
		{
			if(!dropped.count(task))
				task->Cancel(true);
		}
	}
	m_admission.Clear();
}

int tRetrievalService::GetPoolSize()
{
	lockguard g(this);
	return m_nPoolSize;
}

size_t tRetrievalService::GetWorkerCount()
{
	lockguard g(this);
	ReapWorkers();
	return m_threads.size();
}

void tRetrievalService::SetPoolSize(int n)
{
	if(n < 1)
		throw std::invalid_argument("Retrieval pool size must be at least one");
	lockguard g(this);
	m_nPoolSize = n;
	// surplus workers leave after their current task
	SpawnWorkers();
}

}
