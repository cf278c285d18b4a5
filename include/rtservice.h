#ifndef _RTSERVICE_H
#define _RTSERVICE_H

#include "config.h"
#include "meta.h"
#include "lockable.h"
#include "rtask.h"
#include "admission.h"
#include "failclass.h"

#include <set>
#include <vector>
#include <thread>

namespace rtv
{

class INetworkStatus;

/**
 * Priority scheduler for retrievals.
 *
 * A fixed number of worker threads take tasks from a bounded ready queue, highest key first.
 * Requests for a resource which is already queued or running are merged into the existing task.
 * Pool size, queue size and stale request limit are taken from the configuration.
 */
class RTV_API tRetrievalService : public base_with_condition
{
public:
	explicit tRetrievalService(std::shared_ptr<INetworkStatus> netStatus = std::shared_ptr<INetworkStatus>(),
			std::shared_ptr<ISecurityListener> listener = std::shared_ptr<ISecurityListener>());
	//! Cancels pending work unless a graceful shutdown was requested, then joins all workers
	~tRetrievalService();

	/**
	 * Admits a retriever or merges the request into the task already admitted for its name.
	 * The queue order key is priority plus submission epoch, so a priority of one unit is
	 * worth one epoch of waiting. Negative priorities are allowed and simply rank lower.
	 * @return the task handle, or empty if the service is shut down or the queue is full
	 * @throw std::invalid_argument for a null retriever or an empty name
	 */
	tTaskPtr Submit(tRetrieverPtr retriever, double priority);

	//! true while at least one worker executes a retrieval
	bool HasActiveTasks() const { return m_nActive.load() > 0; }
	bool IsAvailable();
	//! percent of the known content length which was read by the admitted retrievals
	double GetProgress();

	/**
	 * Stops accepting work. Immediate shutdown cancels queued tasks and interrupts the running
	 * ones, otherwise the queue is drained by the workers. The admission table is cleared.
	 */
	void Shutdown(bool immediately);

	int GetPoolSize();
	void SetPoolSize(int n);

	std::shared_ptr<ISecurityListener> GetSecurityListener() const { return m_classifier.GetSecurityListener(); }
	void SetSecurityListener(std::shared_ptr<ISecurityListener> p) { m_classifier.SetSecurityListener(move(p)); }

	// introspection
	size_t GetQueueLength();
	tAdmissionTable& GetAdmissionTable() { return m_admission; }
	//! worker threads not joined yet, joins those which left after a pool shrink
	size_t GetWorkerCount();

private:
	tRetrievalService(const tRetrievalService&) = delete;
	tRetrievalService& operator=(const tRetrievalService&) = delete;

	void SpawnWorkers();
	void ReapWorkers();
	void WorkerLoop();
	void RunTask(const tTaskPtr& task);
	void Complete(const tTaskPtr& task, std::exception_ptr failure);
	void OnCancelled(const tTaskPtr& task);
	bool Boost(const tTaskPtr& task, double priority);

	std::shared_ptr<INetworkStatus> m_netStatus;
	tFailureClassifier m_classifier;
	tAdmissionTable m_admission;

	// guarded by the mutex
	std::set<tTaskPtr, tTaskOrder> m_queue;
	std::vector<std::thread> m_threads;
	std::vector<std::thread::id> m_finished;
	int m_nPoolSize, m_nThreads = 0;
	size_t m_nQueueSize;
	bool m_bShutdown = false;
	uint64_t m_nSeq = 0;

	std::atomic_int m_nActive;
};

}

#endif
