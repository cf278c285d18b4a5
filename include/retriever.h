#ifndef _RETRIEVER_H
#define _RETRIEVER_H

#include "config.h"
#include "meta.h"
#include "lockable.h"

#include <memory>
#include <atomic>

namespace rtv
{

class INetworkStatus;
class IPostProcessor;

/**
 * One fetch attempt of a resource, executed synchronously by a worker thread.
 *
 * The state moves from NotStarted through Connecting and Reading into exactly one of the
 * terminal states (Successful, Error, Interrupted). Only the executing thread changes the state,
 * other threads may read the state and the progress counters at any time.
 */
class RTV_API tRetriever : public base_with_mutex
{
public:
	enum eState : int
	{
		NotStarted,
		Connecting,
		Reading,
		Interrupted,
		Error,
		Successful
	};

	//! protocol dependent response information, code 200 is OK for all kinds
	struct tProtocolInfo
	{
		enum eKind : char
		{
			NONE,
			HTTP,
			ARCHIVE
		} kind = NONE;
		int code = 0;
		bool IsOk() const { return code == 200; }
	};

	tRetriever(cmstring& sName, std::shared_ptr<IPostProcessor> postProcessor);
	virtual ~tRetriever();

	/**
	 * Runs the retrieval on the calling thread. Returns normally when the outcome is
	 * Successful or Interrupted, rethrows the failure otherwise. The post-processor runs in
	 * every case once the state is terminal.
	 */
	void Execute();

	/**
	 * Completes a retrieval which will never be executed: the state goes to Error and the
	 * end-of-life step runs as if the execution had failed.
	 */
	void MarkFailed();

	cmstring& GetName() const { return m_sName; }
	//! key for the network health bookkeeping, empty if not applicable
	virtual mstring GetHost() const { return mstring(); }
	/**
	 * Asks for the first member of ZIP payloads instead of the archive itself.
	 * @return false if this kind of retriever does not deliver ZIP payloads
	 */
	virtual bool SetExtractZipEntry(bool bExtract) { (void) bExtract; return false; }
	eState GetState() const { return m_state.load(); }
	static bool IsTerminal(eState st) { return st == Interrupted || st == Error || st == Successful; }
	static LPCSTR GetStateName(eState st);

	//! total payload size if known, otherwise zero or negative
	virtual off_t GetContentLength() const { return m_nContentLength.load(); }
	off_t GetContentLengthRead() const { return m_nContentLengthRead.load(); }
	mstring GetContentType() const;
	//! UTC seconds, 0 if unknown
	time_t GetExpirationTime() const { return m_nExpiration.load(); }
	tProtocolInfo GetProtocolInfo() const;

	tBytes GetBuffer() const;
	tBytes TakeBuffer();

	//! timeouts in milliseconds, the defaults come from the configuration
	int GetConnectTimeout() const { return m_nConnectTimeout; }
	void SetConnectTimeout(int ms) { m_nConnectTimeout = ms; }
	int GetReadTimeout() const { return m_nReadTimeout; }
	void SetReadTimeout(int ms) { m_nReadTimeout = ms; }

	//! milliseconds a request may wait in the queue, the configured value is used for -1
	int GetStaleRequestLimit() const;
	void SetStaleRequestLimit(int ms) { m_nStaleLimit = ms; }

	//! coarse submission time bucket, see TIME_PRIORITY_GRANULARITY
	int64_t GetSubmitEpoch() const { return m_nSubmitEpoch.load(); }
	void SetSubmitEpoch(int64_t epoch) { m_nSubmitEpoch.store(epoch); }
	static int64_t MakeEpoch() { return GetTimeMs() / TIME_PRIORITY_GRANULARITY; }

	std::shared_ptr<INetworkStatus> GetNetworkStatus() const;
	void SetNetworkStatus(std::shared_ptr<INetworkStatus> p);

	const std::shared_ptr<IPostProcessor>& GetPostProcessor() const { return m_postProcessor; }

protected:
	//! Connection setup, the timeouts are validated before
	virtual void OpenConnection() =0;
	//! Reads the whole payload, may return an empty buffer for no content
	virtual tBytes DoRead() =0;

	void SetContentLength(off_t n) { m_nContentLength.store(n); }
	void SetContentLengthRead(off_t n) { m_nContentLengthRead.store(n); }
	void AddContentLengthRead(off_t n) { m_nContentLengthRead.fetch_add(n); }
	void SetContentType(cmstring& s);
	void SetExpirationTime(time_t t) { m_nExpiration.store(t); }
	void SetProtocolInfo(tProtocolInfo info);

private:
	tRetriever(const tRetriever&) = delete;
	tRetriever& operator=(const tRetriever&) = delete;

	bool CheckInterrupted();
	void SetState(eState st);
	void RunEndOfLife();

	const mstring m_sName;
	std::shared_ptr<IPostProcessor> m_postProcessor;
	std::shared_ptr<INetworkStatus> m_netStatus;

	std::atomic<eState> m_state;
	std::atomic<off_t> m_nContentLength, m_nContentLengthRead;
	std::atomic<time_t> m_nExpiration;
	std::atomic<int64_t> m_nSubmitEpoch;
	int m_nConnectTimeout, m_nReadTimeout, m_nStaleLimit = -1;

	// guarded by the mutex
	mstring m_sContentType;
	tProtocolInfo m_protoInfo;
	tBytes m_buffer;
};

typedef std::shared_ptr<tRetriever> tRetrieverPtr;

/**
 * Creates the retriever for the URL scheme: http and https, or jar:file:...!/entry for an
 * entry of a local ZIP archive.
 * @return nullptr for unsupported or malformed URLs
 */
tRetrieverPtr RTV_API CreateRetriever(cmstring& url, std::shared_ptr<IPostProcessor> postProcessor);

}

#endif
