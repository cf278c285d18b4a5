/*
 * tcpconnect.h
 *
 * Blocking outgoing connection, optionally with TLS on top.
 */

#ifndef TCPCONNECT_H_
#define TCPCONNECT_H_

#include "meta.h"
#include <memory>

#ifdef HAVE_SSL
#include <openssl/ssl.h>
#endif

namespace rtv
{

class RTV_API tcpconnect
{
public:
	virtual ~tcpconnect();

	/**
	 * Resolves the target host and connects to the first reachable address, then does the TLS
	 * handshake for https targets. All of it must complete within timeoutMs.
	 *
	 * @throw tTransportException (UNKNOWN_HOST, CONNECT, TIMEOUT), tTlsException,
	 * tInterruptedException
	 */
	static std::unique_ptr<tcpconnect> Connect(const tHostPortProto& target, int timeoutMs);

	int GetFD() const { return m_conFd.get(); }
	inline cmstring & GetHostname() const { return m_sHostName; }
	inline cmstring & GetPort() const { return m_sPort; }
	bool IsSslMode() const { return m_bUseSsl; }

	//! Sends all data, each wait for socket space is bounded by timeoutMs
	void Send(const char *data, size_t len, int timeoutMs);
	/**
	 * Reads what is available, waiting at most timeoutMs for the first byte.
	 * @return Number of read bytes, 0 on end of stream
	 * @throw tTransportException (TIMEOUT), tRetrievalException, tInterruptedException
	 */
	size_t Recv(char *buf, size_t maxlen, int timeoutMs);

	/**
	 * Waits until the socket becomes readable (or writable), polling the interruption flag in
	 * between.
	 * @return false on timeout
	 */
	static bool WaitReady(int fd, bool forWrite, int timeoutMs);

protected:
	tcpconnect(cmstring& sHost, cmstring& sPort);
	tcpconnect(const tcpconnect&) = delete;
	tcpconnect& operator=(const tcpconnect&) = delete;

	unique_fd m_conFd;
	bool m_bUseSsl = false;
	mstring m_sHostName, m_sPort;

	void DoConnect(int64_t deadlineMs);

#ifdef HAVE_SSL
	SSL *m_ssl = nullptr;
	void SSLinit(int64_t deadlineMs);
#endif
};
}

#endif /* TCPCONNECT_H_ */
