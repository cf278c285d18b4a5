/*
 * tcpconnect.cc
 *
 * Blocking outgoing connection, optionally with TLS on top.
 */

#include <sys/select.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>

#include "debug.h"

#include "meta.h"
#include "tcpconnect.h"
#include "rtcfg.h"
#include "rterror.h"
#include "dnsres.h"
#include "interrupt.h"
#include "tlsio.h"

using namespace std;

#ifdef HAVE_SSL
#include <openssl/bio.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>
#endif

namespace rtv
{

tcpconnect::tcpconnect(cmstring& sHost, cmstring& sPort) :
		m_sHostName(sHost), m_sPort(sPort)
{
}

tcpconnect::~tcpconnect()
{
	LOGSTART("tcpconnect::~tcpconnect, terminating outgoing connection");
#ifdef HAVE_SSL
	if (m_ssl)
		SSL_free(m_ssl);
#endif
}

bool tcpconnect::WaitReady(int fd, bool forWrite, int timeoutMs)
{
	auto deadline = GetTimeMs() + timeoutMs;
	while(true)
	{
		interrupt::Check();
		auto remaining = deadline - GetTimeMs();
		if(remaining <= 0)
			return false;
		auto slice = std::min<int64_t>(remaining, interrupt::POLL_SLICE_MS);
		timeval tv { time_t(slice / 1000), suseconds_t((slice % 1000) * 1000) };
		fd_set fds;
		FD_ZERO(&fds);
		FD_SET(fd, &fds);
		auto n = select(fd + 1, forWrite ? nullptr : &fds, forWrite ? &fds : nullptr, nullptr, &tv);
		if(n > 0)
			return true;
		if(n < 0 && errno != EINTR)
			throw tRetrievalException(tErrnoFmter("915 Socket error: "));
	}
}

unique_ptr<tcpconnect> tcpconnect::Connect(const tHostPortProto& target, int timeoutMs)
{
	LOGSTARTs("tcpconnect::Connect");
	if(timeoutMs <= 0)
		throw tRetrievalException("500 unspecified timeout");

	auto deadline = GetTimeMs() + timeoutMs;
	unique_ptr<tcpconnect> ret(new tcpconnect(target.sHost, target.GetPort()));
	ret->DoConnect(deadline);
#ifdef HAVE_SSL
	if(target.bSSL)
		ret->SSLinit(deadline);
#else
	if(target.bSSL)
		throw tTlsException("500 SSL not supported by this build");
#endif
	return ret;
}

void tcpconnect::DoConnect(int64_t deadline)
{
	auto dns = CAddrInfo::Resolve(m_sHostName, m_sPort, std::max<int64_t>(1, deadline - GetTimeMs()));
	interrupt::Check();
	if(dns->HasError())
		throw tTransportException(tTransportException::UNKNOWN_HOST,
				dns->GetError().empty() ? mstring("503 DNS error - unknown host") : dns->GetError());

	// pickup the first and/or probably the best errno code which can be reported to user
	int err_code = 0;
	bool timedOut = false;

	for(auto p = dns->getTcpAddrInfo(); p; p = p->ai_next)
	{
		if(p->ai_socktype != SOCK_STREAM)
			continue;
		unique_fd fd(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
		if(!fd.valid())
		{
			if(!err_code)
				err_code = errno;
			continue;
		}
		set_nb(fd.get());
		int yes(1);
		ignore_value(setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes)));
		LOG("Connecting: " << formatIpPort(p));

		int res;
		while(-1 == (res = ::connect(fd.get(), p->ai_addr, p->ai_addrlen)) && errno == EINTR)
			;
		if(res == 0)
		{
			m_conFd = move(fd);
			return;
		}
		if(errno != EINPROGRESS)
		{
			if(!err_code)
				err_code = errno;
			continue;
		}
		auto remaining = deadline - GetTimeMs();
		if(remaining <= 0 || !WaitReady(fd.get(), true, remaining))
		{
			timedOut = true;
			break;
		}
		int soerr = 0;
		socklen_t optlen = sizeof(soerr);
		if(getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, (void*) &soerr, &optlen) == 0 && 0 == soerr)
		{
			m_conFd = move(fd);
			return;
		}
		if(!err_code)
			err_code = soerr ? soerr : errno;
	}
	if(timedOut || err_code == ETIMEDOUT)
		throw tTransportException(tTransportException::TIMEOUT, "503 Connection timeout");
	throw tTransportException(tTransportException::CONNECT,
			tErrnoFmter("500 Connection failure: ", err_code ? err_code : ENETUNREACH));
}

void tcpconnect::Send(const char *data, size_t len, int timeoutMs)
{
	while(len > 0)
	{
		ssize_t n;
#ifdef HAVE_SSL
		if(m_ssl)
		{
			n = SSL_write(m_ssl, data, int(len));
			if(n <= 0)
			{
				auto sslerr = SSL_get_error(m_ssl, int(n));
				if(sslerr != SSL_ERROR_WANT_READ && sslerr != SSL_ERROR_WANT_WRITE)
					throw tRetrievalException(atls::GetErrorText("write failure"));
				if(!WaitReady(m_conFd.get(), sslerr == SSL_ERROR_WANT_WRITE, timeoutMs))
					throw tTransportException(tTransportException::TIMEOUT, "503 Connection timeout");
				continue;
			}
		}
		else
#endif
		{
			n = ::send(m_conFd.get(), data, len, MSG_NOSIGNAL);
			if(n < 0)
			{
				if(errno == EINTR)
					continue;
				if(errno != EAGAIN && errno != EWOULDBLOCK)
					throw tRetrievalException(tErrnoFmter("502 Send error: "));
				if(!WaitReady(m_conFd.get(), true, timeoutMs))
					throw tTransportException(tTransportException::TIMEOUT, "503 Connection timeout");
				continue;
			}
		}
		data += n;
		len -= n;
	}
}

size_t tcpconnect::Recv(char *buf, size_t maxlen, int timeoutMs)
{
	while(true)
	{
#ifdef HAVE_SSL
		if(m_ssl)
		{
			auto n = SSL_read(m_ssl, buf, int(std::min(maxlen, size_t(MAX_VAL(int)))));
			if(n > 0)
				return n;
			auto sslerr = SSL_get_error(m_ssl, n);
			if(sslerr == SSL_ERROR_ZERO_RETURN)
				return 0;
			if(sslerr == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)
				return 0; // peer went away without close_notify, treat as end of stream
			if(sslerr != SSL_ERROR_WANT_READ && sslerr != SSL_ERROR_WANT_WRITE)
				throw tRetrievalException(atls::GetErrorText("read failure"));
			if(!WaitReady(m_conFd.get(), sslerr == SSL_ERROR_WANT_WRITE, timeoutMs))
				throw tTransportException(tTransportException::TIMEOUT, "503 Connection timeout");
			continue;
		}
#endif
		auto n = ::recv(m_conFd.get(), buf, maxlen, 0);
		if(n >= 0)
			return n;
		if(errno == EINTR)
			continue;
		if(errno != EAGAIN && errno != EWOULDBLOCK)
			throw tRetrievalException(tErrnoFmter("502 Receive error: "));
		if(!WaitReady(m_conFd.get(), false, timeoutMs))
			throw tTransportException(tTransportException::TIMEOUT, "503 Connection timeout");
	}
}

#ifdef HAVE_SSL
void tcpconnect::SSLinit(int64_t deadline)
{
	auto ctx = atls::GetContext();
	if(!ctx)
		throw tTlsException(atls::GetInitError());
	m_ssl = SSL_new(ctx);
	if (!m_ssl)
		throw tTlsException(atls::GetErrorText(nullptr));
	m_bUseSsl = true;

	// for SNI
	SSL_set_tlsext_host_name(m_ssl, m_sHostName.c_str());

	if(!cfg::nsafriendly)
	{
		auto param = SSL_get0_param(m_ssl);
		/* Enable automatic hostname checks */
		X509_VERIFY_PARAM_set_hostflags(param,
				X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
		X509_VERIFY_PARAM_set1_host(param, m_sHostName.c_str(), 0);
		SSL_set_verify(m_ssl, SSL_VERIFY_PEER, nullptr);
	}
	else
		SSL_set_verify(m_ssl, SSL_VERIFY_NONE, nullptr);

	SSL_set_connect_state(m_ssl);
	SSL_set_mode(m_ssl, SSL_MODE_AUTO_RETRY
			| SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER
			| SSL_MODE_ENABLE_PARTIAL_WRITE);

	if(SSL_set_fd(m_ssl, m_conFd.get()) != 1)
		throw tTlsException(atls::GetErrorText("cannot attach socket"));

	while(true)
	{
		auto hret=SSL_connect(m_ssl);
		if(hret == 1 )
			break;
		auto sslerr = SSL_get_error(m_ssl, hret);
		if(hret == 0 || (sslerr != SSL_ERROR_WANT_READ && sslerr != SSL_ERROR_WANT_WRITE))
		{
			auto vres = SSL_get_verify_result(m_ssl);
			if(vres != X509_V_OK)
				throw tTlsException(mstring("500 SSL error: ") + X509_verify_cert_error_string(vres));
			throw tTlsException(atls::GetErrorText("handshake failure"));
		}
		auto remaining = deadline - GetTimeMs();
		if(remaining <= 0 || !WaitReady(m_conFd.get(), sslerr == SSL_ERROR_WANT_WRITE, remaining))
			throw tTransportException(tTransportException::TIMEOUT, "503 SSL handshake timeout");
	}

	if(!cfg::nsafriendly)
	{
		auto hret=SSL_get_verify_result(m_ssl);
		if(hret != X509_V_OK)
			throw tTlsException(mstring("500 SSL error: ") + X509_verify_cert_error_string(hret));
		auto server_cert = SSL_get_peer_certificate(m_ssl);
		if(server_cert)
			X509_free(server_cert);
		else // The handshake was successful although the server did not provide a certificate
			throw tTlsException("500 SSL error: Incompatible remote certificate");
	}
}
#endif

}
