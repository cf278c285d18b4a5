/*
 * tlsio.h
 *
 * Process wide TLS client context.
 */

#ifndef INCLUDE_TLSIO_H_
#define INCLUDE_TLSIO_H_

#include "config.h"
#include <string>

#ifdef HAVE_SSL
#include <openssl/ssl.h>
#endif

namespace rtv
{

// helper which needs to be initialized once per address space
namespace atls
{

#ifdef HAVE_SSL
	//! Thread-safe, only the first call does the work
	void RTV_API Init();
	void RTV_API Deinit();
	SSL_CTX* GetContext();
	//! status line of the initialization failure, empty if the context is usable
	std::string RTV_API GetInitError();
	//! status line text for the recent OpenSSL error queue entry
	std::string GetErrorText(const char *context);
#endif

};

}

#endif /* INCLUDE_TLSIO_H_ */
