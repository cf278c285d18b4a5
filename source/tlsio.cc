/*
 * tlsio.cc
 *
 * Process wide TLS client context.
 */

#include "meta.h"
#include "tlsio.h"
#include "lockable.h"
#include "rtcfg.h"

#ifdef HAVE_SSL
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/crypto.h>

namespace rtv
{
namespace atls
{

static SSL_CTX *g_ssl_ctx = nullptr;
static unsigned long g_ssl_error = 0;
static std::once_flag g_init_once;

static void DoInit()
{
	OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

	g_ssl_ctx = SSL_CTX_new(TLS_client_method());
	if(!g_ssl_ctx)
	{
		g_ssl_error = ERR_get_error();
		return;
	}
	int ok = 0;
	if(cfg::cafile.empty() && cfg::capath.empty())
		ok = SSL_CTX_set_default_verify_paths(g_ssl_ctx);
	else
		ok = SSL_CTX_load_verify_locations(g_ssl_ctx,
			cfg::cafile.empty() ? nullptr : cfg::cafile.c_str(),
			cfg::capath.empty() ? nullptr : cfg::capath.c_str());
	if (!ok)
	{
		g_ssl_error = ERR_get_error();
		SSL_CTX_free(g_ssl_ctx);
		g_ssl_ctx = nullptr;
	}
}

void Init()
{
	std::call_once(g_init_once, DoInit);
}

void Deinit()
{
	if(g_ssl_ctx)
		SSL_CTX_free(g_ssl_ctx);
	g_ssl_ctx = nullptr;
}

SSL_CTX* GetContext()
{
	Init();
	return g_ssl_ctx;
}

std::string GetInitError()
{
	if(g_ssl_ctx)
		return std::string();
	if(!g_ssl_error)
		return "911 SSL error: context not available";
	auto reason = ERR_reason_error_string(g_ssl_error);
	return std::string("911 SSL error: ") + (reason ? reason : "initialization failure");
}

std::string GetErrorText(const char *context)
{
	auto ec = ERR_get_error();
	auto reason = ec ? ERR_reason_error_string(ec) : nullptr;
	std::string ret("500 SSL error: ");
	if(context)
		ret += context;
	if(reason)
	{
		if(context)
			ret += ", ";
		ret += reason;
	}
	else if(!context)
		ret += "Generic SSL failure";
	return ret;
}

}
}
#endif // HAVE_SSL
