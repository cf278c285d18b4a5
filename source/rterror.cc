#include "rterror.h"

using namespace std;

namespace rtv
{

int tRetrievalException::GetCode() const
{
	auto n = atoi(what());
	return n > 0 ? n : 500;
}

LPCSTR tTransportException::KindName(eKind k)
{
	switch(k)
	{
	case TIMEOUT: return "timeout";
	case CONNECT: return "connect";
	case UNKNOWN_HOST: return "unknown host";
	case HOST_UNAVAILABLE: return "host unavailable";
	}
	return "unknown";
}

static void append_nested(mstring& out, const std::exception& ex)
{
	if(!out.empty())
		out += ": ";
	out += ex.what();
	try
	{
		std::rethrow_if_nested(ex);
	}
	catch(const std::exception& inner)
	{
		append_nested(out, inner);
	}
	catch(...)
	{
		out += ": (unknown)";
	}
}

mstring FormatNested(const std::exception& ex)
{
	mstring ret;
	append_nested(ret, ex);
	return ret;
}

}
