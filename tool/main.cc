#include "config.h"
#include "meta.h"
#include "rtcfg.h"
#include "rtlogger.h"
#include "rterror.h"
#include "retriever.h"
#include "postproc.h"
#include "netstatus.h"
#include "rtservice.h"
#include "tlsio.h"

#include <sys/stat.h>
#include <signal.h>
#include <cstring>
#include <cerrno>
#include <cstdlib>

#include <iostream>
#include <fstream>
#include <vector>

using namespace std;
using namespace rtv;

static void usage(int retCode = 0)
{
	cout << "Usage: rtvfetch [options] [Key=value ...] URL[@priority] ...\n\n"
		"Options:\n"
		"-h: this help message\n"
		"-c: configuration directory\n"
		"-i: ignore configuration loading errors\n"
		"-o: directory where the payloads are stored\n"
		"-v: extra verbosity in logging\n"
		"-z: unpack the first member of ZIP payloads received via HTTP\n"
		"\n"
		"URL can be http://..., https://... or jar:file:/path/archive.zip!/member\n"
		"\n"
		"Most interesting variables:\n"
		"LogDir: /directory/for/logfiles\n"
		"RetrievalPoolSize: number of parallel retrievals (default: 8)\n"
		"ConnectTimeout, ReadTimeout: timeouts in milliseconds\n"
		"OfflineMode: treat every host as unavailable\n"
		"\n"
		"Run with -v CfgDump=1 to see all settings.\n";
	exit(retCode);
}

struct tRequest
{
	mstring url;
	double priority = 0;
	tRetrieverPtr retriever;
	tTaskPtr task;
};

static bool IsUrl(cmstring& s)
{
	return s.find("://") != stmiss || startsWithSz(s, "jar:");
}

//! splits a trailing @priority suffix, the URL stays untouched if the suffix is not a number
static tRequest ParseRequest(cmstring& arg)
{
	tRequest ret;
	ret.url = arg;
	auto pos = arg.rfind('@');
	if(pos == stmiss || pos + 1 >= arg.size())
		return ret;
	char *end = nullptr;
	auto val = strtod(arg.c_str() + pos + 1, &end);
	if(end && !*end)
	{
		ret.url = arg.substr(0, pos);
		ret.priority = val;
	}
	return ret;
}

//! file name for the payload, the last path element or a numbered fallback
static mstring MakeOutputName(cmstring& url, unsigned index)
{
	auto sep = url.find_last_of("/!");
	mstring name = sep == stmiss ? url : url.substr(sep + 1);
	auto q = name.find_first_of("?#");
	if(q != stmiss)
		name.erase(q);
	if(name.empty() || name == "." || name == "..")
		name = "payload";
	return to_string(index) + "_" + name;
}

int main(int argc, const char **argv)
{
	LPCSTR szCfgDir = nullptr, szOutDir = nullptr;
	bool bExtraVerb = false, bIgnoreCfgErrors = false, bUnzip = false, bDumpCfg = false;
	tStrVec cmdvars;
	vector<tRequest> requests;

	for (auto p = argv + 1; p < argv + argc; p++)
	{
		if (!strncmp(*p, "-h", 2))
			usage();
		else if (!strcmp(*p, "-i"))
			bIgnoreCfgErrors = true;
		else if (!strcmp(*p, "-v"))
			bExtraVerb = true;
		else if (!strcmp(*p, "-z"))
			bUnzip = true;
		else if (!strcmp(*p, "-c") || !strcmp(*p, "-o"))
		{
			auto& target = (*p)[1] == 'c' ? szCfgDir : szOutDir;
			++p;
			if (p < argv + argc)
				target = *p;
			else
				usage(2);
		}
		else if (**p == '-')
			usage(2);
		else if (IsUrl(*p))
			requests.emplace_back(ParseRequest(*p));
		else if (!strcmp(*p, "CfgDump=1"))
			bDumpCfg = true;
		else if (**p)
			cmdvars.emplace_back(*p);
	}

	try
	{
		cfg::tConfigBuilder builder(false, bIgnoreCfgErrors);
		if (szCfgDir)
			builder.AddConfigDirectory(szCfgDir);
		for (const auto& keyval : cmdvars)
			builder.AddOption(keyval);
		builder.Build();
	}
	catch (const tStartupException& ex)
	{
		cerr << ex.what() << endl;
		return EXIT_FAILURE;
	}

	if (bExtraVerb)
		cfg::debug |= (log::LOG_DEBUG | log::LOG_MORE);
	if (bDumpCfg)
	{
		cfg::dump_config();
		return EXIT_SUCCESS;
	}
	if (requests.empty())
		usage(1);

	if (!log::open())
	{
		cerr << "Problem creating log files. Check permissions of the log directory, "
				<< cfg::logdir << endl;
		return EXIT_FAILURE;
	}
	tDtorEx closeLogs([]() { log::close(false); });

	if (szOutDir && mkdir(szOutDir, cfg::dirperms) && errno != EEXIST)
	{
		cerr << tErrnoFmter("Cannot create output directory: ") << endl;
		return EXIT_FAILURE;
	}

	signal(SIGPIPE, SIG_IGN);
#ifdef HAVE_SSL
	atls::Init();
#endif

	int nFailed = 0;
	auto postProc = make_shared<tBasicPostProcessor>();
	auto netStatus = make_shared<tBasicNetworkStatus>();

	if (netStatus->IsNetworkUnavailable(cfg::netcheckinterval))
		cerr << "Warning: network seems to be unavailable" << endl;

	{
		tRetrievalService service(netStatus);

		for (auto& rq : requests)
		{
			rq.retriever = CreateRetriever(rq.url, postProc);
			if (!rq.retriever)
			{
				cerr << rq.url << ": unsupported or malformed URL" << endl;
				continue;
			}
			if (bUnzip && !rq.retriever->SetExtractZipEntry(true) && bExtraVerb)
				cerr << rq.url << ": -z does not apply" << endl;
			rq.task = service.Submit(rq.retriever, rq.priority);
			if (!rq.task)
				cerr << rq.url << ": rejected by the scheduler" << endl;
		}

		unsigned index = 0;
		for (auto& rq : requests)
		{
			++index;
			if (!rq.task)
			{
				nFailed++;
				continue;
			}
			try
			{
				auto rtr = rq.task->Get();
				auto info = rtr->GetProtocolInfo();
				auto payload = rtr->GetBuffer();
				cout << rq.url << ": " << tRetriever::GetStateName(rtr->GetState())
						<< " " << info.code << " " << payload.size() << " bytes";
				if (!rtr->GetContentType().empty())
					cout << " (" << rtr->GetContentType() << ")";
				cout << endl;
				if (rtr->GetState() != tRetriever::Successful || !info.IsOk())
				{
					nFailed++;
					continue;
				}
				if (!szOutDir)
					continue;
				auto path = mstring(szOutDir) + "/" + MakeOutputName(rq.url, index);
				ofstream out(path, ios::binary | ios::trunc);
				out.write((const char*) payload.data(), payload.size());
				out.close();
				if (!out)
				{
					cerr << path << ": " << tErrnoFmter("write error: ") << endl;
					nFailed++;
				}
			}
			catch (const std::exception& ex)
			{
				nFailed++;
				cout << rq.url << ": " << GetFailureClassName(rq.task->GetFailureClass())
						<< " failure: " << FormatNested(ex) << endl;
			}
		}
		service.Shutdown(false);
	}

	log::flush();
	return nFailed ? EXIT_FAILURE : EXIT_SUCCESS;
}
