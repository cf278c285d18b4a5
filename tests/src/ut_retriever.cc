#include "gtest/gtest.h"
#include "retriever.h"
#include "httpretriever.h"
#include "arcretriever.h"
#include "postproc.h"
#include "interrupt.h"
#include "testhelpers.h"

using namespace rtv;
using namespace rtv::test;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Invoke;

class retriever : public tConfigReset {};

TEST_F(retriever, successfulRun)
{
	auto pp = std::make_shared<MockPostProcessor>();
	auto ns = std::make_shared<MockNetworkStatus>();
	auto r = std::make_shared<tFakeRetriever>("http://example.org/a", pp);
	r->host = "example.org";
	r->SetNetworkStatus(ns);
	r->onRead = [](tFakeRetriever& self)
	{
		EXPECT_EQ(self.GetState(), tRetriever::Reading);
		self.Progress(5, 5);
		return ToBytes("hello");
	};

	EXPECT_CALL(*ns, LogAvailableHost(mstring("example.org"))).Times(1);
	EXPECT_CALL(*ns, LogUnavailableHost(_)).Times(0);
	EXPECT_CALL(*pp, Run(_)).WillOnce(Invoke([](tRetriever& rr)
	{
		EXPECT_EQ(rr.GetState(), tRetriever::Successful);
		return rr.TakeBuffer();
	}));

	ASSERT_EQ(r->GetState(), tRetriever::NotStarted);
	ASSERT_NO_THROW(r->Execute());
	ASSERT_EQ(r->GetState(), tRetriever::Successful);
	ASSERT_EQ(ToString(r->GetBuffer()), "hello");
	ASSERT_EQ(r->GetContentLength(), 5);
	ASSERT_EQ(r->GetContentLengthRead(), 5);
}

TEST_F(retriever, emptyPayloadIsNotAnError)
{
	auto r = std::make_shared<tFakeRetriever>("empty");
	r->onRead = [](tFakeRetriever& self)
	{
		self.Progress(100, 0);
		return tBytes();
	};
	r->Execute();
	ASSERT_EQ(r->GetState(), tRetriever::Successful);
	ASSERT_EQ(r->GetContentLength(), 0);
	ASSERT_TRUE(r->GetBuffer().empty());
}

TEST_F(retriever, connectFailure)
{
	auto pp = std::make_shared<MockPostProcessor>();
	auto ns = std::make_shared<MockNetworkStatus>();
	auto r = std::make_shared<tFakeRetriever>("http://bad.example/", pp);
	r->host = "bad.example";
	r->SetNetworkStatus(ns);
	r->onConnect = []() { throw tTransportException(tTransportException::CONNECT, "503 Connection refused"); };
	bool readCalled = false;
	r->onRead = [&](tFakeRetriever&) { readCalled = true; return tBytes(); };

	EXPECT_CALL(*ns, LogUnavailableHost(mstring("bad.example"))).Times(1);
	EXPECT_CALL(*ns, LogAvailableHost(_)).Times(0);
	EXPECT_CALL(*pp, Run(_)).WillOnce(Invoke([](tRetriever& rr)
	{
		EXPECT_EQ(rr.GetState(), tRetriever::Error);
		return tBytes();
	}));

	ASSERT_THROW(r->Execute(), tTransportException);
	ASSERT_EQ(r->GetState(), tRetriever::Error);
	ASSERT_FALSE(readCalled);
}

TEST_F(retriever, interruptedBeforeStart)
{
	auto pp = std::make_shared<MockPostProcessor>();
	auto r = std::make_shared<tFakeRetriever>("x", pp);
	EXPECT_CALL(*pp, Run(_)).WillOnce(Return(tBytes()));
	std::atomic_bool flag(true);
	{
		interrupt::tScope sc(flag);
		ASSERT_NO_THROW(r->Execute());
	}
	ASSERT_EQ(r->GetState(), tRetriever::Interrupted);
	ASSERT_EQ(r->nExecutions.load(), 0);
}

TEST_F(retriever, interruptedWhileConnecting)
{
	auto r = std::make_shared<tFakeRetriever>("x");
	std::atomic_bool flag(false);
	bool readCalled = false;
	r->onConnect = [&]() { flag = true; };
	r->onRead = [&](tFakeRetriever&) { readCalled = true; return tBytes(); };
	{
		interrupt::tScope sc(flag);
		r->Execute();
	}
	ASSERT_EQ(r->GetState(), tRetriever::Interrupted);
	ASSERT_FALSE(readCalled);
}

TEST_F(retriever, interruptionDuringReadIsNotAnError)
{
	auto r = std::make_shared<tFakeRetriever>("x");
	r->onRead = [](tFakeRetriever&) -> tBytes { throw tInterruptedException(); };
	ASSERT_NO_THROW(r->Execute());
	ASSERT_EQ(r->GetState(), tRetriever::Interrupted);
}

TEST_F(retriever, unexpectedFailure)
{
	auto ns = std::make_shared<MockNetworkStatus>();
	auto r = std::make_shared<tFakeRetriever>("x");
	r->host = "h";
	r->SetNetworkStatus(ns);
	EXPECT_CALL(*ns, LogUnavailableHost(_)).Times(0);
	r->onRead = [](tFakeRetriever&) -> tBytes { throw std::logic_error("boom"); };
	ASSERT_THROW(r->Execute(), std::logic_error);
	ASSERT_EQ(r->GetState(), tRetriever::Error);
}

TEST_F(retriever, postProcessorFailureTurnsIntoError)
{
	auto pp = std::make_shared<MockPostProcessor>();
	auto r = std::make_shared<tFakeRetriever>("x", pp);
	r->onRead = [](tFakeRetriever&) { return ToBytes("data"); };
	EXPECT_CALL(*pp, Run(_)).WillOnce(Throw(std::runtime_error("disk full")));
	try
	{
		r->Execute();
		FAIL() << "no exception";
	}
	catch(const tPostProcessException& ex)
	{
		ASSERT_NE(FormatNested(ex).find("disk full"), stmiss);
	}
	ASSERT_EQ(r->GetState(), tRetriever::Error);
}

TEST_F(retriever, unspecifiedTimeout)
{
	auto r = std::make_shared<tFakeRetriever>("x");
	r->SetReadTimeout(0);
	ASSERT_THROW(r->Execute(), tRetrievalException);
	ASSERT_EQ(r->GetState(), tRetriever::Error);
	ASSERT_EQ(r->nExecutions.load(), 0);
}

TEST_F(retriever, terminalStateIsFinal)
{
	auto r = std::make_shared<tFakeRetriever>("x");
	r->Execute();
	ASSERT_EQ(r->GetState(), tRetriever::Successful);
	r->Execute();
	ASSERT_EQ(r->GetState(), tRetriever::Successful);
}

TEST_F(retriever, markFailedRunsEndOfLife)
{
	auto pp = std::make_shared<MockPostProcessor>();
	auto r = std::make_shared<tFakeRetriever>("x", pp);
	EXPECT_CALL(*pp, Run(_)).WillOnce(Return(tBytes()));
	r->MarkFailed();
	ASSERT_EQ(r->GetState(), tRetriever::Error);
	ASSERT_EQ(r->nExecutions.load(), 0);
}

TEST_F(retriever, defaultsFromConfig)
{
	auto r = std::make_shared<tFakeRetriever>("x");
	ASSERT_EQ(r->GetConnectTimeout(), cfg::contimeout);
	ASSERT_EQ(r->GetReadTimeout(), cfg::readtimeout);
	ASSERT_EQ(r->GetStaleRequestLimit(), cfg::stalelimit);
	r->SetStaleRequestLimit(5);
	ASSERT_EQ(r->GetStaleRequestLimit(), 5);
}

TEST_F(retriever, factory)
{
	auto h = CreateRetriever("https://example.org:8443/some/path?x=1", nullptr);
	ASSERT_TRUE(h);
	auto http = std::dynamic_pointer_cast<tHttpRetriever>(h);
	ASSERT_TRUE(http);
	ASSERT_EQ(http->GetHost(), "example.org");
	ASSERT_EQ(http->GetName(), "https://example.org:8443/some/path?x=1");

	auto j = CreateRetriever("jar:file:/tmp/a.zip!/dir/entry.xml", nullptr);
	auto arc = std::dynamic_pointer_cast<tArchiveRetriever>(j);
	ASSERT_TRUE(arc);
	ASSERT_EQ(arc->GetArchivePath(), "/tmp/a.zip");
	ASSERT_EQ(arc->GetEntryName(), "dir/entry.xml");
	ASSERT_TRUE(arc->GetHost().empty());

	// only HTTP payloads can be unpacked on the fly
	ASSERT_FALSE(http->GetExtractZipEntry());
	ASSERT_TRUE(h->SetExtractZipEntry(true));
	ASSERT_TRUE(http->GetExtractZipEntry());
	ASSERT_FALSE(j->SetExtractZipEntry(true));

	ASSERT_FALSE(CreateRetriever("ftp://example.org/file", nullptr));
	ASSERT_FALSE(CreateRetriever("no-scheme", nullptr));
	ASSERT_FALSE(CreateRetriever("jar:file:/tmp/a.zip", nullptr));
}

namespace
{
class tRecordingPostProcessor : public tBasicPostProcessor
{
public:
	int absent = 0, invalid = 0;
protected:
	void MarkResourceAbsent(tRetriever&) override { absent++; }
	void HandleInvalidResponseCode(tRetriever& r) override { invalid++; tBasicPostProcessor::HandleInvalidResponseCode(r); }
};
}

TEST_F(retriever, basicPostProcessor)
{
	auto pp = std::make_shared<tRecordingPostProcessor>();

	auto ok = std::make_shared<tFakeRetriever>("res/file.txt", pp);
	ok->onRead = [](tFakeRetriever& self)
	{
		self.Protocol(tRetriever::tProtocolInfo::HTTP, 200, "text/plain; charset=utf-8");
		return ToBytes("text");
	};
	ok->Execute();
	ASSERT_EQ(ToString(ok->GetBuffer()), "text");
	ASSERT_EQ(pp->absent, 0);

	auto notFound = std::make_shared<tFakeRetriever>("res/missing.png", pp);
	notFound->onRead = [](tFakeRetriever& self)
	{
		self.Protocol(tRetriever::tProtocolInfo::HTTP, 404, "text/html");
		return ToBytes("<html/>");
	};
	notFound->Execute();
	ASSERT_TRUE(notFound->GetBuffer().empty());
	ASSERT_EQ(pp->invalid, 1);
	ASSERT_EQ(pp->absent, 1);

	auto failed = std::make_shared<tFakeRetriever>("res/fail", pp);
	failed->onConnect = []() { throw tRetrievalException("500 broken"); };
	ASSERT_THROW(failed->Execute(), tRetrievalException);
	ASSERT_EQ(pp->absent, 2);

	// no content type, guessed from the name
	auto guessed = std::make_shared<tFakeRetriever>("tiles/1/2/3.png", pp);
	guessed->onRead = [](tFakeRetriever& self)
	{
		self.Protocol(tRetriever::tProtocolInfo::ARCHIVE, 200, "");
		return ToBytes("PNG");
	};
	guessed->Execute();
	ASSERT_EQ(ToString(guessed->GetBuffer()), "PNG");
}

namespace
{
class tFailingStorePostProcessor : public tRecordingPostProcessor
{
protected:
	tBytes HandleTextContent(tRetriever&) override { throw std::runtime_error("disk full"); }
};
}

TEST_F(retriever, contentHandlingFailureIsContained)
{
	auto pp = std::make_shared<tFailingStorePostProcessor>();
	auto r = std::make_shared<tFakeRetriever>("doc.txt", pp);
	r->onRead = [](tFakeRetriever& self)
	{
		self.Protocol(tRetriever::tProtocolInfo::HTTP, 200, "text/plain");
		return ToBytes("some text");
	};
	ASSERT_NO_THROW(r->Execute());
	ASSERT_EQ(r->GetState(), tRetriever::Successful);
	ASSERT_TRUE(r->GetBuffer().empty());
	ASSERT_EQ(pp->absent, 1);
}
