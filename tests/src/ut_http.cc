#include "gtest/gtest.h"
#include "httpretriever.h"
#include "rtservice.h"
#include "testhelpers.h"

using namespace rtv;
using namespace rtv::test;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::_;

class http : public tConfigReset
{
protected:
	tLoopbackServer srv;

	std::shared_ptr<tHttpRetriever> Make(cmstring& path)
	{
		auto r = std::dynamic_pointer_cast<tHttpRetriever>(CreateRetriever(srv.Url(path), nullptr));
		EXPECT_TRUE(r);
		return r;
	}
};

TEST_F(http, sizedBody)
{
	srv.Serve("/tile.png", "HTTP/1.1 200 OK\r\nContent-Type: image/png\r\nContent-Length: 10\r\n"
			"Cache-Control: max-age=3600\r\n\r\n0123456789");
	auto r = Make("/tile.png");
	auto before = GetTime();
	r->Execute();
	ASSERT_EQ(r->GetState(), tRetriever::Successful);
	ASSERT_EQ(r->GetResponseCode(), 200);
	ASSERT_EQ(r->GetResponseMessage(), "200 OK");
	ASSERT_EQ(r->GetProtocolInfo().kind, tRetriever::tProtocolInfo::HTTP);
	ASSERT_EQ(r->GetContentType(), "image/png");
	ASSERT_EQ(r->GetContentLength(), 10);
	ASSERT_EQ(r->GetContentLengthRead(), 10);
	ASSERT_EQ(ToString(r->GetBuffer()), "0123456789");
	ASSERT_GE(r->GetExpirationTime(), before + 3600);

	auto req = srv.LastRequest();
	ASSERT_EQ(req.substr(0, 24), "GET /tile.png HTTP/1.1\r\n");
	ASSERT_NE(req.find("Connection: close"), stmiss);
	ASSERT_NE(req.find("User-Agent: " + cfg::agentheader), stmiss);
	ASSERT_NE(req.find("Host: 127.0.0.1:" + std::to_string(srv.GetPort())), stmiss);
}

TEST_F(http, chunkedBody)
{
	srv.Serve("/doc", "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nContent-Type: text/xml\r\n\r\n"
			"5\r\nhello\r\n7;ext=1\r\n, world\r\n0\r\nX-Trailer: 1\r\n\r\n");
	auto r = Make("/doc");
	r->Execute();
	ASSERT_EQ(ToString(r->GetBuffer()), "hello, world");
	ASSERT_EQ(r->GetContentLengthRead(), 12);
}

TEST_F(http, bodyUntilClose)
{
	mstring body(100000, 'z');
	srv.Serve("/stream", "HTTP/1.0 200 OK\r\nContent-Type: application/octet-stream\r\n\r\n" + body);
	auto r = Make("/stream");
	r->Execute();
	ASSERT_EQ(r->GetBuffer().size(), body.size());
	ASSERT_EQ(r->GetContentLengthRead(), off_t(body.size()));
}

TEST_F(http, informationalResponseSkipped)
{
	srv.Serve("/c", "HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 204 No Content\r\n\r\n");
	auto r = Make("/c");
	r->Execute();
	ASSERT_EQ(r->GetResponseCode(), 204);
	ASSERT_TRUE(r->GetBuffer().empty());
}

TEST_F(http, redirects)
{
	srv.Serve("/old", "HTTP/1.1 301 Moved\r\nLocation: /new/place\r\nContent-Length: 0\r\n\r\n");
	srv.Serve("/new/place", "HTTP/1.1 302 Found\r\nLocation: target.txt\r\nContent-Length: 0\r\n\r\n");
	srv.Serve("/new/target.txt", "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
	auto r = Make("/old");
	r->Execute();
	ASSERT_EQ(r->GetResponseCode(), 200);
	ASSERT_EQ(ToString(r->GetBuffer()), "ok");
	ASSERT_EQ(srv.RequestCount(), 3);
}

TEST_F(http, redirectLoop)
{
	cfg::redirmax = 2;
	srv.Serve("/loop", "HTTP/1.1 307 Again\r\nLocation: /loop\r\nContent-Length: 0\r\n\r\n");
	auto r = Make("/loop");
	ASSERT_THROW(r->Execute(), tRetrievalException);
	ASSERT_EQ(r->GetState(), tRetriever::Error);
	ASSERT_EQ(srv.RequestCount(), 3);
}

TEST_F(http, notFoundIsNotAFailure)
{
	auto r = Make("/missing");
	r->Execute();
	ASSERT_EQ(r->GetState(), tRetriever::Successful);
	ASSERT_EQ(r->GetResponseCode(), 404);
	ASSERT_FALSE(r->GetProtocolInfo().IsOk());
}

TEST_F(http, prematureEnd)
{
	srv.Serve("/short", "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nonly a few bytes");
	auto r = Make("/short");
	ASSERT_THROW(r->Execute(), tRetrievalException);
	ASSERT_EQ(r->GetState(), tRetriever::Error);
	ASSERT_EQ(r->GetContentLengthRead(), 16);
	ASSERT_LE(r->GetContentLengthRead(), r->GetContentLength());
}

TEST_F(http, oversizedLengths)
{
	srv.Serve("/chunk", "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
			"ffffffffffffffff\r\nabc\r\n0\r\n\r\n");
	auto r = Make("/chunk");
	try
	{
		r->Execute();
		FAIL() << "no exception";
	}
	catch(const tRetrievalException& ex)
	{
		ASSERT_STREQ(ex.what(), "502 Bad chunk header");
	}
	ASSERT_EQ(r->GetState(), tRetriever::Error);

	// nothing is allocated up front for a length the body does not deliver
	srv.Serve("/huge", "HTTP/1.1 200 OK\r\nContent-Length: 9000000000000000000\r\n\r\nabc");
	auto h = Make("/huge");
	try
	{
		h->Execute();
		FAIL() << "no exception";
	}
	catch(const tRetrievalException& ex)
	{
		ASSERT_STREQ(ex.what(), "502 Premature end of data");
	}
	ASSERT_EQ(h->GetContentLengthRead(), 3);
}

TEST_F(http, readTimeout)
{
	srv.Serve("/slow", "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
	srv.SetDelay(1500);
	auto r = Make("/slow");
	r->SetReadTimeout(200);
	try
	{
		r->Execute();
		FAIL() << "no exception";
	}
	catch(const tTransportException& ex)
	{
		ASSERT_EQ(ex.GetKind(), tTransportException::TIMEOUT);
	}
	ASSERT_EQ(r->GetState(), tRetriever::Error);
}

TEST_F(http, connectionRefused)
{
	int port;
	{
		tLoopbackServer gone;
		port = gone.GetPort();
	}
	auto r = CreateRetriever("http://127.0.0.1:" + std::to_string(port) + "/x", nullptr);
	ASSERT_THROW(r->Execute(), tTransportException);
	ASSERT_EQ(r->GetState(), tRetriever::Error);
}

TEST_F(http, zipExtraction)
{
	auto zip = MakeZip({{"inner.xml", "<inner/>"}}, true);
	srv.Serve("/pack.zip", "HTTP/1.1 200 OK\r\nContent-Type: application/zip\r\nContent-Length: "
			+ std::to_string(zip.size()) + "\r\n\r\n" + ToString(zip));
	auto r = Make("/pack.zip");
	r->SetExtractZipEntry(true);
	r->Execute();
	ASSERT_EQ(ToString(r->GetBuffer()), "<inner/>");
	ASSERT_EQ(r->GetContentLength(), off_t(zip.size()));
}

TEST_F(http, interruptedWhileWaiting)
{
	srv.Serve("/slow", "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
	srv.SetDelay(3000);
	auto r = Make("/slow");
	std::atomic_bool flag(false);
	std::thread canceller([&]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(200));
		flag = true;
	});
	{
		interrupt::tScope sc(flag);
		r->Execute();
	}
	canceller.join();
	ASSERT_EQ(r->GetState(), tRetriever::Interrupted);
}

TEST_F(http, throughTheService)
{
	srv.Serve("/a.txt", "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 1\r\n\r\nA");
	auto ns = std::make_shared<NiceMock<MockNetworkStatus>>();
	EXPECT_CALL(*ns, LogAvailableHost(mstring("127.0.0.1"))).Times(1);
	ON_CALL(*ns, IsHostUnavailable(_)).WillByDefault(Return(false));
	tRetrievalService svc(ns);
	auto task = svc.Submit(CreateRetriever(srv.Url("/a.txt"), std::make_shared<tBasicPostProcessor>()), 0);
	ASSERT_TRUE(task);
	auto r = task->Get();
	ASSERT_EQ(ToString(r->GetBuffer()), "A");
	ASSERT_EQ(task->GetFailureClass(), eFailureClass::NONE);
}
