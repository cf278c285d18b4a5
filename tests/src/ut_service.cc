#include "gtest/gtest.h"
#include "rtservice.h"
#include "rterror.h"
#include "testhelpers.h"

#include <vector>
#include <mutex>

using namespace rtv;
using namespace rtv::test;
using ::testing::_;
using ::testing::Return;
using ::testing::NiceMock;

namespace
{

class service : public tConfigReset
{
protected:
	void SetUp() override
	{
		tConfigReset::SetUp();
		cfg::poolsize = 1;
	}

	//! occupies a worker until the gate is opened
	std::shared_ptr<tFakeRetriever> MakeBlocker(std::shared_ptr<tGate> gate, cmstring& name = "blocker")
	{
		auto r = std::make_shared<tFakeRetriever>(name);
		r->onConnect = [gate]() { gate->Pass(); };
		return r;
	}

	std::shared_ptr<tFakeRetriever> MakeRecording(cmstring& name)
	{
		auto r = std::make_shared<tFakeRetriever>(name);
		r->onConnect = [this, name]()
		{
			std::lock_guard<std::mutex> g(m_orderMx);
			m_order.push_back(name);
		};
		return r;
	}

	tStrVec GetOrder()
	{
		std::lock_guard<std::mutex> g(m_orderMx);
		return m_order;
	}

	std::mutex m_orderMx;
	tStrVec m_order;
};

class tThrowingSizeRetriever : public tFakeRetriever
{
public:
	using tFakeRetriever::tFakeRetriever;
	off_t GetContentLength() const override { throw std::runtime_error("size not available"); }
};

}

TEST_F(service, deduplicatesAndBoosts)
{
	tRetrievalService svc;
	auto gate = std::make_shared<tGate>();
	auto blocker = svc.Submit(MakeBlocker(gate), 0);
	ASSERT_TRUE(blocker);
	ASSERT_TRUE(WaitFor([&]() { return gate->WasEntered(); }));

	auto first = std::make_shared<tFakeRetriever>("tile/0/0/0");
	auto h1 = svc.Submit(first, 1);
	ASSERT_TRUE(h1);
	auto second = std::make_shared<tFakeRetriever>("tile/0/0/0");
	auto h2 = svc.Submit(second, 10);
	ASSERT_EQ(h1, h2);
	ASSERT_EQ(h1->GetRetriever(), first);
	ASSERT_EQ(h1->GetPriority(), 10);
	ASSERT_EQ(svc.GetAdmissionTable().Size(), 2u);
	ASSERT_EQ(svc.GetQueueLength(), 1u);

	gate->Open();
	ASSERT_EQ(h1->Get(), first);
	ASSERT_EQ(first->nExecutions.load(), 1);
	ASSERT_EQ(second->nExecutions.load(), 0);
	ASSERT_FALSE(svc.GetAdmissionTable().Find("tile/0/0/0"));

	// the identity is free again, a resubmission is a new task
	auto h3 = svc.Submit(std::make_shared<tFakeRetriever>("tile/0/0/0"), 1);
	ASSERT_TRUE(h3);
	ASSERT_NE(h3, h1);
	ASSERT_NO_THROW(h3->Get());
}

TEST_F(service, concurrentSubmissionsShareOneTask)
{
	cfg::poolsize = 4;
	tRetrievalService svc;
	auto gate = std::make_shared<tGate>();
	std::atomic_int executions(0);
	std::vector<tTaskPtr> handles(16);
	std::vector<std::thread> submitters;
	for(unsigned i = 0; i < handles.size(); ++i)
	{
		submitters.emplace_back([&, i]()
		{
			auto r = std::make_shared<tFakeRetriever>("same/resource");
			r->onConnect = [gate, &executions]() { executions++; gate->Pass(); };
			handles[i] = svc.Submit(r, i);
		});
	}
	for(auto& t : submitters)
		t.join();
	gate->Open();
	for(auto& h : handles)
	{
		ASSERT_TRUE(h);
		ASSERT_EQ(h, handles.front());
		ASSERT_NO_THROW(h->Get());
	}
	ASSERT_EQ(executions.load(), 1);
}

TEST_F(service, dequeuesByPriority)
{
	tRetrievalService svc;
	auto gate = std::make_shared<tGate>();
	svc.Submit(MakeBlocker(gate), 0);
	ASSERT_TRUE(WaitFor([&]() { return gate->WasEntered(); }));

	auto a = svc.Submit(MakeRecording("A"), 10);
	auto b = svc.Submit(MakeRecording("B"), 50);
	auto c = svc.Submit(MakeRecording("C"), 30);
	gate->Open();
	a->Get();
	b->Get();
	c->Get();
	ASSERT_EQ(GetOrder(), tStrVec({"B", "C", "A"}));
}

TEST_F(service, boostReordersQueuedTask)
{
	tRetrievalService svc;
	auto gate = std::make_shared<tGate>();
	svc.Submit(MakeBlocker(gate), 0);
	ASSERT_TRUE(WaitFor([&]() { return gate->WasEntered(); }));

	auto a = svc.Submit(MakeRecording("A"), 10);
	auto b = svc.Submit(MakeRecording("B"), 20);
	ASSERT_EQ(svc.Submit(MakeRecording("A"), 100), a);
	gate->Open();
	a->Get();
	b->Get();
	ASSERT_EQ(GetOrder(), tStrVec({"A", "B"}));
}

TEST_F(service, cancelQueuedTask)
{
	tRetrievalService svc;
	auto gate = std::make_shared<tGate>();
	auto blocker = svc.Submit(MakeBlocker(gate), 0);
	ASSERT_TRUE(WaitFor([&]() { return gate->WasEntered(); }));

	auto r = std::make_shared<tFakeRetriever>("queued");
	auto h = svc.Submit(r, 1);
	ASSERT_TRUE(h->Cancel(false));
	ASSERT_TRUE(h->IsCancelled());
	ASSERT_FALSE(svc.GetAdmissionTable().Find("queued"));
	ASSERT_EQ(svc.GetQueueLength(), 0u);
	ASSERT_EQ(h->GetFailureClass(), eFailureClass::CANCELLED);
	ASSERT_THROW(h->Get(), tCancelledException);

	gate->Open();
	blocker->Get();
	ASSERT_EQ(r->nExecutions.load(), 0);
	ASSERT_EQ(r->GetState(), tRetriever::NotStarted);
}

TEST_F(service, cancelRunningTaskInterrupts)
{
	tRetrievalService svc;
	auto gate = std::make_shared<tGate>();
	auto r = MakeBlocker(gate, "running");
	auto h = svc.Submit(r, 0);
	ASSERT_TRUE(WaitFor([&]() { return gate->WasEntered(); }));
	ASSERT_TRUE(svc.HasActiveTasks());

	ASSERT_TRUE(h->Cancel(true));
	ASSERT_THROW(h->Get(), tCancelledException);
	ASSERT_TRUE(WaitFor([&]() { return r->GetState() == tRetriever::Interrupted; }));
	ASSERT_TRUE(WaitFor([&]() { return !svc.GetAdmissionTable().Find("running"); }));
	ASSERT_TRUE(WaitFor([&]() { return !svc.HasActiveTasks(); }));
	ASSERT_EQ(h->GetFailureClass(), eFailureClass::CANCELLED);
}

TEST_F(service, transportFailureReachesHandle)
{
	auto ns = std::make_shared<NiceMock<MockNetworkStatus>>();
	tRetrievalService svc(ns);
	auto r = std::make_shared<tFakeRetriever>("http://unreachable.example/x");
	r->host = "unreachable.example";
	r->onConnect = []() { throw tTransportException(tTransportException::UNKNOWN_HOST, "503 DNS error - unknown host"); };

	EXPECT_CALL(*ns, IsHostUnavailable(mstring("unreachable.example"))).WillOnce(Return(false));
	EXPECT_CALL(*ns, LogUnavailableHost(mstring("unreachable.example"))).Times(1);

	auto h = svc.Submit(r, 0);
	ASSERT_TRUE(h);
	ASSERT_EQ(r->GetNetworkStatus(), ns);
	try
	{
		h->Get();
		FAIL() << "no exception";
	}
	catch(const tTransportException& ex)
	{
		ASSERT_EQ(ex.GetKind(), tTransportException::UNKNOWN_HOST);
	}
	ASSERT_EQ(h->GetFailureClass(), eFailureClass::TRANSPORT);
	ASSERT_EQ(r->GetState(), tRetriever::Error);
	ASSERT_FALSE(svc.GetAdmissionTable().Find(r->GetName()));
}

TEST_F(service, securityFailureGoesToListener)
{
	auto listener = std::make_shared<MockSecurityListener>();
	tRetrievalService svc(nullptr, listener);
	ASSERT_EQ(svc.GetSecurityListener(), listener);
	auto r = std::make_shared<tFakeRetriever>("https://selfsigned.example/");
	r->onConnect = []() { throw tTlsException("500 SSL error: certificate verify failed"); };

	EXPECT_CALL(*listener, OnException(_, mstring("https://selfsigned.example/"))).Times(1);

	auto h = svc.Submit(r, 0);
	ASSERT_THROW(h->Get(), tTlsException);
	ASSERT_EQ(h->GetFailureClass(), eFailureClass::SECURITY);
}

TEST_F(service, unavailableHostFailsFast)
{
	auto ns = std::make_shared<NiceMock<MockNetworkStatus>>();
	auto pp = std::make_shared<MockPostProcessor>();
	tRetrievalService svc(ns);
	auto r = std::make_shared<tFakeRetriever>("http://down.example/", pp);
	r->host = "down.example";

	EXPECT_CALL(*ns, IsHostUnavailable(mstring("down.example"))).WillOnce(Return(true));
	EXPECT_CALL(*pp, Run(_)).WillOnce(Return(tBytes()));

	auto h = svc.Submit(r, 0);
	try
	{
		h->Get();
		FAIL() << "no exception";
	}
	catch(const tTransportException& ex)
	{
		ASSERT_EQ(ex.GetKind(), tTransportException::HOST_UNAVAILABLE);
	}
	ASSERT_EQ(r->nExecutions.load(), 0);
	ASSERT_EQ(r->GetState(), tRetriever::Error);
}

TEST_F(service, postProcessingFailureIsUnexpected)
{
	auto pp = std::make_shared<MockPostProcessor>();
	tRetrievalService svc;
	auto r = std::make_shared<tFakeRetriever>("pp/fails", pp);
	EXPECT_CALL(*pp, Run(_)).WillOnce(::testing::Throw(std::runtime_error("cannot store")));
	auto h = svc.Submit(r, 0);
	ASSERT_THROW(h->Get(), tPostProcessException);
	ASSERT_EQ(h->GetFailureClass(), eFailureClass::POSTPROC);
	ASSERT_EQ(r->GetState(), tRetriever::Error);
}

TEST_F(service, boundedQueueRejectsNewIdentities)
{
	cfg::queuesize = 1;
	tRetrievalService svc;
	auto gate = std::make_shared<tGate>();
	svc.Submit(MakeBlocker(gate), 0);
	ASSERT_TRUE(WaitFor([&]() { return gate->WasEntered(); }));

	auto a = svc.Submit(std::make_shared<tFakeRetriever>("A"), 1);
	ASSERT_TRUE(a);
	ASSERT_FALSE(svc.Submit(std::make_shared<tFakeRetriever>("B"), 1));
	// boosting the queued identity is still possible
	ASSERT_EQ(svc.Submit(std::make_shared<tFakeRetriever>("A"), 5), a);
	gate->Open();
	ASSERT_NO_THROW(a->Get());
}

TEST_F(service, staleRequestIsCancelled)
{
	tRetrievalService svc;
	auto gate = std::make_shared<tGate>();
	svc.Submit(MakeBlocker(gate), 0);
	ASSERT_TRUE(WaitFor([&]() { return gate->WasEntered(); }));

	auto r = std::make_shared<tFakeRetriever>("stale");
	r->SetStaleRequestLimit(1);
	auto h = svc.Submit(r, 0);
	std::this_thread::sleep_for(std::chrono::milliseconds(30));
	gate->Open();
	ASSERT_THROW(h->Get(), tCancelledException);
	ASSERT_TRUE(WaitFor([&]() { return !svc.GetAdmissionTable().Find("stale"); }));
	ASSERT_EQ(r->nExecutions.load(), 0);
}

TEST_F(service, progress)
{
	cfg::poolsize = 2;
	tRetrievalService svc;
	ASSERT_EQ(svc.GetProgress(), 0);

	auto gate = std::make_shared<tGate>();
	auto r1 = std::make_shared<tFakeRetriever>("p1");
	r1->onConnect = [r1p = r1.get(), gate]() { r1p->Progress(100, 25); gate->Pass(); };
	auto r2 = std::make_shared<tThrowingSizeRetriever>("p2");
	r2->onConnect = [gate]() { gate->Pass(); };
	auto h1 = svc.Submit(r1, 0), h2 = svc.Submit(r2, 0);
	ASSERT_TRUE(WaitFor([&]() { return r1->GetContentLengthRead() == 25; }));

	ASSERT_DOUBLE_EQ(svc.GetProgress(), 25.0);
	gate->Open();
	h1->Get();
	h2->Get();
}

TEST_F(service, poolSize)
{
	tRetrievalService svc;
	ASSERT_EQ(svc.GetPoolSize(), 1);
	ASSERT_THROW(svc.SetPoolSize(0), std::invalid_argument);
	svc.SetPoolSize(2);
	ASSERT_EQ(svc.GetPoolSize(), 2);

	// two blockers run side by side now
	auto g1 = std::make_shared<tGate>(), g2 = std::make_shared<tGate>();
	auto h1 = svc.Submit(MakeBlocker(g1, "b1"), 0), h2 = svc.Submit(MakeBlocker(g2, "b2"), 0);
	ASSERT_TRUE(WaitFor([&]() { return g1->WasEntered() && g2->WasEntered(); }));
	g1->Open();
	g2->Open();
	h1->Get();
	h2->Get();

	svc.SetPoolSize(1);
	ASSERT_NO_THROW(svc.Submit(std::make_shared<tFakeRetriever>("after"), 0)->Get());
}

TEST_F(service, shrinkingJoinsSurplusWorkers)
{
	tRetrievalService svc;
	for(int i = 0; i < 5; ++i)
	{
		svc.SetPoolSize(4);
		ASSERT_EQ(svc.GetWorkerCount(), 4u);
		svc.SetPoolSize(1);
		ASSERT_TRUE(WaitFor([&]() { return svc.GetWorkerCount() == 1; }));
	}
	ASSERT_NO_THROW(svc.Submit(std::make_shared<tFakeRetriever>("still served"), 0)->Get());
}

TEST_F(service, gracefulShutdown)
{
	tRetrievalService svc;
	ASSERT_TRUE(svc.IsAvailable());
	auto gate = std::make_shared<tGate>();
	auto running = svc.Submit(MakeBlocker(gate), 0);
	ASSERT_TRUE(WaitFor([&]() { return gate->WasEntered(); }));
	auto queued = svc.Submit(std::make_shared<tFakeRetriever>("queued"), 0);

	svc.Shutdown(false);
	ASSERT_FALSE(svc.IsAvailable());
	ASSERT_EQ(svc.GetAdmissionTable().Size(), 0u);
	ASSERT_FALSE(svc.Submit(std::make_shared<tFakeRetriever>("late"), 0));

	gate->Open();
	ASSERT_NO_THROW(running->Get());
	ASSERT_NO_THROW(queued->Get());
}

TEST_F(service, immediateShutdown)
{
	tRetrievalService svc;
	auto gate = std::make_shared<tGate>();
	auto blocker = MakeBlocker(gate);
	auto running = svc.Submit(blocker, 0);
	ASSERT_TRUE(WaitFor([&]() { return gate->WasEntered(); }));
	auto queuedRetriever = std::make_shared<tFakeRetriever>("queued");
	auto queued = svc.Submit(queuedRetriever, 0);

	svc.Shutdown(true);
	ASSERT_THROW(queued->Get(), tCancelledException);
	ASSERT_THROW(running->Get(), tCancelledException);
	ASSERT_TRUE(WaitFor([&]() { return blocker->GetState() == tRetriever::Interrupted; }));
	ASSERT_EQ(queuedRetriever->nExecutions.load(), 0);
	ASSERT_EQ(svc.GetAdmissionTable().Size(), 0u);
}

TEST_F(service, rejectsInvalidInput)
{
	tRetrievalService svc;
	ASSERT_THROW(svc.Submit(tRetrieverPtr(), 0), std::invalid_argument);
	ASSERT_THROW(svc.Submit(std::make_shared<tFakeRetriever>(""), 0), std::invalid_argument);
}
