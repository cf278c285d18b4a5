#include "gtest/gtest.h"
#include "rtask.h"
#include "rterror.h"
#include "testhelpers.h"

#include <set>

using namespace rtv;
using namespace rtv::test;

static tTaskPtr MakeTask(cmstring& name, double prio, uint64_t seq, int64_t epoch)
{
	auto r = std::make_shared<tFakeRetriever>(name);
	r->SetSubmitEpoch(epoch);
	return std::make_shared<tRetrievalTask>(r, prio, seq);
}

TEST(task, identity)
{
	auto a = MakeTask("tile/0/0/0", 1, 1, 100), b = MakeTask("tile/0/0/0", 7, 2, 200),
			c = MakeTask("tile/0/0/1", 1, 3, 100);
	ASSERT_TRUE(*a == *b);
	ASSERT_EQ(a->GetHash(), b->GetHash());
	ASSERT_TRUE(*a != *c);
	ASSERT_EQ(a->GetName(), "tile/0/0/0");
	ASSERT_THROW(tRetrievalTask(tRetrieverPtr(), 1, 0), std::invalid_argument);
}

TEST(task, ordering)
{
	std::set<tTaskPtr, tTaskOrder> q;
	auto b = MakeTask("B", 1, 1, 1000), a = MakeTask("A", 5, 2, 1000);
	q.insert(b);
	q.insert(a);
	// same epoch, higher priority first
	ASSERT_EQ(*q.begin(), a);

	// a later epoch wins over an older one with the same priority
	std::set<tTaskPtr, tTaskOrder> q2;
	auto older = MakeTask("old", 1, 1, 1000), newer = MakeTask("new", 1, 2, 1001);
	q2.insert(older);
	q2.insert(newer);
	ASSERT_EQ(*q2.begin(), newer);

	// equal keys, the earlier submission is first
	std::set<tTaskPtr, tTaskOrder> q3;
	auto first = MakeTask("first", 2, 10, 1000), second = MakeTask("second", 2, 11, 1000);
	q3.insert(second);
	q3.insert(first);
	ASSERT_EQ(q3.size(), 2u);
	ASSERT_EQ(*q3.begin(), first);
}

TEST(task, negativePriorityIsAdditive)
{
	std::set<tTaskPtr, tTaskOrder> q;
	auto low = MakeTask("low", -100, 1, 1000), high = MakeTask("high", -1, 2, 1000);
	q.insert(low);
	q.insert(high);
	ASSERT_EQ(*q.begin(), high);
	ASSERT_DOUBLE_EQ(low->GetKey(), 900);

	// one epoch later outweighs one unit of priority, the tie goes to the sequence
	auto later = MakeTask("later", -2, 3, 1001);
	q.insert(later);
	ASSERT_EQ(*q.begin(), high);
	ASSERT_DOUBLE_EQ(later->GetKey(), high->GetKey());
}

TEST(task, refreshRaisesOnly)
{
	auto t = MakeTask("x", 3, 1, 0);
	auto before = tRetriever::MakeEpoch();
	t->Refresh(1);
	ASSERT_EQ(t->GetPriority(), 3);
	ASSERT_GE(t->GetRetriever()->GetSubmitEpoch(), before);
	t->Refresh(10);
	ASSERT_EQ(t->GetPriority(), 10);
	ASSERT_DOUBLE_EQ(t->GetKey(), 10 + t->GetRetriever()->GetSubmitEpoch());
	ASSERT_GT(t->GetSubmitTime(), 0);
}

TEST(task, cancelPending)
{
	auto t = MakeTask("x", 0, 1, 0);
	int hookCalls = 0;
	t->SetCancelHook([&](const tTaskPtr& p) { hookCalls++; ASSERT_EQ(p, t); });
	ASSERT_FALSE(t->IsDone());
	ASSERT_TRUE(t->Cancel(false));
	ASSERT_EQ(hookCalls, 1);
	ASSERT_TRUE(t->IsDone());
	ASSERT_TRUE(t->IsCancelled());
	ASSERT_FALSE(t->Cancel(true));
	ASSERT_EQ(hookCalls, 1);
	ASSERT_FALSE(t->BeginExecution());
	ASSERT_THROW(t->Get(), tCancelledException);
	ASSERT_FALSE(t->GetInterruptFlag().load());
}

TEST(task, cancelRunningRaisesFlag)
{
	auto t = MakeTask("x", 0, 1, 0);
	ASSERT_TRUE(t->BeginExecution());
	ASSERT_EQ(t->GetStatus(), tRetrievalTask::RUNNING);
	ASSERT_TRUE(t->Cancel(true));
	ASSERT_TRUE(t->GetInterruptFlag().load());
	// finishing keeps the cancellation visible
	t->Finish(std::exception_ptr(), eFailureClass::CANCELLED);
	ASSERT_EQ(t->GetStatus(), tRetrievalTask::CANCELLED);
	ASSERT_EQ(t->GetFailureClass(), eFailureClass::CANCELLED);
}

TEST(task, getResultAndFailure)
{
	auto ok = MakeTask("ok", 0, 1, 0);
	ASSERT_FALSE(ok->Wait(20));
	std::thread finisher([&]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(30));
		ASSERT_TRUE(ok->BeginExecution());
		ok->Finish(std::exception_ptr(), eFailureClass::NONE);
	});
	auto r = ok->Get();
	finisher.join();
	ASSERT_EQ(r, ok->GetRetriever());
	ASSERT_TRUE(ok->Wait(0));
	ASSERT_FALSE(ok->Cancel(true));

	auto bad = MakeTask("bad", 0, 2, 0);
	ASSERT_TRUE(bad->BeginExecution());
	bad->Finish(std::make_exception_ptr(tTransportException(tTransportException::CONNECT, "503 Connection refused")),
			eFailureClass::TRANSPORT);
	ASSERT_THROW(bad->Get(), tTransportException);
	ASSERT_EQ(bad->GetFailureClass(), eFailureClass::TRANSPORT);
}
