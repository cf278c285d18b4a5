#include "debug.h"

#include "admission.h"

using namespace std;

namespace rtv
{

tTaskPtr tAdmissionTable::Admit(const tTaskPtr& fresh, const tAction& reuseExisting, const tAction& enqueue)
{
	LOGSTARTFUNCx(fresh->GetName());
	setLockGuard;
	auto it = m_map.find(fresh->GetName());
	if(it != m_map.end())
	{
		if(reuseExisting(it->second))
		{
			LOG("reusing admitted task");
			return it->second;
		}
		if(!enqueue(fresh))
			return tTaskPtr();
		it->second = fresh;
		return fresh;
	}
	if(!enqueue(fresh))
		return tTaskPtr();
	m_map.emplace(fresh->GetName(), fresh);
	return fresh;
}

bool tAdmissionTable::Remove(const tTaskPtr& task)
{
	setLockGuard;
	auto it = m_map.find(task->GetName());
	if(it == m_map.end() || it->second != task)
		return false;
	m_map.erase(it);
	return true;
}

tTaskPtr tAdmissionTable::Find(cmstring& name)
{
	setLockGuard;
	auto it = m_map.find(name);
	return it == m_map.end() ? tTaskPtr() : it->second;
}

std::vector<tTaskPtr> tAdmissionTable::Snapshot()
{
	setLockGuard;
	std::vector<tTaskPtr> ret;
	ret.reserve(m_map.size());
	for(const auto& kv : m_map)
		ret.emplace_back(kv.second);
	return ret;
}

void tAdmissionTable::Clear()
{
	setLockGuard;
	m_map.clear();
}

size_t tAdmissionTable::Size()
{
	setLockGuard;
	return m_map.size();
}

}
