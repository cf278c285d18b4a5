#ifndef _ADMISSION_H
#define _ADMISSION_H

#include "config.h"
#include "meta.h"
#include "lockable.h"
#include "rtask.h"

#include <unordered_map>
#include <vector>
#include <functional>

namespace rtv
{

/**
 * Identity keyed table of the tasks which are queued or running.
 * Holds at most one task per resource name.
 */
class RTV_API tAdmissionTable : public base_with_mutex
{
public:
	typedef std::function<bool(const tTaskPtr&)> tAction;

	/**
	 * Insert-or-boost, atomic for the identity of the fresh task. Both callbacks run with the
	 * table locked.
	 *
	 * If a task with the same name is present, reuseExisting decides: true returns that task,
	 * false replaces it. Otherwise (or on replacement) the fresh task is offered to enqueue
	 * and stored if that returns true.
	 *
	 * @return the task to hand out, empty if enqueue refused the fresh task
	 */
	tTaskPtr Admit(const tTaskPtr& fresh, const tAction& reuseExisting, const tAction& enqueue);

	//! Removes the entry of the task's name if it still refers to this very task
	bool Remove(const tTaskPtr& task);

	tTaskPtr Find(cmstring& name);
	std::vector<tTaskPtr> Snapshot();
	void Clear();
	size_t Size();

private:
	std::unordered_map<mstring, tTaskPtr> m_map;
};

}

#endif
