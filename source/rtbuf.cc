#include "debug.h"

#include "config.h"
#include "rtbuf.h"

#include <unistd.h>
#include <sys/stat.h>
#include <algorithm>

namespace rtv
{

bool rtbuf::setsize(size_t c) {
	if(m_nCapacity==c)
		return true;
	if(c < w)
		return false;

	char *p = (char*) realloc(m_buf, c+1);
	if(!p)
		return false;

	m_buf=p;
	m_nCapacity=c;
	m_buf[c]=0; // terminate to make string operations safe
	return true;
}

bool rtbuf::initFromFile(const char *szPath)
{
	struct stat statbuf;

	if (0!=stat(szPath, &statbuf))
		return false;

	unique_fd fd(::open(szPath, O_RDONLY));
	if (!fd.valid())
		return false;

	clear();

	if(!setsize(statbuf.st_size))
		return false;

	while (freecapa()>0)
	{
		auto n = sysread(fd.get());
		if (n < 0)
			return false;
		if (n == 0)
			break; // truncated meanwhile?
	}
	return true;
}

int rtbuf::sysread(int fd, size_t maxlen)
{
	size_t todo(std::min(maxlen, freecapa()));
	int n;
	do {
		n=::read(fd, m_buf+w, todo);
	} while(n<0 && EINTR == errno); // cannot handle EAGAIN here, let the caller check errno
	if(n<0)
		return -errno;
	if(n>0)
		w+=n;
	return(n);
}

}
