#include "debug.h"

#include "arcretriever.h"
#include "rtzip.h"
#include "rterror.h"
#include "interrupt.h"

using namespace std;

namespace rtv
{

tArchiveRetriever::tArchiveRetriever(cmstring& sName, cmstring& sArchivePath, cmstring& sEntry,
		std::shared_ptr<IPostProcessor> postProcessor) :
		tRetriever(sName, move(postProcessor)),
		m_sArchivePath(sArchivePath),
		m_sEntry(sEntry)
{
}

bool tArchiveRetriever::ParseUrl(cmstring& url, mstring& archivePath, mstring& entry)
{
	string_view rest(url);
	if(rest.length() < 4 || !scaseequals(rest.substr(0, 4), "jar:"))
		return false;
	rest.remove_prefix(4);
	if(rest.length() < 5 || !scaseequals(rest.substr(0, 5), "file:"))
		return false;
	rest.remove_prefix(5);
	// file:///abs/path and file:/abs/path are both fine
	if(startsWithSz(rest, "//"))
		rest.remove_prefix(2);
	auto sep = rest.find("!/");
	if(sep == stmiss || sep == 0 || sep + 2 >= rest.length())
		return false;
	archivePath = to_string(rest.substr(0, sep));
	entry = to_string(rest.substr(sep + 2));
	return true;
}

void tArchiveRetriever::OpenConnection()
{
	LOGSTARTFUNCx(m_sArchivePath);
	if(!m_archive.initFromFile(m_sArchivePath.c_str()))
		throw tRetrievalException(tErrnoFmter("404 Cannot read archive: "));
}

tBytes tArchiveRetriever::DoRead()
{
	tProtocolInfo info;
	info.kind = tProtocolInfo::ARCHIVE;

	tZipReader reader((const uint8_t*) m_archive.rptr(), m_archive.size());
	reader.Open();
	auto ent = reader.Find(m_sEntry);
	if(!ent)
	{
		info.code = 404;
		SetProtocolInfo(info);
		SetContentLength(0);
		return tBytes();
	}
	SetContentLength(ent->size);
	interrupt::Check();
	auto ret = reader.Extract(*ent);
	AddContentLengthRead(ret.size());
	info.code = 200;
	SetProtocolInfo(info);
	// the archive is not needed anymore
	m_archive.clear();
	return ret;
}

}
