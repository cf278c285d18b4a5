#ifndef _ARCRETRIEVER_H
#define _ARCRETRIEVER_H

#include "retriever.h"
#include "rtbuf.h"

namespace rtv
{

//! Reads one member of a local ZIP archive, addressed as jar:file:/path/to/archive.zip!/member
class RTV_API tArchiveRetriever : public tRetriever
{
public:
	tArchiveRetriever(cmstring& sName, cmstring& sArchivePath, cmstring& sEntry,
			std::shared_ptr<IPostProcessor> postProcessor);

	//! splits the URL into archive path and member name, false if malformed
	static bool ParseUrl(cmstring& url, mstring& archivePath, mstring& entry);

	cmstring& GetArchivePath() const { return m_sArchivePath; }
	cmstring& GetEntryName() const { return m_sEntry; }

protected:
	void OpenConnection() override;
	tBytes DoRead() override;

private:
	mstring m_sArchivePath, m_sEntry;
	rtbuf m_archive;
};

}

#endif
