#ifndef _HTTPRETRIEVER_H
#define _HTTPRETRIEVER_H

#include "retriever.h"
#include "header.h"
#include "rtbuf.h"

#include <memory>

namespace rtv
{

class tcpconnect;

/**
 * HTTP/1.1 GET of one resource over a dedicated connection, with redirects and optional
 * extraction of a single-member ZIP payload.
 */
class RTV_API tHttpRetriever : public tRetriever
{
public:
	tHttpRetriever(cmstring& sName, tHttpUrl url, std::shared_ptr<IPostProcessor> postProcessor);
	~tHttpRetriever();

	mstring GetHost() const override { return m_url.sHost; }
	const tHttpUrl& GetUrl() const { return m_url; }
	//! status code of the final response, 0 before a response was seen
	int GetResponseCode() const { return GetProtocolInfo().code; }
	mstring GetResponseMessage() const;

	//! inflate the first member of application/zip payloads
	bool SetExtractZipEntry(bool bExtract) override { m_bExtractZip = bExtract; return true; }
	bool GetExtractZipEntry() const { return m_bExtractZip; }

	/**
	 * Expiration time from the response headers: max-age first, then Expires corrected by
	 * the server's Date, then Expires as is.
	 * @return UTC seconds or 0 if not specified
	 */
	static time_t GetExpiration(const header& h, time_t now);

protected:
	void OpenConnection() override;
	tBytes DoRead() override;

private:
	void Connect(const tHttpUrl& target);
	void SendRequest(const tHttpUrl& target);
	void ReadResponseHeader();
	//! appends more input to m_inbuf, 0 on end of stream
	size_t Fill();
	//! one CRLF terminated line from the input, without the line end
	mstring ReadLine();

	tBytes ReadSized(off_t len);
	tBytes ReadChunked();
	tBytes ReadUntilClose();
	tBytes ExtractZip(const tBytes& payload);

	tHttpUrl m_url;
	std::atomic_bool m_bExtractZip;
	std::unique_ptr<tcpconnect> m_con;
	header m_head;
	rtbuf m_inbuf;
};

}

#endif
