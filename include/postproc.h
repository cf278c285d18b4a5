#ifndef _POSTPROC_H
#define _POSTPROC_H

#include "config.h"
#include "meta.h"

namespace rtv
{

class tRetriever;

//! End-of-life hook of a retrieval, produces the final payload
class RTV_API IPostProcessor
{
public:
	virtual ~IPostProcessor() {}
	/**
	 * Called exactly once after the retriever reached a terminal state.
	 * @return the payload handed out to the caller, may be empty
	 */
	virtual tBytes Run(tRetriever& retriever) =0;
};

/**
 * Dispatches on the retrieval outcome and the content type. Subclasses persist or convert the
 * content by overriding the Handle... methods.
 */
class RTV_API tBasicPostProcessor : public IPostProcessor
{
public:
	tBytes Run(tRetriever& retriever) override;

protected:
	//! default: MarkResourceAbsent if the retrieval ended with an error
	virtual void HandleUnsuccessfulRetrieval(tRetriever& retriever);
	//! true if the protocol specific response code means OK
	virtual bool ValidateResponseCode(const tRetriever& retriever);
	virtual void HandleInvalidResponseCode(tRetriever& retriever);
	virtual tBytes HandleSuccessfulRetrieval(tRetriever& retriever);
	//! dispatcher on the content type, the type is guessed from the name suffix if missing
	virtual tBytes HandleContent(tRetriever& retriever);

	virtual tBytes HandleTextContent(tRetriever& retriever);
	virtual tBytes HandleImageContent(tRetriever& retriever);
	virtual tBytes HandleApplicationContent(tRetriever& retriever);
	virtual tBytes HandleZipContent(tRetriever& retriever);
	virtual tBytes HandleUnknownContentType(tRetriever& retriever);

	//! notification hook for resources which shall not be requested again soon
	virtual void MarkResourceAbsent(tRetriever& retriever);

	static bool IsPrimaryContentType(string_view typeOfContent, string_view contentType);
	//! MIME type from the file name suffix of the resource, empty if unknown
	static mstring GuessContentType(cmstring& name);
};

}

#endif
