#include "debug.h"

#include "postproc.h"
#include "retriever.h"
#include "rterror.h"

#include <algorithm>

using namespace std;

namespace rtv
{

static const struct { LPCSTR suffix; LPCSTR mime; } suffix2mime[] =
{
		{ "png", "image/png" },
		{ "jpg", "image/jpeg" },
		{ "jpeg", "image/jpeg" },
		{ "gif", "image/gif" },
		{ "dds", "image/dds" },
		{ "tif", "image/tiff" },
		{ "tiff", "image/tiff" },
		{ "xml", "text/xml" },
		{ "html", "text/html" },
		{ "htm", "text/html" },
		{ "txt", "text/plain" },
		{ "json", "application/json" },
		{ "zip", "application/zip" },
		{ "bil", "application/bil" },
		{ "kml", "application/vnd.google-earth.kml+xml" }
};

bool tBasicPostProcessor::IsPrimaryContentType(string_view typeOfContent, string_view contentType)
{
	trimBoth(contentType);
	return contentType.length() >= typeOfContent.length()
			&& scaseequals(contentType.substr(0, typeOfContent.length()), typeOfContent);
}

mstring tBasicPostProcessor::GuessContentType(cmstring& name)
{
	auto path = string_view(name);
	auto cut = path.find_first_of(";?#");
	if(cut != stmiss)
		path = path.substr(0, cut);
	auto dot = path.rfind('.');
	auto slash = path.rfind('/');
	if(dot == stmiss || (slash != stmiss && slash > dot))
		return mstring();
	auto suffix = path.substr(dot + 1);
	for(const auto& x : suffix2mime)
		if(scaseequals(suffix, x.suffix))
			return x.mime;
	return mstring();
}

tBytes tBasicPostProcessor::Run(tRetriever& retriever)
{
	if(retriever.GetState() != tRetriever::Successful)
	{
		HandleUnsuccessfulRetrieval(retriever);
		return tBytes();
	}
	if(!ValidateResponseCode(retriever))
	{
		HandleInvalidResponseCode(retriever);
		return tBytes();
	}
	return HandleSuccessfulRetrieval(retriever);
}

void tBasicPostProcessor::HandleUnsuccessfulRetrieval(tRetriever& retriever)
{
	if(retriever.GetState() == tRetriever::Error)
		MarkResourceAbsent(retriever);
}

bool tBasicPostProcessor::ValidateResponseCode(const tRetriever& retriever)
{
	auto info = retriever.GetProtocolInfo();
	switch(info.kind)
	{
	case tRetriever::tProtocolInfo::HTTP:
	case tRetriever::tProtocolInfo::ARCHIVE:
		return info.IsOk();
	case tRetriever::tProtocolInfo::NONE:
		break;
	}
	return false;
}

void tBasicPostProcessor::HandleInvalidResponseCode(tRetriever& retriever)
{
	MarkResourceAbsent(retriever);
	log::misc(tSS() << "Unexpected response code " << retriever.GetProtocolInfo().code
			<< " for " << retriever.GetName());
}

tBytes tBasicPostProcessor::HandleSuccessfulRetrieval(tRetriever& retriever)
{
	try
	{
		return HandleContent(retriever);
	}
	catch(const tInterruptedException&)
	{
		USRDBG("Post-processing cancelled for " << retriever.GetName());
	}
	catch(const std::exception& ex)
	{
		MarkResourceAbsent(retriever);
		log::err(tSS() << "Exception while handling retrieved data of " << retriever.GetName()
				<< ": " << ex.what());
	}
	return tBytes();
}

tBytes tBasicPostProcessor::HandleContent(tRetriever& retriever)
{
	auto contentType = retriever.GetContentType();
	if(contentType.empty())
	{
		contentType = GuessContentType(retriever.GetName());
		if(contentType.empty())
		{
			log::err(tSS() << "Content type is missing for " << retriever.GetName());
			return tBytes();
		}
	}
	trimBoth(contentType);
	std::transform(contentType.begin(), contentType.end(), contentType.begin(), ::tolower);

	if(StrHas(contentType, "zip"))
		return HandleZipContent(retriever);
	if(IsPrimaryContentType("text", contentType))
		return HandleTextContent(retriever);
	if(IsPrimaryContentType("image", contentType))
		return HandleImageContent(retriever);
	if(IsPrimaryContentType("application", contentType))
		return HandleApplicationContent(retriever);
	return HandleUnknownContentType(retriever);
}

tBytes tBasicPostProcessor::HandleTextContent(tRetriever& retriever)
{
	return retriever.TakeBuffer();
}

tBytes tBasicPostProcessor::HandleImageContent(tRetriever& retriever)
{
	return retriever.TakeBuffer();
}

tBytes tBasicPostProcessor::HandleApplicationContent(tRetriever& retriever)
{
	return retriever.TakeBuffer();
}

tBytes tBasicPostProcessor::HandleZipContent(tRetriever& retriever)
{
	return retriever.TakeBuffer();
}

tBytes tBasicPostProcessor::HandleUnknownContentType(tRetriever& retriever)
{
	log::misc(tSS() << "Unknown content type " << retriever.GetContentType()
			<< " of " << retriever.GetName());
	return tBytes();
}

void tBasicPostProcessor::MarkResourceAbsent(tRetriever&)
{
}

}
