#ifndef _HEADER_H
#define _HEADER_H

#include <string>
#include <functional>
#include "meta.h"
#include "rtbuf.h"

namespace rtv
{

class RTV_API header {
   public:
      enum eHeadType : char
	  {
         INVALID,
         HEAD,
         GET,
         ANSWER
      };
      enum eHeadPos : char
	  {
    	  CONNECTION,			// 0
    	  CONTENT_LENGTH,
    	  TRANSFER_ENCODING,
    	  LOCATION,
    	  CONTENT_TYPE,			// 4
    	  CACHE_CONTROL,
    	  EXPIRES,
    	  DATE,
    	  HOST,
    	  USER_AGENT,			// 9
    	  // unreachable entry and size reference
    	  HEADPOS_MAX,
		  HEADPOS_NOTFORUS
      };

      eHeadType type = INVALID;
      mstring frontLine;

      char *h[HEADPOS_MAX] = {0};

      inline header(){};
      ~header();
      header(const header &);
      header& operator=(const header&);

      static bool ParseDate(const char *, struct tm*);
      //! Date header value to UTC seconds, -1 if not parseable
      static time_t ParseDateUtc(const char *);

      void set(eHeadPos, const mstring &value);
      void set(eHeadPos, const char *val);
      void set(eHeadPos, const char *s, size_t len);
      void del(eHeadPos);

      inline const char * getCodeMessage() const {
    	  return frontLine.length()>9 ? frontLine.c_str()+9 : "";
      }
      inline int getStatus() const { int r=atoi(getCodeMessage()); return r ? r : 500; }
      //! Content-Length value, -1 if missing or bad
      off_t getContentLength() const;
      //! max-age from Cache-Control in seconds, -1 if not present
      long getMaxAge() const;
      bool isChunked() const;
      void clear();

      tSS ToString() const;
      /**
       * Read buffer to parse one header block.
       *
       * @param src Pointer to raw input
       * @param length Maximum considered input length
       * @param unkFunc Optional callback for ignored headers (called with key name and the value)
       * @return Length of processed data,
       * 0: incomplete, needs more data
       * <0: error
       * >0: length of the processed data
       */
      int Load(const char *src, unsigned length, const std::function<void(cmstring&, cmstring&)> &unkFunc = std::function<void(cmstring&, cmstring&)>());
};

inline bool BODYFREECODE(int status)
{
	// no response if not-modified or similar, following http://www.w3.org/Protocols/rfc2616/rfc2616-sec4.html#sec4.4
	return (304 == status || (status>=100 && status<200) || 204==status);
}

inline bool REDIRECTCODE(int status)
{
	return 301 == status || 302 == status || 303 == status || 307 == status || 308 == status;
}

}

#endif
