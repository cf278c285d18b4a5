
#ifndef __RTV_CONFIG_H_
#define __RTV_CONFIG_H_

#include "rtvsyscap.h"

// safe fallbacks, should be defined by build system
#ifndef RTVERSION
#define RTVERSION "0.custom"
#endif
#ifndef CFGDIR
#define CFGDIR "/usr/local/etc/rtv"
#endif

#define __STDC_FORMAT_MACROS
#include <inttypes.h>
#include <climits>
#include <memory>

namespace rtv
{

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

#define COMMA ,
#ifdef HAVE_SSL
#define IFSSLORFALSE(x) x
#else
#define IFSSLORFALSE(x) false
#endif

#if defined _WIN32 || defined __CYGWIN__
  #define RTV_SO_IMPORT __declspec(dllimport)
  #define RTV_SO_EXPORT __declspec(dllexport)
  #define RTV_SO_LOCAL
#else
  #if __GNUC__ >= 4
    #define RTV_SO_IMPORT __attribute__ ((visibility ("default")))
    #define RTV_SO_EXPORT __attribute__ ((visibility ("default")))
    #define RTV_SO_LOCAL  __attribute__ ((visibility ("hidden")))
  #else
    #define RTV_SO_IMPORT
    #define RTV_SO_EXPORT
    #define RTV_SO_LOCAL
  #endif
#endif

#ifdef RTV_CORE_IN_SO
  #ifdef rtvcore_EXPORTS // defined by cmake for shared lib project
    #define RTV_API RTV_SO_EXPORT
  #else
    #define RTV_API RTV_SO_IMPORT
  #endif
  #define RTV_LOCAL RTV_SO_LOCAL
#else // built in as usual
  #define RTV_API
  #define RTV_LOCAL
#endif

//! Coarse time bucket for the submission epoch of a retrieval, in milliseconds
#define TIME_PRIORITY_GRANULARITY 500

}

#if __cplusplus >= 201703L
#define IS_CXX17
#endif

#if __cplusplus >= 201402L
#define IS_CXX14
#endif

#endif // __RTV_CONFIG_H_
