#pragma once

#if defined _WIN32 || defined __CYGWIN__
#ifdef dynscope_EXPORTS
#ifdef __GNUCC__
#define DYNSCOPE_EXPORT __attribute__ ((dllexport))
#else
#define DYNSCOPE_EXPORT __declspec(dllexport)
#define DLL_WARNING_DISABLE_4251
#endif
#else
#ifdef __GNUC__
#define DYNSCOPE_EXPORT __attribute__ ((dllexport))
#else
#define DYNSCOPE_EXPORT __declspec(dllimport)
#endif
#endif
#else
#if __GNUC__ >= 4
#define DYNSCOPE_EXPORT __attribute__ ((visibility ("default")))
#else
#define DYNSCOPE_EXPORT
#endif
#endif

#ifdef DLL_WARNING_DISABLE_4251
#pragma warning( disable : 4251 )
#pragma warning( disable : 4275 )
#endif
