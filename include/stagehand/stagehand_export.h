#pragma once

#if defined _WIN32 || defined __CYGWIN__
#ifdef stagehand_EXPORTS
#ifdef __GNUC__
#define STAGEHAND_EXPORT __attribute__ ((dllexport))
#else
#define STAGEHAND_EXPORT __declspec(dllexport)
#define STAGEHAND_DLL_WARNING_DISABLE_4251
#endif
#else
#ifdef __GNUC__
#define STAGEHAND_EXPORT __attribute__ ((dllimport))
#else
#define STAGEHAND_EXPORT __declspec(dllimport)
#endif
#endif
#else
#if __GNUC__ >= 4
#define STAGEHAND_EXPORT __attribute__ ((visibility ("default")))
#else
#define STAGEHAND_EXPORT
#endif
#endif

#ifdef STAGEHAND_DLL_WARNING_DISABLE_4251
#pragma warning( disable : 4251 )
#pragma warning( disable : 4275 )
#endif
