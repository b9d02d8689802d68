#ifndef PSHARE_API_PSHAREAPIDEFS_H_
#define PSHARE_API_PSHAREAPIDEFS_H_

#if defined(__GNUC__)
#define PSHARE_API_EXPORT __attribute__((visibility("default")))
#define PSHARE_API_IMPORT
#else  // Unsupported compiler
#define PSHARE_API_EXPORT
#define PSHARE_API_IMPORT
#endif  // defined(__GNUC__)

#ifdef PSHARE_BUILD_SHARED_LIB
#define PSHARE_API PSHARE_API_EXPORT
#else
#define PSHARE_API PSHARE_API_IMPORT
#endif  // PSHARE_BUILD_SHARED_LIB

#endif  // PSHARE_API_PSHAREAPIDEFS_H_
