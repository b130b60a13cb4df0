#ifndef __RESTED_VERSION_H__
#define __RESTED_VERSION_H__

// OS
#ifdef _WIN32
#   define WINDOWS
#else
#   define POSIX
#endif

#if defined(linux) || defined(__linux__)
#   define LINUX
#endif

#ifdef __APPLE__
#   define OSX
#   ifndef BSD
#       define BSD
#   endif
#endif

#ifdef __FreeBSD__
#   define FREEBSD
#   define BSD
#endif

// Compiler and architecture
#ifdef __GNUC__
#   define GCC
#   ifdef __x86_64
#       define X86_64
#   elif defined(i386)
#       define X86
#   elif defined(__arm__)
#       define ARM
#   endif
#endif

#define RESTED_VERSION_MAJOR 1
#define RESTED_VERSION_MINOR 0
#define RESTED_VERSION_STRING "1.0"

#endif
