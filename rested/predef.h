#ifndef __RESTED_PREDEF_H__
#define __RESTED_PREDEF_H__

#include "version.h"

#ifdef WINDOWS
#error Rested only builds on POSIX platforms
#endif

#include <strings.h>

#ifdef LINUX
#include <sys/sysmacros.h>

#ifdef major
#undef major
#endif
#ifdef minor
#undef minor
#endif
#endif

#define stricmp strcasecmp
#define strnicmp strncasecmp

#endif
