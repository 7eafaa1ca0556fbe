/*

config.hpp
----------

Build configuration of mailcast. Each macro may be defined before the first
mailcast header to change its default.

MAILCAST_NO_EXCEPTIONS       leaves out throwing.hpp.
MAILCAST_MAX_NESTING_DEPTH   deepest part nesting the message parser accepts (64).
MAILCAST_DEFAULT_OUTPUT_DIR  directory the body files are written to (`emails`).
MAILCAST_REDIRECT_TIMEOUT_S  seconds allowed to one redirect lookup (10).

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#if defined(MAILCAST_NO_EXCEPTIONS)
#define MAILCAST_THROWING_ENABLED 0
#else
#define MAILCAST_THROWING_ENABLED 1
#endif

#if !defined(MAILCAST_MAX_NESTING_DEPTH)
#define MAILCAST_MAX_NESTING_DEPTH 64
#endif

#if !defined(MAILCAST_DEFAULT_OUTPUT_DIR)
#define MAILCAST_DEFAULT_OUTPUT_DIR "emails"
#endif

#if !defined(MAILCAST_REDIRECT_TIMEOUT_S)
#define MAILCAST_REDIRECT_TIMEOUT_S 10
#endif
