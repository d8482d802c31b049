#pragma once

// Distribution packages install the client headers either under firebird/
// (custom installations) or directly in the include root (Debian/Ubuntu).

#if __has_include(<firebird/Interface.h>)
#include <firebird/Interface.h>
#elif __has_include(<Interface.h>)
#include <Interface.h>
#else
#error "Firebird Interface.h not found"
#endif

#if __has_include(<firebird/ibase.h>)
#include <firebird/ibase.h>
#elif __has_include(<ibase.h>)
#include <ibase.h>
#else
#error "Firebird ibase.h not found"
#endif

#if __has_include(<firebird/iberror.h>)
#include <firebird/iberror.h>
#elif __has_include(<iberror.h>)
#include <iberror.h>
#endif
