#pragma once

#include "util_compile.h"

#ifndef TC_STATIC
#if defined(TC_CORE_EXPORT)
#define TC_CORE_API TC_DECL_EXPORT
#else
#define TC_CORE_API TC_DECL_IMPORT
#endif
#else
#define TC_CORE_API
#endif
