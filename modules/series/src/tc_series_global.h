#pragma once

#include <tChrono/Global>

#ifndef TC_STATIC
#if defined(TC_SERIES_EXPORT)
#define TC_SERIES_API TC_DECL_EXPORT
#else
#define TC_SERIES_API TC_DECL_IMPORT
#endif
#else
#define TC_SERIES_API
#endif
