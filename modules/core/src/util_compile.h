#pragma once

#ifdef _WIN32
#define TC_DECL_EXPORT __declspec(dllexport)
#define TC_DECL_IMPORT __declspec(dllimport)
#else
#define TC_DECL_EXPORT __attribute__((visibility("default")))
#define TC_DECL_IMPORT __attribute__((visibility("default")))
#endif
