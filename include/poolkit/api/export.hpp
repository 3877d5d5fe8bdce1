#pragma once

#if defined(_WIN32)
#if defined(POOLKIT_BUILD_DLL)
#define POOLKIT_API __declspec(dllexport)
#elif defined(POOLKIT_USE_DLL)
#define POOLKIT_API __declspec(dllimport)
#else
#define POOLKIT_API
#endif
#else
#define POOLKIT_API
#endif
