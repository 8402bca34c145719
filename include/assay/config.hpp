#pragma once


/*
    ---------------------------------
    Assay build configuration macros
    ---------------------------------
    - `ASSAY_VERSION_*`     : library version, kept in step with CMakeLists.txt
    - `ASSAY_API`           : marks the out-of-line symbols in src/

    Static builds need nothing. Shared builds define `ASSAY_BUILD_SHARED`
    while compiling the library and `ASSAY_SHARED` in its consumers; the
    `assay` CMake target does both when `BUILD_SHARED_LIBS` is on
*/


#define ASSAY_VERSION_MAJOR 0
#define ASSAY_VERSION_MINOR 1
#define ASSAY_VERSION_PATCH 0
#define ASSAY_VERSION_STRING "0.1.0"

#if defined(_WIN32) || defined(__CYGWIN__)
#define ASSAY_SYMBOL_EXPORT __declspec(dllexport)
#define ASSAY_SYMBOL_IMPORT __declspec(dllimport)
#elif defined(__GNUC__) && __GNUC__ >= 4
#define ASSAY_SYMBOL_EXPORT __attribute__((visibility("default")))
#define ASSAY_SYMBOL_IMPORT __attribute__((visibility("default")))
#else
#define ASSAY_SYMBOL_EXPORT
#define ASSAY_SYMBOL_IMPORT
#endif

#ifndef ASSAY_API
#if defined(ASSAY_BUILD_SHARED)
#define ASSAY_API ASSAY_SYMBOL_EXPORT
#elif defined(ASSAY_SHARED)
#define ASSAY_API ASSAY_SYMBOL_IMPORT
#else
#define ASSAY_API
#endif
#endif // ASSAY_API
