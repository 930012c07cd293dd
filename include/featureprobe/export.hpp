/*!
 * @file export.hpp
 * @brief Public. Configuration of exported symbols.
 */

#pragma once

#ifdef DOXYGEN_SHOULD_SKIP_THIS
    #define FP_EXPORT
#else
    #ifdef _WIN32
        #define FP_EXPORT __declspec(dllexport)
    #else
        #define FP_EXPORT __attribute__((visibility("default")))
    #endif
#endif
