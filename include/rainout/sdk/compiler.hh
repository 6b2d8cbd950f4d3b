/**
 * @file compiler.hh
 * @brief Compiler detection macros
 */
#pragma once

#if !defined(__EMSCRIPTEN__)
#if defined(__clang__)
#define RAINOUT_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
#define RAINOUT_COMPILER_GCC
#elif defined(_MSC_VER)
#define RAINOUT_COMPILER_MSVC
#endif
#else
#define RAINOUT_COMPILER_WASM
#endif
