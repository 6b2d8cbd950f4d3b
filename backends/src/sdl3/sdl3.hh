#pragma once

#include <rainout/sdk/compiler.hh>

#if defined(RAINOUT_COMPILER_MSVC)
#pragma warning( push )
#pragma warning( disable : 4820)
#elif defined(RAINOUT_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(RAINOUT_COMPILER_CLANG)
# pragma clang diagnostic push
#elif defined(RAINOUT_COMPILER_WASM)
# pragma clang diagnostic push
#endif

#include <SDL3/SDL.h>

#if defined(RAINOUT_COMPILER_MSVC)
#pragma warning( pop )
#elif defined(RAINOUT_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(RAINOUT_COMPILER_CLANG)
# pragma clang diagnostic pop
#elif defined(RAINOUT_COMPILER_WASM)
# pragma clang diagnostic pop
#endif
