#pragma once

#define SKETCHES_LIKELY(cond) (__builtin_expect(!!(cond), 1))
#define SKETCHES_UNLIKELY(cond) (__builtin_expect(!!(cond), 0))

#define SKETCHES_ALWAYS_INLINE __attribute__((always_inline, artificial)) inline

#ifdef SKETCHES_OPTLEVEL_0
#define SKETCHES_OPT_INLINE inline
#else
#define SKETCHES_OPT_INLINE __attribute__((always_inline)) inline
#endif
