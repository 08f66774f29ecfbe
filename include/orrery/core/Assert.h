#pragma once

#include <cstdlib>
#include <iostream>

// Invariant checks. These stay enabled in release builds: a failed check means
// the body tree or a generator precondition is corrupt and the run cannot go on.

#ifndef ORRERY_ASSERT
  #define ORRERY_ASSERT(expr)                                              \
    do {                                                                   \
      if (!(expr)) {                                                       \
        std::cerr << "ORRERY_ASSERT failed: " #expr "\n"                   \
                  << "  at " << __FILE__ << ":" << __LINE__ << "\n";       \
        std::abort();                                                      \
      }                                                                    \
    } while (0)
#endif

#ifndef ORRERY_ASSERT_MSG
  #define ORRERY_ASSERT_MSG(expr, msg)                                     \
    do {                                                                   \
      if (!(expr)) {                                                       \
        std::cerr << "ORRERY_ASSERT failed: " #expr "\n"                   \
                  << "  message: " << (msg) << "\n"                        \
                  << "  at " << __FILE__ << ":" << __LINE__ << "\n";       \
        std::abort();                                                      \
      }                                                                    \
    } while (0)
#endif
