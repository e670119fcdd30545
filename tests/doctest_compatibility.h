#ifndef DOCTEST_COMPATIBILITY_H
#define DOCTEST_COMPATIBILITY_H

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#define DOCTEST_CONFIG_SUPER_FAST_ASSERTS
#include <doctest/doctest.h>

// catch2 spellings
#define SECTION(name) DOCTEST_SUBCASE(name)

#endif  // DOCTEST_COMPATIBILITY_H
