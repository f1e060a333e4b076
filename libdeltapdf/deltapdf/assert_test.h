/*
 * Include this file to use assert in test code. It ensures that NDEBUG is undefined, which would
 * otherwise turn every check into a no-op and cause spurious passes.
 */

#ifndef DELTAPDF_ASSERT_TEST_H
#define DELTAPDF_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* DELTAPDF_ASSERT_TEST_H */
