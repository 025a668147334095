#ifndef __ADB_TEST_HEADERS__
#define __ADB_TEST_HEADERS__

#include "Headers.hpp"

#include "catch2/catch.hpp"

#endif  // __ADB_TEST_HEADERS__
