#ifndef TESTING_H
#define TESTING_H

#include <iostream>

// number of failed checks in this test executable; main() returns it
inline int test_failures = 0;

// If macro argument is not true, test is failing
#define IS_TRUE(x) { \
    if (!(x)) { \
        std::cout << __PRETTY_FUNCTION__ << " failed on line " << __LINE__ << std::endl;\
        ++test_failures; \
    } else { \
        std::cout << __PRETTY_FUNCTION__ << " passed on line " << __LINE__ << std::endl;\
    } \
}

// If the statement does not throw an exception of type E, test is failing
#define THROWS(statement, E) { \
    bool _threw = false; \
    try { statement; } catch (const E &) { _threw = true; } \
    IS_TRUE(_threw); \
}

#endif
