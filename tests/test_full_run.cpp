#include "flow_checks.h"
#include <gtest/gtest.h>



// the complete 30000 step run of the default case, takes several minutes
TEST(EllipseFullRunTest, StaysFiniteAndDevelopsWake) {
    RunEllipseFlow(30'000);
}
