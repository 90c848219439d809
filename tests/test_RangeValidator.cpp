/**
 * RangeValidator: every [s, e) with 0 <= s < e <= n is accepted, everything
 * else is rejected with the observed count.
 */
#include <gtest/gtest.h>
#include "notebook/RangeValidator.h"

TEST(RangeValidator, AcceptsEveryValidRange) {
    for (int n = 1; n <= 6; ++n) {
        for (int s = 0; s < n; ++s) {
            for (int e = s + 1; e <= n; ++e) {
                EXPECT_NO_THROW(RangeValidator::requireRange(s, e, n, "test")) << s << "-" << e << " of " << n;
            }
        }
    }
}

TEST(RangeValidator, RejectsInvalidRangesWithActualCount) {
    struct Case { int s, e, n; };
    const Case cases[] = {
        {3, 4, 3},   // start == count
        {5, 6, 3},   // start past the end
        {1, 1, 3},   // empty
        {2, 1, 3},   // reversed
        {0, 4, 3},   // stop past the end
        {-1, 1, 3},  // negative start
        {0, 1, 0},   // empty notebook
    };
    for (const auto& c : cases) {
        try {
            RangeValidator::requireRange(c.s, c.e, c.n, "delete_notebook_cells");
            ADD_FAILURE() << "accepted " << c.s << "-" << c.e << " of " << c.n;
        } catch (const GatewayError& e) {
            EXPECT_EQ(e.code(), ErrorCode::INDEX_OUT_OF_BOUNDS);
            EXPECT_EQ(e.context()["startIndex"], c.s);
            EXPECT_EQ(e.context()["stopIndex"], c.e);
            EXPECT_EQ(e.context()["cellCount"], c.n);
            EXPECT_EQ(e.context()["operation"], "delete_notebook_cells");
        }
    }
}

TEST(RangeValidator, IndexBounds) {
    EXPECT_NO_THROW(RangeValidator::requireIndex(0, 1, "modify"));
    EXPECT_NO_THROW(RangeValidator::requireIndex(4, 5, "modify"));
    EXPECT_THROW(RangeValidator::requireIndex(5, 5, "modify"), GatewayError);
    EXPECT_THROW(RangeValidator::requireIndex(-1, 5, "modify"), GatewayError);

    try {
        RangeValidator::requireIndex(7, 3, "modify");
    } catch (const GatewayError& e) {
        EXPECT_STREQ(e.what(), "Index 7 is out of bounds (0-2)");
        EXPECT_EQ(e.context()["cellCount"], 3);
    }
}

TEST(RangeValidator, InsertPositionIsClampedNotRejected) {
    EXPECT_EQ(RangeValidator::clampInsertPosition(10, 3), 3);
    EXPECT_EQ(RangeValidator::clampInsertPosition(-2, 3), 0);
    EXPECT_EQ(RangeValidator::clampInsertPosition(1, 3), 1);
    EXPECT_EQ(RangeValidator::clampInsertPosition(std::nullopt, 3), 3);
    EXPECT_EQ(RangeValidator::clampInsertPosition(0, 0), 0);
}
