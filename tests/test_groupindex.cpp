/**
 * @file test_groupindex.cpp
 * @brief Unit tests for the GroupIndex class
 *
 * This file contains Google Test unit tests that verify grouping of files by
 * digest, group id assignment in digest order, label exposure and id
 * recompaction after removals.
 *
 * @see GroupIndex
 */

#include <gtest/gtest.h>
#include "groupindex.hpp"

/**
 * @class GroupIndexTest
 * @brief Test fixture for GroupIndex unit tests
 *
 * Provides a fresh index per test and three readable digests whose lexical
 * order is AAAA < BBBB < CCCC.
 */
class GroupIndexTest : public ::testing::Test {
protected:
    GroupIndex index;

    const std::string digestA = "aaaa0000000000000000000000000000";
    const std::string digestB = "bbbb0000000000000000000000000000";
    const std::string digestC = "cccc0000000000000000000000000000";
};

/**
 * @test EmptyIndexHasNoGroups
 * @brief Verifies the initial state of an index
 */
TEST_F(GroupIndexTest, EmptyIndexHasNoGroups) {
    EXPECT_TRUE(index.snapshot().empty());
    EXPECT_EQ(index.duplicateGroupCount(), 0u);
    EXPECT_EQ(index.groupId("/tmp/a"), 0);
    EXPECT_EQ(index.label("/tmp/a"), "");
}

/**
 * @test SingletonHasNoLabel
 * @brief Verifies that a file with a unique digest is not shown as grouped
 *
 * The digest still gets an id internally, but neither groupId() nor the
 * snapshot's label() expose it.
 */
TEST_F(GroupIndexTest, SingletonHasNoLabel) {
    index.record("/tmp/a", digestA);

    EXPECT_TRUE(index.contains("/tmp/a"));
    EXPECT_EQ(index.groupId("/tmp/a"), 0);
    EXPECT_EQ(index.label("/tmp/a"), "");

    auto view = index.snapshot();
    ASSERT_EQ(view.size(), 1u);
    EXPECT_EQ(view.at(digestA).id, 1);
    EXPECT_FALSE(view.at(digestA).isDuplicate());
    EXPECT_EQ(view.at(digestA).label(), "");
}

/**
 * @test IdenticalFilesShareGroup
 * @brief Two identical files and one distinct file
 *
 * Expected behavior:
 * - Both identical files carry the same visible label
 * - The distinct file has none
 */
TEST_F(GroupIndexTest, IdenticalFilesShareGroup) {
    index.record("/tmp/a", digestA);
    index.record("/tmp/b", digestA);
    index.record("/tmp/c", digestB);

    EXPECT_EQ(index.groupId("/tmp/a"), 1);
    EXPECT_EQ(index.groupId("/tmp/b"), 1);
    EXPECT_EQ(index.label("/tmp/a"), "Group 1");
    EXPECT_EQ(index.groupId("/tmp/c"), 0);
    EXPECT_EQ(index.label("/tmp/c"), "");
    EXPECT_EQ(index.duplicateGroupCount(), 1u);
}

/**
 * @test IdsFollowDigestOrderNotInsertionOrder
 * @brief Verifies that ids are the lexical rank of the digest
 */
TEST_F(GroupIndexTest, IdsFollowDigestOrderNotInsertionOrder) {
    index.record("/tmp/c1", digestC);
    index.record("/tmp/c2", digestC);
    index.record("/tmp/a1", digestA);
    index.record("/tmp/a2", digestA);

    EXPECT_EQ(index.groupId("/tmp/a1"), 1);
    EXPECT_EQ(index.groupId("/tmp/c1"), 2);
    EXPECT_EQ(index.label("/tmp/c2"), "Group 2");
}

/**
 * @test LowerDigestShiftsExistingGroups
 * @brief A new digest sorting first takes id 1 and pushes the others up
 */
TEST_F(GroupIndexTest, LowerDigestShiftsExistingGroups) {
    index.record("/tmp/b1", digestB);
    index.record("/tmp/b2", digestB);
    EXPECT_EQ(index.groupId("/tmp/b1"), 1);

    index.record("/tmp/a1", digestA);

    EXPECT_EQ(index.snapshot().at(digestA).id, 1);
    EXPECT_EQ(index.groupId("/tmp/b1"), 2);
    EXPECT_EQ(index.groupId("/tmp/a1"), 0);
}

/**
 * @test LabelsIndependentOfArrivalOrder
 * @brief The same files recorded in different orders get the same labels
 *
 * Results reach the index in completion order, which varies between runs.
 */
TEST_F(GroupIndexTest, LabelsIndependentOfArrivalOrder) {
    const std::vector<std::pair<std::string, std::string>> files = {
        {"/z1", digestC}, {"/z2", digestC}, {"/a1", digestA},
        {"/a2", digestA}, {"/m1", digestB}, {"/m2", digestB},
    };

    GroupIndex forward;
    for (const auto& [path, digest] : files) {
        forward.record(path, digest);
    }
    GroupIndex backward;
    for (auto it = files.rbegin(); it != files.rend(); ++it) {
        backward.record(it->first, it->second);
    }

    for (const auto& [path, digest] : files) {
        EXPECT_EQ(forward.label(path), backward.label(path)) << path;
    }
    EXPECT_EQ(forward.label("/a1"), "Group 1");
    EXPECT_EQ(forward.label("/m1"), "Group 2");
    EXPECT_EQ(forward.label("/z1"), "Group 3");
}

/**
 * @test RecordingTwiceIsIdempotent
 * @brief Verifies that the same path and digest does not grow a group
 */
TEST_F(GroupIndexTest, RecordingTwiceIsIdempotent) {
    index.record("/tmp/a", digestA);
    index.record("/tmp/a", digestA);

    EXPECT_EQ(index.size(), 1u);
    EXPECT_EQ(index.snapshot().at(digestA).paths.size(), 1u);
    EXPECT_EQ(index.groupId("/tmp/a"), 0);
}

/**
 * @test RerecordMovesPath
 * @brief Verifies that a path belongs to at most one group
 *
 * Recording a known path under a new digest moves it; the old group is
 * deleted when it becomes empty.
 */
TEST_F(GroupIndexTest, RerecordMovesPath) {
    index.record("/tmp/a", digestA);
    index.record("/tmp/b", digestB);
    index.record("/tmp/a", digestB);

    auto view = index.snapshot();
    EXPECT_EQ(view.count(digestA), 0u);
    ASSERT_EQ(view.count(digestB), 1u);
    EXPECT_EQ(view.at(digestB).paths.size(), 2u);
    EXPECT_EQ(view.at(digestB).id, 1);
    EXPECT_EQ(index.digestOf("/tmp/a"), digestB);
}

/**
 * @test RemovingWholeGroupCompactsIds
 * @brief Removing every member of a group frees its id
 *
 * Remaining groups are renumbered 1..N in digest order.
 */
TEST_F(GroupIndexTest, RemovingWholeGroupCompactsIds) {
    index.record("/tmp/a1", digestA);
    index.record("/tmp/a2", digestA);
    index.record("/tmp/b1", digestB);
    index.record("/tmp/b2", digestB);
    index.record("/tmp/c1", digestC);
    index.record("/tmp/c2", digestC);

    index.remove({"/tmp/a1", "/tmp/a2"});

    auto view = index.snapshot();
    EXPECT_EQ(view.count(digestA), 0u);
    EXPECT_EQ(view.at(digestB).id, 1);
    EXPECT_EQ(view.at(digestC).id, 2);
    EXPECT_EQ(index.label("/tmp/c1"), "Group 2");
    EXPECT_FALSE(index.contains("/tmp/a1"));
}

/**
 * @test RemovingSoleMemberRenumbersHigherGroup
 * @brief A group losing its last member disappears and closes the gap
 *
 * Test scenario: A (single file) ranks first and holds id 1, B and C are
 * duplicate groups with ids 2 and 3. Removing the lone member of A deletes
 * its group, and B and C move down to 1 and 2.
 */
TEST_F(GroupIndexTest, RemovingSoleMemberRenumbersHigherGroup) {
    index.record("/tmp/a", digestA);
    index.record("/tmp/b1", digestB);
    index.record("/tmp/b2", digestB);
    index.record("/tmp/c1", digestC);
    index.record("/tmp/c2", digestC);

    EXPECT_EQ(index.groupId("/tmp/b1"), 2);
    EXPECT_EQ(index.groupId("/tmp/c1"), 3);

    index.remove({"/tmp/a"});

    EXPECT_EQ(index.snapshot().count(digestA), 0u);
    EXPECT_EQ(index.groupId("/tmp/b1"), 1);
    EXPECT_EQ(index.groupId("/tmp/c1"), 2);
}

/**
 * @test RemovingMiddleGroupRenumbersLaterOnes
 * @brief Only groups sorting after the removed one change their id
 */
TEST_F(GroupIndexTest, RemovingMiddleGroupRenumbersLaterOnes) {
    index.record("/tmp/c1", digestC);
    index.record("/tmp/c2", digestC);
    index.record("/tmp/b1", digestB);
    index.record("/tmp/b2", digestB);
    index.record("/tmp/a1", digestA);
    index.record("/tmp/a2", digestA);

    EXPECT_EQ(index.groupId("/tmp/c1"), 3);

    index.remove({"/tmp/b1", "/tmp/b2"});

    EXPECT_EQ(index.groupId("/tmp/a1"), 1);
    EXPECT_EQ(index.groupId("/tmp/c1"), 2);
    EXPECT_EQ(index.label("/tmp/c2"), "Group 2");
}

/**
 * @test RemovingToSingletonHidesLabel
 * @brief A group reduced to one member keeps its id but loses its label
 */
TEST_F(GroupIndexTest, RemovingToSingletonHidesLabel) {
    index.record("/tmp/a1", digestA);
    index.record("/tmp/a2", digestA);

    index.remove({"/tmp/a2"});

    EXPECT_EQ(index.label("/tmp/a1"), "");
    EXPECT_EQ(index.snapshot().at(digestA).id, 1);
    EXPECT_EQ(index.duplicateGroupCount(), 0u);
}

/**
 * @test RemovingUnknownPathsIsHarmless
 * @brief Unknown paths are ignored by remove()
 */
TEST_F(GroupIndexTest, RemovingUnknownPathsIsHarmless) {
    index.record("/tmp/a1", digestA);
    index.record("/tmp/a2", digestA);

    index.remove({"/tmp/nope"});

    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.groupId("/tmp/a1"), 1);
}

/**
 * @test NewDigestAfterRemovalStaysDense
 * @brief Ids stay unique and dense when groups are created after a removal
 */
TEST_F(GroupIndexTest, NewDigestAfterRemovalStaysDense) {
    index.record("/tmp/a1", digestA);
    index.record("/tmp/a2", digestA);
    index.record("/tmp/b1", digestB);
    index.record("/tmp/b2", digestB);

    index.remove({"/tmp/a1", "/tmp/a2"});
    index.record("/tmp/c1", digestC);
    index.record("/tmp/c2", digestC);

    EXPECT_EQ(index.groupId("/tmp/b1"), 1);
    EXPECT_EQ(index.groupId("/tmp/c1"), 2);
}

/**
 * @test GroupingMatchesDigestEquality
 * @brief Two paths share an id exactly when their digests are equal and
 *        shared by at least two files
 */
TEST_F(GroupIndexTest, GroupingMatchesDigestEquality) {
    const std::vector<std::pair<std::string, std::string>> files = {
        {"/f1", digestA}, {"/f2", digestB}, {"/f3", digestA},
        {"/f4", digestC}, {"/f5", digestB}, {"/f6", digestA},
    };
    for (const auto& [path, digest] : files) {
        index.record(path, digest);
    }

    for (const auto& [p1, d1] : files) {
        for (const auto& [p2, d2] : files) {
            if (p1 == p2) {
                continue;
            }
            bool sameGroup = index.groupId(p1) != 0 &&
                             index.groupId(p1) == index.groupId(p2);
            EXPECT_EQ(sameGroup, d1 == d2) << p1 << " vs " << p2;
        }
    }
    EXPECT_EQ(index.groupId("/f4"), 0);
}

/**
 * @test ClearResetsEverything
 * @brief Verifies that clear() forgets groups and ids
 */
TEST_F(GroupIndexTest, ClearResetsEverything) {
    index.record("/tmp/a1", digestA);
    index.record("/tmp/a2", digestA);
    index.clear();

    EXPECT_EQ(index.size(), 0u);
    EXPECT_TRUE(index.snapshot().empty());

    index.record("/tmp/b1", digestB);
    EXPECT_EQ(index.snapshot().at(digestB).id, 1);
}
