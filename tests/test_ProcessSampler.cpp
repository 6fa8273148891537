// tests/test_ProcessSampler.cpp
#include <gtest/gtest.h>
#include "core/ProcessSampler.hpp"

namespace pollswitch {
namespace testing {

TEST(ProcessSnapshotTest, LookupIgnoresCase) {
    ProcessSnapshot snapshot{"HuntGame.exe", "explorer.exe"};

    EXPECT_TRUE(snapshot.contains("huntgame.exe"));
    EXPECT_TRUE(snapshot.contains("HUNTGAME.EXE"));
    EXPECT_TRUE(snapshot.contains("Explorer.exe"));
    EXPECT_FALSE(snapshot.contains("cs2.exe"));
}

TEST(ProcessSnapshotTest, DuplicatesCollapse) {
    ProcessSnapshot snapshot;
    snapshot.insert("svchost.exe");
    snapshot.insert("SVCHOST.EXE");
    snapshot.insert("svchost.exe");

    EXPECT_EQ(snapshot.size(), 1u);
}

TEST(ProcessSnapshotTest, IgnoresEmptyNames) {
    ProcessSnapshot snapshot;
    snapshot.insert("");

    EXPECT_TRUE(snapshot.empty());
    EXPECT_FALSE(snapshot.contains(""));
}

TEST(ProcessSnapshotTest, FoldHandlesNonAscii) {
    EXPECT_EQ(ProcessSnapshot::fold("ÉLDEN.exe"), ProcessSnapshot::fold("élden.EXE"));
}

} // namespace testing
} // namespace pollswitch
