#include "test_helpers.hpp"

#include "consistency_check.hpp"
#include "sync_executor.hpp"

class ConsistencyCheckTest : public TempTreeTest {
protected:
    RecordingEventSink sink;
};

TEST_F(ConsistencyCheckTest, MirroredTreeIsConsistent) {
    write_file(source / "a.txt", "alpha");
    write_file(source / "dir/b.txt", "beta");
    mirrord::SyncExecutor executor(sink);
    ASSERT_FALSE(executor.run_pass(source, destination).aborted());

    mirrord::ConsistencyChecker checker(sink);
    auto report = checker.run(source, destination);

    EXPECT_FALSE(report.abort_reason);
    EXPECT_EQ(report.files_compared, 2u);
    EXPECT_TRUE(report.inconsistencies.empty());
    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(sink.consistency_checks.load(), 1);
}

TEST_F(ConsistencyCheckTest, SameSizeAndAgeDifferentContentIsReportedNotRepaired) {
    write_file(source / "doc.txt", "abcd");
    write_file(destination / "doc.txt", "wxyz");
    set_mtime(source / "doc.txt", base_time());
    set_mtime(destination / "doc.txt", base_time());

    mirrord::ConsistencyChecker checker(sink);
    auto report = checker.run(source, destination);

    ASSERT_EQ(report.inconsistencies.size(), 1u);
    EXPECT_EQ(report.inconsistencies[0].relative_path, "doc.txt");
    EXPECT_EQ(report.inconsistencies[0].reason, "content differs");
    ASSERT_EQ(sink.inconsistencies().size(), 1u);

    // The mtime rule leaves it alone, and so does the audit
    mirrord::SyncExecutor executor(sink);
    auto pass = executor.run_pass(source, destination);
    EXPECT_EQ(pass.modified, 0u);
    EXPECT_EQ(read_file(destination / "doc.txt"), "wxyz");
}

TEST_F(ConsistencyCheckTest, SizeMismatchIsReported) {
    write_file(source / "doc.txt", "short");
    write_file(destination / "doc.txt", "much longer content");

    mirrord::ConsistencyChecker checker(sink);
    auto report = checker.run(source, destination);

    ASSERT_EQ(report.inconsistencies.size(), 1u);
    EXPECT_EQ(report.inconsistencies[0].reason, "size differs");
}

TEST_F(ConsistencyCheckTest, FilesMissingFromDestinationAreNotCompared) {
    write_file(source / "only_here.txt", "x");

    mirrord::ConsistencyChecker checker(sink);
    auto report = checker.run(source, destination);

    EXPECT_EQ(report.files_compared, 0u);
    EXPECT_TRUE(report.inconsistencies.empty());
}

TEST_F(ConsistencyCheckTest, ExcludedFilesAreSkipped) {
    write_file(source / "cache.tmp", "one");
    write_file(destination / "cache.tmp", "three");

    mirrord::ConsistencyChecker checker(sink, mirrord::ExcludeFilter({"*.tmp"}));
    auto report = checker.run(source, destination);

    EXPECT_EQ(report.files_compared, 0u);
    EXPECT_TRUE(report.inconsistencies.empty());
}

TEST_F(ConsistencyCheckTest, UnreadableRootAbortsTheCheck) {
    fs::remove_all(destination);

    mirrord::ConsistencyChecker checker(sink);
    auto report = checker.run(source, destination);

    ASSERT_TRUE(report.abort_reason);
    EXPECT_EQ(sink.consistency_checks.load(), 0);
}
