#include "test_helpers.hpp"

#include "errors.hpp"
#include "tree_enumerator.hpp"

using mirrord::DirectoryNode;
using mirrord::TreeEnumerator;

class TreeEnumeratorTest : public TempTreeTest {};

TEST_F(TreeEnumeratorTest, WalksTopDownInNameOrder) {
    write_file(source / "b/2.txt", "");
    write_file(source / "b/1.txt", "");
    write_file(source / "a/inner/x.txt", "");
    write_file(source / "root.txt", "");
    fs::create_directories(source / "c");

    TreeEnumerator walk(source);
    auto nodes = walk.snapshot();

    ASSERT_EQ(nodes.size(), 5u);
    EXPECT_EQ(nodes[0].relative_path, fs::path());
    EXPECT_EQ(nodes[0].directories, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(nodes[0].files, std::vector<std::string>{"root.txt"});
    EXPECT_EQ(nodes[1].relative_path, fs::path("a"));
    EXPECT_EQ(nodes[2].relative_path, fs::path("a/inner"));
    EXPECT_EQ(nodes[2].files, std::vector<std::string>{"x.txt"});
    EXPECT_EQ(nodes[3].relative_path, fs::path("b"));
    EXPECT_EQ(nodes[3].files, (std::vector<std::string>{"1.txt", "2.txt"}));
    EXPECT_EQ(nodes[4].relative_path, fs::path("c"));
    EXPECT_TRUE(nodes[4].directories.empty());
    EXPECT_TRUE(nodes[4].files.empty());
}

TEST_F(TreeEnumeratorTest, MissingRootThrowsRootUnreadable) {
    EXPECT_THROW(TreeEnumerator(test_dir / "nope"), mirrord::RootUnreadable);
}

TEST_F(TreeEnumeratorTest, FileRootThrowsRootUnreadable) {
    write_file(test_dir / "plain.txt", "x");
    EXPECT_THROW(TreeEnumerator(test_dir / "plain.txt"), mirrord::RootUnreadable);
}

TEST_F(TreeEnumeratorTest, ListsLazilyAfterTheRoot) {
    fs::create_directories(source / "later");

    TreeEnumerator walk(source);
    DirectoryNode node;
    ASSERT_TRUE(walk.next(node));
    EXPECT_EQ(node.directories, std::vector<std::string>{"later"});

    // Created after the root was listed but before "later" is visited
    write_file(source / "later/new.txt", "");

    ASSERT_TRUE(walk.next(node));
    EXPECT_EQ(node.relative_path, fs::path("later"));
    EXPECT_EQ(node.files, std::vector<std::string>{"new.txt"});
    EXPECT_FALSE(walk.next(node));
}

TEST_F(TreeEnumeratorTest, VanishedSubdirectoryIsReportedOnItsNode) {
    fs::create_directories(source / "fleeting");
    write_file(source / "stable.txt", "");

    TreeEnumerator walk(source);
    DirectoryNode node;
    ASSERT_TRUE(walk.next(node));

    fs::remove_all(source / "fleeting");

    ASSERT_TRUE(walk.next(node));
    EXPECT_EQ(node.relative_path, fs::path("fleeting"));
    EXPECT_FALSE(node.error.empty());
    EXPECT_FALSE(walk.next(node));
}

TEST_F(TreeEnumeratorTest, SkipsSymlinksAndHonoursExcludes) {
    write_file(source / "keep/file.txt", "");
    write_file(source / "skip.log", "");
    write_file(source / "node_modules/pkg/index.js", "");
    fs::create_directory_symlink(source, source / "keep/cycle");
    fs::create_symlink(source / "keep/file.txt", source / "alias.txt");

    mirrord::ExcludeFilter filter({"*.log", "node_modules"});
    TreeEnumerator walk(source, &filter);
    auto nodes = walk.snapshot();

    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].directories, std::vector<std::string>{"keep"});
    EXPECT_TRUE(nodes[0].files.empty());
    EXPECT_EQ(nodes[1].relative_path, fs::path("keep"));
    EXPECT_TRUE(nodes[1].directories.empty());
    EXPECT_EQ(nodes[1].files, std::vector<std::string>{"file.txt"});
}
