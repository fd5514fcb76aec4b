#include "core/filebrowserpage.hpp"
#include "core/fakes.hpp"
#include <gtest/gtest.h>

using namespace usbdeck::core;
using namespace usbdeck::testing;

class FileBrowserPageTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree = std::make_shared<FakeTree>();
        tree->addDirectory("/media/stick");
        tree->addDirectory("/media/stick/photos");
        tree->addDirectory("/media/stick/photos/2024");
        tree->addFile("/media/stick/readme.txt", 12);
        tree->addFile("/media/stick/.trash", 1);

        page = std::make_unique<FileBrowserPage>(std::make_shared<FakeFileSystem>(tree), "/media/stick");
    }

    std::shared_ptr<FakeTree> tree;
    std::unique_ptr<FileBrowserPage> page;
};

TEST_F(FileBrowserPageTest, StartsAtRootWithoutListing) {
    EXPECT_EQ(page->root(), std::filesystem::path("/media/stick"));
    EXPECT_EQ(page->currentDirectory(), page->root());
    EXPECT_TRUE(page->entries().empty());
    EXPECT_EQ(tree->listings, 0);
}

TEST_F(FileBrowserPageTest, ReloadListsCurrentDirectory) {
    ASSERT_TRUE(page->reload().success);
    ASSERT_EQ(page->entries().size(), 2u);
    EXPECT_EQ(page->entries()[0].name, "photos");
    EXPECT_EQ(page->entries()[1].name, "readme.txt");
}

TEST_F(FileBrowserPageTest, EnterAndGoUp) {
    ASSERT_TRUE(page->enter("photos").success);
    EXPECT_EQ(page->currentDirectory(), std::filesystem::path("/media/stick/photos"));
    ASSERT_EQ(page->entries().size(), 1u);
    EXPECT_EQ(page->entries()[0].name, "2024");

    ASSERT_TRUE(page->goUp().success);
    EXPECT_EQ(page->currentDirectory(), page->root());
}

TEST_F(FileBrowserPageTest, GoUpStopsAtRoot) {
    int listings = tree->listings;
    EXPECT_TRUE(page->goUp().success);
    EXPECT_EQ(page->currentDirectory(), page->root());
    EXPECT_EQ(tree->listings, listings);
}

TEST_F(FileBrowserPageTest, EnterRejectsRelativeNames) {
    EXPECT_FALSE(page->enter("").success);
    EXPECT_FALSE(page->enter(".").success);
    EXPECT_FALSE(page->enter("..").success);
    EXPECT_EQ(page->currentDirectory(), page->root());
}

TEST_F(FileBrowserPageTest, FailedListingKeepsLocation) {
    ASSERT_TRUE(page->reload().success);

    usbdeck::fs::FsResult result = page->enter("missing");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, std::make_error_code(std::errc::no_such_file_or_directory));
    EXPECT_EQ(page->currentDirectory(), page->root());
    EXPECT_EQ(page->entries().size(), 2u);
}

TEST_F(FileBrowserPageTest, ShowHiddenRelists) {
    ASSERT_TRUE(page->reload().success);
    ASSERT_TRUE(page->setShowHidden(true).success);
    EXPECT_TRUE(page->showHidden());
    EXPECT_EQ(page->entries().size(), 3u);
}

TEST_F(FileBrowserPageTest, ResetRootMovesLocation) {
    tree->addDirectory("/media/stick1");
    ASSERT_TRUE(page->enter("photos").success);

    ASSERT_TRUE(page->resetRoot("/media/stick1").success);
    EXPECT_EQ(page->root(), std::filesystem::path("/media/stick1"));
    EXPECT_EQ(page->currentDirectory(), std::filesystem::path("/media/stick1"));
    EXPECT_TRUE(page->entries().empty());
}

TEST_F(FileBrowserPageTest, EmptyRootCannotBeListed) {
    FileBrowserPage unmounted(std::make_shared<FakeFileSystem>(tree), std::filesystem::path());
    EXPECT_FALSE(unmounted.reload().success);
    EXPECT_EQ(tree->listings, 0);
}

TEST_F(FileBrowserPageTest, ReleaseDropsFilesystem) {
    ASSERT_TRUE(page->reload().success);

    page->release();
    EXPECT_TRUE(page->isReleased());
    EXPECT_TRUE(page->entries().empty());
    EXPECT_EQ(tree->filesystems_destroyed, 1);

    page->release();
    EXPECT_EQ(tree->filesystems_destroyed, 1);

    EXPECT_FALSE(page->reload().success);
    EXPECT_FALSE(page->enter("photos").success);
}
