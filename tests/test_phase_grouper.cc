#include "phase_grouper.hh"
#include <gtest/gtest.h>
#include "test_support.hh"

namespace {

std::vector<std::string> Names(const PhotoGroup& group) {
    std::vector<std::string> names;
    for (const auto& photo : group.photos) {
        names.push_back(photo.sort_key);
    }
    return names;
}

TEST(GroupKeyTest, LeadingDigitsBeforeSeparator) {
    GroupKey key = ExtractGroupKey("2_scaffold.jpg");
    EXPECT_EQ(key.key, "2");
    EXPECT_EQ(key.residual, "scaffold.jpg");

    EXPECT_EQ(ExtractGroupKey("14-roof.png").key, "14");
    EXPECT_EQ(ExtractGroupKey("IMG_0001.jpg").key, "");
    EXPECT_EQ(ExtractGroupKey("IMG_0001.jpg").residual, "IMG_0001.jpg");
    // Digits without a separator are part of the name, not a key
    EXPECT_EQ(ExtractGroupKey("20250305.jpg").key, "");
}

TEST(GroupKeyTest, VariantPrefixStripsTrailingUnderscores) {
    EXPECT_EQ(ExtractVariantPrefix("1_2_photo.jpg"), "1_2");
    EXPECT_EQ(ExtractVariantPrefix("3__x.jpg"), "3");
    EXPECT_EQ(ExtractVariantPrefix("photo.jpg"), "photo.jpg");
}

// -----------------------------------------------------------------------------
// Groups are ordered by first appearance in the filename-sorted listing
// -----------------------------------------------------------------------------
TEST(PhaseGrouperTest, GroupsByPrefixInFirstAppearanceOrder) {
    PhaseGrouper grouper;
    std::vector<std::string> listing = {
        "/w/2_b.jpg", "/w/1_b.jpg", "/w/2_a.jpg", "/w/1_a.jpg", "/w/3_a.jpg"
    };

    auto groups = grouper.Group("main", listing);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].key, "1");
    EXPECT_EQ(groups[1].key, "2");
    EXPECT_EQ(groups[2].key, "3");
    EXPECT_EQ(Names(groups[0]), (std::vector<std::string>{"1_a.jpg", "1_b.jpg"}));
    EXPECT_EQ(Names(groups[1]), (std::vector<std::string>{"2_a.jpg", "2_b.jpg"}));
    EXPECT_EQ(groups[0].phase, "main");
    EXPECT_EQ(groups[0].photos[0].path, "/w/1_a.jpg");
}

TEST(PhaseGrouperTest, NoPrefixCollapsesToSingleImplicitGroup) {
    PhaseGrouper grouper;
    auto groups = grouper.Group("pre", {"/w/IMG_3.jpg", "/w/IMG_1.jpg", "/w/IMG_2.jpg"});
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].key, "");
    EXPECT_EQ(Names(groups[0]), (std::vector<std::string>{"IMG_1.jpg", "IMG_2.jpg", "IMG_3.jpg"}));
}

TEST(PhaseGrouperTest, DeterministicAcrossRuns) {
    PhaseGrouper grouper;
    std::vector<std::string> listing = {"/a/5_x.jpg", "/a/IMG.jpg", "/a/1_y.jpg", "/a/5_a.jpg"};

    auto first = grouper.Group("p", listing);
    auto second = grouper.Group("p", listing);
    ASSERT_EQ(first.size(), second.size());
    for (size_t g = 0; g < first.size(); ++g) {
        EXPECT_EQ(first[g].key, second[g].key);
        EXPECT_EQ(Names(first[g]), Names(second[g]));
    }
}

TEST(PhaseGrouperTest, EmptyListingYieldsNoGroups) {
    PhaseGrouper grouper;
    EXPECT_TRUE(grouper.Group("empty", {}).empty());
}

TEST(PhaseGrouperTest, CollapseVariantsKeepsLongestName) {
    PhaseGrouper grouper;
    grouper.SetCollapseVariants(true);

    auto groups = grouper.Group("p", {"/a/1_1.jpg", "/a/1_1_edited.jpg", "/a/1_2.jpg"});
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(Names(groups[0]), (std::vector<std::string>{"1_1_edited.jpg", "1_2.jpg"}));
}

// -----------------------------------------------------------------------------
// Folder listing filters extensions and previous outputs
// -----------------------------------------------------------------------------
TEST(PhaseGrouperTest, ListPhotosFiltersAndSorts) {
    test_support::TempDir dir("listing");
    dir.Touch("b.JPG");
    dir.Touch("a.png");
    dir.Touch("c.jpeg");
    dir.Touch("a_stamped.png");
    dir.Touch("notes.txt");
    dir.Touch("nested/d.jpg");

    auto paths = PhaseGrouper::ListPhotos(dir.Path());
    ASSERT_EQ(paths.size(), 3u);
    EXPECT_EQ(std::filesystem::path(paths[0]).filename().string(), "a.png");
    EXPECT_EQ(std::filesystem::path(paths[1]).filename().string(), "b.JPG");
    EXPECT_EQ(std::filesystem::path(paths[2]).filename().string(), "c.jpeg");
}

TEST(PhaseGrouperTest, MissingFolderIsEmptyListing) {
    EXPECT_TRUE(PhaseGrouper::ListPhotos("/nonexistent/photostamp/folder").empty());
}

} // namespace
