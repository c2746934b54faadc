#include <gtest/gtest.h>
#include "core/automatic_selector.hpp"
#include <algorithm>
#include <random>

class AutomaticSelectorTest : public ::testing::Test
{
protected:
    AutomaticSelector selector_;

    static FileMetadata meta(const std::string &path, uint64_t resolution, uint64_t size, double mod_time)
    {
        return FileMetadata(path, 0, resolution, size, mod_time);
    }

    static FileMetadataMap toMap(const std::vector<FileMetadata> &list)
    {
        FileMetadataMap map;
        for (const auto &m : list)
            map[m.path] = m;
        return map;
    }

    static DuplicateGroup pathsOf(const std::vector<FileMetadata> &list)
    {
        DuplicateGroup group;
        for (const auto &m : list)
            group.push_back(m.path);
        std::sort(group.begin(), group.end());
        return group;
    }
};

TEST_F(AutomaticSelectorTest, FormatPriorityTable)
{
    EXPECT_LT(selector_.getFormatPriority("/a/x.dng"), selector_.getFormatPriority("/a/x.tiff"));
    EXPECT_LT(selector_.getFormatPriority("/a/x.tiff"), selector_.getFormatPriority("/a/x.png"));
    EXPECT_LT(selector_.getFormatPriority("/a/x.png"), selector_.getFormatPriority("/a/x.jpg"));
    EXPECT_EQ(selector_.getFormatPriority("/a/x.jpg"), selector_.getFormatPriority("/a/x.jpeg"));
    EXPECT_LT(selector_.getFormatPriority("/a/x.jpeg"), selector_.getFormatPriority("/a/x.heic"));
    EXPECT_LT(selector_.getFormatPriority("/a/x.heic"), selector_.getFormatPriority("/a/x.webp"));
    EXPECT_LT(selector_.getFormatPriority("/a/x.webp"), selector_.getFormatPriority("/a/x.xyz"));
    EXPECT_EQ(selector_.getFormatPriority("/a/x.xyz"), 99);
    EXPECT_EQ(selector_.getFormatPriority("/a/X.DNG"), 0);
}

TEST_F(AutomaticSelectorTest, EditSuffixDetection)
{
    EXPECT_FALSE(AutomaticSelector::isLikelyOriginalByName("/p/photo-copy.jpg"));
    EXPECT_FALSE(AutomaticSelector::isLikelyOriginalByName("/p/photo_edited.png"));
    EXPECT_FALSE(AutomaticSelector::isLikelyOriginalByName("/p/photo-2.heic"));
    EXPECT_FALSE(AutomaticSelector::isLikelyOriginalByName("/p/photo(1).png"));
    EXPECT_FALSE(AutomaticSelector::isLikelyOriginalByName("/p/photo_12.jpg"));
    EXPECT_FALSE(AutomaticSelector::isLikelyOriginalByName("/p/photo-EDIT.jpg"));
    EXPECT_FALSE(AutomaticSelector::isLikelyOriginalByName("/p/photo_Copy.jpg"));

    EXPECT_TRUE(AutomaticSelector::isLikelyOriginalByName("/p/photo.jpg"));
    EXPECT_TRUE(AutomaticSelector::isLikelyOriginalByName("/p/photo_final.jpg"));
    EXPECT_TRUE(AutomaticSelector::isLikelyOriginalByName("/p/IMG2024.jpg"));
    EXPECT_TRUE(AutomaticSelector::isLikelyOriginalByName("/p/copy-of-photo.jpg"));
}

TEST_F(AutomaticSelectorTest, CascadeOrder)
{
    // Resolution beats everything else
    EXPECT_LT(selector_.compareFiles(meta("/a.webp", 200, 1, 9), meta("/b.dng", 100, 999, 1)), 0);
    // Then size
    EXPECT_LT(selector_.compareFiles(meta("/a.webp", 100, 10, 9), meta("/b.dng", 100, 5, 1)), 0);
    // Then format
    EXPECT_LT(selector_.compareFiles(meta("/a.dng", 100, 10, 9), meta("/b.jpg", 100, 10, 1)), 0);
    // Then the name
    EXPECT_LT(selector_.compareFiles(meta("/photo.jpg", 100, 10, 9), meta("/photo-copy.jpg", 100, 10, 1)), 0);
    // Then the older file
    EXPECT_LT(selector_.compareFiles(meta("/b.jpg", 100, 10, 1), meta("/a.jpg", 100, 10, 2)), 0);
    // Finally the path
    EXPECT_LT(selector_.compareFiles(meta("/a.jpg", 100, 10, 1), meta("/b.jpg", 100, 10, 1)), 0);
    EXPECT_EQ(selector_.compareFiles(meta("/a.jpg", 100, 10, 1), meta("/a.jpg", 100, 10, 1)), 0);
}

TEST_F(AutomaticSelectorTest, CascadeIsTotalOrder)
{
    const std::vector<std::string> names = {"/x/a.jpg", "/x/a-1.jpg", "/x/b.png", "/x/c.dng",
                                            "/x/c_copy.dng", "/x/d.webp", "/x/e.xyz", "/x/f.heic"};
    std::vector<FileMetadata> items;
    std::mt19937 rng(7);
    for (size_t i = 0; i < names.size(); i++)
    {
        for (int k = 0; k < 4; k++)
        {
            std::string path = names[i];
            path.insert(3, std::to_string(k));
            items.push_back(meta(path, 100 + (rng() % 2) * 100, 10 + rng() % 2, static_cast<double>(rng() % 3)));
        }
    }

    for (const auto &x : items)
    {
        EXPECT_FALSE(selector_.isBetter(x, x));
        for (const auto &y : items)
        {
            // Antisymmetry
            EXPECT_EQ(selector_.compareFiles(x, y), -selector_.compareFiles(y, x));
            for (const auto &z : items)
            {
                if (selector_.isBetter(x, y) && selector_.isBetter(y, z))
                    EXPECT_TRUE(selector_.isBetter(x, z)) << x.path << " " << y.path << " " << z.path;
            }
        }
    }
}

TEST_F(AutomaticSelectorTest, KeepBestQualityScenario)
{
    std::vector<FileMetadata> list = {meta("/g/one.jpg", 100, 50, 1), meta("/g/two.jpg", 200, 50, 1),
                                      meta("/g/three.jpg", 150, 50, 1)};
    auto result = selector_.runAutomaticSelection({pathsOf(list)}, SelectionStrategy::KEEP_BEST_QUALITY, toMap(list));

    EXPECT_EQ(result.files_for_removal, (std::vector<std::string>{"/g/one.jpg", "/g/three.jpg"}));
    EXPECT_TRUE(result.files_to_sort.empty());
}

TEST_F(AutomaticSelectorTest, KeepLastEditedScenario)
{
    std::vector<FileMetadata> list = {meta("/g/a.jpg", 300, 50, 10), meta("/g/b.jpg", 100, 50, 30),
                                      meta("/g/c.jpg", 200, 50, 20)};
    auto result = selector_.runAutomaticSelection({pathsOf(list)}, SelectionStrategy::KEEP_LAST_EDITED, toMap(list));

    EXPECT_EQ(result.files_for_removal, (std::vector<std::string>{"/g/a.jpg", "/g/c.jpg"}));
}

TEST_F(AutomaticSelectorTest, KeepLastEditedTieGoesToSmallestPath)
{
    std::vector<FileMetadata> list = {meta("/g/z.jpg", 100, 50, 30), meta("/g/m.jpg", 100, 50, 30),
                                      meta("/g/a.jpg", 100, 50, 5)};
    EXPECT_EQ(AutomaticSelector::getLastEdited(list).path, "/g/m.jpg");

    std::reverse(list.begin(), list.end());
    EXPECT_EQ(AutomaticSelector::getLastEdited(list).path, "/g/m.jpg");
}

TEST_F(AutomaticSelectorTest, KeepUniqueVersionsScenario)
{
    std::vector<FileMetadata> list = {meta("/g/A.dng", 4000, 900, 100), meta("/g/B_edited.jpg", 2000, 300, 500),
                                      meta("/g/C.jpg", 2000, 300, 200), meta("/g/D-copy.png", 1000, 100, 300)};
    auto result = selector_.runAutomaticSelection({pathsOf(list)}, SelectionStrategy::KEEP_ALL_UNIQUE_VERSIONS, toMap(list));

    EXPECT_EQ(result.files_for_removal, (std::vector<std::string>{"/g/C.jpg", "/g/D-copy.png"}));
    ASSERT_EQ(result.files_to_sort.size(), 1u);
    EXPECT_EQ(result.files_to_sort[0].original, "/g/A.dng");
    EXPECT_EQ(result.files_to_sort[0].edited, "/g/B_edited.jpg");
}

TEST_F(AutomaticSelectorTest, KeepUniqueVersionsSameFileForBothRoles)
{
    std::vector<FileMetadata> list = {meta("/g/best.jpg", 4000, 900, 500), meta("/g/other.jpg", 100, 10, 100)};
    GroupSelection selection = selector_.select(SelectionStrategy::KEEP_ALL_UNIQUE_VERSIONS, list);

    EXPECT_EQ(selection.keep, (std::vector<std::string>{"/g/best.jpg"}));
    EXPECT_EQ(selection.remove, (std::vector<std::string>{"/g/other.jpg"}));
    ASSERT_TRUE(selection.roles.has_value());
    EXPECT_EQ(selection.roles->original, "/g/best.jpg");
    EXPECT_EQ(selection.roles->edited, "/g/best.jpg");
}

TEST_F(AutomaticSelectorTest, SmallGroupsAreSkipped)
{
    std::vector<FileMetadata> list = {meta("/g/a.jpg", 100, 50, 1), meta("/g/b.jpg", 200, 50, 1)};
    FileMetadataMap data = toMap(list);

    DuplicateGroups groups = {{"/g/a.jpg"},                       // size 1
                              {"/g/a.jpg", "/g/missing.jpg"},      // only one entry has metadata
                              {}};
    auto result = selector_.runAutomaticSelection(groups, SelectionStrategy::KEEP_BEST_QUALITY, data);
    EXPECT_TRUE(result.files_for_removal.empty());
    EXPECT_TRUE(result.files_to_sort.empty());
}

TEST_F(AutomaticSelectorTest, MissingMetadataIsNeverRemoved)
{
    std::vector<FileMetadata> list = {meta("/g/a.jpg", 100, 50, 1), meta("/g/b.jpg", 200, 50, 1)};
    auto result = selector_.runAutomaticSelection({{"/g/a.jpg", "/g/b.jpg", "/g/ghost.jpg"}},
                                                  SelectionStrategy::KEEP_BEST_QUALITY, toMap(list));
    EXPECT_EQ(result.files_for_removal, (std::vector<std::string>{"/g/a.jpg"}));
}

TEST_F(AutomaticSelectorTest, UnknownStrategyReturnsEmpty)
{
    std::vector<FileMetadata> list = {meta("/g/a.jpg", 100, 50, 1), meta("/g/b.jpg", 200, 50, 1)};
    auto result = selector_.runAutomaticSelection({pathsOf(list)}, std::string("KEEP_EVERYTHING"), toMap(list));
    EXPECT_TRUE(result.files_for_removal.empty());
    EXPECT_TRUE(result.files_to_sort.empty());
}

TEST_F(AutomaticSelectorTest, StrategyByName)
{
    std::vector<FileMetadata> list = {meta("/g/a.jpg", 100, 50, 1), meta("/g/b.jpg", 200, 50, 1)};
    auto by_id = selector_.runAutomaticSelection({pathsOf(list)}, std::string("keep_best_quality"), toMap(list));
    auto by_display = selector_.runAutomaticSelection({pathsOf(list)}, std::string("Keep best quality"), toMap(list));
    EXPECT_EQ(by_id.files_for_removal, (std::vector<std::string>{"/g/a.jpg"}));
    EXPECT_EQ(by_display.files_for_removal, by_id.files_for_removal);

    auto parsed = SelectionStrategies::fromString("Keep unique versions (original + edited)");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(*parsed == SelectionStrategy::KEEP_ALL_UNIQUE_VERSIONS);
    EXPECT_FALSE(SelectionStrategies::fromString("").has_value());
}

TEST_F(AutomaticSelectorTest, RemovalIsUnionAcrossGroups)
{
    std::vector<FileMetadata> list = {meta("/g/a.jpg", 100, 50, 1), meta("/g/b.jpg", 200, 50, 1),
                                      meta("/h/c.jpg", 300, 50, 1), meta("/h/d.jpg", 100, 50, 1)};
    DuplicateGroups groups = {{"/g/a.jpg", "/g/b.jpg"}, {"/h/c.jpg", "/h/d.jpg"}, {"/g/a.jpg", "/g/b.jpg"}};
    auto result = selector_.runAutomaticSelection(groups, SelectionStrategy::KEEP_BEST_QUALITY, toMap(list));
    EXPECT_EQ(result.files_for_removal, (std::vector<std::string>{"/g/a.jpg", "/h/d.jpg"}));
}

TEST_F(AutomaticSelectorTest, ConfiguredPriorityTable)
{
    DedupConfig config;
    config.format_priority = {{"jpg", 0}, {"dng", 5}};
    AutomaticSelector selector(config);
    EXPECT_LT(selector.compareFiles(meta("/a.jpg", 100, 10, 1), meta("/b.dng", 100, 10, 1)), 0);
    EXPECT_EQ(selector.getFormatPriority("/x.png"), 99);
}
