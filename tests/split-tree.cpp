#include <gtest/gtest.h>
#include <split-tree.h>

using namespace splitrandr;

namespace
{

SplitTree parsed(const char* text)
{
    SplitTree tree;
    EXPECT_TRUE(parse_split_tree(text, tree)) << text;
    return tree;
}

unsigned long long area(std::vector<Rect> const& rects)
{
    unsigned long long sum = 0;
    for(const auto& r : rects)
        sum += 1ull * r.width * r.height;
    return sum;
}

} // namespace

TEST(SplitTree, DefaultIsSingleLeaf)
{
    const SplitTree tree;
    EXPECT_TRUE(tree.isLeaf());
    EXPECT_EQ(tree.leafCount(), 1u);
    EXPECT_EQ(tree.splitCount(), 0u);
    EXPECT_EQ(tree.toString(), "N");

    const auto rects = resolve(tree, 1920, 1080);
    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(rects[0], Rect(0, 0, 1920, 1080));
}

TEST(SplitTree, ResolvesNestedSplitBeforeFirst)
{
    const auto tree = parsed("V0.6(N,H0.4(N,N))");
    EXPECT_EQ(tree.leafCount(), 3u);
    EXPECT_EQ(tree.splitCount(), 2u);

    const auto rects = resolve(tree, 1920, 1080);
    ASSERT_EQ(rects.size(), 3u);
    EXPECT_EQ(rects[0], Rect(0, 0, 1152, 1080));
    EXPECT_EQ(rects[1], Rect(1152, 0, 768, 432));
    EXPECT_EQ(rects[2], Rect(1152, 432, 768, 648));
}

TEST(SplitTree, AfterChildAbsorbsRoundingResidual)
{
    const auto tree = parsed("V0.3333(N,N)");
    const auto rects = resolve(tree, 1001, 10);
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0].width, 334u);
    EXPECT_EQ(rects[1].x, 334);
    EXPECT_EQ(rects[1].width, 667u);
    EXPECT_EQ(area(rects), 1001ull * 10);
}

TEST(SplitTree, RectanglesTileTheOutput)
{
    for(const char* text : {"H0.5(N,N)", "V0.25(H0.7(N,N),V0.9(N,H0.1(N,N)))", "H0.999(V0.001(N,N),N)"})
    {
        const auto tree = parsed(text);
        for(const auto size : {std::make_pair(1920u, 1080u), std::make_pair(7u, 5u), std::make_pair(2560u, 1440u)})
        {
            const auto rects = resolve(tree, size.first, size.second);
            ASSERT_EQ(rects.size(), tree.leafCount());
            EXPECT_EQ(area(rects), 1ull * size.first * size.second) << text;
            for(const auto& r : rects)
            {
                EXPECT_GT(r.width, 0u) << text;
                EXPECT_GT(r.height, 0u) << text;
                EXPECT_LE(r.x + r.width, size.first);
                EXPECT_LE(r.y + r.height, size.second);
            }
        }
    }
}

TEST(SplitTree, CutIsClampedToKeepLeavesNonEmpty)
{
    const auto tree = parsed("V0.001(N,V0.999(N,N))");
    const auto rects = resolve(tree, 100, 50);
    ASSERT_EQ(rects.size(), 3u);
    EXPECT_EQ(rects[0], Rect(0, 0, 1, 50));
    EXPECT_EQ(rects[1].width, 98u);
    EXPECT_EQ(rects[2], Rect(99, 0, 1, 50));
}

TEST(SplitTree, InsertSplitReplacesAddressedLeaf)
{
    const auto tree = parsed("V0.5(N,N)");
    SplitTree result;
    ASSERT_TRUE(insert_split(tree, 1, SplitDirection::Horizontal, 0.25, result));
    EXPECT_EQ(result.toString(), "V0.5(N,H0.25(N,N))");
    EXPECT_EQ(tree.toString(), "V0.5(N,N)");

    ASSERT_TRUE(insert_split(SplitTree(), 0, SplitDirection::Vertical, 0.5, result));
    EXPECT_EQ(result.toString(), "V0.5(N,N)");
}

TEST(SplitTree, InsertSplitRejectsBadArguments)
{
    const auto tree = parsed("V0.5(N,N)");
    SplitTree result = parsed("H0.5(N,N)");
    EXPECT_FALSE(insert_split(tree, 2, SplitDirection::Vertical, 0.5, result));
    EXPECT_FALSE(insert_split(tree, 0, SplitDirection::Vertical, 0.0, result));
    EXPECT_FALSE(insert_split(tree, 0, SplitDirection::Vertical, 1.0, result));
    EXPECT_FALSE(insert_split(tree, 0, SplitDirection::Vertical, -0.5, result));
    EXPECT_EQ(result.toString(), "H0.5(N,N)");
}

TEST(SplitTree, RemoveSplitCollapsesSubtree)
{
    const auto tree = parsed("V0.6(N,H0.4(N,N))");
    SplitTree result;
    ASSERT_TRUE(remove_split(tree, 1, result));
    EXPECT_EQ(result.toString(), "V0.6(N,N)");
    ASSERT_TRUE(remove_split(tree, 0, result));
    EXPECT_TRUE(result.isLeaf());
    EXPECT_EQ(tree.leafCount(), 3u);

    EXPECT_FALSE(remove_split(tree, 2, result));
    EXPECT_FALSE(remove_split(SplitTree(), 0, result));
}

TEST(SplitTree, InsertThenRemoveRestoresTree)
{
    const auto tree = parsed("H0.3(N,N)");
    SplitTree inserted, removed;
    ASSERT_TRUE(insert_split(tree, 0, SplitDirection::Vertical, 0.7, inserted));
    ASSERT_TRUE(remove_split(inserted, 1, removed));
    EXPECT_EQ(removed, tree);
}

TEST(SplitTree, CopiesAreIndependent)
{
    SplitTree original = parsed("V0.5(N,N)");
    SplitTree copy = original;
    SplitTree moved = std::move(original);
    EXPECT_TRUE(original.isLeaf());
    EXPECT_EQ(copy, moved);

    copy = SplitTree();
    EXPECT_EQ(moved.toString(), "V0.5(N,N)");
}

TEST(SplitTree, ParsesAndPrintsTextNotation)
{
    for(const char* text : {"N", "H0.5(N,N)", "V0.6(N,H0.4(N,N))", "V0.25(H0.75(N,N),N)"})
        EXPECT_EQ(parsed(text).toString(), text);

    SplitTree tree;
    EXPECT_TRUE(parse_split_tree(" V0.5( N, N)", tree));
    EXPECT_EQ(tree.toString(), "V0.5(N,N)");
}

TEST(SplitTree, RejectsMalformedText)
{
    SplitTree tree;
    for(const char* text : {"", "X", "V", "V0.5", "V0.5(N)", "V0.5(N,N", "V0.5(N,N)N", "V1.5(N,N)", "H0(N,N)", "Vx(N,N)"})
        EXPECT_FALSE(parse_split_tree(text, tree)) << text;
}

TEST(SplitTree, RebuildsTreeFromResolvedRegions)
{
    for(const char* text : {"V0.5(N,H0.25(N,N))", "H0.5(V0.25(N,N),V0.75(N,N))", "N"})
    {
        const auto tree = parsed(text);
        const auto rebuilt = split_tree_from_regions(resolve(tree, 1920, 1080), 1920, 1080);
        EXPECT_EQ(rebuilt, tree) << text << " became " << rebuilt.toString();
    }
}

TEST(SplitTree, RegionsWithoutCleanCutCollapse)
{
    // Pinwheel: no single straight cut separates these
    const std::vector<Rect> regions = {Rect(0, 0, 2, 1), Rect(2, 0, 1, 2), Rect(1, 2, 2, 1), Rect(0, 1, 1, 2), Rect(1, 1, 1, 1)};
    EXPECT_TRUE(split_tree_from_regions(regions, 3, 3).isLeaf());
}
