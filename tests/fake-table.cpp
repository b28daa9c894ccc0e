#include <gtest/gtest.h>
#include <fake-table.h>

using namespace splitrandr;

namespace
{

DecodedEntry decodedEntry(const char* name, const char* tree, unsigned width, unsigned height, const char* edid = "")
{
    OutputSplitConfig config;
    config.name = name;
    config.edidHex = edid;
    config.width = width;
    config.height = height;
    EXPECT_TRUE(parse_split_tree(tree, config.tree));

    const auto bytes = encode_config({config});
    std::vector<DecodedEntry> entries;
    EXPECT_EQ(decode_config(bytes.data(), bytes.size(), entries), DecodeStatus::Ok);
    return entries.at(0);
}

RealOutputState realOutput(const char* name = "DP-1", const char* edid = "")
{
    RealOutputState output;
    output.output = 0x42;
    output.name = name;
    output.edidHex = edid;
    output.crtc = 0x50;
    output.crtcX = 1920;
    output.crtcY = 0;
    output.crtcWidth = 1920;
    output.crtcHeight = 1080;
    output.mode = 0x60;
    output.mmWidth = 600;
    output.mmHeight = 340;
    return output;
}

} // namespace

TEST(FakeTable, BuildsOneTriplePerLeaf)
{
    FakeXidNamespace ids;
    FakeTable table;
    ASSERT_EQ(build_fake_table({decodedEntry("DP-1", "V0.5(N,N)", 1920, 1080)}, {realOutput()}, ids, table), BuildStatus::Ok);

    ASSERT_EQ(table.outputs.size(), 2u);
    ASSERT_EQ(table.crtcs.size(), 2u);
    ASSERT_EQ(table.modes.size(), 2u);

    EXPECT_EQ(table.outputs[0].name, "DP-1~0");
    EXPECT_EQ(table.outputs[1].name, "DP-1~1");
    EXPECT_EQ(table.outputs[1].parentOutput, 0x42u);
    EXPECT_EQ(table.outputs[0].mmWidth, 300u);
    EXPECT_EQ(table.outputs[0].mmHeight, 340u);

    EXPECT_EQ(table.crtcs[0].x, 1920);
    EXPECT_EQ(table.crtcs[1].x, 2880);
    EXPECT_EQ(table.crtcs[1].width, 960u);
    EXPECT_EQ(table.crtcs[1].parentCrtc, 0x50u);
    EXPECT_EQ(table.crtcs[1].output, table.outputs[1].xid);
    EXPECT_EQ(table.outputs[1].crtc, table.crtcs[1].xid);

    EXPECT_EQ(table.modes[0].name, "960x1080");

    for(const auto& output : table.outputs)
        EXPECT_TRUE(is_fake(output.xid));
    EXPECT_TRUE(table.isSplitOutput(0x42));
    EXPECT_TRUE(table.isSplitCrtc(0x50));
    EXPECT_FALSE(table.isSplitOutput(0x43));
}

TEST(FakeTable, LookupByKind)
{
    FakeXidNamespace ids;
    FakeTable table;
    ASSERT_EQ(build_fake_table({decodedEntry("DP-1", "H0.5(N,N)", 1920, 1080)}, {realOutput()}, ids, table), BuildStatus::Ok);

    const auto output = table.lookup(table.outputs[1].xid);
    EXPECT_EQ(output.kind, FakeLookup::Output);
    ASSERT_NE(output.output, nullptr);
    EXPECT_EQ(output.output->leafIndex, 1u);

    EXPECT_EQ(table.lookup(table.crtcs[0].xid).kind, FakeLookup::Crtc);
    EXPECT_EQ(table.lookup(table.modes[0].xid).kind, FakeLookup::Mode);
    EXPECT_EQ(table.lookup(0x42).kind, FakeLookup::NotFound);
    EXPECT_EQ(table.lookup(make_fake_xid(999, FakeKind::Output)).kind, FakeLookup::NotFound);
}

TEST(FakeTable, MatchesByEdidBeforeName)
{
    FakeXidNamespace ids;
    FakeTable table;
    const auto entry = decodedEntry("HDMI-1", "V0.5(N,N)", 1920, 1080, "00ffffffffffff0010ac");
    ASSERT_EQ(build_fake_table({entry}, {realOutput("DP-1", "00ffffffffffff0010ac")}, ids, table), BuildStatus::Ok);
    ASSERT_EQ(table.outputs.size(), 2u);
    EXPECT_EQ(table.outputs[0].name, "DP-1~0");

    ASSERT_EQ(build_fake_table({entry}, {realOutput("HDMI-1", "00ffffffffffff001e6d")}, ids, table), BuildStatus::Ok);
    EXPECT_TRUE(table.empty());
}

TEST(FakeTable, SkipsMismatchedAndUnsplitOutputs)
{
    FakeXidNamespace ids;
    FakeTable table;
    ASSERT_EQ(build_fake_table({decodedEntry("DP-1", "V0.5(N,N)", 2560, 1440)}, {realOutput()}, ids, table), BuildStatus::Ok);
    EXPECT_TRUE(table.empty());

    ASSERT_EQ(build_fake_table({decodedEntry("DP-1", "N", 1920, 1080)}, {realOutput()}, ids, table), BuildStatus::Ok);
    EXPECT_TRUE(table.empty());

    auto inactive = realOutput();
    inactive.crtc = 0;
    ASSERT_EQ(build_fake_table({decodedEntry("DP-1", "V0.5(N,N)", 1920, 1080)}, {inactive}, ids, table), BuildStatus::Ok);
    EXPECT_TRUE(table.empty());
}

TEST(FakeTable, IdsAreStableAcrossRebuilds)
{
    FakeXidNamespace ids;
    FakeTable first, second;
    ASSERT_EQ(build_fake_table({decodedEntry("DP-1", "V0.5(N,N)", 1920, 1080)}, {realOutput()}, ids, first), BuildStatus::Ok);
    ASSERT_EQ(build_fake_table({decodedEntry("DP-1", "V0.3(N,V0.5(N,N))", 1920, 1080)}, {realOutput()}, ids, second),
              BuildStatus::Ok);
    ASSERT_EQ(second.outputs.size(), 3u);
    EXPECT_EQ(second.outputs[0].xid, first.outputs[0].xid);
    EXPECT_EQ(second.outputs[1].xid, first.outputs[1].xid);
    EXPECT_EQ(ids.size(), 3u);
}

TEST(FakeTable, ExhaustedNamespaceIsReported)
{
    FakeXidNamespace ids(1);
    FakeTable table;
    EXPECT_EQ(build_fake_table({decodedEntry("DP-1", "V0.5(N,N)", 1920, 1080)}, {realOutput()}, ids, table),
              BuildStatus::IdCollision);
}

TEST(FakeTable, UpdateCrtcOnlyTouchesRecord)
{
    FakeXidNamespace ids;
    FakeTable table;
    ASSERT_EQ(build_fake_table({decodedEntry("DP-1", "V0.5(N,N)", 1920, 1080)}, {realOutput()}, ids, table), BuildStatus::Ok);
    const auto crtc = table.crtcs[1].xid;

    EXPECT_TRUE(table.updateCrtc(crtc, 100, 200, table.modes[1].xid, 1));
    EXPECT_EQ(table.findCrtc(crtc)->x, 100);
    EXPECT_EQ(table.findCrtc(crtc)->y, 200);

    EXPECT_TRUE(table.updateCrtc(crtc, 100, 200, 0, 1));
    EXPECT_EQ(table.findCrtc(crtc)->mode, 0u);
    EXPECT_EQ(table.findCrtc(crtc)->width, 960u);

    EXPECT_FALSE(table.updateCrtc(make_fake_xid(999, FakeKind::Crtc), 0, 0, 0, 1));
    EXPECT_FALSE(table.updateCrtc(0x50, 0, 0, 0, 1));
}
