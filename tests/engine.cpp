#include <gtest/gtest.h>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>
#include <engine.h>
#include <paths.h>

using namespace splitrandr;

namespace
{

class EngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        char dirTemplate[] = "/tmp/splitrandr-engine-XXXXXX";
        ASSERT_NE(mkdtemp(dirTemplate), nullptr);
        dir = dirTemplate;
        path = dir + "/splitrandr.bin";
    }

    void TearDown() override
    {
        unlink(path.c_str());
        rmdir(dir.c_str());
    }

    static std::vector<uint8_t> encoded(const char* tree)
    {
        OutputSplitConfig config;
        config.name = "DP-1";
        config.width = 1920;
        config.height = 1080;
        EXPECT_TRUE(parse_split_tree(tree, config.tree));
        return encode_config({config});
    }

    void writeConfig(const char* tree)
    {
        const auto bytes = encoded(tree);
        ASSERT_TRUE(write_file_atomically(path, bytes.data(), bytes.size()));
    }

    // Same-sized rewrites need distinct modification times to be noticed
    void writeBytes(std::vector<uint8_t> const& bytes, time_t mtime)
    {
        ASSERT_TRUE(write_file_atomically(path, bytes.data(), bytes.size()));
        const struct timespec times[2] = {{mtime, 0}, {mtime, 0}};
        ASSERT_EQ(utimensat(AT_FDCWD, path.c_str(), times, 0), 0);
    }

    static std::vector<RealOutputState> realOutputs()
    {
        RealOutputState output;
        output.output = 0x42;
        output.name = "DP-1";
        output.crtc = 0x50;
        output.crtcWidth = 1920;
        output.crtcHeight = 1080;
        return {output};
    }

    std::string dir;
    std::string path;
};

} // namespace

TEST_F(EngineTest, WalksThroughStates)
{
    Engine engine(path);
    EXPECT_EQ(engine.state(), EngineState::Unloaded);
    engine.attach();
    EXPECT_EQ(engine.state(), EngineState::Loaded);

    EXPECT_TRUE(engine.pollConfig());
    EXPECT_EQ(engine.state(), EngineState::ConfigBound);
    EXPECT_FALSE(engine.wantsSplits());

    writeConfig("V0.5(N,N)");
    EXPECT_TRUE(engine.pollConfig());
    EXPECT_TRUE(engine.wantsSplits());

    const auto table = engine.refresh(realOutputs());
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->outputs.size(), 2u);
    EXPECT_EQ(engine.state(), EngineState::Serving);
    EXPECT_EQ(engine.table(), table);
    EXPECT_STREQ(engine_state_name(engine.state()), "serving");
}

TEST_F(EngineTest, UnchangedConfigIsNotReloaded)
{
    Engine engine(path);
    writeConfig("V0.5(N,N)");
    EXPECT_TRUE(engine.pollConfig());
    EXPECT_FALSE(engine.pollConfig());
    EXPECT_EQ(engine.config()->entries.size(), 1u);
}

TEST_F(EngineTest, RefreshKeepsIdsForSameLeaves)
{
    Engine engine(path);
    writeConfig("V0.5(N,N)");
    ASSERT_TRUE(engine.pollConfig());
    const auto first = engine.refresh(realOutputs());

    // A moved output forces a rebuild
    auto moved = realOutputs();
    moved[0].crtcX = 1920;
    const auto second = engine.refresh(moved);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(first, second);
    EXPECT_EQ(first->outputs[1].xid, second->outputs[1].xid);
    EXPECT_EQ(first->crtcs[0].xid, second->crtcs[0].xid);
    EXPECT_EQ(second->crtcs[1].x, 1920 + 960);
}

TEST_F(EngineTest, CrtcUpdatesSurviveResourceListing)
{
    Engine engine(path);
    writeConfig("V0.5(N,N)");
    ASSERT_TRUE(engine.pollConfig());
    const auto table = engine.refresh(realOutputs());
    ASSERT_NE(table, nullptr);
    ASSERT_EQ(table->crtcs.size(), 2u);
    const uint32_t crtc = table->crtcs[1].xid;
    ASSERT_TRUE(table->updateCrtc(crtc, 960, 0, 0, 1));

    EXPECT_FALSE(engine.pollConfig());
    const auto again = engine.refresh(realOutputs());
    ASSERT_NE(again, nullptr);
    ASSERT_NE(again->findCrtc(crtc), nullptr);
    EXPECT_EQ(again->findCrtc(crtc)->mode, 0u);

    // A new configuration starts from fresh records
    writeBytes(encoded("V0.25(N,N)"), 5000);
    EXPECT_TRUE(engine.pollConfig());
    const auto rebuilt = engine.refresh(realOutputs());
    ASSERT_NE(rebuilt, nullptr);
    ASSERT_NE(rebuilt->findCrtc(crtc), nullptr);
    EXPECT_NE(rebuilt->findCrtc(crtc)->mode, 0u);
    EXPECT_EQ(rebuilt->findCrtc(crtc)->x, 480);
}

TEST_F(EngineTest, RejectedConfigKeepsFakeRecords)
{
    Engine engine(path);
    writeBytes(encoded("V0.5(N,H0.5(N,N))"), 1000);
    ASSERT_TRUE(engine.pollConfig());
    const auto before = engine.refresh(realOutputs());
    ASSERT_NE(before, nullptr);
    ASSERT_EQ(before->outputs.size(), 3u);

    auto bad = encoded("V0.5(N,H0.5(N,N))");
    bad[4 + CONFIG_HEADER_SIZE] = 'X';
    writeBytes(bad, 2000);
    EXPECT_FALSE(engine.pollConfig());

    const auto after = engine.refresh(realOutputs());
    ASSERT_NE(after, nullptr);
    ASSERT_EQ(after->outputs.size(), before->outputs.size());
    ASSERT_EQ(after->crtcs.size(), before->crtcs.size());
    for(size_t i = 0; i < before->outputs.size(); ++i)
        EXPECT_EQ(after->outputs[i].xid, before->outputs[i].xid);
    for(size_t i = 0; i < before->crtcs.size(); ++i)
    {
        EXPECT_EQ(after->crtcs[i].xid, before->crtcs[i].xid);
        EXPECT_EQ(after->crtcs[i].x, before->crtcs[i].x);
        EXPECT_EQ(after->crtcs[i].y, before->crtcs[i].y);
        EXPECT_EQ(after->crtcs[i].width, before->crtcs[i].width);
        EXPECT_EQ(after->crtcs[i].height, before->crtcs[i].height);
    }
    EXPECT_EQ(engine.state(), EngineState::Serving);
}

TEST_F(EngineTest, ClearDropsFakeObjects)
{
    Engine engine(path);
    writeConfig("H0.5(N,N)");
    ASSERT_TRUE(engine.pollConfig());
    ASSERT_NE(engine.refresh(realOutputs()), nullptr);
    engine.clear();
    EXPECT_EQ(engine.table(), nullptr);
}

TEST_F(EngineTest, RemovedConfigStopsSplitting)
{
    Engine engine(path);
    writeConfig("V0.5(N,N)");
    ASSERT_TRUE(engine.pollConfig());
    ASSERT_TRUE(engine.wantsSplits());

    ASSERT_EQ(unlink(path.c_str()), 0);
    EXPECT_TRUE(engine.pollConfig());
    EXPECT_FALSE(engine.wantsSplits());
    const auto table = engine.refresh(realOutputs());
    ASSERT_NE(table, nullptr);
    EXPECT_TRUE(table->empty());
}

TEST_F(EngineTest, IdFailureDisablesSplitting)
{
    Engine engine(path);
    writeConfig("V0.5(N,N)");
    ASSERT_TRUE(engine.pollConfig());

    // A parent id inside the reserved range cannot own fake children
    auto real = realOutputs();
    real[0].output = 0xe0000042;
    EXPECT_EQ(engine.refresh(real), nullptr);
    EXPECT_EQ(engine.state(), EngineState::Disabled);
    EXPECT_FALSE(engine.wantsSplits());
    EXPECT_FALSE(engine.pollConfig());
    EXPECT_EQ(engine.refresh(realOutputs()), nullptr);
}
