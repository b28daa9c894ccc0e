#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <monitors-xml.h>

using namespace splitrandr;

namespace
{

size_t count(std::string const& text, std::string const& needle)
{
    size_t n = 0;
    for(size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size()))
        ++n;
    return n;
}

DisplayLayout sampleLayout()
{
    DisplayLayout layout;

    OutputLayout split;
    split.name = "DP-1";
    split.active = true;
    split.width = 1920;
    split.height = 1080;
    split.rate = 0;
    split.primary = true;
    EXPECT_TRUE(parse_split_tree("V0.5(N,N)", split.tree));
    layout.outputs.push_back(split);

    OutputLayout plain;
    plain.name = "HDMI-1";
    plain.active = true;
    plain.x = 1920;
    plain.width = 2560;
    plain.height = 1440;
    plain.rate = 59.951;
    layout.outputs.push_back(plain);

    OutputLayout off;
    off.name = "VGA-1";
    layout.outputs.push_back(off);
    return layout;
}

} // namespace

TEST(MonitorsXml, SplitConfigurationThenUnsplit)
{
    const auto xml = monitors_xml(sampleLayout());
    EXPECT_EQ(xml.compare(0, 23, "<monitors version=\"2\">\n"), 0);
    EXPECT_EQ(count(xml, "<configuration>"), 2u);

    const auto second = xml.find("<configuration>", xml.find("<configuration>") + 1);
    const std::string split = xml.substr(0, second);
    const std::string unsplit = xml.substr(second);

    EXPECT_EQ(count(split, "<connector>DP-1~0</connector>"), 1u);
    EXPECT_EQ(count(split, "<connector>DP-1~1</connector>"), 1u);
    EXPECT_EQ(count(split, "<connector>DP-1</connector>"), 0u);
    EXPECT_EQ(count(split, "<connector>HDMI-1</connector>"), 1u);
    EXPECT_EQ(count(split, "<x>960</x>"), 1u);
    EXPECT_EQ(count(split, "<width>960</width>"), 2u);
    EXPECT_EQ(count(split, "<vendor>unknown</vendor>"), 3u);
    // Virtual monitors are never primary
    EXPECT_EQ(count(split, "<primary>yes</primary>"), 0u);

    EXPECT_EQ(count(unsplit, "<connector>DP-1</connector>"), 1u);
    EXPECT_EQ(count(unsplit, "~"), 0u);
    EXPECT_EQ(count(unsplit, "<primary>yes</primary>"), 1u);
    EXPECT_EQ(count(xml, "VGA-1"), 0u);
}

TEST(MonitorsXml, RateDefaultsToSixtyHertz)
{
    const auto xml = monitors_xml(sampleLayout());
    EXPECT_EQ(count(xml, "<rate>60.000</rate>"), 3u);
    EXPECT_EQ(count(xml, "<rate>59.951</rate>"), 2u);
}

TEST(MonitorsXml, IdentityComesFromEdid)
{
    auto layout = sampleLayout();
    uint8_t edid[128] = {0x00, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x00, 0x10, 0xac};
    layout.outputs[1].edidHex.clear();
    for(const uint8_t byte : edid)
    {
        char hex[3];
        snprintf(hex, sizeof hex, "%02x", byte);
        layout.outputs[1].edidHex += hex;
    }
    layout.outputs[1].name = "HDMI<1>";

    const auto xml = monitors_xml(layout);
    EXPECT_EQ(count(xml, "<vendor>DEL</vendor>"), 2u);
    EXPECT_EQ(count(xml, "<connector>HDMI&lt;1&gt;</connector>"), 2u);
}

TEST(MonitorsXml, WritesFileCreatingDirectories)
{
    char dirTemplate[] = "/tmp/splitrandr-xml-XXXXXX";
    ASSERT_NE(mkdtemp(dirTemplate), nullptr);
    const std::string dir = dirTemplate;
    const std::string path = dir + "/nested/cinnamon-monitors.xml";

    const auto layout = sampleLayout();
    ASSERT_TRUE(write_monitors_xml(path, layout));

    FILE* f = fopen(path.c_str(), "r");
    ASSERT_NE(f, nullptr);
    std::string contents;
    char buf[1024];
    size_t n;
    while((n = fread(buf, 1, sizeof buf, f)) > 0)
        contents.append(buf, n);
    fclose(f);
    EXPECT_EQ(contents, monitors_xml(layout));

    unlink(path.c_str());
    rmdir((dir + "/nested").c_str());
    rmdir(dir.c_str());
}
