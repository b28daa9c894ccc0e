#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>
#include <paths.h>

using namespace splitrandr;

namespace
{

class PathsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        save("HOME");
        save("XDG_CONFIG_HOME");
        save("SPLITRANDR_CONFIG");
        unsetenv("SPLITRANDR_CONFIG");
    }

    void TearDown() override
    {
        for(const auto& var : saved)
        {
            if(var.second.first)
                setenv(var.first.c_str(), var.second.second.c_str(), 1);
            else
                unsetenv(var.first.c_str());
        }
    }

    void save(const char* name)
    {
        const char* value = getenv(name);
        saved.push_back({name, {value != nullptr, value ? value : ""}});
    }

    std::vector<std::pair<std::string, std::pair<bool, std::string>>> saved;
};

std::string readFile(std::string const& path)
{
    std::string contents;
    FILE* f = fopen(path.c_str(), "rb");
    if(!f)
        return contents;
    char buf[256];
    size_t n;
    while((n = fread(buf, 1, sizeof buf, f)) > 0)
        contents.append(buf, n);
    fclose(f);
    return contents;
}

} // namespace

TEST_F(PathsTest, XdgConfigHome)
{
    setenv("XDG_CONFIG_HOME", "/srv/conf", 1);
    EXPECT_EQ(config_home(), "/srv/conf");
    EXPECT_EQ(binary_config_path(), "/srv/conf/splitrandr.bin");
    EXPECT_EQ(monitors_xml_path(), "/srv/conf/cinnamon-monitors.xml");
}

TEST_F(PathsTest, RelativeXdgFallsBackToHome)
{
    setenv("HOME", "/home/alice", 1);
    setenv("XDG_CONFIG_HOME", "conf", 1);
    EXPECT_EQ(config_home(), "/home/alice/.config");
    unsetenv("XDG_CONFIG_HOME");
    EXPECT_EQ(binary_config_path(), "/home/alice/.config/splitrandr.bin");
}

TEST_F(PathsTest, ExplicitConfigPath)
{
    setenv("XDG_CONFIG_HOME", "/srv/conf", 1);
    setenv("SPLITRANDR_CONFIG", "/run/splits.bin", 1);
    EXPECT_EQ(binary_config_path(), "/run/splits.bin");
    EXPECT_EQ(monitors_xml_path(), "/srv/conf/cinnamon-monitors.xml");

    setenv("SPLITRANDR_CONFIG", "", 1);
    EXPECT_EQ(binary_config_path(), "/srv/conf/splitrandr.bin");
}

TEST_F(PathsTest, AtomicWriteReplacesFile)
{
    char dirTemplate[] = "/tmp/splitrandr-paths-XXXXXX";
    ASSERT_NE(mkdtemp(dirTemplate), nullptr);
    const std::string dir = dirTemplate;
    const std::string path = dir + "/a/b/file";

    ASSERT_TRUE(write_file_atomically(path, "first", 5));
    EXPECT_EQ(readFile(path), "first");
    ASSERT_TRUE(write_file_atomically(path, "2nd", 3));
    EXPECT_EQ(readFile(path), "2nd");

    const std::string temp = path + ".tmp." + std::to_string(getpid());
    struct stat st;
    EXPECT_NE(stat(temp.c_str(), &st), 0);

    EXPECT_TRUE(remove_file(path));
    EXPECT_NE(stat(path.c_str(), &st), 0);
    // Already gone
    EXPECT_TRUE(remove_file(path));

    rmdir((dir + "/a/b").c_str());
    rmdir((dir + "/a").c_str());
    rmdir(dir.c_str());
}
