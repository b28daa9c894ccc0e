#include <gtest/gtest.h>
#include <stdio.h>
#include <unistd.h>
#include <process-control.h>

using namespace splitrandr;

namespace
{

std::string selfFile(const char* entry)
{
    std::string contents;
    FILE* f = fopen((std::string("/proc/self/") + entry).c_str(), "r");
    if(!f)
        return contents;
    char buf[4096];
    size_t n;
    while((n = fread(buf, 1, sizeof buf, f)) > 0)
        contents.append(buf, n);
    fclose(f);
    return contents;
}

} // namespace

TEST(ProcessControl, PrependPreload)
{
    EXPECT_EQ(prepend_preload(nullptr, "/usr/lib/libsplitrandr.so"), "/usr/lib/libsplitrandr.so");
    EXPECT_EQ(prepend_preload("", "/usr/lib/libsplitrandr.so"), "/usr/lib/libsplitrandr.so");
    EXPECT_EQ(prepend_preload("/lib/libother.so", "/usr/lib/libsplitrandr.so"),
              "/usr/lib/libsplitrandr.so:/lib/libother.so");
    EXPECT_EQ(prepend_preload("/lib/libother.so:/usr/lib/libsplitrandr.so", "/usr/lib/libsplitrandr.so"),
              "/lib/libother.so:/usr/lib/libsplitrandr.so");
    EXPECT_EQ(prepend_preload("/lib/libother.so /usr/lib/libsplitrandr.so", "/usr/lib/libsplitrandr.so"),
              "/lib/libother.so /usr/lib/libsplitrandr.so");
    // A prefix of an existing entry is not the same library
    EXPECT_EQ(prepend_preload("/usr/lib/libsplitrandr.so.1", "/usr/lib/libsplitrandr.so"),
              "/usr/lib/libsplitrandr.so:/usr/lib/libsplitrandr.so.1");
}

TEST(ProcessControl, ParseStatState)
{
    EXPECT_EQ(parse_stat_state("1234 (cinnamon) S 1 1234 1234 0 -1"), 'S');
    EXPECT_EQ(parse_stat_state("1234 (odd) name) T 1 1234"), 'T');
    EXPECT_EQ(parse_stat_state("1234 (a b) t 1"), 't');
    EXPECT_EQ(parse_stat_state("garbage"), 0);
    EXPECT_EQ(parse_stat_state("1234 (x)   "), 0);
}

TEST(ProcessControl, InspectsOwnProcess)
{
    SystemProcessControl control;
    EXPECT_EQ(control.processState(getpid()), 'R');

    std::string comm = selfFile("comm");
    if(!comm.empty() && comm[comm.size() - 1] == '\n')
        comm.erase(comm.size() - 1);
    ASSERT_FALSE(comm.empty());
    EXPECT_NE(control.findProcess(comm), 0);
    EXPECT_EQ(control.findProcess("no-such-process-name"), 0);
}

TEST(ProcessControl, MissingProcessHasNoState)
{
    SystemProcessControl control;
    // Above the default pid_max
    EXPECT_EQ(control.processState(4194304 + 1), 0);
    EXPECT_FALSE(control.mapsLibrary(4194304 + 1, "/lib/libc.so.6"));
}

TEST(ProcessControl, MapsLibrary)
{
    const std::string maps = selfFile("maps");
    const auto slash = maps.find('/');
    ASSERT_NE(slash, std::string::npos);
    const std::string mapped = maps.substr(slash, maps.find('\n', slash) - slash);

    SystemProcessControl control;
    EXPECT_TRUE(control.mapsLibrary(getpid(), mapped));
    EXPECT_TRUE(control.mapsLibrary(getpid(), mapped.substr(mapped.rfind('/') + 1)));
    EXPECT_FALSE(control.mapsLibrary(getpid(), "/nonexistent/libsplitrandr.so"));
}
