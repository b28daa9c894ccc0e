#include <gtest/gtest.h>
#include <fake-xid.h>

using namespace splitrandr;

TEST(FakeXid, ReservedBitsMarkFakeIds)
{
    EXPECT_TRUE(is_fake(0xE0000000u));
    EXPECT_TRUE(is_fake(0xFFFFFFFFu));
    EXPECT_FALSE(is_fake(0x1FFFFFFFu));
    EXPECT_FALSE(is_fake(0x00400042u));
    EXPECT_FALSE(is_fake(0xC0000001u));
    EXPECT_EQ(classify(0x00400042u), XidClass::Real);
    EXPECT_EQ(classify(make_fake_xid(3, FakeKind::Crtc)), XidClass::Fake);
}

TEST(FakeXid, EncodesKindAndSlot)
{
    const auto xid = make_fake_xid(1234, FakeKind::Mode);
    EXPECT_TRUE(is_fake(xid));
    EXPECT_EQ(fake_kind(xid), FakeKind::Mode);
    EXPECT_EQ(fake_slot(xid), 1234u);
}

TEST(FakeXid, AllocationIsIdempotentPerLeaf)
{
    FakeXidNamespace ids;
    const auto first = ids.allocate(0x42, 0);
    const auto second = ids.allocate(0x42, 1);
    EXPECT_NE(first, 0u);
    EXPECT_NE(first, second);
    EXPECT_EQ(ids.allocate(0x42, 0), first);
    EXPECT_EQ(ids.allocate(0x42, 1), second);
    EXPECT_EQ(ids.size(), 2u);

    // Same leaf, other kinds: same slot, distinct ids
    const auto crtc = ids.allocate(0x42, 1, FakeKind::Crtc);
    EXPECT_EQ(fake_slot(crtc), fake_slot(second));
    EXPECT_EQ(fake_kind(crtc), FakeKind::Crtc);
    EXPECT_NE(crtc, second);
    EXPECT_EQ(ids.size(), 2u);

    EXPECT_EQ(ids.findSlot(0x42, 1), long(fake_slot(second)));
    EXPECT_EQ(ids.findSlot(0x43, 0), -1);
}

TEST(FakeXid, RefusesFakeParents)
{
    FakeXidNamespace ids;
    EXPECT_EQ(ids.allocate(make_fake_xid(0, FakeKind::Output), 0), 0u);
    EXPECT_EQ(ids.size(), 0u);
}

TEST(FakeXid, ExhaustedRegistryReturnsZero)
{
    FakeXidNamespace ids(2);
    EXPECT_NE(ids.allocate(0x42, 0), 0u);
    EXPECT_NE(ids.allocate(0x42, 1), 0u);
    EXPECT_EQ(ids.allocate(0x42, 2), 0u);
    // Known pairs still resolve
    EXPECT_NE(ids.allocate(0x42, 1), 0u);
}
