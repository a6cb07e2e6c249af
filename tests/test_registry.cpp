// tests/test_registry.cpp
#include <gtest/gtest.h>

#include "session/registry.hpp"
#include "sim_rig.hpp"

using session::Registry;

TEST(Registry, PutAndGetLive)
{
    SimRig rig;
    ASSERT_NE(rig.wr, nullptr);
    Registry reg;
    auto     s = rig.make_session();
    ASSERT_TRUE(s);

    EXPECT_EQ(reg.get("SIM-0001"), nullptr);
    ASSERT_TRUE(reg.put(s));
    EXPECT_EQ(reg.get("SIM-0001"), s);
    EXPECT_EQ(reg.size(), 1u);
    ASSERT_EQ(reg.all().size(), 1u);
    EXPECT_EQ(reg.all()[0], s);
}

TEST(Registry, SecondLiveSessionRefused)
{
    SimRig   rig;
    Registry reg;
    auto     a = std::make_shared<session::Session>(*rig.dev, *rig.wr, *rig.nt);
    auto     b = std::make_shared<session::Session>(*rig.dev, *rig.wr, *rig.nt);

    ASSERT_TRUE(reg.put(a));
    EXPECT_FALSE(reg.put(b));
    EXPECT_EQ(reg.get("SIM-0001"), a);
}

TEST(Registry, DeadEntryHiddenAndReplaced)
{
    SimRig   rig;
    Registry reg;
    auto     a = std::make_shared<session::Session>(*rig.dev, *rig.wr, *rig.nt);
    auto     b = std::make_shared<session::Session>(*rig.dev, *rig.wr, *rig.nt);

    ASSERT_TRUE(reg.put(a));
    a->close();
    EXPECT_EQ(reg.get("SIM-0001"), nullptr);
    ASSERT_TRUE(reg.put(b));
    EXPECT_EQ(reg.get("SIM-0001"), b);
}

TEST(Registry, RemoveOnlyMatchingInstance)
{
    SimRig   rig;
    Registry reg;
    auto     a = std::make_shared<session::Session>(*rig.dev, *rig.wr, *rig.nt);
    auto     b = std::make_shared<session::Session>(*rig.dev, *rig.wr, *rig.nt);

    ASSERT_TRUE(reg.put(a));
    EXPECT_FALSE(reg.remove("SIM-0001", b.get()));
    EXPECT_EQ(reg.size(), 1u);
    EXPECT_TRUE(reg.remove("SIM-0001", a.get()));
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_FALSE(reg.remove("SIM-0001", a.get()));
}
