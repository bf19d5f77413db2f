// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/Macros.hpp"
#include "utils/ScopeGuard.hpp"

TEST(ScopeGuardTests, RunsOnScopeExit)
{
    int calls = 0;
    {
        auto guard = Utils::makeScopeGuard([&calls] { ++calls; });
        EXPECT_TRUE(guard.isArmed());
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTests, DismissSkipsAction)
{
    int calls = 0;
    {
        auto guard = Utils::makeScopeGuard([&calls] { ++calls; });
        guard.dismiss();
    }
    EXPECT_EQ(calls, 0);
}

TEST(ScopeGuardTests, MovedFromGuardDoesNotFire)
{
    int calls = 0;
    {
        auto outer = Utils::makeScopeGuard([&calls] { ++calls; });
        {
            auto inner = std::move(outer);
            EXPECT_FALSE(outer.isArmed());
        }
        EXPECT_EQ(calls, 1);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTests, DeferRunsInReverseOrder)
{
    QString trace;
    {
        UTILS_DEFER(trace += QLatin1Char('a'));
        UTILS_DEFER(trace += QLatin1Char('b'));
    }
    EXPECT_EQ(trace, QStringLiteral("ba"));
}
