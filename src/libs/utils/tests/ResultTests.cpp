// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/Macros.hpp"
#include "utils/Result.hpp"

namespace {

Utils::Result requirePositive(int v)
{
    UTILS_GUARD_OK(v > 0, QStringLiteral("must be positive"));
    return Utils::Result::success();
}

} // namespace

TEST(ResultTests, SuccessIsTruthy)
{
    const Utils::Result r = Utils::Result::success();
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_TRUE(r.errors.isEmpty());
}

TEST(ResultTests, FailureKeepsEveryMessage)
{
    Utils::Result r = Utils::Result::failure(QStringLiteral("first"));
    r.addError(QStringLiteral("second"));

    EXPECT_FALSE(r);
    ASSERT_EQ(r.errors.size(), 2);
    EXPECT_EQ(r.message(), QStringLiteral("first; second"));
}

TEST(ResultTests, MergeTurnsSuccessIntoFailure)
{
    Utils::Result r;
    r.merge(Utils::Result::success());
    EXPECT_TRUE(r);

    r.merge(Utils::Result::failure(QStringList{QStringLiteral("a"), QStringLiteral("b")}));
    EXPECT_FALSE(r);
    EXPECT_EQ(r.errors, (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
}

TEST(ResultTests, GuardMacroReturnsFailure)
{
    EXPECT_TRUE(requirePositive(3));
    const Utils::Result r = requirePositive(-1);
    EXPECT_FALSE(r);
    EXPECT_EQ(r.errors.value(0), QStringLiteral("must be positive"));
}
