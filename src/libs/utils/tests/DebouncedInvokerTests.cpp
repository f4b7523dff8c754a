// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/async/DebouncedInvoker.hpp"

#include <QtCore/QCoreApplication>
#include <QtTest/QSignalSpy>

namespace {

QCoreApplication* ensureCoreApp()
{
    if (auto* existing = QCoreApplication::instance())
        return existing;

    static int argc = 1;
    static char appName[] = "UtilsTests";
    static char* argv[] = {appName, nullptr};
    static QCoreApplication app(argc, argv);
    return &app;
}

} // namespace

TEST(DebouncedInvokerTests, BurstRunsActionOnce)
{
    ensureCoreApp();

    Utils::Async::DebouncedInvoker invoker(10);
    int runs = 0;
    invoker.setAction([&runs]() { ++runs; });

    QSignalSpy spy(&invoker, &Utils::Async::DebouncedInvoker::fired);
    invoker.trigger();
    invoker.trigger();
    invoker.trigger();
    EXPECT_TRUE(invoker.isPending());

    ASSERT_TRUE(spy.wait(1000));
    EXPECT_EQ(runs, 1);
    EXPECT_FALSE(invoker.isPending());
}

TEST(DebouncedInvokerTests, CancelDropsPendingAction)
{
    ensureCoreApp();

    Utils::Async::DebouncedInvoker invoker(5);
    int runs = 0;
    invoker.setAction([&runs]() { ++runs; });

    QSignalSpy spy(&invoker, &Utils::Async::DebouncedInvoker::fired);
    invoker.trigger();
    invoker.cancel();

    EXPECT_FALSE(spy.wait(50));
    EXPECT_EQ(runs, 0);
}

TEST(DebouncedInvokerTests, FlushRunsOnlyWhenPending)
{
    ensureCoreApp();

    Utils::Async::DebouncedInvoker invoker(10000);
    int runs = 0;
    invoker.setAction([&runs]() { ++runs; });

    EXPECT_FALSE(invoker.flush());
    EXPECT_EQ(runs, 0);

    invoker.trigger();
    EXPECT_TRUE(invoker.flush());
    EXPECT_EQ(runs, 1);
    EXPECT_FALSE(invoker.isPending());
}

TEST(DebouncedInvokerTests, TriggerWithoutActionIsIgnored)
{
    ensureCoreApp();

    Utils::Async::DebouncedInvoker invoker(10);
    invoker.trigger();
    EXPECT_FALSE(invoker.isPending());
}
