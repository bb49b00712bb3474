/*
* ========================================================================== *
*                                                                            *
*    This file is part of the Letterbox player window layout engine          *
*                                                                            *
*    Copyright (C) 2024   <info@openterface.com>                             *
*                                                                            *
*    This program is free software: you can redistribute it and/or modify    *
*    it under the terms of the GNU General Public License as published by    *
*    the Free Software Foundation version 3.                                 *
*                                                                            *
*    This program is distributed in the hope that it will be useful, but     *
*    WITHOUT ANY WARRANTY; without even the implied warranty of              *
*    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU        *
*    General Public License for more details.                                *
*                                                                            *
*    You should have received a copy of the GNU General Public License       *
*    along with this program. If not, see <http://www.gnu.org/licenses/>.    *
*                                                                            *
* ========================================================================== *
*/

#include "testutil.h"
#include "ui/animationqueue.h"

#include <stdexcept>

TEST(AnimationQueueTest, InstantTasksRunInOrderAndReportIdle)
{
    AnimationQueue queue;
    QStringList order;
    int idleCount = 0;
    QObject::connect(&queue, &AnimationQueue::idle, [&]() { ++idleCount; });

    queue.addTasks({AnimationTask::instant([&]() { order << "A"; }),
                    AnimationTask::instant([&]() { order << "B"; })});
    queue.addTask(AnimationTask::instant([&]() { order << "C"; }));

    EXPECT_EQ(order, QStringList({"A", "B", "C"}));
    EXPECT_EQ(idleCount, 2);
    EXPECT_FALSE(queue.isRunning());
    EXPECT_EQ(queue.pendingCount(), 0);
}

TEST(AnimationQueueTest, TasksAddedNextRunBeforeQueuedTasks)
{
    AnimationQueue queue;
    QStringList order;

    queue.addTasks({AnimationTask::instant([&]() {
                        order << "A";
                        queue.addTasksNext({AnimationTask::instant([&]() { order << "B"; }),
                                            AnimationTask::instant([&]() { order << "C"; })});
                    }),
                    AnimationTask::instant([&]() { order << "D"; })});

    EXPECT_EQ(order, QStringList({"A", "B", "C", "D"}));
}

TEST(AnimationQueueTest, TimedTaskHoldsQueueUntilItsDurationPasses)
{
    AnimationQueue queue;
    QStringList order;

    queue.addTasks({AnimationTask(0.02, TimingCurve::EaseIn, [&]() { order << "timed"; }),
                    AnimationTask::instant([&]() { order << "after"; })});

    EXPECT_EQ(order, QStringList({"timed"}));
    EXPECT_TRUE(queue.isRunning());
    EXPECT_EQ(queue.pendingCount(), 1);

    // Added while busy: waits its turn
    queue.addTask(AnimationTask::instant([&]() { order << "late"; }));
    EXPECT_EQ(order, QStringList({"timed"}));

    ASSERT_TRUE(waitForSignal(&queue, &AnimationQueue::idle));
    EXPECT_EQ(order, QStringList({"timed", "after", "late"}));
    EXPECT_FALSE(queue.isRunning());
}

TEST(AnimationQueueTest, ZeroScaleRunsEverythingSynchronously)
{
    AnimationQueue queue;
    queue.setDurationScale(0);
    bool idle = false;
    QObject::connect(&queue, &AnimationQueue::idle, [&]() { idle = true; });

    int runs = 0;
    queue.addTasks({AnimationTask(5, TimingCurve::Linear, [&]() { ++runs; }),
                    AnimationTask(5, TimingCurve::Linear, [&]() { ++runs; })});

    EXPECT_EQ(runs, 2);
    EXPECT_TRUE(idle);
    EXPECT_FALSE(queue.isRunning());
}

TEST(AnimationQueueTest, TaskStartedCarriesScaledDuration)
{
    AnimationQueue queue;
    queue.setDurationScale(0.5);
    QList<qreal> durations;
    QObject::connect(&queue, &AnimationQueue::taskStarted, [&](qreal duration) { durations << duration; });

    queue.addTasks({AnimationTask::instant(nullptr), AnimationTask(0.04, TimingCurve::Linear, nullptr)});
    ASSERT_TRUE(waitForSignal(&queue, &AnimationQueue::idle));

    ASSERT_EQ(durations.size(), 2);
    EXPECT_EQ(durations.at(0), 0);
    EXPECT_DOUBLE_EQ(durations.at(1), 0.02);
}

TEST(AnimationQueueTest, NegativeScaleIsClamped)
{
    AnimationQueue queue;
    queue.setDurationScale(-3);
    EXPECT_EQ(queue.durationScale(), 0);
}

TEST(AnimationQueueTest, FailingTaskDoesNotStallQueue)
{
    AnimationQueue queue;
    QStringList order;

    queue.addTasks({AnimationTask::instant([&]() { throw std::runtime_error("broken step"); }),
                    AnimationTask::instant([&]() { order << "after"; })});

    EXPECT_EQ(order, QStringList({"after"}));
    EXPECT_FALSE(queue.isRunning());

    queue.addTask(AnimationTask::instant([&]() { order << "next"; }));
    EXPECT_EQ(order, QStringList({"after", "next"}));
}
