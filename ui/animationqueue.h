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

#ifndef ANIMATIONQUEUE_H
#define ANIMATIONQUEUE_H

#include <QObject>
#include <QQueue>
#include <QTimer>
#include <QList>
#include <QLoggingCategory>
#include <functional>

#include "transition/transitionoperation.h"

Q_DECLARE_LOGGING_CATEGORY(log_ui_animation)

/**
 * @brief One unit of work for the AnimationQueue
 *
 * The body starts the change (for example an animated window resize) and the queue
 * waits @c duration seconds before running the next task.
 */
struct AnimationTask
{
    qreal duration = 0;
    TimingCurve timing = TimingCurve::Linear;
    std::function<void()> body;

    AnimationTask() = default;
    AnimationTask(qreal duration, TimingCurve timing, std::function<void()> body)
        : duration(duration), timing(timing), body(std::move(body)) {}

    static AnimationTask instant(std::function<void()> body) {
        return AnimationTask(0, TimingCurve::Linear, std::move(body));
    }
};

/**
 * @brief Runs tasks strictly in order on the GUI thread
 *
 * Zero duration tasks run back to back without returning to the event loop. A timed
 * task runs its body, then a single shot timer holds the queue for its duration.
 * Tasks added while the queue is busy (including from inside a running body) wait
 * their turn.
 */
class AnimationQueue : public QObject
{
    Q_OBJECT
public:
    explicit AnimationQueue(QObject *parent = nullptr);
    ~AnimationQueue();

    void addTask(const AnimationTask &task);
    void addTasks(const QList<AnimationTask> &tasks);

    /**
     * @brief Put @p tasks at the front of the queue, keeping their order
     *
     * Meant to be called from a running task body, to expand it into several steps
     * which run before anything queued after it.
     */
    void addTasksNext(const QList<AnimationTask> &tasks);

    /// True while a task is running or waiting for its duration to pass
    bool isRunning() const { return m_running || m_timer.isActive(); }
    int pendingCount() const { return m_taskQueue.size(); }

    /**
     * @brief Multiplier for task durations. 0 runs everything synchronously.
     */
    void setDurationScale(qreal scale) { m_durationScale = qMax(qreal(0), scale); }
    qreal durationScale() const { return m_durationScale; }

signals:
    void taskStarted(qreal duration);
    /// Emitted when the last queued task has finished
    void idle();

private slots:
    void onProcessTasks();

private:
    QQueue<AnimationTask> m_taskQueue;
    QTimer m_timer;
    bool m_running = false;
    qreal m_durationScale = 1.0;
};

#endif // ANIMATIONQUEUE_H
