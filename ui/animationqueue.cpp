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

#include "animationqueue.h"

#include <exception>

Q_LOGGING_CATEGORY(log_ui_animation, "lbx.ui.animation")

AnimationQueue::AnimationQueue(QObject *parent) : QObject(parent)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &AnimationQueue::onProcessTasks);
}

AnimationQueue::~AnimationQueue()
{
    m_timer.stop();
    if (!m_taskQueue.isEmpty()) {
        qCDebug(log_ui_animation) << "Dropping" << m_taskQueue.size() << "unfinished tasks";
    }
}

void AnimationQueue::addTask(const AnimationTask &task)
{
    m_taskQueue.enqueue(task);
    if (!isRunning()) {
        onProcessTasks();
    }
}

void AnimationQueue::addTasks(const QList<AnimationTask> &tasks)
{
    for (const AnimationTask &task : tasks) {
        m_taskQueue.enqueue(task);
    }
    if (!isRunning()) {
        onProcessTasks();
    }
}

void AnimationQueue::addTasksNext(const QList<AnimationTask> &tasks)
{
    for (int i = tasks.size() - 1; i >= 0; --i) {
        m_taskQueue.prepend(tasks.at(i));
    }
    if (!isRunning()) {
        onProcessTasks();
    }
}

void AnimationQueue::onProcessTasks()
{
    m_running = true;
    while (!m_taskQueue.isEmpty()) {
        const AnimationTask task = m_taskQueue.dequeue();
        const qreal duration = task.duration * m_durationScale;
        emit taskStarted(duration);
        if (task.body) {
            try {
                task.body();
            } catch (const std::exception &e) {
                qCCritical(log_ui_animation) << "Animation task failed:" << e.what();
            }
        }
        if (duration > 0) {
            // Resume once this task's animation has had time to finish
            m_running = false;
            m_timer.start(qRound(duration * 1000));
            return;
        }
    }
    m_running = false;
    emit idle();
}
