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

#ifndef PLAYERWINDOW_H
#define PLAYERWINDOW_H

#include <QMainWindow>
#include <QFrame>
#include <QPointer>
#include <QPropertyAnimation>
#include <QTimer>
#include <QLoggingCategory>

#include "ui/playerwindowhost.h"
#include "layout/layoutpreferences.h"

Q_DECLARE_LOGGING_CATEGORY(log_ui_window)

class WindowLayoutCoordinator;
class QResizeEvent;
class QMoveEvent;
class QCloseEvent;
class QKeyEvent;

/**
 * @brief Player window with placeholder bars, driven by a WindowLayoutCoordinator
 *
 * Draws the video area and the four bars as plain frames where the current geometry
 * says they go. Converts between Qt's top-left coordinates and the model's
 * bottom-left coordinates.
 */
class PlayerWindow : public QMainWindow, public PlayerWindowHost
{
    Q_OBJECT

public:
    explicit PlayerWindow(const LayoutPreferences &prefs, QWidget *parent = nullptr);
    ~PlayerWindow();

    WindowLayoutCoordinator *coordinator() const { return m_coordinator; }

    // PlayerWindowHost
    ScreenList screens() const override;
    void setWindowGeometry(const WindowGeometry &geometry, qreal duration, TimingCurve timing) override;
    void showFadeableViews(const LayoutState &layout, qreal duration) override;
    void fadeOutOldViews(const LayoutState &oldLayout, const LayoutState &newLayout, qreal duration) override;
    void updateHiddenViews(const LayoutState &layout) override;
    void fadeInNewViews(const LayoutState &layout, qreal duration) override;
    void applyWindowStyle(const LayoutState &layout) override;
    void setVideoUpdatesSuspended(bool suspended) override;

protected:
    void resizeEvent(QResizeEvent *event) override;
    void moveEvent(QMoveEvent *event) override;
    void closeEvent(QCloseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private slots:
    void onLiveResizeEnded();

private:
    QFrame *createBar(const QString &name, const QString &color);
    void layoutBars(const WindowGeometry &geometry);
    void fadeWidget(QWidget *widget, bool show, qreal duration);
    QRect toQtRect(const QRectF &modelFrame) const;
    QRectF toModelFrame(const QRect &qtRect) const;
    QString currentScreenID() const;

    WindowLayoutCoordinator *m_coordinator;
    QWidget *m_content;
    QFrame *m_videoView;
    QFrame *m_topBar;
    QFrame *m_bottomBar;
    QFrame *m_leadingSidebar;
    QFrame *m_trailingSidebar;

    QPointer<QPropertyAnimation> m_geometryAnimation;
    WindowGeometry m_geometry;                  ///< Last geometry applied by the coordinator
    QTimer m_liveResizeTimer;
    bool m_isApplyingGeometry = false;
    bool m_isInLiveResize = false;
};

#endif // PLAYERWINDOW_H
