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

#include "playerwindow.h"
#include "ui/coordinator/windowlayoutcoordinator.h"
#include "ui/globalsetting.h"
#include "geometry/rectutil.h"

#include <QGraphicsOpacityEffect>
#include <QResizeEvent>
#include <QMoveEvent>
#include <QCloseEvent>
#include <QKeyEvent>
#include <QScreen>
#include <QWindow>
#include <QDebug>

Q_LOGGING_CATEGORY(log_ui_window, "lbx.ui.window")

namespace {

QEasingCurve toEasingCurve(TimingCurve timing)
{
    switch (timing) {
    case TimingCurve::Linear: return QEasingCurve(QEasingCurve::Linear);
    case TimingCurve::EaseIn: return QEasingCurve(QEasingCurve::InQuad);
    case TimingCurve::EaseOut: return QEasingCurve(QEasingCurve::OutQuad);
    case TimingCurve::EaseInEaseOut: return QEasingCurve(QEasingCurve::InOutQuad);
    }
    return QEasingCurve(QEasingCurve::Linear);
}

int toMilliseconds(qreal seconds)
{
    return qMax(0, qRound(seconds * 1000));
}

}

PlayerWindow::PlayerWindow(const LayoutPreferences &prefs, QWidget *parent)
    : QMainWindow(parent)
    , m_coordinator(nullptr)
{
    setWindowTitle(QStringLiteral("Letterbox"));

    m_content = new QWidget(this);
    m_content->setStyleSheet("background-color: #202020;");
    setCentralWidget(m_content);

    m_videoView = createBar(QStringLiteral("videoView"), QStringLiteral("#000000"));
    m_topBar = createBar(QStringLiteral("topBar"), QStringLiteral("#3a3a3c"));
    m_bottomBar = createBar(QStringLiteral("bottomBar"), QStringLiteral("#3a3a3c"));
    m_leadingSidebar = createBar(QStringLiteral("leadingSidebar"), QStringLiteral("#2c2c2e"));
    m_trailingSidebar = createBar(QStringLiteral("trailingSidebar"), QStringLiteral("#2c2c2e"));

    m_liveResizeTimer.setSingleShot(true);
    m_liveResizeTimer.setInterval(250);
    connect(&m_liveResizeTimer, &QTimer::timeout, this, &PlayerWindow::onLiveResizeEnded);

    m_coordinator = new WindowLayoutCoordinator(this, prefs, this);
    connect(m_coordinator, &WindowLayoutCoordinator::fullscreenChanged, this, [](bool isFullScreen) {
        qCDebug(log_ui_window) << "Full screen changed:" << isFullScreen;
    });
    connect(m_coordinator, &WindowLayoutCoordinator::layoutChanged, this, [this](const LayoutState &layout) {
        setWindowTitle(QStringLiteral("Letterbox - %1").arg(toString(layout.mode())));
    });
}

PlayerWindow::~PlayerWindow()
{
    if (m_geometryAnimation) {
        m_geometryAnimation->stop();
    }
}

QFrame *PlayerWindow::createBar(const QString &name, const QString &color)
{
    QFrame *bar = new QFrame(m_content);
    bar->setObjectName(name);
    bar->setStyleSheet(QStringLiteral("QFrame#%1 { background-color: %2; }").arg(name, color));
    bar->setGraphicsEffect(new QGraphicsOpacityEffect(bar));
    bar->hide();
    return bar;
}

// Coordinates

QRect PlayerWindow::toQtRect(const QRectF &modelFrame) const
{
    return RectUtil::flipVertically(modelFrame, screens().referenceHeight()).toRect();
}

QRectF PlayerWindow::toModelFrame(const QRect &qtRect) const
{
    return RectUtil::flipVertically(QRectF(qtRect), screens().referenceHeight());
}

QString PlayerWindow::currentScreenID() const
{
    QScreen *current = screen();
    return current ? current->name() : QString();
}

// PlayerWindowHost

ScreenList PlayerWindow::screens() const
{
    return ScreenList::fromApplication();
}

void PlayerWindow::setWindowGeometry(const WindowGeometry &geometry, qreal duration, TimingCurve timing)
{
    m_geometry = geometry;
    const QRect target = toQtRect(geometry.windowFrame());
    qCDebug(log_ui_window) << "Set window frame" << target << "over" << duration << "s";

    if (m_geometryAnimation) {
        m_geometryAnimation->stop();
    }

    if (isFullScreen() && geometry.fitOption() == ScreenFitOption::NativeFullScreen) {
        // The window manager owns the frame in native full screen
        layoutBars(geometry);
        return;
    }

    if (duration <= 0 || !isVisible()) {
        m_isApplyingGeometry = true;
        setGeometry(target);
        m_isApplyingGeometry = false;
        layoutBars(geometry);
        return;
    }

    m_isApplyingGeometry = true;
    QPropertyAnimation *animation = new QPropertyAnimation(this, "geometry");
    animation->setDuration(toMilliseconds(duration));
    animation->setStartValue(QMainWindow::geometry());
    animation->setEndValue(target);
    animation->setEasingCurve(toEasingCurve(timing));
    connect(animation, &QPropertyAnimation::finished, this, [this, geometry]() {
        m_isApplyingGeometry = false;
        layoutBars(geometry);
    });
    m_geometryAnimation = animation;
    animation->start(QAbstractAnimation::DeleteWhenStopped);
}

void PlayerWindow::layoutBars(const WindowGeometry &geometry)
{
    const qreal windowHeight = geometry.windowFrame().height();
    const qreal windowWidth = geometry.windowFrame().width();
    const BoxQuad &outside = geometry.outsideBars();
    const BoxQuad &inside = geometry.insideBars();
    const qreal topMargin = geometry.topMarginHeight();
    const QSizeF viewportSize = geometry.viewportSize();

    // Frames in window coordinates, bottom-left origin
    const qreal topBarHeight = outside.top + inside.top;
    const QRectF topBar(outside.leading, windowHeight - topMargin - topBarHeight, viewportSize.width(), topBarHeight);
    const QRectF bottomBar(outside.leading, 0, viewportSize.width(), outside.bottom + inside.bottom);
    const QRectF leadingSidebar(0, 0, outside.leading + inside.leading, windowHeight - topMargin);
    const qreal trailingWidth = outside.trailing + inside.trailing;
    const QRectF trailingSidebar(windowWidth - trailingWidth, 0, trailingWidth, windowHeight - topMargin);

    auto place = [windowHeight](QWidget *widget, const QRectF &frame) {
        widget->setGeometry(RectUtil::flipVertically(frame, windowHeight).toRect());
    };
    place(m_videoView, geometry.videoFrameInWindow());
    place(m_topBar, topBar);
    place(m_bottomBar, bottomBar);
    place(m_leadingSidebar, leadingSidebar);
    place(m_trailingSidebar, trailingSidebar);
    m_videoView->show();
    m_videoView->lower();
}

void PlayerWindow::fadeWidget(QWidget *widget, bool show, qreal duration)
{
    QGraphicsOpacityEffect *effect = qobject_cast<QGraphicsOpacityEffect *>(widget->graphicsEffect());
    if (!effect) {
        widget->setVisible(show);
        return;
    }
    if (show) {
        widget->show();
    }
    const qreal endValue = show ? 1.0 : 0.0;
    if (duration <= 0) {
        effect->setOpacity(endValue);
        return;
    }
    QPropertyAnimation *animation = new QPropertyAnimation(effect, "opacity");
    animation->setDuration(toMilliseconds(duration));
    animation->setStartValue(effect->opacity());
    animation->setEndValue(endValue);
    animation->start(QAbstractAnimation::DeleteWhenStopped);
}

void PlayerWindow::showFadeableViews(const LayoutState &layout, qreal duration)
{
    if (isShowable(layout.topBarView())) {
        fadeWidget(m_topBar, true, duration);
    }
    if (isShowable(layout.bottomBarView())) {
        fadeWidget(m_bottomBar, true, duration);
    }
}

void PlayerWindow::fadeOutOldViews(const LayoutState &oldLayout, const LayoutState &newLayout, qreal duration)
{
    if (isShowable(oldLayout.topBarView()) && !isShowable(newLayout.topBarView())) {
        fadeWidget(m_topBar, false, duration);
    }
    if (isShowable(oldLayout.bottomBarView()) && !isShowable(newLayout.bottomBarView())) {
        fadeWidget(m_bottomBar, false, duration);
    }
    if (oldLayout.leadingSidebar().isVisible() && !newLayout.leadingSidebar().isVisible()) {
        fadeWidget(m_leadingSidebar, false, duration);
    }
    if (oldLayout.trailingSidebar().isVisible() && !newLayout.trailingSidebar().isVisible()) {
        fadeWidget(m_trailingSidebar, false, duration);
    }
}

void PlayerWindow::updateHiddenViews(const LayoutState &layout)
{
    m_topBar->setVisible(isShowable(layout.topBarView()));
    m_bottomBar->setVisible(isShowable(layout.bottomBarView()));
    m_leadingSidebar->setVisible(layout.leadingSidebar().isVisible());
    m_trailingSidebar->setVisible(layout.trailingSidebar().isVisible());
}

void PlayerWindow::fadeInNewViews(const LayoutState &layout, qreal duration)
{
    if (isShowable(layout.topBarView())) {
        fadeWidget(m_topBar, true, duration);
    }
    if (isShowable(layout.bottomBarView())) {
        fadeWidget(m_bottomBar, true, duration);
    }
    if (layout.leadingSidebar().isVisible()) {
        fadeWidget(m_leadingSidebar, true, duration);
    }
    if (layout.trailingSidebar().isVisible()) {
        fadeWidget(m_trailingSidebar, true, duration);
    }
}

void PlayerWindow::applyWindowStyle(const LayoutState &layout)
{
    const bool wasVisible = isVisible();
    const bool frameless = layout.spec().isLegacyStyle() || layout.isMusicMode();
    m_isApplyingGeometry = true;

    if (frameless != windowFlags().testFlag(Qt::FramelessWindowHint)) {
        // Changing flags hides the window
        setWindowFlag(Qt::FramelessWindowHint, frameless);
        if (wasVisible && !layout.isNativeFullScreen()) {
            show();
        }
    }

    if (layout.isNativeFullScreen()) {
        if (!isFullScreen()) {
            showFullScreen();
        }
    } else if (isFullScreen()) {
        showNormal();
    }
    m_isApplyingGeometry = false;
    qCDebug(log_ui_window) << "Applied window style for" << toString(layout.mode())
                           << "legacy:" << layout.spec().isLegacyStyle();
}

void PlayerWindow::setVideoUpdatesSuspended(bool suspended)
{
    m_videoView->setUpdatesEnabled(!suspended);
}

// Events

void PlayerWindow::resizeEvent(QResizeEvent *event)
{
    QMainWindow::resizeEvent(event);
    if (!m_coordinator) {
        return;
    }

    if (m_isApplyingGeometry) {
        // Animating toward m_geometry; keep the bars in proportion along the way
        GeometryChanges changes;
        changes.windowFrame = toModelFrame(geometry());
        layoutBars(m_geometry.withChanges(changes));
        return;
    }
    if (!isVisible() || m_coordinator->currentLayout().isFullScreen()) {
        return;
    }

    m_isInLiveResize = true;
    m_liveResizeTimer.start();

    const QSizeF requestedSize(event->size());
    const WindowGeometry resized = m_coordinator->resizeWindow(requestedSize, m_isInLiveResize);
    const QSize resolvedSize = resized.windowFrame().size().toSize();
    if (resolvedSize != event->size()) {
        // Top left corner stays put while dragging
        m_isApplyingGeometry = true;
        setGeometry(QRect(geometry().topLeft(), resolvedSize));
        m_isApplyingGeometry = false;
    }

    GeometryChanges changes;
    changes.windowFrame = toModelFrame(geometry());
    m_geometry = resized.withChanges(changes);
    layoutBars(m_geometry);
    m_coordinator->updateCachedGeometry(m_geometry.windowFrame(), currentScreenID());
}

void PlayerWindow::moveEvent(QMoveEvent *event)
{
    QMainWindow::moveEvent(event);
    if (!m_coordinator || m_isApplyingGeometry || !isVisible()) {
        return;
    }
    if (m_coordinator->currentLayout().isFullScreen()) {
        return;
    }
    qCDebug(log_ui_window) << "Window moved by" << (event->pos() - event->oldPos());
    m_coordinator->updateCachedGeometry(toModelFrame(geometry()), currentScreenID());
}

void PlayerWindow::closeEvent(QCloseEvent *event)
{
    GlobalSetting::instance().savePlayerState(m_coordinator->saveState());
    qCDebug(log_ui_window) << "Saved player window state";
    event->accept();
}

void PlayerWindow::keyPressEvent(QKeyEvent *event)
{
    const LayoutState &layout = m_coordinator->currentLayout();
    switch (event->key()) {
    case Qt::Key_F:
        m_coordinator->toggleFullScreen();
        break;
    case Qt::Key_Escape:
        m_coordinator->exitFullScreen();
        break;
    case Qt::Key_M:
        if (layout.isMusicMode()) {
            m_coordinator->exitMusicMode();
        } else {
            m_coordinator->enterMusicMode();
        }
        break;
    case Qt::Key_P:
        if (layout.trailingSidebar().isVisible() || layout.leadingSidebar().isVisible()) {
            m_coordinator->hideSidebars();
        } else {
            m_coordinator->showSidebar(SidebarTab(SidebarTab::Playlist));
        }
        break;
    case Qt::Key_S:
        m_coordinator->showSidebar(SidebarTab(SidebarTab::Video));
        break;
    case Qt::Key_Plus:
    case Qt::Key_Equal:
        m_coordinator->scaleVideoByIncrement(32);
        break;
    case Qt::Key_Minus:
        m_coordinator->scaleVideoByIncrement(-32);
        break;
    case Qt::Key_1:
        m_coordinator->setVideoScale(1.0);
        break;
    case Qt::Key_2:
        m_coordinator->setVideoScale(2.0);
        break;
    default:
        QMainWindow::keyPressEvent(event);
        return;
    }
}

void PlayerWindow::onLiveResizeEnded()
{
    m_isInLiveResize = false;
    m_coordinator->endLiveResize();
    qCDebug(log_ui_window) << "Live resize ended";
}
