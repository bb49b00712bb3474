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

#include "musicmodegeometry.h"
#include "rectutil.h"
#include "global.h"
#include <cmath>

MusicModeGeometry::MusicModeGeometry()
    : MusicModeGeometry(QRectF(0, 0, MusicModeConst::DEFAULT_WINDOW_WIDTH, MusicModeConst::OSC_HEIGHT), QString(),
                        MusicModeConst::DEFAULT_PLAYLIST_HEIGHT, false, false, WIDTH_WHEN_NO_VIDEO / HEIGHT_WHEN_NO_VIDEO)
{
}

MusicModeGeometry::MusicModeGeometry(const QRectF &windowFrame, const QString &screenID, qreal playlistHeight,
                                     bool isVideoVisible, bool isPlaylistVisible, qreal videoAspect)
    : m_windowFrame(windowFrame)
    , m_screenID(screenID)
    , m_isVideoVisible(isVideoVisible)
    , m_isPlaylistVisible(isPlaylistVisible)
    , m_videoAspect(videoAspect)
{
    if (!(m_videoAspect > 0)) {
        qCWarning(log_core_geometry) << "Invalid music mode video aspect" << videoAspect << "- using default";
        m_videoAspect = WIDTH_WHEN_NO_VIDEO / HEIGHT_WHEN_NO_VIDEO;
    }

    if (isPlaylistVisible) {
        // Whatever is left below the video and control bar
        const qreal videoHeight = isVideoVisible ? windowFrame.width() / m_videoAspect : 0;
        m_playlistHeight = std::round(windowFrame.height() - MusicModeConst::OSC_HEIGHT - videoHeight);
    } else {
        // Can fall slightly below the minimum due to rounding
        m_playlistHeight = qMax(playlistHeight, MusicModeConst::MIN_PLAYLIST_HEIGHT);
    }
}

MusicModeGeometry MusicModeGeometry::defaultGeometry(const ScreenInfo &screen, qreal videoAspect,
                                                     bool isVideoVisible, bool isPlaylistVisible,
                                                     qreal playlistHeight)
{
    const qreal width = MusicModeConst::DEFAULT_WINDOW_WIDTH;
    const qreal videoHeight = isVideoVisible && videoAspect > 0 ? std::round(width / videoAspect) : 0;
    const qreal height = videoHeight + MusicModeConst::OSC_HEIGHT + (isPlaylistVisible ? playlistHeight : 0);

    const QRectF visibleFrame = screen.visibleFrame;
    const QRectF windowFrame(visibleFrame.x(), RectUtil::maxY(visibleFrame) - height, width, height);
    return MusicModeGeometry(windowFrame, screen.id, playlistHeight, isVideoVisible, isPlaylistVisible, videoAspect);
}

MusicModeGeometry MusicModeGeometry::withWindowFrame(const QRectF &windowFrame) const
{
    return MusicModeGeometry(windowFrame, m_screenID, m_playlistHeight, m_isVideoVisible, m_isPlaylistVisible, m_videoAspect);
}

MusicModeGeometry MusicModeGeometry::withScreenID(const QString &screenID) const
{
    return MusicModeGeometry(m_windowFrame, screenID, m_playlistHeight, m_isVideoVisible, m_isPlaylistVisible, m_videoAspect);
}

MusicModeGeometry MusicModeGeometry::withVideoAspect(qreal videoAspect) const
{
    return MusicModeGeometry(m_windowFrame, m_screenID, m_playlistHeight, m_isVideoVisible, m_isPlaylistVisible, videoAspect);
}

MusicModeGeometry MusicModeGeometry::withPlaylistVisible(bool visible) const
{
    if (visible == m_isPlaylistVisible) {
        return *this;
    }
    // The playlist opens below the control bar, so the top edge stays fixed
    qreal newHeight;
    if (visible) {
        newHeight = m_windowFrame.height() + m_playlistHeight;
    } else {
        newHeight = qMax(MusicModeConst::OSC_HEIGHT + videoHeight(), m_windowFrame.height() - m_playlistHeight);
    }
    const QRectF newWindowFrame(m_windowFrame.x(), RectUtil::maxY(m_windowFrame) - newHeight,
                                m_windowFrame.width(), newHeight);
    return MusicModeGeometry(newWindowFrame, m_screenID, m_playlistHeight, m_isVideoVisible, visible, m_videoAspect);
}

MusicModeGeometry MusicModeGeometry::withVideoViewVisible(bool visible) const
{
    QRectF newWindowFrame = m_windowFrame;
    if (visible) {
        newWindowFrame.setHeight(m_windowFrame.height() + videoHeightIfVisible());
    } else {
        // Never shorter than the control bar
        newWindowFrame.setHeight(qMax(MusicModeConst::OSC_HEIGHT, m_windowFrame.height() - videoHeightIfVisible()));
    }
    return MusicModeGeometry(newWindowFrame, m_screenID, m_playlistHeight, visible, m_isPlaylistVisible, m_videoAspect);
}

MusicModeGeometry MusicModeGeometry::refit(const GeometryContext &context) const
{
    const QRectF containerFrame = context.screens.screenOrDefault(m_screenID).visibleFrame;
    const qreal minPlaylistHeight = m_isPlaylistVisible ? MusicModeConst::MIN_PLAYLIST_HEIGHT : 0;

    // Widest the video can get without pushing the control bar off the screen
    qreal maxWidth;
    if (m_isVideoVisible) {
        qreal maxVideoHeight = containerFrame.height() - MusicModeConst::OSC_HEIGHT - minPlaylistHeight;
        // Can be negative on a very short screen
        maxVideoHeight = qMax(maxVideoHeight, std::round(MusicModeConst::MIN_WINDOW_WIDTH / m_videoAspect));
        maxWidth = std::round(maxVideoHeight * m_videoAspect);
    } else {
        maxWidth = context.musicModeMaxWindowWidth;
    }
    maxWidth = qMin(maxWidth, containerFrame.width());

    const QSizeF requestedSize = m_windowFrame.size();
    qreal newWidth = requestedSize.width();
    if (newWidth < MusicModeConst::MIN_WINDOW_WIDTH) {
        newWidth = MusicModeConst::MIN_WINDOW_WIDTH;
    } else if (newWidth > maxWidth) {
        newWidth = maxWidth;
    }

    const qreal videoHeight = m_isVideoVisible ? std::round(newWidth / m_videoAspect) : 0;
    const qreal minWindowHeight = videoHeight + MusicModeConst::OSC_HEIGHT + minPlaylistHeight;
    const qreal maxHeight = m_isPlaylistVisible ? containerFrame.height() : minWindowHeight;
    const qreal newHeight = qMin(std::round(qMax(requestedSize.height(), minWindowHeight)), maxHeight);

    QRectF newWindowFrame(m_windowFrame.topLeft(), QSizeF(newWidth, newHeight));
    if (shouldMoveWindowToKeepInContainer(ScreenFitOption::KeepInVisibleScreen, context.moveWindowIntoVisibleScreen)) {
        newWindowFrame = RectUtil::constrain(newWindowFrame, containerFrame);
    }
    const MusicModeGeometry fitted = withWindowFrame(newWindowFrame);
    qCDebug(log_core_geometry) << "Refitted" << fitted << "from requested size" << RectUtil::toString(requestedSize);
    return fitted;
}

std::optional<MusicModeGeometry> MusicModeGeometry::scaleVideo(const GeometryContext &context,
                                                               std::optional<QSizeF> desiredSize,
                                                               std::optional<QString> screenID) const
{
    if (!m_isVideoVisible) {
        qCCritical(log_core_geometry) << "Cannot scale music mode video: video is not visible";
        return std::nullopt;
    }

    const QSizeF newVideoSize = desiredSize.value_or(*videoSize());
    const QString newScreenID = screenID.value_or(m_screenID);
    const QRectF containerFrame = context.screens.screenOrDefault(newScreenID).visibleFrame;

    // Only the video scales. Window height stays the same.
    const qreal windowHeight = qMin(containerFrame.height(), m_windowFrame.height());

    qreal newVideoWidth = qMax(newVideoSize.width(), MusicModeConst::MIN_WINDOW_WIDTH);
    newVideoWidth = qMin(newVideoWidth, context.musicModeMaxWindowWidth);
    newVideoWidth = qMin(newVideoWidth, containerFrame.width());
    qreal newVideoHeight = newVideoWidth / m_videoAspect;

    const qreal minPlaylistHeight = m_isPlaylistVisible ? MusicModeConst::MIN_PLAYLIST_HEIGHT : 0;
    const qreal maxVideoHeight = windowHeight - MusicModeConst::OSC_HEIGHT - minPlaylistHeight;
    if (newVideoHeight > maxVideoHeight) {
        newVideoHeight = maxVideoHeight;
        newVideoWidth = newVideoHeight * m_videoAspect;
    }

    // Keep the side nearest to the screen edge fixed
    qreal newOriginX = m_windowFrame.x();
    const qreal distanceToLeadingSide = std::abs(m_windowFrame.x() - containerFrame.x());
    const qreal distanceToTrailingSide = std::abs(RectUtil::maxX(m_windowFrame) - RectUtil::maxX(containerFrame));
    if (distanceToTrailingSide < distanceToLeadingSide) {
        newOriginX += m_windowFrame.width() - newVideoWidth;
    }

    QRectF newWindowFrame(newOriginX, m_windowFrame.y(), newVideoWidth, windowHeight);
    if (shouldMoveWindowToKeepInContainer(ScreenFitOption::KeepInVisibleScreen, context.moveWindowIntoVisibleScreen)) {
        newWindowFrame = RectUtil::constrain(newWindowFrame, containerFrame);
    }
    qCDebug(log_core_geometry) << "Scaled music mode video to" << RectUtil::toString(newVideoSize)
                               << "window:" << RectUtil::toString(newWindowFrame);
    return MusicModeGeometry(newWindowFrame, newScreenID, m_playlistHeight, m_isVideoVisible, m_isPlaylistVisible, m_videoAspect);
}

qreal MusicModeGeometry::videoHeightIfVisible() const
{
    const qreal heightByDivision = std::round(m_windowFrame.width() / m_videoAspect);
    const qreal heightBySubtraction = m_windowFrame.height() - MusicModeConst::OSC_HEIGHT - m_playlistHeight;
    // Align to the other controls if within 1 unit
    if (std::abs(heightByDivision - heightBySubtraction) < 1) {
        return heightBySubtraction;
    }
    return heightByDivision;
}

std::optional<QSizeF> MusicModeGeometry::videoSize() const
{
    if (!m_isVideoVisible) {
        return std::nullopt;
    }
    return QSizeF(m_windowFrame.width(), videoHeightIfVisible());
}

qreal MusicModeGeometry::videoHeight() const
{
    return m_isVideoVisible ? videoHeightIfVisible() : 0;
}

qreal MusicModeGeometry::bottomBarHeight() const
{
    return m_windowFrame.height() - videoHeight();
}

WindowGeometry MusicModeGeometry::toWindowGeometry() const
{
    const qreal outsideBottomBarHeight = MusicModeConst::OSC_HEIGHT + (m_isPlaylistVisible ? m_playlistHeight : 0);
    return WindowGeometry(m_windowFrame, m_screenID, ScreenFitOption::KeepInVisibleScreen, WindowMode::MusicMode, 0,
                          BoxQuad(0, 0, outsideBottomBarHeight, 0), BoxQuad(), m_videoAspect);
}

bool MusicModeGeometry::operator==(const MusicModeGeometry &other) const
{
    return m_windowFrame == other.m_windowFrame
        && m_screenID == other.m_screenID
        && m_playlistHeight == other.m_playlistHeight
        && m_isVideoVisible == other.m_isVideoVisible
        && m_isPlaylistVisible == other.m_isPlaylistVisible
        && m_videoAspect == other.m_videoAspect;
}

QString MusicModeGeometry::toString() const
{
    return QString("MusicModeGeometry(video={show:%1 H:%2 aspect:%3} playlist={show:%4 H:%5} bottomBarH:%6 windowFrame:%7)")
        .arg(QLatin1Char(m_isVideoVisible ? 'Y' : 'N'))
        .arg(videoHeight())
        .arg(m_videoAspect, 0, 'f', 4)
        .arg(QLatin1Char(m_isPlaylistVisible ? 'Y' : 'N'))
        .arg(m_playlistHeight)
        .arg(bottomBarHeight())
        .arg(RectUtil::toString(m_windowFrame));
}

QDebug operator<<(QDebug dbg, const MusicModeGeometry &geometry)
{
    QDebugStateSaver saver(dbg);
    dbg.noquote() << geometry.toString();
    return dbg;
}
