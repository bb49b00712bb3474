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

#ifndef MUSICMODEGEOMETRY_H
#define MUSICMODEGEOMETRY_H

#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QDebug>
#include <optional>

#include "windowgeometry.h"

/**
 * @brief Geometry of the compact music mode window
 *
 * The window is a vertical stack of up to three sections, top to bottom:
 * the video (shown if isVideoVisible, scaled to the window width), the control
 * bar (fixed height) and the playlist (shown if isPlaylistVisible, user resizable
 * but at least MusicModeConst::MIN_PLAYLIST_HEIGHT tall).
 */
class MusicModeGeometry
{
public:
    MusicModeGeometry();

    /**
     * @brief If the playlist is visible @p playlistHeight is ignored and recalculated
     * from the window height. Otherwise it is kept (clamped to the minimum) so the
     * playlist can be reopened at the same height.
     */
    MusicModeGeometry(const QRectF &windowFrame, const QString &screenID, qreal playlistHeight,
                      bool isVideoVisible, bool isPlaylistVisible, qreal videoAspect);

    /**
     * @brief Default geometry placed at the top left of @p screen's visible frame
     */
    static MusicModeGeometry defaultGeometry(const ScreenInfo &screen, qreal videoAspect,
                                             bool isVideoVisible = true, bool isPlaylistVisible = false,
                                             qreal playlistHeight = MusicModeConst::DEFAULT_PLAYLIST_HEIGHT);

    const QRectF &windowFrame() const { return m_windowFrame; }
    const QString &screenID() const { return m_screenID; }
    qreal playlistHeight() const { return m_playlistHeight; }
    bool isVideoVisible() const { return m_isVideoVisible; }
    bool isPlaylistVisible() const { return m_isPlaylistVisible; }
    qreal videoAspect() const { return m_videoAspect; }

    MusicModeGeometry withWindowFrame(const QRectF &windowFrame) const;
    MusicModeGeometry withScreenID(const QString &screenID) const;
    MusicModeGeometry withVideoAspect(qreal videoAspect) const;
    MusicModeGeometry withPlaylistVisible(bool visible) const;

    /**
     * @brief Show or hide the video, growing or shrinking the window height by the video height
     */
    MusicModeGeometry withVideoViewVisible(bool visible) const;

    /**
     * @brief Clamp width to [MIN_WINDOW_WIDTH, max width] and height so the control bar
     * stays on screen, then keep the frame inside the visible screen
     */
    MusicModeGeometry refit(const GeometryContext &context) const;

    /**
     * @brief Scale the video to @p desiredSize keeping the window height
     *
     * The edge of the window nearest the screen edge stays fixed.
     * @return nothing if the video is hidden
     */
    std::optional<MusicModeGeometry> scaleVideo(const GeometryContext &context,
                                                std::optional<QSizeF> desiredSize = std::nullopt,
                                                std::optional<QString> screenID = std::nullopt) const;

    /// Video height if the video were visible
    qreal videoHeightIfVisible() const;
    /// Empty if the video is hidden
    std::optional<QSizeF> videoSize() const;
    qreal videoHeight() const;
    qreal bottomBarHeight() const;

    WindowGeometry toWindowGeometry() const;

    bool operator==(const MusicModeGeometry &other) const;
    bool operator!=(const MusicModeGeometry &other) const { return !(*this == other); }

    QString toString() const;

private:
    QRectF m_windowFrame;
    QString m_screenID;
    qreal m_playlistHeight;
    bool m_isVideoVisible;
    bool m_isPlaylistVisible;
    qreal m_videoAspect;
};

QDebug operator<<(QDebug dbg, const MusicModeGeometry &geometry);

#endif // MUSICMODEGEOMETRY_H
