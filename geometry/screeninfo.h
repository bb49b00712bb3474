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

#ifndef SCREENINFO_H
#define SCREENINFO_H

#include <QRectF>
#include <QString>
#include <QList>
#include <optional>

/**
 * @brief Snapshot of one screen's bounds, in bottom-left-origin coordinates
 */
struct ScreenInfo
{
    QString id;
    QRectF frame;
    QRectF visibleFrame;
    /// Height of the notch area at the top of the screen, 0 if none
    qreal cameraHousingHeight = 0;

    bool hasCameraHousing() const { return cameraHousingHeight > 0; }

    /// Full frame minus the camera housing strip at the top
    QRectF frameWithoutCameraHousing() const {
        return QRectF(frame.x(), frame.y(), frame.width(), frame.height() - cameraHousingHeight);
    }

    bool operator==(const ScreenInfo &other) const {
        return id == other.id && frame == other.frame && visibleFrame == other.visibleFrame
            && cameraHousingHeight == other.cameraHousingHeight;
    }
};

/**
 * @brief The set of screens a window can be placed on
 *
 * Geometry operations look screens up by id and fall back to the first screen
 * when the id is unknown, so a window saved on a disconnected screen still lands
 * somewhere visible.
 */
class ScreenList
{
public:
    ScreenList() = default;
    explicit ScreenList(const QList<ScreenInfo> &screens);

    /**
     * @brief Build the list from the screens known to QGuiApplication
     *
     * Converts Qt's top-left coordinates into the model's bottom-left coordinates
     * relative to the primary screen.
     */
    static ScreenList fromApplication();

    std::optional<ScreenInfo> find(const QString &id) const;

    /**
     * @brief Screen with @p id, or the first screen if there is no such screen
     *
     * If the list is empty a 1920x1080 placeholder is returned and a warning logged.
     */
    ScreenInfo screenOrDefault(const QString &id) const;

    bool isEmpty() const { return m_screens.isEmpty(); }
    const QList<ScreenInfo> &screens() const { return m_screens; }

    /// Height used to flip coordinates between Qt and the model
    qreal referenceHeight() const;

private:
    QList<ScreenInfo> m_screens;
};

#endif // SCREENINFO_H
