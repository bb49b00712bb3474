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

#include "screeninfo.h"
#include "rectutil.h"
#include <QGuiApplication>
#include <QScreen>

ScreenList::ScreenList(const QList<ScreenInfo> &screens)
    : m_screens(screens)
{
}

ScreenList ScreenList::fromApplication()
{
    QList<ScreenInfo> result;
    QScreen *primary = QGuiApplication::primaryScreen();
    if (!primary) {
        qCWarning(log_core_geometry) << "No primary screen available";
        return ScreenList();
    }
    const qreal referenceHeight = primary->geometry().height();

    // Primary screen goes first so that it becomes the fallback screen
    QList<QScreen *> screens = QGuiApplication::screens();
    screens.removeAll(primary);
    screens.prepend(primary);

    for (QScreen *screen : screens) {
        ScreenInfo info;
        info.id = screen->name();
        info.frame = RectUtil::flipVertically(QRectF(screen->geometry()), referenceHeight);
        info.visibleFrame = RectUtil::flipVertically(QRectF(screen->availableGeometry()), referenceHeight);
        info.cameraHousingHeight = 0;
        qCDebug(log_core_geometry) << "Found screen" << info.id << "frame:" << RectUtil::toString(info.frame)
                                   << "visible:" << RectUtil::toString(info.visibleFrame);
        result.append(info);
    }
    return ScreenList(result);
}

std::optional<ScreenInfo> ScreenList::find(const QString &id) const
{
    for (const ScreenInfo &screen : m_screens) {
        if (screen.id == id) {
            return screen;
        }
    }
    return std::nullopt;
}

ScreenInfo ScreenList::screenOrDefault(const QString &id) const
{
    std::optional<ScreenInfo> found = find(id);
    if (found) {
        return *found;
    }
    if (!m_screens.isEmpty()) {
        if (!id.isEmpty()) {
            qCDebug(log_core_geometry) << "Screen" << id << "not found, using" << m_screens.first().id;
        }
        return m_screens.first();
    }

    qCWarning(log_core_geometry) << "No screens available, using a placeholder screen";
    ScreenInfo placeholder;
    placeholder.id = QStringLiteral("placeholder");
    placeholder.frame = QRectF(0, 0, 1920, 1080);
    placeholder.visibleFrame = placeholder.frame;
    return placeholder;
}

qreal ScreenList::referenceHeight() const
{
    if (m_screens.isEmpty()) {
        return 0;
    }
    return m_screens.first().frame.height();
}
