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

#ifndef PLAYERSAVESTATE_H
#define PLAYERSAVESTATE_H

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QLoggingCategory>
#include <optional>

#include "layout/layoutspec.h"
#include "layout/layoutpreferences.h"
#include "geometry/windowgeometry.h"
#include "geometry/musicmodegeometry.h"

Q_DECLARE_LOGGING_CATEGORY(log_core_state)

/**
 * @brief Player window state saved on quit and restored on the next launch
 *
 * Each part is encoded as a line of comma separated tokens whose first token is
 * the format version. Tab groups and the playlist width are not saved: they always
 * come from the current settings when the layout is restored.
 *
 * Layout spec (11 tokens):
 *   version, leading tab, trailing tab, mode, legacy, top placement,
 *   trailing placement, bottom placement, leading placement, OSC enabled, OSC position
 * Windowed geometry (12 tokens):
 *   version, video width, video height, video aspect, outside top, outside trailing,
 *   outside bottom, outside leading, x, y, width, height
 * Music mode geometry (9 tokens):
 *   version, x, y, width, height, playlist height, video visible, playlist visible,
 *   video aspect
 */
struct PlayerSaveState
{
    static const QString VERSION;

    // Keys used by toProperties() and fromProperties()
    static const QString KEY_LAYOUT_SPEC;
    static const QString KEY_WINDOWED_GEOMETRY;
    static const QString KEY_MUSIC_MODE_GEOMETRY;
    static const QString KEY_SCREEN_ID;
    static const QString KEY_MUSIC_MODE_SCREEN_ID;
    static const QString KEY_VIDEO_ASPECT;

    std::optional<LayoutSpec> layoutSpec;
    std::optional<WindowGeometry> windowedModeGeometry;
    std::optional<MusicModeGeometry> musicModeGeometry;
    std::optional<qreal> videoAspect;

    bool isEmpty() const { return !layoutSpec && !windowedModeGeometry && !musicModeGeometry; }

    QVariantMap toProperties() const;

    /**
     * @brief Decode every part found in @p properties
     *
     * Parts which are missing or fail to parse are left empty. A failure is logged
     * but never stops the other parts from loading.
     */
    static PlayerSaveState fromProperties(const QVariantMap &properties, const LayoutPreferences &prefs);

    static QString encode(const LayoutSpec &spec);
    static QString encode(const WindowGeometry &geometry);
    static QString encode(const MusicModeGeometry &geometry);

    static std::optional<LayoutSpec> decodeLayoutSpec(const QString &csv, const LayoutPreferences &prefs);
    static std::optional<WindowGeometry> decodeWindowGeometry(const QString &csv, const QString &screenID);
    static std::optional<MusicModeGeometry> decodeMusicModeGeometry(const QString &csv, const QString &screenID);
};

#endif // PLAYERSAVESTATE_H
