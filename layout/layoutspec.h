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

#ifndef LAYOUTSPEC_H
#define LAYOUTSPEC_H

#include <QString>
#include <QDebug>
#include <QList>
#include <optional>

#include "geometry/geometrytypes.h"
#include "sidebar.h"
#include "layoutpreferences.h"

/**
 * @brief Partial update applied by LayoutSpec::withChanges()
 */
struct LayoutSpecChanges
{
    std::optional<Sidebar> leadingSidebar;
    std::optional<Sidebar> trailingSidebar;
    std::optional<WindowMode> mode;
    std::optional<bool> isLegacyStyle;
    std::optional<PanelPlacement> topBarPlacement;
    std::optional<PanelPlacement> bottomBarPlacement;
    std::optional<bool> enableOSC;
    std::optional<OSCPosition> oscPosition;
};

/**
 * @brief Declaration of the layout a player window should have
 *
 * Carries no sizes. LayoutState::fromSpec() compiles it into concrete visibility
 * and sizes. Music mode overrides most fields at construction: both sidebars are
 * hidden, the top bar is inside, the bottom bar outside and the OSC disabled.
 */
class LayoutSpec
{
public:
    /// Windowed layout with no sidebars configured
    LayoutSpec();

    LayoutSpec(const Sidebar &leadingSidebar, const Sidebar &trailingSidebar,
               WindowMode mode, bool isLegacyStyle,
               PanelPlacement topBarPlacement, PanelPlacement bottomBarPlacement,
               bool enableOSC, OSCPosition oscPosition);

    /**
     * @brief Windowed layout with both sidebars hidden and no OSC
     */
    static LayoutSpec defaultLayout(const LayoutPreferences &prefs);

    /**
     * @brief Build from @p prefs, keeping sidebar visibility and tabs from @p oldSpec
     * @param mode defaults to the mode of @p oldSpec
     * @param isLegacyStyle defaults to the legacy full screen setting for full screen
     *        and to the legacy windowed setting otherwise
     */
    static LayoutSpec fromPreferences(const LayoutPreferences &prefs, const LayoutSpec &oldSpec,
                                      std::optional<WindowMode> mode = std::nullopt,
                                      std::optional<bool> isLegacyStyle = std::nullopt);

    LayoutSpec withChanges(const LayoutSpecChanges &changes) const;

    const Sidebar &leadingSidebar() const { return m_leadingSidebar; }
    const Sidebar &trailingSidebar() const { return m_trailingSidebar; }
    const Sidebar &sidebar(SidebarLocation location) const;
    WindowMode mode() const { return m_mode; }
    bool isLegacyStyle() const { return m_isLegacyStyle; }
    PanelPlacement topBarPlacement() const { return m_topBarPlacement; }
    PanelPlacement bottomBarPlacement() const { return m_bottomBarPlacement; }
    PanelPlacement leadingSidebarPlacement() const { return m_leadingSidebar.placement(); }
    PanelPlacement trailingSidebarPlacement() const { return m_trailingSidebar.placement(); }
    bool enableOSC() const { return m_enableOSC; }
    OSCPosition oscPosition() const { return m_oscPosition; }

    bool isFullScreen() const { return m_mode == WindowMode::FullScreen; }
    bool isNativeFullScreen() const { return isFullScreen() && !m_isLegacyStyle; }
    bool isLegacyFullScreen() const { return isFullScreen() && m_isLegacyStyle; }
    bool isMusicMode() const { return m_mode == WindowMode::MusicMode; }

    /**
     * @brief True if every field which comes from app-wide settings matches @p other
     *
     * Ignores the mode and which sidebar tabs are visible.
     */
    bool hasSamePrefsValues(const LayoutSpec &other) const;

    /**
     * @brief Space left between the inside sidebars beyond the required minimum
     *
     * Negative if the sidebars overlap or come too close in @p viewportWidth.
     */
    qreal excessSpaceBetweenInsideSidebars(qreal viewportWidth,
                                           std::optional<qreal> leadingSidebarWidth = std::nullopt,
                                           std::optional<qreal> trailingSidebarWidth = std::nullopt) const;

    /**
     * @brief Which inside sidebars must close to fit in @p viewportWidth
     *
     * Closes the wider sidebar first (the leading one on a tie) until enough space
     * remains between them.
     */
    QList<SidebarLocation> sidebarsToHide(qreal viewportWidth) const;

    bool operator==(const LayoutSpec &other) const;
    bool operator!=(const LayoutSpec &other) const { return !(*this == other); }

    QString toString() const;

private:
    Sidebar m_leadingSidebar;
    Sidebar m_trailingSidebar;
    WindowMode m_mode;
    bool m_isLegacyStyle;
    PanelPlacement m_topBarPlacement;
    PanelPlacement m_bottomBarPlacement;
    bool m_enableOSC;
    OSCPosition m_oscPosition;
};

QDebug operator<<(QDebug dbg, const LayoutSpec &spec);

#endif // LAYOUTSPEC_H
