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

#ifndef SIDEBAR_H
#define SIDEBAR_H

#include <QString>
#include <QFlags>
#include <QLoggingCategory>
#include <optional>

#include "geometry/geometrytypes.h"

Q_DECLARE_LOGGING_CATEGORY(log_core_layout)

enum class SidebarLocation {
    Leading = 0,
    Trailing
};

/**
 * @brief Kind of view shown in a sidebar. Each sidebar hosts one or more groups.
 */
enum class SidebarTabGroup {
    Settings = 0x1,
    Playlist = 0x2
};
Q_DECLARE_FLAGS(SidebarTabGroups, SidebarTabGroup)
Q_DECLARE_OPERATORS_FOR_FLAGS(SidebarTabGroups)

/**
 * @brief A single tab of a sidebar
 *
 * Playlist and Chapters belong to the Playlist group. Everything else, plugin
 * tabs included, belongs to the Settings group.
 */
class SidebarTab
{
public:
    enum Kind {
        Playlist = 0,
        Chapters,
        Video,
        Audio,
        Sub,
        Plugin
    };

    SidebarTab(Kind kind = Playlist, const QString &pluginID = QString());

    static SidebarTab plugin(const QString &pluginID) { return SidebarTab(Plugin, pluginID); }

    /**
     * @brief Parse a tab name as produced by name()
     * @return nothing if @p name is not a known tab
     */
    static std::optional<SidebarTab> fromName(const QString &name);

    Kind kind() const { return m_kind; }
    const QString &pluginID() const { return m_pluginID; }
    SidebarTabGroup group() const;
    QString name() const;

    bool operator==(const SidebarTab &other) const {
        return m_kind == other.m_kind && (m_kind != Plugin || m_pluginID == other.m_pluginID);
    }
    bool operator!=(const SidebarTab &other) const { return !(*this == other); }

private:
    Kind m_kind;
    QString m_pluginID;
};

/**
 * @brief Width of a sidebar showing @p group
 * @param playlistWidth value of the playlist width setting, clamped to its allowed range
 */
qreal sidebarTabGroupWidth(SidebarTabGroup group, qreal playlistWidth);

/**
 * @brief Immutable descriptor of one sidebar
 *
 * A sidebar is visible when it has a visible tab. Its width is only counted
 * towards the bar sizes while it is visible, on the inside or outside of the
 * viewport depending on its placement.
 */
class Sidebar
{
public:
    Sidebar(SidebarLocation location = SidebarLocation::Leading,
            SidebarTabGroups tabGroups = SidebarTabGroups(),
            PanelPlacement placement = PanelPlacement::InsideViewport,
            std::optional<SidebarTab> visibleTab = std::nullopt,
            std::optional<SidebarTab> lastVisibleTab = std::nullopt,
            qreal playlistWidth = 270);

    SidebarLocation location() const { return m_location; }
    SidebarTabGroups tabGroups() const { return m_tabGroups; }
    PanelPlacement placement() const { return m_placement; }
    const std::optional<SidebarTab> &visibleTab() const { return m_visibleTab; }
    const std::optional<SidebarTab> &lastVisibleTab() const { return m_lastVisibleTab; }
    qreal playlistWidth() const { return m_playlistWidth; }

    bool isVisible() const { return m_visibleTab.has_value(); }
    std::optional<SidebarTabGroup> visibleTabGroup() const;

    qreal currentWidth() const;
    qreal insideWidth() const;
    qreal outsideWidth() const;

    /**
     * @brief Tab to show when the sidebar is opened without naming one
     *
     * The last visible tab if its group is still configured, else the first tab
     * of the first configured group.
     */
    std::optional<SidebarTab> defaultTabToShow() const;

    /// Show @p tab, or hide the sidebar if @p tab is empty
    Sidebar withVisibleTab(const std::optional<SidebarTab> &tab) const;
    Sidebar hidden() const { return withVisibleTab(std::nullopt); }
    Sidebar withPlacement(PanelPlacement placement) const;
    Sidebar withTabGroups(SidebarTabGroups tabGroups) const;
    Sidebar withPlaylistWidth(qreal playlistWidth) const;

    bool operator==(const Sidebar &other) const;
    bool operator!=(const Sidebar &other) const { return !(*this == other); }

    QString toString() const;

private:
    SidebarLocation m_location;
    SidebarTabGroups m_tabGroups;
    PanelPlacement m_placement;
    std::optional<SidebarTab> m_visibleTab;
    std::optional<SidebarTab> m_lastVisibleTab;
    qreal m_playlistWidth;
};

QString toString(SidebarLocation location);
QString toString(SidebarTabGroup group);

#endif // SIDEBAR_H
