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

#include "sidebar.h"
#include "global.h"
#include <QStringList>

Q_LOGGING_CATEGORY(log_core_layout, "lbx.core.layout")

SidebarTab::SidebarTab(Kind kind, const QString &pluginID)
    : m_kind(kind)
    , m_pluginID(kind == Plugin ? pluginID : QString())
{
}

std::optional<SidebarTab> SidebarTab::fromName(const QString &name)
{
    if (name == QLatin1String("playlist")) {
        return SidebarTab(Playlist);
    } else if (name == QLatin1String("chapters")) {
        return SidebarTab(Chapters);
    } else if (name == QLatin1String("video")) {
        return SidebarTab(Video);
    } else if (name == QLatin1String("audio")) {
        return SidebarTab(Audio);
    } else if (name == QLatin1String("sub")) {
        return SidebarTab(Sub);
    } else if (name.startsWith(QLatin1String("plugin:"))) {
        return SidebarTab(Plugin, name.mid(7));
    }
    return std::nullopt;
}

SidebarTabGroup SidebarTab::group() const
{
    switch (m_kind) {
    case Playlist:
    case Chapters:
        return SidebarTabGroup::Playlist;
    default:
        return SidebarTabGroup::Settings;
    }
}

QString SidebarTab::name() const
{
    switch (m_kind) {
    case Playlist: return QStringLiteral("playlist");
    case Chapters: return QStringLiteral("chapters");
    case Video: return QStringLiteral("video");
    case Audio: return QStringLiteral("audio");
    case Sub: return QStringLiteral("sub");
    case Plugin: return QStringLiteral("plugin:") + m_pluginID;
    }
    return QString();
}

qreal sidebarTabGroupWidth(SidebarTabGroup group, qreal playlistWidth)
{
    if (group == SidebarTabGroup::Settings) {
        return SidebarConst::SETTINGS_WIDTH;
    }
    return qBound(SidebarConst::MIN_PLAYLIST_WIDTH, playlistWidth, SidebarConst::MAX_PLAYLIST_WIDTH);
}

Sidebar::Sidebar(SidebarLocation location, SidebarTabGroups tabGroups, PanelPlacement placement,
                 std::optional<SidebarTab> visibleTab, std::optional<SidebarTab> lastVisibleTab,
                 qreal playlistWidth)
    : m_location(location)
    , m_tabGroups(tabGroups)
    , m_placement(placement)
    , m_visibleTab(visibleTab)
    , m_lastVisibleTab(visibleTab ? visibleTab : lastVisibleTab)
    , m_playlistWidth(playlistWidth)
{
    if (m_visibleTab && !m_tabGroups.testFlag(m_visibleTab->group())) {
        qCWarning(log_core_layout) << ::toString(m_location) << "sidebar cannot show tab" << m_visibleTab->name()
                                   << "because its group is not configured there - hiding it";
        m_visibleTab.reset();
    }
}

std::optional<SidebarTabGroup> Sidebar::visibleTabGroup() const
{
    if (!m_visibleTab) {
        return std::nullopt;
    }
    return m_visibleTab->group();
}

qreal Sidebar::currentWidth() const
{
    if (!m_visibleTab) {
        return 0;
    }
    return sidebarTabGroupWidth(m_visibleTab->group(), m_playlistWidth);
}

qreal Sidebar::insideWidth() const
{
    return m_placement == PanelPlacement::InsideViewport ? currentWidth() : 0;
}

qreal Sidebar::outsideWidth() const
{
    return m_placement == PanelPlacement::OutsideViewport ? currentWidth() : 0;
}

std::optional<SidebarTab> Sidebar::defaultTabToShow() const
{
    if (m_lastVisibleTab && m_tabGroups.testFlag(m_lastVisibleTab->group())) {
        return m_lastVisibleTab;
    }
    if (m_tabGroups.testFlag(SidebarTabGroup::Settings)) {
        return SidebarTab(SidebarTab::Video);
    }
    if (m_tabGroups.testFlag(SidebarTabGroup::Playlist)) {
        return SidebarTab(SidebarTab::Playlist);
    }
    qCDebug(log_core_layout) << "No tab groups configured for" << ::toString(m_location) << "sidebar";
    return std::nullopt;
}

Sidebar Sidebar::withVisibleTab(const std::optional<SidebarTab> &tab) const
{
    return Sidebar(m_location, m_tabGroups, m_placement, tab, m_lastVisibleTab, m_playlistWidth);
}

Sidebar Sidebar::withPlacement(PanelPlacement placement) const
{
    return Sidebar(m_location, m_tabGroups, placement, m_visibleTab, m_lastVisibleTab, m_playlistWidth);
}

Sidebar Sidebar::withTabGroups(SidebarTabGroups tabGroups) const
{
    return Sidebar(m_location, tabGroups, m_placement, m_visibleTab, m_lastVisibleTab, m_playlistWidth);
}

Sidebar Sidebar::withPlaylistWidth(qreal playlistWidth) const
{
    return Sidebar(m_location, m_tabGroups, m_placement, m_visibleTab, m_lastVisibleTab, playlistWidth);
}

bool Sidebar::operator==(const Sidebar &other) const
{
    return m_location == other.m_location
        && m_tabGroups == other.m_tabGroups
        && m_placement == other.m_placement
        && m_visibleTab == other.m_visibleTab
        && m_lastVisibleTab == other.m_lastVisibleTab
        && m_playlistWidth == other.m_playlistWidth;
}

QString Sidebar::toString() const
{
    QStringList groups;
    if (m_tabGroups.testFlag(SidebarTabGroup::Settings)) {
        groups << ::toString(SidebarTabGroup::Settings);
    }
    if (m_tabGroups.testFlag(SidebarTabGroup::Playlist)) {
        groups << ::toString(SidebarTabGroup::Playlist);
    }
    return QString("Sidebar(%1 groups:[%2] placement:%3 visibleTab:%4)")
        .arg(::toString(m_location), groups.join(','), ::toString(m_placement),
             m_visibleTab ? m_visibleTab->name() : QStringLiteral("nil"));
}

QString toString(SidebarLocation location)
{
    return location == SidebarLocation::Leading ? QStringLiteral("leading") : QStringLiteral("trailing");
}

QString toString(SidebarTabGroup group)
{
    return group == SidebarTabGroup::Settings ? QStringLiteral("settings") : QStringLiteral("playlist");
}
