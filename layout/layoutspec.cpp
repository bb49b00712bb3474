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

#include "layoutspec.h"
#include "global.h"

LayoutSpec::LayoutSpec()
    : LayoutSpec(Sidebar(SidebarLocation::Leading), Sidebar(SidebarLocation::Trailing),
                 WindowMode::Windowed, false,
                 PanelPlacement::InsideViewport, PanelPlacement::InsideViewport,
                 false, OSCPosition::Floating)
{
}

LayoutSpec::LayoutSpec(const Sidebar &leadingSidebar, const Sidebar &trailingSidebar,
                       WindowMode mode, bool isLegacyStyle,
                       PanelPlacement topBarPlacement, PanelPlacement bottomBarPlacement,
                       bool enableOSC, OSCPosition oscPosition)
    : m_leadingSidebar(leadingSidebar)
    , m_trailingSidebar(trailingSidebar)
    , m_mode(mode)
    , m_isLegacyStyle(isLegacyStyle)
    , m_topBarPlacement(topBarPlacement)
    , m_bottomBarPlacement(bottomBarPlacement)
    , m_enableOSC(enableOSC)
    , m_oscPosition(oscPosition)
{
    if (mode == WindowMode::MusicMode) {
        // Music mode has its own fixed layout
        m_leadingSidebar = leadingSidebar.hidden();
        m_trailingSidebar = trailingSidebar.hidden();
        m_topBarPlacement = PanelPlacement::InsideViewport;
        m_bottomBarPlacement = PanelPlacement::OutsideViewport;
        m_enableOSC = false;
    }
}

LayoutSpec LayoutSpec::defaultLayout(const LayoutPreferences &prefs)
{
    const Sidebar leadingSidebar(SidebarLocation::Leading, prefs.leadingSidebarTabGroups,
                                 prefs.leadingSidebarPlacement, std::nullopt, std::nullopt, prefs.playlistWidth);
    const Sidebar trailingSidebar(SidebarLocation::Trailing, prefs.trailingSidebarTabGroups,
                                  prefs.trailingSidebarPlacement, std::nullopt, std::nullopt, prefs.playlistWidth);
    return LayoutSpec(leadingSidebar, trailingSidebar, WindowMode::Windowed, false,
                      PanelPlacement::InsideViewport, PanelPlacement::InsideViewport,
                      false, OSCPosition::Floating);
}

LayoutSpec LayoutSpec::fromPreferences(const LayoutPreferences &prefs, const LayoutSpec &oldSpec,
                                       std::optional<WindowMode> mode, std::optional<bool> isLegacyStyle)
{
    const Sidebar &oldLeading = oldSpec.leadingSidebar();
    const Sidebar &oldTrailing = oldSpec.trailingSidebar();
    const Sidebar leadingSidebar(SidebarLocation::Leading, prefs.leadingSidebarTabGroups,
                                 prefs.leadingSidebarPlacement, oldLeading.visibleTab(),
                                 oldLeading.lastVisibleTab(), prefs.playlistWidth);
    const Sidebar trailingSidebar(SidebarLocation::Trailing, prefs.trailingSidebarTabGroups,
                                  prefs.trailingSidebarPlacement, oldTrailing.visibleTab(),
                                  oldTrailing.lastVisibleTab(), prefs.playlistWidth);

    const WindowMode newMode = mode.value_or(oldSpec.mode());
    const bool legacy = isLegacyStyle.value_or(newMode == WindowMode::FullScreen
                                                   ? prefs.useLegacyFullScreen
                                                   : prefs.useLegacyWindowedMode);
    return LayoutSpec(leadingSidebar, trailingSidebar, newMode, legacy,
                      prefs.topBarPlacement, prefs.bottomBarPlacement,
                      prefs.enableOSC, prefs.oscPosition);
}

LayoutSpec LayoutSpec::withChanges(const LayoutSpecChanges &changes) const
{
    return LayoutSpec(changes.leadingSidebar.value_or(m_leadingSidebar),
                      changes.trailingSidebar.value_or(m_trailingSidebar),
                      changes.mode.value_or(m_mode),
                      changes.isLegacyStyle.value_or(m_isLegacyStyle),
                      changes.topBarPlacement.value_or(m_topBarPlacement),
                      changes.bottomBarPlacement.value_or(m_bottomBarPlacement),
                      changes.enableOSC.value_or(m_enableOSC),
                      changes.oscPosition.value_or(m_oscPosition));
}

const Sidebar &LayoutSpec::sidebar(SidebarLocation location) const
{
    return location == SidebarLocation::Leading ? m_leadingSidebar : m_trailingSidebar;
}

bool LayoutSpec::hasSamePrefsValues(const LayoutSpec &other) const
{
    return other.m_enableOSC == m_enableOSC
        && other.m_oscPosition == m_oscPosition
        && other.m_isLegacyStyle == m_isLegacyStyle
        && other.m_topBarPlacement == m_topBarPlacement
        && other.m_bottomBarPlacement == m_bottomBarPlacement
        && other.leadingSidebarPlacement() == leadingSidebarPlacement()
        && other.trailingSidebarPlacement() == trailingSidebarPlacement()
        && other.m_leadingSidebar.tabGroups() == m_leadingSidebar.tabGroups()
        && other.m_trailingSidebar.tabGroups() == m_trailingSidebar.tabGroups();
}

qreal LayoutSpec::excessSpaceBetweenInsideSidebars(qreal viewportWidth,
                                                   std::optional<qreal> leadingSidebarWidth,
                                                   std::optional<qreal> trailingSidebarWidth) const
{
    const qreal leading = leadingSidebarWidth.value_or(m_leadingSidebar.insideWidth());
    const qreal trailing = trailingSidebarWidth.value_or(m_trailingSidebar.insideWidth());
    return viewportWidth - (leading + trailing + SidebarConst::MIN_SPACE_BETWEEN_INSIDE_SIDEBARS);
}

QList<SidebarLocation> LayoutSpec::sidebarsToHide(qreal viewportWidth) const
{
    QList<SidebarLocation> result;
    qreal leadingSpace = m_leadingSidebar.insideWidth();
    qreal trailingSpace = m_trailingSidebar.insideWidth();

    while (leadingSpace + trailingSpace > 0
           && excessSpaceBetweenInsideSidebars(viewportWidth, leadingSpace, trailingSpace) < 0) {
        if (leadingSpace > 0 && leadingSpace >= trailingSpace) {
            result.append(SidebarLocation::Leading);
            leadingSpace = 0;
        } else if (trailingSpace > 0) {
            result.append(SidebarLocation::Trailing);
            trailingSpace = 0;
        } else {
            break;
        }
    }
    if (!result.isEmpty()) {
        qCDebug(log_core_layout) << "Viewport width" << viewportWidth << "requires hiding" << result.size() << "sidebar(s)";
    }
    return result;
}

bool LayoutSpec::operator==(const LayoutSpec &other) const
{
    return m_leadingSidebar == other.m_leadingSidebar
        && m_trailingSidebar == other.m_trailingSidebar
        && m_mode == other.m_mode
        && m_isLegacyStyle == other.m_isLegacyStyle
        && m_topBarPlacement == other.m_topBarPlacement
        && m_bottomBarPlacement == other.m_bottomBarPlacement
        && m_enableOSC == other.m_enableOSC
        && m_oscPosition == other.m_oscPosition;
}

QString LayoutSpec::toString() const
{
    return QString("LayoutSpec(mode:%1 legacy:%2 topBar:%3 bottomBar:%4 OSC:%5 %6 lead:%7 trail:%8)")
        .arg(::toString(m_mode),
             m_isLegacyStyle ? QStringLiteral("Y") : QStringLiteral("N"),
             ::toString(m_topBarPlacement),
             ::toString(m_bottomBarPlacement),
             m_enableOSC ? QStringLiteral("Y") : QStringLiteral("N"),
             ::toString(m_oscPosition),
             m_leadingSidebar.toString(),
             m_trailingSidebar.toString());
}

QDebug operator<<(QDebug dbg, const LayoutSpec &spec)
{
    QDebugStateSaver saver(dbg);
    dbg.noquote() << spec.toString();
    return dbg;
}
