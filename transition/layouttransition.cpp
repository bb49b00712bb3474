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

#include "layouttransition.h"
#include <QStringList>

Q_LOGGING_CATEGORY(log_core_transition, "lbx.core.transition")

LayoutTransition::LayoutTransition(const QString &name,
                                   const LayoutState &inputLayout, const WindowGeometry &inputGeometry,
                                   const LayoutState &outputLayout, const WindowGeometry &outputGeometry,
                                   bool isInitialLayout)
    : m_name(name)
    , m_inputLayout(inputLayout)
    , m_outputLayout(outputLayout)
    , m_inputGeometry(inputGeometry)
    , m_outputGeometry(outputGeometry)
    , m_isInitialLayout(isInitialLayout)
{
}

qreal LayoutTransition::totalDuration() const
{
    qreal total = 0;
    for (const TransitionOperation &op : m_operations) {
        total += op.duration;
    }
    return total;
}

bool LayoutTransition::isEffectivelyNoOp() const
{
    if (m_isInitialLayout || m_inputLayout.spec() != m_outputLayout.spec() || m_inputGeometry != m_outputGeometry) {
        return false;
    }
    for (const TransitionOperation &op : m_operations) {
        if (!op.isZeroDuration()) {
            return false;
        }
    }
    return true;
}

bool LayoutTransition::isOSCChanging() const
{
    return m_inputLayout.enableOSC() != m_outputLayout.enableOSC()
        || m_inputLayout.oscPosition() != m_outputLayout.oscPosition();
}

bool LayoutTransition::needsFadeOutOldViews() const
{
    return isTogglingLegacyStyle() || isTopBarPlacementChanging()
        || m_inputLayout.mode() != m_outputLayout.mode()
        || (m_inputLayout.bottomBarPlacement() == PanelPlacement::InsideViewport
            && m_outputLayout.bottomBarPlacement() == PanelPlacement::OutsideViewport)
        || m_inputLayout.enableOSC() != m_outputLayout.enableOSC()
        || (m_inputLayout.enableOSC() && m_inputLayout.oscPosition() != m_outputLayout.oscPosition())
        || (isShowable(m_inputLayout.leadingSidebarToggleButton()) && !isShowable(m_outputLayout.leadingSidebarToggleButton()))
        || (isShowable(m_inputLayout.trailingSidebarToggleButton()) && !isShowable(m_outputLayout.trailingSidebarToggleButton()));
}

bool LayoutTransition::needsFadeInNewViews() const
{
    return isTogglingLegacyStyle() || isTopBarPlacementChanging()
        || m_inputLayout.mode() != m_outputLayout.mode()
        || (m_inputLayout.bottomBarPlacement() == PanelPlacement::OutsideViewport
            && m_outputLayout.bottomBarPlacement() == PanelPlacement::InsideViewport)
        || m_inputLayout.enableOSC() != m_outputLayout.enableOSC()
        || (m_outputLayout.enableOSC() && m_inputLayout.oscPosition() != m_outputLayout.oscPosition())
        || (!isShowable(m_inputLayout.leadingSidebarToggleButton()) && isShowable(m_outputLayout.leadingSidebarToggleButton()))
        || (!isShowable(m_inputLayout.trailingSidebarToggleButton()) && isShowable(m_outputLayout.trailingSidebarToggleButton()));
}

bool LayoutTransition::needsCloseOldPanels() const
{
    if (isEnteringFullScreen()) {
        // Full screen sets its own frame
        return false;
    }
    return isHidingLeadingSidebar() || isHidingTrailingSidebar()
        || isTopBarPlacementChanging() || isBottomBarPlacementChanging()
        || isTogglingLegacyStyle()
        || m_inputLayout.mode() != m_outputLayout.mode()
        || m_inputLayout.enableOSC() != m_outputLayout.enableOSC()
        || (m_inputLayout.enableOSC() && m_inputLayout.oscPosition() != m_outputLayout.oscPosition());
}

bool LayoutTransition::isAddingLegacyStyle() const
{
    return !m_inputLayout.spec().isLegacyStyle() && m_outputLayout.spec().isLegacyStyle();
}

bool LayoutTransition::isRemovingLegacyStyle() const
{
    return m_inputLayout.spec().isLegacyStyle() && !m_outputLayout.spec().isLegacyStyle();
}

bool LayoutTransition::isTogglingLegacyStyle() const
{
    return m_inputLayout.spec().isLegacyStyle() != m_outputLayout.spec().isLegacyStyle();
}

bool LayoutTransition::isTogglingFullScreen() const
{
    return m_inputLayout.isFullScreen() != m_outputLayout.isFullScreen();
}

bool LayoutTransition::isEnteringFullScreen() const
{
    return m_outputLayout.isFullScreen() && (!m_inputLayout.isFullScreen() || m_isInitialLayout);
}

bool LayoutTransition::isExitingFullScreen() const
{
    return m_inputLayout.isFullScreen() && !m_outputLayout.isFullScreen();
}

bool LayoutTransition::isEnteringNativeFullScreen() const
{
    return isEnteringFullScreen() && m_outputLayout.isNativeFullScreen();
}

bool LayoutTransition::isEnteringLegacyFullScreen() const
{
    return isEnteringFullScreen() && m_outputLayout.isLegacyFullScreen();
}

bool LayoutTransition::isExitingLegacyFullScreen() const
{
    return isExitingFullScreen() && m_inputLayout.isLegacyFullScreen();
}

bool LayoutTransition::isTogglingLegacyFullScreen() const
{
    return isEnteringLegacyFullScreen() || isExitingLegacyFullScreen();
}

bool LayoutTransition::isEnteringMusicMode() const
{
    return !m_inputLayout.isMusicMode() && m_outputLayout.isMusicMode();
}

bool LayoutTransition::isExitingMusicMode() const
{
    return m_inputLayout.isMusicMode() && !m_outputLayout.isMusicMode();
}

bool LayoutTransition::isTogglingMusicMode() const
{
    return m_inputLayout.isMusicMode() != m_outputLayout.isMusicMode();
}

bool LayoutTransition::isTopBarPlacementChanging() const
{
    return m_inputLayout.topBarPlacement() != m_outputLayout.topBarPlacement();
}

bool LayoutTransition::isBottomBarPlacementChanging() const
{
    return m_inputLayout.bottomBarPlacement() != m_outputLayout.bottomBarPlacement();
}

bool LayoutTransition::isLeadingSidebarPlacementChanging() const
{
    return m_inputLayout.leadingSidebarPlacement() != m_outputLayout.leadingSidebarPlacement();
}

bool LayoutTransition::isTrailingSidebarPlacementChanging() const
{
    return m_inputLayout.trailingSidebarPlacement() != m_outputLayout.trailingSidebarPlacement();
}

bool LayoutTransition::isShowing(SidebarLocation location) const
{
    const Sidebar &oldState = m_inputLayout.sidebar(location);
    const Sidebar &newState = m_outputLayout.sidebar(location);
    if (!oldState.isVisible() && newState.isVisible()) {
        return true;
    }
    return isHidingAndThenShowing(location);
}

bool LayoutTransition::isHiding(SidebarLocation location) const
{
    const Sidebar &oldState = m_inputLayout.sidebar(location);
    const Sidebar &newState = m_outputLayout.sidebar(location);
    if (oldState.isVisible()) {
        if (!newState.isVisible()) {
            return true;
        }
        const std::optional<SidebarTabGroup> oldGroup = oldState.visibleTabGroup();
        const std::optional<SidebarTabGroup> newGroup = newState.visibleTabGroup();
        if (oldGroup && newGroup && *oldGroup != *newGroup) {
            return true;
        }
        if (oldGroup && !newState.tabGroups().testFlag(*oldGroup)) {
            qCWarning(log_core_transition) << "Visible tab group" << ::toString(*oldGroup)
                                           << "is not configured in the new" << ::toString(location) << "sidebar";
            return true;
        }
    }
    return isHidingAndThenShowing(location);
}

bool LayoutTransition::isHidingAndThenShowing(SidebarLocation location) const
{
    const Sidebar &oldState = m_inputLayout.sidebar(location);
    const Sidebar &newState = m_outputLayout.sidebar(location);
    if (oldState.isVisible() && newState.isVisible()) {
        if (oldState.placement() != newState.placement()) {
            return true;
        }
        if (oldState.visibleTabGroup() != newState.visibleTabGroup()) {
            return true;
        }
    }
    return false;
}

bool LayoutTransition::isTogglingVisibilityOfAnySidebar() const
{
    return isShowingLeadingSidebar() || isShowingTrailingSidebar()
        || isHidingLeadingSidebar() || isHidingTrailingSidebar();
}

QString LayoutTransition::toString() const
{
    QStringList ops;
    for (const TransitionOperation &op : m_operations) {
        ops << QString("%1(%2)").arg(op.name()).arg(op.duration);
    }
    return QString("LayoutTransition[%1] %2 -> %3 initial:%4 ops:[%5]")
        .arg(m_name, ::toString(m_inputLayout.mode()), ::toString(m_outputLayout.mode()),
             m_isInitialLayout ? QStringLiteral("Y") : QStringLiteral("N"), ops.join(", "));
}
