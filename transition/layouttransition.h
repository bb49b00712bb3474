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

#ifndef LAYOUTTRANSITION_H
#define LAYOUTTRANSITION_H

#include <QString>
#include <QList>
#include <QLoggingCategory>
#include <optional>

#include "layout/layoutstate.h"
#include "geometry/windowgeometry.h"
#include "transitionoperation.h"

Q_DECLARE_LOGGING_CATEGORY(log_core_transition)

/**
 * @brief Everything needed to animate a player window from one layout to another
 *
 * Built by TransitionPlanner::build() and handed to the coordinator, which runs
 * its operations in order and then discards it. The predicates compare the input
 * and output layouts pairwise.
 */
class LayoutTransition
{
public:
    LayoutTransition(const QString &name,
                     const LayoutState &inputLayout, const WindowGeometry &inputGeometry,
                     const LayoutState &outputLayout, const WindowGeometry &outputGeometry,
                     bool isInitialLayout = false);

    const QString &name() const { return m_name; }
    const LayoutState &inputLayout() const { return m_inputLayout; }
    const LayoutState &outputLayout() const { return m_outputLayout; }
    const WindowGeometry &inputGeometry() const { return m_inputGeometry; }
    /// Applied after the old panels close, if any
    const std::optional<WindowGeometry> &middleGeometry() const { return m_middleGeometry; }
    const WindowGeometry &outputGeometry() const { return m_outputGeometry; }
    bool isInitialLayout() const { return m_isInitialLayout; }
    const QList<TransitionOperation> &operations() const { return m_operations; }

    void setMiddleGeometry(const std::optional<WindowGeometry> &geometry) { m_middleGeometry = geometry; }
    void appendOperation(const TransitionOperation &operation) { m_operations.append(operation); }
    void setOperations(const QList<TransitionOperation> &operations) { m_operations = operations; }

    /// Sum of all operation durations, in seconds
    qreal totalDuration() const;

    /**
     * @brief True if running this transition changes nothing
     *
     * Same spec and same geometry, and every operation has zero duration.
     */
    bool isEffectivelyNoOp() const;

    // Predicates

    bool isOSCChanging() const;
    bool needsFadeOutOldViews() const;
    bool needsFadeInNewViews() const;
    bool needsCloseOldPanels() const;

    bool isAddingLegacyStyle() const;
    bool isRemovingLegacyStyle() const;
    bool isTogglingLegacyStyle() const;

    bool isTogglingFullScreen() const;
    bool isEnteringFullScreen() const;
    bool isExitingFullScreen() const;
    bool isEnteringNativeFullScreen() const;
    bool isEnteringLegacyFullScreen() const;
    bool isExitingLegacyFullScreen() const;
    bool isTogglingLegacyFullScreen() const;

    bool isEnteringMusicMode() const;
    bool isExitingMusicMode() const;
    bool isTogglingMusicMode() const;

    bool isTopBarPlacementChanging() const;
    bool isBottomBarPlacementChanging() const;
    bool isLeadingSidebarPlacementChanging() const;
    bool isTrailingSidebarPlacementChanging() const;

    /// Opening @p location, including closing it first to show a different group
    bool isShowing(SidebarLocation location) const;
    /// Closing @p location, including closing it only to reopen it
    bool isHiding(SidebarLocation location) const;
    /// Visible before and after, but with a different tab group or placement
    bool isHidingAndThenShowing(SidebarLocation location) const;

    bool isShowingLeadingSidebar() const { return isShowing(SidebarLocation::Leading); }
    bool isShowingTrailingSidebar() const { return isShowing(SidebarLocation::Trailing); }
    bool isHidingLeadingSidebar() const { return isHiding(SidebarLocation::Leading); }
    bool isHidingTrailingSidebar() const { return isHiding(SidebarLocation::Trailing); }
    bool isTogglingVisibilityOfAnySidebar() const;

    QString toString() const;

private:
    QString m_name;
    LayoutState m_inputLayout;
    LayoutState m_outputLayout;
    WindowGeometry m_inputGeometry;
    std::optional<WindowGeometry> m_middleGeometry;
    WindowGeometry m_outputGeometry;
    bool m_isInitialLayout;
    QList<TransitionOperation> m_operations;
};

#endif // LAYOUTTRANSITION_H
