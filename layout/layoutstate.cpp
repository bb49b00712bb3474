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

#include "layoutstate.h"
#include "global.h"

QString toString(Visibility visibility)
{
    switch (visibility) {
    case Visibility::Hidden: return QStringLiteral("hidden");
    case Visibility::ShowAlways: return QStringLiteral("showAlways");
    case Visibility::ShowFadeableTopBar: return QStringLiteral("showFadeableTopBar");
    case Visibility::ShowFadeableNonTopBar: return QStringLiteral("showFadeableNonTopBar");
    }
    return QStringLiteral("unknown");
}

LayoutState::LayoutState()
    : m_spec(LayoutSpec())
{
}

LayoutState::LayoutState(const LayoutSpec &spec)
    : m_spec(spec)
{
}

LayoutState LayoutState::fromSpec(const LayoutSpec &spec, const LayoutStateOptions &options)
{
    LayoutState layout(spec);
    layout.m_allowVideoToOverlapCameraHousing = options.allowVideoToOverlapCameraHousing;
    layout.m_oscBarHeight = options.oscBarHeight;

    // Title bar & title bar accessories

    if (layout.isFullScreen()) {
        layout.m_titleIconAndText = Visibility::ShowAlways;
        layout.m_trafficLightButtons = Visibility::ShowAlways;

        if (spec.isLegacyStyle() && !options.allowVideoToOverlapCameraHousing) {
            layout.m_cameraHousingOffset = options.cameraHousingHeight;
        }
    } else if (!layout.isMusicMode()) {
        const Visibility visibleState = layout.topBarPlacement() == PanelPlacement::InsideViewport
                                            ? Visibility::ShowFadeableTopBar : Visibility::ShowAlways;
        layout.m_topBarView = visibleState;

        // Legacy windows draw no title bar at all
        if (!spec.isLegacyStyle()) {
            layout.m_titleBar = visibleState;
            layout.m_trafficLightButtons = visibleState;
            layout.m_titleIconAndText = visibleState;
            // May be reduced below to share space with a top OSC
            layout.m_titleBarHeight = TitleBarConst::STANDARD_HEIGHT;
            layout.m_titlebarAccessories = visibleState;

            const bool hasLeadingSidebar = spec.leadingSidebar().tabGroups().toInt() != 0;
            if (hasLeadingSidebar && options.showLeadingSidebarToggleButton) {
                layout.m_leadingSidebarToggleButton = visibleState;
            }
            const bool hasTrailingSidebar = spec.trailingSidebar().tabGroups().toInt() != 0;
            if (hasTrailingSidebar && options.showTrailingSidebarToggleButton) {
                layout.m_trailingSidebarToggleButton = visibleState;
            }
        }

        if (layout.topBarPlacement() == PanelPlacement::InsideViewport) {
            layout.m_osdMinOffsetFromTop = layout.m_titleBarHeight + TitleBarConst::OSD_OFFSET;
        }
    }

    // OSC

    if (spec.enableOSC()) {
        switch (spec.oscPosition()) {
        case OSCPosition::Floating:
            layout.m_controlBarFloating = Visibility::ShowFadeableNonTopBar;
            break;
        case OSCPosition::Top:
            if (isShowable(layout.m_titleBar)) {
                layout.m_titleBarHeight = TitleBarConst::REDUCED_HEIGHT;
            }
            layout.m_topBarView = layout.topBarPlacement() == PanelPlacement::InsideViewport
                                      ? Visibility::ShowFadeableTopBar : Visibility::ShowAlways;
            layout.m_topOSCHeight = options.oscBarHeight;
            break;
        case OSCPosition::Bottom:
            layout.m_bottomBarView = layout.bottomBarPlacement() == PanelPlacement::InsideViewport
                                         ? Visibility::ShowFadeableNonTopBar : Visibility::ShowAlways;
            break;
        }
    } else if (layout.isMusicMode()) {
        // Music mode control bar
        layout.m_bottomBarView = Visibility::ShowAlways;
    }

    // Sidebar tab height and downshift: match the title bar, and the top OSC if inside
    if (layout.isMusicMode()) {
        layout.m_sidebarTabHeight = SidebarConst::MUSIC_MODE_TAB_HEIGHT;
    } else if (isShowable(layout.m_topBarView) && layout.topBarPlacement() == PanelPlacement::InsideViewport) {
        layout.m_sidebarDownshift = layout.m_titleBarHeight;

        const qreal tabHeight = layout.m_topOSCHeight;
        // Leave the default if out of a readable range
        if (tabHeight >= SidebarConst::MIN_TAB_HEIGHT && tabHeight <= SidebarConst::MAX_TAB_HEIGHT) {
            layout.m_sidebarTabHeight = tabHeight;
        }
    }

    qCDebug(log_core_layout) << "Built" << layout;
    return layout;
}

qreal LayoutState::bottomBarHeight() const
{
    return hasBottomOSC() ? m_oscBarHeight : 0;
}

qreal LayoutState::outsideTopBarHeight() const
{
    return topBarPlacement() == PanelPlacement::OutsideViewport ? topBarHeight() : 0;
}

qreal LayoutState::outsideBottomBarHeight() const
{
    if (isMusicMode()) {
        return MusicModeConst::OSC_HEIGHT;
    }
    return bottomBarPlacement() == PanelPlacement::OutsideViewport ? bottomBarHeight() : 0;
}

qreal LayoutState::insideTopBarHeight() const
{
    return topBarPlacement() == PanelPlacement::InsideViewport ? topBarHeight() : 0;
}

qreal LayoutState::insideBottomBarHeight() const
{
    return bottomBarPlacement() == PanelPlacement::InsideViewport ? bottomBarHeight() : 0;
}

BoxQuad LayoutState::outsideBars() const
{
    return BoxQuad(outsideTopBarHeight(), outsideTrailingBarWidth(), outsideBottomBarHeight(), outsideLeadingBarWidth());
}

BoxQuad LayoutState::insideBars() const
{
    return BoxQuad(insideTopBarHeight(), insideTrailingBarWidth(), insideBottomBarHeight(), insideLeadingBarWidth());
}

bool LayoutState::hasPermanentOSC() const
{
    if (!enableOSC()) {
        return false;
    }
    return (oscPosition() == OSCPosition::Top && topBarPlacement() == PanelPlacement::OutsideViewport)
        || (oscPosition() == OSCPosition::Bottom && bottomBarPlacement() == PanelPlacement::OutsideViewport);
}

Visibility LayoutState::pinToTopButtonVisibility(bool isOnTop, bool alwaysShowOnTopIcon) const
{
    const bool showOnTopStatus = alwaysShowOnTopIcon || isOnTop;
    if (isFullScreen() || !showOnTopStatus) {
        return Visibility::Hidden;
    }
    if (topBarPlacement() == PanelPlacement::InsideViewport) {
        return Visibility::ShowFadeableNonTopBar;
    }
    return Visibility::ShowAlways;
}

WindowGeometry LayoutState::buildFullScreenGeometry(const ScreenInfo &screen, qreal videoAspect) const
{
    return WindowGeometry::forFullScreen(screen, m_spec.isLegacyStyle(), WindowMode::FullScreen,
                                         outsideBars(), insideBars(), videoAspect,
                                         m_allowVideoToOverlapCameraHousing);
}

WindowGeometry LayoutState::buildGeometry(const QRectF &windowFrame, const QString &screenID, qreal videoAspect) const
{
    const ScreenFitOption fitOption = isMusicMode() ? ScreenFitOption::KeepInVisibleScreen : ScreenFitOption::NoConstraints;
    return WindowGeometry(windowFrame, screenID, fitOption, mode(), 0, outsideBars(), insideBars(), videoAspect);
}

bool LayoutState::operator==(const LayoutState &other) const
{
    return m_spec == other.m_spec
        && m_titleBar == other.m_titleBar
        && m_titleIconAndText == other.m_titleIconAndText
        && m_trafficLightButtons == other.m_trafficLightButtons
        && m_titlebarAccessories == other.m_titlebarAccessories
        && m_leadingSidebarToggleButton == other.m_leadingSidebarToggleButton
        && m_trailingSidebarToggleButton == other.m_trailingSidebarToggleButton
        && m_controlBarFloating == other.m_controlBarFloating
        && m_topBarView == other.m_topBarView
        && m_bottomBarView == other.m_bottomBarView
        && m_osdMinOffsetFromTop == other.m_osdMinOffsetFromTop
        && m_sidebarDownshift == other.m_sidebarDownshift
        && m_sidebarTabHeight == other.m_sidebarTabHeight
        && m_titleBarHeight == other.m_titleBarHeight
        && m_topOSCHeight == other.m_topOSCHeight
        && m_cameraHousingOffset == other.m_cameraHousingOffset
        && m_oscBarHeight == other.m_oscBarHeight;
}

QString LayoutState::toString() const
{
    return QString("LayoutState(%1 titleBarH:%2 topOSCH:%3 bottomBarH:%4 topBar:%5 bottomBar:%6 cameraHousingOffset:%7)")
        .arg(m_spec.toString())
        .arg(m_titleBarHeight)
        .arg(m_topOSCHeight)
        .arg(bottomBarHeight())
        .arg(::toString(m_topBarView), ::toString(m_bottomBarView))
        .arg(m_cameraHousingOffset);
}

QDebug operator<<(QDebug dbg, const LayoutState &layout)
{
    QDebugStateSaver saver(dbg);
    dbg.noquote() << layout.toString();
    return dbg;
}
