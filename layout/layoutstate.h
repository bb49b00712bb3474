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

#ifndef LAYOUTSTATE_H
#define LAYOUTSTATE_H

#include <QString>
#include <QDebug>

#include "layoutspec.h"
#include "geometry/windowgeometry.h"
#include "geometry/screeninfo.h"

/**
 * @brief How a view is shown in a layout
 */
enum class Visibility {
    Hidden = 0,
    ShowAlways,
    ShowFadeableTopBar,     ///< Fades in and out as part of the top bar
    ShowFadeableNonTopBar   ///< Fades in and out, but not with the top bar
};

inline bool isShowable(Visibility visibility) { return visibility != Visibility::Hidden; }

QString toString(Visibility visibility);

/**
 * @brief External values the layout derivation depends on besides the spec
 */
struct LayoutStateOptions
{
    qreal cameraHousingHeight = 0;
    bool allowVideoToOverlapCameraHousing = false;
    qreal oscBarHeight = DEFAULT_OSC_BAR_HEIGHT;
    bool showLeadingSidebarToggleButton = true;
    bool showTrailingSidebarToggleButton = true;

    static LayoutStateOptions fromPreferences(const LayoutPreferences &prefs, qreal cameraHousingHeight = 0) {
        LayoutStateOptions options;
        options.cameraHousingHeight = cameraHousingHeight;
        options.allowVideoToOverlapCameraHousing = prefs.allowVideoToOverlapCameraHousing;
        options.oscBarHeight = prefs.oscBarHeight;
        options.showLeadingSidebarToggleButton = prefs.showLeadingSidebarToggleButton;
        options.showTrailingSidebarToggleButton = prefs.showTrailingSidebarToggleButton;
        return options;
    }
};

/**
 * @brief Concrete visibility and sizes of every part of a player window
 *
 * Derived from a LayoutSpec by fromSpec() and never patched afterwards. When anything
 * needs to change, a new LayoutState is built and a LayoutTransition animates from
 * the old one to the new one.
 */
class LayoutState
{
public:
    /// Layout of LayoutSpec()
    LayoutState();

    static LayoutState fromSpec(const LayoutSpec &spec, const LayoutStateOptions &options = LayoutStateOptions());

    const LayoutSpec &spec() const { return m_spec; }

    // Visibility of views
    Visibility titleBar() const { return m_titleBar; }
    Visibility titleIconAndText() const { return m_titleIconAndText; }
    Visibility trafficLightButtons() const { return m_trafficLightButtons; }
    Visibility titlebarAccessories() const { return m_titlebarAccessories; }
    Visibility leadingSidebarToggleButton() const { return m_leadingSidebarToggleButton; }
    Visibility trailingSidebarToggleButton() const { return m_trailingSidebarToggleButton; }
    Visibility controlBarFloating() const { return m_controlBarFloating; }
    Visibility topBarView() const { return m_topBarView; }
    Visibility bottomBarView() const { return m_bottomBarView; }

    // Sizes and offsets
    qreal osdMinOffsetFromTop() const { return m_osdMinOffsetFromTop; }
    qreal sidebarDownshift() const { return m_sidebarDownshift; }
    qreal sidebarTabHeight() const { return m_sidebarTabHeight; }
    qreal titleBarHeight() const { return m_titleBarHeight; }
    qreal topOSCHeight() const { return m_topOSCHeight; }
    /// Black margin above the top bar covering the camera housing in legacy full screen
    qreal cameraHousingOffset() const { return m_cameraHousingOffset; }

    qreal topBarHeight() const { return m_titleBarHeight + m_topOSCHeight; }
    /// OSC bar height if the OSC is at the bottom, else 0
    qreal bottomBarHeight() const;

    qreal outsideTopBarHeight() const;
    qreal outsideBottomBarHeight() const;
    qreal outsideLeadingBarWidth() const { return m_spec.leadingSidebar().outsideWidth(); }
    qreal outsideTrailingBarWidth() const { return m_spec.trailingSidebar().outsideWidth(); }
    qreal insideTopBarHeight() const;
    qreal insideBottomBarHeight() const;
    qreal insideLeadingBarWidth() const { return m_spec.leadingSidebar().insideWidth(); }
    qreal insideTrailingBarWidth() const { return m_spec.trailingSidebar().insideWidth(); }

    BoxQuad outsideBars() const;
    BoxQuad insideBars() const;

    // Convenience accessors
    WindowMode mode() const { return m_spec.mode(); }
    bool isFullScreen() const { return m_spec.isFullScreen(); }
    bool isNativeFullScreen() const { return m_spec.isNativeFullScreen(); }
    bool isLegacyFullScreen() const { return m_spec.isLegacyFullScreen(); }
    bool isMusicMode() const { return m_spec.isMusicMode(); }
    bool isWindowed() const { return m_spec.mode() == WindowMode::Windowed; }
    bool canToggleFullScreen() const { return isFullScreen() || isWindowed(); }
    bool canShowSidebars() const { return canToggleFullScreen(); }
    bool enableOSC() const { return m_spec.enableOSC(); }
    OSCPosition oscPosition() const { return m_spec.oscPosition(); }
    PanelPlacement topBarPlacement() const { return m_spec.topBarPlacement(); }
    PanelPlacement bottomBarPlacement() const { return m_spec.bottomBarPlacement(); }
    PanelPlacement leadingSidebarPlacement() const { return m_spec.leadingSidebarPlacement(); }
    PanelPlacement trailingSidebarPlacement() const { return m_spec.trailingSidebarPlacement(); }
    const Sidebar &leadingSidebar() const { return m_spec.leadingSidebar(); }
    const Sidebar &trailingSidebar() const { return m_spec.trailingSidebar(); }
    const Sidebar &sidebar(SidebarLocation location) const { return m_spec.sidebar(location); }

    bool hasFloatingOSC() const { return enableOSC() && oscPosition() == OSCPosition::Floating; }
    bool hasTopOSC() const { return enableOSC() && oscPosition() == OSCPosition::Top; }
    bool hasBottomOSC() const { return enableOSC() && oscPosition() == OSCPosition::Bottom; }
    /// True if the OSC sits in an outside bar and so never fades out
    bool hasPermanentOSC() const;

    Visibility pinToTopButtonVisibility(bool isOnTop, bool alwaysShowOnTopIcon) const;

    /**
     * @brief Full screen geometry for this layout on @p screen
     */
    WindowGeometry buildFullScreenGeometry(const ScreenInfo &screen, qreal videoAspect) const;

    /**
     * @brief Windowed or music mode geometry for this layout with the given frame
     */
    WindowGeometry buildGeometry(const QRectF &windowFrame, const QString &screenID, qreal videoAspect) const;

    bool operator==(const LayoutState &other) const;
    bool operator!=(const LayoutState &other) const { return !(*this == other); }

    QString toString() const;

private:
    explicit LayoutState(const LayoutSpec &spec);

    LayoutSpec m_spec;
    bool m_allowVideoToOverlapCameraHousing = false;
    qreal m_oscBarHeight = DEFAULT_OSC_BAR_HEIGHT;

    Visibility m_titleBar = Visibility::Hidden;
    Visibility m_titleIconAndText = Visibility::Hidden;
    Visibility m_trafficLightButtons = Visibility::Hidden;
    Visibility m_titlebarAccessories = Visibility::Hidden;
    Visibility m_leadingSidebarToggleButton = Visibility::Hidden;
    Visibility m_trailingSidebarToggleButton = Visibility::Hidden;
    Visibility m_controlBarFloating = Visibility::Hidden;
    Visibility m_topBarView = Visibility::Hidden;
    Visibility m_bottomBarView = Visibility::Hidden;

    qreal m_osdMinOffsetFromTop = 0;
    qreal m_sidebarDownshift = SidebarConst::DEFAULT_DOWNSHIFT;
    qreal m_sidebarTabHeight = SidebarConst::DEFAULT_TAB_HEIGHT;
    qreal m_titleBarHeight = 0;
    qreal m_topOSCHeight = 0;
    qreal m_cameraHousingOffset = 0;
};

QDebug operator<<(QDebug dbg, const LayoutState &layout);

#endif // LAYOUTSTATE_H
