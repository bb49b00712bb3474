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

#ifndef GLOBALSETTING_H
#define GLOBALSETTING_H

#include <QObject>
#include <QSettings>
#include <QLoggingCategory>

#include "layout/layoutpreferences.h"
#include "state/playersavestate.h"

class GlobalSetting : public QObject
{
    Q_OBJECT
public:
    explicit GlobalSetting(QObject *parent = nullptr);

    /// Settings stored under a different organization and application, for tests
    GlobalSetting(const QString &organization, const QString &application, QObject *parent = nullptr);

    static GlobalSetting& instance();

    void setLogSettings(bool core, bool ui);
    void loadLogSettings();
    void setLogStoreSettings(bool storeLog, QString logFilePath);
    bool getLogStore() const;
    QString getLogFilePath() const;

    /**
     * @brief Read every layout-related setting into one snapshot
     */
    LayoutPreferences layoutPreferences() const;
    void setLayoutPreferences(const LayoutPreferences &prefs);

    // Bars
    void setTopBarPlacement(PanelPlacement placement);
    PanelPlacement getTopBarPlacement() const;
    void setBottomBarPlacement(PanelPlacement placement);
    PanelPlacement getBottomBarPlacement() const;
    void setLeadingSidebarPlacement(PanelPlacement placement);
    PanelPlacement getLeadingSidebarPlacement() const;
    void setTrailingSidebarPlacement(PanelPlacement placement);
    PanelPlacement getTrailingSidebarPlacement() const;
    void setLeadingSidebarTabGroups(SidebarTabGroups groups);
    SidebarTabGroups getLeadingSidebarTabGroups() const;
    void setTrailingSidebarTabGroups(SidebarTabGroups groups);
    SidebarTabGroups getTrailingSidebarTabGroups() const;
    void setPlaylistWidth(qreal width);
    qreal getPlaylistWidth() const;

    // On-screen controls
    void setEnableOSC(bool enable);
    bool getEnableOSC() const;
    void setOSCPosition(OSCPosition position);
    OSCPosition getOSCPosition() const;
    void setOSCBarHeight(qreal height);
    qreal getOSCBarHeight() const;

    // Window style
    void setUseLegacyWindowedMode(bool legacy);
    bool getUseLegacyWindowedMode() const;
    void setUseLegacyFullScreen(bool legacy);
    bool getUseLegacyFullScreen() const;
    void setShowSidebarToggleButtons(bool leading, bool trailing);
    void setAlwaysShowOnTopIcon(bool show);
    bool getAlwaysShowOnTopIcon() const;
    void setFullScreenWhenOpen(bool fullScreen);
    bool getFullScreenWhenOpen() const;

    // Sizing
    void setLockViewportToVideoSize(bool lock);
    bool getLockViewportToVideoSize() const;
    void setAllowEmptySpaceAroundVideo(bool allow);
    bool getAllowEmptySpaceAroundVideo() const;
    void setMoveWindowIntoVisibleScreenOnResize(bool move);
    bool getMoveWindowIntoVisibleScreenOnResize() const;
    void setAllowVideoToOverlapCameraHousing(bool allow);
    bool getAllowVideoToOverlapCameraHousing() const;
    void setResizeWindowTiming(ResizeWindowTiming timing);
    ResizeWindowTiming getResizeWindowTiming() const;
    void setResizeWindowScheme(ResizeWindowScheme scheme);
    ResizeWindowScheme getResizeWindowScheme() const;
    void setResizeWindowOption(ResizeWindowOption option);
    ResizeWindowOption getResizeWindowOption() const;
    void setGeometryDirective(const QString &directive);
    QString getGeometryDirective() const;
    void setMusicModeMaxWindowWidth(qreal width);
    qreal getMusicModeMaxWindowWidth() const;
    void setAnimationDuration(qreal seconds);
    qreal getAnimationDuration() const;

    // Saved player window
    void savePlayerState(const PlayerSaveState &state);
    PlayerSaveState loadPlayerState(const LayoutPreferences &prefs) const;
    void clearPlayerState();

    void sync() { m_settings.sync(); }

private:
    QSettings m_settings;
};

#endif // GLOBALSETTING_H
