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

#include "globalsetting.h"
#include "global.h"
#include <QDebug>

namespace {

// Out of range values fall back to the default
template <typename Enum>
Enum readEnum(const QSettings &settings, const QString &key, Enum defaultValue, Enum minValue, Enum maxValue)
{
    bool ok = false;
    const int value = settings.value(key, static_cast<int>(defaultValue)).toInt(&ok);
    if (!ok || value < static_cast<int>(minValue) || value > static_cast<int>(maxValue)) {
        qWarning() << "Invalid value for setting" << key << "- using default";
        return defaultValue;
    }
    return static_cast<Enum>(value);
}

}

GlobalSetting::GlobalSetting(QObject *parent)
    : QObject(parent),
      m_settings("Techxartisan", "Letterbox")
{
}

GlobalSetting::GlobalSetting(const QString &organization, const QString &application, QObject *parent)
    : QObject(parent),
      m_settings(organization, application)
{
}

GlobalSetting& GlobalSetting::instance()
{
    static GlobalSetting instance;
    return instance;
}

void GlobalSetting::setLogSettings(bool core, bool ui)
{
    m_settings.setValue("log/core", core);
    m_settings.setValue("log/ui", ui);
}

void GlobalSetting::loadLogSettings()
{
    QString logFilter = "";
    logFilter += m_settings.value("log/core", false).toBool() ? "lbx.core.*=true\n" : "lbx.core.*=false\n";
    logFilter += m_settings.value("log/ui", false).toBool() ? "lbx.ui.*=true\n" : "lbx.ui.*=false\n";
    QLoggingCategory::setFilterRules(logFilter);
}

void GlobalSetting::setLogStoreSettings(bool storeLog, QString logFilePath){
    m_settings.setValue("log/storeLog", storeLog);
    m_settings.setValue("log/logFilePath", logFilePath);
}

bool GlobalSetting::getLogStore() const {
    return m_settings.value("log/storeLog", false).toBool();
}

QString GlobalSetting::getLogFilePath() const {
    return m_settings.value("log/logFilePath").toString();
}

LayoutPreferences GlobalSetting::layoutPreferences() const
{
    LayoutPreferences prefs;
    prefs.topBarPlacement = getTopBarPlacement();
    prefs.bottomBarPlacement = getBottomBarPlacement();
    prefs.leadingSidebarPlacement = getLeadingSidebarPlacement();
    prefs.trailingSidebarPlacement = getTrailingSidebarPlacement();
    prefs.leadingSidebarTabGroups = getLeadingSidebarTabGroups();
    prefs.trailingSidebarTabGroups = getTrailingSidebarTabGroups();
    prefs.playlistWidth = getPlaylistWidth();

    prefs.enableOSC = getEnableOSC();
    prefs.oscPosition = getOSCPosition();
    prefs.oscBarHeight = getOSCBarHeight();

    prefs.useLegacyWindowedMode = getUseLegacyWindowedMode();
    prefs.useLegacyFullScreen = getUseLegacyFullScreen();
    prefs.showLeadingSidebarToggleButton = m_settings.value("window/showLeadingSidebarToggleButton", true).toBool();
    prefs.showTrailingSidebarToggleButton = m_settings.value("window/showTrailingSidebarToggleButton", true).toBool();
    prefs.alwaysShowOnTopIcon = getAlwaysShowOnTopIcon();
    prefs.fullScreenWhenOpen = getFullScreenWhenOpen();

    prefs.lockViewportToVideoSize = getLockViewportToVideoSize();
    prefs.allowEmptySpaceAroundVideo = getAllowEmptySpaceAroundVideo();
    prefs.moveWindowIntoVisibleScreenOnResize = getMoveWindowIntoVisibleScreenOnResize();
    prefs.allowVideoToOverlapCameraHousing = getAllowVideoToOverlapCameraHousing();
    prefs.resizeWindowTiming = getResizeWindowTiming();
    prefs.resizeWindowScheme = getResizeWindowScheme();
    prefs.resizeWindowOption = getResizeWindowOption();
    prefs.geometryDirective = getGeometryDirective();
    prefs.musicModeMaxWindowWidth = getMusicModeMaxWindowWidth();
    prefs.animationDuration = getAnimationDuration();
    return prefs;
}

void GlobalSetting::setLayoutPreferences(const LayoutPreferences &prefs)
{
    setTopBarPlacement(prefs.topBarPlacement);
    setBottomBarPlacement(prefs.bottomBarPlacement);
    setLeadingSidebarPlacement(prefs.leadingSidebarPlacement);
    setTrailingSidebarPlacement(prefs.trailingSidebarPlacement);
    setLeadingSidebarTabGroups(prefs.leadingSidebarTabGroups);
    setTrailingSidebarTabGroups(prefs.trailingSidebarTabGroups);
    setPlaylistWidth(prefs.playlistWidth);

    setEnableOSC(prefs.enableOSC);
    setOSCPosition(prefs.oscPosition);
    setOSCBarHeight(prefs.oscBarHeight);

    setUseLegacyWindowedMode(prefs.useLegacyWindowedMode);
    setUseLegacyFullScreen(prefs.useLegacyFullScreen);
    setShowSidebarToggleButtons(prefs.showLeadingSidebarToggleButton, prefs.showTrailingSidebarToggleButton);
    setAlwaysShowOnTopIcon(prefs.alwaysShowOnTopIcon);
    setFullScreenWhenOpen(prefs.fullScreenWhenOpen);

    setLockViewportToVideoSize(prefs.lockViewportToVideoSize);
    setAllowEmptySpaceAroundVideo(prefs.allowEmptySpaceAroundVideo);
    setMoveWindowIntoVisibleScreenOnResize(prefs.moveWindowIntoVisibleScreenOnResize);
    setAllowVideoToOverlapCameraHousing(prefs.allowVideoToOverlapCameraHousing);
    setResizeWindowTiming(prefs.resizeWindowTiming);
    setResizeWindowScheme(prefs.resizeWindowScheme);
    setResizeWindowOption(prefs.resizeWindowOption);
    setGeometryDirective(prefs.geometryDirective);
    setMusicModeMaxWindowWidth(prefs.musicModeMaxWindowWidth);
    setAnimationDuration(prefs.animationDuration);
}

// Bars

void GlobalSetting::setTopBarPlacement(PanelPlacement placement) {
    m_settings.setValue("layout/topBarPlacement", static_cast<int>(placement));
}

PanelPlacement GlobalSetting::getTopBarPlacement() const {
    return readEnum(m_settings, "layout/topBarPlacement", PanelPlacement::InsideViewport,
                    PanelPlacement::InsideViewport, PanelPlacement::OutsideViewport);
}

void GlobalSetting::setBottomBarPlacement(PanelPlacement placement) {
    m_settings.setValue("layout/bottomBarPlacement", static_cast<int>(placement));
}

PanelPlacement GlobalSetting::getBottomBarPlacement() const {
    return readEnum(m_settings, "layout/bottomBarPlacement", PanelPlacement::InsideViewport,
                    PanelPlacement::InsideViewport, PanelPlacement::OutsideViewport);
}

void GlobalSetting::setLeadingSidebarPlacement(PanelPlacement placement) {
    m_settings.setValue("layout/leadingSidebarPlacement", static_cast<int>(placement));
}

PanelPlacement GlobalSetting::getLeadingSidebarPlacement() const {
    return readEnum(m_settings, "layout/leadingSidebarPlacement", PanelPlacement::InsideViewport,
                    PanelPlacement::InsideViewport, PanelPlacement::OutsideViewport);
}

void GlobalSetting::setTrailingSidebarPlacement(PanelPlacement placement) {
    m_settings.setValue("layout/trailingSidebarPlacement", static_cast<int>(placement));
}

PanelPlacement GlobalSetting::getTrailingSidebarPlacement() const {
    return readEnum(m_settings, "layout/trailingSidebarPlacement", PanelPlacement::InsideViewport,
                    PanelPlacement::InsideViewport, PanelPlacement::OutsideViewport);
}

void GlobalSetting::setLeadingSidebarTabGroups(SidebarTabGroups groups) {
    m_settings.setValue("layout/leadingSidebarTabGroups", groups.toInt());
}

SidebarTabGroups GlobalSetting::getLeadingSidebarTabGroups() const {
    const int value = m_settings.value("layout/leadingSidebarTabGroups", static_cast<int>(SidebarTabGroup::Settings)).toInt();
    return SidebarTabGroups::fromInt(value & (static_cast<int>(SidebarTabGroup::Settings) | static_cast<int>(SidebarTabGroup::Playlist)));
}

void GlobalSetting::setTrailingSidebarTabGroups(SidebarTabGroups groups) {
    m_settings.setValue("layout/trailingSidebarTabGroups", groups.toInt());
}

SidebarTabGroups GlobalSetting::getTrailingSidebarTabGroups() const {
    const int value = m_settings.value("layout/trailingSidebarTabGroups", static_cast<int>(SidebarTabGroup::Playlist)).toInt();
    return SidebarTabGroups::fromInt(value & (static_cast<int>(SidebarTabGroup::Settings) | static_cast<int>(SidebarTabGroup::Playlist)));
}

void GlobalSetting::setPlaylistWidth(qreal width) {
    m_settings.setValue("layout/playlistWidth", width);
}

qreal GlobalSetting::getPlaylistWidth() const {
    const qreal width = m_settings.value("layout/playlistWidth", 270).toDouble();
    return qBound(SidebarConst::MIN_PLAYLIST_WIDTH, width, SidebarConst::MAX_PLAYLIST_WIDTH);
}

// On-screen controls

void GlobalSetting::setEnableOSC(bool enable) {
    m_settings.setValue("osc/enable", enable);
}

bool GlobalSetting::getEnableOSC() const {
    return m_settings.value("osc/enable", true).toBool();
}

void GlobalSetting::setOSCPosition(OSCPosition position) {
    m_settings.setValue("osc/position", static_cast<int>(position));
}

OSCPosition GlobalSetting::getOSCPosition() const {
    return readEnum(m_settings, "osc/position", OSCPosition::Floating, OSCPosition::Floating, OSCPosition::Bottom);
}

void GlobalSetting::setOSCBarHeight(qreal height) {
    m_settings.setValue("osc/barHeight", height);
}

qreal GlobalSetting::getOSCBarHeight() const {
    return qMax(MIN_OSC_BAR_HEIGHT, m_settings.value("osc/barHeight", DEFAULT_OSC_BAR_HEIGHT).toDouble());
}

// Window style

void GlobalSetting::setUseLegacyWindowedMode(bool legacy) {
    m_settings.setValue("window/useLegacyWindowedMode", legacy);
}

bool GlobalSetting::getUseLegacyWindowedMode() const {
    return m_settings.value("window/useLegacyWindowedMode", false).toBool();
}

void GlobalSetting::setUseLegacyFullScreen(bool legacy) {
    m_settings.setValue("window/useLegacyFullScreen", legacy);
}

bool GlobalSetting::getUseLegacyFullScreen() const {
    return m_settings.value("window/useLegacyFullScreen", false).toBool();
}

void GlobalSetting::setShowSidebarToggleButtons(bool leading, bool trailing) {
    m_settings.setValue("window/showLeadingSidebarToggleButton", leading);
    m_settings.setValue("window/showTrailingSidebarToggleButton", trailing);
}

void GlobalSetting::setAlwaysShowOnTopIcon(bool show) {
    m_settings.setValue("window/alwaysShowOnTopIcon", show);
}

bool GlobalSetting::getAlwaysShowOnTopIcon() const {
    return m_settings.value("window/alwaysShowOnTopIcon", false).toBool();
}

void GlobalSetting::setFullScreenWhenOpen(bool fullScreen) {
    m_settings.setValue("window/fullScreenWhenOpen", fullScreen);
}

bool GlobalSetting::getFullScreenWhenOpen() const {
    return m_settings.value("window/fullScreenWhenOpen", false).toBool();
}

// Sizing

void GlobalSetting::setLockViewportToVideoSize(bool lock) {
    m_settings.setValue("sizing/lockViewportToVideoSize", lock);
}

bool GlobalSetting::getLockViewportToVideoSize() const {
    return m_settings.value("sizing/lockViewportToVideoSize", true).toBool();
}

void GlobalSetting::setAllowEmptySpaceAroundVideo(bool allow) {
    m_settings.setValue("sizing/allowEmptySpaceAroundVideo", allow);
}

bool GlobalSetting::getAllowEmptySpaceAroundVideo() const {
    return m_settings.value("sizing/allowEmptySpaceAroundVideo", false).toBool();
}

void GlobalSetting::setMoveWindowIntoVisibleScreenOnResize(bool move) {
    m_settings.setValue("sizing/moveWindowIntoVisibleScreenOnResize", move);
}

bool GlobalSetting::getMoveWindowIntoVisibleScreenOnResize() const {
    return m_settings.value("sizing/moveWindowIntoVisibleScreenOnResize", true).toBool();
}

void GlobalSetting::setAllowVideoToOverlapCameraHousing(bool allow) {
    m_settings.setValue("sizing/allowVideoToOverlapCameraHousing", allow);
}

bool GlobalSetting::getAllowVideoToOverlapCameraHousing() const {
    return m_settings.value("sizing/allowVideoToOverlapCameraHousing", false).toBool();
}

void GlobalSetting::setResizeWindowTiming(ResizeWindowTiming timing) {
    m_settings.setValue("sizing/resizeWindowTiming", static_cast<int>(timing));
}

ResizeWindowTiming GlobalSetting::getResizeWindowTiming() const {
    return readEnum(m_settings, "sizing/resizeWindowTiming", ResizeWindowTiming::OnlyWhenOpen,
                    ResizeWindowTiming::Always, ResizeWindowTiming::Never);
}

void GlobalSetting::setResizeWindowScheme(ResizeWindowScheme scheme) {
    m_settings.setValue("sizing/resizeWindowScheme", static_cast<int>(scheme));
}

ResizeWindowScheme GlobalSetting::getResizeWindowScheme() const {
    return readEnum(m_settings, "sizing/resizeWindowScheme", ResizeWindowScheme::SimpleVideoSizeMultiple,
                    ResizeWindowScheme::SimpleVideoSizeMultiple, ResizeWindowScheme::MpvGeometry);
}

void GlobalSetting::setResizeWindowOption(ResizeWindowOption option) {
    m_settings.setValue("sizing/resizeWindowOption", static_cast<int>(option));
}

ResizeWindowOption GlobalSetting::getResizeWindowOption() const {
    return readEnum(m_settings, "sizing/resizeWindowOption", ResizeWindowOption::VideoSize10,
                    ResizeWindowOption::FitScreen, ResizeWindowOption::VideoSize20);
}

void GlobalSetting::setGeometryDirective(const QString &directive) {
    m_settings.setValue("sizing/geometry", directive);
}

QString GlobalSetting::getGeometryDirective() const {
    return m_settings.value("sizing/geometry", QString()).toString();
}

void GlobalSetting::setMusicModeMaxWindowWidth(qreal width) {
    m_settings.setValue("sizing/musicModeMaxWindowWidth", width);
}

qreal GlobalSetting::getMusicModeMaxWindowWidth() const {
    const qreal width = m_settings.value("sizing/musicModeMaxWindowWidth", MusicModeConst::DEFAULT_MAX_WINDOW_WIDTH).toDouble();
    return qMax(MusicModeConst::MIN_WINDOW_WIDTH, width);
}

void GlobalSetting::setAnimationDuration(qreal seconds) {
    m_settings.setValue("sizing/animationDuration", seconds);
}

qreal GlobalSetting::getAnimationDuration() const {
    return qMax(qreal(0), m_settings.value("sizing/animationDuration", DEFAULT_ANIMATION_DURATION).toDouble());
}

// Saved player window

void GlobalSetting::savePlayerState(const PlayerSaveState &state)
{
    m_settings.remove("state");
    const QVariantMap properties = state.toProperties();
    for (auto it = properties.constBegin(); it != properties.constEnd(); ++it) {
        m_settings.setValue("state/" + it.key(), it.value());
    }
}

PlayerSaveState GlobalSetting::loadPlayerState(const LayoutPreferences &prefs) const
{
    QVariantMap properties;
    const QStringList keys = {
        PlayerSaveState::KEY_LAYOUT_SPEC,
        PlayerSaveState::KEY_WINDOWED_GEOMETRY,
        PlayerSaveState::KEY_MUSIC_MODE_GEOMETRY,
        PlayerSaveState::KEY_SCREEN_ID,
        PlayerSaveState::KEY_MUSIC_MODE_SCREEN_ID,
        PlayerSaveState::KEY_VIDEO_ASPECT
    };
    for (const QString &key : keys) {
        const QVariant value = m_settings.value("state/" + key);
        if (value.isValid()) {
            properties.insert(key, value);
        }
    }
    return PlayerSaveState::fromProperties(properties, prefs);
}

void GlobalSetting::clearPlayerState()
{
    m_settings.remove("state");
}
