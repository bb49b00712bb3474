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

#include "ui/playerwindow.h"
#include "ui/loghandler.h"
#include "ui/globalsetting.h"
#include "ui/coordinator/windowlayoutcoordinator.h"
#include "regex/RegularExpression.h"
#include "global.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QStyleFactory>
#include <QTimer>
#include <QDebug>

namespace {

// "WxH" with positive integers
std::optional<QSizeF> parseVideoSize(const QString &text)
{
    const QStringList parts = text.split(QLatin1Char('x'));
    if (parts.size() != 2) {
        return std::nullopt;
    }
    bool okWidth = false;
    bool okHeight = false;
    const int width = parts[0].toInt(&okWidth);
    const int height = parts[1].toInt(&okHeight);
    if (!okWidth || !okHeight || width <= 0 || height <= 0) {
        return std::nullopt;
    }
    return QSizeF(width, height);
}

}

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    app.setStyle(QStyleFactory::create("Fusion"));

    QCoreApplication::setApplicationName("Letterbox");
    QCoreApplication::setOrganizationName("TechxArtisan");
    QCoreApplication::setApplicationVersion(APP_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Player window layout engine demo");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption fullScreenOption(QStringList() << "f" << "fullscreen", "Enter full screen after opening.");
    QCommandLineOption musicModeOption(QStringList() << "m" << "music-mode", "Open in music mode.");
    QCommandLineOption legacyOption("legacy", "Use legacy full screen and windowed style.");
    QCommandLineOption videoSizeOption(QStringList() << "s" << "video-size", "Video size to simulate, as WxH.", "size", "1920x1080");
    QCommandLineOption geometryOption(QStringList() << "g" << "geometry", "Window geometry directive, as [W[xH]][+-X+-Y].", "geometry");
    QCommandLineOption restoreOption(QStringList() << "r" << "restore", "Restore the window saved at last exit.");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Enable all log categories.");
    parser.addOptions({fullScreenOption, musicModeOption, legacyOption, videoSizeOption,
                       geometryOption, restoreOption, verboseOption});
    parser.process(app);

    // load the settings
    GlobalSetting &settings = GlobalSetting::instance();
    if (parser.isSet(verboseOption)) {
        settings.setLogSettings(true, true);
    }
    settings.loadLogSettings();
    LogHandler::instance().enableLogStore();
    qDebug() << "Start letterbox" << APP_VERSION;

    const std::optional<QSizeF> videoSize = parseVideoSize(parser.value(videoSizeOption));
    if (!videoSize) {
        qCritical() << "Invalid video size:" << parser.value(videoSizeOption);
        return 1;
    }

    LayoutPreferences prefs = settings.layoutPreferences();
    if (parser.isSet(legacyOption)) {
        prefs.useLegacyFullScreen = true;
        prefs.useLegacyWindowedMode = true;
    }
    if (parser.isSet(geometryOption)) {
        const QString directive = parser.value(geometryOption);
        if (!RegularExpression::instance().geometryRegex.match(directive).hasMatch()) {
            qCritical() << "Invalid geometry:" << directive;
            return 1;
        }
        prefs.geometryDirective = directive;
        prefs.resizeWindowScheme = ResizeWindowScheme::MpvGeometry;
    }

    PlayerWindow window(prefs);
    WindowLayoutCoordinator *coordinator = window.coordinator();

    PlayerSaveState priorState;
    if (parser.isSet(restoreOption)) {
        priorState = settings.loadPlayerState(prefs);
        if (priorState.isEmpty()) {
            qWarning() << "No saved window state to restore";
        }
    }
    coordinator->setInitialLayout(priorState);
    window.show();

    // Stand in for the first frame of a newly opened video
    QTimer::singleShot(0, &window, [&]() {
        coordinator->applyVideoSize(*videoSize, true);
        if (parser.isSet(musicModeOption)) {
            coordinator->enterMusicMode();
        } else if (parser.isSet(fullScreenOption)) {
            coordinator->enterFullScreen();
        }
    });

    return app.exec();
}
