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

#include "playersavestate.h"
#include "regex/RegularExpression.h"

Q_LOGGING_CATEGORY(log_core_state, "lbx.core.state")

const QString PlayerSaveState::VERSION = QStringLiteral("1");

const QString PlayerSaveState::KEY_LAYOUT_SPEC = QStringLiteral("layoutSpec");
const QString PlayerSaveState::KEY_WINDOWED_GEOMETRY = QStringLiteral("windowedModeGeometry");
const QString PlayerSaveState::KEY_MUSIC_MODE_GEOMETRY = QStringLiteral("musicModeGeometry");
const QString PlayerSaveState::KEY_SCREEN_ID = QStringLiteral("screenID");
const QString PlayerSaveState::KEY_MUSIC_MODE_SCREEN_ID = QStringLiteral("musicModeScreenID");
const QString PlayerSaveState::KEY_VIDEO_ASPECT = QStringLiteral("videoAspect");

static const QString NO_TAB = QStringLiteral("nil");

static QString yesNo(bool value)
{
    return value ? QStringLiteral("Y") : QStringLiteral("N");
}

static QString number(qreal value, int decimals = 2)
{
    return QString::number(value, 'f', decimals);
}

/**
 * @brief Reads the tokens of one saved line in order, logging the first failure
 */
class TokenReader
{
public:
    TokenReader(const QString &preamble, const QString &csv)
        : m_preamble(preamble)
        , m_tokens(csv.split(QLatin1Char(',')))
        , m_index(0)
        , m_ok(true)
    {
    }

    bool checkHeader(int expectedCount)
    {
        if (m_tokens.size() != expectedCount) {
            fail(QStringLiteral("expected %1 tokens but found %2").arg(expectedCount).arg(m_tokens.size()));
            return false;
        }
        const QString version = next();
        if (version != PlayerSaveState::VERSION) {
            fail(QStringLiteral("unsupported version \"%1\"").arg(version));
            return false;
        }
        return true;
    }

    QString next()
    {
        if (m_index >= m_tokens.size()) {
            fail(QStringLiteral("ran out of tokens"));
            return QString();
        }
        return m_tokens.at(m_index++).trimmed();
    }

    qreal nextDouble(const char *name)
    {
        const QString token = next();
        if (!m_ok) {
            return 0;
        }
        if (!RegularExpression::instance().numberRegex.match(token).hasMatch()) {
            fail(QStringLiteral("%1 is not a number: \"%2\"").arg(QLatin1String(name), token));
            return 0;
        }
        return token.toDouble();
    }

    int nextInt(const char *name, int min, int max)
    {
        const QString token = next();
        if (!m_ok) {
            return min;
        }
        bool isInt = false;
        const int value = token.toInt(&isInt);
        if (!isInt || value < min || value > max) {
            fail(QStringLiteral("%1 is not an integer in [%2, %3]: \"%4\"")
                     .arg(QLatin1String(name)).arg(min).arg(max).arg(token));
            return min;
        }
        return value;
    }

    bool nextBool(const char *name)
    {
        const QString token = next();
        if (!m_ok) {
            return false;
        }
        if (RegularExpression::instance().yesRegex.match(token).hasMatch()) {
            return true;
        }
        if (!RegularExpression::instance().noRegex.match(token).hasMatch()) {
            fail(QStringLiteral("%1 is not Y or N: \"%2\"").arg(QLatin1String(name), token));
        }
        return false;
    }

    std::optional<SidebarTab> nextTab(const char *name)
    {
        const QString token = next();
        if (!m_ok || token == NO_TAB) {
            return std::nullopt;
        }
        std::optional<SidebarTab> tab = SidebarTab::fromName(token);
        if (!tab) {
            fail(QStringLiteral("%1 is not a sidebar tab: \"%2\"").arg(QLatin1String(name), token));
        }
        return tab;
    }

    void fail(const QString &reason)
    {
        if (m_ok) {
            qCCritical(log_core_state).noquote() << m_preamble << reason;
        }
        m_ok = false;
    }

    bool ok() const { return m_ok; }

private:
    QString m_preamble;
    QStringList m_tokens;
    int m_index;
    bool m_ok;
};

QString PlayerSaveState::encode(const LayoutSpec &spec)
{
    const std::optional<SidebarTab> &leadingTab = spec.leadingSidebar().visibleTab();
    const std::optional<SidebarTab> &trailingTab = spec.trailingSidebar().visibleTab();

    QStringList tokens;
    tokens << VERSION
           << (leadingTab ? leadingTab->name() : NO_TAB)
           << (trailingTab ? trailingTab->name() : NO_TAB)
           << QString::number(static_cast<int>(spec.mode()))
           << yesNo(spec.isLegacyStyle())
           << QString::number(static_cast<int>(spec.topBarPlacement()))
           << QString::number(static_cast<int>(spec.trailingSidebarPlacement()))
           << QString::number(static_cast<int>(spec.bottomBarPlacement()))
           << QString::number(static_cast<int>(spec.leadingSidebarPlacement()))
           << yesNo(spec.enableOSC())
           << QString::number(static_cast<int>(spec.oscPosition()));
    return tokens.join(QLatin1Char(','));
}

QString PlayerSaveState::encode(const WindowGeometry &geometry)
{
    const QRectF &frame = geometry.windowFrame();
    const BoxQuad &outside = geometry.outsideBars();

    QStringList tokens;
    tokens << VERSION
           << number(geometry.videoSize().width())
           << number(geometry.videoSize().height())
           << number(geometry.videoAspect(), 6)
           << number(outside.top)
           << number(outside.trailing)
           << number(outside.bottom)
           << number(outside.leading)
           << number(frame.x())
           << number(frame.y())
           << number(frame.width())
           << number(frame.height());
    return tokens.join(QLatin1Char(','));
}

QString PlayerSaveState::encode(const MusicModeGeometry &geometry)
{
    const QRectF &frame = geometry.windowFrame();

    QStringList tokens;
    tokens << VERSION
           << number(frame.x())
           << number(frame.y())
           << number(frame.width())
           << number(frame.height())
           << number(geometry.playlistHeight())
           << yesNo(geometry.isVideoVisible())
           << yesNo(geometry.isPlaylistVisible())
           << number(geometry.videoAspect(), 6);
    return tokens.join(QLatin1Char(','));
}

std::optional<LayoutSpec> PlayerSaveState::decodeLayoutSpec(const QString &csv, const LayoutPreferences &prefs)
{
    TokenReader reader(QStringLiteral("Failed to restore layout spec from \"%1\":").arg(csv), csv);
    if (!reader.checkHeader(11)) {
        return std::nullopt;
    }

    const std::optional<SidebarTab> leadingTab = reader.nextTab("leading tab");
    const std::optional<SidebarTab> trailingTab = reader.nextTab("trailing tab");
    const int mode = reader.nextInt("mode", static_cast<int>(WindowMode::Windowed), static_cast<int>(WindowMode::MusicMode));
    const bool isLegacyStyle = reader.nextBool("legacy style");
    const int topPlacement = reader.nextInt("top bar placement", 0, 1);
    const int trailingPlacement = reader.nextInt("trailing sidebar placement", 0, 1);
    const int bottomPlacement = reader.nextInt("bottom bar placement", 0, 1);
    const int leadingPlacement = reader.nextInt("leading sidebar placement", 0, 1);
    const bool enableOSC = reader.nextBool("OSC enabled");
    const int oscPosition = reader.nextInt("OSC position", 0, 2);
    if (!reader.ok()) {
        return std::nullopt;
    }

    const Sidebar leadingSidebar(SidebarLocation::Leading, prefs.leadingSidebarTabGroups,
                                 static_cast<PanelPlacement>(leadingPlacement), leadingTab, leadingTab,
                                 prefs.playlistWidth);
    const Sidebar trailingSidebar(SidebarLocation::Trailing, prefs.trailingSidebarTabGroups,
                                  static_cast<PanelPlacement>(trailingPlacement), trailingTab, trailingTab,
                                  prefs.playlistWidth);
    return LayoutSpec(leadingSidebar, trailingSidebar, static_cast<WindowMode>(mode), isLegacyStyle,
                      static_cast<PanelPlacement>(topPlacement), static_cast<PanelPlacement>(bottomPlacement),
                      enableOSC, static_cast<OSCPosition>(oscPosition));
}

std::optional<WindowGeometry> PlayerSaveState::decodeWindowGeometry(const QString &csv, const QString &screenID)
{
    TokenReader reader(QStringLiteral("Failed to restore windowed geometry from \"%1\":").arg(csv), csv);
    if (!reader.checkHeader(12)) {
        return std::nullopt;
    }

    // The video size is always derived again, so it is only checked for format
    reader.nextDouble("video width");
    reader.nextDouble("video height");
    const qreal videoAspect = reader.nextDouble("video aspect");
    BoxQuad outsideBars;
    outsideBars.top = reader.nextDouble("outside top");
    outsideBars.trailing = reader.nextDouble("outside trailing");
    outsideBars.bottom = reader.nextDouble("outside bottom");
    outsideBars.leading = reader.nextDouble("outside leading");
    const qreal x = reader.nextDouble("x");
    const qreal y = reader.nextDouble("y");
    const qreal width = reader.nextDouble("width");
    const qreal height = reader.nextDouble("height");
    if (!reader.ok()) {
        return std::nullopt;
    }
    if (!(videoAspect > 0)) {
        reader.fail(QStringLiteral("video aspect must be positive"));
        return std::nullopt;
    }

    WindowGeometry geometry(QRectF(x, y, width, height), screenID, ScreenFitOption::KeepInVisibleScreen,
                            WindowMode::Windowed, 0, outsideBars, BoxQuad(), videoAspect);
    if (!geometry.isValid()) {
        reader.fail(QStringLiteral("outside bars do not fit in the window frame"));
        return std::nullopt;
    }
    return geometry;
}

std::optional<MusicModeGeometry> PlayerSaveState::decodeMusicModeGeometry(const QString &csv, const QString &screenID)
{
    TokenReader reader(QStringLiteral("Failed to restore music mode geometry from \"%1\":").arg(csv), csv);
    if (!reader.checkHeader(9)) {
        return std::nullopt;
    }

    const qreal x = reader.nextDouble("x");
    const qreal y = reader.nextDouble("y");
    const qreal width = reader.nextDouble("width");
    const qreal height = reader.nextDouble("height");
    const qreal playlistHeight = reader.nextDouble("playlist height");
    const bool isVideoVisible = reader.nextBool("video visible");
    const bool isPlaylistVisible = reader.nextBool("playlist visible");
    const qreal videoAspect = reader.nextDouble("video aspect");
    if (!reader.ok()) {
        return std::nullopt;
    }
    if (!(videoAspect > 0)) {
        reader.fail(QStringLiteral("video aspect must be positive"));
        return std::nullopt;
    }
    return MusicModeGeometry(QRectF(x, y, width, height), screenID, playlistHeight,
                             isVideoVisible, isPlaylistVisible, videoAspect);
}

QVariantMap PlayerSaveState::toProperties() const
{
    QVariantMap properties;
    if (layoutSpec) {
        properties.insert(KEY_LAYOUT_SPEC, encode(*layoutSpec));
    }
    if (windowedModeGeometry) {
        properties.insert(KEY_WINDOWED_GEOMETRY, encode(*windowedModeGeometry));
        properties.insert(KEY_SCREEN_ID, windowedModeGeometry->screenID());
    }
    if (musicModeGeometry) {
        properties.insert(KEY_MUSIC_MODE_GEOMETRY, encode(*musicModeGeometry));
        properties.insert(KEY_MUSIC_MODE_SCREEN_ID, musicModeGeometry->screenID());
    }
    if (videoAspect) {
        properties.insert(KEY_VIDEO_ASPECT, number(*videoAspect, 6));
    }
    return properties;
}

PlayerSaveState PlayerSaveState::fromProperties(const QVariantMap &properties, const LayoutPreferences &prefs)
{
    PlayerSaveState state;

    const QString layoutCSV = properties.value(KEY_LAYOUT_SPEC).toString();
    if (!layoutCSV.isEmpty()) {
        state.layoutSpec = decodeLayoutSpec(layoutCSV, prefs);
    }

    const QString windowedCSV = properties.value(KEY_WINDOWED_GEOMETRY).toString();
    if (!windowedCSV.isEmpty()) {
        state.windowedModeGeometry = decodeWindowGeometry(windowedCSV, properties.value(KEY_SCREEN_ID).toString());
    }

    const QString musicCSV = properties.value(KEY_MUSIC_MODE_GEOMETRY).toString();
    if (!musicCSV.isEmpty()) {
        state.musicModeGeometry = decodeMusicModeGeometry(musicCSV, properties.value(KEY_MUSIC_MODE_SCREEN_ID).toString());
    }

    if (properties.contains(KEY_VIDEO_ASPECT)) {
        bool ok = false;
        const qreal aspect = properties.value(KEY_VIDEO_ASPECT).toString().toDouble(&ok);
        if (ok && aspect > 0) {
            state.videoAspect = aspect;
        } else {
            qCWarning(log_core_state) << "Ignoring invalid saved video aspect" << properties.value(KEY_VIDEO_ASPECT);
        }
    }

    qCDebug(log_core_state) << "Restored state parts - layout:" << state.layoutSpec.has_value()
                            << "windowed:" << state.windowedModeGeometry.has_value()
                            << "music mode:" << state.musicModeGeometry.has_value();
    return state;
}
