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

#include "windowgeometry.h"
#include "geometrydef.h"
#include "rectutil.h"
#include "global.h"
#include <QtMath>
#include <cmath>

WindowGeometry::WindowGeometry()
    : WindowGeometry(QRectF(), QString(), ScreenFitOption::NoConstraints, WindowMode::Windowed, 0,
                     BoxQuad(), BoxQuad(), WIDTH_WHEN_NO_VIDEO / HEIGHT_WHEN_NO_VIDEO)
{
}

static qreal nonNegative(qreal value, const char *name)
{
    if (value < 0) {
        qCWarning(log_core_geometry) << "Expected" << name << ">= 0, found" << value << "- using 0";
        return 0;
    }
    return value;
}

static BoxQuad nonNegative(const BoxQuad &quad, const char *name)
{
    return BoxQuad(nonNegative(quad.top, name), nonNegative(quad.trailing, name),
                   nonNegative(quad.bottom, name), nonNegative(quad.leading, name));
}

WindowGeometry::WindowGeometry(const QRectF &windowFrame, const QString &screenID, ScreenFitOption fitOption,
                               WindowMode mode, qreal topMarginHeight,
                               const BoxQuad &outsideBars, const BoxQuad &insideBars,
                               qreal videoAspect, std::optional<BoxQuad> viewportMargins)
    : m_windowFrame(windowFrame)
    , m_screenID(screenID)
    , m_fitOption(fitOption)
    , m_mode(mode)
    , m_topMarginHeight(nonNegative(topMarginHeight, "topMarginHeight"))
    , m_outsideBars(nonNegative(outsideBars, "outside bar size"))
    , m_insideBars(nonNegative(insideBars, "inside bar size"))
    , m_videoAspect(videoAspect)
{
    if (!(m_videoAspect > 0)) {
        qCWarning(log_core_geometry) << "Invalid video aspect" << videoAspect << "- using default";
        m_videoAspect = WIDTH_WHEN_NO_VIDEO / HEIGHT_WHEN_NO_VIDEO;
    }

    const QSizeF viewport = deriveViewportSize(m_windowFrame, m_topMarginHeight, m_outsideBars);
    m_videoSize = fitVideoToContainer(m_videoAspect, viewport, viewportMargins.value_or(BoxQuad()));
    if (viewportMargins) {
        m_viewportMargins = *viewportMargins;
    } else {
        m_viewportMargins = computeBestViewportMargins(viewport, m_videoSize, m_insideBars, m_mode);
    }
}

QRectF WindowGeometry::fullScreenWindowFrame(const ScreenInfo &screen, bool legacy)
{
    return legacy ? screen.frame : screen.frameWithoutCameraHousing();
}

WindowGeometry WindowGeometry::forFullScreen(const ScreenInfo &screen, bool legacy, WindowMode mode,
                                             const BoxQuad &outsideBars, const BoxQuad &insideBars,
                                             qreal videoAspect, bool allowVideoToOverlapCameraHousing)
{
    const QRectF windowFrame = fullScreenWindowFrame(screen, legacy);
    qreal topMarginHeight = 0;
    ScreenFitOption fitOption = ScreenFitOption::NativeFullScreen;
    if (legacy) {
        topMarginHeight = allowVideoToOverlapCameraHousing ? 0 : screen.cameraHousingHeight;
        fitOption = ScreenFitOption::LegacyFullScreen;
    }
    return WindowGeometry(windowFrame, screen.id, fitOption, mode, topMarginHeight,
                          outsideBars, insideBars, videoAspect);
}

// Derived values

QSizeF WindowGeometry::deriveViewportSize(const QRectF &windowFrame, qreal topMarginHeight, const BoxQuad &outsideBars)
{
    return QSizeF(windowFrame.width() - outsideBars.totalWidth(),
                  windowFrame.height() - outsideBars.totalHeight() - topMarginHeight);
}

QSizeF WindowGeometry::viewportSize() const
{
    return deriveViewportSize(m_windowFrame, m_topMarginHeight, m_outsideBars);
}

QSizeF WindowGeometry::outsideBarsTotalSize() const
{
    return QSizeF(m_outsideBars.totalWidth(), m_outsideBars.totalHeight());
}

bool WindowGeometry::isValid() const
{
    const QSizeF viewport = viewportSize();
    return viewport.width() >= 0 && viewport.height() >= 0;
}

QRectF WindowGeometry::viewportFrameInScreen() const
{
    return QRectF(QPointF(m_windowFrame.x() + m_outsideBars.leading, m_windowFrame.y() + m_outsideBars.bottom),
                  viewportSize());
}

QRectF WindowGeometry::videoFrameInWindow() const
{
    return QRectF(QPointF(m_outsideBars.leading + m_viewportMargins.leading,
                          m_outsideBars.bottom + m_viewportMargins.bottom),
                  m_videoSize);
}

QRectF WindowGeometry::videoFrameInScreen() const
{
    return videoFrameInWindow().translated(m_windowFrame.topLeft());
}

// Minimums

qreal WindowGeometry::minVideoWidth(WindowMode mode)
{
    return mode == WindowMode::MusicMode ? MusicModeConst::MIN_WINDOW_WIDTH : MIN_VIDEO_WIDTH;
}

qreal WindowGeometry::minVideoHeight(WindowMode mode)
{
    return mode == WindowMode::MusicMode ? 0 : MIN_VIDEO_HEIGHT;
}

QSizeF WindowGeometry::computeMinVideoSize(qreal videoAspect, WindowMode mode)
{
    const qreal minWidth = minVideoWidth(mode);
    const qreal minHeight = minVideoHeight(mode);
    const QSizeF fromWidth(minWidth, std::round(minWidth / videoAspect));
    if (fromWidth.height() >= minHeight) {
        return fromWidth;
    }
    return QSizeF(std::round(minHeight * videoAspect), minHeight);
}

qreal WindowGeometry::minViewportWidth(WindowMode mode) const
{
    // Also leaves room between inside sidebars
    return qMax(minVideoWidth(mode), m_insideBars.totalWidth() + SidebarConst::MIN_SPACE_BETWEEN_INSIDE_SIDEBARS);
}

qreal WindowGeometry::minViewportHeight(WindowMode mode) const
{
    return minVideoHeight(mode);
}

qreal WindowGeometry::minWindowWidth(WindowMode mode) const
{
    return minViewportWidth(mode) + m_outsideBars.totalWidth();
}

qreal WindowGeometry::minWindowHeight(WindowMode mode) const
{
    return minViewportHeight(mode) + m_outsideBars.totalHeight() + m_topMarginHeight;
}

// Static calculations

QSizeF WindowGeometry::fitVideoToContainer(qreal videoAspect, const QSizeF &containerSize, const BoxQuad &margins)
{
    if (containerSize.width() <= 0 || containerSize.height() <= 0 || !(videoAspect > 0)) {
        return QSizeF(0, 0);
    }

    const QSizeF usable(containerSize.width() - margins.totalWidth(),
                        containerSize.height() - margins.totalHeight());
    if (usable.width() <= 0 || usable.height() <= 0) {
        return QSizeF(0, 0);
    }

    if (videoAspect < RectUtil::aspect(usable)) {
        // Video is taller: shrink to meet height
        const qreal width = RectUtil::snap(usable.height() * videoAspect, usable.width());
        return QSizeF(width, usable.height());
    }
    // Video is wider: shrink to meet width
    const qreal height = RectUtil::snap(usable.width() / videoAspect, usable.height());
    return QSizeF(usable.width(), height);
}

BoxQuad WindowGeometry::computeBestViewportMargins(const QSizeF &viewportSize, const QSizeF &videoSize,
                                                   const BoxQuad &insideBars, WindowMode mode)
{
    if (viewportSize.width() <= 0 || viewportSize.height() <= 0) {
        return BoxQuad();
    }
    if (mode == WindowMode::MusicMode) {
        // Viewport is always equal to the video in music mode
        return BoxQuad();
    }

    qreal leadingMargin = 0;
    qreal trailingMargin = 0;
    qreal unusedWidth = qMax(0.0, viewportSize.width() - videoSize.width());

    if (unusedWidth > 0) {
        if (mode == WindowMode::FullScreen) {
            leadingMargin += unusedWidth * 0.5;
            trailingMargin += unusedWidth * 0.5;
        } else {
            const qreal leadingSidebarWidth = insideBars.leading;
            const qreal trailingSidebarWidth = insideBars.trailing;

            const qreal viewportMidpointX = viewportSize.width() * 0.5;
            const qreal leadingVideoIdealX = viewportMidpointX - videoSize.width() * 0.5;
            const qreal trailingVideoIdealX = viewportMidpointX + videoSize.width() * 0.5;

            const qreal leadingClearance = leadingVideoIdealX - leadingSidebarWidth;
            const qreal trailingClearance = viewportSize.width() - trailingVideoIdealX - trailingSidebarWidth;
            const qreal freeWidthTotal = viewportSize.width() - videoSize.width() - leadingSidebarWidth - trailingSidebarWidth;

            if (leadingClearance >= 0 && trailingClearance >= 0) {
                leadingMargin += unusedWidth * 0.5;
                trailingMargin += unusedWidth * 0.5;
            } else if (freeWidthTotal >= 0) {
                // Enough room to move the video out from under the sidebars
                leadingMargin += leadingSidebarWidth;
                trailingMargin += trailingSidebarWidth;
                unusedWidth = unusedWidth - leadingSidebarWidth - trailingSidebarWidth;
                if (trailingClearance < 0) {
                    leadingMargin += unusedWidth;
                } else if (leadingClearance < 0) {
                    trailingMargin += unusedWidth;
                }
            } else if (leadingSidebarWidth == 0) {
                trailingMargin += unusedWidth;
            } else if (trailingSidebarWidth == 0) {
                leadingMargin += unusedWidth;
            } else {
                // Not enough room for everything: center the video between the sidebars
                const qreal midpointBetweenSidebarsX =
                    (viewportSize.width() - trailingSidebarWidth - leadingSidebarWidth) * 0.5 + leadingSidebarWidth;
                qreal leadingNeeded = midpointBetweenSidebarsX - videoSize.width() * 0.5;
                qreal trailingNeeded = viewportSize.width() - (midpointBetweenSidebarsX + videoSize.width() * 0.5);
                if (leadingNeeded < 0) {
                    trailingNeeded -= leadingNeeded;
                    leadingNeeded = 0;
                }
                if (trailingNeeded < 0) {
                    leadingNeeded -= trailingNeeded;
                    trailingNeeded = 0;
                }
                const qreal totalNeeded = leadingNeeded + trailingNeeded;
                if (totalNeeded > 0) {
                    const qreal allocationFactor = unusedWidth / totalNeeded;
                    leadingMargin += leadingNeeded * allocationFactor;
                    trailingMargin += trailingNeeded * allocationFactor;
                }
            }
        }

        leadingMargin = std::floor(leadingMargin);
        trailingMargin = std::ceil(trailingMargin);
    }

    const qreal unusedHeight = qMax(0.0, viewportSize.height() - videoSize.height());
    return BoxQuad(std::floor(unusedHeight * 0.5), trailingMargin, std::ceil(unusedHeight * 0.5), leadingMargin);
}

std::optional<QRectF> WindowGeometry::containerFrame(const ScreenInfo &screen, ScreenFitOption fitOption)
{
    switch (fitOption) {
    case ScreenFitOption::KeepInVisibleScreen:
    case ScreenFitOption::CenterInVisibleScreen:
        return screen.visibleFrame;
    case ScreenFitOption::LegacyFullScreen:
        return screen.frame;
    case ScreenFitOption::NativeFullScreen:
        return screen.frameWithoutCameraHousing();
    case ScreenFitOption::NoConstraints:
        break;
    }
    return std::nullopt;
}

QSizeF WindowGeometry::computeMaxViewportSize(const QSizeF &containerSize) const
{
    // Only the viewport changes size. Outside bars keep theirs.
    return QSizeF(containerSize.width() - m_outsideBars.totalWidth(),
                  containerSize.height() - m_outsideBars.totalHeight() - m_topMarginHeight);
}

QSizeF WindowGeometry::computeMaxVideoSize(const QSizeF &containerSize) const
{
    return fitVideoToContainer(m_videoAspect, computeMaxViewportSize(containerSize));
}

bool WindowGeometry::isViewportLocked(const GeometryContext &context, WindowMode mode, std::optional<bool> requested) const
{
    if (mode == WindowMode::MusicMode) {
        return true;
    }
    return requested.value_or(context.lockViewportToVideoSize);
}

// Transformations

WindowGeometry WindowGeometry::withChanges(const GeometryChanges &changes) const
{
    return WindowGeometry(changes.windowFrame.value_or(m_windowFrame),
                          changes.screenID.value_or(m_screenID),
                          changes.fitOption.value_or(m_fitOption),
                          changes.mode.value_or(m_mode),
                          changes.topMarginHeight.value_or(m_topMarginHeight),
                          changes.outsideBars.appliedTo(m_outsideBars),
                          changes.insideBars.appliedTo(m_insideBars),
                          changes.videoAspect.value_or(m_videoAspect),
                          changes.viewportMargins);
}

WindowGeometry WindowGeometry::scaleViewport(const GeometryContext &context, const QSizeF &desiredViewportSize) const
{
    ScaleRequest request;
    request.desiredSize = desiredViewportSize;
    return scaleViewport(context, request);
}

WindowGeometry WindowGeometry::scaleViewport(const GeometryContext &context, const ScaleRequest &request) const
{
    const WindowMode mode = request.mode.value_or(m_mode);
    const bool lockViewportToVideoSize = isViewportLocked(context, mode, request.lockViewportToVideoSize);
    // Do not center in screen again unless explicitly requested
    const ScreenFitOption newFitOption = request.fitOption.value_or(
        m_fitOption == ScreenFitOption::CenterInVisibleScreen ? ScreenFitOption::KeepInVisibleScreen : m_fitOption);
    const QString newScreenID = request.screenID.value_or(m_screenID);
    const ScreenInfo screen = context.screens.screenOrDefault(newScreenID);
    const std::optional<QRectF> container = containerFrame(screen, newFitOption);

    std::optional<QSizeF> maxViewportSize;
    if (container) {
        maxViewportSize = computeMaxViewportSize(container->size());
    }

    QSizeF newViewportSize = request.desiredSize.value_or(viewportSize());
    qCDebug(log_core_geometry) << "ScaleViewport start, desired:" << RectUtil::toString(newViewportSize)
                               << "lockViewport:" << lockViewportToVideoSize;

    // -- Viewport size

    const QSizeF minVideoSize = computeMinVideoSize(m_videoAspect, mode);
    newViewportSize = newViewportSize.expandedTo(minVideoSize);

    if (lockViewportToVideoSize) {
        // Constrain before computing the video size, then again below
        if (maxViewportSize) {
            newViewportSize = newViewportSize.boundedTo(*maxViewportSize);
        }
        newViewportSize = fitVideoToContainer(m_videoAspect, newViewportSize);
    }

    newViewportSize = newViewportSize.expandedTo(QSizeF(minViewportWidth(mode), minViewportHeight(mode)));

    if (maxViewportSize) {
        newViewportSize = newViewportSize.boundedTo(*maxViewportSize);
    }

    // -- Window size. Rounded to prevent drift from small imprecisions.

    const QSizeF newWindowSize(std::round(newViewportSize.width() + m_outsideBars.totalWidth()),
                               std::round(newViewportSize.height() + m_outsideBars.totalHeight() + m_topMarginHeight));

    // Keep the previous center
    const qreal deltaX = (newWindowSize.width() - m_windowFrame.width()) / 2;
    const qreal deltaY = (newWindowSize.height() - m_windowFrame.height()) / 2;
    const QPointF newWindowOrigin(std::round(m_windowFrame.x() - deltaX),
                                  std::round(m_windowFrame.y() - deltaY));

    QRectF newWindowFrame(newWindowOrigin, newWindowSize);
    if (container && shouldMoveWindowToKeepInContainer(newFitOption, context.moveWindowIntoVisibleScreen)) {
        newWindowFrame = RectUtil::constrain(newWindowFrame, *container);
        if (newFitOption == ScreenFitOption::CenterInVisibleScreen) {
            newWindowFrame = RectUtil::centeredRect(newWindowFrame.size(), *container);
        }
        qCDebug(log_core_geometry) << "ScaleViewport: constrained in" << RectUtil::toString(*container)
                                   << "->" << RectUtil::toString(newWindowFrame);
    }

    GeometryChanges changes;
    changes.windowFrame = newWindowFrame;
    changes.screenID = newScreenID;
    changes.fitOption = newFitOption;
    changes.mode = mode;
    return withChanges(changes);
}

WindowGeometry WindowGeometry::scaleWindow(const GeometryContext &context, const QSizeF &desiredWindowSize,
                                           std::optional<ScreenFitOption> fitOption) const
{
    ScaleRequest request;
    request.desiredSize = QSizeF(desiredWindowSize.width() - m_outsideBars.totalWidth(),
                                 desiredWindowSize.height() - m_outsideBars.totalHeight() - m_topMarginHeight);
    request.fitOption = fitOption;
    return scaleViewport(context, request);
}

WindowGeometry WindowGeometry::scaleVideo(const GeometryContext &context, const QSizeF &desiredVideoSize,
                                          const ScaleRequest &request) const
{
    const WindowMode mode = request.mode.value_or(m_mode);
    const bool lockViewportToVideoSize = isViewportLocked(context, mode, request.lockViewportToVideoSize);

    ScreenFitOption newFitOption = request.fitOption.value_or(
        m_fitOption == ScreenFitOption::CenterInVisibleScreen ? ScreenFitOption::KeepInVisibleScreen : m_fitOption);
    if (isFullScreenFit(newFitOption)) {
        qCCritical(log_core_geometry) << "ScaleVideo: invalid fit option" << ::toString(newFitOption)
                                      << "- using noConstraints";
        newFitOption = ScreenFitOption::NoConstraints;
    }
    const QString newScreenID = request.screenID.value_or(m_screenID);
    const std::optional<QRectF> container = containerFrame(context.screens.screenOrDefault(newScreenID), newFitOption);

    // Enforce the aspect by recalculating height from width
    const QSizeF minVideoSize = computeMinVideoSize(m_videoAspect, mode);
    const qreal newWidth = qMax(minVideoSize.width(), desiredVideoSize.width());
    QSizeF newVideoSize(newWidth, std::round(newWidth / m_videoAspect));

    if (container) {
        if (newVideoSize.width() > container->width()) {
            newVideoSize = QSizeF(container->width(), std::round(container->width() / m_videoAspect));
        }
        if (newVideoSize.height() > container->height()) {
            newVideoSize = QSizeF(std::round(container->height() * m_videoAspect), container->height());
        }
    }

    QSizeF newViewportSize;
    if (lockViewportToVideoSize || m_videoSize.width() <= 0) {
        newViewportSize = newVideoSize;
    } else {
        // Scale the existing viewport
        const qreal scaleRatio = newVideoSize.width() / m_videoSize.width();
        newViewportSize = viewportSize() * scaleRatio;
    }
    qCDebug(log_core_geometry) << "ScaleVideo: desired video" << RectUtil::toString(desiredVideoSize)
                               << "-> viewport" << RectUtil::toString(newViewportSize);

    ScaleRequest viewportRequest = request;
    viewportRequest.desiredSize = newViewportSize;
    viewportRequest.screenID = newScreenID;
    viewportRequest.fitOption = newFitOption;
    viewportRequest.mode = mode;
    return scaleViewport(context, viewportRequest);
}

WindowGeometry WindowGeometry::refit(const GeometryContext &context, std::optional<ScreenFitOption> fitOption) const
{
    ScaleRequest request;
    request.fitOption = fitOption;
    return scaleViewport(context, request);
}

WindowGeometry WindowGeometry::withResizedOutsideBars(const BarChanges &outsideBars) const
{
    qreal deltaW = 0;
    qreal deltaH = 0;
    qreal deltaX = 0;
    qreal deltaY = 0;

    BarChanges clamped;
    if (outsideBars.top) {
        clamped.top = nonNegative(*outsideBars.top, "outside top bar height");
        deltaH += *clamped.top - m_outsideBars.top;
    }
    if (outsideBars.trailing) {
        clamped.trailing = nonNegative(*outsideBars.trailing, "outside trailing bar width");
        deltaW += *clamped.trailing - m_outsideBars.trailing;
    }
    if (outsideBars.bottom) {
        clamped.bottom = nonNegative(*outsideBars.bottom, "outside bottom bar height");
        const qreal deltaBottom = *clamped.bottom - m_outsideBars.bottom;
        deltaH += deltaBottom;
        deltaY -= deltaBottom;
    }
    if (outsideBars.leading) {
        clamped.leading = nonNegative(*outsideBars.leading, "outside leading bar width");
        const qreal deltaLeading = *clamped.leading - m_outsideBars.leading;
        deltaW += deltaLeading;
        deltaX -= deltaLeading;
    }

    GeometryChanges changes;
    changes.windowFrame = QRectF(m_windowFrame.x() + deltaX, m_windowFrame.y() + deltaY,
                                 m_windowFrame.width() + deltaW, m_windowFrame.height() + deltaH);
    changes.outsideBars = clamped;
    return withChanges(changes);
}

WindowGeometry WindowGeometry::withResizedBars(const GeometryContext &context,
                                               const BarChanges &outsideBars, const BarChanges &insideBars,
                                               std::optional<ScreenFitOption> fitOption,
                                               std::optional<qreal> videoAspect) const
{
    GeometryChanges changes;
    changes.fitOption = fitOption;
    changes.insideBars = insideBars;
    changes.videoAspect = videoAspect;
    return withChanges(changes).withResizedOutsideBars(outsideBars).scaleViewport(context);
}

WindowGeometry WindowGeometry::apply(const GeometryDef &geometryDef, const QSizeF &desiredVideoSize,
                                     const GeometryContext &context) const
{
    const QRectF screenFrame = context.screens.screenOrDefault(m_screenID).visibleFrame;
    const QSizeF minVideoSize = computeMinVideoSize(m_videoAspect, WindowMode::Windowed);

    QSizeF newVideoSize = desiredVideoSize;
    bool widthOrHeightIsSet = false;

    // Width and height cannot both take effect. Width wins.
    if (geometryDef.width && *geometryDef.width > 0) {
        qreal width = *geometryDef.width;
        if (geometryDef.widthIsPercentage) {
            width = width * 0.01 * screenFrame.width();
        }
        width = qMax(minVideoSize.width(), width);
        newVideoSize = QSizeF(width, std::round(width / m_videoAspect));
        widthOrHeightIsSet = true;
    } else if (geometryDef.height && *geometryDef.height > 0) {
        qreal height = *geometryDef.height;
        if (geometryDef.heightIsPercentage) {
            height = height * 0.01 * screenFrame.height();
        }
        height = qMax(minVideoSize.height(), height);
        newVideoSize = QSizeF(std::round(height * m_videoAspect), height);
        widthOrHeightIsSet = true;
    }

    const QSizeF newWindowSize(newVideoSize.width() + m_outsideBars.totalWidth(),
                               newVideoSize.height() + m_outsideBars.totalHeight() + m_topMarginHeight);

    QPointF newOrigin = m_windowFrame.topLeft();
    if (geometryDef.hasPosition()) {
        newOrigin.setX(geometryDef.resolveX(screenFrame.width(), newWindowSize.width()) + screenFrame.x());
        newOrigin.setY(geometryDef.resolveY(screenFrame.height(), newWindowSize.height()) + screenFrame.y());
    } else if (widthOrHeightIsSet) {
        newOrigin = RectUtil::centeredRect(newWindowSize, screenFrame).topLeft();
    }

    QRectF newWindowFrame(newOrigin, newWindowSize);
    if (!geometryDef.hasPosition() && !widthOrHeightIsSet) {
        // The old origin may leave the resized window partly off screen
        newWindowFrame = RectUtil::constrain(newWindowFrame, screenFrame);
    }
    qCDebug(log_core_geometry) << "Applied" << geometryDef.toString() << "in screen" << RectUtil::toString(screenFrame)
                               << "->" << RectUtil::toString(newWindowFrame);
    GeometryChanges changes;
    changes.windowFrame = newWindowFrame;
    return withChanges(changes);
}

WindowGeometry WindowGeometry::cropVideo(const QSizeF &videoSizeUnscaled, const QRectF &cropbox) const
{
    if (videoSizeUnscaled.width() <= 0 || cropbox.width() <= 0 || cropbox.height() <= 0) {
        qCCritical(log_core_geometry) << "Cannot crop video: invalid size" << RectUtil::toString(videoSizeUnscaled)
                                      << "or cropbox" << RectUtil::toString(cropbox);
        return *this;
    }

    // Scale the cropbox to the current video scale
    const qreal scaleRatio = m_videoSize.width() / videoSizeUnscaled.width();
    const QRectF cropboxScaled(cropbox.x() * scaleRatio, cropbox.y() * scaleRatio,
                               cropbox.width() * scaleRatio, cropbox.height() * scaleRatio);

    if (cropboxScaled.x() > m_videoSize.width() || cropboxScaled.y() > m_videoSize.height()) {
        qCCritical(log_core_geometry) << "Cannot crop video: the cropbox is outside the video. Cropbox scaled:"
                                      << RectUtil::toString(cropboxScaled) << "video:" << RectUtil::toString(m_videoSize);
        return *this;
    }

    const qreal widthRemoved = m_videoSize.width() - cropboxScaled.width();
    const qreal heightRemoved = m_videoSize.height() - cropboxScaled.height();

    GeometryChanges changes;
    changes.windowFrame = QRectF(m_windowFrame.x() + cropboxScaled.x(), m_windowFrame.y() + cropboxScaled.y(),
                                 m_windowFrame.width() - widthRemoved, m_windowFrame.height() - heightRemoved);
    changes.videoAspect = RectUtil::aspect(cropbox.size());
    changes.fitOption = m_fitOption == ScreenFitOption::CenterInVisibleScreen ? ScreenFitOption::KeepInVisibleScreen : m_fitOption;
    qCDebug(log_core_geometry) << "Cropping from cropbox" << RectUtil::toString(cropbox) << "scaled" << scaleRatio
                               << "x ->" << RectUtil::toString(*changes.windowFrame);
    return withChanges(changes);
}

WindowGeometry WindowGeometry::uncropVideo(const GeometryContext &context, const QSizeF &videoDisplaySize,
                                           const QRectF &cropbox, qreal videoScale) const
{
    if (videoDisplaySize.height() <= 0) {
        qCCritical(log_core_geometry) << "Cannot uncrop video: invalid display size" << RectUtil::toString(videoDisplaySize);
        return *this;
    }

    const QRectF cropboxScaled(cropbox.x() * videoScale, cropbox.y() * videoScale,
                               cropbox.width() * videoScale, cropbox.height() * videoScale);
    // The part which was cropped away
    const QSizeF antiCropboxSizeScaled((videoDisplaySize.width() - cropbox.width()) * videoScale,
                                       (videoDisplaySize.height() - cropbox.height()) * videoScale);

    GeometryChanges changes;
    changes.windowFrame = QRectF(m_windowFrame.x() - cropboxScaled.x(), m_windowFrame.y() - cropboxScaled.y(),
                                 m_windowFrame.width() + antiCropboxSizeScaled.width(),
                                 m_windowFrame.height() + antiCropboxSizeScaled.height());
    changes.videoAspect = RectUtil::aspect(videoDisplaySize);
    return withChanges(changes).refit(context);
}

bool WindowGeometry::operator==(const WindowGeometry &other) const
{
    return m_windowFrame == other.m_windowFrame
        && m_screenID == other.m_screenID
        && m_fitOption == other.m_fitOption
        && m_mode == other.m_mode
        && m_topMarginHeight == other.m_topMarginHeight
        && m_outsideBars == other.m_outsideBars
        && m_insideBars == other.m_insideBars
        && m_viewportMargins == other.m_viewportMargins
        && m_videoAspect == other.m_videoAspect
        && m_videoSize == other.m_videoSize;
}

QString WindowGeometry::toString() const
{
    QString result;
    QDebug(&result).nospace() << "WindowGeometry(screenID: " << m_screenID
                              << ", mode: " << ::toString(m_mode)
                              << ", fit: " << ::toString(m_fitOption)
                              << ", topMargin: " << m_topMarginHeight
                              << ", outsideBars: " << m_outsideBars
                              << ", insideBars: " << m_insideBars
                              << ", viewportMargins: " << m_viewportMargins
                              << ", videoAspect: " << m_videoAspect
                              << ", videoSize: " << RectUtil::toString(m_videoSize)
                              << ", windowFrame: " << RectUtil::toString(m_windowFrame) << ")";
    return result;
}

QDebug operator<<(QDebug dbg, const WindowGeometry &geometry)
{
    QDebugStateSaver saver(dbg);
    dbg.noquote() << geometry.toString();
    return dbg;
}
