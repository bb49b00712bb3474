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

#include "testutil.h"
#include "geometry/windowgeometry.h"
#include "geometry/geometrydef.h"

#include <cmath>

// Construction and derived values

TEST(WindowGeometryTest, OutsideBottomBarShrinksVideo)
{
    const WindowGeometry noBars = plainGeometry(QRectF(100, 100, 1280, 720));
    EXPECT_EQ(noBars.videoSize(), QSizeF(1280, 720));

    const WindowGeometry withBar(QRectF(100, 100, 1280, 720), "main", ScreenFitOption::KeepInVisibleScreen,
                                 WindowMode::Windowed, 0, BoxQuad(0, 0, 40, 0), BoxQuad(), ASPECT_16_9);
    EXPECT_EQ(withBar.viewportSize(), QSizeF(1280, 680));
    EXPECT_EQ(withBar.videoSize(), QSizeF(1209, 680));
    // 71 spare columns, split with the extra one on the trailing side
    EXPECT_EQ(withBar.viewportMargins(), BoxQuad(0, 36, 0, 35));
}

TEST(WindowGeometryTest, NegativeBarsAndAspectAreReplaced)
{
    const WindowGeometry geometry(QRectF(0, 0, 640, 360), "main", ScreenFitOption::NoConstraints,
                                  WindowMode::Windowed, -5, BoxQuad(-1, 0, -2, 0), BoxQuad(0, -3, 0, 0), -1);
    EXPECT_EQ(geometry.topMarginHeight(), 0);
    EXPECT_EQ(geometry.outsideBars(), BoxQuad());
    EXPECT_EQ(geometry.insideBars(), BoxQuad());
    EXPECT_DOUBLE_EQ(geometry.videoAspect(), WIDTH_WHEN_NO_VIDEO / HEIGHT_WHEN_NO_VIDEO);
}

TEST(WindowGeometryTest, FitVideoToContainer)
{
    EXPECT_EQ(WindowGeometry::fitVideoToContainer(ASPECT_16_9, QSizeF(0, 100)), QSizeF(0, 0));
    EXPECT_EQ(WindowGeometry::fitVideoToContainer(4.0 / 3.0, QSizeF(1920, 1080)), QSizeF(1440, 1080));
    EXPECT_EQ(WindowGeometry::fitVideoToContainer(2.0, QSizeF(1000, 1000)), QSizeF(1000, 500));
    EXPECT_EQ(WindowGeometry::fitVideoToContainer(2.0, QSizeF(1000, 1000), BoxQuad(0, 100, 0, 100)), QSizeF(800, 400));
}

TEST(WindowGeometryTest, MinVideoSize)
{
    EXPECT_EQ(WindowGeometry::computeMinVideoSize(ASPECT_16_9, WindowMode::Windowed), QSizeF(285, 160));
    // Very wide video is limited by the minimum height instead
    EXPECT_EQ(WindowGeometry::computeMinVideoSize(4.0, WindowMode::Windowed), QSizeF(480, 120));
    EXPECT_EQ(WindowGeometry::computeMinVideoSize(ASPECT_16_9, WindowMode::MusicMode), QSizeF(260, 146));
}

TEST(WindowGeometryTest, MinWindowSizeLeavesRoomBetweenInsideSidebars)
{
    const WindowGeometry geometry(QRectF(0, 0, 1280, 720), "main", ScreenFitOption::KeepInVisibleScreen,
                                  WindowMode::Windowed, 0, BoxQuad(0, 0, 44, 0), BoxQuad(0, 270, 0, 360), ASPECT_16_9);
    EXPECT_EQ(geometry.minViewportWidth(WindowMode::Windowed), 850);
    EXPECT_EQ(geometry.minWindowWidth(WindowMode::Windowed), 850);
    EXPECT_EQ(geometry.minWindowHeight(WindowMode::Windowed), 164);
}

TEST(WindowGeometryTest, VideoMovesOutFromUnderInsideSidebar)
{
    // Room for the video beside a 360 wide leading sidebar
    const WindowGeometry geometry(QRectF(0, 0, 1400, 450), "main", ScreenFitOption::NoConstraints,
                                  WindowMode::Windowed, 0, BoxQuad(), BoxQuad(0, 0, 0, 360), ASPECT_16_9,
                                  std::nullopt);
    EXPECT_EQ(geometry.videoSize(), QSizeF(800, 450));
    EXPECT_GE(geometry.viewportMargins().leading, 360);
    EXPECT_EQ(geometry.viewportMargins().leading + geometry.viewportMargins().trailing, 600);
}

// Scaling

TEST(WindowGeometryTest, ScaleViewportClampsToMinimum)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 640, 360));
    const WindowGeometry scaled = geometry.scaleViewport(geometryContext(), QSizeF(50, 50));
    EXPECT_EQ(scaled.viewportSize(), QSizeF(285, 160));
    EXPECT_EQ(scaled.videoSize(), QSizeF(285, 160));
    // Center is kept, origin rounded
    EXPECT_EQ(scaled.windowFrame(), QRectF(278, 200, 285, 160));
}

TEST(WindowGeometryTest, ScaleViewportStaysInVisibleScreen)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 640, 360));
    const WindowGeometry scaled = geometry.scaleViewport(geometryContext(), QSizeF(4000, 4000));
    EXPECT_EQ(scaled.viewportSize(), QSizeF(1876, 1055));
    EXPECT_TRUE(mainScreen().visibleFrame.contains(scaled.windowFrame()));
}

TEST(WindowGeometryTest, ScaleViewportUnlockedKeepsEmptySpace)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 640, 360), ASPECT_16_9, ScreenFitOption::NoConstraints);
    ScaleRequest request;
    request.desiredSize = QSizeF(1000, 400);
    request.lockViewportToVideoSize = false;
    const WindowGeometry scaled = geometry.scaleViewport(geometryContext(), request);
    EXPECT_EQ(scaled.viewportSize(), QSizeF(1000, 400));
    EXPECT_EQ(scaled.videoSize(), QSizeF(711, 400));
    EXPECT_EQ(scaled.viewportMargins(), BoxQuad(0, 145, 0, 144));
}

TEST(WindowGeometryTest, CenterInScreenIsNotRepeated)
{
    const WindowGeometry geometry = plainGeometry(QRectF(0, 0, 640, 360), ASPECT_16_9, ScreenFitOption::CenterInVisibleScreen);
    const WindowGeometry refitted = geometry.refit(geometryContext());
    EXPECT_EQ(refitted.fitOption(), ScreenFitOption::KeepInVisibleScreen);

    ScaleRequest request;
    request.fitOption = ScreenFitOption::CenterInVisibleScreen;
    const WindowGeometry centered = geometry.scaleViewport(geometryContext(), request);
    EXPECT_EQ(centered.windowFrame(), QRectF(640, 347.5, 640, 360));
}

TEST(WindowGeometryTest, ScaleVideoLockedResizesViewportToVideo)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 640, 360));
    const WindowGeometry scaled = geometry.scaleVideo(geometryContext(), QSizeF(1280, 720));
    EXPECT_EQ(scaled.videoSize(), QSizeF(1280, 720));
    EXPECT_EQ(scaled.windowFrame(), QRectF(0, 0, 1280, 720));
}

TEST(WindowGeometryTest, ScaleVideoUnlockedScalesViewport)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 800, 360), ASPECT_16_9, ScreenFitOption::NoConstraints);
    ASSERT_EQ(geometry.videoSize(), QSizeF(640, 360));

    ScaleRequest request;
    request.lockViewportToVideoSize = false;
    const WindowGeometry scaled = geometry.scaleVideo(geometryContext(), QSizeF(1280, 720), request);
    EXPECT_EQ(scaled.viewportSize(), QSizeF(1600, 720));
    EXPECT_EQ(scaled.videoSize(), QSizeF(1280, 720));
}

TEST(WindowGeometryTest, ScaleVideoRejectsFullScreenFit)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 640, 360));
    ScaleRequest request;
    request.fitOption = ScreenFitOption::LegacyFullScreen;
    const WindowGeometry scaled = geometry.scaleVideo(geometryContext(), QSizeF(800, 450), request);
    EXPECT_EQ(scaled.fitOption(), ScreenFitOption::NoConstraints);
    EXPECT_EQ(scaled.videoSize(), QSizeF(800, 450));
}

// Bars

TEST(WindowGeometryTest, OutsideBarsKeepOppositeEdges)
{
    const WindowGeometry geometry = plainGeometry(QRectF(200, 200, 800, 450));

    BarChanges topAndTrailing;
    topAndTrailing.top = 30;
    topAndTrailing.trailing = 50;
    const WindowGeometry grown = geometry.withResizedOutsideBars(topAndTrailing);
    EXPECT_EQ(grown.windowFrame(), QRectF(200, 200, 850, 480));
    EXPECT_EQ(grown.videoSize(), geometry.videoSize());

    BarChanges bottomAndLeading;
    bottomAndLeading.bottom = 40;
    bottomAndLeading.leading = 100;
    const WindowGeometry shifted = geometry.withResizedOutsideBars(bottomAndLeading);
    EXPECT_EQ(shifted.windowFrame(), QRectF(100, 160, 900, 490));
    EXPECT_EQ(shifted.viewportFrameInScreen(), QRectF(200, 200, 800, 450));
}

TEST(WindowGeometryTest, ClosingOutsideBarsRestoresFrame)
{
    const WindowGeometry geometry = plainGeometry(QRectF(200, 200, 800, 450));

    BarChanges open;
    open.bottom = 40;
    open.leading = 100;
    BarChanges close;
    close.bottom = 0;
    close.leading = 0;
    EXPECT_EQ(geometry.withResizedOutsideBars(open).withResizedOutsideBars(close), geometry);
}

TEST(WindowGeometryTest, ResizedBarsRescaleViewport)
{
    const WindowGeometry geometry = plainGeometry(QRectF(400, 400, 640, 360));
    BarChanges outside;
    outside.bottom = 44;
    const WindowGeometry resized = geometry.withResizedBars(geometryContext(), outside, BarChanges());
    EXPECT_EQ(resized.viewportSize(), QSizeF(640, 360));
    EXPECT_EQ(resized.windowFrame(), QRectF(400, 356, 640, 404));
}

// Full screen

TEST(WindowGeometryTest, LegacyFullScreenCoversCameraHousing)
{
    const ScreenInfo screen = notchedScreen();
    const WindowGeometry legacy = WindowGeometry::forFullScreen(screen, true, WindowMode::FullScreen,
                                                                BoxQuad(), BoxQuad(), ASPECT_16_9, false);
    EXPECT_EQ(legacy.topMarginHeight(), 32);
    EXPECT_EQ(legacy.windowFrame(), screen.frame);
    EXPECT_EQ(legacy.fitOption(), ScreenFitOption::LegacyFullScreen);
    EXPECT_EQ(legacy.viewportSize(), QSizeF(1512, 950));

    const WindowGeometry overlapping = WindowGeometry::forFullScreen(screen, true, WindowMode::FullScreen,
                                                                     BoxQuad(), BoxQuad(), ASPECT_16_9, true);
    EXPECT_EQ(overlapping.topMarginHeight(), 0);
}

TEST(WindowGeometryTest, NativeFullScreenAvoidsCameraHousing)
{
    const ScreenInfo screen = notchedScreen();
    const WindowGeometry native = WindowGeometry::forFullScreen(screen, false, WindowMode::FullScreen,
                                                                BoxQuad(), BoxQuad(), ASPECT_16_9, false);
    EXPECT_EQ(native.topMarginHeight(), 0);
    EXPECT_EQ(native.windowFrame(), QRectF(0, 0, 1512, 950));
    EXPECT_EQ(native.fitOption(), ScreenFitOption::NativeFullScreen);
}

// Geometry directives

TEST(WindowGeometryTest, ApplyPercentageWidthCentersWindow)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 640, 360));
    const std::optional<GeometryDef> def = GeometryDef::parse("50%");
    ASSERT_TRUE(def.has_value());
    const WindowGeometry applied = geometry.apply(*def, QSizeF(640, 360), geometryContext());
    EXPECT_EQ(applied.windowFrame(), QRectF(480, 257.5, 960, 540));
}

TEST(WindowGeometryTest, ApplyPositionFromEitherEdge)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 640, 360));

    const std::optional<GeometryDef> fromOrigin = GeometryDef::parse("+0+0");
    ASSERT_TRUE(fromOrigin.has_value());
    EXPECT_EQ(geometry.apply(*fromOrigin, QSizeF(640, 360), geometryContext()).windowFrame(), QRectF(0, 0, 640, 360));

    const std::optional<GeometryDef> fromFarEdges = GeometryDef::parse("-0-0");
    ASSERT_TRUE(fromFarEdges.has_value());
    EXPECT_EQ(geometry.apply(*fromFarEdges, QSizeF(640, 360), geometryContext()).windowFrame(),
              QRectF(1280, 695, 640, 360));
}

TEST(WindowGeometryTest, ApplyWithoutSizeOrPositionKeepsWindowOnScreen)
{
    const WindowGeometry geometry = plainGeometry(QRectF(1500, 900, 320, 180));
    const WindowGeometry applied = geometry.apply(GeometryDef(), QSizeF(640, 360), geometryContext());
    EXPECT_EQ(applied.windowFrame(), QRectF(1280, 695, 640, 360));

    // Already on screen: origin is kept
    const WindowGeometry onScreen = plainGeometry(QRectF(100, 100, 320, 180));
    EXPECT_EQ(onScreen.apply(GeometryDef(), QSizeF(640, 360), geometryContext()).windowFrame(),
              QRectF(100, 100, 640, 360));
}

TEST(WindowGeometryTest, ApplyClampsToMinimumWidth)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 640, 360));
    const std::optional<GeometryDef> def = GeometryDef::parse("200");
    ASSERT_TRUE(def.has_value());
    const WindowGeometry applied = geometry.apply(*def, QSizeF(640, 360), geometryContext());
    EXPECT_EQ(applied.windowFrame().size(), QSizeF(285, 160));
}

// Cropping

TEST(WindowGeometryTest, CropAndUncrop)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 1280, 720));
    const QSizeF videoSize(1920, 1080);
    const QRectF cropbox(0, 0, 1080, 1080);

    const WindowGeometry cropped = geometry.cropVideo(videoSize, cropbox);
    EXPECT_EQ(cropped.windowFrame(), QRectF(100, 100, 720, 720));
    EXPECT_DOUBLE_EQ(cropped.videoAspect(), 1.0);
    EXPECT_EQ(cropped.videoSize(), QSizeF(720, 720));

    const WindowGeometry uncropped = cropped.uncropVideo(geometryContext(), videoSize, cropbox, 1280.0 / 1920.0);
    EXPECT_EQ(uncropped.windowFrame(), QRectF(100, 100, 1280, 720));
    EXPECT_TRUE(RectUtil::isSameAspect(uncropped.videoAspect(), ASPECT_16_9));
}

TEST(WindowGeometryTest, CropOutsideVideoIsIgnored)
{
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 1280, 720));
    EXPECT_EQ(geometry.cropVideo(QSizeF(1920, 1080), QRectF(5000, 0, 100, 100)), geometry);
    EXPECT_EQ(geometry.cropVideo(QSizeF(0, 0), QRectF(0, 0, 100, 100)), geometry);
}

// Properties over a range of aspects and sizes

namespace {

struct FitCase
{
    qreal aspect;
    QSizeF container;
};

class FitVideoToContainerTest : public ::testing::TestWithParam<FitCase>
{
};

} // namespace

TEST_P(FitVideoToContainerTest, KeepsAspectInsideContainer)
{
    const FitCase param = GetParam();
    const QSizeF fitted = WindowGeometry::fitVideoToContainer(param.aspect, param.container);

    EXPECT_LE(fitted.width(), param.container.width());
    EXPECT_LE(fitted.height(), param.container.height());
    if (param.container.isEmpty()) {
        EXPECT_EQ(fitted, QSizeF(0, 0));
        return;
    }

    // One side fills the container, the other is within a rounding step of the aspect
    EXPECT_TRUE(fitted.width() == param.container.width() || fitted.height() == param.container.height());
    const bool heightFromWidth = std::abs(fitted.height() - fitted.width() / param.aspect) <= 1;
    const bool widthFromHeight = std::abs(fitted.width() - fitted.height() * param.aspect) <= 1;
    EXPECT_TRUE(heightFromWidth || widthFromHeight) << RectUtil::toString(fitted).toStdString();
}

INSTANTIATE_TEST_SUITE_P(
    Aspects,
    FitVideoToContainerTest,
    ::testing::Values(FitCase{ASPECT_16_9, QSizeF(1920, 1080)},
                      FitCase{ASPECT_16_9, QSizeF(1000, 1000)},
                      FitCase{2.39, QSizeF(1280, 720)},
                      FitCase{9.0 / 16.0, QSizeF(1920, 1080)},
                      FitCase{9.0 / 16.0, QSizeF(333, 777)},
                      FitCase{1.0, QSizeF(640, 480)},
                      FitCase{1.0, QSizeF(301, 1200)},
                      FitCase{4.0 / 3.0, QSizeF(0, 0)},
                      FitCase{ASPECT_16_9, QSizeF(0, 500)}));

namespace {

struct ScaleVideoCase
{
    qreal aspect;
    QSizeF desiredVideoSize;
};

class ScaleVideoMinimumTest : public ::testing::TestWithParam<ScaleVideoCase>
{
};

} // namespace

TEST_P(ScaleVideoMinimumTest, ViewportIsNeverBelowMinimum)
{
    const ScaleVideoCase param = GetParam();
    const WindowGeometry geometry = plainGeometry(QRectF(100, 100, 320, std::round(320 / param.aspect)), param.aspect);
    const WindowGeometry scaled = geometry.scaleVideo(geometryContext(), param.desiredVideoSize);

    EXPECT_GE(scaled.viewportSize().width(), scaled.minViewportWidth(WindowMode::Windowed));
    EXPECT_GE(scaled.viewportSize().height(), scaled.minViewportHeight(WindowMode::Windowed));
    EXPECT_LE(scaled.videoSize().width(), scaled.viewportSize().width());
    EXPECT_LE(scaled.videoSize().height(), scaled.viewportSize().height());
    EXPECT_TRUE(mainScreen().visibleFrame.contains(scaled.windowFrame()));
}

INSTANTIATE_TEST_SUITE_P(
    DesiredSizes,
    ScaleVideoMinimumTest,
    ::testing::Values(ScaleVideoCase{ASPECT_16_9, QSizeF(0, 0)},
                      ScaleVideoCase{ASPECT_16_9, QSizeF(10, 6)},
                      ScaleVideoCase{ASPECT_16_9, QSizeF(4000, 2250)},
                      ScaleVideoCase{9.0 / 16.0, QSizeF(50, 89)},
                      ScaleVideoCase{4.0, QSizeF(100, 25)},
                      ScaleVideoCase{1.0, QSizeF(120, 120)}));

TEST(WindowGeometryTest, EmptyChangesGiveEqualGeometry)
{
    const QList<WindowGeometry> geometries = {
        plainGeometry(QRectF(100, 100, 1280, 720)),
        WindowGeometry(QRectF(0, 0, 1280, 764), "main", ScreenFitOption::KeepInVisibleScreen,
                       WindowMode::Windowed, 0, BoxQuad(0, 0, 44, 0), BoxQuad(0, 270, 0, 0), ASPECT_16_9),
        WindowGeometry::forFullScreen(notchedScreen(), true, WindowMode::FullScreen, BoxQuad(), BoxQuad(), 4.0 / 3.0, false),
    };
    for (const WindowGeometry &geometry : geometries) {
        EXPECT_EQ(geometry.withChanges(GeometryChanges()), geometry);
    }
}
