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
#include "transition/transitionplanner.h"

namespace {

TransitionContext makeContext(const LayoutPreferences &prefs = LayoutPreferences(),
                              const ScreenList &screens = singleScreen())
{
    TransitionContext context;
    context.prefs = prefs;
    context.screens = screens;
    context.videoAspect = ASPECT_16_9;
    context.musicModeGeometry = MusicModeGeometry::defaultGeometry(screens.screens().first(), ASPECT_16_9);
    return context;
}

LayoutState layoutFor(const TransitionContext &context, const LayoutSpec &spec)
{
    return LayoutState::fromSpec(spec, TransitionPlanner(context).layoutOptions());
}

LayoutSpec withMode(const LayoutSpec &spec, WindowMode mode, std::optional<bool> legacy = std::nullopt)
{
    LayoutSpecChanges changes;
    changes.mode = mode;
    changes.isLegacyStyle = legacy;
    return spec.withChanges(changes);
}

QStringList operationNames(const LayoutTransition &transition)
{
    QStringList names;
    for (const TransitionOperation &op : transition.operations()) {
        names << op.name();
    }
    return names;
}

std::optional<TransitionOperation> findOperation(const LayoutTransition &transition, OperationKind kind)
{
    for (const TransitionOperation &op : transition.operations()) {
        if (op.kind == kind) {
            return op;
        }
    }
    return std::nullopt;
}

} // namespace

TEST(TransitionPlannerTest, MovingTopBarOutsideWhileClosingSidebar)
{
    TransitionContext context = makeContext();
    const LayoutSpec prefsSpec = LayoutSpec::fromPreferences(context.prefs, LayoutSpec());
    LayoutSpecChanges open;
    open.leadingSidebar = prefsSpec.leadingSidebar().withVisibleTab(SidebarTab(SidebarTab::Video));
    const LayoutSpec inputSpec = prefsSpec.withChanges(open);
    const LayoutState inputLayout = layoutFor(context, inputSpec);
    context.windowedModeGeometry = inputLayout.buildGeometry(QRectF(100, 100, 1280, 720), "main", ASPECT_16_9);

    LayoutSpecChanges changes;
    changes.topBarPlacement = PanelPlacement::OutsideViewport;
    changes.leadingSidebar = inputSpec.leadingSidebar().hidden();
    const LayoutSpec outputSpec = inputSpec.withChanges(changes);

    const LayoutTransition transition = TransitionPlanner(context).build("UpdateLayout", inputLayout, outputSpec);

    EXPECT_EQ(transition.inputGeometry().insideBars(), BoxQuad(28, 0, 0, 360));
    EXPECT_EQ(transition.outputGeometry().outsideBars(), BoxQuad(28, 0, 0, 0));
    EXPECT_EQ(transition.outputGeometry().insideBars(), BoxQuad());
    EXPECT_EQ(transition.outputGeometry().windowFrame(), QRectF(100, 100, 1280, 748));

    // Closes everything which moves before reopening it on the other side
    ASSERT_TRUE(transition.middleGeometry().has_value());
    const WindowGeometry &middle = *transition.middleGeometry();
    EXPECT_EQ(middle.insideBars().leading, 0);
    EXPECT_EQ(middle.outsideBars().leading, 0);
    EXPECT_EQ(middle.insideBars().top, 0);
    EXPECT_EQ(middle.outsideBars().top, 0);
    EXPECT_EQ(middle.windowFrame(), QRectF(100, 100, 1280, 720));

    const QStringList expected = {"PreTransition", "ShowFadeableViews", "FadeOutOldViews", "CloseOldPanels",
                                  "UpdateHiddenViewsAndConstraints", "OpenNewPanels", "FadeInNewViews",
                                  "PostTransition"};
    EXPECT_EQ(operationNames(transition), expected);

    const std::optional<TransitionOperation> close = findOperation(transition, OperationKind::CloseOldPanels);
    ASSERT_TRUE(close.has_value());
    EXPECT_EQ(close->timing, TimingCurve::EaseIn);
    EXPECT_DOUBLE_EQ(close->duration, 0.25);
    ASSERT_TRUE(close->geometry.has_value());
    EXPECT_EQ(*close->geometry, middle);

    const std::optional<TransitionOperation> openPanels = findOperation(transition, OperationKind::OpenNewPanels);
    ASSERT_TRUE(openPanels.has_value());
    ASSERT_TRUE(openPanels->geometry.has_value());
    EXPECT_EQ(*openPanels->geometry, transition.outputGeometry());
}

TEST(TransitionPlannerTest, SameSpecRunsInstantly)
{
    TransitionContext context = makeContext();
    const LayoutSpec spec = LayoutSpec::fromPreferences(context.prefs, LayoutSpec());
    const LayoutState layout = layoutFor(context, spec);
    context.windowedModeGeometry = layout.buildGeometry(QRectF(100, 100, 640, 360), "main", ASPECT_16_9);

    const LayoutTransition transition = TransitionPlanner(context).build("Refresh", layout, spec);
    EXPECT_EQ(transition.totalDuration(), 0);
    EXPECT_TRUE(transition.isEffectivelyNoOp());
    EXPECT_FALSE(findOperation(transition, OperationKind::CloseOldPanels).has_value());
    EXPECT_FALSE(findOperation(transition, OperationKind::FadeOutOldViews).has_value());
}

TEST(TransitionPlannerTest, EnteringNativeFullScreen)
{
    TransitionContext context = makeContext();
    const LayoutSpec spec = LayoutSpec::fromPreferences(context.prefs, LayoutSpec());
    const LayoutState layout = layoutFor(context, spec);
    context.windowedModeGeometry = layout.buildGeometry(QRectF(100, 100, 640, 360), "main", ASPECT_16_9);

    const LayoutTransition transition = TransitionPlanner(context).build(
        "EnterFullScreen", layout, withMode(spec, WindowMode::FullScreen));

    EXPECT_TRUE(transition.isEnteringNativeFullScreen());
    EXPECT_FALSE(transition.middleGeometry().has_value());
    EXPECT_FALSE(findOperation(transition, OperationKind::CloseOldPanels).has_value());
    EXPECT_FALSE(findOperation(transition, OperationKind::FadeInNewViews).has_value());
    EXPECT_FALSE(findOperation(transition, OperationKind::SuspendVideo).has_value());

    const std::optional<TransitionOperation> show = findOperation(transition, OperationKind::ShowFadeableViews);
    ASSERT_TRUE(show.has_value());
    EXPECT_EQ(show->duration, 0);

    const std::optional<TransitionOperation> openPanels = findOperation(transition, OperationKind::OpenNewPanels);
    ASSERT_TRUE(openPanels.has_value());
    EXPECT_EQ(openPanels->timing, TimingCurve::EaseInEaseOut);
    ASSERT_TRUE(openPanels->geometry.has_value());
    EXPECT_EQ(openPanels->geometry->windowFrame(), mainScreen().frame);
    EXPECT_EQ(openPanels->geometry->fitOption(), ScreenFitOption::NativeFullScreen);
}

TEST(TransitionPlannerTest, EnteringLegacyFullScreenCoversCameraHousingLast)
{
    LayoutPreferences prefs;
    prefs.useLegacyFullScreen = true;
    TransitionContext context = makeContext(prefs, singleScreen(notchedScreen()));
    const LayoutSpec spec = LayoutSpec::fromPreferences(prefs, LayoutSpec());
    const LayoutState layout = layoutFor(context, spec);
    context.windowedModeGeometry = layout.buildGeometry(QRectF(100, 100, 800, 450), "notch", ASPECT_16_9);

    const LayoutSpec fullScreenSpec = LayoutSpec::fromPreferences(prefs, spec, WindowMode::FullScreen);
    ASSERT_TRUE(fullScreenSpec.isLegacyFullScreen());
    const LayoutTransition transition = TransitionPlanner(context).build("EnterFullScreen", layout, fullScreenSpec);

    EXPECT_TRUE(findOperation(transition, OperationKind::SuspendVideo).has_value());
    EXPECT_TRUE(findOperation(transition, OperationKind::ResumeVideo).has_value());
    EXPECT_EQ(transition.outputLayout().cameraHousingOffset(), 32);

    const std::optional<TransitionOperation> openPanels = findOperation(transition, OperationKind::OpenNewPanels);
    ASSERT_TRUE(openPanels.has_value());
    EXPECT_DOUBLE_EQ(openPanels->duration, 0.2);
    ASSERT_TRUE(openPanels->geometry.has_value());
    EXPECT_EQ(openPanels->geometry->windowFrame(), QRectF(0, 0, 1512, 950));
    EXPECT_EQ(openPanels->geometry->topMarginHeight(), 0);

    const QList<TransitionOperation> &ops = transition.operations();
    ASSERT_GE(ops.size(), 2);
    const TransitionOperation &cover = ops.at(ops.size() - 2);
    EXPECT_EQ(cover.kind, OperationKind::EnterLegacyFullScreenCoverCameraHousing);
    EXPECT_DOUBLE_EQ(cover.duration, 0.05);
    EXPECT_EQ(cover.timing, TimingCurve::EaseIn);
    ASSERT_TRUE(cover.geometry.has_value());
    EXPECT_EQ(cover.geometry->windowFrame(), QRectF(0, 0, 1512, 982));
    EXPECT_EQ(cover.geometry->topMarginHeight(), 32);
    EXPECT_EQ(ops.last().kind, OperationKind::PostTransition);
}

TEST(TransitionPlannerTest, ExitingLegacyFullScreenUncoversBeforeClosingPanels)
{
    LayoutPreferences prefs;
    prefs.useLegacyFullScreen = true;
    TransitionContext context = makeContext(prefs, singleScreen(notchedScreen()));
    const LayoutSpec windowedSpec = LayoutSpec::fromPreferences(prefs, LayoutSpec());
    context.windowedModeGeometry = layoutFor(context, windowedSpec)
                                       .buildGeometry(QRectF(100, 100, 800, 450), "notch", ASPECT_16_9);

    const LayoutState fullScreenLayout = layoutFor(context, LayoutSpec::fromPreferences(prefs, windowedSpec,
                                                                                        WindowMode::FullScreen));
    const LayoutTransition transition = TransitionPlanner(context).build("ExitFullScreen", fullScreenLayout,
                                                                         windowedSpec);

    EXPECT_TRUE(transition.isExitingLegacyFullScreen());
    const QStringList names = operationNames(transition);
    const int uncoverIndex = names.indexOf("ExitLegacyFullScreenUncoverCameraHousing");
    const int closeIndex = names.indexOf("CloseOldPanels");
    ASSERT_GE(uncoverIndex, 0);
    ASSERT_GE(closeIndex, 0);
    EXPECT_LT(uncoverIndex, closeIndex);

    const TransitionOperation &uncover = transition.operations().at(uncoverIndex);
    EXPECT_DOUBLE_EQ(uncover.duration, 0.05);
    ASSERT_TRUE(uncover.geometry.has_value());
    EXPECT_EQ(uncover.geometry->windowFrame(), QRectF(0, 0, 1512, 950));
    EXPECT_EQ(uncover.geometry->topMarginHeight(), 0);

    EXPECT_EQ(transition.outputGeometry(), context.windowedModeGeometry.withResizedBars(
        context.geometryContext(), BarChanges::from(transition.outputLayout().outsideBars()),
        BarChanges::from(transition.outputLayout().insideBars()), std::nullopt, ASPECT_16_9));
}

TEST(TransitionPlannerTest, EnteringMusicMode)
{
    TransitionContext context = makeContext();
    const LayoutSpec spec = LayoutSpec::fromPreferences(context.prefs, LayoutSpec());
    const LayoutState layout = layoutFor(context, spec);
    context.windowedModeGeometry = layout.buildGeometry(QRectF(400, 400, 640, 360), "main", ASPECT_16_9);

    const LayoutTransition transition = TransitionPlanner(context).build(
        "EnterMusicMode", layout, withMode(spec, WindowMode::MusicMode));

    EXPECT_EQ(transition.outputGeometry().outsideBars().bottom, MusicModeConst::OSC_HEIGHT);
    EXPECT_EQ(transition.outputGeometry().mode(), WindowMode::MusicMode);

    ASSERT_TRUE(transition.middleGeometry().has_value());
    EXPECT_EQ(transition.middleGeometry()->insideBars(), BoxQuad());
    EXPECT_EQ(transition.middleGeometry()->outsideBars(), BoxQuad());

    const std::optional<TransitionOperation> show = findOperation(transition, OperationKind::ShowFadeableViews);
    ASSERT_TRUE(show.has_value());
    EXPECT_DOUBLE_EQ(show->duration, 0.075);

    const std::optional<TransitionOperation> move = findOperation(transition, OperationKind::MoveWindowForMusicMode);
    ASSERT_TRUE(move.has_value());
    EXPECT_DOUBLE_EQ(move->duration, 0.25);
    EXPECT_EQ(move->timing, TimingCurve::EaseInEaseOut);
    ASSERT_TRUE(move->geometry.has_value());
    EXPECT_EQ(*move->geometry, transition.outputGeometry());
}

TEST(TransitionPlannerTest, ExitingMusicModeShowsNoFade)
{
    TransitionContext context = makeContext();
    const LayoutSpec spec = LayoutSpec::fromPreferences(context.prefs, LayoutSpec());
    context.windowedModeGeometry = layoutFor(context, spec)
                                       .buildGeometry(QRectF(400, 400, 640, 360), "main", ASPECT_16_9);
    const LayoutState musicLayout = layoutFor(context, withMode(spec, WindowMode::MusicMode));

    const LayoutTransition transition = TransitionPlanner(context).build("ExitMusicMode", musicLayout, spec);

    EXPECT_TRUE(transition.isExitingMusicMode());
    const std::optional<TransitionOperation> show = findOperation(transition, OperationKind::ShowFadeableViews);
    const std::optional<TransitionOperation> fadeOut = findOperation(transition, OperationKind::FadeOutOldViews);
    ASSERT_TRUE(show.has_value());
    ASSERT_TRUE(fadeOut.has_value());
    EXPECT_EQ(show->duration, 0);
    EXPECT_EQ(fadeOut->duration, 0);
    EXPECT_FALSE(findOperation(transition, OperationKind::MoveWindowForMusicMode).has_value());

    // Only the control bar closes on the way out
    ASSERT_TRUE(transition.middleGeometry().has_value());
    EXPECT_EQ(transition.middleGeometry()->outsideBars().bottom, 0);
}

TEST(TransitionPlannerTest, InitialLayoutHasNoMiddleGeometry)
{
    TransitionContext context = makeContext();
    const LayoutSpec spec = LayoutSpec::fromPreferences(context.prefs, LayoutSpec());
    context.windowedModeGeometry = plainGeometry(QRectF(100, 100, 640, 360));

    const LayoutTransition transition = TransitionPlanner(context).build("InitialLayout", LayoutState(), spec, true);
    EXPECT_TRUE(transition.isInitialLayout());
    EXPECT_FALSE(transition.middleGeometry().has_value());
    EXPECT_FALSE(transition.isEffectivelyNoOp());
    EXPECT_EQ(operationNames(transition).first(), QStringLiteral("PreTransition"));
    EXPECT_EQ(operationNames(transition).last(), QStringLiteral("PostTransition"));
}

TEST(TransitionPlannerTest, ClosingOutsideSidebarRestoresIntendedViewport)
{
    LayoutPreferences prefs;
    prefs.trailingSidebarPlacement = PanelPlacement::OutsideViewport;
    TransitionContext context = makeContext(prefs);
    const LayoutSpec closedSpec = LayoutSpec::fromPreferences(prefs, LayoutSpec());
    LayoutSpecChanges open;
    open.trailingSidebar = closedSpec.trailingSidebar().withVisibleTab(SidebarTab(SidebarTab::Playlist));
    const LayoutSpec openSpec = closedSpec.withChanges(open);
    const LayoutState openLayout = layoutFor(context, openSpec);

    // Window had to shrink to make room for the 270 wide playlist
    context.windowedModeGeometry = openLayout.buildGeometry(QRectF(100, 100, 970, 394), "main", ASPECT_16_9);
    ASSERT_EQ(context.windowedModeGeometry.viewportSize(), QSizeF(700, 394));
    context.intendedViewportSize = IntendedViewportSize{QSizeF(800, 450), ASPECT_16_9};

    const LayoutTransition transition = TransitionPlanner(context).build("HideSidebar", openLayout, closedSpec);
    EXPECT_EQ(transition.outputGeometry().outsideBars().trailing, 0);
    EXPECT_EQ(transition.outputGeometry().viewportSize(), QSizeF(800, 450));

    // A different video invalidates the recorded size
    context.intendedViewportSize = IntendedViewportSize{QSizeF(800, 450), 4.0 / 3.0};
    const LayoutTransition other = TransitionPlanner(context).build("HideSidebar", openLayout, closedSpec);
    EXPECT_EQ(other.outputGeometry().viewportSize(), QSizeF(700, 394));
}

TEST(TransitionPlannerTest, NarrowingSidebarShrinksInMiddleStep)
{
    LayoutPreferences prefs;
    prefs.trailingSidebarPlacement = PanelPlacement::OutsideViewport;
    prefs.playlistWidth = 400;
    TransitionContext context = makeContext(prefs);
    LayoutSpecChanges open;
    open.trailingSidebar = LayoutSpec::fromPreferences(prefs, LayoutSpec()).trailingSidebar()
        .withVisibleTab(SidebarTab(SidebarTab::Playlist));
    const LayoutSpec wideSpec = LayoutSpec::fromPreferences(prefs, LayoutSpec()).withChanges(open);
    const LayoutState wideLayout = layoutFor(context, wideSpec);
    ASSERT_EQ(wideLayout.outsideBars().trailing, 400);

    context.windowedModeGeometry = wideLayout.buildGeometry(QRectF(100, 100, 1200, 450), "main", ASPECT_16_9);
    ASSERT_EQ(context.windowedModeGeometry.viewportSize(), QSizeF(800, 450));

    LayoutSpecChanges narrow;
    narrow.trailingSidebar = wideSpec.trailingSidebar().withPlaylistWidth(300);
    const LayoutSpec narrowSpec = wideSpec.withChanges(narrow);

    const LayoutTransition transition = TransitionPlanner(context).build("ApplyPreferences", wideLayout, narrowSpec);
    EXPECT_FALSE(transition.isHidingTrailingSidebar());
    EXPECT_EQ(transition.outputGeometry().outsideBars().trailing, 300);

    ASSERT_TRUE(transition.middleGeometry().has_value());
    const WindowGeometry &middle = *transition.middleGeometry();
    EXPECT_EQ(middle.outsideBars().trailing, 300);
    EXPECT_EQ(middle.windowFrame().width(), transition.outputGeometry().windowFrame().width());

    // Widening keeps the narrower width until the panels open
    context.windowedModeGeometry = transition.outputGeometry();
    const LayoutTransition widen = TransitionPlanner(context).build("ApplyPreferences", transition.outputLayout(), wideSpec);
    ASSERT_TRUE(widen.middleGeometry().has_value());
    EXPECT_EQ(widen.middleGeometry()->outsideBars().trailing, 300);
    EXPECT_EQ(widen.outputGeometry().outsideBars().trailing, 400);
}
