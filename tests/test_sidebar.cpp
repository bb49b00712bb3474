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
#include "layout/sidebar.h"

TEST(SidebarTabTest, NamesRoundTripThroughParser)
{
    const QList<SidebarTab> tabs = {SidebarTab(SidebarTab::Playlist), SidebarTab(SidebarTab::Chapters),
                                    SidebarTab(SidebarTab::Video), SidebarTab(SidebarTab::Audio),
                                    SidebarTab(SidebarTab::Sub), SidebarTab::plugin("foo")};
    for (const SidebarTab &tab : tabs) {
        const std::optional<SidebarTab> parsed = SidebarTab::fromName(tab.name());
        ASSERT_TRUE(parsed.has_value()) << tab.name().toStdString();
        EXPECT_EQ(*parsed, tab);
    }
    EXPECT_EQ(SidebarTab::plugin("foo").name(), QStringLiteral("plugin:foo"));
    EXPECT_FALSE(SidebarTab::fromName("bogus").has_value());
}

TEST(SidebarTabTest, Groups)
{
    EXPECT_EQ(SidebarTab(SidebarTab::Playlist).group(), SidebarTabGroup::Playlist);
    EXPECT_EQ(SidebarTab(SidebarTab::Chapters).group(), SidebarTabGroup::Playlist);
    EXPECT_EQ(SidebarTab(SidebarTab::Sub).group(), SidebarTabGroup::Settings);
    EXPECT_EQ(SidebarTab::plugin("foo").group(), SidebarTabGroup::Settings);
    EXPECT_NE(SidebarTab::plugin("foo"), SidebarTab::plugin("bar"));
}

TEST(SidebarTest, GroupWidths)
{
    EXPECT_EQ(sidebarTabGroupWidth(SidebarTabGroup::Settings, 270), 360);
    EXPECT_EQ(sidebarTabGroupWidth(SidebarTabGroup::Playlist, 100), 240);
    EXPECT_EQ(sidebarTabGroupWidth(SidebarTabGroup::Playlist, 2000), 800);
    EXPECT_EQ(sidebarTabGroupWidth(SidebarTabGroup::Playlist, 300), 300);
}

TEST(SidebarTest, TabFromUnconfiguredGroupIsHidden)
{
    const Sidebar sidebar(SidebarLocation::Leading, SidebarTabGroup::Settings, PanelPlacement::InsideViewport,
                          SidebarTab(SidebarTab::Playlist));
    EXPECT_FALSE(sidebar.isVisible());
    EXPECT_EQ(sidebar.currentWidth(), 0);
}

TEST(SidebarTest, WidthCountsOnlyOnItsSide)
{
    const Sidebar inside(SidebarLocation::Trailing, SidebarTabGroup::Playlist, PanelPlacement::InsideViewport,
                         SidebarTab(SidebarTab::Playlist), std::nullopt, 300);
    EXPECT_EQ(inside.currentWidth(), 300);
    EXPECT_EQ(inside.insideWidth(), 300);
    EXPECT_EQ(inside.outsideWidth(), 0);

    const Sidebar outside = inside.withPlacement(PanelPlacement::OutsideViewport);
    EXPECT_EQ(outside.insideWidth(), 0);
    EXPECT_EQ(outside.outsideWidth(), 300);

    EXPECT_EQ(outside.hidden().outsideWidth(), 0);
    EXPECT_FALSE(outside.hidden().visibleTabGroup().has_value());
}

TEST(SidebarTest, DefaultTabToShow)
{
    const SidebarTabGroups both = SidebarTabGroup::Settings | SidebarTabGroup::Playlist;
    EXPECT_EQ(Sidebar(SidebarLocation::Leading, both).defaultTabToShow(), SidebarTab(SidebarTab::Video));
    EXPECT_EQ(Sidebar(SidebarLocation::Leading, SidebarTabGroup::Playlist).defaultTabToShow(),
              SidebarTab(SidebarTab::Playlist));
    EXPECT_FALSE(Sidebar(SidebarLocation::Leading).defaultTabToShow().has_value());

    // Last shown tab wins while its group is still configured
    const Sidebar closed = Sidebar(SidebarLocation::Leading, both, PanelPlacement::InsideViewport,
                                   SidebarTab(SidebarTab::Chapters)).hidden();
    EXPECT_FALSE(closed.isVisible());
    EXPECT_EQ(closed.defaultTabToShow(), SidebarTab(SidebarTab::Chapters));
    EXPECT_EQ(closed.withTabGroups(SidebarTabGroup::Settings).defaultTabToShow(), SidebarTab(SidebarTab::Video));
}
