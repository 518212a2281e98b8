/*
 * List Widget Unit Tests
 * Window invariant, scrolling, hit testing and scrollbar geometry
 */

#include "utils/widgets.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>

#include <cstdio>
#include <vector>

using Op_Kind = Recording_Draw_Target::Op_Kind;

static const Theme THEME = {COLOR_DKGRAY, COLOR_CYAN, COLOR_BLACK, COLOR_WHITE, COLOR_BLUE, COLOR_RED};

static std::vector<List_Item> make_items(uint8_t count, uint32_t height = 20) {
    std::vector<List_Item> items;
    for (uint8_t i = 0; i < count; ++i) {
        char text[16];
        snprintf(text, sizeof(text), "item %u", static_cast<unsigned>(i));
        items.push_back(make_list_item(text, height, Font_Id::Small));
    }
    return items;
}

static void expect_window_invariant(const List &list) {
    if (list.item_count() == 0U) {
        return;
    }
    EXPECT_LT(list.selected_index(), list.item_count());
    EXPECT_LE(list.window_start(), list.selected_index());
    EXPECT_LE(list.selected_index(), list.window_start() + list.visible_lines() - 1U);
}

class ListTest : public ::testing::Test {
protected:
    Recording_Draw_Target target;
    std::vector<List_Item> items = make_items(10);
    List list{items.data(), 10, {{0, 0}, {240, 90}}, THEME};
};

TEST_F(ListTest, VisibleLinesFromFirstItemHeight) {
    EXPECT_EQ(list.visible_lines(), 4U);
    EXPECT_EQ(list.item_count(), 10U);
    EXPECT_TRUE(list.shows_scrollbar());
    EXPECT_STREQ(list.item(3).text, "item 3");
}

TEST_F(ListTest, SelectingRowSevenKeepsItVisible) {
    list.set_selected_index(7);
    EXPECT_EQ(list.selected_index(), 7U);
    EXPECT_EQ(list.window_start(), 4U);
    expect_window_invariant(list);

    Rect track = list.scrollbar_track();
    Rect indicator = list.scrollbar_indicator();
    EXPECT_EQ(track.size.height, 80U);
    EXPECT_EQ(indicator.size.height, 80U * 4U / 10U);
    EXPECT_EQ(indicator.top_left.y, static_cast<int32_t>(80U * 4U / 10U));
}

TEST_F(ListTest, SetSelectedIndexOutOfRangeIsIgnored) {
    list.set_selected_index(3);
    list.set_selected_index(10);
    EXPECT_EQ(list.selected_index(), 3U);
    expect_window_invariant(list);
}

TEST_F(ListTest, SetSelectedIndexBackwardsMovesWindow) {
    list.set_selected_index(9);
    list.set_selected_index(1);
    EXPECT_EQ(list.window_start(), 1U);
    expect_window_invariant(list);
}

TEST_F(ListTest, ScrollDownMovesWindowOneLine) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(list.scroll_down(target), HwError::None);
    }
    EXPECT_EQ(list.selected_index(), 3U);
    EXPECT_EQ(list.window_start(), 0U);

    ASSERT_EQ(list.scroll_down(target), HwError::None);
    EXPECT_EQ(list.selected_index(), 4U);
    EXPECT_EQ(list.window_start(), 1U);
}

TEST_F(ListTest, ScrollDownAtEndIsNoOp) {
    list.set_selected_index(9);
    uint8_t start = list.window_start();
    ASSERT_EQ(list.scroll_down(target), HwError::None);
    EXPECT_EQ(list.selected_index(), 9U);
    EXPECT_EQ(list.window_start(), start);
}

TEST_F(ListTest, ScrollUpAtStartIsNoOp) {
    ASSERT_EQ(list.scroll_up(target), HwError::None);
    EXPECT_EQ(list.selected_index(), 0U);
    EXPECT_EQ(list.window_start(), 0U);
}

TEST_F(ListTest, InvariantHoldsUnderScrollSequence) {
    uint32_t seed = 12345;
    for (int step = 0; step < 500; ++step) {
        seed = seed * 1103515245U + 12345U;
        if ((seed >> 16U) & 1U) {
            list.scroll_down(target);
        } else {
            list.scroll_up(target);
        }
        expect_window_invariant(list);
    }
}

TEST_F(ListTest, DrawsOnlyWindowRows) {
    list.set_selected_index(5);
    target.clear();
    ASSERT_EQ(list.draw(target), HwError::None);

    std::vector<std::string> texts = target.texts();
    ASSERT_EQ(texts.size(), 4U);
    EXPECT_EQ(texts.front(), "item 2");
    EXPECT_EQ(texts.back(), "item 5");

    /* Selected row background is the highlight colour */
    const auto &ops = target.ops();
    bool highlighted = false;
    for (size_t i = 0; i + 1 < ops.size(); ++i) {
        if (ops[i].kind == Op_Kind::Fill && ops[i + 1].kind == Op_Kind::Glyphs &&
            ops[i + 1].text == "item 5") {
            EXPECT_EQ(ops[i].color, THEME.highlight);
            EXPECT_EQ(ops[i].area.size.width, 240U - List::SCROLLBAR_WIDTH);
            highlighted = true;
        }
    }
    EXPECT_TRUE(highlighted);

    /* Scrollbar track then indicator close the draw */
    EXPECT_EQ(ops[ops.size() - 2].area.top_left.x, 220);
    EXPECT_EQ(ops.back().color, THEME.text_primary);
}

TEST_F(ListTest, SelectAtPosHitsVisibleRow) {
    list.set_selected_index(6);  /* window 3..6 */
    uint8_t selected = 0;
    ASSERT_EQ(list.select_at_pos(target, {10, 25}, selected), HwError::None);
    EXPECT_EQ(selected, 4U);
    EXPECT_EQ(list.selected_index(), 4U);
    expect_window_invariant(list);
}

TEST_F(ListTest, SelectAtPosOutsideKeepsSelection) {
    list.set_selected_index(2);
    uint8_t selected = 0;
    ASSERT_EQ(list.select_at_pos(target, {10, 200}, selected), HwError::None);
    EXPECT_EQ(selected, 2U);
}

TEST(ListShortTest, NoScrollbarUsesMarginWidth) {
    Recording_Draw_Target target;
    std::vector<List_Item> items = make_items(3);
    List list(items.data(), 3, {{0, 0}, {240, 90}}, THEME);
    EXPECT_FALSE(list.shows_scrollbar());

    ASSERT_EQ(list.draw(target), HwError::None);
    EXPECT_EQ(target.count(Op_Kind::Fill), 3U);
    EXPECT_EQ(target.ops()[0].area.size.width, 240U - List::ROW_MARGIN);
}

TEST(ListShortTest, LongItemTextIsTruncated) {
    Recording_Draw_Target target;
    List_Item item = make_list_item("a row label that is far too long for the list",
                                    20, Font_Id::Small);
    List list(&item, 1, {{0, 0}, {120, 40}}, THEME);
    ASSERT_EQ(list.draw(target), HwError::None);

    /* (120 - 20) / 8 = 12 cells: 9 characters and the ellipsis */
    EXPECT_TRUE(target.drew_text("a row lab..."));
}

TEST(ListShortTest, DrawErrorPropagates) {
    Recording_Draw_Target target;
    target.fail_after(1);
    std::vector<List_Item> items = make_items(3);
    List list(items.data(), 3, {{0, 0}, {240, 90}}, THEME);
    EXPECT_EQ(list.draw(target), HwError::DrawFailed);
}
