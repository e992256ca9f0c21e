#include <gtest/gtest.h>

#include "data.h"
#include "errors.h"

TEST(CommandTable, RgbwFlatCommands) {
    EXPECT_EQ(lookup_command(BulbType::Rgbw, "all_on"), (CommandSpec{0x42}));
    EXPECT_EQ(lookup_command(BulbType::Rgbw, "all_off"), (CommandSpec{0x41}));
    EXPECT_EQ(lookup_command(BulbType::Rgbw, "all_white"), (CommandSpec{0xc2}));
    EXPECT_EQ(lookup_command(BulbType::Rgbw, "all_nightmode"), (CommandSpec{0xc1}));
    EXPECT_EQ(lookup_command(BulbType::Rgbw, "disco"), (CommandSpec{0x4d}));
    EXPECT_EQ(lookup_command(BulbType::Rgbw, "color_by_int"), (CommandSpec{0x40}));
    EXPECT_EQ(lookup_command(BulbType::Rgbw, "brightness"), (CommandSpec{0x4e}));
    EXPECT_EQ(lookup_command(BulbType::Rgbw, "color_to_red"), (CommandSpec{0x40, 0xb0}));
    EXPECT_EQ(lookup_command(BulbType::Rgbw, "color_to_violet"), (CommandSpec{0x40, 0x00}));
}

TEST(CommandTable, WhiteFlatCommands) {
    EXPECT_EQ(lookup_command(BulbType::White, "all_on"), (CommandSpec{0x35}));
    EXPECT_EQ(lookup_command(BulbType::White, "all_off"), (CommandSpec{0x39}));
    EXPECT_EQ(lookup_command(BulbType::White, "all_white"), (CommandSpec{0xb5}));
    EXPECT_EQ(lookup_command(BulbType::White, "all_nightmode"), (CommandSpec{0xb9}));
    EXPECT_EQ(lookup_command(BulbType::White, "warmer"), (CommandSpec{0x3e}));
    EXPECT_EQ(lookup_command(BulbType::White, "cooler"), (CommandSpec{0x3f}));
    EXPECT_EQ(lookup_command(BulbType::White, "brightness_up"), (CommandSpec{0x3c}));
    EXPECT_EQ(lookup_command(BulbType::White, "brightness_down"), (CommandSpec{0x34}));
}

TEST(CommandTable, BulbFamiliesHaveDisjointFeatures) {
    EXPECT_FALSE(has_command(BulbType::Rgbw, "warmer"));
    EXPECT_FALSE(has_command(BulbType::Rgbw, "brightness_up"));
    EXPECT_FALSE(has_command(BulbType::White, "disco"));
    EXPECT_FALSE(has_command(BulbType::White, "brightness"));
    EXPECT_FALSE(has_command(BulbType::White, "color_to_red"));
    EXPECT_TRUE(has_command(BulbType::White, "all_on"));
}

TEST(CommandTable, UnknownCommandThrows) {
    EXPECT_THROW(lookup_command(BulbType::Rgbw, "warmer"), UnknownCommand);
    EXPECT_THROW(lookup_command(BulbType::White, "no_such_command"), UnknownCommand);
    EXPECT_THROW(lookup_group_command(BulbType::Rgbw, "disco", 1), UnknownCommand);
}

TEST(CommandTable, PerGroupCommandsAreIndexedByGroup) {
    EXPECT_EQ(lookup_group_command(BulbType::Rgbw, "on", 1), (CommandSpec{0x45}));
    EXPECT_EQ(lookup_group_command(BulbType::Rgbw, "on", 4), (CommandSpec{0x4b}));
    EXPECT_EQ(lookup_group_command(BulbType::Rgbw, "off", 2), (CommandSpec{0x48}));
    EXPECT_EQ(lookup_group_command(BulbType::Rgbw, "white", 3), (CommandSpec{0xc9}));
    EXPECT_EQ(lookup_group_command(BulbType::Rgbw, "nightmode", 4), (CommandSpec{0xcc}));

    EXPECT_EQ(lookup_group_command(BulbType::White, "on", 2), (CommandSpec{0x3d}));
    EXPECT_EQ(lookup_group_command(BulbType::White, "off", 4), (CommandSpec{0x36}));
    EXPECT_EQ(lookup_group_command(BulbType::White, "white", 1), (CommandSpec{0xb8}));
    EXPECT_EQ(lookup_group_command(BulbType::White, "nightmode", 3), (CommandSpec{0xba}));
}

TEST(CommandTable, PerGroupLookupRejectsBadGroup) {
    EXPECT_THROW(lookup_group_command(BulbType::Rgbw, "on", 0), InvalidGroup);
    EXPECT_THROW(lookup_group_command(BulbType::White, "on", 5), InvalidGroup);
}

TEST(Palette, HasSixteenColoursInWheelOrder) {
    auto names = palette_color_names();
    ASSERT_EQ(names.size(), 16u);
    EXPECT_EQ(names.front(), "violet");
    EXPECT_EQ(names.back(), "lavendar");

    for (size_t i = 0; i < names.size(); ++i) {
        uint8_t hue = 0xff;
        ASSERT_TRUE(lookup_palette_color(names[i], hue)) << names[i];
        EXPECT_EQ(hue, static_cast<uint8_t>(i * 0x10)) << names[i];
        EXPECT_TRUE(has_command(BulbType::Rgbw, "color_to_" + names[i])) << names[i];
    }
}

TEST(Palette, WhiteIsNotAPaletteColour) {
    uint8_t hue;
    EXPECT_FALSE(lookup_palette_color("white", hue));
    EXPECT_FALSE(lookup_palette_color("chartreuse", hue));
}
