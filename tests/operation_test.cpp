#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "errors.h"
#include "operation.h"

TEST(ParseColor, Names) {
    Color c = parse_color("red");
    ASSERT_TRUE(std::holds_alternative<NamedColor>(c));
    EXPECT_EQ(std::get<NamedColor>(c).name, "red");

    EXPECT_EQ(std::get<NamedColor>(parse_color("Royal-Blue")).name, "royal_blue");
    EXPECT_EQ(std::get<NamedColor>(parse_color("white")).name, "white");
}

TEST(ParseColor, Index) {
    Color c = parse_color("156");
    ASSERT_TRUE(std::holds_alternative<IndexedColor>(c));
    EXPECT_EQ(std::get<IndexedColor>(c).value, 156);

    // Range is checked when the colour is applied.
    EXPECT_EQ(std::get<IndexedColor>(parse_color("300")).value, 300);
}

TEST(ParseColor, HexAndTriple) {
    Color hex = parse_color("#FF8000");
    ASSERT_TRUE(std::holds_alternative<RgbColor>(hex));
    EXPECT_EQ(std::get<RgbColor>(hex).r, 255);
    EXPECT_EQ(std::get<RgbColor>(hex).g, 128);
    EXPECT_EQ(std::get<RgbColor>(hex).b, 0);

    Color triple = parse_color("0, 128,255");
    ASSERT_TRUE(std::holds_alternative<RgbColor>(triple));
    EXPECT_EQ(std::get<RgbColor>(triple).g, 128);
    EXPECT_EQ(std::get<RgbColor>(triple).b, 255);
}

TEST(ParseColor, Rejects) {
    EXPECT_THROW(parse_color("chartreuse"), UnknownColor);
    EXPECT_THROW(parse_color("-1"), UnknownColor);
    EXPECT_THROW(parse_color("256,0,0"), UnknownColor);
    EXPECT_THROW(parse_color("#12345"), UnknownColor);
    EXPECT_THROW(parse_color(""), UnknownColor);
}

TEST(ParseCommandName, AcceptsBothSpellings) {
    EXPECT_EQ(parse_command_name("disco-faster"), Command::DiscoFaster);
    EXPECT_EQ(parse_command_name("disco_faster"), Command::DiscoFaster);
    EXPECT_EQ(parse_command_name("set_color"), Command::SetColor);
    EXPECT_EQ(parse_command_name("color"), Command::SetColor);
    EXPECT_EQ(parse_command_name("Brightness-Up"), Command::BrightnessUp);
    EXPECT_STREQ(command_name(Command::Nightmode), "nightmode");
}

TEST(ParseCommandName, UnknownCommand) {
    EXPECT_THROW(parse_command_name("explode"), UnknownCommand);
}

TEST(ParseOperations, SequenceWithArguments) {
    auto ops = parse_operations({"color", "red", "brightness", "50", "off"}, 2);
    ASSERT_EQ(ops.size(), 3u);

    EXPECT_EQ(ops[0].command, Command::SetColor);
    EXPECT_EQ(ops[0].group, 2);
    EXPECT_EQ(std::get<NamedColor>(ops[0].color).name, "red");

    EXPECT_EQ(ops[1].command, Command::SetBrightness);
    EXPECT_EQ(std::get<int>(ops[1].brightness), 50);

    EXPECT_EQ(ops[2].command, Command::Off);
    EXPECT_EQ(ops[2].group, 2);
}

TEST(ParseOperations, MissingArgument) {
    EXPECT_THROW(parse_operations({"on", "color"}), std::invalid_argument);
    EXPECT_THROW(parse_operations({"brightness", "loud"}), std::invalid_argument);
}

TEST(ParseBrightness, IntegerAndDecimal) {
    EXPECT_EQ(std::get<int>(parse_brightness("75")), 75);
    EXPECT_EQ(std::get<int>(parse_brightness("-5")), 0);
    EXPECT_EQ(std::get<int>(parse_brightness("99999999999")), 100);
    EXPECT_DOUBLE_EQ(std::get<double>(parse_brightness("0.5")), 0.5);
    EXPECT_DOUBLE_EQ(std::get<double>(parse_brightness("50.0")), 50.0);
    EXPECT_THROW(parse_brightness("half"), std::invalid_argument);
}
