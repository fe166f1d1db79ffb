#include <gtest/gtest.h>

#include "input/code_tables/code_tables.hpp"

#include <climits>

using code_tables::button_name;
using code_tables::key_name;

TEST(KeyNameTest, NamesLettersDigitsAndFunctionKeys) {
    EXPECT_EQ(key_name(30), "A");
    EXPECT_EQ(key_name(16), "Q");
    EXPECT_EQ(key_name(50), "M");
    EXPECT_EQ(key_name(2), "1");
    EXPECT_EQ(key_name(11), "0");
    EXPECT_EQ(key_name(59), "F1");
    EXPECT_EQ(key_name(68), "F10");
    EXPECT_EQ(key_name(87), "F11");
    EXPECT_EQ(key_name(88), "F12");
}

TEST(KeyNameTest, NamesModifiersAndEditingKeys) {
    EXPECT_EQ(key_name(1), "ESC");
    EXPECT_EQ(key_name(14), "BACKSPACE");
    EXPECT_EQ(key_name(15), "TAB");
    EXPECT_EQ(key_name(28), "ENTER");
    EXPECT_EQ(key_name(57), "SPACE");
    EXPECT_EQ(key_name(29), "CTRL");
    EXPECT_EQ(key_name(42), "SHIFT (LEFT)");
    EXPECT_EQ(key_name(54), "SHIFT (RIGHT)");
    EXPECT_EQ(key_name(56), "ALT");
    EXPECT_EQ(key_name(100), "ALT GR");
    EXPECT_EQ(key_name(125), "SUPER/WIN");
    EXPECT_EQ(key_name(58), "CAPS LOCK");
}

TEST(KeyNameTest, NamesNavigationNumpadAndMediaKeys) {
    EXPECT_EQ(key_name(103), "UP");
    EXPECT_EQ(key_name(105), "LEFT");
    EXPECT_EQ(key_name(106), "RIGHT");
    EXPECT_EQ(key_name(108), "DOWN");
    EXPECT_EQ(key_name(107), "END");
    EXPECT_EQ(key_name(109), "PAGE DOWN");
    EXPECT_EQ(key_name(111), "DELETE");
    EXPECT_EQ(key_name(99), "PRINT SCREEN");
    EXPECT_EQ(key_name(119), "PAUSE");

    EXPECT_EQ(key_name(71), "NUM 7");
    EXPECT_EQ(key_name(82), "NUM 0");
    EXPECT_EQ(key_name(96), "NUM ENTER");
    EXPECT_EQ(key_name(55), "NUM *");

    EXPECT_EQ(key_name(113), "MUTE");
    EXPECT_EQ(key_name(114), "VOLUME DOWN");
    EXPECT_EQ(key_name(115), "VOLUME UP");
}

TEST(KeyNameTest, KeepsTheMonitorsHistoricNamesForRemappedCodes) {
    EXPECT_EQ(key_name(102), "PAGE UP");
    EXPECT_EQ(key_name(110), "HOME");
    EXPECT_EQ(key_name(118), "INSERT");
    EXPECT_EQ(key_name(127), "PAUSE");
    EXPECT_EQ(key_name(128), "PREV TRACK");
    EXPECT_EQ(key_name(129), "NEXT TRACK");
    EXPECT_EQ(key_name(130), "STOP");
    EXPECT_EQ(key_name(131), "PLAY/PAUSE");

    // the evdev codes of page up and the media keys are not part of the table
    EXPECT_EQ(key_name(104), "UNKNOWN KEY");
    EXPECT_EQ(key_name(163), "UNKNOWN KEY");
    EXPECT_EQ(key_name(164), "UNKNOWN KEY");
    EXPECT_EQ(key_name(165), "UNKNOWN KEY");
    EXPECT_EQ(key_name(166), "UNKNOWN KEY");
}

TEST(KeyNameTest, EveryOtherCodeIsUnknown) {
    EXPECT_EQ(key_name(0), "UNKNOWN KEY");
    EXPECT_EQ(key_name(-1), "UNKNOWN KEY");
    EXPECT_EQ(key_name(INT_MIN), "UNKNOWN KEY");
    EXPECT_EQ(key_name(INT_MAX), "UNKNOWN KEY");
    // right control has no entry of its own
    EXPECT_EQ(key_name(97), "UNKNOWN KEY");
    EXPECT_EQ(key_name(272), "UNKNOWN KEY");
}

TEST(KeyNameTest, IsTotalOverAWideRange) {
    for (int code = -1000; code <= 1000; ++code) {
        EXPECT_FALSE(key_name(code).empty()) << "code " << code;
    }
}

TEST(ButtonNameTest, NamesCommonButtons) {
    EXPECT_EQ(button_name(272), "LEFT");
    EXPECT_EQ(button_name(273), "RIGHT");
    EXPECT_EQ(button_name(274), "MIDDLE");
    EXPECT_EQ(button_name(275), "SIDE");
    EXPECT_EQ(button_name(276), "EXTRA");
}

TEST(ButtonNameTest, UnknownButtonsFallBackToTheirCode) {
    EXPECT_EQ(button_name(277), "277");
    EXPECT_EQ(button_name(0), "0");
    EXPECT_EQ(button_name(-5), "-5");
}
