#include <gtest/gtest.h>

#include "debug.h"
#include "exitcodes.h"


TEST(Debug, SelectorsAddAndRemoveBits) {
    unsigned int selector = 0;

    EXPECT_EQ("", decode_bits(selector, "+scrub+archive"));
    EXPECT_EQ((unsigned int)(D_scrub | D_archive), selector);

    EXPECT_EQ("", decode_bits(selector, "-scrub"));
    EXPECT_EQ((unsigned int)D_archive, selector);

    selector = D_default;
    EXPECT_EQ("", decode_bits(selector, "+exec-volume"));
    EXPECT_TRUE(selector & D_exec);
    EXPECT_FALSE(selector & D_volume);
    EXPECT_FALSE(selector & D_config);
}


TEST(Debug, AllAndNumericForms) {
    unsigned int selector = 0;

    EXPECT_EQ("", decode_bits(selector, "+all"));
    EXPECT_EQ((unsigned int)D_all, selector);

    EXPECT_EQ("", decode_bits(selector, "=0x41"));
    EXPECT_EQ(0x41u, selector);
}


TEST(Debug, UnknownSelectionsAreNamed) {
    unsigned int selector = D_scrub;

    EXPECT_EQ("unknown debugging selection: +frobnicate", decode_bits(selector, "+frobnicate"));
    EXPECT_EQ("unknown debugging flag (should be + or -): scrub", decode_bits(selector, "scrub"));
    EXPECT_EQ("unknown debugging selection: =zz", decode_bits(selector, "=zz"));
}


TEST(Debug, TheSelectorTableIsSorted) {
    for (int index = 1; index < ndebug_options; ++index)
        EXPECT_LT(string(debug_options[index - 1].name), string(debug_options[index].name));
}


TEST(ExitCodes, EveryOutcomeHasAName) {
    EXPECT_EQ("success", outcomeName(EO_SUCCESS));
    EXPECT_EQ("drain timeout", outcomeName(EO_DRAIN_TIMEOUT));
    EXPECT_EQ("trapped signal", outcomeName(EO_TRAPPED_SIGNAL));
    EXPECT_EQ("code 99", outcomeName(99));
}
