#include <gtest/gtest.h>
#include "../include/color_space.hpp"
#include <cmath>
#include <vector>

class ColorSpaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Primary, secondary and gray colors with their expected hue
        reference_colors = {
            { {255, 0, 0}, 0.0 },     // Red
            { {0, 255, 0}, 120.0 },   // Green
            { {0, 0, 255}, 240.0 },   // Blue
            { {255, 255, 0}, 60.0 },  // Yellow (r == g, r sector wins)
            { {0, 255, 255}, 180.0 }, // Cyan (g == b, g sector wins)
            { {255, 0, 255}, 300.0 }, // Magenta (r == b, r sector wins)
        };
    }

    // Standard HSV -> RGB reconstruction, channels returned in [0, 255]
    static void hsvToRgb(const HsvColor& hsv, double& r, double& g, double& b) {
        double v = hsv.v / 100.0;
        double c = v * hsv.s / 100.0;
        double hp = hsv.h / 60.0;
        double x = c * (1.0 - std::abs(std::fmod(hp, 2.0) - 1.0));
        double m = v - c;

        double r1 = 0, g1 = 0, b1 = 0;
        if (hp < 1)      { r1 = c; g1 = x; }
        else if (hp < 2) { r1 = x; g1 = c; }
        else if (hp < 3) { g1 = c; b1 = x; }
        else if (hp < 4) { g1 = x; b1 = c; }
        else if (hp < 5) { r1 = x; b1 = c; }
        else             { r1 = c; b1 = x; }

        r = (r1 + m) * 255.0;
        g = (g1 + m) * 255.0;
        b = (b1 + m) * 255.0;
    }

    std::vector<std::pair<RgbColor, double>> reference_colors;
};

TEST_F(ColorSpaceTest, ReferenceHues) {
    for (const auto& ref : reference_colors) {
        HsvColor hsv = rgbToHsv(ref.first);
        EXPECT_NEAR(hsv.h, ref.second, 1e-9) << "rgb(" << ref.first.r << "," << ref.first.g << "," << ref.first.b << ")";
        EXPECT_DOUBLE_EQ(hsv.s, 100.0);
        EXPECT_DOUBLE_EQ(hsv.v, 100.0);
    }
}

TEST_F(ColorSpaceTest, CrimsonScenario) {
    HsvColor hsv = rgbToHsv(220, 20, 60);

    EXPECT_NEAR(hsv.h, 348.0, 0.5);
    EXPECT_NEAR(hsv.s, 91.0, 0.5);
    EXPECT_NEAR(hsv.v, 86.0, 0.5);
}

TEST_F(ColorSpaceTest, AchromaticHasZeroHue) {
    HsvColor black = rgbToHsv(0, 0, 0);
    EXPECT_DOUBLE_EQ(black.h, 0.0);
    EXPECT_DOUBLE_EQ(black.s, 0.0);
    EXPECT_DOUBLE_EQ(black.v, 0.0);

    HsvColor gray = rgbToHsv(128, 128, 128);
    EXPECT_DOUBLE_EQ(gray.h, 0.0);
    EXPECT_DOUBLE_EQ(gray.s, 0.0);
    EXPECT_NEAR(gray.v, 128.0 / 255.0 * 100.0, 1e-9);

    HsvColor white = rgbToHsv(255, 255, 255);
    EXPECT_DOUBLE_EQ(white.h, 0.0);
    EXPECT_DOUBLE_EQ(white.s, 0.0);
    EXPECT_DOUBLE_EQ(white.v, 100.0);
}

TEST_F(ColorSpaceTest, UnroundedChannels) {
    // Centroids are converted before rounding; ties still resolve to the r sector
    HsvColor hsv = rgbToHsv(200.5, 200.5, 100.25);
    EXPECT_NEAR(hsv.h, 60.0, 1e-9);
    EXPECT_GT(hsv.s, 0.0);
}

TEST_F(ColorSpaceTest, RangesAndRoundTrip) {
    for (int r = 0; r < 256; r += 15) {
        for (int g = 0; g < 256; g += 15) {
            for (int b = 0; b < 256; b += 15) {
                HsvColor hsv = rgbToHsv(r, g, b);

                ASSERT_GE(hsv.h, 0.0);
                ASSERT_LT(hsv.h, 360.0);
                ASSERT_GE(hsv.s, 0.0);
                ASSERT_LE(hsv.s, 100.0);
                ASSERT_GE(hsv.v, 0.0);
                ASSERT_LE(hsv.v, 100.0);

                double rr, gg, bb;
                hsvToRgb(hsv, rr, gg, bb);
                EXPECT_NEAR(rr, r, 1e-6);
                EXPECT_NEAR(gg, g, 1e-6);
                EXPECT_NEAR(bb, b, 1e-6);

                // Recomputing from the reconstruction gives back the same saturation and value
                HsvColor again = rgbToHsv(rr, gg, bb);
                EXPECT_NEAR(again.s, hsv.s, 1e-9);
                EXPECT_NEAR(again.v, hsv.v, 1e-9);
            }
        }
    }
}
