#include "etcalc/Errors.hpp"
#include "etcalc/PixelMask.hpp"

#include <gtest/gtest.h>

using namespace etcalc;

TEST(PixelMask, CentreOfOddAndEvenArrays)
{
    EXPECT_EQ(PixelMask(5, 5, 1e-5).center_ind(), Eigen::Vector2d(2.0, 2.0));
    EXPECT_EQ(PixelMask(4, 6, 1e-5).center_ind(), Eigen::Vector2d(1.5, 2.5));
}

TEST(PixelMask, PsfOffsetIsGivenAsXY)
{
    PixelMask m(10, 10, 1e-5, Eigen::Vector2d(1.0, -2.0));
    EXPECT_EQ(m.psf_center_ind(), Eigen::Vector2d(4.5 - 2.0, 4.5 + 1.0));
}

TEST(PixelMask, CircleAndSquareApertures)
{
    PixelMask circle(5, 5, 1e-5);
    circle.create_photometric_aperture(ApertureShape::Circle, 1.0);
    EXPECT_EQ(circle.count(), 5);
    EXPECT_EQ(circle.mask()(2, 2), 1.0);
    EXPECT_EQ(circle.mask()(1, 1), 0.0);

    PixelMask square(5, 5, 1e-5);
    square.create_photometric_aperture(ApertureShape::Square, 1.0);
    EXPECT_EQ(square.count(), 9);
}

TEST(PixelMask, CentrePixelAlwaysIncluded)
{
    PixelMask m(6, 6, 1e-5);
    m.create_photometric_aperture(ApertureShape::Circle, 0.0);
    EXPECT_EQ(m.count(), 1);
}

TEST(PixelMask, EvenArrayCircleCoversCentralQuad)
{
    PixelMask m(4, 4, 1e-5);
    m.create_photometric_aperture(ApertureShape::Circle, 0.75);
    EXPECT_EQ(m.count(), 4);
    const PixelMask::Bounds b = m.bounds();
    EXPECT_EQ(b.row0, 1);
    EXPECT_EQ(b.col0, 1);
    EXPECT_EQ(b.rows, 2);
    EXPECT_EQ(b.cols, 2);
}

TEST(PixelMask, ApertureFollowsExplicitOffset)
{
    PixelMask m(9, 9, 1e-5);
    m.create_photometric_aperture(ApertureShape::Square, 0.0, Eigen::Vector2d(3.0, 0.0));
    EXPECT_EQ(m.count(), 1);
    EXPECT_EQ(m.mask()(4, 7), 1.0);
}

TEST(PixelMask, ApertureClippedAtTheBorder)
{
    PixelMask m(3, 3, 1e-5, Eigen::Vector2d(1.0, 1.0));
    m.create_photometric_aperture(ApertureShape::Square, 1.0);
    EXPECT_EQ(m.count(), 4);
    EXPECT_EQ(m.bounds().row0, 1);
}

TEST(PixelMask, InvalidInput)
{
    EXPECT_THROW(PixelMask(0, 3, 1e-5), ConfigurationError);
    EXPECT_THROW(PixelMask(3, 3, 0.0), ConfigurationError);
    PixelMask m(3, 3, 1e-5);
    EXPECT_THROW(m.create_photometric_aperture(ApertureShape::Circle, -1.0), ConfigurationError);
    EXPECT_THROW(m.bounds(), ConfigurationError);
    EXPECT_THROW(parse_aperture_shape("hexagon"), ConfigurationError);
    EXPECT_EQ(parse_aperture_shape("Square"), ApertureShape::Square);
}
