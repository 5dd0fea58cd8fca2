#include"test_pch.hpp"
#include"../Terrain.hpp"

namespace himal {

	class TerrainTest : public ::testing::Test {
	protected:
		//5x5 cells of 10 units on a side
		Alignment a{ Extent(0, 50, 0, 50), 5, 5 };

		template<class F>
		Raster<metric_t> makeDem(F elevation) {
			Raster<metric_t> dem{ a, 0.f };
			for (rowcol_t row = 0; row < a.nrow(); ++row) {
				for (rowcol_t col = 0; col < a.ncol(); ++col) {
					dem.atRC(row, col).value() = (metric_t)elevation(row, col);
				}
			}
			return dem;
		}
	};

	TEST_F(TerrainTest, FlatDem) {
		Raster<metric_t> dem{ a, 1500.f };
		SlopeAspect sa = deriveSlopeAspect(dem);
		for (cell_t cell = 0; cell < a.ncell(); ++cell) {
			ASSERT_TRUE(sa.slope[cell].has_value());
			EXPECT_NEAR(sa.slope[cell].value(), 0, 0.0001);
			EXPECT_FALSE(sa.aspect[cell].has_value());
		}
	}

	TEST_F(TerrainTest, EastFacingPlane) {
		Raster<metric_t> dem = makeDem([](rowcol_t, rowcol_t col) { return 1000. - 10. * col; });
		SlopeAspect sa = deriveSlopeAspect(dem);
		for (rowcol_t row = 1; row < 4; ++row) {
			for (rowcol_t col = 1; col < 4; ++col) {
				EXPECT_NEAR(sa.slope.atRC(row, col).value(), 45, 0.001);
				EXPECT_NEAR(sa.aspect.atRC(row, col).value(), 90, 0.001);
			}
		}
	}

	TEST_F(TerrainTest, NorthFacingPlane) {
		Raster<metric_t> dem = makeDem([](rowcol_t row, rowcol_t) { return 1000. + 10. * row; });
		SlopeAspect sa = deriveSlopeAspect(dem);
		for (rowcol_t row = 1; row < 4; ++row) {
			for (rowcol_t col = 1; col < 4; ++col) {
				EXPECT_NEAR(sa.slope.atRC(row, col).value(), 45, 0.001);
				EXPECT_NEAR(sa.aspect.atRC(row, col).value(), 0, 0.001);
			}
		}
	}

	TEST_F(TerrainTest, SouthWestFacingPlane) {
		Raster<metric_t> dem = makeDem([](rowcol_t row, rowcol_t col) { return 1000. - 10. * row + 10. * col; });
		SlopeAspect sa = deriveSlopeAspect(dem);
		EXPECT_NEAR(sa.aspect.atRC(2, 2).value(), 225, 0.001);
	}

	TEST_F(TerrainTest, ValuesAreInRange) {
		Raster<metric_t> dem = makeDem([](rowcol_t row, rowcol_t col) { return 3000. + 200. * std::sin(row * 1.3) * std::cos(col * 0.7) + 50. * row; });
		SlopeAspect sa = deriveSlopeAspect(dem);
		for (cell_t cell = 0; cell < a.ncell(); ++cell) {
			EXPECT_GE(sa.slope[cell].value(), 0);
			EXPECT_LE(sa.slope[cell].value(), 90);
			if (sa.aspect[cell].has_value()) {
				EXPECT_GE(sa.aspect[cell].value(), 0);
				EXPECT_LT(sa.aspect[cell].value(), 360);
			}
		}
	}

	TEST_F(TerrainTest, MetersPerUnitScalesHorizontalDistance) {
		Raster<metric_t> dem = makeDem([](rowcol_t, rowcol_t col) { return 1000. - 10. * col; });
		TerrainParams params;
		params.metersPerUnit = 10;
		SlopeAspect sa = deriveSlopeAspect(dem, params);
		double expected = std::atan(0.1) * 180. / M_PI;
		EXPECT_NEAR(sa.slope.atRC(2, 2).value(), expected, 0.001);

		params.metersPerUnit = 0;
		EXPECT_THROW(deriveSlopeAspect(dem, params), std::invalid_argument);
	}

	TEST_F(TerrainTest, NoDataCells) {
		Raster<metric_t> dem = makeDem([](rowcol_t, rowcol_t col) { return 1000. - 10. * col; });
		dem.atRC(2, 2).has_value() = false;
		SlopeAspect sa = deriveSlopeAspect(dem);
		EXPECT_FALSE(sa.slope.atRC(2, 2).has_value());
		EXPECT_FALSE(sa.aspect.atRC(2, 2).has_value());

		//the missing neighbor takes the neighbor's own center value, which flattens one side of the kernel
		ASSERT_TRUE(sa.slope.atRC(2, 1).has_value());
		EXPECT_LT(sa.slope.atRC(2, 1).value(), 45);
		EXPECT_GT(sa.slope.atRC(2, 1).value(), 0);
	}

	TEST_F(TerrainTest, ThicknessAboveSnowline) {
		Raster<metric_t> dem{ a, 2500.f };
		for (rowcol_t col = 0; col < a.ncol(); ++col) {
			dem.atRC(0, col).value() = 3500.f;
			dem.atRC(1, col).value() = 3000.f;
		}
		dem.atRC(4, 4).has_value() = false;
		Raster<metric_t> slope{ a, 10.f };

		GlacierProxy proxy = estimateThickness(dem, slope, 3000, 0.02);
		for (rowcol_t col = 0; col < a.ncol(); ++col) {
			EXPECT_NEAR(proxy.thickness.atRC(0, col).value(), 300, 0.001);
			EXPECT_NEAR(proxy.velocity.atRC(0, col).value(), 6, 0.001);
			EXPECT_NEAR(proxy.thickness.atRC(1, col).value(), 300, 0.001);
			EXPECT_FALSE(proxy.thickness.atRC(2, col).has_value());
			EXPECT_FALSE(proxy.velocity.atRC(2, col).has_value());
		}
		EXPECT_FALSE(proxy.thickness.atRC(4, 4).has_value());

		Raster<metric_t> otherGrid{ Alignment(Extent(0, 50, 0, 50), 10, 10) };
		EXPECT_THROW(estimateThickness(dem, otherGrid, 3000, 0.02), AlignmentMismatchException);
	}

	TEST_F(TerrainTest, SnowlineMask) {
		Raster<metric_t> dem = makeDem([](rowcol_t row, rowcol_t) { return 4000. - 500. * row; });
		dem.atRC(0, 0).has_value() = false;
		Raster<label_t> mask = snowlineMask(dem, 3000);
		EXPECT_FALSE(mask.atRC(0, 0).has_value());
		EXPECT_EQ(mask.atRC(0, 1).value(), 1);
		EXPECT_EQ(mask.atRC(2, 3).value(), 1);
		EXPECT_EQ(mask.atRC(3, 3).value(), 0);
		EXPECT_TRUE(mask.atRC(4, 4).has_value());
		EXPECT_EQ(mask.atRC(4, 4).value(), 0);
	}
}
