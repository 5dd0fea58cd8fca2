#include"test_pch.hpp"
#include"../SpectralIndex.hpp"

namespace himal {

	class SpectralIndexTest : public ::testing::Test {
	public:
		Alignment a{ Extent(0, 3, 0, 1), 1, 3 };
		MultiBandRaster<metric_t> image{ a, { "B3", "B8" } };

		void setCell(cell_t cell, std::optional<metric_t> green, std::optional<metric_t> nir) {
			setValue(image.bandByName("B3"), cell, green);
			setValue(image.bandByName("B8"), cell, nir);
		}

		static void setValue(Raster<metric_t>& r, cell_t cell, std::optional<metric_t> v) {
			r[cell].has_value() = v.has_value();
			r[cell].value() = v.value_or(0);
		}
	};

	TEST_F(SpectralIndexTest, NormalizedDifference) {
		setCell(0, 0.3f, 0.1f);
		setCell(1, 0.f, 0.f);
		setCell(2, std::nullopt, 0.4f);

		Raster<metric_t> ndwi = normalizedDifference(image, "B3", "B8");
		EXPECT_EQ((Alignment)ndwi, a);
		ASSERT_TRUE(ndwi[0].has_value());
		EXPECT_NEAR(ndwi[0].value(), 0.5, 0.0001);
		//zero denominator
		EXPECT_FALSE(ndwi[1].has_value());
		//nodata input
		EXPECT_FALSE(ndwi[2].has_value());

		EXPECT_THROW(normalizedDifference(image, "B3", "B11"), std::out_of_range);
	}

	TEST_F(SpectralIndexTest, IndexIsWithinUnitRange) {
		std::mt19937 gen{ 1 };
		std::uniform_real_distribution<float> dist{ 0.f, 1.f };
		Alignment big{ Extent(0, 20, 0, 20), 20, 20 };
		Raster<metric_t> green{ big };
		Raster<metric_t> nir{ big };
		for (cell_t cell = 0; cell < big.ncell(); ++cell) {
			setValue(green, cell, dist(gen));
			setValue(nir, cell, cell % 7 ? dist(gen) : 0.f);
		}
		Raster<metric_t> ndwi = normalizedDifference(green, nir);
		for (cell_t cell = 0; cell < big.ncell(); ++cell) {
			ASSERT_TRUE(ndwi[cell].has_value());
			EXPECT_GE(ndwi[cell].value(), -1.f);
			EXPECT_LE(ndwi[cell].value(), 1.f);
		}
	}

	TEST_F(SpectralIndexTest, AlignmentMismatchThrows) {
		Raster<metric_t> other{ Alignment(Extent(0, 3, 0, 2), 2, 3), 1.f };
		EXPECT_THROW(normalizedDifference(image.bandByName("B3"), other), AlignmentMismatchException);
	}

	TEST_F(SpectralIndexTest, ThresholdAbove) {
		Raster<metric_t> index{ a };
		setValue(index, 0, 0.5f);
		setValue(index, 1, 0.51f);

		Raster<label_t> mask = thresholdAbove(index, 0.5);
		EXPECT_EQ(mask.countValues(), 3);
		EXPECT_EQ(mask[0].value(), 0);
		EXPECT_EQ(mask[1].value(), 1);
		//nodata is never above the threshold
		EXPECT_EQ(mask[2].value(), 0);
	}

	TEST_F(SpectralIndexTest, ThresholdIsMonotonic) {
		Alignment big{ Extent(0, 10, 0, 10), 10, 10 };
		Raster<metric_t> index{ big };
		for (cell_t cell = 0; cell < big.ncell(); ++cell) {
			setValue(index, cell, -1.f + 2.f * (float)cell / (float)big.ncell());
		}
		auto countSet = [](const Raster<label_t>& m) {
			cell_t n = 0;
			for (cell_t cell = 0; cell < m.ncell(); ++cell) {
				n += m[cell].value();
			}
			return n;
			};
		cell_t previous = std::numeric_limits<cell_t>::max();
		for (double t = -1.; t <= 1.; t += 0.1) {
			cell_t n = countSet(thresholdAbove(index, t));
			EXPECT_LE(n, previous) << "at threshold " << t;
			previous = n;
		}
	}
}
