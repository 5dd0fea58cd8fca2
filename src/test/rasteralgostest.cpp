#include"test_pch.hpp"
#include"../RasterAlgos.hpp"

namespace himal {

	class RasterAlgosTest : public ::testing::Test {
	public:

		Raster<double> r;
		Alignment a;

		void SetUp() override {
			a = Alignment(Extent(0, 4, 0, 4), 2, 2);
			r = Raster<double>(Alignment(Extent(0, 4, 0, 4), 4, 4));
			for (cell_t cell = 0; cell < r.ncell(); ++cell) {
				r[cell].value() = (int)cell;
				r[cell].has_value() = true;
			}
			r[0].has_value() = false;
			r[1].has_value() = false;
			r[4].has_value() = false;
			r[5].has_value() = false;
			r[15].has_value() = false;
		}
	};

	TEST_F(RasterAlgosTest, AggregateMean) {
		auto out = aggregateMean(r, a);

		EXPECT_EQ((Alignment)out, a);

		EXPECT_FALSE(out[0].has_value());
		EXPECT_TRUE(out[1].has_value());
		EXPECT_TRUE(out[2].has_value());
		EXPECT_TRUE(out[3].has_value());

		EXPECT_NEAR(out[1].value(), 4.5, 0.01);
		EXPECT_NEAR(out[2].value(), 10.5, 0.01);
		EXPECT_NEAR(out[3].value(), 11.7, 0.1);
	}

	TEST_F(RasterAlgosTest, AggregateMeanPartialCoverage) {
		//a coarse grid that extends past the raster; the cells past the edge only see the part that overlaps
		Alignment coarse{ 0, -2, 3, 2, 2, 2 };
		auto out = aggregateMean(r, coarse);
		ASSERT_EQ(out.nrow(), 3);
		EXPECT_NEAR(out.atRC(0, 1).value(), 4.5, 0.01);
		EXPECT_FALSE(out.atRC(2, 0).has_value());
		EXPECT_FALSE(out.atRC(2, 1).has_value());
	}

	TEST_F(RasterAlgosTest, ConnectedComponentsTest) {
		Raster<int> r{ Alignment(Extent(0,5,0,5),5,5) };
		/*
		*  NA  1  NA  2  2
		*   1  1  NA  NA  2
		*  NA NA  NA  5 NA
		*   3  6   4  4  5
		*   3  3  NA NA  NA
		*/
		r.atRCUnsafe(0, 1).value() = 1; r.atRCUnsafe(0, 1).has_value() = true;
		r.atRCUnsafe(0, 3).value() = 2; r.atRCUnsafe(0, 3).has_value() = true;
		r.atRCUnsafe(0, 4).value() = 2; r.atRCUnsafe(0, 4).has_value() = true;
		r.atRCUnsafe(1, 0).value() = 1; r.atRCUnsafe(1, 0).has_value() = true;
		r.atRCUnsafe(1, 1).value() = 1; r.atRCUnsafe(1, 1).has_value() = true;
		r.atRCUnsafe(1, 4).value() = 2; r.atRCUnsafe(1, 4).has_value() = true;
		r.atRCUnsafe(2, 3).value() = 5; r.atRCUnsafe(2, 3).has_value() = true;
		r.atRCUnsafe(3, 0).value() = 3; r.atRCUnsafe(3, 0).has_value() = true;
		r.atRCUnsafe(3, 1).value() = 6; r.atRCUnsafe(3, 1).has_value() = true;
		r.atRCUnsafe(3, 2).value() = 4; r.atRCUnsafe(3, 2).has_value() = true;
		r.atRCUnsafe(3, 3).value() = 4; r.atRCUnsafe(3, 3).has_value() = true;
		r.atRCUnsafe(3, 4).value() = 5; r.atRCUnsafe(3, 4).has_value() = true;
		r.atRCUnsafe(4, 0).value() = 3; r.atRCUnsafe(4, 0).has_value() = true;
		r.atRCUnsafe(4, 1).value() = 3; r.atRCUnsafe(4, 1).has_value() = true;

		Raster<cell_t> withDiagonals = connectedComponents(r, Connectivity::eight);
		Raster<cell_t> withoutDiagonals = connectedComponents(r, Connectivity::four);

		ASSERT_EQ((Alignment)r, (Alignment(withDiagonals)));
		ASSERT_EQ((Alignment)r, (Alignment(withoutDiagonals)));

		//check NAs are in the right places, first
		for (cell_t cell : CellIterator(r)) {
			EXPECT_EQ(r.atCellUnsafe(cell).has_value(), withDiagonals.atCellUnsafe(cell).has_value()) << " at cell " << cell;
			EXPECT_EQ(r.atCellUnsafe(cell).has_value(), withoutDiagonals.atCellUnsafe(cell).has_value()) << " at cell " << cell;
		}

		//labels are assigned in the order each component's first cell appears
		EXPECT_EQ(withDiagonals.atRCUnsafe(0, 1).value(), 1);
		EXPECT_EQ(withDiagonals.atRCUnsafe(1, 0).value(), 1);
		EXPECT_EQ(withDiagonals.atRCUnsafe(1, 1).value(), 1);
		EXPECT_EQ(withDiagonals.atRCUnsafe(0, 3).value(), 2);
		EXPECT_EQ(withDiagonals.atRCUnsafe(0, 4).value(), 2);
		EXPECT_EQ(withDiagonals.atRCUnsafe(1, 4).value(), 2);
		EXPECT_EQ(withDiagonals.atRCUnsafe(2, 3).value(), 3);
		EXPECT_EQ(withDiagonals.atRCUnsafe(3, 4).value(), 3);
		EXPECT_EQ(withDiagonals.atRCUnsafe(3, 0).value(), 4);
		EXPECT_EQ(withDiagonals.atRCUnsafe(4, 0).value(), 4);
		EXPECT_EQ(withDiagonals.atRCUnsafe(4, 1).value(), 4);
		EXPECT_EQ(withDiagonals.atRCUnsafe(3, 1).value(), 5);
		EXPECT_EQ(withDiagonals.atRCUnsafe(3, 2).value(), 6);
		EXPECT_EQ(withDiagonals.atRCUnsafe(3, 3).value(), 6);

		//without diagonals, the 5s are split in two
		EXPECT_EQ(withoutDiagonals.atRCUnsafe(2, 3).value(), 3);
		EXPECT_EQ(withoutDiagonals.atRCUnsafe(3, 0).value(), 4);
		EXPECT_EQ(withoutDiagonals.atRCUnsafe(3, 1).value(), 5);
		EXPECT_EQ(withoutDiagonals.atRCUnsafe(3, 2).value(), 6);
		EXPECT_EQ(withoutDiagonals.atRCUnsafe(3, 4).value(), 7);
	}
}
