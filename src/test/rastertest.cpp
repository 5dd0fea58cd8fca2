#include"test_pch.hpp"
#include"../MultiBandRaster.hpp"

namespace himal {

	TEST(AlignmentTest, CellLookups) {
		Alignment a{ Extent(0, 4, 0, 2), 2, 4 };
		EXPECT_EQ(a.xres(), 1);
		EXPECT_EQ(a.yres(), 1);
		EXPECT_EQ(a.cellFromXY(0.5, 1.5), 0);
		EXPECT_EQ(a.cellFromXY(3.5, 0.5), 7);
		//the right and bottom edges belong to the last column and row
		EXPECT_EQ(a.cellFromXY(4, 0), 7);
		EXPECT_THROW(a.cellFromXY(4.5, 0), OutsideExtentException);
		EXPECT_DOUBLE_EQ(a.xFromCol(2), 2.5);
		EXPECT_DOUBLE_EQ(a.yFromRow(0), 1.5);
	}

	TEST(AlignmentTest, RowColExtentSnapping) {
		Alignment a{ Extent(0, 10, 0, 10), 10, 10 };
		Extent e{ 1.2, 3.7, 6.4, 8.9 };

		RowColExtent out = a.rowColExtent(e, SnapType::out);
		EXPECT_EQ(out.mincol, 1);
		EXPECT_EQ(out.maxcol, 3);
		EXPECT_EQ(out.minrow, 1);
		EXPECT_EQ(out.maxrow, 3);

		RowColExtent in = a.rowColExtent(e, SnapType::in);
		EXPECT_EQ(in.mincol, 2);
		EXPECT_EQ(in.maxcol, 2);
		EXPECT_EQ(in.minrow, 2);
		EXPECT_EQ(in.maxrow, 2);

		//centers at 1.5, 2.5, 3.5 fall inside [1.2, 3.7]
		RowColExtent near = a.rowColExtent(e, SnapType::near);
		EXPECT_EQ(near.mincol, 1);
		EXPECT_EQ(near.maxcol, 3);

		EXPECT_TRUE(a.rowColExtent(Extent(20, 30, 20, 30), SnapType::out).isEmpty());

		Alignment sub = a.subAlignment(out);
		EXPECT_EQ(sub.ncol(), 3);
		EXPECT_EQ(sub.nrow(), 3);
		EXPECT_DOUBLE_EQ(sub.xmin(), 1);
		EXPECT_DOUBLE_EQ(sub.ymax(), 9);
	}

	TEST(RasterTest, FillAndExtract) {
		Raster<metric_t> r{ Alignment(Extent(0, 3, 0, 3), 3, 3), 7.f };
		EXPECT_EQ(r.countValues(), 9);
		r.atRC(1, 1).has_value() = false;
		EXPECT_EQ(r.countValues(), 8);

		EXPECT_EQ(r.extract(0.2, 2.9).value(), 7.f);
		EXPECT_FALSE(r.extract(1.5, 1.5).has_value());
		EXPECT_FALSE(r.extract(-1, 1).has_value());

		r *= 2;
		r += 1;
		EXPECT_EQ(r.atRC(0, 0).value(), 15.f);
		EXPECT_FALSE(r.atRC(1, 1).has_value());
	}

	TEST(RasterTest, MaskByPolygonUsesCellCenters) {
		Raster<metric_t> r{ Alignment(Extent(0, 4, 0, 4), 4, 4), 1.f };
		//covers the centers of the left two columns, but only part of the third
		Polygon p{ std::vector<CoordXY>{ {0, 0}, {2.3, 0}, {2.3, 4}, {0, 4} } };
		r.maskByPolygon(MultiPolygon(p));
		for (rowcol_t row = 0; row < 4; ++row) {
			EXPECT_TRUE(r.atRC(row, 0).has_value());
			EXPECT_TRUE(r.atRC(row, 1).has_value());
			EXPECT_FALSE(r.atRC(row, 2).has_value());
			EXPECT_FALSE(r.atRC(row, 3).has_value());
		}
	}

	TEST(RasterTest, WriteAndReadWindow) {
		TempDir dir{ "rastertest" };
		std::string file = (dir.path() / "values.tif").string();

		Raster<metric_t> r{ Alignment(Extent(0, 4, 0, 4), 4, 4) };
		for (cell_t cell = 0; cell < r.ncell(); ++cell) {
			r[cell].has_value() = true;
			r[cell].value() = (metric_t)cell;
		}
		r[5].has_value() = false;
		r.writeRaster(file);

		Raster<metric_t> full{ file };
		EXPECT_EQ(full, r);

		Raster<metric_t> window{ file, Extent(0.5, 2.5, 1.5, 3.5), SnapType::out };
		ASSERT_EQ(window.ncol(), 3);
		ASSERT_EQ(window.nrow(), 3);
		EXPECT_DOUBLE_EQ(window.xmin(), 0);
		EXPECT_DOUBLE_EQ(window.ymax(), 4);
		EXPECT_EQ(window.atRC(0, 0).value(), 0.f);
		EXPECT_FALSE(window.atRC(1, 1).has_value());
		EXPECT_EQ(window.atRC(2, 2).value(), 10.f);

		EXPECT_THROW(Raster<metric_t>(file, Extent(10, 20, 10, 20), SnapType::out), OutsideExtentException);
		EXPECT_THROW(Raster<metric_t>((dir.path() / "missing.tif").string()), InvalidRasterFileException);
	}

	TEST(MultiBandRasterTest, NamedBands) {
		Alignment a{ Extent(0, 2, 0, 2), 2, 2 };
		MultiBandRaster<metric_t> m{ a, { "B3", "B8" } };
		EXPECT_EQ(m.nBands(), 2);
		EXPECT_EQ(m.bandIndex("B8"), 2);
		EXPECT_TRUE(m.hasBand("B3"));
		EXPECT_FALSE(m.hasBand("B4"));
		EXPECT_THROW(m.bandIndex("B4"), std::out_of_range);

		m.setBand(1, Raster<metric_t>(a, 3.f));
		EXPECT_EQ(m.bandByName("B3").atRC(1, 1).value(), 3.f);
		EXPECT_FALSE(m.bandByName("B8").hasAnyValue());

		EXPECT_THROW(m.setBand(2, Raster<metric_t>(Alignment(Extent(0, 4, 0, 4), 2, 2), 1.f)), AlignmentMismatchException);
	}

	TEST(MultiBandRasterTest, WriteAndReadWithNames) {
		TempDir dir{ "multibandtest" };
		std::string file = (dir.path() / "stack.tif").string();

		Alignment a{ Extent(0, 2, 0, 2), 2, 2 };
		MultiBandRaster<metric_t> m{ a, { "B3", "B8" } };
		m.setBand(1, Raster<metric_t>(a, 1.f));
		m.setBand(2, Raster<metric_t>(a, 2.f));
		m.writeRaster(file);

		MultiBandRaster<metric_t> described{ file };
		EXPECT_EQ(described.nBands(), 2);
		EXPECT_EQ(described.bandNames(), (std::vector<std::string>{ "B3", "B8" }));
		EXPECT_EQ(described.bandByName("B8").atRC(0, 0).value(), 2.f);

		MultiBandRaster<metric_t> renamed{ file, { "green", "nir" } };
		EXPECT_EQ(renamed.bandByName("nir").atRC(1, 1).value(), 2.f);

		EXPECT_THROW(MultiBandRaster<metric_t>(file, { "only_one" }), BandMismatchException);
	}
}
