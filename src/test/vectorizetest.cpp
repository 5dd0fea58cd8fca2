#include"test_pch.hpp"
#include"../Vectorize.hpp"
#include"../SpectralIndex.hpp"

namespace himal {

	namespace {
		//rows are given top to bottom; '#' is set, '.' is unset, anything else is nodata
		Raster<label_t> maskFromPicture(const std::vector<std::string>& picture) {
			rowcol_t nrow = (rowcol_t)picture.size();
			rowcol_t ncol = (rowcol_t)picture[0].size();
			Raster<label_t> out{ Alignment(Extent(0, ncol, 0, nrow), nrow, ncol) };
			for (rowcol_t row = 0; row < nrow; ++row) {
				for (rowcol_t col = 0; col < ncol; ++col) {
					char c = picture[row][col];
					if (c == '#' || c == '.') {
						out.atRC(row, col).has_value() = true;
						out.atRC(row, col).value() = c == '#' ? 1 : 0;
					}
				}
			}
			return out;
		}
	}

	TEST(VectorizeTest, EmptyMask) {
		Raster<label_t> mask = maskFromPicture({ "....", "....", "...." });
		VectorDataset<Polygon> polys = vectorizeMask(mask);
		EXPECT_EQ(polys.nFeature(), 0);
		EXPECT_EQ(polys.getAllFieldNames().size(), 2);
	}

	TEST(VectorizeTest, FullMask) {
		Raster<label_t> mask = maskFromPicture({ "#####", "#####", "#####" });
		VectorDataset<Polygon> polys = vectorizeMask(mask);
		ASSERT_EQ(polys.nFeature(), 1);

		const Polygon& p = polys.getGeometry(0);
		EXPECT_EQ(p.nInnerRings(), 0);
		//four corners plus the closing vertex
		EXPECT_EQ(p.getOuterRing().size(), 5);
		EXPECT_NEAR(p.area(), mask.area(), 0.0001);
		EXPECT_EQ(p.boundingBox(), (Extent)mask);
		EXPECT_EQ(polys.getIntegerField(0, "ID"), 1);
		EXPECT_EQ(polys.getIntegerField(0, "NCELL"), 15);
	}

	TEST(VectorizeTest, CheckerboardConnectivity) {
		Raster<label_t> mask = maskFromPicture({ "#.#.", ".#.#", "#.#.", ".#.#" });

		VectorDataset<Polygon> four = vectorizeMask(mask, Connectivity::four);
		ASSERT_EQ(four.nFeature(), 8);
		for (size_t i = 0; i < four.nFeature(); ++i) {
			EXPECT_NEAR(four.getGeometry(i).area(), 1., 0.0001);
			EXPECT_EQ(four.getGeometry(i).nInnerRings(), 0);
			EXPECT_EQ(four.getIntegerField(i, "ID"), (int64_t)i + 1);
			EXPECT_EQ(four.getIntegerField(i, "NCELL"), 1);
		}
		//components are numbered in scan order
		EXPECT_NEAR(four.getGeometry(1).boundingBox().xmin(), 2, 0.0001);
		EXPECT_NEAR(four.getGeometry(1).boundingBox().ymax(), 4, 0.0001);

		VectorDataset<Polygon> eight = vectorizeMask(mask, Connectivity::eight);
		ASSERT_EQ(eight.nFeature(), 1);
		EXPECT_EQ(eight.getIntegerField(0, "NCELL"), 8);
		EXPECT_NEAR(eight.getGeometry(0).area(), 8., 0.0001);
		//the two unset cells away from the border are enclosed by diagonal links
		EXPECT_EQ(eight.getGeometry(0).nInnerRings(), 2);
	}

	TEST(VectorizeTest, RingAroundHole) {
		Raster<label_t> mask = maskFromPicture({ ".....", ".###.", ".#.#.", ".###.", "....." });
		VectorDataset<Polygon> polys = vectorizeMask(mask);
		ASSERT_EQ(polys.nFeature(), 1);

		const Polygon& p = polys.getGeometry(0);
		ASSERT_EQ(p.nInnerRings(), 1);
		EXPECT_NEAR(p.area(), 8., 0.0001);
		EXPECT_GT(Polygon::signedRingArea(p.getOuterRing()), 0);
		EXPECT_LT(Polygon::signedRingArea(p.getInnerRing(0)), 0);
		EXPECT_NEAR(std::abs(Polygon::signedRingArea(p.getInnerRing(0))), 1., 0.0001);
		EXPECT_FALSE(p.containsPoint(2.5, 2.5));
		EXPECT_TRUE(p.containsPoint(1.5, 2.5));
	}

	TEST(VectorizeTest, HoleTouchingOutsideAtCorner) {
		//the unset center cell meets the unset bottom-right cell at a corner
		Raster<label_t> mask = maskFromPicture({ "###", "#.#", "##." });
		auto noRepeatedVertex = [](const Ring& ring) {
			std::set<std::pair<coord_t, coord_t>> seen;
			for (size_t i = 0; i + 1 < ring.size(); ++i) {
				if (!seen.insert({ ring[i].x, ring[i].y }).second) {
					return false;
				}
			}
			return true;
			};

		for (Connectivity connectivity : { Connectivity::four, Connectivity::eight }) {
			VectorDataset<Polygon> polys = vectorizeMask(mask, connectivity);
			ASSERT_EQ(polys.nFeature(), 1);
			const Polygon& p = polys.getGeometry(0);
			EXPECT_EQ(polys.getIntegerField(0, "NCELL"), 7);

			//an L-shaped outer ring around a one-cell hole
			EXPECT_EQ(p.getOuterRing().size(), 7);
			EXPECT_TRUE(noRepeatedVertex(p.getOuterRing()));
			ASSERT_EQ(p.nInnerRings(), 1);
			EXPECT_TRUE(noRepeatedVertex(p.getInnerRing(0)));
			EXPECT_GT(Polygon::signedRingArea(p.getOuterRing()), 0);
			EXPECT_NEAR(Polygon::signedRingArea(p.getInnerRing(0)), -1., 0.0001);
			EXPECT_NEAR(p.area(), 7., 0.0001);

			EXPECT_FALSE(p.containsPoint(1.5, 1.5));
			EXPECT_FALSE(p.containsPoint(2.5, 0.5));
			EXPECT_TRUE(p.containsPoint(0.5, 0.5));
		}
	}

	TEST(VectorizeTest, NoDataIsNotSet) {
		Raster<label_t> mask = maskFromPicture({ "#x#", "xxx", "#x#" });
		VectorDataset<Polygon> polys = vectorizeMask(mask, Connectivity::eight);
		EXPECT_EQ(polys.nFeature(), 4);
	}

	TEST(VectorizeTest, Deterministic) {
		Raster<label_t> mask = maskFromPicture({ "##..#", "#..##", "..#..", "##..#" });
		VectorDataset<Polygon> first = vectorizeMask(mask);
		VectorDataset<Polygon> second = vectorizeMask(mask);
		ASSERT_EQ(first.nFeature(), second.nFeature());
		for (size_t i = 0; i < first.nFeature(); ++i) {
			EXPECT_EQ(first.getGeometry(i).getOuterRing(), second.getGeometry(i).getOuterRing());
		}
	}

	TEST(VectorizeTest, WaterBlockEndToEnd) {
		//the top-left 2x2 block is water by NDWI, the rest isn't
		Alignment a{ Extent(0, 4, 0, 4), 4, 4 };
		MultiBandRaster<metric_t> image{ a, { "B3", "B8" } };
		Raster<metric_t> green{ a, 0.1f };
		Raster<metric_t> nir{ a, 0.5f };
		for (rowcol_t row = 0; row < 2; ++row) {
			for (rowcol_t col = 0; col < 2; ++col) {
				green.atRC(row, col).value() = 0.5f;
				nir.atRC(row, col).value() = 0.1f;
			}
		}
		image.setBand(1, green);
		image.setBand(2, nir);

		Raster<label_t> mask = thresholdAbove(normalizedDifference(image, "B3", "B8"), 0.3);
		VectorDataset<Polygon> lakes = vectorizeMask(mask);

		ASSERT_EQ(lakes.nFeature(), 1);
		const Polygon& lake = lakes.getGeometry(0);
		EXPECT_NEAR(lake.area(), 4., 0.0001);
		EXPECT_EQ(lake.nInnerRings(), 0);
		EXPECT_EQ(lake.boundingBox(), Extent(0, 2, 2, 4));
		EXPECT_EQ(lakes.getIntegerField(0, "NCELL"), 4);
	}

	TEST(VectorizeTest, WritesShapefile) {
		TempDir dir{ "vectorizetest" };
		Raster<label_t> mask = maskFromPicture({ "#..", "..#" });
		VectorDataset<Polygon> polys = vectorizeMask(mask, Connectivity::four);
		polys.writeVector(dir.path() / "lakes.shp");

		VectorDataset<Polygon> read{ dir.path() / "lakes.shp" };
		ASSERT_EQ(read.nFeature(), 2);
		EXPECT_EQ(read.getIntegerField(1, "ID"), 2);
		EXPECT_NEAR(read.getGeometry(1).area(), 1., 0.0001);
	}
}
