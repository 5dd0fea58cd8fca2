#include"test_pch.hpp"
#include"../HazardClassifier.hpp"

namespace himal {

	namespace {
		TrainingSet separableSet() {
			TrainingSet ts;
			ts.bandNames = { "B1", "B2" };
			for (int i = 0; i <= 4; ++i) {
				ts.add({ (double)i, 2. * i + 0.1 }, 1);
			}
			for (int i = 6; i <= 10; ++i) {
				ts.add({ (double)i, 2. * i + 0.1 }, 2);
			}
			return ts;
		}

		TrainingSet noisySet() {
			TrainingSet ts;
			ts.bandNames = { "B1", "B2", "B3" };
			std::mt19937 rng{ 17 };
			std::uniform_real_distribution<double> dist{ 0, 1 };
			for (int i = 0; i < 60; ++i) {
				double a = dist(rng), b = dist(rng), c = dist(rng);
				ts.add({ a, b, c }, a + 0.3 * dist(rng) > 0.65 ? 5 : 3);
			}
			return ts;
		}
	}

	TEST(RandomForestTest, SeparableClasses) {
		RandomForest rf = RandomForest::train(separableSet());
		EXPECT_EQ(rf.nTrees(), 50);
		EXPECT_EQ(rf.classes(), (std::vector<label_t>{ 1, 2 }));
		EXPECT_EQ(rf.bandNames(), (std::vector<std::string>{ "B1", "B2" }));

		EXPECT_EQ(rf.predict({ 0.5, 1.1 }), 1);
		EXPECT_EQ(rf.predict({ 2, 4.1 }), 1);
		EXPECT_EQ(rf.predict({ 8, 16.1 }), 2);
		EXPECT_EQ(rf.predict({ 20, 40 }), 2);

		EXPECT_THROW(rf.predict({ 1 }), std::invalid_argument);
	}

	TEST(RandomForestTest, LabelsNeedNotBeConsecutive) {
		RandomForest rf = RandomForest::train(noisySet());
		EXPECT_EQ(rf.classes(), (std::vector<label_t>{ 3, 5 }));
		for (double a = 0; a <= 1; a += 0.1) {
			label_t l = rf.predict({ a, 0.5, 0.5 });
			EXPECT_TRUE(l == 3 || l == 5);
		}
	}

	TEST(RandomForestTest, SameSeedSameForest) {
		ForestParams params;
		params.nTrees = 20;
		params.seed = 42;
		RandomForest first = RandomForest::train(noisySet(), params);
		RandomForest second = RandomForest::train(noisySet(), params);

		std::mt19937 rng{ 3 };
		std::uniform_real_distribution<double> dist{ 0, 1 };
		for (int i = 0; i < 200; ++i) {
			std::vector<double> f{ dist(rng), dist(rng), dist(rng) };
			EXPECT_EQ(first.predict(f), second.predict(f));
		}
	}

	TEST(RandomForestTest, ParamsAreRespected) {
		ForestParams params;
		params.nTrees = 7;
		params.maxDepth = 1;
		params.featuresPerSplit = 3;
		RandomForest rf = RandomForest::train(noisySet(), params);
		EXPECT_EQ(rf.nTrees(), 7);

		params.featuresPerSplit = 50;
		EXPECT_NO_THROW(RandomForest::train(noisySet(), params));
	}

	TEST(DecisionTreeTest, StumpsAndFullTrees) {
		TrainingSet ts = separableSet();
		std::vector<int> classIndices;
		for (label_t l : ts.labels) {
			classIndices.push_back(l - 1);
		}
		std::vector<size_t> rows(ts.size());
		std::iota(rows.begin(), rows.end(), 0);
		std::mt19937_64 rng{ 1 };

		ForestParams params;
		DecisionTree full{ ts.features, classIndices, 2, rows, params, 2, rng };
		//a perfect split at the root, then two pure leaves
		EXPECT_EQ(full.nNodes(), 3);
		for (size_t i = 0; i < ts.size(); ++i) {
			EXPECT_EQ(full.predict(ts.features[i]), classIndices[i]);
		}

		params.maxDepth = 0;
		params.minLeafSize = 20;
		DecisionTree leaf{ ts.features, classIndices, 2, rows, params, 2, rng };
		EXPECT_EQ(leaf.nNodes(), 1);
	}

	TEST(RandomForestTest, InvalidTrainingData) {
		TrainingSet empty;
		EXPECT_THROW(RandomForest::train(empty), InvalidTrainingDataException);

		TrainingSet oneClass;
		oneClass.bandNames = { "B1" };
		oneClass.add({ 1 }, 1);
		oneClass.add({ 2 }, 1);
		EXPECT_THROW(RandomForest::train(oneClass), InvalidTrainingDataException);

		TrainingSet ragged = separableSet();
		ragged.features[3].push_back(7);
		EXPECT_THROW(RandomForest::train(ragged), InvalidTrainingDataException);

		TrainingSet nonFinite = separableSet();
		nonFinite.features[0][0] = std::numeric_limits<double>::quiet_NaN();
		EXPECT_THROW(RandomForest::train(nonFinite), InvalidTrainingDataException);

		TrainingSet mismatched = separableSet();
		mismatched.labels.pop_back();
		EXPECT_THROW(RandomForest::train(mismatched), InvalidTrainingDataException);

		ForestParams noTrees;
		noTrees.nTrees = 0;
		EXPECT_THROW(RandomForest::train(separableSet(), noTrees), InvalidTrainingDataException);
	}

	class HazardClassifierTest : public ::testing::Test {
	protected:
		Alignment a{ Extent(0, 4, 0, 4), 4, 4 };
		MultiBandRaster<metric_t> image{ a, { "B1", "B2" } };

		void SetUp() override {
			//the west half is dark and the east half is bright
			Raster<metric_t> b1{ a, 0.f };
			Raster<metric_t> b2{ a, 0.f };
			for (cell_t cell = 0; cell < a.ncell(); ++cell) {
				bool east = a.colFromCell(cell) >= 2;
				b1[cell].value() = east ? 0.8f : 0.1f;
				b2[cell].value() = east ? 0.6f + 0.01f * a.rowFromCell(cell) : 0.2f;
			}
			image.setBand(1, b1);
			image.setBand(2, b2);
		}

		VectorDataset<Point> labeledPoints() {
			VectorDataset<Point> points;
			points.addIntegerField("class");
			std::vector<std::tuple<double, double, int>> raw = {
				{ 0.5, 0.5, 0 }, { 1.5, 3.5, 0 }, { 0.5, 2.5, 0 },
				{ 2.5, 0.5, 1 }, { 3.5, 3.5, 1 }, { 3.5, 1.5, 1 },
			};
			for (const auto& [x, y, c] : raw) {
				points.addGeometry(Point(x, y));
				points.setIntegerField(points.nGeometry() - 1, "class", c);
			}
			return points;
		}
	};

	TEST_F(HazardClassifierTest, ExtractFeatures) {
		VectorDataset<Point> points = labeledPoints();
		points.addGeometry(Point(10, 10));
		points.setIntegerField(points.nGeometry() - 1, "class", 1);
		image.bandAt(2).atXY(0.5, 2.5).has_value() = false;

		TrainingSet ts = extractFeatures(image, points);
		ASSERT_EQ(ts.size(), 5);
		EXPECT_EQ(ts.bandNames, (std::vector<std::string>{ "B1", "B2" }));
		EXPECT_EQ(ts.labels, (std::vector<label_t>{ 0, 0, 1, 1, 1 }));
		EXPECT_NEAR(ts.features[0][0], 0.1, 0.0001);
		EXPECT_NEAR(ts.features[2][0], 0.8, 0.0001);
		//(2.5, 0.5) is in the bottom row
		EXPECT_NEAR(ts.features[2][1], 0.63, 0.0001);

		TrainingSet oneBand = extractFeatures(image, points, "class", { "B2" });
		EXPECT_EQ(oneBand.features[0].size(), 1);
		EXPECT_NEAR(oneBand.features[0][0], 0.2, 0.0001);
	}

	TEST_F(HazardClassifierTest, ClassFieldTypes) {
		VectorDataset<Point> points;
		points.addRealField("weight");
		points.addStringField("name", 8);
		points.addGeometry(Point(0.5, 0.5));
		points.setRealField(0, "weight", 1.6);
		points.setStringField(0, "name", "lake");

		TrainingSet ts = extractFeatures(image, points, "weight");
		ASSERT_EQ(ts.size(), 1);
		EXPECT_EQ(ts.labels[0], 2);

		EXPECT_THROW(extractFeatures(image, points, "name"), WrongFieldTypeException);
		EXPECT_THROW(extractFeatures(image, points, "missing"), std::out_of_range);
		EXPECT_THROW(extractFeatures(image, points, "weight", { "B9" }), std::out_of_range);
	}

	TEST_F(HazardClassifierTest, UnlabeledPointThrows) {
		TempDir dir{ "classifiertest_unlabeled" };
		VectorDataset<Point> points = labeledPoints();
		points.addGeometry(Point(1.5, 1.5));
		points.setFieldNull(points.nGeometry() - 1, "class");
		points.writeVector(dir.path() / "points.shp");

		VectorDataset<Point> fromFile{ dir.path() / "points.shp" };
		ASSERT_EQ(fromFile.nGeometry(), 7);
		EXPECT_FALSE(fromFile.isFieldNull(0, "class"));
		EXPECT_EQ(fromFile.getIntegerField(3, "class"), 1);
		EXPECT_TRUE(fromFile.isFieldNull(6, "class"));
		EXPECT_THROW(extractFeatures(image, fromFile), InvalidTrainingDataException);

		//once labeled, the point is used
		fromFile.setIntegerField(6, "class", 0);
		EXPECT_EQ(extractFeatures(image, fromFile).size(), 7);
	}

	TEST_F(HazardClassifierTest, ClassifyImage) {
		TrainingSet ts = extractFeatures(image, labeledPoints());
		RandomForest rf = RandomForest::train(ts);

		image.bandAt(1).atRC(0, 0).has_value() = false;
		Raster<label_t> classes = classify(rf, image);
		EXPECT_TRUE(classes.isSameAlignment(a));
		EXPECT_FALSE(classes.atRC(0, 0).has_value());
		for (cell_t cell = 1; cell < a.ncell(); ++cell) {
			ASSERT_TRUE(classes[cell].has_value());
			EXPECT_EQ(classes[cell].value(), a.colFromCell(cell) >= 2 ? 1 : 0);
		}
	}

	TEST_F(HazardClassifierTest, ClassifyHazard) {
		HazardProblem problem{ "glof", labeledPoints() };
		ForestParams params;
		params.nTrees = 10;
		params.seed = 5;
		HazardResult result = classifyHazard(image, problem, params);
		EXPECT_EQ(result.name, "glof");
		EXPECT_EQ(result.samples.size(), 6);
		EXPECT_EQ(result.forest.nTrees(), 10);
		EXPECT_EQ(result.classification.atRC(1, 3).value(), 1);
		EXPECT_EQ(result.classification.atRC(2, 0).value(), 0);

		MultiBandRaster<metric_t> projected{ Alignment(0, 0, 4, 4, 1, 1, CoordRef("EPSG:32645")), { "B1", "B2" } };
		VectorDataset<Point> geographic{ CoordRef("EPSG:4326") };
		geographic.addIntegerField("class");
		EXPECT_THROW(extractFeatures(projected, geographic), CRSMismatchException);
	}
}
