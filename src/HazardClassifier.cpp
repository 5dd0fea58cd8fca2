#include"HazardClassifier.hpp"

#include<omp.h>

namespace himal {

	TrainingSet extractFeatures(const MultiBandRaster<metric_t>& image, const VectorDataset<Point>& points,
		const std::string& classField, const std::vector<std::string>& bands)
	{
		if (!points.crs().isConsistentHoriz(image.crs())) {
			throw CRSMismatchException("Training points and image have different CRSs");
		}

		TrainingSet out;
		out.bandNames = bands.size() ? bands : image.bandNames();
		std::vector<band_t> bandIndices;
		for (const std::string& name : out.bandNames) {
			bandIndices.push_back(image.bandIndex(name));
		}

		FieldType type = points.getFieldType(classField);
		if (type == FieldType::String) {
			throw WrongFieldTypeException("Class field " + classField + " must be numeric");
		}

		cell_t droppedOutside = 0;
		cell_t droppedNoData = 0;
		for (size_t i = 0; i < points.nGeometry(); ++i) {
			const Point& p = points.getGeometry(i);
			if (points.isFieldNull(i, classField)) {
				throw InvalidTrainingDataException("Training point (" + std::to_string(p.x()) + ", " + std::to_string(p.y())
					+ ") has no value in " + classField);
			}
			if (!image.contains(p.x(), p.y())) {
				spdlog::warn("[HazardClassifier] Dropping training point ({}, {}): outside of the image", p.x(), p.y());
				++droppedOutside;
				continue;
			}
			cell_t cell = image.cellFromXY(p.x(), p.y());
			std::vector<double> f;
			f.reserve(bandIndices.size());
			for (band_t band : bandIndices) {
				auto v = image.atCellUnsafe(cell, band);
				if (!v.has_value()) {
					break;
				}
				f.push_back(v.value());
			}
			if (f.size() != bandIndices.size()) {
				spdlog::warn("[HazardClassifier] Dropping training point ({}, {}): nodata in the image", p.x(), p.y());
				++droppedNoData;
				continue;
			}
			label_t label = type == FieldType::Integer
				? (label_t)points.getIntegerField(i, classField)
				: (label_t)std::lround(points.getRealField(i, classField));
			out.add(std::move(f), label);
		}
		spdlog::info("[HazardClassifier] Extracted {} samples; dropped {} outside the image and {} on nodata", out.size(), droppedOutside, droppedNoData);
		return out;
	}

	Raster<label_t> classify(const RandomForest& forest, const MultiBandRaster<metric_t>& image)
	{
		std::vector<band_t> bandIndices;
		for (const std::string& name : forest.bandNames()) {
			bandIndices.push_back(image.bandIndex(name));
		}

		const cell_t n = image.ncell();
		std::vector<label_t> labels(n, 0);
		std::vector<char> valid(n, 0);

#pragma omp parallel
		{
			std::vector<double> f(bandIndices.size());
#pragma omp for schedule(static)
			for (rowcol_t row = 0; row < image.nrow(); ++row) {
				for (rowcol_t col = 0; col < image.ncol(); ++col) {
					cell_t cell = image.cellFromRowColUnsafe(row, col);
					bool hasAll = true;
					for (size_t b = 0; b < bandIndices.size(); ++b) {
						auto v = image.atCellUnsafe(cell, bandIndices[b]);
						if (!v.has_value()) {
							hasAll = false;
							break;
						}
						f[b] = v.value();
					}
					if (!hasAll) {
						continue;
					}
					labels[cell] = forest.predict(f);
					valid[cell] = 1;
				}
			}
		}

		Raster<label_t> out{ (Alignment)image };
		for (cell_t cell = 0; cell < n; ++cell) {
			if (valid[cell]) {
				out[cell].has_value() = true;
				out[cell].value() = labels[cell];
			}
		}
		return out;
	}

	HazardResult classifyHazard(const MultiBandRaster<metric_t>& image, const HazardProblem& problem,
		const ForestParams& params, const std::vector<std::string>& bands)
	{
		spdlog::info("[HazardClassifier] Classifying {}", problem.name);
		TrainingSet samples = extractFeatures(image, problem.points, problem.classField, bands);
		RandomForest forest = RandomForest::train(samples, params);
		Raster<label_t> classification = classify(forest, image);
		return HazardResult{ problem.name, std::move(samples), std::move(forest), std::move(classification) };
	}
}
