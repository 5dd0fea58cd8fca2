#pragma once
#ifndef hm_hazardclassifier_h
#define hm_hazardclassifier_h

#include"MultiBandRaster.hpp"
#include"RandomForest.hpp"
#include"Vector.hpp"

namespace himal {

	//Samples the image at the nearest cell to each point, pairing the band values with the point's class
	//The class field may be an integer field or a real field (rounded)
	//Points outside of the image, or on a cell that's nodata in any of the bands, are dropped with a warning
	//If bands is empty, every band of the image is used, in order
	//throws InvalidTrainingDataException if a point has a null class, std::out_of_range if the class field or a band is missing,
	//WrongFieldTypeException if the class field is a string,
	//and CRSMismatchException if the points and the image have inconsistent CRSs
	TrainingSet extractFeatures(const MultiBandRaster<metric_t>& image, const VectorDataset<Point>& points,
		const std::string& classField = "class", const std::vector<std::string>& bands = {});

	//Applies the forest to every cell of the image, using the bands named by the forest
	//cells that are nodata in any of those bands are nodata in the output
	Raster<label_t> classify(const RandomForest& forest, const MultiBandRaster<metric_t>& image);

	//One supervised classification: a name for logging and output files, and its labeled points
	struct HazardProblem {
		std::string name;
		VectorDataset<Point> points;
		std::string classField = "class";
	};

	struct HazardResult {
		std::string name;
		TrainingSet samples;
		RandomForest forest;
		Raster<label_t> classification;
	};

	//extractFeatures, train, and classify in sequence
	HazardResult classifyHazard(const MultiBandRaster<metric_t>& image, const HazardProblem& problem,
		const ForestParams& params, const std::vector<std::string>& bands = {});
}

#endif
