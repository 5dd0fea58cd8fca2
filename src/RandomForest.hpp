#pragma once
#ifndef hm_randomforest_h
#define hm_randomforest_h

#include"gis_pch.hpp"
#include"HimalGisTypeDefs.hpp"
#include"GisExceptions.hpp"

namespace himal {

	struct ForestParams {
		int nTrees = 50;
		//0 means floor(sqrt(number of features))
		int featuresPerSplit = 0;
		int minLeafSize = 1;
		//0 means unbounded
		int maxDepth = 0;
		std::uint64_t seed = 0;
	};

	//Feature vectors with their labels. bandNames gives the meaning of each position in a feature vector
	struct TrainingSet {
		std::vector<std::string> bandNames;
		std::vector<std::vector<double>> features;
		std::vector<label_t> labels;

		size_t size() const { return labels.size(); }
		void add(std::vector<double> f, label_t label) {
			features.push_back(std::move(f));
			labels.push_back(label);
		}
	};

	//A CART classification tree stored as a flat list of nodes, with the root at index 0
	class DecisionTree {
	public:
		//grows a tree on the given rows of the training set, which may contain repeats
		//labels must already be converted to class indices 0..nClass-1
		DecisionTree(const std::vector<std::vector<double>>& features, const std::vector<int>& classIndices, int nClass,
			std::vector<size_t> rows, const ForestParams& params, int featuresPerSplit, std::mt19937_64& rng);

		//the class index predicted for the given feature vector
		int predict(const std::vector<double>& features) const;

		size_t nNodes() const { return _nodes.size(); }

	private:
		struct Node {
			int feature = -1; //-1 for leaves
			double threshold = 0;
			int left = -1, right = -1;
			int classIndex = 0;
		};
		std::vector<Node> _nodes;

		int _grow(const std::vector<std::vector<double>>& features, const std::vector<int>& classIndices, int nClass,
			std::vector<size_t>& rows, size_t begin, size_t end, int depth, const ForestParams& params, int featuresPerSplit, std::mt19937_64& rng);
	};

	//An ensemble of decision trees, each grown on a bootstrap sample, voting by majority
	//Immutable once trained
	class RandomForest {
	public:
		//throws InvalidTrainingDataException if the samples are empty, ragged, non-finite, or contain only one class
		//the same samples and seed always produce the same forest
		static RandomForest train(const TrainingSet& samples, const ForestParams& params = ForestParams());

		//majority vote; ties go to the lowest label
		label_t predict(const std::vector<double>& features) const;

		const std::vector<std::string>& bandNames() const;
		const std::vector<label_t>& classes() const;
		size_t nTrees() const;

	private:
		RandomForest() = default;

		std::vector<DecisionTree> _trees;
		std::vector<std::string> _bandNames;
		std::vector<label_t> _classes;
	};
}

#endif
