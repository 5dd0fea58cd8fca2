#include"RandomForest.hpp"

#include<omp.h>

namespace himal {

	namespace {
		double gini(const std::vector<cell_t>& counts, cell_t total) {
			if (total == 0) {
				return 0;
			}
			double sumSq = 0;
			for (cell_t c : counts) {
				double p = (double)c / total;
				sumSq += p * p;
			}
			return 1. - sumSq;
		}

		//the most common class; ties go to the lowest index
		int plurality(const std::vector<cell_t>& counts) {
			int best = 0;
			for (int i = 1; i < (int)counts.size(); ++i) {
				if (counts[i] > counts[best]) {
					best = i;
				}
			}
			return best;
		}
	}

	DecisionTree::DecisionTree(const std::vector<std::vector<double>>& features, const std::vector<int>& classIndices, int nClass,
		std::vector<size_t> rows, const ForestParams& params, int featuresPerSplit, std::mt19937_64& rng)
	{
		_grow(features, classIndices, nClass, rows, 0, rows.size(), 0, params, featuresPerSplit, rng);
	}

	int DecisionTree::predict(const std::vector<double>& features) const
	{
		int node = 0;
		while (_nodes[node].feature >= 0) {
			const Node& n = _nodes[node];
			node = features[n.feature] <= n.threshold ? n.left : n.right;
		}
		return _nodes[node].classIndex;
	}

	int DecisionTree::_grow(const std::vector<std::vector<double>>& features, const std::vector<int>& classIndices, int nClass,
		std::vector<size_t>& rows, size_t begin, size_t end, int depth, const ForestParams& params, int featuresPerSplit, std::mt19937_64& rng)
	{
		int thisNode = (int)_nodes.size();
		_nodes.emplace_back();

		const cell_t n = (cell_t)(end - begin);
		std::vector<cell_t> counts(nClass, 0);
		for (size_t i = begin; i < end; ++i) {
			counts[classIndices[rows[i]]]++;
		}
		_nodes[thisNode].classIndex = plurality(counts);

		bool pure = counts[_nodes[thisNode].classIndex] == n;
		bool tooDeep = params.maxDepth > 0 && depth >= params.maxDepth;
		if (pure || tooDeep || n < 2 * (cell_t)params.minLeafSize) {
			return thisNode;
		}

		//the features to consider at this node, sampled without replacement
		const int nFeature = (int)features.front().size();
		std::vector<int> candidates(nFeature);
		std::iota(candidates.begin(), candidates.end(), 0);
		for (int i = 0; i < featuresPerSplit; ++i) {
			std::uniform_int_distribution<int> pick(i, nFeature - 1);
			std::swap(candidates[i], candidates[pick(rng)]);
		}

		double bestImpurity = std::numeric_limits<double>::max();
		int bestFeature = -1;
		double bestThreshold = 0;
		std::vector<size_t> sorted(rows.begin() + begin, rows.begin() + end);
		for (int c = 0; c < featuresPerSplit; ++c) {
			int feature = candidates[c];
			std::stable_sort(sorted.begin(), sorted.end(),
				[&](size_t a, size_t b) { return features[a][feature] < features[b][feature]; });

			std::vector<cell_t> leftCounts(nClass, 0);
			std::vector<cell_t> rightCounts = counts;
			for (cell_t i = 0; i < n - 1; ++i) {
				int cls = classIndices[sorted[i]];
				leftCounts[cls]++;
				rightCounts[cls]--;
				double here = features[sorted[i]][feature];
				double next = features[sorted[i + 1]][feature];
				if (here == next) {
					continue;
				}
				cell_t nLeft = i + 1;
				cell_t nRight = n - nLeft;
				if (nLeft < params.minLeafSize || nRight < params.minLeafSize) {
					continue;
				}
				double impurity = (nLeft * gini(leftCounts, nLeft) + nRight * gini(rightCounts, nRight)) / n;
				if (impurity < bestImpurity) {
					bestImpurity = impurity;
					bestFeature = feature;
					bestThreshold = (here + next) / 2.;
				}
			}
		}

		if (bestFeature < 0) {
			return thisNode;
		}

		auto mid = std::stable_partition(rows.begin() + begin, rows.begin() + end,
			[&](size_t r) { return features[r][bestFeature] <= bestThreshold; });
		size_t split = mid - rows.begin();

		_nodes[thisNode].feature = bestFeature;
		_nodes[thisNode].threshold = bestThreshold;
		int left = _grow(features, classIndices, nClass, rows, begin, split, depth + 1, params, featuresPerSplit, rng);
		int right = _grow(features, classIndices, nClass, rows, split, end, depth + 1, params, featuresPerSplit, rng);
		_nodes[thisNode].left = left;
		_nodes[thisNode].right = right;
		return thisNode;
	}

	RandomForest RandomForest::train(const TrainingSet& samples, const ForestParams& params)
	{
		if (samples.size() == 0) {
			throw InvalidTrainingDataException("No training samples");
		}
		if (samples.features.size() != samples.labels.size()) {
			throw InvalidTrainingDataException("Different numbers of feature vectors and labels");
		}
		const size_t nFeature = samples.bandNames.size();
		if (nFeature == 0) {
			throw InvalidTrainingDataException("Training samples have no features");
		}
		for (const auto& f : samples.features) {
			if (f.size() != nFeature) {
				throw InvalidTrainingDataException("Feature vectors must all have one value per band");
			}
			for (double v : f) {
				if (!std::isfinite(v)) {
					throw InvalidTrainingDataException("Feature vectors must be finite");
				}
			}
		}
		if (params.nTrees < 1) {
			throw InvalidTrainingDataException("A forest needs at least one tree");
		}

		RandomForest out;
		out._bandNames = samples.bandNames;
		std::set<label_t> classSet(samples.labels.begin(), samples.labels.end());
		if (classSet.size() < 2) {
			throw InvalidTrainingDataException("Training samples must contain at least two classes");
		}
		out._classes.assign(classSet.begin(), classSet.end());

		std::vector<int> classIndices(samples.size());
		for (size_t i = 0; i < samples.size(); ++i) {
			classIndices[i] = (int)(std::lower_bound(out._classes.begin(), out._classes.end(), samples.labels[i]) - out._classes.begin());
		}

		int featuresPerSplit = params.featuresPerSplit;
		if (featuresPerSplit <= 0) {
			featuresPerSplit = (int)std::floor(std::sqrt((double)nFeature));
		}
		featuresPerSplit = std::clamp(featuresPerSplit, 1, (int)nFeature);
		ForestParams treeParams = params;
		treeParams.minLeafSize = std::max(1, params.minLeafSize);

		spdlog::info("[RandomForest] Training {} trees on {} samples with {} features", params.nTrees, samples.size(), nFeature);

		//each tree has its own generator, so the result doesn't depend on the thread schedule
		std::vector<std::optional<DecisionTree>> trees(params.nTrees);
		const size_t n = samples.size();
#pragma omp parallel for schedule(dynamic)
		for (int t = 0; t < params.nTrees; ++t) {
			std::seed_seq seq{ (std::uint32_t)(params.seed & 0xffffffff), (std::uint32_t)(params.seed >> 32), (std::uint32_t)t };
			std::mt19937_64 rng{ seq };
			std::uniform_int_distribution<size_t> draw(0, n - 1);
			std::vector<size_t> rows(n);
			for (size_t i = 0; i < n; ++i) {
				rows[i] = draw(rng);
			}
			trees[t].emplace(samples.features, classIndices, (int)out._classes.size(), std::move(rows), treeParams, featuresPerSplit, rng);
		}
		for (auto& tree : trees) {
			out._trees.push_back(std::move(tree.value()));
		}
		return out;
	}

	label_t RandomForest::predict(const std::vector<double>& features) const
	{
		if (features.size() != _bandNames.size()) {
			throw std::invalid_argument("Expected " + std::to_string(_bandNames.size()) + " features, got " + std::to_string(features.size()));
		}
		std::vector<cell_t> votes(_classes.size(), 0);
		for (const DecisionTree& tree : _trees) {
			votes[tree.predict(features)]++;
		}
		return _classes[plurality(votes)];
	}

	const std::vector<std::string>& RandomForest::bandNames() const
	{
		return _bandNames;
	}

	const std::vector<label_t>& RandomForest::classes() const
	{
		return _classes;
	}

	size_t RandomForest::nTrees() const
	{
		return _trees.size();
	}
}
