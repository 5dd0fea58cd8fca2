#include"WatershedRun.hpp"

namespace {
	void printUsage(const char* exe) {
		std::cerr << "Usage: " << exe << " <config.yaml>\n"
			<< "Runs the watershed hazard analyses configured in the YAML file and writes their outputs to its output_dir\n";
	}
}

int main(int argc, char* argv[]) {
	if (argc != 2) {
		printUsage(argv[0]);
		return 2;
	}
	std::string arg = argv[1];
	if (arg == "-h" || arg == "--help") {
		printUsage(argv[0]);
		return 0;
	}

	try {
		himal::RunConfig cfg = himal::loadRunConfig(arg);
		std::vector<std::string> failed = himal::runFromConfig(cfg);
		if (failed.size()) {
			spdlog::error("{} of the configured analyses failed", failed.size());
			return 1;
		}
	}
	catch (const std::exception& e) {
		spdlog::error("{}", e.what());
		return 1;
	}
	return 0;
}
