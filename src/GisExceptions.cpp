#include"GisExceptions.hpp"

namespace himal {
	InvalidAlignmentException::InvalidAlignmentException(const std::string& error) : std::runtime_error(error) {}
	AlignmentMismatchException::AlignmentMismatchException(const std::string& error) : std::runtime_error(error) {}
	OutsideExtentException::OutsideExtentException(const std::string& error) : std::out_of_range(error) {}
	CRSMismatchException::CRSMismatchException(const std::string& error) : std::runtime_error(error) {}
	UnableToDeduceCRSException::UnableToDeduceCRSException(const std::string& error) : std::runtime_error(error) {}
	InvalidRasterFileException::InvalidRasterFileException(const std::string& error) : std::runtime_error(error) {}
	InvalidVectorFileException::InvalidVectorFileException(const std::string& error) : std::runtime_error(error) {}
	BandMismatchException::BandMismatchException(const std::string& error) : std::runtime_error(error) {}
	InvalidTrainingDataException::InvalidTrainingDataException(const std::string& error) : std::runtime_error(error) {}
	InvalidConfigException::InvalidConfigException(const std::string& error) : std::invalid_argument(error) {}
}
