#pragma once
#ifndef hm_gisexceptions_h
#define hm_gisexceptions_h

#include"gis_pch.hpp"

namespace himal {

	class InvalidAlignmentException : public std::runtime_error {
	public:
		InvalidAlignmentException(const std::string& error);
	};
	class AlignmentMismatchException : public std::runtime_error {
	public:
		AlignmentMismatchException(const std::string& error);
	};
	class OutsideExtentException : public std::out_of_range {
	public:
		OutsideExtentException(const std::string& error);
	};
	class CRSMismatchException : public std::runtime_error {
	public:
		CRSMismatchException(const std::string& error);
	};
	class UnableToDeduceCRSException : public std::runtime_error {
	public:
		UnableToDeduceCRSException(const std::string& error);
	};
	class InvalidRasterFileException : public std::runtime_error {
	public:
		InvalidRasterFileException(const std::string& error);
	};
	class InvalidVectorFileException : public std::runtime_error {
	public:
		InvalidVectorFileException(const std::string& error);
	};

	//the band list of an image doesn't match the schema of the collection or the model it's used with
	class BandMismatchException : public std::runtime_error {
	public:
		BandMismatchException(const std::string& error);
	};

	//training data that can't produce a classifier: empty, ragged, or only one class
	class InvalidTrainingDataException : public std::runtime_error {
	public:
		InvalidTrainingDataException(const std::string& error);
	};

	class InvalidConfigException : public std::invalid_argument {
	public:
		InvalidConfigException(const std::string& error);
	};
}

#endif
