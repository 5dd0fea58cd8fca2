#pragma once
#ifndef himal_vector_h
#define himal_vector_h

#include"gis_pch.hpp"
#include"Geometry.hpp"
#include"GDALWrappers.hpp"
#include"GisExceptions.hpp"

namespace himal {

	class WrongFieldTypeException : public std::runtime_error {
	public:
		WrongFieldTypeException(const std::string& error);
	};

	enum class FieldType {
		Integer,
		Real,
		String
	};

	//Typed columns of feature attributes, in the order the fields were added
	//Every getter and setter throws std::out_of_range if the field doesn't exist and WrongFieldTypeException if it has another type
	//A value can be null; the getters return zero or an empty string for a null value
	class AttributeTable {
	public:
		AttributeTable() = default;
		virtual ~AttributeTable() = default;

		//strings longer than width are truncated when set
		//adding a field that already exists throws std::invalid_argument
		void addStringField(const std::string& name, size_t width);
		void addIntegerField(const std::string& name);
		void addRealField(const std::string& name);

		//adds every field of other that isn't already present here, with the same type and width
		void addFieldsFrom(const AttributeTable& other);
		//copies row otherIndex of other into row index of this table, for every field of other
		void copyRow(size_t index, const AttributeTable& other, size_t otherIndex);

		size_t nFeature() const;

		const std::vector<std::string>& getAllFieldNames() const;
		bool fieldExists(const std::string& name) const;
		FieldType getFieldType(const std::string& name) const;
		size_t getStringFieldWidth(const std::string& name) const;

		const std::string& getStringField(size_t index, const std::string& name) const;
		int64_t getIntegerField(size_t index, const std::string& name) const;
		double getRealField(size_t index, const std::string& name) const;

		void setStringField(size_t index, const std::string& name, const std::string& value);
		void setIntegerField(size_t index, const std::string& name, int64_t value);
		void setRealField(size_t index, const std::string& name, double value);

		//setting a value makes it non-null
		bool isFieldNull(size_t index, const std::string& name) const;
		void setFieldNull(size_t index, const std::string& name);

	protected:
		//a new row with zeros and empty strings in every field, none of them null
		void _addRow();

	private:
		using Column = std::variant<std::vector<int64_t>, std::vector<double>, std::vector<std::string>>;
		struct Field {
			FieldType type;
			size_t width; //strings only
			Column values;
			std::vector<char> isNull;
		};

		size_t _nrow = 0;
		std::unordered_map<std::string, Field> _fields;
		std::vector<std::string> _fieldNamesInOrder;

		void _addField(const std::string& name, FieldType type, size_t width);
		const Field& _field(const std::string& name) const;
		Field& _field(const std::string& name);

		template<class T>
		const std::vector<T>& _column(const std::string& name, FieldType type) const {
			const Field& f = _field(name);
			if (f.type != type) {
				throw WrongFieldTypeException("Field " + name + " is not of the requested type");
			}
			return std::get<std::vector<T>>(f.values);
		}
		template<class T>
		std::vector<T>& _column(const std::string& name, FieldType type) {
			return const_cast<std::vector<T>&>(std::as_const(*this)._column<T>(name, type));
		}
	};

	//Geometries of one type with their attributes and a shared CRS
	template<class GEOMETRY>
	class VectorDataset : public AttributeTable {
	public:
		class Feature;
		class const_iterator;

		VectorDataset() = default;
		explicit VectorDataset(const CoordRef& crs);
		//throws InvalidVectorFileException if the file can't be read or has the wrong geometry type
		VectorDataset(const std::string& filename);
		VectorDataset(const std::filesystem::path& filename);

		//driver is any GDAL vector driver that can create files, e.g. "ESRI Shapefile" or "GeoJSON"
		void writeVector(const std::filesystem::path& filename, const std::string& driver = "ESRI Shapefile") const;

		const_iterator begin() const;
		const_iterator end() const;

		const CoordRef& crs() const;

		const GEOMETRY& getGeometry(size_t index) const;
		//appends a feature with default attributes; throws CRSMismatchException if the geometry's CRS differs from the dataset's
		void addGeometry(const GEOMETRY& g);
		size_t nGeometry() const;

		//a read-only view of one geometry and its attributes
		class Feature {
		public:
			Feature(const VectorDataset& dataset, size_t index) : _dataset(dataset), _index(index) {}

			const GEOMETRY& getGeometry() const { return _dataset.getGeometry(_index); }
			const std::string& getStringField(const std::string& name) const { return _dataset.getStringField(_index, name); }
			int64_t getIntegerField(const std::string& name) const { return _dataset.getIntegerField(_index, name); }
			double getRealField(const std::string& name) const { return _dataset.getRealField(_index, name); }

		private:
			const VectorDataset& _dataset;
			size_t _index;
		};

		class const_iterator {
		public:
			const_iterator(const VectorDataset& dataset, size_t index) : _dataset(&dataset), _index(index) {}

			const_iterator& operator++() { ++_index; return *this; }
			bool operator==(const const_iterator& other) const = default;
			Feature operator*() const { return Feature(*_dataset, _index); }

		private:
			const VectorDataset* _dataset;
			size_t _index;
		};

	private:
		CoordRef _crs;
		std::vector<GEOMETRY> _geometries;

		void _constructFromFilename(const std::string& filename);
	};

	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::VectorDataset(const CoordRef& crs)
		: _crs(crs)
	{
	}
	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::VectorDataset(const std::string& filename)
	{
		_constructFromFilename(filename);
	}
	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::VectorDataset(const std::filesystem::path& filename)
	{
		_constructFromFilename(filename.string());
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::writeVector(const std::filesystem::path& filename, const std::string& driver) const
	{
		UniqueGdalDataset out = gdalCreateWrapper(driver, filename.string(), 0, 0, 0, GDT_Unknown);
		if (!out) {
			throw InvalidVectorFileException("Unable to create " + filename.string());
		}
		UniqueOSR osr = _crs.gdalSpatialRef();

		OGRLayer* layer = out->CreateLayer(filename.stem().string().c_str(), osr.get(), GEOMETRY::gdalGeometryTypeStatic, nullptr);
		if (!layer) {
			throw InvalidVectorFileException("Unable to create a layer in " + filename.string());
		}

		for (const auto& fieldName : getAllFieldNames()) {
			OGRFieldDefn newField = OGRFieldDefn(fieldName.c_str(), OFTString);
			switch (getFieldType(fieldName)) {
			case FieldType::String:
				newField.SetType(OFTString);
				newField.SetWidth((int)getStringFieldWidth(fieldName));
				break;
			case FieldType::Real:
				newField.SetType(OFTReal);
				break;
			case FieldType::Integer:
				newField.SetType(OFTInteger64);
				break;
			}
			if (layer->CreateField(&newField) != OGRERR_NONE) {
				throw InvalidVectorFileException("Unable to create field " + fieldName + " in " + filename.string());
			}
		}
		for (size_t i = 0; i < nFeature(); ++i) {
			UniqueOGRFeature gdalFeature = createFeatureWrapper(layer);
			for (const auto& fieldName : getAllFieldNames()) {
				if (isFieldNull(i, fieldName)) {
					gdalFeature->SetFieldNull(gdalFeature->GetFieldIndex(fieldName.c_str()));
					continue;
				}
				switch (getFieldType(fieldName)) {
				case FieldType::String:
					gdalFeature->SetField(fieldName.c_str(), getStringField(i, fieldName).c_str());
					break;
				case FieldType::Real:
					gdalFeature->SetField(fieldName.c_str(), getRealField(i, fieldName));
					break;
				case FieldType::Integer:
					gdalFeature->SetField(fieldName.c_str(), (GIntBig)getIntegerField(i, fieldName));
					break;
				}
			}
			std::unique_ptr<typename GEOMETRY::GdalEquivalent> geometry = _geometries[i].gdalGeometry();
			gdalFeature->SetGeometry(geometry.get());
			if (layer->CreateFeature(gdalFeature.get()) != OGRERR_NONE) {
				throw InvalidVectorFileException("Unable to write feature to " + filename.string());
			}
		}
	}
	template<class GEOMETRY>
	inline typename VectorDataset<GEOMETRY>::const_iterator VectorDataset<GEOMETRY>::begin() const
	{
		return const_iterator(*this, 0);
	}
	template<class GEOMETRY>
	inline typename VectorDataset<GEOMETRY>::const_iterator VectorDataset<GEOMETRY>::end() const
	{
		return const_iterator(*this, _geometries.size());
	}
	template<class GEOMETRY>
	inline const CoordRef& VectorDataset<GEOMETRY>::crs() const
	{
		return _crs;
	}
	template<class GEOMETRY>
	inline const GEOMETRY& VectorDataset<GEOMETRY>::getGeometry(size_t index) const
	{
		return _geometries.at(index);
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::addGeometry(const GEOMETRY& g)
	{
		if (!g.crs().isConsistentHoriz(_crs)) {
			throw CRSMismatchException("Geometry CRS does not match the dataset");
		}
		_geometries.push_back(g);
		_addRow();
	}
	template<class GEOMETRY>
	inline size_t VectorDataset<GEOMETRY>::nGeometry() const
	{
		return _geometries.size();
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::_constructFromFilename(const std::string& filename)
	{
		UniqueGdalDataset shp = vectorGDALWrapper(filename);
		if (!shp) {
			throw InvalidVectorFileException("Unable to open " + filename + " as a vector file");
		}
		OGRLayer* layer = shp->GetLayer(0);
		if (!layer) {
			throw InvalidVectorFileException(filename + " has no layers");
		}
		OGRwkbGeometryType layerType = wkbFlatten(layer->GetGeomType());
		//shapefiles report polygon layers as wkbPolygon even when some features are multipolygons
		bool polygonLayerAsMulti = std::is_same<GEOMETRY, MultiPolygon>::value && layerType == wkbPolygon;
		if (layerType != GEOMETRY::gdalGeometryTypeStatic && !polygonLayerAsMulti) {
			throw InvalidVectorFileException(filename + " is not the expected geometry type");
		}
		_crs = CoordRef(layer->GetSpatialRef());

		OGRFeatureDefn* defn = layer->GetLayerDefn();
		for (int i = 0; i < defn->GetFieldCount(); ++i) {
			OGRFieldDefn* field = defn->GetFieldDefn(i);
			switch (field->GetType()) {
			case OFTInteger:
			case OFTInteger64:
				addIntegerField(field->GetNameRef());
				break;
			case OFTReal:
				addRealField(field->GetNameRef());
				break;
			case OFTString:
				addStringField(field->GetNameRef(), field->GetWidth() > 0 ? field->GetWidth() : 254);
				break;
			default:
				spdlog::warn("[Vector] Skipping field '{}' of unsupported type in {}", field->GetNameRef(), filename);
			}
		}

		for (const OGRFeatureUniquePtr& feature : layer) {
			OGRGeometry* gdalGeometry = feature->GetGeometryRef();
			if (!gdalGeometry) {
				spdlog::warn("[Vector] Skipping feature {} with no geometry in {}", feature->GetFID(), filename);
				continue;
			}
			GEOMETRY himalGeometry{ *gdalGeometry, _crs };
			addGeometry(himalGeometry);
			size_t index = _geometries.size() - 1;
			for (int i = 0; i < feature->GetFieldCount(); ++i) {
				OGRFieldDefn* field = feature->GetFieldDefnRef(i);
				if (!fieldExists(field->GetNameRef())) {
					continue;
				}
				if (!feature->IsFieldSetAndNotNull(i)) {
					setFieldNull(index, field->GetNameRef());
					continue;
				}
				switch (field->GetType()) {
				case OFTInteger:
				case OFTInteger64:
					setIntegerField(index, field->GetNameRef(), feature->GetFieldAsInteger64(i));
					break;
				case OFTReal:
					setRealField(index, field->GetNameRef(), feature->GetFieldAsDouble(i));
					break;
				case OFTString:
					setStringField(index, field->GetNameRef(), feature->GetFieldAsString(i));
					break;
				default:
					break;
				}
			}
		}
	}

}

#endif
