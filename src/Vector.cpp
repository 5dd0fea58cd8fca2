#include"Vector.hpp"

namespace himal {

	WrongFieldTypeException::WrongFieldTypeException(const std::string& error) : std::runtime_error(error) {}

	void AttributeTable::addStringField(const std::string& name, size_t width)
	{
		_addField(name, FieldType::String, width);
	}
	void AttributeTable::addIntegerField(const std::string& name)
	{
		_addField(name, FieldType::Integer, 0);
	}
	void AttributeTable::addRealField(const std::string& name)
	{
		_addField(name, FieldType::Real, 0);
	}

	void AttributeTable::addFieldsFrom(const AttributeTable& other)
	{
		for (const std::string& name : other.getAllFieldNames()) {
			if (!fieldExists(name)) {
				const Field& f = other._field(name);
				_addField(name, f.type, f.width);
			}
		}
	}

	void AttributeTable::copyRow(size_t index, const AttributeTable& other, size_t otherIndex)
	{
		for (const std::string& name : other.getAllFieldNames()) {
			if (other.isFieldNull(otherIndex, name)) {
				setFieldNull(index, name);
				continue;
			}
			switch (other.getFieldType(name)) {
			case FieldType::Integer:
				setIntegerField(index, name, other.getIntegerField(otherIndex, name));
				break;
			case FieldType::Real:
				setRealField(index, name, other.getRealField(otherIndex, name));
				break;
			case FieldType::String:
				setStringField(index, name, other.getStringField(otherIndex, name));
				break;
			}
		}
	}

	size_t AttributeTable::nFeature() const
	{
		return _nrow;
	}

	const std::vector<std::string>& AttributeTable::getAllFieldNames() const
	{
		return _fieldNamesInOrder;
	}
	bool AttributeTable::fieldExists(const std::string& name) const
	{
		return _fields.contains(name);
	}
	FieldType AttributeTable::getFieldType(const std::string& name) const
	{
		return _field(name).type;
	}
	size_t AttributeTable::getStringFieldWidth(const std::string& name) const
	{
		const Field& f = _field(name);
		if (f.type != FieldType::String) {
			throw WrongFieldTypeException("Field " + name + " is not a string field");
		}
		return f.width;
	}

	const std::string& AttributeTable::getStringField(size_t index, const std::string& name) const
	{
		return _column<std::string>(name, FieldType::String).at(index);
	}
	int64_t AttributeTable::getIntegerField(size_t index, const std::string& name) const
	{
		return _column<int64_t>(name, FieldType::Integer).at(index);
	}
	double AttributeTable::getRealField(size_t index, const std::string& name) const
	{
		return _column<double>(name, FieldType::Real).at(index);
	}

	void AttributeTable::setStringField(size_t index, const std::string& name, const std::string& value)
	{
		size_t width = getStringFieldWidth(name);
		_column<std::string>(name, FieldType::String).at(index) = value.substr(0, width);
		_field(name).isNull[index] = false;
	}
	void AttributeTable::setIntegerField(size_t index, const std::string& name, int64_t value)
	{
		_column<int64_t>(name, FieldType::Integer).at(index) = value;
		_field(name).isNull[index] = false;
	}
	void AttributeTable::setRealField(size_t index, const std::string& name, double value)
	{
		_column<double>(name, FieldType::Real).at(index) = value;
		_field(name).isNull[index] = false;
	}

	bool AttributeTable::isFieldNull(size_t index, const std::string& name) const
	{
		return _field(name).isNull.at(index);
	}
	void AttributeTable::setFieldNull(size_t index, const std::string& name)
	{
		Field& f = _field(name);
		f.isNull.at(index) = true;
		std::visit([index](auto& values) { values.at(index) = {}; }, f.values);
	}

	void AttributeTable::_addRow()
	{
		++_nrow;
		for (auto& [name, f] : _fields) {
			std::visit([this](auto& values) { values.resize(_nrow); }, f.values);
			f.isNull.resize(_nrow, false);
		}
	}

	void AttributeTable::_addField(const std::string& name, FieldType type, size_t width)
	{
		if (fieldExists(name)) {
			throw std::invalid_argument("Field " + name + " already exists");
		}
		Field f{ type, width, Column(), std::vector<char>(_nrow, false) };
		switch (type) {
		case FieldType::Integer:
			f.values = std::vector<int64_t>(_nrow, 0);
			break;
		case FieldType::Real:
			f.values = std::vector<double>(_nrow, 0.);
			break;
		case FieldType::String:
			f.values = std::vector<std::string>(_nrow);
			break;
		}
		_fields.emplace(name, std::move(f));
		_fieldNamesInOrder.push_back(name);
	}

	const AttributeTable::Field& AttributeTable::_field(const std::string& name) const
	{
		auto it = _fields.find(name);
		if (it == _fields.end()) {
			throw std::out_of_range("No field named " + name);
		}
		return it->second;
	}
	AttributeTable::Field& AttributeTable::_field(const std::string& name)
	{
		return const_cast<Field&>(std::as_const(*this)._field(name));
	}
}
