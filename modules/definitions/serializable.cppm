export module keystone.definitions:serializable;

import :category;
import :definition_id;
import :error;
import :subtype;

import keystone.core.log;
import std;

export namespace keystone::defs
{

// form written by the object serializer: the subtype travels as its name
struct SerializableDefinitionId
{
	CategoryType type_id{};
	std::string subtype_name{};

	bool is_null() const noexcept
	{
		return type_id.is_null();
	}

	std::string_view type_id_string(const CategoryResolver& categories) const
	{
		return categories.name_of(type_id);
	}

	static std::expected<SerializableDefinitionId, FormatError> from_strings(std::string_view type_name, std::string_view subtype_name, const CategoryResolver& categories)
	{
		if(type_name.empty())
			return std::unexpected(FormatError::Empty);

		const std::optional<CategoryType> type = categories.try_parse(type_name);
		if(!type)
			return std::unexpected(FormatError::UnknownCategory);

		return SerializableDefinitionId{*type, std::string{subtype_name}};
	}

	bool operator==(const SerializableDefinitionId& rhs) const = default;
};

std::expected<SerializableDefinitionId, ResolutionError> to_serializable(const DefinitionId& id, const StringInterner& strings)
{
	if(id.type_id().is_null())
	{
		log::debug("to_serializable: refusing to serialize a definition id with the invalid category");
		return std::unexpected(ResolutionError::InvalidCategory);
	}

	return SerializableDefinitionId{id.type_id(), std::string{id.subtype_name(strings)}};
}

DefinitionId from_serializable(const SerializableDefinitionId& id, StringInterner& strings)
{
	return DefinitionId{id.type_id, std::string_view{id.subtype_name}, strings};
}

}
