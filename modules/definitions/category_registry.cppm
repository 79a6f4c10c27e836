module;

#include <tracy/Tracy.hpp>

export module keystone.definitions:category_registry;

import :category;
import :error;

import keystone.core;
import std;

using std::size_t, std::uint16_t;

namespace keystone::defs
{

constexpr std::string_view whitespace = " \t\n\v\f\r";

// names must survive a "<category>/<subtype>" round trip
constexpr bool valid_category_name(std::string_view name)
{
	if(name.empty() || name == "(null)")
		return false;

	if(name.find('/') != std::string_view::npos)
		return false;

	return whitespace.find(name.front()) == std::string_view::npos
		&& whitespace.find(name.back()) == std::string_view::npos;
}

}

export namespace keystone::defs
{

class CategoryRegistry final : public CategoryResolver
{
public:
	using register_return_type = std::expected<CategoryType, RegistryError>;

	constexpr static size_t max_categories = std::numeric_limits<uint16_t>::max();

	CategoryRegistry() = default;

	CategoryRegistry(const CategoryRegistry&) = delete;
	CategoryRegistry(CategoryRegistry&&) = delete;

	CategoryRegistry& operator=(const CategoryRegistry&) = delete;
	CategoryRegistry& operator=(CategoryRegistry&&) = delete;

	template <typename T>
	register_return_type register_category(std::string_view name)
	{
		return register_category(name, CategoryType::of<T>());
	}

	// categories with no C++ content type are keyed by their name
	register_return_type register_category(std::string_view name)
	{
		return register_category(name, CategoryType{fnv::hash(name)});
	}

	register_return_type register_category(std::string_view name, CategoryType type)
	{
		ZoneScoped;

		if(!valid_category_name(name))
		{
			log::warn("category_registry: rejected category name \"{}\"", name);
			return std::unexpected(RegistryError::InvalidName);
		}

		if(type.is_null())
			return std::unexpected(RegistryError::InvalidToken);

		std::unique_lock<std::shared_mutex> w_lock{lock};

		auto name_it = by_name.find(name);
		auto type_it = by_type.find(type);

		if(name_it != by_name.end() && type_it != by_type.end() && name_it->second == type && type_it->second.name == name)
			return type;

		if(name_it != by_name.end() || type_it != by_type.end())
		{
			log::warn("category_registry: {} ({:#010x}) conflicts with an existing category", name, type.value());
			return std::unexpected(RegistryError::Conflict);
		}

		if(by_runtime.size() >= max_categories)
		{
			log::error("category_registry: out of runtime type ids registering {}", name);
			return std::unexpected(RegistryError::OutOfHandles);
		}

		by_runtime.push_back(type);
		const RuntimeTypeId runtime{static_cast<uint16_t>(by_runtime.size())};

		by_name.emplace(std::string{name}, type);
		by_type.emplace(type, Entry{std::string{name}, runtime});

		log::debug("category_registry: registered {} as {:#010x} (runtime {})", name, type.value(), runtime.value());
		return type;
	}

	// additional parse name, formatting keeps the registered name
	std::expected<void, RegistryError> register_alias(std::string_view alias, CategoryType type)
	{
		ZoneScoped;

		if(!valid_category_name(alias))
			return std::unexpected(RegistryError::InvalidName);

		std::unique_lock<std::shared_mutex> w_lock{lock};

		if(!by_type.contains(type))
			return std::unexpected(RegistryError::InvalidToken);

		auto name_it = by_name.find(alias);
		if(name_it != by_name.end())
		{
			if(name_it->second == type)
				return {};

			log::warn("category_registry: alias {} already names another category", alias);
			return std::unexpected(RegistryError::Conflict);
		}

		by_name.emplace(std::string{alias}, type);
		return {};
	}

	size_t size() const
	{
		std::shared_lock<std::shared_mutex> r_lock{lock};
		return by_runtime.size();
	}

	std::optional<CategoryType> try_parse(std::string_view name) const override
	{
		std::shared_lock<std::shared_mutex> r_lock{lock};

		auto it = by_name.find(name);
		if(it == by_name.end())
			return std::nullopt;

		return it->second;
	}

	RuntimeTypeId to_runtime(CategoryType type) const override
	{
		std::shared_lock<std::shared_mutex> r_lock{lock};

		auto it = by_type.find(type);
		if(it == by_type.end())
			return RuntimeTypeId{};

		return it->second.runtime;
	}

	std::optional<CategoryType> from_runtime(RuntimeTypeId id) const override
	{
		if(!id.is_valid())
			return std::nullopt;

		std::shared_lock<std::shared_mutex> r_lock{lock};

		if(id.value() > by_runtime.size())
			return std::nullopt;

		return by_runtime[id.value() - 1u];
	}

	std::string_view name_of(CategoryType type) const override
	{
		std::shared_lock<std::shared_mutex> r_lock{lock};

		auto it = by_type.find(type);
		if(it == by_type.end())
			return {};

		return it->second.name;
	}
private:
	struct Entry
	{
		std::string name;
		RuntimeTypeId runtime;
	};

	mutable std::shared_mutex lock;

	// entries are never erased, so views of names stay valid
	std::unordered_map<std::string, CategoryType, fnv::name_hash, std::equal_to<>> by_name;
	std::unordered_map<CategoryType, Entry> by_type;
	std::vector<CategoryType> by_runtime;
};

}
