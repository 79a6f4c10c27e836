export module keystone.definitions:category;

import keystone.core;
import std;

using std::uint16_t, std::uint32_t;

export namespace keystone::defs
{

// identity of a content category, derived from the content type it builds
struct CategoryType
{
public:
	using value_type = uint32_t;

	static constexpr value_type null = 0u;

	constexpr CategoryType() noexcept : internal{null} {}
	constexpr explicit CategoryType(value_type value) noexcept : internal{value} {}

	template <typename T>
	static constexpr CategoryType of() noexcept
	{
		return CategoryType{type_hash<T>::get()};
	}

	static constexpr CategoryType invalid() noexcept
	{
		return CategoryType{};
	}

	constexpr bool operator==(const CategoryType& rhs) const noexcept = default;

	constexpr value_type value() const noexcept
	{
		return internal;
	}

	constexpr uint32_t hash() const noexcept
	{
		return internal;
	}

	constexpr bool is_null() const noexcept
	{
		return internal == null;
	}
private:
	value_type internal;
};

// narrow alias of a CategoryType, only valid within one process
struct RuntimeTypeId
{
public:
	using value_type = uint16_t;

	static constexpr value_type null = 0u;

	constexpr RuntimeTypeId() noexcept : internal{null} {}
	constexpr explicit RuntimeTypeId(value_type value) noexcept : internal{value} {}

	constexpr bool operator==(const RuntimeTypeId& rhs) const noexcept = default;

	constexpr value_type value() const noexcept
	{
		return internal;
	}

	constexpr bool is_valid() const noexcept
	{
		return internal != null;
	}
private:
	value_type internal;
};

// Resolves category names and runtime ids. Implementations must allow
// concurrent calls to every member.
class CategoryResolver
{
public:
	virtual ~CategoryResolver() = default;

	virtual std::optional<CategoryType> try_parse(std::string_view name) const = 0;

	// RuntimeTypeId{} when the category is unknown
	virtual RuntimeTypeId to_runtime(CategoryType type) const = 0;

	virtual std::optional<CategoryType> from_runtime(RuntimeTypeId id) const = 0;

	// empty when the category is unknown
	virtual std::string_view name_of(CategoryType type) const = 0;
};

}

template <>
struct std::hash<keystone::defs::CategoryType>
{
	std::size_t operator()(const keystone::defs::CategoryType& type) const noexcept
	{
		return std::hash<std::uint32_t>{}(type.value());
	}
};

template <>
struct std::formatter<keystone::defs::CategoryType>
{
	template <class ParseContext>
	constexpr ParseContext::iterator parse(ParseContext& ctx)
	{
		return ctx.begin();
	}

	template <class FmtContext>
	FmtContext::iterator format(const keystone::defs::CategoryType type, FmtContext& ctx) const
	{
		if(type.is_null())
			return std::format_to(ctx.out(), "category: null");

		return std::format_to(ctx.out(), "category: {:#010x}", type.value());
	}
};

template <>
struct std::formatter<keystone::defs::RuntimeTypeId> : std::formatter<std::uint16_t>
{
	template <class FmtContext>
	FmtContext::iterator format(const keystone::defs::RuntimeTypeId id, FmtContext& ctx) const
	{
		return std::formatter<std::uint16_t>::format(id.value(), ctx);
	}
};
