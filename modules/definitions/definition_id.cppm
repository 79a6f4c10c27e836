export module keystone.definitions:definition_id;

import :category;
import :content;
import :context;
import :error;
import :subtype;

import std;

using std::size_t, std::uint32_t, std::uint64_t;

namespace keystone::defs
{

constexpr std::string_view null_token = "(null)";

constexpr std::string_view trim(std::string_view str)
{
	constexpr std::string_view whitespace = " \t\n\v\f\r";

	const auto first = str.find_first_not_of(whitespace);
	if(first == std::string_view::npos)
		return {};

	const auto last = str.find_last_not_of(whitespace);
	return str.substr(first, last - first + 1);
}

}

export namespace keystone::defs
{

/*
 * Names one piece of content as "<category>/<subtype>", e.g. "Ore/Iron".
 * Prefer taking the id from the content object it was built from over
 * spelling names out in code: names come from data and may change.
 */
class DefinitionId
{
public:
	struct Comparer;

	using parse_return_type = std::expected<DefinitionId, FormatError>;

	constexpr DefinitionId() noexcept = default;
	constexpr explicit DefinitionId(CategoryType type) noexcept : type{type}, subtype{SubtypeId::null_or_empty()} {}
	constexpr DefinitionId(CategoryType type, SubtypeId subtype) noexcept : type{type}, subtype{subtype} {}

	DefinitionId(CategoryType type, std::optional<std::string_view> subtype_name, StringInterner& strings) :
		type{type},
		subtype{strings.get_or_compute(subtype_name)}
	{
	}

	static DefinitionId from_content(const ContentBase& content) noexcept
	{
		return DefinitionId{content.type_id(), content.subtype_id()};
	}

	/*
	 * Splits on the first '/'. The category must be known to the resolver,
	 * the subtype is interned as given; "(null)" stands for no subtype.
	 */
	static parse_return_type parse(std::string_view text, const DefinitionContext& ctx)
	{
		if(text.empty())
			return std::unexpected(FormatError::Empty);

		const auto slash = text.find('/');
		if(slash == std::string_view::npos)
			return std::unexpected(FormatError::MissingSeparator);

		const std::optional<CategoryType> type = ctx.categories.try_parse(trim(text.substr(0, slash)));
		if(!type)
			return std::unexpected(FormatError::UnknownCategory);

		std::optional<std::string_view> subtype_name = trim(text.substr(slash + 1));
		if(*subtype_name == null_token)
			subtype_name = std::nullopt;

		return DefinitionId{*type, subtype_name, ctx.strings};
	}

	static parse_return_type parse(const char* text, const DefinitionContext& ctx)
	{
		if(text == nullptr)
			return std::unexpected(FormatError::Empty);

		return parse(std::string_view{text}, ctx);
	}

	static DefinitionId parse_or_throw(std::string_view text, const DefinitionContext& ctx)
	{
		auto result = parse(text, ctx);
		if(!result)
			throw DefinitionFormatException(result.error(), text);

		return *result;
	}

	// out is reset to DefinitionId{} on failure
	static bool try_parse(std::string_view text, const DefinitionContext& ctx, DefinitionId& out)
	{
		auto result = parse(text, ctx);
		out = result.value_or(DefinitionId{});
		return result.has_value();
	}

	static bool try_parse(const char* text, const DefinitionContext& ctx, DefinitionId& out)
	{
		auto result = parse(text, ctx);
		out = result.value_or(DefinitionId{});
		return result.has_value();
	}

	constexpr CategoryType type_id() const noexcept
	{
		return type;
	}

	constexpr SubtypeId subtype_id() const noexcept
	{
		return subtype;
	}

	std::string_view subtype_name(const StringInterner& strings) const
	{
		return strings.to_string(subtype);
	}

	constexpr uint32_t hash() const noexcept
	{
		return (static_cast<uint32_t>(type.hash()) << 16u) ^ subtype.hash();
	}

	// fewer collisions than hash(), still needs a full compare on a match
	constexpr uint64_t hash_long() const noexcept
	{
		return (static_cast<uint64_t>(type.hash()) << 32u) | static_cast<uint64_t>(subtype.hash());
	}

	std::string to_string(const DefinitionContext& ctx) const
	{
		std::string_view type_name = type.is_null() ? std::string_view{} : ctx.categories.name_of(type);
		std::string_view subtype_name = ctx.strings.to_string(subtype);

		return std::format("{}/{}", type_name.empty() ? null_token : type_name, subtype_name.empty() ? null_token : subtype_name);
	}

	constexpr bool operator==(const DefinitionId& rhs) const noexcept = default;
private:
	CategoryType type{};
	SubtypeId subtype{};
};

// usable as both Hash and KeyEqual of unordered containers
struct DefinitionId::Comparer
{
	constexpr bool operator()(const DefinitionId& lhs, const DefinitionId& rhs) const noexcept
	{
		return lhs.type_id() == rhs.type_id() && lhs.subtype_id() == rhs.subtype_id();
	}

	// hash_long() rather than the 32 bit hash() so 64 bit size_t keeps both handles
	constexpr size_t operator()(const DefinitionId& id) const noexcept
	{
		return static_cast<size_t>(id.hash_long());
	}
};

inline constexpr DefinitionId::Comparer definition_id_comparer{};

DefinitionId get_id(const ContentBase& content) noexcept
{
	return DefinitionId::from_content(content);
}

}

template <>
struct std::hash<keystone::defs::DefinitionId>
{
	std::size_t operator()(const keystone::defs::DefinitionId& id) const noexcept
	{
		return keystone::defs::definition_id_comparer(id);
	}
};

template <>
struct std::formatter<keystone::defs::DefinitionId>
{
	template <class ParseContext>
	constexpr ParseContext::iterator parse(ParseContext& ctx)
	{
		return ctx.begin();
	}

	template <class FmtContext>
	FmtContext::iterator format(const keystone::defs::DefinitionId& id, FmtContext& ctx) const
	{
		return std::format_to(ctx.out(), "definition: {:#010x} | subtype {}", id.type_id().value(), id.subtype_id());
	}
};
