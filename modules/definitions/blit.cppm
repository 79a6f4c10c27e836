export module keystone.definitions:blit;

import :category;
import :context;
import :definition_id;
import :error;
import :subtype;

import keystone.core;
import std;
import xxhash;

using std::size_t, std::uint16_t, std::uint32_t;

export namespace keystone::defs
{

#if defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
struct __attribute__((packed)) BlitWire
{
	uint16_t type_id;
	uint32_t subtype_id;
};
#elif defined(_MSC_VER)
#pragma pack(push, 1)
struct BlitWire
{
	uint16_t type_id;
	uint32_t subtype_id;
};
#pragma pack(pop)
#endif

/*
 * Fixed-width projection of a DefinitionId for packing into network
 * messages. The category travels as its 16 bit runtime id, so a blit is only
 * meaningful to a process that registered categories in the same order.
 */
class DefinitionIdBlit
{
public:
	using widen_return_type = std::expected<DefinitionId, ResolutionError>;
	using narrow_return_type = std::expected<DefinitionIdBlit, ResolutionError>;

	constexpr static size_t wire_size = sizeof(uint16_t) + sizeof(uint32_t);

	constexpr DefinitionIdBlit() noexcept = default;
	constexpr DefinitionIdBlit(RuntimeTypeId type, SubtypeId subtype) noexcept : type{type}, subtype{subtype} {}

	static narrow_return_type from_category(CategoryType category, SubtypeId subtype, const CategoryResolver& categories)
	{
		if(category.is_null())
		{
			log::debug("definition_id_blit: cannot narrow the invalid category");
			return std::unexpected(ResolutionError::InvalidCategory);
		}

		const RuntimeTypeId runtime = categories.to_runtime(category);
		if(!runtime.is_valid())
		{
			log::debug("definition_id_blit: category {:#010x} has no runtime id", category.value());
			return std::unexpected(ResolutionError::UnknownCategory);
		}

		return DefinitionIdBlit{runtime, subtype};
	}

	static narrow_return_type narrow(const DefinitionId& id, const CategoryResolver& categories)
	{
		return from_category(id.type_id(), id.subtype_id(), categories);
	}

	widen_return_type widen(const CategoryResolver& categories, const StringInterner& strings) const
	{
		const std::optional<CategoryType> category = categories.from_runtime(type);
		if(!category)
		{
			log::debug("definition_id_blit: runtime id {} does not resolve", type.value());
			return std::unexpected(ResolutionError::UnknownRuntimeType);
		}

		// the id still names its category, an unknown subtype formats as "(null)"
		if(!strings.is_known(subtype))
			log::debug("definition_id_blit: subtype id {} is not interned", subtype.value());

		return DefinitionId{*category, subtype};
	}

	constexpr bool is_valid() const noexcept
	{
		return type.is_valid();
	}

	constexpr RuntimeTypeId type_id() const noexcept
	{
		return type;
	}

	constexpr SubtypeId subtype_id() const noexcept
	{
		return subtype;
	}

	std::string to_string(const DefinitionContext& ctx) const
	{
		return widen(ctx.categories, ctx.strings).value_or(DefinitionId{}).to_string(ctx);
	}

	// u16le runtime id, u32le subtype id
	void write(ByteWriter& out) const
	{
		out.write(type.value());
		out.write(subtype.value());
	}

	static std::expected<DefinitionIdBlit, ReadError> read(ByteReader& in)
	{
		if(in.remaining() < wire_size)
			return std::unexpected(ReadError::Truncated);

		const auto runtime = in.read<uint16_t>();
		if(!runtime)
			return std::unexpected(runtime.error());

		const auto interned = in.read<uint32_t>();
		if(!interned)
			return std::unexpected(interned.error());

		return DefinitionIdBlit{RuntimeTypeId{*runtime}, SubtypeId{*interned}};
	}

	constexpr BlitWire to_wire() const noexcept
	{
		return BlitWire{type.value(), subtype.value()};
	}

	static constexpr DefinitionIdBlit from_wire(const BlitWire& wire) noexcept
	{
		return DefinitionIdBlit{RuntimeTypeId{wire.type_id}, SubtypeId{wire.subtype_id}};
	}

	constexpr bool operator==(const DefinitionIdBlit& rhs) const noexcept = default;
private:
	RuntimeTypeId type{};
	SubtypeId subtype{};
};

}

static_assert(sizeof(keystone::defs::BlitWire) == 6u);
static_assert(keystone::defs::DefinitionIdBlit::wire_size == sizeof(keystone::defs::BlitWire));

template <>
struct std::hash<keystone::defs::DefinitionIdBlit>
{
	std::size_t operator()(const keystone::defs::DefinitionIdBlit& id) const noexcept
	{
		const keystone::defs::BlitWire key = id.to_wire();
		return static_cast<std::size_t>(xxhash::XXH3_64bits(&key, sizeof(key)));
	}
};

template <>
struct std::formatter<keystone::defs::DefinitionIdBlit>
{
	template <class ParseContext>
	constexpr ParseContext::iterator parse(ParseContext& ctx)
	{
		return ctx.begin();
	}

	template <class FmtContext>
	FmtContext::iterator format(const keystone::defs::DefinitionIdBlit& id, FmtContext& ctx) const
	{
		if(id.is_valid())
			return std::format_to(ctx.out(), "blit: runtime {} | subtype {}", id.type_id(), id.subtype_id());

		return std::format_to(ctx.out(), "blit: null");
	}
};
