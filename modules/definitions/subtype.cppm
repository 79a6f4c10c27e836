export module keystone.definitions:subtype;

import std;

using std::uint32_t;

export namespace keystone::defs
{

struct SubtypeId
{
public:
	using value_type = uint32_t;

	static constexpr value_type null = 0u;

	constexpr SubtypeId() noexcept : internal{null} {}
	constexpr explicit SubtypeId(value_type value) noexcept : internal{value} {}

	// handle of both the absent and the empty name
	static constexpr SubtypeId null_or_empty() noexcept
	{
		return SubtypeId{};
	}

	constexpr bool operator==(const SubtypeId& rhs) const noexcept = default;

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

class StringInterner
{
public:
	virtual ~StringInterner() = default;

	virtual SubtypeId get_or_compute(std::optional<std::string_view> name) = 0;
	virtual std::optional<SubtypeId> try_get(std::string_view name) const = 0;

	virtual bool is_known(SubtypeId id) const = 0;

	// empty for SubtypeId::null_or_empty() and for unknown ids
	virtual std::string_view to_string(SubtypeId id) const = 0;
};

}

template <>
struct std::hash<keystone::defs::SubtypeId>
{
	std::size_t operator()(const keystone::defs::SubtypeId& id) const noexcept
	{
		return std::hash<std::uint32_t>{}(id.value());
	}
};

template <>
struct std::formatter<keystone::defs::SubtypeId> : std::formatter<std::uint32_t>
{
	template <class FmtContext>
	FmtContext::iterator format(const keystone::defs::SubtypeId id, FmtContext& ctx) const
	{
		return std::formatter<std::uint32_t>::format(id.value(), ctx);
	}
};
