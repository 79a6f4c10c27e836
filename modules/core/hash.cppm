export module keystone.core:hash;

import std;

using std::size_t, std::uint8_t, std::uint32_t;

namespace keystone::fnv
{
	constexpr uint32_t prime = 0x1000193u;
	constexpr uint32_t basis = 0x811C9DC5u;
}

export namespace keystone::fnv
{
	// fnv-1a, 32 bit
	constexpr uint32_t hash(std::string_view str)
	{
		uint32_t out = basis;

		for(const char c : str)
			out = (out ^ static_cast<uint32_t>(static_cast<uint8_t>(c))) * prime;

		return out;
	}

	constexpr uint32_t operator""_fnv(const char* str, size_t len)
	{
		return fnv::hash(std::string_view{str, len});
	}

	// transparent hasher for unordered containers keyed by names
	struct name_hash
	{
		using is_transparent = void;

		size_t operator()(std::string_view str) const noexcept
		{
			return fnv::hash(str);
		}
	};
}
