export module keystone.core:type_hash;

import :hash;
import std;

using std::uint32_t;

export namespace keystone
{

template <typename T>
struct type_hash
{
	static constexpr uint32_t get()
	{
		#if defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
		constexpr auto value = fnv::hash(__PRETTY_FUNCTION__);
		#elif defined(_MSC_VER)
		constexpr auto value = fnv::hash(__FUNCSIG__);
		#endif
		return value;
	}
};

template <typename T>
inline constexpr uint32_t type_hash_v = type_hash<T>::get();

}
