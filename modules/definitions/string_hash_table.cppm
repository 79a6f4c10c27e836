module;

#include <tracy/Tracy.hpp>

export module keystone.definitions:string_hash_table;

import :subtype;

import keystone.core;
import std;

using std::size_t, std::uint32_t;

export namespace keystone::defs
{

// Interns subtype names. Ids are handed out sequentially from 1 and never
// reused, 0 is the null_or_empty id.
class StringHashTable final : public StringInterner
{
public:
	StringHashTable() = default;

	StringHashTable(const StringHashTable&) = delete;
	StringHashTable(StringHashTable&&) = delete;

	StringHashTable& operator=(const StringHashTable&) = delete;
	StringHashTable& operator=(StringHashTable&&) = delete;

	SubtypeId get_or_compute(std::optional<std::string_view> name) override
	{
		if(!name || name->empty())
			return SubtypeId::null_or_empty();

		{
		std::shared_lock<std::shared_mutex> r_lock{lock};

		auto it = lookup.find(*name);
		if(it != lookup.end())
			return it->second;
		}

		ZoneScoped;

		std::unique_lock<std::shared_mutex> w_lock{lock};

		// another thread may have interned it between the locks
		auto it = lookup.find(*name);
		if(it != lookup.end())
			return it->second;

		if(names.size() >= std::numeric_limits<uint32_t>::max() - 1u)
		{
			log::critical("string_hash_table: out of subtype ids");
			throw std::runtime_error("string_hash_table: out of subtype ids");
		}

		const std::string& stored = names.emplace_back(*name);
		const SubtypeId id{static_cast<uint32_t>(names.size())};
		lookup.emplace(std::string_view{stored}, id);

		return id;
	}

	std::optional<SubtypeId> try_get(std::string_view name) const override
	{
		if(name.empty())
			return SubtypeId::null_or_empty();

		std::shared_lock<std::shared_mutex> r_lock{lock};

		auto it = lookup.find(name);
		if(it == lookup.end())
			return std::nullopt;

		return it->second;
	}

	bool is_known(SubtypeId id) const override
	{
		if(id.is_null())
			return true;

		std::shared_lock<std::shared_mutex> r_lock{lock};
		return id.value() <= names.size();
	}

	std::string_view to_string(SubtypeId id) const override
	{
		if(id.is_null())
			return {};

		std::shared_lock<std::shared_mutex> r_lock{lock};

		if(id.value() > names.size())
			return {};

		return names[id.value() - 1u];
	}

	size_t size() const
	{
		std::shared_lock<std::shared_mutex> r_lock{lock};
		return names.size();
	}
private:
	mutable std::shared_mutex lock;

	// deque keeps element addresses stable, lookup keys view into it
	std::deque<std::string> names;
	std::unordered_map<std::string_view, SubtypeId, fnv::name_hash, std::equal_to<>> lookup;
};

}
