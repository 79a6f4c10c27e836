// CategoryRegistry: names, tokens and runtime ids.

#include <gtest/gtest.h>

import keystone.core;
import keystone.definitions;
import std;

using namespace keystone;
using namespace keystone::defs;

namespace
{
struct OreBuilder {};
struct ComponentBuilder {};
struct AmmoBuilder {};
}

TEST(CategoryRegistry, RegistersTypedCategory)
{
	CategoryRegistry registry;

	const auto ore = registry.register_category<OreBuilder>("Ore");
	ASSERT_TRUE(ore.has_value());
	EXPECT_EQ(*ore, CategoryType::of<OreBuilder>());
	EXPECT_EQ(ore->value(), type_hash_v<OreBuilder>);

	EXPECT_EQ(registry.try_parse("Ore"), *ore);
	EXPECT_EQ(registry.name_of(*ore), "Ore");
	EXPECT_EQ(registry.size(), 1u);
}

TEST(CategoryRegistry, NameOnlyCategoryUsesNameHash)
{
	CategoryRegistry registry;

	const auto block = registry.register_category("CubeBlock");
	ASSERT_TRUE(block.has_value());
	EXPECT_EQ(block->value(), fnv::hash("CubeBlock"));
}

TEST(CategoryRegistry, RuntimeIdsAreSequentialFromOne)
{
	CategoryRegistry registry;
	const CategoryType ore = registry.register_category<OreBuilder>("Ore").value();
	const CategoryType component = registry.register_category<ComponentBuilder>("Component").value();

	EXPECT_EQ(registry.to_runtime(ore), RuntimeTypeId{1});
	EXPECT_EQ(registry.to_runtime(component), RuntimeTypeId{2});

	EXPECT_EQ(registry.from_runtime(RuntimeTypeId{1}), ore);
	EXPECT_EQ(registry.from_runtime(RuntimeTypeId{2}), component);
}

TEST(CategoryRegistry, UnknownLookupsAreEmpty)
{
	CategoryRegistry registry;
	ASSERT_TRUE(registry.register_category<OreBuilder>("Ore").has_value());

	EXPECT_FALSE(registry.try_parse("Ammo").has_value());
	EXPECT_FALSE(registry.try_parse("ore").has_value());
	EXPECT_FALSE(registry.try_parse(" Ore").has_value());

	EXPECT_FALSE(registry.to_runtime(CategoryType::of<AmmoBuilder>()).is_valid());
	EXPECT_FALSE(registry.to_runtime(CategoryType::invalid()).is_valid());
	EXPECT_TRUE(registry.name_of(CategoryType::of<AmmoBuilder>()).empty());

	EXPECT_FALSE(registry.from_runtime(RuntimeTypeId{}).has_value());
	EXPECT_FALSE(registry.from_runtime(RuntimeTypeId{2}).has_value());
}

TEST(CategoryRegistry, SameRegistrationIsIdempotent)
{
	CategoryRegistry registry;
	const auto first = registry.register_category<OreBuilder>("Ore");
	const auto second = registry.register_category<OreBuilder>("Ore");

	ASSERT_TRUE(first.has_value());
	ASSERT_TRUE(second.has_value());
	EXPECT_EQ(*first, *second);
	EXPECT_EQ(registry.size(), 1u);
}

TEST(CategoryRegistry, RejectsConflicts)
{
	CategoryRegistry registry;
	ASSERT_TRUE(registry.register_category<OreBuilder>("Ore").has_value());

	const auto same_name = registry.register_category<ComponentBuilder>("Ore");
	ASSERT_FALSE(same_name.has_value());
	EXPECT_EQ(same_name.error(), RegistryError::Conflict);

	const auto same_token = registry.register_category<OreBuilder>("Ingot");
	ASSERT_FALSE(same_token.has_value());
	EXPECT_EQ(same_token.error(), RegistryError::Conflict);

	EXPECT_EQ(registry.size(), 1u);
}

TEST(CategoryRegistry, RejectsNamesThatCannotRoundTrip)
{
	CategoryRegistry registry;

	for(const std::string_view name : {"", "(null)", "Ore/Iron", " Ore", "Ore\t"})
	{
		const auto result = registry.register_category(name);
		ASSERT_FALSE(result.has_value()) << "name: \"" << name << "\"";
		EXPECT_EQ(result.error(), RegistryError::InvalidName);
	}

	const auto null_token = registry.register_category("Ore", CategoryType::invalid());
	ASSERT_FALSE(null_token.has_value());
	EXPECT_EQ(null_token.error(), RegistryError::InvalidToken);

	EXPECT_EQ(registry.size(), 0u);
}

TEST(CategoryRegistry, AliasesParseButDoNotRename)
{
	CategoryRegistry registry;
	const CategoryType ore = registry.register_category<OreBuilder>("Ore").value();

	ASSERT_TRUE(registry.register_alias("MyObjectBuilder_Ore", ore).has_value());
	EXPECT_TRUE(registry.register_alias("MyObjectBuilder_Ore", ore).has_value());

	EXPECT_EQ(registry.try_parse("MyObjectBuilder_Ore"), ore);
	EXPECT_EQ(registry.name_of(ore), "Ore");
	EXPECT_EQ(registry.size(), 1u);
}

TEST(CategoryRegistry, AliasErrors)
{
	CategoryRegistry registry;
	const CategoryType ore = registry.register_category<OreBuilder>("Ore").value();
	const CategoryType component = registry.register_category<ComponentBuilder>("Component").value();

	EXPECT_EQ(registry.register_alias("Component", ore).error(), RegistryError::Conflict);
	EXPECT_EQ(registry.register_alias("Ammo", CategoryType::of<AmmoBuilder>()).error(), RegistryError::InvalidToken);
	EXPECT_EQ(registry.register_alias("Bad/Alias", component).error(), RegistryError::InvalidName);
}

TEST(CategoryRegistry, ErrorStringsAreDistinct)
{
	std::set<std::string_view> messages;
	for(const RegistryError e : {RegistryError::InvalidName, RegistryError::InvalidToken, RegistryError::Conflict, RegistryError::OutOfHandles})
		messages.insert(registry_error_string(e));

	EXPECT_EQ(messages.size(), 4u);
}

TEST(CategoryRegistry, ConcurrentReadsDuringRegistration)
{
	CategoryRegistry registry;
	const CategoryType ore = registry.register_category<OreBuilder>("Ore").value();

	std::atomic<bool> mismatch{false};
	std::vector<std::jthread> readers;
	for(int i = 0; i < 4; i++)
	{
		readers.emplace_back([&]
		{
			for(int n = 0; n < 2000; n++)
			{
				if(registry.try_parse("Ore") != ore || registry.name_of(ore) != "Ore")
					mismatch = true;
			}
		});
	}

	for(int i = 0; i < 200; i++)
		ASSERT_TRUE(registry.register_category(std::format("Category{}", i)).has_value());

	readers.clear();
	EXPECT_FALSE(mismatch);
	EXPECT_EQ(registry.size(), 201u);
}

TEST(CategoryType, FormatsForLogs)
{
	EXPECT_EQ(std::format("{}", CategoryType::invalid()), "category: null");
	EXPECT_EQ(std::format("{}", CategoryType{0x1234u}), "category: 0x00001234");
	EXPECT_EQ(std::format("{}", RuntimeTypeId{7}), "7");
}
