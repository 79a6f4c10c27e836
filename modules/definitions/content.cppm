export module keystone.definitions:content;

import :category;
import :subtype;

import std;

export namespace keystone::defs
{

// Base of data-driven content objects. The category comes from the concrete
// content type, the subtype names the variant loaded from data.
class ContentBase
{
public:
	ContentBase() = default;
	explicit ContentBase(SubtypeId subtype) noexcept : subtype{subtype} {}
	ContentBase(std::optional<std::string_view> subtype_name, StringInterner& strings) : subtype{strings.get_or_compute(subtype_name)} {}

	virtual ~ContentBase() = default;

	virtual CategoryType type_id() const noexcept = 0;

	SubtypeId subtype_id() const noexcept
	{
		return subtype;
	}

	std::string_view subtype_name(const StringInterner& strings) const
	{
		return strings.to_string(subtype);
	}
protected:
	ContentBase(const ContentBase&) = default;
	ContentBase& operator=(const ContentBase&) = default;
private:
	SubtypeId subtype{};
};

template <typename Derived>
class Content : public ContentBase
{
public:
	using ContentBase::ContentBase;

	CategoryType type_id() const noexcept override
	{
		return CategoryType::of<Derived>();
	}
};

}
