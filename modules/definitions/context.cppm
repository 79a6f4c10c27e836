export module keystone.definitions:context;

import :category;
import :subtype;

export namespace keystone::defs
{

// collaborators every text conversion needs; both must outlive the context
struct DefinitionContext
{
	const CategoryResolver& categories;
	StringInterner& strings;
};

}
