export module keystone.definitions;

export import :error;
export import :category;
export import :category_registry;
export import :subtype;
export import :string_hash_table;
export import :context;
export import :content;
export import :definition_id;
export import :serializable;
export import :blit;

export namespace keystone::defs
{

}
