export module keystone.core;
export import keystone.core.config;
export import keystone.core.log;
export import :hash;
export import :type_hash;
export import :byte_stream;

import std;

export namespace keystone
{

}
