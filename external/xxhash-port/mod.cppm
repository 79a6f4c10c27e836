module;

#include <xxhash.h>

export module xxhash;

// minimum for hashing fixed-layout keys
export namespace xxhash
{
	using ::XXH3_64bits;
}
