export module keystone.definitions:error;

import std;

export namespace keystone::defs
{

enum class FormatError
{
	Empty,
	MissingSeparator,
	UnknownCategory
};

std::string_view format_error_string(FormatError e)
{
	switch(e)
	{
	using enum FormatError;
	case Empty:
		return "definition id is empty";
	case MissingSeparator:
		return "definition id has no '/' separator";
	case UnknownCategory:
		return "definition id names an unknown category";
	}

	std::unreachable();
}

// a widen/narrow that cannot be represented in the target form
enum class ResolutionError
{
	InvalidCategory,
	UnknownCategory,
	UnknownRuntimeType
};

std::string_view resolution_error_string(ResolutionError e)
{
	switch(e)
	{
	using enum ResolutionError;
	case InvalidCategory:
		return "definition id has the invalid category";
	case UnknownCategory:
		return "category has no runtime type id";
	case UnknownRuntimeType:
		return "runtime type id does not resolve to a category";
	}

	std::unreachable();
}

enum class RegistryError
{
	InvalidName,
	InvalidToken,
	Conflict,
	OutOfHandles
};

std::string_view registry_error_string(RegistryError e)
{
	switch(e)
	{
	using enum RegistryError;
	case InvalidName:
		return "category name is not usable in a definition id";
	case InvalidToken:
		return "category token is invalid";
	case Conflict:
		return "category name or token is already registered";
	case OutOfHandles:
		return "out of runtime type ids";
	}

	std::unreachable();
}

class DefinitionFormatException : public std::runtime_error
{
public:
	DefinitionFormatException(FormatError e, std::string_view text) :
		std::runtime_error{std::format("malformed definition id \"{}\": {}", text, format_error_string(e))},
		error{e}
	{
	}

	FormatError code() const noexcept
	{
		return error;
	}
private:
	FormatError error;
};

}
