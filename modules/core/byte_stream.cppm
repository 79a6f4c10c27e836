export module keystone.core:byte_stream;

import std;

using std::size_t, std::uint8_t;

export namespace keystone
{

enum class ReadError
{
	Truncated
};

std::string_view read_error_string(ReadError e)
{
	switch(e)
	{
	using enum ReadError;
	case Truncated:
		return "unexpected end of stream";
	}

	std::unreachable();
}

// all multi-byte values are little-endian on the wire regardless of host order
class ByteWriter
{
public:
	ByteWriter() = default;
	explicit ByteWriter(size_t reserve)
	{
		buffer.reserve(reserve);
	}

	template <std::unsigned_integral T>
	void write(T value)
	{
		for(size_t i = 0; i < sizeof(T); i++)
			buffer.push_back(static_cast<std::byte>(static_cast<uint8_t>(value >> (i * 8u))));
	}

	std::span<const std::byte> data() const noexcept
	{
		return buffer;
	}

	size_t size() const noexcept
	{
		return buffer.size();
	}

	std::vector<std::byte> take() noexcept
	{
		return std::exchange(buffer, {});
	}
private:
	std::vector<std::byte> buffer;
};

class ByteReader
{
public:
	explicit ByteReader(std::span<const std::byte> bytes) noexcept : source{bytes} {}

	template <std::unsigned_integral T>
	std::expected<T, ReadError> read()
	{
		if(remaining() < sizeof(T))
			return std::unexpected(ReadError::Truncated);

		T value{0};
		for(size_t i = 0; i < sizeof(T); i++)
			value |= static_cast<T>(static_cast<T>(std::to_integer<uint8_t>(source[offset + i])) << (i * 8u));

		offset += sizeof(T);
		return value;
	}

	size_t remaining() const noexcept
	{
		return source.size() - offset;
	}

	size_t position() const noexcept
	{
		return offset;
	}
private:
	std::span<const std::byte> source;
	size_t offset{0};
};

}
