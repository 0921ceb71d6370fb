#pragma once

#include "csx_document.h"
#include "mathtypes.h"

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

// Little-endian writer for the DIF container and its interiors
class dif_stream final {
  private:
	std::vector<std::byte> bytes;

	template <std::unsigned_integral UInt>
	void write_little_endian(UInt value) {
		for (std::size_t i = 0; i != sizeof(UInt); ++i) {
			bytes.push_back(std::byte(value >> (i * 8)));
		}
	}

  public:
	void write_u8(std::uint8_t value) {
		bytes.push_back(std::byte(value));
	}

	void write_u16(std::uint16_t value) {
		write_little_endian(value);
	}

	void write_u32(std::uint32_t value) {
		write_little_endian(value);
	}

	void write_f32(float value) {
		write_little_endian(std::bit_cast<std::uint32_t>(value));
	}

	void write_bool(bool value) {
		write_u8(value ? 1 : 0);
	}

	// Point3F
	void write_point(double3_array const & point);

	// A u8 length and the characters. Longer strings are cut to 255 bytes
	// with a warning
	void write_string(std::u8string_view string);

	// A u32 count and the key/value string pairs
	void write_dictionary(std::span<csx_property const> properties);

	// Size-prefixed array of u16 or u32 values
	void write_u16_vector(std::span<std::uint16_t const> values);
	void write_u32_vector(std::span<std::uint32_t const> values);

	template <class Element, class WriteElement>
	void write_vector(
		std::span<Element const> elements, WriteElement&& writeElement
	) {
		write_u32(std::uint32_t(elements.size()));
		for (Element const & element : elements) {
			writeElement(*this, element);
		}
	}

	void append(std::span<std::byte const> data) {
		bytes.insert(bytes.end(), data.begin(), data.end());
	}

	std::size_t size() const noexcept {
		return bytes.size();
	}

	std::vector<std::byte> take() && noexcept {
		return std::move(bytes);
	}
};
