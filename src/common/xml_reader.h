#pragma once

#include "parsing.h"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct xml_attribute final {
	std::u8string name;
	std::u8string value;
};

struct xml_element final {
	std::u8string name;
	std::vector<xml_attribute> attributes;
	std::vector<xml_element> children;
	// Character data directly inside the element, entities decoded
	std::u8string text;
	std::size_t line{};

	std::optional<std::u8string_view> attribute(std::u8string_view attributeName
	) const noexcept;

	xml_element const * first_child(std::u8string_view childName
	) const noexcept;

	std::vector<xml_element const *>
	children_named(std::u8string_view childName) const;
};

struct xml_parse_error final {
	std::size_t line{};
	std::u8string message;
};

// Deepest element nesting parse_document accepts, the root being depth 1
constexpr std::size_t max_xml_element_depth = 256;

// Reads a whole document and returns its root element. Supports the prolog,
// comments, processing instructions, the five predefined entities and
// numeric character references. DTDs and CDATA sections are rejected
class xml_reader final {
  private:
	std::u8string_view remainingInput;
	std::size_t lineNumber{ 1 };

	void advance(std::size_t numCodeUnits) noexcept;
	void skip_whitespace() noexcept;
	bool skip_until_after(std::u8string_view terminator) noexcept;
	bool skip_misc();

	std::optional<std::u8string_view> parse_name() noexcept;
	bool decode_text(std::u8string_view raw, std::u8string& out) const;
	std::optional<xml_parse_error> parse_attributes(xml_element& element);

	xml_parse_error make_error(char const * message) const;

  public:
	// Note: the text will be kept and used
	explicit xml_reader(std::u8string_view text) noexcept;

	std::expected<xml_element, xml_parse_error> parse_document();
};

inline std::expected<xml_element, xml_parse_error>
parse_xml_document(std::u8string_view text) {
	return xml_reader{ text }.parse_document();
}
