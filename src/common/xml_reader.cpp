#include "xml_reader.h"

#include "numeric_string_conversions.h"

#include <algorithm>
#include <charconv>
#include <utility>

std::optional<std::u8string_view>
xml_element::attribute(std::u8string_view attributeName) const noexcept {
	for (xml_attribute const & a : attributes) {
		if (a.name == attributeName) {
			return a.value;
		}
	}
	return std::nullopt;
}

xml_element const *
xml_element::first_child(std::u8string_view childName) const noexcept {
	for (xml_element const & child : children) {
		if (child.name == childName) {
			return &child;
		}
	}
	return nullptr;
}

std::vector<xml_element const *>
xml_element::children_named(std::u8string_view childName) const {
	std::vector<xml_element const *> result;
	for (xml_element const & child : children) {
		if (child.name == childName) {
			result.push_back(&child);
		}
	}
	return result;
}

////////

static constexpr bool is_name_start_code_unit(char8_t c) noexcept {
	return (c >= u8'a' && c <= u8'z') || (c >= u8'A' && c <= u8'Z')
		|| c == u8'_' || c == u8':' || !is_ascii_code_unit(c);
}

static constexpr bool is_name_code_unit(char8_t c) noexcept {
	return is_name_start_code_unit(c) || (c >= u8'0' && c <= u8'9')
		|| c == u8'-' || c == u8'.';
}

xml_reader::xml_reader(std::u8string_view text) noexcept :
	remainingInput(text) {
	// UTF-8 byte order mark
	try_to_skip(remainingInput, u8"\xEF\xBB\xBF");
}

void xml_reader::advance(std::size_t numCodeUnits) noexcept {
	numCodeUnits = std::min(numCodeUnits, remainingInput.size());
	lineNumber += std::ranges::count(
		remainingInput.substr(0, numCodeUnits), u8'\n'
	);
	remainingInput.remove_prefix(numCodeUnits);
}

void xml_reader::skip_whitespace() noexcept {
	advance(std::min(
		remainingInput.size(),
		remainingInput.find_first_not_of(ascii_whitespace)
	));
}

bool xml_reader::skip_until_after(std::u8string_view terminator) noexcept {
	std::size_t const end = remainingInput.find(terminator);
	if (end == std::u8string_view::npos) [[unlikely]] {
		advance(remainingInput.size());
		return false;
	}
	advance(end + terminator.size());
	return true;
}

// Skips whitespace, comments and processing instructions (the XML
// declaration included)
bool xml_reader::skip_misc() {
	while (true) {
		skip_whitespace();
		if (remainingInput.starts_with(u8"<!--")) {
			if (!skip_until_after(u8"-->")) [[unlikely]] {
				return false;
			}
		} else if (remainingInput.starts_with(u8"<?")) {
			if (!skip_until_after(u8"?>")) [[unlikely]] {
				return false;
			}
		} else {
			return true;
		}
	}
}

std::optional<std::u8string_view> xml_reader::parse_name() noexcept {
	if (remainingInput.empty() || !is_name_start_code_unit(remainingInput[0]))
		[[unlikely]] {
		return std::nullopt;
	}
	std::size_t length = 1;
	while (length < remainingInput.size()
		   && is_name_code_unit(remainingInput[length])) {
		++length;
	}
	std::u8string_view const name = remainingInput.substr(0, length);
	advance(length);
	return name;
}

bool xml_reader::decode_text(std::u8string_view raw, std::u8string& out)
	const {
	while (!raw.empty()) {
		std::size_t const ampersand = raw.find(u8'&');
		out += raw.substr(0, ampersand);
		if (ampersand == std::u8string_view::npos) {
			return true;
		}
		raw.remove_prefix(ampersand + 1);

		std::size_t const semicolon = raw.find(u8';');
		if (semicolon == std::u8string_view::npos) [[unlikely]] {
			return false;
		}
		std::u8string_view const entity = raw.substr(0, semicolon);
		raw.remove_prefix(semicolon + 1);

		if (entity == u8"lt") {
			out += u8'<';
		} else if (entity == u8"gt") {
			out += u8'>';
		} else if (entity == u8"amp") {
			out += u8'&';
		} else if (entity == u8"apos") {
			out += u8'\'';
		} else if (entity == u8"quot") {
			out += u8'"';
		} else if (entity.starts_with(u8'#')) {
			std::u8string_view digits = entity.substr(1);
			std::optional<std::uint32_t> codePoint;
			if (try_to_skip_one(digits, u8'x')) {
				std::uint32_t value;
				char const * begin = (char const *) digits.data();
				char const * end = begin + digits.size();
				std::from_chars_result const result{
					std::from_chars(begin, end, value, 16)
				};
				if (!digits.empty() && result.ec == std::errc{}
					&& result.ptr == end) {
					codePoint = value;
				}
			} else if (!digits.starts_with(u8'+')) {
				codePoint = number_from_string<std::uint32_t>(digits);
			}
			if (!codePoint || codePoint.value() == 0
				|| !append_code_point_as_utf8(out, codePoint.value()))
				[[unlikely]] {
				return false;
			}
		} else [[unlikely]] {
			return false;
		}
	}
	return true;
}

xml_parse_error xml_reader::make_error(char const * message) const {
	return xml_parse_error{ .line = lineNumber,
							.message = std::u8string{
								to_u8string_view(message) } };
}

std::optional<xml_parse_error>
xml_reader::parse_attributes(xml_element& element) {
	while (true) {
		std::size_t const whitespaceLength = std::min(
			remainingInput.size(),
			remainingInput.find_first_not_of(ascii_whitespace)
		);
		advance(whitespaceLength);
		if (remainingInput.empty()) [[unlikely]] {
			return make_error("Unexpected end of document inside a tag");
		}
		if (remainingInput.starts_with(u8'>')
			|| remainingInput.starts_with(u8"/>")) {
			return std::nullopt;
		}
		if (whitespaceLength == 0) [[unlikely]] {
			return make_error("Expected whitespace before an attribute");
		}

		std::optional<std::u8string_view> const maybeName = parse_name();
		if (!maybeName) [[unlikely]] {
			return make_error("Expected an attribute name");
		}
		skip_whitespace();
		if (!try_to_skip_one(remainingInput, u8'=')) [[unlikely]] {
			return make_error("Expected '=' after an attribute name");
		}
		skip_whitespace();

		if (remainingInput.empty()
			|| (remainingInput[0] != u8'"' && remainingInput[0] != u8'\''))
			[[unlikely]] {
			return make_error("Expected a quoted attribute value");
		}
		char8_t const quote = remainingInput[0];
		std::size_t const closingQuote = remainingInput.find(quote, 1);
		if (closingQuote == std::u8string_view::npos) [[unlikely]] {
			return make_error("Unterminated attribute value");
		}
		std::u8string_view const rawValue = remainingInput.substr(
			1, closingQuote - 1
		);
		if (rawValue.contains(u8'<')) [[unlikely]] {
			return make_error("'<' is not allowed in an attribute value");
		}

		if (element.attribute(maybeName.value())) [[unlikely]] {
			return make_error("Duplicate attribute");
		}
		xml_attribute& attribute = element.attributes.emplace_back(
			xml_attribute{ .name = std::u8string{ maybeName.value() },
						   .value = {} }
		);
		if (!decode_text(rawValue, attribute.value)) [[unlikely]] {
			return make_error("Invalid entity reference in an attribute");
		}
		advance(closingQuote + 1);
	}
}

std::expected<xml_element, xml_parse_error> xml_reader::parse_document() {
	if (!skip_misc()) [[unlikely]] {
		return std::unexpected(make_error("Unterminated comment"));
	}
	if (remainingInput.starts_with(u8"<!")) [[unlikely]] {
		return std::unexpected(make_error("Document type declarations are not supported"));
	}
	if (!remainingInput.starts_with(u8'<')) [[unlikely]] {
		return std::unexpected(make_error("Expected the root element"));
	}

	// Elements whose end tag has not been read yet, innermost last
	std::vector<xml_element> openElements;
	std::optional<xml_element> root;

	while (!root) {
		if (remainingInput.empty()) [[unlikely]] {
			return std::unexpected(make_error("Unexpected end of document"));
		}

		if (!remainingInput.starts_with(u8'<')) {
			std::size_t const textLength = std::min(
				remainingInput.size(), remainingInput.find(u8'<')
			);
			std::u8string_view const rawText = remainingInput.substr(
				0, textLength
			);
			if (!decode_text(rawText, openElements.back().text))
				[[unlikely]] {
				return std::unexpected(
					make_error("Invalid entity reference in text")
				);
			}
			advance(textLength);
			continue;
		}

		if (remainingInput.starts_with(u8"<!--")) {
			if (!skip_until_after(u8"-->")) [[unlikely]] {
				return std::unexpected(make_error("Unterminated comment"));
			}
			continue;
		}
		if (remainingInput.starts_with(u8"<?")) {
			if (!skip_until_after(u8"?>")) [[unlikely]] {
				return std::unexpected(
					make_error("Unterminated processing instruction")
				);
			}
			continue;
		}
		if (remainingInput.starts_with(u8"<!")) [[unlikely]] {
			return std::unexpected(
				make_error("CDATA sections and declarations are not supported")
			);
		}

		if (remainingInput.starts_with(u8"</")) {
			advance(2);
			std::optional<std::u8string_view> const maybeName = parse_name();
			if (!maybeName) [[unlikely]] {
				return std::unexpected(make_error("Expected an end tag name"));
			}
			if (openElements.empty()
				|| openElements.back().name != maybeName.value())
				[[unlikely]] {
				return std::unexpected(make_error("Mismatched end tag"));
			}
			skip_whitespace();
			if (!try_to_skip_one(remainingInput, u8'>')) [[unlikely]] {
				return std::unexpected(make_error("Expected '>'"));
			}

			xml_element finished{ std::move(openElements.back()) };
			openElements.pop_back();
			if (openElements.empty()) {
				root = std::move(finished);
			} else {
				openElements.back().children.emplace_back(std::move(finished)
				);
			}
			continue;
		}

		// Start tag
		if (openElements.size() >= max_xml_element_depth) [[unlikely]] {
			return std::unexpected(make_error("Elements are nested too deeply"
			));
		}
		advance(1);
		xml_element element{};
		element.line = lineNumber;
		std::optional<std::u8string_view> const maybeName = parse_name();
		if (!maybeName) [[unlikely]] {
			return std::unexpected(make_error("Expected an element name"));
		}
		element.name = maybeName.value();

		if (std::optional<xml_parse_error> attributeError = parse_attributes(
				element
			)) [[unlikely]] {
			return std::unexpected(std::move(attributeError.value()));
		}

		if (try_to_skip(remainingInput, u8"/>")) {
			if (openElements.empty()) {
				root = std::move(element);
			} else {
				openElements.back().children.emplace_back(std::move(element));
			}
		} else {
			advance(1);
			openElements.emplace_back(std::move(element));
		}
	}

	if (!skip_misc()) [[unlikely]] {
		return std::unexpected(make_error("Unterminated comment"));
	}
	if (!remainingInput.empty()) [[unlikely]] {
		return std::unexpected(
			make_error("Unexpected content after the root element")
		);
	}
	return std::move(root.value());
}
