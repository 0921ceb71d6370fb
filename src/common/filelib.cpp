#include "filelib.h"

#include "utf8.h"

#include <fstream>
#include <tuple>

// <Opened successfully>, <Size of file>, <File stream>
std::tuple<bool, std::size_t, std::ifstream> static open_file_and_get_size(
	std::filesystem::path const & filePath
) {
	// Open the file and get the file size
	std::ifstream file{ filePath.c_str(),
						std::ios::ate | std::ios::binary | std::ios::in };
	std::streampos fileSize = file.tellg();
	file.seekg(0, std::ios_base::beg);
	return std::make_tuple(file.good(), fileSize, std::move(file));
}

std::optional<std::u8string> read_utf8_file(
	std::filesystem::path const & filePath, bool windowsLineEndingsToUnix
) {
	auto [fileOpened, fileSize, file] = open_file_and_get_size(filePath);
	if (!fileOpened) {
		return std::nullopt;
	}

	std::u8string text;
	text.resize_and_overwrite(
		fileSize,
		[&file](char8_t* buffer, std::size_t bufferSize) {
			file.read((char*) buffer, bufferSize);

			if (file.eof()) [[unlikely]] {
				// In case the file shrunk between tellg() and the read
				file.clear();
				return std::size_t(file.gcount());
			}

			return bufferSize;
		}
	);
	if (!file.good()) {
		return std::nullopt;
	}

	if (windowsLineEndingsToUnix) {
		std::size_t outIndex = 0;
		for (std::u8string_view remainingCharactersToCopy{ text };
			 !remainingCharactersToCopy.empty();
			 remainingCharactersToCopy = remainingCharactersToCopy.substr(1
			 )) {
			if (remainingCharactersToCopy.starts_with(u8"\r\n")) {
				remainingCharactersToCopy
					= remainingCharactersToCopy.substr(1);
			}
			text[outIndex++] = remainingCharactersToCopy[0];
		}
		text.resize(outIndex);
	}

	if (!validate_utf8(text)) [[unlikely]] {
		return std::nullopt;
	}

	// Don't waste space if the file shrunk between tellg() and read()
	// or if Windows line endings were replaced
	text.shrink_to_fit();

	return text;
}

bool write_binary_file(
	std::filesystem::path const & filePath, std::span<std::byte const> data
) {
	std::ofstream file{ filePath.c_str(),
						std::ios::binary | std::ios::out | std::ios::trunc };
	if (!file.good()) {
		return false;
	}
	file.write((char const *) data.data(), data.size());
	file.close();
	return !file.fail();
}

std::filesystem::path path_without_extension(std::filesystem::path filePath
) {
	filePath.replace_extension();
	return filePath;
}
