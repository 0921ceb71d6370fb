#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

// std::nullopt if the file can't be read or isn't valid UTF-8
std::optional<std::u8string> read_utf8_file(
	std::filesystem::path const & filePath, bool windowsLineEndingsToUnix
);

// Replaces the file. Returns false if it could not be fully written
bool write_binary_file(
	std::filesystem::path const & filePath, std::span<std::byte const> data
);

// "maps/level.csx" -> "maps/level"
std::filesystem::path path_without_extension(std::filesystem::path filePath);
