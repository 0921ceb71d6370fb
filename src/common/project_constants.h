#pragma once

#include <string>

constexpr std::u8string_view projectIssueTracker
	= u8"" PROJECT_ISSUE_TRACKER;

constexpr std::u8string_view projectVersionString = u8"v" PROJECT_VERSION;
constexpr std::u8string_view projectPlatformVersion = u8"" PLATFORM_VERSION;

constexpr std::u8string_view projectName = u8"" PROJECT_NAME;
constexpr std::u8string_view projectDescription
	= u8"Torque Constructor CSX to DIF interior converter";
