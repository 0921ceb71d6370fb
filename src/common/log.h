#pragma once
#include "cmdlib.h"
#include "messages.h"

#include <filesystem>
#include <optional>
#include <string>

enum class developer_level {
	disabled,
	error,
	warning,
	message,
	fluff,
	spam,
	megaspam,
	max_level = megaspam
};

constexpr std::u8string_view developer_level_options{
	u8"disabled|error|warning|message|fluff|spam|megaspam"
};

std::optional<developer_level>
developer_level_from_string(std::u8string_view nameOrIntegerString);

std::u8string_view name_of_developer_level(developer_level level) noexcept;

//
// log.cpp globals
//

extern std::u8string g_Program;
// Input path without its extension, used for <base>.log and <base>.err
extern std::filesystem::path g_Mapname;

extern developer_level g_developer;
extern bool g_verbose;
extern bool g_log;

//
// log.cpp Functions
//

extern void ResetLog();
extern void ResetErrorLog();

extern void OpenLog();
extern void CloseLog();
extern void WriteLog(char const * const message);

extern void FORMAT_PRINTF(2, 3)
	Developer(developer_level level, char const * const message, ...);

extern void FORMAT_PRINTF(1, 2)
	PrintConsole(char const * const message, ...);
extern void FlushConsole();
extern void FORMAT_PRINTF(1, 2) Verbose(char const * const message, ...);
extern void FORMAT_PRINTF(1, 2) Log(char const * const message, ...);
extern void FORMAT_PRINTF(1, 2) Error(char const * const error, ...);
extern void FORMAT_PRINTF(2, 3)
	Fatal(conversion_msg msgid, char const * const error, ...);
extern void FORMAT_PRINTF(1, 2) Warning(char const * const warning, ...);

extern void LogStart(int const argc, char** argv);
extern void LogEnd();
extern void Banner();

extern void LogTimeElapsed(double elapsed_time);

// Note: The first element in argv is skipped since that's usually
// the executable path
void log_arguments(int argc, char** argv);
