#include "log.h"

#include "cli_option_defaults.h"
#include "numeric_string_conversions.h"
#include "project_constants.h"
#include "utf8.h"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <utility>

std::u8string g_Program = u8"Uninitialized variable";
std::filesystem::path g_Mapname;

developer_level g_developer = cli_option_defaults::developer;
bool g_verbose = cli_option_defaults::verbose;
bool g_log = cli_option_defaults::log;

static FILE* CompileLog = nullptr;
// Workers of different interiors log concurrently
static std::mutex logMutex;

// All lower-case, for the sake of case-insensitive comparisons
using namespace std::literals;
constexpr std::array<std::u8string_view, std::size_t(developer_level::max_level) + 1>
	developer_level_names{ u8"disabled"sv, u8"error"sv, u8"warning"sv,
						   u8"message"sv,  u8"fluff"sv, u8"spam"sv,
						   u8"megaspam"sv };

std::u8string_view name_of_developer_level(developer_level level) noexcept {
	return developer_level_names[std::to_underlying(level)];
}

std::optional<developer_level>
developer_level_from_string(std::u8string_view nameOrIntegerString) {
	for (std::size_t i = 0; i != developer_level_names.size(); ++i) {
		if (strings_equal_with_ascii_case_insensitivity(
				nameOrIntegerString, developer_level_names[i]
			)) {
			return developer_level(i);
		}
	}
	return clamp_signed_integer_from_string(
			   nameOrIntegerString,
			   std::to_underlying(developer_level::disabled),
			   std::to_underlying(developer_level::max_level)
	)
		.transform([](std::int64_t integerForm) {
			return developer_level(integerForm);
		});
}

////////

static std::filesystem::path path_to_log_file(std::filesystem::path base) {
	base += u8".log";
	return base;
}

static std::filesystem::path
path_to_error_log_file(std::filesystem::path base) {
	base += u8".err";
	return base;
}

void ResetLog() {
	if (g_log) {
		std::error_code ignoredMissingFile;
		std::filesystem::remove(path_to_log_file(g_Mapname), ignoredMissingFile);
	}
}

void ResetErrorLog() {
	if (g_log) {
		std::error_code ignoredMissingFile;
		std::filesystem::remove(
			path_to_error_log_file(g_Mapname), ignoredMissingFile
		);
	}
}

static void LogError(char const * const message) {
	if (g_log && CompileLog) {
		std::filesystem::path filePath{ path_to_error_log_file(g_Mapname) };
		FILE* ErrorLog{ fopen(filePath.c_str(), "a") };

		if (ErrorLog) {
			fprintf(
				ErrorLog,
				"%s: %s\n",
				(char const *) g_Program.data(),
				message
			);
			fflush(ErrorLog);
			fclose(ErrorLog);
		} else {
			fprintf(
				stderr,
				"ERROR: Could not open error logfile %s",
				filePath.c_str()
			);
			fflush(stderr);
		}
	}
}

void OpenLog() {
	if (g_log) {
		std::filesystem::path filePath{ path_to_log_file(g_Mapname) };
		CompileLog = fopen(filePath.c_str(), "a");

		if (!CompileLog) {
			fprintf(
				stderr, "ERROR: Could not open logfile %s", filePath.c_str()
			);
			fflush(stderr);
		}
	}
}

void CloseLog() {
	if (g_log && CompileLog) {
		LogEnd();
		fflush(CompileLog);
		fclose(CompileLog);
		CompileLog = nullptr;
	}
}

//
//  Every function up to this point should check g_log, the functions below
//  should not
//

void WriteLog(char const * const message) {
	std::scoped_lock lock{ logMutex };
	if (CompileLog) {
		fprintf(CompileLog, "%s", message);
		fflush(CompileLog);
	}

	fprintf(stdout, "%s", message);
	fflush(stdout);
}

#define MAX_ERROR	2048
#define MAX_WARNING 2048
#define MAX_MESSAGE 2048

// =====================================================================================
//  Error
//      for formatted error messages, fatals out
// =====================================================================================
void FORMAT_PRINTF(1, 2) Error(char const * const error, ...) {
	char message[MAX_ERROR];
	char message2[MAX_ERROR];
	va_list argptr;

	va_start(argptr, error);
	vsnprintf(message, MAX_ERROR, error, argptr);
	va_end(argptr);

	safe_snprintf(message2, MAX_MESSAGE, "%s%s\n", "Error: ", message);
	WriteLog(message2);
	LogError(message2);

	exit(1);
}

// =====================================================================================
//  Fatal
//      For formatted 'fatal' messages, followed by the message table entry
//      The caller decides when to stop
// =====================================================================================
void FORMAT_PRINTF(2, 3)
	Fatal(conversion_msg msgid, char const * const warning, ...) {
	char message[MAX_WARNING];
	char message2[MAX_WARNING];

	va_list argptr;

	va_start(argptr, warning);
	vsnprintf(message, MAX_WARNING, warning, argptr);
	va_end(argptr);

	safe_snprintf(message2, MAX_MESSAGE, "%s%s\n", "Error: ", message);
	WriteLog(message2);
	LogError(message2);

	MessageTable_t const & msg = get_message(msgid);
	safe_snprintf(
		message2,
		MAX_MESSAGE,
		"%s\nDescription: %s\nHow to fix: %s\n",
		(char const *) msg.title.data(),
		(char const *) msg.text.data(),
		(char const *) msg.howto.data()
	);
	WriteLog(message2);
	LogError(message2);
}

// =====================================================================================
//  Warning
//      For formatted warning messages
//      automatically appends an extra newline to the message
// =====================================================================================
void FORMAT_PRINTF(1, 2) Warning(char const * const warning, ...) {
	char message[MAX_WARNING];
	char message2[MAX_WARNING];

	va_list argptr;

	va_start(argptr, warning);
	vsnprintf(message, MAX_WARNING, warning, argptr);
	va_end(argptr);

	safe_snprintf(message2, MAX_MESSAGE, "%s%s\n", "Warning: ", message);
	WriteLog(message2);
}

// =====================================================================================
//  Verbose
//      Same as log but only prints when in verbose mode
// =====================================================================================
void FORMAT_PRINTF(1, 2) Verbose(char const * const warning, ...) {
	if (g_verbose) {
		char message[MAX_MESSAGE];

		va_list argptr;

		va_start(argptr, warning);
		vsnprintf(message, MAX_MESSAGE, warning, argptr);
		va_end(argptr);

		WriteLog(message);
	}
}

// =====================================================================================
//  Developer
//      Same as log but only prints when in developer mode
// =====================================================================================
void FORMAT_PRINTF(2, 3)
	Developer(developer_level level, char const * const warning, ...) {
	if (level <= g_developer) {
		char message[MAX_MESSAGE];

		va_list argptr;

		va_start(argptr, warning);
		vsnprintf(message, MAX_MESSAGE, warning, argptr);
		va_end(argptr);

		WriteLog(message);
	}
}

static void DisplayDeveloperLevel() {
	if (g_developer == developer_level::disabled) {
		Log("Developer messages disabled.\n");
		return;
	}

	Log("Developer messages enabled, logging everything above level: %s\n",
		(char const *) name_of_developer_level(g_developer).data());
}

// =====================================================================================
//  Log
//      For formatted log output messages
// =====================================================================================
void FORMAT_PRINTF(1, 2) Log(char const * const warning, ...) {
	char message[MAX_MESSAGE];

	va_list argptr;

	va_start(argptr, warning);
	vsnprintf(message, MAX_MESSAGE, warning, argptr);
	va_end(argptr);

	WriteLog(message);
}

void log_arguments(int argc, char** argv) {
	Log("Arguments: ");
	// i = 1 to skip the executable path
	for (int i = 1; i < argc; i++) {
		std::string_view arg{ argv[i] };
		if (arg.contains(' ')) {
			Log("\"%s\" ", argv[i]);
		} else {
			Log("%s ", argv[i]);
		}
	}
	Log("\n");
}

void Banner() {
	Log("%s %s %s\n",
		(char const *) g_Program.data(),
		(char const *) projectVersionString.data(),
		(char const *) projectPlatformVersion.data());

	Log("%s - %s\n"
		"Submit detailed bug reports to %s\n",
		(char const *) projectName.data(),
		(char const *) projectDescription.data(),
		(char const *) projectIssueTracker.data());
}

void LogStart(int argc, char** argv) {
	Banner();
	Log("-----  BEGIN  %s -----\n", (char const *) g_Program.data());
	log_arguments(argc, argv);
	DisplayDeveloperLevel();
}

void LogEnd() {
	Log("\n-----   END   %s -----\n\n\n\n",
		(char const *) g_Program.data());
}

static void seconds_to_hhmm(
	unsigned int elapsed_time,
	unsigned& hours,
	unsigned& minutes,
	unsigned& seconds
) {
	seconds = elapsed_time % 60;
	elapsed_time /= 60;

	minutes = elapsed_time % 60;
	elapsed_time /= 60;

	hours = elapsed_time;
}

void LogTimeElapsed(double elapsed_time) {
	unsigned hours = 0;
	unsigned minutes = 0;
	unsigned seconds = 0;

	seconds_to_hhmm(elapsed_time, hours, minutes, seconds);

	if (hours) {
		Log("%.2f seconds elapsed [%uh %um %us]\n",
			elapsed_time,
			hours,
			minutes,
			seconds);
	} else if (minutes) {
		Log("%.2f seconds elapsed [%um %us]\n",
			elapsed_time,
			minutes,
			seconds);
	} else {
		Log("%.2f seconds elapsed\n", elapsed_time);
	}
}

void FORMAT_PRINTF(1, 2) PrintConsole(char const * const warning, ...) {
	char message[MAX_MESSAGE];

	va_list argptr;

	va_start(argptr, warning);
	vsnprintf(message, MAX_MESSAGE, warning, argptr);
	va_end(argptr);

	std::scoped_lock lock{ logMutex };
	fprintf(stdout, "%s", message);
}

void FlushConsole() {
	std::scoped_lock lock{ logMutex };
	fflush(stdout);
}
