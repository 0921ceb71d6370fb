#include "messages.h"

#include <array>
#include <utility>

// Common descriptions
std::u8string_view const internallimit
	= u8"The interior hit a limit of the target DIF format";
std::u8string_view const internalerror
	= u8"The converter had an internal error";
std::u8string_view const maperror
	= u8"The CSX file has a problem which must be fixed";

// Common explanations
std::u8string_view const selfexplanitory = u8"self explanitory";
std::u8string_view const contact
	= u8"If you think this error is not caused by the CSX file, you can file an issue at " PROJECT_ISSUE_TRACKER;

static MessageTable_t const messages[std::to_underlying(conversion_msg::last
)] = {
	{ u8"invalid message",
	  u8"This is a message should never be printed.",
	  contact },

	// Recoverable
	{ u8"Degenerate face",
	  u8"A face has no three non-collinear points, so no plane can be fitted through it. The face was dropped.",
	  u8"Find the brush in Constructor and remove or rebuild the collapsed face" },
	{ u8"Path node without an elevator",
	  u8"A path_node or trigger appears before any Door_Elevator entity, so it cannot be bound to one. It was dropped.",
	  u8"Move the entity after the Door_Elevator it belongs to, or delete it" },

	// Fatal
	{ u8"Capacity exceeded",
	  u8"A single brush (or a detail level or elevator that can not be split) has more points, planes or surfaces than one interior of the target DIF version can address",
	  u8"Simplify the brush, split it into several brushes or pick a DIF version with wider indices" },
	{ u8"Unsupported engine and DIF version combination",
	  u8"The requested engine has no binary layout for the requested interior version",
	  u8"Use version 0 for mbg and tge, 0-13 for tgea and 0-14 for t3d" },
	{ u8"Malformed CSX", maperror, u8"Re-export the scene from Constructor" },
	{ u8"Unable to read the CSX file",
	  u8"The input file could not be opened or read",
	  selfexplanitory },
	{ u8"Unable to write the DIF file",
	  u8"An output file could not be created or fully written",
	  u8"Check that the output directory is writable and has free space" },
	{ u8"Execution Cancelled",
	  u8"Tool execution was cancelled either by the user or due to a fatal compile setting",
	  selfexplanitory },
};

using namespace std::literals;
constexpr std::array<std::u8string_view, std::to_underlying(conversion_msg::last)>
	message_names{ u8"Invalid"sv,
				   u8"DegenerateGeometry"sv,
				   u8"UnboundPathNode"sv,
				   u8"CapacityExceeded"sv,
				   u8"UnsupportedVersionCombination"sv,
				   u8"MalformedInput"sv,
				   u8"UnreadableInput"sv,
				   u8"OutputWriteFailed"sv,
				   u8"ToolCancelled"sv };

MessageTable_t const & get_message(conversion_msg id) noexcept {
	return messages[std::to_underlying(id)];
}

std::u8string_view name_of_message(conversion_msg id) noexcept {
	return message_names[std::to_underlying(id)];
}
