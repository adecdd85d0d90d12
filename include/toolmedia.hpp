#pragma once

/// @file toolmedia.hpp
/// @brief Main header for toolmedia - includes the commonly used components
///
/// Usage:
/// @code
/// #include <toolmedia.hpp>
///
/// int main() {
///     auto settings = toolmedia::Settings::from_env();
///     auto sanitizer = toolmedia::sanitize::ContentSanitizer::from_settings(settings);
///
///     toolmedia::tools::ToolManager tools;
///     tools.register_tool(toolmedia::tools::Tool("bash", run_bash));
///     toolmedia::tools::wrap_media_tools(tools, sanitizer);
/// }
/// @endcode

// Core types and exceptions
#include "toolmedia/content.hpp"
#include "toolmedia/exceptions.hpp"
#include "toolmedia/types.hpp"
#include "toolmedia/version.hpp"

// Configuration and logging
#include "toolmedia/logging.hpp"
#include "toolmedia/settings.hpp"

// Image handling
#include "toolmedia/media/codec.hpp"
#include "toolmedia/media/image_backend.hpp"
#include "toolmedia/media/image_ops.hpp"
#include "toolmedia/media/mime.hpp"

// Tool result sanitizing
#include "toolmedia/sanitize/content_sanitizer.hpp"
#include "toolmedia/sanitize/read_result.hpp"
#include "toolmedia/tools/media_tools.hpp"
