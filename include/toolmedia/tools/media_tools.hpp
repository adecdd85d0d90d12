#pragma once
#include "toolmedia/sanitize/content_sanitizer.hpp"
#include "toolmedia/tools/manager.hpp"
#include "toolmedia/tools/tool.hpp"

#include <memory>
#include <vector>

namespace toolmedia::tools
{

constexpr const char* kReadToolName = "read";
constexpr const char* kBashToolName = "bash";

/// Path argument of a read call, "<unknown>" when missing
std::string read_path_argument(const Json& args);

/// Read tool whose image results get their MIME type repaired from the bytes
/// (ReadImageError propagates) and are then sanitized as `read:<path>`.
Tool wrap_read_tool(Tool base, std::shared_ptr<const sanitize::ContentSanitizer> sanitizer,
                    sanitize::SanitizeOptions options = {});

/// Bash tool whose results are sanitized as `bash`
Tool wrap_bash_tool(Tool base, std::shared_ptr<const sanitize::ContentSanitizer> sanitizer,
                    sanitize::SanitizeOptions options = {});

/// Wraps `read` and `bash`, other tools are returned as they are
std::vector<Tool> wrap_media_tools(const std::vector<Tool>& tools,
                                   std::shared_ptr<const sanitize::ContentSanitizer> sanitizer,
                                   sanitize::SanitizeOptions options = {});

/// Same, replacing the registered tools in place
void wrap_media_tools(ToolManager& manager,
                      std::shared_ptr<const sanitize::ContentSanitizer> sanitizer,
                      sanitize::SanitizeOptions options = {});

} // namespace toolmedia::tools
