#pragma once
#include "toolmedia/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace toolmedia::tools
{

/// A named tool: JSON arguments in, JSON tool result (`{"content": [...]}`) out
class Tool
{
  public:
    using Fn = std::function<toolmedia::Json(const toolmedia::Json&)>;

    Tool(std::string name, Fn fn, std::optional<std::string> description = std::nullopt)
        : name_(std::move(name)), description_(std::move(description)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::optional<std::string>& description() const
    {
        return description_;
    }
    toolmedia::Json invoke(const toolmedia::Json& input) const
    {
        return fn_(input);
    }

    /// Same name and description, different behaviour
    Tool with_fn(Fn fn) const
    {
        return Tool(name_, std::move(fn), description_);
    }

  private:
    std::string name_;
    std::optional<std::string> description_;
    Fn fn_;
};

} // namespace toolmedia::tools
