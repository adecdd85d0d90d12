#pragma once
#include "toolmedia/exceptions.hpp"
#include "toolmedia/tools/tool.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolmedia::tools
{

class ToolManager
{
  public:
    void register_tool(const Tool& t)
    {
        tools_.insert_or_assign(t.name(), t);
    }

    bool has(const std::string& name) const
    {
        return tools_.count(name) > 0;
    }

    const Tool& get(const std::string& name) const
    {
        auto it = tools_.find(name);
        if (it == tools_.end())
            throw toolmedia::NotFoundError("tool not found: " + name);
        return it->second;
    }

    toolmedia::Json invoke(const std::string& name, const toolmedia::Json& input) const
    {
        return get(name).invoke(input);
    }

    /// Sorted
    std::vector<std::string> list_names() const
    {
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& kv : tools_)
            names.push_back(kv.first);
        std::sort(names.begin(), names.end());
        return names;
    }

    std::vector<Tool> list() const
    {
        std::vector<Tool> out;
        for (const auto& name : list_names())
            out.push_back(tools_.at(name));
        return out;
    }

  private:
    std::unordered_map<std::string, Tool> tools_;
};

} // namespace toolmedia::tools
