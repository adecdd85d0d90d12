/// @file manager.cpp
/// @brief ToolManager registration, lookup and invocation

#include "toolmedia/exceptions.hpp"
#include "toolmedia/tools/manager.hpp"

#include <cassert>
#include <iostream>

using namespace toolmedia;
using namespace toolmedia::tools;

static Tool create_echo_tool()
{
    return Tool("echo",
                [](const Json& args)
                {
                    return Json{{"content", Json::array({{{"type", "text"},
                                                          {"text", args.value("text", "")}}})}};
                },
                "Echo the text argument");
}

void test_register_and_invoke()
{
    std::cout << "  test_register_and_invoke... " << std::flush;
    ToolManager tm;
    tm.register_tool(create_echo_tool());
    assert(tm.has("echo"));
    auto res = tm.invoke("echo", Json{{"text", "hi"}});
    assert(res["content"][0]["text"] == "hi");
    assert(tm.get("echo").description() == "Echo the text argument");
    std::cout << "PASSED\n";
}

void test_missing_tool()
{
    std::cout << "  test_missing_tool... " << std::flush;
    ToolManager tm;
    bool threw = false;
    try
    {
        tm.invoke("missing", Json::object());
    }
    catch (const NotFoundError& e)
    {
        threw = true;
        assert(std::string(e.what()) == "tool not found: missing");
    }
    assert(threw);

    threw = false;
    try
    {
        tm.get("missing");
    }
    catch (const NotFoundError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_list_and_replace()
{
    std::cout << "  test_list_and_replace... " << std::flush;
    ToolManager tm;
    tm.register_tool(Tool("read", [](const Json&) { return Json{{"v", 1}}; }));
    tm.register_tool(Tool("bash", [](const Json&) { return Json{{"v", 2}}; }));
    tm.register_tool(create_echo_tool());

    auto names = tm.list_names();
    assert((names == std::vector<std::string>{"bash", "echo", "read"}));
    assert(tm.list().size() == 3);

    // Same name replaces
    tm.register_tool(Tool("read", [](const Json&) { return Json{{"v", 3}}; }));
    assert(tm.list_names().size() == 3);
    assert(tm.invoke("read", Json::object())["v"] == 3);
    std::cout << "PASSED\n";
}

void test_with_fn_keeps_identity()
{
    std::cout << "  test_with_fn_keeps_identity... " << std::flush;
    Tool echo = create_echo_tool();
    Tool silent = echo.with_fn([](const Json&) { return Json{{"content", Json::array()}}; });
    assert(silent.name() == "echo");
    assert(silent.description() == "Echo the text argument");
    assert(silent.invoke(Json::object())["content"].empty());
    // Original is unchanged
    assert(echo.invoke(Json{{"text", "x"}})["content"][0]["text"] == "x");
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "ToolManager tests\n";
    test_register_and_invoke();
    test_missing_tool();
    test_list_and_replace();
    test_with_fn_keeps_identity();
    std::cout << "All ToolManager tests passed\n";
    return 0;
}
