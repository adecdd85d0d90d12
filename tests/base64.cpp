#include "toolmedia/util/base64.hpp"

#include <cassert>
#include <iostream>

using namespace toolmedia;
namespace b64 = toolmedia::util::base64;

int main()
{
    auto bytes = [](const std::string& s) { return Bytes(s.begin(), s.end()); };

    assert(b64::encode(bytes("")) == "");
    assert(b64::encode(bytes("f")) == "Zg==");
    assert(b64::encode(bytes("fo")) == "Zm8=");
    assert(b64::encode(bytes("foo")) == "Zm9v");
    assert(b64::encode(bytes("foobar")) == "Zm9vYmFy");
    std::cout << "[OK] encode\n";

    assert(b64::decode("Zm9vYmFy") == bytes("foobar"));
    assert(b64::decode("Zm8=") == bytes("fo"));
    // Whitespace and junk are skipped
    assert(b64::decode(" Zm9v\nYmFy\t") == bytes("foobar"));
    assert(b64::decode("Zm9v*YmFy") == bytes("foobar"));
    // Decoding stops at padding
    assert(b64::decode("Zg==Zm9v") == bytes("f"));
    // URL-safe alphabet
    assert(b64::decode("-_-_") == b64::decode("+/+/"));
    assert(b64::decode("").empty());
    std::cout << "[OK] decode\n";

    assert(b64::trim("  abc \n") == "abc");
    assert(b64::trim("\t\r\n ").empty());
    assert(b64::trim("abc") == "abc");
    std::cout << "[OK] trim\n";

    Bytes binary;
    for (int i = 0; i < 256; ++i)
        binary.push_back(static_cast<std::uint8_t>(i));
    assert(b64::decode(b64::encode(binary)) == binary);
    std::cout << "[OK] binary\n";

    return 0;
}
