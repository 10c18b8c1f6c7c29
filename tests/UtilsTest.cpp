#include "utils/Utf8Utils.hpp"
#include "utils/Url.hpp"
#include "bencode/BencodeCodingPath.hpp"
#include "bencode/BencodeValue.hpp"
#undef NDEBUG
#include <assert.h>

namespace {

bool utf8(const std::string& s) {
    return Utf8Utils::isValid(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

}

int main() {
    {
        assert(utf8(""));
        assert(utf8("plain ascii"));
        assert(utf8("caf\xc3\xa9"));
        assert(utf8("\xe2\x82\xac"));
        assert(utf8("\xf0\x9f\x98\x80"));

        assert(!utf8("\xff"));
        assert(!utf8("\xc0\x80"));          // overlong NUL
        assert(!utf8("\xe2\x82"));          // truncated
        assert(!utf8("\xed\xa0\x80"));      // surrogate
        assert(!utf8("\xf4\x90\x80\x80"));  // past U+10FFFF
        assert(!utf8("\x80"));
    }

    {
        std::optional<Url> url = Url::parse("udp://tracker.opentrackr.org:1337/announce");
        assert(url);
        assert(url->getScheme() == "udp");
        assert(url->getHost() == "tracker.opentrackr.org");
        assert(url->getPort() == std::optional<std::string>("1337"));
        assert(url->getPath() == "/announce");
        assert(!url->getQuery());

        url = Url::parse("https://tracker.example.org/announce?passkey=abc");
        assert(url);
        assert(!url->getPort());
        assert(url->getQuery() == std::optional<std::string>("passkey=abc"));
        assert(*url == *Url::parse("https://tracker.example.org/announce?passkey=abc"));

        assert(!Url::parse(""));
        assert(!Url::parse("not a url"));
        assert(!Url::parse("http://"));
    }

    {
        BencodeCodingPath root;
        assert(root.empty());
        assert(root.toString() == "<root>");

        BencodeCodingPath info = root.appendingKey("info");
        BencodeCodingPath file = info.appendingKey("files").appendingIndex(2).appendingKey("path").appendingIndex(0);
        assert(file.toString() == "info.files[2].path[0]");
        assert(file.size() == 5);

        // extending leaves the source path untouched
        assert(root.empty());
        assert(info.toString() == "info");

        assert(root.appendingIndex(3).toString() == "[3]");
        assert(BencodeCodingKey::listIndex(3).stringValue() == "3");
        assert(BencodeCodingKey::listIndex(3).intValue() == 3);
        assert(BencodeCodingKey::dictionaryKey("3") != BencodeCodingKey::listIndex(3));
    }

    {
        BencodeValue::Dictionary dict;
        dict.emplace("name", BencodeValue::fromString("spam"));
        dict.emplace("count", BencodeValue(BencodeInteger(-3)));
        dict.emplace("huge", BencodeValue(BencodeInteger::fromDecimal("123456789012345678901234567890")));
        dict.emplace("max", BencodeValue(BencodeInteger::fromDecimal("18446744073709551615")));
        dict.emplace("hash", BencodeValue(BencodeValue::ByteString{0xde, 0xad, 0xbe, 0xef}));
        dict.emplace("list", BencodeValue(BencodeValue::List{BencodeValue(BencodeInteger(1)), BencodeValue::fromString("x")}));
        BencodeValue value(dict);

        nlohmann::json json = value.toJson();
        assert(json["name"] == "spam");
        assert(json["count"] == -3);
        assert(json["huge"] == "123456789012345678901234567890");
        assert(json["max"] == 18446744073709551615ull);
        assert(json["hash"]["bytes"] == "deadbeef");
        assert(json["list"].size() == 2);
        assert(json["list"][1] == "x");
        assert(json.dump() == R"({"count":-3,"hash":{"bytes":"deadbeef"},"huge":"123456789012345678901234567890",)"
                              R"("list":[1,"x"],"max":18446744073709551615,"name":"spam"})");
    }

    {
        assert(BencodeValue(BencodeValue::List{}).type() == BencodeValue::Type::List);
        assert(std::string(BencodeValue::typeName(BencodeValue::Type::ByteString)) == "byte string");
        assert(BencodeValue::fromString("a") != BencodeValue::fromString("b"));
    }

    return 0;
}
