#include "bencode/BencodeParser.hpp"
#include "bencode/BencodeError.hpp"
#include <cstdlib>
#include <stdexcept>
#undef NDEBUG
#include <assert.h>

namespace {

BencodeValue parse(const std::string& input, const BencodeOptions& options = BencodeOptions()) {
    BencodeParser parser(input, options);
    return parser.parse();
}

// Parses input that must be rejected and returns the reported error.
BencodeParseError parseError(const std::string& input, const BencodeOptions& options = BencodeOptions()) {
    try {
        parse(input, options);
    } catch (const BencodeParseError& e) {
        return e;
    }
    assert(false && "input was accepted");
    std::abort();
}

BencodeValue::ByteString bytes(const std::string& text) {
    return BencodeValue::ByteString(text.begin(), text.end());
}

}

int main() {
    using Kind = BencodeParseError::Kind;

    // integers
    {
        assert(parse("i3e").asInteger() == BencodeInteger(3));
        assert(parse("i-3e").asInteger() == BencodeInteger(-3));
        assert(parse("i0e").asInteger() == BencodeInteger(0));
        assert(parse("i-42e").asInteger().toString() == "-42");
        assert(parse("i123456789012345678901234567890e").asInteger().toString() ==
               "123456789012345678901234567890");
    }

    {
        // a million digits, one forward pass
        std::string digits = "9" + std::string(999999, '0');
        BencodeInteger value = parse("i" + digits + "e").asInteger();
        assert(value.toString() == digits);
        int64_t out = 0;
        assert(!value.toInt64(out));

        std::string negative = "-3" + std::string(999998, '7') + "1";
        assert(parse("i" + negative + "e").asInteger().toString() == negative);
    }

    {
        BencodeParseError e = parseError("i03e");
        assert(e.kind() == Kind::IntegerWithLeadingZero);
        assert(e.position() == 2);

        assert(parseError("i00e").kind() == Kind::IntegerWithLeadingZero);
        assert(parseError("i01e").kind() == Kind::IntegerWithLeadingZero);
        assert(parseError("i-01e").kind() == Kind::IntegerWithLeadingZero);
    }

    {
        // sign and magnitude are parsed independently
        BencodeValue value = parse("i-0e");
        assert(value.asInteger().isZero());
        assert(!value.asInteger().isNegative());

        BencodeOptions strict;
        strict.rejectNegativeZero = true;
        BencodeParseError e = parseError("i-0e", strict);
        assert(e.kind() == Kind::NegativeZero);
        assert(e.position() == 1);
        assert(parse("i-1e", strict).asInteger() == BencodeInteger(-1));
    }

    {
        assert(parseError("ie").kind() == Kind::UnexpectedCharacter);
        assert(parseError("i-e").kind() == Kind::UnexpectedCharacter);
        assert(parseError("i--1e").kind() == Kind::UnexpectedCharacter);
        assert(parseError("i+1e").kind() == Kind::UnexpectedCharacter);

        BencodeParseError e = parseError("i1x2e");
        assert(e.kind() == Kind::UnexpectedCharacter);
        assert(e.position() == 2);

        assert(parseError("i12").kind() == Kind::UnexpectedEndOfFile);
        assert(parseError("i").kind() == Kind::UnexpectedEndOfFile);
    }

    // byte strings
    {
        assert(parse("4:spam").asByteString() == bytes("spam"));
        assert(parse("0:").asByteString().empty());

        // delimiters inside the payload do not end it early
        assert(parse("5:e:di1").asByteString() == bytes("e:di1"));

        std::string binary = std::string("3:") + '\0' + "\xff" "\x80";
        BencodeValue::ByteString expected = {0x00, 0xff, 0x80};
        assert(parse(binary).asByteString() == expected);
    }

    {
        BencodeParseError e = parseError("4:sp");
        assert(e.kind() == Kind::UnexpectedEndOfFile);
        assert(e.position() == 4);

        assert(parseError("4").kind() == Kind::UnexpectedEndOfFile);
        assert(parseError("04:spam").kind() == Kind::IntegerWithLeadingZero);
        assert(parseError("4x:spam").kind() == Kind::UnexpectedCharacter);
    }

    {
        BencodeParseError e = parseError("99999999999999999999999:x");
        assert(e.kind() == Kind::IntegerNotRepresentable);
        assert(e.position() == 0);
    }

    // lists
    {
        BencodeValue value = parse("l4:spam4:eggse");
        assert(value.isList());
        const BencodeValue::List& list = value.asList();
        assert(list.size() == 2);
        assert(list[0].asByteString() == bytes("spam"));
        assert(list[1].asByteString() == bytes("eggs"));

        assert(parse("le").asList().empty());

        BencodeValue nested = parse("lli1eeli2ei3eee");
        assert(nested.asList().size() == 2);
        assert(nested.asList()[1].asList()[1].asInteger() == BencodeInteger(3));

        assert(parseError("l4:spam").kind() == Kind::UnexpectedEndOfFile);
    }

    // dictionaries
    {
        BencodeValue value = parse("d3:cow3:moo4:spam4:eggse");
        const BencodeValue::Dictionary& dict = value.asDictionary();
        assert(dict.size() == 2);
        assert(dict.at("cow").asByteString() == bytes("moo"));
        assert(dict.at("spam").asByteString() == bytes("eggs"));

        // no ordering requirement on read
        assert(parse("d4:spam4:eggs3:cow3:mooe") == value);
        assert(parse("de").asDictionary().empty());
    }

    {
        // last occurrence wins
        BencodeValue value = parse("d1:ai1e1:ai2ee");
        assert(value.asDictionary().size() == 1);
        assert(value.asDictionary().at("a").asInteger() == BencodeInteger(2));

        BencodeOptions strict;
        strict.rejectDuplicateKeys = true;
        BencodeParseError e = parseError("d1:ai1e1:ai2ee", strict);
        assert(e.kind() == Kind::DuplicateKey);
        assert(e.position() == 7);
    }

    {
        BencodeParseError e = parseError("d1:\xffi1ee");
        assert(e.kind() == Kind::InvalidUtf8Key);
        assert(e.position() == 1);

        // values may hold arbitrary bytes
        assert(parse("d1:a1:\xff" "e").asDictionary().at("a").asByteString().size() == 1);
        assert(parse("d2:\xc3\xa9i1ee").asDictionary().count("\xc3\xa9") == 1);
    }

    {
        BencodeParseError e = parseError("di1ei2ee");
        assert(e.kind() == Kind::UnexpectedCharacter);
        assert(e.position() == 1);

        assert(parseError("d3:cow").kind() == Kind::UnexpectedEndOfFile);
        assert(parseError("d3:cowe").kind() == Kind::UnexpectedCharacter);
    }

    // top level
    {
        BencodeParseError e = parseError("i3ei4e");
        assert(e.kind() == Kind::UnexpectedCharacter);
        assert(e.position() == 3);

        e = parseError("");
        assert(e.kind() == Kind::UnexpectedEndOfFile);
        assert(e.position() == 0);

        e = parseError("x");
        assert(e.kind() == Kind::UnexpectedCharacter);
        assert(e.position() == 0);

        e = parseError("e");
        assert(e.kind() == Kind::UnexpectedCharacter);
    }

    {
        BencodeOptions shallow;
        shallow.maxDepth = 2;
        assert(parse("llee", shallow).asList().size() == 1);
        assert(parse("ld1:ai1eee", shallow).isList());

        BencodeParseError e = parseError("llleee", shallow);
        assert(e.kind() == Kind::NestingTooDeep);
        assert(e.position() == 3);

        std::string deep(10000, 'l');
        deep += std::string(10000, 'e');
        assert(parseError(deep).kind() == Kind::NestingTooDeep);
    }

    {
        BencodeParser parser("i1e");
        assert(parser.parse().asInteger() == BencodeInteger(1));
        bool thrown = false;
        try {
            parser.parse();
        } catch (const std::logic_error&) {
            thrown = true;
        }
        assert(thrown);
    }

    {
        BencodeParseError e = parseError("i03e");
        assert(std::string(e.what()) == "Integer with leading zero at offset 2");
    }

    return 0;
}
