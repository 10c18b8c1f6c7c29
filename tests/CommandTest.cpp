#include "commands/CommandOptions.hpp"
#include "commands/DecodeCommand.hpp"
#include "commands/InfoCommand.hpp"
#include "manager/CommandManager.hpp"
#include <iostream>
#include <sstream>
#include <memory>
#include <stdexcept>
#undef NDEBUG
#include <assert.h>

namespace {

CommandOptions parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    for (auto& word : words) {
        argv.push_back(&word[0]);
    }
    return CommandOptions::parse(static_cast<int>(argv.size()), argv.data(), 2);
}

// Runs a command through the manager and captures what it prints.
bool run(const std::string& name, const CommandOptions& options, std::string& out, std::string& err) {
    CommandManager manager;
    manager.registerCommand("decode", std::make_unique<DecodeCommand>());
    manager.registerCommand("info", std::make_unique<InfoCommand>());

    std::stringstream outStream;
    std::stringstream errStream;
    std::streambuf* oldOut = std::cout.rdbuf(outStream.rdbuf());
    std::streambuf* oldErr = std::cerr.rdbuf(errStream.rdbuf());
    bool ok = manager.executeCommand(name, options);
    std::cout.rdbuf(oldOut);
    std::cerr.rdbuf(oldErr);

    out = outStream.str();
    err = errStream.str();
    return ok;
}

}

int main() {
    {
        CommandOptions options = parse({"bencode-inspect", "decode", "--max-depth", "8", "--strict", "i3e"});
        assert(options.args == std::vector<std::string>{"i3e"});
        assert(options.hasOption("--max-depth"));
        assert(options.hasFlag("--strict"));

        BencodeOptions bencodeOptions = options.toBencodeOptions();
        assert(bencodeOptions.maxDepth == 8);
        assert(bencodeOptions.rejectNegativeZero);
        assert(bencodeOptions.rejectDuplicateKeys);

        BencodeOptions defaults = parse({"bencode-inspect", "decode", "i3e"}).toBencodeOptions();
        assert(defaults.maxDepth == 512);
        assert(!defaults.rejectNegativeZero);
    }

    {
        bool thrown = false;
        try {
            parse({"bencode-inspect", "decode", "-f"});
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            parse({"bencode-inspect", "decode", "--max-depth", "deep"}).toBencodeOptions();
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }

    {
        std::string out, err;
        assert(run("decode", parse({"bencode-inspect", "decode", "d3:cow3:moo4:spaml1:a1:bee"}), out, err));
        assert(out == "{\"cow\":\"moo\",\"spam\":[\"a\",\"b\"]}\n");
        assert(err.empty());
    }

    {
        std::string out, err;
        assert(run("decode", parse({"bencode-inspect", "decode", "l4:\xde\xad\xbe\xef" "3:abce"}), out, err));
        assert(out == "[{\"bytes\":\"deadbeef\"},\"abc\"]\n");

        // a real dictionary with a "bytes" key prints the same way
        std::string dictOut;
        assert(run("decode", parse({"bencode-inspect", "decode", "ld5:bytes8:deadbeefe3:abce"}), dictOut, err));
        assert(dictOut == out);
    }

    {
        std::string out, err;
        assert(!run("decode", parse({"bencode-inspect", "decode", "i03e"}), out, err));
        assert(out.empty());
        assert(err == "Error executing command: Decode failed: Integer with leading zero at offset 2\n");

        assert(run("decode", parse({"bencode-inspect", "decode", "i-0e"}), out, err));
        assert(out == "0\n");
        assert(!run("decode", parse({"bencode-inspect", "decode", "--strict", "i-0e"}), out, err));
        assert(err == "Error executing command: Decode failed: Negative zero at offset 1\n");
    }

    {
        std::string out, err;
        assert(!run("seed", parse({"bencode-inspect", "seed"}), out, err));
        assert(err == "Unknown command: seed\n");

        assert(!run("info", parse({"bencode-inspect", "info", "/nonexistent/file.torrent"}), out, err));
        assert(err.find("Cannot open file: /nonexistent/file.torrent") != std::string::npos);
    }

    return 0;
}
