#include "StompFrame.hpp"
#include "StompErrors.hpp"
#include "StompTestBench.hpp"
#include <string>

using namespace std::string_literals;

namespace {

std::unique_ptr<const StompFrame> parseInPieces(const std::string& bytes, size_t split) {
    StompFrameParser parser;
    std::string rest = parser.process(bytes.substr(0, split));
    check(rest.empty(), "no leftover expected before the frame is complete");
    rest = parser.process(bytes.substr(split));
    check(rest.empty(), "no leftover expected after a single frame");
    return parser.takeFrame();
}

void checkSameFrame(const StompFrame& actual, const StompFrame& expected, const std::string& what) {
    checkEqual(actual.command(), expected.command(), what + " command");
    check(actual.headers() == expected.headers(), what + ": headers differ");
    checkEqual(actual.body(), expected.body(), what + " body");
}

} // namespace

int main() {
    StompTestBench bench("FRAME CODEC TESTS");

    bench.executeTest("Parse simple frame", []() {
        auto frame = StompFrame::parse("MESSAGE\ndestination:/queue/x\nmessage-id:7\n\nhello\0"s);
        check(frame != nullptr, "frame expected");
        checkEqual(frame->command(), "MESSAGE", "command");
        checkEqual(frame->destination(), "/queue/x", "destination");
        checkEqual(frame->get("message-id"), "7", "message-id");
        checkEqual(frame->body(), "hello", "body");
        check(frame->has("destination"), "destination header present");
        check(!frame->has("receipt"), "receipt header absent");
        checkEqual(frame->get("receipt", "none"), "none", "default value");
        return "command, headers and body extracted";
    });

    bench.executeTest("Heartbeats before a command", []() {
        StompFrameParser parser;
        parser.process("\n\r\n\n");
        check(!parser.complete(), "heartbeats must not produce a frame");
        check(!parser.hasPartialFrame(), "heartbeats are not a partial frame");

        std::string rest = parser.process("\nRECEIPT\nreceipt-id:r.1\n\n\0"s);
        check(parser.complete(), "frame after heartbeats");
        check(rest.empty(), "nothing left over");
        auto frame = parser.takeFrame();
        checkEqual(frame->command(), "RECEIPT", "command");
        checkEqual(frame->get("receipt-id"), "r.1", "receipt-id");
        return "blank lines absorbed";
    });

    bench.executeTest("Body with content-length keeps zero bytes", []() {
        std::string body = "a\0b\0c"s;
        std::string bytes = "MESSAGE\ncontent-length:5\n\n"s + body + "\0"s;
        auto frame = StompFrame::parse(bytes);
        check(frame != nullptr, "frame expected");
        checkEqual(frame->body().size(), 5u, "body size");
        checkEqual(frame->body(), body, "body");
        return "5 bytes including two NULs";
    });

    bench.executeTest("Body without content-length ends at NUL", []() {
        StompFrameParser parser;
        std::string rest = parser.process("SEND\ndestination:/q\n\nhello\0ERROR\n"s);
        check(parser.complete(), "frame complete");
        checkEqual(rest, "ERROR\n", "bytes after the terminator");
        auto frame = parser.takeFrame();
        checkEqual(frame->body(), "hello", "body");
        return "terminator excluded, remainder returned";
    });

    bench.executeTest("Content-length body longer than declared", []() {
        checkThrows<StompFrameError>([]() {
            StompFrame::parse("MESSAGE\ncontent-length:2\n\nabc\0"s);
        }, "missing terminator after body");
        return "StompFrameError raised";
    });

    bench.executeTest("Malformed header and length", []() {
        checkThrows<StompFrameError>([]() {
            StompFrame::parse("SEND\nno-colon-here\n\n\0"s);
        }, "header without colon");
        checkThrows<StompFrameError>([]() {
            StompFrame::parse("SEND\ncontent-length:abc\n\n\0"s);
        }, "non-numeric content-length");
        checkThrows<StompFrameError>([]() {
            StompFrame::parse("SEND\ncontent-length:-1\n\n\0"s);
        }, "negative content-length");
        return "parser fails fast";
    });

    bench.executeTest("Header split on first colon", []() {
        auto frame = StompFrame::parse("SEND\nreply-to:http://host:8080/x\n\n\0"s);
        checkEqual(frame->get("reply-to"), "http://host:8080/x", "value keeps later colons");
        return "value intact";
    });

    bench.executeTest("Duplicate headers: last wins, first position kept", []() {
        auto frame = StompFrame::parse("MESSAGE\nfoo:1\nbar:2\nfoo:3\n\n\0"s);
        checkEqual(frame->get("foo"), "3", "duplicate value");
        checkEqual(frame->headers().size(), 2u, "header count");
        checkEqual(frame->serialize(), "MESSAGE\nfoo:3\nbar:2\n\n\0"s, "serialized order");
        return "foo=3 serialized first";
    });

    bench.executeTest("Chunk-size independence", []() {
        std::string bytes = "\n\nMESSAGE\nsubscription:s.1\nack:a1\ncontent-length:4\n\nx\0y\n\0"s;
        auto whole = StompFrame::parse(bytes);
        check(whole != nullptr, "whole frame");

        for (size_t split = 0; split <= bytes.size(); split++) {
            auto frame = parseInPieces(bytes, split);
            check(frame != nullptr, "frame for split " + std::to_string(split));
            checkSameFrame(*frame, *whole, "split " + std::to_string(split));
        }

        StompFrameParser parser;
        for (char c : bytes) {
            parser.process(std::string(1, c));
        }
        auto byteByByte = parser.takeFrame();
        check(byteByByte != nullptr, "byte by byte frame");
        checkSameFrame(*byteByByte, *whole, "byte by byte");
        return std::to_string(bytes.size() + 1) + " splits agree";
    });

    bench.executeTest("Incomplete bytes give no frame", []() {
        check(StompFrame::parse("MESSAGE\ndestination:/q\n\nhal"s) == nullptr, "no frame expected");
        StompFrameParser parser;
        parser.process("MESS");
        check(parser.hasPartialFrame(), "partial command line");
        check(parser.takeFrame() == nullptr, "takeFrame before completion");
        return "nullptr until the terminator";
    });

    bench.executeTest("Serialize injects content-length", []() {
        StompFrame withBody("SEND", StompHeaders{{"destination", "/queue/x"}}, "hi");
        checkEqual(withBody.serialize(), "SEND\ndestination:/queue/x\ncontent-length:2\n\nhi\0"s, "with body");

        StompFrame empty("ACK", StompHeaders{{"id", "a1"}});
        checkEqual(empty.serialize(), "ACK\nid:a1\n\n\0"s, "empty body");

        StompFrame explicitLength("SEND", StompHeaders{{"content-length", "2"}}, "hi");
        checkEqual(explicitLength.serialize(), "SEND\ncontent-length:2\n\nhi\0"s, "explicit length kept");
        return "content-length only when needed";
    });

    bench.executeTest("Serialize then parse is stable", []() {
        StompFrame original("MESSAGE",
                            StompHeaders{{"destination", "/topic/t"}, {"message-id", "m-1"}, {"ack", "a9"}},
                            "bin\0ary\n\0body"s);
        auto parsed = StompFrame::parse(original.serialize());
        check(parsed != nullptr, "parsed frame");
        auto reparsed = StompFrame::parse(parsed->serialize());
        check(reparsed != nullptr, "reparsed frame");
        checkSameFrame(*reparsed, *parsed, "second pass");
        checkEqual(parsed->body(), original.body(), "body");
        checkEqual(parsed->get("content-length"), std::to_string(original.body().size()), "computed length");
        return "binary body survives";
    });

    bench.executeTest("Client frame builders", []() {
        checkEqual(StompFrame::connect("admin", "pw")->serialize(),
                   "CONNECT\naccept-version:1.2\nlogin:admin\npasscode:pw\n\n\0"s, "CONNECT");
        checkEqual(StompFrame::connect("", "", StompHeaders{{"host", "broker"}})->serialize(),
                   "CONNECT\naccept-version:1.2\nhost:broker\n\n\0"s, "CONNECT with extra header");
        checkEqual(StompFrame::subscribe("/queue/x", "s.1", "client")->serialize(),
                   "SUBSCRIBE\ndestination:/queue/x\nack:client\nid:s.1\n\n\0"s, "SUBSCRIBE");
        checkEqual(StompFrame::ack("a1")->serialize(), "ACK\nid:a1\n\n\0"s, "ACK");
        checkEqual(StompFrame::commit("t.1")->serialize(), "COMMIT\ntransaction:t.1\n\n\0"s, "COMMIT");
        return "wire bytes match";
    });

    bench.executeTest("Text decoding", []() {
        StompFrame plain("MESSAGE", StompHeaders(), "caf\xC3\xA9");
        checkEqual(plain.text(), "caf\xC3\xA9", "utf-8 default");

        StompFrame latin1("MESSAGE", StompHeaders{{"content-type", "text/plain; charset=iso-8859-1"}}, "caf\xE9");
        checkEqual(latin1.text(), "caf\xC3\xA9", "latin-1 converted");

        StompFrame unknown("MESSAGE", StompHeaders{{"content-type", "text/plain;charset=no-such-charset"}}, "x");
        checkThrows<StompError>([&unknown]() { unknown.text(); }, "unknown charset");
        return "charset honoured";
    });

    return bench.finish();
}
