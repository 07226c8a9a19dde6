#include "channel_messages.h"
#include "id_utils.h"
#include "logger.h"
#include "signal_codec.h"
#include "wire_codec.h"

#include <iostream>
#include <set>
#include <string>
#include <string_view>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

using json = nlohmann::json;

static bool test_wire_header() {
    const std::string frame = wire::encode_message(MessageType::CHANNEL_BINARY, std::string(300, 'x'));
    TEST_ASSERT(frame.size() == wire::kHeaderSize + 300, "frame size");
    TEST_ASSERT(static_cast<uint8_t>(frame[0]) == 0x03, "type byte");
    TEST_ASSERT(static_cast<uint8_t>(frame[3]) == 0x01 && static_cast<uint8_t>(frame[4]) == 0x2c,
                "length is big-endian");

    MessageType type;
    std::string_view payload;
    TEST_ASSERT(wire::decode_message(frame, type, payload), "frame decodes");
    TEST_ASSERT(type == MessageType::CHANNEL_BINARY && payload.size() == 300, "decoded fields");

    TEST_ASSERT(!wire::decode_message(std::string_view(frame).substr(0, 100), type, payload),
                "truncated frame rejected");

    std::string bad_type = frame;
    bad_type[0] = static_cast<char>(0x7f);
    TEST_ASSERT(!wire::decode_message(bad_type, type, payload), "unknown type rejected");

    const std::string oversize("\x03\x7f\xff\xff\xff", 5);
    uint32_t length = 0;
    TEST_ASSERT(!wire::decode_header(oversize, type, length), "oversize length rejected");
    return true;
}

static bool test_control_messages() {
    channel_msg::ControlMessage msg;
    TEST_ASSERT(channel_msg::decode_control(channel_msg::encode_metadata("a b.txt", 42, "text/plain"), &msg),
                "metadata decodes");
    TEST_ASSERT(msg.kind == channel_msg::ControlMessage::Kind::METADATA, "metadata kind");
    TEST_ASSERT(msg.name == "a b.txt" && msg.size == 42 && msg.mime_type == "text/plain", "metadata fields");

    const json meta = json::parse(channel_msg::encode_metadata("n", 1, "m"));
    TEST_ASSERT(meta["type"] == "metadata" && meta.contains("mimeType"), "metadata wire shape");

    TEST_ASSERT(channel_msg::decode_control(channel_msg::encode_complete(), &msg), "complete decodes");
    TEST_ASSERT(msg.kind == channel_msg::ControlMessage::Kind::COMPLETE, "complete kind");

    std::string err;
    TEST_ASSERT(!channel_msg::decode_control("[1,2]", &msg, &err) && !err.empty(), "non-object rejected");
    TEST_ASSERT(!channel_msg::decode_control(R"({"type":"resume"})", &msg), "unknown type rejected");
    TEST_ASSERT(!channel_msg::decode_control(R"({"type":"metadata","name":"x","size":-1})", &msg),
                "negative size rejected");
    TEST_ASSERT(!channel_msg::decode_control(R"({"type":"metadata","name":"x","size":-5.0})", &msg),
                "negative float size rejected");
    TEST_ASSERT(!channel_msg::decode_control(R"({"type":"metadata","name":"x","size":1e30})", &msg),
                "huge float size rejected");
    TEST_ASSERT(!channel_msg::decode_control(R"({"type":"metadata","name":"x","size":2.5})", &msg),
                "fractional size rejected");
    TEST_ASSERT(!channel_msg::decode_control(R"({"type":"metadata","name":"x","size":"7"})", &msg),
                "string size rejected");
    TEST_ASSERT(channel_msg::decode_control(R"({"type":"metadata","name":"x","size":18446744073709551615})", &msg) &&
                    msg.size == 18446744073709551615ull,
                "largest unsigned size accepted");
    return true;
}

static bool test_signal_json_shape() {
    Signal s;
    s.from_id = "h";
    s.to_id = "c";
    s.kind = SignalKind::ICE_CANDIDATE;
    s.payload = R"({"host":"10.0.0.2","port":4000})";
    s.file_id = "f";
    s.timestamp_ms = 1234;

    const json j = signal_codec::signal_to_json(s);
    TEST_ASSERT(j["type"] == "ice-candidate", "kind name");
    TEST_ASSERT(j["data"].is_string() && j["data"] == s.payload, "payload carried as a string");
    TEST_ASSERT(j["fromId"] == "h" && j["toId"] == "c" && j["fileId"] == "f" && j["timestamp"] == 1234,
                "signal fields");

    Signal back;
    TEST_ASSERT(signal_codec::signal_from_json(j, &back), "signal parses");
    TEST_ASSERT(back.payload == s.payload, "payload survives");

    Signal structured;
    TEST_ASSERT(signal_codec::signal_from_json(json::parse(R"({"type":"answer","data":{"ok":true}})"), &structured),
                "object payload accepted");
    TEST_ASSERT(structured.payload == R"({"ok":true})", "object payload serialized");

    Signal opaque;
    opaque.kind = SignalKind::OFFER;
    opaque.payload = "v=0 not json";
    TEST_ASSERT(signal_codec::signal_to_json(opaque)["data"] == "v=0 not json", "non-JSON payload kept as string");

    std::string err;
    TEST_ASSERT(!signal_codec::signal_from_json(json{{"type", "shout"}}, &back, &err), "unknown kind rejected");
    TEST_ASSERT(!err.empty(), "error explained");
    return true;
}

static bool test_file_list_json() {
    std::vector<FileDescriptor> files;
    TEST_ASSERT(signal_codec::files_from_json(
                    json::parse(R"([{"id":"1","name":"a","size":5,"type":"text/plain"},{"id":"2","name":"b"}])"),
                    &files),
                "file list parses");
    TEST_ASSERT(files.size() == 2 && files[0].size == 5 && files[1].size == 0, "sizes");
    TEST_ASSERT(files[0].mime_type == "text/plain", "type maps to mime type");

    std::string err;
    TEST_ASSERT(!signal_codec::files_from_json(json::parse(R"([{"name":"no id"}])"), &files, &err),
                "entry without id rejected");
    TEST_ASSERT(!signal_codec::files_from_json(json::parse(R"({"id":"1"})"), &files, &err), "non-array rejected");
    TEST_ASSERT(!signal_codec::files_from_json(json::parse(R"([{"id":"1","size":-5.0}])"), &files, &err),
                "negative float size rejected");
    TEST_ASSERT(!signal_codec::files_from_json(json::parse(R"([{"id":"1","size":1e30}])"), &files, &err),
                "huge float size rejected");
    TEST_ASSERT(!signal_codec::files_from_json(json::parse(R"([{"id":"1","size":-2}])"), &files, &err),
                "negative integer size rejected");

    DownloadCounts counts{{"a", 2}, {"b", 1}};
    TEST_ASSERT(signal_codec::counts_from_json(signal_codec::counts_to_json(counts)) == counts, "counts");
    TEST_ASSERT(signal_codec::counts_from_json(json::parse(R"({"a":"x"})")).empty(), "non-numeric counts skipped");
    TEST_ASSERT((signal_codec::counts_from_json(json::parse(R"({"a":-1,"b":1.5,"c":3})")) == DownloadCounts{{"c", 3}}),
                "negative and fractional counts skipped");
    return true;
}

static bool test_identifiers() {
    const std::string room = generate_room_id(8);
    TEST_ASSERT(room.size() == 8 && room.find_first_not_of("0123456789abcdef") == std::string::npos,
                "room code shape");
    TEST_ASSERT(generate_room_id(12).size() == 12, "room code length configurable");

    const std::string peer = generate_peer_id();
    TEST_ASSERT(peer.rfind("id_", 0) == 0 && peer.size() > 12, "peer id shape");

    const std::string file = generate_file_id();
    TEST_ASSERT(file.size() == 36 && file[8] == '-' && file[14] == '4', "file id is a v4 UUID");

    std::set<std::string> tokens;
    for (int i = 0; i < 50; ++i) {
        tokens.insert(generate_channel_token());
    }
    TEST_ASSERT(tokens.size() == 50, "tokens unique");
    TEST_ASSERT(tokens.begin()->size() == 32, "token length");

    const std::string t = generate_channel_token();
    TEST_ASSERT(tokens_equal(t, t), "token equals itself");
    TEST_ASSERT(!tokens_equal(t, t.substr(1)), "length mismatch");
    std::string flipped = t;
    flipped[31] = flipped[31] == 'a' ? 'b' : 'a';
    TEST_ASSERT(!tokens_equal(t, flipped), "last char differs");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- Codec tests ---" << std::endl;

    if (test_wire_header()) std::cout << "PASS: wire header" << std::endl;
    if (test_control_messages()) std::cout << "PASS: control messages" << std::endl;
    if (test_signal_json_shape()) std::cout << "PASS: signal JSON" << std::endl;
    if (test_file_list_json()) std::cout << "PASS: file list JSON" << std::endl;
    if (test_identifiers()) std::cout << "PASS: identifiers" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
