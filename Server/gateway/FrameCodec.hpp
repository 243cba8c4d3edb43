#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using namespace std;

namespace ws
{
    inline constexpr const char* MAGIC_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    inline constexpr size_t MAX_PAYLOAD = 1 << 20;

    enum class Opcode : uint8_t
    {
        Continuation = 0x0,
        Text = 0x1,
        Binary = 0x2,
        Close = 0x8,
        Ping = 0x9,
        Pong = 0xA,
    };

    struct Frame
    {
        bool fin = true;
        Opcode opcode = Opcode::Text;
        string payload; // unmasked
    };

    array<uint8_t, 20> sha1(string_view data);
    string base64_encode(const uint8_t* data, size_t size);

    // Sec-WebSocket-Accept value for a client key
    string accept_key(const string& client_key);
    string handshake_response(const string& client_key);

    // server frames are never masked; mask is for client-side encoding
    string encode_frame(Opcode opcode, string_view payload, const array<uint8_t, 4>* mask = nullptr);
    inline string encode_text(string_view payload) { return encode_frame(Opcode::Text, payload); }

    class FrameDecoder
    {
    public:
        enum class Status { Frame, NeedMore, TooLarge };

        void feed(const char* data, size_t n) { buf_.append(data, n); }

        // one complete frame off the front of the buffer, if any
        Status next(Frame& out);

        size_t buffered() const { return buf_.size(); }

    private:
        string buf_;
    };
}
