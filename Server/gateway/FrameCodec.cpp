#include "FrameCodec.hpp"
#include <vector>

using namespace std;

namespace
{
    inline uint32_t rotl(uint32_t v, int n)
    {
        return (v << n) | (v >> (32 - n));
    }

    void sha1_block(array<uint32_t, 5>& h, const uint8_t* block)
    {
        uint32_t w[80];
        for (int i = 0; i < 16; i++)
        {
            w[i] = (uint32_t(block[i * 4]) << 24) | (uint32_t(block[i * 4 + 1]) << 16)
                | (uint32_t(block[i * 4 + 2]) << 8) | uint32_t(block[i * 4 + 3]);
        }
        for (int i = 16; i < 80; i++)
            w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);

        uint32_t a = h[0], b = h[1], c = h[2], d = h[3], e = h[4];
        for (int i = 0; i < 80; i++)
        {
            uint32_t f, k;
            if (i < 20)
            {
                f = (b & c) | (~b & d);
                k = 0x5A827999;
            }
            else if (i < 40)
            {
                f = b ^ c ^ d;
                k = 0x6ED9EBA1;
            }
            else if (i < 60)
            {
                f = (b & c) | (b & d) | (c & d);
                k = 0x8F1BBCDC;
            }
            else
            {
                f = b ^ c ^ d;
                k = 0xCA62C1D6;
            }
            uint32_t tmp = rotl(a, 5) + f + e + k + w[i];
            e = d;
            d = c;
            c = rotl(b, 30);
            b = a;
            a = tmp;
        }
        h[0] += a; h[1] += b; h[2] += c; h[3] += d; h[4] += e;
    }
}

namespace ws
{
    array<uint8_t, 20> sha1(string_view data)
    {
        array<uint32_t, 5> h{ 0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0 };

        vector<uint8_t> msg(data.begin(), data.end());
        uint64_t bits = uint64_t(data.size()) * 8;
        msg.push_back(0x80);
        while (msg.size() % 64 != 56)
            msg.push_back(0);
        for (int i = 7; i >= 0; i--)
            msg.push_back(static_cast<uint8_t>(bits >> (i * 8)));

        for (size_t off = 0; off < msg.size(); off += 64)
            sha1_block(h, msg.data() + off);

        array<uint8_t, 20> out{};
        for (int i = 0; i < 5; i++)
        {
            out[i * 4] = static_cast<uint8_t>(h[i] >> 24);
            out[i * 4 + 1] = static_cast<uint8_t>(h[i] >> 16);
            out[i * 4 + 2] = static_cast<uint8_t>(h[i] >> 8);
            out[i * 4 + 3] = static_cast<uint8_t>(h[i]);
        }
        return out;
    }

    string base64_encode(const uint8_t* data, size_t size)
    {
        static const char* abc = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        string out;
        out.reserve((size + 2) / 3 * 4);
        for (size_t i = 0; i < size; i += 3)
        {
            uint32_t b = uint32_t(data[i]) << 16;
            if (i + 1 < size) b |= uint32_t(data[i + 1]) << 8;
            if (i + 2 < size) b |= uint32_t(data[i + 2]);
            out.push_back(abc[(b >> 18) & 0x3F]);
            out.push_back(abc[(b >> 12) & 0x3F]);
            out.push_back(i + 1 < size ? abc[(b >> 6) & 0x3F] : '=');
            out.push_back(i + 2 < size ? abc[b & 0x3F] : '=');
        }
        return out;
    }

    string accept_key(const string& client_key)
    {
        auto digest = sha1(client_key + MAGIC_GUID);
        return base64_encode(digest.data(), digest.size());
    }

    string handshake_response(const string& client_key)
    {
        return "HTTP/1.1 101 Switching Protocols\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Accept: " + accept_key(client_key) + "\r\n\r\n";
    }

    string encode_frame(Opcode opcode, string_view payload, const array<uint8_t, 4>* mask)
    {
        string frame;
        const size_t len = payload.size();
        const uint8_t mask_bit = mask ? 0x80 : 0x00;
        frame.reserve(len + 14);

        frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));
        if (len < 126)
        {
            frame.push_back(static_cast<char>(mask_bit | len));
        }
        else if (len < 65536)
        {
            frame.push_back(static_cast<char>(mask_bit | 126));
            frame.push_back(static_cast<char>((len >> 8) & 0xFF));
            frame.push_back(static_cast<char>(len & 0xFF));
        }
        else
        {
            frame.push_back(static_cast<char>(mask_bit | 127));
            for (int i = 7; i >= 0; i--)
                frame.push_back(static_cast<char>((uint64_t(len) >> (i * 8)) & 0xFF));
        }

        if (!mask)
        {
            frame.append(payload.data(), len);
            return frame;
        }
        frame.append(reinterpret_cast<const char*>(mask->data()), 4);
        for (size_t i = 0; i < len; i++)
            frame.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ (*mask)[i % 4]));
        return frame;
    }

    FrameDecoder::Status FrameDecoder::next(Frame& out)
    {
        auto byte = [this](size_t i) { return static_cast<uint8_t>(buf_[i]); };

        if (buf_.size() < 2)
            return Status::NeedMore;

        const bool fin = (byte(0) & 0x80) != 0;
        const auto opcode = static_cast<Opcode>(byte(0) & 0x0F);
        const bool masked = (byte(1) & 0x80) != 0;
        uint64_t len = byte(1) & 0x7F;
        size_t pos = 2;

        if (len == 126)
        {
            if (buf_.size() < 4) return Status::NeedMore;
            len = (uint64_t(byte(2)) << 8) | byte(3);
            pos = 4;
        }
        else if (len == 127)
        {
            if (buf_.size() < 10) return Status::NeedMore;
            len = 0;
            for (size_t i = 2; i < 10; i++)
                len = (len << 8) | byte(i);
            pos = 10;
        }

        if (len > MAX_PAYLOAD)
            return Status::TooLarge;

        array<uint8_t, 4> mask{};
        if (masked)
        {
            if (buf_.size() < pos + 4) return Status::NeedMore;
            for (size_t i = 0; i < 4; i++)
                mask[i] = byte(pos + i);
            pos += 4;
        }

        if (buf_.size() < pos + len)
            return Status::NeedMore;

        out.fin = fin;
        out.opcode = opcode;
        out.payload.assign(buf_, pos, static_cast<size_t>(len));
        if (masked)
        {
            for (size_t i = 0; i < out.payload.size(); i++)
                out.payload[i] = static_cast<char>(static_cast<uint8_t>(out.payload[i]) ^ mask[i % 4]);
        }
        buf_.erase(0, pos + static_cast<size_t>(len));
        return Status::Frame;
    }
}
