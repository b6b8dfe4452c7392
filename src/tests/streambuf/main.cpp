#include <random>
#include <iostream>
#include <exception>
#include <algorithm>
#include <cassert>

#include "rdse_tools.h"
#include "rdse_streambuf.h"

using namespace RDSE;

class RandomBuf : public BinaryBuf
{
public:
    explicit RandomBuf(size_t len) : BinaryBuf(len)
    {
        std::mt19937 gen(335);
        std::uniform_int_distribution<int> dist(0, 255);
        std::generate(begin(), end(), [&](){ return static_cast<uint8_t>(dist(gen)); });
    }
};

void testStreamBufRef(const BinaryBuf & buf)
{
    std::cout << "== test StreamBufRef interface" << std::endl;

    StreamBufRef sb(buf.data(), buf.size());

    std::cout << "test ::last/peek: ";
    assert(sb.last() == buf.size());
    assert(sb.peek() == buf.front());
    std::cout << "passed" << std::endl;

    std::cout << "test ::readInt8: ";
    for(auto v : buf)
        assert(v == sb.readInt8());
    assert(sb.last() == 0);
    std::cout << "passed" << std::endl;

    std::cout << "test ::read: ";
    sb.reset(buf.data(), buf.size());
    auto res = sb.read(buf.size());
    assert(sb.last() == 0);
    assert(res.crc32b() == buf.crc32b());
    std::cout << "passed" << std::endl;

    std::cout << "test ::skip/read: ";
    sb.reset(buf.data(), buf.size());
    sb.skip(100);
    auto tail = sb.read();
    assert(tail.size() == buf.size() - 100);
    assert(std::equal(tail.begin(), tail.end(), buf.begin() + 100));
    std::cout << "passed" << std::endl;

    std::cout << "test short read throws: ";
    sb.reset(buf.data(), 3);
    bool thrown = false;
    try
    {
        sb.readIntBE32();
    }
    catch(const streambuf_error &)
    {
        thrown = true;
    }
    assert(thrown);
    std::cout << "passed" << std::endl;
}

void testStreamBuf(const BinaryBuf & buf)
{
    std::cout << "== test StreamBuf interface" << std::endl;

    std::cout << "test ::write/read: ";
    StreamBuf sb;
    sb.write(buf);
    assert(sb.last() == buf.size());
    assert(sb.rawbuf().crc32b() == buf.crc32b());
    std::cout << "passed" << std::endl;

    std::cout << "test ::skip/tell/last: ";
    sb.skip(buf.size() / 2);
    assert(sb.tell() == buf.size() / 2);
    assert(sb.last() == buf.size() - buf.size() / 2);
    std::cout << "passed" << std::endl;

    std::cout << "test ::shrink: ";
    auto rest = sb.last();
    auto front = sb.peek();
    sb.shrink();
    assert(sb.tell() == 0);
    assert(sb.last() == rest);
    assert(sb.peek() == front);
    assert(sb.rawbuf().size() == rest);
    std::cout << "passed" << std::endl;

    std::cout << "test ::readIntBE32/writeIntBE32: ";
    StreamBufRef ref(buf.data(), buf.size());
    size_t bufsz = buf.size() - (buf.size() % 4);
    StreamBuf sb2(bufsz);
    while(4 <= ref.last())
        sb2.writeIntBE32(ref.readIntBE32());
    assert(sb2.rawbuf().crc32b() == Tools::crc32b(buf.data(), bufsz));
    std::cout << "passed" << std::endl;

    std::cout << "test ::readString: ";
    StreamBuf sb3;
    sb3.write("remote");
    sb3.write(std::string_view("desk"));
    assert(sb3.readString(6) == "remote");
    assert(sb3.readString() == "desk");
    std::cout << "passed" << std::endl;
}

void testByteOrder(void)
{
    StreamBuf sb;

    std::cout << "== test byte order interface" << std::endl;

    std::cout << "test ::writeIntBE/readIntBE: ";
    sb.writeIntBE16(0x1122);
    assert(sb.readIntBE16() == 0x1122);
    sb.writeIntBE32(0x11223344);
    assert(sb.readIntBE32() == 0x11223344);
    sb.writeIntBE64(0x1122334455667788);
    assert(sb.readIntBE64() == 0x1122334455667788);
    std::cout << "passed" << std::endl;

    std::cout << "test network order layout: ";
    StreamBuf sb2;
    sb2.writeIntBE32(0x01020304);
    sb2.writeIntBE16(0x0506);
    sb2.writeIntBE64(0x0708090A0B0C0D0E);
    assert(sb2.rawbuf() == std::vector<uint8_t>({ 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14 }));
    std::cout << "passed" << std::endl;
}

void testZlib(const BinaryBuf & buf)
{
    std::cout << "== test zlib" << std::endl;

    std::cout << "test ::zlibCompress/zlibUncompress: ";
    BinaryBuf text;
    for(int it = 0; it < 100; ++it)
        text.append("remote desktop session engine ");

    auto zip = Tools::zlibCompress(text);
    assert(zip.size() < text.size());

    auto unzip = Tools::zlibUncompress(BinaryBuf(zip), text.size());
    assert(unzip == static_cast<const std::vector<uint8_t> &>(text));
    std::cout << "passed" << std::endl;

    std::cout << "test uncompress limit: ";
    assert(Tools::zlibUncompress(BinaryBuf(zip), text.size() - 1).empty());
    assert(Tools::zlibUncompress(text, text.size()).empty());
    std::cout << "passed" << std::endl;

    std::cout << "test random data: ";
    auto zip2 = Tools::zlibCompress(buf);
    assert(Tools::zlibUncompress(BinaryBuf(zip2), buf.size()) == static_cast<const std::vector<uint8_t> &>(buf));
    std::cout << "passed" << std::endl;
}

int main()
{
    RandomBuf buf(335);

    std::cout << "fill random, buf size: " << buf.size() << ", crc32b: " << buf.crc32b() << std::endl;

    testStreamBufRef(buf);
    testStreamBuf(buf);
    testByteOrder();
    testZlib(buf);

    return 0;
}
