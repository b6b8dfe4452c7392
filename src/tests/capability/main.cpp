#include <iostream>
#include <exception>
#include <cassert>

#include "rdse_application.h"
#include "rdse_capability.h"

using namespace RDSE;

CapabilitySet hostDeclaration(void)
{
    CapabilitySet caps;
    caps.codecs = { VideoCodec::VP9, VideoCodec::AV1 };
    caps.colorFormats = ColorFormat::RGB32 | ColorFormat::I420 | ColorFormat::I444;
    caps.maxWidth = 3840;
    caps.maxHeight = 2160;
    caps.keyboardModes = keyboardModeMask(KeyboardMode::Legacy) | keyboardModeMask(KeyboardMode::Map);
    caps.permissions = PermAll;
    caps.quality = 90;
    caps.fps = 60;
    caps.resumable = true;
    return caps;
}

CapabilitySet clientDeclaration(void)
{
    CapabilitySet caps;
    caps.codecs = { VideoCodec::H264, VideoCodec::VP9 };
    caps.colorFormats = ColorFormat::RGB32 | ColorFormat::I420;
    caps.maxWidth = 1920;
    caps.maxHeight = 1080;
    caps.keyboardModes = keyboardModeMask(KeyboardMode::Legacy) | keyboardModeMask(KeyboardMode::Map) | keyboardModeMask(KeyboardMode::Translate);
    caps.permissions = PermKeyboard | PermClipboard | PermFileTransfer;
    caps.quality = 100;
    caps.fps = 30;
    caps.resumable = true;
    return caps;
}

void testNegotiate(void)
{
    std::cout << "test negotiate intersection: ";

    auto caps = Negotiator::negotiate(hostDeclaration(), clientDeclaration());

    assert(caps.generation == 1);
    assert(caps.codecs.size() == 1);
    assert(caps.codec() == VideoCodec::VP9);
    assert(caps.colorFormat == ColorFormat::I420);
    assert(caps.width == 1920 && caps.height == 1080);
    assert(caps.keyboard == KeyboardMode::Map);
    assert(caps.permissions == (PermKeyboard | PermClipboard | PermFileTransfer));
    assert(! caps.allowed(PermAudio));
    assert(caps.quality == 90);
    assert(caps.fps == 30);
    assert(caps.resumable);

    std::cout << "passed" << std::endl;

    std::cout << "test host codec order: ";

    auto host = hostDeclaration();
    auto client = clientDeclaration();
    host.codecs = { VideoCodec::AV1, VideoCodec::VP9, VideoCodec::H264 };
    client.codecs = { VideoCodec::H264, VideoCodec::VP9, VideoCodec::AV1 };

    caps = Negotiator::negotiate(host, client, std::nullopt, 4);
    assert(caps.generation == 4);
    assert(caps.codecs.size() == 3);
    assert(caps.codec() == VideoCodec::AV1);

    std::cout << "passed" << std::endl;

    std::cout << "test codec preference: ";

    caps = Negotiator::negotiate(host, client, VideoCodec::H264);
    assert(caps.codec() == VideoCodec::H264);
    assert(caps.codecs[1] == VideoCodec::AV1);

    // not shared: host order kept
    client.codecs = { VideoCodec::VP9, VideoCodec::AV1 };
    caps = Negotiator::negotiate(host, client, VideoCodec::H264);
    assert(caps.codec() == VideoCodec::AV1);

    std::cout << "passed" << std::endl;

    std::cout << "test not resumable: ";

    client = clientDeclaration();
    client.resumable = false;
    caps = Negotiator::negotiate(hostDeclaration(), client);
    assert(! caps.resumable);

    std::cout << "passed" << std::endl;
}

void testMismatch(void)
{
    std::cout << "test codec mismatch: ";

    auto client = clientDeclaration();
    client.codecs = { VideoCodec::H265 };

    try
    {
        Negotiator::negotiate(hostDeclaration(), client);
        assert(false);
    }
    catch(const session_error & err)
    {
        assert(err.code == ErrorCode::CapabilityMismatch);
    }

    std::cout << "passed" << std::endl;
}

void testLowerQuality(void)
{
    std::cout << "test lower quality: ";

    auto host = hostDeclaration();
    auto client = clientDeclaration();
    client.codecs = { VideoCodec::VP9, VideoCodec::AV1 };

    auto caps = Negotiator::negotiate(host, client);
    assert(caps.codec() == VideoCodec::VP9);

    // first step drops the failing codec
    auto lower = Negotiator::lowerQuality(host, caps);
    assert(! Negotiator::isCodecSupported(lower, VideoCodec::VP9));
    assert(Negotiator::isCodecSupported(lower, VideoCodec::AV1));

    caps = Negotiator::negotiate(lower, client);
    assert(caps.codec() == VideoCodec::AV1);
    assert(caps.codecs.size() == 1);

    // single codec: resolution halves
    lower = Negotiator::lowerQuality(lower, caps);
    assert(lower.maxWidth == 960 && lower.maxHeight == 540);

    caps = Negotiator::negotiate(lower, client);
    assert(caps.width == 960 && caps.height == 540);

    lower = Negotiator::lowerQuality(lower, caps);
    caps = Negotiator::negotiate(lower, client);
    assert(caps.width == 480 && caps.height == 270);

    // resolution floor reached: image quality halves
    lower = Negotiator::lowerQuality(lower, caps);
    caps = Negotiator::negotiate(lower, client);
    assert(caps.width == 320 && caps.height == 240);

    lower = Negotiator::lowerQuality(lower, caps);
    assert(lower.quality == 45);
    assert(lower.maxWidth == 320);

    std::cout << "passed" << std::endl;
}

int main(int argc, char** argv)
{
    Application::setDebugLevel(DebugLevel::None);

    testNegotiate();
    testMismatch();
    testLowerQuality();

    return 0;
}
