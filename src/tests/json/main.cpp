#include <iostream>
#include <exception>
#include <algorithm>
#include <cassert>

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_json_wrapper.h"
#include "rdse_engine_config.h"

using namespace RDSE;

const char* testJson = R"json(
{
    "test:string": "string",
    "test:int": 1234567,
    "test:double": 1.5,
    "test:true": true,
    "test:false": false,
    "test:array": [ 1, 2, 3, 4, 5, 6, 7, 8, 9 ],
    "test:object": { "test:int": 111, "test:arr": [ "a", "b" ] },
    "test:null": null,
    "test:escaped": "a\tb \"q\"",
    "test:numstr": "0x10"
}
)json";

const char* engineJson = R"json(
{
    "peer:id": "test-host",
    "auth:retries": 5,
    "auth:otp:required": true,
    "session:reconnect:grace": 10000,
    "session:heartbeat:interval": -1,
    "codec-preference": "vp9",
    "caps:codecs": [ "vp9", "av1", "unknown" ],
    "caps:color:formats": [ "i420" ],
    "caps:permissions": [ "keyboard", "clipboard", "file-transfer" ],
    "disable-clipboard": true,
    "image-quality": "custom",
    "custom-image-quality": 40,
    "keyboard-mode": "translate",
    "mux:video:depth": 32,
    "mux:file:share": 0.25,
    "mux:bandwidth": 1000000,
    "file:chunk:size": 32768,
    "file:window": 4,
    "terminal-persistent": false,
    "swap-left-right-mouse": true,
    "sync-init-clipboard": true,
    "proto:frame:max": 1048576
}
)json";

class TestApp : public Application
{
public:
    TestApp() : Application("test_json") {}

    int start(void)
    {
        JsonContentString content(testJson);

        std::cout << "test JsonContent::isObject: ";
        assert(content.isValid() && content.isObject());
        std::cout << "passed" << std::endl;

        auto config = content.toObject();

        std::cout << "test Object::getString/getInteger/getDouble/getBoolean: ";
        assert(config.getString("test:string") == "string");
        assert(config.getInteger("test:int") == 1234567);
        assert(config.getDouble("test:double") == 1.5);
        assert(config.getBoolean("test:true"));
        assert(! config.getBoolean("test:false"));
        std::cout << "passed" << std::endl;

        std::cout << "test Object defaults: ";
        assert(config.getInteger("test:missing", 42) == 42);
        assert(config.getString("test:missing", "def") == "def");
        assert(! config.hasKey("test:missing"));
        std::cout << "passed" << std::endl;

        std::cout << "test Object::keys: ";
        assert(config.keys().size() == 10 && config.size() == 10);
        std::cout << "passed" << std::endl;

        std::cout << "test scalar conversions: ";
        assert(config.getString("test:null") == "null");
        assert(config.getInteger("test:null", 5) == 0);
        assert(config.getString("test:escaped") == "a\tb \"q\"");
        assert(config.getInteger("test:numstr") == 16);
        assert(config.getInteger("test:double") == 1);
        assert(config.getString("test:true") == "true");
        assert(config.getInteger("test:true") == 1);
        assert(config.getBoolean("test:int"));
        assert(! config.getArray("test:string") && ! config.getObject("test:array"));
        std::cout << "passed" << std::endl;

        std::cout << "test Object copy: ";
        JsonObject copy(config);
        assert(copy.getObject("test:object") && copy.getObject("test:object") != config.getObject("test:object"));
        copy.addString("test:string", "other");
        assert(config.getString("test:string") == "string" && copy.getString("test:string") == "other");
        std::cout << "passed" << std::endl;

        std::cout << "test Object::getStdList: ";
        auto list = config.getStdList<int>("test:array");
        assert(list.size() == 9 && list.front() == 1 && list.back() == 9);
        auto arr = config.getArray("test:array");
        assert(arr && arr->size() == 9 && arr->getValue(4)->getInteger() == 5 && ! arr->getValue(9));
        std::cout << "passed" << std::endl;

        std::cout << "test Object::getObject: ";
        auto obj = config.getObject("test:object");
        assert(obj && obj->getInteger("test:int") == 111);
        assert(obj->getStdList<std::string>("test:arr").size() == 2);
        std::cout << "passed" << std::endl;

        std::cout << "test invalid json: ";
        JsonContentString broken("{ \"key\": ");
        assert(! broken.isValid() || ! broken.isObject());
        std::cout << "passed" << std::endl;

        testEngineConfig();
        return 0;
    }

    void testEngineConfig(void)
    {
        std::cout << "== test EngineConfig" << std::endl;

        JsonContentString content(engineJson);
        assert(content.isObject());

        auto conf = EngineConfig::fromJson(content.toObject(), Msg::Role::Host);
        auto & caps = conf.session.declared;

        std::cout << "test session keys: ";
        assert(conf.session.role == Msg::Role::Host);
        assert(conf.session.peerId == "test-host");
        assert(conf.session.authRetries == 5);
        assert(conf.session.otpRequired);
        assert(conf.session.reconnectGrace == std::chrono::milliseconds(10000));
        // negative values keep the default
        assert(conf.session.heartbeatInterval == std::chrono::milliseconds(5000));
        assert(conf.session.codecPreference == VideoCodec::VP9);
        std::cout << "passed" << std::endl;

        std::cout << "test declaration keys: ";
        assert(caps.codecs == std::vector<VideoCodec>({ VideoCodec::VP9, VideoCodec::AV1 }));
        assert(caps.colorFormats == ColorFormat::I420);
        assert(caps.permissions == (PermKeyboard | PermFileTransfer));
        assert(caps.quality == 40);
        assert(caps.keyboardModes == (keyboardModeMask(KeyboardMode::Legacy) | keyboardModeMask(KeyboardMode::Translate)));
        std::cout << "passed" << std::endl;

        std::cout << "test channel keys: ";
        assert(conf.mux.videoDepth == 32);
        assert(conf.mux.fileShare == 0.25);
        assert(conf.mux.bandwidth == 1000000);
        assert(conf.file.chunkSize == 32768);
        assert(conf.file.window == 4);
        assert(! conf.terminal.persistent);
        assert(conf.input.swapMouseButtons);
        assert(conf.syncInitClipboard);
        assert(conf.frameMax == 1048576);
        std::cout << "passed" << std::endl;

        std::cout << "test defaults: ";
        auto def = EngineConfig::fromJson(JsonObject(), Msg::Role::Client);
        assert(def.session.role == Msg::Role::Client);
        assert(def.session.authRetries == 3);
        assert(def.session.declared.permissions == PermAll);
        assert(def.session.declared.resumable);
        assert(def.mux.videoDepth == 64);
        assert(def.file.digestInterval == 16);
        assert(def.clipboard.maxSize == 16 * 1024 * 1024);
        assert(def.frameMax == Protocol::frame_max_default);
        std::cout << "passed" << std::endl;
    }
};

int main()
{
    Application::setDebugLevel(DebugLevel::None);
    TestApp app;
    return app.start();
}
