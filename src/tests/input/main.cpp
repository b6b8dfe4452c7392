#include <list>
#include <iostream>
#include <exception>
#include <cassert>

#include "rdse_application.h"
#include "rdse_input.h"

using namespace RDSE;

struct Capture : PacketSender
{
    std::list<InputMsg> events;

    bool sendPacket(Packet && pkt) override
    {
        events.emplace_back(std::get<InputMsg>(pkt.msg));
        return true;
    }
};

struct Injector : InputInjector
{
    int keys = 0;
    int pointers = 0;
    int touches = 0;

    void injectKey(const Msg::KeyEvent &) override { keys++; }
    void injectPointer(const Msg::PointerEvent &) override { pointers++; }
    void injectTouch(const Msg::TouchEvent &) override { touches++; }
};

void testKeyboardModes(void)
{
    std::cout << "test keyboard modes: ";

    Capture out;
    InputRouter router(InputSettings(), & out);

    KeyInput key;
    key.virtualKey = 0x41;
    key.scanCode = 0x1E;
    key.unicode = 'a';
    key.pressed = true;

    router.sendKey(key);
    router.setKeyboardMode(KeyboardMode::Map);
    router.sendKey(key);
    router.setKeyboardMode(KeyboardMode::Translate);
    router.sendKey(key);

    // non character key falls back to the virtual key
    key.unicode = 0;
    router.sendKey(key);

    assert(out.events.size() == 4);

    auto it = out.events.begin();
    auto & legacy = std::get<Msg::KeyEvent>(*it++);
    assert(legacy.mode == KeyboardMode::Legacy && legacy.code == 0x41);
    auto & map = std::get<Msg::KeyEvent>(*it++);
    assert(map.mode == KeyboardMode::Map && map.code == 0x1E);
    auto & translate = std::get<Msg::KeyEvent>(*it++);
    assert(translate.mode == KeyboardMode::Translate && translate.code == 'a');
    auto & fallback = std::get<Msg::KeyEvent>(*it++);
    assert(fallback.mode == KeyboardMode::Legacy && fallback.code == 0x41);

    std::cout << "passed" << std::endl;
}

void testPointer(void)
{
    std::cout << "test pointer rescale: ";

    Capture out;
    InputRouter router(InputSettings(), & out);

    router.setViewSize(960, 540);
    router.setDisplaySize(0, 1920, 1080);

    router.sendPointer(480, 270, 0);
    assert(router.buffered() == 1);
    assert(router.flush() == 1);

    auto & ev = std::get<Msg::PointerEvent>(out.events.back());
    assert(ev.posx == 960 && ev.posy == 540);

    router.sendPointer(959, 539, 0);
    router.flush();
    auto & edge = std::get<Msg::PointerEvent>(out.events.back());
    assert(edge.posx == 1918 && edge.posy == 1078);

    assert(Input::rescale(100, 0, 1920) == 100);
    assert(Input::rescale(1000, 1000, 500) == 499);

    std::cout << "passed" << std::endl;

    std::cout << "test pointer coalesce: ";

    out.events.clear();
    router.sendPointer(1, 1, 0);
    router.sendPointer(2, 2, 0);
    router.sendPointer(3, 3, Input::Left);
    router.sendPointer(4, 4, Input::Left);
    assert(router.buffered() == 2);

    // key flushes pending pointers first
    KeyInput key;
    key.virtualKey = 0x0D;
    router.sendKey(key);

    assert(out.events.size() == 3);
    assert(std::holds_alternative<Msg::PointerEvent>(out.events.front()));
    assert(std::holds_alternative<Msg::KeyEvent>(out.events.back()));

    std::cout << "passed" << std::endl;

    std::cout << "test display switch: ";

    out.events.clear();
    router.setDisplaySize(1, 800, 600);
    router.sendPointer(100, 100, 0);
    router.selectDisplay(1);
    assert(router.buffered() == 0);

    router.sendPointer(480, 270, 0);
    router.flush();
    assert(out.events.size() == 1);

    auto & moved = std::get<Msg::PointerEvent>(out.events.back());
    assert(moved.display == 1);
    assert(moved.posx == 400 && moved.posy == 300);

    std::cout << "passed" << std::endl;
}

void testSettings(void)
{
    std::cout << "test swap buttons and wheel: ";

    InputSettings settings;
    settings.swapMouseButtons = true;
    settings.reverseMouseWheel = true;

    Capture out;
    InputRouter router(settings, & out);

    router.sendPointer(0, 0, Input::Left | Input::Middle, 0, 3);
    router.flush();

    auto & ev = std::get<Msg::PointerEvent>(out.events.back());
    assert(ev.buttons == (Input::Right | Input::Middle));
    assert(ev.wheely == -3);

    std::cout << "passed" << std::endl;

    std::cout << "test view only: ";

    InputSettings view;
    view.viewOnly = true;
    InputRouter viewer(view, & out);

    out.events.clear();
    assert(! viewer.sendKey(KeyInput()));
    assert(! viewer.sendPointer(1, 1, 0));
    assert(! viewer.sendTouch(1, Msg::TouchPhase::Begin, 1, 1));
    assert(out.events.empty());

    std::cout << "passed" << std::endl;

    std::cout << "test injection: ";

    Injector injector;
    InputRouter host(InputSettings(), & out);

    host.recvMessage(Msg::KeyEvent());
    host.setInjector(& injector);
    host.recvMessage(Msg::KeyEvent());
    host.recvMessage(Msg::PointerEvent());
    host.recvMessage(Msg::TouchEvent());

    assert(injector.keys == 1);
    assert(injector.pointers == 1);
    assert(injector.touches == 1);

    std::cout << "passed" << std::endl;
}

int main(int argc, char** argv)
{
    Application::setDebugLevel(DebugLevel::None);

    testKeyboardModes();
    testPointer();
    testSettings();

    return 0;
}
