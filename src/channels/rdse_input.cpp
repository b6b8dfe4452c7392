/***************************************************************************
 *   Copyright © 2021 by Andrey Afletdinov <public.irkutsk@gmail.com>      *
 *                                                                         *
 *   Part of the RDSE: Remote Desktop Session Engine                       *
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU General Public License as published by  *
 *   the Free Software Foundation; either version 3 of the License, or     *
 *   (at your option) any later version.                                   *
 *                                                                         *
 *   This program is distributed in the hope that it will be useful,       *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
 *   GNU General Public License for more details.                          *
 *                                                                         *
 *   You should have received a copy of the GNU General Public License     *
 *   along with this program; if not, write to the                         *
 *   Free Software Foundation, Inc.,                                       *
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.             *
 ***************************************************************************/

#include <cinttypes>
#include <algorithm>

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_input.h"

namespace RDSE
{
    uint16_t Input::rescale(uint16_t pos, uint16_t from, uint16_t to)
    {
        if(from == 0 || to == 0 || from == to)
        {
            return pos;
        }

        uint32_t res = static_cast<uint32_t>(pos) * to / from;
        return std::min<uint32_t>(res, to - 1);
    }

    /* InputRouter */
    InputRouter::InputRouter(const InputSettings & st, PacketSender* ptr) : settings(st), sender(ptr)
    {
    }

    void InputRouter::setInjector(InputInjector* ptr)
    {
        injector = ptr;
    }

    void InputRouter::setKeyboardMode(const KeyboardMode & val)
    {
        Application::debug(DebugType::Input, "%s: %s", __FUNCTION__, keyboardModeName(val));
        mode = val;
    }

    void InputRouter::setViewSize(uint16_t width, uint16_t height)
    {
        view = Input::Size{ width, height };
    }

    void InputRouter::setDisplaySize(uint32_t display, uint16_t width, uint16_t height)
    {
        displays[display] = Input::Size{ width, height };
    }

    void InputRouter::selectDisplay(uint32_t display)
    {
        if(display != activeDisplay)
        {
            Application::debug(DebugType::Input, "%s: display: %" PRIu32 ", drop pointers: %lu", __FUNCTION__, display, pointers.size());
            pointers.clear();
            activeDisplay = display;
        }
    }

    void InputRouter::send(InputMsg && msg)
    {
        sender->sendPacket(Packet(ChannelKind::Input, std::move(msg)));
    }

    bool InputRouter::sendKey(const KeyInput & key)
    {
        if(settings.viewOnly)
        {
            return false;
        }

        // keep the order with the pointer
        flush();

        Msg::KeyEvent ev;
        ev.pressed = key.pressed;
        ev.modifiers = key.modifiers;

        switch(mode)
        {
            case KeyboardMode::Legacy:
                ev.mode = KeyboardMode::Legacy;
                ev.code = key.virtualKey;
                break;

            case KeyboardMode::Map:
                ev.mode = KeyboardMode::Map;
                ev.code = key.scanCode;
                break;

            case KeyboardMode::Translate:
                if(key.unicode)
                {
                    ev.mode = KeyboardMode::Translate;
                    ev.code = key.unicode;
                }
                else
                {
                    ev.mode = KeyboardMode::Legacy;
                    ev.code = key.virtualKey;
                }
                break;
        }

        Application::trace(DebugType::Input, "%s: mode: %s, code: 0x%08" PRIx32 ", pressed: %s",
                           __FUNCTION__, keyboardModeName(ev.mode), ev.code, (ev.pressed ? "true" : "false"));

        send(std::move(ev));
        return true;
    }

    bool InputRouter::sendPointer(uint16_t posx, uint16_t posy, uint8_t buttons, int16_t wheelx, int16_t wheely)
    {
        if(settings.viewOnly)
        {
            return false;
        }

        if(settings.swapMouseButtons)
        {
            uint8_t left = buttons & Input::Left;
            uint8_t right = buttons & Input::Right;

            buttons &= ~(Input::Left | Input::Right);

            if(left) buttons |= Input::Right;
            if(right) buttons |= Input::Left;
        }

        if(settings.reverseMouseWheel)
        {
            wheelx = -wheelx;
            wheely = -wheely;
        }

        Msg::PointerEvent ev;
        ev.display = activeDisplay;
        ev.buttons = buttons;
        ev.wheelx = wheelx;
        ev.wheely = wheely;

        if(auto it = displays.find(activeDisplay); it != displays.end())
        {
            ev.posx = Input::rescale(posx, view.width, it->second.width);
            ev.posy = Input::rescale(posy, view.height, it->second.height);
        }
        else
        {
            ev.posx = posx;
            ev.posy = posy;
        }

        // consecutive moves coalesce
        if(! pointers.empty())
        {
            auto & last = pointers.back();

            if(last.buttons == ev.buttons && last.wheelx == 0 && last.wheely == 0 &&
               ev.wheelx == 0 && ev.wheely == 0)
            {
                last.posx = ev.posx;
                last.posy = ev.posy;
                return true;
            }
        }

        pointers.emplace_back(std::move(ev));
        return true;
    }

    bool InputRouter::sendTouch(uint32_t touchId, const Msg::TouchPhase & phase, uint16_t posx, uint16_t posy)
    {
        if(settings.viewOnly)
        {
            return false;
        }

        flush();

        Msg::TouchEvent ev;
        ev.display = activeDisplay;
        ev.touchId = touchId;
        ev.phase = phase;
        ev.posx = posx;
        ev.posy = posy;

        if(auto it = displays.find(activeDisplay); it != displays.end())
        {
            ev.posx = Input::rescale(posx, view.width, it->second.width);
            ev.posy = Input::rescale(posy, view.height, it->second.height);
        }

        send(std::move(ev));
        return true;
    }

    size_t InputRouter::flush(void)
    {
        size_t res = pointers.size();

        for(auto & ev : pointers)
        {
            send(std::move(ev));
        }

        pointers.clear();
        return res;
    }

    void InputRouter::recvMessage(const InputMsg & msg)
    {
        if(! injector)
        {
            Application::debug(DebugType::Input, "%s: %s", __FUNCTION__, "injector not set");
            return;
        }

        if(auto key = std::get_if<Msg::KeyEvent>(& msg))
        {
            injector->injectKey(*key);
        }
        else if(auto ptr = std::get_if<Msg::PointerEvent>(& msg))
        {
            injector->injectPointer(*ptr);
        }
        else if(auto touch = std::get_if<Msg::TouchEvent>(& msg))
        {
            injector->injectTouch(*touch);
        }
    }
}
