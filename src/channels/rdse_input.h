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

#ifndef _RDSE_INPUT_
#define _RDSE_INPUT_

#include <map>
#include <list>

#include "rdse_global.h"
#include "rdse_protocol.h"
#include "rdse_interfaces.h"
#include "rdse_channel_mux.h"

namespace RDSE
{
    struct InputSettings
    {
        bool            swapMouseButtons = false;
        bool            reverseMouseWheel = false;
        bool            viewOnly = false;
    };

    /// local key with every code the platform knows
    struct KeyInput
    {
        uint32_t        virtualKey = 0;
        uint32_t        scanCode = 0;
        // 0: non character key
        uint32_t        unicode = 0;
        uint32_t        modifiers = 0;
        bool            pressed = false;
    };

    namespace Input
    {
        enum Button : uint8_t { Left = 0x01, Middle = 0x02, Right = 0x04 };

        struct Size
        {
            uint16_t    width = 0;
            uint16_t    height = 0;
        };

        uint16_t        rescale(uint16_t pos, uint16_t from, uint16_t to);
    }

    /// @brief: client side event shaping, host side injection
    class InputRouter
    {
        InputSettings   settings;
        KeyboardMode    mode = KeyboardMode::Legacy;

        INTMAP<uint32_t, Input::Size> displays;
        Input::Size     view;
        uint32_t        activeDisplay = 0;

        std::list<Msg::PointerEvent> pointers;

        PacketSender*   sender = nullptr;
        InputInjector*  injector = nullptr;

    protected:
        void            send(InputMsg &&);

    public:
        InputRouter(const InputSettings &, PacketSender*);

        void            setInjector(InputInjector*);
        void            setKeyboardMode(const KeyboardMode &);
        const KeyboardMode & keyboardMode(void) const { return mode; }

        /// @brief: local view in pixels
        void            setViewSize(uint16_t width, uint16_t height);
        /// @brief: remote resolution, DisplayInfo
        void            setDisplaySize(uint32_t display, uint16_t width, uint16_t height);
        /// @brief: switch the active display, buffered pointer events are dropped
        void            selectDisplay(uint32_t display);

        bool            sendKey(const KeyInput &);
        bool            sendPointer(uint16_t posx, uint16_t posy, uint8_t buttons, int16_t wheelx = 0, int16_t wheely = 0);
        bool            sendTouch(uint32_t touchId, const Msg::TouchPhase &, uint16_t posx, uint16_t posy);

        /// @brief: write opportunity
        /// @return pointer events sent
        size_t          flush(void);
        size_t          buffered(void) const { return pointers.size(); }

        void            recvMessage(const InputMsg &);
    };
}

#endif // _RDSE_INPUT_
