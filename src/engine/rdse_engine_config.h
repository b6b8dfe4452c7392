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

#ifndef _RDSE_ENGINE_CONFIG_
#define _RDSE_ENGINE_CONFIG_

#include <string>

#include "rdse_json_wrapper.h"
#include "rdse_session.h"
#include "rdse_channel_mux.h"
#include "rdse_video.h"
#include "rdse_file_transfer.h"
#include "rdse_clipboard.h"
#include "rdse_terminal.h"
#include "rdse_input.h"

namespace RDSE
{
    /// typed engine settings
    struct EngineConfig
    {
        SessionSettings session;
        MuxSettings     mux;
        VideoSettings   video;
        FileSettings    file;
        ClipboardSettings clipboard;
        TerminalSettings terminal;
        InputSettings   input;

        size_t          frameMax = Protocol::frame_max_default;
        bool            syncInitClipboard = false;
        std::string     fileRoot;

        /// @brief: read section:name keys, missing keys keep the defaults
        static EngineConfig fromJson(const JsonObject &, const Msg::Role &);
        /// @brief: declaration of every local feature
        static CapabilitySet defaultDeclaration(void);
    };

    uint32_t permissionFromName(std::string_view);
    std::optional<ColorFormat> colorFormatFromName(std::string_view);
    std::optional<KeyboardMode> keyboardModeFromName(std::string_view);
}

#endif // _RDSE_ENGINE_CONFIG_
