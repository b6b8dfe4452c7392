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


#ifndef _RDSE_APPLICATION_
#define _RDSE_APPLICATION_

#include <list>
#include <mutex>
#include <string>
#include <cstdarg>
#include <filesystem>

#include "rdse_json_wrapper.h"

namespace RDSE
{
    enum class DebugTarget { Quiet, Console, Syslog, SyslogFile };
    enum class DebugLevel { None, Info, Debug, Trace };

    enum DebugType
    {
        All = 0xFFFFFFFF,
        Proto = 1 << 31,
        Sess = 1 << 30,
        Mux = 1 << 29,
        Video = 1 << 28,
        File = 1 << 27,
        Clip = 1 << 26,
        Term = 1 << 25,
        Input = 1 << 24,
        Audio = 1 << 23,
        Sock = 1 << 22,
        Auth = 1 << 21,
        App = 1 << 16
    };

    /// static logger, one per process
    class Application
    {
    public:
        explicit Application(std::string_view ident);
        virtual ~Application();

        Application(Application &) = delete;
        Application & operator= (const Application &) = delete;

        static void info(const char* format, ...);
        static void notice(const char* format, ...);
        static void warning(const char* format, ...);
        static void error(const char* format, ...);
        static void debug(uint32_t subsys, const char* format, ...);
        static void trace(uint32_t subsys, const char* format, ...);

        static void setDebug(const DebugTarget &, const DebugLevel &);

        static void setDebugTarget(const DebugTarget &);
        static void setDebugTarget(std::string_view target);
        static bool setDebugTargetFile(const std::filesystem::path & file);

        static void setDebugLevel(const DebugLevel &);
        static void setDebugLevel(std::string_view level);

        static void setDebugTypes(const std::list<std::string> &);
    };

    /// application with json config, the "debug:*" keys configure the logger
    class ApplicationJsonConfig : public Application
    {
        JsonObject json;

    protected:
        void applyDebugConfig(void);
        bool readDefaultConfig(void);

    public:
        explicit ApplicationJsonConfig(std::string_view ident);

        bool readConfig(const std::filesystem::path &);

        inline std::string configGetString(std::string_view key, std::string_view def = "") const
        {
            return json.getString(key, def);
        }

        inline bool configHasKey(std::string_view key) const
        {
            return json.hasKey(key);
        }

        const JsonObject & config(void) const { return json; }
    };
}

#endif // _RDSE_APPLICATION_
