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


#include <unistd.h>
#include <syslog.h>

#include <ctime>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <array>
#include <cstdio>
#include <memory>
#include <clocale>
#include <cstdlib>

#include "rdse_tools.h"
#include "rdse_application.h"

namespace RDSE
{
    namespace
    {
        std::unique_ptr<FILE, int(*)(FILE*)> logFile{ nullptr, fclose };
        DebugTarget logTarget = DebugTarget::Console;
        DebugLevel logLevel = DebugLevel::Info;
        uint32_t logTypes = DebugType::All;

        std::mutex logLock;
        std::string logIdent{"rdse"};
        int logFacility = LOG_USER;

        const std::array<std::pair<const char*, uint32_t>, 13> debugTypeNames = {{
            { "proto", DebugType::Proto }, { "sess", DebugType::Sess }, { "mux", DebugType::Mux },
            { "video", DebugType::Video }, { "file", DebugType::File }, { "clip", DebugType::Clip },
            { "term", DebugType::Term }, { "input", DebugType::Input }, { "audio", DebugType::Audio },
            { "sock", DebugType::Sock }, { "auth", DebugType::Auth }, { "app", DebugType::App },
            { "all", DebugType::All }
        }};

        // syslog facility: user, local0 .. local7
        int syslogFacility(std::string_view name)
        {
            if(name.size() == 6 && name.substr(0, 5) == "local" && '0' <= name[5] && name[5] <= '7')
            {
                return LOG_LOCAL0 + ((name[5] - '0') << 3);
            }

            return LOG_USER;
        }

        void writeLine(FILE* fd, const char* level, const char* format, va_list args)
        {
            char stamp[32] = { 0 };
            std::time_t now = std::time(nullptr);
            std::tm tm;

            if(localtime_r(& now, & tm))
            {
                std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", & tm);
            }

            const std::scoped_lock guard{ logLock };

            fprintf(fd, "%s %s [%s] ", stamp, logIdent.c_str(), level);
            vfprintf(fd, format, args);
            fputc('\n', fd);
            fflush(fd);
        }

        void writeLog(int priority, const char* level, const char* format, va_list args)
        {
            switch(logTarget)
            {
                case DebugTarget::Console:
                    writeLine(stderr, level, format, args);
                    break;

                case DebugTarget::SyslogFile:
                    writeLine(logFile ? logFile.get() : stderr, level, format, args);
                    break;

                case DebugTarget::Syslog:
                    vsyslog(priority, format, args);
                    break;

                default:
                    break;
            }
        }
    }

    Application::Application(std::string_view sid)
    {
        std::setlocale(LC_NUMERIC, "C");
        logIdent.assign(sid.begin(), sid.end());
    }

    Application::~Application()
    {
        if(logTarget == DebugTarget::Syslog)
        {
            closelog();
        }
    }

    void Application::setDebug(const DebugTarget & tgt, const DebugLevel & lvl)
    {
        setDebugTarget(tgt);
        setDebugLevel(lvl);
    }

    void Application::setDebugTypes(const std::list<std::string> & names)
    {
        uint32_t types = 0;

        for(const auto & name : names)
        {
            auto id = Tools::lower(name);
            auto it = std::find_if(debugTypeNames.begin(), debugTypeNames.end(),
                                   [&](auto & pair) { return id == pair.first; });

            if(it != debugTypeNames.end())
            {
                types |= it->second;
            }
            else
            {
                Application::warning("%s: unknown debug type: `%s'", __FUNCTION__, id.c_str());
            }
        }

        logTypes = types;
    }

    void Application::setDebugTarget(const DebugTarget & tgt)
    {
        if(logTarget == tgt)
        {
            return;
        }

        if(logTarget == DebugTarget::Syslog)
        {
            closelog();
        }
        else if(logTarget == DebugTarget::SyslogFile)
        {
            logFile.reset();
        }

        if(tgt == DebugTarget::Syslog)
        {
            openlog(logIdent.c_str(), LOG_PID, logFacility);
        }

        logTarget = tgt;
    }

    void Application::setDebugTarget(std::string_view tgt)
    {
        if(tgt == "console")
        {
            setDebugTarget(DebugTarget::Console);
        }
        else if(tgt == "syslog")
        {
            setDebugTarget(DebugTarget::Syslog);
        }
        else if(tgt == "quiet")
        {
            setDebugTarget(DebugTarget::Quiet);
        }
        else
        {
            Application::warning("%s: unknown target: `%.*s'", __FUNCTION__, (int) tgt.size(), tgt.data());
        }
    }

    bool Application::setDebugTargetFile(const std::filesystem::path & file)
    {
        std::unique_ptr<FILE, int(*)(FILE*)> fd{ fopen(file.c_str(), "a"), fclose };

        if(! fd)
        {
            Application::error("%s: %s failed, error: %s, path: `%s'", __FUNCTION__, "fopen", strerror(errno), file.c_str());
            return false;
        }

        setDebugTarget(DebugTarget::SyslogFile);
        logFile = std::move(fd);
        return true;
    }

    void Application::setDebugLevel(const DebugLevel & lvl)
    {
        logLevel = lvl;
    }

    void Application::setDebugLevel(std::string_view lvl)
    {
        if(lvl == "info")
        {
            setDebugLevel(DebugLevel::Info);
        }
        else if(lvl == "debug")
        {
            setDebugLevel(DebugLevel::Debug);
        }
        else if(lvl == "trace")
        {
            setDebugLevel(DebugLevel::Trace);
        }
        else
        {
            setDebugLevel(DebugLevel::None);
        }
    }

    void Application::info(const char* format, ...)
    {
        if(logLevel != DebugLevel::None)
        {
            va_list args;
            va_start(args, format);
            writeLog(LOG_INFO, "info", format, args);
            va_end(args);
        }
    }

    void Application::notice(const char* format, ...)
    {
        va_list args;
        va_start(args, format);
        writeLog(LOG_NOTICE, "notice", format, args);
        va_end(args);
    }

    void Application::warning(const char* format, ...)
    {
        if(logLevel != DebugLevel::None)
        {
            va_list args;
            va_start(args, format);
            writeLog(LOG_WARNING, "warning", format, args);
            va_end(args);
        }
    }

    void Application::error(const char* format, ...)
    {
        va_list args;
        va_start(args, format);
        writeLog(LOG_ERR, "error", format, args);
        va_end(args);
    }

    void Application::debug(uint32_t subsys, const char* format, ...)
    {
        if((subsys & logTypes) && (logLevel == DebugLevel::Debug || logLevel == DebugLevel::Trace))
        {
            va_list args;
            va_start(args, format);
            writeLog(LOG_DEBUG, "debug", format, args);
            va_end(args);
        }
    }

    void Application::trace(uint32_t subsys, const char* format, ...)
    {
        if((subsys & logTypes) && logLevel == DebugLevel::Trace)
        {
            va_list args;
            va_start(args, format);
            writeLog(LOG_DEBUG, "trace", format, args);
            va_end(args);
        }
    }

    /* ApplicationJsonConfig */
    ApplicationJsonConfig::ApplicationJsonConfig(std::string_view ident) : Application(ident)
    {
        readDefaultConfig();
    }

    bool ApplicationJsonConfig::readDefaultConfig(void)
    {
        std::list<std::filesystem::path> files;

        if(auto env = std::getenv("RDSE_CONFIG"))
        {
            files.emplace_back(env);
        }

        auto name = Tools::joinToString(logIdent, ".json");
        files.emplace_back(std::filesystem::current_path() / name);
        files.emplace_back(std::filesystem::path("/etc/rdse") / name);

        for(const auto & path : files)
        {
            std::error_code err;

            if(std::filesystem::exists(path, err) && readConfig(path))
            {
                return true;
            }
        }

        return false;
    }

    bool ApplicationJsonConfig::readConfig(const std::filesystem::path & file)
    {
        Application::info("%s: path: `%s', uid: %d", __FUNCTION__, file.c_str(), getuid());

        JsonContentFile content(file);

        if(! content.isValid() || ! content.isObject())
        {
            Application::error("%s: %s failed, path: `%s'", __FUNCTION__, "json object", file.c_str());
            return false;
        }

        auto jo = content.toObject();
        json.swap(jo);
        json.addString("config:path", file.native());

        applyDebugConfig();
        return true;
    }

    void ApplicationJsonConfig::applyDebugConfig(void)
    {
        if(json.hasKey("debug:level"))
        {
            setDebugLevel(json.getString("debug:level"));
        }

        if(auto types = json.getArray("debug:types"))
        {
            setDebugTypes(types->toStdList<std::string>());
        }

        auto target = json.getString("debug:target", "console");

        if(target == "file")
        {
            auto file = json.getString("debug:file");

            if(file.empty() || ! setDebugTargetFile(file))
            {
                setDebugTarget(DebugTarget::Console);
            }

            return;
        }

        if(target == "syslog")
        {
            logFacility = syslogFacility(json.getString("debug:syslog", "user"));
            // reopen with the facility
            setDebugTarget(DebugTarget::Console);
        }

        setDebugTarget(target);
    }
}
