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

#ifndef _RDSE_PEER_
#define _RDSE_PEER_

#include <set>
#include <atomic>
#include <string>
#include <memory>

#include "rdse_application.h"
#include "rdse_interfaces.h"
#include "rdse_engine.h"
#include "rdse_connector.h"

#define RDSE_PEER_VERSION 20261018

namespace RDSE
{
    namespace Peer
    {
        /* single user, password from config */
        class PasswordAuth : public Authenticator
        {
            std::string     user;
            BinaryBuf       saltBuf;
            BinaryBuf       verifierBuf;

        public:
            PasswordAuth(const std::string & username, const std::string & password);

            BinaryBuf       salt(void) const override { return saltBuf; }
            std::optional<BinaryBuf> verifier(const std::string & username) const override;
        };

        class PasswordCredentials : public CredentialsProvider
        {
            std::string     user;
            std::string     pass;

        public:
            PasswordCredentials(const std::string & username, const std::string & password) : user(username), pass(password) {}

            std::string     username(void) const override { return user; }
            std::string     password(void) const override { return pass; }
        };

        /* logs received content, echoes terminal data */
        class LogSinks : public SessionEvents, public VideoSink, public ClipboardSink, public TerminalPeer, public AudioSink, public PluginHandler
        {
            std::string     name;
            Engine*         engine = nullptr;
            // remote opened, echoed back
            std::set<uint32_t> terminals;

        public:
            std::atomic<bool> active{false};
            std::atomic<bool> closed{false};

            explicit LogSinks(std::string_view id) : name(id) {}

            void            attach(Engine &);

            // SessionEvents
            void            sessionStateChanged(const SessionState &) override;
            void            sessionActive(const Capabilities &) override;
            void            sessionResumed(const Capabilities &) override;
            void            sessionClosed(const ErrorCode &, const std::string & reason) override;
            void            sessionNotification(uint8_t level, const std::string & text) override;
            void            fileJobFinished(uint32_t job, bool success) override;
            void            fileDirectoryListed(uint32_t request, const std::vector<Msg::FileEntry> &) override;

            // VideoSink
            void            videoFrame(const VideoFrame &) override;
            void            displayResized(uint32_t display, uint16_t width, uint16_t height) override;

            // ClipboardSink
            void            clipboardApply(const ClipboardContent &) override;

            // TerminalPeer
            bool            terminalOpen(uint32_t id, uint16_t rows, uint16_t cols, const std::string & command) override;
            void            terminalData(uint32_t id, const BinaryBuf &) override;
            void            terminalResize(uint32_t id, uint16_t rows, uint16_t cols) override;
            void            terminalClosed(uint32_t id, int32_t status) override;

            // AudioSink
            void            audioFormat(const Msg::AudioFormat &) override;
            void            audioFrame(const Msg::AudioFrame &) override;

            // PluginHandler
            void            pluginMessage(const std::string & pluginId, const BinaryBuf & payload) override;
        };

        enum class Mode { Host, Client, Loopback };

        class Service : public ApplicationJsonConfig
        {
            Mode            mode = Mode::Loopback;
            std::string     address{"127.0.0.1"};
            uint16_t        port = 5910;

            std::string     sendFile;
            std::string     clipboardText;
            std::string     terminalCommand;
            int             closeAfter = 0;

        protected:
            int             runHost(void);
            int             runClient(void);
            int             runLoopback(void);

            void            clientActions(Engine &);
            std::unique_ptr<Engine> createEngine(const Msg::Role &, LogSinks &) const;

        public:
            Service(int argc, const char** argv);

            int             start(void);
        };
    }
}

#endif // _RDSE_PEER_
