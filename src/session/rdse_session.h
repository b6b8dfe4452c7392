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

#ifndef _RDSE_SESSION_
#define _RDSE_SESSION_

#include <list>
#include <chrono>
#include <memory>
#include <string>
#include <optional>

#include "rdse_protocol.h"
#include "rdse_interfaces.h"
#include "rdse_capability.h"

namespace RDSE
{
    struct SessionSettings
    {
        Msg::Role       role = Msg::Role::Client;
        std::string     peerId;
        BinaryBuf       publicKey;
        CapabilitySet   declared;
        std::optional<VideoCodec> codecPreference;

        int             authRetries = 3;
        bool            otpRequired = false;

        std::chrono::milliseconds handshakeTimeout{18000};
        std::chrono::milliseconds reconnectGrace{30000};
        std::chrono::milliseconds heartbeatInterval{5000};
        // zero: disabled
        std::chrono::milliseconds readTimeout{0};
    };

    /// @brief: lifecycle of one connection, handshake, auth and negotiation
    class Session
    {
        SessionSettings settings;
        SessionState    state = SessionState::Disconnected;

        std::shared_ptr<const Capabilities> caps;
        CapabilitySet   remoteDeclared;

        std::string     remotePeerId;
        BinaryBuf       remotePublicKey;
        BinaryBuf       resumeToken;
        BinaryBuf       challenge;

        std::list<ControlMsg> outgoing;

        SessionEvents*  events = nullptr;
        const Authenticator* authenticator = nullptr;
        const CredentialsProvider* credentials = nullptr;

        TimePoint       handshakeStart;
        TimePoint       reconnectStart;
        TimePoint       lastRecv;
        TimePoint       lastHeartbeat;

        ErrorCode       closeCode = ErrorCode::None;
        std::string     closeReason;

        int             attemptsLeft = 0;
        bool            resuming = false;

    protected:
        void            setState(const SessionState &);
        void            closeWith(const ErrorCode &, const std::string & reason, bool notify);
        void            sendChallenge(void);
        void            setCapabilities(Capabilities &&);

        void            recvHello(const Msg::Hello &, const TimePoint &);
        void            recvAuthChallenge(const Msg::AuthChallenge &);
        void            recvAuthResponse(const Msg::AuthResponse &);
        void            recvAuthResult(const Msg::AuthResult &);
        void            recvCapabilityOffer(const Msg::CapabilityOffer &);
        void            recvCapabilityAnswer(const Msg::CapabilityAnswer &);
        void            recvRenegotiate(const Msg::Renegotiate &);
        void            recvSessionClose(const Msg::SessionClose &);

        bool            isHandshakePhase(void) const;
        bool            isHost(void) const { return settings.role == Msg::Role::Host; }

    public:
        explicit Session(const SessionSettings &);

        void            setEvents(SessionEvents*);
        void            setAuthenticator(const Authenticator*);
        void            setCredentials(const CredentialsProvider*);

        /// @brief: new transport attached
        void            start(const TimePoint &);

        /// @brief: session control message, other control messages belong to the engine
        /// @return false if the message is not a session message
        bool            recvControl(const ControlMsg &, const TimePoint &);

        /// @brief: any inbound traffic
        void            received(const TimePoint &);

        void            transportLost(const TimePoint &);
        void            tick(const TimePoint &);

        /// @brief: graceful close, finished by closeFlushed
        void            close(const std::string & reason = "");
        /// @brief: channel queues drained, send SessionClose
        void            closeFlushed(void);
        /// @brief: immediate close, unrecoverable protocol state
        void            abort(const ErrorCode &, const std::string & reason);

        /// @brief: update the local declaration and renegotiate
        void            requestRenegotiation(const CapabilitySet &);

        std::list<ControlMsg> takeOutgoing(void);
        bool            hasOutgoing(void) const;

        const SessionState & getState(void) const { return state; }
        bool            isActive(void) const { return state == SessionState::Active; }
        bool            isClosed(void) const { return state == SessionState::Closed; }

        std::shared_ptr<const Capabilities> capabilities(void) const { return caps; }
        const CapabilitySet & declaration(void) const { return settings.declared; }

        const ErrorCode & errorCode(void) const { return closeCode; }
        const std::string & errorReason(void) const { return closeReason; }
        const std::string & remoteId(void) const { return remotePeerId; }
        const BinaryBuf & token(void) const { return resumeToken; }
        const Msg::Role & role(void) const { return settings.role; }
    };

    namespace Auth
    {
        /// @brief: sha256(password + salt)
        BinaryBuf       verifier(std::string_view password, const std::vector<uint8_t> & salt);
        /// @brief: sha256(verifier + challenge)
        BinaryBuf       response(const std::vector<uint8_t> & verifier, const std::vector<uint8_t> & challenge);
    }
}

#endif // _RDSE_SESSION_
