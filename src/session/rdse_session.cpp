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
#include "rdse_global.h"
#include "rdse_crypto.h"
#include "rdse_application.h"
#include "rdse_session.h"

using namespace std::chrono_literals;

namespace RDSE
{
    const size_t resume_token_size = 16;
    const size_t challenge_size = 32;

    const char* sessionStateName(const SessionState & state)
    {
        switch(state)
        {
            case SessionState::Disconnected: return "disconnected";
            case SessionState::Handshaking: return "handshaking";
            case SessionState::Authenticating: return "authenticating";
            case SessionState::Negotiating: return "negotiating";
            case SessionState::Active: return "active";
            case SessionState::Closing: return "closing";
            case SessionState::Reconnecting: return "reconnecting";
            case SessionState::Closed: return "closed";
        }

        return "unknown";
    }

    BinaryBuf Auth::verifier(std::string_view password, const std::vector<uint8_t> & salt)
    {
        Crypto::Digest digest;
        digest.update(password);
        digest.update(salt);
        return digest.value();
    }

    BinaryBuf Auth::response(const std::vector<uint8_t> & verifier, const std::vector<uint8_t> & challenge)
    {
        Crypto::Digest digest;
        digest.update(verifier);
        digest.update(challenge);
        return digest.value();
    }

    /* Session */
    Session::Session(const SessionSettings & st) : settings(st)
    {
        if(settings.peerId.empty())
        {
            settings.peerId = Tools::joinToString(engine_ident, "-", Tools::randomHexString(8));
        }
    }

    void Session::setEvents(SessionEvents* ptr)
    {
        events = ptr;
    }

    void Session::setAuthenticator(const Authenticator* ptr)
    {
        authenticator = ptr;
    }

    void Session::setCredentials(const CredentialsProvider* ptr)
    {
        credentials = ptr;
    }

    void Session::setState(const SessionState & st)
    {
        if(state != st)
        {
            Application::debug(DebugType::Sess, "%s: %s -> %s", __FUNCTION__, sessionStateName(state), sessionStateName(st));
            state = st;

            if(events)
            {
                events->sessionStateChanged(state);
            }
        }
    }

    bool Session::isHandshakePhase(void) const
    {
        return state == SessionState::Handshaking ||
               state == SessionState::Authenticating || state == SessionState::Negotiating;
    }

    void Session::closeWith(const ErrorCode & code, const std::string & reason, bool notify)
    {
        if(state == SessionState::Closed)
        {
            return;
        }

        if(code != ErrorCode::None)
        {
            Application::error("%s: %s, reason: %s", __FUNCTION__, errorCodeName(code), reason.c_str());
        }
        else
        {
            Application::info("%s: peer: %s, reason: %s", __FUNCTION__, remotePeerId.c_str(), reason.c_str());
        }

        if(notify)
        {
            outgoing.emplace_back(Msg::SessionClose{ code, reason });
        }

        closeCode = code;
        closeReason = reason;
        resuming = false;
        setState(SessionState::Closed);

        if(events)
        {
            events->sessionClosed(code, reason);
        }
    }

    void Session::start(const TimePoint & now)
    {
        if(state == SessionState::Closed)
        {
            Application::error("%s: %s", __FUNCTION__, "session closed");
            throw session_error(closeCode, NS_FuncName);
        }

        handshakeStart = now;
        lastRecv = now;
        lastHeartbeat = now;

        if(state == SessionState::Reconnecting)
        {
            // host waits for the resume hello
            if(isHost())
            {
                Application::info("%s: %s", __FUNCTION__, "transport attached, wait resume");
                return;
            }

            resuming = true;
        }
        else if(state != SessionState::Disconnected)
        {
            Application::error("%s: invalid state: %s", __FUNCTION__, sessionStateName(state));
            throw session_error(ErrorCode::TransportError, NS_FuncName);
        }

        setState(SessionState::Handshaking);

        if(! isHost())
        {
            Msg::Hello hello;
            hello.version = protocol_version;
            hello.role = settings.role;
            hello.peerId = settings.peerId;
            hello.publicKey = settings.publicKey;

            if(resuming)
            {
                hello.resumeToken = resumeToken;
            }

            outgoing.emplace_back(std::move(hello));
        }
    }

    void Session::received(const TimePoint & now)
    {
        lastRecv = now;
    }

    bool Session::recvControl(const ControlMsg & msg, const TimePoint & now)
    {
        lastRecv = now;

        if(state == SessionState::Closed)
        {
            Application::debug(DebugType::Sess, "%s: session closed, skip message", __FUNCTION__);
            return true;
        }

        switch(msg.index())
        {
            case 0: recvHello(std::get<Msg::Hello>(msg), now); break;
            case 1: recvAuthChallenge(std::get<Msg::AuthChallenge>(msg)); break;
            case 2: recvAuthResponse(std::get<Msg::AuthResponse>(msg)); break;
            case 3: recvAuthResult(std::get<Msg::AuthResult>(msg)); break;
            case 4: recvCapabilityOffer(std::get<Msg::CapabilityOffer>(msg)); break;
            case 5: recvCapabilityAnswer(std::get<Msg::CapabilityAnswer>(msg)); break;
            case 6: recvRenegotiate(std::get<Msg::Renegotiate>(msg)); break;
            case 10: recvSessionClose(std::get<Msg::SessionClose>(msg)); break;
            // heartbeat only refreshes the read timer
            case 11: break;

            default:
                return false;
        }

        return true;
    }

    void Session::recvHello(const Msg::Hello & hello, const TimePoint & now)
    {
        if(state != SessionState::Handshaking && ! (isHost() && state == SessionState::Reconnecting))
        {
            Application::warning("%s: unexpected hello, state: %s", __FUNCTION__, sessionStateName(state));

            if(isHandshakePhase())
            {
                closeWith(ErrorCode::AuthError, "unexpected hello", true);
            }

            return;
        }

        if(hello.version != protocol_version)
        {
            closeWith(ErrorCode::AuthError, Tools::joinToString("unsupported protocol version: ", static_cast<int>(hello.version)), true);
            return;
        }

        if(hello.peerId.empty())
        {
            closeWith(ErrorCode::AuthError, "empty peer id", true);
            return;
        }

        if(hello.role == settings.role)
        {
            closeWith(ErrorCode::AuthError, "peer role conflict", true);
            return;
        }

        if(isHost())
        {
            bool reattach = state == SessionState::Reconnecting;

            if(reattach || hello.resumeToken.size())
            {
                if(! reattach || ! Crypto::equal(hello.resumeToken, resumeToken) || hello.peerId != remotePeerId)
                {
                    closeWith(ErrorCode::AuthError, "resume token mismatch", true);
                    return;
                }

                Application::info("%s: session resumed, peer: %s", __FUNCTION__, remotePeerId.c_str());

                Msg::Hello reply;
                reply.version = protocol_version;
                reply.role = settings.role;
                reply.peerId = settings.peerId;
                reply.publicKey = settings.publicKey;
                reply.resumeToken = resumeToken;
                reply.resumed = true;
                outgoing.emplace_back(std::move(reply));

                lastHeartbeat = now;
                setState(SessionState::Active);

                if(events)
                {
                    events->sessionResumed(*caps);
                }

                return;
            }

            remotePeerId = hello.peerId;
            remotePublicKey = hello.publicKey;
            resumeToken = Crypto::randomKey(resume_token_size);

            Msg::Hello reply;
            reply.version = protocol_version;
            reply.role = settings.role;
            reply.peerId = settings.peerId;
            reply.publicKey = settings.publicKey;
            reply.resumeToken = resumeToken;
            outgoing.emplace_back(std::move(reply));

            Application::info("%s: client connected, peer: %s", __FUNCTION__, remotePeerId.c_str());
            setState(SessionState::Authenticating);

            if(authenticator)
            {
                attemptsLeft = std::max(1, settings.authRetries);
                sendChallenge();
            }
            else
            {
                Application::warning("%s: %s", __FUNCTION__, "authenticator not set, skip authentication");
                outgoing.emplace_back(Msg::AuthResult{ true, "" });
                setState(SessionState::Negotiating);
            }

            return;
        }

        // client side
        if(resuming)
        {
            if(! hello.resumed || ! Crypto::equal(hello.resumeToken, resumeToken) || ! caps)
            {
                closeWith(ErrorCode::AuthError, "resume rejected", true);
                return;
            }

            Application::info("%s: session resumed, peer: %s", __FUNCTION__, remotePeerId.c_str());
            resuming = false;
            lastHeartbeat = now;
            setState(SessionState::Active);

            if(events)
            {
                events->sessionResumed(*caps);
            }

            return;
        }

        remotePeerId = hello.peerId;
        remotePublicKey = hello.publicKey;
        resumeToken = hello.resumeToken;

        Application::info("%s: host connected, peer: %s", __FUNCTION__, remotePeerId.c_str());
        setState(SessionState::Authenticating);
    }

    void Session::sendChallenge(void)
    {
        challenge = Crypto::randomNonce(challenge_size);

        Msg::AuthChallenge msg;
        msg.salt = authenticator->salt();
        msg.challenge = challenge;
        msg.attemptsLeft = attemptsLeft;
        msg.otpRequired = settings.otpRequired;

        Application::debug(DebugType::Auth, "%s: attempts left: %d", __FUNCTION__, attemptsLeft);
        outgoing.emplace_back(std::move(msg));
    }

    void Session::recvAuthChallenge(const Msg::AuthChallenge & msg)
    {
        if(isHost() || state != SessionState::Authenticating)
        {
            closeWith(ErrorCode::AuthError, "unexpected auth challenge", true);
            return;
        }

        if(! credentials)
        {
            closeWith(ErrorCode::AuthError, "credentials not available", true);
            return;
        }

        Msg::AuthResponse res;
        res.username = credentials->username();
        res.response = Auth::response(Auth::verifier(credentials->password(), msg.salt), msg.challenge);

        if(msg.otpRequired)
        {
            res.otp = credentials->otpCode();
        }

        Application::debug(DebugType::Auth, "%s: user: %s, attempts left: %" PRIu8, __FUNCTION__, res.username.c_str(), msg.attemptsLeft);
        outgoing.emplace_back(std::move(res));
    }

    void Session::recvAuthResponse(const Msg::AuthResponse & msg)
    {
        if(! isHost() || state != SessionState::Authenticating || ! authenticator || challenge.empty())
        {
            closeWith(ErrorCode::AuthError, "unexpected auth response", true);
            return;
        }

        bool success = false;

        if(auto verifier = authenticator->verifier(msg.username))
        {
            success = Crypto::equal(Auth::response(*verifier, challenge), msg.response);

            if(success && settings.otpRequired)
            {
                success = ! msg.otp.empty() && authenticator->checkOtp(msg.username, msg.otp);

                if(! success)
                {
                    Application::warning("%s: second factor failed, user: %s", __FUNCTION__, msg.username.c_str());
                }
            }
        }
        else
        {
            Application::warning("%s: unknown user: %s", __FUNCTION__, msg.username.c_str());
        }

        // single use
        challenge.clear();

        if(success)
        {
            Application::notice("%s: success, user: %s", __FUNCTION__, msg.username.c_str());
            outgoing.emplace_back(Msg::AuthResult{ true, "" });
            setState(SessionState::Negotiating);
            return;
        }

        attemptsLeft--;
        Application::warning("%s: failed, user: %s, attempts left: %d", __FUNCTION__, msg.username.c_str(), attemptsLeft);
        outgoing.emplace_back(Msg::AuthResult{ false, "authentication failed" });

        if(0 < attemptsLeft)
        {
            sendChallenge();
        }
        else
        {
            closeWith(ErrorCode::AuthFailed, "authentication retries exhausted", true);
        }
    }

    void Session::recvAuthResult(const Msg::AuthResult & msg)
    {
        if(isHost() || state != SessionState::Authenticating)
        {
            closeWith(ErrorCode::AuthError, "unexpected auth result", true);
            return;
        }

        if(! msg.success)
        {
            // the host sends a fresh challenge or closes
            Application::warning("%s: %s", __FUNCTION__, msg.reason.c_str());
            return;
        }

        setState(SessionState::Negotiating);
        outgoing.emplace_back(Msg::CapabilityOffer{ settings.declared });
    }

    void Session::setCapabilities(Capabilities && val)
    {
        caps = std::make_shared<const Capabilities>(std::move(val));

        if(events)
        {
            events->sessionActive(*caps);
        }
    }

    void Session::recvCapabilityOffer(const Msg::CapabilityOffer & msg)
    {
        if(! isHost() || state != SessionState::Negotiating)
        {
            closeWith(ErrorCode::AuthError, "unexpected capability offer", true);
            return;
        }

        try
        {
            auto res = Negotiator::negotiate(settings.declared, msg.caps, settings.codecPreference, 1);
            remoteDeclared = msg.caps;
            outgoing.emplace_back(Msg::CapabilityAnswer{ res });
            setState(SessionState::Active);
            lastHeartbeat = lastRecv;
            setCapabilities(std::move(res));
        }
        catch(const session_error & err)
        {
            closeWith(err.code, "no common video codec", true);
        }
    }

    void Session::recvCapabilityAnswer(const Msg::CapabilityAnswer & msg)
    {
        if(isHost())
        {
            Application::warning("%s: %s", __FUNCTION__, "unexpected capability answer");
            return;
        }

        if(state == SessionState::Negotiating)
        {
            setState(SessionState::Active);
            lastHeartbeat = lastRecv;
            setCapabilities(Capabilities(msg.caps));
            return;
        }

        if(state == SessionState::Active)
        {
            if(caps && msg.caps.generation <= caps->generation)
            {
                Application::warning("%s: stale generation: %" PRIu32, __FUNCTION__, msg.caps.generation);
                return;
            }

            setCapabilities(Capabilities(msg.caps));
            return;
        }

        closeWith(ErrorCode::AuthError, "unexpected capability answer", true);
    }

    void Session::recvRenegotiate(const Msg::Renegotiate & msg)
    {
        if(! isHost() || state != SessionState::Active)
        {
            Application::warning("%s: unexpected renegotiate, state: %s", __FUNCTION__, sessionStateName(state));
            return;
        }

        try
        {
            auto res = Negotiator::negotiate(settings.declared, msg.caps, settings.codecPreference, caps->generation + 1);
            remoteDeclared = msg.caps;
            outgoing.emplace_back(Msg::CapabilityAnswer{ res });
            setCapabilities(std::move(res));
        }
        catch(const session_error & err)
        {
            // keep the current snapshot
            Application::warning("%s: renegotiation failed, capabilities unchanged, error: %s", __FUNCTION__, errorCodeName(err.code));
            outgoing.emplace_back(Msg::Notification{ 1, "renegotiation failed" });
        }
    }

    void Session::recvSessionClose(const Msg::SessionClose & msg)
    {
        Application::info("%s: code: %s, reason: %s", __FUNCTION__, errorCodeName(msg.code), msg.reason.c_str());
        closeWith(msg.code, msg.reason, false);
    }

    void Session::requestRenegotiation(const CapabilitySet & declared)
    {
        if(state != SessionState::Active)
        {
            Application::warning("%s: invalid state: %s", __FUNCTION__, sessionStateName(state));
            return;
        }

        settings.declared = declared;

        if(! isHost())
        {
            outgoing.emplace_back(Msg::Renegotiate{ declared });
            return;
        }

        try
        {
            auto res = Negotiator::negotiate(settings.declared, remoteDeclared, settings.codecPreference, caps->generation + 1);
            outgoing.emplace_back(Msg::CapabilityAnswer{ res });
            setCapabilities(std::move(res));
        }
        catch(const session_error & err)
        {
            Application::warning("%s: renegotiation failed, capabilities unchanged, error: %s", __FUNCTION__, errorCodeName(err.code));
        }
    }

    void Session::transportLost(const TimePoint & now)
    {
        outgoing.clear();

        if((state == SessionState::Active || state == SessionState::Closing) && caps && caps->resumable)
        {
            Application::warning("%s: wait reconnect, grace: %u ms", __FUNCTION__, static_cast<unsigned>(settings.reconnectGrace.count()));
            reconnectStart = now;
            setState(SessionState::Reconnecting);
            return;
        }

        if(state == SessionState::Reconnecting || resuming)
        {
            // a resume attempt failed, the grace timer continues
            resuming = false;
            setState(SessionState::Reconnecting);
            return;
        }

        closeWith(ErrorCode::TransportError, "transport lost", false);
    }

    void Session::tick(const TimePoint & now)
    {
        if(isHandshakePhase() && resuming && settings.reconnectGrace < now - reconnectStart)
        {
            closeWith(ErrorCode::ReconnectExpired, "reconnect grace expired", true);
            return;
        }

        if(isHandshakePhase() && settings.handshakeTimeout < now - handshakeStart)
        {
            closeWith(ErrorCode::AuthError, "handshake timeout", true);
            return;
        }

        if(state == SessionState::Reconnecting)
        {
            if(settings.reconnectGrace < now - reconnectStart)
            {
                caps.reset();
                resumeToken.clear();
                closeWith(ErrorCode::ReconnectExpired, "reconnect grace expired", false);
            }

            return;
        }

        if(state == SessionState::Active)
        {
            if(0ms < settings.readTimeout && settings.readTimeout < now - lastRecv)
            {
                Application::warning("%s: read timeout: %u ms", __FUNCTION__, static_cast<unsigned>(settings.readTimeout.count()));
                transportLost(now);
                return;
            }

            if(0ms < settings.heartbeatInterval && settings.heartbeatInterval <= now - lastHeartbeat)
            {
                lastHeartbeat = now;
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
                outgoing.emplace_back(Msg::Heartbeat{ static_cast<uint64_t>(ms.count()) });
            }
        }
    }

    void Session::close(const std::string & reason)
    {
        closeReason = reason;

        switch(state)
        {
            case SessionState::Active:
                setState(SessionState::Closing);
                break;

            case SessionState::Handshaking:
            case SessionState::Authenticating:
            case SessionState::Negotiating:
                closeWith(ErrorCode::None, reason, true);
                break;

            case SessionState::Disconnected:
            case SessionState::Reconnecting:
                closeWith(ErrorCode::None, reason, false);
                break;

            default:
                break;
        }
    }

    void Session::closeFlushed(void)
    {
        if(state == SessionState::Closing)
        {
            closeWith(ErrorCode::None, closeReason, true);
        }
    }

    void Session::abort(const ErrorCode & code, const std::string & reason)
    {
        closeWith(code, reason, true);
    }

    std::list<ControlMsg> Session::takeOutgoing(void)
    {
        std::list<ControlMsg> res;
        res.swap(outgoing);
        return res;
    }

    bool Session::hasOutgoing(void) const
    {
        return ! outgoing.empty();
    }
}
