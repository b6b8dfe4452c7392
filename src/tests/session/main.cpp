#include <iostream>
#include <exception>
#include <cassert>

#include "rdse_application.h"
#include "rdse_session.h"

using namespace RDSE;
using namespace std::chrono_literals;

class TestAuth : public Authenticator
{
    BinaryBuf salt_{ BinaryBuf(16, 0x11) };

public:
    BinaryBuf salt(void) const override
    {
        return salt_;
    }

    std::optional<BinaryBuf> verifier(const std::string & username) const override
    {
        if(username == "user")
        {
            return Auth::verifier("secret", salt_);
        }

        return std::nullopt;
    }

    bool checkOtp(const std::string & username, const std::string & code) const override
    {
        return code == "123456";
    }
};

class TestCredentials : public CredentialsProvider
{
public:
    std::string pass{ "secret" };
    std::string otp;

    std::string username(void) const override { return "user"; }
    std::string password(void) const override { return pass; }
    std::string otpCode(void) const override { return otp; }
};

struct TestEvents : SessionEvents
{
    int active = 0;
    int resumed = 0;
    int closed = 0;
    ErrorCode code = ErrorCode::None;

    void sessionActive(const Capabilities &) override { active++; }
    void sessionResumed(const Capabilities &) override { resumed++; }
    void sessionClosed(const ErrorCode & err, const std::string &) override { closed++; code = err; }
};

SessionSettings settings(const Msg::Role & role)
{
    SessionSettings st;
    st.role = role;
    st.peerId = role == Msg::Role::Host ? "host" : "client";
    st.declared.codecs = role == Msg::Role::Host ?
                         std::vector<VideoCodec>{ VideoCodec::VP9, VideoCodec::AV1 } : std::vector<VideoCodec>{ VideoCodec::H264, VideoCodec::VP9 };
    st.declared.maxWidth = 1920;
    st.declared.maxHeight = 1080;
    st.declared.permissions = PermAll;
    st.declared.resumable = true;
    st.authRetries = 2;
    return st;
}

/// exchange control messages until both sides are quiet
void pump(Session & host, Session & client, const TimePoint & now)
{
    for(int loop = 0; loop < 32 && (host.hasOutgoing() || client.hasOutgoing()); ++loop)
    {
        for(auto & msg : host.takeOutgoing())
        {
            client.recvControl(msg, now);
        }

        for(auto & msg : client.takeOutgoing())
        {
            host.recvControl(msg, now);
        }
    }
}

struct Pair
{
    TestAuth auth;
    TestCredentials creds;
    TestEvents hostEvents;
    TestEvents clientEvents;
    Session host;
    Session client;

    Pair() : host(settings(Msg::Role::Host)), client(settings(Msg::Role::Client))
    {
        host.setAuthenticator(& auth);
        host.setEvents(& hostEvents);
        client.setCredentials(& creds);
        client.setEvents(& clientEvents);
    }

    void connect(const TimePoint & now)
    {
        host.start(now);
        client.start(now);
        pump(host, client, now);
    }
};

void testHandshake(void)
{
    std::cout << "test handshake success: ";

    auto now = std::chrono::steady_clock::now();
    Pair pair;

    assert(pair.host.getState() == SessionState::Disconnected);
    pair.connect(now);

    assert(pair.host.isActive());
    assert(pair.client.isActive());
    assert(pair.host.remoteId() == "client");
    assert(pair.client.remoteId() == "host");
    assert(pair.hostEvents.active == 1);
    assert(pair.clientEvents.active == 1);

    auto hcaps = pair.host.capabilities();
    auto ccaps = pair.client.capabilities();
    assert(hcaps && ccaps);
    assert(hcaps->generation == 1 && ccaps->generation == 1);
    assert(hcaps->codec() == VideoCodec::VP9);
    assert(ccaps->codec() == VideoCodec::VP9);
    assert(pair.host.token().size() == 16);
    assert(pair.host.token() == pair.client.token());

    std::cout << "passed" << std::endl;
}

void testAuthFailure(void)
{
    std::cout << "test auth retry: ";

    auto now = std::chrono::steady_clock::now();

    {
        Pair pair;
        pair.creds.pass = "wrong";

        pair.host.start(now);
        pair.client.start(now);

        // hello, challenge, wrong response
        for(auto & msg : pair.client.takeOutgoing()) pair.host.recvControl(msg, now);
        for(auto & msg : pair.host.takeOutgoing()) pair.client.recvControl(msg, now);
        for(auto & msg : pair.client.takeOutgoing()) pair.host.recvControl(msg, now);

        // failure result and a fresh challenge
        assert(pair.host.getState() == SessionState::Authenticating);
        auto out = pair.host.takeOutgoing();
        assert(out.size() == 2);
        assert(! std::get<Msg::AuthResult>(out.front()).success);
        assert(std::get<Msg::AuthChallenge>(out.back()).attemptsLeft == 1);

        pair.creds.pass = "secret";
        for(auto & msg : out) pair.client.recvControl(msg, now);
        pump(pair.host, pair.client, now);

        assert(pair.host.isActive());
        assert(pair.client.isActive());
    }

    std::cout << "passed" << std::endl;

    std::cout << "test auth retries exhausted: ";

    {
        Pair pair;
        pair.creds.pass = "wrong";
        pair.connect(now);

        assert(pair.host.isClosed());
        assert(pair.host.errorCode() == ErrorCode::AuthFailed);
        assert(pair.client.isClosed());
        assert(pair.client.errorCode() == ErrorCode::AuthFailed);
        assert(pair.clientEvents.closed == 1);
        assert(pair.clientEvents.active == 0);
        assert(! pair.host.capabilities());
    }

    std::cout << "passed" << std::endl;

    std::cout << "test second factor: ";

    {
        auto host = settings(Msg::Role::Host);
        host.otpRequired = true;
        host.authRetries = 1;

        TestAuth auth;
        TestCredentials creds;
        Session hsess(host);
        Session csess(settings(Msg::Role::Client));
        hsess.setAuthenticator(& auth);
        csess.setCredentials(& creds);

        hsess.start(now);
        csess.start(now);
        pump(hsess, csess, now);
        assert(hsess.errorCode() == ErrorCode::AuthFailed);

        Session hsess2(host);
        Session csess2(settings(Msg::Role::Client));
        hsess2.setAuthenticator(& auth);
        creds.otp = "123456";
        csess2.setCredentials(& creds);

        hsess2.start(now);
        csess2.start(now);
        pump(hsess2, csess2, now);
        assert(hsess2.isActive());
    }

    std::cout << "passed" << std::endl;
}

void testMismatch(void)
{
    std::cout << "test capability mismatch: ";

    auto now = std::chrono::steady_clock::now();
    auto client = settings(Msg::Role::Client);
    client.declared.codecs = { VideoCodec::H265 };

    TestAuth auth;
    TestCredentials creds;
    TestEvents events;
    Session host(settings(Msg::Role::Host));
    Session csess(client);
    host.setAuthenticator(& auth);
    csess.setCredentials(& creds);
    csess.setEvents(& events);

    host.start(now);
    csess.start(now);
    pump(host, csess, now);

    assert(host.errorCode() == ErrorCode::CapabilityMismatch);
    assert(csess.errorCode() == ErrorCode::CapabilityMismatch);
    assert(events.code == ErrorCode::CapabilityMismatch);
    assert(events.active == 0);

    std::cout << "passed" << std::endl;
}

void testRenegotiate(void)
{
    std::cout << "test renegotiation: ";

    auto now = std::chrono::steady_clock::now();
    Pair pair;
    pair.connect(now);

    auto declared = pair.client.declaration();
    declared.maxWidth = 1280;
    declared.maxHeight = 720;
    pair.client.requestRenegotiation(declared);
    pump(pair.host, pair.client, now);

    assert(pair.host.capabilities()->generation == 2);
    assert(pair.client.capabilities()->generation == 2);
    assert(pair.client.capabilities()->width == 1280);
    assert(pair.clientEvents.active == 2);

    // no shared codec: snapshot unchanged
    declared.codecs = { VideoCodec::H265 };
    pair.client.requestRenegotiation(declared);
    pump(pair.host, pair.client, now);

    assert(pair.host.isActive());
    assert(pair.client.capabilities()->generation == 2);

    std::cout << "passed" << std::endl;
}

void testResume(void)
{
    std::cout << "test resume with token: ";

    auto now = std::chrono::steady_clock::now();
    Pair pair;
    pair.connect(now);

    auto caps = pair.client.capabilities();

    pair.host.transportLost(now);
    pair.client.transportLost(now);
    assert(pair.host.getState() == SessionState::Reconnecting);
    assert(pair.client.getState() == SessionState::Reconnecting);

    now += 5s;
    pair.host.tick(now);
    pair.client.tick(now);
    assert(pair.host.getState() == SessionState::Reconnecting);

    pair.connect(now);

    assert(pair.host.isActive());
    assert(pair.client.isActive());
    assert(pair.hostEvents.resumed == 1);
    assert(pair.clientEvents.resumed == 1);
    assert(pair.hostEvents.active == 1);
    // same snapshot, no renegotiation
    assert(pair.client.capabilities() == caps);

    std::cout << "passed" << std::endl;

    std::cout << "test resume token mismatch: ";

    pair.host.transportLost(now);

    TestCredentials creds;
    Session intruder(settings(Msg::Role::Client));
    intruder.setCredentials(& creds);

    pair.host.start(now);
    intruder.start(now);
    pump(pair.host, intruder, now);

    assert(pair.host.isClosed());
    assert(pair.host.errorCode() == ErrorCode::AuthError);
    assert(intruder.isClosed());

    std::cout << "passed" << std::endl;

    std::cout << "test reconnect grace expired: ";

    Pair pair2;
    pair2.connect(now);
    pair2.host.transportLost(now);

    pair2.host.tick(now + 29s);
    assert(pair2.host.getState() == SessionState::Reconnecting);

    pair2.host.tick(now + 31s);
    assert(pair2.host.isClosed());
    assert(pair2.host.errorCode() == ErrorCode::ReconnectExpired);
    assert(pair2.hostEvents.code == ErrorCode::ReconnectExpired);

    std::cout << "passed" << std::endl;
}

void testTimers(void)
{
    std::cout << "test handshake timeout: ";

    auto now = std::chrono::steady_clock::now();
    Session host(settings(Msg::Role::Host));
    host.start(now);

    host.tick(now + 17s);
    assert(host.getState() == SessionState::Handshaking);

    host.tick(now + 19s);
    assert(host.isClosed());
    assert(host.errorCode() == ErrorCode::AuthError);

    std::cout << "passed" << std::endl;

    std::cout << "test heartbeat: ";

    Pair pair;
    pair.connect(now);

    pair.client.tick(now + 6s);
    auto out = pair.client.takeOutgoing();
    assert(out.size() == 1);
    assert(std::holds_alternative<Msg::Heartbeat>(out.front()));

    std::cout << "passed" << std::endl;

    std::cout << "test graceful close: ";

    pair.client.close("user exit");
    assert(pair.client.getState() == SessionState::Closing);
    assert(! pair.client.hasOutgoing());

    pair.client.closeFlushed();
    assert(pair.client.isClosed());
    pump(pair.host, pair.client, now);

    assert(pair.host.isClosed());
    assert(pair.host.errorCode() == ErrorCode::None);
    assert(pair.host.errorReason() == "user exit");

    try
    {
        pair.host.start(now);
        assert(false);
    }
    catch(const session_error &)
    {
    }

    std::cout << "passed" << std::endl;
}

int main(int argc, char** argv)
{
    Application::setDebugLevel(DebugLevel::None);

    testHandshake();
    testAuthFailure();
    testMismatch();
    testRenegotiate();
    testResume();
    testTimers();

    return 0;
}
